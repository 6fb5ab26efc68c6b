/*!
 *  Copyright (c) 2024 by Contributors
 * \file xschema/regexp_syntax.h
 * \brief Check patterns against the RE2 syntax used by the type language.
 */
#ifndef XSCHEMA_REGEXP_SYNTAX_H_
#define XSCHEMA_REGEXP_SYNTAX_H_

#include <string>

namespace xschema {

enum class RegexpStatus : int {
  kOk = 0,
  /*!
   * \brief Valid in ECMAScript but not in RE2: look-around, back references, unknown escapes and
   * character classes.
   */
  kUnsupported = 1,
  /*! \brief Not a regular expression at all. */
  kInvalid = 2,
};

struct RegexpCheck {
  RegexpStatus status = RegexpStatus::kOk;
  std::string message;
};

/*! \brief Check the syntax of an RE2 pattern. */
RegexpCheck CheckRegexpSyntax(const std::string& pattern);

/*! \brief Escape all regular expression metacharacters in text. */
std::string QuoteMeta(const std::string& text);

}  // namespace xschema

#endif  // XSCHEMA_REGEXP_SYNTAX_H_
