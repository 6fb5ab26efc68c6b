/*!
 *  Copyright (c) 2024 by Contributors
 * \file xschema/json_pointer.h
 * \brief JSON Pointers (RFC 6901): escaping, parsing and lookup.
 */
#ifndef XSCHEMA_JSON_POINTER_H_
#define XSCHEMA_JSON_POINTER_H_

#include <picojson.h>

#include <string>
#include <vector>

#include "support/utils.h"

namespace xschema {

/*! \brief Escape '~' and '/' in a reference token. */
std::string EscapeJSONPointerToken(const std::string& token);

/*! \brief The pointer for the tokens, e.g. {"$defs", "a/b"} gives "/$defs/a~1b". */
std::string JSONPointerFromTokens(const std::vector<std::string>& tokens);

/*!
 * \brief Split a pointer into unescaped tokens. The empty pointer has no tokens; any other must
 * start with '/'.
 */
Result<std::vector<std::string>> JSONPointerTokens(const std::string& pointer);

/*!
 * \brief Find the value the tokens point to.
 * \return The value, or nullptr when it does not exist.
 */
const picojson::value* LookupJSONPointer(
    const picojson::value& root, const std::vector<std::string>& tokens
);

}  // namespace xschema

#endif  // XSCHEMA_JSON_POINTER_H_
