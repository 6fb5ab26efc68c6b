/*!
 *  Copyright (c) 2024 by Contributors
 * \file xschema/exception.h
 * \brief The exceptions thrown by the public API.
 */
#ifndef XSCHEMA_EXCEPTION_H_
#define XSCHEMA_EXCEPTION_H_

#include <stdexcept>
#include <string>
#include <vector>

namespace xschema {

/*!
 * \brief One problem found while translating a schema.
 */
struct SchemaDiagnostic {
  /*!
   * \brief Where the problem is. For Extract, a JSON Pointer fragment into the input document,
   * e.g. "#/properties/a/minLength". For Generate, the path of the value, e.g. "a.b". Empty for
   * problems without a location.
   */
  std::string location;
  /*! \brief The message. */
  std::string message;

  std::string ToString() const { return location.empty() ? message : location + ": " + message; }
};

/*!
 * \brief Thrown when a translation finds one or more problems. All problems found are reported
 * together, each with its location.
 */
class SchemaError : public std::runtime_error {
 public:
  explicit SchemaError(std::vector<SchemaDiagnostic> diagnostics)
      : std::runtime_error(Describe(diagnostics)), diagnostics_(std::move(diagnostics)) {}

  /*! \brief All problems, in the order they were found. */
  const std::vector<SchemaDiagnostic>& Diagnostics() const noexcept { return diagnostics_; }

 private:
  static std::string Describe(const std::vector<SchemaDiagnostic>& diagnostics) {
    std::string msg;
    for (size_t i = 0; i < diagnostics.size(); ++i) {
      if (i != 0) msg += "\n";
      msg += diagnostics[i].ToString();
    }
    return msg;
  }

  std::vector<SchemaDiagnostic> diagnostics_;
};

/*!
 * \brief Thrown when the input text is not valid JSON.
 */
struct InvalidJSONError : public std::runtime_error {
  InvalidJSONError(const std::string& msg) : std::runtime_error("Invalid JSON: " + msg) {}
};

/*!
 * \brief Thrown when the configuration cannot be used at all, e.g. a relative schema ID or an
 * unsupported output version.
 */
struct InvalidConfigError : public std::runtime_error {
  InvalidConfigError(const std::string& msg)
      : std::runtime_error("Invalid configuration: " + msg) {}
};

}  // namespace xschema

#endif  // XSCHEMA_EXCEPTION_H_
