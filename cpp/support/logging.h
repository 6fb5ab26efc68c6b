/*!
 *  Copyright (c) 2024 by Contributors
 * \file xschema/support/logging.h
 * \brief Stream-style logging and checking macros. A fatal message throws LoggingError.
 */
#ifndef XSCHEMA_SUPPORT_LOGGING_H_
#define XSCHEMA_SUPPORT_LOGGING_H_

#include <sstream>
#include <stdexcept>
#include <string>

/*!
 * \brief Whether XSCHEMA_LOG(DEBUG) messages are emitted. Set to 1 at compile time to trace the
 * decisions the decoder and the generator make.
 */
#ifndef XSCHEMA_ENABLE_LOG_DEBUG
#define XSCHEMA_ENABLE_LOG_DEBUG 0
#endif

namespace xschema {

/*!
 * \brief The error thrown by a fatal log message or a failed check.
 */
class LoggingError : public std::runtime_error {
 public:
  explicit LoggingError(const std::string& msg) : std::runtime_error(msg) {}
};

/*!
 * \brief Collects a fatal message and throws it as LoggingError when destroyed.
 */
class LogFatal {
 public:
  LogFatal(const std::string& file, int lineno) {
    stream_ << "[" << file << ":" << lineno << "] ";
  }
  [[noreturn]] ~LogFatal() noexcept(false) { throw LoggingError(stream_.str()); }
  std::ostringstream& stream() { return stream_; }

 private:
  std::ostringstream stream_;
};

/*!
 * \brief Collects a non-fatal message and writes it to stderr when destroyed.
 */
class LogMessage {
 public:
  static constexpr int kDebug = 0;
  static constexpr int kInfo = 1;
  static constexpr int kWarning = 2;

  LogMessage(const std::string& file, int lineno, int level);
  ~LogMessage();
  std::ostringstream& stream() { return stream_; }

 private:
  std::ostringstream stream_;
};

/*!
 * \brief Swallows a stream expression in a ternary, so that a disabled log statement still
 * type-checks its operands.
 */
class LogMessageVoidify {
 public:
  void operator&(std::ostream&) {}
};

}  // namespace xschema

#define XSCHEMA_LOG_FATAL ::xschema::LogFatal(__FILE__, __LINE__).stream()
#define XSCHEMA_LOG_WARNING \
  ::xschema::LogMessage(__FILE__, __LINE__, ::xschema::LogMessage::kWarning).stream()
#define XSCHEMA_LOG_INFO \
  ::xschema::LogMessage(__FILE__, __LINE__, ::xschema::LogMessage::kInfo).stream()
#define XSCHEMA_LOG_DEBUG                                                               \
  !(XSCHEMA_ENABLE_LOG_DEBUG)                                                           \
      ? (void)0                                                                         \
      : ::xschema::LogMessageVoidify() &                                                \
            ::xschema::LogMessage(__FILE__, __LINE__, ::xschema::LogMessage::kDebug).stream()

#define XSCHEMA_LOG(level) XSCHEMA_LOG_##level

#define XSCHEMA_CHECK(x) \
  if (!(x))              \
  XSCHEMA_LOG_FATAL << "Check failed: (" #x << ") is false: "

#define XSCHEMA_ICHECK(x) \
  if (!(x))               \
  XSCHEMA_LOG_FATAL << "Internal check failed: (" #x << ") is false: "

#ifndef NDEBUG
#define XSCHEMA_DCHECK(x) XSCHEMA_ICHECK(x)
#else
#define XSCHEMA_DCHECK(x) \
  while (false) XSCHEMA_ICHECK(x)
#endif

#endif  // XSCHEMA_SUPPORT_LOGGING_H_
