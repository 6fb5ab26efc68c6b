/*!
 * Copyright (c) 2024 by Contributors
 * \file xschema/support/utils.h
 * \brief The Result type and small string helpers shared by the decoder and the
 * generator.
 */
#ifndef XSCHEMA_SUPPORT_UTILS_H_
#define XSCHEMA_SUPPORT_UTILS_H_

#include <cstddef>
#include <cstdint>
#include <stdexcept>
#include <string>
#include <type_traits>
#include <utility>
#include <variant>
#include <vector>

#include "logging.h"

namespace xschema {

/****************** Result Library ******************/

/*!
 * \brief A partial result that is converted into a Result. Holds either the value or the error.
 * \tparam T The type of the held value
 * \tparam IsOk Whether the held value is a success value
 */
template <typename T, bool IsOk>
struct PartialResult {
  template <typename... Args>
  PartialResult(Args&&... args) : value(std::forward<Args>(args)...) {}
  T value;
};

/*!
 * \brief Construct a success result from the arguments of T's constructor.
 * \code
 * return ResultOk<URI>(scheme, host, path);
 * \endcode
 */
template <typename T, typename... Args>
inline PartialResult<T, true> ResultOk(Args&&... args) {
  return PartialResult<T, true>{std::forward<Args>(args)...};
}

/*!
 * \brief Construct a success result that forwards an existing value.
 */
template <typename T>
inline PartialResult<T&&, true> ResultOk(T&& value) {
  return PartialResult<T&&, true>{std::forward<T>(value)};
}

/*!
 * \brief Construct an error result from the arguments of E's constructor. E defaults to
 * std::runtime_error.
 * \code
 * return ResultErr("invalid escape in JSON pointer");
 * \endcode
 */
template <typename E = std::runtime_error, typename... Args>
inline PartialResult<E, false> ResultErr(Args&&... args) {
  return PartialResult<E, false>{std::forward<Args>(args)...};
}

/*!
 * \brief Construct an error result that forwards an existing error.
 */
template <typename E>
inline PartialResult<E&&, false> ResultErr(E&& err) {
  return PartialResult<E&&, false>{std::forward<E>(err)};
}

/*!
 * \brief Either a success value or an error. The value and the error are moved out with the
 * rvalue-qualified accessors.
 * \code
 * auto uri = URI::Parse(text);
 * if (uri.IsErr()) {
 *   return ResultErr(std::move(uri).UnwrapErr());
 * }
 * URI base = std::move(uri).Unwrap();
 * \endcode
 */
template <typename T, typename E = std::runtime_error>
class Result {
 private:
  static_assert(!std::is_same_v<T, E>, "T and E cannot be the same type");

 public:
  Result() = delete;

  template <typename U, typename = std::enable_if_t<std::is_constructible_v<T, std::decay_t<U>>>>
  Result(PartialResult<U, true>&& partial_result)
      : data_(std::in_place_type<T>, std::forward<U>(partial_result.value)) {}

  template <typename V, typename = std::enable_if_t<std::is_constructible_v<E, std::decay_t<V>>>>
  Result(PartialResult<V, false>&& partial_result)
      : data_(std::in_place_type<E>, std::forward<V>(partial_result.value)) {}

  bool IsOk() const { return std::holds_alternative<T>(data_); }

  bool IsErr() const { return std::holds_alternative<E>(data_); }

  T Unwrap() && {
    XSCHEMA_DCHECK(IsOk()) << "Called Unwrap() on an Err value";
    return std::get<T>(std::move(data_));
  }

  E UnwrapErr() && {
    XSCHEMA_DCHECK(IsErr()) << "Called UnwrapErr() on an Ok value";
    return std::get<E>(std::move(data_));
  }

  T UnwrapOr(T default_value) && {
    return IsOk() ? std::get<T>(std::move(data_)) : std::move(default_value);
  }

  template <typename F, typename U = std::decay_t<std::invoke_result_t<F, T>>>
  Result<U, E> Map(F&& f) && {
    if (IsOk()) {
      return ResultOk(f(std::get<T>(std::move(data_))));
    }
    return ResultErr(std::get<E>(std::move(data_)));
  }

  const T& ValueRef() const& {
    XSCHEMA_DCHECK(IsOk()) << "Called ValueRef() on an Err value";
    return std::get<T>(data_);
  }

  const E& ErrRef() const& {
    XSCHEMA_DCHECK(IsErr()) << "Called ErrRef() on an Ok value";
    return std::get<E>(data_);
  }

 private:
  std::variant<T, E> data_;
};

/****************** Misc ******************/

// Sometimes GCC fails to detect some branches will not return, such as when we use LOG(FATAL)
// to raise an error. This macro manually mark them as unreachable to avoid warnings.
#ifdef __GNUC__
#define XSCHEMA_UNREACHABLE() __builtin_unreachable()
#else
#define XSCHEMA_UNREACHABLE()
#endif

/*!
 * \brief Quote a string the way diagnostics print names: double quotes with JSON escapes.
 */
std::string Quote(const std::string& str);

/*!
 * \brief Join the strings with the separator.
 */
std::string Join(const std::vector<std::string>& strs, const std::string& sep);

/*!
 * \brief Whether str starts with prefix.
 */
inline bool StartsWith(const std::string& str, const std::string& prefix) {
  return str.size() >= prefix.size() && str.compare(0, prefix.size(), prefix) == 0;
}

/*!
 * \brief Whether str ends with suffix.
 */
inline bool EndsWith(const std::string& str, const std::string& suffix) {
  return str.size() >= suffix.size() &&
         str.compare(str.size() - suffix.size(), suffix.size(), suffix) == 0;
}

}  // namespace xschema

#endif  // XSCHEMA_SUPPORT_UTILS_H_
