#pragma once

#include <cstddef>
#include <string>
#include <utility>
#include <variant>

namespace kira::core {

// Error taxonomy (E.14: use purpose-designed types as error indicators).
// kParse / kValidation / kIo are recorded per file and never stop a run.
// kConfiguration means the schema itself cannot be trusted and aborts the run.
enum class ErrorKind {
  kParse,
  kValidation,
  kConfiguration,
  kIo,
};

struct Error {
  ErrorKind kind{ErrorKind::kValidation};
  std::string message;
};

inline Error parse_error(std::string message) {
  return Error{ErrorKind::kParse, std::move(message)};
}

inline Error configuration_error(std::string message) {
  return Error{ErrorKind::kConfiguration, std::move(message)};
}

inline Error io_error(std::string message) {
  return Error{ErrorKind::kIo, std::move(message)};
}

// Result<T, E> follows C++ Core Guidelines E.27: systematic error handling without exceptions.
// This type encodes success (T) or failure (E) explicitly, preventing ignored errors.
// Usage: return Result<Value, ErrorType>::ok(val) or Result<Value, ErrorType>::err(error).
// The has_value() check makes error handling mandatory and visible at call sites.
template <typename T, typename E>
class Result {
 public:
  static Result ok(T value) { return Result(std::in_place_index<0>, std::move(value)); }
  static Result err(E error) { return Result(std::in_place_index<1>, std::move(error)); }

  [[nodiscard]] bool has_value() const { return data_.index() == 0; }
  [[nodiscard]] const T& value() const { return std::get<0>(data_); }
  [[nodiscard]] T& value() { return std::get<0>(data_); }
  [[nodiscard]] const E& error() const { return std::get<1>(data_); }

 private:
  template <std::size_t I, typename V>
  Result(std::in_place_index_t<I> index, V&& value) : data_(index, std::forward<V>(value)) {}

  std::variant<T, E> data_;
};

}  // namespace kira::core
