#pragma once

#include <optional>
#include <string>
#include <utility>
#include <variant>

namespace rxrecon::core {

// Error enumerations following E.14 (use purpose-designed types as error indicators).

enum class InputErrorCode {
  kMissingInvoiceNumber,
  kNegativeQuantity,
  kNegativePrice,
  kNegativeTotal,
  kDuplicateLineNumber,
  kInvalidPurchaseOrder,
  kInvalidConfig,
};

// InputError rejects a whole reconciliation call before any matching happens.
// line_number points at the offending line item when the error is line-scoped.
struct InputError {
  InputErrorCode code{InputErrorCode::kMissingInvoiceNumber};
  std::string message;
  std::optional<int> line_number;
};

// input_error_code_to_string returns the stable kebab-case name used in JSON and audit payloads.
inline const char* input_error_code_to_string(const InputErrorCode code) {
  switch (code) {
    case InputErrorCode::kMissingInvoiceNumber:
      return "missing-invoice-number";
    case InputErrorCode::kNegativeQuantity:
      return "negative-quantity";
    case InputErrorCode::kNegativePrice:
      return "negative-price";
    case InputErrorCode::kNegativeTotal:
      return "negative-total";
    case InputErrorCode::kDuplicateLineNumber:
      return "duplicate-line-number";
    case InputErrorCode::kInvalidPurchaseOrder:
      return "invalid-purchase-order";
    case InputErrorCode::kInvalidConfig:
      return "invalid-config";
  }
  return "unknown";
}

// Result<T, E> follows C++ Core Guidelines E.27: systematic error handling without exceptions.
// This type encodes success (T) or failure (E) explicitly, preventing ignored errors.
// Usage: return Result<Value, ErrorType>::ok(val) or Result<Value, ErrorType>::err(error).
// The has_value() check makes error handling mandatory and visible at call sites.
template <typename T, typename E>
class Result {
 public:
  static Result ok(T value) { return Result(std::move(value)); }
  static Result err(E error) { return Result(std::move(error)); }

  [[nodiscard]] bool has_value() const { return std::holds_alternative<T>(data_); }
  [[nodiscard]] const T& value() const { return std::get<T>(data_); }
  [[nodiscard]] const E& error() const { return std::get<E>(data_); }

 private:
  explicit Result(T value) : data_(std::move(value)) {}
  explicit Result(E error) : data_(std::move(error)) {}

  std::variant<T, E> data_;
};

}  // namespace rxrecon::core
