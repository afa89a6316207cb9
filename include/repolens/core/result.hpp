#pragma once
#include <expected>
#include <string>
#include <string_view>

namespace repolens::core {

enum class ErrorKind {
  Internal,
  // Network failure, timeout or non-2xx reply from an external service.
  Transient,
  // The external service answered, but not in the agreed shape.
  ContractViolation,
  // Missing or invalid configuration. Never retried.
  Configuration,
  Cancelled,
  NotFound,
};

struct Error {
  std::string Message;
  ErrorKind Kind{ErrorKind::Internal};
  // Bounded preview of the raw external output, when there was one.
  std::string Preview;
};

constexpr std::string_view toString(ErrorKind Kind) {
  switch (Kind) {
  case ErrorKind::Internal:
    return "internal";
  case ErrorKind::Transient:
    return "transient";
  case ErrorKind::ContractViolation:
    return "contract_violation";
  case ErrorKind::Configuration:
    return "configuration";
  case ErrorKind::Cancelled:
    return "cancelled";
  case ErrorKind::NotFound:
    return "not_found";
  }
  return "unknown";
}

} // namespace repolens::core
