#pragma once

#include <exception>
#include <optional>
#include <string>
#include <vector>

namespace relalg {

enum class ErrorType {
  kUnknown,
  kNotFound,
  kParseError,
  kSchemaViolation,
  kTypeMismatch,
  kDuplicatePrimaryKey,
  kDuplicateTuple,
  kDuplicateAttributeName,
  kUnknownAttribute,
  kInvalidPrimaryKey,
  kNotSupported,
};

class Error : public std::exception {
private:
  struct ErrorData {
    ErrorType type;
    std::string message;
  };

public:
  Error(ErrorType type, std::string message);
  std::string What() const;
  virtual const char* what() const noexcept override;
  Error& Wrap(ErrorType type, std::string message);
  bool Wraps(ErrorType type) const;
  ErrorType GetType() const;

private:
  std::vector<ErrorData> wrapped_;
  std::optional<std::string> what_;
};

}  // namespace relalg
