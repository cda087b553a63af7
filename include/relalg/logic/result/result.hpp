#pragma once

#include <expected>
#include <string>

#include <relalg/logic/result/error.hpp>

namespace relalg {

struct EmptyResult {};

template <typename OkResult = EmptyResult> using Result = std::expected<OkResult, Error>;

template <typename T = EmptyResult> auto Ok(T&& v = {}) { return Result<T>(std::forward<T>(v)); }

template <ErrorType ErrorType = ErrorType::kUnknown>
std::unexpected<Error> MakeError(std::string message) {
  return std::unexpected<Error>(Error{ErrorType, std::move(message)});
}

template <ErrorType ErrorType = ErrorType::kUnknown, typename T>
std::unexpected<Error> WrapError(Result<T>&& result, std::string message) {
  return std::unexpected<Error>(std::move(result.error().Wrap(ErrorType, std::move(message))));
}

} // namespace relalg
