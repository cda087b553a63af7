#include <relalg/logic/result/error.hpp>

#include <algorithm>
#include <ranges>
#include <sstream>

namespace relalg {

Error::Error(ErrorType type, std::string message)
    : wrapped_({ErrorData{std::move(type), std::move(message)}}), what_(What()) {}

std::string Error::What() const {
  std::ostringstream res;
  res << wrapped_.back().message;
  auto view_without_first = wrapped_ | std::views::reverse | std::views::drop(1);
  for (const auto& el : view_without_first) {
    res << ": " << el.message;
  }
  return res.str();
}

Error& Error::Wrap(ErrorType type, std::string message) {
  wrapped_.push_back(ErrorData{std::move(type), std::move(message)});
  what_ = What();
  return *this;
}

bool Error::Wraps(ErrorType type) const {
  return std::ranges::find(wrapped_, type, &ErrorData::type) != wrapped_.end();
}

// Type of the innermost (original) failure.
ErrorType Error::GetType() const { return wrapped_.front().type; }

const char* Error::what() const noexcept { return what_->c_str(); }

}  // namespace relalg
