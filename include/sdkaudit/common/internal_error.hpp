#pragma once

#include <stdexcept>
#include <string>

#include <fmt/core.h>

namespace sdkaudit::common {

// Exception type for internal sdkaudit errors (bugs, not user errors)
class InternalError : public std::runtime_error {
 public:
  InternalError(const char* context, const std::string& detail)
      : std::runtime_error(
            fmt::format(
                "Internal error in {}: {}\n"
                "This is a bug in sdkaudit.",
                context, detail)) {
  }
};

[[noreturn]] inline void ThrowInternalError(
    const char* context, const std::string& detail) {
  throw InternalError(context, detail);
}

}  // namespace sdkaudit::common
