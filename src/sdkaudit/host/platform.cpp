#include "sdkaudit/host/platform.hpp"

#include <algorithm>
#include <cctype>
#include <optional>
#include <string>
#include <string_view>

namespace sdkaudit::host {

auto CurrentPlatform() -> Platform {
#if defined(_WIN32)
  return Platform::kWindows;
#elif defined(__APPLE__)
  return Platform::kMacOS;
#elif defined(__linux__)
  return Platform::kLinux;
#else
  return Platform::kOther;
#endif
}

auto ParsePlatform(std::string_view name) -> std::optional<Platform> {
  std::string lower(name);
  std::ranges::transform(lower, lower.begin(), [](unsigned char c) {
    return static_cast<char>(std::tolower(c));
  });
  if (lower == "windows") {
    return Platform::kWindows;
  }
  if (lower == "linux") {
    return Platform::kLinux;
  }
  if (lower == "macos") {
    return Platform::kMacOS;
  }
  return std::nullopt;
}

auto ToString(Platform platform) -> std::string_view {
  switch (platform) {
    case Platform::kWindows:
      return "windows";
    case Platform::kLinux:
      return "linux";
    case Platform::kMacOS:
      return "macos";
    case Platform::kOther:
      return "other";
  }
  return "other";
}

}  // namespace sdkaudit::host
