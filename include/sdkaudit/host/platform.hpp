#pragma once

#include <cstdint>
#include <optional>
#include <string_view>

namespace sdkaudit::host {

enum class Platform : uint8_t {
  kWindows,
  kLinux,
  kMacOS,
  kOther,
};

// The platform this process is running on.
auto CurrentPlatform() -> Platform;

// "windows", "linux" or "macos" (case-insensitive).
auto ParsePlatform(std::string_view name) -> std::optional<Platform>;

auto ToString(Platform platform) -> std::string_view;

// True when the audit may run here. Path conventions (drive roots, program
// folders) are platform-specific, so every other platform is a no-op.
inline auto PlatformGateOpen(Platform current, Platform target) -> bool {
  return current == target;
}

}  // namespace sdkaudit::host
