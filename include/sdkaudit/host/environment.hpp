#pragma once

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace sdkaudit::host {

// Which PATH to audit.
enum class PathScope : uint8_t {
  kMachine,  // System-wide value, as newly started programs see it
  kProcess,  // This process's environment
};

auto ParsePathScope(std::string_view name) -> std::optional<PathScope>;
auto ToString(PathScope scope) -> std::string_view;

// Returns "" when the variable is not set. Machine scope falls back to the
// process environment where no system-wide value can be read.
auto ReadSearchPath(PathScope scope) -> std::string;

// ';' on Windows, ':' elsewhere.
auto SearchPathSeparator() -> char;

// Logical drive roots ("C:\", "D:\") on Windows, mount points on Linux.
auto EnumerateVolumeRoots() -> std::vector<std::string>;

// Two-letter language of the user interface locale; "en" when unknown.
auto DetectUiLanguage() -> std::string;

// Result file for the current login session.
//   1. $XDG_RUNTIME_DIR/sdkaudit/last_result.json
//   2. <temp>/sdkaudit-<session key>/last_result.json
auto DefaultStatePath() -> std::filesystem::path;

// Differs between logon sessions on Windows (logon LUID) and between boots
// elsewhere ("<uid>-<boot id>"). Stable for the lifetime of the session.
auto CurrentSessionKey() -> std::string;

}  // namespace sdkaudit::host
