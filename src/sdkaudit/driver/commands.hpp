#pragma once

#include <filesystem>
#include <optional>
#include <string>
#include <vector>

#include "sdkaudit/common/markup.hpp"
#include "sdkaudit/config/audit_config.hpp"

namespace sdkaudit::driver {

// Command-line overrides for `sdkaudit check`; unset fields fall back to the
// configuration file, then to the host environment.
struct CheckOptions {
  std::optional<std::string> search_path;
  std::vector<std::string> volume_roots;
  std::optional<std::string> language;
  bool show_positive = false;
  std::optional<std::filesystem::path> state_file;
  bool no_state = false;
  common::MarkupMode markup = common::MarkupMode::kPlain;
  bool strict = false;
};

// Exit codes
inline constexpr int kExitOk = 0;
inline constexpr int kExitError = 1;
inline constexpr int kExitCheckFailed = 2;

auto Check(const CheckOptions& options, const config::AuditConfig& config)
    -> int;

// Print the recorded result of the last check.
auto Status(
    const std::optional<std::filesystem::path>& state_file,
    const config::AuditConfig& config) -> int;

// Forget the recorded result so the next check reports again.
auto Reset(
    const std::optional<std::filesystem::path>& state_file,
    const config::AuditConfig& config) -> int;

// Write a default sdkaudit.toml into the current directory.
auto Init(bool force) -> int;

}  // namespace sdkaudit::driver
