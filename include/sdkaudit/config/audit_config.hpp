#pragma once

#include <filesystem>
#include <map>
#include <optional>
#include <string>
#include <string_view>

#include "sdkaudit/audit/message_catalog.hpp"
#include "sdkaudit/audit/search_path.hpp"
#include "sdkaudit/common/diagnostic.hpp"
#include "sdkaudit/host/environment.hpp"
#include "sdkaudit/host/platform.hpp"

namespace sdkaudit::config {

inline constexpr std::string_view kConfigFileName = "sdkaudit.toml";

struct AuditConfig {
  bool show_positive_messages = false;
  std::string sdk_folder_marker = std::string(audit::kDefaultSdkFolderMarker);
  std::optional<std::string> force_language;
  host::Platform target_platform = host::Platform::kWindows;
  host::PathScope path_scope = host::PathScope::kMachine;
  // Absolute, or relative to the working directory
  std::optional<std::filesystem::path> state_file;
  // [catalog.<tag>] tables, completed from the built-in catalog for the tag
  // (English for unknown tags)
  std::map<std::string, audit::MessageCatalog> catalogs;

  // Directory where sdkaudit.toml was found; empty for defaults
  std::filesystem::path root_dir;
};

// Search for sdkaudit.toml starting from dir, going up to parent dirs.
// Directories that cannot be inspected are skipped. Returns nullopt if not
// found.
auto FindConfig(
    const std::filesystem::path& start_dir = std::filesystem::current_path())
    -> std::optional<std::filesystem::path>;

// Parse sdkaudit.toml. Relative paths resolve against the file's directory.
auto LoadConfig(const std::filesystem::path& config_path)
    -> Result<AuditConfig>;

// Parse configuration text; origin names it in diagnostics.
auto ParseConfig(
    std::string_view text, std::string_view origin,
    const std::filesystem::path& root_dir) -> Result<AuditConfig>;

// Commented sdkaudit.toml written by `sdkaudit init`.
auto DefaultConfigText() -> std::string;

}  // namespace sdkaudit::config
