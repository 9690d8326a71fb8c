#include "sdkaudit/config/audit_config.hpp"

#include <expected>
#include <filesystem>
#include <fstream>
#include <initializer_list>
#include <optional>
#include <sstream>
#include <string>
#include <string_view>
#include <system_error>
#include <utility>

#include <fmt/core.h>
#include <fmt/format.h>
#include <spdlog/spdlog.h>

#if defined(__clang__)
#pragma clang diagnostic push
#pragma clang diagnostic ignored "-Wdeprecated-literal-operator"
#endif
#include <toml++/toml.hpp>
#if defined(__clang__)
#pragma clang diagnostic pop
#endif

#include "sdkaudit/audit/message_catalog.hpp"
#include "sdkaudit/common/diagnostic.hpp"
#include "sdkaudit/host/environment.hpp"
#include "sdkaudit/host/platform.hpp"

namespace sdkaudit::config {

namespace fs = std::filesystem;

namespace {

// Reads an optional scalar; a present value of the wrong type is an error.
template <typename T>
auto ReadValue(
    const toml::table& section, std::string_view section_name,
    std::string_view key, std::string_view origin, std::string_view type_name)
    -> Result<std::optional<T>> {
  const toml::node* node = section.get(key);
  if (node == nullptr) {
    return std::optional<T>{};
  }
  if (auto value = node->value_exact<T>()) {
    return std::optional<T>(*value);
  }
  return std::unexpected(
      Diagnostic::HostError(
          std::string(origin), fmt::format(
                                   "'{}.{}' must be a {}", section_name, key,
                                   type_name)));
}

void WarnUnknownKeys(
    const toml::table& section, std::string_view section_name,
    std::initializer_list<std::string_view> known, std::string_view origin) {
  for (const auto& [key, node] : section) {
    bool found = false;
    for (std::string_view k : known) {
      found = found || key.str() == k;
    }
    if (!found) {
      spdlog::warn(
          "{}: ignoring unknown key '{}.{}'", origin, section_name, key.str());
    }
  }
}

auto ParseAuditSection(
    const toml::table& section, std::string_view origin, AuditConfig& config)
    -> Result<void> {
  WarnUnknownKeys(
      section, "audit",
      {"show_positive_messages", "sdk_folder_marker", "force_language",
       "target_platform", "path_scope"},
      origin);

  auto show_positive = ReadValue<bool>(
      section, "audit", "show_positive_messages", origin, "boolean");
  if (!show_positive) {
    return std::unexpected(std::move(show_positive).error());
  }
  if (*show_positive) {
    config.show_positive_messages = **show_positive;
  }

  auto marker = ReadValue<std::string>(
      section, "audit", "sdk_folder_marker", origin, "string");
  if (!marker) {
    return std::unexpected(std::move(marker).error());
  }
  if (*marker) {
    if ((*marker)->empty()) {
      return std::unexpected(
          Diagnostic::HostError(
              std::string(origin), "'audit.sdk_folder_marker' is empty"));
    }
    config.sdk_folder_marker = **marker;
  }

  auto language = ReadValue<std::string>(
      section, "audit", "force_language", origin, "string");
  if (!language) {
    return std::unexpected(std::move(language).error());
  }
  if (*language) {
    config.force_language = **language;
  }

  auto platform = ReadValue<std::string>(
      section, "audit", "target_platform", origin, "string");
  if (!platform) {
    return std::unexpected(std::move(platform).error());
  }
  if (*platform) {
    auto parsed = host::ParsePlatform(**platform);
    if (!parsed) {
      return std::unexpected(
          Diagnostic::HostError(
              std::string(origin),
              fmt::format("unknown target_platform '{}'", **platform))
              .WithNote("expected one of: windows, linux, macos"));
    }
    config.target_platform = *parsed;
  }

  auto scope = ReadValue<std::string>(
      section, "audit", "path_scope", origin, "string");
  if (!scope) {
    return std::unexpected(std::move(scope).error());
  }
  if (*scope) {
    auto parsed = host::ParsePathScope(**scope);
    if (!parsed) {
      return std::unexpected(
          Diagnostic::HostError(
              std::string(origin),
              fmt::format("unknown path_scope '{}'", **scope))
              .WithNote("expected one of: machine, process"));
    }
    config.path_scope = *parsed;
  }

  return {};
}

auto ParseCatalog(
    std::string_view tag, const toml::table& table, std::string_view origin)
    -> Result<audit::MessageCatalog> {
  audit::CatalogRegistry builtins;
  audit::MessageCatalog catalog = builtins.Resolve(tag);

  for (const auto& [key, node] : table) {
    auto id = audit::ParseMessageId(key.str());
    if (!id) {
      return std::unexpected(
          Diagnostic::HostError(
              std::string(origin),
              fmt::format("unknown message id 'catalog.{}.{}'", tag, key.str()))
              .WithNote(
                  "expected one of: explanation, systemPath, sdk64Only, "
                  "sdk32Only, bothCorrect, bothWrongOrder, notFound"));
    }
    auto text = node.value_exact<std::string>();
    if (!text) {
      return std::unexpected(
          Diagnostic::HostError(
              std::string(origin),
              fmt::format("'catalog.{}.{}' must be a string", tag, key.str())));
    }
    catalog.Set(*id, *text);
  }

  // systemPath receives exactly one argument at display time.
  try {
    (void)fmt::format(
        fmt::runtime(catalog.Get(audit::MessageId::kSystemPath)), "");
  } catch (const fmt::format_error& e) {
    return std::unexpected(
        Diagnostic::HostError(
            std::string(origin),
            fmt::format(
                "'catalog.{}.systemPath' is not a valid template: {}", tag,
                e.what()))
            .WithNote("use {} where the search path goes"));
  }
  return catalog;
}

}  // namespace

auto FindConfig(const fs::path& start_dir) -> std::optional<fs::path> {
  fs::path dir = fs::absolute(start_dir);

  while (true) {
    fs::path config_path = dir / kConfigFileName;
    std::error_code ec;
    if (fs::exists(config_path, ec)) {
      return config_path;
    }
    if (ec) {
      // Unreadable directory: keep looking further up
      spdlog::debug("cannot check {}: {}", config_path.string(), ec.message());
    }

    fs::path parent = dir.parent_path();
    if (parent == dir) {
      // Reached root
      return std::nullopt;
    }
    dir = parent;
  }
}

auto LoadConfig(const fs::path& config_path) -> Result<AuditConfig> {
  std::ifstream in(config_path);
  if (!in) {
    return std::unexpected(
        Diagnostic::HostError(config_path.string(), "cannot open file"));
  }
  std::stringstream buffer;
  buffer << in.rdbuf();
  return ParseConfig(
      buffer.str(), config_path.string(), config_path.parent_path());
}

auto ParseConfig(
    std::string_view text, std::string_view origin, const fs::path& root_dir)
    -> Result<AuditConfig> {
  AuditConfig config;
  config.root_dir = root_dir;

  toml::table tbl;
  try {
    tbl = toml::parse(text, origin);
  } catch (const toml::parse_error& e) {
    return std::unexpected(
        Diagnostic::HostError(
            std::string(origin),
            fmt::format(
                "failed to parse (line {}): {}", e.source().begin.line,
                e.description())));
  }

  // [audit] section (optional)
  if (auto* audit_section = tbl["audit"].as_table()) {
    if (auto parsed = ParseAuditSection(*audit_section, origin, config);
        !parsed) {
      return std::unexpected(std::move(parsed).error());
    }
  }

  // [state] section (optional)
  if (auto* state_section = tbl["state"].as_table()) {
    WarnUnknownKeys(*state_section, "state", {"file"}, origin);
    auto file =
        ReadValue<std::string>(*state_section, "state", "file", origin, "string");
    if (!file) {
      return std::unexpected(std::move(file).error());
    }
    if (*file) {
      fs::path state_path = **file;
      if (state_path.is_relative() && !root_dir.empty()) {
        state_path = root_dir / state_path;
      }
      config.state_file = state_path;
    }
  }

  // [catalog.<tag>] tables (optional)
  if (auto* catalogs = tbl["catalog"].as_table()) {
    for (const auto& [tag, node] : *catalogs) {
      const auto* table = node.as_table();
      std::string language = audit::NormalizeLanguageTag(tag.str());
      if (table == nullptr || language.empty()) {
        return std::unexpected(
            Diagnostic::HostError(
                std::string(origin),
                fmt::format(
                    "'catalog.{}' must be a table named by a language tag",
                    tag.str())));
      }
      auto catalog = ParseCatalog(language, *table, origin);
      if (!catalog) {
        return std::unexpected(std::move(catalog).error());
      }
      config.catalogs.insert_or_assign(language, std::move(*catalog));
    }
  }

  return config;
}

auto DefaultConfigText() -> std::string {
  return "[audit]\n"
         "# Also report passing checks\n"
         "show_positive_messages = false\n"
         "# Install subfolder under Program Files / Program Files (x86)\n"
         "sdk_folder_marker = \"dotnet\\\\\"\n"
         "# Message language; defaults to the user interface language\n"
         "# force_language = \"en\"\n"
         "# The check is skipped on any other platform\n"
         "target_platform = \"windows\"\n"
         "# machine: system-wide PATH, process: this shell's PATH\n"
         "path_scope = \"machine\"\n"
         "\n"
         "# [state]\n"
         "# file = \"last_result.json\"\n";
}

}  // namespace sdkaudit::config
