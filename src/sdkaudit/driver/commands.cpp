#include "commands.hpp"

#include <filesystem>
#include <fstream>
#include <iostream>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include <fmt/core.h>
#include <fmt/ranges.h>
#include <spdlog/spdlog.h>

#include "print.hpp"
#include "sdkaudit/audit/auditor.hpp"
#include "sdkaudit/audit/message_catalog.hpp"
#include "sdkaudit/audit/outcome.hpp"
#include "sdkaudit/audit/result_store.hpp"
#include "sdkaudit/audit/search_path.hpp"
#include "sdkaudit/common/markup.hpp"
#include "sdkaudit/config/audit_config.hpp"
#include "sdkaudit/host/environment.hpp"
#include "sdkaudit/host/platform.hpp"

namespace sdkaudit::driver {

namespace fs = std::filesystem;

namespace {

// CLI flag, then [state] file, then the per-session default.
auto ResolveStatePath(
    const std::optional<fs::path>& state_file,
    const config::AuditConfig& config) -> fs::path {
  if (state_file) {
    return *state_file;
  }
  if (config.state_file) {
    return *config.state_file;
  }
  return host::DefaultStatePath();
}

auto YesNo(bool value) -> std::string_view {
  return value ? "yes" : "no";
}

}  // namespace

auto Check(const CheckOptions& options, const config::AuditConfig& config)
    -> int {
  auto current = host::CurrentPlatform();
  if (!host::PlatformGateOpen(current, config.target_platform)) {
    spdlog::info(
        "skipping check: running on {}, target platform is {}",
        host::ToString(current), host::ToString(config.target_platform));
    return kExitOk;
  }

  std::string search_path = options.search_path
                                ? *options.search_path
                                : host::ReadSearchPath(config.path_scope);
  std::vector<std::string> volume_roots = options.volume_roots.empty()
                                              ? host::EnumerateVolumeRoots()
                                              : options.volume_roots;
  if (spdlog::default_logger_raw()->should_log(spdlog::level::debug)) {
    for (const auto& entry :
         audit::SplitSearchPath(search_path, host::SearchPathSeparator())) {
      spdlog::debug("search path entry: {}", entry);
    }
  }

  audit::CatalogRegistry catalogs;
  for (const auto& [tag, catalog] : config.catalogs) {
    catalogs.Add(tag, catalog);
  }

  std::optional<std::string> force_language =
      options.language ? options.language : config.force_language;
  if (force_language && !catalogs.Has(*force_language)) {
    PrintWarning(
        fmt::format(
            "no messages for language '{}', using {} (available: {})",
            *force_language, audit::kDefaultLanguage,
            fmt::join(catalogs.Tags(), ", ")));
  }

  std::unique_ptr<audit::ResultStore> store;
  if (options.no_state) {
    store = std::make_unique<audit::MemoryResultStore>();
  } else {
    auto state_path = ResolveStatePath(options.state_file, config);
    spdlog::debug("state file: {}", state_path.string());
    store = std::make_unique<audit::FileResultStore>(state_path);
  }

  audit::AuditOptions audit_options{
      .show_positive_messages =
          options.show_positive || config.show_positive_messages,
      .sdk_folder_marker = config.sdk_folder_marker,
  };
  audit::SdkPathAuditor auditor(
      audit_options, catalogs, host::DetectUiLanguage(), *store);

  std::optional<std::string_view> forced;
  if (force_language) {
    forced = *force_language;
  }
  auto report = auditor.Audit(search_path, volume_roots, forced);

  if (report.message) {
    std::cout << common::RenderMarkup(*report.message, options.markup) << '\n';
  }

  if (options.strict && audit::IsFailure(audit::Classify(report.result))) {
    return kExitCheckFailed;
  }
  return kExitOk;
}

auto Status(
    const std::optional<fs::path>& state_file,
    const config::AuditConfig& config) -> int {
  audit::FileResultStore store(ResolveStatePath(state_file, config));
  auto loaded = store.Load();
  if (!loaded) {
    PrintDiagnostic(loaded.error());
    return kExitError;
  }
  if (!*loaded) {
    std::cout << fmt::format(
        "no recorded result ({})\n", store.Path().string());
    return kExitOk;
  }

  const auto& result = **loaded;
  std::cout << fmt::format("state file:   {}\n", store.Path().string());
  std::cout << fmt::format("32-bit found: {}\n", YesNo(result.has32));
  if (result.has32) {
    std::cout << fmt::format("32-bit path:  {}\n", result.path32);
  }
  std::cout << fmt::format("64-bit found: {}\n", YesNo(result.has64));
  if (result.has64) {
    std::cout << fmt::format("64-bit path:  {}\n", result.path64);
  }
  if (result.has32 && result.has64) {
    std::cout << fmt::format("64-bit first: {}\n", YesNo(result.has64_first));
  }
  std::cout << fmt::format(
      "outcome:      {}\n", audit::ToString(audit::Classify(result)));
  return kExitOk;
}

auto Reset(
    const std::optional<fs::path>& state_file,
    const config::AuditConfig& config) -> int {
  audit::FileResultStore store(ResolveStatePath(state_file, config));
  if (auto cleared = store.Clear(); !cleared) {
    PrintDiagnostic(cleared.error());
    return kExitError;
  }
  std::cout << fmt::format("cleared {}\n", store.Path().string());
  return kExitOk;
}

auto Init(bool force) -> int {
  try {
    fs::path config_path = fs::current_path() / config::kConfigFileName;
    if (fs::exists(config_path) && !force) {
      PrintError(
          fmt::format(
              "{} already exists (use --force to overwrite)",
              config::kConfigFileName));
      return kExitError;
    }

    std::ofstream out(config_path, std::ios::trunc);
    if (!out) {
      PrintError(fmt::format("cannot write {}", config_path.string()));
      return kExitError;
    }
    out << config::DefaultConfigText();
    std::cout << fmt::format("Created {}\n", config_path.string());
    return kExitOk;
  } catch (const fs::filesystem_error& e) {
    PrintError(e.what());
    return kExitError;
  }
}

}  // namespace sdkaudit::driver
