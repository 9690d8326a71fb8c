#include <argparse/argparse.hpp>
#include <cstdio>
#include <exception>
#include <filesystem>
#include <iostream>
#include <optional>
#include <string>
#include <system_error>
#include <vector>

#include <fmt/core.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

#include "commands.hpp"
#include "print.hpp"
#include "sdkaudit/common/markup.hpp"
#include "sdkaudit/config/audit_config.hpp"
#include "sdkaudit/version.hpp"

#if defined(_WIN32)
#include <io.h>
#else
#include <unistd.h>
#endif

namespace {

namespace fs = std::filesystem;

// Log lines go to stderr so stdout carries only the diagnostic.
void ConfigureLogging(int verbosity) {
  auto logger = spdlog::stderr_color_mt("sdkaudit");
  logger->set_pattern("%n: %^%l%$: %v");
  spdlog::set_default_logger(logger);
  if (verbosity >= 2) {
    spdlog::set_level(spdlog::level::debug);
  } else if (verbosity == 1) {
    spdlog::set_level(spdlog::level::info);
  } else {
    spdlog::set_level(spdlog::level::warn);
  }
}

auto StdoutIsTerminal() -> bool {
#if defined(_WIN32)
  return _isatty(_fileno(stdout)) != 0;
#else
  return isatty(fileno(stdout)) != 0;
#endif
}

// sdkaudit.toml from the working directory or a parent, defaults when there
// is none. nullopt after reporting a configuration error.
auto LoadConfigOrDefaults() -> std::optional<sdkaudit::config::AuditConfig> {
  auto config_path = sdkaudit::config::FindConfig();
  if (!config_path) {
    spdlog::debug("no {} found, using defaults",
                  sdkaudit::config::kConfigFileName);
    return sdkaudit::config::AuditConfig{};
  }
  spdlog::debug("using {}", config_path->string());
  auto config = sdkaudit::config::LoadConfig(*config_path);
  if (!config) {
    sdkaudit::driver::PrintDiagnostic(config.error());
    return std::nullopt;
  }
  return *std::move(config);
}

auto PresentPath(const argparse::ArgumentParser& cmd)
    -> std::optional<fs::path> {
  if (auto file = cmd.present<std::string>("--state-file")) {
    return fs::path(*file);
  }
  return std::nullopt;
}

auto CheckCommand(const argparse::ArgumentParser& cmd) -> int {
  sdkaudit::driver::CheckOptions options;
  options.search_path = cmd.present<std::string>("--path");
  if (auto volumes = cmd.present<std::vector<std::string>>("--volume")) {
    options.volume_roots = *volumes;
  }
  options.language = cmd.present<std::string>("--lang");
  options.show_positive = cmd.get<bool>("--show-positive");
  options.state_file = PresentPath(cmd);
  options.no_state = cmd.get<bool>("--no-state");
  options.strict = cmd.get<bool>("--strict");

  if (auto markup = cmd.present<std::string>("--markup")) {
    auto mode = sdkaudit::common::ParseMarkupMode(*markup);
    if (!mode) {
      sdkaudit::driver::PrintError(
          "unknown markup '" + *markup + "', use 'ansi', 'plain', or 'raw'");
      return sdkaudit::driver::kExitError;
    }
    options.markup = *mode;
  } else {
    options.markup = StdoutIsTerminal() ? sdkaudit::common::MarkupMode::kAnsi
                                        : sdkaudit::common::MarkupMode::kPlain;
  }

  auto config = LoadConfigOrDefaults();
  if (!config) {
    return sdkaudit::driver::kExitError;
  }
  return sdkaudit::driver::Check(options, *config);
}

auto StatusCommand(const argparse::ArgumentParser& cmd) -> int {
  auto config = LoadConfigOrDefaults();
  if (!config) {
    return sdkaudit::driver::kExitError;
  }
  return sdkaudit::driver::Status(PresentPath(cmd), *config);
}

auto ResetCommand(const argparse::ArgumentParser& cmd) -> int {
  auto config = LoadConfigOrDefaults();
  if (!config) {
    return sdkaudit::driver::kExitError;
  }
  return sdkaudit::driver::Reset(PresentPath(cmd), *config);
}

void AddStateFileFlag(argparse::ArgumentParser& cmd) {
  cmd.add_argument("--state-file")
      .help("Result file (default: per-session runtime directory)")
      .metavar("path");
}

}  // namespace

auto main(int argc, char* argv[]) -> int {
  argparse::ArgumentParser program(
      "sdkaudit", std::string(sdkaudit::kVersion),
      argparse::default_arguments::help);
  program.add_description(
      "Check that the 64-bit .NET SDK is on the PATH ahead of the 32-bit one");
  program.add_argument("--version")
      .default_value(false)
      .implicit_value(true)
      .help("Print version and exit");
  program.add_argument("-C").help("Run as if started in <dir>").metavar("dir");
  int verbosity = 0;
  program.add_argument("-v", "--verbose")
      .action([&](const auto&) { ++verbosity; })
      .append()
      .default_value(false)
      .implicit_value(true)
      .nargs(0)
      .help("More logging (repeatable)");

  // Subcommand: check
  argparse::ArgumentParser check_cmd("check");
  check_cmd.add_description("Audit the search path and report changes");
  check_cmd.add_argument("--path")
      .help("Search path to audit instead of the host PATH")
      .metavar("string");
  check_cmd.add_argument("--volume")
      .append()
      .help("Volume root to probe, e.g. C:\\ (repeatable)")
      .metavar("root");
  check_cmd.add_argument("--lang")
      .help("Message language for this run only")
      .metavar("tag");
  check_cmd.add_argument("--show-positive")
      .default_value(false)
      .implicit_value(true)
      .help("Also report passing checks");
  AddStateFileFlag(check_cmd);
  check_cmd.add_argument("--no-state")
      .default_value(false)
      .implicit_value(true)
      .help("Do not read or record the previous result");
  check_cmd.add_argument("--markup")
      .help("Color tags: ansi, plain, or raw (default: ansi on a terminal)");
  check_cmd.add_argument("--strict")
      .default_value(false)
      .implicit_value(true)
      .help("Exit with status 2 when the check fails");

  // Subcommand: status
  argparse::ArgumentParser status_cmd("status");
  status_cmd.add_description("Show the recorded result of the last check");
  AddStateFileFlag(status_cmd);

  // Subcommand: reset
  argparse::ArgumentParser reset_cmd("reset");
  reset_cmd.add_description("Forget the recorded result");
  AddStateFileFlag(reset_cmd);

  // Subcommand: init
  argparse::ArgumentParser init_cmd("init");
  init_cmd.add_description("Create a default sdkaudit.toml");
  init_cmd.add_argument("--force", "-f")
      .default_value(false)
      .implicit_value(true)
      .help("Overwrite existing sdkaudit.toml");

  program.add_subparser(check_cmd);
  program.add_subparser(status_cmd);
  program.add_subparser(reset_cmd);
  program.add_subparser(init_cmd);

  try {
    program.parse_args(argc, argv);
  } catch (const std::exception& err) {
    sdkaudit::driver::PrintError(err.what());
    std::cerr << program;
    return sdkaudit::driver::kExitError;
  }

  if (program.get<bool>("--version")) {
    std::cout << fmt::format("sdkaudit {}\n", sdkaudit::kVersion);
    return sdkaudit::driver::kExitOk;
  }

  ConfigureLogging(verbosity);

  // Handle -C before dispatching subcommands
  if (auto dir = program.present("-C")) {
    std::error_code ec;
    fs::current_path(*dir, ec);
    if (ec) {
      sdkaudit::driver::PrintError(
          fmt::format("cannot change to '{}': {}", *dir, ec.message()));
      return sdkaudit::driver::kExitError;
    }
  }

  if (program.is_subcommand_used("check")) {
    return CheckCommand(check_cmd);
  }

  if (program.is_subcommand_used("status")) {
    return StatusCommand(status_cmd);
  }

  if (program.is_subcommand_used("reset")) {
    return ResetCommand(reset_cmd);
  }

  if (program.is_subcommand_used("init")) {
    return sdkaudit::driver::Init(init_cmd.get<bool>("--force"));
  }

  // No subcommand provided
  std::cout << program;
  return sdkaudit::driver::kExitOk;
}
