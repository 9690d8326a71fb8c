#include "tests/cli/cli_test_fixture.hpp"

#include <array>
#include <cstdio>
#include <cstdlib>
#include <fstream>
#include <random>
#include <sstream>
#include <stdexcept>
#include <sys/wait.h>
#include <utility>

namespace sdkaudit::test {
namespace {

auto GenerateRandomSuffix() -> std::string {
  static std::random_device rd;
  static std::mt19937 gen(rd());
  static std::uniform_int_distribution<> dis(0, 999999);
  return std::to_string(dis(gen));
}

// Execute command and capture output
// Uses popen to capture combined stdout/stderr
auto ExecuteCommand(const std::string& cmd) -> std::pair<int, std::string> {
  std::string output;
  std::array<char, 4096> buffer{};

  FILE* pipe = popen(cmd.c_str(), "r");
  if (pipe == nullptr) {
    return {-1, "Failed to execute command"};
  }

  while (fgets(buffer.data(), buffer.size(), pipe) != nullptr) {
    output += buffer.data();
  }

  int status = pclose(pipe);
  int exit_code = WIFEXITED(status) ? WEXITSTATUS(status) : -1;

  return {exit_code, output};
}

constexpr auto kHostPlatform =
#if defined(_WIN32)
    "windows";
#elif defined(__APPLE__)
    "macos";
#else
    "linux";
#endif

}  // namespace

void CliTestFixture::SetUp() {
  // Create unique test directory
  auto tmp = std::filesystem::temp_directory_path();
  test_dir_ = tmp / ("sdkaudit_cli_test_" + GenerateRandomSuffix());
  std::filesystem::create_directories(test_dir_);

  // SDKAUDIT_BIN overrides the binary the build points us at
  const char* bin = std::getenv("SDKAUDIT_BIN");
  if (bin != nullptr) {
    sdkaudit_bin_ = bin;
  } else {
    sdkaudit_bin_ = SDKAUDIT_BINARY_PATH;
  }
}

void CliTestFixture::TearDown() {
  // Clean up test directory
  if (!test_dir_.empty() && std::filesystem::exists(test_dir_)) {
    std::filesystem::remove_all(test_dir_);
  }
}

auto CliTestFixture::Run(const std::vector<std::string>& args) -> CliResult {
  // Build command string; the C locale keeps messages in English
  std::ostringstream cmd;
  cmd << "cd '" << test_dir_.string() << "' && LC_ALL=C '"
      << sdkaudit_bin_.string() << "'";
  for (const auto& arg : args) {
    // Simple escaping for shell
    cmd << " '" << arg << "'";
  }
  // Redirect stderr to stdout so we capture both
  cmd << " 2>&1";

  auto [exit_code, output] = ExecuteCommand(cmd.str());
  return CliResult{.exit_code = exit_code, .output = output};
}

auto CliTestFixture::Check(
    const std::string& search_path, const std::vector<std::string>& extra_args)
    -> CliResult {
  std::vector<std::string> args = {
      "check",        "--path",           search_path,
      "--volume",     "C:\\",             "--state-file",
      StateFile().string(),
  };
  args.insert(args.end(), extra_args.begin(), extra_args.end());
  return Run(args);
}

void CliTestFixture::WriteFile(
    const std::filesystem::path& relative_path, const std::string& content) {
  auto full_path = test_dir_ / relative_path;
  std::filesystem::create_directories(full_path.parent_path());
  std::ofstream out(full_path);
  out << content;
}

void CliTestFixture::WriteHostConfig(const std::string& extra) {
  std::ostringstream toml;
  toml << "[audit]\n";
  toml << "target_platform = \"" << kHostPlatform << "\"\n";
  toml << extra;
  WriteFile("sdkaudit.toml", toml.str());
}

auto CliTestFixture::FileExists(
    const std::filesystem::path& relative_path) const -> bool {
  return std::filesystem::exists(test_dir_ / relative_path);
}

auto CliTestFixture::ReadFile(const std::filesystem::path& relative_path) const
    -> std::string {
  auto full_path = test_dir_ / relative_path;
  std::ifstream in(full_path);
  if (!in) {
    throw std::runtime_error("Failed to read file: " + full_path.string());
  }
  std::ostringstream ss;
  ss << in.rdbuf();
  return ss.str();
}

}  // namespace sdkaudit::test
