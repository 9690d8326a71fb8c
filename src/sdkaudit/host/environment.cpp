#include "sdkaudit/host/environment.hpp"

#include <cstdint>
#include <cstdio>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <optional>
#include <string>
#include <string_view>
#include <system_error>
#include <vector>

#include <fmt/core.h>
#include <fmt/ranges.h>
#include <spdlog/spdlog.h>

#include "sdkaudit/audit/message_catalog.hpp"

#if defined(_WIN32)
#include <windows.h>
#else
#include <unistd.h>
#endif

#if defined(__linux__)
#include <mntent.h>
#endif

#if defined(__APPLE__)
#include <sys/sysctl.h>
#include <sys/time.h>
#endif

namespace sdkaudit::host {

namespace fs = std::filesystem;

namespace {

auto GetEnv(const char* name) -> std::string {
  const char* value = std::getenv(name);
  return value != nullptr ? std::string(value) : std::string{};
}

#if defined(_WIN32)

constexpr auto kEnvironmentKey =
    "SYSTEM\\CurrentControlSet\\Control\\Session Manager\\Environment";

// REG_EXPAND_SZ values come back expanded. The value can grow between the
// size query and the read, so retry until the buffer fits.
auto ReadMachinePath() -> std::optional<std::string> {
  std::string value;
  DWORD size = 0;
  while (true) {
    LSTATUS status = RegGetValueA(
        HKEY_LOCAL_MACHINE, kEnvironmentKey, "Path", RRF_RT_REG_SZ, nullptr,
        value.empty() ? nullptr : value.data(), &size);
    if (status == ERROR_SUCCESS && !value.empty()) {
      value.resize(size);
      break;
    }
    if ((status == ERROR_SUCCESS || status == ERROR_MORE_DATA) && size > 0) {
      value.assign(size, '\0');
      continue;
    }
    spdlog::debug("cannot read machine Path (status {})", status);
    return std::nullopt;
  }
  while (!value.empty() && value.back() == '\0') {
    value.pop_back();
  }
  return value;
}

// Logon session LUID: new for every logon, so state from an earlier logon or
// boot is never read back.
auto LogonSessionKey() -> std::optional<std::string> {
  HANDLE token = nullptr;
  if (OpenProcessToken(GetCurrentProcess(), TOKEN_QUERY, &token) == 0) {
    spdlog::debug("cannot open process token (error {})", GetLastError());
    return std::nullopt;
  }
  TOKEN_STATISTICS stats{};
  DWORD size = 0;
  BOOL ok = GetTokenInformation(
      token, TokenStatistics, &stats, sizeof(stats), &size);
  CloseHandle(token);
  if (ok == 0) {
    spdlog::debug("cannot query token statistics (error {})", GetLastError());
    return std::nullopt;
  }
  return fmt::format(
      "{:08x}{:08x}", static_cast<uint32_t>(stats.AuthenticationId.HighPart),
      static_cast<uint32_t>(stats.AuthenticationId.LowPart));
}

#else

auto ReadMachinePath() -> std::optional<std::string> {
  return std::nullopt;
}

// Changes on every boot. Logging out of the last session on a POSIX host
// does not clear <temp>, so the boot is the narrowest scope available there.
auto BootKey() -> std::optional<std::string> {
#if defined(__linux__)
  std::ifstream in("/proc/sys/kernel/random/boot_id");
  std::string boot_id;
  if (in >> boot_id && !boot_id.empty()) {
    return boot_id;
  }
  spdlog::debug("cannot read /proc/sys/kernel/random/boot_id");
#elif defined(__APPLE__)
  timeval boot_time{};
  size_t size = sizeof(boot_time);
  if (sysctlbyname("kern.boottime", &boot_time, &size, nullptr, 0) == 0) {
    return fmt::format("{}", boot_time.tv_sec);
  }
  spdlog::debug("cannot read kern.boottime");
#endif
  return std::nullopt;
}

#endif

}  // namespace

auto ParsePathScope(std::string_view name) -> std::optional<PathScope> {
  if (name == "machine") {
    return PathScope::kMachine;
  }
  if (name == "process") {
    return PathScope::kProcess;
  }
  return std::nullopt;
}

auto ToString(PathScope scope) -> std::string_view {
  switch (scope) {
    case PathScope::kMachine:
      return "machine";
    case PathScope::kProcess:
      return "process";
  }
  return "process";
}

auto ReadSearchPath(PathScope scope) -> std::string {
  if (scope == PathScope::kMachine) {
    if (auto machine = ReadMachinePath()) {
      return *machine;
    }
    spdlog::debug("no machine-wide PATH, using the process environment");
  }
  return GetEnv("PATH");
}

auto SearchPathSeparator() -> char {
#if defined(_WIN32)
  return ';';
#else
  return ':';
#endif
}

auto EnumerateVolumeRoots() -> std::vector<std::string> {
  std::vector<std::string> roots;

#if defined(_WIN32)
  DWORD length = GetLogicalDriveStringsA(0, nullptr);
  if (length == 0) {
    spdlog::warn("cannot enumerate logical drives");
    return roots;
  }
  std::string buffer(length, '\0');
  if (GetLogicalDriveStringsA(length, buffer.data()) == 0) {
    spdlog::warn("cannot enumerate logical drives");
    return roots;
  }
  // NUL-separated list, terminated by an empty string
  for (const char* p = buffer.c_str(); *p != '\0';
       p += std::string_view(p).size() + 1) {
    roots.emplace_back(p);
  }
#elif defined(__linux__)
  FILE* mounts = setmntent("/proc/self/mounts", "r");
  if (mounts == nullptr) {
    spdlog::warn("cannot open /proc/self/mounts, probing / only");
    roots.emplace_back("/");
    return roots;
  }
  while (const mntent* entry = getmntent(mounts)) {
    roots.emplace_back(entry->mnt_dir);
  }
  endmntent(mounts);
#else
  roots.emplace_back("/");
#endif

  spdlog::debug("volume roots: {}", fmt::join(roots, ", "));
  return roots;
}

auto DetectUiLanguage() -> std::string {
  std::string language;

#if defined(_WIN32)
  std::wstring name(LOCALE_NAME_MAX_LENGTH, L'\0');
  LCID lcid = MAKELCID(GetUserDefaultUILanguage(), SORT_DEFAULT);
  int written = LCIDToLocaleName(lcid, name.data(), LOCALE_NAME_MAX_LENGTH, 0);
  if (written > 0) {
    std::string narrow;
    for (wchar_t c : name.substr(0, static_cast<size_t>(written - 1))) {
      narrow += static_cast<char>(c & 0x7F);
    }
    language = audit::NormalizeLanguageTag(narrow);
  }
#else
  for (const char* var : {"LC_ALL", "LC_MESSAGES", "LANG"}) {
    std::string value = GetEnv(var);
    if (!value.empty()) {
      language = audit::NormalizeLanguageTag(value);
      break;
    }
  }
#endif

  if (language.empty()) {
    language = std::string(audit::kDefaultLanguage);
  }
  return language;
}

auto DefaultStatePath() -> fs::path {
  constexpr auto kFileName = "last_result.json";

  std::string runtime_dir = GetEnv("XDG_RUNTIME_DIR");
  if (!runtime_dir.empty()) {
    return fs::path(runtime_dir) / "sdkaudit" / kFileName;
  }

  std::error_code ec;
  fs::path tmp = fs::temp_directory_path(ec);
  if (ec) {
    spdlog::debug("no temp directory ({}), using cwd", ec.message());
    tmp = ".";
  }
  return tmp / fmt::format("sdkaudit-{}", CurrentSessionKey()) / kFileName;
}

auto CurrentSessionKey() -> std::string {
#if defined(_WIN32)
  if (auto logon = LogonSessionKey()) {
    return *logon;
  }
  DWORD session_id = 0;
  if (ProcessIdToSessionId(GetCurrentProcessId(), &session_id) == 0) {
    spdlog::debug("cannot query session id (error {})", GetLastError());
  }
  return fmt::format("s{}", session_id);
#else
  if (auto boot = BootKey()) {
    return fmt::format("{}-{}", getuid(), *boot);
  }
  return fmt::format("{}", getuid());
#endif
}

}  // namespace sdkaudit::host
