#include "sdkaudit/audit/result_store.hpp"

#include <expected>
#include <filesystem>
#include <fstream>
#include <optional>
#include <string>
#include <system_error>

#include <fmt/core.h>
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include "sdkaudit/audit/audit_result.hpp"
#include "sdkaudit/common/diagnostic.hpp"

namespace sdkaudit::audit {

namespace fs = std::filesystem;

namespace {

// Top-level key the record is stored under.
constexpr auto kRecordKey = "sdkaudit.last_result";

auto ToJson(const AuditResult& result) -> nlohmann::json {
  return nlohmann::json{
      {"has32", result.has32},
      {"has64", result.has64},
      {"has64_first", result.has64_first},
      {"path32", result.path32},
      {"path64", result.path64},
  };
}

// Throws nlohmann::json::exception on missing fields or wrong types.
auto FromJson(const nlohmann::json& j) -> AuditResult {
  AuditResult result;
  result.has32 = j.at("has32").get<bool>();
  result.has64 = j.at("has64").get<bool>();
  result.has64_first = j.at("has64_first").get<bool>();
  result.path32 = j.at("path32").get<std::string>();
  result.path64 = j.at("path64").get<std::string>();
  return result;
}

}  // namespace

auto MemoryResultStore::Load() -> Result<std::optional<AuditResult>> {
  return stored_;
}

auto MemoryResultStore::Save(const AuditResult& result) -> Result<void> {
  stored_ = result;
  return {};
}

auto MemoryResultStore::Clear() -> Result<void> {
  stored_.reset();
  return {};
}

auto FileResultStore::Load() -> Result<std::optional<AuditResult>> {
  std::error_code ec;
  if (!fs::exists(path_, ec)) {
    if (ec) {
      return std::unexpected(
          Diagnostic::HostError(
              path_.string(), fmt::format("cannot access: {}", ec.message())));
    }
    return std::optional<AuditResult>{};
  }

  std::ifstream in(path_);
  if (!in) {
    return std::unexpected(
        Diagnostic::HostError(path_.string(), "cannot open result file"));
  }

  try {
    auto doc = nlohmann::json::parse(in);
    if (!doc.contains(kRecordKey)) {
      return std::unexpected(
          Diagnostic::HostError(
              path_.string(),
              fmt::format("missing '{}' record", kRecordKey)));
    }
    return std::optional<AuditResult>(FromJson(doc.at(kRecordKey)));
  } catch (const nlohmann::json::exception& e) {
    return std::unexpected(
        Diagnostic::HostError(
            path_.string(),
            fmt::format("malformed result file: {}", e.what())));
  }
}

auto FileResultStore::Save(const AuditResult& result) -> Result<void> {
  std::error_code ec;
  if (path_.has_parent_path()) {
    fs::create_directories(path_.parent_path(), ec);
    if (ec) {
      return std::unexpected(
          Diagnostic::HostError(
              path_.parent_path().string(),
              fmt::format("cannot create directory: {}", ec.message())));
    }
  }

  fs::path tmp_path = path_;
  tmp_path += ".tmp";
  {
    std::ofstream out(tmp_path, std::ios::trunc);
    if (!out) {
      return std::unexpected(
          Diagnostic::HostError(tmp_path.string(), "cannot open for writing"));
    }
    nlohmann::json doc;
    doc[kRecordKey] = ToJson(result);
    out << doc.dump(2) << '\n';
    if (!out) {
      return std::unexpected(
          Diagnostic::HostError(tmp_path.string(), "write failed"));
    }
  }

  fs::rename(tmp_path, path_, ec);
  if (ec) {
    return std::unexpected(
        Diagnostic::HostError(
            path_.string(), fmt::format("cannot replace: {}", ec.message())));
  }
  spdlog::debug("saved audit result to {}", path_.string());
  return {};
}

auto FileResultStore::Clear() -> Result<void> {
  std::error_code ec;
  fs::remove(path_, ec);
  if (ec) {
    return std::unexpected(
        Diagnostic::HostError(
            path_.string(), fmt::format("cannot remove: {}", ec.message())));
  }
  return {};
}

}  // namespace sdkaudit::audit
