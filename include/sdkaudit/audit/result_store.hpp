#pragma once

#include <filesystem>
#include <optional>
#include <utility>

#include "sdkaudit/audit/audit_result.hpp"
#include "sdkaudit/common/diagnostic.hpp"

namespace sdkaudit::audit {

// Session-scoped storage for the last AuditResult. The record is always read
// and written as one unit.
class ResultStore {
 public:
  ResultStore() = default;
  virtual ~ResultStore() = default;

  ResultStore(const ResultStore&) = delete;
  ResultStore& operator=(const ResultStore&) = delete;
  ResultStore(ResultStore&&) = delete;
  ResultStore& operator=(ResultStore&&) = delete;

  // nullopt when nothing has been recorded yet.
  virtual auto Load() -> Result<std::optional<AuditResult>> = 0;
  virtual auto Save(const AuditResult& result) -> Result<void> = 0;
  virtual auto Clear() -> Result<void> = 0;
};

// Lives as long as the process.
class MemoryResultStore final : public ResultStore {
 public:
  auto Load() -> Result<std::optional<AuditResult>> override;
  auto Save(const AuditResult& result) -> Result<void> override;
  auto Clear() -> Result<void> override;

 private:
  std::optional<AuditResult> stored_;
};

// JSON document on disk, normally under the per-session runtime directory.
// Writes go to a sibling temporary file which is then renamed over the
// target.
class FileResultStore final : public ResultStore {
 public:
  explicit FileResultStore(std::filesystem::path path)
      : path_(std::move(path)) {
  }

  auto Load() -> Result<std::optional<AuditResult>> override;
  auto Save(const AuditResult& result) -> Result<void> override;
  auto Clear() -> Result<void> override;

  [[nodiscard]] auto Path() const -> const std::filesystem::path& {
    return path_;
  }

 private:
  std::filesystem::path path_;
};

}  // namespace sdkaudit::audit
