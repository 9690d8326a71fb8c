#pragma once

#include <optional>
#include <span>
#include <string>
#include <string_view>

#include "sdkaudit/audit/audit_result.hpp"
#include "sdkaudit/audit/message_catalog.hpp"
#include "sdkaudit/audit/outcome.hpp"
#include "sdkaudit/audit/result_store.hpp"
#include "sdkaudit/audit/search_path.hpp"

namespace sdkaudit::audit {

struct AuditOptions {
  bool show_positive_messages = false;
  std::string sdk_folder_marker = std::string(kDefaultSdkFolderMarker);
};

struct AuditReport {
  AuditOutcome outcome = AuditOutcome::kUnchanged;
  AuditResult result;
  // Set exactly when a diagnostic has to be displayed.
  std::optional<std::string> message;
};

// Probe each volume root, in order, for the 32-bit and 64-bit install
// locations of the SDK. The first root matching a bitness wins; scanning
// stops once both are found. Ordering is decided by substring position in
// the search path, not by which root matched first.
auto ScanSearchPath(
    std::string_view search_path, std::span<const std::string> volume_roots,
    std::string_view marker) -> AuditResult;

// <outcome template><relevant path><explanation><systemPath(search_path)>
auto ComposeMessage(
    AuditOutcome outcome, const AuditResult& result,
    std::string_view search_path, const MessageCatalog& catalog)
    -> std::string;

// Checks the search path for the SDK and reports only when the result
// changed since the last recorded one.
//
// The catalog for the UI language is resolved once at construction. The
// registry and store must outlive the auditor.
class SdkPathAuditor {
 public:
  SdkPathAuditor(
      AuditOptions options, const CatalogRegistry& catalogs,
      std::string_view ui_language, ResultStore& store);

  // Never fails. An unreadable store counts as "nothing recorded", an
  // unwritable one is logged and otherwise ignored. force_language selects
  // the catalog for this call only.
  auto Audit(
      std::string_view search_path, std::span<const std::string> volume_roots,
      std::optional<std::string_view> force_language = std::nullopt)
      -> AuditReport;

 private:
  auto LoadPrevious() -> AuditResult;
  auto CatalogFor(std::optional<std::string_view> force_language) const
      -> const MessageCatalog&;

  AuditOptions options_;
  const CatalogRegistry& catalogs_;
  const MessageCatalog& ui_catalog_;
  ResultStore& store_;
};

}  // namespace sdkaudit::audit
