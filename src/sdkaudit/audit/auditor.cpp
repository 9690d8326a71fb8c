#include "sdkaudit/audit/auditor.hpp"

#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <utility>

#include <spdlog/spdlog.h>

#include "sdkaudit/audit/audit_result.hpp"
#include "sdkaudit/audit/message_catalog.hpp"
#include "sdkaudit/audit/outcome.hpp"
#include "sdkaudit/audit/result_store.hpp"
#include "sdkaudit/audit/search_path.hpp"
#include "sdkaudit/common/internal_error.hpp"

namespace sdkaudit::audit {

namespace {

auto TemplateFor(AuditOutcome outcome) -> MessageId {
  switch (outcome) {
    case AuditOutcome::kSdk64Only:
      return MessageId::kSdk64Only;
    case AuditOutcome::kSdk32Only:
      return MessageId::kSdk32Only;
    case AuditOutcome::kBothCorrectOrder:
      return MessageId::kBothCorrect;
    case AuditOutcome::kBothWrongOrder:
      return MessageId::kBothWrongOrder;
    case AuditOutcome::kNotFound:
      return MessageId::kNotFound;
    case AuditOutcome::kUnchanged:
      break;
  }
  common::ThrowInternalError(
      "TemplateFor", "no message for outcome " + std::string(ToString(outcome)));
}

auto RelevantPath(AuditOutcome outcome, const AuditResult& result)
    -> std::string_view {
  switch (outcome) {
    case AuditOutcome::kSdk64Only:
    case AuditOutcome::kBothCorrectOrder:
      return result.path64;
    case AuditOutcome::kSdk32Only:
    case AuditOutcome::kBothWrongOrder:
      return result.path32;
    case AuditOutcome::kNotFound:
    case AuditOutcome::kUnchanged:
      return {};
  }
  return {};
}

}  // namespace

auto ScanSearchPath(
    std::string_view search_path, std::span<const std::string> volume_roots,
    std::string_view marker) -> AuditResult {
  AuditResult result;

  for (const auto& root : volume_roots) {
    auto candidates = CandidatesFor(root, marker);
    if (!result.has32 &&
        search_path.find(candidates.path32) != std::string_view::npos) {
      result.has32 = true;
      result.path32 = std::move(candidates.path32);
      spdlog::debug("32-bit SDK found at {}", result.path32);
    }
    if (!result.has64 &&
        search_path.find(candidates.path64) != std::string_view::npos) {
      result.has64 = true;
      result.path64 = std::move(candidates.path64);
      spdlog::debug("64-bit SDK found at {}", result.path64);
    }
    if (result.has32 && result.has64) {
      break;
    }
  }

  if (result.has32 && result.has64) {
    result.has64_first =
        search_path.find(result.path64) < search_path.find(result.path32);
  } else {
    result.has64_first = true;
  }
  return result;
}

auto ComposeMessage(
    AuditOutcome outcome, const AuditResult& result,
    std::string_view search_path, const MessageCatalog& catalog)
    -> std::string {
  std::string message = catalog.Get(TemplateFor(outcome));
  message += RelevantPath(outcome, result);
  message += catalog.Get(MessageId::kExplanation);
  message += catalog.FormatSystemPath(search_path);
  return message;
}

SdkPathAuditor::SdkPathAuditor(
    AuditOptions options, const CatalogRegistry& catalogs,
    std::string_view ui_language, ResultStore& store)
    : options_(std::move(options)),
      catalogs_(catalogs),
      ui_catalog_(catalogs.Resolve(ui_language)),
      store_(store) {
}

auto SdkPathAuditor::Audit(
    std::string_view search_path, std::span<const std::string> volume_roots,
    std::optional<std::string_view> force_language) -> AuditReport {
  AuditReport report;
  report.result =
      ScanSearchPath(search_path, volume_roots, options_.sdk_folder_marker);

  if (report.result == LoadPrevious()) {
    spdlog::info("result unchanged since last check");
    report.outcome = AuditOutcome::kUnchanged;
    return report;
  }

  if (auto saved = store_.Save(report.result); !saved) {
    spdlog::warn(
        "cannot record audit result: {}", saved.error().Describe());
  }

  report.outcome = Classify(report.result);
  spdlog::info("audit outcome: {}", ToString(report.outcome));

  if (IsPositive(report.outcome) && !options_.show_positive_messages) {
    return report;
  }
  report.message = ComposeMessage(
      report.outcome, report.result, search_path, CatalogFor(force_language));
  return report;
}

auto SdkPathAuditor::LoadPrevious() -> AuditResult {
  auto loaded = store_.Load();
  if (!loaded) {
    spdlog::warn(
        "cannot read previous audit result: {}", loaded.error().Describe());
    return AuditResult{};
  }
  return loaded->value_or(AuditResult{});
}

auto SdkPathAuditor::CatalogFor(
    std::optional<std::string_view> force_language) const
    -> const MessageCatalog& {
  if (force_language) {
    return catalogs_.Resolve(*force_language);
  }
  return ui_catalog_;
}

}  // namespace sdkaudit::audit
