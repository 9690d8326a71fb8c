#include "sdkaudit/audit/outcome.hpp"

#include <string>
#include <string_view>

#include "sdkaudit/audit/audit_result.hpp"
#include "sdkaudit/common/internal_error.hpp"

namespace sdkaudit::audit {

auto Classify(const AuditResult& result) -> AuditOutcome {
  if (result.has64 && !result.has32) {
    return AuditOutcome::kSdk64Only;
  }
  if (!result.has64 && result.has32) {
    return AuditOutcome::kSdk32Only;
  }
  if (result.has64 && result.has32) {
    return result.has64_first ? AuditOutcome::kBothCorrectOrder
                              : AuditOutcome::kBothWrongOrder;
  }
  return AuditOutcome::kNotFound;
}

auto IsPositive(AuditOutcome outcome) -> bool {
  return outcome == AuditOutcome::kSdk64Only ||
         outcome == AuditOutcome::kBothCorrectOrder;
}

auto IsFailure(AuditOutcome outcome) -> bool {
  switch (outcome) {
    case AuditOutcome::kSdk32Only:
    case AuditOutcome::kBothWrongOrder:
    case AuditOutcome::kNotFound:
      return true;
    case AuditOutcome::kUnchanged:
    case AuditOutcome::kSdk64Only:
    case AuditOutcome::kBothCorrectOrder:
      return false;
  }
  common::ThrowInternalError(
      "IsFailure", "unknown outcome " +
                       std::to_string(static_cast<int>(outcome)));
}

auto ToString(AuditOutcome outcome) -> std::string_view {
  switch (outcome) {
    case AuditOutcome::kUnchanged:
      return "unchanged";
    case AuditOutcome::kSdk64Only:
      return "sdk64-only";
    case AuditOutcome::kSdk32Only:
      return "sdk32-only";
    case AuditOutcome::kBothCorrectOrder:
      return "both-correct-order";
    case AuditOutcome::kBothWrongOrder:
      return "both-wrong-order";
    case AuditOutcome::kNotFound:
      return "not-found";
  }
  common::ThrowInternalError(
      "ToString", "unknown outcome " +
                      std::to_string(static_cast<int>(outcome)));
}

}  // namespace sdkaudit::audit
