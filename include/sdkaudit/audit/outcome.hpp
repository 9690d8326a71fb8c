#pragma once

#include <cstdint>
#include <string_view>

#include "sdkaudit/audit/audit_result.hpp"

namespace sdkaudit::audit {

enum class AuditOutcome : uint8_t {
  kUnchanged,         // Same result as last time, nothing to report
  kSdk64Only,         // Positive
  kSdk32Only,         // Negative
  kBothCorrectOrder,  // Positive
  kBothWrongOrder,    // Partial failure
  kNotFound,          // Negative
};

// Classify a result into one of the five reportable outcomes. Never returns
// kUnchanged; has64_first is consulted only when both bitnesses are present.
auto Classify(const AuditResult& result) -> AuditOutcome;

// Positive outcomes are hidden unless positive messages are enabled.
auto IsPositive(AuditOutcome outcome) -> bool;

// Outcomes that make `check --strict` fail.
auto IsFailure(AuditOutcome outcome) -> bool;

auto ToString(AuditOutcome outcome) -> std::string_view;

}  // namespace sdkaudit::audit
