#pragma once

#include <string>

namespace sdkaudit::audit {

// Outcome of one scan of the search path. Persisted as a single record and
// compared field-by-field against the previous one for change detection.
struct AuditResult {
  bool has32 = false;
  bool has64 = false;
  // Only meaningful when has32 && has64. Set to true otherwise.
  bool has64_first = false;
  // Matched candidate paths; empty when the marker was not found.
  std::string path32;
  std::string path64;

  auto operator==(const AuditResult&) const -> bool = default;
};

}  // namespace sdkaudit::audit
