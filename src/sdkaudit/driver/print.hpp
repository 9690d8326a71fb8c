#pragma once

#include <string>

#include "sdkaudit/common/diagnostic.hpp"

namespace sdkaudit::driver {

void PrintError(const std::string& message);
void PrintWarning(const std::string& message);
void PrintDiagnostic(const Diagnostic& diag);

}  // namespace sdkaudit::driver
