#pragma once

#include <string>

#include "hwsuite/common/diagnostic.hpp"

namespace hwsuite::driver {

void PrintError(const std::string& message);
void PrintWarning(const std::string& message);
void PrintDiagnostic(const Diagnostic& diag);

}  // namespace hwsuite::driver
