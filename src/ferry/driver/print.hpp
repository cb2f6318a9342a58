#pragma once

#include <string>

namespace ferry::driver {

void PrintError(const std::string& message);

}  // namespace ferry::driver
