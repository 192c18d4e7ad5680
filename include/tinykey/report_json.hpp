#pragma once

#include <string>
#include <string_view>
#include <vector>

#include "tinykey/key_validator.hpp"

namespace tinykey {

std::string EscapeJson(std::string_view input);

std::string JsonStringArray(const std::vector<std::string>& values);

// Object with every report field; absent optionals are written as null.
std::string ReportToJson(const ValidationReport& report);

}  // namespace tinykey
