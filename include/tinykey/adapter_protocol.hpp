#pragma once

#include <string>
#include <string_view>

namespace tinykey {

// One JSON request object in, one single-line JSON response out (no newline).
// Failures come back as {"ok":false,"error":"<KeyStatus>"}.
std::string HandleRequestLine(std::string_view line);

}  // namespace tinykey
