#pragma once

#include <cstddef>
#include <string>
#include <string_view>
#include <vector>

#include "tinykey/key_status.hpp"

namespace tinykey {

constexpr std::size_t kDefaultGroupSize = 4;
constexpr std::string_view kDefaultGroupSeparator = "-";

class KeyFormat {
public:
    // "ABCD1234EFGH5678" -> "ABCD-1234-EFGH-5678". Keys shorter than one group
    // come back unchanged.
    static KeyStatus Group(
        std::string_view key,
        std::size_t group_size,
        std::string_view separator,
        std::string& out_text);

    static std::string Join(const std::vector<std::string>& keys, std::string_view separator = "\n");
};

}  // namespace tinykey
