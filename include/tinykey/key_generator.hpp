#pragma once

#include <cstddef>
#include <string>
#include <string_view>
#include <vector>

#include "tinykey/entropy.hpp"
#include "tinykey/key_status.hpp"

namespace tinykey {

constexpr std::size_t kDefaultKeyLength = 42;
constexpr std::size_t kDefaultKeyCount = 1;

struct KeyShape {
    std::size_t length = kDefaultKeyLength;
    std::string prefix;
    std::string suffix;
};

class KeyGenerator {
public:
    // prefix + `length` symbols drawn from alphabet + suffix. A size that cannot
    // be allocated gives InvalidLength.
    static KeyStatus Build(
        IEntropySource& source,
        std::string_view alphabet,
        const KeyShape& shape,
        std::string& out_key);

    static KeyStatus Build(std::string_view alphabet, const KeyShape& shape, std::string& out_key);

    // Independent keys; no uniqueness check. On failure out_keys is left empty.
    static KeyStatus BuildMany(
        IEntropySource& source,
        std::size_t count,
        std::string_view alphabet,
        const KeyShape& shape,
        std::vector<std::string>& out_keys);

    static KeyStatus BuildMany(
        std::size_t count,
        std::string_view alphabet,
        const KeyShape& shape,
        std::vector<std::string>& out_keys);
};

}  // namespace tinykey
