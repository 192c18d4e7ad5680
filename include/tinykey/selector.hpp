#pragma once

#include <cstddef>
#include <string_view>

#include "tinykey/entropy.hpp"
#include "tinykey/key_status.hpp"

namespace tinykey {

// Uniform choice over [0, n) by rejection sampling. Sizes up to 256 take one
// byte per draw with limit 256 - (256 % n); larger sizes combine the fewest
// bytes that cover n.
class Selector {
public:
    static KeyStatus ChooseIndex(IEntropySource& source, std::size_t alphabet_size, std::size_t& out_index);

    static KeyStatus Choose(IEntropySource& source, std::string_view alphabet, char& out_symbol);
    static KeyStatus Choose(std::string_view alphabet, char& out_symbol);

    // Bytes consumed per draw for an alphabet of this size.
    static std::size_t DrawWidth(std::size_t alphabet_size);
};

}  // namespace tinykey
