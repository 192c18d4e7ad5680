#pragma once

#include <cstddef>
#include <cstdint>
#include <memory>
#include <optional>
#include <random>
#include <string>

#include "tinykey/key_status.hpp"

namespace tinykey {

// Warning: seeded std::mt19937_64, predictable output. Demonstration only; never
// use it for tokens or secrets. Shares no interface with Selector or IEntropySource.
class InsecureSequence {
public:
    [[deprecated("Insecure generator. Use KeyGenerator for real keys.")]]
    static std::unique_ptr<InsecureSequence> Create(
        std::string prefix,
        std::string alphabet,
        std::size_t length,
        std::optional<std::uint64_t> seed,
        KeyStatus& out_status);

    // Prefix characters first, then `length` drawn characters.
    bool Next(char& out_char);

    std::string Collect();

private:
    InsecureSequence(std::string prefix, std::string alphabet, std::size_t length, std::uint64_t seed);

    std::string prefix_;
    std::string alphabet_;
    std::size_t length_ = 0;
    std::size_t prefix_emitted_ = 0;
    std::size_t drawn_ = 0;
    std::mt19937_64 engine_;
};

}  // namespace tinykey
