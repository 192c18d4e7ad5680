#include "tinykey/selector.hpp"

#include <array>
#include <cstdint>
#include <limits>

#include "misc.h"

namespace tinykey {

namespace {

constexpr std::size_t kMaxDrawWidth = sizeof(std::uint64_t);

// Largest draw value that still maps evenly onto [0, n).
std::uint64_t AcceptCeiling(const std::size_t width, const std::uint64_t n) {
    const std::uint64_t range_max = width >= kMaxDrawWidth
        ? std::numeric_limits<std::uint64_t>::max()
        : (std::uint64_t{1} << (width * 8U)) - 1U;
    // (range_max + 1) % n without overflowing at 2^64.
    const std::uint64_t remainder = (range_max % n + 1U) % n;
    return range_max - remainder;
}

}  // namespace

std::size_t Selector::DrawWidth(const std::size_t alphabet_size) {
    std::size_t width = 1;
    std::uint64_t covered = 256U;
    while (width < kMaxDrawWidth && covered < alphabet_size) {
        covered <<= 8U;
        ++width;
    }
    return width;
}

KeyStatus Selector::ChooseIndex(IEntropySource& source, const std::size_t alphabet_size, std::size_t& out_index) {
    if (alphabet_size == 0) {
        return KeyStatus::EmptyAlphabet;
    }

    const std::size_t width = DrawWidth(alphabet_size);
    const auto n = static_cast<std::uint64_t>(alphabet_size);
    const std::uint64_t ceiling = AcceptCeiling(width, n);

    std::array<std::uint8_t, kMaxDrawWidth> draw{};
    while (true) {
        const KeyStatus status = source.Fill(draw.data(), width);
        if (status != KeyStatus::Ok) {
            CryptoPP::memset_z(draw.data(), 0, draw.size());
            return status;
        }

        std::uint64_t value = 0;
        for (std::size_t i = 0; i < width; ++i) {
            value = (value << 8U) | draw[i];
        }
        if (value <= ceiling) {
            out_index = static_cast<std::size_t>(value % n);
            CryptoPP::memset_z(draw.data(), 0, draw.size());
            return KeyStatus::Ok;
        }
    }
}

KeyStatus Selector::Choose(IEntropySource& source, const std::string_view alphabet, char& out_symbol) {
    std::size_t index = 0;
    const KeyStatus status = ChooseIndex(source, alphabet.size(), index);
    if (status != KeyStatus::Ok) {
        return status;
    }
    out_symbol = alphabet[index];
    return KeyStatus::Ok;
}

KeyStatus Selector::Choose(const std::string_view alphabet, char& out_symbol) {
    return Choose(SystemEntropy(), alphabet, out_symbol);
}

}  // namespace tinykey
