#include "tinykey/entropy.hpp"

#include <algorithm>
#include <cstddef>
#include <cstdint>
#include <utility>
#include <vector>

#include "cryptlib.h"
#include "misc.h"
#include "osrng.h"

namespace tinykey {

KeyStatus SystemEntropySource::Fill(std::uint8_t* out, const std::size_t length) {
    if (length == 0) {
        return KeyStatus::Ok;
    }
    if (out == nullptr) {
        return KeyStatus::EntropySourceFailure;
    }

    try {
        CryptoPP::OS_GenerateRandomBlock(false, reinterpret_cast<CryptoPP::byte*>(out), length);
    } catch (const CryptoPP::Exception&) {
        CryptoPP::memset_z(out, 0, length);
        return KeyStatus::EntropySourceFailure;
    }
    return KeyStatus::Ok;
}

StubEntropySource::StubEntropySource(std::vector<std::uint8_t> bytes) : bytes_(std::move(bytes)) {}

KeyStatus StubEntropySource::Fill(std::uint8_t* out, const std::size_t length) {
    if (length == 0) {
        return KeyStatus::Ok;
    }
    if (out == nullptr || bytes_.size() - position_ < length) {
        return KeyStatus::EntropySourceFailure;
    }
    std::copy_n(bytes_.begin() + static_cast<std::ptrdiff_t>(position_), length, out);
    position_ += length;
    return KeyStatus::Ok;
}

IEntropySource& SystemEntropy() {
    static SystemEntropySource source;
    return source;
}

}  // namespace tinykey
