#pragma once

#include <cstddef>
#include <cstdint>
#include <vector>

#include "tinykey/key_status.hpp"

namespace tinykey {

class IEntropySource {
public:
    virtual ~IEntropySource() = default;

    // Writes exactly `length` bytes or reports EntropySourceFailure.
    virtual KeyStatus Fill(std::uint8_t* out, std::size_t length) = 0;
};

// Operating system CSPRNG through Crypto++. Holds no state.
class SystemEntropySource final : public IEntropySource {
public:
    KeyStatus Fill(std::uint8_t* out, std::size_t length) override;
};

// Replays a fixed byte string; fails once it runs dry. Test and adapter use only.
class StubEntropySource final : public IEntropySource {
public:
    explicit StubEntropySource(std::vector<std::uint8_t> bytes);

    KeyStatus Fill(std::uint8_t* out, std::size_t length) override;

    std::size_t Consumed() const {
        return position_;
    }

private:
    std::vector<std::uint8_t> bytes_;
    std::size_t position_ = 0;
};

IEntropySource& SystemEntropy();

}  // namespace tinykey
