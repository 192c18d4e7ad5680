#include "tinykey/insecure_sequence.hpp"

#include <chrono>
#include <random>
#include <string>
#include <utility>

namespace tinykey {

namespace {

std::uint64_t SeedFromClock() {
    std::random_device rd;
    const auto now_ns = static_cast<std::uint64_t>(
        std::chrono::high_resolution_clock::now().time_since_epoch().count());
    std::uint64_t seed = now_ns ^ 0x9E3779B97F4A7C15ULL;
    seed ^= (static_cast<std::uint64_t>(rd()) << 32U);
    seed ^= static_cast<std::uint64_t>(rd());
    return seed;
}

}  // namespace

std::unique_ptr<InsecureSequence> InsecureSequence::Create(
    std::string prefix,
    std::string alphabet,
    const std::size_t length,
    const std::optional<std::uint64_t> seed,
    KeyStatus& out_status) {
    if (alphabet.empty() && length > 0) {
        out_status = KeyStatus::EmptyAlphabet;
        return nullptr;
    }
    out_status = KeyStatus::Ok;
    return std::unique_ptr<InsecureSequence>(new InsecureSequence(
        std::move(prefix), std::move(alphabet), length, seed.has_value() ? *seed : SeedFromClock()));
}

InsecureSequence::InsecureSequence(
    std::string prefix,
    std::string alphabet,
    const std::size_t length,
    const std::uint64_t seed)
    : prefix_(std::move(prefix)), alphabet_(std::move(alphabet)), length_(length), engine_(seed) {}

bool InsecureSequence::Next(char& out_char) {
    if (prefix_emitted_ < prefix_.size()) {
        out_char = prefix_[prefix_emitted_++];
        return true;
    }
    if (drawn_ >= length_) {
        return false;
    }
    std::uniform_int_distribution<std::size_t> dist(0, alphabet_.size() - 1);
    out_char = alphabet_[dist(engine_)];
    ++drawn_;
    return true;
}

std::string InsecureSequence::Collect() {
    std::string out;
    out.reserve(prefix_.size() - prefix_emitted_ + length_ - drawn_);
    char ch = '\0';
    while (Next(ch)) {
        out.push_back(ch);
    }
    return out;
}

}  // namespace tinykey
