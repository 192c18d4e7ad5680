#pragma once

#include <array>
#include <string>
#include <string_view>
#include <variant>

#include "tinykey/key_status.hpp"

namespace tinykey {

enum class Preset {
    Alphanumeric,
    Hex,
    Base64,
    Safe,
    Lowercase,
    Uppercase,
    Numbers,
    Printable
};

constexpr std::array<Preset, 8> kAllPresets = {
    Preset::Alphanumeric,
    Preset::Hex,
    Preset::Base64,
    Preset::Safe,
    Preset::Lowercase,
    Preset::Uppercase,
    Preset::Numbers,
    Preset::Printable};

constexpr Preset kDefaultPreset = Preset::Alphanumeric;

// Exactly one of a named preset or a literal symbol list.
using AlphabetSource = std::variant<Preset, std::string>;

class Charset {
public:
    static const std::string& PresetAlphabet(Preset preset);
    static std::string_view PresetName(Preset preset);

    // Accepts the lowercase preset names ("hex", "base64", ...).
    static KeyStatus ParsePreset(std::string_view name, Preset& out_preset);

    static const std::string& Resolve(const AlphabetSource& source);
};

}  // namespace tinykey
