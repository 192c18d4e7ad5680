#include "tinykey/charset.hpp"

#include <cstddef>
#include <initializer_list>
#include <string>
#include <string_view>

namespace tinykey {

namespace {

constexpr std::string_view kLowercase = "abcdefghijklmnopqrstuvwxyz";
constexpr std::string_view kUppercase = "ABCDEFGHIJKLMNOPQRSTUVWXYZ";
constexpr std::string_view kDigits = "0123456789";
constexpr std::string_view kPunctuation = "!\"#$%&'()*+,-./:;<=>?@[\\]^_`{|}~";

std::string Concat(std::initializer_list<std::string_view> parts) {
    std::string out;
    for (const auto part : parts) {
        out.append(part);
    }
    return out;
}

const std::array<std::string, kAllPresets.size()>& PresetTable() {
    static const std::array<std::string, kAllPresets.size()> table = {
        Concat({kLowercase, kUppercase, kDigits}),
        Concat({kDigits, "abcdef"}),
        Concat({kLowercase, kUppercase, kDigits, "+/"}),
        Concat({kLowercase, kUppercase, kDigits, "-_"}),
        std::string(kLowercase),
        std::string(kUppercase),
        std::string(kDigits),
        // Space is the only whitespace kept.
        Concat({kDigits, kLowercase, kUppercase, kPunctuation, " "}),
    };
    return table;
}

}  // namespace

const std::string& Charset::PresetAlphabet(const Preset preset) {
    return PresetTable()[static_cast<std::size_t>(preset)];
}

std::string_view Charset::PresetName(const Preset preset) {
    switch (preset) {
        case Preset::Alphanumeric:
            return "alphanumeric";
        case Preset::Hex:
            return "hex";
        case Preset::Base64:
            return "base64";
        case Preset::Safe:
            return "safe";
        case Preset::Lowercase:
            return "lowercase";
        case Preset::Uppercase:
            return "uppercase";
        case Preset::Numbers:
            return "numbers";
        case Preset::Printable:
            return "printable";
    }
    return "unknown";
}

KeyStatus Charset::ParsePreset(const std::string_view name, Preset& out_preset) {
    for (const Preset preset : kAllPresets) {
        if (PresetName(preset) == name) {
            out_preset = preset;
            return KeyStatus::Ok;
        }
    }
    return KeyStatus::UnknownPreset;
}

const std::string& Charset::Resolve(const AlphabetSource& source) {
    if (const auto* preset = std::get_if<Preset>(&source)) {
        return PresetAlphabet(*preset);
    }
    return std::get<std::string>(source);
}

}  // namespace tinykey
