#pragma once

#include <string_view>

namespace tinykey {

enum class KeyStatus {
    Ok = 0,
    EmptyAlphabet,
    UnknownPreset,
    EntropySourceFailure,
    InvalidLength,
    BadHex,
    UnknownOp,
    BadJson
};

inline std::string_view ToString(const KeyStatus status) {
    switch (status) {
        case KeyStatus::Ok:
            return "Ok";
        case KeyStatus::EmptyAlphabet:
            return "EmptyAlphabet";
        case KeyStatus::UnknownPreset:
            return "UnknownPreset";
        case KeyStatus::EntropySourceFailure:
            return "EntropySourceFailure";
        case KeyStatus::InvalidLength:
            return "InvalidLength";
        case KeyStatus::BadHex:
            return "BadHex";
        case KeyStatus::UnknownOp:
            return "UnknownOp";
        case KeyStatus::BadJson:
            return "BadJson";
    }
    return "UnknownStatus";
}

}  // namespace tinykey
