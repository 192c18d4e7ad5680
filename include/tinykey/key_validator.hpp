#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "tinykey/charset.hpp"

namespace tinykey {

struct VerifyRules {
    // Absent means the charset check is skipped, not that nothing is allowed.
    std::optional<AlphabetSource> alphabet;
    std::optional<std::size_t> min_length;
    std::optional<std::size_t> max_length;
    // Empty strings count as absent.
    std::optional<std::string> prefix;
    std::optional<std::string> suffix;
};

struct ValidationReport {
    bool valid = false;
    std::optional<std::string> expected_charset;
    std::string core;
    std::size_t length = 0;
    std::optional<std::size_t> min_length;
    std::optional<std::size_t> max_length;
    // Never empty: failure diagnostics, or the single "No errors" entry.
    std::vector<std::string> reasons;
    std::vector<std::string> hints;
    std::string key_number;
};

class KeyValidator {
public:
    // Always returns a complete report; malformed keys are reported, never raised.
    static ValidationReport Verify(std::string_view key, const VerifyRules& rules = {});

    // Same checks per key, tagged "<i> out of <N>".
    static std::vector<ValidationReport> VerifyMany(const std::vector<std::string>& keys, const VerifyRules& rules = {});

    static std::string_view DropFirst(std::string_view text, std::size_t count);
    static std::string_view DropLast(std::string_view text, std::size_t count);
};

}  // namespace tinykey
