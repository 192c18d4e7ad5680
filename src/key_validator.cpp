#include "tinykey/key_validator.hpp"

#include <array>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace tinykey {

namespace {

constexpr std::string_view kNoErrors = "No errors";

std::string_view AffixOrEmpty(const std::optional<std::string>& affix) {
    if (!affix.has_value()) {
        return {};
    }
    return *affix;
}

std::string DescribeChar(const unsigned char value) {
    if (value >= 0x20U && value < 0x7FU) {
        return std::string(1, static_cast<char>(value));
    }
    static constexpr char kHex[] = "0123456789ABCDEF";
    std::string out = "\\x";
    out.push_back(kHex[(value >> 4U) & 0x0FU]);
    out.push_back(kHex[value & 0x0FU]);
    return out;
}

std::string Quote(const std::string_view text) {
    std::string out = "'";
    out.append(text);
    out.push_back('\'');
    return out;
}

}  // namespace

std::string_view KeyValidator::DropFirst(const std::string_view text, const std::size_t count) {
    if (count >= text.size()) {
        return {};
    }
    return text.substr(count);
}

std::string_view KeyValidator::DropLast(const std::string_view text, const std::size_t count) {
    if (count >= text.size()) {
        return {};
    }
    return text.substr(0, text.size() - count);
}

ValidationReport KeyValidator::Verify(const std::string_view key, const VerifyRules& rules) {
    ValidationReport report;
    report.min_length = rules.min_length;
    report.max_length = rules.max_length;

    const std::string_view prefix = AffixOrEmpty(rules.prefix);
    const std::string_view suffix = AffixOrEmpty(rules.suffix);
    bool valid = true;

    // Stage 1: strip decorations. Mismatches still strip by length so the core
    // length stays reportable.
    std::string_view core;
    const std::size_t decoration_size = prefix.size() + suffix.size();
    if (decoration_size > key.size()) {
        valid = false;
        report.reasons.push_back(
            "Key shorter than its prefix and suffix: " + std::to_string(key.size()) + " < " +
            std::to_string(decoration_size));
    } else {
        core = DropLast(DropFirst(key, prefix.size()), suffix.size());
    }

    if (!prefix.empty()) {
        const std::string_view head = key.substr(0, prefix.size());
        if (head != prefix) {
            valid = false;
            report.reasons.push_back("Prefix mismatch: expected " + Quote(prefix) + ", found " + Quote(head));
        }
    }
    if (!suffix.empty()) {
        const std::string_view tail = key.size() > suffix.size() ? DropFirst(key, key.size() - suffix.size()) : key;
        if (tail != suffix) {
            valid = false;
            report.reasons.push_back("Suffix mismatch: expected " + Quote(suffix) + ", found " + Quote(tail));
        }
    }

    // Stage 2 and 3: length of the recovered core against the bounds.
    report.core = std::string(core);
    report.length = core.size();

    if (rules.min_length.has_value() && report.length < *rules.min_length) {
        valid = false;
        report.reasons.push_back(
            "Length smaller than minimum: " + std::to_string(report.length) + " < " +
            std::to_string(*rules.min_length));
        if (key.size() > *rules.min_length) {
            report.hints.emplace_back("'min_length' failure: did you mean to include affixes in the check?");
        }
    }
    if (rules.max_length.has_value() && report.length > *rules.max_length) {
        valid = false;
        report.reasons.push_back(
            "Length larger than maximum: " + std::to_string(report.length) + " > " +
            std::to_string(*rules.max_length));
        if (key.size() < *rules.max_length) {
            report.hints.emplace_back("'max_length' failure: did you mean to include affixes in the check?");
        }
    }

    // Stage 4 and 5: charset, only when one was supplied.
    if (rules.alphabet.has_value()) {
        const std::string& allowed = Charset::Resolve(*rules.alphabet);
        report.expected_charset = allowed;

        std::array<bool, 256> allowed_table{};
        allowed_table.fill(false);
        for (const char ch : allowed) {
            allowed_table[static_cast<unsigned char>(ch)] = true;
        }

        std::array<bool, 256> offending{};
        offending.fill(false);
        bool any_offending = false;
        for (const char ch : core) {
            const auto value = static_cast<unsigned char>(ch);
            if (!allowed_table[value]) {
                offending[value] = true;
                any_offending = true;
            }
        }

        if (any_offending) {
            valid = false;
            std::string listed;
            for (std::size_t value = 0; value < offending.size(); ++value) {
                if (!offending[value]) {
                    continue;
                }
                if (!listed.empty()) {
                    listed += ", ";
                }
                listed += DescribeChar(static_cast<unsigned char>(value));
            }
            report.reasons.push_back("Invalid characters: " + listed);
            if (offending[static_cast<unsigned char>('_')]) {
                report.hints.emplace_back(
                    "Found '_' among invalid characters. Did you intend it as a prefix/suffix separator?");
            }
        }
    } else if (prefix.empty() && suffix.empty() && !rules.min_length.has_value() && !rules.max_length.has_value()) {
        report.hints.emplace_back(
            "No alphabet or preset was provided. All characters are considered valid. "
            "Did you mean to provide one?");
    }

    report.valid = valid;
    if (valid) {
        report.reasons.emplace_back(kNoErrors);
    }
    return report;
}

std::vector<ValidationReport> KeyValidator::VerifyMany(const std::vector<std::string>& keys, const VerifyRules& rules) {
    std::vector<ValidationReport> reports;
    reports.reserve(keys.size());
    const std::string total = std::to_string(keys.size());
    for (std::size_t i = 0; i < keys.size(); ++i) {
        ValidationReport report = Verify(keys[i], rules);
        report.key_number = std::to_string(i + 1) + " out of " + total;
        reports.push_back(std::move(report));
    }
    return reports;
}

}  // namespace tinykey
