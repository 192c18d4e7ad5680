#include "tinykey/report_json.hpp"

#include <optional>
#include <string>

namespace tinykey {

namespace {

std::string OptionalSize(const std::optional<std::size_t>& value) {
    return value.has_value() ? std::to_string(*value) : std::string("null");
}

}  // namespace

std::string EscapeJson(const std::string_view input) {
    std::string output;
    output.reserve(input.size() + 8);
    for (const char ch : input) {
        switch (ch) {
            case '"':
                output += "\\\"";
                break;
            case '\\':
                output += "\\\\";
                break;
            case '\b':
                output += "\\b";
                break;
            case '\f':
                output += "\\f";
                break;
            case '\n':
                output += "\\n";
                break;
            case '\r':
                output += "\\r";
                break;
            case '\t':
                output += "\\t";
                break;
            default: {
                const unsigned char byte = static_cast<unsigned char>(ch);
                if (byte < 0x20U) {
                    static constexpr char kHex[] = "0123456789ABCDEF";
                    output += "\\u00";
                    output.push_back(kHex[(byte >> 4U) & 0x0FU]);
                    output.push_back(kHex[byte & 0x0FU]);
                } else {
                    output.push_back(ch);
                }
                break;
            }
        }
    }
    return output;
}

std::string JsonStringArray(const std::vector<std::string>& values) {
    std::string out = "[";
    for (std::size_t i = 0; i < values.size(); ++i) {
        if (i > 0) {
            out += ",";
        }
        out += "\"" + EscapeJson(values[i]) + "\"";
    }
    out += "]";
    return out;
}

std::string ReportToJson(const ValidationReport& report) {
    std::string out = "{";
    out += "\"valid\":";
    out += report.valid ? "true" : "false";
    out += ",\"expected_charset\":";
    out += report.expected_charset.has_value() ? "\"" + EscapeJson(*report.expected_charset) + "\"" : "null";
    out += ",\"core\":\"" + EscapeJson(report.core) + "\"";
    out += ",\"length\":" + std::to_string(report.length);
    out += ",\"min_length\":" + OptionalSize(report.min_length);
    out += ",\"max_length\":" + OptionalSize(report.max_length);
    out += ",\"reasons\":" + JsonStringArray(report.reasons);
    out += ",\"hints\":" + JsonStringArray(report.hints);
    if (!report.key_number.empty()) {
        out += ",\"key_number\":\"" + EscapeJson(report.key_number) + "\"";
    }
    out += "}";
    return out;
}

}  // namespace tinykey
