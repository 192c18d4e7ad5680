#include "tinykey/adapter_protocol.hpp"

#include <cctype>
#include <cstdint>
#include <cstdlib>
#include <memory>
#include <optional>
#include <ostream>
#include <sstream>
#include <string>
#include <string_view>
#include <unordered_map>
#include <utility>
#include <vector>

#include "tinykey/charset.hpp"
#include "tinykey/entropy.hpp"
#include "tinykey/insecure_sequence.hpp"
#include "tinykey/key_format.hpp"
#include "tinykey/key_generator.hpp"
#include "tinykey/key_status.hpp"
#include "tinykey/key_validator.hpp"
#include "tinykey/report_json.hpp"
#include "tinykey/selector.hpp"

namespace {

using tinykey::KeyStatus;

struct JsonValue {
    enum class Type {
        Null,
        Number,
        String,
        Array,
        Object
    };

    Type type = Type::Null;
    long long number_value = 0;
    std::string string_value;
    std::vector<JsonValue> array_value;
    std::unordered_map<std::string, JsonValue> object_value;
};

class JsonParser {
public:
    explicit JsonParser(std::string_view input) : input_(input) {}

    bool ParseRootObject(JsonValue& out_value) {
        SkipWhitespace();
        if (!ParseObject(out_value)) {
            return false;
        }
        SkipWhitespace();
        return position_ == input_.size();
    }

private:
    bool ParseValue(JsonValue& out_value) {
        SkipWhitespace();
        if (End()) {
            return false;
        }
        const char ch = input_[position_];
        if (ch == '{') {
            return ParseObject(out_value);
        }
        if (ch == '[') {
            return ParseArray(out_value);
        }
        if (ch == '"') {
            out_value.type = JsonValue::Type::String;
            return ParseString(out_value.string_value);
        }
        if (ch == 'n') {
            if (!ConsumeLiteral("null")) {
                return false;
            }
            out_value.type = JsonValue::Type::Null;
            return true;
        }
        if (ch == '-' || std::isdigit(static_cast<unsigned char>(ch)) != 0) {
            out_value.type = JsonValue::Type::Number;
            return ParseNumber(out_value.number_value);
        }
        return false;
    }

    bool ParseArray(JsonValue& out_value) {
        if (!ConsumeChar('[')) {
            return false;
        }

        out_value.type = JsonValue::Type::Array;
        out_value.array_value.clear();

        SkipWhitespace();
        if (ConsumeChar(']')) {
            return true;
        }

        while (true) {
            JsonValue element;
            if (!ParseValue(element)) {
                return false;
            }
            out_value.array_value.push_back(std::move(element));

            SkipWhitespace();
            if (ConsumeChar(']')) {
                return true;
            }
            if (!ConsumeChar(',')) {
                return false;
            }
        }
    }

    bool ParseObject(JsonValue& out_value) {
        if (!ConsumeChar('{')) {
            return false;
        }

        out_value.type = JsonValue::Type::Object;
        out_value.object_value.clear();

        SkipWhitespace();
        if (ConsumeChar('}')) {
            return true;
        }

        while (true) {
            SkipWhitespace();
            std::string key;
            if (!ParseString(key)) {
                return false;
            }

            SkipWhitespace();
            if (!ConsumeChar(':')) {
                return false;
            }

            JsonValue value;
            if (!ParseValue(value)) {
                return false;
            }
            out_value.object_value.emplace(std::move(key), std::move(value));

            SkipWhitespace();
            if (ConsumeChar('}')) {
                return true;
            }
            if (!ConsumeChar(',')) {
                return false;
            }
        }
    }

    bool ParseString(std::string& out_text) {
        if (!ConsumeChar('"')) {
            return false;
        }
        out_text.clear();

        while (!End()) {
            const char ch = input_[position_++];
            if (ch == '"') {
                return true;
            }
            if (ch == '\\') {
                if (End()) {
                    return false;
                }
                const char esc = input_[position_++];
                switch (esc) {
                    case '"':
                        out_text.push_back('"');
                        break;
                    case '\\':
                        out_text.push_back('\\');
                        break;
                    case '/':
                        out_text.push_back('/');
                        break;
                    case 'b':
                        out_text.push_back('\b');
                        break;
                    case 'f':
                        out_text.push_back('\f');
                        break;
                    case 'n':
                        out_text.push_back('\n');
                        break;
                    case 'r':
                        out_text.push_back('\r');
                        break;
                    case 't':
                        out_text.push_back('\t');
                        break;
                    case 'u': {
                        std::uint32_t codepoint = 0;
                        if (!ParseHex4(codepoint)) {
                            return false;
                        }
                        AppendUtf8(codepoint, out_text);
                        break;
                    }
                    default:
                        return false;
                }
                continue;
            }

            if (static_cast<unsigned char>(ch) < 0x20U) {
                return false;
            }
            out_text.push_back(ch);
        }

        return false;
    }

    // Keys are byte strings, so \u escapes are stored as their UTF-8 bytes.
    // Surrogate pairs are not combined.
    static void AppendUtf8(const std::uint32_t codepoint, std::string& out_text) {
        if (codepoint <= 0x7FU) {
            out_text.push_back(static_cast<char>(codepoint));
        } else if (codepoint <= 0x7FFU) {
            out_text.push_back(static_cast<char>(0xC0U | (codepoint >> 6U)));
            out_text.push_back(static_cast<char>(0x80U | (codepoint & 0x3FU)));
        } else {
            out_text.push_back(static_cast<char>(0xE0U | (codepoint >> 12U)));
            out_text.push_back(static_cast<char>(0x80U | ((codepoint >> 6U) & 0x3FU)));
            out_text.push_back(static_cast<char>(0x80U | (codepoint & 0x3FU)));
        }
    }

    bool ParseHex4(std::uint32_t& out_value) {
        if (position_ + 4 > input_.size()) {
            return false;
        }
        out_value = 0;
        for (int i = 0; i < 4; ++i) {
            const char ch = input_[position_++];
            int digit = 0;
            if (ch >= '0' && ch <= '9') {
                digit = ch - '0';
            } else if (ch >= 'a' && ch <= 'f') {
                digit = 10 + (ch - 'a');
            } else if (ch >= 'A' && ch <= 'F') {
                digit = 10 + (ch - 'A');
            } else {
                return false;
            }
            out_value = (out_value << 4U) | static_cast<std::uint32_t>(digit);
        }
        return true;
    }

    bool ParseNumber(long long& out_number) {
        const std::size_t start = position_;
        if (input_[position_] == '-') {
            ++position_;
            if (End()) {
                return false;
            }
        }
        if (std::isdigit(static_cast<unsigned char>(input_[position_])) == 0) {
            return false;
        }
        while (!End() && std::isdigit(static_cast<unsigned char>(input_[position_])) != 0) {
            ++position_;
        }
        const std::string text(input_.substr(start, position_ - start));
        char* end_ptr = nullptr;
        const long long value = std::strtoll(text.c_str(), &end_ptr, 10);
        if (end_ptr == nullptr || *end_ptr != '\0') {
            return false;
        }
        out_number = value;
        return true;
    }

    bool ConsumeLiteral(const std::string_view literal) {
        if (position_ + literal.size() > input_.size()) {
            return false;
        }
        if (input_.substr(position_, literal.size()) != literal) {
            return false;
        }
        position_ += literal.size();
        return true;
    }

    bool ConsumeChar(const char expected) {
        if (!End() && input_[position_] == expected) {
            ++position_;
            return true;
        }
        return false;
    }

    void SkipWhitespace() {
        while (!End() && std::isspace(static_cast<unsigned char>(input_[position_])) != 0) {
            ++position_;
        }
    }

    bool End() const {
        return position_ >= input_.size();
    }

    std::string_view input_;
    std::size_t position_ = 0;
};

const JsonValue* FindObjectMember(const JsonValue& object, const std::string_view key) {
    if (object.type != JsonValue::Type::Object) {
        return nullptr;
    }
    const auto it = object.object_value.find(std::string(key));
    if (it == object.object_value.end()) {
        return nullptr;
    }
    return &it->second;
}

std::string GetString(const JsonValue& object, const std::string_view key, const std::string& fallback = "") {
    const JsonValue* value = FindObjectMember(object, key);
    if (value == nullptr || value->type != JsonValue::Type::String) {
        return fallback;
    }
    return value->string_value;
}

std::optional<std::string> GetOptionalString(const JsonValue& object, const std::string_view key) {
    const JsonValue* value = FindObjectMember(object, key);
    if (value == nullptr || value->type != JsonValue::Type::String) {
        return std::nullopt;
    }
    return value->string_value;
}

long long GetNumber(const JsonValue& object, const std::string_view key, const long long fallback) {
    const JsonValue* value = FindObjectMember(object, key);
    if (value == nullptr || value->type != JsonValue::Type::Number) {
        return fallback;
    }
    return value->number_value;
}

std::optional<long long> GetOptionalNumber(const JsonValue& object, const std::string_view key) {
    const JsonValue* value = FindObjectMember(object, key);
    if (value == nullptr || value->type != JsonValue::Type::Number) {
        return std::nullopt;
    }
    return value->number_value;
}

bool GetStringArray(const JsonValue& object, const std::string_view key, std::vector<std::string>& out_values) {
    const JsonValue* value = FindObjectMember(object, key);
    if (value == nullptr || value->type != JsonValue::Type::Array) {
        return false;
    }
    out_values.clear();
    out_values.reserve(value->array_value.size());
    for (const auto& element : value->array_value) {
        if (element.type != JsonValue::Type::String) {
            return false;
        }
        out_values.push_back(element.string_value);
    }
    return true;
}

bool HasKey(const JsonValue& object, const std::string_view key) {
    return FindObjectMember(object, key) != nullptr;
}

std::optional<std::vector<std::uint8_t>> ParseHexBytes(const std::string_view input) {
    if ((input.size() % 2U) != 0U) {
        return std::nullopt;
    }
    auto from_hex = [](const char ch) -> int {
        if (ch >= '0' && ch <= '9') {
            return ch - '0';
        }
        if (ch >= 'a' && ch <= 'f') {
            return 10 + (ch - 'a');
        }
        if (ch >= 'A' && ch <= 'F') {
            return 10 + (ch - 'A');
        }
        return -1;
    };

    std::vector<std::uint8_t> output;
    output.reserve(input.size() / 2U);
    for (std::size_t i = 0; i < input.size(); i += 2U) {
        const int high = from_hex(input[i]);
        const int low = from_hex(input[i + 1U]);
        if (high < 0 || low < 0) {
            return std::nullopt;
        }
        output.push_back(static_cast<std::uint8_t>((high << 4) | low));
    }
    return output;
}

// "alphabet" (literal) takes precedence over "preset"; neither means `fallback`.
KeyStatus ReadAlphabetSource(
    const JsonValue& request,
    const std::optional<tinykey::AlphabetSource>& fallback,
    std::optional<tinykey::AlphabetSource>& out_source) {
    if (const auto alphabet = GetOptionalString(request, "alphabet")) {
        out_source = *alphabet;
        return KeyStatus::Ok;
    }
    if (const auto preset_name = GetOptionalString(request, "preset")) {
        tinykey::Preset preset = tinykey::kDefaultPreset;
        const KeyStatus status = tinykey::Charset::ParsePreset(*preset_name, preset);
        if (status != KeyStatus::Ok) {
            return status;
        }
        out_source = preset;
        return KeyStatus::Ok;
    }
    out_source = fallback;
    return KeyStatus::Ok;
}

KeyStatus ReadSize(const JsonValue& request, const std::string_view key, const long long fallback, std::size_t& out) {
    const long long value = GetNumber(request, key, fallback);
    if (value < 0) {
        return KeyStatus::InvalidLength;
    }
    out = static_cast<std::size_t>(value);
    return KeyStatus::Ok;
}

KeyStatus ReadOptionalSize(const JsonValue& request, const std::string_view key, std::optional<std::size_t>& out) {
    const auto value = GetOptionalNumber(request, key);
    if (!value.has_value()) {
        out.reset();
        return KeyStatus::Ok;
    }
    if (*value < 0) {
        return KeyStatus::InvalidLength;
    }
    out = static_cast<std::size_t>(*value);
    return KeyStatus::Ok;
}

KeyStatus ReadVerifyRules(const JsonValue& request, tinykey::VerifyRules& out_rules) {
    KeyStatus status = ReadAlphabetSource(request, std::nullopt, out_rules.alphabet);
    if (status != KeyStatus::Ok) {
        return status;
    }
    status = ReadOptionalSize(request, "min_length", out_rules.min_length);
    if (status != KeyStatus::Ok) {
        return status;
    }
    status = ReadOptionalSize(request, "max_length", out_rules.max_length);
    if (status != KeyStatus::Ok) {
        return status;
    }
    out_rules.prefix = GetOptionalString(request, "prefix");
    out_rules.suffix = GetOptionalString(request, "suffix");
    return KeyStatus::Ok;
}

KeyStatus ReadKeyShape(const JsonValue& request, tinykey::KeyShape& out_shape) {
    const KeyStatus status =
        ReadSize(request, "length", static_cast<long long>(tinykey::kDefaultKeyLength), out_shape.length);
    if (status != KeyStatus::Ok) {
        return status;
    }
    out_shape.prefix = GetString(request, "prefix");
    out_shape.suffix = GetString(request, "suffix");
    return KeyStatus::Ok;
}

void WriteError(std::ostream& out, const std::string_view error) {
    out << "{\"ok\":false,\"error\":\"" << tinykey::EscapeJson(error) << "\"}";
}

void WriteStatusError(std::ostream& out, const KeyStatus status) {
    WriteError(out, tinykey::ToString(status));
}

void WriteOkSimple(std::ostream& out) {
    out << "{\"ok\":true}";
}

void WriteOkString(std::ostream& out, const std::string_view field, const std::string_view value) {
    out << "{\"ok\":true,\"" << field << "\":\"" << tinykey::EscapeJson(value) << "\"}";
}

void WriteOkKeys(std::ostream& out, const std::vector<std::string>& keys) {
    out << "{\"ok\":true,\"keys\":" << tinykey::JsonStringArray(keys) << "}";
}

void WriteOkPresets(std::ostream& out) {
    out << "{\"ok\":true,\"presets\":{";
    bool first = true;
    for (const tinykey::Preset preset : tinykey::kAllPresets) {
        if (!first) {
            out << ",";
        }
        first = false;
        out << "\"" << tinykey::Charset::PresetName(preset) << "\":\""
            << tinykey::EscapeJson(tinykey::Charset::PresetAlphabet(preset)) << "\"";
    }
    out << "}}";
}

void WriteOkReports(std::ostream& out, const std::vector<tinykey::ValidationReport>& reports) {
    out << "{\"ok\":true,\"reports\":[";
    for (std::size_t i = 0; i < reports.size(); ++i) {
        if (i > 0) {
            out << ",";
        }
        out << tinykey::ReportToJson(reports[i]);
    }
    out << "]}";
}

// Stub mode replays caller-supplied bytes so selections are reproducible.
KeyStatus MakeEntropySource(const JsonValue& request, std::unique_ptr<tinykey::StubEntropySource>& out_stub) {
    const std::string mode = GetString(request, "mode", "system");
    if (mode != "stub") {
        out_stub.reset();
        return KeyStatus::Ok;
    }
    if (!HasKey(request, "rng_bytes_hex")) {
        return KeyStatus::EntropySourceFailure;
    }
    auto bytes = ParseHexBytes(GetString(request, "rng_bytes_hex"));
    if (!bytes.has_value()) {
        return KeyStatus::BadHex;
    }
    out_stub = std::make_unique<tinykey::StubEntropySource>(std::move(*bytes));
    return KeyStatus::Ok;
}

tinykey::IEntropySource& SourceOrSystem(const std::unique_ptr<tinykey::StubEntropySource>& stub) {
    if (stub != nullptr) {
        return *stub;
    }
    return tinykey::SystemEntropy();
}

}  // namespace

namespace tinykey {

std::string HandleRequestLine(const std::string_view line) {
    std::ostringstream out;

    JsonValue request;
    JsonParser parser(line);
    if (!parser.ParseRootObject(request)) {
        WriteStatusError(out, KeyStatus::BadJson);
        return out.str();
    }

    const std::string op = GetString(request, "op");
    if (op == "ping") {
        WriteOkSimple(out);
        return out.str();
    }

    if (op == "presets") {
        WriteOkPresets(out);
        return out.str();
    }

    if (op == "choose") {
        std::optional<AlphabetSource> source;
        KeyStatus status = ReadAlphabetSource(request, AlphabetSource{kDefaultPreset}, source);
        std::unique_ptr<StubEntropySource> stub;
        if (status == KeyStatus::Ok) {
            status = MakeEntropySource(request, stub);
        }
        char symbol = '\0';
        if (status == KeyStatus::Ok) {
            status = Selector::Choose(SourceOrSystem(stub), Charset::Resolve(*source), symbol);
        }
        if (status != KeyStatus::Ok) {
            WriteStatusError(out, status);
        } else {
            WriteOkString(out, "symbol", std::string_view(&symbol, 1));
        }
        return out.str();
    }

    if (op == "gen_key" || op == "gen_keys") {
        std::optional<AlphabetSource> source;
        KeyStatus status = ReadAlphabetSource(request, AlphabetSource{kDefaultPreset}, source);
        KeyShape shape;
        if (status == KeyStatus::Ok) {
            status = ReadKeyShape(request, shape);
        }
        std::size_t count = 1;
        if (status == KeyStatus::Ok && op == "gen_keys") {
            status = ReadSize(request, "count", static_cast<long long>(kDefaultKeyCount), count);
        }
        std::unique_ptr<StubEntropySource> stub;
        if (status == KeyStatus::Ok) {
            status = MakeEntropySource(request, stub);
        }

        std::vector<std::string> keys;
        if (status == KeyStatus::Ok) {
            status = KeyGenerator::BuildMany(SourceOrSystem(stub), count, Charset::Resolve(*source), shape, keys);
        }
        if (status != KeyStatus::Ok) {
            WriteStatusError(out, status);
        } else if (op == "gen_key") {
            WriteOkString(out, "key", keys.front());
        } else {
            WriteOkKeys(out, keys);
        }
        return out.str();
    }

    if (op == "verify") {
        VerifyRules rules;
        const KeyStatus status = ReadVerifyRules(request, rules);
        if (status != KeyStatus::Ok) {
            WriteStatusError(out, status);
        } else {
            const ValidationReport report = KeyValidator::Verify(GetString(request, "key"), rules);
            out << "{\"ok\":true,\"report\":" << ReportToJson(report) << "}";
        }
        return out.str();
    }

    if (op == "verify_many") {
        VerifyRules rules;
        std::vector<std::string> keys;
        KeyStatus status = ReadVerifyRules(request, rules);
        if (status == KeyStatus::Ok && !GetStringArray(request, "keys", keys)) {
            status = KeyStatus::BadJson;
        }
        if (status != KeyStatus::Ok) {
            WriteStatusError(out, status);
        } else {
            WriteOkReports(out, KeyValidator::VerifyMany(keys, rules));
        }
        return out.str();
    }

    if (op == "format") {
        std::size_t group_size = kDefaultGroupSize;
        KeyStatus status = ReadSize(request, "group_size", static_cast<long long>(kDefaultGroupSize), group_size);
        std::string grouped;
        if (status == KeyStatus::Ok) {
            status = KeyFormat::Group(
                GetString(request, "key"),
                group_size,
                GetString(request, "separator", std::string(kDefaultGroupSeparator)),
                grouped);
        }
        if (status != KeyStatus::Ok) {
            WriteStatusError(out, status);
        } else {
            WriteOkString(out, "text", grouped);
        }
        return out.str();
    }

    if (op == "insecure_sequence") {
        std::optional<AlphabetSource> source;
        KeyStatus status = ReadAlphabetSource(request, AlphabetSource{kDefaultPreset}, source);
        std::size_t length = 0;
        if (status == KeyStatus::Ok) {
            status = ReadSize(request, "length", static_cast<long long>(kDefaultKeyLength), length);
        }
        std::optional<std::uint64_t> seed;
        if (const auto seed_number = GetOptionalNumber(request, "seed")) {
            seed = static_cast<std::uint64_t>(*seed_number);
        }

        std::unique_ptr<InsecureSequence> sequence;
        if (status == KeyStatus::Ok) {
            sequence = InsecureSequence::Create(
                GetString(request, "prefix"), Charset::Resolve(*source), length, seed, status);
        }
        if (status != KeyStatus::Ok) {
            WriteStatusError(out, status);
        } else {
            WriteOkString(out, "text", sequence->Collect());
        }
        return out.str();
    }

    WriteStatusError(out, KeyStatus::UnknownOp);
    return out.str();
}

}  // namespace tinykey
