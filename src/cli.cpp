#include "tinykey/cli.hpp"

#include <cstdint>
#include <exception>
#include <functional>
#include <iostream>
#include <limits>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "tinykey/charset.hpp"
#include "tinykey/insecure_sequence.hpp"
#include "tinykey/key_format.hpp"
#include "tinykey/key_generator.hpp"
#include "tinykey/key_status.hpp"
#include "tinykey/key_validator.hpp"
#include "tinykey/report_json.hpp"

namespace {

constexpr int kExitOk = 0;
constexpr int kExitError = 1;
constexpr int kExitInvalidKey = 2;

struct AlphabetOptions {
    std::optional<std::string> preset;
    std::optional<std::string> alphabet;
};

struct KeygenOptions {
    bool help = false;
    bool log = false;
    AlphabetOptions charset;
    std::size_t length = tinykey::kDefaultKeyLength;
    std::size_t count = tinykey::kDefaultKeyCount;
    std::string prefix;
    std::string suffix;
    std::optional<std::size_t> group_size;
    std::string separator = std::string(tinykey::kDefaultGroupSeparator);
};

struct VerifyOptions {
    bool help = false;
    bool log = false;
    bool json = false;
    std::optional<std::string> key;
    AlphabetOptions charset;
    std::optional<std::size_t> min_length;
    std::optional<std::size_t> max_length;
    std::optional<std::string> prefix;
    std::optional<std::string> suffix;
};

struct FormatOptions {
    bool help = false;
    std::optional<std::string> key;
    std::size_t group_size = tinykey::kDefaultGroupSize;
    std::string separator = std::string(tinykey::kDefaultGroupSeparator);
};

struct InsecureOptions {
    bool help = false;
    AlphabetOptions charset;
    std::string prefix;
    std::size_t length = tinykey::kDefaultKeyLength;
    std::optional<std::uint64_t> seed;
};

void CliLog(const bool enabled, const std::string& message) {
    if (!enabled) {
        return;
    }
    std::cerr << "[log] " << message << "\n";
}

bool ParseSize(const std::string& value, const bool allow_zero, std::size_t& out) {
    if (value.empty() || value.front() == '-' || value.front() == '+') {
        return false;
    }
    std::size_t idx = 0;
    unsigned long long parsed = 0;
    try {
        parsed = std::stoull(value, &idx);
    } catch (const std::exception&) {
        return false;
    }
    if (idx != value.size() ||
        (!allow_zero && parsed == 0) ||
        parsed > static_cast<unsigned long long>(std::numeric_limits<std::size_t>::max())) {
        return false;
    }
    out = static_cast<std::size_t>(parsed);
    return true;
}

bool ParseSeed(const std::string& value, std::uint64_t& out) {
    std::size_t parsed = 0;
    if (!ParseSize(value, true, parsed)) {
        return false;
    }
    out = static_cast<std::uint64_t>(parsed);
    return true;
}

// Handles the flags shared by every subcommand that draws on an alphabet.
// Returns true when `arg` was one of them.
bool ParseAlphabetFlag(
    const std::string& arg,
    const std::function<bool(std::string&)>& require_value,
    AlphabetOptions& opts,
    bool& ok) {
    ok = true;
    if (arg == "--preset") {
        std::string value;
        ok = require_value(value);
        opts.preset = std::move(value);
        return true;
    }
    if (arg == "--alphabet") {
        std::string value;
        ok = require_value(value);
        opts.alphabet = std::move(value);
        return true;
    }
    return false;
}

// A non-empty literal alphabet wins over the preset name; the default preset
// applies when neither is given.
tinykey::KeyStatus ResolveAlphabetOptions(const AlphabetOptions& opts, tinykey::AlphabetSource& out_source) {
    if (opts.alphabet.has_value() && !opts.alphabet->empty()) {
        out_source = *opts.alphabet;
        return tinykey::KeyStatus::Ok;
    }
    if (opts.preset.has_value()) {
        tinykey::Preset preset = tinykey::kDefaultPreset;
        const tinykey::KeyStatus status = tinykey::Charset::ParsePreset(*opts.preset, preset);
        if (status != tinykey::KeyStatus::Ok) {
            return status;
        }
        out_source = preset;
        return tinykey::KeyStatus::Ok;
    }
    out_source = tinykey::kDefaultPreset;
    return tinykey::KeyStatus::Ok;
}

bool ParseKeygenArgs(const int argc, char* argv[], const int start_index, KeygenOptions& opts, std::string& error) {
    for (int i = start_index; i < argc; ++i) {
        const std::string arg(argv[i]);
        std::function<bool(std::string&)> require_value = [&](std::string& dst) -> bool {
            if (i + 1 >= argc) {
                error = "Missing value for " + arg;
                return false;
            }
            dst = argv[++i];
            return true;
        };
        auto require_size = [&](const bool allow_zero, std::size_t& dst) -> bool {
            std::string value;
            if (!require_value(value)) {
                return false;
            }
            if (!ParseSize(value, allow_zero, dst)) {
                error = "Invalid value for " + arg;
                return false;
            }
            return true;
        };

        bool ok = true;
        if (ParseAlphabetFlag(arg, require_value, opts.charset, ok)) {
            if (!ok) {
                return false;
            }
        } else if (arg == "--help" || arg == "-h") {
            opts.help = true;
        } else if (arg == "--log") {
            opts.log = true;
        } else if (arg == "--length") {
            if (!require_size(true, opts.length)) {
                return false;
            }
        } else if (arg == "--count") {
            if (!require_size(true, opts.count)) {
                return false;
            }
        } else if (arg == "--group") {
            std::size_t group = 0;
            if (!require_size(false, group)) {
                return false;
            }
            opts.group_size = group;
        } else if (arg == "--separator") {
            if (!require_value(opts.separator)) {
                return false;
            }
        } else if (arg == "--prefix") {
            if (!require_value(opts.prefix)) {
                return false;
            }
        } else if (arg == "--suffix") {
            if (!require_value(opts.suffix)) {
                return false;
            }
        } else {
            error = "Unknown argument: " + arg;
            return false;
        }
    }
    return true;
}

bool ParseVerifyArgs(const int argc, char* argv[], VerifyOptions& opts, std::string& error) {
    for (int i = 2; i < argc; ++i) {
        const std::string arg(argv[i]);
        std::function<bool(std::string&)> require_value = [&](std::string& dst) -> bool {
            if (i + 1 >= argc) {
                error = "Missing value for " + arg;
                return false;
            }
            dst = argv[++i];
            return true;
        };
        auto require_bound = [&](std::optional<std::size_t>& dst) -> bool {
            std::string value;
            if (!require_value(value)) {
                return false;
            }
            std::size_t parsed = 0;
            if (!ParseSize(value, true, parsed)) {
                error = "Invalid value for " + arg;
                return false;
            }
            dst = parsed;
            return true;
        };

        bool ok = true;
        if (ParseAlphabetFlag(arg, require_value, opts.charset, ok)) {
            if (!ok) {
                return false;
            }
        } else if (arg == "--help" || arg == "-h") {
            opts.help = true;
        } else if (arg == "--log") {
            opts.log = true;
        } else if (arg == "--json") {
            opts.json = true;
        } else if (arg == "--key") {
            std::string value;
            if (!require_value(value)) {
                return false;
            }
            opts.key = std::move(value);
        } else if (arg == "--min-length") {
            if (!require_bound(opts.min_length)) {
                return false;
            }
        } else if (arg == "--max-length") {
            if (!require_bound(opts.max_length)) {
                return false;
            }
        } else if (arg == "--prefix") {
            std::string value;
            if (!require_value(value)) {
                return false;
            }
            opts.prefix = std::move(value);
        } else if (arg == "--suffix") {
            std::string value;
            if (!require_value(value)) {
                return false;
            }
            opts.suffix = std::move(value);
        } else {
            error = "Unknown argument: " + arg;
            return false;
        }
    }

    if (opts.help) {
        return true;
    }
    if (!opts.key.has_value()) {
        error = "Missing --key";
        return false;
    }
    return true;
}

bool ParseFormatArgs(const int argc, char* argv[], FormatOptions& opts, std::string& error) {
    for (int i = 2; i < argc; ++i) {
        const std::string arg(argv[i]);
        auto require_value = [&](std::string& dst) -> bool {
            if (i + 1 >= argc) {
                error = "Missing value for " + arg;
                return false;
            }
            dst = argv[++i];
            return true;
        };

        if (arg == "--help" || arg == "-h") {
            opts.help = true;
        } else if (arg == "--key") {
            std::string value;
            if (!require_value(value)) {
                return false;
            }
            opts.key = std::move(value);
        } else if (arg == "--group") {
            std::string value;
            if (!require_value(value)) {
                return false;
            }
            if (!ParseSize(value, false, opts.group_size)) {
                error = "Invalid value for --group";
                return false;
            }
        } else if (arg == "--separator") {
            if (!require_value(opts.separator)) {
                return false;
            }
        } else {
            error = "Unknown argument: " + arg;
            return false;
        }
    }

    if (opts.help) {
        return true;
    }
    if (!opts.key.has_value()) {
        error = "Missing --key";
        return false;
    }
    return true;
}

bool ParseInsecureArgs(const int argc, char* argv[], InsecureOptions& opts, std::string& error) {
    for (int i = 2; i < argc; ++i) {
        const std::string arg(argv[i]);
        std::function<bool(std::string&)> require_value = [&](std::string& dst) -> bool {
            if (i + 1 >= argc) {
                error = "Missing value for " + arg;
                return false;
            }
            dst = argv[++i];
            return true;
        };

        bool ok = true;
        if (ParseAlphabetFlag(arg, require_value, opts.charset, ok)) {
            if (!ok) {
                return false;
            }
        } else if (arg == "--help" || arg == "-h") {
            opts.help = true;
        } else if (arg == "--prefix") {
            if (!require_value(opts.prefix)) {
                return false;
            }
        } else if (arg == "--length") {
            std::string value;
            if (!require_value(value)) {
                return false;
            }
            if (!ParseSize(value, true, opts.length)) {
                error = "Invalid value for --length";
                return false;
            }
        } else if (arg == "--seed") {
            std::string value;
            if (!require_value(value)) {
                return false;
            }
            std::uint64_t seed = 0;
            if (!ParseSeed(value, seed)) {
                error = "Invalid value for --seed";
                return false;
            }
            opts.seed = seed;
        } else {
            error = "Unknown argument: " + arg;
            return false;
        }
    }
    return true;
}

void PrintHelp(std::ostream& out) {
    out << "tinykey - secure random key generator and validator\n\n";
    out << "Usage:\n";
    out << "  tinykey gen-key [--preset NAME|--alphabet CHARS] [--length N] [--prefix S] [--suffix S]\n";
    out << "                  [--count N] [--group N] [--separator S] [--log]\n";
    out << "  tinykey verify --key KEY [--preset NAME|--alphabet CHARS] [--min-length N] [--max-length N]\n";
    out << "                 [--prefix S] [--suffix S] [--json] [--log]\n";
    out << "  tinykey presets\n";
    out << "  tinykey format --key KEY [--group N] [--separator S]\n";
    out << "  tinykey insecure-demo [--prefix S] [--preset NAME|--alphabet CHARS] [--length N] [--seed N]\n\n";

    out << "Subcommands:\n";
    out << "  gen-key, --gen-key   Generate keys from the OS random source\n";
    out << "  verify               Check a key's prefix, suffix, length and characters\n";
    out << "  presets              List the built-in alphabets\n";
    out << "  format               Split a key into separator-delimited groups\n";
    out << "  insecure-demo        Predictable PRNG output for comparison; never use as a secret\n";
    out << "  --help, -h           Show this help (also accepted after any subcommand)\n\n";

    out << "Examples:\n";
    out << "  tinykey gen-key\n";
    out << "  tinykey gen-key --preset hex --length 32 --prefix sk_ --count 5\n";
    out << "  tinykey gen-key --alphabet ABC123 --length 16 --group 4\n";
    out << "  tinykey verify --key sk_0f3a --preset hex --prefix sk_ --min-length 4\n";
    out << "  tinykey format --key ABCD1234EFGH5678 --group 8 --separator .\n\n";

    out << "Exit codes:\n";
    out << "  0 success or valid key, 1 usage or runtime error, 2 key failed verification\n";
}

void PrintKeygenHelp(std::ostream& out) {
    out << "tinykey key generation\n\n";
    out << "Usage:\n";
    out << "  tinykey gen-key [--preset NAME|--alphabet CHARS] [--length N] [--prefix S] [--suffix S]\n";
    out << "                  [--count N] [--group N] [--separator S] [--log]\n\n";
    out << "Options:\n";
    out << "  --preset <name>     Built-in alphabet (default alphanumeric; see 'tinykey presets')\n";
    out << "  --alphabet <chars>  Literal alphabet, overrides --preset when non-empty\n";
    out << "  --length <N>        Characters drawn between prefix and suffix (default 42)\n";
    out << "  --prefix <text>     Literal text placed before the random part\n";
    out << "  --suffix <text>     Literal text placed after the random part\n";
    out << "  --count <N>         Number of keys, one per line (default 1)\n";
    out << "  --group <N>         Print keys split into groups of N characters\n";
    out << "  --separator <text>  Group separator (default '-')\n";
    out << "  --log               Show minimal runtime logs on stderr\n";
    out << "  --help, -h          Show this help\n";
}

void PrintVerifyHelp(std::ostream& out) {
    out << "tinykey key verification\n\n";
    out << "Usage:\n";
    out << "  tinykey verify --key KEY [--preset NAME|--alphabet CHARS] [--min-length N] [--max-length N]\n";
    out << "                 [--prefix S] [--suffix S] [--json] [--log]\n\n";
    out << "Options:\n";
    out << "  --key <text>        Key to verify\n";
    out << "  --preset <name>     Expected built-in alphabet\n";
    out << "  --alphabet <chars>  Expected literal alphabet (no charset check when neither is given)\n";
    out << "  --min-length <N>    Minimum length of the part between prefix and suffix\n";
    out << "  --max-length <N>    Maximum length of the part between prefix and suffix\n";
    out << "  --prefix <text>     Expected leading text\n";
    out << "  --suffix <text>     Expected trailing text\n";
    out << "  --json              Print the report as a JSON object\n";
    out << "  --log               Show minimal runtime logs on stderr\n";
    out << "  --help, -h          Show this help\n";
}

void PrintFormatHelp(std::ostream& out) {
    out << "tinykey key formatting\n\n";
    out << "Usage:\n";
    out << "  tinykey format --key KEY [--group N] [--separator S]\n\n";
    out << "Options:\n";
    out << "  --key <text>        Key to format\n";
    out << "  --group <N>         Characters per group (default 4)\n";
    out << "  --separator <text>  Text between groups (default '-')\n";
    out << "  --help, -h          Show this help\n";
}

void PrintInsecureHelp(std::ostream& out) {
    out << "tinykey insecure demo generator\n\n";
    out << "Usage:\n";
    out << "  tinykey insecure-demo [--prefix S] [--preset NAME|--alphabet CHARS] [--length N] [--seed N]\n\n";
    out << "Warning:\n";
    out << "  - Output comes from a seedable std::mt19937_64 and is predictable.\n";
    out << "  - It exists only to contrast with gen-key. Never use it for tokens or secrets.\n";
}

void PrintVerifyReport(std::ostream& out, const tinykey::ValidationReport& report) {
    out << "valid: " << (report.valid ? "true" : "false") << "\n";
    out << "expected_charset: " << (report.expected_charset.has_value() ? *report.expected_charset : "(any)") << "\n";
    out << "core: " << report.core << "\n";
    out << "length: " << report.length << "\n";
    out << "min_length: " << (report.min_length.has_value() ? std::to_string(*report.min_length) : "-") << "\n";
    out << "max_length: " << (report.max_length.has_value() ? std::to_string(*report.max_length) : "-") << "\n";
    out << "reasons:\n";
    for (const auto& reason : report.reasons) {
        out << "  - " << reason << "\n";
    }
    if (!report.hints.empty()) {
        out << "hints:\n";
        for (const auto& hint : report.hints) {
            out << "  - " << hint << "\n";
        }
    }
}

int KeygenFlow(const KeygenOptions& opts) {
    tinykey::AlphabetSource source = tinykey::kDefaultPreset;
    const tinykey::KeyStatus resolve_status = ResolveAlphabetOptions(opts.charset, source);
    if (resolve_status != tinykey::KeyStatus::Ok) {
        std::cerr << tinykey::ToString(resolve_status) << "\n";
        return kExitError;
    }
    const std::string& alphabet = tinykey::Charset::Resolve(source);

    tinykey::KeyShape shape;
    shape.length = opts.length;
    shape.prefix = opts.prefix;
    shape.suffix = opts.suffix;

    CliLog(opts.log,
        "Generating " + std::to_string(opts.count) + " key(s) of length " + std::to_string(opts.length) +
        " over " + std::to_string(alphabet.size()) + " symbols");

    std::vector<std::string> keys;
    const tinykey::KeyStatus status = tinykey::KeyGenerator::BuildMany(opts.count, alphabet, shape, keys);
    if (status != tinykey::KeyStatus::Ok) {
        std::cerr << tinykey::ToString(status) << "\n";
        return kExitError;
    }

    if (opts.group_size.has_value()) {
        for (auto& key : keys) {
            std::string grouped;
            const tinykey::KeyStatus group_status =
                tinykey::KeyFormat::Group(key, *opts.group_size, opts.separator, grouped);
            if (group_status != tinykey::KeyStatus::Ok) {
                std::cerr << tinykey::ToString(group_status) << "\n";
                return kExitError;
            }
            key = std::move(grouped);
        }
    }

    if (!keys.empty()) {
        std::cout << tinykey::KeyFormat::Join(keys) << "\n";
    }
    CliLog(opts.log, "Done");
    return kExitOk;
}

int VerifyFlow(const VerifyOptions& opts) {
    tinykey::VerifyRules rules;
    if (opts.charset.preset.has_value() || opts.charset.alphabet.has_value()) {
        tinykey::AlphabetSource source = tinykey::kDefaultPreset;
        const tinykey::KeyStatus status = ResolveAlphabetOptions(opts.charset, source);
        if (status != tinykey::KeyStatus::Ok) {
            std::cerr << tinykey::ToString(status) << "\n";
            return kExitError;
        }
        rules.alphabet = std::move(source);
    }
    rules.min_length = opts.min_length;
    rules.max_length = opts.max_length;
    rules.prefix = opts.prefix;
    rules.suffix = opts.suffix;

    CliLog(opts.log, "Verifying key of " + std::to_string(opts.key->size()) + " bytes");
    const tinykey::ValidationReport report = tinykey::KeyValidator::Verify(*opts.key, rules);
    if (opts.json) {
        std::cout << tinykey::ReportToJson(report) << "\n";
    } else {
        PrintVerifyReport(std::cout, report);
    }
    CliLog(opts.log, std::string("Verdict: ") + (report.valid ? "valid" : "invalid"));
    return report.valid ? kExitOk : kExitInvalidKey;
}

int PresetsFlow() {
    for (const tinykey::Preset preset : tinykey::kAllPresets) {
        std::cout << tinykey::Charset::PresetName(preset) << "\t" << tinykey::Charset::PresetAlphabet(preset) << "\n";
    }
    return kExitOk;
}

int FormatFlow(const FormatOptions& opts) {
    std::string grouped;
    const tinykey::KeyStatus status = tinykey::KeyFormat::Group(*opts.key, opts.group_size, opts.separator, grouped);
    if (status != tinykey::KeyStatus::Ok) {
        std::cerr << tinykey::ToString(status) << "\n";
        return kExitError;
    }
    std::cout << grouped << "\n";
    return kExitOk;
}

int InsecureFlow(const InsecureOptions& opts) {
    tinykey::AlphabetSource source = tinykey::kDefaultPreset;
    const tinykey::KeyStatus resolve_status = ResolveAlphabetOptions(opts.charset, source);
    if (resolve_status != tinykey::KeyStatus::Ok) {
        std::cerr << tinykey::ToString(resolve_status) << "\n";
        return kExitError;
    }

    std::cerr << "Warning: insecure demo output is predictable. Do not use it as a secret.\n";
    tinykey::KeyStatus status = tinykey::KeyStatus::Ok;
    auto sequence = tinykey::InsecureSequence::Create(
        opts.prefix, tinykey::Charset::Resolve(source), opts.length, opts.seed, status);
    if (status != tinykey::KeyStatus::Ok) {
        std::cerr << tinykey::ToString(status) << "\n";
        return kExitError;
    }
    std::cout << sequence->Collect() << "\n";
    return kExitOk;
}

}  // namespace

namespace tinykey {

int RunCliMain(const int argc, char* argv[]) {
    if (argc < 2) {
        PrintHelp(std::cerr);
        return kExitError;
    }

    const std::string command(argv[1]);
    if (command == "--help" || command == "-h" || command == "help") {
        PrintHelp(std::cout);
        return kExitOk;
    }

    if (command == "gen-key" || command == "--gen-key") {
        KeygenOptions opts;
        std::string error;
        if (!ParseKeygenArgs(argc, argv, 2, opts, error)) {
            std::cerr << error << "\n";
            return kExitError;
        }
        if (opts.help) {
            PrintKeygenHelp(std::cout);
            return kExitOk;
        }
        return KeygenFlow(opts);
    }

    if (command == "verify") {
        VerifyOptions opts;
        std::string error;
        if (!ParseVerifyArgs(argc, argv, opts, error)) {
            std::cerr << error << "\n";
            return kExitError;
        }
        if (opts.help) {
            PrintVerifyHelp(std::cout);
            return kExitOk;
        }
        return VerifyFlow(opts);
    }

    if (command == "presets") {
        return PresetsFlow();
    }

    if (command == "format") {
        FormatOptions opts;
        std::string error;
        if (!ParseFormatArgs(argc, argv, opts, error)) {
            std::cerr << error << "\n";
            return kExitError;
        }
        if (opts.help) {
            PrintFormatHelp(std::cout);
            return kExitOk;
        }
        return FormatFlow(opts);
    }

    if (command == "insecure-demo") {
        InsecureOptions opts;
        std::string error;
        if (!ParseInsecureArgs(argc, argv, opts, error)) {
            std::cerr << error << "\n";
            return kExitError;
        }
        if (opts.help) {
            PrintInsecureHelp(std::cout);
            return kExitOk;
        }
        return InsecureFlow(opts);
    }

    std::cerr << "Unknown command: " << command << "\n";
    return kExitError;
}

}  // namespace tinykey
