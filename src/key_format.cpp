#include "tinykey/key_format.hpp"

#include <string>
#include <utility>

namespace tinykey {

KeyStatus KeyFormat::Group(
    const std::string_view key,
    const std::size_t group_size,
    const std::string_view separator,
    std::string& out_text) {
    if (group_size == 0) {
        return KeyStatus::InvalidLength;
    }
    if (key.size() < group_size) {
        out_text = std::string(key);
        return KeyStatus::Ok;
    }

    const std::size_t groups = (key.size() + group_size - 1) / group_size;
    std::string out;
    out.reserve(key.size() + (groups - 1) * separator.size());
    for (std::size_t start = 0; start < key.size(); start += group_size) {
        if (start > 0) {
            out.append(separator);
        }
        out.append(key.substr(start, group_size));
    }
    out_text = std::move(out);
    return KeyStatus::Ok;
}

std::string KeyFormat::Join(const std::vector<std::string>& keys, const std::string_view separator) {
    std::string out;
    if (keys.empty()) {
        return out;
    }
    std::size_t total = 0;
    for (const auto& key : keys) {
        total += key.size();
    }
    total += (keys.size() - 1) * separator.size();
    out.reserve(total);

    for (std::size_t i = 0; i < keys.size(); ++i) {
        if (i > 0) {
            out.append(separator);
        }
        out += keys[i];
    }
    return out;
}

}  // namespace tinykey
