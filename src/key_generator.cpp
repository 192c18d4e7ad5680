#include "tinykey/key_generator.hpp"

#include <limits>
#include <new>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

#include "tinykey/selector.hpp"

namespace tinykey {

KeyStatus KeyGenerator::Build(
    IEntropySource& source,
    const std::string_view alphabet,
    const KeyShape& shape,
    std::string& out_key) {
    const std::size_t decoration = shape.prefix.size() + shape.suffix.size();
    if (shape.length > std::numeric_limits<std::size_t>::max() - decoration) {
        return KeyStatus::InvalidLength;
    }

    std::string key;
    try {
        key.reserve(decoration + shape.length);
    } catch (const std::length_error&) {
        return KeyStatus::InvalidLength;
    } catch (const std::bad_alloc&) {
        return KeyStatus::InvalidLength;
    }
    key += shape.prefix;

    for (std::size_t i = 0; i < shape.length; ++i) {
        char symbol = '\0';
        const KeyStatus status = Selector::Choose(source, alphabet, symbol);
        if (status != KeyStatus::Ok) {
            return status;
        }
        key.push_back(symbol);
    }

    key += shape.suffix;
    out_key = std::move(key);
    return KeyStatus::Ok;
}

KeyStatus KeyGenerator::Build(const std::string_view alphabet, const KeyShape& shape, std::string& out_key) {
    return Build(SystemEntropy(), alphabet, shape, out_key);
}

KeyStatus KeyGenerator::BuildMany(
    IEntropySource& source,
    const std::size_t count,
    const std::string_view alphabet,
    const KeyShape& shape,
    std::vector<std::string>& out_keys) {
    out_keys.clear();

    std::vector<std::string> keys;
    try {
        keys.reserve(count);
    } catch (const std::length_error&) {
        return KeyStatus::InvalidLength;
    } catch (const std::bad_alloc&) {
        return KeyStatus::InvalidLength;
    }
    for (std::size_t i = 0; i < count; ++i) {
        std::string key;
        const KeyStatus status = Build(source, alphabet, shape, key);
        if (status != KeyStatus::Ok) {
            return status;
        }
        keys.push_back(std::move(key));
    }

    out_keys = std::move(keys);
    return KeyStatus::Ok;
}

KeyStatus KeyGenerator::BuildMany(
    const std::size_t count,
    const std::string_view alphabet,
    const KeyShape& shape,
    std::vector<std::string>& out_keys) {
    return BuildMany(SystemEntropy(), count, alphabet, shape, out_keys);
}

}  // namespace tinykey
