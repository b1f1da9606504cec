/**
 * @file canonical_json.cpp
 * @brief Canonical JSON serialization
 */

#include "jsonts/canonical_json.hpp"

#include "jsonts/common.hpp"

#include <algorithm>
#include <format>
#include <ranges>
#include <string_view>
#include <vector>

namespace jsonts::canonical {

namespace {

jsonts::VoidResult validate_no_float(const nlohmann::json& j, std::string_view path)
{
    if (j.is_number_float()) {
        return std::unexpected(Error::make(
            "FloatingPointNotAllowed",
            std::format("Floating point numbers not allowed in canonical JSON at: {}", path)));
    }
    if (j.is_object()) {
        for (const auto& [key, val] : j.items()) {
            if (auto result = validate_no_float(val, std::format("{}.{}", path, key)); !result) {
                return result;
            }
        }
    } else if (j.is_array()) {
        for (auto [i, elem] : std::views::enumerate(j)) {
            if (auto result = validate_no_float(elem, std::format("{}[{}]", path, i)); !result) {
                return result;
            }
        }
    }
    return {};
}

/**
 * @brief Recursively copy JSON with object keys in lexicographic order
 *
 * nlohmann::json already stores keys in a std::map, but the copy keeps the
 * serialization independent of the object_t the caller was built with.
 */
[[nodiscard]] nlohmann::json make_sorted_copy(const nlohmann::json& j)
{
    if (j.is_object()) {
        std::vector<std::string> keys;
        keys.reserve(j.size());
        for (const auto& [key, _] : j.items()) {
            keys.push_back(key);
        }
        std::ranges::sort(keys);

        nlohmann::json result = nlohmann::json::object();
        for (const auto& key : keys) {
            result[key] = make_sorted_copy(j.at(key));
        }
        return result;
    }
    if (j.is_array()) {
        nlohmann::json result = nlohmann::json::array();
        result.get_ref<nlohmann::json::array_t&>().reserve(j.size());
        for (const auto& elem : j) {
            result.push_back(make_sorted_copy(elem));
        }
        return result;
    }
    return j;
}

}  // namespace

jsonts::Result<std::string> canonicalize(const nlohmann::json& j)
{
    if (auto result = validate_no_float(j, "$"); !result) {
        return std::unexpected(result.error());
    }

    const nlohmann::json sorted = make_sorted_copy(j);
    try {
        return sorted.dump(-1, ' ', false, nlohmann::json::error_handler_t::strict);
    } catch (const nlohmann::json::type_error& ex) {
        return std::unexpected(
            Error::make("InvalidUtf8", std::format("Canonical JSON contains invalid UTF-8: {}", ex.what())));
    }
}

jsonts::Result<std::string> hash_canonical(const nlohmann::json& j)
{
    auto canonical = canonicalize(j);
    if (!canonical) {
        return std::unexpected(canonical.error());
    }
    return common::sha256_prefixed(*canonical);
}

jsonts::VoidResult validate_for_canonical(const nlohmann::json& j)
{
    return validate_no_float(j, "$");
}

}  // namespace jsonts::canonical
