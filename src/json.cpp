#include "json.hpp"

#include <stdexcept>

#include <spdlog/spdlog.h>

// ─────────────────────────────────────
nlohmann::json JsonParse::ParseOrThrow(const std::string &body) {
    try {
        return nlohmann::json::parse(body);
    } catch (const nlohmann::json::parse_error &e) {
        throw std::runtime_error(e.what());
    }
}

// ─────────────────────────────────────
std::optional<std::string> JsonParse::FindString(const nlohmann::json &obj, const char *key) {
    if (!obj.is_object()) {
        return std::nullopt;
    }
    auto it = obj.find(key);
    if (it == obj.end() || it->is_null()) {
        spdlog::debug("JsonParse: no '{}' in {}", key, obj.dump());
        return std::nullopt;
    }
    if (!it->is_string()) {
        spdlog::warn("JsonParse: '{}' is a {}, expected a string", key, it->type_name());
        return std::nullopt;
    }
    const auto &value = it->get_ref<const std::string &>();
    if (value.empty()) {
        return std::nullopt;
    }
    return value;
}

// ─────────────────────────────────────
std::vector<nlohmann::json> JsonParse::GetObjects(const nlohmann::json &arr) {
    std::vector<nlohmann::json> out;
    if (!arr.is_array()) {
        spdlog::warn("JsonParse: Expected array, got {}", arr.type_name());
        return out;
    }
    for (const auto &v : arr) {
        if (v.is_object()) {
            out.push_back(v);
        } else {
            spdlog::warn("JsonParse: Array element is not an object, skipping");
        }
    }
    return out;
}
