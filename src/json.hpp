#pragma once

#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

class JsonParse {
  public:
    static nlohmann::json ParseOrThrow(const std::string &body);
    // Non-empty string member, or nullopt when absent, empty or not a string
    static std::optional<std::string> FindString(const nlohmann::json &obj, const char *key);
    static std::vector<nlohmann::json> GetObjects(const nlohmann::json &arr);
};
