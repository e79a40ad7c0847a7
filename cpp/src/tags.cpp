#include "tags.h"
#include "utils.h"
#include <nlohmann/json.hpp>
#include <unordered_set>

using json = nlohmann::json;

namespace promptvault {
namespace tags {

std::string tagKey(const std::string& tag) {
    return utils::toLower(utils::trim(tag));
}

std::vector<std::string> normalize(const std::vector<std::string>& raw_tags) {
    std::vector<std::string> normalized;
    std::unordered_set<std::string> seen;

    for (const auto& raw : raw_tags) {
        std::string trimmed = utils::trim(raw);
        if (trimmed.empty()) {
            continue;
        }
        if (seen.insert(utils::toLower(trimmed)).second) {
            normalized.push_back(trimmed);
        }
    }

    return normalized;
}

std::vector<std::string> parseTagInput(const std::string& text) {
    return normalize(utils::split(text, ','));
}

std::string encode(const std::vector<std::string>& tags) {
    json j = tags;
    return j.dump(-1, ' ', false, json::error_handler_t::replace);
}

std::vector<std::string> decode(const std::string& stored) {
    std::vector<std::string> result;
    if (stored.empty()) return result;

    json j = json::parse(stored, nullptr, false);
    if (j.is_discarded() || !j.is_array()) {
        return result;
    }

    for (const auto& item : j) {
        if (item.is_string()) {
            result.push_back(item.get<std::string>());
        }
    }
    return result;
}

bool hasTag(const std::vector<std::string>& tags, const std::string& name) {
    std::string key = tagKey(name);
    if (key.empty()) return false;

    for (const auto& tag : tags) {
        if (tagKey(tag) == key) {
            return true;
        }
    }
    return false;
}

} // namespace tags
} // namespace promptvault
