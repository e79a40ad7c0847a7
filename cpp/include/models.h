#ifndef PROMPTVAULT_MODELS_H
#define PROMPTVAULT_MODELS_H

#include <string>
#include <vector>
#include <optional>
#include <cstdint>
#include <utility>
#include <nlohmann/json.hpp>

namespace promptvault {

using json = nlohmann::json;

// A stored prompt with its metadata and running score
struct Prompt {
    int64_t id;
    std::string title;
    std::string content;
    std::vector<std::string> tags;   // normalized, see tags.h
    bool is_favorite;
    double score_avg;                // 0 whenever score_count == 0
    int64_t score_count;
    std::string created_at;
    std::string updated_at;

    Prompt() : id(0), is_favorite(false), score_avg(0.0), score_count(0) {}

    json toJson() const;
};

// Immutable snapshot of a prompt's content
struct PromptVersion {
    int64_t id;
    int64_t prompt_id;
    std::string content;
    std::string change_note;         // may be empty, never absent
    std::string created_at;

    PromptVersion() : id(0), prompt_id(0) {}

    json toJson() const;
};

// One recorded use of a prompt
struct UsageLog {
    int64_t id;
    int64_t prompt_id;
    json input_payload;
    std::string output_text;
    std::optional<int> rating;       // 1-5, absent when no feedback was given
    std::string used_at;

    UsageLog() : id(0), prompt_id(0) {}

    json toJson() const;
};

// Tag name with the number of prompts carrying it
struct TagCount {
    std::string name;
    int64_t count;

    TagCount() : count(0) {}
    TagCount(std::string n, int64_t c) : name(std::move(n)), count(c) {}

    json toJson() const;
};

// Input for create/update
struct SavePromptInput {
    std::optional<int64_t> id;
    std::string title;
    std::string content;
    std::vector<std::string> tags;
    bool is_favorite;
    std::optional<std::string> change_note;

    SavePromptInput() : is_favorite(false) {}
};

// Input for logging a use of a prompt
struct UsageInput {
    int64_t prompt_id;
    json input_payload;
    std::string output_text;
    std::optional<int> rating;

    UsageInput() : prompt_id(0), input_payload(json::object()) {}
};

// Sort modes accepted by listPrompts
namespace sort_mode {
    constexpr const char* SCORE = "score";
    constexpr const char* CREATED = "created";
    constexpr const char* UPDATED = "updated";
}

} // namespace promptvault

#endif // PROMPTVAULT_MODELS_H
