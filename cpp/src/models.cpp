#include "models.h"

namespace promptvault {

json Prompt::toJson() const {
    return json{
        {"id", id},
        {"title", title},
        {"content", content},
        {"tags", tags},
        {"isFavorite", is_favorite},
        {"scoreAvg", score_avg},
        {"scoreCount", score_count},
        {"createdAt", created_at},
        {"updatedAt", updated_at}
    };
}

json PromptVersion::toJson() const {
    return json{
        {"id", id},
        {"promptId", prompt_id},
        {"content", content},
        {"changeNote", change_note},
        {"createdAt", created_at}
    };
}

json UsageLog::toJson() const {
    json j{
        {"id", id},
        {"promptId", prompt_id},
        {"inputVars", input_payload},
        {"outputText", output_text},
        {"usedAt", used_at}
    };
    j["rating"] = rating ? json(*rating) : json(nullptr);
    return j;
}

json TagCount::toJson() const {
    return json{
        {"name", name},
        {"count", count}
    };
}

} // namespace promptvault
