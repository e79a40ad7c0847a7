#ifndef PROMPTVAULT_PROMPT_QUERY_H
#define PROMPTVAULT_PROMPT_QUERY_H

#include <string>
#include <vector>
#include <optional>
#include "database.h"
#include "models.h"

namespace promptvault {

// Filtered, sorted listings and tag statistics. Read-only.
class PromptQuery {
public:
    explicit PromptQuery(Database& db);

    // search: substring of title, content, or tag blob (SQLite LIKE rules,
    //         ASCII case-insensitive); blank means no filter
    // tag:    exact whole-tag match against the decoded tag list
    // sort_by: "score", "created", anything else sorts by updated_at
    std::vector<Prompt> list(const std::optional<std::string>& search = std::nullopt,
                             const std::optional<std::string>& tag = std::nullopt,
                             const std::optional<std::string>& sort_by = std::nullopt);

    // Every tag with the number of prompts carrying it,
    // by count desc then name asc
    std::vector<TagCount> listTags();

    static std::string orderClause(const std::optional<std::string>& sort_by);

    // Escape %, _ and the escape character itself for LIKE ... ESCAPE '\'
    static std::string escapeLike(const std::string& text);

private:
    Database& db_;
};

} // namespace promptvault

#endif // PROMPTVAULT_PROMPT_QUERY_H
