#include "prompt_query.h"
#include "prompt_store.h"
#include "tags.h"
#include "utils.h"
#include <algorithm>
#include <map>

namespace promptvault {

namespace {

std::string trimmedOrEmpty(const std::optional<std::string>& value) {
    return value ? utils::trim(*value) : std::string();
}

} // namespace

PromptQuery::PromptQuery(Database& db)
    : db_(db)
{
}

std::string PromptQuery::orderClause(const std::optional<std::string>& sort_by) {
    std::string mode = trimmedOrEmpty(sort_by);
    if (mode == sort_mode::SCORE) {
        return "score_avg DESC, updated_at DESC, id DESC";
    }
    if (mode == sort_mode::CREATED) {
        return "created_at DESC, id DESC";
    }
    return "updated_at DESC, id DESC";
}

std::string PromptQuery::escapeLike(const std::string& text) {
    std::string escaped;
    escaped.reserve(text.size());
    for (char c : text) {
        if (c == '%' || c == '_' || c == '\\') {
            escaped += '\\';
        }
        escaped += c;
    }
    return escaped;
}

std::vector<Prompt> PromptQuery::list(const std::optional<std::string>& search,
                                      const std::optional<std::string>& tag,
                                      const std::optional<std::string>& sort_by) {
    std::string search_term = trimmedOrEmpty(search);
    std::string tag_filter = trimmedOrEmpty(tag);

    std::string sql = std::string("SELECT ") + PROMPT_COLUMNS + " FROM prompts WHERE 1 = 1";
    if (!search_term.empty()) {
        sql += " AND (title LIKE ?1 ESCAPE '\\' OR content LIKE ?1 ESCAPE '\\'"
               " OR tags LIKE ?1 ESCAPE '\\')";
    }
    sql += " ORDER BY " + orderClause(sort_by);

    Statement stmt(db_, sql);
    if (!search_term.empty()) {
        stmt.bindText(1, "%" + escapeLike(search_term) + "%");
    }

    std::vector<Prompt> prompts;
    while (stmt.step()) {
        Prompt p = promptFromRow(stmt);
        if (!tag_filter.empty() && !tags::hasTag(p.tags, tag_filter)) {
            continue;
        }
        prompts.push_back(p);
    }

    return prompts;
}

std::vector<TagCount> PromptQuery::listTags() {
    std::map<std::string, int64_t> counts;

    Statement stmt(db_, "SELECT tags FROM prompts");
    while (stmt.step()) {
        for (const auto& name : tags::decode(stmt.columnText(0))) {
            counts[name]++;
        }
    }

    std::vector<TagCount> result;
    result.reserve(counts.size());
    for (const auto& [name, count] : counts) {
        result.emplace_back(name, count);
    }

    std::stable_sort(result.begin(), result.end(), [](const TagCount& a, const TagCount& b) {
        if (a.count != b.count) return a.count > b.count;
        return a.name < b.name;
    });

    return result;
}

} // namespace promptvault
