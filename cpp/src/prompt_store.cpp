#include "prompt_store.h"
#include "errors.h"
#include "tags.h"
#include "utils.h"

namespace promptvault {

const char* PROMPT_COLUMNS =
    "id, title, content, tags, is_favorite, score_avg, score_count, created_at, updated_at";

Prompt promptFromRow(const Statement& stmt) {
    Prompt p;
    p.id = stmt.columnInt64(0);
    p.title = stmt.columnText(1);
    p.content = stmt.columnText(2);
    p.tags = tags::decode(stmt.columnText(3));
    p.is_favorite = stmt.columnInt64(4) != 0;
    p.score_count = stmt.columnInt64(6);
    p.score_avg = p.score_count > 0 ? stmt.columnDouble(5) : 0.0;
    p.created_at = stmt.columnText(7);
    p.updated_at = stmt.columnText(8);
    return p;
}

PromptStore::PromptStore(Database& db)
    : db_(db)
{
}

void PromptStore::validate(const std::string& title, const std::string& content) {
    if (utils::trim(title).empty()) {
        throw ValidationError("Prompt title cannot be empty");
    }
    if (utils::trim(content).empty()) {
        throw ValidationError("Prompt content cannot be empty");
    }
}

void PromptStore::insertVersion(Database& db,
                                int64_t prompt_id,
                                const std::string& content,
                                const std::string& change_note,
                                const std::string& created_at) {
    Statement stmt(db, R"(
        INSERT INTO prompt_versions (prompt_id, content, change_note, created_at)
        VALUES (?, ?, ?, ?)
    )");
    stmt.bindInt64(1, prompt_id)
        .bindText(2, content)
        .bindText(3, change_note)
        .bindText(4, created_at);
    stmt.run();
}

// ============================================================================
// Mutations
// ============================================================================

Prompt PromptStore::create(const std::string& title,
                           const std::string& content,
                           const std::vector<std::string>& tag_list,
                           bool is_favorite,
                           const std::optional<std::string>& change_note) {
    validate(title, content);

    std::string note = utils::trim(change_note.value_or(""));
    if (note.empty()) {
        note = change_notes::INITIAL;
    }
    std::string timestamp = utils::getCurrentTimestamp();

    Transaction tx(db_);

    Statement stmt(db_, R"(
        INSERT INTO prompts (title, content, tags, is_favorite, score_avg, score_count, created_at, updated_at)
        VALUES (?, ?, ?, ?, 0, 0, ?, ?)
    )");
    stmt.bindText(1, utils::trim(title))
        .bindText(2, content)
        .bindText(3, tags::encode(tags::normalize(tag_list)))
        .bindInt64(4, is_favorite ? 1 : 0)
        .bindText(5, timestamp)
        .bindText(6, timestamp);
    stmt.run();

    int64_t id = db_.lastInsertId();
    insertVersion(db_, id, content, note, timestamp);

    tx.commit();

    utils::log::debug("Created prompt " + std::to_string(id));
    return requirePrompt(id);
}

void PromptStore::applyUpdate(int64_t id,
                              const std::string& title,
                              const std::string& content,
                              const std::vector<std::string>& tag_list,
                              bool is_favorite,
                              const std::string& note) {
    std::string previous_content;
    {
        Statement select(db_, "SELECT content FROM prompts WHERE id = ?");
        select.bindInt64(1, id);
        if (!select.step()) {
            throw NotFoundError("Prompt " + std::to_string(id) + " does not exist");
        }
        previous_content = select.columnText(0);
    }

    std::string timestamp = utils::getCurrentTimestamp();

    Statement stmt(db_, R"(
        UPDATE prompts
        SET title = ?, content = ?, tags = ?, is_favorite = ?, updated_at = ?
        WHERE id = ?
    )");
    stmt.bindText(1, utils::trim(title))
        .bindText(2, content)
        .bindText(3, tags::encode(tags::normalize(tag_list)))
        .bindInt64(4, is_favorite ? 1 : 0)
        .bindText(5, timestamp)
        .bindInt64(6, id);
    stmt.run();

    if (previous_content != content || !note.empty()) {
        insertVersion(db_, id, content, note.empty() ? change_notes::UPDATED : note, timestamp);
        utils::log::debug("Updated prompt " + std::to_string(id) + " with a new version");
    } else {
        utils::log::debug("Updated prompt " + std::to_string(id) + " without a new version");
    }
}

Prompt PromptStore::update(int64_t id,
                           const std::string& title,
                           const std::string& content,
                           const std::vector<std::string>& tag_list,
                           bool is_favorite,
                           const std::optional<std::string>& change_note) {
    validate(title, content);

    Transaction tx(db_);
    applyUpdate(id, title, content, tag_list, is_favorite, utils::trim(change_note.value_or("")));
    tx.commit();

    return requirePrompt(id);
}

void PromptStore::remove(int64_t id) {
    Statement stmt(db_, "DELETE FROM prompts WHERE id = ?");
    stmt.bindInt64(1, id);
    stmt.run();

    if (db_.changes() > 0) {
        utils::log::debug("Deleted prompt " + std::to_string(id));
    }
}

Prompt PromptStore::restoreVersion(int64_t id,
                                   int64_t version_id,
                                   const std::optional<std::string>& change_note) {
    std::string note = utils::trim(change_note.value_or(""));
    if (note.empty()) {
        note = change_notes::RESTORED;
    }

    Transaction tx(db_);

    Prompt current = requirePrompt(id);

    std::string content;
    {
        Statement select(db_, "SELECT content FROM prompt_versions WHERE id = ? AND prompt_id = ?");
        select.bindInt64(1, version_id).bindInt64(2, id);
        if (!select.step()) {
            throw NotFoundError("Version " + std::to_string(version_id) +
                                " does not belong to prompt " + std::to_string(id));
        }
        content = select.columnText(0);
    }

    applyUpdate(id, current.title, content, current.tags, current.is_favorite, note);
    tx.commit();

    return requirePrompt(id);
}

// ============================================================================
// Retrieval
// ============================================================================

std::optional<Prompt> PromptStore::get(int64_t id) {
    Statement stmt(db_, std::string("SELECT ") + PROMPT_COLUMNS + " FROM prompts WHERE id = ? LIMIT 1");
    stmt.bindInt64(1, id);
    if (stmt.step()) {
        return promptFromRow(stmt);
    }
    return std::nullopt;
}

Prompt PromptStore::requirePrompt(int64_t id) {
    auto prompt = get(id);
    if (!prompt) {
        throw NotFoundError("Prompt " + std::to_string(id) + " does not exist");
    }
    return *prompt;
}

std::vector<PromptVersion> PromptStore::listVersions(int64_t id) {
    std::vector<PromptVersion> versions;

    Statement stmt(db_, R"(
        SELECT id, prompt_id, content, change_note, created_at
        FROM prompt_versions
        WHERE prompt_id = ?
        ORDER BY created_at DESC, id DESC
    )");
    stmt.bindInt64(1, id);

    while (stmt.step()) {
        PromptVersion v;
        v.id = stmt.columnInt64(0);
        v.prompt_id = stmt.columnInt64(1);
        v.content = stmt.columnText(2);
        v.change_note = stmt.columnText(3);
        v.created_at = stmt.columnText(4);
        versions.push_back(v);
    }

    return versions;
}

} // namespace promptvault
