#ifndef PROMPTVAULT_PROMPT_STORE_H
#define PROMPTVAULT_PROMPT_STORE_H

#include <string>
#include <vector>
#include <optional>
#include <cstdint>
#include "database.h"
#include "models.h"

namespace promptvault {

// Change notes written when the caller does not supply one
namespace change_notes {
    constexpr const char* INITIAL = "initial version";
    constexpr const char* UPDATED = "content updated";
    constexpr const char* RESTORED = "restored version";
    constexpr const char* IMPORTED = "imported";
    constexpr const char* IMPORTED_VERSION = "imported version";
}

// Column list shared by every query that materializes a Prompt
extern const char* PROMPT_COLUMNS;

// Read a Prompt from a row selected with PROMPT_COLUMNS
Prompt promptFromRow(const Statement& stmt);

// CRUD and versioning over prompts and prompt_versions
class PromptStore {
public:
    explicit PromptStore(Database& db);

    // ===== Mutations =====

    // Insert a prompt and its first version.
    // Throws ValidationError when the trimmed title or content is empty.
    Prompt create(const std::string& title,
                  const std::string& content,
                  const std::vector<std::string>& tags,
                  bool is_favorite,
                  const std::optional<std::string>& change_note = std::nullopt);

    // Overwrite title/content/tags/favorite. A version is appended only when the
    // content changed or a non-empty change note was given.
    // Throws NotFoundError for an unknown id, ValidationError as for create.
    Prompt update(int64_t id,
                  const std::string& title,
                  const std::string& content,
                  const std::vector<std::string>& tags,
                  bool is_favorite,
                  const std::optional<std::string>& change_note = std::nullopt);

    // Deletes the prompt with its versions and usage logs. Unknown ids are a no-op.
    void remove(int64_t id);

    // Make a past version the current content; always appends a version
    Prompt restoreVersion(int64_t id,
                          int64_t version_id,
                          const std::optional<std::string>& change_note = std::nullopt);

    // ===== Retrieval =====

    std::optional<Prompt> get(int64_t id);

    // Newest first: created_at desc, then id desc
    std::vector<PromptVersion> listVersions(int64_t id);

    // ===== Shared helpers =====

    // Append a version row; used by create/update and by snapshot import
    static void insertVersion(Database& db,
                              int64_t prompt_id,
                              const std::string& content,
                              const std::string& change_note,
                              const std::string& created_at);

    // Throws ValidationError unless both title and content have non-blank text
    static void validate(const std::string& title, const std::string& content);

private:
    // Body of update; the caller holds the transaction
    void applyUpdate(int64_t id,
                     const std::string& title,
                     const std::string& content,
                     const std::vector<std::string>& tags,
                     bool is_favorite,
                     const std::string& note);

    Prompt requirePrompt(int64_t id);

    Database& db_;
};

} // namespace promptvault

#endif // PROMPTVAULT_PROMPT_STORE_H
