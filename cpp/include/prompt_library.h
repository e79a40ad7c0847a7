#ifndef PROMPTVAULT_PROMPT_LIBRARY_H
#define PROMPTVAULT_PROMPT_LIBRARY_H

#include <string>
#include <vector>
#include <map>
#include <memory>
#include <optional>
#include <cstdint>
#include "config.h"
#include "database.h"
#include "models.h"
#include "prompt_store.h"
#include "usage_ledger.h"
#include "prompt_query.h"
#include "snapshot.h"

namespace promptvault {

// Operation surface of the prompt library. Owns the connection and one of each
// component; opening bootstraps the schema and lets any failure propagate.
class PromptLibrary {
public:
    PromptLibrary(const std::string& db_path, const DatabaseOptions& options = DatabaseOptions());
    explicit PromptLibrary(const Config& config);

    PromptLibrary(const PromptLibrary&) = delete;
    PromptLibrary& operator=(const PromptLibrary&) = delete;

    // ===== Queries =====
    std::vector<Prompt> listPrompts(const std::optional<std::string>& search = std::nullopt,
                                    const std::optional<std::string>& tag = std::nullopt,
                                    const std::optional<std::string>& sort_by = std::nullopt);
    std::vector<TagCount> listTags();
    std::optional<Prompt> getPrompt(int64_t id);
    std::vector<PromptVersion> listPromptVersions(int64_t prompt_id);
    std::vector<UsageLog> listPromptUsage(int64_t prompt_id);

    // ===== Mutations =====

    // Create when input.id is empty, update otherwise
    Prompt upsertPrompt(const SavePromptInput& input);
    void deletePrompt(int64_t id);
    void logPromptUsage(const UsageInput& input);
    Prompt restorePromptVersion(int64_t prompt_id,
                                int64_t version_id,
                                const std::optional<std::string>& change_note = std::nullopt);

    // ===== Snapshots =====
    std::string exportPromptsSnapshot();
    int64_t importPromptsSnapshot(const std::string& text);

    // Stored content with {{ placeholders }} filled from values.
    // Throws NotFoundError for an unknown id.
    std::string renderPrompt(int64_t id, const std::map<std::string, std::string>& values);

    void setExportIndent(int indent) { export_indent_ = indent; }

    Database& database() { return *db_; }

private:
    std::unique_ptr<Database> db_;
    PromptStore store_;
    UsageLedger ledger_;
    PromptQuery query_;
    SnapshotService snapshots_;
    int export_indent_;
};

} // namespace promptvault

#endif // PROMPTVAULT_PROMPT_LIBRARY_H
