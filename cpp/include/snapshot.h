#ifndef PROMPTVAULT_SNAPSHOT_H
#define PROMPTVAULT_SNAPSHOT_H

#include <string>
#include <vector>
#include <optional>
#include <variant>
#include <cstdint>
#include "database.h"
#include "models.h"
#include "prompt_store.h"
#include "prompt_query.h"

namespace promptvault {

// ===== Export shape =====

struct ExportVersionItem {
    std::string content;
    std::string change_note;
    std::string created_at;

    json toJson() const;
};

struct ExportPromptItem {
    std::string title;
    std::string content;
    std::vector<std::string> tags;
    bool is_favorite;
    double score_avg;
    int64_t score_count;
    std::vector<ExportVersionItem> versions;   // newest first

    ExportPromptItem() : is_favorite(false), score_avg(0.0), score_count(0) {}

    json toJson() const;
};

struct Snapshot {
    std::string exported_at;
    std::vector<ExportPromptItem> prompts;     // updated_at desc

    json toJson() const;
};

// ===== Import shape =====
// Optional fields are absent when missing or null in the input.

struct ImportVersionItem {
    std::string content;
    std::optional<std::string> change_note;
    std::optional<std::string> created_at;
};

struct ImportPromptItem {
    std::string title;
    std::string content;
    std::optional<std::vector<std::string>> tags;
    std::optional<bool> is_favorite;
    std::optional<double> score_avg;
    std::optional<int64_t> score_count;
    std::optional<std::vector<ImportVersionItem>> versions;

    // Throws ParseError when a field has the wrong JSON type, or when title,
    // content or a version's content is missing or null
    static ImportPromptItem fromJson(const json& j);
};

// {"prompts": [...]} as produced by export
struct WrappedPayload {
    std::vector<ImportPromptItem> prompts;
};

// A bare [...] of prompt items
struct FlatPayload {
    std::vector<ImportPromptItem> prompts;
};

using ImportPayload = std::variant<WrappedPayload, FlatPayload>;

// Parse snapshot text into one of the two accepted shapes. Throws ParseError.
ImportPayload parseImportPayload(const std::string& text);

// The prompt items of either shape
const std::vector<ImportPromptItem>& importItems(const ImportPayload& payload);

struct ImportResult {
    int64_t imported;
    int64_t skipped;

    ImportResult() : imported(0), skipped(0) {}
};

// Score pair as stored on import: count >= 0, avg 0 when count is 0,
// otherwise avg clamped to the rating range
void sanitizeImportedScore(const std::optional<double>& avg_in,
                           const std::optional<int64_t>& count_in,
                           double& avg_out,
                           int64_t& count_out);

// Full-fidelity backup and restore of the prompt library
class SnapshotService {
public:
    SnapshotService(Database& db, PromptStore& store, PromptQuery& query);

    Snapshot buildSnapshot();

    // JSON of buildSnapshot(), pretty-printed unless indent is 0
    std::string exportSnapshot(int indent = 2);

    // Parse then import; ParseError is raised before anything is written
    ImportResult importSnapshot(const std::string& text);

    // All-or-nothing: invalid items are skipped, any storage failure rolls back
    // the whole batch and is rethrown as StorageError
    ImportResult importPayload(const ImportPayload& payload);

private:
    Database& db_;
    PromptStore& store_;
    PromptQuery& query_;
};

} // namespace promptvault

#endif // PROMPTVAULT_SNAPSHOT_H
