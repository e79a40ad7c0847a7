#include "prompt_library.h"
#include "errors.h"
#include "template_vars.h"
#include "utils.h"

namespace promptvault {

namespace {

std::unique_ptr<Database> openDatabase(const std::string& path, const DatabaseOptions& options) {
    auto db = std::make_unique<Database>(path, options);
    db->ensureSchema();
    utils::log::debug("Prompt library ready at " + path);
    return db;
}

DatabaseOptions optionsFrom(const Config& config) {
    DatabaseOptions options;
    options.busy_timeout_ms = config.getBusyTimeoutMs();
    options.journal_mode = config.getJournalMode();
    return options;
}

} // namespace

PromptLibrary::PromptLibrary(const std::string& db_path, const DatabaseOptions& options)
    : db_(openDatabase(db_path, options)),
      store_(*db_),
      ledger_(*db_),
      query_(*db_),
      snapshots_(*db_, store_, query_),
      export_indent_(2)
{
}

PromptLibrary::PromptLibrary(const Config& config)
    : PromptLibrary(config.getDatabasePath(), optionsFrom(config))
{
    export_indent_ = config.getExportIndent();
}

// ============================================================================
// Queries
// ============================================================================

std::vector<Prompt> PromptLibrary::listPrompts(const std::optional<std::string>& search,
                                               const std::optional<std::string>& tag,
                                               const std::optional<std::string>& sort_by) {
    return query_.list(search, tag, sort_by);
}

std::vector<TagCount> PromptLibrary::listTags() {
    return query_.listTags();
}

std::optional<Prompt> PromptLibrary::getPrompt(int64_t id) {
    return store_.get(id);
}

std::vector<PromptVersion> PromptLibrary::listPromptVersions(int64_t prompt_id) {
    return store_.listVersions(prompt_id);
}

std::vector<UsageLog> PromptLibrary::listPromptUsage(int64_t prompt_id) {
    return ledger_.listUsage(prompt_id);
}

// ============================================================================
// Mutations
// ============================================================================

Prompt PromptLibrary::upsertPrompt(const SavePromptInput& input) {
    if (input.id) {
        return store_.update(*input.id, input.title, input.content, input.tags,
                             input.is_favorite, input.change_note);
    }
    return store_.create(input.title, input.content, input.tags,
                         input.is_favorite, input.change_note);
}

void PromptLibrary::deletePrompt(int64_t id) {
    store_.remove(id);
}

void PromptLibrary::logPromptUsage(const UsageInput& input) {
    ledger_.logUsage(input);
}

Prompt PromptLibrary::restorePromptVersion(int64_t prompt_id,
                                           int64_t version_id,
                                           const std::optional<std::string>& change_note) {
    return store_.restoreVersion(prompt_id, version_id, change_note);
}

// ============================================================================
// Snapshots
// ============================================================================

std::string PromptLibrary::exportPromptsSnapshot() {
    return snapshots_.exportSnapshot(export_indent_);
}

int64_t PromptLibrary::importPromptsSnapshot(const std::string& text) {
    return snapshots_.importSnapshot(text).imported;
}

std::string PromptLibrary::renderPrompt(int64_t id, const std::map<std::string, std::string>& values) {
    auto prompt = store_.get(id);
    if (!prompt) {
        throw NotFoundError("Prompt " + std::to_string(id) + " does not exist");
    }
    return template_vars::applyVariables(prompt->content, values);
}

} // namespace promptvault
