#include "snapshot.h"
#include "errors.h"
#include "tags.h"
#include "usage_ledger.h"
#include "utils.h"
#include <algorithm>
#include <cmath>

namespace promptvault {

namespace {

// Field readers for import items. Missing and null both read as absent;
// any other type mismatch is a ParseError.

bool isAbsent(const json& j, const char* key) {
    auto it = j.find(key);
    return it == j.end() || it->is_null();
}

std::optional<std::string> readString(const json& j, const char* key) {
    if (isAbsent(j, key)) return std::nullopt;
    const json& value = j.at(key);
    if (!value.is_string()) {
        throw ParseError(std::string("Snapshot field '") + key + "' must be a string");
    }
    return value.get<std::string>();
}

std::string requireString(const json& j, const char* key) {
    std::optional<std::string> value = readString(j, key);
    if (!value) {
        throw ParseError(std::string("Snapshot field '") + key + "' is required");
    }
    return *value;
}

std::optional<bool> readBool(const json& j, const char* key) {
    if (isAbsent(j, key)) return std::nullopt;
    const json& value = j.at(key);
    if (!value.is_boolean()) {
        throw ParseError(std::string("Snapshot field '") + key + "' must be a boolean");
    }
    return value.get<bool>();
}

std::optional<double> readNumber(const json& j, const char* key) {
    if (isAbsent(j, key)) return std::nullopt;
    const json& value = j.at(key);
    if (!value.is_number()) {
        throw ParseError(std::string("Snapshot field '") + key + "' must be a number");
    }
    return value.get<double>();
}

std::optional<int64_t> readInteger(const json& j, const char* key) {
    if (isAbsent(j, key)) return std::nullopt;
    const json& value = j.at(key);
    if (!value.is_number_integer()) {
        throw ParseError(std::string("Snapshot field '") + key + "' must be an integer");
    }
    return value.get<int64_t>();
}

std::vector<ImportPromptItem> readItems(const json& array) {
    std::vector<ImportPromptItem> items;
    items.reserve(array.size());
    for (const auto& entry : array) {
        items.push_back(ImportPromptItem::fromJson(entry));
    }
    return items;
}

} // namespace

// ============================================================================
// Export shape
// ============================================================================

json ExportVersionItem::toJson() const {
    return json{
        {"content", content},
        {"changeNote", change_note},
        {"createdAt", created_at}
    };
}

json ExportPromptItem::toJson() const {
    json j;
    j["title"] = title;
    j["content"] = content;
    j["tags"] = tags;
    j["isFavorite"] = is_favorite;
    j["scoreAvg"] = score_avg;
    j["scoreCount"] = score_count;
    j["versions"] = json::array();
    for (const auto& v : versions) {
        j["versions"].push_back(v.toJson());
    }
    return j;
}

json Snapshot::toJson() const {
    json j;
    j["exportedAt"] = exported_at;
    j["prompts"] = json::array();
    for (const auto& p : prompts) {
        j["prompts"].push_back(p.toJson());
    }
    return j;
}

// ============================================================================
// Import shape
// ============================================================================

ImportPromptItem ImportPromptItem::fromJson(const json& j) {
    if (!j.is_object()) {
        throw ParseError("Snapshot prompt entries must be objects");
    }

    ImportPromptItem item;
    item.title = requireString(j, "title");
    item.content = requireString(j, "content");
    item.is_favorite = readBool(j, "isFavorite");
    item.score_avg = readNumber(j, "scoreAvg");
    item.score_count = readInteger(j, "scoreCount");

    if (!isAbsent(j, "tags")) {
        const json& raw = j.at("tags");
        if (!raw.is_array()) {
            throw ParseError("Snapshot field 'tags' must be an array of strings");
        }
        std::vector<std::string> tag_list;
        for (const auto& t : raw) {
            if (!t.is_string()) {
                throw ParseError("Snapshot field 'tags' must be an array of strings");
            }
            tag_list.push_back(t.get<std::string>());
        }
        item.tags = tag_list;
    }

    if (!isAbsent(j, "versions")) {
        const json& raw = j.at("versions");
        if (!raw.is_array()) {
            throw ParseError("Snapshot field 'versions' must be an array");
        }
        std::vector<ImportVersionItem> versions;
        for (const auto& v : raw) {
            if (!v.is_object()) {
                throw ParseError("Snapshot version entries must be objects");
            }
            ImportVersionItem version;
            version.content = requireString(v, "content");
            version.change_note = readString(v, "changeNote");
            version.created_at = readString(v, "createdAt");
            versions.push_back(version);
        }
        item.versions = versions;
    }

    return item;
}

ImportPayload parseImportPayload(const std::string& text) {
    json j = json::parse(text, nullptr, false);
    if (j.is_discarded()) {
        throw ParseError("Snapshot is not valid JSON");
    }

    if (j.is_array()) {
        return FlatPayload{readItems(j)};
    }

    if (j.is_object()) {
        auto it = j.find("prompts");
        if (it == j.end() || !it->is_array()) {
            throw ParseError("Snapshot object must contain a 'prompts' array");
        }
        return WrappedPayload{readItems(*it)};
    }

    throw ParseError("Snapshot must be an object with 'prompts' or an array of prompts");
}

const std::vector<ImportPromptItem>& importItems(const ImportPayload& payload) {
    if (const auto* wrapped = std::get_if<WrappedPayload>(&payload)) {
        return wrapped->prompts;
    }
    return std::get<FlatPayload>(payload).prompts;
}

void sanitizeImportedScore(const std::optional<double>& avg_in,
                           const std::optional<int64_t>& count_in,
                           double& avg_out,
                           int64_t& count_out) {
    count_out = std::max<int64_t>(0, count_in.value_or(0));
    if (count_out == 0) {
        avg_out = 0.0;
        return;
    }
    if (!avg_in || !std::isfinite(*avg_in)) {
        // A count without a usable average cannot be folded into later ratings
        count_out = 0;
        avg_out = 0.0;
        return;
    }
    avg_out = std::min(std::max(*avg_in, static_cast<double>(MIN_RATING)),
                       static_cast<double>(MAX_RATING));
}

// ============================================================================
// SnapshotService
// ============================================================================

SnapshotService::SnapshotService(Database& db, PromptStore& store, PromptQuery& query)
    : db_(db), store_(store), query_(query)
{
}

Snapshot SnapshotService::buildSnapshot() {
    Snapshot snapshot;
    snapshot.exported_at = utils::getCurrentTimestamp();

    for (const auto& prompt : query_.list(std::nullopt, std::nullopt, std::string(sort_mode::UPDATED))) {
        ExportPromptItem item;
        item.title = prompt.title;
        item.content = prompt.content;
        item.tags = prompt.tags;
        item.is_favorite = prompt.is_favorite;
        item.score_avg = prompt.score_avg;
        item.score_count = prompt.score_count;

        for (const auto& version : store_.listVersions(prompt.id)) {
            ExportVersionItem v;
            v.content = version.content;
            v.change_note = version.change_note;
            v.created_at = version.created_at;
            item.versions.push_back(v);
        }

        snapshot.prompts.push_back(item);
    }

    utils::log::debug("Built snapshot with " + std::to_string(snapshot.prompts.size()) + " prompts");
    return snapshot;
}

std::string SnapshotService::exportSnapshot(int indent) {
    // 0 means a single line
    return buildSnapshot().toJson().dump(indent > 0 ? indent : -1, ' ', false,
                                         json::error_handler_t::replace);
}

ImportResult SnapshotService::importSnapshot(const std::string& text) {
    ImportPayload payload = parseImportPayload(text);
    return importPayload(payload);
}

ImportResult SnapshotService::importPayload(const ImportPayload& payload) {
    const auto& items = importItems(payload);
    std::string import_time = utils::getCurrentTimestamp();
    ImportResult result;

    Transaction tx(db_);

    // Reverse order so that, with equal timestamps, the id DESC tiebreak
    // lists prompts and versions in their snapshot order
    for (auto it = items.rbegin(); it != items.rend(); ++it) {
        const ImportPromptItem& item = *it;
        std::string title = utils::trim(item.title);
        if (title.empty() || utils::trim(item.content).empty()) {
            result.skipped++;
            continue;
        }

        double score_avg = 0.0;
        int64_t score_count = 0;
        sanitizeImportedScore(item.score_avg, item.score_count, score_avg, score_count);

        std::vector<std::string> tag_list = tags::normalize(item.tags.value_or(std::vector<std::string>()));

        int64_t prompt_id = 0;
        {
            Statement stmt(db_, R"(
                INSERT INTO prompts (title, content, tags, is_favorite, score_avg, score_count, created_at, updated_at)
                VALUES (?, ?, ?, ?, ?, ?, ?, ?)
            )");
            stmt.bindText(1, title)
                .bindText(2, item.content)
                .bindText(3, tags::encode(tag_list))
                .bindInt64(4, item.is_favorite.value_or(false) ? 1 : 0)
                .bindDouble(5, score_avg)
                .bindInt64(6, score_count)
                .bindText(7, import_time)
                .bindText(8, import_time);
            stmt.run();
            prompt_id = db_.lastInsertId();
        }

        int inserted_versions = 0;
        if (item.versions) {
            const auto& versions = *item.versions;
            for (auto v = versions.rbegin(); v != versions.rend(); ++v) {
                if (utils::trim(v->content).empty()) continue;
                PromptStore::insertVersion(db_, prompt_id, v->content,
                                           v->change_note.value_or(change_notes::IMPORTED_VERSION),
                                           v->created_at.value_or(import_time));
                inserted_versions++;
            }
        }

        if (inserted_versions == 0) {
            PromptStore::insertVersion(db_, prompt_id, item.content,
                                       change_notes::IMPORTED, import_time);
        }

        result.imported++;
    }

    tx.commit();

    utils::log::info("Imported " + std::to_string(result.imported) + " prompts, skipped " +
                     std::to_string(result.skipped));
    return result;
}

} // namespace promptvault
