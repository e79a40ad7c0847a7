#include <gtest/gtest.h>
#include "test_helpers.h"
#include "snapshot.h"
#include "usage_ledger.h"
#include "errors.h"

using namespace promptvault;
using promptvault::test::DatabaseTest;

class SnapshotTest : public DatabaseTest {
protected:
    void SetUp() override {
        DatabaseTest::SetUp();
        store_ = std::make_unique<PromptStore>(db());
        query_ = std::make_unique<PromptQuery>(db());
        snapshots_ = std::make_unique<SnapshotService>(db(), *store_, *query_);
    }

    void wipe() {
        db().exec("DELETE FROM prompts");
    }

    std::vector<std::string> versionContents(int64_t id) {
        std::vector<std::string> contents;
        for (const auto& v : store_->listVersions(id)) contents.push_back(v.content);
        return contents;
    }

    std::unique_ptr<PromptStore> store_;
    std::unique_ptr<PromptQuery> query_;
    std::unique_ptr<SnapshotService> snapshots_;
};

TEST_F(SnapshotTest, ExportHasExpectedShape) {
    Prompt p = store_->create("Title", "Body", {"a", "b"}, true);
    store_->update(p.id, "Title", "Body 2", {"a", "b"}, true, std::string("second"));

    json j = json::parse(snapshots_->exportSnapshot());
    ASSERT_TRUE(j.contains("exportedAt"));
    ASSERT_TRUE(j["prompts"].is_array());
    ASSERT_EQ(j["prompts"].size(), 1u);

    const json& item = j["prompts"][0];
    EXPECT_EQ(item["title"], "Title");
    EXPECT_EQ(item["content"], "Body 2");
    EXPECT_EQ(item["tags"], json::array({"a", "b"}));
    EXPECT_EQ(item["isFavorite"], true);
    EXPECT_EQ(item["scoreAvg"], 0.0);
    EXPECT_EQ(item["scoreCount"], 0);
    ASSERT_EQ(item["versions"].size(), 2u);
    EXPECT_EQ(item["versions"][0]["content"], "Body 2");
    EXPECT_EQ(item["versions"][0]["changeNote"], "second");
    EXPECT_EQ(item["versions"][1]["changeNote"], "initial version");
    EXPECT_TRUE(item["versions"][1].contains("createdAt"));
    EXPECT_FALSE(item.contains("id"));
}

TEST_F(SnapshotTest, ExportImportRoundTrip) {
    Prompt a = store_->create("Alpha", "a1", {"x"}, true);
    store_->update(a.id, "Alpha", "a2", {"x"}, true);
    store_->update(a.id, "Alpha", "a3", {"x"}, true, std::string("third"));
    Prompt b = store_->create("Beta", "b1", {"y", "z"}, false);

    UsageLedger ledger(db());
    UsageInput rated;
    rated.prompt_id = b.id;
    rated.rating = 4;
    ledger.logUsage(rated);

    Snapshot before = snapshots_->buildSnapshot();
    std::string text = snapshots_->exportSnapshot();
    wipe();
    ASSERT_EQ(promptCount(), 0);

    ImportResult result = snapshots_->importSnapshot(text);
    EXPECT_EQ(result.imported, 2);
    EXPECT_EQ(result.skipped, 0);

    Snapshot after = snapshots_->buildSnapshot();
    ASSERT_EQ(after.prompts.size(), before.prompts.size());
    for (size_t i = 0; i < before.prompts.size(); i++) {
        const auto& x = before.prompts[i];
        const auto& y = after.prompts[i];
        EXPECT_EQ(y.title, x.title);
        EXPECT_EQ(y.content, x.content);
        EXPECT_EQ(y.tags, x.tags);
        EXPECT_EQ(y.is_favorite, x.is_favorite);
        EXPECT_EQ(y.score_avg, x.score_avg);
        EXPECT_EQ(y.score_count, x.score_count);
        ASSERT_EQ(y.versions.size(), x.versions.size());
        for (size_t v = 0; v < x.versions.size(); v++) {
            EXPECT_EQ(y.versions[v].content, x.versions[v].content);
            EXPECT_EQ(y.versions[v].change_note, x.versions[v].change_note);
            EXPECT_EQ(y.versions[v].created_at, x.versions[v].created_at);
        }
    }
}

TEST_F(SnapshotTest, ImportSkipsInvalidItemsWithoutTrace) {
    ImportResult result = snapshots_->importSnapshot(R"([
        {"title": "Valid", "content": "kept"},
        {"title": "Empty", "content": "   "},
        {"title": "  ", "content": "blank title"}
    ])");

    EXPECT_EQ(result.imported, 1);
    EXPECT_EQ(result.skipped, 2);
    auto prompts = query_->list();
    ASSERT_EQ(prompts.size(), 1u);
    EXPECT_EQ(prompts[0].title, "Valid");
    EXPECT_EQ(versionCount(), 1);
}

TEST_F(SnapshotTest, ImportAcceptsWrappedAndFlatShapes) {
    EXPECT_EQ(snapshots_->importSnapshot(R"({"exportedAt": "x", "prompts": [{"title": "W", "content": "w"}]})").imported, 1);
    EXPECT_EQ(snapshots_->importSnapshot(R"([{"title": "F", "content": "f"}])").imported, 1);
    EXPECT_EQ(promptCount(), 2);

    EXPECT_TRUE(std::holds_alternative<WrappedPayload>(parseImportPayload(R"({"prompts": []})")));
    EXPECT_TRUE(std::holds_alternative<FlatPayload>(parseImportPayload("[]")));
}

TEST_F(SnapshotTest, ImportAppliesDefaults) {
    snapshots_->importSnapshot(R"([{"title": "  Spaced  ", "content": "body", "tags": ["A", "a", " b "]}])");

    auto prompts = query_->list();
    ASSERT_EQ(prompts.size(), 1u);
    EXPECT_EQ(prompts[0].title, "Spaced");
    EXPECT_EQ(prompts[0].tags, (std::vector<std::string>{"A", "b"}));
    EXPECT_FALSE(prompts[0].is_favorite);
    EXPECT_EQ(prompts[0].score_count, 0);

    auto versions = store_->listVersions(prompts[0].id);
    ASSERT_EQ(versions.size(), 1u);
    EXPECT_EQ(versions[0].content, "body");
    EXPECT_EQ(versions[0].change_note, "imported");
}

TEST_F(SnapshotTest, ImportVersionsKeepOrderAndFillMissingNotes) {
    snapshots_->importSnapshot(R"([{
        "title": "T",
        "content": "v3",
        "versions": [
            {"content": "v3"},
            {"content": "  "},
            {"content": "v2", "changeNote": "edited"},
            {"content": "v1", "changeNote": null, "createdAt": "2020-01-01T00:00:00.000000+00:00"}
        ]
    }])");

    auto prompts = query_->list();
    ASSERT_EQ(prompts.size(), 1u);
    EXPECT_EQ(versionContents(prompts[0].id), (std::vector<std::string>{"v3", "v2", "v1"}));

    auto versions = store_->listVersions(prompts[0].id);
    EXPECT_EQ(versions[0].change_note, "imported version");
    EXPECT_EQ(versions[1].change_note, "edited");
    EXPECT_EQ(versions[2].created_at, "2020-01-01T00:00:00.000000+00:00");
}

TEST_F(SnapshotTest, ImportPreservesSnapshotOrder) {
    snapshots_->importSnapshot(R"([
        {"title": "first", "content": "1"},
        {"title": "second", "content": "2"},
        {"title": "third", "content": "3"}
    ])");

    auto prompts = query_->list();
    ASSERT_EQ(prompts.size(), 3u);
    EXPECT_EQ(prompts[0].title, "first");
    EXPECT_EQ(prompts[1].title, "second");
    EXPECT_EQ(prompts[2].title, "third");
}

TEST_F(SnapshotTest, ImportSanitizesScores) {
    snapshots_->importSnapshot(R"([
        {"title": "negative", "content": "x", "scoreAvg": 4.0, "scoreCount": -3},
        {"title": "high", "content": "x", "scoreAvg": 9.5, "scoreCount": 2},
        {"title": "no avg", "content": "x", "scoreCount": 2},
        {"title": "ok", "content": "x", "scoreAvg": 3.5, "scoreCount": 4}
    ])");

    for (const auto& p : query_->list()) {
        if (p.title == "negative" || p.title == "no avg") {
            EXPECT_EQ(p.score_count, 0) << p.title;
            EXPECT_EQ(p.score_avg, 0.0) << p.title;
        } else if (p.title == "high") {
            EXPECT_EQ(p.score_count, 2);
            EXPECT_EQ(p.score_avg, 5.0);
        } else {
            EXPECT_EQ(p.score_count, 4);
            EXPECT_EQ(p.score_avg, 3.5);
        }
    }
}

TEST(SanitizeScoreTest, ClampsAndResets) {
    double avg = -1;
    int64_t count = -1;

    sanitizeImportedScore(0.5, 3, avg, count);
    EXPECT_EQ(avg, 1.0);
    EXPECT_EQ(count, 3);

    sanitizeImportedScore(4.0, std::nullopt, avg, count);
    EXPECT_EQ(avg, 0.0);
    EXPECT_EQ(count, 0);

    sanitizeImportedScore(std::nullopt, 5, avg, count);
    EXPECT_EQ(avg, 0.0);
    EXPECT_EQ(count, 0);
}

TEST_F(SnapshotTest, MalformedInputRaisesParseErrorBeforeWriting) {
    EXPECT_THROW(snapshots_->importSnapshot("not json"), ParseError);
    EXPECT_THROW(snapshots_->importSnapshot("42"), ParseError);
    EXPECT_THROW(snapshots_->importSnapshot(R"({"items": []})"), ParseError);
    EXPECT_THROW(snapshots_->importSnapshot(R"({"prompts": "nope"})"), ParseError);
    EXPECT_THROW(snapshots_->importSnapshot(R"([{"title": "ok", "content": "x"}, "string"])"), ParseError);
    EXPECT_THROW(snapshots_->importSnapshot(R"([{"title": "ok", "content": "x"}, {"title": 5, "content": "x"}])"), ParseError);
    EXPECT_THROW(snapshots_->importSnapshot(R"([{"title": "t", "content": "x", "tags": "a,b"}])"), ParseError);
    EXPECT_THROW(snapshots_->importSnapshot(R"([{"title": "t", "content": "x", "scoreCount": 1.5}])"), ParseError);

    EXPECT_EQ(promptCount(), 0);
    EXPECT_EQ(versionCount(), 0);
}

TEST_F(SnapshotTest, MissingRequiredFieldsRaiseParseError) {
    EXPECT_THROW(snapshots_->importSnapshot(R"([{"content": "x"}, {"title": "ok", "content": "y"}])"), ParseError);
    EXPECT_THROW(snapshots_->importSnapshot(R"([{"title": "ok", "content": "y"}, {"title": "no body"}])"), ParseError);
    EXPECT_THROW(snapshots_->importSnapshot(R"({"prompts": [{"title": null, "content": "x"}]})"), ParseError);
    EXPECT_THROW(snapshots_->importSnapshot(R"([{"title": "t", "content": "x", "versions": [{"changeNote": "n"}]}])"), ParseError);
    EXPECT_THROW(snapshots_->importSnapshot(R"([{"title": "t", "content": "x", "versions": [{"content": null}]}])"), ParseError);

    EXPECT_EQ(promptCount(), 0);
    EXPECT_EQ(versionCount(), 0);
}

TEST_F(SnapshotTest, StorageFailureRollsBackWholeBatch) {
    store_->create("existing", "stays", {}, false);
    db().exec("CREATE TRIGGER fail_import BEFORE INSERT ON prompts "
              "WHEN NEW.title = 'boom' BEGIN SELECT RAISE(ABORT, 'injected failure'); END;");

    EXPECT_THROW(snapshots_->importSnapshot(R"([
        {"title": "good one", "content": "a"},
        {"title": "boom", "content": "b"},
        {"title": "good two", "content": "c"}
    ])"), StorageError);

    EXPECT_FALSE(db().inTransaction());
    auto prompts = query_->list();
    ASSERT_EQ(prompts.size(), 1u);
    EXPECT_EQ(prompts[0].title, "existing");
    EXPECT_EQ(versionCount(), 1);
}
