#include <gtest/gtest.h>
#include "test_helpers.h"
#include "prompt_library.h"
#include "errors.h"
#include "utils.h"

using namespace promptvault;
using promptvault::test::TempDir;

class PromptLibraryTest : public ::testing::Test {
protected:
    void SetUp() override {
        library_ = std::make_unique<PromptLibrary>(dir_.file("prompt-library.db"));
    }

    SavePromptInput input(const std::string& title, const std::string& content) {
        SavePromptInput in;
        in.title = title;
        in.content = content;
        return in;
    }

    TempDir dir_;
    std::unique_ptr<PromptLibrary> library_;
};

TEST_F(PromptLibraryTest, UpsertCreatesThenUpdates) {
    SavePromptInput in = input("Greeting", "Hello {{ name }}");
    in.tags = {"demo"};
    Prompt created = library_->upsertPrompt(in);

    in.id = created.id;
    in.content = "Hi {{ name }}";
    Prompt updated = library_->upsertPrompt(in);

    EXPECT_EQ(updated.id, created.id);
    EXPECT_EQ(library_->listPrompts().size(), 1u);
    EXPECT_EQ(library_->listPromptVersions(created.id).size(), 2u);
}

TEST_F(PromptLibraryTest, UpsertUnknownIdRaisesNotFound) {
    SavePromptInput in = input("t", "c");
    in.id = 404;
    EXPECT_THROW(library_->upsertPrompt(in), NotFoundError);
}

TEST_F(PromptLibraryTest, RenderFillsVariables) {
    Prompt p = library_->upsertPrompt(input("Greeting", "Hello {{ name }} from {{ place }}"));
    EXPECT_EQ(library_->renderPrompt(p.id, {{"name", "Ada"}}), "Hello Ada from {{place}}");
    EXPECT_THROW(library_->renderPrompt(p.id + 1, {}), NotFoundError);
}

TEST_F(PromptLibraryTest, UsageAndScoreThroughFacade) {
    Prompt p = library_->upsertPrompt(input("t", "c"));

    UsageInput usage;
    usage.prompt_id = p.id;
    usage.rating = 5;
    library_->logPromptUsage(usage);

    EXPECT_EQ(library_->getPrompt(p.id)->score_count, 1);
    EXPECT_EQ(library_->listPromptUsage(p.id).size(), 1u);

    library_->deletePrompt(p.id);
    EXPECT_FALSE(library_->getPrompt(p.id).has_value());
    EXPECT_NO_THROW(library_->deletePrompt(p.id));
}

TEST_F(PromptLibraryTest, RestoreThroughFacade) {
    Prompt p = library_->upsertPrompt(input("t", "old"));
    SavePromptInput edit = input("t", "new");
    edit.id = p.id;
    library_->upsertPrompt(edit);

    int64_t old_version = library_->listPromptVersions(p.id).back().id;
    Prompt restored = library_->restorePromptVersion(p.id, old_version, std::string("rollback"));
    EXPECT_EQ(restored.content, "old");
    EXPECT_EQ(library_->listPromptVersions(p.id)[0].change_note, "rollback");
}

TEST_F(PromptLibraryTest, SnapshotThroughFacade) {
    library_->upsertPrompt(input("one", "1"));
    library_->upsertPrompt(input("two", "2"));
    std::string text = library_->exportPromptsSnapshot();

    TempDir other;
    PromptLibrary copy(other.file("copy.db"));
    EXPECT_EQ(copy.importPromptsSnapshot(text), 2);
    EXPECT_EQ(copy.listPrompts().size(), 2u);
    EXPECT_EQ(copy.listTags().size(), 0u);
}

TEST_F(PromptLibraryTest, JsonViewsUseCamelCase) {
    Prompt p = library_->upsertPrompt(input("t", "c"));
    json j = p.toJson();
    EXPECT_EQ(j["id"], p.id);
    EXPECT_EQ(j["isFavorite"], false);
    EXPECT_TRUE(j.contains("scoreAvg"));
    EXPECT_TRUE(j.contains("updatedAt"));

    json v = library_->listPromptVersions(p.id)[0].toJson();
    EXPECT_EQ(v["promptId"], p.id);
    EXPECT_EQ(v["changeNote"], "initial version");
}

TEST(PromptLibraryConfigTest, OpensDatabaseFromConfig) {
    TempDir dir;
    Config config;
    config.initialize(dir.path());
    config.setExportIndent(0);

    PromptLibrary library(config);
    library.upsertPrompt([] {
        SavePromptInput in;
        in.title = "t";
        in.content = "c";
        return in;
    }());

    EXPECT_TRUE(utils::fileExists(config.getDatabasePath()));
    std::string snapshot = library.exportPromptsSnapshot();
    EXPECT_EQ(snapshot.find('\n'), std::string::npos);
}
