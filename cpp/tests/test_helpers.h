#ifndef PROMPTVAULT_TEST_HELPERS_H
#define PROMPTVAULT_TEST_HELPERS_H

#include <gtest/gtest.h>
#include <string>
#include <memory>
#include <stdexcept>
#include <cstdio>
#include <cstdlib>
#include <ftw.h>
#include "database.h"

namespace promptvault {
namespace test {

// Fresh directory under /tmp, removed with its contents on destruction
class TempDir {
public:
    TempDir() {
        char tmpl[] = "/tmp/promptvault_test_XXXXXX";
        char* dir = mkdtemp(tmpl);
        if (!dir) {
            throw std::runtime_error("mkdtemp failed");
        }
        path_ = dir;
    }

    ~TempDir() {
        nftw(path_.c_str(), removeEntry, 16, FTW_DEPTH | FTW_PHYS);
    }

    TempDir(const TempDir&) = delete;
    TempDir& operator=(const TempDir&) = delete;

    const std::string& path() const { return path_; }

    std::string file(const std::string& name) const { return path_ + "/" + name; }

private:
    static int removeEntry(const char* path, const struct stat*, int, struct FTW*) {
        return std::remove(path);
    }

    std::string path_;
};

inline int64_t countRows(Database& db, const std::string& sql) {
    Statement stmt(db, sql);
    if (!stmt.step()) return 0;
    return stmt.columnInt64(0);
}

// Empty prompt database with the schema in place
class DatabaseTest : public ::testing::Test {
protected:
    void SetUp() override {
        db_ = std::make_unique<Database>(dir_.file("prompt-library.db"));
        db_->ensureSchema();
    }

    Database& db() { return *db_; }

    int64_t promptCount() { return countRows(*db_, "SELECT COUNT(*) FROM prompts"); }
    int64_t versionCount() { return countRows(*db_, "SELECT COUNT(*) FROM prompt_versions"); }
    int64_t usageCount() { return countRows(*db_, "SELECT COUNT(*) FROM usage_logs"); }

    TempDir dir_;
    std::unique_ptr<Database> db_;
};

} // namespace test
} // namespace promptvault

#endif // PROMPTVAULT_TEST_HELPERS_H
