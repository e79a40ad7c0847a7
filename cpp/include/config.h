#ifndef PROMPTVAULT_CONFIG_H
#define PROMPTVAULT_CONFIG_H

#include <string>
#include "utils.h"

namespace promptvault {

class Config {
public:
    Config();

    // Resolve the data directory and load config.json from it.
    // An empty data_dir means: $PROMPTVAULT_HOME, $XDG_DATA_HOME/promptvault,
    // then ~/.local/share/promptvault.
    void initialize(const std::string& data_dir = "");

    // Getters
    std::string getDataDir() const { return data_dir_; }
    std::string getDatabaseFile() const { return database_file_; }
    int getBusyTimeoutMs() const { return busy_timeout_ms_; }
    std::string getJournalMode() const { return journal_mode_; }
    utils::log::Level getLogLevel() const { return log_level_; }
    int getExportIndent() const { return export_indent_; }

    // Absolute path of the database file
    std::string getDatabasePath() const;

    // Setters (validated; throw ValidationError)
    void setDataDir(const std::string& dir);
    void setDatabaseFile(const std::string& file);
    void setBusyTimeoutMs(int timeout_ms);
    void setJournalMode(const std::string& mode);
    void setLogLevel(utils::log::Level level);
    void setExportIndent(int indent);

    // Persistence. load() keeps defaults when config.json is absent;
    // throws ParseError on malformed JSON, ValidationError on bad values.
    void load();
    void save() const;

    std::string getConfigPath() const;

    static std::string resolveDefaultDataDir();

private:
    std::string data_dir_;
    std::string database_file_;
    int busy_timeout_ms_;
    std::string journal_mode_;
    utils::log::Level log_level_;
    int export_indent_;
};

} // namespace promptvault

#endif // PROMPTVAULT_CONFIG_H
