#include "config.h"
#include "errors.h"
#include <nlohmann/json.hpp>
#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <fstream>

using json = nlohmann::json;

namespace promptvault {

namespace {

const char* CONFIG_FILE_NAME = "config.json";

const char* const JOURNAL_MODES[] = {"DELETE", "TRUNCATE", "PERSIST", "WAL", "MEMORY"};

std::string envOrEmpty(const char* name) {
    const char* value = getenv(name);
    return value ? std::string(value) : std::string();
}

} // namespace

Config::Config()
    : database_file_("prompt-library.db")
    , busy_timeout_ms_(5000)
    , journal_mode_("WAL")
    , log_level_(utils::log::Level::Warn)
    , export_indent_(2)
{
}

std::string Config::resolveDefaultDataDir() {
    std::string home_override = envOrEmpty("PROMPTVAULT_HOME");
    if (!home_override.empty()) {
        return home_override;
    }

    std::string xdg = envOrEmpty("XDG_DATA_HOME");
    if (!xdg.empty()) {
        return utils::joinPath(xdg, "promptvault");
    }

    return utils::joinPath(utils::getHomeDir(), ".local/share/promptvault");
}

void Config::initialize(const std::string& data_dir) {
    data_dir_ = data_dir.empty() ? resolveDefaultDataDir() : data_dir;

    if (!utils::dirExists(data_dir_) && !utils::createDirs(data_dir_)) {
        throw StorageError("Failed to create data directory: " + data_dir_);
    }

    load();
}

std::string Config::getConfigPath() const {
    return utils::joinPath(data_dir_, CONFIG_FILE_NAME);
}

std::string Config::getDatabasePath() const {
    if (database_file_ == ":memory:" || utils::isAbsolutePath(database_file_)) {
        return database_file_;
    }
    return utils::joinPath(data_dir_, database_file_);
}

void Config::load() {
    std::string path = getConfigPath();
    if (!utils::fileExists(path)) {
        utils::log::debug("No config file at " + path + ", using defaults");
        return;
    }

    std::ifstream file(path);
    if (!file.is_open()) {
        throw StorageError("Cannot open config file: " + path);
    }

    json config;
    try {
        config = json::parse(file);
    } catch (const json::parse_error& e) {
        throw ParseError("Invalid config file " + path + ": " + e.what());
    }

    if (!config.is_object()) {
        throw ParseError("Invalid config file " + path + ": expected a JSON object");
    }

    try {
        if (config.contains("database_file")) {
            setDatabaseFile(config["database_file"].get<std::string>());
        }
        if (config.contains("busy_timeout_ms")) {
            setBusyTimeoutMs(config["busy_timeout_ms"].get<int>());
        }
        if (config.contains("journal_mode")) {
            setJournalMode(config["journal_mode"].get<std::string>());
        }
        if (config.contains("log_level")) {
            utils::log::Level level;
            std::string name = config["log_level"].get<std::string>();
            if (!utils::log::parseLevel(name, level)) {
                throw ValidationError("Unknown log level: " + name);
            }
            setLogLevel(level);
        }
        if (config.contains("export_indent")) {
            setExportIndent(config["export_indent"].get<int>());
        }
    } catch (const json::type_error& e) {
        throw ParseError("Invalid config file " + path + ": " + e.what());
    }
}

void Config::save() const {
    json config;
    config["database_file"] = database_file_;
    config["busy_timeout_ms"] = busy_timeout_ms_;
    config["journal_mode"] = journal_mode_;
    config["log_level"] = utils::log::levelName(log_level_);
    config["export_indent"] = export_indent_;

    if (!utils::writeFile(getConfigPath(), config.dump(2) + "\n")) {
        throw StorageError("Failed to write config file: " + getConfigPath());
    }
}

// Setters
void Config::setDataDir(const std::string& dir) {
    if (utils::trim(dir).empty()) {
        throw ValidationError("Data directory cannot be empty");
    }
    data_dir_ = dir;
}

void Config::setDatabaseFile(const std::string& file) {
    if (utils::trim(file).empty()) {
        throw ValidationError("Database file name cannot be empty");
    }
    database_file_ = file;
}

void Config::setBusyTimeoutMs(int timeout_ms) {
    if (timeout_ms < 0) {
        throw ValidationError("busy_timeout_ms must be >= 0");
    }
    busy_timeout_ms_ = timeout_ms;
}

void Config::setJournalMode(const std::string& mode) {
    std::string upper = mode;
    std::transform(upper.begin(), upper.end(), upper.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });

    auto it = std::find(std::begin(JOURNAL_MODES), std::end(JOURNAL_MODES), upper);
    if (it == std::end(JOURNAL_MODES)) {
        throw ValidationError("Unknown journal mode: " + mode);
    }
    journal_mode_ = upper;
}

void Config::setLogLevel(utils::log::Level level) {
    log_level_ = level;
}

void Config::setExportIndent(int indent) {
    if (indent < 0) {
        throw ValidationError("export_indent must be >= 0");
    }
    export_indent_ = indent;
}

} // namespace promptvault
