#ifndef PROMPTVAULT_UTILS_H
#define PROMPTVAULT_UTILS_H

#include <string>
#include <vector>

namespace promptvault {
namespace utils {

// String utilities
std::string trim(const std::string& str);
std::vector<std::string> split(const std::string& str, char delimiter);
bool startsWith(const std::string& str, const std::string& prefix);
std::string toLower(const std::string& str);

// Split a command line into words, honoring single and double quotes
std::vector<std::string> splitArgs(const std::string& line);

// File utilities
bool fileExists(const std::string& path);
bool dirExists(const std::string& path);
bool createDirs(const std::string& path);
std::string readFile(const std::string& path);
bool writeFile(const std::string& path, const std::string& content);

// Path utilities
std::string getHomeDir();
std::string joinPath(const std::string& p1, const std::string& p2);
std::string getDirname(const std::string& path);
bool isAbsolutePath(const std::string& path);

// Time utilities
// RFC 3339 UTC timestamp with microseconds, e.g. 2026-10-19T08:15:02.123456+00:00
std::string getCurrentTimestamp();

// Terminal utilities
namespace terminal {
    // ANSI colors
    extern const char* RED;
    extern const char* GREEN;
    extern const char* YELLOW;
    extern const char* CYAN;
    extern const char* BOLD;
    extern const char* RESET;

    // Colored output
    void printError(const std::string& text);
    void printSuccess(const std::string& text);
    void printWarning(const std::string& text);
    void printInfo(const std::string& text);
}

// Diagnostics on stderr, filtered by level
namespace log {
    enum class Level { Debug = 0, Info, Warn, Error, Off };

    void setLevel(Level level);
    Level getLevel();

    // Parse "debug", "info", "warn", "error", "off"; returns false on unknown names
    bool parseLevel(const std::string& name, Level& out);
    std::string levelName(Level level);

    void debug(const std::string& message);
    void info(const std::string& message);
    void warn(const std::string& message);
    void error(const std::string& message);
}

} // namespace utils
} // namespace promptvault

#endif // PROMPTVAULT_UTILS_H
