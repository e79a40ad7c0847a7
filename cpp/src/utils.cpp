#include "utils.h"
#include <algorithm>
#include <cctype>
#include <sstream>
#include <fstream>
#include <iostream>
#include <ctime>
#include <cstdio>
#include <cerrno>
#include <sys/stat.h>
#include <sys/types.h>
#include <unistd.h>
#include <pwd.h>
#include <chrono>

namespace promptvault {
namespace utils {

// String utilities
std::string trim(const std::string& str) {
    size_t first = str.find_first_not_of(" \t\n\r\f\v");
    if (first == std::string::npos) return "";
    size_t last = str.find_last_not_of(" \t\n\r\f\v");
    return str.substr(first, (last - first + 1));
}

std::vector<std::string> split(const std::string& str, char delimiter) {
    std::vector<std::string> tokens;
    std::string token;
    std::istringstream tokenStream(str);
    while (std::getline(tokenStream, token, delimiter)) {
        tokens.push_back(token);
    }
    return tokens;
}

bool startsWith(const std::string& str, const std::string& prefix) {
    return str.size() >= prefix.size() &&
           str.compare(0, prefix.size(), prefix) == 0;
}

std::string toLower(const std::string& str) {
    std::string result = str;
    std::transform(result.begin(), result.end(), result.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return result;
}

std::vector<std::string> splitArgs(const std::string& line) {
    std::vector<std::string> args;
    std::string current;
    bool in_word = false;
    char quote = 0;

    for (size_t i = 0; i < line.size(); i++) {
        char c = line[i];
        if (quote) {
            if (c == quote) {
                quote = 0;
            } else if (c == '\\' && quote == '"' && i + 1 < line.size()) {
                current += line[++i];
            } else {
                current += c;
            }
        } else if (c == '"' || c == '\'') {
            quote = c;
            in_word = true;
        } else if (c == ' ' || c == '\t') {
            if (in_word) {
                args.push_back(current);
                current.clear();
                in_word = false;
            }
        } else {
            current += c;
            in_word = true;
        }
    }
    if (in_word) {
        args.push_back(current);
    }
    return args;
}

// File utilities
bool fileExists(const std::string& path) {
    struct stat buffer;
    return (stat(path.c_str(), &buffer) == 0 && S_ISREG(buffer.st_mode));
}

bool dirExists(const std::string& path) {
    struct stat buffer;
    return (stat(path.c_str(), &buffer) == 0 && S_ISDIR(buffer.st_mode));
}

bool createDirs(const std::string& path) {
    if (path.empty()) return false;
    if (dirExists(path)) return true;

    // Create each missing component, like mkdir -p
    size_t pos = 0;
    while (pos != std::string::npos) {
        pos = path.find('/', pos + 1);
        std::string partial = path.substr(0, pos);
        if (partial.empty() || dirExists(partial)) continue;
        if (mkdir(partial.c_str(), 0755) != 0 && errno != EEXIST) {
            return false;
        }
    }
    return dirExists(path);
}

std::string readFile(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        return "";
    }
    std::stringstream buffer;
    buffer << file.rdbuf();
    return buffer.str();
}

bool writeFile(const std::string& path, const std::string& content) {
    std::ofstream file(path);
    if (!file.is_open()) {
        return false;
    }
    file << content;
    return file.good();
}

// Path utilities
std::string getHomeDir() {
    const char* home = getenv("HOME");
    if (home && *home) {
        return std::string(home);
    }
    struct passwd* pw = getpwuid(getuid());
    if (pw) {
        return std::string(pw->pw_dir);
    }
    return "/tmp";
}

std::string joinPath(const std::string& p1, const std::string& p2) {
    if (p1.empty()) return p2;
    if (p2.empty()) return p1;
    if (p1.back() == '/') return p1 + p2;
    return p1 + "/" + p2;
}

std::string getDirname(const std::string& path) {
    size_t pos = path.find_last_of('/');
    if (pos == std::string::npos) return ".";
    if (pos == 0) return "/";
    return path.substr(0, pos);
}

bool isAbsolutePath(const std::string& path) {
    return !path.empty() && path[0] == '/';
}

// Time utilities
std::string getCurrentTimestamp() {
    auto now = std::chrono::system_clock::now();
    auto time = std::chrono::system_clock::to_time_t(now);
    auto micros = std::chrono::duration_cast<std::chrono::microseconds>(
        now.time_since_epoch()).count() % 1000000;

    struct tm tm_utc;
    gmtime_r(&time, &tm_utc);

    char buffer[64];
    std::strftime(buffer, sizeof(buffer), "%Y-%m-%dT%H:%M:%S", &tm_utc);

    char fraction[32];
    std::snprintf(fraction, sizeof(fraction), ".%06lld+00:00", static_cast<long long>(micros));
    return std::string(buffer) + fraction;
}

// Terminal utilities
namespace terminal {

const char* RED = "\033[0;31m";
const char* GREEN = "\033[0;32m";
const char* YELLOW = "\033[1;33m";
const char* CYAN = "\033[0;36m";
const char* BOLD = "\033[1m";
const char* RESET = "\033[0m";

void printError(const std::string& text) {
    std::cerr << RED << "✗ " << text << RESET << std::endl;
}

void printSuccess(const std::string& text) {
    std::cout << GREEN << "✓ " << text << RESET << std::endl;
}

void printWarning(const std::string& text) {
    std::cout << YELLOW << "⚠ " << text << RESET << std::endl;
}

void printInfo(const std::string& text) {
    std::cout << CYAN << text << RESET << std::endl;
}

} // namespace terminal

namespace log {

namespace {

Level g_level = Level::Warn;

void write(Level level, const char* color, const std::string& message) {
    if (level < g_level) return;

    static const bool use_color = isatty(STDERR_FILENO) != 0;
    if (use_color) {
        std::cerr << color << "[" << levelName(level) << "]" << terminal::RESET
                  << " " << message << std::endl;
    } else {
        std::cerr << "[" << levelName(level) << "] " << message << std::endl;
    }
}

} // namespace

void setLevel(Level level) {
    g_level = level;
}

Level getLevel() {
    return g_level;
}

bool parseLevel(const std::string& name, Level& out) {
    std::string lower = toLower(trim(name));
    if (lower == "debug") out = Level::Debug;
    else if (lower == "info") out = Level::Info;
    else if (lower == "warn" || lower == "warning") out = Level::Warn;
    else if (lower == "error") out = Level::Error;
    else if (lower == "off") out = Level::Off;
    else return false;
    return true;
}

std::string levelName(Level level) {
    switch (level) {
        case Level::Debug: return "debug";
        case Level::Info:  return "info";
        case Level::Warn:  return "warn";
        case Level::Error: return "error";
        case Level::Off:   return "off";
    }
    return "unknown";
}

void debug(const std::string& message) { write(Level::Debug, terminal::CYAN, message); }
void info(const std::string& message)  { write(Level::Info, terminal::GREEN, message); }
void warn(const std::string& message)  { write(Level::Warn, terminal::YELLOW, message); }
void error(const std::string& message) { write(Level::Error, terminal::RED, message); }

} // namespace log

} // namespace utils
} // namespace promptvault
