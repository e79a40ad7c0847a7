#ifndef PROMPTVAULT_ERRORS_H
#define PROMPTVAULT_ERRORS_H

#include <stdexcept>
#include <string>

namespace promptvault {

// Base class for every error the engine reports
class Error : public std::runtime_error {
public:
    explicit Error(const std::string& message) : std::runtime_error(message) {}
};

// Rejected input: empty title/content, rating outside 1-5, bad config value
class ValidationError : public Error {
public:
    explicit ValidationError(const std::string& message) : Error(message) {}
};

// Operation targets a prompt (or version) that does not exist
class NotFoundError : public Error {
public:
    explicit NotFoundError(const std::string& message) : Error(message) {}
};

// Malformed snapshot or config text
class ParseError : public Error {
public:
    explicit ParseError(const std::string& message) : Error(message) {}
};

// SQLite or filesystem failure
class StorageError : public Error {
public:
    StorageError(const std::string& message, int code = 0)
        : Error(message), code_(code) {}

    // SQLite result code, 0 when the failure did not come from SQLite
    int code() const { return code_; }

private:
    int code_;
};

} // namespace promptvault

#endif // PROMPTVAULT_ERRORS_H
