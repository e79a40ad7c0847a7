#ifndef PROMPTVAULT_TAGS_H
#define PROMPTVAULT_TAGS_H

#include <string>
#include <vector>

namespace promptvault {
namespace tags {

// Trim each entry, drop empties, and drop case-insensitive duplicates.
// The first-seen spelling and the first-seen order win. Idempotent.
std::vector<std::string> normalize(const std::vector<std::string>& raw_tags);

// Split "a, b ,c" on commas and normalize the parts
std::vector<std::string> parseTagInput(const std::string& text);

// Stored form of a tag list: a JSON array of strings
std::string encode(const std::vector<std::string>& tags);

// Inverse of encode; malformed or non-array input yields an empty list
std::vector<std::string> decode(const std::string& stored);

// Whole-tag membership using the same case-insensitive key as normalize
bool hasTag(const std::vector<std::string>& tags, const std::string& name);

// Key used for deduplication and matching
std::string tagKey(const std::string& tag);

} // namespace tags
} // namespace promptvault

#endif // PROMPTVAULT_TAGS_H
