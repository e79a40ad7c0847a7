#ifndef PROMPTVAULT_TEMPLATE_VARS_H
#define PROMPTVAULT_TEMPLATE_VARS_H

#include <string>
#include <vector>
#include <map>

namespace promptvault {
namespace template_vars {

// Names of {{ name }} placeholders, trimmed, unique, in order of first appearance
std::vector<std::string> extractVariables(const std::string& content);

// Substitute placeholders. Names without a value stay as "{{name}}".
std::string applyVariables(const std::string& content,
                           const std::map<std::string, std::string>& values);

// Whitespace-collapsed preview, at most 90 code points plus "..."
std::string summarizeContent(const std::string& content);

} // namespace template_vars
} // namespace promptvault

#endif // PROMPTVAULT_TEMPLATE_VARS_H
