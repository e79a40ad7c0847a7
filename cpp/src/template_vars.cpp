#include "template_vars.h"
#include "utils.h"
#include <regex>
#include <unordered_set>

namespace promptvault {
namespace template_vars {

namespace {

const std::regex& placeholderPattern() {
    static const std::regex pattern(R"(\{\{\s*([^{}]+?)\s*\}\})");
    return pattern;
}

const size_t SUMMARY_LIMIT = 90;

bool isContinuationByte(unsigned char c) {
    return (c & 0xC0) == 0x80;
}

} // namespace

std::vector<std::string> extractVariables(const std::string& content) {
    std::vector<std::string> names;
    std::unordered_set<std::string> seen;

    auto begin = std::sregex_iterator(content.begin(), content.end(), placeholderPattern());
    for (auto it = begin; it != std::sregex_iterator(); ++it) {
        std::string name = utils::trim((*it)[1].str());
        if (!name.empty() && seen.insert(name).second) {
            names.push_back(name);
        }
    }

    return names;
}

std::string applyVariables(const std::string& content,
                           const std::map<std::string, std::string>& values) {
    std::string result;
    auto last = content.cbegin();

    auto begin = std::sregex_iterator(content.begin(), content.end(), placeholderPattern());
    for (auto it = begin; it != std::sregex_iterator(); ++it) {
        const std::smatch& match = *it;
        result.append(last, match[0].first);

        std::string name = utils::trim(match[1].str());
        auto value = values.find(name);
        if (value != values.end()) {
            result += value->second;
        } else {
            result += "{{" + name + "}}";
        }
        last = match[0].second;
    }
    result.append(last, content.cend());

    return result;
}

std::string summarizeContent(const std::string& content) {
    std::string collapsed;
    collapsed.reserve(content.size());

    bool pending_space = false;
    for (char c : content) {
        if (c == ' ' || c == '\t' || c == '\n' || c == '\r' || c == '\f' || c == '\v') {
            pending_space = true;
            continue;
        }
        if (pending_space && !collapsed.empty()) {
            collapsed += ' ';
        }
        pending_space = false;
        collapsed += c;
    }

    size_t code_points = 0;
    for (size_t i = 0; i < collapsed.size(); i++) {
        if (isContinuationByte(static_cast<unsigned char>(collapsed[i]))) continue;
        if (code_points == SUMMARY_LIMIT) {
            return collapsed.substr(0, i) + "...";
        }
        code_points++;
    }

    return collapsed;
}

} // namespace template_vars
} // namespace promptvault
