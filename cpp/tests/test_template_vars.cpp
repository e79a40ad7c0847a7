#include <gtest/gtest.h>
#include "template_vars.h"

using namespace promptvault;

TEST(TemplateVarsTest, ExtractReturnsUniqueNamesInOrder) {
    auto names = template_vars::extractVariables("Hello {{ name }}, write about {{topic}} for {{name}}.");
    EXPECT_EQ(names, (std::vector<std::string>{"name", "topic"}));
}

TEST(TemplateVarsTest, ExtractIgnoresEmptyAndNestedBraces) {
    EXPECT_TRUE(template_vars::extractVariables("{{ }} and {{}} and plain text").empty());
    EXPECT_EQ(template_vars::extractVariables("{{ {a} }} {{ b }}"), (std::vector<std::string>{"b"}));
}

TEST(TemplateVarsTest, ApplySubstitutesKnownValues) {
    std::map<std::string, std::string> values{{"name", "Ada"}, {"topic", "engines"}};
    EXPECT_EQ(template_vars::applyVariables("Hi {{ name }}, on {{topic}}.", values),
              "Hi Ada, on engines.");
}

TEST(TemplateVarsTest, ApplyLeavesMissingInCanonicalForm) {
    std::map<std::string, std::string> values{{"name", "Ada"}};
    EXPECT_EQ(template_vars::applyVariables("{{ name }} / {{  missing  }}", values),
              "Ada / {{missing}}");
}

TEST(TemplateVarsTest, ApplyWithoutPlaceholdersIsIdentity) {
    EXPECT_EQ(template_vars::applyVariables("no vars { here }", {}), "no vars { here }");
}

TEST(TemplateVarsTest, SummaryCollapsesWhitespace) {
    EXPECT_EQ(template_vars::summarizeContent("  first\n\n  second\tthird  "), "first second third");
    EXPECT_EQ(template_vars::summarizeContent(""), "");
}

TEST(TemplateVarsTest, SummaryTruncatesAtNinetyCharacters) {
    std::string exact(90, 'x');
    EXPECT_EQ(template_vars::summarizeContent(exact), exact);

    std::string longer(100, 'y');
    EXPECT_EQ(template_vars::summarizeContent(longer), std::string(90, 'y') + "...");
}

TEST(TemplateVarsTest, SummaryNeverSplitsMultibyteCharacters) {
    std::string text;
    for (int i = 0; i < 95; i++) text += "\xC3\xA9";   // e-acute

    std::string summary = template_vars::summarizeContent(text);
    EXPECT_EQ(summary.size(), 90u * 2 + 3);
    EXPECT_EQ(summary.substr(summary.size() - 3), "...");
    EXPECT_EQ(summary.substr(0, 2), "\xC3\xA9");
}
