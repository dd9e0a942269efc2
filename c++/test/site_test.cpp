#include <string>
#include <variant>
#include <vector>

#include <gtest/gtest.h>

#include "digest.hpp"
#include "site.hpp"

TEST(Digest, WorkingStringIsTruncatedBase64OfSha512)
{
    Digest digest("x:y");
    EXPECT_EQ(digest.base64digest().size(), 88u);
    EXPECT_EQ(digest.working_string(), "0gp8s+vSbiymEXpLbm/Dk/OFrbgnp9NY");
}

TEST(DerivePassword, IsDeterministic)
{
    auto first = derive_password("github.com", "secret", {});
    auto second = derive_password("github.com", "secret", {});
    EXPECT_EQ(first, second);
    EXPECT_EQ(first.size(), WORKING_STRING_LENGTH);
    EXPECT_EQ(first, "FAqoqlc4fFMrHdIg0TW6AtI2Lu9/sDiw");
}

TEST(DerivePassword, DependsOnSiteAndMasterPassword)
{
    EXPECT_NE(derive_password("github.com", "secret", {}),
              derive_password("github.com", "secret2", {}));
    EXPECT_NE(derive_password("github.com", "secret", {}),
              derive_password("gitlab.com", "secret", {}));
}

TEST(DerivePassword, AppliesSiteFilters)
{
    Site site{"github.com", {DigitFilter{}}};
    EXPECT_EQ(derive_password(site, "secret"), "5064612455277386096098219838");
}

TEST(BuildRegistry, BlankLineResetsFilters)
{
    auto sites = build_registry({"# @uppercase", "site-a", "", "site-b"});
    ASSERT_EQ(sites.size(), 2u);
    EXPECT_EQ(sites[0].name, "site-a");
    ASSERT_EQ(sites[0].filters.size(), 1u);
    EXPECT_TRUE(std::holds_alternative<UppercaseFilter>(sites[0].filters[0]));
    EXPECT_EQ(sites[1].name, "site-b");
    EXPECT_TRUE(sites[1].filters.empty());
}

TEST(BuildRegistry, FiltersAccumulateUntilBlankLine)
{
    auto sites = build_registry({
        "# @substring 0 8",
        "first.example",
        "# @digit",
        "second.example",
        "   ",
        "third.example",
    });
    ASSERT_EQ(sites.size(), 3u);
    EXPECT_EQ(sites[0].filters.size(), 1u);
    ASSERT_EQ(sites[1].filters.size(), 2u);
    EXPECT_TRUE(std::holds_alternative<SubstringFilter>(sites[1].filters[0]));
    EXPECT_TRUE(std::holds_alternative<DigitFilter>(sites[1].filters[1]));
    EXPECT_TRUE(sites[2].filters.empty());
}

TEST(BuildRegistry, TrimsLinesAndSkipsInvalidDirectives)
{
    auto sites = build_registry({
        "  # @lowercase  ",
        "# a plain comment",
        "# @replace onlyonearg",
        "\texample.com \r",
    });
    ASSERT_EQ(sites.size(), 1u);
    EXPECT_EQ(sites[0].name, "example.com");
    ASSERT_EQ(sites[0].filters.size(), 1u);
    EXPECT_TRUE(std::holds_alternative<LowercaseFilter>(sites[0].filters[0]));
}

TEST(BuildRegistry, KeepsDeclarationOrder)
{
    auto sites = build_registry({"b.example", "a.example", "c.example"});
    ASSERT_EQ(sites.size(), 3u);
    EXPECT_EQ(sites[0].name, "b.example");
    EXPECT_EQ(sites[1].name, "a.example");
    EXPECT_EQ(sites[2].name, "c.example");
}

TEST(BuildRegistry, EndToEndSubstring)
{
    auto sites = build_registry({"# @substring 0 8", "example.com"});
    ASSERT_EQ(sites.size(), 1u);
    auto password = derive_password(sites[0], "hunter2");
    EXPECT_EQ(password, "NmoLjCCW");
    EXPECT_EQ(password,
              Digest("example.com:hunter2").working_string().substr(0, 8));
}

TEST(FormatPasswords, AlignsPasswords)
{
    std::vector<Site> sites{{"a", {}}, {"longer.example", {}}};
    EXPECT_EQ(format_passwords(sites, "pw"),
              "a:              lKz6pOGLx7HMJzvmB4tu9tZ/vMvmNe/B\n"
              "longer.example: ZpS200fqFnU9osbwftXru0Y+9IlouC/6\n");
}

TEST(FormatPasswords, EmptyRegistry)
{
    EXPECT_EQ(format_passwords({}, "pw"), "");
}
