/**
 * @file test_query_template.cpp
 * @brief Unit tests for query templates and value escapers
 */

#include <gtest/gtest.h>
#include <idp/dc/exceptions.h>
#include <idp/dc/query_template.h>

using namespace idp::dc;

namespace {

ResolutionContext makeContext() {
    ResolutionContext context("alice", "https://sp.example.org", "https://idp.example.org");
    context.addDependencyAttribute("affiliation", {AttributeValue::ofString("staff"),
                                                   AttributeValue::ofString("member")});
    context.addDependencyAttribute("nothing", {});
    return context;
}

} // namespace

// ============================================================================
// Escapers
// ============================================================================

TEST(EscaperTest, LdapFilterValue_EscapesSpecialCharacters) {
    EXPECT_EQ(escapeLdapFilterValue("alice"), "alice");
    EXPECT_EQ(escapeLdapFilterValue("a*b"), "a\\2ab");
    EXPECT_EQ(escapeLdapFilterValue("(x)"), "\\28x\\29");
    EXPECT_EQ(escapeLdapFilterValue("back\\slash"), "back\\5cslash");
    EXPECT_EQ(escapeLdapFilterValue(std::string("nul\0byte", 8)), "nul\\00byte");
}

TEST(EscaperTest, SqlLiteral_DoublesQuotes) {
    EXPECT_EQ(escapeSqlLiteral("O'Brien"), "O''Brien");
    EXPECT_EQ(escapeSqlLiteral("''"), "''''");
    EXPECT_EQ(escapeSqlLiteral("plain"), "plain");
}

// ============================================================================
// Rendering
// ============================================================================

TEST(QueryTemplateTest, BuiltInVariables) {
    QueryTemplate tmpl("{principal} via {requester} from {issuer}");

    EXPECT_EQ(tmpl.render(makeContext()),
              "alice via https://sp.example.org from https://idp.example.org");
}

TEST(QueryTemplateTest, IndexedDependencyValues) {
    QueryTemplate tmpl("{affiliation}/{affiliation[1]}");

    EXPECT_EQ(tmpl.render(makeContext()), "staff/member");
}

TEST(QueryTemplateTest, DoubledBracesAreLiteral) {
    QueryTemplate tmpl("{{\"uid\": \"{principal}\"}}");

    EXPECT_EQ(tmpl.render(makeContext()), "{\"uid\": \"alice\"}");
}

TEST(QueryTemplateTest, EscaperAppliesOnlyToValues) {
    ResolutionContext context("a*)(uid=*");
    QueryTemplate tmpl("(uid={principal})", escapeLdapFilterValue);

    EXPECT_EQ(tmpl.render(context), "(uid=a\\2a\\29\\28uid=\\2a)");
}

TEST(QueryTemplateTest, UnknownVariable_Throws) {
    QueryTemplate tmpl("(mail={email})");

    EXPECT_THROW(tmpl.render(makeContext()), QueryConstructionException);
}

TEST(QueryTemplateTest, MissingValue_Throws) {
    EXPECT_THROW(QueryTemplate("{principal}").render(ResolutionContext()), QueryConstructionException);
    EXPECT_THROW(QueryTemplate("{nothing}").render(makeContext()), QueryConstructionException);
}

TEST(QueryTemplateTest, IndexOutOfRange_Throws) {
    EXPECT_THROW(QueryTemplate("{affiliation[2]}").render(makeContext()), QueryConstructionException);
}

TEST(QueryTemplateTest, MalformedTokens_Throw) {
    auto context = makeContext();

    EXPECT_THROW(QueryTemplate("{principal").render(context), QueryConstructionException);
    EXPECT_THROW(QueryTemplate("principal}").render(context), QueryConstructionException);
    EXPECT_THROW(QueryTemplate("{}").render(context), QueryConstructionException);
    EXPECT_THROW(QueryTemplate("{affiliation[x]}").render(context), QueryConstructionException);
    EXPECT_THROW(QueryTemplate("{affiliation[]}").render(context), QueryConstructionException);
    EXPECT_THROW(QueryTemplate("{a{b}").render(context), QueryConstructionException);
}

TEST(QueryTemplateTest, RenderIsDeterministic) {
    QueryTemplate tmpl("uid={principal}");
    auto context = makeContext();

    EXPECT_EQ(tmpl.render(context), tmpl.render(context));
}
