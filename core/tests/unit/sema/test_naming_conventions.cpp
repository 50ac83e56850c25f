// tests/unit/sema/test_naming_conventions.cpp
#include <gtest/gtest.h>

#include "frugal_ls/sema/checks/naming_convention_checker.hpp"
#include "frugal_ls/test_support/parse_helpers.hpp"

using namespace frugal_ls;
using test_support::make_document;

TEST(NamingConventionTest, PascalCasePredicate)
{
  EXPECT_TRUE(is_pascal_case("User"));
  EXPECT_TRUE(is_pascal_case("UserService"));
  EXPECT_TRUE(is_pascal_case("HTTPRequest"));
  EXPECT_TRUE(is_pascal_case("User2"));

  EXPECT_FALSE(is_pascal_case(""));
  EXPECT_FALSE(is_pascal_case("user"));
  EXPECT_FALSE(is_pascal_case("User_Service"));
  EXPECT_FALSE(is_pascal_case("HTTP"));
}

TEST(NamingConventionTest, UpperSnakeCasePredicate)
{
  EXPECT_TRUE(is_upper_snake_case("MAX"));
  EXPECT_TRUE(is_upper_snake_case("MAX_USERS"));
  EXPECT_TRUE(is_upper_snake_case("V2_API"));

  EXPECT_FALSE(is_upper_snake_case(""));
  EXPECT_FALSE(is_upper_snake_case("maxUsers"));
  EXPECT_FALSE(is_upper_snake_case("Max_Users"));
  EXPECT_FALSE(is_upper_snake_case("_MAX"));
  EXPECT_FALSE(is_upper_snake_case("MAX_"));
  EXPECT_FALSE(is_upper_snake_case("MAX__USERS"));
}

TEST(NamingConventionTest, WarnsOnViolations)
{
  const Document doc = make_document(
    "struct user_record {}\n"
    "service userService {}\n"
    "const i32 maxUsers = 10\n"
    "typedef i64 user_id\n"
    "enum Color {}\n");

  DiagnosticBag diags;
  NamingConventionChecker checker(&diags);
  EXPECT_FALSE(checker.check(doc.symbols()));
  EXPECT_EQ(checker.warning_count(), 3U);

  ASSERT_EQ(diags.size(), 3U);
  for (const auto & d : diags) {
    EXPECT_EQ(d.severity, Severity::Warning);
    EXPECT_EQ(d.code, "W0301");
  }
  EXPECT_EQ(
    diags.all()[0].message, "Struct 'user_record' should follow PascalCase naming convention");
  EXPECT_EQ(
    diags.all()[1].message, "Service 'userService' should follow PascalCase naming convention");
  EXPECT_EQ(
    diags.all()[2].message, "Const 'maxUsers' should follow UPPER_SNAKE_CASE naming convention");
  EXPECT_EQ(diags.all()[0].range.start, (Position{0, 7}));
}

TEST(NamingConventionTest, ConformingNamesAreQuiet)
{
  const Document doc = make_document(
    "struct User {}\n"
    "exception NotFound {}\n"
    "scope Events {}\n"
    "const i32 MAX_USERS = 10\n");

  DiagnosticBag diags;
  NamingConventionChecker checker(&diags);
  EXPECT_TRUE(checker.check(doc.symbols()));
  EXPECT_FALSE(checker.has_warnings());
  EXPECT_TRUE(diags.empty());
}
