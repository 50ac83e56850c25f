// tests/unit/sema/test_duplicate_definitions.cpp
#include <gtest/gtest.h>

#include "frugal_ls/sema/checks/duplicate_definition_checker.hpp"
#include "frugal_ls/test_support/parse_helpers.hpp"

using namespace frugal_ls;
using test_support::k_test_uri;
using test_support::make_document;

TEST(DuplicateDefinitionTest, DuplicateStructRelatesToFirst)
{
  const Document doc = make_document(
    "struct User {\n"
    "  1: string name\n"
    "}\n"
    "struct User {\n"
    "  1: string email\n"
    "}\n");
  const auto symbols = doc.symbols();

  DiagnosticBag diags;
  DuplicateDefinitionChecker checker(&diags);
  EXPECT_FALSE(checker.check(symbols, k_test_uri));
  EXPECT_TRUE(checker.has_errors());
  EXPECT_EQ(checker.error_count(), 1U);

  ASSERT_EQ(diags.size(), 1U);
  const Diagnostic & d = diags.all().front();
  EXPECT_EQ(d.severity, Severity::Error);
  EXPECT_EQ(d.message, "Duplicate struct definition 'User'");
  EXPECT_EQ(d.code, "E0101");
  EXPECT_EQ(d.range.start, (Position{3, 7}));
  EXPECT_EQ(d.range.end, (Position{3, 11}));

  ASSERT_EQ(d.related.size(), 1U);
  EXPECT_EQ(d.related[0].uri, k_test_uri);
  EXPECT_EQ(d.related[0].range.start, (Position{0, 7}));
  EXPECT_EQ(d.related[0].message, "First definition of 'User' here");
}

TEST(DuplicateDefinitionTest, NDefinitionsGiveNMinusOne)
{
  const Document doc = make_document(
    "enum Mode {}\n"
    "enum Mode {}\n"
    "enum Mode {}\n"
    "enum Mode {}\n");

  DiagnosticBag diags;
  DuplicateDefinitionChecker checker(&diags);
  EXPECT_FALSE(checker.check(doc.symbols(), k_test_uri));

  ASSERT_EQ(diags.size(), 3U);
  for (const auto & d : diags) {
    EXPECT_EQ(d.message, "Duplicate enum definition 'Mode'");
    ASSERT_EQ(d.related.size(), 1U);
    EXPECT_EQ(d.related[0].range.start, (Position{0, 5}));
  }
}

TEST(DuplicateDefinitionTest, DifferentKindsDoNotCollide)
{
  const Document doc = make_document(
    "struct Thing {}\n"
    "exception Thing {}\n"
    "service Thing {}\n");

  DiagnosticBag diags;
  DuplicateDefinitionChecker checker(&diags);
  EXPECT_TRUE(checker.check(doc.symbols(), k_test_uri));
  EXPECT_TRUE(diags.empty());
}

TEST(DuplicateDefinitionTest, WorksWithoutBag)
{
  const Document doc = make_document("const i32 A = 1\nconst i32 A = 2\n");

  DuplicateDefinitionChecker checker;
  EXPECT_FALSE(checker.check(doc.symbols(), k_test_uri));
  EXPECT_EQ(checker.error_count(), 1U);
}
