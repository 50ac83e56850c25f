// tests/unit/sema/test_type_references.cpp
#include <gtest/gtest.h>

#include "frugal_ls/sema/checks/type_reference_checker.hpp"
#include "frugal_ls/test_support/parse_helpers.hpp"

using namespace frugal_ls;
using test_support::make_document;

namespace
{

std::vector<Diagnostic> check_types(const Document & doc)
{
  DiagnosticBag diags;
  TypeReferenceChecker checker(&diags);
  checker.check(doc.root(), doc.source(), doc.symbols());
  return diags.take();
}

}  // namespace

TEST(TypeReferenceTest, UnknownType)
{
  const Document doc = make_document(
    "struct Order {\n"
    "  1: UnknownType item\n"
    "}\n");

  const auto diags = check_types(doc);
  ASSERT_EQ(diags.size(), 1U);
  EXPECT_EQ(diags[0].severity, Severity::Error);
  EXPECT_EQ(diags[0].message, "Unknown type 'UnknownType'");
  EXPECT_EQ(diags[0].code, "E0201");
  EXPECT_EQ(diags[0].range.start, (Position{1, 5}));
  EXPECT_EQ(diags[0].range.end, (Position{1, 16}));
}

TEST(TypeReferenceTest, DeclaredTypesResolveRegardlessOfOrder)
{
  const Document doc = make_document(
    "struct Order {\n"
    "  1: Customer customer,\n"
    "  2: Status status,\n"
    "  3: OrderId id\n"
    "}\n"
    "struct Customer {}\n"
    "enum Status {}\n"
    "typedef i64 OrderId\n");

  EXPECT_TRUE(check_types(doc).empty());
}

TEST(TypeReferenceTest, ContainerElementsAreChecked)
{
  const Document doc = make_document(
    "struct Bag {\n"
    "  1: list<Missing> items,\n"
    "  2: map<string, i32> counts\n"
    "}\n");

  const auto diags = check_types(doc);
  ASSERT_EQ(diags.size(), 1U);
  EXPECT_EQ(diags[0].message, "Unknown type 'Missing'");
}

TEST(TypeReferenceTest, ServiceSignatures)
{
  const Document doc = make_document(
    "exception NotFound {}\n"
    "service S {\n"
    "  Result get(1: Query q) throws (1: NotFound nf)\n"
    "}\n");

  const auto diags = check_types(doc);
  ASSERT_EQ(diags.size(), 2U);
  EXPECT_EQ(diags[0].message, "Unknown type 'Result'");
  EXPECT_EQ(diags[1].message, "Unknown type 'Query'");
}

TEST(TypeReferenceTest, QualifiedTypesAreNotChecked)
{
  const Document doc = make_document("struct A {\n  1: other.Thing t\n}\n");
  EXPECT_TRUE(check_types(doc).empty());
}

TEST(TypeReferenceTest, KnownTypes)
{
  const Document doc = make_document("struct User {}\nconst i32 MAX = 1\n");
  const auto symbols = doc.symbols();
  const auto known = TypeReferenceChecker::known_types(symbols);

  EXPECT_NE(known.find("User"), known.end());
  EXPECT_NE(known.find("i64"), known.end());
  EXPECT_NE(known.find("uuid"), known.end());
  EXPECT_NE(known.find("void"), known.end());
  EXPECT_EQ(known.find("MAX"), known.end());
}
