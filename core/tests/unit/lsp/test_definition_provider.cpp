// tests/unit/lsp/test_definition_provider.cpp
#include <gtest/gtest.h>

#include "frugal_ls/lsp/definition_provider.hpp"
#include "frugal_ls/test_support/parse_helpers.hpp"

using namespace frugal_ls;
using namespace frugal_ls::lsp;
using test_support::make_document;
using test_support::position_of;

namespace
{

const char * k_types_uri = "file:///idl/types.frugal";
const char * k_service_uri = "file:///idl/service.frugal";

}  // namespace

TEST(DefinitionProviderTest, JumpsToOtherDocument)
{
  const Document types = make_document("struct User {}\n", k_types_uri);
  const Document service = make_document(
    "service S {\n"
    "  User get()\n"
    "}\n",
    k_service_uri);
  const DocumentSet docs{{k_types_uri, &types}, {k_service_uri, &service}};

  const DefinitionProvider provider;
  const auto locs = provider.definition(service, position_of(service, "User"), docs);

  ASSERT_EQ(locs.size(), 1U);
  EXPECT_EQ(locs[0].uri, k_types_uri);
  EXPECT_EQ(locs[0].range.start, (Position{0, 7}));
  EXPECT_EQ(locs[0].range.end, (Position{0, 11}));
}

TEST(DefinitionProviderTest, OriginDocumentFirst)
{
  const Document a = make_document("struct Dup {}\nstruct B {\n  1: Dup d\n}\n", k_types_uri);
  const Document b = make_document("struct Dup {}\n", k_service_uri);
  const DocumentSet docs{{k_types_uri, &a}, {k_service_uri, &b}};

  const DefinitionProvider provider;
  const auto locs = provider.definition(b, position_of(b, "Dup"), docs);

  ASSERT_EQ(locs.size(), 2U);
  EXPECT_EQ(locs[0].uri, k_service_uri);
  EXPECT_EQ(locs[1].uri, k_types_uri);
}

TEST(DefinitionProviderTest, IgnoresNonFrugalDocuments)
{
  const Document types = make_document("struct User {}\n", "file:///notes/user.thrift");
  const Document service = make_document("service S {\n  User get()\n}\n", k_service_uri);
  const DocumentSet docs{{"file:///notes/user.thrift", &types}, {k_service_uri, &service}};

  const DefinitionProvider provider;
  EXPECT_TRUE(provider.definition(service, position_of(service, "User"), docs).empty());

  const DefinitionProvider thrift_aware({".frugal", ".thrift"});
  EXPECT_EQ(thrift_aware.definition(service, position_of(service, "User"), docs).size(), 1U);
}

TEST(DefinitionProviderTest, MembersAreNotTargets)
{
  const Document doc = make_document("struct A {\n  1: i32 count\n}\n", k_types_uri);
  const DocumentSet docs{{k_types_uri, &doc}};

  const DefinitionProvider provider;
  EXPECT_TRUE(provider.definition(doc, position_of(doc, "count"), docs).empty());
}
