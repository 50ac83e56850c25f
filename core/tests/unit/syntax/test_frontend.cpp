// tests/unit/syntax/test_frontend.cpp - Grammar and parse pipeline smoke tests
#include <gtest/gtest.h>

#include <string>

#include "frugal_ls/syntax/frontend.hpp"
#include "frugal_ls/syntax/node_kinds.hpp"
#include "frugal_ls/syntax/node_utils.hpp"

using namespace frugal_ls;
namespace k = frugal_ls::syntax::kind;

namespace
{

size_t count_kind(ts_ll::Node root, std::string_view kind)
{
  size_t n = 0;
  syntax::walk_preorder(root, [&](ts_ll::Node node) {
    if (node.kind() == kind) ++n;
  });
  return n;
}

}  // namespace

TEST(FrontendTest, ParsesAllDefinitionKinds)
{
  const std::string src = R"(
include "base.frugal"
namespace java com.example.events

const i32 MAX_USERS = 100
typedef i64 UserId

enum Color {
  RED = 1,
  GREEN = 2
}

struct User {
  1: required UserId id,
  2: optional string name = "anon",
  3: list<map<string, Color>> tags
}

exception UserNotFound {
  1: string message
}

service UserService extends base.BaseService {
  User getUser(1: i64 userId) throws (1: UserNotFound ex),
  oneway void ping()
}

scope Events prefix foo.bar {
  Created: User
}
)";

  const ParseResult result = parse_source(src);
  ASSERT_FALSE(result.tree.is_null());
  EXPECT_FALSE(result.has_errors());

  const ts_ll::Node root = result.tree.root_node();
  EXPECT_EQ(root.kind(), k::k_source_file);
  EXPECT_FALSE(root.has_error());

  EXPECT_EQ(count_kind(root, k::k_include_statement), 1U);
  EXPECT_EQ(count_kind(root, k::k_namespace_statement), 1U);
  EXPECT_EQ(count_kind(root, k::k_const_definition), 1U);
  EXPECT_EQ(count_kind(root, k::k_typedef_definition), 1U);
  EXPECT_EQ(count_kind(root, k::k_enum_definition), 1U);
  EXPECT_EQ(count_kind(root, k::k_struct_definition), 1U);
  EXPECT_EQ(count_kind(root, k::k_exception_definition), 1U);
  EXPECT_EQ(count_kind(root, k::k_service_definition), 1U);
  EXPECT_EQ(count_kind(root, k::k_scope_definition), 1U);
  EXPECT_EQ(count_kind(root, k::k_function_definition), 2U);
  EXPECT_EQ(count_kind(root, k::k_field_list), 2U);
  EXPECT_EQ(count_kind(root, k::k_scope_operation), 1U);
}

TEST(FrontendTest, CommentsAreExtras)
{
  const std::string src =
    "// line\n"
    "# hash\n"
    "/* block\n   comment */\n"
    "struct A {\n"
    "  1: i32 x // trailing\n"
    "}\n";

  const ParseResult result = parse_source(src);
  EXPECT_FALSE(result.has_errors());
  EXPECT_EQ(count_kind(result.tree.root_node(), k::k_comment), 4U);
}

TEST(FrontendTest, ReportsSyntaxErrors)
{
  const std::string src = "struct A {\n  1: i32\n}\n";

  const ParseResult result = parse_source(src);
  ASSERT_FALSE(result.tree.is_null());
  ASSERT_TRUE(result.has_errors());

  for (const auto & err : result.errors) {
    EXPECT_TRUE(err.message == "Syntax error" || err.message.rfind("Missing ", 0) == 0)
      << err.message;
  }
}

TEST(FrontendTest, RecoversDefinitionsAfterError)
{
  const std::string src = "struct A {\n  1: i32 a\n}\n@@@\nstruct B {}\n";

  const ParseResult result = parse_source(src);
  EXPECT_TRUE(result.has_errors());
  EXPECT_EQ(count_kind(result.tree.root_node(), k::k_struct_definition), 2U);
}

TEST(FrontendTest, SyntaxErrorCap)
{
  const std::string src = "@@@\nstruct A {}\n$$$\nstruct B {}\n%%%\n";

  ParseOptions opts;
  opts.max_syntax_errors = 1;
  const ParseResult capped = parse_source(src, opts);
  EXPECT_EQ(capped.errors.size(), 1U);

  const ParseResult all = parse_source(src);
  EXPECT_GE(all.errors.size(), 1U);
}

TEST(FrontendTest, DeepestNodeAt)
{
  const std::string src = "struct User {}\n";
  const ParseResult result = parse_source(src);

  const ts_ll::Node n = syntax::deepest_node_at(result.tree.root_node(), 8);
  EXPECT_EQ(n.kind(), k::k_identifier);
  EXPECT_EQ(n.start_byte(), 7U);
  EXPECT_EQ(n.end_byte(), 11U);
}

TEST(FrontendTest, EmptySource)
{
  const ParseResult result = parse_source("");
  ASSERT_FALSE(result.tree.is_null());
  EXPECT_FALSE(result.has_errors());
  EXPECT_EQ(result.tree.root_node().child_count(), 0U);
}
