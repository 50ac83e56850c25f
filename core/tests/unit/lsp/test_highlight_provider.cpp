// tests/unit/lsp/test_highlight_provider.cpp
#include <gtest/gtest.h>

#include "frugal_ls/lsp/highlight_provider.hpp"
#include "frugal_ls/test_support/parse_helpers.hpp"

using namespace frugal_ls;
using namespace frugal_ls::lsp;
using test_support::make_document;
using test_support::position_of;

TEST(HighlightProviderTest, DeclarationIsWriteUsesAreRead)
{
  const Document doc = make_document(
    "enum Status {\n"
    "  OK = 1\n"
    "}\n"
    "const Status DEFAULT_STATUS = Status.OK\n"
    "struct Reply {\n"
    "  1: Status status\n"
    "}\n");

  const HighlightProvider provider;
  const auto highlights = provider.highlights(doc, position_of(doc, "Status", 2));

  ASSERT_EQ(highlights.size(), 4U);
  EXPECT_EQ(highlights[0].kind, DocumentHighlightKind::Write);
  EXPECT_EQ(highlights[0].range.start, (Position{0, 5}));
  EXPECT_EQ(highlights[1].kind, DocumentHighlightKind::Read);
  EXPECT_EQ(highlights[1].range.start, (Position{3, 6}));
  EXPECT_EQ(highlights[2].kind, DocumentHighlightKind::Read);
  EXPECT_EQ(highlights[2].range.start, (Position{3, 30}));
  EXPECT_EQ(highlights[3].kind, DocumentHighlightKind::Read);
  EXPECT_EQ(highlights[3].range.start, (Position{5, 5}));
}

TEST(HighlightProviderTest, EmptyWhenNothingUnderCursor)
{
  const Document doc = make_document("struct A {}\n\n");

  const HighlightProvider provider;
  EXPECT_TRUE(provider.highlights(doc, Position{1, 0}).empty());
  EXPECT_TRUE(provider.highlights(doc, Position{7, 3}).empty());
}
