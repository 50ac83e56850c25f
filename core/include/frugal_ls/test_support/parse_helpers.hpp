// frugal_ls/test_support/parse_helpers.hpp - helpers for unit tests
//
// Single-document parsing plus cursor lookup by needle, so tests can place a
// position on "the second `User`" without counting columns by hand.
//
#pragma once

#include <gtest/gtest.h>

#include <cstdint>
#include <string>
#include <string_view>

#include "frugal_ls/basic/source_manager.hpp"
#include "frugal_ls/document/document.hpp"

namespace frugal_ls::test_support
{

inline constexpr const char * k_test_uri = "file:///tmp/test.frugal";

[[nodiscard]] inline Document make_document(
  std::string src, std::string uri = k_test_uri, const ParseOptions & options = {})
{
  return Document::parse(std::move(uri), std::move(src), options);
}

/// Byte offset of the `occurrence`-th (0-based) match of `needle` in `text`.
[[nodiscard]] inline uint32_t find_byte_offset(
  std::string_view text, std::string_view needle, size_t occurrence = 0)
{
  size_t pos = text.find(needle);
  for (size_t i = 0; i < occurrence && pos != std::string_view::npos; ++i) {
    pos = text.find(needle, pos + 1);
  }
  EXPECT_NE(pos, std::string_view::npos) << "needle must exist: '" << needle << "'";
  if (pos == std::string_view::npos) return 0U;
  return static_cast<uint32_t>(pos);
}

/// Position of the `occurrence`-th match of `needle`, shifted by `delta` bytes.
[[nodiscard]] inline Position position_of(
  const Document & doc, std::string_view needle, size_t occurrence = 0, uint32_t delta = 0)
{
  return doc.source().position_at(find_byte_offset(doc.text(), needle, occurrence) + delta);
}

}  // namespace frugal_ls::test_support
