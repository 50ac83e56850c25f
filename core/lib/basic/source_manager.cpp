// frugal_ls/basic/source_manager.cpp - Line table and position conversion
#include "frugal_ls/basic/source_manager.hpp"

#include <algorithm>

namespace frugal_ls
{

void SourceManager::build_line_table()
{
  line_offsets_.clear();
  line_offsets_.push_back(0);

  for (size_t i = 0; i < source_.size(); ++i) {
    if (source_[i] == '\n') {
      line_offsets_.push_back(static_cast<uint32_t>(i + 1));
    }
  }
}

std::optional<uint32_t> SourceManager::offset_at(Position pos) const noexcept
{
  if (pos.line >= line_offsets_.size()) {
    return std::nullopt;
  }

  const std::string_view line = get_line(pos.line);
  if (pos.character > line.size()) {
    return std::nullopt;
  }

  return line_offsets_[pos.line] + pos.character;
}

Position SourceManager::position_at(uint32_t offset) const noexcept
{
  if (offset > source_.size()) {
    offset = static_cast<uint32_t>(source_.size());
  }

  auto it = std::upper_bound(line_offsets_.begin(), line_offsets_.end(), offset);
  --it;  // line_offsets_ always starts with 0

  Position pos;
  pos.line = static_cast<uint32_t>(it - line_offsets_.begin());
  pos.character = offset - *it;
  return pos;
}

Range SourceManager::to_range(SourceRange range) const noexcept
{
  if (!range.is_valid()) {
    return {};
  }
  return Range{position_at(range.begin()), position_at(range.end())};
}

LineColumn SourceManager::get_line_column(uint32_t offset) const noexcept
{
  const Position pos = position_at(offset);
  return {pos.line + 1, pos.character + 1};
}

std::string_view SourceManager::get_line(uint32_t line_index) const noexcept
{
  if (line_index >= line_offsets_.size()) {
    return {};
  }

  const uint32_t start = line_offsets_[line_index];
  auto end = static_cast<uint32_t>(source_.size());
  if (line_index + 1 < line_offsets_.size()) {
    end = line_offsets_[line_index + 1] - 1;  // drop '\n'
  }

  return std::string_view(source_).substr(start, end - start);
}

std::string_view SourceManager::get_source_slice(SourceRange range) const noexcept
{
  if (!range.is_valid()) {
    return {};
  }

  const uint32_t start = range.begin();
  uint32_t end = range.end();
  if (start >= source_.size()) {
    return {};
  }
  if (end > source_.size()) {
    end = static_cast<uint32_t>(source_.size());
  }
  return std::string_view(source_).substr(start, end - start);
}

}  // namespace frugal_ls
