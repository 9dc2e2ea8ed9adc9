#include "modelspec/basic/source_manager.hpp"

#include <algorithm>

namespace modelspec
{

SourceManager::SourceManager(std::string text, std::string name)
: name_(std::move(name)), text_(std::move(text))
{
  line_starts_.push_back(0);
  for (uint32_t i = 0; i < text_.size(); ++i) {
    if (text_[i] == '\n') line_starts_.push_back(i + 1);
  }
}

LineColumn SourceManager::get_line_column(uint32_t offset) const noexcept
{
  offset = std::min(offset, static_cast<uint32_t>(text_.size()));

  // line_starts_[0] == 0, so the predecessor always exists.
  const auto next = std::upper_bound(line_starts_.begin(), line_starts_.end(), offset);
  const auto line = static_cast<uint32_t>(next - line_starts_.begin());
  return {line, offset - line_starts_[line - 1] + 1};
}

std::string_view SourceManager::get_line(uint32_t index) const noexcept
{
  if (index >= line_starts_.size()) return {};

  const uint32_t begin = line_starts_[index];
  uint32_t end = index + 1 < line_starts_.size() ? line_starts_[index + 1] - 1
                                                 : static_cast<uint32_t>(text_.size());
  if (end > begin && text_[end - 1] == '\r') --end;

  return std::string_view(text_).substr(begin, end - begin);
}

std::string_view SourceManager::get_slice(SourceRange range) const noexcept
{
  if (range.is_invalid() || range.get_begin().get_offset() >= text_.size()) return {};

  const uint32_t begin = range.get_begin().get_offset();
  const uint32_t end = std::min(range.get_end().get_offset(), static_cast<uint32_t>(text_.size()));
  return std::string_view(text_).substr(begin, end - begin);
}

FullSourceRange SourceManager::get_full_range(SourceRange range) const noexcept
{
  if (range.is_invalid()) return {};

  const LineColumn from = get_line_column(range.get_begin());
  const LineColumn to = get_line_column(range.get_end());
  return FullSourceRange{
    from.line,
    from.column,
    to.line,
    to.column,
    range.get_begin().get_offset(),
    range.get_end().get_offset(),
  };
}

}  // namespace modelspec
