#include "text_buffer.hpp"

#include <utility>

namespace flakeedit::edit
{
    TextBuffer::TextBuffer(std::string text)
        : m_text(std::move(text))
    {
    }

    const std::string& TextBuffer::text() const noexcept
    {
        return m_text;
    }

    std::string TextBuffer::release() noexcept
    {
        return std::move(m_text);
    }

    std::optional<std::size_t> TextBuffer::offsetOf(const SourceLocation& location, std::vector<Diagnostic>& diagnostics) const
    {
        std::optional<std::size_t> offset = positionToOffset(m_text, location);
        if (!offset.has_value())
        {
            diagnostics.emplace_back(makeError(EditErrorKind::PositionNotFound,
                "could not find " + describeLocation(location) + " in the manifest text",
                SourceSpan{location, location}));
        }
        return offset;
    }

    std::optional<ByteRange> TextBuffer::rangeOf(const SourceSpan& span, std::vector<Diagnostic>& diagnostics) const
    {
        const std::optional<std::size_t> begin = offsetOf(span.begin, diagnostics);
        if (!begin.has_value())
        {
            return std::nullopt;
        }

        const std::optional<std::size_t> end = offsetOf(span.end, diagnostics);
        if (!end.has_value())
        {
            return std::nullopt;
        }

        return ByteRange{*begin, *end};
    }

    std::optional<std::string> TextBuffer::linePrefix(const SourceLocation& location, std::vector<Diagnostic>& diagnostics) const
    {
        const std::optional<ByteRange> range = rangeOf(SourceSpan{{location.line, 1}, location}, diagnostics);
        if (!range.has_value())
        {
            return std::nullopt;
        }

        return m_text.substr(range->begin, range->end - range->begin);
    }

    void TextBuffer::insert(std::size_t offset, std::string_view text)
    {
        m_text.insert(offset, text.data(), text.size());
    }

    void TextBuffer::replace(const ByteRange& range, std::string_view text)
    {
        m_text.replace(range.begin, range.end - range.begin, text.data(), text.size());
    }

    bool isBlank(std::string_view text) noexcept
    {
        return text.find_first_not_of(" \t") == std::string_view::npos;
    }
} // namespace flakeedit::edit
