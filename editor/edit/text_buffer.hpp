#pragma once

#include "diagnostic.hpp"
#include "position_index.hpp"

#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace flakeedit::edit
{
    // The manifest text being edited. Positions are resolved against the current contents,
    // so callers must order their edits so that every span they still need lies before the
    // bytes they have already changed.
    class TextBuffer
    {
    public:
        explicit TextBuffer(std::string text);

        [[nodiscard]] const std::string& text() const noexcept;
        [[nodiscard]] std::string release() noexcept;

        [[nodiscard]] std::optional<std::size_t> offsetOf(const SourceLocation& location, std::vector<Diagnostic>& diagnostics) const;
        [[nodiscard]] std::optional<ByteRange> rangeOf(const SourceSpan& span, std::vector<Diagnostic>& diagnostics) const;

        // Text between the start of `location`'s line and `location` itself.
        [[nodiscard]] std::optional<std::string> linePrefix(const SourceLocation& location, std::vector<Diagnostic>& diagnostics) const;

        void insert(std::size_t offset, std::string_view text);
        void replace(const ByteRange& range, std::string_view text);

    private:
        std::string m_text;
    };

    [[nodiscard]] bool isBlank(std::string_view text) noexcept;
} // namespace flakeedit::edit
