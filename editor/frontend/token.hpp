#pragma once

#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

namespace flakeedit::frontend
{
    enum class TokenKind : std::uint16_t
    {
        EndOfFile,
        Identifier,
        IntegerLiteral,
        FloatLiteral,
        StringLiteral,
        IndentedStringLiteral,
        UriLiteral,
        PathLiteral,

        // Keywords
        KeywordLet,
        KeywordIn,
        KeywordRec,
        KeywordInherit,
        KeywordIf,
        KeywordThen,
        KeywordElse,
        KeywordWith,
        KeywordAssert,
        KeywordOr,

        // Punctuation
        LeftBrace,
        RightBrace,
        LeftParen,
        RightParen,
        LeftBracket,
        RightBracket,
        DollarBrace,
        Comma,
        Colon,
        Semicolon,
        Dot,
        Ellipsis,
        At,
        Question,
        Equals,

        // Operators
        Plus,
        Minus,
        Asterisk,
        Slash,
        PlusPlus,
        SlashSlash,
        Bang,
        LessThan,
        GreaterThan,
        LessEquals,
        GreaterEquals,
        EqualsEquals,
        BangEquals,
        AmpersandAmpersand,
        PipePipe,
        Arrow,
        PipeRight,
        PipeLeft
    };

    struct SourceLocation
    {
        std::uint32_t line{1};
        std::uint32_t column{1};
    };

    struct SourceSpan
    {
        SourceLocation begin{};
        SourceLocation end{};
    };

    [[nodiscard]] bool operator==(const SourceLocation& lhs, const SourceLocation& rhs) noexcept;
    [[nodiscard]] bool operator!=(const SourceLocation& lhs, const SourceLocation& rhs) noexcept;
    [[nodiscard]] bool operator<(const SourceLocation& lhs, const SourceLocation& rhs) noexcept;

    // One segment of a string literal. Raw segments cover the literal text between
    // interpolations; their spans never include the string delimiters.
    struct StringSegment
    {
        bool isInterpolation{false};
        std::string content;
        SourceSpan span{};
    };

    struct Token
    {
        TokenKind kind{TokenKind::EndOfFile};
        SourceSpan span{};
        std::string text{};
        std::vector<StringSegment> segments{};
    };

    [[nodiscard]] std::string_view toString(TokenKind kind);
} // namespace flakeedit::frontend
