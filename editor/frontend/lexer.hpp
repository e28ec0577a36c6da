#pragma once

#include "token.hpp"

#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace flakeedit::frontend
{
    struct Diagnostic
    {
        std::string code;
        std::string message;
        SourceSpan span;
    };

    class Lexer
    {
    public:
        explicit Lexer(std::string_view source, std::string_view fileName = {});

        [[nodiscard]] const std::vector<Token>& tokens() const noexcept;
        [[nodiscard]] const std::vector<Diagnostic>& diagnostics() const noexcept;

        void lex();

    private:
        void pushToken(TokenKind kind, SourceLocation start, SourceLocation end, std::string_view text);
        bool tryLexPath();
        bool tryLexSearchPath();
        bool tryLexUri();
        void lexIdentifierOrKeyword();
        void lexNumber();
        void lexString();
        void lexIndentedString();
        bool lexInterpolation(std::vector<StringSegment>& segments);
        void skipLineComment();
        void skipBlockComment();
        void emitSingle(TokenKind kind);
        void emitDouble(TokenKind kind);
        void reportError(std::string_view code, std::string message, SourceLocation start);
        char peek() const;
        char peekNext() const;
        char peekAt(std::size_t offset) const;
        char advance();
        bool isAtEnd() const;
        void advanceLine();

    private:
        std::string_view m_source;
        std::string_view m_fileName;
        std::vector<Token> m_tokens;
        std::vector<Diagnostic> m_diagnostics;
        std::size_t m_current{0};
        SourceLocation m_location{};
    };
} // namespace flakeedit::frontend
