#pragma once

#include "ast.hpp"
#include "lexer.hpp"

#include <memory>
#include <optional>
#include <string_view>
#include <vector>

namespace flakeedit::frontend
{
    class Parser
    {
    public:
        Parser(const std::vector<Token>& tokens, std::string_view fileName);

        [[nodiscard]] Expression parse();
        [[nodiscard]] const std::vector<Diagnostic>& diagnostics() const noexcept;

    private:
        const Token& peek() const;
        const Token& previous() const;
        const Token& advance();
        const Token& lookAhead(std::size_t offset) const;
        bool isAtEnd() const;
        bool check(TokenKind kind) const;
        bool match(TokenKind kind);
        const Token& consume(TokenKind kind, std::string_view messageCode, std::string_view messageText);
        void reportError(std::string_view code, std::string message, SourceSpan span);

        std::unique_ptr<Expression> parseExpression();
        std::unique_ptr<Expression> parseFunction();
        std::unique_ptr<Expression> parseLet();
        std::unique_ptr<Expression> parseWith();
        std::unique_ptr<Expression> parseAssert();
        std::unique_ptr<Expression> parseIf();
        std::unique_ptr<Expression> parseBinary(int minimumPrecedence);
        std::unique_ptr<Expression> parseUnary();
        std::unique_ptr<Expression> parseApplication();
        std::unique_ptr<Expression> parseSelect();
        std::unique_ptr<Expression> parsePrimary();
        std::unique_ptr<Expression> parseAttributeSet(bool isRecursive);
        std::unique_ptr<Expression> parseList();
        std::unique_ptr<Expression> parseStringLiteral(ExpressionKind kind);

        void parseBindings(std::vector<Binding>& bindings, TokenKind terminator);
        Binding parseBinding();
        Binding parseInherit();
        std::vector<AttributePart> parseAttributePath();
        std::optional<AttributePart> parseAttributePart();
        FunctionHead parseFormals();

        bool isFormalsAhead() const;
        bool startsPrimary(TokenKind kind) const;

        static std::unique_ptr<Expression> makeExpression(ExpressionKind kind, SourceSpan span);

    private:
        const std::vector<Token>& m_tokens;
        std::string_view m_fileName;
        std::size_t m_current{0};
        std::vector<Diagnostic> m_diagnostics;
    };

    struct ParsedManifest
    {
        Expression root;
        std::vector<Diagnostic> diagnostics;
    };

    // Lexes and parses a whole manifest. Lexer diagnostics short-circuit parsing.
    [[nodiscard]] ParsedManifest parseManifest(std::string_view source, std::string_view fileName = {});
} // namespace flakeedit::frontend
