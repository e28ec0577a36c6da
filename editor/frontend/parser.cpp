#include "parser.hpp"

#include <utility>

namespace
{
    using namespace flakeedit::frontend;

    struct OperatorInfo
    {
        int precedence{0};
        bool rightAssociative{false};
    };

    constexpr int kNotPrecedence = 8;
    constexpr int kNegatePrecedence = 13;

    OperatorInfo binaryOperatorInfo(TokenKind kind)
    {
        switch (kind)
        {
        case TokenKind::PipeRight:
        case TokenKind::PipeLeft:
            return {1, false};
        case TokenKind::Arrow:
            return {2, true};
        case TokenKind::PipePipe:
            return {3, false};
        case TokenKind::AmpersandAmpersand:
            return {4, false};
        case TokenKind::EqualsEquals:
        case TokenKind::BangEquals:
            return {5, false};
        case TokenKind::LessThan:
        case TokenKind::GreaterThan:
        case TokenKind::LessEquals:
        case TokenKind::GreaterEquals:
            return {6, false};
        case TokenKind::SlashSlash:
            return {7, true};
        case TokenKind::Plus:
        case TokenKind::Minus:
            return {9, false};
        case TokenKind::Asterisk:
        case TokenKind::Slash:
            return {10, false};
        case TokenKind::PlusPlus:
            return {11, true};
        case TokenKind::Question:
            return {12, false};
        default:
            return {0, false};
        }
    }

    SourceSpan joinSpans(const SourceSpan& first, const SourceSpan& last)
    {
        return {first.begin, last.end};
    }
} // namespace

namespace flakeedit::frontend
{
    Parser::Parser(const std::vector<Token>& tokens, std::string_view fileName)
        : m_tokens(tokens)
        , m_fileName(fileName)
    {
    }

    Expression Parser::parse()
    {
        m_current = 0;
        m_diagnostics.clear();

        std::unique_ptr<Expression> root = parseExpression();

        if (!isAtEnd())
        {
            reportError("FLAKEEDIT-E2103", "Unexpected trailing input after the top-level expression.", peek().span);
        }

        return std::move(*root);
    }

    const std::vector<Diagnostic>& Parser::diagnostics() const noexcept
    {
        return m_diagnostics;
    }

    const Token& Parser::peek() const
    {
        return m_tokens[m_current];
    }

    const Token& Parser::previous() const
    {
        return m_tokens[m_current - 1];
    }

    const Token& Parser::advance()
    {
        if (!isAtEnd())
        {
            ++m_current;
        }

        const std::size_t index = (m_current == 0) ? 0 : (m_current - 1);
        return m_tokens[index];
    }

    const Token& Parser::lookAhead(std::size_t offset) const
    {
        const std::size_t index = m_current + offset;
        if (index >= m_tokens.size())
        {
            return m_tokens.back();
        }
        return m_tokens[index];
    }

    bool Parser::isAtEnd() const
    {
        return peek().kind == TokenKind::EndOfFile;
    }

    bool Parser::check(TokenKind kind) const
    {
        if (isAtEnd()) return false;
        return peek().kind == kind;
    }

    bool Parser::match(TokenKind kind)
    {
        if (check(kind))
        {
            advance();
            return true;
        }
        return false;
    }

    const Token& Parser::consume(TokenKind kind, std::string_view messageCode, std::string_view messageText)
    {
        if (check(kind))
        {
            return advance();
        }

        reportError(messageCode, std::string{messageText}, peek().span);

        if (!isAtEnd())
        {
            advance();
        }

        return previous();
    }

    void Parser::reportError(std::string_view code, std::string message, SourceSpan span)
    {
        Diagnostic diag;
        diag.code = std::string{code};
        diag.message = std::move(message);
        diag.span = span;
        m_diagnostics.emplace_back(std::move(diag));
    }

    std::unique_ptr<Expression> Parser::makeExpression(ExpressionKind kind, SourceSpan span)
    {
        auto expression = std::make_unique<Expression>();
        expression->kind = kind;
        expression->span = span;
        return expression;
    }

    std::unique_ptr<Expression> Parser::parseExpression()
    {
        if (check(TokenKind::KeywordLet))
        {
            return parseLet();
        }

        if (check(TokenKind::KeywordWith))
        {
            return parseWith();
        }

        if (check(TokenKind::KeywordAssert))
        {
            return parseAssert();
        }

        if (check(TokenKind::KeywordIf))
        {
            return parseIf();
        }

        if (check(TokenKind::Identifier))
        {
            const TokenKind next = lookAhead(1).kind;
            if (next == TokenKind::Colon || (next == TokenKind::At && lookAhead(2).kind == TokenKind::LeftBrace))
            {
                return parseFunction();
            }
        }

        if (check(TokenKind::LeftBrace) && isFormalsAhead())
        {
            return parseFunction();
        }

        return parseBinary(1);
    }

    std::unique_ptr<Expression> Parser::parseFunction()
    {
        const Token& first = peek();
        FunctionHead head;

        if (check(TokenKind::Identifier) && lookAhead(1).kind == TokenKind::Colon)
        {
            const Token& parameter = advance();
            head.kind = FunctionHeadKind::Simple;
            head.identifier = parameter.text;
            head.span = parameter.span;
        }
        else if (check(TokenKind::Identifier))
        {
            const Token& binder = advance();
            advance(); // consume '@'
            head = parseFormals();
            head.identifier = binder.text;
        }
        else
        {
            head = parseFormals();
            if (match(TokenKind::At))
            {
                const Token& binder = consume(TokenKind::Identifier, "FLAKEEDIT-E2110", "Expected identifier after '@'.");
                head.identifier = binder.text;
            }
        }

        consume(TokenKind::Colon, "FLAKEEDIT-E2111", "Expected ':' after function parameters.");
        std::unique_ptr<Expression> body = parseExpression();

        auto function = makeExpression(ExpressionKind::Function, joinSpans(first.span, body->span));
        function->head = std::move(head);
        function->children.emplace_back(std::move(body));
        return function;
    }

    FunctionHead Parser::parseFormals()
    {
        FunctionHead head;
        head.kind = FunctionHeadKind::Destructured;

        const Token& open = consume(TokenKind::LeftBrace, "FLAKEEDIT-E2108", "Expected '{' to open the parameter set.");

        while (!check(TokenKind::RightBrace) && !isAtEnd())
        {
            if (match(TokenKind::Ellipsis))
            {
                head.ellipsis = true;
                head.ellipsisSpan = previous().span;
                match(TokenKind::Comma);
                continue;
            }

            if (!check(TokenKind::Identifier))
            {
                reportError("FLAKEEDIT-E2108", "Expected a parameter name or '...' in the parameter set.", peek().span);
                advance();
                continue;
            }

            const Token& name = advance();
            Formal formal;
            formal.identifier = name.text;
            formal.identifierSpan = name.span;
            formal.span = name.span;

            if (match(TokenKind::Question))
            {
                formal.defaultValue = parseExpression();
                formal.span.end = formal.defaultValue->span.end;
            }

            head.arguments.emplace_back(std::move(formal));

            if (!match(TokenKind::Comma))
            {
                break;
            }
        }

        const Token& close = consume(TokenKind::RightBrace, "FLAKEEDIT-E2109", "Expected '}' to close the parameter set.");
        head.span = joinSpans(open.span, close.span);
        return head;
    }

    bool Parser::isFormalsAhead() const
    {
        const TokenKind first = lookAhead(1).kind;
        if (first == TokenKind::RightBrace)
        {
            const TokenKind after = lookAhead(2).kind;
            return after == TokenKind::Colon || after == TokenKind::At;
        }

        if (first == TokenKind::Ellipsis)
        {
            return true;
        }

        if (first == TokenKind::Identifier)
        {
            const TokenKind second = lookAhead(2).kind;
            if (second == TokenKind::Comma || second == TokenKind::Question)
            {
                return true;
            }
            if (second == TokenKind::RightBrace)
            {
                const TokenKind after = lookAhead(3).kind;
                return after == TokenKind::Colon || after == TokenKind::At;
            }
        }

        return false;
    }

    std::unique_ptr<Expression> Parser::parseLet()
    {
        const Token& keyword = advance();
        auto let = makeExpression(ExpressionKind::Let, keyword.span);

        parseBindings(let->bindings, TokenKind::KeywordIn);
        consume(TokenKind::KeywordIn, "FLAKEEDIT-E2112", "Expected 'in' after let bindings.");

        std::unique_ptr<Expression> body = parseExpression();
        let->span.end = body->span.end;
        let->children.emplace_back(std::move(body));
        return let;
    }

    std::unique_ptr<Expression> Parser::parseWith()
    {
        const Token& keyword = advance();
        auto with = makeExpression(ExpressionKind::With, keyword.span);

        with->children.emplace_back(parseExpression());
        consume(TokenKind::Semicolon, "FLAKEEDIT-E2113", "Expected ';' after 'with' expression.");
        with->children.emplace_back(parseExpression());
        with->span.end = with->children.back()->span.end;
        return with;
    }

    std::unique_ptr<Expression> Parser::parseAssert()
    {
        const Token& keyword = advance();
        auto assertion = makeExpression(ExpressionKind::Assert, keyword.span);

        assertion->children.emplace_back(parseExpression());
        consume(TokenKind::Semicolon, "FLAKEEDIT-E2113", "Expected ';' after 'assert' condition.");
        assertion->children.emplace_back(parseExpression());
        assertion->span.end = assertion->children.back()->span.end;
        return assertion;
    }

    std::unique_ptr<Expression> Parser::parseIf()
    {
        const Token& keyword = advance();
        auto conditional = makeExpression(ExpressionKind::IfElse, keyword.span);

        conditional->children.emplace_back(parseExpression());
        consume(TokenKind::KeywordThen, "FLAKEEDIT-E2114", "Expected 'then' after 'if' condition.");
        conditional->children.emplace_back(parseExpression());
        consume(TokenKind::KeywordElse, "FLAKEEDIT-E2115", "Expected 'else' branch.");
        conditional->children.emplace_back(parseExpression());
        conditional->span.end = conditional->children.back()->span.end;
        return conditional;
    }

    std::unique_ptr<Expression> Parser::parseBinary(int minimumPrecedence)
    {
        std::unique_ptr<Expression> left = parseUnary();

        while (!isAtEnd())
        {
            const TokenKind kind = peek().kind;
            const OperatorInfo info = binaryOperatorInfo(kind);
            if (info.precedence == 0 || info.precedence < minimumPrecedence)
            {
                break;
            }

            const Token& op = advance();

            if (kind == TokenKind::Question)
            {
                auto hasAttribute = makeExpression(ExpressionKind::HasAttribute, left->span);
                hasAttribute->attributePath = parseAttributePath();
                if (!hasAttribute->attributePath.empty())
                {
                    hasAttribute->span.end = hasAttribute->attributePath.back().span.end;
                }
                hasAttribute->children.emplace_back(std::move(left));
                left = std::move(hasAttribute);
                continue;
            }

            const int nextMinimum = info.rightAssociative ? info.precedence : info.precedence + 1;
            std::unique_ptr<Expression> right = parseBinary(nextMinimum);

            auto binary = makeExpression(ExpressionKind::BinaryOperation, joinSpans(left->span, right->span));
            binary->text = op.text;
            binary->children.emplace_back(std::move(left));
            binary->children.emplace_back(std::move(right));
            left = std::move(binary);
        }

        return left;
    }

    std::unique_ptr<Expression> Parser::parseUnary()
    {
        if (check(TokenKind::Bang) || check(TokenKind::Minus))
        {
            const Token& op = advance();
            const int precedence = (op.kind == TokenKind::Bang) ? kNotPrecedence : kNegatePrecedence;
            std::unique_ptr<Expression> operand = parseBinary(precedence);

            auto unary = makeExpression(ExpressionKind::UnaryOperation, joinSpans(op.span, operand->span));
            unary->text = op.text;
            unary->children.emplace_back(std::move(operand));
            return unary;
        }

        return parseApplication();
    }

    std::unique_ptr<Expression> Parser::parseApplication()
    {
        std::unique_ptr<Expression> function = parseSelect();

        while (!isAtEnd() && startsPrimary(peek().kind))
        {
            std::unique_ptr<Expression> argument = parseSelect();
            auto application = makeExpression(ExpressionKind::Apply, joinSpans(function->span, argument->span));
            application->children.emplace_back(std::move(function));
            application->children.emplace_back(std::move(argument));
            function = std::move(application);
        }

        return function;
    }

    std::unique_ptr<Expression> Parser::parseSelect()
    {
        std::unique_ptr<Expression> target = parsePrimary();

        if (!check(TokenKind::Dot))
        {
            return target;
        }

        advance(); // consume '.'
        auto select = makeExpression(ExpressionKind::Select, target->span);
        select->attributePath = parseAttributePath();
        if (!select->attributePath.empty())
        {
            select->span.end = select->attributePath.back().span.end;
        }
        select->children.emplace_back(std::move(target));

        if (match(TokenKind::KeywordOr))
        {
            std::unique_ptr<Expression> fallback = parseSelect();
            select->span.end = fallback->span.end;
            select->children.emplace_back(std::move(fallback));
        }

        return select;
    }

    bool Parser::startsPrimary(TokenKind kind) const
    {
        switch (kind)
        {
        case TokenKind::Identifier:
        case TokenKind::IntegerLiteral:
        case TokenKind::FloatLiteral:
        case TokenKind::StringLiteral:
        case TokenKind::IndentedStringLiteral:
        case TokenKind::UriLiteral:
        case TokenKind::PathLiteral:
        case TokenKind::LeftParen:
        case TokenKind::LeftBracket:
        case TokenKind::LeftBrace:
        case TokenKind::KeywordRec:
            return true;
        default:
            return false;
        }
    }

    std::unique_ptr<Expression> Parser::parsePrimary()
    {
        const Token& token = peek();

        switch (token.kind)
        {
        case TokenKind::Identifier:
        {
            advance();
            auto identifier = makeExpression(ExpressionKind::Identifier, token.span);
            identifier->text = token.text;
            return identifier;
        }
        case TokenKind::IntegerLiteral:
        case TokenKind::FloatLiteral:
        case TokenKind::UriLiteral:
        case TokenKind::PathLiteral:
        {
            advance();
            ExpressionKind kind = ExpressionKind::Integer;
            if (token.kind == TokenKind::FloatLiteral) kind = ExpressionKind::Float;
            if (token.kind == TokenKind::UriLiteral) kind = ExpressionKind::Uri;
            if (token.kind == TokenKind::PathLiteral) kind = ExpressionKind::Path;
            auto literal = makeExpression(kind, token.span);
            literal->text = token.text;
            return literal;
        }
        case TokenKind::StringLiteral:
            return parseStringLiteral(ExpressionKind::String);
        case TokenKind::IndentedStringLiteral:
            return parseStringLiteral(ExpressionKind::IndentedString);
        case TokenKind::LeftParen:
        {
            const Token& open = advance();
            std::unique_ptr<Expression> inner = parseExpression();
            const Token& close = consume(TokenKind::RightParen, "FLAKEEDIT-E2116", "Expected ')' to close parenthesized expression.");
            auto parenthesized = makeExpression(ExpressionKind::Parenthesized, joinSpans(open.span, close.span));
            parenthesized->children.emplace_back(std::move(inner));
            return parenthesized;
        }
        case TokenKind::LeftBracket:
            return parseList();
        case TokenKind::LeftBrace:
            return parseAttributeSet(false);
        case TokenKind::KeywordRec:
            return parseAttributeSet(true);
        default:
            break;
        }

        reportError("FLAKEEDIT-E2104",
            "Unexpected token '" + std::string{toString(token.kind)} + "' where an expression was expected.",
            token.span);
        auto invalid = makeExpression(ExpressionKind::Invalid, token.span);
        if (!isAtEnd())
        {
            advance();
        }
        return invalid;
    }

    std::unique_ptr<Expression> Parser::parseStringLiteral(ExpressionKind kind)
    {
        const Token& token = advance();
        auto literal = makeExpression(kind, token.span);
        literal->parts = token.segments;
        return literal;
    }

    std::unique_ptr<Expression> Parser::parseList()
    {
        const Token& open = advance();
        auto list = makeExpression(ExpressionKind::List, open.span);

        while (!check(TokenKind::RightBracket) && !isAtEnd())
        {
            const std::size_t before = m_current;
            list->children.emplace_back(parseSelect());
            if (m_current == before)
            {
                advance();
            }
        }

        const Token& close = consume(TokenKind::RightBracket, "FLAKEEDIT-E2117", "Expected ']' to close list.");
        list->span.end = close.span.end;
        return list;
    }

    std::unique_ptr<Expression> Parser::parseAttributeSet(bool isRecursive)
    {
        const Token& first = peek();
        if (isRecursive)
        {
            advance(); // consume 'rec'
        }

        consume(TokenKind::LeftBrace, "FLAKEEDIT-E2107", "Expected '{' to open attribute set.");
        auto map = makeExpression(ExpressionKind::Map, first.span);
        map->isRecursive = isRecursive;

        parseBindings(map->bindings, TokenKind::RightBrace);

        const Token& close = consume(TokenKind::RightBrace, "FLAKEEDIT-E2107", "Expected '}' to close attribute set.");
        map->span.end = close.span.end;
        return map;
    }

    void Parser::parseBindings(std::vector<Binding>& bindings, TokenKind terminator)
    {
        while (!check(terminator) && !isAtEnd())
        {
            const std::size_t before = m_current;

            if (check(TokenKind::KeywordInherit))
            {
                bindings.emplace_back(parseInherit());
            }
            else
            {
                bindings.emplace_back(parseBinding());
            }

            if (m_current == before)
            {
                advance();
            }
        }
    }

    Binding Parser::parseBinding()
    {
        Binding binding;
        binding.kind = BindingKind::KeyValue;
        binding.span.begin = peek().span.begin;
        binding.from = parseAttributePath();

        consume(TokenKind::Equals, "FLAKEEDIT-E2105", "Expected '=' after attribute name.");
        binding.to = parseExpression();

        const Token& terminator = consume(TokenKind::Semicolon, "FLAKEEDIT-E2106", "Expected ';' after attribute value.");
        binding.span.end = terminator.span.end;
        return binding;
    }

    Binding Parser::parseInherit()
    {
        Binding binding;
        binding.kind = BindingKind::Inherit;

        const Token& keyword = advance();
        binding.span.begin = keyword.span.begin;

        if (match(TokenKind::LeftParen))
        {
            binding.inheritSource = parseExpression();
            consume(TokenKind::RightParen, "FLAKEEDIT-E2116", "Expected ')' after inherit source.");
        }

        while (!check(TokenKind::Semicolon) && !isAtEnd())
        {
            std::optional<AttributePart> part = parseAttributePart();
            if (!part.has_value())
            {
                break;
            }
            binding.from.emplace_back(std::move(*part));
        }

        const Token& terminator = consume(TokenKind::Semicolon, "FLAKEEDIT-E2106", "Expected ';' after inherited names.");
        binding.span.end = terminator.span.end;
        return binding;
    }

    std::vector<AttributePart> Parser::parseAttributePath()
    {
        std::vector<AttributePart> path;

        do
        {
            std::optional<AttributePart> part = parseAttributePart();
            if (!part.has_value())
            {
                break;
            }
            path.emplace_back(std::move(*part));
        } while (match(TokenKind::Dot));

        return path;
    }

    std::optional<AttributePart> Parser::parseAttributePart()
    {
        const Token& token = peek();
        AttributePart part;
        part.span = token.span;

        switch (token.kind)
        {
        case TokenKind::Identifier:
        case TokenKind::KeywordOr:
            advance();
            part.content = token.text;
            return part;
        case TokenKind::StringLiteral:
            advance();
            if (token.segments.size() == 1 && !token.segments.front().isInterpolation)
            {
                part.content = token.segments.front().content;
            }
            else
            {
                part.isInterpolation = true;
                part.content = token.text;
            }
            return part;
        case TokenKind::DollarBrace:
        {
            advance();
            parseExpression();
            const Token& close = consume(TokenKind::RightBrace, "FLAKEEDIT-E2118", "Expected '}' to close interpolated attribute name.");
            part.isInterpolation = true;
            part.span.end = close.span.end;
            return part;
        }
        default:
            break;
        }

        reportError("FLAKEEDIT-E2119",
            "Expected attribute name, found '" + std::string{toString(token.kind)} + "'.",
            token.span);
        return std::nullopt;
    }

    ParsedManifest parseManifest(std::string_view source, std::string_view fileName)
    {
        ParsedManifest parsed;

        Lexer lexer{source, fileName};
        lexer.lex();
        if (!lexer.diagnostics().empty())
        {
            parsed.diagnostics = lexer.diagnostics();
            return parsed;
        }

        Parser parser{lexer.tokens(), fileName};
        parsed.root = parser.parse();
        parsed.diagnostics = parser.diagnostics();
        return parsed;
    }
} // namespace flakeedit::frontend
