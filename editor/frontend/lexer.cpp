#include "lexer.hpp"

#include <cctype>

namespace
{
    using namespace flakeedit::frontend;

    bool isIdentifierStart(char ch)
    {
        return std::isalpha(static_cast<unsigned char>(ch)) || ch == '_';
    }

    bool isIdentifierPart(char ch)
    {
        return std::isalnum(static_cast<unsigned char>(ch)) || ch == '_' || ch == '\'' || ch == '-';
    }

    bool isPathChar(char ch)
    {
        return std::isalnum(static_cast<unsigned char>(ch)) || ch == '.' || ch == '_' || ch == '-' || ch == '+';
    }

    bool isSchemeChar(char ch)
    {
        return std::isalnum(static_cast<unsigned char>(ch)) || ch == '+' || ch == '-' || ch == '.';
    }

    bool isUriChar(char ch)
    {
        if (std::isalnum(static_cast<unsigned char>(ch)))
        {
            return true;
        }

        switch (ch)
        {
        case '%':
        case '/':
        case '?':
        case ':':
        case '@':
        case '&':
        case '=':
        case '+':
        case '$':
        case ',':
        case '-':
        case '_':
        case '.':
        case '!':
        case '~':
        case '*':
        case '\'':
            return true;
        default:
            return false;
        }
    }

    bool isContinuationByte(char ch)
    {
        return (static_cast<unsigned char>(ch) & 0xC0) == 0x80;
    }

    TokenKind keywordLookup(std::string_view text)
    {
        if (text == "let") return TokenKind::KeywordLet;
        if (text == "in") return TokenKind::KeywordIn;
        if (text == "rec") return TokenKind::KeywordRec;
        if (text == "inherit") return TokenKind::KeywordInherit;
        if (text == "if") return TokenKind::KeywordIf;
        if (text == "then") return TokenKind::KeywordThen;
        if (text == "else") return TokenKind::KeywordElse;
        if (text == "with") return TokenKind::KeywordWith;
        if (text == "assert") return TokenKind::KeywordAssert;
        if (text == "or") return TokenKind::KeywordOr;
        return TokenKind::Identifier;
    }

    char unescape(char ch)
    {
        switch (ch)
        {
        case 'n': return '\n';
        case 'r': return '\r';
        case 't': return '\t';
        default: return ch;
        }
    }
} // namespace

namespace flakeedit::frontend
{
    Lexer::Lexer(std::string_view source, std::string_view fileName)
        : m_source(source)
        , m_fileName(fileName)
        , m_location{1, 1}
    {
    }

    const std::vector<Token>& Lexer::tokens() const noexcept
    {
        return m_tokens;
    }

    const std::vector<Diagnostic>& Lexer::diagnostics() const noexcept
    {
        return m_diagnostics;
    }

    void Lexer::lex()
    {
        m_tokens.clear();
        m_diagnostics.clear();
        m_current = 0;
        m_location = {1, 1};

        while (!isAtEnd())
        {
            const char ch = peek();
            if (std::isspace(static_cast<unsigned char>(ch)))
            {
                advance();
                continue;
            }

            if (ch == '#')
            {
                skipLineComment();
                continue;
            }

            if (ch == '/' && peekNext() == '*')
            {
                skipBlockComment();
                continue;
            }

            if (ch == '<' && tryLexSearchPath())
            {
                continue;
            }

            if ((isPathChar(ch) || ch == '/' || ch == '~') && tryLexPath())
            {
                continue;
            }

            if (std::isalpha(static_cast<unsigned char>(ch)) && tryLexUri())
            {
                continue;
            }

            if (isIdentifierStart(ch))
            {
                lexIdentifierOrKeyword();
                continue;
            }

            if (std::isdigit(static_cast<unsigned char>(ch)))
            {
                lexNumber();
                continue;
            }

            const SourceLocation startLocation = m_location;

            switch (ch)
            {
            case '"':
                lexString();
                break;
            case '\'':
                if (peekNext() == '\'')
                {
                    lexIndentedString();
                }
                else
                {
                    advance();
                    reportError("FLAKEEDIT-E2001", "Unexpected character '''.", startLocation);
                }
                break;
            case '{':
                emitSingle(TokenKind::LeftBrace);
                break;
            case '}':
                emitSingle(TokenKind::RightBrace);
                break;
            case '(':
                emitSingle(TokenKind::LeftParen);
                break;
            case ')':
                emitSingle(TokenKind::RightParen);
                break;
            case '[':
                emitSingle(TokenKind::LeftBracket);
                break;
            case ']':
                emitSingle(TokenKind::RightBracket);
                break;
            case ',':
                emitSingle(TokenKind::Comma);
                break;
            case ':':
                emitSingle(TokenKind::Colon);
                break;
            case ';':
                emitSingle(TokenKind::Semicolon);
                break;
            case '@':
                emitSingle(TokenKind::At);
                break;
            case '?':
                emitSingle(TokenKind::Question);
                break;
            case '*':
                emitSingle(TokenKind::Asterisk);
                break;
            case '.':
                if (peekNext() == '.' && peekAt(2) == '.')
                {
                    advance();
                    advance();
                    advance();
                    pushToken(TokenKind::Ellipsis, startLocation, m_location, "...");
                }
                else
                {
                    emitSingle(TokenKind::Dot);
                }
                break;
            case '$':
                if (peekNext() == '{')
                {
                    emitDouble(TokenKind::DollarBrace);
                }
                else
                {
                    advance();
                    reportError("FLAKEEDIT-E2001", "Unexpected character '$'.", startLocation);
                }
                break;
            case '+':
                if (peekNext() == '+')
                {
                    emitDouble(TokenKind::PlusPlus);
                }
                else
                {
                    emitSingle(TokenKind::Plus);
                }
                break;
            case '-':
                if (peekNext() == '>')
                {
                    emitDouble(TokenKind::Arrow);
                }
                else
                {
                    emitSingle(TokenKind::Minus);
                }
                break;
            case '/':
                if (peekNext() == '/')
                {
                    emitDouble(TokenKind::SlashSlash);
                }
                else
                {
                    emitSingle(TokenKind::Slash);
                }
                break;
            case '=':
                if (peekNext() == '=')
                {
                    emitDouble(TokenKind::EqualsEquals);
                }
                else
                {
                    emitSingle(TokenKind::Equals);
                }
                break;
            case '!':
                if (peekNext() == '=')
                {
                    emitDouble(TokenKind::BangEquals);
                }
                else
                {
                    emitSingle(TokenKind::Bang);
                }
                break;
            case '<':
                if (peekNext() == '=')
                {
                    emitDouble(TokenKind::LessEquals);
                }
                else if (peekNext() == '|')
                {
                    emitDouble(TokenKind::PipeLeft);
                }
                else
                {
                    emitSingle(TokenKind::LessThan);
                }
                break;
            case '>':
                if (peekNext() == '=')
                {
                    emitDouble(TokenKind::GreaterEquals);
                }
                else
                {
                    emitSingle(TokenKind::GreaterThan);
                }
                break;
            case '&':
                if (peekNext() == '&')
                {
                    emitDouble(TokenKind::AmpersandAmpersand);
                }
                else
                {
                    advance();
                    reportError("FLAKEEDIT-E2001", "Unexpected character '&'.", startLocation);
                }
                break;
            case '|':
                if (peekNext() == '|')
                {
                    emitDouble(TokenKind::PipePipe);
                }
                else if (peekNext() == '>')
                {
                    emitDouble(TokenKind::PipeRight);
                }
                else
                {
                    advance();
                    reportError("FLAKEEDIT-E2001", "Unexpected character '|'.", startLocation);
                }
                break;
            default:
            {
                const char unexpected = advance();
                while (!isAtEnd() && isContinuationByte(peek()))
                {
                    advance();
                }
                reportError("FLAKEEDIT-E2001", std::string{"Unexpected character '"} + unexpected + "'.", startLocation);
                break;
            }
            }
        }

        pushToken(TokenKind::EndOfFile, m_location, m_location, "");
    }

    void Lexer::pushToken(TokenKind kind, SourceLocation start, SourceLocation end, std::string_view text)
    {
        Token token;
        token.kind = kind;
        token.span = {start, end};
        token.text = std::string{text};
        m_tokens.emplace_back(std::move(token));
    }

    // `<nixpkgs>` or `<nixpkgs/lib>`.
    bool Lexer::tryLexSearchPath()
    {
        std::size_t length = 1;
        bool needsSegment = true;
        while (m_current + length < m_source.size())
        {
            const char ch = m_source[m_current + length];
            if (isPathChar(ch))
            {
                needsSegment = false;
                ++length;
                continue;
            }
            if (ch == '/' && !needsSegment)
            {
                needsSegment = true;
                ++length;
                continue;
            }
            break;
        }

        if (needsSegment || m_current + length >= m_source.size() || m_source[m_current + length] != '>')
        {
            return false;
        }
        ++length;

        const std::size_t startIndex = m_current;
        const SourceLocation startLocation = m_location;
        for (std::size_t index = 0; index < length; ++index)
        {
            advance();
        }
        pushToken(TokenKind::PathLiteral, startLocation, m_location, m_source.substr(startIndex, length));
        return true;
    }

    // `./a`, `../a/b`, `/a`, `~/a`, `a/b`: a run of path characters followed by at
    // least one `/segment`, with an optional trailing slash.
    bool Lexer::tryLexPath()
    {
        std::size_t length = 0;
        if (peek() == '~')
        {
            length = 1;
        }
        else
        {
            while (m_current + length < m_source.size() && isPathChar(m_source[m_current + length]))
            {
                ++length;
            }
        }

        std::size_t segments = 0;
        while (m_current + length + 1 < m_source.size()
               && m_source[m_current + length] == '/'
               && isPathChar(m_source[m_current + length + 1]))
        {
            ++length;
            while (m_current + length < m_source.size() && isPathChar(m_source[m_current + length]))
            {
                ++length;
            }
            ++segments;
        }

        if (segments == 0)
        {
            return false;
        }

        if (m_current + length < m_source.size() && m_source[m_current + length] == '/')
        {
            ++length;
        }

        const std::size_t startIndex = m_current;
        const SourceLocation startLocation = m_location;
        for (std::size_t index = 0; index < length; ++index)
        {
            advance();
        }
        pushToken(TokenKind::PathLiteral, startLocation, m_location, m_source.substr(startIndex, length));
        return true;
    }

    // `scheme:rest`, where the scheme starts with a letter and `rest` is non-empty.
    bool Lexer::tryLexUri()
    {
        std::size_t length = 1;
        while (m_current + length < m_source.size() && isSchemeChar(m_source[m_current + length]))
        {
            ++length;
        }

        if (m_current + length + 1 >= m_source.size()
            || m_source[m_current + length] != ':'
            || !isUriChar(m_source[m_current + length + 1]))
        {
            return false;
        }

        ++length;
        while (m_current + length < m_source.size() && isUriChar(m_source[m_current + length]))
        {
            ++length;
        }

        const std::size_t startIndex = m_current;
        const SourceLocation startLocation = m_location;
        for (std::size_t index = 0; index < length; ++index)
        {
            advance();
        }
        pushToken(TokenKind::UriLiteral, startLocation, m_location, m_source.substr(startIndex, length));
        return true;
    }

    void Lexer::lexIdentifierOrKeyword()
    {
        const std::size_t startIndex = m_current;
        const SourceLocation startLocation = m_location;

        while (!isAtEnd() && isIdentifierPart(peek()))
        {
            advance();
        }

        const std::string_view text = m_source.substr(startIndex, m_current - startIndex);
        pushToken(keywordLookup(text), startLocation, m_location, text);
    }

    void Lexer::lexNumber()
    {
        const std::size_t startIndex = m_current;
        const SourceLocation startLocation = m_location;
        TokenKind kind = TokenKind::IntegerLiteral;

        while (std::isdigit(static_cast<unsigned char>(peek())))
        {
            advance();
        }

        if (peek() == '.' && std::isdigit(static_cast<unsigned char>(peekNext())))
        {
            kind = TokenKind::FloatLiteral;
            advance();
            while (std::isdigit(static_cast<unsigned char>(peek())))
            {
                advance();
            }
        }

        if ((peek() == 'e' || peek() == 'E')
            && (std::isdigit(static_cast<unsigned char>(peekNext()))
                || ((peekNext() == '+' || peekNext() == '-') && std::isdigit(static_cast<unsigned char>(peekAt(2))))))
        {
            kind = TokenKind::FloatLiteral;
            advance();
            if (peek() == '+' || peek() == '-')
            {
                advance();
            }
            while (std::isdigit(static_cast<unsigned char>(peek())))
            {
                advance();
            }
        }

        pushToken(kind, startLocation, m_location, m_source.substr(startIndex, m_current - startIndex));
    }

    void Lexer::lexString()
    {
        const std::size_t startIndex = m_current;
        const SourceLocation startLocation = m_location;
        std::vector<StringSegment> segments;

        advance(); // consume opening quote

        StringSegment raw;
        raw.span.begin = m_location;
        bool rawOpen = false;
        bool closed = false;

        auto flushRaw = [&]() {
            if (rawOpen)
            {
                raw.span.end = m_location;
                segments.emplace_back(std::move(raw));
                raw = StringSegment{};
                rawOpen = false;
            }
        };

        while (!isAtEnd())
        {
            const char ch = peek();
            if (ch == '"')
            {
                flushRaw();
                advance();
                closed = true;
                break;
            }

            if (ch == '$' && peekNext() == '{')
            {
                flushRaw();
                if (!lexInterpolation(segments))
                {
                    return;
                }
                continue;
            }

            if (!rawOpen)
            {
                raw.span.begin = m_location;
                rawOpen = true;
            }

            if (ch == '\\' && m_current + 1 < m_source.size())
            {
                advance();
                raw.content.push_back(unescape(advance()));
                continue;
            }

            if (ch == '$' && peekNext() == '$')
            {
                raw.content += "$$";
                advance();
                advance();
                continue;
            }

            raw.content.push_back(advance());
        }

        if (!closed)
        {
            reportError("FLAKEEDIT-E2002", "Unterminated string literal.", startLocation);
            return;
        }

        if (segments.empty())
        {
            StringSegment empty;
            empty.span.begin = {startLocation.line, startLocation.column + 1};
            empty.span.end = empty.span.begin;
            segments.emplace_back(std::move(empty));
        }

        pushToken(TokenKind::StringLiteral, startLocation, m_location, m_source.substr(startIndex, m_current - startIndex));
        m_tokens.back().segments = std::move(segments);
    }

    void Lexer::lexIndentedString()
    {
        const std::size_t startIndex = m_current;
        const SourceLocation startLocation = m_location;
        std::vector<StringSegment> segments;

        advance();
        advance(); // consume opening ''

        StringSegment raw;
        bool rawOpen = false;
        bool closed = false;

        auto flushRaw = [&]() {
            if (rawOpen)
            {
                raw.span.end = m_location;
                segments.emplace_back(std::move(raw));
                raw = StringSegment{};
                rawOpen = false;
            }
        };

        auto openRaw = [&]() {
            if (!rawOpen)
            {
                raw.span.begin = m_location;
                rawOpen = true;
            }
        };

        while (!isAtEnd())
        {
            const char ch = peek();
            if (ch == '\'' && peekNext() == '\'')
            {
                const char escaped = peekAt(2);
                if (escaped == '\'')
                {
                    openRaw();
                    advance();
                    advance();
                    advance();
                    raw.content += "''";
                    continue;
                }
                if (escaped == '$')
                {
                    openRaw();
                    advance();
                    advance();
                    advance();
                    raw.content.push_back('$');
                    continue;
                }
                if (escaped == '\\' && m_current + 3 < m_source.size())
                {
                    openRaw();
                    advance();
                    advance();
                    advance();
                    raw.content.push_back(unescape(advance()));
                    continue;
                }

                flushRaw();
                advance();
                advance();
                closed = true;
                break;
            }

            if (ch == '$' && peekNext() == '{')
            {
                flushRaw();
                if (!lexInterpolation(segments))
                {
                    return;
                }
                continue;
            }

            openRaw();
            raw.content.push_back(advance());
        }

        if (!closed)
        {
            reportError("FLAKEEDIT-E2002", "Unterminated indented string literal.", startLocation);
            return;
        }

        if (segments.empty())
        {
            StringSegment empty;
            empty.span.begin = {startLocation.line, startLocation.column + 2};
            empty.span.end = empty.span.begin;
            segments.emplace_back(std::move(empty));
        }

        pushToken(TokenKind::IndentedStringLiteral, startLocation, m_location, m_source.substr(startIndex, m_current - startIndex));
        m_tokens.back().segments = std::move(segments);
    }

    // Consumes `${ ... }` inside a string literal. The interpolated expression is kept as
    // opaque text; nested strings and braces are balanced but not tokenized.
    bool Lexer::lexInterpolation(std::vector<StringSegment>& segments)
    {
        const SourceLocation startLocation = m_location;
        const std::size_t startIndex = m_current;

        advance();
        advance(); // consume ${

        int depth = 1;
        while (!isAtEnd() && depth > 0)
        {
            const char ch = advance();
            if (ch == '{')
            {
                ++depth;
            }
            else if (ch == '}')
            {
                --depth;
            }
            else if (ch == '"')
            {
                while (!isAtEnd() && peek() != '"')
                {
                    if (advance() == '\\' && !isAtEnd())
                    {
                        advance();
                    }
                }
                if (!isAtEnd())
                {
                    advance();
                }
            }
        }

        if (depth > 0)
        {
            reportError("FLAKEEDIT-E2004", "Unterminated string interpolation.", startLocation);
            return false;
        }

        StringSegment interpolation;
        interpolation.isInterpolation = true;
        interpolation.content = std::string{m_source.substr(startIndex + 2, m_current - startIndex - 3)};
        interpolation.span = {startLocation, m_location};
        segments.emplace_back(std::move(interpolation));
        return true;
    }

    void Lexer::skipLineComment()
    {
        while (!isAtEnd() && peek() != '\n')
        {
            advance();
        }
    }

    void Lexer::skipBlockComment()
    {
        const SourceLocation startLocation = m_location;
        advance();
        advance(); // consume /*

        while (!isAtEnd())
        {
            if (peek() == '*' && peekNext() == '/')
            {
                advance();
                advance();
                return;
            }
            advance();
        }

        reportError("FLAKEEDIT-E2003", "Unterminated block comment.", startLocation);
    }

    void Lexer::emitSingle(TokenKind kind)
    {
        const SourceLocation startLocation = m_location;
        advance();
        pushToken(kind, startLocation, m_location, m_source.substr(m_current - 1, 1));
    }

    void Lexer::emitDouble(TokenKind kind)
    {
        const SourceLocation startLocation = m_location;
        advance();
        advance();
        pushToken(kind, startLocation, m_location, m_source.substr(m_current - 2, 2));
    }

    void Lexer::reportError(std::string_view code, std::string message, SourceLocation start)
    {
        Diagnostic diag;
        diag.code = std::string{code};
        diag.message = std::move(message);
        diag.span = {start, m_location};
        m_diagnostics.emplace_back(std::move(diag));
    }

    char Lexer::peek() const
    {
        if (isAtEnd()) return '\0';
        return m_source[m_current];
    }

    char Lexer::peekNext() const
    {
        return peekAt(1);
    }

    char Lexer::peekAt(std::size_t offset) const
    {
        if (m_current + offset >= m_source.size()) return '\0';
        return m_source[m_current + offset];
    }

    char Lexer::advance()
    {
        const char ch = m_source[m_current++];
        if (ch == '\n')
        {
            advanceLine();
        }
        else if (!isContinuationByte(ch))
        {
            ++m_location.column;
        }
        return ch;
    }

    bool Lexer::isAtEnd() const
    {
        return m_current >= m_source.size();
    }

    void Lexer::advanceLine()
    {
        ++m_location.line;
        m_location.column = 1;
    }
} // namespace flakeedit::frontend
