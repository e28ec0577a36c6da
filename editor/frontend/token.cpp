#include "token.hpp"

#include <tuple>

namespace flakeedit::frontend
{
    bool operator==(const SourceLocation& lhs, const SourceLocation& rhs) noexcept
    {
        return lhs.line == rhs.line && lhs.column == rhs.column;
    }

    bool operator!=(const SourceLocation& lhs, const SourceLocation& rhs) noexcept
    {
        return !(lhs == rhs);
    }

    bool operator<(const SourceLocation& lhs, const SourceLocation& rhs) noexcept
    {
        return std::tie(lhs.line, lhs.column) < std::tie(rhs.line, rhs.column);
    }

    std::string_view toString(TokenKind kind)
    {
        switch (kind)
        {
        case TokenKind::EndOfFile: return "endOfFile";
        case TokenKind::Identifier: return "identifier";
        case TokenKind::IntegerLiteral: return "integerLiteral";
        case TokenKind::FloatLiteral: return "floatLiteral";
        case TokenKind::StringLiteral: return "stringLiteral";
        case TokenKind::IndentedStringLiteral: return "indentedStringLiteral";
        case TokenKind::UriLiteral: return "uriLiteral";
        case TokenKind::PathLiteral: return "pathLiteral";

        case TokenKind::KeywordLet: return "let";
        case TokenKind::KeywordIn: return "in";
        case TokenKind::KeywordRec: return "rec";
        case TokenKind::KeywordInherit: return "inherit";
        case TokenKind::KeywordIf: return "if";
        case TokenKind::KeywordThen: return "then";
        case TokenKind::KeywordElse: return "else";
        case TokenKind::KeywordWith: return "with";
        case TokenKind::KeywordAssert: return "assert";
        case TokenKind::KeywordOr: return "or";

        case TokenKind::LeftBrace: return "leftBrace";
        case TokenKind::RightBrace: return "rightBrace";
        case TokenKind::LeftParen: return "leftParen";
        case TokenKind::RightParen: return "rightParen";
        case TokenKind::LeftBracket: return "leftBracket";
        case TokenKind::RightBracket: return "rightBracket";
        case TokenKind::DollarBrace: return "dollarBrace";
        case TokenKind::Comma: return "comma";
        case TokenKind::Colon: return "colon";
        case TokenKind::Semicolon: return "semicolon";
        case TokenKind::Dot: return "dot";
        case TokenKind::Ellipsis: return "ellipsis";
        case TokenKind::At: return "at";
        case TokenKind::Question: return "question";
        case TokenKind::Equals: return "equals";

        case TokenKind::Plus: return "plus";
        case TokenKind::Minus: return "minus";
        case TokenKind::Asterisk: return "asterisk";
        case TokenKind::Slash: return "slash";
        case TokenKind::PlusPlus: return "plusPlus";
        case TokenKind::SlashSlash: return "slashSlash";
        case TokenKind::Bang: return "bang";
        case TokenKind::LessThan: return "lessThan";
        case TokenKind::GreaterThan: return "greaterThan";
        case TokenKind::LessEquals: return "lessEquals";
        case TokenKind::GreaterEquals: return "greaterEquals";
        case TokenKind::EqualsEquals: return "equalsEquals";
        case TokenKind::BangEquals: return "bangEquals";
        case TokenKind::AmpersandAmpersand: return "ampersandAmpersand";
        case TokenKind::PipePipe: return "pipePipe";
        case TokenKind::Arrow: return "arrow";
        case TokenKind::PipeRight: return "pipeRight";
        case TokenKind::PipeLeft: return "pipeLeft";
        }

        return "unknown";
    }
} // namespace flakeedit::frontend
