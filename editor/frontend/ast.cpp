#include "ast.hpp"

namespace flakeedit::frontend
{
    std::string_view toString(ExpressionKind kind)
    {
        switch (kind)
        {
        case ExpressionKind::Invalid: return "Invalid";
        case ExpressionKind::Map: return "Map";
        case ExpressionKind::String: return "String";
        case ExpressionKind::IndentedString: return "IndentedString";
        case ExpressionKind::Uri: return "Uri";
        case ExpressionKind::Function: return "Function";
        case ExpressionKind::Identifier: return "Identifier";
        case ExpressionKind::Integer: return "Integer";
        case ExpressionKind::Float: return "Float";
        case ExpressionKind::Path: return "Path";
        case ExpressionKind::List: return "List";
        case ExpressionKind::Let: return "LetIn";
        case ExpressionKind::With: return "With";
        case ExpressionKind::Assert: return "Assert";
        case ExpressionKind::IfElse: return "IfThenElse";
        case ExpressionKind::Apply: return "FunctionApplication";
        case ExpressionKind::Select: return "PropertyAccess";
        case ExpressionKind::HasAttribute: return "HasProperty";
        case ExpressionKind::BinaryOperation: return "BinaryOperation";
        case ExpressionKind::UnaryOperation: return "UnaryOperation";
        case ExpressionKind::Parenthesized: return "Parenthesized";
        }

        return "Unknown";
    }
} // namespace flakeedit::frontend
