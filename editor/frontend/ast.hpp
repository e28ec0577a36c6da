#pragma once

#include "token.hpp"

#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace flakeedit::frontend
{
    enum class ExpressionKind
    {
        Invalid,
        Map,
        String,
        IndentedString,
        Uri,
        Function,
        Identifier,
        Integer,
        Float,
        Path,
        List,
        Let,
        With,
        Assert,
        IfElse,
        Apply,
        Select,
        HasAttribute,
        BinaryOperation,
        UnaryOperation,
        Parenthesized
    };

    // One segment of an attribute key. `inputs."foo".url` has three raw parts;
    // `inputs.${name}` has a raw part followed by an interpolation.
    struct AttributePart
    {
        bool isInterpolation{false};
        std::string content;
        SourceSpan span;
    };

    struct Expression;

    enum class BindingKind
    {
        KeyValue,
        Inherit
    };

    struct Binding
    {
        BindingKind kind{BindingKind::KeyValue};
        // Key path for key-value bindings, inherited names for `inherit`.
        std::vector<AttributePart> from;
        std::unique_ptr<Expression> to;
        std::unique_ptr<Expression> inheritSource;
        // Whole binding, key through the terminating ';'.
        SourceSpan span;
    };

    struct Formal
    {
        std::string identifier;
        SourceSpan identifierSpan;
        std::unique_ptr<Expression> defaultValue;
        // Identifier through the end of the default value, if any.
        SourceSpan span;
    };

    enum class FunctionHeadKind
    {
        Simple,
        Destructured
    };

    struct FunctionHead
    {
        FunctionHeadKind kind{FunctionHeadKind::Simple};
        // Simple heads: the parameter name. Destructured heads: the `@` binder, if any.
        std::optional<std::string> identifier;
        std::vector<Formal> arguments;
        bool ellipsis{false};
        SourceSpan ellipsisSpan;
        // Destructured heads: the braces. Simple heads: the parameter identifier.
        SourceSpan span;
    };

    struct Expression
    {
        ExpressionKind kind{ExpressionKind::Invalid};
        SourceSpan span;

        // Identifier, number, path and URI text; operator spelling.
        std::string text;

        // String and IndentedString.
        std::vector<StringSegment> parts;

        // Map and Let.
        std::vector<Binding> bindings;
        bool isRecursive{false};

        // Function.
        FunctionHead head;

        // Select and HasAttribute.
        std::vector<AttributePart> attributePath;

        // Function body, list elements, operands, select target/default, and so on.
        std::vector<std::unique_ptr<Expression>> children;
    };

    [[nodiscard]] std::string_view toString(ExpressionKind kind);
} // namespace flakeedit::frontend
