#pragma once

#include "token.hpp"

#include <string>
#include <string_view>

namespace flakeedit::edit
{
    using frontend::SourceLocation;
    using frontend::SourceSpan;

    enum class EditErrorKind
    {
        InheritNotSupported,
        UnsupportedExpressionKind,
        MultiPartValueUnsupported,
        MissingOutputs,
        MissingInputs,
        MissingInputsAndOutputs,
        PositionNotFound,
        EmptyParameterListUnsupported,
        AmbiguousOrUnknownValueShape,
        ParameterListTokenMissing,
        ParameterNameNotIdentifier,
        InputAlreadyInParameterList
    };

    struct Diagnostic
    {
        EditErrorKind kind{EditErrorKind::UnsupportedExpressionKind};
        std::string code;
        std::string message;
        SourceSpan span;
        bool isWarning{false};
    };

    [[nodiscard]] std::string_view toString(EditErrorKind kind);
    [[nodiscard]] std::string_view codeFor(EditErrorKind kind);

    [[nodiscard]] Diagnostic makeError(EditErrorKind kind, std::string message, SourceSpan span = {});
    [[nodiscard]] Diagnostic makeWarning(EditErrorKind kind, std::string message, SourceSpan span = {});

    // "L<line>:C<column>", the location format used in every user-facing message.
    [[nodiscard]] std::string describeLocation(const SourceLocation& location);
} // namespace flakeedit::edit
