#include "diagnostic.hpp"

#include <utility>

namespace flakeedit::edit
{
    std::string_view toString(EditErrorKind kind)
    {
        switch (kind)
        {
        case EditErrorKind::InheritNotSupported: return "InheritNotSupported";
        case EditErrorKind::UnsupportedExpressionKind: return "UnsupportedExpressionKind";
        case EditErrorKind::MultiPartValueUnsupported: return "MultiPartValueUnsupported";
        case EditErrorKind::MissingOutputs: return "MissingOutputs";
        case EditErrorKind::MissingInputs: return "MissingInputs";
        case EditErrorKind::MissingInputsAndOutputs: return "MissingInputsAndOutputs";
        case EditErrorKind::PositionNotFound: return "PositionNotFound";
        case EditErrorKind::EmptyParameterListUnsupported: return "EmptyParameterListUnsupported";
        case EditErrorKind::AmbiguousOrUnknownValueShape: return "AmbiguousOrUnknownValueShape";
        case EditErrorKind::ParameterListTokenMissing: return "ParameterListTokenMissing";
        case EditErrorKind::ParameterNameNotIdentifier: return "ParameterNameNotIdentifier";
        case EditErrorKind::InputAlreadyInParameterList: return "InputAlreadyInParameterList";
        }

        return "Unknown";
    }

    std::string_view codeFor(EditErrorKind kind)
    {
        switch (kind)
        {
        case EditErrorKind::InheritNotSupported: return "FLAKEEDIT-E4001";
        case EditErrorKind::UnsupportedExpressionKind: return "FLAKEEDIT-E4002";
        case EditErrorKind::MultiPartValueUnsupported: return "FLAKEEDIT-E4003";
        case EditErrorKind::MissingOutputs: return "FLAKEEDIT-E4004";
        case EditErrorKind::MissingInputs: return "FLAKEEDIT-E4005";
        case EditErrorKind::MissingInputsAndOutputs: return "FLAKEEDIT-E4006";
        case EditErrorKind::PositionNotFound: return "FLAKEEDIT-E4007";
        case EditErrorKind::EmptyParameterListUnsupported: return "FLAKEEDIT-E4008";
        case EditErrorKind::AmbiguousOrUnknownValueShape: return "FLAKEEDIT-E4009";
        case EditErrorKind::ParameterListTokenMissing: return "FLAKEEDIT-E4010";
        case EditErrorKind::ParameterNameNotIdentifier: return "FLAKEEDIT-E4011";
        case EditErrorKind::InputAlreadyInParameterList: return "FLAKEEDIT-W4101";
        }

        return "FLAKEEDIT-E4000";
    }

    Diagnostic makeError(EditErrorKind kind, std::string message, SourceSpan span)
    {
        Diagnostic diag;
        diag.kind = kind;
        diag.code = std::string{codeFor(kind)};
        diag.message = std::move(message);
        diag.span = span;
        return diag;
    }

    Diagnostic makeWarning(EditErrorKind kind, std::string message, SourceSpan span)
    {
        Diagnostic diag = makeError(kind, std::move(message), span);
        diag.isWarning = true;
        return diag;
    }

    std::string describeLocation(const SourceLocation& location)
    {
        return "L" + std::to_string(location.line) + ":C" + std::to_string(location.column);
    }
} // namespace flakeedit::edit
