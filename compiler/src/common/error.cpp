#include "common/error.hpp"

namespace autojit {

auto error_kind_name(ErrorKind kind) -> const char* {
    switch (kind) {
    case ErrorKind::Arity:
        return "ArityError";
    case ErrorKind::KeywordArgsUnsupported:
        return "KeywordArgsUnsupportedError";
    case ErrorKind::UnsupportedValue:
        return "UnsupportedValueError";
    case ErrorKind::SignatureMismatch:
        return "SignatureMismatchError";
    case ErrorKind::SignatureSyntax:
        return "SignatureSyntaxError";
    case ErrorKind::Compilation:
        return "CompilationError";
    case ErrorKind::DuplicateMethodSignature:
        return "DuplicateMethodSignatureError";
    case ErrorKind::InheritedMethodMissing:
        return "InheritedMethodMissingError";
    case ErrorKind::LayoutIncompatible:
        return "LayoutIncompatibleError";
    case ErrorKind::AttributeType:
        return "AttributeTypeError";
    case ErrorKind::UnknownCallable:
        return "UnknownCallableError";
    case ErrorKind::UnknownAttribute:
        return "UnknownAttributeError";
    case ErrorKind::UnknownMethod:
        return "UnknownMethodError";
    case ErrorKind::NotImplemented:
        return "NotImplementedError";
    }
    return "JitError";
}

auto JitError::to_string() const -> std::string {
    std::string out = error_kind_name(kind);
    out += ": ";
    out += message;
    for (const auto& note : notes) {
        out += "\n  note: ";
        out += note;
    }
    return out;
}

} // namespace autojit
