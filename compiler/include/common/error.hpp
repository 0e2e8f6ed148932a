//! # JIT Error Types
//!
//! Every fallible autojit operation returns `Result<T, JitError>`. The
//! `ErrorKind` tag identifies the failure class so that callers can react to
//! it without parsing messages; the message is for humans.
//!
//! ## Example
//!
//! ```cpp
//! auto result = ctx.invoke(id, args);
//! if (is_err(result) && unwrap_err(result).kind == ErrorKind::Arity) {
//!     std::cerr << unwrap_err(result).to_string() << "\n";
//! }
//! ```

#ifndef AUTOJIT_COMMON_ERROR_HPP
#define AUTOJIT_COMMON_ERROR_HPP

#include <string>
#include <vector>

namespace autojit {

/// Failure classes reported by the dispatcher, the class builder and the
/// pipeline adapters.
enum class ErrorKind {
    Arity,                    ///< Wrong number of positional arguments
    KeywordArgsUnsupported,   ///< Keyword arguments passed to a native callable
    UnsupportedValue,         ///< Runtime value has no native type
    SignatureMismatch,        ///< Arity or unification conflict against a signature
    SignatureSyntax,          ///< Malformed signature string
    Compilation,              ///< Pipeline adapter diagnostic
    DuplicateMethodSignature, ///< Method annotated twice incompatibly
    InheritedMethodMissing,   ///< Parent vtable entry expected but absent
    LayoutIncompatible,       ///< Derived layout is not a prefix extension of a base
    AttributeType,            ///< Value does not fit the native field or argument type
    UnknownCallable,          ///< No callable registered under the given id
    UnknownAttribute,         ///< No native attribute with that name
    UnknownMethod,            ///< No native method with that name
    NotImplemented,           ///< Removed feature (bytecode backend)
};

/// Returns the public name of an error kind (e.g. "ArityError").
[[nodiscard]] auto error_kind_name(ErrorKind kind) -> const char*;

/// An error produced by the JIT layer.
struct JitError {
    ErrorKind kind;
    std::string message;
    std::vector<std::string> notes;

    [[nodiscard]] static auto make(ErrorKind kind, std::string msg) -> JitError {
        return JitError{kind, std::move(msg), {}};
    }

    /// Returns a copy with an extra note appended.
    [[nodiscard]] auto with_note(std::string note) const -> JitError {
        JitError copy = *this;
        copy.notes.push_back(std::move(note));
        return copy;
    }

    /// Formats as "KindName: message" followed by one "  note: ..." line per note.
    [[nodiscard]] auto to_string() const -> std::string;
};

} // namespace autojit

#endif // AUTOJIT_COMMON_ERROR_HPP
