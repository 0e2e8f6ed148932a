//! # Signatures
//!
//! A `Signature` is the type-specialized contract of a callable: ordered
//! argument types, one return type and an optional name. It is the key of the
//! specialization cache.
//!
//! ## Equality
//!
//! Two signatures are equal iff their argument sequences and return types are
//! structurally equal. The name is metadata and never takes part in equality
//! or hashing. A null return type means "to be inferred".
//!
//! ## String Grammar
//!
//! ```text
//! signature := [name] type '(' [type (',' type)*] ')'
//! type      := base suffix*
//!            | type '(' [type (',' type)*] ')' '*'     (function pointer, args only)
//! suffix    := '*' | '[' ':' (',' ':')* ']'
//! base      := i1 i2 i4 i8 u1 u2 u4 u8 f4 f8 b1 void object | C alias | TypeVar
//! ```
//!
//! `"myfun f8(f8, i4)"` parses to name `myfun`, return `f8`, args `[f8, i4]`.

#ifndef AUTOJIT_TYPES_SIGNATURE_HPP
#define AUTOJIT_TYPES_SIGNATURE_HPP

#include "common.hpp"
#include "common/error.hpp"
#include "types/type.hpp"

#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace autojit::types {

class Signature {
public:
    Signature() = default;
    Signature(TypePtr return_type, std::vector<TypePtr> args,
              std::optional<std::string> name = std::nullopt);

    [[nodiscard]] auto return_type() const -> const TypePtr& {
        return return_type_;
    }

    [[nodiscard]] auto args() const -> const std::vector<TypePtr>& {
        return args_;
    }

    [[nodiscard]] auto arity() const -> size_t {
        return args_.size();
    }

    [[nodiscard]] auto name() const -> const std::optional<std::string>& {
        return name_;
    }

    /// False when the return type is still to be inferred.
    [[nodiscard]] auto has_return_type() const -> bool {
        return return_type_ != nullptr;
    }

    /// True when no argument or return type mentions a type variable.
    [[nodiscard]] auto is_concrete() const -> bool;

    [[nodiscard]] auto with_return_type(TypePtr ret) const -> Signature;
    [[nodiscard]] auto with_args(std::vector<TypePtr> args) const -> Signature;
    [[nodiscard]] auto with_name(std::optional<std::string> name) const -> Signature;

    /// `ret(a, b)` without the name. Stable across processes.
    [[nodiscard]] auto canonical() const -> std::string;

    /// `(a, b)` spelled with `type_key`: the argument-only cache key.
    [[nodiscard]] auto args_key() const -> std::string;

    /// `name ret(a, b)` when named, otherwise `canonical()`.
    [[nodiscard]] auto to_string() const -> std::string;

    /// The signature as a function pointer type.
    [[nodiscard]] auto as_func_ptr_type() const -> TypePtr;

    [[nodiscard]] auto operator==(const Signature& other) const -> bool;
    [[nodiscard]] auto operator!=(const Signature& other) const -> bool {
        return !(*this == other);
    }

private:
    TypePtr return_type_;
    std::vector<TypePtr> args_;
    std::optional<std::string> name_;
};

/// Hash consistent with `Signature::operator==`.
struct SignatureHash {
    auto operator()(const Signature& sig) const -> size_t;
};

/// Parses the string grammar. `name_override`, when given, replaces any
/// name found in the text.
[[nodiscard]] auto parse_signature(std::string_view text,
                                   std::optional<std::string> name_override = std::nullopt)
    -> Result<Signature, JitError>;

/// Parses a single type, e.g. `"f8[:, :]"` or `"i4(i4)*"`.
[[nodiscard]] auto parse_type(std::string_view text) -> Result<TypePtr, JitError>;

/// Builds a signature from a function pointer type.
[[nodiscard]] auto signature_from_type(const TypePtr& func_type,
                                       std::optional<std::string> name = std::nullopt)
    -> Result<Signature, JitError>;

} // namespace autojit::types

#endif // AUTOJIT_TYPES_SIGNATURE_HPP
