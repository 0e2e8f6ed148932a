//! # Type Resolver
//!
//! Maps runtime values to semantic types and resolves a callable's template
//! signature against the types observed at a call site.
//!
//! ## Resolution Order
//!
//! 1. Keyword arguments are rejected (`KeywordArgsUnsupported`)
//! 2. The positional count must equal the callable's parameter count (`Arity`)
//! 3. Every value is mapped with `type_of` (`UnsupportedValue`)
//! 4. The template signature, if any, is unified positionally
//!    (`SignatureMismatch`); concrete template positions win
//! 5. `locals` overrides the type of named arguments
//!
//! The arity check runs before any value is inspected, so a wrong call never
//! reaches type resolution or compilation.

#ifndef AUTOJIT_TYPES_RESOLVER_HPP
#define AUTOJIT_TYPES_RESOLVER_HPP

#include "common.hpp"
#include "common/error.hpp"
#include "types/signature.hpp"
#include "types/value.hpp"

#include <optional>
#include <span>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

namespace autojit::types {

/// Per-argument type overrides, keyed by parameter name.
using LocalsMap = std::unordered_map<std::string, TypePtr>;

/// Keyword arguments as received from the host; always rejected.
using KeywordArgs = std::vector<std::pair<std::string, Value>>;

/// What the resolver needs to know about a callable.
struct CallableShape {
    std::string name;
    std::vector<std::string> arg_names;
    std::optional<Signature> template_signature;
    LocalsMap locals;
};

/// Maps a value to its semantic type.
[[nodiscard]] auto type_of(const Value& value) -> Result<TypePtr, JitError>;

/// Unifies `tmpl` against `arg_types` and applies `locals`.
[[nodiscard]] auto resolve_template(const LocalsMap& locals, const Signature& tmpl,
                                    const std::vector<std::string>& arg_names,
                                    const std::vector<TypePtr>& arg_types)
    -> Result<Signature, JitError>;

/// Overrides argument types by parameter name. Names not in `arg_names` are
/// ignored.
[[nodiscard]] auto apply_locals(const LocalsMap& locals, const std::vector<std::string>& arg_names,
                                const Signature& sig) -> Signature;

/// Builds a signature with the types of `args` and the given return type.
[[nodiscard]] auto signature_from_values(std::span<const Value> args, TypePtr return_type = nullptr,
                                         std::optional<std::string> name = std::nullopt)
    -> Result<Signature, JitError>;

/// Full dispatcher pipeline from call-site values to the lookup signature.
[[nodiscard]] auto resolve_argtypes(const CallableShape& callable, std::span<const Value> args,
                                    const KeywordArgs& kwargs) -> Result<Signature, JitError>;

} // namespace autojit::types

#endif // AUTOJIT_TYPES_RESOLVER_HPP
