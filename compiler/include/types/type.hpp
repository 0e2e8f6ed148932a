//! # Semantic Types
//!
//! The closed set of types the JIT layer can specialize on. Every runtime
//! value the dispatcher accepts maps to one of these (see `types/resolver.hpp`)
//! and every type here has a native representation (see `native_size`).
//!
//! | Kind          | Spelling      | Native form                     |
//! |---------------|---------------|---------------------------------|
//! | PrimitiveType | `i4`, `f8`    | scalar                          |
//! | PtrType       | `f8*`         | pointer                         |
//! | ArrayType     | `f8[:, :]`    | pointer to the first element    |
//! | StructType    | `Point{...}`  | by-value aggregate              |
//! | FuncPtrType   | `i4(i4)*`     | function pointer                |
//! | ObjectType    | `object`      | opaque host handle (pointer)    |
//! | TypeVar       | `T`           | none, must be resolved first    |
//! | ExtensionRef  | `instance(C)` | pointer to the attribute struct |

#ifndef AUTOJIT_TYPES_TYPE_HPP
#define AUTOJIT_TYPES_TYPE_HPP

#include "common.hpp"

#include <cstdint>
#include <memory>
#include <string>
#include <unordered_map>
#include <utility>
#include <variant>
#include <vector>

namespace autojit::types {

// Forward declarations
struct Type;
using TypePtr = std::shared_ptr<Type>;

// Primitive types
enum class PrimitiveKind {
    // Integers
    I8,
    I16,
    I32,
    I64,
    U8,
    U16,
    U32,
    U64,
    // Floats
    F32,
    F64,
    // Other primitives
    Bool,
    Void,
};

struct PrimitiveType {
    PrimitiveKind kind;
};

// Pointer type: T*
struct PtrType {
    TypePtr inner; // Null inner means void*
};

// Array type: T[:], T[:, :], ...
struct ArrayType {
    TypePtr element;
    size_t ndim;
};

// Struct field
struct StructField {
    std::string name;
    TypePtr type;
};

// By-value struct type (host structure values)
struct StructType {
    std::string name;
    std::vector<StructField> fields;
};

// Function pointer type: R(A, B)*
struct FuncPtrType {
    std::vector<TypePtr> params;
    TypePtr return_type;
};

// Opaque host object
struct ObjectType {};

// Template type variable (free until unified)
struct TypeVar {
    std::string name;
};

// Instance of a native extension class. Two classes with the same name
// (a rebuilt class, or one per context) differ by class_id; 0 is unbound.
struct ExtensionRef {
    std::string class_name;
    uint64_t class_id = 0;
};

// Type variant
struct Type {
    std::variant<PrimitiveType, PtrType, ArrayType, StructType, FuncPtrType, ObjectType, TypeVar,
                 ExtensionRef>
        kind;

    template <typename T> [[nodiscard]] auto is() const -> bool {
        return std::holds_alternative<T>(kind);
    }

    template <typename T> [[nodiscard]] auto as() -> T& {
        return std::get<T>(kind);
    }

    template <typename T> [[nodiscard]] auto as() const -> const T& {
        return std::get<T>(kind);
    }
};

// Factories
[[nodiscard]] auto make_primitive(PrimitiveKind kind) -> TypePtr;
[[nodiscard]] auto make_void() -> TypePtr;
[[nodiscard]] auto make_bool() -> TypePtr;
[[nodiscard]] auto make_i32() -> TypePtr;
[[nodiscard]] auto make_i64() -> TypePtr;
[[nodiscard]] auto make_u64() -> TypePtr;
[[nodiscard]] auto make_f32() -> TypePtr;
[[nodiscard]] auto make_f64() -> TypePtr;
[[nodiscard]] auto make_ptr(TypePtr inner) -> TypePtr;
[[nodiscard]] auto make_array(TypePtr element, size_t ndim) -> TypePtr;
[[nodiscard]] auto make_struct(std::string name, std::vector<StructField> fields) -> TypePtr;
[[nodiscard]] auto make_func_ptr(std::vector<TypePtr> params, TypePtr ret) -> TypePtr;
[[nodiscard]] auto make_object() -> TypePtr;
[[nodiscard]] auto make_type_var(std::string name) -> TypePtr;
[[nodiscard]] auto make_extension_ref(std::string class_name, uint64_t class_id = 0) -> TypePtr;

// Classification
[[nodiscard]] auto is_primitive(const TypePtr& type, PrimitiveKind kind) -> bool;
[[nodiscard]] auto is_integer(const TypePtr& type) -> bool;
[[nodiscard]] auto is_signed_integer(const TypePtr& type) -> bool;
[[nodiscard]] auto is_float(const TypePtr& type) -> bool;
[[nodiscard]] auto is_numeric(const TypePtr& type) -> bool;
[[nodiscard]] auto is_void(const TypePtr& type) -> bool;

/// True if the type or any type nested in it is a TypeVar.
[[nodiscard]] auto contains_type_var(const TypePtr& type) -> bool;

// Type comparison
[[nodiscard]] auto types_equal(const TypePtr& a, const TypePtr& b) -> bool;

/// Canonical short spelling. A null type prints as "?".
[[nodiscard]] auto type_to_string(const TypePtr& type) -> std::string;

/// Like `type_to_string`, but extension classes also spell their class id,
/// so equal keys mean equal types. Used for cache keys.
[[nodiscard]] auto type_key(const TypePtr& type) -> std::string;

[[nodiscard]] auto primitive_kind_to_string(PrimitiveKind kind) -> std::string;

/// Replaces TypeVar instances with types from the substitution map.
/// Unmapped variables are left in place.
[[nodiscard]] auto substitute_type(const TypePtr& type,
                                   const std::unordered_map<std::string, TypePtr>& substitutions)
    -> TypePtr;

/// Binds the type variables of `pattern` so that it matches `concrete`.
/// Returns false on a structural mismatch or when a variable is already bound
/// to a different type.
[[nodiscard]] auto unify(const TypePtr& pattern, const TypePtr& concrete,
                         std::unordered_map<std::string, TypePtr>& bindings) -> bool;

/// Smallest numeric type both operands convert to without loss where
/// possible: any float wins over integers, wider wins over narrower.
/// Returns null when either side is not numeric.
[[nodiscard]] auto promote_numeric(const TypePtr& a, const TypePtr& b) -> TypePtr;

// Native layout. Aggregates use natural alignment. TypeVar and void have no
// native size and report 0.
[[nodiscard]] auto native_size(const TypePtr& type) -> size_t;
[[nodiscard]] auto native_align(const TypePtr& type) -> size_t;

} // namespace autojit::types

#endif // AUTOJIT_TYPES_TYPE_HPP
