//! # Host Values
//!
//! `Value` is the dynamic value the host side passes to a JIT-compiled
//! callable and receives back from it. Each alternative maps to one semantic
//! type through `type_of` (see `types/resolver.hpp`).

#ifndef AUTOJIT_TYPES_VALUE_HPP
#define AUTOJIT_TYPES_VALUE_HPP

#include "types/signature.hpp"
#include "types/type.hpp"

#include <cstdint>
#include <memory>
#include <string>
#include <variant>
#include <vector>

namespace autojit::exttypes {
class Instance;
}

namespace autojit::types {

/// Raw pointer with its pointee type. A null pointee type is untyped and has
/// no native type.
struct PointerValue {
    TypePtr pointee;
    void* address = nullptr;
    bool is_void = false; ///< Explicit void*, distinct from an unknown pointee
};

/// Native function pointer with its signature.
struct FunctionValue {
    Signature signature;
    void* address = nullptr;
};

/// By-value struct, stored in native layout.
struct StructValue {
    TypePtr struct_type;
    std::vector<uint8_t> bytes;
};

/// Strided-free contiguous array view.
struct ArrayValue {
    TypePtr element;
    size_t ndim = 1;
    void* data = nullptr;
    std::vector<size_t> shape;
};

/// Opaque host object, passed through as a handle.
struct ObjectValue {
    std::shared_ptr<void> handle;
    std::string type_name;
};

/// Instance of a native extension class.
struct InstanceValue {
    std::shared_ptr<exttypes::Instance> instance;
};

struct Value {
    std::variant<std::monostate, bool, int32_t, int64_t, uint64_t, float, double, PointerValue,
                 FunctionValue, StructValue, ArrayValue, ObjectValue, InstanceValue>
        data;

    Value() = default;

    template <typename T>
        requires(!std::is_same_v<std::decay_t<T>, Value>)
    Value(T&& v) : data(std::forward<T>(v)) {}

    [[nodiscard]] auto is_none() const -> bool {
        return std::holds_alternative<std::monostate>(data);
    }

    template <typename T> [[nodiscard]] auto is() const -> bool {
        return std::holds_alternative<T>(data);
    }

    template <typename T> [[nodiscard]] auto as() const -> const T& {
        return std::get<T>(data);
    }

    template <typename T> [[nodiscard]] auto as() -> T& {
        return std::get<T>(data);
    }

    /// Short human-readable rendering for diagnostics.
    [[nodiscard]] auto to_string() const -> std::string;
};

} // namespace autojit::types

#endif // AUTOJIT_TYPES_VALUE_HPP
