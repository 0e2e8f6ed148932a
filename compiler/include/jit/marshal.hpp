//! # Value Marshalling
//!
//! Conversion between host `Value`s and native storage.
//!
//! ## Coercion Rules
//!
//! | Value                | Accepted target                                 |
//! |----------------------|-------------------------------------------------|
//! | integer              | any integer type that holds it, any float type  |
//! | float                | any float type, an integer type if integral     |
//! | bool                 | `b1` only                                       |
//! | pointer              | same pointee type, or `void*`                   |
//! | array                | same element type and dimension count           |
//! | struct               | structurally equal struct type                  |
//! | function pointer     | equal signature                                 |
//! | object               | `object`                                        |
//! | extension instance   | its class or any ancestor class                 |
//!
//! Anything else fails with `AttributeType`.

#pragma once

#include "common.hpp"
#include "common/error.hpp"
#include "types/type.hpp"
#include "types/value.hpp"

namespace autojit::jit {

/// Converts `value` so that it can be stored as `target`.
[[nodiscard]] auto coerce_value(const types::Value& value, const types::TypePtr& target)
    -> Result<types::Value, JitError>;

/// Writes an already coerced value in native layout. `dst` must hold
/// `native_size(type)` bytes.
[[nodiscard]] auto write_native(const types::Value& value, const types::TypePtr& type, void* dst)
    -> Result<bool, JitError>;

/// Reads a native value of `type` from `src`.
[[nodiscard]] auto read_native(const types::TypePtr& type, const void* src)
    -> Result<types::Value, JitError>;

} // namespace autojit::jit
