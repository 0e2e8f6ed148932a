//! # Inheritance Verifier
//!
//! A derived layout D is compatible with a base layout B iff the first |B|
//! fields of D equal B's fields by name and type, in order, and the same
//! holds for the vtable slots (name and signature, receiver compared only as
//! "some extension instance"). Every native base of a class must be
//! compatible at the same time.

#pragma once

#include "common.hpp"
#include "common/error.hpp"
#include "exttypes/layout.hpp"

#include <string>
#include <vector>

namespace autojit::exttypes {

/// A native base class as seen by the verifier.
struct NativeBaseLayout {
    std::string name;
    const AttributeStruct* attrs;
    const VTableType* vtab;
};

/// Checks that `derived_*` extends `base_*`. Fails with LayoutIncompatible
/// describing the first mismatching field or slot.
[[nodiscard]] Result<bool, JitError> verify(const AttributeStruct& base_struct,
                                            const AttributeStruct& derived_struct,
                                            const VTableType& base_vtab,
                                            const VTableType& derived_vtab);

/// Checks every base against the derived layout. `bases[0]` is the primary
/// parent the derived layout was seeded from; a conflict with another base
/// is reported as "Multiple incompatible base classes found: A and B".
[[nodiscard]] Result<bool, JitError> verify_bases(const std::vector<NativeBaseLayout>& bases,
                                                  const AttributeStruct& derived_struct,
                                                  const VTableType& derived_vtab);

} // namespace autojit::exttypes
