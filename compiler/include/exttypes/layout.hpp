//! # Extension Type Layouts
//!
//! `AttributeStruct` is the native field layout of an extension class and
//! `VTableType` the ordered method slot list. Both only grow by appending, so
//! a derived layout that starts from its parent's is prefix-compatible and
//! offset-based access from parent code stays valid.
//!
//! ```text
//! Base  { x: f8 }            offsets: x=0
//! Child { x: f8, y: i4 }     offsets: x=0, y=8      (Base is a prefix)
//! ```

#pragma once

#include "types/signature.hpp"
#include "types/type.hpp"

#include <optional>
#include <string>
#include <vector>

namespace autojit::exttypes {

struct AttributeField {
    std::string name;
    types::TypePtr type;
    size_t offset = 0;
};

/// Native attribute layout with natural alignment.
class AttributeStruct {
public:
    explicit AttributeStruct(std::string class_name) : class_name_(std::move(class_name)) {}

    /// Appends a field at the next naturally aligned offset. Returns false if
    /// a field with that name already exists.
    bool add_field(const std::string& name, const types::TypePtr& type);

    [[nodiscard]] const std::vector<AttributeField>& fields() const {
        return fields_;
    }

    [[nodiscard]] const AttributeField* find(const std::string& name) const;

    [[nodiscard]] const std::string& class_name() const {
        return class_name_;
    }

    /// Total size, padded to the alignment.
    [[nodiscard]] size_t size() const;
    [[nodiscard]] size_t align() const {
        return align_;
    }

    /// True iff this struct's fields are the leading fields of `derived`,
    /// compared by name and type, in order.
    [[nodiscard]] bool is_prefix_of(const AttributeStruct& derived) const;

    /// The layout as a semantic struct type named after the class.
    [[nodiscard]] types::TypePtr as_struct_type() const;

    /// `Name{x: f8, y: i4}`
    [[nodiscard]] std::string to_string() const;

private:
    std::string class_name_;
    std::vector<AttributeField> fields_;
    size_t end_ = 0;
    size_t align_ = 1;
};

struct VTableSlot {
    std::string name;
    types::Signature signature; ///< Includes the receiver as argument 0
};

/// Ordered method slots of an extension class.
class VTableType {
public:
    VTableType() = default;

    void add_slot(VTableSlot slot) {
        slots_.push_back(std::move(slot));
    }

    [[nodiscard]] const std::vector<VTableSlot>& slots() const {
        return slots_;
    }

    [[nodiscard]] std::optional<size_t> index_of(const std::string& name) const;

    [[nodiscard]] size_t size() const {
        return slots_.size();
    }

    /// True iff this table's slots lead `derived` by name and signature, the
    /// receiver argument being compared only as "some extension instance".
    [[nodiscard]] bool is_prefix_of(const VTableType& derived) const;

private:
    std::vector<VTableSlot> slots_;
};

/// Signature equality treating two extension-instance receivers as equal.
[[nodiscard]] bool signatures_equal_modulo_receiver(const types::Signature& a,
                                                    const types::Signature& b);

} // namespace autojit::exttypes
