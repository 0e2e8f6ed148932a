//! # Extension Types
//!
//! The compile-time description of a native extension class, built up
//! stage by stage by `ClassBuilder` and frozen into a `ClassDescriptor`.

#pragma once

#include "exttypes/layout.hpp"
#include "types/signature.hpp"
#include "types/symtab.hpp"

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace autojit::exttypes {

enum class MethodKind {
    Instance, ///< Receives the instance as argument 0
    Static,
    Class, ///< Receives nothing native for the class; treated as static
};

struct MethodEntry {
    std::string name;
    types::Signature signature; ///< Instance methods include the receiver
    MethodKind kind = MethodKind::Instance;
    bool inherited = false; ///< Taken from the parent and not overridden
};

class ExtensionType {
public:
    explicit ExtensionType(std::string class_name);

    [[nodiscard]] const std::string& class_name() const {
        return class_name_;
    }

    /// Process-unique; never reused, even for a class of the same name.
    [[nodiscard]] uint64_t class_id() const {
        return class_id_;
    }

    /// The receiver type of this class's instance methods.
    [[nodiscard]] types::TypePtr instance_type() const {
        return types::make_extension_ref(class_name_, class_id_);
    }

    types::SymbolTable& symtab() {
        return symtab_;
    }
    [[nodiscard]] const types::SymbolTable& symtab() const {
        return symtab_;
    }

    /// Adds a method or replaces the entry with the same name in place, so
    /// an override keeps its parent's vtable slot.
    void add_method(MethodEntry entry);

    [[nodiscard]] const std::vector<MethodEntry>& methods() const {
        return methods_;
    }

    [[nodiscard]] std::optional<size_t> find_method(const std::string& name) const;

    void set_attribute_struct(std::shared_ptr<const AttributeStruct> s) {
        attribute_struct_ = std::move(s);
    }
    [[nodiscard]] const std::shared_ptr<const AttributeStruct>& attribute_struct() const {
        return attribute_struct_;
    }

    void set_vtab_type(std::shared_ptr<const VTableType> v) {
        vtab_type_ = std::move(v);
    }
    [[nodiscard]] const std::shared_ptr<const VTableType>& vtab_type() const {
        return vtab_type_;
    }

    void set_parent(std::shared_ptr<const AttributeStruct> parent_struct,
                    std::shared_ptr<const VTableType> parent_vtab) {
        parent_struct_ = std::move(parent_struct);
        parent_vtab_ = std::move(parent_vtab);
    }
    [[nodiscard]] const std::shared_ptr<const AttributeStruct>& parent_struct() const {
        return parent_struct_;
    }
    [[nodiscard]] const std::shared_ptr<const VTableType>& parent_vtab() const {
        return parent_vtab_;
    }

private:
    std::string class_name_;
    uint64_t class_id_;
    types::SymbolTable symtab_;
    std::vector<MethodEntry> methods_;
    std::shared_ptr<const AttributeStruct> attribute_struct_;
    std::shared_ptr<const VTableType> vtab_type_;
    std::shared_ptr<const AttributeStruct> parent_struct_;
    std::shared_ptr<const VTableType> parent_vtab_;
};

} // namespace autojit::exttypes
