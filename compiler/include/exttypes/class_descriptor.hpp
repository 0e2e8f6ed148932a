//! # Class Descriptors
//!
//! The final, immutable form of a native extension class: attribute struct,
//! vtable, compiled method table and a fixed accessor table with one typed
//! getter/setter per attribute. Descriptors are only ever created complete;
//! there is no partially built state to observe.
//!
//! ## Example
//!
//! ```cpp
//! auto inst = descriptor->instantiate(std::vector<Value>{1.5});
//! auto x = descriptor->get_attr(*unwrap(inst).as<InstanceValue>().instance, "x");
//! ```

#pragma once

#include "common.hpp"
#include "common/error.hpp"
#include "exttypes/extension_type.hpp"
#include "exttypes/instance.hpp"
#include "jit/artifact.hpp"
#include "types/value.hpp"

#include <memory>
#include <optional>
#include <span>
#include <string>
#include <vector>

namespace autojit::exttypes {

/// Typed access to one attribute at a fixed struct offset.
struct Accessor {
    std::string name;
    types::TypePtr type;
    size_t offset = 0;

    [[nodiscard]] Result<types::Value, JitError> get(const uint8_t* base) const;

    /// Checked write: fails with AttributeType if `value` does not fit `type`.
    [[nodiscard]] Result<bool, JitError> set(uint8_t* base, const types::Value& value) const;
};

/// One vtable entry.
struct NativeMethod {
    std::string name;
    MethodKind kind = MethodKind::Instance;
    jit::ArtifactPtr artifact;
    bool inherited = false;
};

class ClassDescriptor : public std::enable_shared_from_this<ClassDescriptor> {
public:
    ClassDescriptor(std::shared_ptr<const ExtensionType> extension_type,
                    std::vector<std::shared_ptr<const ClassDescriptor>> native_bases,
                    std::vector<NativeMethod> methods, std::vector<Accessor> accessors,
                    std::vector<std::string> host_methods);

    [[nodiscard]] const std::string& name() const {
        return extension_type_->class_name();
    }

    [[nodiscard]] uint64_t class_id() const {
        return extension_type_->class_id();
    }

    [[nodiscard]] const ExtensionType& extension_type() const {
        return *extension_type_;
    }

    [[nodiscard]] const std::shared_ptr<const AttributeStruct>& attribute_struct() const {
        return extension_type_->attribute_struct();
    }

    [[nodiscard]] const std::shared_ptr<const VTableType>& vtable_type() const {
        return extension_type_->vtab_type();
    }

    /// Primary parent, or null.
    [[nodiscard]] std::shared_ptr<const ClassDescriptor> parent() const {
        return native_bases_.empty() ? nullptr : native_bases_.front();
    }

    [[nodiscard]] const std::vector<std::shared_ptr<const ClassDescriptor>>& native_bases() const {
        return native_bases_;
    }

    [[nodiscard]] const std::vector<NativeMethod>& methods() const {
        return methods_;
    }

    /// Native entry points in slot order.
    [[nodiscard]] const std::vector<void*>& vtable() const {
        return vtable_;
    }

    [[nodiscard]] const std::vector<Accessor>& accessors() const {
        return accessors_;
    }

    /// Methods without any signature; they stay on the host side.
    [[nodiscard]] const std::vector<std::string>& host_methods() const {
        return host_methods_;
    }

    [[nodiscard]] const Accessor* find_accessor(const std::string& attr) const;
    [[nodiscard]] std::optional<size_t> method_index(const std::string& method) const;

    /// True for this class and every native ancestor. Classes are compared by
    /// identity; a same-named class from another build is unrelated.
    [[nodiscard]] bool is_subclass_of(const ClassDescriptor& other) const;
    [[nodiscard]] bool is_subclass_of(uint64_t class_id) const;

    /// Allocates a zeroed instance and runs the native `__init__`, if any.
    [[nodiscard]] Result<types::Value, JitError> instantiate(std::span<const types::Value> args) const;

    /// Dispatches through the vtable. `self` is ignored for static methods.
    [[nodiscard]] Result<types::Value, JitError>
    call_method(const std::shared_ptr<Instance>& self, const std::string& method,
                std::span<const types::Value> args) const;

    [[nodiscard]] Result<types::Value, JitError> get_attr(const Instance& self,
                                                          const std::string& attr) const;

    [[nodiscard]] Result<bool, JitError> set_attr(Instance& self, const std::string& attr,
                                                  const types::Value& value) const;

private:
    std::shared_ptr<const ExtensionType> extension_type_;
    std::vector<std::shared_ptr<const ClassDescriptor>> native_bases_;
    std::vector<NativeMethod> methods_;
    std::vector<void*> vtable_;
    std::vector<Accessor> accessors_;
    std::vector<std::string> host_methods_;
};

using ClassDescriptorPtr = std::shared_ptr<const ClassDescriptor>;

} // namespace autojit::exttypes
