#include "exttypes/class_descriptor.hpp"

#include "jit/marshal.hpp"
#include "log/log.hpp"

#include <algorithm>
#include <cstring>

namespace autojit::exttypes {

// ============================================================================
// Instance
// ============================================================================

Instance::Instance(std::shared_ptr<const ClassDescriptor> descriptor)
    : descriptor_(std::move(descriptor)) {
    size_t bytes = descriptor_ && descriptor_->attribute_struct()
                       ? descriptor_->attribute_struct()->size()
                       : 0;
    size_t words = std::max<size_t>(1, (bytes + sizeof(std::max_align_t) - 1) /
                                           sizeof(std::max_align_t));
    storage_ = std::make_unique<std::max_align_t[]>(words);
    std::memset(storage_.get(), 0, words * sizeof(std::max_align_t));
}

std::string Instance::class_name() const {
    return descriptor_ ? descriptor_->name() : std::string();
}

types::TypePtr Instance::instance_type() const {
    return descriptor_ ? descriptor_->extension_type().instance_type() : nullptr;
}

// ============================================================================
// Accessor
// ============================================================================

Result<types::Value, JitError> Accessor::get(const uint8_t* base) const {
    return jit::read_native(type, base + offset);
}

Result<bool, JitError> Accessor::set(uint8_t* base, const types::Value& value) const {
    auto coerced = jit::coerce_value(value, type);
    if (is_err(coerced)) {
        return JitError::make(ErrorKind::AttributeType, "cannot assign " + value.to_string() +
                                                            " to attribute '" + name + "' of type " +
                                                            types::type_to_string(type));
    }
    return jit::write_native(unwrap(coerced), type, base + offset);
}

// ============================================================================
// ClassDescriptor
// ============================================================================

ClassDescriptor::ClassDescriptor(std::shared_ptr<const ExtensionType> extension_type,
                                 std::vector<std::shared_ptr<const ClassDescriptor>> native_bases,
                                 std::vector<NativeMethod> methods,
                                 std::vector<Accessor> accessors,
                                 std::vector<std::string> host_methods)
    : extension_type_(std::move(extension_type)), native_bases_(std::move(native_bases)),
      methods_(std::move(methods)), accessors_(std::move(accessors)),
      host_methods_(std::move(host_methods)) {
    vtable_.reserve(methods_.size());
    for (const auto& m : methods_) {
        vtable_.push_back(m.artifact ? m.artifact->entry : nullptr);
    }
}

const Accessor* ClassDescriptor::find_accessor(const std::string& attr) const {
    for (const auto& accessor : accessors_) {
        if (accessor.name == attr)
            return &accessor;
    }
    return nullptr;
}

std::optional<size_t> ClassDescriptor::method_index(const std::string& method) const {
    for (size_t i = 0; i < methods_.size(); ++i) {
        if (methods_[i].name == method)
            return i;
    }
    return std::nullopt;
}

bool ClassDescriptor::is_subclass_of(const ClassDescriptor& other) const {
    if (this == &other)
        return true;
    return std::any_of(native_bases_.begin(), native_bases_.end(),
                       [&](const ClassDescriptorPtr& base) {
                           return base && base->is_subclass_of(other);
                       });
}

bool ClassDescriptor::is_subclass_of(uint64_t class_id) const {
    if (this->class_id() == class_id)
        return true;
    return std::any_of(native_bases_.begin(), native_bases_.end(),
                       [&](const ClassDescriptorPtr& base) {
                           return base && base->is_subclass_of(class_id);
                       });
}

Result<types::Value, JitError>
ClassDescriptor::instantiate(std::span<const types::Value> args) const {
    auto instance = std::make_shared<Instance>(shared_from_this());

    if (method_index("__init__")) {
        auto result = call_method(instance, "__init__", args);
        if (is_err(result))
            return unwrap_err(result).with_note("while constructing " + name());
    } else if (!args.empty()) {
        return JitError::make(ErrorKind::Arity, name() + "() takes no arguments (" +
                                                    std::to_string(args.size()) + " given)");
    }

    AUTOJIT_LOG_TRACE("exttypes", "instantiated " << name());
    return types::InstanceValue{std::move(instance)};
}

Result<types::Value, JitError>
ClassDescriptor::call_method(const std::shared_ptr<Instance>& self, const std::string& method,
                             std::span<const types::Value> args) const {
    auto index = method_index(method);
    if (!index) {
        if (std::find(host_methods_.begin(), host_methods_.end(), method) != host_methods_.end()) {
            return JitError::make(ErrorKind::UnknownMethod,
                                  "'" + method + "' is a host method of " + name() +
                                      " and has no native entry");
        }
        return JitError::make(ErrorKind::UnknownMethod,
                              name() + " has no native method '" + method + "'");
    }

    const auto& entry = methods_[*index];
    if (!entry.artifact) {
        return JitError::make(ErrorKind::InheritedMethodMissing,
                              name() + "." + method + " has no compiled implementation");
    }

    std::vector<types::Value> full_args;
    if (entry.kind == MethodKind::Instance) {
        if (!self) {
            return JitError::make(ErrorKind::Arity,
                                  name() + "." + method + "() requires an instance");
        }
        full_args.reserve(args.size() + 1);
        full_args.emplace_back(types::InstanceValue{self});
    }
    full_args.insert(full_args.end(), args.begin(), args.end());

    const auto& sig = entry.artifact->signature;
    if (full_args.size() != sig.arity()) {
        size_t shown = entry.kind == MethodKind::Instance ? sig.arity() - 1 : sig.arity();
        size_t given = args.size();
        return JitError::make(ErrorKind::Arity, method + "() takes exactly " +
                                                    std::to_string(shown) + " arguments (" +
                                                    std::to_string(given) + " given)");
    }

    return entry.artifact->call(full_args);
}

Result<types::Value, JitError> ClassDescriptor::get_attr(const Instance& self,
                                                         const std::string& attr) const {
    if (!self.descriptor() || !self.descriptor()->is_subclass_of(*this)) {
        return JitError::make(ErrorKind::AttributeType,
                              "instance of " + self.class_name() + " is not a " + name());
    }
    const auto* accessor = find_accessor(attr);
    if (!accessor) {
        return JitError::make(ErrorKind::UnknownAttribute,
                              name() + " has no attribute '" + attr + "'");
    }
    return accessor->get(self.data());
}

Result<bool, JitError> ClassDescriptor::set_attr(Instance& self, const std::string& attr,
                                                 const types::Value& value) const {
    if (!self.descriptor() || !self.descriptor()->is_subclass_of(*this)) {
        return JitError::make(ErrorKind::AttributeType,
                              "instance of " + self.class_name() + " is not a " + name());
    }
    const auto* accessor = find_accessor(attr);
    if (!accessor) {
        return JitError::make(ErrorKind::UnknownAttribute,
                              name() + " has no attribute '" + attr + "'");
    }
    return accessor->set(self.data(), value);
}

} // namespace autojit::exttypes
