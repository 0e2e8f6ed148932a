#include "exttypes/layout.hpp"

#include <algorithm>
#include <sstream>

namespace autojit::exttypes {

bool AttributeStruct::add_field(const std::string& name, const types::TypePtr& type) {
    if (find(name))
        return false;

    size_t field_align = std::max<size_t>(types::native_align(type), 1);
    size_t offset = (end_ + field_align - 1) / field_align * field_align;
    fields_.push_back(AttributeField{name, type, offset});
    end_ = offset + types::native_size(type);
    align_ = std::max(align_, field_align);
    return true;
}

const AttributeField* AttributeStruct::find(const std::string& name) const {
    for (const auto& field : fields_) {
        if (field.name == name)
            return &field;
    }
    return nullptr;
}

size_t AttributeStruct::size() const {
    return (end_ + align_ - 1) / align_ * align_;
}

bool AttributeStruct::is_prefix_of(const AttributeStruct& derived) const {
    if (fields_.size() > derived.fields_.size())
        return false;
    for (size_t i = 0; i < fields_.size(); ++i) {
        if (fields_[i].name != derived.fields_[i].name ||
            !types::types_equal(fields_[i].type, derived.fields_[i].type))
            return false;
    }
    return true;
}

types::TypePtr AttributeStruct::as_struct_type() const {
    std::vector<types::StructField> fields;
    fields.reserve(fields_.size());
    for (const auto& f : fields_) {
        fields.push_back(types::StructField{f.name, f.type});
    }
    return types::make_struct(class_name_, std::move(fields));
}

std::string AttributeStruct::to_string() const {
    std::ostringstream ss;
    ss << class_name_ << "{";
    for (size_t i = 0; i < fields_.size(); ++i) {
        if (i > 0)
            ss << ", ";
        ss << fields_[i].name << ": " << types::type_to_string(fields_[i].type);
    }
    ss << "}";
    return ss.str();
}

std::optional<size_t> VTableType::index_of(const std::string& name) const {
    for (size_t i = 0; i < slots_.size(); ++i) {
        if (slots_[i].name == name)
            return i;
    }
    return std::nullopt;
}

bool signatures_equal_modulo_receiver(const types::Signature& a, const types::Signature& b) {
    if (a.arity() != b.arity() || !types::types_equal(a.return_type(), b.return_type()))
        return false;
    for (size_t i = 0; i < a.arity(); ++i) {
        const auto& ta = a.args()[i];
        const auto& tb = b.args()[i];
        if (i == 0 && ta && tb && ta->is<types::ExtensionRef>() && tb->is<types::ExtensionRef>())
            continue;
        if (!types::types_equal(ta, tb))
            return false;
    }
    return true;
}

bool VTableType::is_prefix_of(const VTableType& derived) const {
    if (slots_.size() > derived.slots_.size())
        return false;
    for (size_t i = 0; i < slots_.size(); ++i) {
        if (slots_[i].name != derived.slots_[i].name ||
            !signatures_equal_modulo_receiver(slots_[i].signature, derived.slots_[i].signature))
            return false;
    }
    return true;
}

} // namespace autojit::exttypes
