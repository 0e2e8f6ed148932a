#include "jit/marshal.hpp"

#include "exttypes/class_descriptor.hpp"
#include "exttypes/instance.hpp"

#include <cmath>
#include <cstring>
#include <limits>

namespace autojit::jit {

using types::PrimitiveKind;
using types::Value;

namespace {

struct IntRange {
    int64_t min;
    uint64_t max;
};

auto int_range(PrimitiveKind kind) -> IntRange {
    switch (kind) {
    case PrimitiveKind::I8:
        return {INT8_MIN, INT8_MAX};
    case PrimitiveKind::I16:
        return {INT16_MIN, INT16_MAX};
    case PrimitiveKind::I32:
        return {INT32_MIN, INT32_MAX};
    case PrimitiveKind::I64:
        return {INT64_MIN, INT64_MAX};
    case PrimitiveKind::U8:
        return {0, UINT8_MAX};
    case PrimitiveKind::U16:
        return {0, UINT16_MAX};
    case PrimitiveKind::U32:
        return {0, UINT32_MAX};
    case PrimitiveKind::U64:
        return {0, UINT64_MAX};
    default:
        return {0, 0};
    }
}

auto mismatch(const Value& value, const types::TypePtr& target) -> JitError {
    return JitError::make(ErrorKind::AttributeType, "cannot convert " + value.to_string() +
                                                        " to " + types::type_to_string(target));
}

/// Integer value in the storage alternative used for `kind`.
auto integer_value(PrimitiveKind kind, bool negative, int64_t s, uint64_t u) -> Value {
    switch (kind) {
    case PrimitiveKind::I8:
    case PrimitiveKind::I16:
    case PrimitiveKind::I32:
        return static_cast<int32_t>(negative ? s : static_cast<int64_t>(u));
    case PrimitiveKind::I64:
        return negative ? s : static_cast<int64_t>(u);
    default:
        return u;
    }
}

auto coerce_to_primitive(const Value& value, const types::TypePtr& target, PrimitiveKind kind)
    -> Result<Value, JitError> {
    if (kind == PrimitiveKind::Void)
        return mismatch(value, target);

    if (value.is<bool>()) {
        if (kind == PrimitiveKind::Bool)
            return value;
        return mismatch(value, target);
    }
    if (kind == PrimitiveKind::Bool)
        return mismatch(value, target);

    bool is_int = value.is<int32_t>() || value.is<int64_t>() || value.is<uint64_t>();
    bool is_flt = value.is<float>() || value.is<double>();
    if (!is_int && !is_flt)
        return mismatch(value, target);

    if (kind == PrimitiveKind::F32 || kind == PrimitiveKind::F64) {
        double d = 0.0;
        if (value.is<int32_t>())
            d = static_cast<double>(value.as<int32_t>());
        else if (value.is<int64_t>())
            d = static_cast<double>(value.as<int64_t>());
        else if (value.is<uint64_t>())
            d = static_cast<double>(value.as<uint64_t>());
        else if (value.is<float>())
            d = static_cast<double>(value.as<float>());
        else
            d = value.as<double>();
        if (kind == PrimitiveKind::F32)
            return static_cast<float>(d);
        return d;
    }

    // Integer target
    bool negative = false;
    int64_t s = 0;
    uint64_t u = 0;
    if (value.is<int32_t>() || value.is<int64_t>()) {
        s = value.is<int32_t>() ? value.as<int32_t>() : value.as<int64_t>();
        negative = s < 0;
        u = negative ? 0 : static_cast<uint64_t>(s);
    } else if (value.is<uint64_t>()) {
        u = value.as<uint64_t>();
    } else {
        double d = value.is<float>() ? value.as<float>() : value.as<double>();
        if (!std::isfinite(d) || std::trunc(d) != d || d < -9.2233720368547758e18 ||
            d >= 1.8446744073709552e19)
            return mismatch(value, target);
        negative = d < 0;
        if (negative)
            s = static_cast<int64_t>(d);
        else
            u = static_cast<uint64_t>(d);
    }

    auto range = int_range(kind);
    if (negative ? s < range.min : u > range.max)
        return mismatch(value, target);
    return integer_value(kind, negative, s, u);
}

// An unbound reference (class id 0) names no class, so nothing matches it.
auto is_instance_of(const exttypes::Instance& instance, const types::ExtensionRef& ref) -> bool {
    const auto* descriptor = instance.descriptor().get();
    return descriptor && ref.class_id != 0 && descriptor->is_subclass_of(ref.class_id);
}

} // namespace

auto coerce_value(const Value& value, const types::TypePtr& target) -> Result<Value, JitError> {
    if (!target)
        return mismatch(value, target);

    if (target->is<types::PrimitiveType>())
        return coerce_to_primitive(value, target, target->as<types::PrimitiveType>().kind);

    if (target->is<types::PtrType>()) {
        if (!value.is<types::PointerValue>())
            return mismatch(value, target);
        const auto& ptr = value.as<types::PointerValue>();
        const auto& inner = target->as<types::PtrType>().inner;
        if (!inner || (!ptr.is_void && types::types_equal(ptr.pointee, inner)))
            return value;
        return mismatch(value, target);
    }

    if (target->is<types::ArrayType>()) {
        if (!value.is<types::ArrayValue>())
            return mismatch(value, target);
        const auto& arr = value.as<types::ArrayValue>();
        const auto& at = target->as<types::ArrayType>();
        if (arr.ndim == at.ndim && types::types_equal(arr.element, at.element))
            return value;
        return mismatch(value, target);
    }

    if (target->is<types::StructType>()) {
        if (value.is<types::StructValue>() &&
            types::types_equal(value.as<types::StructValue>().struct_type, target))
            return value;
        return mismatch(value, target);
    }

    if (target->is<types::FuncPtrType>()) {
        if (value.is<types::FunctionValue>() &&
            types::types_equal(value.as<types::FunctionValue>().signature.as_func_ptr_type(),
                               target))
            return value;
        return mismatch(value, target);
    }

    if (target->is<types::ObjectType>()) {
        if (value.is<types::ObjectValue>())
            return value;
        return mismatch(value, target);
    }

    if (target->is<types::ExtensionRef>()) {
        if (value.is<types::InstanceValue>()) {
            const auto& inst = value.as<types::InstanceValue>().instance;
            if (inst && is_instance_of(*inst, target->as<types::ExtensionRef>()))
                return value;
        }
        return mismatch(value, target);
    }

    return JitError::make(ErrorKind::AttributeType,
                          "unresolved type " + types::type_to_string(target));
}

auto write_native(const Value& value, const types::TypePtr& type, void* dst)
    -> Result<bool, JitError> {
    if (!type || !dst)
        return mismatch(value, type);

    if (type->is<types::PrimitiveType>()) {
        auto kind = type->as<types::PrimitiveType>().kind;
        auto store = [dst](auto v) { std::memcpy(dst, &v, sizeof(v)); };
        switch (kind) {
        case PrimitiveKind::Bool:
            if (!value.is<bool>())
                return mismatch(value, type);
            store(static_cast<uint8_t>(value.as<bool>() ? 1 : 0));
            return true;
        case PrimitiveKind::F32:
            if (!value.is<float>())
                return mismatch(value, type);
            store(value.as<float>());
            return true;
        case PrimitiveKind::F64:
            if (!value.is<double>())
                return mismatch(value, type);
            store(value.as<double>());
            return true;
        case PrimitiveKind::Void:
            return true;
        default:
            break;
        }

        uint64_t bits = 0;
        if (value.is<int32_t>())
            bits = static_cast<uint64_t>(static_cast<int64_t>(value.as<int32_t>()));
        else if (value.is<int64_t>())
            bits = static_cast<uint64_t>(value.as<int64_t>());
        else if (value.is<uint64_t>())
            bits = value.as<uint64_t>();
        else
            return mismatch(value, type);

        switch (types::native_size(type)) {
        case 1:
            store(static_cast<uint8_t>(bits));
            break;
        case 2:
            store(static_cast<uint16_t>(bits));
            break;
        case 4:
            store(static_cast<uint32_t>(bits));
            break;
        default:
            store(bits);
            break;
        }
        return true;
    }

    void* address = nullptr;
    if (value.is<types::PointerValue>()) {
        address = value.as<types::PointerValue>().address;
    } else if (value.is<types::ArrayValue>()) {
        address = value.as<types::ArrayValue>().data;
    } else if (value.is<types::FunctionValue>()) {
        address = value.as<types::FunctionValue>().address;
    } else if (value.is<types::ObjectValue>()) {
        address = value.as<types::ObjectValue>().handle.get();
    } else if (value.is<types::InstanceValue>()) {
        const auto& inst = value.as<types::InstanceValue>().instance;
        if (!inst)
            return mismatch(value, type);
        address = inst->data();
    } else if (value.is<types::StructValue>()) {
        const auto& sv = value.as<types::StructValue>();
        if (sv.bytes.size() != types::native_size(type))
            return mismatch(value, type);
        std::memcpy(dst, sv.bytes.data(), sv.bytes.size());
        return true;
    } else {
        return mismatch(value, type);
    }
    std::memcpy(dst, &address, sizeof(address));
    return true;
}

auto read_native(const types::TypePtr& type, const void* src) -> Result<Value, JitError> {
    if (!type) {
        return JitError::make(ErrorKind::UnsupportedValue, "cannot read a value of unknown type");
    }

    auto load = [src](auto tag) {
        decltype(tag) v;
        std::memcpy(&v, src, sizeof(v));
        return v;
    };

    if (type->is<types::PrimitiveType>()) {
        switch (type->as<types::PrimitiveType>().kind) {
        case PrimitiveKind::I8:
            return static_cast<int32_t>(load(int8_t{}));
        case PrimitiveKind::I16:
            return static_cast<int32_t>(load(int16_t{}));
        case PrimitiveKind::I32:
            return load(int32_t{});
        case PrimitiveKind::I64:
            return load(int64_t{});
        case PrimitiveKind::U8:
            return static_cast<uint64_t>(load(uint8_t{}));
        case PrimitiveKind::U16:
            return static_cast<uint64_t>(load(uint16_t{}));
        case PrimitiveKind::U32:
            return static_cast<uint64_t>(load(uint32_t{}));
        case PrimitiveKind::U64:
            return load(uint64_t{});
        case PrimitiveKind::F32:
            return load(float{});
        case PrimitiveKind::F64:
            return load(double{});
        case PrimitiveKind::Bool:
            return (load(uint8_t{}) & 1) != 0;
        case PrimitiveKind::Void:
            return Value{};
        }
    }

    if (type->is<types::StructType>()) {
        types::StructValue sv;
        sv.struct_type = type;
        sv.bytes.resize(types::native_size(type));
        std::memcpy(sv.bytes.data(), src, sv.bytes.size());
        return sv;
    }

    void* address = load(static_cast<void*>(nullptr));
    if (type->is<types::PtrType>()) {
        const auto& inner = type->as<types::PtrType>().inner;
        return types::PointerValue{inner, address, inner == nullptr};
    }
    if (type->is<types::FuncPtrType>()) {
        auto sig = types::signature_from_type(type);
        if (is_err(sig))
            return unwrap_err(sig);
        return types::FunctionValue{unwrap(sig), address};
    }
    if (type->is<types::ObjectType>()) {
        // Borrowed: native code cannot transfer ownership of a host object.
        return types::ObjectValue{std::shared_ptr<void>(address, [](void*) {}), "object"};
    }

    return JitError::make(ErrorKind::UnsupportedValue,
                          "cannot return a value of type " + types::type_to_string(type) +
                              " from native code");
}

} // namespace autojit::jit
