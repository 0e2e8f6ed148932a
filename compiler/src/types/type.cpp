//! # Type Implementation
//!
//! Factories, structural comparison, canonical spelling, type-variable
//! substitution/unification and native layout for the semantic types.
//!
//! ## Canonical Spelling
//!
//! | Type                         | String            |
//! |------------------------------|-------------------|
//! | I32, F64, Bool               | `i4`, `f8`, `b1`  |
//! | pointer to f64               | `f8*`             |
//! | 2-d array of i32             | `i4[:, :]`        |
//! | function pointer i4(i4)      | `i4(i4)*`         |
//! | struct Point {x: f8}         | `Point{x: f8}`    |
//! | instance of class Base       | `instance(Base)`  |
//!
//! The spelling is what `Signature` hashes, so it must be injective over the
//! closed type set.

#include "types/type.hpp"

#include <algorithm>
#include <sstream>

namespace autojit::types {

// ============================================================================
// Factories
// ============================================================================

auto make_primitive(PrimitiveKind kind) -> TypePtr {
    auto type = std::make_shared<Type>();
    type->kind = PrimitiveType{kind};
    return type;
}

auto make_void() -> TypePtr {
    return make_primitive(PrimitiveKind::Void);
}

auto make_bool() -> TypePtr {
    return make_primitive(PrimitiveKind::Bool);
}

auto make_i32() -> TypePtr {
    return make_primitive(PrimitiveKind::I32);
}

auto make_i64() -> TypePtr {
    return make_primitive(PrimitiveKind::I64);
}

auto make_u64() -> TypePtr {
    return make_primitive(PrimitiveKind::U64);
}

auto make_f32() -> TypePtr {
    return make_primitive(PrimitiveKind::F32);
}

auto make_f64() -> TypePtr {
    return make_primitive(PrimitiveKind::F64);
}

auto make_ptr(TypePtr inner) -> TypePtr {
    auto type = std::make_shared<Type>();
    type->kind = PtrType{std::move(inner)};
    return type;
}

auto make_array(TypePtr element, size_t ndim) -> TypePtr {
    auto type = std::make_shared<Type>();
    type->kind = ArrayType{std::move(element), ndim};
    return type;
}

auto make_struct(std::string name, std::vector<StructField> fields) -> TypePtr {
    auto type = std::make_shared<Type>();
    type->kind = StructType{std::move(name), std::move(fields)};
    return type;
}

auto make_func_ptr(std::vector<TypePtr> params, TypePtr ret) -> TypePtr {
    auto type = std::make_shared<Type>();
    type->kind = FuncPtrType{std::move(params), std::move(ret)};
    return type;
}

auto make_object() -> TypePtr {
    auto type = std::make_shared<Type>();
    type->kind = ObjectType{};
    return type;
}

auto make_type_var(std::string name) -> TypePtr {
    auto type = std::make_shared<Type>();
    type->kind = TypeVar{std::move(name)};
    return type;
}

auto make_extension_ref(std::string class_name, uint64_t class_id) -> TypePtr {
    auto type = std::make_shared<Type>();
    type->kind = ExtensionRef{std::move(class_name), class_id};
    return type;
}

// ============================================================================
// Classification
// ============================================================================

auto is_primitive(const TypePtr& type, PrimitiveKind kind) -> bool {
    return type && type->is<PrimitiveType>() && type->as<PrimitiveType>().kind == kind;
}

auto is_integer(const TypePtr& type) -> bool {
    if (!type || !type->is<PrimitiveType>())
        return false;
    switch (type->as<PrimitiveType>().kind) {
    case PrimitiveKind::I8:
    case PrimitiveKind::I16:
    case PrimitiveKind::I32:
    case PrimitiveKind::I64:
    case PrimitiveKind::U8:
    case PrimitiveKind::U16:
    case PrimitiveKind::U32:
    case PrimitiveKind::U64:
        return true;
    default:
        return false;
    }
}

auto is_signed_integer(const TypePtr& type) -> bool {
    if (!type || !type->is<PrimitiveType>())
        return false;
    auto kind = type->as<PrimitiveType>().kind;
    return kind == PrimitiveKind::I8 || kind == PrimitiveKind::I16 || kind == PrimitiveKind::I32 ||
           kind == PrimitiveKind::I64;
}

auto is_float(const TypePtr& type) -> bool {
    return is_primitive(type, PrimitiveKind::F32) || is_primitive(type, PrimitiveKind::F64);
}

auto is_numeric(const TypePtr& type) -> bool {
    return is_integer(type) || is_float(type);
}

auto is_void(const TypePtr& type) -> bool {
    return is_primitive(type, PrimitiveKind::Void);
}

auto contains_type_var(const TypePtr& type) -> bool {
    if (!type)
        return false;

    return std::visit(
        [](const auto& t) -> bool {
            using T = std::decay_t<decltype(t)>;

            if constexpr (std::is_same_v<T, TypeVar>) {
                return true;
            } else if constexpr (std::is_same_v<T, PtrType>) {
                return contains_type_var(t.inner);
            } else if constexpr (std::is_same_v<T, ArrayType>) {
                return contains_type_var(t.element);
            } else if constexpr (std::is_same_v<T, StructType>) {
                return std::any_of(t.fields.begin(), t.fields.end(),
                                   [](const StructField& f) { return contains_type_var(f.type); });
            } else if constexpr (std::is_same_v<T, FuncPtrType>) {
                return contains_type_var(t.return_type) ||
                       std::any_of(t.params.begin(), t.params.end(),
                                   [](const TypePtr& p) { return contains_type_var(p); });
            } else {
                return false;
            }
        },
        type->kind);
}

// ============================================================================
// Display
// ============================================================================

auto primitive_kind_to_string(PrimitiveKind kind) -> std::string {
    switch (kind) {
    case PrimitiveKind::I8:
        return "i1";
    case PrimitiveKind::I16:
        return "i2";
    case PrimitiveKind::I32:
        return "i4";
    case PrimitiveKind::I64:
        return "i8";
    case PrimitiveKind::U8:
        return "u1";
    case PrimitiveKind::U16:
        return "u2";
    case PrimitiveKind::U32:
        return "u4";
    case PrimitiveKind::U64:
        return "u8";
    case PrimitiveKind::F32:
        return "f4";
    case PrimitiveKind::F64:
        return "f8";
    case PrimitiveKind::Bool:
        return "b1";
    case PrimitiveKind::Void:
        return "void";
    }
    return "?";
}

namespace {

auto render_type(const TypePtr& type, bool with_class_id) -> std::string {
    if (!type)
        return "?";

    return std::visit(
        [with_class_id](const auto& t) -> std::string {
            using T = std::decay_t<decltype(t)>;

            if constexpr (std::is_same_v<T, PrimitiveType>) {
                return primitive_kind_to_string(t.kind);
            } else if constexpr (std::is_same_v<T, PtrType>) {
                return (t.inner ? render_type(t.inner, with_class_id) : std::string("void")) +
                       "*";
            } else if constexpr (std::is_same_v<T, ArrayType>) {
                std::ostringstream ss;
                ss << render_type(t.element, with_class_id) << "[";
                for (size_t i = 0; i < t.ndim; ++i) {
                    if (i > 0)
                        ss << ", ";
                    ss << ":";
                }
                ss << "]";
                return ss.str();
            } else if constexpr (std::is_same_v<T, StructType>) {
                std::ostringstream ss;
                ss << (t.name.empty() ? "struct" : t.name) << "{";
                for (size_t i = 0; i < t.fields.size(); ++i) {
                    if (i > 0)
                        ss << ", ";
                    ss << t.fields[i].name << ": "
                       << render_type(t.fields[i].type, with_class_id);
                }
                ss << "}";
                return ss.str();
            } else if constexpr (std::is_same_v<T, FuncPtrType>) {
                std::ostringstream ss;
                ss << render_type(t.return_type, with_class_id) << "(";
                for (size_t i = 0; i < t.params.size(); ++i) {
                    if (i > 0)
                        ss << ", ";
                    ss << render_type(t.params[i], with_class_id);
                }
                ss << ")*";
                return ss.str();
            } else if constexpr (std::is_same_v<T, ObjectType>) {
                return "object";
            } else if constexpr (std::is_same_v<T, TypeVar>) {
                return t.name;
            } else if constexpr (std::is_same_v<T, ExtensionRef>) {
                if (with_class_id && t.class_id != 0)
                    return "instance(" + t.class_name + "#" + std::to_string(t.class_id) + ")";
                return "instance(" + t.class_name + ")";
            } else {
                return "?";
            }
        },
        type->kind);
}

} // namespace

auto type_to_string(const TypePtr& type) -> std::string {
    return render_type(type, false);
}

auto type_key(const TypePtr& type) -> std::string {
    return render_type(type, true);
}

// ============================================================================
// Comparison
// ============================================================================

auto types_equal(const TypePtr& a, const TypePtr& b) -> bool {
    if (!a && !b)
        return true;
    if (!a || !b)
        return false;
    if (a.get() == b.get())
        return true;

    return std::visit(
        [&b](const auto& ta) -> bool {
            using T = std::decay_t<decltype(ta)>;

            if (!std::holds_alternative<T>(b->kind))
                return false;
            const auto& tb = std::get<T>(b->kind);

            if constexpr (std::is_same_v<T, PrimitiveType>) {
                return ta.kind == tb.kind;
            } else if constexpr (std::is_same_v<T, PtrType>) {
                return types_equal(ta.inner, tb.inner);
            } else if constexpr (std::is_same_v<T, ArrayType>) {
                return ta.ndim == tb.ndim && types_equal(ta.element, tb.element);
            } else if constexpr (std::is_same_v<T, StructType>) {
                if (ta.name != tb.name || ta.fields.size() != tb.fields.size())
                    return false;
                for (size_t i = 0; i < ta.fields.size(); ++i) {
                    if (ta.fields[i].name != tb.fields[i].name ||
                        !types_equal(ta.fields[i].type, tb.fields[i].type))
                        return false;
                }
                return true;
            } else if constexpr (std::is_same_v<T, FuncPtrType>) {
                if (ta.params.size() != tb.params.size())
                    return false;
                for (size_t i = 0; i < ta.params.size(); ++i) {
                    if (!types_equal(ta.params[i], tb.params[i]))
                        return false;
                }
                return types_equal(ta.return_type, tb.return_type);
            } else if constexpr (std::is_same_v<T, ObjectType>) {
                return true;
            } else if constexpr (std::is_same_v<T, TypeVar>) {
                return ta.name == tb.name;
            } else if constexpr (std::is_same_v<T, ExtensionRef>) {
                return ta.class_name == tb.class_name && ta.class_id == tb.class_id;
            } else {
                return false;
            }
        },
        a->kind);
}

// ============================================================================
// Substitution and Unification
// ============================================================================

auto substitute_type(const TypePtr& type, const std::unordered_map<std::string, TypePtr>& subs)
    -> TypePtr {
    if (!type || subs.empty())
        return type;

    return std::visit(
        [&type, &subs](const auto& t) -> TypePtr {
            using T = std::decay_t<decltype(t)>;

            if constexpr (std::is_same_v<T, TypeVar>) {
                auto it = subs.find(t.name);
                return it != subs.end() ? it->second : type;
            } else if constexpr (std::is_same_v<T, PtrType>) {
                return make_ptr(substitute_type(t.inner, subs));
            } else if constexpr (std::is_same_v<T, ArrayType>) {
                return make_array(substitute_type(t.element, subs), t.ndim);
            } else if constexpr (std::is_same_v<T, StructType>) {
                std::vector<StructField> fields;
                fields.reserve(t.fields.size());
                for (const auto& f : t.fields) {
                    fields.push_back(StructField{f.name, substitute_type(f.type, subs)});
                }
                return make_struct(t.name, std::move(fields));
            } else if constexpr (std::is_same_v<T, FuncPtrType>) {
                std::vector<TypePtr> params;
                params.reserve(t.params.size());
                for (const auto& p : t.params) {
                    params.push_back(substitute_type(p, subs));
                }
                return make_func_ptr(std::move(params), substitute_type(t.return_type, subs));
            } else {
                return type;
            }
        },
        type->kind);
}

auto unify(const TypePtr& pattern, const TypePtr& concrete,
           std::unordered_map<std::string, TypePtr>& bindings) -> bool {
    if (!pattern || !concrete)
        return pattern == concrete;

    if (pattern->is<TypeVar>()) {
        const auto& name = pattern->as<TypeVar>().name;
        auto it = bindings.find(name);
        if (it == bindings.end()) {
            bindings.emplace(name, concrete);
            return true;
        }
        return types_equal(it->second, concrete);
    }

    if (pattern->kind.index() != concrete->kind.index())
        return false;

    if (pattern->is<PtrType>()) {
        return unify(pattern->as<PtrType>().inner, concrete->as<PtrType>().inner, bindings);
    }
    if (pattern->is<ArrayType>()) {
        const auto& pa = pattern->as<ArrayType>();
        const auto& ca = concrete->as<ArrayType>();
        return pa.ndim == ca.ndim && unify(pa.element, ca.element, bindings);
    }
    if (pattern->is<FuncPtrType>()) {
        const auto& pf = pattern->as<FuncPtrType>();
        const auto& cf = concrete->as<FuncPtrType>();
        if (pf.params.size() != cf.params.size())
            return false;
        for (size_t i = 0; i < pf.params.size(); ++i) {
            if (!unify(pf.params[i], cf.params[i], bindings))
                return false;
        }
        return unify(pf.return_type, cf.return_type, bindings);
    }
    if (pattern->is<StructType>()) {
        const auto& ps = pattern->as<StructType>();
        const auto& cs = concrete->as<StructType>();
        if (ps.name != cs.name || ps.fields.size() != cs.fields.size())
            return false;
        for (size_t i = 0; i < ps.fields.size(); ++i) {
            if (ps.fields[i].name != cs.fields[i].name ||
                !unify(ps.fields[i].type, cs.fields[i].type, bindings))
                return false;
        }
        return true;
    }
    return types_equal(pattern, concrete);
}

namespace {

// Rank within the integer lattice: byte width, unsigned above signed of the same width.
int integer_rank(PrimitiveKind kind) {
    switch (kind) {
    case PrimitiveKind::Bool:
        return 0;
    case PrimitiveKind::I8:
        return 1;
    case PrimitiveKind::U8:
        return 2;
    case PrimitiveKind::I16:
        return 3;
    case PrimitiveKind::U16:
        return 4;
    case PrimitiveKind::I32:
        return 5;
    case PrimitiveKind::U32:
        return 6;
    case PrimitiveKind::I64:
        return 7;
    case PrimitiveKind::U64:
        return 8;
    default:
        return -1;
    }
}

} // namespace

auto promote_numeric(const TypePtr& a, const TypePtr& b) -> TypePtr {
    if (!is_numeric(a) || !is_numeric(b))
        return nullptr;
    if (types_equal(a, b))
        return a;

    if (is_float(a) || is_float(b)) {
        if (is_primitive(a, PrimitiveKind::F64) || is_primitive(b, PrimitiveKind::F64))
            return make_f64();
        // f4 mixed with an integer wider than 16 bits loses precision in f4
        const auto& other = is_float(a) ? b : a;
        if (is_integer(other) && integer_rank(other->as<PrimitiveType>().kind) > 4)
            return make_f64();
        return make_f32();
    }

    auto ka = a->as<PrimitiveType>().kind;
    auto kb = b->as<PrimitiveType>().kind;
    bool sa = is_signed_integer(a);
    bool sb = is_signed_integer(b);
    if (sa != sb) {
        // Mixed signedness: the result must hold the unsigned operand's range.
        const auto& s = sa ? a : b;
        const auto& u = sa ? b : a;
        if (native_size(s) > native_size(u))
            return s;
        switch (native_size(u)) {
        case 1:
            return make_primitive(PrimitiveKind::I16);
        case 2:
            return make_i32();
        case 4:
            return make_i64();
        default:
            return make_f64();
        }
    }
    return integer_rank(ka) >= integer_rank(kb) ? a : b;
}

// ============================================================================
// Native Layout
// ============================================================================

auto native_size(const TypePtr& type) -> size_t {
    if (!type)
        return 0;

    return std::visit(
        [](const auto& t) -> size_t {
            using T = std::decay_t<decltype(t)>;

            if constexpr (std::is_same_v<T, PrimitiveType>) {
                switch (t.kind) {
                case PrimitiveKind::I8:
                case PrimitiveKind::U8:
                case PrimitiveKind::Bool:
                    return 1;
                case PrimitiveKind::I16:
                case PrimitiveKind::U16:
                    return 2;
                case PrimitiveKind::I32:
                case PrimitiveKind::U32:
                case PrimitiveKind::F32:
                    return 4;
                case PrimitiveKind::I64:
                case PrimitiveKind::U64:
                case PrimitiveKind::F64:
                    return 8;
                case PrimitiveKind::Void:
                    return 0;
                }
                return 0;
            } else if constexpr (std::is_same_v<T, StructType>) {
                size_t offset = 0;
                size_t max_align = 1;
                for (const auto& f : t.fields) {
                    size_t align = native_align(f.type);
                    if (align == 0)
                        align = 1;
                    offset = (offset + align - 1) / align * align;
                    offset += native_size(f.type);
                    max_align = std::max(max_align, align);
                }
                return (offset + max_align - 1) / max_align * max_align;
            } else if constexpr (std::is_same_v<T, TypeVar>) {
                return 0;
            } else {
                return sizeof(void*);
            }
        },
        type->kind);
}

auto native_align(const TypePtr& type) -> size_t {
    if (!type)
        return 0;
    if (type->is<StructType>()) {
        size_t max_align = 1;
        for (const auto& f : type->as<StructType>().fields) {
            max_align = std::max(max_align, native_align(f.type));
        }
        return max_align;
    }
    return native_size(type);
}

} // namespace autojit::types
