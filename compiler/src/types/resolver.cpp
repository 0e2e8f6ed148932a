#include "types/resolver.hpp"

#include "exttypes/instance.hpp"

namespace autojit::types {

auto type_of(const Value& value) -> Result<TypePtr, JitError> {
    return std::visit(
        [](const auto& v) -> Result<TypePtr, JitError> {
            using T = std::decay_t<decltype(v)>;

            if constexpr (std::is_same_v<T, std::monostate>) {
                return JitError::make(ErrorKind::UnsupportedValue, "None has no native type");
            } else if constexpr (std::is_same_v<T, bool>) {
                return make_bool();
            } else if constexpr (std::is_same_v<T, int32_t>) {
                return make_i32();
            } else if constexpr (std::is_same_v<T, int64_t>) {
                return make_i64();
            } else if constexpr (std::is_same_v<T, uint64_t>) {
                return make_u64();
            } else if constexpr (std::is_same_v<T, float>) {
                return make_f32();
            } else if constexpr (std::is_same_v<T, double>) {
                return make_f64();
            } else if constexpr (std::is_same_v<T, PointerValue>) {
                if (v.is_void)
                    return make_ptr(nullptr);
                if (!v.pointee)
                    return JitError::make(ErrorKind::UnsupportedValue,
                                          "pointer value without a pointee type");
                return make_ptr(v.pointee);
            } else if constexpr (std::is_same_v<T, FunctionValue>) {
                if (!v.signature.has_return_type())
                    return JitError::make(ErrorKind::UnsupportedValue,
                                          "function pointer without a return type");
                return v.signature.as_func_ptr_type();
            } else if constexpr (std::is_same_v<T, StructValue>) {
                if (!v.struct_type || !v.struct_type->template is<StructType>())
                    return JitError::make(ErrorKind::UnsupportedValue,
                                          "struct value without a struct type");
                return v.struct_type;
            } else if constexpr (std::is_same_v<T, ArrayValue>) {
                if (!v.element || v.ndim == 0)
                    return JitError::make(ErrorKind::UnsupportedValue,
                                          "array value without an element type");
                return make_array(v.element, v.ndim);
            } else if constexpr (std::is_same_v<T, ObjectValue>) {
                return make_object();
            } else if constexpr (std::is_same_v<T, InstanceValue>) {
                auto type = v.instance ? v.instance->instance_type() : nullptr;
                if (!type)
                    return JitError::make(ErrorKind::UnsupportedValue, "empty instance handle");
                return type;
            } else {
                return JitError::make(ErrorKind::UnsupportedValue, "unsupported value");
            }
        },
        value.data);
}

auto apply_locals(const LocalsMap& locals, const std::vector<std::string>& arg_names,
                  const Signature& sig) -> Signature {
    if (locals.empty())
        return sig;

    std::vector<TypePtr> args = sig.args();
    for (size_t i = 0; i < arg_names.size() && i < args.size(); ++i) {
        auto it = locals.find(arg_names[i]);
        if (it != locals.end() && it->second) {
            args[i] = it->second;
        }
    }
    return sig.with_args(std::move(args));
}

auto resolve_template(const LocalsMap& locals, const Signature& tmpl,
                      const std::vector<std::string>& arg_names,
                      const std::vector<TypePtr>& arg_types) -> Result<Signature, JitError> {
    if (tmpl.arity() != arg_types.size()) {
        return JitError::make(ErrorKind::SignatureMismatch,
                              "signature " + tmpl.to_string() + " expects " +
                                  std::to_string(tmpl.arity()) + " arguments, got " +
                                  std::to_string(arg_types.size()));
    }

    std::unordered_map<std::string, TypePtr> bindings;
    for (size_t i = 0; i < arg_types.size(); ++i) {
        const auto& pattern = tmpl.args()[i];
        if (!contains_type_var(pattern))
            continue;
        if (!unify(pattern, arg_types[i], bindings)) {
            return JitError::make(ErrorKind::SignatureMismatch,
                                  "argument " + std::to_string(i) + " of type " +
                                      type_to_string(arg_types[i]) + " does not match " +
                                      type_to_string(pattern) + " in " + tmpl.to_string());
        }
    }

    std::vector<TypePtr> args;
    args.reserve(arg_types.size());
    for (const auto& pattern : tmpl.args()) {
        args.push_back(substitute_type(pattern, bindings));
    }

    // A return type that mentions an unbound variable is left to inference.
    TypePtr ret = substitute_type(tmpl.return_type(), bindings);
    if (contains_type_var(ret))
        ret = nullptr;

    return apply_locals(locals, arg_names, Signature(std::move(ret), std::move(args), tmpl.name()));
}

auto signature_from_values(std::span<const Value> args, TypePtr return_type,
                           std::optional<std::string> name) -> Result<Signature, JitError> {
    std::vector<TypePtr> types;
    types.reserve(args.size());
    for (size_t i = 0; i < args.size(); ++i) {
        auto ty = type_of(args[i]);
        if (is_err(ty)) {
            return unwrap_err(ty).with_note("while resolving argument " + std::to_string(i));
        }
        types.push_back(unwrap(ty));
    }
    return Signature(std::move(return_type), std::move(types), std::move(name));
}

auto resolve_argtypes(const CallableShape& callable, std::span<const Value> args,
                      const KeywordArgs& kwargs) -> Result<Signature, JitError> {
    if (!kwargs.empty()) {
        return JitError::make(ErrorKind::KeywordArgsUnsupported,
                              callable.name + "() does not accept keyword arguments (got '" +
                                  kwargs.front().first + "')");
    }

    if (args.size() != callable.arg_names.size()) {
        return JitError::make(ErrorKind::Arity, callable.name + "() takes exactly " +
                                                    std::to_string(callable.arg_names.size()) +
                                                    " arguments (" + std::to_string(args.size()) +
                                                    " given)");
    }

    auto observed = signature_from_values(args);
    if (is_err(observed))
        return observed;

    if (callable.template_signature) {
        return resolve_template(callable.locals, *callable.template_signature, callable.arg_names,
                                unwrap(observed).args());
    }
    return apply_locals(callable.locals, callable.arg_names, unwrap(observed));
}

} // namespace autojit::types
