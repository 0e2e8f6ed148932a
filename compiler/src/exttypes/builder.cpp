//! # Extension Type Builder Implementation
//!
//! One `ClassBuild` per `ClassBuilder::build` call holds the working state.
//! Each stage either advances the state or returns the error that aborts the
//! build; the descriptor only exists once every stage succeeded.

#include "exttypes/builder.hpp"

#include "cache/specialization_cache.hpp"
#include "exttypes/inheritance.hpp"
#include "log/log.hpp"

#include <algorithm>
#include <unordered_map>
#include <unordered_set>

namespace autojit::exttypes {

namespace {

// Object handles, instances and arrays travel as borrowed pointers. An
// attribute struct has no way to keep their owners alive.
bool holds_host_reference(const types::TypePtr& type) {
    if (!type)
        return false;
    if (type->is<types::ObjectType>() || type->is<types::ExtensionRef>() ||
        type->is<types::ArrayType>())
        return true;
    if (type->is<types::StructType>()) {
        const auto& fields = type->as<types::StructType>().fields;
        return std::any_of(fields.begin(), fields.end(), [](const types::StructField& field) {
            return holds_host_reference(field.type);
        });
    }
    return false;
}

class ClassBuild {
public:
    ClassBuild(jit::PipelineAdapter& adapter, const jit::CompileOptions& options,
               const ClassDecl& decl)
        : adapter_(adapter), options_(options), decl_(decl),
          ext_(std::make_shared<ExtensionType>(decl.name)), working_struct_(decl.name) {}

    // ------------------------------------------------------------------------
    // Stage 1: inherit from the primary native base
    // ------------------------------------------------------------------------

    Result<bool, JitError> inherit() {
        for (const auto& base : decl_.bases) {
            if (base.native) {
                native_bases_.push_back(base.native);
                base_layouts_.push_back(NativeBaseLayout{base.native->name(),
                                                         base.native->attribute_struct().get(),
                                                         base.native->vtable_type().get()});
            }
        }
        if (native_bases_.empty())
            return true;

        const auto& primary = native_bases_.front();
        ext_->set_parent(primary->attribute_struct(), primary->vtable_type());

        for (const auto& field : primary->attribute_struct()->fields()) {
            working_struct_.add_field(field.name, field.type);
            ext_->symtab().define(field.name, types::Variable{field.type, false});
        }

        VTableType seed_vtab;
        for (const auto& parent_method : primary->extension_type().methods()) {
            MethodEntry entry = parent_method;
            entry.inherited = true;
            if (entry.kind == MethodKind::Instance)
                entry.signature =
                    with_receiver(without_receiver(parent_method)).with_name(entry.name);
            seed_vtab.add_slot(VTableSlot{entry.name, entry.signature});
            ext_->add_method(std::move(entry));
        }

        for (const auto& base : native_bases_) {
            for (const auto& host : base->host_methods()) {
                add_host_method(host);
            }
        }

        AUTOJIT_LOG_DEBUG("exttypes", decl_.name << " inherits " << working_struct_.to_string()
                                                 << " from " << primary->name());
        return verify_bases(base_layouts_, working_struct_, seed_vtab);
    }

    // ------------------------------------------------------------------------
    // Stage 2: declared attributes and method annotations
    // ------------------------------------------------------------------------

    Result<bool, JitError> collect_signatures(const ExplicitSignatures& explicit_signatures) {
        for (const auto& [name, type] : decl_.attribute_types) {
            if (!is_storable(type)) {
                return JitError::make(ErrorKind::SignatureMismatch,
                                      "attribute '" + name + "' of " + decl_.name +
                                          " needs a concrete type, got " +
                                          types::type_to_string(type));
            }
            auto owned = check_owned(name, type);
            if (is_err(owned))
                return owned;
            auto existing = ext_->symtab().lookup(name);
            if (existing && !types::types_equal(existing->type, type)) {
                return JitError::make(ErrorKind::LayoutIncompatible,
                                      "attribute '" + name + "' is " +
                                          types::type_to_string(existing->type) +
                                          " in a base class but declared " +
                                          types::type_to_string(type) + " in " + decl_.name);
            }
            if (!existing)
                ext_->symtab().define(name, types::Variable{type, false});
        }

        std::unordered_map<std::string, types::Signature> annotations;
        auto annotate = [&](const std::string& method,
                            const types::Signature& sig) -> Result<bool, JitError> {
            auto it = annotations.find(method);
            if (it != annotations.end() && it->second != sig) {
                return JitError::make(ErrorKind::DuplicateMethodSignature,
                                      "method " + decl_.name + "." + method +
                                          " has conflicting signatures " +
                                          it->second.canonical() + " and " + sig.canonical());
            }
            annotations.insert_or_assign(method, sig);
            return true;
        };

        std::unordered_set<std::string> declared;
        for (const auto& md : decl_.methods) {
            if (!declared.insert(md.decl.name).second) {
                return JitError::make(ErrorKind::DuplicateMethodSignature,
                                      "method " + decl_.name + "." + md.decl.name +
                                          " is declared more than once");
            }
            if (md.signature) {
                auto r = annotate(md.decl.name, *md.signature);
                if (is_err(r))
                    return r;
            }
        }
        for (const auto& [method, sig] : explicit_signatures) {
            if (!declared.count(method)) {
                return JitError::make(ErrorKind::UnknownMethod, "signature given for " +
                                                                    decl_.name + "." + method +
                                                                    ", which is not declared");
            }
            auto r = annotate(method, sig);
            if (is_err(r))
                return r;
        }

        for (const auto& md : decl_.methods) {
            const auto& name = md.decl.name;
            std::optional<types::Signature> sig;
            if (auto it = annotations.find(name); it != annotations.end()) {
                sig = it->second;
            } else if (auto index = ext_->find_method(name)) {
                // Unannotated override: keep the inherited contract.
                sig = without_receiver(ext_->methods()[*index]);
            }

            if (!sig) {
                add_host_method(name);
                continue;
            }

            size_t receiver = md.kind == MethodKind::Instance ? 1 : 0;
            if (md.decl.params.size() != sig->arity() + receiver) {
                return JitError::make(
                    ErrorKind::SignatureMismatch,
                    decl_.name + "." + name + " takes " +
                        std::to_string(md.decl.params.size() - std::min(receiver, md.decl.params.size())) +
                        " arguments but its signature " + sig->canonical() + " has " +
                        std::to_string(sig->arity()));
            }

            types::Signature full =
                md.kind == MethodKind::Instance ? with_receiver(*sig) : sig->with_name(name);
            ext_->add_method(MethodEntry{name, full.with_name(name), md.kind, false});
            native_decls_.emplace(name, &md);
            host_methods_.erase(std::remove(host_methods_.begin(), host_methods_.end(), name),
                                host_methods_.end());
        }
        return true;
    }

    // ------------------------------------------------------------------------
    // Stage 3: infer the constructor
    // ------------------------------------------------------------------------

    Result<bool, JitError> infer_constructor() {
        auto it = native_decls_.find("__init__");
        if (it == native_decls_.end())
            return true;

        auto index = ext_->find_method("__init__");
        MethodEntry entry = ext_->methods()[*index];
        types::TypePtr hint =
            entry.signature.has_return_type() ? entry.signature.return_type() : types::make_void();

        auto opts = method_options();
        auto inferred = adapter_.infer_types(it->second->decl, hint, entry.signature.args(), opts);
        if (is_err(inferred))
            return unwrap_err(inferred).with_note("while inferring " + decl_.name + ".__init__");

        const auto& result = unwrap(inferred);
        if (!types::is_void(result.signature.return_type())) {
            return JitError::make(ErrorKind::SignatureMismatch,
                                  decl_.name + ".__init__ must return void, inferred " +
                                      types::type_to_string(result.signature.return_type()));
        }

        auto recorded = record_assignments("__init__", result.attribute_assignments, false);
        if (is_err(recorded))
            return recorded;

        entry.signature = entry.signature.with_return_type(types::make_void());
        ext_->add_method(std::move(entry));
        return true;
    }

    // ------------------------------------------------------------------------
    // Stage 4: finalize the attribute struct
    // ------------------------------------------------------------------------

    Result<bool, JitError> finalize_struct() {
        for (const auto& [name, var] : ext_->symtab().entries()) {
            if (working_struct_.find(name))
                continue;
            if (!is_storable(var.type)) {
                return JitError::make(ErrorKind::SignatureMismatch,
                                      "attribute '" + name + "' of " + decl_.name +
                                          " has no concrete type");
            }
            auto owned = check_owned(name, var.type);
            if (is_err(owned))
                return owned;
            working_struct_.add_field(name, var.type);
        }
        ext_->set_attribute_struct(std::make_shared<AttributeStruct>(working_struct_));
        AUTOJIT_LOG_DEBUG("exttypes", "attribute struct " << working_struct_.to_string() << " ("
                                                          << working_struct_.size() << " bytes)");
        return true;
    }

    // ------------------------------------------------------------------------
    // Stage 5: infer the remaining methods
    // ------------------------------------------------------------------------

    Result<bool, JitError> infer_methods() {
        // Copy: entries are replaced while iterating.
        const std::vector<MethodEntry> methods = ext_->methods();
        for (auto entry : methods) {
            if (entry.inherited || entry.name == "__init__")
                continue;

            const auto* md = native_decls_.at(entry.name);
            auto opts = method_options();
            auto inferred = adapter_.infer_types(md->decl, entry.signature.return_type(),
                                                 entry.signature.args(), opts);
            if (is_err(inferred))
                return unwrap_err(inferred).with_note("while inferring " + decl_.name + "." +
                                                      entry.name);

            const auto& result = unwrap(inferred);
            const auto& ret = result.signature.return_type();
            if (entry.signature.has_return_type() &&
                !types::types_equal(entry.signature.return_type(), ret)) {
                return JitError::make(ErrorKind::SignatureMismatch,
                                      decl_.name + "." + entry.name + " is declared to return " +
                                          types::type_to_string(entry.signature.return_type()) +
                                          " but returns " + types::type_to_string(ret));
            }

            auto recorded = record_assignments(entry.name, result.attribute_assignments, true);
            if (is_err(recorded))
                return recorded;

            entry.signature = entry.signature.with_return_type(ret);
            ext_->add_method(std::move(entry));
        }
        return true;
    }

    // ------------------------------------------------------------------------
    // Stage 6: finalize the vtable type
    // ------------------------------------------------------------------------

    Result<bool, JitError> finalize_vtable() {
        auto vtab = std::make_shared<VTableType>();
        for (const auto& m : ext_->methods()) {
            vtab->add_slot(VTableSlot{m.name, m.signature});
        }
        ext_->set_vtab_type(vtab);
        if (base_layouts_.empty())
            return true;
        return verify_bases(base_layouts_, *ext_->attribute_struct(), *vtab);
    }

    // ------------------------------------------------------------------------
    // Stage 7: compile own methods, reuse inherited ones
    // ------------------------------------------------------------------------

    Result<bool, JitError> compile_methods() {
        const auto& methods = ext_->methods();
        ClassDescriptorPtr primary = native_bases_.empty() ? nullptr : native_bases_.front();

        for (size_t i = 0; i < methods.size(); ++i) {
            const auto& m = methods[i];
            if (m.inherited) {
                jit::ArtifactPtr artifact;
                if (primary && i < primary->methods().size() &&
                    primary->methods()[i].name == m.name) {
                    artifact = primary->methods()[i].artifact;
                }
                if (!artifact) {
                    return JitError::make(ErrorKind::InheritedMethodMissing,
                                          decl_.name + " inherits '" + m.name + "' but " +
                                              (primary ? primary->name() : std::string("its base")) +
                                              " has no compiled entry for it");
                }
                compiled_.push_back(NativeMethod{m.name, m.kind, std::move(artifact), true});
                continue;
            }

            const auto* md = native_decls_.at(m.name);
            auto opts = method_options();
            opts.symbol_name = cache::mangle_symbol(decl_.name + "_" + m.name, m.signature);

            auto compiled = adapter_.compile(md->decl, m.signature, opts);
            if (is_err(compiled))
                return unwrap_err(compiled).with_note("while compiling " + decl_.name + "." +
                                                      m.name);
            compiled_.push_back(NativeMethod{m.name, m.kind, unwrap(compiled), false});
            AUTOJIT_LOG_DEBUG("exttypes", "compiled " << decl_.name << "." << m.name << " "
                                                      << m.signature.canonical());
        }
        return true;
    }

    // ------------------------------------------------------------------------
    // Stages 8 and 9: accessors and assembly
    // ------------------------------------------------------------------------

    void build_accessors() {
        for (const auto& field : ext_->attribute_struct()->fields()) {
            accessors_.push_back(Accessor{field.name, field.type, field.offset});
        }
    }

    ClassDescriptorPtr assemble() {
        return std::make_shared<ClassDescriptor>(ext_, native_bases_, std::move(compiled_),
                                                       std::move(accessors_),
                                                       std::move(host_methods_));
    }

private:
    static bool is_storable(const types::TypePtr& type) {
        return type && !types::contains_type_var(type) && !types::is_void(type);
    }

    Result<bool, JitError> check_owned(const std::string& name,
                                       const types::TypePtr& type) const {
        if (!holds_host_reference(type))
            return true;
        return JitError::make(ErrorKind::AttributeType,
                              "attribute '" + name + "' of " + decl_.name + " cannot hold " +
                                  types::type_to_string(type) +
                                  ": only values stored by copy fit an attribute struct");
    }

    types::Signature with_receiver(const types::Signature& sig) const {
        std::vector<types::TypePtr> args;
        args.reserve(sig.arity() + 1);
        args.push_back(ext_->instance_type());
        args.insert(args.end(), sig.args().begin(), sig.args().end());
        return types::Signature(sig.return_type(), std::move(args), sig.name());
    }

    static types::Signature without_receiver(const MethodEntry& entry) {
        if (entry.kind != MethodKind::Instance || entry.signature.arity() == 0)
            return entry.signature;
        std::vector<types::TypePtr> args(entry.signature.args().begin() + 1,
                                         entry.signature.args().end());
        return types::Signature(entry.signature.return_type(), std::move(args));
    }

    void add_host_method(const std::string& name) {
        if (std::find(host_methods_.begin(), host_methods_.end(), name) == host_methods_.end())
            host_methods_.push_back(name);
    }

    jit::CompileOptions method_options() const {
        jit::CompileOptions opts = options_;
        opts.owner = ext_.get();
        opts.wrap = true;
        opts.symbol_name.reset();
        return opts;
    }

    /// Types the attributes assigned by `method`. Before the struct is frozen
    /// new attributes are added and inferred ones may be widened; afterwards
    /// every assignment must fit an existing field.
    Result<bool, JitError>
    record_assignments(const std::string& method,
                       const std::vector<std::pair<std::string, types::TypePtr>>& assignments,
                       bool frozen) {
        auto& symtab = ext_->symtab();
        for (const auto& [attr, type] : assignments) {
            auto existing = symtab.lookup(attr);
            if (!existing) {
                if (frozen) {
                    return JitError::make(ErrorKind::SignatureMismatch,
                                          decl_.name + "." + method + " assigns attribute '" +
                                              attr + "', which is not defined on " + decl_.name);
                }
                symtab.define(attr, types::Variable{type, true});
                continue;
            }
            if (types::types_equal(existing->type, type))
                continue;

            auto promoted = types::promote_numeric(existing->type, type);
            if (!frozen && existing->promotable) {
                if (!promoted) {
                    return JitError::make(ErrorKind::SignatureMismatch,
                                          "attribute '" + attr + "' of " + decl_.name +
                                              " is assigned both " +
                                              types::type_to_string(existing->type) + " and " +
                                              types::type_to_string(type));
                }
                symtab.define(attr, types::Variable{promoted, true});
                continue;
            }

            // Fixed type: accept only values that widen into it.
            if (!promoted || !types::types_equal(promoted, existing->type)) {
                return JitError::make(ErrorKind::SignatureMismatch,
                                      decl_.name + "." + method + " assigns " +
                                          types::type_to_string(type) + " to attribute '" + attr +
                                          "' of type " + types::type_to_string(existing->type));
            }
        }
        return true;
    }

    jit::PipelineAdapter& adapter_;
    const jit::CompileOptions& options_;
    const ClassDecl& decl_;

    std::shared_ptr<ExtensionType> ext_;
    AttributeStruct working_struct_;
    std::vector<ClassDescriptorPtr> native_bases_;
    std::vector<NativeBaseLayout> base_layouts_;
    std::unordered_map<std::string, const MethodDecl*> native_decls_;
    std::vector<std::string> host_methods_;
    std::vector<NativeMethod> compiled_;
    std::vector<Accessor> accessors_;
};

} // namespace

ClassBuilder::ClassBuilder(jit::PipelineAdapter& adapter, jit::CompileOptions options)
    : adapter_(adapter), options_(std::move(options)) {}

Result<ClassDescriptorPtr, JitError> ClassBuilder::build(const ClassDecl& decl,
                                                         const ExplicitSignatures& explicit_signatures) {
    AUTOJIT_LOG_DEBUG("exttypes", "building class " << decl.name);
    ClassBuild state(adapter_, options_, decl);

    auto inherited = state.inherit();
    if (is_err(inherited))
        return unwrap_err(inherited);

    auto collected = state.collect_signatures(explicit_signatures);
    if (is_err(collected))
        return unwrap_err(collected);

    auto ctor = state.infer_constructor();
    if (is_err(ctor))
        return unwrap_err(ctor);

    auto layout = state.finalize_struct();
    if (is_err(layout))
        return unwrap_err(layout);

    auto methods = state.infer_methods();
    if (is_err(methods))
        return unwrap_err(methods);

    auto vtab = state.finalize_vtable();
    if (is_err(vtab))
        return unwrap_err(vtab);

    auto compiled = state.compile_methods();
    if (is_err(compiled))
        return unwrap_err(compiled);

    state.build_accessors();
    auto descriptor = state.assemble();
    AUTOJIT_LOG_INFO("exttypes", "built class " << decl.name << " with "
                                                << descriptor->methods().size()
                                                << " native methods");
    return descriptor;
}

} // namespace autojit::exttypes
