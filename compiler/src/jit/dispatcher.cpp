#include "jit/dispatcher.hpp"

#include "log/log.hpp"

namespace autojit::jit {

Dispatcher::Dispatcher(FunctionDecl decl, FunctionOptions options,
                       std::shared_ptr<cache::SpecializationCache> cache,
                       std::shared_ptr<PipelineAdapter> adapter, CompileOptions compile_options)
    : decl_(std::move(decl)), options_(std::move(options)), adapter_(std::move(adapter)),
      compile_options_(std::move(compile_options)), cache_(std::move(cache)) {
    shape_.name = decl_.name;
    shape_.arg_names = decl_.params;
    shape_.template_signature = options_.template_signature;
    shape_.locals = options_.locals;

    compile_options_.locals = options_.locals;
    compile_options_.backend = options_.backend;
    compile_options_.nopython = options_.nopython;
}

Result<ArtifactPtr, JitError> Dispatcher::compile_signature(const types::Signature& sig) {
    return cache_->compile_or_get(sig, [this](const types::Signature& key) {
        if (!key.name()) {
            return adapter_->compile(decl_, key, compile_options_);
        }
        CompileOptions named = compile_options_;
        named.symbol_name = *key.name();
        return adapter_->compile(decl_, key, named);
    });
}

Result<types::Value, JitError> Dispatcher::invoke(std::span<const types::Value> args,
                                                  const types::KeywordArgs& kwargs) {
    ArtifactPtr artifact;

    if (fixed_) {
        if (!kwargs.empty()) {
            return JitError::make(ErrorKind::KeywordArgsUnsupported,
                                  decl_.name + "() does not accept keyword arguments (got '" +
                                      kwargs.front().first + "')");
        }
        if (args.size() != fixed_->arity()) {
            return JitError::make(ErrorKind::Arity, decl_.name + "() takes exactly " +
                                                        std::to_string(fixed_->arity()) +
                                                        " arguments (" +
                                                        std::to_string(args.size()) + " given)");
        }
        auto found = cache_->get(*fixed_);
        if (!found) {
            return JitError::make(ErrorKind::Compilation,
                                  decl_.name + " has no specialization for " +
                                      fixed_->canonical());
        }
        artifact = *found;
    } else {
        auto resolved = types::resolve_argtypes(shape_, args, kwargs);
        if (is_err(resolved))
            return unwrap_err(resolved);

        const auto& sig = unwrap(resolved);
        AUTOJIT_LOG_TRACE("dispatch", decl_.name << " called as " << sig.canonical());

        auto compiled = compile_signature(sig);
        if (is_err(compiled))
            return unwrap_err(compiled);
        artifact = unwrap(compiled);
    }

    // The local reference keeps the module alive for the duration of the call.
    return artifact->call(args);
}

Result<ArtifactPtr, JitError> Dispatcher::compile(const std::vector<types::TypePtr>& argtypes,
                                                  types::TypePtr restype) {
    types::Signature sig(std::move(restype), argtypes);
    sig = types::apply_locals(options_.locals, decl_.params, sig);
    return compile_signature(sig);
}

Result<ArtifactPtr, JitError> Dispatcher::compile_fixed(const types::Signature& sig) {
    auto compiled = compile_signature(sig);
    if (is_err(compiled))
        return compiled;

    fixed_ = unwrap(compiled)->signature;
    AUTOJIT_LOG_DEBUG("dispatch", decl_.name << " pinned to " << fixed_->canonical());
    return compiled;
}

} // namespace autojit::jit
