#include "jit/pipeline.hpp"

namespace autojit::jit {

auto PipelineAdapter::infer_types(const FunctionDecl& decl, const types::TypePtr& return_type_hint,
                                  const std::vector<types::TypePtr>& arg_types,
                                  const CompileOptions& options)
    -> Result<InferenceResult, JitError> {
    if (decl.infer) {
        InferenceRequest request{decl, return_type_hint, arg_types, options};
        auto result = decl.infer(request);
        if (is_err(result)) {
            return unwrap_err(result).with_note("while inferring types of '" + decl.name + "'");
        }
        auto& inferred = unwrap(result);
        if (!inferred.signature.has_return_type()) {
            return JitError::make(ErrorKind::Compilation,
                                  "inference for '" + decl.name + "' left the return type unknown");
        }
        return std::move(inferred);
    }

    if (!return_type_hint) {
        return JitError::make(ErrorKind::Compilation,
                              "cannot infer the return type of '" + decl.name +
                                  "': the declaration has no inference hook");
    }

    InferenceResult result;
    result.signature = types::Signature(return_type_hint, arg_types);
    for (size_t i = 0; i < decl.params.size() && i < arg_types.size(); ++i) {
        result.symtab.define(decl.params[i], types::Variable{arg_types[i], false});
    }
    return result;
}

auto PipelineAdapter::complete_signature(const FunctionDecl& decl, const types::Signature& sig,
                                         const CompileOptions& options)
    -> Result<types::Signature, JitError> {
    if (sig.has_return_type())
        return sig;

    auto inferred = infer_types(decl, nullptr, sig.args(), options);
    if (is_err(inferred))
        return unwrap_err(inferred);

    // Inference may refine nothing but the return type.
    return sig.with_return_type(unwrap(inferred).signature.return_type());
}

} // namespace autojit::jit
