#include "jit/bytecode.hpp"

#include "log/log.hpp"

namespace autojit::jit {

auto BytecodePipeline::compile(const FunctionDecl& decl, const types::Signature& /*sig*/,
                               const CompileOptions& /*options*/)
    -> Result<ArtifactPtr, JitError> {
    AUTOJIT_LOG_WARN("dispatch", "bytecode backend requested for '" << decl.name << "'");
    return JitError::make(ErrorKind::NotImplemented, BYTECODE_REMOVED_MESSAGE);
}

auto BytecodePipeline::infer_types(const FunctionDecl& /*decl*/,
                                   const types::TypePtr& /*return_type_hint*/,
                                   const std::vector<types::TypePtr>& /*arg_types*/,
                                   const CompileOptions& /*options*/)
    -> Result<InferenceResult, JitError> {
    return JitError::make(ErrorKind::NotImplemented, BYTECODE_REMOVED_MESSAGE);
}

} // namespace autojit::jit
