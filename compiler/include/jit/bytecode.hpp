//! # Bytecode Backend
//!
//! The bytecode translation backend has been removed. The adapter is kept so
//! that callables configured with `Backend::Bytecode` fail with a clear
//! `NotImplemented` error instead of silently using another backend.

#pragma once

#include "jit/pipeline.hpp"

namespace autojit::jit {

inline constexpr const char* BYTECODE_REMOVED_MESSAGE = "Bytecode backend is no longer supported.";
inline constexpr const char* BYTECODE_EXPORT_REMOVED_MESSAGE =
    "Bytecode translation has been removed for exported functions.";

class BytecodePipeline : public PipelineAdapter {
public:
    [[nodiscard]] auto compile(const FunctionDecl& decl, const types::Signature& sig,
                               const CompileOptions& options)
        -> Result<ArtifactPtr, JitError> override;

    [[nodiscard]] auto infer_types(const FunctionDecl& decl,
                                   const types::TypePtr& return_type_hint,
                                   const std::vector<types::TypePtr>& arg_types,
                                   const CompileOptions& options)
        -> Result<InferenceResult, JitError> override;

    [[nodiscard]] auto name() const -> std::string_view override {
        return "bytecode";
    }
};

} // namespace autojit::jit
