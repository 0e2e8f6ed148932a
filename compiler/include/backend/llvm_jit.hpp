//! # LLVM ORC JIT Pipeline
//!
//! A `PipelineAdapter` that compiles declarations in-process with LLVM's
//! LLJIT through the LLVM C API.
//!
//! ## Compilation Steps
//!
//! 1. Infer the return type if the signature lacks one
//! 2. Call the declaration's `lower` hook for the function body IR
//! 3. Append the host wrapper `void <sym>__wrapper(i8** args, i8* ret)`
//! 4. Parse, verify and (at -O1 and above) optimize the module
//! 5. Add it to the shared LLJIT under its own resource tracker
//! 6. Look up the function and the wrapper
//!
//! The resource tracker is the artifact's module handle: releasing the last
//! artifact that references it removes the code from the JIT.
//!
//! ## Usage
//!
//! ```cpp
//! auto pipeline = LLVMJitPipeline::create();
//! if (is_err(pipeline)) {
//!     std::cerr << unwrap_err(pipeline).to_string() << "\n";
//! }
//! JitContext ctx(unwrap(pipeline));
//! ```

#pragma once

#include "common.hpp"
#include "common/error.hpp"
#include "exttypes/layout.hpp"
#include "jit/pipeline.hpp"

#include <atomic>
#include <memory>
#include <string>
#include <string_view>

namespace autojit::backend {

class LLVMJitPipeline : public jit::PipelineAdapter {
public:
    /// Initializes the native target and creates the JIT.
    [[nodiscard]] static auto create() -> Result<std::shared_ptr<LLVMJitPipeline>, JitError>;

    ~LLVMJitPipeline() override;

    LLVMJitPipeline(const LLVMJitPipeline&) = delete;
    LLVMJitPipeline& operator=(const LLVMJitPipeline&) = delete;

    [[nodiscard]] auto compile(const jit::FunctionDecl& decl, const types::Signature& sig,
                               const jit::CompileOptions& options)
        -> Result<jit::ArtifactPtr, JitError> override;

    [[nodiscard]] auto name() const -> std::string_view override {
        return "llvm-orc";
    }

    /// Target triple of the host JIT.
    [[nodiscard]] auto triple() const -> std::string;

    /// Shared LLJIT state; outlives the pipeline while modules remain.
    struct Engine;

private:
    explicit LLVMJitPipeline(std::shared_ptr<Engine> engine);

    std::shared_ptr<Engine> engine_;
    std::atomic<uint64_t> counter_{0};
};

/// LLVM IR spelling of a semantic type (`i32`, `double`, `i8*`, `{ double, i32 }`).
/// Extension instances and host objects are `i8*`; arrays decay to a pointer
/// to their first element.
[[nodiscard]] auto llvm_type_name(const types::TypePtr& type) -> Result<std::string, JitError>;

/// Literal IR struct type of an attribute struct.
[[nodiscard]] auto llvm_struct_type(const exttypes::AttributeStruct& attrs)
    -> Result<std::string, JitError>;

/// IR computing a typed pointer to `field` from the receiver register:
/// `%<result>.raw = getelementptr ...` followed by `%<result> = bitcast ...`.
[[nodiscard]] auto llvm_field_pointer(const exttypes::AttributeField& field,
                                      std::string_view self_reg, std::string_view result_reg)
    -> Result<std::string, JitError>;

/// The host wrapper definition calling `symbol` with the arguments unpacked
/// from `i8** %args` and the result stored through `i8* %ret`.
[[nodiscard]] auto llvm_host_wrapper(const std::string& symbol, const types::Signature& sig)
    -> Result<std::string, JitError>;

} // namespace autojit::backend
