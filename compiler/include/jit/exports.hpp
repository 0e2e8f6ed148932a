//! # Export Registry
//!
//! Ahead-of-use compilation of named native entry points. Each exported
//! signature string (`"name ret(args)"`) is parsed, compiled through the
//! pipeline adapter and recorded under its name; a signature without a name
//! is recorded under the declaration's name.
//!
//! Re-exporting a name replaces the previous entry.
//!
//! The export name is the lookup key here, not the native symbol. Backends
//! that share one symbol namespace across compilations (the LLVM pipeline
//! uses a single JITDylib) emit `<name>_<n>` with a process-unique `n`, so a
//! re-export never collides with the entry it replaces. The emitted symbol
//! is `ExportedFunction::artifact->symbol`; resolve exports through `find`
//! rather than by symbol name.

#pragma once

#include "common.hpp"
#include "common/error.hpp"
#include "jit/pipeline.hpp"
#include "types/signature.hpp"

#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace autojit::jit {

struct ExportedFunction {
    std::string name; ///< Export name; the native symbol may carry a suffix
    types::Signature signature;
    ArtifactPtr artifact;
};

class ExportRegistry {
public:
    /// `options.wrap` decides whether exported artifacts get a host wrapper.
    ExportRegistry(std::shared_ptr<PipelineAdapter> adapter, CompileOptions options);

    /// Compile and record one exported signature.
    Result<ExportedFunction, JitError> export_function(const FunctionDecl& decl,
                                                       const std::string& signature,
                                                       Backend backend = Backend::Ast);

    /// Compile every signature, then record them all. Nothing is recorded if
    /// any of them fails.
    Result<std::vector<ExportedFunction>, JitError>
    export_many(const FunctionDecl& decl, const std::vector<std::string>& signatures,
                Backend backend = Backend::Ast);

    [[nodiscard]] std::optional<ExportedFunction> find(const std::string& name) const;

    /// Exported names in sorted order.
    [[nodiscard]] std::vector<std::string> names() const;

    [[nodiscard]] size_t size() const;

private:
    Result<ExportedFunction, JitError> compile_export(const FunctionDecl& decl,
                                                      const std::string& signature,
                                                      Backend backend);
    void record(ExportedFunction exported);

    std::shared_ptr<PipelineAdapter> adapter_;
    CompileOptions options_;

    mutable std::mutex mutex_;
    std::map<std::string, ExportedFunction> exports_;
};

} // namespace autojit::jit
