//! # JIT Context
//!
//! Owns everything a session of JIT compilation needs: the pipeline adapter,
//! the specialization registry, the callables, the extension class registry
//! and the export table. Every entry point takes the context explicitly;
//! several contexts can coexist and share nothing.
//!
//! ## Usage
//!
//! ```cpp
//! JitContext ctx(pipeline, JitOptions::from_env());
//! auto add = ctx.autojit(add_decl);
//! std::vector<Value> args{Value(int32_t(1)), Value(int32_t(2))};
//! auto result = ctx.invoke(unwrap(add), args);
//! ```

#pragma once

#include "cache/specialization_cache.hpp"
#include "common.hpp"
#include "common/error.hpp"
#include "exttypes/builder.hpp"
#include "jit/dispatcher.hpp"
#include "jit/exports.hpp"
#include "jit/pipeline.hpp"

#include <map>
#include <memory>
#include <shared_mutex>
#include <span>
#include <string>
#include <vector>

namespace autojit::jit {

/// Session-wide options.
struct JitOptions {
    int opt_level = 2;
    bool wrap_exports = false;
    bool verbose = false;
    Backend backend = Backend::Ast;

    /// Defaults overridden by `AUTOJIT_OPT_LEVEL` and `AUTOJIT_WRAP_EXPORTS`.
    static JitOptions from_env();
};

class JitContext {
public:
    explicit JitContext(std::shared_ptr<PipelineAdapter> adapter, JitOptions options = {});
    ~JitContext();

    JitContext(const JitContext&) = delete;
    JitContext& operator=(const JitContext&) = delete;

    // ========================================================================
    // Callables
    // ========================================================================

    /// Registers a lazily specializing callable.
    Result<cache::CallableId, JitError> autojit(FunctionDecl decl, FunctionOptions options = {});

    /// Registers a callable compiled eagerly for exactly one signature. A name
    /// in the signature overrides the native symbol name.
    Result<cache::CallableId, JitError> jit(FunctionDecl decl, const types::Signature& sig,
                                            FunctionOptions options = {});
    Result<cache::CallableId, JitError> jit(FunctionDecl decl, const std::string& sig,
                                            FunctionOptions options = {});

    [[nodiscard]] Result<types::Value, JitError>
    invoke(cache::CallableId id, std::span<const types::Value> args,
           const types::KeywordArgs& kwargs = {});

    [[nodiscard]] Result<ArtifactPtr, JitError>
    compile_function(cache::CallableId id, const std::vector<types::TypePtr>& argtypes,
                     types::TypePtr restype = nullptr);

    /// Returns null for an unknown id.
    [[nodiscard]] std::shared_ptr<Dispatcher> dispatcher(cache::CallableId id) const;

    // ========================================================================
    // Extension classes
    // ========================================================================

    /// Builds and registers a class. Nothing is registered on failure; a
    /// successful rebuild replaces the earlier class of the same name.
    Result<exttypes::ClassDescriptorPtr, JitError>
    build_class(const exttypes::ClassDecl& decl,
                const exttypes::ExplicitSignatures& explicit_signatures = {});

    [[nodiscard]] exttypes::ClassDescriptorPtr lookup_class(const std::string& name) const;

    [[nodiscard]] std::vector<std::string> class_names() const;

    // ========================================================================
    // Accessors
    // ========================================================================

    [[nodiscard]] ExportRegistry& exports() {
        return exports_;
    }

    [[nodiscard]] const cache::SpecializationRegistry& specializations() const {
        return registry_;
    }

    [[nodiscard]] const JitOptions& options() const {
        return options_;
    }

    [[nodiscard]] PipelineAdapter& adapter() {
        return *adapter_;
    }

private:
    Result<std::shared_ptr<Dispatcher>, JitError> make_dispatcher(FunctionDecl decl,
                                                                  FunctionOptions options,
                                                                  cache::CallableId& id);
    void publish(cache::CallableId id, std::shared_ptr<Dispatcher> dispatcher);
    [[nodiscard]] CompileOptions base_compile_options() const;

    std::shared_ptr<PipelineAdapter> adapter_;
    std::shared_ptr<PipelineAdapter> bytecode_;
    JitOptions options_;

    cache::SpecializationRegistry registry_;

    mutable std::shared_mutex mutex_;
    std::map<cache::CallableId, std::shared_ptr<Dispatcher>> callables_;
    std::map<std::string, exttypes::ClassDescriptorPtr> classes_;

    ExportRegistry exports_;
};

} // namespace autojit::jit
