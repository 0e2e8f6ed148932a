//! # Dispatcher
//!
//! One registered callable: its declaration, its options and its
//! specialization cache. `invoke` maps call-site values to a signature,
//! compiles on a miss and calls the artifact.
//!
//! ## Modes
//!
//! | Mode        | Created by    | Signature source                          |
//! |-------------|---------------|-------------------------------------------|
//! | Specializing | `autojit`    | resolved from each call's argument values |
//! | Fixed       | `jit`         | the one signature compiled eagerly        |
//!
//! A fixed dispatcher never compiles on a call; its arguments are coerced to
//! the declared signature by the artifact's wrapper.

#pragma once

#include "cache/specialization_cache.hpp"
#include "common.hpp"
#include "common/error.hpp"
#include "jit/pipeline.hpp"
#include "types/resolver.hpp"

#include <memory>
#include <optional>
#include <span>
#include <string>
#include <vector>

namespace autojit::jit {

/// Per-callable options.
struct FunctionOptions {
    std::optional<types::Signature> template_signature;
    types::LocalsMap locals;
    Backend backend = Backend::Ast;
    std::string target = "cpu";
    bool nopython = true;
};

class Dispatcher {
public:
    /// `cache` is owned by the context's specialization registry.
    Dispatcher(FunctionDecl decl, FunctionOptions options,
               std::shared_ptr<cache::SpecializationCache> cache,
               std::shared_ptr<PipelineAdapter> adapter, CompileOptions compile_options);

    /// Resolve, compile on a miss, then call.
    [[nodiscard]] Result<types::Value, JitError>
    invoke(std::span<const types::Value> args, const types::KeywordArgs& kwargs = {});

    /// Cache-aware compile for explicit argument types. A null `restype` is
    /// inferred by the adapter.
    [[nodiscard]] Result<ArtifactPtr, JitError>
    compile(const std::vector<types::TypePtr>& argtypes, types::TypePtr restype = nullptr);

    /// Compiles `sig` and pins the dispatcher to it.
    [[nodiscard]] Result<ArtifactPtr, JitError> compile_fixed(const types::Signature& sig);

    [[nodiscard]] const FunctionDecl& decl() const {
        return decl_;
    }

    [[nodiscard]] const types::CallableShape& shape() const {
        return shape_;
    }

    [[nodiscard]] const FunctionOptions& options() const {
        return options_;
    }

    [[nodiscard]] const std::optional<types::Signature>& fixed_signature() const {
        return fixed_;
    }

    [[nodiscard]] cache::SpecializationCache& cache() {
        return *cache_;
    }

    [[nodiscard]] const cache::SpecializationCache& cache() const {
        return *cache_;
    }

private:
    Result<ArtifactPtr, JitError> compile_signature(const types::Signature& sig);

    FunctionDecl decl_;
    FunctionOptions options_;
    types::CallableShape shape_;
    std::shared_ptr<PipelineAdapter> adapter_;
    CompileOptions compile_options_;
    std::shared_ptr<cache::SpecializationCache> cache_;
    std::optional<types::Signature> fixed_;
};

} // namespace autojit::jit
