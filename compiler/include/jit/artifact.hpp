//! # Compiled Artifacts
//!
//! The product of one successful compilation: a native entry point, a
//! callable wrapper that marshals host values, and the module handle that
//! keeps the native code alive. Artifacts are shared so that a caller holding
//! one survives a cache overwrite.

#pragma once

#include "common.hpp"
#include "common/error.hpp"
#include "types/signature.hpp"
#include "types/value.hpp"

#include <functional>
#include <memory>
#include <span>
#include <string>
#include <string_view>

namespace autojit::jit {

/// Owner of the native code behind one or more artifacts. Releasing the last
/// reference unloads the code.
class NativeModule {
public:
    virtual ~NativeModule() = default;

    [[nodiscard]] virtual auto name() const -> std::string_view = 0;
};

/// Marshals host values into a native call and the result back.
using NativeInvoker =
    std::function<Result<types::Value, JitError>(std::span<const types::Value>)>;

struct CompiledArtifact {
    types::Signature signature; ///< Fully resolved, return type included
    std::string symbol;         ///< Mangled native symbol
    void* entry = nullptr;      ///< Native entry point
    NativeInvoker invoke;       ///< Empty when compiled without a wrapper
    std::shared_ptr<NativeModule> module;

    [[nodiscard]] auto has_wrapper() const -> bool {
        return static_cast<bool>(invoke);
    }

    /// Calls through the wrapper, failing when there is none.
    [[nodiscard]] auto call(std::span<const types::Value> args) const
        -> Result<types::Value, JitError> {
        if (!invoke) {
            return JitError::make(ErrorKind::Compilation,
                                  "'" + symbol + "' was compiled without a host wrapper");
        }
        return invoke(args);
    }
};

using ArtifactPtr = std::shared_ptr<const CompiledArtifact>;

} // namespace autojit::jit
