//! # Compilation Pipeline Adapter
//!
//! The boundary between the dispatch core and the code generator. The core
//! hands a declaration and a signature to a `PipelineAdapter` and gets back a
//! `CompiledArtifact`; it never looks inside the declaration's body.
//!
//! ## Declarations
//!
//! A `FunctionDecl` carries two frontend hooks:
//!
//! | Hook    | Input                              | Output                    |
//! |---------|------------------------------------|---------------------------|
//! | `infer` | argument types + return type hint  | signature, symbol table   |
//! | `lower` | resolved signature + symbol name   | LLVM IR text              |
//!
//! Adapters that do not produce IR (test fakes) ignore `lower`.

#pragma once

#include "common.hpp"
#include "common/error.hpp"
#include "jit/artifact.hpp"
#include "types/resolver.hpp"
#include "types/signature.hpp"
#include "types/symtab.hpp"

#include <functional>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace autojit::exttypes {
class ExtensionType;
}

namespace autojit::jit {

/// Translation backend for a callable.
enum class Backend {
    Ast,      ///< Typed-AST pipeline
    Bytecode, ///< Removed; always fails with NotImplemented
};

struct CompileOptions {
    int opt_level = 2;
    bool nopython = true;
    std::optional<std::string> symbol_name; ///< Overrides the mangled symbol
    bool link = true;
    bool wrap = true; ///< Build the host wrapper
    types::LocalsMap locals;
    Backend backend = Backend::Ast;
    /// Class whose method is being compiled, borrowed for the duration of the call.
    const exttypes::ExtensionType* owner = nullptr;
};

struct FunctionDecl;

struct InferenceRequest {
    const FunctionDecl& decl;
    types::TypePtr return_type_hint; ///< Null when unknown
    const std::vector<types::TypePtr>& arg_types;
    const CompileOptions& options;
};

struct InferenceResult {
    types::Signature signature;
    types::SymbolTable symtab;
    /// Attribute assignments made through the receiver, in first-seen order.
    std::vector<std::pair<std::string, types::TypePtr>> attribute_assignments;
};

struct LoweringRequest {
    const FunctionDecl& decl;
    const types::Signature& signature;
    const std::string& symbol;
    const CompileOptions& options;
};

using InferHook = std::function<Result<InferenceResult, JitError>(const InferenceRequest&)>;
using LowerHook = std::function<Result<std::string, JitError>(const LoweringRequest&)>;

struct FunctionDecl {
    std::string name;
    std::vector<std::string> params;
    InferHook infer;
    LowerHook lower;
};

/// External code generator.
class PipelineAdapter {
public:
    virtual ~PipelineAdapter() = default;

    /// Compiles `decl` for `sig`. When the return type is unknown it is
    /// inferred first; the artifact always carries the resolved signature.
    [[nodiscard]] virtual auto compile(const FunctionDecl& decl, const types::Signature& sig,
                                       const CompileOptions& options)
        -> Result<ArtifactPtr, JitError> = 0;

    /// Whole-body inference without compilation. The default calls the
    /// declaration's `infer` hook, or accepts a known return type as is.
    [[nodiscard]] virtual auto infer_types(const FunctionDecl& decl,
                                           const types::TypePtr& return_type_hint,
                                           const std::vector<types::TypePtr>& arg_types,
                                           const CompileOptions& options)
        -> Result<InferenceResult, JitError>;

    [[nodiscard]] virtual auto name() const -> std::string_view = 0;

protected:
    /// Infers the return type if `sig` lacks one.
    [[nodiscard]] auto complete_signature(const FunctionDecl& decl, const types::Signature& sig,
                                          const CompileOptions& options)
        -> Result<types::Signature, JitError>;
};

} // namespace autojit::jit
