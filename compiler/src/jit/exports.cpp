#include "jit/exports.hpp"

#include "jit/bytecode.hpp"
#include "log/log.hpp"

namespace autojit::jit {

ExportRegistry::ExportRegistry(std::shared_ptr<PipelineAdapter> adapter, CompileOptions options)
    : adapter_(std::move(adapter)), options_(std::move(options)) {}

Result<ExportedFunction, JitError> ExportRegistry::compile_export(const FunctionDecl& decl,
                                                                  const std::string& signature,
                                                                  Backend backend) {
    if (backend == Backend::Bytecode) {
        return JitError::make(ErrorKind::NotImplemented, BYTECODE_EXPORT_REMOVED_MESSAGE);
    }

    auto parsed = types::parse_signature(signature);
    if (is_err(parsed))
        return unwrap_err(parsed);

    const auto& sig = unwrap(parsed);
    std::string name = sig.name() ? *sig.name() : decl.name;

    if (sig.arity() != decl.params.size()) {
        return JitError::make(ErrorKind::SignatureMismatch,
                              "export '" + name + "' declares " + std::to_string(sig.arity()) +
                                  " arguments but " + decl.name + " takes " +
                                  std::to_string(decl.params.size()));
    }
    if (!sig.is_concrete()) {
        return JitError::make(ErrorKind::SignatureMismatch,
                              "export '" + name + "' has a generic signature " + sig.canonical());
    }

    CompileOptions options = options_;
    options.backend = backend;
    options.symbol_name = name;

    auto compiled = adapter_->compile(decl, sig, options);
    if (is_err(compiled))
        return unwrap_err(compiled).with_note("while exporting '" + name + "'");

    ArtifactPtr artifact = unwrap(compiled);
    return ExportedFunction{name, artifact->signature, artifact};
}

void ExportRegistry::record(ExportedFunction exported) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = exports_.find(exported.name);
    if (it != exports_.end()) {
        AUTOJIT_LOG_WARN("exports", "re-exporting " << exported.name << " as "
                                                    << exported.signature.canonical());
        it->second = std::move(exported);
        return;
    }
    AUTOJIT_LOG_INFO("exports", "exported " << exported.name << " "
                                            << exported.signature.canonical());
    exports_.emplace(exported.name, std::move(exported));
}

Result<ExportedFunction, JitError> ExportRegistry::export_function(const FunctionDecl& decl,
                                                                   const std::string& signature,
                                                                   Backend backend) {
    auto exported = compile_export(decl, signature, backend);
    if (is_err(exported))
        return exported;
    record(unwrap(exported));
    return exported;
}

Result<std::vector<ExportedFunction>, JitError>
ExportRegistry::export_many(const FunctionDecl& decl, const std::vector<std::string>& signatures,
                            Backend backend) {
    std::vector<ExportedFunction> compiled;
    compiled.reserve(signatures.size());
    for (const auto& signature : signatures) {
        auto exported = compile_export(decl, signature, backend);
        if (is_err(exported))
            return unwrap_err(exported);
        compiled.push_back(std::move(unwrap(exported)));
    }

    for (const auto& exported : compiled) {
        record(exported);
    }
    return compiled;
}

std::optional<ExportedFunction> ExportRegistry::find(const std::string& name) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = exports_.find(name);
    if (it == exports_.end())
        return std::nullopt;
    return it->second;
}

std::vector<std::string> ExportRegistry::names() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<std::string> result;
    result.reserve(exports_.size());
    for (const auto& [name, _] : exports_) {
        result.push_back(name);
    }
    return result;
}

size_t ExportRegistry::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return exports_.size();
}

} // namespace autojit::jit
