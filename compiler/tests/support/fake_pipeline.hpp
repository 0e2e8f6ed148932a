//! # Fake Pipeline Adapter
//!
//! A `PipelineAdapter` for tests that never generates code. Each declaration
//! name maps to a C++ implementation; the artifact's invoker coerces the
//! arguments to the compiled signature before calling it, the same way the
//! LLVM wrapper does. Compilations are counted and can be made to fail.

#pragma once

#include "cache/specialization_cache.hpp"
#include "jit/marshal.hpp"
#include "jit/pipeline.hpp"

#include <atomic>
#include <chrono>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <span>
#include <string>
#include <thread>
#include <vector>

namespace autojit::test {

using FakeImpl =
    std::function<Result<types::Value, JitError>(std::span<const types::Value> args)>;

class FakeModule : public jit::NativeModule {
public:
    explicit FakeModule(std::string name, std::atomic<int>* live) : name_(std::move(name)), live_(live) {
        ++*live_;
    }
    ~FakeModule() override {
        --*live_;
    }

    [[nodiscard]] auto name() const -> std::string_view override {
        return name_;
    }

private:
    std::string name_;
    std::atomic<int>* live_;
};

class FakePipeline : public jit::PipelineAdapter {
public:
    /// Registers the implementation used for declarations named `name`.
    void implement(const std::string& name, FakeImpl impl) {
        std::lock_guard<std::mutex> lock(mutex_);
        impls_[name] = std::move(impl);
    }

    /// The next `count` compilations fail with a Compilation error.
    void fail_next(int count) {
        failures_ = count;
    }

    /// Every compilation sleeps this long first.
    void set_delay(std::chrono::milliseconds delay) {
        delay_ = delay;
    }

    [[nodiscard]] int compile_count() const {
        return compiles_;
    }

    [[nodiscard]] int live_modules() const {
        return live_modules_;
    }

    [[nodiscard]] std::vector<types::Signature> compiled() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return compiled_;
    }

    [[nodiscard]] std::vector<jit::CompileOptions> compile_options() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return options_;
    }

    [[nodiscard]] auto compile(const jit::FunctionDecl& decl, const types::Signature& sig,
                               const jit::CompileOptions& options)
        -> Result<jit::ArtifactPtr, JitError> override {
        ++compiles_;
        if (delay_.count() > 0)
            std::this_thread::sleep_for(delay_);

        if (options.backend == jit::Backend::Bytecode) {
            return JitError::make(ErrorKind::NotImplemented, "bytecode requested");
        }
        if (failures_ > 0) {
            --failures_;
            return JitError::make(ErrorKind::Compilation, "injected failure for " + decl.name);
        }

        auto completed = complete_signature(decl, sig, options);
        if (is_err(completed))
            return unwrap_err(completed);
        types::Signature resolved = unwrap(completed);
        if (!resolved.is_concrete()) {
            return JitError::make(ErrorKind::Compilation,
                                  "cannot compile generic " + resolved.canonical());
        }

        FakeImpl impl;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            compiled_.push_back(resolved);
            options_.push_back(options);
            if (auto it = impls_.find(decl.name); it != impls_.end())
                impl = it->second;
        }

        auto artifact = std::make_shared<jit::CompiledArtifact>();
        artifact->signature = resolved;
        artifact->symbol = options.symbol_name ? *options.symbol_name
                                               : cache::mangle_symbol(decl.name, resolved);
        artifact->module = std::make_shared<FakeModule>(artifact->symbol, &live_modules_);
        artifact->entry = artifact->module.get();
        if (options.wrap) {
            artifact->invoke = [resolved, impl](std::span<const types::Value> args)
                -> Result<types::Value, JitError> {
                std::vector<types::Value> coerced;
                for (size_t i = 0; i < args.size() && i < resolved.arity(); ++i) {
                    auto value = jit::coerce_value(args[i], resolved.args()[i]);
                    if (is_err(value))
                        return unwrap_err(value);
                    coerced.push_back(unwrap(value));
                }
                if (!impl)
                    return types::Value{};
                auto result = impl(coerced);
                if (is_err(result) || types::is_void(resolved.return_type()))
                    return result;
                return jit::coerce_value(unwrap(result), resolved.return_type());
            };
        }
        return jit::ArtifactPtr(std::move(artifact));
    }

    [[nodiscard]] auto name() const -> std::string_view override {
        return "fake";
    }

private:
    mutable std::mutex mutex_;
    std::map<std::string, FakeImpl> impls_;
    std::vector<types::Signature> compiled_;
    std::vector<jit::CompileOptions> options_;
    std::atomic<int> compiles_{0};
    std::atomic<int> failures_{0};
    std::atomic<int> live_modules_{0};
    std::chrono::milliseconds delay_{0};
};

// ============================================================================
// Declaration helpers
// ============================================================================

/// A declaration whose return type is the numeric promotion of its arguments.
inline jit::FunctionDecl numeric_decl(std::string name, std::vector<std::string> params) {
    jit::FunctionDecl decl;
    decl.name = std::move(name);
    decl.params = std::move(params);
    decl.infer = [](const jit::InferenceRequest& req) -> Result<jit::InferenceResult, JitError> {
        if (req.return_type_hint) {
            return jit::InferenceResult{types::Signature(req.return_type_hint, req.arg_types), {}, {}};
        }
        types::TypePtr ret = req.arg_types.empty() ? types::make_void() : req.arg_types[0];
        for (size_t i = 1; i < req.arg_types.size(); ++i) {
            ret = types::promote_numeric(ret, req.arg_types[i]);
            if (!ret) {
                return JitError::make(ErrorKind::Compilation,
                                      req.decl.name + "() needs numeric arguments");
            }
        }
        return jit::InferenceResult{types::Signature(ret, req.arg_types), {}, {}};
    };
    return decl;
}

/// Adds two numeric values in double or int64 arithmetic.
inline Result<types::Value, JitError> add_values(std::span<const types::Value> args) {
    auto as_double = [](const types::Value& v) -> double {
        if (v.is<int32_t>())
            return v.as<int32_t>();
        if (v.is<int64_t>())
            return static_cast<double>(v.as<int64_t>());
        if (v.is<uint64_t>())
            return static_cast<double>(v.as<uint64_t>());
        if (v.is<float>())
            return v.as<float>();
        return v.as<double>();
    };
    if (args[0].is<int32_t>() && args[1].is<int32_t>())
        return types::Value(int64_t(args[0].as<int32_t>()) + args[1].as<int32_t>());
    if (args[0].is<int64_t>() && args[1].is<int64_t>())
        return types::Value(args[0].as<int64_t>() + args[1].as<int64_t>());
    return types::Value(as_double(args[0]) + as_double(args[1]));
}

} // namespace autojit::test
