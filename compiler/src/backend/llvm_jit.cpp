//! # LLVM ORC JIT Pipeline Implementation
//!
//! Uses the LLVM C API (LLJIT, resource trackers, IR reader, pass builder).

#include "backend/llvm_jit.hpp"

#include "cache/specialization_cache.hpp"
#include "jit/bytecode.hpp"
#include "jit/marshal.hpp"
#include "log/log.hpp"

#include <algorithm>
#include <cstddef>
#include <cstdint>
#include <mutex>
#include <sstream>
#include <vector>

// LLVM C API headers
#include <llvm-c/Analysis.h>
#include <llvm-c/Core.h>
#include <llvm-c/Error.h>
#include <llvm-c/IRReader.h>
#include <llvm-c/LLJIT.h>
#include <llvm-c/Orc.h>
#include <llvm-c/Target.h>
#include <llvm-c/Transforms/PassBuilder.h>

namespace autojit::backend {

// ============================================================================
// Helper Functions
// ============================================================================

/// Convert LLVM error message to string and dispose it.
static std::string consume_error_message(char* error) {
    if (error == nullptr) {
        return "";
    }
    std::string msg(error);
    LLVMDisposeMessage(error);
    return msg;
}

/// Convert an LLVMErrorRef to string and consume it.
static std::string consume_llvm_error(LLVMErrorRef err) {
    if (err == nullptr) {
        return "";
    }
    char* msg = LLVMGetErrorMessage(err);
    std::string result(msg ? msg : "unknown LLVM error");
    LLVMDisposeErrorMessage(msg);
    return result;
}

/// Get optimization pipeline string for the pass builder.
static const char* get_opt_level_string(int level) {
    switch (level) {
    case 0:
        return "default<O0>";
    case 1:
        return "default<O1>";
    case 2:
        return "default<O2>";
    case 3:
        return "default<O3>";
    default:
        return "default<O2>";
    }
}

static JitError compilation_error(const std::string& symbol, const std::string& what) {
    return JitError::make(ErrorKind::Compilation, what).with_note("while compiling '" + symbol + "'");
}

// ============================================================================
// Type Mapping
// ============================================================================

auto llvm_type_name(const types::TypePtr& type) -> Result<std::string, JitError> {
    if (!type) {
        return JitError::make(ErrorKind::Compilation, "cannot lower an unknown type");
    }

    if (type->is<types::PrimitiveType>()) {
        switch (type->as<types::PrimitiveType>().kind) {
        case types::PrimitiveKind::I8:
        case types::PrimitiveKind::U8:
            return std::string("i8");
        case types::PrimitiveKind::I16:
        case types::PrimitiveKind::U16:
            return std::string("i16");
        case types::PrimitiveKind::I32:
        case types::PrimitiveKind::U32:
            return std::string("i32");
        case types::PrimitiveKind::I64:
        case types::PrimitiveKind::U64:
            return std::string("i64");
        case types::PrimitiveKind::F32:
            return std::string("float");
        case types::PrimitiveKind::F64:
            return std::string("double");
        case types::PrimitiveKind::Bool:
            return std::string("i1");
        case types::PrimitiveKind::Void:
            return std::string("void");
        }
    }

    if (type->is<types::PtrType>()) {
        const auto& inner = type->as<types::PtrType>().inner;
        if (!inner)
            return std::string("i8*");
        auto inner_name = llvm_type_name(inner);
        if (is_err(inner_name))
            return inner_name;
        return unwrap(inner_name) + "*";
    }

    if (type->is<types::ArrayType>()) {
        auto element = llvm_type_name(type->as<types::ArrayType>().element);
        if (is_err(element))
            return element;
        return unwrap(element) + "*";
    }

    if (type->is<types::StructType>()) {
        std::ostringstream ss;
        ss << "{ ";
        const auto& fields = type->as<types::StructType>().fields;
        for (size_t i = 0; i < fields.size(); ++i) {
            auto field = llvm_type_name(fields[i].type);
            if (is_err(field))
                return field;
            if (i > 0)
                ss << ", ";
            ss << unwrap(field);
        }
        ss << " }";
        return ss.str();
    }

    if (type->is<types::FuncPtrType>()) {
        const auto& fn = type->as<types::FuncPtrType>();
        auto ret = llvm_type_name(fn.return_type);
        if (is_err(ret))
            return ret;
        std::ostringstream ss;
        ss << unwrap(ret) << " (";
        for (size_t i = 0; i < fn.params.size(); ++i) {
            auto param = llvm_type_name(fn.params[i]);
            if (is_err(param))
                return param;
            if (i > 0)
                ss << ", ";
            ss << unwrap(param);
        }
        ss << ")*";
        return ss.str();
    }

    if (type->is<types::ObjectType>() || type->is<types::ExtensionRef>())
        return std::string("i8*");

    return JitError::make(ErrorKind::Compilation,
                          "type " + types::type_to_string(type) + " has no native representation");
}

auto llvm_struct_type(const exttypes::AttributeStruct& attrs) -> Result<std::string, JitError> {
    return llvm_type_name(attrs.as_struct_type());
}

auto llvm_field_pointer(const exttypes::AttributeField& field, std::string_view self_reg,
                        std::string_view result_reg) -> Result<std::string, JitError> {
    auto field_type = llvm_type_name(field.type);
    if (is_err(field_type))
        return field_type;

    std::ostringstream ss;
    ss << "  %" << result_reg << ".raw = getelementptr i8, i8* %" << self_reg << ", i64 "
       << field.offset << "\n";
    ss << "  %" << result_reg << " = bitcast i8* %" << result_reg << ".raw to "
       << unwrap(field_type) << "*\n";
    return ss.str();
}

auto llvm_host_wrapper(const std::string& symbol, const types::Signature& sig)
    -> Result<std::string, JitError> {
    auto ret = llvm_type_name(sig.return_type());
    if (is_err(ret))
        return ret;

    std::ostringstream body;
    std::ostringstream call_args;
    for (size_t i = 0; i < sig.arity(); ++i) {
        auto arg = llvm_type_name(sig.args()[i]);
        if (is_err(arg))
            return arg;
        const auto& ty = unwrap(arg);
        body << "  %a" << i << ".slot = getelementptr i8*, i8** %args, i64 " << i << "\n";
        body << "  %a" << i << ".raw = load i8*, i8** %a" << i << ".slot\n";
        body << "  %a" << i << ".ptr = bitcast i8* %a" << i << ".raw to " << ty << "*\n";
        body << "  %a" << i << " = load " << ty << ", " << ty << "* %a" << i << ".ptr\n";
        if (i > 0)
            call_args << ", ";
        call_args << ty << " %a" << i;
    }

    const auto& ret_ty = unwrap(ret);
    std::ostringstream ir;
    ir << "\ndefine void @" << symbol << "__wrapper(i8** %args, i8* %ret) {\n";
    ir << "entry:\n";
    ir << body.str();
    if (ret_ty == "void") {
        ir << "  call void @" << symbol << "(" << call_args.str() << ")\n";
    } else {
        ir << "  %r = call " << ret_ty << " @" << symbol << "(" << call_args.str() << ")\n";
        ir << "  %r.ptr = bitcast i8* %ret to " << ret_ty << "*\n";
        ir << "  store " << ret_ty << " %r, " << ret_ty << "* %r.ptr\n";
    }
    ir << "  ret void\n";
    ir << "}\n";
    return ir.str();
}

// ============================================================================
// Engine and Module Handles
// ============================================================================

struct LLVMJitPipeline::Engine {
    LLVMOrcLLJITRef jit = nullptr;
    std::mutex mutex;

    ~Engine() {
        if (jit) {
            LLVMErrorRef err = LLVMOrcDisposeLLJIT(jit);
            if (err) {
                AUTOJIT_LOG_ERROR("llvm", "failed to dispose LLJIT: " << consume_llvm_error(err));
            }
        }
    }
};

namespace {

/// One JIT-compiled module, tracked by its own resource tracker.
class LLVMModuleHandle : public jit::NativeModule {
public:
    LLVMModuleHandle(std::shared_ptr<LLVMJitPipeline::Engine> engine,
                     LLVMOrcResourceTrackerRef tracker, std::string name)
        : engine_(std::move(engine)), tracker_(tracker), name_(std::move(name)) {}

    ~LLVMModuleHandle() override {
        std::lock_guard<std::mutex> lock(engine_->mutex);
        LLVMErrorRef err = LLVMOrcResourceTrackerRemove(tracker_);
        if (err) {
            AUTOJIT_LOG_WARN("llvm", "failed to unload module " << name_ << ": "
                                                                << consume_llvm_error(err));
        }
        LLVMOrcReleaseResourceTracker(tracker_);
        AUTOJIT_LOG_TRACE("llvm", "unloaded module " << name_);
    }

    LLVMModuleHandle(const LLVMModuleHandle&) = delete;
    LLVMModuleHandle& operator=(const LLVMModuleHandle&) = delete;

    [[nodiscard]] auto name() const -> std::string_view override {
        return name_;
    }

private:
    std::shared_ptr<LLVMJitPipeline::Engine> engine_;
    LLVMOrcResourceTrackerRef tracker_;
    std::string name_;
};

using HostWrapperFn = void (*)(void**, void*);

/// Marshals host values through the generated wrapper.
jit::NativeInvoker make_invoker(types::Signature sig, HostWrapperFn wrapper, std::string symbol,
                                std::shared_ptr<jit::NativeModule> module) {
    return [sig = std::move(sig), wrapper, symbol = std::move(symbol),
            module = std::move(module)](
               std::span<const types::Value> args) -> Result<types::Value, JitError> {
        if (args.size() != sig.arity()) {
            return JitError::make(ErrorKind::Arity,
                                  symbol + "() takes exactly " + std::to_string(sig.arity()) +
                                      " arguments (" + std::to_string(args.size()) + " given)");
        }

        auto words = [](size_t bytes) {
            return std::max<size_t>(1, (bytes + sizeof(std::max_align_t) - 1) /
                                           sizeof(std::max_align_t));
        };

        std::vector<types::Value> coerced;
        coerced.reserve(args.size());
        std::vector<std::unique_ptr<std::max_align_t[]>> storage;
        storage.reserve(args.size());
        std::vector<void*> slots;
        slots.reserve(args.size());

        for (size_t i = 0; i < args.size(); ++i) {
            const auto& arg_type = sig.args()[i];
            auto value = jit::coerce_value(args[i], arg_type);
            if (is_err(value)) {
                return unwrap_err(value).with_note("argument " + std::to_string(i) + " of " +
                                                   symbol + " expects " +
                                                   types::type_to_string(arg_type));
            }
            coerced.push_back(std::move(unwrap(value)));
            storage.push_back(std::make_unique<std::max_align_t[]>(
                words(types::native_size(arg_type))));
            auto written = jit::write_native(coerced.back(), arg_type, storage.back().get());
            if (is_err(written))
                return unwrap_err(written);
            slots.push_back(storage.back().get());
        }

        const auto& ret_type = sig.return_type();
        auto ret_storage =
            std::make_unique<std::max_align_t[]>(words(types::native_size(ret_type)));
        wrapper(slots.data(), ret_storage.get());

        if (types::is_void(ret_type))
            return types::Value{};
        return jit::read_native(ret_type, ret_storage.get());
    };
}

} // namespace

// ============================================================================
// LLVMJitPipeline
// ============================================================================

LLVMJitPipeline::LLVMJitPipeline(std::shared_ptr<Engine> engine) : engine_(std::move(engine)) {}

LLVMJitPipeline::~LLVMJitPipeline() = default;

auto LLVMJitPipeline::create() -> Result<std::shared_ptr<LLVMJitPipeline>, JitError> {
    if (LLVMInitializeNativeTarget() != 0 || LLVMInitializeNativeAsmPrinter() != 0 ||
        LLVMInitializeNativeAsmParser() != 0) {
        return JitError::make(ErrorKind::Compilation, "failed to initialize the native target");
    }

    auto engine = std::make_shared<Engine>();
    LLVMErrorRef err = LLVMOrcCreateLLJIT(&engine->jit, nullptr);
    if (err) {
        engine->jit = nullptr;
        return JitError::make(ErrorKind::Compilation,
                              "failed to create LLJIT: " + consume_llvm_error(err));
    }

    AUTOJIT_LOG_INFO("llvm", "LLJIT ready for " << LLVMOrcLLJITGetTripleString(engine->jit));
    return std::shared_ptr<LLVMJitPipeline>(new LLVMJitPipeline(std::move(engine)));
}

auto LLVMJitPipeline::triple() const -> std::string {
    return LLVMOrcLLJITGetTripleString(engine_->jit);
}

auto LLVMJitPipeline::compile(const jit::FunctionDecl& decl, const types::Signature& sig,
                              const jit::CompileOptions& options)
    -> Result<jit::ArtifactPtr, JitError> {
    if (options.backend == jit::Backend::Bytecode) {
        return JitError::make(ErrorKind::NotImplemented, jit::BYTECODE_REMOVED_MESSAGE);
    }

    auto completed = complete_signature(decl, sig, options);
    if (is_err(completed))
        return unwrap_err(completed);
    const types::Signature resolved = unwrap(completed).with_name(decl.name);

    // Unique within the shared JITDylib
    std::string base = options.symbol_name ? *options.symbol_name
                                           : cache::mangle_symbol(decl.name, resolved);
    std::string symbol =
        base + "_" + std::to_string(counter_.fetch_add(1, std::memory_order_relaxed));

    if (!decl.lower) {
        return compilation_error(symbol, "declaration '" + decl.name + "' has no lowering hook");
    }

    jit::LoweringRequest request{decl, resolved, symbol, options};
    auto lowered = decl.lower(request);
    if (is_err(lowered))
        return unwrap_err(lowered).with_note("while lowering '" + decl.name + "'");

    std::string ir = unwrap(lowered);
    if (options.wrap) {
        auto wrapper = llvm_host_wrapper(symbol, resolved);
        if (is_err(wrapper))
            return unwrap_err(wrapper);
        ir += unwrap(wrapper);
    }
    AUTOJIT_LOG_TRACE("llvm", "IR for " << symbol << ":\n" << ir);

    // Parse into a fresh thread-safe context
    LLVMOrcThreadSafeContextRef ts_ctx = LLVMOrcCreateNewThreadSafeContext();
    LLVMContextRef ctx = LLVMOrcThreadSafeContextGetContext(ts_ctx);

    LLVMMemoryBufferRef buffer = LLVMCreateMemoryBufferWithMemoryRangeCopy(
        ir.c_str(), ir.size(), symbol.c_str());
    LLVMModuleRef module = nullptr;
    char* error = nullptr;
    if (LLVMParseIRInContext(ctx, buffer, &module, &error) != 0) {
        LLVMOrcDisposeThreadSafeContext(ts_ctx);
        return compilation_error(symbol, "failed to parse LLVM IR: " + consume_error_message(error));
    }

    LLVMSetTarget(module, LLVMOrcLLJITGetTripleString(engine_->jit));
    LLVMSetDataLayout(module, LLVMOrcLLJITGetDataLayoutStr(engine_->jit));

    error = nullptr;
    if (LLVMVerifyModule(module, LLVMReturnStatusAction, &error) != 0) {
        std::string msg = consume_error_message(error);
        LLVMDisposeModule(module);
        LLVMOrcDisposeThreadSafeContext(ts_ctx);
        return compilation_error(symbol, "invalid LLVM IR: " + msg);
    } else if (error) {
        LLVMDisposeMessage(error);
    }

    if (options.opt_level > 0) {
        LLVMPassBuilderOptionsRef pass_opts = LLVMCreatePassBuilderOptions();
        LLVMErrorRef err =
            LLVMRunPasses(module, get_opt_level_string(options.opt_level), nullptr, pass_opts);
        if (err) {
            AUTOJIT_LOG_WARN("llvm", "optimization of " << symbol
                                                        << " failed: " << consume_llvm_error(err));
        }
        LLVMDisposePassBuilderOptions(pass_opts);
    }

    // The thread-safe module takes the module; the context stays alive with it.
    LLVMOrcThreadSafeModuleRef ts_module = LLVMOrcCreateNewThreadSafeModule(module, ts_ctx);
    LLVMOrcDisposeThreadSafeContext(ts_ctx);

    std::lock_guard<std::mutex> lock(engine_->mutex);

    LLVMOrcJITDylibRef dylib = LLVMOrcLLJITGetMainJITDylib(engine_->jit);
    LLVMOrcResourceTrackerRef tracker = LLVMOrcJITDylibCreateResourceTracker(dylib);
    LLVMErrorRef err = LLVMOrcLLJITAddLLVMIRModuleWithRT(engine_->jit, tracker, ts_module);
    if (err) {
        LLVMOrcReleaseResourceTracker(tracker);
        return compilation_error(symbol, "failed to add module: " + consume_llvm_error(err));
    }

    LLVMOrcExecutorAddress entry_addr = 0;
    err = LLVMOrcLLJITLookup(engine_->jit, &entry_addr, symbol.c_str());
    if (err) {
        std::string msg = consume_llvm_error(err);
        LLVMErrorRef remove_err = LLVMOrcResourceTrackerRemove(tracker);
        if (remove_err) {
            AUTOJIT_LOG_WARN("llvm", "cleanup of " << symbol << " failed: "
                                                   << consume_llvm_error(remove_err));
        }
        LLVMOrcReleaseResourceTracker(tracker);
        return compilation_error(symbol, "symbol lookup failed: " + msg);
    }

    LLVMOrcExecutorAddress wrapper_addr = 0;
    if (options.wrap) {
        std::string wrapper_name = symbol + "__wrapper";
        err = LLVMOrcLLJITLookup(engine_->jit, &wrapper_addr, wrapper_name.c_str());
        if (err) {
            std::string msg = consume_llvm_error(err);
            LLVMErrorRef remove_err = LLVMOrcResourceTrackerRemove(tracker);
            if (remove_err) {
                AUTOJIT_LOG_WARN("llvm", "cleanup of " << symbol << " failed: "
                                                       << consume_llvm_error(remove_err));
            }
            LLVMOrcReleaseResourceTracker(tracker);
            return compilation_error(symbol, "wrapper lookup failed: " + msg);
        }
    }

    auto handle = std::make_shared<LLVMModuleHandle>(engine_, tracker, symbol);

    auto artifact = std::make_shared<jit::CompiledArtifact>();
    artifact->signature = resolved;
    artifact->symbol = symbol;
    artifact->entry = reinterpret_cast<void*>(static_cast<uintptr_t>(entry_addr));
    artifact->module = handle;
    if (options.wrap) {
        artifact->invoke =
            make_invoker(resolved, reinterpret_cast<HostWrapperFn>(static_cast<uintptr_t>(wrapper_addr)),
                         symbol, handle);
    }

    AUTOJIT_LOG_DEBUG("llvm", "compiled " << symbol << " " << resolved.canonical() << " at "
                                          << artifact->entry);
    return jit::ArtifactPtr(std::move(artifact));
}

} // namespace autojit::backend
