#include "jit/context.hpp"

#include "jit/bytecode.hpp"
#include "log/log.hpp"

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <mutex>

namespace autojit::jit {

// ============================================================================
// JitOptions
// ============================================================================

static std::string lowercase(std::string text) {
    std::transform(text.begin(), text.end(), text.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return text;
}

JitOptions JitOptions::from_env() {
    JitOptions options;

    if (const char* level = std::getenv("AUTOJIT_OPT_LEVEL")) {
        std::string text(level);
        if (text.size() == 1 && text[0] >= '0' && text[0] <= '3') {
            options.opt_level = text[0] - '0';
        } else {
            AUTOJIT_LOG_WARN("context", "ignoring AUTOJIT_OPT_LEVEL=" << text
                                                                      << " (expected 0-3)");
        }
    }

    if (const char* wrap = std::getenv("AUTOJIT_WRAP_EXPORTS")) {
        std::string text = lowercase(wrap);
        if (text == "1" || text == "true" || text == "yes" || text == "on") {
            options.wrap_exports = true;
        } else if (text == "0" || text == "false" || text == "no" || text == "off") {
            options.wrap_exports = false;
        } else {
            AUTOJIT_LOG_WARN("context", "ignoring AUTOJIT_WRAP_EXPORTS=" << wrap);
        }
    }

    return options;
}

// ============================================================================
// JitContext
// ============================================================================

static CompileOptions compile_options_for(const JitOptions& options, bool wrap) {
    CompileOptions compile;
    compile.opt_level = options.opt_level;
    compile.backend = options.backend;
    compile.wrap = wrap;
    return compile;
}

JitContext::JitContext(std::shared_ptr<PipelineAdapter> adapter, JitOptions options)
    : adapter_(std::move(adapter)), bytecode_(std::make_shared<BytecodePipeline>()),
      options_(options), exports_(adapter_, compile_options_for(options, options.wrap_exports)) {
    if (options_.verbose) {
        log::Logger::instance().set_level(log::LogLevel::Debug);
    }
    AUTOJIT_LOG_DEBUG("context", "created context on " << adapter_->name() << " at -O"
                                                       << options_.opt_level);
}

JitContext::~JitContext() {
    AUTOJIT_LOG_DEBUG("context", "releasing " << callables_.size() << " callables and "
                                              << classes_.size() << " classes");
}

CompileOptions JitContext::base_compile_options() const {
    return compile_options_for(options_, true);
}

Result<std::shared_ptr<Dispatcher>, JitError>
JitContext::make_dispatcher(FunctionDecl decl, FunctionOptions options, cache::CallableId& id) {
    if (options.target != "cpu") {
        return JitError::make(ErrorKind::NotImplemented,
                              "unsupported target '" + options.target + "' for " + decl.name);
    }
    if (options.template_signature &&
        options.template_signature->arity() != decl.params.size()) {
        return JitError::make(ErrorKind::SignatureMismatch,
                              decl.name + "() takes " + std::to_string(decl.params.size()) +
                                  " arguments but its template " +
                                  options.template_signature->canonical() + " has " +
                                  std::to_string(options.template_signature->arity()));
    }

    auto adapter = options.backend == Backend::Bytecode ? bytecode_ : adapter_;
    id = registry_.create(decl.name, decl.params.size());
    auto cache = registry_.find(id);
    return std::make_shared<Dispatcher>(std::move(decl), std::move(options), std::move(cache),
                                        std::move(adapter), base_compile_options());
}

void JitContext::publish(cache::CallableId id, std::shared_ptr<Dispatcher> dispatcher) {
    std::unique_lock lock(mutex_);
    callables_[id] = std::move(dispatcher);
}

Result<cache::CallableId, JitError> JitContext::autojit(FunctionDecl decl,
                                                        FunctionOptions options) {
    cache::CallableId id = 0;
    auto dispatcher = make_dispatcher(std::move(decl), std::move(options), id);
    if (is_err(dispatcher))
        return unwrap_err(dispatcher);

    AUTOJIT_LOG_DEBUG("dispatch", "registered " << unwrap(dispatcher)->decl().name << " as #"
                                                << id);
    publish(id, unwrap(dispatcher));
    return id;
}

Result<cache::CallableId, JitError> JitContext::jit(FunctionDecl decl,
                                                    const types::Signature& sig,
                                                    FunctionOptions options) {
    if (sig.arity() != decl.params.size()) {
        return JitError::make(ErrorKind::SignatureMismatch,
                              decl.name + "() takes " + std::to_string(decl.params.size()) +
                                  " arguments but the signature " + sig.canonical() + " has " +
                                  std::to_string(sig.arity()));
    }
    for (const auto& arg : sig.args()) {
        if (types::contains_type_var(arg)) {
            return JitError::make(ErrorKind::SignatureMismatch,
                                  "cannot compile " + decl.name + " eagerly for the generic " +
                                      sig.canonical());
        }
    }

    cache::CallableId id = 0;
    auto dispatcher = make_dispatcher(std::move(decl), std::move(options), id);
    if (is_err(dispatcher))
        return unwrap_err(dispatcher);

    auto& callable = unwrap(dispatcher);
    auto compiled = callable->compile_fixed(sig);
    if (is_err(compiled))
        return unwrap_err(compiled);

    publish(id, callable);
    return id;
}

Result<cache::CallableId, JitError> JitContext::jit(FunctionDecl decl, const std::string& sig,
                                                    FunctionOptions options) {
    auto parsed = types::parse_signature(sig);
    if (is_err(parsed))
        return unwrap_err(parsed);
    return jit(std::move(decl), unwrap(parsed), std::move(options));
}

std::shared_ptr<Dispatcher> JitContext::dispatcher(cache::CallableId id) const {
    std::shared_lock lock(mutex_);
    auto it = callables_.find(id);
    return it != callables_.end() ? it->second : nullptr;
}

Result<types::Value, JitError> JitContext::invoke(cache::CallableId id,
                                                  std::span<const types::Value> args,
                                                  const types::KeywordArgs& kwargs) {
    auto callable = dispatcher(id);
    if (!callable) {
        return JitError::make(ErrorKind::UnknownCallable,
                              "no callable registered as #" + std::to_string(id));
    }
    return callable->invoke(args, kwargs);
}

Result<ArtifactPtr, JitError> JitContext::compile_function(cache::CallableId id,
                                                           const std::vector<types::TypePtr>& argtypes,
                                                           types::TypePtr restype) {
    auto callable = dispatcher(id);
    if (!callable) {
        return JitError::make(ErrorKind::UnknownCallable,
                              "no callable registered as #" + std::to_string(id));
    }
    return callable->compile(argtypes, std::move(restype));
}

Result<exttypes::ClassDescriptorPtr, JitError>
JitContext::build_class(const exttypes::ClassDecl& decl,
                        const exttypes::ExplicitSignatures& explicit_signatures) {
    exttypes::ClassBuilder builder(*adapter_, base_compile_options());
    auto built = builder.build(decl, explicit_signatures);
    if (is_err(built))
        return built;

    std::unique_lock lock(mutex_);
    auto [it, inserted] = classes_.insert_or_assign(decl.name, unwrap(built));
    if (!inserted) {
        AUTOJIT_LOG_WARN("exttypes", "class " << decl.name << " replaced by a rebuild");
    }
    return it->second;
}

exttypes::ClassDescriptorPtr JitContext::lookup_class(const std::string& name) const {
    std::shared_lock lock(mutex_);
    auto it = classes_.find(name);
    return it != classes_.end() ? it->second : nullptr;
}

std::vector<std::string> JitContext::class_names() const {
    std::shared_lock lock(mutex_);
    std::vector<std::string> names;
    names.reserve(classes_.size());
    for (const auto& [name, _] : classes_) {
        names.push_back(name);
    }
    return names;
}

} // namespace autojit::jit
