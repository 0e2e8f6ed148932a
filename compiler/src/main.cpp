//! # autojit Driver
//!
//! Small command-line front end to the JIT layer.
//!
//! ## Usage
//!
//! ```bash
//! autojit sig "add i4(i4, i4)" "f8(f8[:, :])"   # Print canonical signatures
//! autojit demo                                  # JIT-compile and run `add`
//! autojit --version
//! ```
//!
//! Logging flags (`--log-level=`, `--log-filter=`, `-v`, `-q`, ...) are
//! accepted before or after the command.

#include "backend/llvm_jit.hpp"
#include "common.hpp"
#include "jit/context.hpp"
#include "log/log.hpp"
#include "types/signature.hpp"

#include <iostream>
#include <string>
#include <vector>

using namespace autojit;

namespace {

void print_usage() {
    std::cout << "autojit " << VERSION << "\n\n"
              << "Usage:\n"
              << "  autojit sig <signature>...   Parse signatures and print them canonically\n"
              << "  autojit demo                 Compile and run add() for i4 and f8\n"
              << "  autojit --version            Print the version\n\n"
              << "Logging:\n"
              << "  --log-level=<level>  --log-filter=<filter>  --log-file=<path>\n"
              << "  --log-format=text|json  -v/-vv/-vvv  -q\n";
}

bool is_log_flag(const std::string& arg) {
    return arg.rfind("--log-", 0) == 0 || arg == "-q" || arg == "--quiet" || arg == "--verbose" ||
           arg == "-v" || arg == "-vv" || arg == "-vvv";
}

int run_sig(const std::vector<std::string>& signatures) {
    if (signatures.empty()) {
        std::cerr << "Usage: autojit sig <signature>...\n";
        return 1;
    }

    int failures = 0;
    for (const auto& text : signatures) {
        auto parsed = types::parse_signature(text);
        if (is_err(parsed)) {
            std::cerr << unwrap_err(parsed).to_string() << "\n";
            ++failures;
            continue;
        }
        std::cout << unwrap(parsed).to_string() << "\n";
    }
    return failures == 0 ? 0 : 1;
}

/// `add(a, b)`: the result type is the numeric promotion of the operands.
jit::FunctionDecl make_add_decl() {
    jit::FunctionDecl decl;
    decl.name = "add";
    decl.params = {"a", "b"};

    decl.infer = [](const jit::InferenceRequest& req) -> Result<jit::InferenceResult, JitError> {
        auto ret = types::promote_numeric(req.arg_types[0], req.arg_types[1]);
        if (!ret) {
            return JitError::make(ErrorKind::Compilation, "add() needs numeric operands");
        }
        jit::InferenceResult result{types::Signature(ret, req.arg_types), {}, {}};
        result.symtab.define("a", types::Variable{req.arg_types[0]});
        result.symtab.define("b", types::Variable{req.arg_types[1]});
        return result;
    };

    decl.lower = [](const jit::LoweringRequest& req) -> Result<std::string, JitError> {
        const auto& sig = req.signature;
        for (const auto& arg : sig.args()) {
            if (!types::types_equal(arg, sig.return_type())) {
                return JitError::make(ErrorKind::Compilation,
                                      "add() is only lowered for uniform operands, not " +
                                          sig.canonical());
            }
        }
        auto ty = backend::llvm_type_name(sig.return_type());
        if (is_err(ty))
            return ty;
        const auto& t = unwrap(ty);
        const char* op = types::is_float(sig.return_type()) ? "fadd" : "add";
        return "define " + t + " @" + req.symbol + "(" + t + " %a, " + t + " %b) {\n" +
               "entry:\n" + "  %r = " + op + " " + t + " %a, %b\n" + "  ret " + t + " %r\n}\n";
    };

    return decl;
}

int run_demo() {
    auto pipeline = backend::LLVMJitPipeline::create();
    if (is_err(pipeline)) {
        std::cerr << unwrap_err(pipeline).to_string() << "\n";
        return 1;
    }
    std::cout << "target: " << unwrap(pipeline)->triple() << "\n";

    jit::JitContext ctx(unwrap(pipeline), jit::JitOptions::from_env());
    auto add = ctx.autojit(make_add_decl());
    if (is_err(add)) {
        std::cerr << unwrap_err(add).to_string() << "\n";
        return 1;
    }

    const std::vector<std::vector<types::Value>> calls = {
        {types::Value(int32_t(2)), types::Value(int32_t(40))},
        {types::Value(1.25), types::Value(2.5)},
        {types::Value(int32_t(-7)), types::Value(int32_t(7))},
    };

    for (const auto& args : calls) {
        auto result = ctx.invoke(unwrap(add), args);
        if (is_err(result)) {
            std::cerr << unwrap_err(result).to_string() << "\n";
            return 1;
        }
        std::cout << "add(" << args[0].to_string() << ", " << args[1].to_string()
                  << ") = " << unwrap(result).to_string() << "\n";
    }

    auto stats = ctx.specializations().total_stats();
    std::cout << "specializations: " << stats.total_entries << " (" << stats.compilations
              << " compiled, " << stats.hits << " cache hits)\n";
    return 0;
}

} // namespace

int main(int argc, char* argv[]) {
    log::Logger::init(log::parse_log_options(argc, argv));

    std::vector<std::string> args;
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (!is_log_flag(arg))
            args.push_back(std::move(arg));
    }

    if (args.empty() || args[0] == "--help" || args[0] == "-h") {
        print_usage();
        return 0;
    }

    const std::string& command = args[0];

    if (command == "--version" || command == "-V") {
        std::cout << "autojit " << VERSION << "\n";
        return 0;
    }

    if (command == "sig") {
        return run_sig(std::vector<std::string>(args.begin() + 1, args.end()));
    }

    if (command == "demo") {
        return run_demo();
    }

    std::cerr << "Unknown command: " << command << "\n\n";
    print_usage();
    return 1;
}
