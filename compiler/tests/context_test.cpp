//! # JIT Context Tests
//!
//! Lazy specialization through `invoke`, eager `jit`, `compile_function`,
//! options and the removed bytecode backend, all on the fake pipeline.

#include "jit/bytecode.hpp"
#include "jit/context.hpp"
#include "support/fake_pipeline.hpp"

#include <cstdlib>
#include <gtest/gtest.h>
#include <thread>

using namespace autojit;
using namespace autojit::jit;
using namespace autojit::types;
using autojit::test::FakePipeline;

class JitContextTest : public ::testing::Test {
protected:
    std::shared_ptr<FakePipeline> pipeline = std::make_shared<FakePipeline>();
    JitContext ctx{pipeline};

    void SetUp() override {
        pipeline->implement("add", test::add_values);
    }

    cache::CallableId register_add(FunctionOptions options = {}) {
        auto id = ctx.autojit(test::numeric_decl("add", {"a", "b"}), std::move(options));
        EXPECT_TRUE(is_ok(id));
        return is_ok(id) ? unwrap(id) : 0;
    }

    Result<Value, JitError> call(cache::CallableId id, std::vector<Value> args,
                                 const KeywordArgs& kwargs = {}) {
        return ctx.invoke(id, args, kwargs);
    }
};

// ============================================================================
// Lazy Specialization
// ============================================================================

TEST_F(JitContextTest, InvokeCompilesOnFirstCall) {
    auto add = register_add();

    auto result = call(add, {Value(int32_t(2)), Value(int32_t(40))});
    ASSERT_TRUE(is_ok(result));
    EXPECT_EQ(unwrap(result).as<int32_t>(), 42);
    EXPECT_EQ(pipeline->compile_count(), 1);
}

TEST_F(JitContextTest, InvokeIsIdempotent) {
    auto add = register_add();

    for (int i = 0; i < 4; ++i) {
        auto result = call(add, {Value(1.5), Value(2.0)});
        ASSERT_TRUE(is_ok(result));
        EXPECT_DOUBLE_EQ(unwrap(result).as<double>(), 3.5);
    }
    EXPECT_EQ(pipeline->compile_count(), 1);

    auto stats = ctx.specializations().total_stats();
    EXPECT_EQ(stats.compilations, 1u);
    EXPECT_EQ(stats.hits, 3u);
}

TEST_F(JitContextTest, OneSpecializationPerSignature) {
    auto add = register_add();

    ASSERT_TRUE(is_ok(call(add, {Value(int32_t(1)), Value(int32_t(2))})));
    ASSERT_TRUE(is_ok(call(add, {Value(1.0), Value(2.0)})));
    ASSERT_TRUE(is_ok(call(add, {Value(int32_t(1)), Value(2.0)})));
    ASSERT_TRUE(is_ok(call(add, {Value(int32_t(5)), Value(int32_t(6))})));

    EXPECT_EQ(pipeline->compile_count(), 3);
    auto sigs = ctx.dispatcher(add)->cache().signatures();
    EXPECT_EQ(sigs.size(), 3u);
    EXPECT_TRUE(ctx.dispatcher(add)->cache().contains(unwrap(parse_signature("f8(i4, f8)"))));
}

TEST_F(JitContextTest, ArityErrorNeverCompiles) {
    auto add = register_add();

    auto result = call(add, {Value(int32_t(1))});
    ASSERT_TRUE(is_err(result));
    EXPECT_EQ(unwrap_err(result).kind, ErrorKind::Arity);
    EXPECT_EQ(unwrap_err(result).message, "add() takes exactly 2 arguments (1 given)");
    EXPECT_EQ(pipeline->compile_count(), 0);
}

TEST_F(JitContextTest, KeywordArgumentsRejected) {
    auto add = register_add();

    auto result = call(add, {Value(int32_t(1)), Value(int32_t(2))}, {{"a", Value(int32_t(1))}});
    ASSERT_TRUE(is_err(result));
    EXPECT_EQ(unwrap_err(result).kind, ErrorKind::KeywordArgsUnsupported);
    EXPECT_EQ(pipeline->compile_count(), 0);
}

TEST_F(JitContextTest, UnsupportedValue) {
    auto add = register_add();

    auto result = call(add, {Value(), Value(int32_t(2))});
    ASSERT_TRUE(is_err(result));
    EXPECT_EQ(unwrap_err(result).kind, ErrorKind::UnsupportedValue);
}

TEST_F(JitContextTest, UnknownCallable) {
    auto result = call(12345, {});
    ASSERT_TRUE(is_err(result));
    EXPECT_EQ(unwrap_err(result).kind, ErrorKind::UnknownCallable);
}

TEST_F(JitContextTest, FailedCompilationLeavesCallableUsable) {
    auto add = register_add();
    pipeline->fail_next(1);

    auto failed = call(add, {Value(int32_t(1)), Value(int32_t(2))});
    ASSERT_TRUE(is_err(failed));
    EXPECT_EQ(unwrap_err(failed).kind, ErrorKind::Compilation);

    auto other = call(add, {Value(1.0), Value(2.0)});
    ASSERT_TRUE(is_ok(other));

    auto retried = call(add, {Value(int32_t(1)), Value(int32_t(2))});
    ASSERT_TRUE(is_ok(retried));
    EXPECT_EQ(unwrap(retried).as<int32_t>(), 3);
}

TEST_F(JitContextTest, TemplateSignatureCoercesConcretePositions) {
    FunctionOptions options;
    options.template_signature = unwrap(parse_signature("T(T, f8)"));
    auto add = register_add(std::move(options));

    auto result = call(add, {Value(int32_t(1)), Value(int32_t(2))});
    ASSERT_TRUE(is_ok(result));

    auto compiled = pipeline->compiled();
    ASSERT_EQ(compiled.size(), 1u);
    EXPECT_EQ(compiled[0].canonical(), "i4(i4, f8)");
    EXPECT_EQ(unwrap(result).as<int32_t>(), 3);
}

TEST_F(JitContextTest, LocalsOverrideArgumentTypes) {
    FunctionOptions options;
    options.locals = {{"b", make_f64()}};
    auto add = register_add(std::move(options));

    auto result = call(add, {Value(int32_t(1)), Value(int32_t(2))});
    ASSERT_TRUE(is_ok(result));
    EXPECT_DOUBLE_EQ(unwrap(result).as<double>(), 3.0);
    EXPECT_EQ(pipeline->compiled()[0].canonical(), "f8(i4, f8)");
}

TEST_F(JitContextTest, TemplateArityMustMatchDeclaration) {
    FunctionOptions options;
    options.template_signature = unwrap(parse_signature("T(T)"));
    auto id = ctx.autojit(test::numeric_decl("add", {"a", "b"}), std::move(options));

    ASSERT_TRUE(is_err(id));
    EXPECT_EQ(unwrap_err(id).kind, ErrorKind::SignatureMismatch);
}

TEST_F(JitContextTest, OnlyCpuTarget) {
    FunctionOptions options;
    options.target = "gpu";
    auto id = ctx.autojit(test::numeric_decl("add", {"a", "b"}), std::move(options));

    ASSERT_TRUE(is_err(id));
    EXPECT_EQ(unwrap_err(id).kind, ErrorKind::NotImplemented);
}

TEST_F(JitContextTest, ConcurrentInvokesCompileOnce) {
    auto add = register_add();
    pipeline->set_delay(std::chrono::milliseconds(10));

    std::vector<std::thread> threads;
    std::atomic<int> ok{0};
    for (int t = 0; t < 6; ++t) {
        threads.emplace_back([&, t]() {
            std::vector<Value> args{Value(double(t)), Value(1.0)};
            if (is_ok(ctx.invoke(add, args)))
                ++ok;
        });
    }
    for (auto& thread : threads) {
        thread.join();
    }

    EXPECT_EQ(ok.load(), 6);
    EXPECT_EQ(pipeline->compile_count(), 1);
}

// ============================================================================
// Eager Compilation
// ============================================================================

TEST_F(JitContextTest, JitCompilesEagerly) {
    auto id = ctx.jit(test::numeric_decl("add", {"a", "b"}), std::string("f8(f8, f8)"));
    ASSERT_TRUE(is_ok(id));
    EXPECT_EQ(pipeline->compile_count(), 1);

    // Arguments are coerced to the fixed signature.
    auto result = call(unwrap(id), {Value(int32_t(1)), Value(int32_t(2))});
    ASSERT_TRUE(is_ok(result));
    EXPECT_DOUBLE_EQ(unwrap(result).as<double>(), 3.0);
    EXPECT_EQ(pipeline->compile_count(), 1);
}

TEST_F(JitContextTest, JitNameOverridesSymbol) {
    auto id = ctx.jit(test::numeric_decl("add", {"a", "b"}), std::string("plus i4(i4, i4)"));
    ASSERT_TRUE(is_ok(id));

    auto options = pipeline->compile_options();
    ASSERT_EQ(options.size(), 1u);
    ASSERT_TRUE(options[0].symbol_name.has_value());
    EXPECT_EQ(*options[0].symbol_name, "plus");
}

TEST_F(JitContextTest, JitFixedSignatureRejectsUncoercible) {
    auto id = ctx.jit(test::numeric_decl("add", {"a", "b"}), std::string("i4(i4, i4)"));
    ASSERT_TRUE(is_ok(id));

    auto result = call(unwrap(id), {Value(1.5), Value(int32_t(2))});
    ASSERT_TRUE(is_err(result));
    EXPECT_EQ(unwrap_err(result).kind, ErrorKind::AttributeType);

    auto arity = call(unwrap(id), {Value(int32_t(1))});
    ASSERT_TRUE(is_err(arity));
    EXPECT_EQ(unwrap_err(arity).kind, ErrorKind::Arity);
}

TEST_F(JitContextTest, JitFailureRegistersNothing) {
    pipeline->fail_next(1);
    auto id = ctx.jit(test::numeric_decl("add", {"a", "b"}), std::string("i4(i4, i4)"));
    ASSERT_TRUE(is_err(id));

    auto bad_syntax = ctx.jit(test::numeric_decl("add", {"a", "b"}), std::string("i4(i4"));
    ASSERT_TRUE(is_err(bad_syntax));
    EXPECT_EQ(unwrap_err(bad_syntax).kind, ErrorKind::SignatureSyntax);

    auto generic = ctx.jit(test::numeric_decl("add", {"a", "b"}), std::string("T(T, T)"));
    ASSERT_TRUE(is_err(generic));
    EXPECT_EQ(unwrap_err(generic).kind, ErrorKind::SignatureMismatch);
}

TEST_F(JitContextTest, CompileFunctionUsesCache) {
    auto add = register_add();

    auto first = ctx.compile_function(add, {make_i64(), make_i64()});
    ASSERT_TRUE(is_ok(first));
    EXPECT_EQ(unwrap(first)->signature.canonical(), "i8(i8, i8)");

    auto second = ctx.compile_function(add, {make_i64(), make_i64()}, make_i64());
    ASSERT_TRUE(is_ok(second));
    EXPECT_EQ(unwrap(second), unwrap(first));
    EXPECT_EQ(pipeline->compile_count(), 1);

    auto result = call(add, {Value(int64_t(4)), Value(int64_t(5))});
    ASSERT_TRUE(is_ok(result));
    EXPECT_EQ(unwrap(result).as<int64_t>(), 9);
    EXPECT_EQ(pipeline->compile_count(), 1);
}

// ============================================================================
// Backends and Options
// ============================================================================

TEST_F(JitContextTest, BytecodeBackendIsRemoved) {
    FunctionOptions options;
    options.backend = Backend::Bytecode;
    auto add = register_add(std::move(options));

    auto result = call(add, {Value(int32_t(1)), Value(int32_t(2))});
    ASSERT_TRUE(is_err(result));
    EXPECT_EQ(unwrap_err(result).kind, ErrorKind::NotImplemented);
    EXPECT_EQ(unwrap_err(result).message, BYTECODE_REMOVED_MESSAGE);
    EXPECT_EQ(pipeline->compile_count(), 0);
}

TEST_F(JitContextTest, OptLevelReachesPipeline) {
    JitOptions options;
    options.opt_level = 3;
    JitContext tuned(pipeline, options);
    auto add = tuned.autojit(test::numeric_decl("add", {"a", "b"}));
    ASSERT_TRUE(is_ok(add));

    std::vector<Value> args{Value(1.0), Value(2.0)};
    ASSERT_TRUE(is_ok(tuned.invoke(unwrap(add), args)));
    EXPECT_EQ(pipeline->compile_options().back().opt_level, 3);
}

TEST_F(JitContextTest, ContextsAreIndependent) {
    auto add = register_add();
    ASSERT_TRUE(is_ok(call(add, {Value(1.0), Value(2.0)})));

    JitContext other(pipeline);
    EXPECT_EQ(other.dispatcher(add), nullptr);
    EXPECT_EQ(other.specializations().size(), 0u);
}

TEST(JitOptionsTest, FromEnvironment) {
    setenv("AUTOJIT_OPT_LEVEL", "1", 1);
    setenv("AUTOJIT_WRAP_EXPORTS", "yes", 1);
    auto options = JitOptions::from_env();
    EXPECT_EQ(options.opt_level, 1);
    EXPECT_TRUE(options.wrap_exports);

    setenv("AUTOJIT_OPT_LEVEL", "fast", 1);
    setenv("AUTOJIT_WRAP_EXPORTS", "off", 1);
    options = JitOptions::from_env();
    EXPECT_EQ(options.opt_level, 2);
    EXPECT_FALSE(options.wrap_exports);

    unsetenv("AUTOJIT_OPT_LEVEL");
    unsetenv("AUTOJIT_WRAP_EXPORTS");
}
