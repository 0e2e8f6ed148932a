//! # Specialization Cache Tests
//!
//! Compile-once semantics, per-signature independence, failure handling,
//! concurrent misses and symbol mangling.

#include "cache/specialization_cache.hpp"

#include <atomic>
#include <chrono>
#include <gtest/gtest.h>
#include <thread>
#include <vector>

using namespace autojit;
using namespace autojit::cache;
using namespace autojit::types;

namespace {

Signature sig_of(std::string_view text) {
    return unwrap(parse_signature(text));
}

ArtifactPtr make_artifact(const Signature& sig, const std::string& symbol) {
    auto artifact = std::make_shared<jit::CompiledArtifact>();
    artifact->signature = sig;
    artifact->symbol = symbol;
    return artifact;
}

} // namespace

class SpecializationCacheTest : public ::testing::Test {
protected:
    SpecializationCache cache{"add", 2};
    std::atomic<int> compiles{0};

    /// Compiles to `ret(args)` where ret is the first argument type.
    CompileFn counting_compile() {
        return [this](const Signature& sig) -> Result<ArtifactPtr, JitError> {
            ++compiles;
            auto resolved = sig.has_return_type() ? sig : sig.with_return_type(sig.args()[0]);
            return make_artifact(resolved, mangle_symbol("add", resolved));
        };
    }
};

// ============================================================================
// Lookup and Registration
// ============================================================================

TEST_F(SpecializationCacheTest, EmptyCacheMisses) {
    EXPECT_FALSE(cache.get(sig_of("i4(i4, i4)")).has_value());
    EXPECT_FALSE(cache.contains(Signature(nullptr, {make_i32(), make_i32()})));
    EXPECT_EQ(cache.get_stats().total_entries, 0u);
}

TEST_F(SpecializationCacheTest, RegisterThenGet) {
    cache.register_specialization(make_artifact(sig_of("i4(i4, i4)"), "a"));

    auto hit = cache.get(sig_of("i4(i4, i4)"));
    ASSERT_TRUE(hit.has_value());
    EXPECT_EQ((*hit)->symbol, "a");

    // Exact lookup compares the return type too.
    EXPECT_FALSE(cache.get(sig_of("i8(i4, i4)")).has_value());
}

TEST_F(SpecializationCacheTest, UnknownReturnTypeMatchesByArguments) {
    cache.register_specialization(make_artifact(sig_of("f8(f8, i4)"), "a"));

    auto hit = cache.get(Signature(nullptr, {make_f64(), make_i32()}));
    ASSERT_TRUE(hit.has_value());
    EXPECT_EQ((*hit)->signature.canonical(), "f8(f8, i4)");
}

TEST_F(SpecializationCacheTest, LastRegistrationWins) {
    auto first = make_artifact(sig_of("i4(i4, i4)"), "first");
    cache.register_specialization(first);
    cache.register_specialization(make_artifact(sig_of("i4(i4, i4)"), "second"));

    EXPECT_EQ((*cache.get(sig_of("i4(i4, i4)")))->symbol, "second");
    EXPECT_EQ(cache.get_stats().total_entries, 1u);
    // A holder of the replaced artifact keeps it alive.
    EXPECT_EQ(first->symbol, "first");
}

TEST_F(SpecializationCacheTest, ClearDropsEntries) {
    cache.register_specialization(make_artifact(sig_of("i4(i4, i4)"), "a"));
    cache.clear();

    EXPECT_FALSE(cache.contains(sig_of("i4(i4, i4)")));
    EXPECT_TRUE(cache.signatures().empty());
}

// ============================================================================
// compile_or_get
// ============================================================================

TEST_F(SpecializationCacheTest, CompilesOncePerSignature) {
    auto key = Signature(nullptr, {make_i32(), make_i32()});

    for (int i = 0; i < 5; ++i) {
        auto result = cache.compile_or_get(key, counting_compile());
        ASSERT_TRUE(is_ok(result));
        EXPECT_EQ(unwrap(result)->signature.canonical(), "i4(i4, i4)");
    }

    EXPECT_EQ(compiles.load(), 1);
    auto stats = cache.get_stats();
    EXPECT_EQ(stats.compilations, 1u);
    EXPECT_EQ(stats.misses, 1u);
    EXPECT_EQ(stats.hits, 4u);
}

TEST_F(SpecializationCacheTest, IndependentEntriesPerSignature) {
    ASSERT_TRUE(is_ok(cache.compile_or_get(Signature(nullptr, {make_i32(), make_i32()}),
                                           counting_compile())));
    ASSERT_TRUE(is_ok(cache.compile_or_get(Signature(nullptr, {make_f64(), make_f64()}),
                                           counting_compile())));
    ASSERT_TRUE(is_ok(cache.compile_or_get(Signature(nullptr, {make_i32(), make_i32()}),
                                           counting_compile())));

    EXPECT_EQ(compiles.load(), 2);
    EXPECT_EQ(cache.signatures().size(), 2u);
    EXPECT_TRUE(cache.contains(sig_of("i4(i4, i4)")));
    EXPECT_TRUE(cache.contains(sig_of("f8(f8, f8)")));
}

TEST_F(SpecializationCacheTest, ArityCheckedBeforeCompiling) {
    auto result = cache.compile_or_get(Signature(nullptr, {make_i32()}), counting_compile());

    ASSERT_TRUE(is_err(result));
    EXPECT_EQ(unwrap_err(result).kind, ErrorKind::Arity);
    EXPECT_EQ(compiles.load(), 0);
}

TEST_F(SpecializationCacheTest, FailedCompilationIsNotCached) {
    auto key = Signature(nullptr, {make_i32(), make_i32()});
    int attempts = 0;
    CompileFn flaky = [&](const Signature& sig) -> Result<ArtifactPtr, JitError> {
        if (++attempts == 1)
            return JitError::make(ErrorKind::Compilation, "backend exploded");
        return make_artifact(sig.with_return_type(make_i32()), "ok");
    };

    auto first = cache.compile_or_get(key, flaky);
    ASSERT_TRUE(is_err(first));
    EXPECT_EQ(unwrap_err(first).kind, ErrorKind::Compilation);
    EXPECT_FALSE(cache.contains(key));

    auto second = cache.compile_or_get(key, flaky);
    ASSERT_TRUE(is_ok(second));
    EXPECT_EQ(attempts, 2);
    EXPECT_EQ(cache.get_stats().failed_compilations, 1u);
}

TEST_F(SpecializationCacheTest, RejectsArtifactForOtherArguments) {
    CompileFn wrong = [](const Signature&) -> Result<ArtifactPtr, JitError> {
        return make_artifact(sig_of("f8(f8, f8)"), "wrong");
    };

    auto result = cache.compile_or_get(Signature(nullptr, {make_i32(), make_i32()}), wrong);
    ASSERT_TRUE(is_err(result));
    EXPECT_EQ(unwrap_err(result).kind, ErrorKind::Compilation);
    EXPECT_TRUE(cache.signatures().empty());
}

TEST_F(SpecializationCacheTest, RejectsNullArtifact) {
    CompileFn null_compile = [](const Signature&) -> Result<ArtifactPtr, JitError> {
        return ArtifactPtr{};
    };

    auto result = cache.compile_or_get(Signature(nullptr, {make_i32(), make_i32()}), null_compile);
    ASSERT_TRUE(is_err(result));
    EXPECT_EQ(unwrap_err(result).kind, ErrorKind::Compilation);
}

TEST_F(SpecializationCacheTest, ConcurrentMissesCompileOnce) {
    auto key = Signature(nullptr, {make_f64(), make_f64()});
    CompileFn slow = [this](const Signature& sig) -> Result<ArtifactPtr, JitError> {
        ++compiles;
        std::this_thread::sleep_for(std::chrono::milliseconds(20));
        return make_artifact(sig.with_return_type(make_f64()), "slow");
    };

    const int num_threads = 8;
    std::vector<std::thread> threads;
    std::vector<ArtifactPtr> seen(num_threads);
    for (int t = 0; t < num_threads; ++t) {
        threads.emplace_back([&, t]() {
            auto result = cache.compile_or_get(key, slow);
            if (is_ok(result))
                seen[t] = unwrap(result);
        });
    }
    for (auto& thread : threads) {
        thread.join();
    }

    EXPECT_EQ(compiles.load(), 1);
    for (const auto& artifact : seen) {
        ASSERT_NE(artifact, nullptr);
        EXPECT_EQ(artifact, seen[0]);
    }
}

// ============================================================================
// Mangling and Registry
// ============================================================================

TEST(MangleSymbolTest, StablePerSignature) {
    auto a = mangle_symbol("add", sig_of("i4(i4, i4)"));
    auto b = mangle_symbol("add", sig_of("plus i4(i4, i4)"));
    auto c = mangle_symbol("add", sig_of("f8(f8, f8)"));

    EXPECT_EQ(a, b);
    EXPECT_NE(a, c);
    EXPECT_EQ(a.rfind("__autojit_add_", 0), 0u);
    EXPECT_EQ(a.size(), std::string("__autojit_add_").size() + 16);
}

TEST(SpecializationRegistryTest, CreateFindAndTotals) {
    SpecializationRegistry registry;
    auto a = registry.create("a", 1);
    auto b = registry.create("b", 1);

    EXPECT_NE(a, b);
    EXPECT_EQ(registry.size(), 2u);
    EXPECT_EQ(registry.find(999), nullptr);
    ASSERT_NE(registry.find(a), nullptr);
    EXPECT_EQ(registry.find(a)->callable_name(), "a");

    registry.find(a)->register_specialization(make_artifact(sig_of("i4(i4)"), "x"));
    registry.find(b)->register_specialization(make_artifact(sig_of("f8(f8)"), "y"));
    EXPECT_EQ(registry.total_stats().total_entries, 2u);
}
