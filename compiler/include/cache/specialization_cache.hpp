//! # Specialization Cache
//!
//! Thread-safe per-callable store {signature -> compiled artifact}.
//!
//! ## Guarantees
//!
//! - At most one artifact per distinct signature, created by at most one
//!   compilation attempt: concurrent misses for the same argument types are
//!   serialized on a per-key mutex and re-check the map before compiling.
//! - Failed compilations insert nothing; the next call retries.
//! - No eviction. Entries live as long as the cache.
//!
//! Uses `std::shared_mutex` for concurrent read access.

#pragma once

#include "common.hpp"
#include "common/error.hpp"
#include "jit/artifact.hpp"
#include "types/signature.hpp"

#include <atomic>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <vector>

namespace autojit::cache {

using jit::ArtifactPtr;

/// Compiles one specialization on a cache miss.
using CompileFn = std::function<Result<ArtifactPtr, JitError>(const types::Signature&)>;

/// Per-callable specialization store.
class SpecializationCache {
public:
    SpecializationCache(std::string callable_name, size_t arity);

    /// Pure lookup. A signature without a return type matches the entry
    /// compiled for the same argument types.
    [[nodiscard]] std::optional<ArtifactPtr> get(const types::Signature& sig) const;

    [[nodiscard]] bool contains(const types::Signature& sig) const;

    /// Unconditional insert keyed by the artifact's signature. Last write wins.
    void register_specialization(ArtifactPtr artifact);

    /// Returns the cached artifact or compiles it exactly once.
    [[nodiscard]] Result<ArtifactPtr, JitError> compile_or_get(const types::Signature& sig,
                                                              const CompileFn& compile);

    /// All cached signatures, in no particular order.
    [[nodiscard]] std::vector<types::Signature> signatures() const;

    /// Drop every entry and reset statistics.
    void clear();

    [[nodiscard]] size_t arity() const {
        return arity_;
    }

    [[nodiscard]] const std::string& callable_name() const {
        return callable_name_;
    }

    /// Cache statistics.
    struct Stats {
        size_t total_entries = 0;
        size_t hits = 0;
        size_t misses = 0;
        size_t compilations = 0;
        size_t failed_compilations = 0;
    };

    [[nodiscard]] Stats get_stats() const;

private:
    std::optional<ArtifactPtr> find_locked(const types::Signature& sig) const;
    std::mutex& key_mutex(const std::string& args_key);

    std::string callable_name_;
    size_t arity_;

    mutable std::shared_mutex mutex_;
    std::unordered_map<types::Signature, ArtifactPtr, types::SignatureHash> entries_;
    std::unordered_map<std::string, types::Signature> by_args_;

    std::mutex key_locks_mutex_;
    std::unordered_map<std::string, std::unique_ptr<std::mutex>> key_locks_;

    mutable std::atomic<size_t> hits_{0};
    mutable std::atomic<size_t> misses_{0};
    std::atomic<size_t> compilations_{0};
    std::atomic<size_t> failed_compilations_{0};
};

/// Stable native symbol for a specialization: `__autojit_<name>_<hash>`.
[[nodiscard]] std::string mangle_symbol(const std::string& callable_name,
                                        const types::Signature& sig);

/// Identifies a registered callable within one context.
using CallableId = uint64_t;

/// Owns one cache per registered callable.
class SpecializationRegistry {
public:
    /// Register a callable and create its (empty) cache.
    CallableId create(std::string callable_name, size_t arity);

    /// Returns null for an unknown id.
    [[nodiscard]] std::shared_ptr<SpecializationCache> find(CallableId id) const;

    [[nodiscard]] size_t size() const;

    /// Statistics summed over every cache.
    [[nodiscard]] SpecializationCache::Stats total_stats() const;

private:
    mutable std::shared_mutex mutex_;
    std::unordered_map<CallableId, std::shared_ptr<SpecializationCache>> caches_;
    CallableId next_id_ = 1;
};

} // namespace autojit::cache
