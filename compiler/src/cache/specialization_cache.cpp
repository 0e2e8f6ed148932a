#include "cache/specialization_cache.hpp"

#include "common/fingerprint.hpp"
#include "log/log.hpp"

namespace autojit::cache {

SpecializationCache::SpecializationCache(std::string callable_name, size_t arity)
    : callable_name_(std::move(callable_name)), arity_(arity) {}

std::optional<ArtifactPtr> SpecializationCache::find_locked(const types::Signature& sig) const {
    if (sig.has_return_type()) {
        auto it = entries_.find(sig);
        if (it == entries_.end())
            return std::nullopt;
        return it->second;
    }

    auto by_args = by_args_.find(sig.args_key());
    if (by_args == by_args_.end())
        return std::nullopt;
    auto it = entries_.find(by_args->second);
    if (it == entries_.end())
        return std::nullopt;
    return it->second;
}

std::optional<ArtifactPtr> SpecializationCache::get(const types::Signature& sig) const {
    std::shared_lock lock(mutex_);
    return find_locked(sig);
}

bool SpecializationCache::contains(const types::Signature& sig) const {
    std::shared_lock lock(mutex_);
    return find_locked(sig).has_value();
}

void SpecializationCache::register_specialization(ArtifactPtr artifact) {
    if (!artifact)
        return;

    std::unique_lock lock(mutex_);
    const auto& sig = artifact->signature;
    by_args_.insert_or_assign(sig.args_key(), sig);
    entries_.insert_or_assign(sig, std::move(artifact));
    AUTOJIT_LOG_DEBUG("cache", "registered " << callable_name_ << " " << sig.canonical());
}

std::mutex& SpecializationCache::key_mutex(const std::string& args_key) {
    std::lock_guard<std::mutex> lock(key_locks_mutex_);
    auto& slot = key_locks_[args_key];
    if (!slot)
        slot = std::make_unique<std::mutex>();
    return *slot;
}

Result<ArtifactPtr, JitError> SpecializationCache::compile_or_get(const types::Signature& sig,
                                                                  const CompileFn& compile) {
    if (sig.arity() != arity_) {
        return JitError::make(ErrorKind::Arity, callable_name_ + "() takes exactly " +
                                                    std::to_string(arity_) + " arguments (" +
                                                    std::to_string(sig.arity()) + " given)");
    }

    if (auto hit = get(sig)) {
        hits_.fetch_add(1, std::memory_order_relaxed);
        return *hit;
    }

    // Serialize compilations of one argument tuple; a waiter finds the
    // winner's artifact on the second lookup.
    std::lock_guard<std::mutex> compile_lock(key_mutex(sig.args_key()));
    if (auto hit = get(sig)) {
        hits_.fetch_add(1, std::memory_order_relaxed);
        return *hit;
    }

    misses_.fetch_add(1, std::memory_order_relaxed);
    compilations_.fetch_add(1, std::memory_order_relaxed);
    AUTOJIT_LOG_DEBUG("cache", "miss " << callable_name_ << " " << sig.canonical());

    auto result = compile(sig);
    if (is_err(result)) {
        failed_compilations_.fetch_add(1, std::memory_order_relaxed);
        AUTOJIT_LOG_DEBUG("cache", "compilation of " << callable_name_ << " " << sig.canonical()
                                                     << " failed, nothing cached");
        return result;
    }

    auto artifact = unwrap(result);
    if (!artifact) {
        failed_compilations_.fetch_add(1, std::memory_order_relaxed);
        return JitError::make(ErrorKind::Compilation,
                              "pipeline returned no artifact for " + callable_name_);
    }
    if (artifact->signature.args_key() != sig.args_key()) {
        failed_compilations_.fetch_add(1, std::memory_order_relaxed);
        return JitError::make(ErrorKind::Compilation,
                              "pipeline compiled " + callable_name_ + " for " +
                                  artifact->signature.canonical() + ", requested " +
                                  sig.canonical());
    }

    register_specialization(artifact);
    return artifact;
}

std::vector<types::Signature> SpecializationCache::signatures() const {
    std::shared_lock lock(mutex_);
    std::vector<types::Signature> out;
    out.reserve(entries_.size());
    for (const auto& [sig, _] : entries_) {
        out.push_back(sig);
    }
    return out;
}

void SpecializationCache::clear() {
    std::unique_lock lock(mutex_);
    entries_.clear();
    by_args_.clear();
    hits_.store(0, std::memory_order_relaxed);
    misses_.store(0, std::memory_order_relaxed);
    compilations_.store(0, std::memory_order_relaxed);
    failed_compilations_.store(0, std::memory_order_relaxed);
}

SpecializationCache::Stats SpecializationCache::get_stats() const {
    std::shared_lock lock(mutex_);
    return {entries_.size(), hits_.load(std::memory_order_relaxed),
            misses_.load(std::memory_order_relaxed), compilations_.load(std::memory_order_relaxed),
            failed_compilations_.load(std::memory_order_relaxed)};
}

std::string mangle_symbol(const std::string& callable_name, const types::Signature& sig) {
    auto fp = fingerprint_string(types::type_key(sig.return_type()) + sig.args_key());
    return "__autojit_" + callable_name + "_" + fp.to_hex().substr(0, 16);
}

// ============================================================================
// SpecializationRegistry
// ============================================================================

CallableId SpecializationRegistry::create(std::string callable_name, size_t arity) {
    std::unique_lock lock(mutex_);
    CallableId id = next_id_++;
    caches_.emplace(id, std::make_shared<SpecializationCache>(std::move(callable_name), arity));
    return id;
}

std::shared_ptr<SpecializationCache> SpecializationRegistry::find(CallableId id) const {
    std::shared_lock lock(mutex_);
    auto it = caches_.find(id);
    return it == caches_.end() ? nullptr : it->second;
}

size_t SpecializationRegistry::size() const {
    std::shared_lock lock(mutex_);
    return caches_.size();
}

SpecializationCache::Stats SpecializationRegistry::total_stats() const {
    std::shared_lock lock(mutex_);
    SpecializationCache::Stats total;
    for (const auto& [_, cache] : caches_) {
        auto s = cache->get_stats();
        total.total_entries += s.total_entries;
        total.hits += s.hits;
        total.misses += s.misses;
        total.compilations += s.compilations;
        total.failed_compilations += s.failed_compilations;
    }
    return total;
}

} // namespace autojit::cache
