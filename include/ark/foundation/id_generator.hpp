#pragma once

/// @file id_generator.hpp
/// @brief Sequence, persistent and UUID identifier generators.

#include <atomic>
#include <cstdint>
#include <mutex>
#include <random>
#include <string>
#include <unordered_set>

namespace ark::foundation {

/// Monotonic integer ids, starting at 1. Thread-safe.
class SequenceIdGenerator {
public:
    SequenceIdGenerator() = default;

    [[nodiscard]] uint64_t next() noexcept {
        return next_.fetch_add(1, std::memory_order_relaxed);
    }

    /// The id the next call to next() will return.
    [[nodiscard]] uint64_t peek() const noexcept {
        return next_.load(std::memory_order_relaxed);
    }

private:
    std::atomic<uint64_t> next_{1};
};

/// Random 16-hex-digit ids that survive serialization.
///
/// Ids are unique within one generator. Ids loaded from storage can be
/// reserved so that freshly generated ids never collide with them.
class PersistentIdGenerator {
public:
    PersistentIdGenerator();
    explicit PersistentIdGenerator(uint64_t seed);

    [[nodiscard]] std::string next();

    /// Mark an externally supplied id as taken.
    /// @return false if it was already taken.
    bool reserve(const std::string& id);

    [[nodiscard]] bool contains(const std::string& id) const;

private:
    mutable std::mutex mutex_;
    std::mt19937_64 engine_;
    std::unordered_set<std::string> issued_;
};

/// Generate a random RFC 4122 version 4 UUID in canonical text form.
[[nodiscard]] std::string generateUuid();

} // namespace ark::foundation
