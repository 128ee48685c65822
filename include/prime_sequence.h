#pragma once

#include "sieve.h"

#include <cstddef>
#include <cstdint>
#include <functional>
#include <optional>
#include <string>

namespace primeseq {

struct SliceSpec {
    std::optional<std::int64_t>start;
    std::optional<std::int64_t>stop;
    std::optional<std::int64_t>step;
};

enum class SliceKind {
    Forward,
    Backward,
    Empty,
    Invalid,
};

struct ResolvedSlice {
    SliceKind kind=SliceKind::Empty;
    std::size_t first=0;
    std::size_t count=0;
    std::int64_t step=1;
    // Largest index the slice reads; meaningful for Forward and Backward.
    std::size_t highest_index=0;
    std::string error;
};

// Classifies a slice over the unbounded prime sequence without touching any
// cache. A default start is 0 and a default step is 1. A forward slice needs
// an explicit non-negative stop; a backward slice may omit it and then runs
// down to index 0. Negative indices are never valid.
ResolvedSlice resolve_slice(const SliceSpec&spec);

// The infinite ordered set of primes, backed by a cache that is extended on
// demand and never shrinks. Not thread-safe.
class PrimeSequence {
public:
    using ExtensionListener=std::function<void(std::uint64_t bound,std::size_t cached)>;
    using const_iterator=PrimeList::const_iterator;

    PrimeSequence();

    bool contains(std::int64_t value);
    std::uint64_t at(std::int64_t index);
    std::uint64_t operator[](std::int64_t index) { return at(index);}
    PrimeList slice(const SliceSpec&spec);

    // Number of primes cached so far, not the size of the set.
    std::size_t size() const { return cache_.size();}
    // Every prime below the watermark is cached.
    std::uint64_t watermark() const { return watermark_;}
    const PrimeList&cached() const { return cache_;}

    const_iterator begin() const { return cache_.begin();}
    const_iterator end() const { return cache_.end();}

    void set_extension_listener(ExtensionListener listener);

    bool operator==(const PrimeList&other) const { return cache_==other;}

private:
    void extend_to_count(std::size_t count);
    void extend_past(std::uint64_t value);
    void adopt(PrimeList&&primes,std::uint64_t bound);

    PrimeList cache_;
    std::uint64_t watermark_;
    ExtensionListener listener_;
};

}
