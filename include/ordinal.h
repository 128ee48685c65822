#pragma once

#include "sieve.h"

#include <cstddef>
#include <cstdint>

namespace primeseq {

struct SieveExtent {
    PrimeList primes;
    std::uint64_t bound;
};

std::uint64_t grow_bound(std::uint64_t bound);
std::uint64_t initial_bound(std::size_t count,const PrimeList&known);

// Every prime up to the returned bound, with at least `count` of them.
SieveExtent extend_to_count(std::size_t count,const PrimeList&known);
// Every prime up to a bound >= value, reached by doubling from `covered`.
SieveExtent extend_to_value(std::uint64_t value,std::uint64_t covered,const PrimeList&known);

PrimeList n_primes(std::int64_t n,const PrimeList&known={});
std::uint64_t nth_prime(std::int64_t n,const PrimeList&known={});
PrimeList composites_up_to(std::int64_t x,const PrimeList&known={});

}
