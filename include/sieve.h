#pragma once

#include <cstdint>
#include <vector>

namespace primeseq {

using PrimeList=std::vector<std::uint64_t>;

// Hints passed as `known` must be an increasing run of primes starting at 2
// with no gaps. They are not validated; an empty list means no hint.

std::uint64_t integer_sqrt(std::uint64_t x) noexcept;

PrimeList primes_up_to(std::int64_t bound,const PrimeList&known={});

std::uint64_t count_primes_up_to(std::int64_t bound);

}
