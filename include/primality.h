#pragma once

#include "sieve.h"

#include <cstdint>

namespace primeseq {

bool is_prime(std::int64_t x,const PrimeList&known={});

// Trial division; much slower than primes_up_to for producing ranges.
std::uint64_t next_prime(const PrimeList&known);

}
