#pragma once

#include "sieve.h"

#include <array>
#include <cstdint>
#include <vector>

namespace primeseq {

using PrimePair=std::array<std::uint64_t,2>;
using PrimeTriplet=std::array<std::uint64_t,3>;
using PrimeQuadruplet=std::array<std::uint64_t,4>;

// Pairs (p, p+difference) of primes with p+difference <= x.
std::vector<PrimePair>primes_with_difference_up_to(std::int64_t x,std::int64_t difference,const PrimeList&known={});

std::vector<PrimePair>twin_primes_up_to(std::int64_t x,const PrimeList&known={});
std::vector<PrimePair>cousin_primes_up_to(std::int64_t x,const PrimeList&known={});
std::vector<PrimePair>sexy_primes_up_to(std::int64_t x,const PrimeList&known={});

// Both shapes (p, p+2, p+6) and (p, p+4, p+6), ordered by p.
std::vector<PrimeTriplet>prime_triplets_up_to(std::int64_t x,const PrimeList&known={});
std::vector<PrimeQuadruplet>prime_quadruplets_up_to(std::int64_t x,const PrimeList&known={});

}
