#include "constellation.h"

#include <algorithm>
#include <stdexcept>

namespace primeseq {

namespace {

class PrimeLookup {
public:
    PrimeLookup(std::int64_t x,const PrimeList&known)
        : primes_(primes_up_to(x,known)),
          limit_(static_cast<std::uint64_t>(x)) {}

    const PrimeList&primes() const { return primes_;}

    bool has(std::uint64_t value) const {
        return value<=limit_&&std::binary_search(primes_.begin(),primes_.end(),value);
    }

private:
    PrimeList primes_;
    std::uint64_t limit_;
};

}

std::vector<PrimePair>primes_with_difference_up_to(std::int64_t x,std::int64_t difference,const PrimeList&known) {
    if(difference<1) {
        throw std::invalid_argument("difference must be positive");
    }
    PrimeLookup lookup(x,known);
    std::uint64_t gap=static_cast<std::uint64_t>(difference);
    std::vector<PrimePair>pairs;
    for(std::uint64_t p : lookup.primes()) {
        if(lookup.has(p+gap)) {
            pairs.push_back({p,p+gap});
        }
    }
    return pairs;
}

std::vector<PrimePair>twin_primes_up_to(std::int64_t x,const PrimeList&known) {
    return primes_with_difference_up_to(x,2,known);
}

std::vector<PrimePair>cousin_primes_up_to(std::int64_t x,const PrimeList&known) {
    return primes_with_difference_up_to(x,4,known);
}

std::vector<PrimePair>sexy_primes_up_to(std::int64_t x,const PrimeList&known) {
    return primes_with_difference_up_to(x,6,known);
}

std::vector<PrimeTriplet>prime_triplets_up_to(std::int64_t x,const PrimeList&known) {
    PrimeLookup lookup(x,known);
    std::vector<PrimeTriplet>triplets;
    for(std::uint64_t p : lookup.primes()) {
        if(!lookup.has(p+6)) {
            continue;
        }
        if(lookup.has(p+2)) {
            triplets.push_back({p,p+2,p+6});
        }
        if(lookup.has(p+4)) {
            triplets.push_back({p,p+4,p+6});
        }
    }
    return triplets;
}

std::vector<PrimeQuadruplet>prime_quadruplets_up_to(std::int64_t x,const PrimeList&known) {
    PrimeLookup lookup(x,known);
    std::vector<PrimeQuadruplet>quadruplets;
    for(std::uint64_t p : lookup.primes()) {
        if(lookup.has(p+2)&&lookup.has(p+6)&&lookup.has(p+8)) {
            quadruplets.push_back({p,p+2,p+6,p+8});
        }
    }
    return quadruplets;
}

}
