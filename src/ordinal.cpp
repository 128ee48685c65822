#include "ordinal.h"

#include <algorithm>
#include <cmath>
#include <limits>
#include <stdexcept>

namespace primeseq {

namespace {

constexpr std::uint64_t kGrowthFactor=2;
constexpr std::uint64_t kMinimumBound=16;
constexpr std::uint64_t kMaximumBound=static_cast<std::uint64_t>(std::numeric_limits<std::int64_t>::max());

std::uint64_t sieve_bound_for(std::size_t count) {
    // p(n) < n (ln n + ln ln n) for n >= 6.
    if(count<6) {
        return kMinimumBound;
    }
    double n=static_cast<double>(count);
    double estimate=n*(std::log(n)+std::log(std::log(n)));
    if(estimate>=static_cast<double>(kMaximumBound)) {
        throw std::overflow_error("prime bound overflow");
    }
    return static_cast<std::uint64_t>(estimate)+1;
}

}

std::uint64_t grow_bound(std::uint64_t bound) {
    if(bound>kMaximumBound/kGrowthFactor) {
        throw std::overflow_error("prime bound overflow");
    }
    return std::max(bound*kGrowthFactor,kMinimumBound);
}

std::uint64_t initial_bound(std::size_t count,const PrimeList&known) {
    std::uint64_t bound=sieve_bound_for(count);
    if(!known.empty()) {
        bound=std::max(bound,grow_bound(known.back()));
    }
    return bound;
}

SieveExtent extend_to_count(std::size_t count,const PrimeList&known) {
    SieveExtent extent{known,initial_bound(count,known)};
    for(;;) {
        extent.primes=primes_up_to(static_cast<std::int64_t>(extent.bound),extent.primes);
        if(extent.primes.size()>=count) {
            return extent;
        }
        extent.bound=grow_bound(extent.bound);
    }
}

SieveExtent extend_to_value(std::uint64_t value,std::uint64_t covered,const PrimeList&known) {
    if(value>kMaximumBound) {
        throw std::overflow_error("prime bound overflow");
    }
    std::uint64_t bound=std::max(covered,kMinimumBound);
    while(bound<value) {
        bound=grow_bound(bound);
    }
    return SieveExtent{primes_up_to(static_cast<std::int64_t>(bound),known),bound};
}

PrimeList n_primes(std::int64_t n,const PrimeList&known) {
    if(n<0) {
        throw std::invalid_argument("count must be non-negative");
    }
    std::size_t count=static_cast<std::size_t>(n);
    if(known.size()>=count) {
        return PrimeList(known.begin(),known.begin()+static_cast<std::ptrdiff_t>(count));
    }
    PrimeList primes=extend_to_count(count,known).primes;
    primes.resize(count);
    return primes;
}

std::uint64_t nth_prime(std::int64_t n,const PrimeList&known) {
    if(n<1) {
        throw std::invalid_argument("n must be at least 1");
    }
    std::size_t index=static_cast<std::size_t>(n-1);
    if(index<known.size()) {
        return known[index];
    }
    return extend_to_count(index+1,known).primes[index];
}

PrimeList composites_up_to(std::int64_t x,const PrimeList&known) {
    if(x<0) {
        throw std::invalid_argument("bound must be non-negative");
    }
    if(x<4) {
        return {};
    }
    PrimeList primes=primes_up_to(x,known);
    std::uint64_t limit=static_cast<std::uint64_t>(x);
    PrimeList composites;
    composites.reserve(static_cast<std::size_t>(limit-1)-primes.size());
    auto next=primes.begin();
    for(std::uint64_t value=2;value<=limit;++value) {
        if(next!=primes.end()&&*next==value) {
            ++next;
            continue;
        }
        composites.push_back(value);
    }
    return composites;
}

}
