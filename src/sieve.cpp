#include "sieve.h"

#include <algorithm>
#include <bit>
#include <cmath>
#include <cstddef>
#include <stdexcept>

namespace primeseq {

namespace {

// One bit per odd value in [low, high]; a set bit marks a composite.
struct OddMarkers {
    std::uint64_t low;
    std::uint64_t high;
    std::size_t bit_count;
    std::vector<std::uint64_t>bits;

    OddMarkers(std::uint64_t first,std::uint64_t last)
        : low(first),
          high(last),
          bit_count(static_cast<std::size_t>((last-first)/2+1)),
          bits((bit_count+63)/64,0) {}

    bool is_composite(std::uint64_t value) const {
        std::size_t index=static_cast<std::size_t>((value-low)>>1);
        return ((bits[index>>6]>>(index&63))&1ULL)!=0;
    }

    void strike_multiples(std::uint64_t p) {
        std::uint64_t start=p*p;
        if(start<low) {
            start=((low+p-1)/p)*p;
            if((start&1ULL)==0) {
                start+=p;
            }
        }
        if(start>high) {
            return;
        }
        // Consecutive odd multiples are 2p apart, which is p marker slots.
        for(std::size_t i=static_cast<std::size_t>((start-low)>>1);i<bit_count;i+=p) {
            bits[i>>6]|=1ULL<<(i&63);
        }
    }

    std::uint64_t count_survivors() const {
        std::uint64_t marked=0;
        for(std::uint64_t word : bits) {
            marked+=static_cast<std::uint64_t>(std::popcount(word));
        }
        // Padding bits past bit_count are never struck.
        return bit_count-marked;
    }
};

std::uint64_t checked_bound(std::int64_t bound) {
    if(bound<0) {
        throw std::invalid_argument("bound must be non-negative");
    }
    return static_cast<std::uint64_t>(bound);
}

OddMarkers sieve_odd_range(std::uint64_t low,std::uint64_t limit,const PrimeList&seed) {
    OddMarkers markers(low,limit);
    std::uint64_t root=integer_sqrt(limit);
    for(std::size_t i=1;i<seed.size()&&seed[i]<=root;++i) {
        markers.strike_multiples(seed[i]);
    }
    for(std::uint64_t value=low;value<=root;value+=2) {
        if(!markers.is_composite(value)) {
            markers.strike_multiples(value);
        }
    }
    return markers;
}

void append_survivors(const OddMarkers&markers,PrimeList&out) {
    std::uint64_t survivors=markers.count_survivors();
    out.reserve(out.size()+static_cast<std::size_t>(survivors));
    std::uint64_t value=markers.low;
    std::size_t produced=0;
    for(std::size_t word=0;word<markers.bits.size()&&produced<markers.bit_count;++word) {
        std::uint64_t composite=markers.bits[word];
        for(std::size_t bit=0;bit<64&&produced<markers.bit_count;++bit,++produced,value+=2) {
            if(composite&(1ULL<<bit)) {
                continue;
            }
            out.push_back(value);
        }
    }
}

}

std::uint64_t integer_sqrt(std::uint64_t x) noexcept {
    std::uint64_t root=static_cast<std::uint64_t>(std::sqrt(static_cast<long double>(x)));
    while(root>0&&root>x/root) {
        --root;
    }
    while(root+1<=x/(root+1)) {
        ++root;
    }
    return root;
}

PrimeList primes_up_to(std::int64_t bound,const PrimeList&known) {
    std::uint64_t limit=checked_bound(bound);
    if(limit<2) {
        return {};
    }
    if(!known.empty()&&known.back()>=limit) {
        return PrimeList(known.begin(),std::upper_bound(known.begin(),known.end(),limit));
    }

    // [2] says nothing the odd-only markers do not already encode.
    PrimeList primes;
    std::uint64_t low=3;
    if(known.size()>1) {
        primes=known;
        low=known.back()+2;
    } else {
        primes.push_back(2);
    }
    if(low>limit) {
        return primes;
    }

    OddMarkers markers=sieve_odd_range(low,limit,primes);
    append_survivors(markers,primes);
    return primes;
}

std::uint64_t count_primes_up_to(std::int64_t bound) {
    std::uint64_t limit=checked_bound(bound);
    if(limit<3) {
        return limit==2 ? 1 : 0;
    }
    OddMarkers markers=sieve_odd_range(3,limit,PrimeList{});
    return 1+markers.count_survivors();
}

}
