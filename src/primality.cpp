#include "primality.h"

#include <algorithm>
#include <stdexcept>

namespace primeseq {

namespace {

bool has_divisor_from(std::uint64_t n,std::uint64_t first_odd,std::uint64_t root) {
    for(std::uint64_t d=first_odd;d<=root;d+=2) {
        if(n%d==0) {
            return true;
        }
    }
    return false;
}

}

bool is_prime(std::int64_t x,const PrimeList&known) {
    if(x<2) {
        return false;
    }
    std::uint64_t n=static_cast<std::uint64_t>(x);
    if(!known.empty()&&known.back()>=n) {
        return std::binary_search(known.begin(),known.end(),n);
    }

    std::uint64_t root=integer_sqrt(n);
    if(known.empty()) {
        if(n<4) {
            return true;
        }
        if((n&1ULL)==0) {
            return false;
        }
        return !has_divisor_from(n,3,root);
    }

    for(std::uint64_t p : known) {
        if(p>root) {
            return true;
        }
        if(n%p==0) {
            return false;
        }
    }
    // Known prefix ends below the square root; continue with odd divisors.
    return !has_divisor_from(n,(known.back()+1)|1ULL,root);
}

std::uint64_t next_prime(const PrimeList&known) {
    if(known.empty()) {
        throw std::invalid_argument("known primes must not be empty");
    }
    std::uint64_t candidate=known.back()==2 ? 3 : known.back()+2;
    while(!is_prime(static_cast<std::int64_t>(candidate),known)) {
        candidate+=2;
    }
    return candidate;
}

}
