#include <algorithm>
#include <cassert>
#include <cstdint>
#include <iostream>
#include <stdexcept>
#include <string>

#include "ordinal.h"
#include "sieve.h"
#include "test_util.h"

using namespace primeseq;
using primeseq_test::to_string;

void testNPrimes()
{
    std::cout<<"----- testNPrimes() -----------------------\n";

    assert(n_primes(0).empty());
    assert(to_string(n_primes(1))=="[2]");

    std::string actual=to_string(n_primes(5));
    std::string expect="[2, 3, 5, 7, 11]";
    std::cout<<"ACTUAL: "<<actual<<"\n";
    std::cout<<"EXPECT: "<<expect<<"\n";
    assert(actual==expect);

    PrimeList reference=primes_up_to(8000);
    for(std::int64_t n=0;n<1000;++n) {
        PrimeList primes=n_primes(n);
        assert(primes.size()==static_cast<std::size_t>(n));
        assert(std::equal(primes.begin(),primes.end(),reference.begin()));
    }
}

void testNPrimesWithHint()
{
    std::cout<<"----- testNPrimesWithHint() ---------------\n";

    PrimeList known=primes_up_to(100);
    // Enough known primes: answered from the hint.
    assert(to_string(n_primes(4,known))=="[2, 3, 5, 7]");
    assert(n_primes(25,known)==known);
    // More than known: the hint seeds the sieve.
    assert(n_primes(26,known)==n_primes(26));
    assert(n_primes(500,known)==n_primes(500));
    assert(n_primes(3,{2})==n_primes(3));
}

void testNthPrime()
{
    std::cout<<"----- testNthPrime() ----------------------\n";

    PrimeList reference=primes_up_to(1000);
    for(std::size_t i=1;i<reference.size();++i) {
        assert(nth_prime(static_cast<std::int64_t>(i))==reference[i-1]);
    }

    std::uint64_t actual=nth_prime(1000);
    std::cout<<"ACTUAL: "<<actual<<"\n";
    std::cout<<"EXPECT: 7919\n";
    assert(actual==7919);
    assert(nth_prime(1000)==n_primes(1000).back());
    assert(nth_prime(10000)==104729);
    assert(nth_prime(3,{2,3,5,7})==5);
    assert(nth_prime(6,{2,3,5,7})==13);

    assert(primeseq_test::throws<std::invalid_argument>([] { nth_prime(0);}));
    assert(primeseq_test::throws<std::invalid_argument>([] { nth_prime(-3);}));
    assert(primeseq_test::throws<std::invalid_argument>([] { n_primes(-1);}));
}

void testCompositesUpTo()
{
    std::cout<<"----- testCompositesUpTo() ----------------\n";

    for(std::int64_t x=0;x<4;++x) {
        assert(composites_up_to(x).empty());
    }
    assert(to_string(composites_up_to(4))=="[4]");
    assert(to_string(composites_up_to(5))=="[4]");
    assert(to_string(composites_up_to(6))=="[4, 6]");

    std::string actual=to_string(composites_up_to(20));
    std::string expect="[4, 6, 8, 9, 10, 12, 14, 15, 16, 18, 20]";
    std::cout<<"ACTUAL: "<<actual<<"\n";
    std::cout<<"EXPECT: "<<expect<<"\n";
    assert(actual==expect);
    assert(composites_up_to(100).size()==74);
    assert(composites_up_to(100,primes_up_to(60))==composites_up_to(100));

    assert(primeseq_test::throws<std::invalid_argument>([] { composites_up_to(-1);}));
}

void testPartition()
{
    std::cout<<"----- testPartition() ---------------------\n";

    for(std::int64_t bound=0;bound<=300;++bound) {
        PrimeList merged=primes_up_to(bound);
        PrimeList composites=composites_up_to(bound);
        merged.insert(merged.end(),composites.begin(),composites.end());
        std::sort(merged.begin(),merged.end());
        std::size_t expect_size=bound<2 ? 0 : static_cast<std::size_t>(bound-1);
        assert(merged.size()==expect_size);
        for(std::size_t i=0;i<merged.size();++i) {
            assert(merged[i]==i+2);
        }
    }
}

void testGrowthPolicy()
{
    std::cout<<"----- testGrowthPolicy() ------------------\n";

    assert(grow_bound(0)==16);
    assert(grow_bound(16)==32);
    assert(grow_bound(1000)==2000);
    assert(primeseq_test::throws<std::overflow_error>([] { grow_bound(~0ULL/2);}));

    assert(initial_bound(1,{})==16);
    assert(initial_bound(3,{2,3,5,7,11})==22);
    // n (ln n + ln ln n) bounds the nth prime from above.
    assert(initial_bound(1000,{})>=7919);

    SieveExtent extent=extend_to_count(100,{});
    std::cout<<"Bound for 100 primes: "<<extent.bound<<"\n";
    assert(extent.primes.size()>=100);
    assert(extent.primes==primes_up_to(static_cast<std::int64_t>(extent.bound)));

    extent=extend_to_value(100,17,primes_up_to(16));
    assert(extent.bound==136);
    assert(extent.primes==primes_up_to(136));
}

int main(int argc,char*argv[])
{
    testNPrimes();
    testNPrimesWithHint();
    testNthPrime();
    testCompositesUpTo();
    testPartition();
    testGrowthPolicy();

    return 0;
}
