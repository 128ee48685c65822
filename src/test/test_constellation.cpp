#include <cassert>
#include <cstddef>
#include <cstdint>
#include <iostream>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

#include "constellation.h"
#include "sieve.h"
#include "test_util.h"

using namespace primeseq;

template<typename Tuple>
std::string tuples_to_string(const std::vector<Tuple>&tuples)
{
    std::stringstream ss;
    ss<<"[";
    for(std::size_t i=0;i<tuples.size();++i) {
        if(i>0) {
            ss<<", ";
        }
        ss<<"(";
        for(std::size_t j=0;j<tuples[i].size();++j) {
            if(j>0) {
                ss<<",";
            }
            ss<<tuples[i][j];
        }
        ss<<")";
    }
    ss<<"]";
    return ss.str();
}

void testPrimePairs()
{
    std::cout<<"----- testPrimePairs() --------------------\n";

    std::string actual=tuples_to_string(twin_primes_up_to(50));
    std::string expect="[(3,5), (5,7), (11,13), (17,19), (29,31), (41,43)]";
    std::cout<<"ACTUAL: "<<actual<<"\n";
    std::cout<<"EXPECT: "<<expect<<"\n";
    assert(actual==expect);

    actual=tuples_to_string(cousin_primes_up_to(50));
    expect="[(3,7), (7,11), (13,17), (19,23), (37,41), (43,47)]";
    std::cout<<"ACTUAL: "<<actual<<"\n";
    std::cout<<"EXPECT: "<<expect<<"\n";
    assert(actual==expect);

    actual=tuples_to_string(sexy_primes_up_to(50));
    expect="[(5,11), (7,13), (11,17), (13,19), (17,23), (23,29), (31,37), (37,43), (41,47)]";
    std::cout<<"ACTUAL: "<<actual<<"\n";
    std::cout<<"EXPECT: "<<expect<<"\n";
    assert(actual==expect);

    // The upper member must also be within the bound.
    assert(tuples_to_string(twin_primes_up_to(42))=="[(3,5), (5,7), (11,13), (17,19), (29,31)]");
    assert(twin_primes_up_to(1000).size()==35);
    assert(twin_primes_up_to(1000,primes_up_to(100))==twin_primes_up_to(1000));
    assert(tuples_to_string(primes_with_difference_up_to(10,1))=="[(2,3)]");
    assert(twin_primes_up_to(4).empty());

    assert(primeseq_test::throws<std::invalid_argument>([] { primes_with_difference_up_to(100,0);}));
    assert(primeseq_test::throws<std::invalid_argument>([] { twin_primes_up_to(-1);}));
}

void testPrimeTriplets()
{
    std::cout<<"----- testPrimeTriplets() -----------------\n";

    std::string actual=tuples_to_string(prime_triplets_up_to(50));
    std::string expect="[(5,7,11), (7,11,13), (11,13,17), (13,17,19), (17,19,23), (37,41,43), (41,43,47)]";
    std::cout<<"ACTUAL: "<<actual<<"\n";
    std::cout<<"EXPECT: "<<expect<<"\n";
    assert(actual==expect);
    assert(prime_triplets_up_to(10).empty());
}

void testPrimeQuadruplets()
{
    std::cout<<"----- testPrimeQuadruplets() --------------\n";

    std::string actual=tuples_to_string(prime_quadruplets_up_to(200));
    std::string expect="[(5,7,11,13), (11,13,17,19), (101,103,107,109), (191,193,197,199)]";
    std::cout<<"ACTUAL: "<<actual<<"\n";
    std::cout<<"EXPECT: "<<expect<<"\n";
    assert(actual==expect);
    assert(prime_quadruplets_up_to(198).size()==3);
}

int main(int argc,char*argv[])
{
    testPrimePairs();
    testPrimeTriplets();
    testPrimeQuadruplets();

    return 0;
}
