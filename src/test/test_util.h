#pragma once

#include <cstddef>
#include <cstdint>
#include <cstring>
#include <fstream>
#include <iostream>
#include <iterator>
#include <sstream>
#include <string>
#include <vector>

namespace primeseq_test {

inline std::string to_string(const std::vector<std::uint64_t>&values) {
    std::stringstream ss;
    ss<<"[";
    for(std::size_t i=0;i<values.size();++i) {
        if(i>0) {
            ss<<", ";
        }
        ss<<values[i];
    }
    ss<<"]";
    return ss.str();
}

template<typename Exception,typename Fn>
bool throws(Fn&&fn) {
    try {
        fn();
    } catch(const Exception&ex) {
        std::cout<<"Caught: "<<ex.what()<<"\n";
        return true;
    }
    return false;
}

inline std::string read_file(const char*path) {
    std::ifstream in(path,std::ios::binary);
    return std::string(std::istreambuf_iterator<char>(in),std::istreambuf_iterator<char>());
}

// Decodes a stream of 64-bit little-endian values.
inline std::vector<std::uint64_t>decode_u64(const std::string&data) {
    std::vector<std::uint64_t>values(data.size()/sizeof(std::uint64_t));
    for(std::size_t i=0;i<values.size();++i) {
        unsigned char bytes[8];
        std::memcpy(bytes,data.data()+i*8,8);
        std::uint64_t value=0;
        for(int b=7;b>=0;--b) {
            value=(value<<8)|bytes[b];
        }
        values[i]=value;
    }
    return values;
}

inline bool is_prime_slow(std::uint64_t n) {
    if(n<2) {
        return false;
    }
    for(std::uint64_t d=2;d*d<=n;++d) {
        if(n%d==0) {
            return false;
        }
    }
    return true;
}

}
