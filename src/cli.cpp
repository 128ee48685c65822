#include "cli.h"

#include "constellation.h"
#include "ordinal.h"
#include "primality.h"
#include "prime_sequence.h"
#include "sieve.h"
#include "writer.h"

#include <array>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <cstdio>
#include <exception>
#include <iostream>
#include <limits>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

namespace primeseq {

namespace {

enum class Query {
    None,
    UpTo,
    Count,
    Test,
    Nth,
    First,
    Composites,
    NextAfter,
    Twins,
    Cousins,
    Sexy,
    Triplets,
    Quadruplets,
    Slice,
    Bench,
    Fermat,
};

struct Options {
    Query query=Query::None;
    std::int64_t value=0;
    SliceSpec slice;
    std::string output_path;
    OutputFormat output_format=OutputFormat::Text;
    bool show_time=false;
    bool trace=false;
    bool help=false;
};

// Ten consecutive primes just above 10^order, for order 2..9.
const std::array<std::array<std::uint64_t,10>,8>kBenchPrimes={{
    {101,103,107,109,113,127,131,137,139,149},
    {1009,1013,1019,1021,1031,1033,1039,1049,1051,1061},
    {10007,10009,10037,10039,10061,10067,10069,10079,10091,10093},
    {100003,100019,100043,100049,100057,100069,100103,100109,100129,100151},
    {1000003,1000033,1000037,1000039,1000081,1000099,1000117,1000121,1000133,1000151},
    {10000019,10000079,10000103,10000121,10000139,10000141,10000169,10000189,10000223,10000229},
    {100000007,100000037,100000039,100000049,100000073,100000081,100000123,100000127,100000193,100000213},
    {1000000007,1000000009,1000000021,1000000033,1000000087,1000000093,1000000097,1000000103,1000000123,1000000181},
}};

constexpr std::int64_t kMinBenchOrder=2;
constexpr std::int64_t kMaxBenchOrder=9;
// F6 = 2^64 + 1 no longer fits.
constexpr std::int64_t kMaxFermat=6;

std::uint64_t parse_u64(const std::string&value) {
    if(value.empty()||value[0]=='-'||value[0]=='+') {
        throw std::invalid_argument("invalid integer: "+value);
    }

    auto exp_pos=value.find_first_of("eE");
    if(exp_pos!=std::string::npos&&value.rfind("0x",0)!=0&&value.rfind("0X",0)!=0) {
        std::string mantissa_str=value.substr(0,exp_pos);
        std::string exponent_str=value.substr(exp_pos+1);
        if(mantissa_str.empty()||exponent_str.empty()) {
            throw std::invalid_argument("invalid integer: "+value);
        }

        std::size_t mantissa_idx=0;
        std::uint64_t mantissa=0;
        try {
            mantissa=std::stoull(mantissa_str,&mantissa_idx,10);
        } catch(const std::exception&) {
            throw std::invalid_argument("invalid integer: "+value);
        }
        if(mantissa_idx!=mantissa_str.size()) {
            throw std::invalid_argument("invalid integer: "+value);
        }

        std::size_t exponent_idx=0;
        long long exponent=0;
        try {
            exponent=std::stoll(exponent_str,&exponent_idx,10);
        } catch(const std::exception&) {
            throw std::invalid_argument("invalid integer: "+value);
        }
        if(exponent_idx!=exponent_str.size()||exponent<0) {
            throw std::invalid_argument("invalid integer: "+value);
        }

        std::uint64_t result=mantissa;
        for(long long i=0;i<exponent;++i) {
            if(result>std::numeric_limits<std::uint64_t>::max()/10ULL) {
                throw std::invalid_argument("integer too large: "+value);
            }
            result*=10ULL;
        }
        return result;
    }

    std::size_t idx=0;
    std::uint64_t result=0;
    try {
        result=std::stoull(value,&idx,0);
    } catch(const std::exception&) {
        throw std::invalid_argument("invalid integer: "+value);
    }
    if(idx!=value.size()) {
        throw std::invalid_argument("invalid integer: "+value);
    }
    return result;
}

std::int64_t parse_i64(const std::string&value) {
    bool negative=!value.empty()&&value[0]=='-';
    std::uint64_t magnitude=parse_u64(negative ? value.substr(1) : value);
    std::uint64_t limit=static_cast<std::uint64_t>(std::numeric_limits<std::int64_t>::max());
    if(negative&&magnitude==limit+1) {
        return std::numeric_limits<std::int64_t>::min();
    }
    if(magnitude>limit) {
        throw std::invalid_argument("integer too large: "+value);
    }
    std::int64_t result=static_cast<std::int64_t>(magnitude);
    return negative ? -result : result;
}

std::optional<std::int64_t>parse_slice_part(const std::string&part) {
    if(part.empty()) {
        return std::nullopt;
    }
    return parse_i64(part);
}

SliceSpec parse_slice(const std::string&text) {
    std::vector<std::string>parts;
    std::size_t begin=0;
    for(;;) {
        std::size_t colon=text.find(':',begin);
        parts.push_back(text.substr(begin,colon==std::string::npos ? std::string::npos : colon-begin));
        if(colon==std::string::npos) {
            break;
        }
        begin=colon+1;
    }
    if(parts.size()<2||parts.size()>3) {
        throw std::invalid_argument("slice must be START:STOP[:STEP]: "+text);
    }
    SliceSpec spec;
    spec.start=parse_slice_part(parts[0]);
    spec.stop=parse_slice_part(parts[1]);
    if(parts.size()==3) {
        spec.step=parse_slice_part(parts[2]);
    }
    return spec;
}

OutputFormat parse_output_format(const std::string&fmt) {
    if(fmt=="text") {
        return OutputFormat::Text;
    } else if(fmt=="binary") {
        return OutputFormat::Binary;
    } else if(fmt=="delta") {
        return OutputFormat::Delta;
    }
    throw std::invalid_argument("unsupported out-format: "+fmt);
}

void set_query(Options&opts,Query query,const std::string&arg,int&i,int argc,char**argv) {
    if(opts.query!=Query::None) {
        throw std::invalid_argument("only one query may be given: "+arg);
    }
    if(i+1>=argc) {
        throw std::invalid_argument(arg+" requires a value");
    }
    opts.query=query;
    std::string value=argv[++i];
    if(query==Query::Slice) {
        opts.slice=parse_slice(value);
    } else {
        opts.value=parse_i64(value);
    }
}

Options parse_options(int argc,char**argv) {
    Options opts;
    for(int i=1;i<argc;++i) {
        std::string arg=argv[i];
        static const std::string out_format_prefix="--out-format=";

        if(arg=="--help"||arg=="-h") {
            opts.help=true;
            return opts;
        } else if(arg.rfind(out_format_prefix,0)==0) {
            opts.output_format=parse_output_format(arg.substr(out_format_prefix.size()));
        } else if(arg=="--up-to") {
            set_query(opts,Query::UpTo,arg,i,argc,argv);
        } else if(arg=="--count") {
            set_query(opts,Query::Count,arg,i,argc,argv);
        } else if(arg=="--test") {
            set_query(opts,Query::Test,arg,i,argc,argv);
        } else if(arg=="--nth") {
            set_query(opts,Query::Nth,arg,i,argc,argv);
        } else if(arg=="--first") {
            set_query(opts,Query::First,arg,i,argc,argv);
        } else if(arg=="--composites") {
            set_query(opts,Query::Composites,arg,i,argc,argv);
        } else if(arg=="--next-after") {
            set_query(opts,Query::NextAfter,arg,i,argc,argv);
        } else if(arg=="--twins") {
            set_query(opts,Query::Twins,arg,i,argc,argv);
        } else if(arg=="--cousins") {
            set_query(opts,Query::Cousins,arg,i,argc,argv);
        } else if(arg=="--sexy") {
            set_query(opts,Query::Sexy,arg,i,argc,argv);
        } else if(arg=="--triplets") {
            set_query(opts,Query::Triplets,arg,i,argc,argv);
        } else if(arg=="--quadruplets") {
            set_query(opts,Query::Quadruplets,arg,i,argc,argv);
        } else if(arg=="--slice") {
            set_query(opts,Query::Slice,arg,i,argc,argv);
        } else if(arg=="--bench") {
            set_query(opts,Query::Bench,arg,i,argc,argv);
        } else if(arg=="--fermat") {
            set_query(opts,Query::Fermat,arg,i,argc,argv);
        } else if(arg=="--out") {
            if(i+1>=argc) {
                throw std::invalid_argument("--out requires a path");
            }
            opts.output_path=argv[++i];
        } else if(arg=="--out-format") {
            if(i+1>=argc) {
                throw std::invalid_argument("--out-format requires a value");
            }
            opts.output_format=parse_output_format(argv[++i]);
        } else if(arg=="--time") {
            opts.show_time=true;
        } else if(arg=="--trace") {
            opts.trace=true;
        } else {
            throw std::invalid_argument("unknown option: "+arg);
        }
    }
    return opts;
}

void print_usage() {
    std::cout<<"primeseq QUERY [options]\n"
              <<"Queries (exactly one):\n"
              <<"  --up-to N           Print primes <= N\n"
              <<"  --count N           Print the number of primes <= N\n"
              <<"  --test X            Print whether X is prime\n"
              <<"  --nth K             Print the K-th prime\n"
              <<"  --first K           Print the first K primes\n"
              <<"  --composites N      Print composites <= N\n"
              <<"  --next-after N      Print the smallest prime > N\n"
              <<"  --twins N           Print twin primes up to N\n"
              <<"  --cousins N         Print cousin primes up to N\n"
              <<"  --sexy N            Print sexy primes up to N\n"
              <<"  --triplets N        Print prime triplets up to N\n"
              <<"  --quadruplets N     Print prime quadruplets up to N\n"
              <<"  --slice A:B[:S]     Print a slice of the prime sequence\n"
              <<"  --bench ORDER       Time primality tests up to 10^ORDER (2-9)\n"
              <<"  --fermat K          Test the Fermat numbers F0..F(K-1) (K <= 6)\n"
              <<"Options:\n"
              <<"  --out PATH          Write results to file\n"
              <<"  --out-format FMT    Output format: text (default), binary, delta\n"
              <<"  --time              Print elapsed time\n"
              <<"  --trace             Report prime cache extensions on stderr\n";
}

bool is_report_query(Query query) {
    return query==Query::Test||query==Query::Bench||query==Query::Fermat;
}

bool is_tuple_query(Query query) {
    return query==Query::Twins||query==Query::Cousins||query==Query::Sexy||
           query==Query::Triplets||query==Query::Quadruplets;
}

// Runs before the output file is opened so a rejected run leaves it untouched.
void check_output_format(const Options&opts) {
    if(opts.output_format!=OutputFormat::Text&&is_report_query(opts.query)) {
        throw std::invalid_argument("binary and delta output are only available for numeric queries");
    }
    if(opts.output_format==OutputFormat::Delta&&is_tuple_query(opts.query)) {
        throw std::invalid_argument("delta output is only available for single-value queries");
    }
}

template<std::size_t N>
void write_tuples(SequenceWriter&writer,const std::vector<std::array<std::uint64_t,N>>&tuples) {
    for(const auto&tuple : tuples) {
        writer.write_tuple(tuple.data(),tuple.size());
    }
}

void run_bench(std::int64_t max_order,SequenceWriter&writer) {
    if(max_order<kMinBenchOrder||max_order>kMaxBenchOrder) {
        throw std::invalid_argument("bench order must be between 2 and 9");
    }
    for(std::int64_t order=kMinBenchOrder;order<=max_order;++order) {
        const auto&primes=kBenchPrimes[static_cast<std::size_t>(order-kMinBenchOrder)];
        std::chrono::steady_clock::duration total{};
        for(std::uint64_t p : primes) {
            auto start=std::chrono::steady_clock::now();
            bool prime=is_prime(static_cast<std::int64_t>(p));
            total+=std::chrono::steady_clock::now()-start;
            if(!prime) {
                throw std::runtime_error("bench value reported composite: "+std::to_string(p));
            }
        }
        auto average=std::chrono::duration_cast<std::chrono::nanoseconds>(total).count()/
                     static_cast<long long>(primes.size());
        writer.write_line("Order "+std::to_string(order)+", average time: "+std::to_string(average)+
                          " ns, iterations: "+std::to_string(primes.size()));
    }
}

void run_fermat(std::int64_t count,SequenceWriter&writer) {
    if(count<0||count>kMaxFermat) {
        throw std::invalid_argument("fermat count must be between 0 and 6");
    }
    for(std::int64_t k=0;k<count;++k) {
        std::uint64_t exponent=1ULL<<k;
        std::uint64_t value=(1ULL<<exponent)+1;
        writer.write_line("2^(2^"+std::to_string(k)+") + 1 = 2^"+std::to_string(exponent)+" + 1 is "+
                          (is_prime(static_cast<std::int64_t>(value)) ? "prime" : "composite"));
    }
}

void run_query(const Options&opts,SequenceWriter&writer) {
    switch(opts.query) {
    case Query::UpTo:
        writer.write_values(primes_up_to(opts.value));
        break;
    case Query::Count:
        writer.write_value(count_primes_up_to(opts.value));
        break;
    case Query::Test:
        writer.write_line(is_prime(opts.value) ? "prime" : "composite");
        break;
    case Query::Nth:
    case Query::Slice: {
        PrimeSequence sequence;
        if(opts.trace) {
            sequence.set_extension_listener([](std::uint64_t bound,std::size_t cached) {
                std::fprintf(stderr,"[primeseq] extended to bound %llu (%zu primes cached)\n",
                             static_cast<unsigned long long>(bound),cached);
            });
        }
        if(opts.query==Query::Nth) {
            if(opts.value<1) {
                throw std::invalid_argument("n must be at least 1");
            }
            writer.write_value(sequence[opts.value-1]);
        } else {
            writer.write_values(sequence.slice(opts.slice));
        }
        break;
    }
    case Query::First:
        writer.write_values(n_primes(opts.value));
        break;
    case Query::Composites:
        writer.write_values(composites_up_to(opts.value));
        break;
    case Query::NextAfter:
        writer.write_value(opts.value<2 ? 2 : next_prime(primes_up_to(opts.value)));
        break;
    case Query::Twins:
        write_tuples(writer,twin_primes_up_to(opts.value));
        break;
    case Query::Cousins:
        write_tuples(writer,cousin_primes_up_to(opts.value));
        break;
    case Query::Sexy:
        write_tuples(writer,sexy_primes_up_to(opts.value));
        break;
    case Query::Triplets:
        write_tuples(writer,prime_triplets_up_to(opts.value));
        break;
    case Query::Quadruplets:
        write_tuples(writer,prime_quadruplets_up_to(opts.value));
        break;
    case Query::Bench:
        run_bench(opts.value,writer);
        break;
    case Query::Fermat:
        run_fermat(opts.value,writer);
        break;
    case Query::None:
        break;
    }
}

}

int run_cli(int argc,char**argv) {
    try {
        Options opts=parse_options(argc,argv);
        if(opts.help) {
            print_usage();
            return 0;
        }
        if(opts.query==Query::None) {
            print_usage();
            return 1;
        }

        check_output_format(opts);

        auto start_time=std::chrono::steady_clock::now();
        SequenceWriter writer(true,opts.output_path,opts.output_format);
        run_query(opts,writer);
        writer.finish();
        auto end_time=std::chrono::steady_clock::now();

        if(opts.show_time) {
            auto elapsed=std::chrono::duration_cast<std::chrono::microseconds>(end_time-start_time).count();
            std::cerr<<"Elapsed: "<<elapsed<<" us\n";
        }
        return 0;
    } catch(const std::exception&ex) {
        std::cerr<<"Error: "<<ex.what()<<"\n";
        return 1;
    }
}

}
