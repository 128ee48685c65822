#include "primeseq/api.h"

#include "cli.h"
#include "constellation.h"
#include "ordinal.h"
#include "primality.h"
#include "prime_sequence.h"
#include "sieve.h"

#include <algorithm>
#include <exception>
#include <memory>
#include <new>
#include <stdexcept>
#include <string>
#include <vector>

namespace {

primeseq::PrimeList to_prime_list(const std::uint64_t*known,std::size_t known_count) {
    if(!known||known_count==0) {
        return {};
    }
    return primeseq::PrimeList(known,known+known_count);
}

template<typename Fn>
primeseq_status run_guarded(Fn&&fn,std::string*error_message) {
    try {
        fn();
        if(error_message) {
            error_message->clear();
        }
        return PRIMESEQ_STATUS_SUCCESS;
    } catch(const std::invalid_argument&ex) {
        if(error_message) {
            *error_message=ex.what();
        }
        return PRIMESEQ_STATUS_INVALID_ARGUMENT;
    } catch(const std::overflow_error&ex) {
        if(error_message) {
            *error_message=ex.what();
        }
        return PRIMESEQ_STATUS_INVALID_ARGUMENT;
    } catch(const std::bad_alloc&) {
        if(error_message) {
            *error_message="out of memory";
        }
        return PRIMESEQ_STATUS_OUT_OF_MEMORY;
    } catch(const std::exception&ex) {
        if(error_message) {
            *error_message=ex.what();
        }
        return PRIMESEQ_STATUS_INTERNAL_ERROR;
    } catch(...) {
        if(error_message) {
            *error_message="unknown error";
        }
        return PRIMESEQ_STATUS_INTERNAL_ERROR;
    }
}

void export_values(const std::vector<std::uint64_t>&values,std::uint64_t**out_values,std::size_t*out_count) {
    if(values.empty()) {
        return;
    }
    auto buffer=std::make_unique<std::uint64_t[]>(values.size());
    std::copy(values.begin(),values.end(),buffer.get());
    *out_count=values.size();
    *out_values=buffer.release();
}

bool reset_outputs(std::uint64_t**out_values,std::size_t*out_count) {
    if(!out_values||!out_count) {
        return false;
    }
    *out_values=nullptr;
    *out_count=0;
    return true;
}

primeseq::SliceSpec to_slice_spec(const primeseq_slice&slice) {
    primeseq::SliceSpec spec;
    if(slice.has_start) {
        spec.start=slice.start;
    }
    if(slice.has_stop) {
        spec.stop=slice.stop;
    }
    if(slice.has_step) {
        spec.step=slice.step;
    }
    return spec;
}

}

struct primeseq_sequence {
    primeseq::PrimeSequence sequence;
    primeseq_extension_callback callback=nullptr;
    void*callback_user_data=nullptr;
    std::string error_message;
};

extern"C" int primeseq_run_cli(int argc,char**argv) {
    return primeseq::run_cli(argc,argv);
}

extern"C" void primeseq_release_u64_buffer(std::uint64_t*buffer) {
    delete[] buffer;
}

extern"C" primeseq_status primeseq_primes_up_to(std::int64_t bound,const std::uint64_t*known,std::size_t known_count,std::uint64_t**out_values,std::size_t*out_count) {
    if(!reset_outputs(out_values,out_count)) {
        return PRIMESEQ_STATUS_INVALID_ARGUMENT;
    }
    return run_guarded([&] {
        export_values(primeseq::primes_up_to(bound,to_prime_list(known,known_count)),out_values,out_count);
    },nullptr);
}

extern"C" primeseq_status primeseq_count_primes_up_to(std::int64_t bound,std::uint64_t*out_count) {
    if(!out_count) {
        return PRIMESEQ_STATUS_INVALID_ARGUMENT;
    }
    *out_count=0;
    return run_guarded([&] {
        *out_count=primeseq::count_primes_up_to(bound);
    },nullptr);
}

extern"C" primeseq_status primeseq_is_prime(std::int64_t x,const std::uint64_t*known,std::size_t known_count,int*out_is_prime) {
    if(!out_is_prime) {
        return PRIMESEQ_STATUS_INVALID_ARGUMENT;
    }
    *out_is_prime=0;
    return run_guarded([&] {
        *out_is_prime=primeseq::is_prime(x,to_prime_list(known,known_count)) ? 1 : 0;
    },nullptr);
}

extern"C" primeseq_status primeseq_n_primes(std::int64_t n,const std::uint64_t*known,std::size_t known_count,std::uint64_t**out_values,std::size_t*out_count) {
    if(!reset_outputs(out_values,out_count)) {
        return PRIMESEQ_STATUS_INVALID_ARGUMENT;
    }
    return run_guarded([&] {
        export_values(primeseq::n_primes(n,to_prime_list(known,known_count)),out_values,out_count);
    },nullptr);
}

extern"C" primeseq_status primeseq_nth_prime(std::int64_t n,const std::uint64_t*known,std::size_t known_count,std::uint64_t*out_value) {
    if(!out_value) {
        return PRIMESEQ_STATUS_INVALID_ARGUMENT;
    }
    *out_value=0;
    return run_guarded([&] {
        *out_value=primeseq::nth_prime(n,to_prime_list(known,known_count));
    },nullptr);
}

extern"C" primeseq_status primeseq_composites_up_to(std::int64_t x,const std::uint64_t*known,std::size_t known_count,std::uint64_t**out_values,std::size_t*out_count) {
    if(!reset_outputs(out_values,out_count)) {
        return PRIMESEQ_STATUS_INVALID_ARGUMENT;
    }
    return run_guarded([&] {
        export_values(primeseq::composites_up_to(x,to_prime_list(known,known_count)),out_values,out_count);
    },nullptr);
}

extern"C" primeseq_status primeseq_next_prime(const std::uint64_t*known,std::size_t known_count,std::uint64_t*out_value) {
    if(!out_value) {
        return PRIMESEQ_STATUS_INVALID_ARGUMENT;
    }
    *out_value=0;
    return run_guarded([&] {
        *out_value=primeseq::next_prime(to_prime_list(known,known_count));
    },nullptr);
}

extern"C" primeseq_status primeseq_primes_with_difference_up_to(std::int64_t x,std::int64_t difference,const std::uint64_t*known,std::size_t known_count,std::uint64_t**out_values,std::size_t*out_pair_count) {
    if(!reset_outputs(out_values,out_pair_count)) {
        return PRIMESEQ_STATUS_INVALID_ARGUMENT;
    }
    return run_guarded([&] {
        auto pairs=primeseq::primes_with_difference_up_to(x,difference,to_prime_list(known,known_count));
        std::vector<std::uint64_t>flat;
        flat.reserve(pairs.size()*2);
        for(const auto&pair : pairs) {
            flat.push_back(pair[0]);
            flat.push_back(pair[1]);
        }
        std::size_t flat_count=0;
        export_values(flat,out_values,&flat_count);
        *out_pair_count=flat_count/2;
    },nullptr);
}

extern"C" void primeseq_slice_init(primeseq_slice*slice) {
    if(!slice) {
        return;
    }
    slice->start=0;
    slice->stop=0;
    slice->step=1;
    slice->has_start=0;
    slice->has_stop=0;
    slice->has_step=0;
}

extern"C" primeseq_sequence*primeseq_sequence_create(void) {
    return new (std::nothrow) primeseq_sequence();
}

extern"C" void primeseq_sequence_destroy(primeseq_sequence*sequence) {
    delete sequence;
}

extern"C" primeseq_status primeseq_sequence_contains(primeseq_sequence*sequence,std::int64_t value,int*out_contains) {
    if(!sequence||!out_contains) {
        return PRIMESEQ_STATUS_INVALID_ARGUMENT;
    }
    *out_contains=0;
    return run_guarded([&] {
        *out_contains=sequence->sequence.contains(value) ? 1 : 0;
    },&sequence->error_message);
}

extern"C" primeseq_status primeseq_sequence_at(primeseq_sequence*sequence,std::int64_t index,std::uint64_t*out_value) {
    if(!sequence||!out_value) {
        return PRIMESEQ_STATUS_INVALID_ARGUMENT;
    }
    *out_value=0;
    return run_guarded([&] {
        *out_value=sequence->sequence.at(index);
    },&sequence->error_message);
}

extern"C" primeseq_status primeseq_sequence_slice(primeseq_sequence*sequence,const primeseq_slice*slice,std::uint64_t**out_values,std::size_t*out_count) {
    if(!sequence||!slice||!reset_outputs(out_values,out_count)) {
        return PRIMESEQ_STATUS_INVALID_ARGUMENT;
    }
    return run_guarded([&] {
        export_values(sequence->sequence.slice(to_slice_spec(*slice)),out_values,out_count);
    },&sequence->error_message);
}

extern"C" std::size_t primeseq_sequence_size(const primeseq_sequence*sequence) {
    if(!sequence) {
        return 0;
    }
    return sequence->sequence.size();
}

extern"C" std::uint64_t primeseq_sequence_watermark(const primeseq_sequence*sequence) {
    if(!sequence) {
        return 0;
    }
    return sequence->sequence.watermark();
}

extern"C" void primeseq_sequence_set_extension_callback(primeseq_sequence*sequence,primeseq_extension_callback callback,void*user_data) {
    if(!sequence) {
        return;
    }
    sequence->callback=callback;
    sequence->callback_user_data=user_data;
    if(!callback) {
        sequence->sequence.set_extension_listener(nullptr);
        return;
    }
    sequence->sequence.set_extension_listener([sequence](std::uint64_t bound,std::size_t cached) {
        sequence->callback(bound,cached,sequence->callback_user_data);
    });
}

extern"C" const char* primeseq_sequence_error_message(const primeseq_sequence*sequence) {
    if(!sequence||sequence->error_message.empty()) {
        return nullptr;
    }
    return sequence->error_message.c_str();
}
