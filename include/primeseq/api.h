#pragma once

#include <cstddef>
#include <cstdint>

#if defined(_WIN32) && defined(PRIMESEQ_DLL_EXPORT)
#  define PRIMESEQ_API __declspec(dllexport)
#else
#  define PRIMESEQ_API
#endif

#ifdef __cplusplus
extern"C" {
#endif

typedef enum primeseq_status {
    PRIMESEQ_STATUS_SUCCESS=0,
    PRIMESEQ_STATUS_INVALID_ARGUMENT=1,
    PRIMESEQ_STATUS_OUT_OF_MEMORY=2,
    PRIMESEQ_STATUS_INTERNAL_ERROR=3
} primeseq_status;

/* Unset components take their defaults: start 0, step 1, stop open. */
typedef struct primeseq_slice {
    std::int64_t start;
    std::int64_t stop;
    std::int64_t step;
    int has_start;
    int has_stop;
    int has_step;
} primeseq_slice;

struct primeseq_sequence;
typedef struct primeseq_sequence primeseq_sequence;

typedef void (*primeseq_extension_callback)(std::uint64_t bound,std::size_t cached,void*user_data);

/*
 * Functions returning a list allocate *out_values, which the caller frees
 * with primeseq_release_u64_buffer. An empty result leaves it null.
 * `known` may be null when known_count is 0.
 */

PRIMESEQ_API int primeseq_run_cli(int argc,char**argv);

PRIMESEQ_API void primeseq_release_u64_buffer(std::uint64_t*buffer);

PRIMESEQ_API primeseq_status primeseq_primes_up_to(std::int64_t bound,const std::uint64_t*known,std::size_t known_count,std::uint64_t**out_values,std::size_t*out_count);

PRIMESEQ_API primeseq_status primeseq_count_primes_up_to(std::int64_t bound,std::uint64_t*out_count);

PRIMESEQ_API primeseq_status primeseq_is_prime(std::int64_t x,const std::uint64_t*known,std::size_t known_count,int*out_is_prime);

PRIMESEQ_API primeseq_status primeseq_n_primes(std::int64_t n,const std::uint64_t*known,std::size_t known_count,std::uint64_t**out_values,std::size_t*out_count);

PRIMESEQ_API primeseq_status primeseq_nth_prime(std::int64_t n,const std::uint64_t*known,std::size_t known_count,std::uint64_t*out_value);

PRIMESEQ_API primeseq_status primeseq_composites_up_to(std::int64_t x,const std::uint64_t*known,std::size_t known_count,std::uint64_t**out_values,std::size_t*out_count);

PRIMESEQ_API primeseq_status primeseq_next_prime(const std::uint64_t*known,std::size_t known_count,std::uint64_t*out_value);

/* Pairs are flattened: out_values holds 2 * out_pair_count entries. */
PRIMESEQ_API primeseq_status primeseq_primes_with_difference_up_to(std::int64_t x,std::int64_t difference,const std::uint64_t*known,std::size_t known_count,std::uint64_t**out_values,std::size_t*out_pair_count);

PRIMESEQ_API void primeseq_slice_init(primeseq_slice*slice);

PRIMESEQ_API primeseq_sequence*primeseq_sequence_create(void);
PRIMESEQ_API void primeseq_sequence_destroy(primeseq_sequence*sequence);

PRIMESEQ_API primeseq_status primeseq_sequence_contains(primeseq_sequence*sequence,std::int64_t value,int*out_contains);

PRIMESEQ_API primeseq_status primeseq_sequence_at(primeseq_sequence*sequence,std::int64_t index,std::uint64_t*out_value);

PRIMESEQ_API primeseq_status primeseq_sequence_slice(primeseq_sequence*sequence,const primeseq_slice*slice,std::uint64_t**out_values,std::size_t*out_count);

PRIMESEQ_API std::size_t primeseq_sequence_size(const primeseq_sequence*sequence);

PRIMESEQ_API std::uint64_t primeseq_sequence_watermark(const primeseq_sequence*sequence);

PRIMESEQ_API void primeseq_sequence_set_extension_callback(primeseq_sequence*sequence,primeseq_extension_callback callback,void*user_data);

PRIMESEQ_API const char* primeseq_sequence_error_message(const primeseq_sequence*sequence);

#ifdef __cplusplus
}
#endif

#undef PRIMESEQ_API
