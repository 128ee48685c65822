#include "prime_sequence.h"

#include "ordinal.h"

#include <algorithm>
#include <stdexcept>
#include <utility>

namespace primeseq {

namespace {

ResolvedSlice invalid_slice(const char*message) {
    ResolvedSlice slice;
    slice.kind=SliceKind::Invalid;
    slice.error=message;
    return slice;
}

std::uint64_t step_magnitude(std::int64_t step) {
    if(step<0) {
        return static_cast<std::uint64_t>(-(step+1))+1;
    }
    return static_cast<std::uint64_t>(step);
}

}

ResolvedSlice resolve_slice(const SliceSpec&spec) {
    std::int64_t step=spec.step.value_or(1);
    if(step==0) {
        return invalid_slice("slice step cannot be zero");
    }
    std::int64_t start=spec.start.value_or(0);
    if(start<0) {
        return invalid_slice("slice start must be non-negative");
    }

    ResolvedSlice slice;
    slice.step=step;
    slice.first=static_cast<std::size_t>(start);

    if(step>0) {
        if(!spec.stop.has_value()) {
            return invalid_slice("slice stop is required for a positive step");
        }
        std::int64_t stop=spec.stop.value();
        if(stop<0) {
            return invalid_slice("slice stop must be non-negative");
        }
        if(start>=stop) {
            slice.kind=SliceKind::Empty;
            return slice;
        }
        std::uint64_t span=static_cast<std::uint64_t>(stop-start);
        slice.count=static_cast<std::size_t>((span-1)/step_magnitude(step)+1);
        slice.highest_index=slice.first+(slice.count-1)*static_cast<std::size_t>(step);
        slice.kind=SliceKind::Forward;
        return slice;
    }

    // Without a stop a backward slice ends at index 0 inclusive.
    std::int64_t stop=-1;
    if(spec.stop.has_value()) {
        stop=spec.stop.value();
        if(stop<0) {
            return invalid_slice("slice stop must be non-negative");
        }
    }
    if(start<=stop) {
        slice.kind=SliceKind::Empty;
        return slice;
    }
    std::uint64_t span=static_cast<std::uint64_t>(start)-static_cast<std::uint64_t>(stop);
    slice.count=static_cast<std::size_t>((span-1)/step_magnitude(step)+1);
    slice.highest_index=slice.first;
    slice.kind=SliceKind::Backward;
    return slice;
}

PrimeSequence::PrimeSequence()
    : watermark_(2) {}

bool PrimeSequence::contains(std::int64_t value) {
    if(value<2) {
        return false;
    }
    std::uint64_t n=static_cast<std::uint64_t>(value);
    if(n>=watermark_) {
        extend_past(n);
    }
    return std::binary_search(cache_.begin(),cache_.end(),n);
}

std::uint64_t PrimeSequence::at(std::int64_t index) {
    if(index<0) {
        throw std::invalid_argument("index must be non-negative");
    }
    std::size_t position=static_cast<std::size_t>(index);
    extend_to_count(position+1);
    return cache_[position];
}

PrimeList PrimeSequence::slice(const SliceSpec&spec) {
    ResolvedSlice resolved=resolve_slice(spec);
    switch(resolved.kind) {
    case SliceKind::Invalid:
        throw std::invalid_argument(resolved.error);
    case SliceKind::Empty:
        return {};
    case SliceKind::Forward:
    case SliceKind::Backward:
        break;
    }

    extend_to_count(resolved.highest_index+1);
    PrimeList out;
    out.reserve(resolved.count);
    std::int64_t index=static_cast<std::int64_t>(resolved.first);
    for(std::size_t i=0;i<resolved.count;++i) {
        if(i>0) {
            index+=resolved.step;
        }
        out.push_back(cache_[static_cast<std::size_t>(index)]);
    }
    return out;
}

void PrimeSequence::set_extension_listener(ExtensionListener listener) {
    listener_=std::move(listener);
}

void PrimeSequence::extend_to_count(std::size_t count) {
    if(cache_.size()>=count) {
        return;
    }
    SieveExtent extent=primeseq::extend_to_count(count,cache_);
    adopt(std::move(extent.primes),extent.bound);
}

void PrimeSequence::extend_past(std::uint64_t value) {
    SieveExtent extent=extend_to_value(value,watermark_,cache_);
    adopt(std::move(extent.primes),extent.bound);
}

void PrimeSequence::adopt(PrimeList&&primes,std::uint64_t bound) {
    cache_=std::move(primes);
    watermark_=std::max(watermark_,bound+1);
    if(listener_) {
        listener_(bound,cache_.size());
    }
}

}
