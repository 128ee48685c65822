#include "writer.h"

#include <charconv>
#include <cerrno>
#include <cstring>
#include <stdexcept>

#if defined(_MSC_VER)
#include <intrin.h>
#endif

namespace primeseq {

namespace {

constexpr std::size_t kBufferThreshold=1u<<20;

inline std::uint64_t to_little_endian(std::uint64_t value) {
#if defined(__BYTE_ORDER__) && (__BYTE_ORDER__ == __ORDER_BIG_ENDIAN__)
    return __builtin_bswap64(value);
#elif defined(_MSC_VER) && defined(_WIN32)
    return _byteswap_uint64(value);
#else
    return value;
#endif
}

}

SequenceWriter::SequenceWriter(bool enabled,const std::string&path,OutputFormat format)
    : enabled_(enabled),
      file_(nullptr),
      owns_file_(false),
      format_(format),
      previous_value_(0) {
    if(!enabled_) {
        return;
    }

    if(path.empty()) {
        file_=stdout;
        owns_file_=false;
        if(format_!=OutputFormat::Text) {
            std::fprintf(stderr,"[primeseq] warning: writing binary output to stdout.\n");
        }
    } else {
        file_=std::fopen(path.c_str(),"wb");
        if(!file_) {
            throw std::runtime_error("Failed to open output file: "+path);
        }
        owns_file_=true;
    }
    buffer_.reserve(kBufferThreshold);
}

SequenceWriter::~SequenceWriter() {
    if(file_&&owns_file_) {
        std::fclose(file_);
    }
}

void SequenceWriter::write_values(const std::vector<std::uint64_t>&values) {
    if(!enabled_) {
        return;
    }
    for(std::uint64_t value : values) {
        write_value(value);
    }
}

void SequenceWriter::write_value(std::uint64_t value) {
    if(!enabled_) {
        return;
    }
    switch(format_) {
    case OutputFormat::Text:
        append_text(value,'\n');
        break;
    case OutputFormat::Binary:
        append_binary(value);
        break;
    case OutputFormat::Delta:
        append_delta(value);
        break;
    }
    if(buffer_.size()>=kBufferThreshold) {
        flush_buffer();
    }
}

void SequenceWriter::write_tuple(const std::uint64_t*values,std::size_t count) {
    if(!enabled_||count==0) {
        return;
    }
    if(format_!=OutputFormat::Text) {
        for(std::size_t i=0;i<count;++i) {
            write_value(values[i]);
        }
        return;
    }
    for(std::size_t i=0;i<count;++i) {
        append_text(values[i],i+1==count ? '\n' : ' ');
    }
    if(buffer_.size()>=kBufferThreshold) {
        flush_buffer();
    }
}

void SequenceWriter::write_line(const std::string&line) {
    if(!enabled_) {
        return;
    }
    if(format_!=OutputFormat::Text) {
        throw std::runtime_error("Report lines require text output");
    }
    buffer_.append(line);
    buffer_.push_back('\n');
    if(buffer_.size()>=kBufferThreshold) {
        flush_buffer();
    }
}

void SequenceWriter::flush() {
    if(!enabled_||!file_) {
        return;
    }
    flush_buffer();
    if(std::fflush(file_)!=0) {
        throw std::runtime_error(std::strerror(errno));
    }
}

void SequenceWriter::finish() {
    if(!enabled_||!file_) {
        return;
    }
    flush_buffer();
    std::FILE*file=file_;
    file_=nullptr;
    if(owns_file_) {
        if(std::fclose(file)!=0) {
            throw std::runtime_error("Failed to close output file");
        }
    } else if(std::fflush(file)!=0) {
        throw std::runtime_error("Failed to flush output stream");
    }
}

void SequenceWriter::append_text(std::uint64_t value,char separator) {
    char local[32];
    auto result=std::to_chars(local,local+sizeof(local),value);
    if(result.ec!=std::errc()) {
        throw std::runtime_error("Failed to convert value to string");
    }
    buffer_.append(local,result.ptr);
    buffer_.push_back(separator);
}

void SequenceWriter::append_binary(std::uint64_t value) {
    std::uint64_t encoded=to_little_endian(value);
    buffer_.append(reinterpret_cast<const char*>(&encoded),sizeof(encoded));
}

void SequenceWriter::append_delta(std::uint64_t value) {
    if(value<previous_value_) {
        throw std::runtime_error("Values must be non-decreasing for delta encoding");
    }
    std::uint64_t delta=value-previous_value_;
    previous_value_=value;
    append_binary(delta);
}

void SequenceWriter::flush_buffer() {
    if(!file_||buffer_.empty()) {
        return;
    }
    const char*data=buffer_.data();
    std::size_t remaining=buffer_.size();
    while(remaining>0) {
        std::size_t written=std::fwrite(data,1,remaining,file_);
        if(written==0) {
            throw std::runtime_error(std::ferror(file_) ? std::strerror(errno) : "short write");
        }
        data+=written;
        remaining-=written;
    }
    buffer_.clear();
}

}
