#pragma once

#include <cstddef>
#include <cstdint>
#include <cstdio>
#include <string>
#include <vector>

namespace primeseq {

enum class OutputFormat {
    Text,
    Binary,
    Delta,
};

// Writes integer sequences to stdout or a file. Text puts one value per line
// (or one tuple per line); Binary writes 64-bit little-endian values; Delta
// writes 64-bit little-endian differences from the previous value and needs a
// non-decreasing stream. write_line emits a free-form report line and is only
// accepted in Text.
class SequenceWriter {
public:
    SequenceWriter(bool enabled,const std::string&path="",OutputFormat format=OutputFormat::Text);
    ~SequenceWriter();

    SequenceWriter(const SequenceWriter&)=delete;
    SequenceWriter&operator=(const SequenceWriter&)=delete;

    bool enabled() const { return enabled_;}
    OutputFormat format() const { return format_;}
    void write_values(const std::vector<std::uint64_t>&values);
    void write_value(std::uint64_t value);
    void write_tuple(const std::uint64_t*values,std::size_t count);
    void write_line(const std::string&line);
    void flush();
    void finish();

private:
    void append_text(std::uint64_t value,char separator);
    void append_binary(std::uint64_t value);
    void append_delta(std::uint64_t value);
    void flush_buffer();

    bool enabled_;
    std::FILE*file_;
    bool owns_file_;
    OutputFormat format_;
    std::string buffer_;
    std::uint64_t previous_value_;
};

}
