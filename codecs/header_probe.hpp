#ifndef HEADER_PROBE_HPP
#define HEADER_PROBE_HPP

#include <istream>
#include <span>

#include <cstddef>

constexpr std::size_t probe_len = 64;

// Quick hints read straight out of the first 64 bytes, without decoding.
// Good for the common detector layout only: the real dimensions come from
// a decoder
struct Probe_result
{
    std::size_t width {0};
    std::size_t height {0};
    int bit_depth {0};
};

// throws Format_error when fewer than probe_len bytes are available.
// Leaves the stream wherever the read stopped; rewind before decoding
[[nodiscard]] Probe_result probe_header(std::istream & input);
[[nodiscard]] Probe_result probe_header(std::span<const unsigned char> prefix);

#endif // HEADER_PROBE_HPP
