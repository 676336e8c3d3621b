#include "header_probe.hpp"

#include <array>
#include <bit>
#include <string>

#include <cstdint>

#include "binio.hpp"
#include "errors.hpp"

namespace
{
    // 16-bit word indexes in the prefix
    constexpr std::size_t width_word = 9;
    constexpr std::size_t height_word = 15;
    constexpr std::size_t bit_depth_word = 21;
}

Probe_result probe_header(std::span<const unsigned char> prefix)
{
    if(std::size(prefix) < probe_len)
        throw Format_error{"Header too short to probe: " + std::to_string(std::size(prefix)) + " of " + std::to_string(probe_len) + " bytes", std::size(prefix)};

    // the words are taken in host byte order, which only matches the
    // file when both are little endian
    std::array<std::uint16_t, probe_len / 2> words;
    auto begin = std::begin(prefix);
    auto end = begin + probe_len;
    for(auto && w: words)
        readb(begin, end, w, std::endian::native);

    return Probe_result
    {
        .width     = words[width_word],
        .height    = words[height_word],
        .bit_depth = words[bit_depth_word]
    };
}

Probe_result probe_header(std::istream & input)
{
    std::array<unsigned char, probe_len> prefix;
    input.read(reinterpret_cast<char *>(std::data(prefix)), std::size(prefix));
    if(input.bad())
        throw Io_error{"Error reading header"};

    auto got = static_cast<std::size_t>(input.gcount());
    return probe_header(std::span<const unsigned char>{std::data(prefix), got});
}
