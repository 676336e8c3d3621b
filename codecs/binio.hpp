#ifndef BINIO_HPP
#define BINIO_HPP

#include <bit>
#include <cstddef>
#include <iterator>
#include <stdexcept>
#include <type_traits>
#include <utility>

#include <cstdint>
#include <cstring>

template<typename T> concept Byte_input_iter =
    std::input_iterator<T> &&
    requires { requires sizeof(*std::declval<T>()) == 1; };

template<typename T> concept Byte_output_iter =
    std::output_iterator<T, char>;

// mixed endian systems apparently do exist, so do a static_assert to make sure we're one or the other
static_assert(std::endian::native == std::endian::big || std::endian::native == std::endian::little);

template <typename T> requires std::is_arithmetic_v<T>
T bswap(T a)
{
    if constexpr(sizeof(T) == 1)
    {
        return a;
    }
    else
    {
        unsigned char buf[sizeof(T)];
        std::memcpy(buf, &a, sizeof(T));
        for(std::size_t i = 0; i < sizeof(T) / 2; ++i)
            std::swap(buf[i], buf[sizeof(T) - 1 - i]);
        std::memcpy(&a, buf, sizeof(T));
        return a;
    }
}

template <typename T, Byte_input_iter InputIter> requires std::is_arithmetic_v<T>
void readb(InputIter & begin, InputIter end, T & t, std::endian endian = std::endian::little)
{
    unsigned char buf[sizeof(T)];
    for(auto && i: buf)
    {
        if(begin == end)
            throw std::runtime_error{"Unexpected end of input"};
        i = static_cast<unsigned char>(*begin++);
    }
    std::memcpy(&t, buf, sizeof(T));
    if(std::endian::native != endian)
        t = bswap(t);
}

template <typename T, Byte_input_iter InputIter> requires std::is_arithmetic_v<T>
T readb(InputIter & begin, InputIter end, std::endian endian = std::endian::little)
{
    T t{0};
    readb(begin, end, t, endian);
    return t;
}

template <typename T, Byte_output_iter OutputIter> requires std::is_arithmetic_v<T>
void writeb(OutputIter & o, T t, std::endian endian = std::endian::little)
{
    if(std::endian::native != endian)
        t = bswap(t);
    char buf[sizeof(T)];
    std::memcpy(buf, &t, sizeof(T));
    for(auto && b: buf)
        *o++ = b;
}

#endif // BINIO_HPP
