#ifndef PIXEL_BUFFER_HPP
#define PIXEL_BUFFER_HPP

#include <stdexcept>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>
#include <vector>

#include <cstddef>
#include <cstdint>
#include <cstring>

enum class Sample_type {uint8, uint16, uint32, int8, int16, int32, float32, float64};

std::size_t sample_size(Sample_type type);
std::string_view to_string(Sample_type type);
bool is_float(Sample_type type);
bool is_signed(Sample_type type);

template <typename T>
constexpr Sample_type sample_type_of()
{
    if constexpr(std::is_same_v<T, std::uint8_t>)
        return Sample_type::uint8;
    else if constexpr(std::is_same_v<T, std::uint16_t>)
        return Sample_type::uint16;
    else if constexpr(std::is_same_v<T, std::uint32_t>)
        return Sample_type::uint32;
    else if constexpr(std::is_same_v<T, std::int8_t>)
        return Sample_type::int8;
    else if constexpr(std::is_same_v<T, std::int16_t>)
        return Sample_type::int16;
    else if constexpr(std::is_same_v<T, std::int32_t>)
        return Sample_type::int32;
    else if constexpr(std::is_same_v<T, float>)
        return Sample_type::float32;
    else if constexpr(std::is_same_v<T, double>)
        return Sample_type::float64;
    else
        static_assert(!std::is_same_v<T, T>, "unsupported sample type");
}

// Row-major array of samples: {height, width} or {height, width, channels}.
// Samples are stored in host byte order
class Pixel_buffer
{
public:
    Pixel_buffer() = default;
    Pixel_buffer(std::vector<std::size_t> shape, Sample_type type); // zero filled

    template <typename T>
    static Pixel_buffer from_values(std::vector<std::size_t> shape, const std::vector<T> & values)
    {
        Pixel_buffer buf{std::move(shape), sample_type_of<T>()};
        if(std::size(values) != buf.size())
            throw std::invalid_argument{"Pixel_buffer: " + std::to_string(std::size(values)) + " values for " + std::to_string(buf.size()) + " samples"};
        std::memcpy(std::data(buf.bytes_), std::data(values), std::size(buf.bytes_));
        return buf;
    }

    const std::vector<std::size_t> & shape() const { return shape_; }
    std::size_t rank() const { return std::size(shape_); }
    Sample_type type() const { return type_; }

    std::size_t size() const; // sample count
    bool empty() const { return std::empty(shape_) || size() == 0; }

    std::size_t height() const   { return rank() > 0 ? shape_[0] : 0; }
    std::size_t width() const    { return rank() > 1 ? shape_[1] : 0; }
    std::size_t channels() const { return rank() > 2 ? shape_[2] : 1; }

    std::vector<unsigned char> & bytes() { return bytes_; }
    const std::vector<unsigned char> & bytes() const { return bytes_; }

    template <typename T> T * values()
    {
        check_type<T>();
        return reinterpret_cast<T *>(std::data(bytes_));
    }
    template <typename T> const T * values() const
    {
        check_type<T>();
        return reinterpret_cast<const T *>(std::data(bytes_));
    }

    template <typename T> T at(std::size_t row, std::size_t col, std::size_t channel = 0) const
    {
        return values<T>()[(row * width() + col) * channels() + channel];
    }

    // any sample converted to double, by flat index
    double value(std::size_t index) const;

    std::string shape_string() const;

    bool operator==(const Pixel_buffer & other) const = default;

private:
    template <typename T> void check_type() const
    {
        if(sample_type_of<T>() != type_)
            throw std::logic_error{"Pixel_buffer holds " + std::string{to_string(type_)} + " samples, not " + std::string{to_string(sample_type_of<T>())}};
    }

    std::vector<std::size_t> shape_;
    Sample_type type_ {Sample_type::uint8};
    std::vector<unsigned char> bytes_;
};

#endif // PIXEL_BUFFER_HPP
