#include "pixel_buffer.hpp"

#include <functional>
#include <numeric>
#include <utility>

std::size_t sample_size(Sample_type type)
{
    switch(type)
    {
    case Sample_type::uint8:
    case Sample_type::int8:
        return 1;
    case Sample_type::uint16:
    case Sample_type::int16:
        return 2;
    case Sample_type::uint32:
    case Sample_type::int32:
    case Sample_type::float32:
        return 4;
    case Sample_type::float64:
        return 8;
    }
    throw std::logic_error{"Unhandled sample type"};
}

std::string_view to_string(Sample_type type)
{
    switch(type)
    {
    case Sample_type::uint8:   return "uint8";
    case Sample_type::uint16:  return "uint16";
    case Sample_type::uint32:  return "uint32";
    case Sample_type::int8:    return "int8";
    case Sample_type::int16:   return "int16";
    case Sample_type::int32:   return "int32";
    case Sample_type::float32: return "float32";
    case Sample_type::float64: return "float64";
    }
    return "unknown";
}

bool is_float(Sample_type type)
{
    return type == Sample_type::float32 || type == Sample_type::float64;
}

bool is_signed(Sample_type type)
{
    return type == Sample_type::int8 || type == Sample_type::int16 || type == Sample_type::int32 || is_float(type);
}

Pixel_buffer::Pixel_buffer(std::vector<std::size_t> shape, Sample_type type):
    shape_{std::move(shape)},
    type_{type}
{
    bytes_.resize(size() * sample_size(type_));
}

std::size_t Pixel_buffer::size() const
{
    if(std::empty(shape_))
        return 0;
    return std::accumulate(std::begin(shape_), std::end(shape_), std::size_t{1}, std::multiplies<>{});
}

double Pixel_buffer::value(std::size_t index) const
{
    if(index >= size())
        throw std::out_of_range{"Pixel_buffer index " + std::to_string(index) + " out of range"};

    switch(type_)
    {
    case Sample_type::uint8:   return values<std::uint8_t>()[index];
    case Sample_type::uint16:  return values<std::uint16_t>()[index];
    case Sample_type::uint32:  return values<std::uint32_t>()[index];
    case Sample_type::int8:    return values<std::int8_t>()[index];
    case Sample_type::int16:   return values<std::int16_t>()[index];
    case Sample_type::int32:   return values<std::int32_t>()[index];
    case Sample_type::float32: return values<float>()[index];
    case Sample_type::float64: return values<double>()[index];
    }
    throw std::logic_error{"Unhandled sample type"};
}

std::string Pixel_buffer::shape_string() const
{
    std::string s = "(";
    for(std::size_t i = 0; i < std::size(shape_); ++i)
    {
        if(i > 0)
            s += ", ";
        s += std::to_string(shape_[i]);
    }
    return s + ")";
}
