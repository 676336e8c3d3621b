#include "image_host.hpp"

#include <algorithm>
#include <fstream>
#include <stdexcept>
#include <utility>

#include "errors.hpp"

std::unique_ptr<std::istream> File_image_host::open_input(const std::string & path)
{
    auto input = std::make_unique<std::ifstream>(path, std::ios_base::in | std::ios_base::binary);
    if(!*input)
        throw Io_error{"Could not open input file " + path};
    return input;
}

std::unique_ptr<std::ostream> File_image_host::open_output(const std::string & path)
{
    auto output = std::make_unique<std::ofstream>(path, std::ios_base::out | std::ios_base::binary);
    if(!*output)
        throw Io_error{"Could not open output file " + path};
    return output;
}

void File_image_host::set_header(Tag_dictionary header)
{
    header_ = std::move(header);
}

void File_image_host::reset_header()
{
    header_.clear();
}

void File_image_host::reset_values()
{
    stats_.reset();
}

void File_image_host::set_dims(std::size_t dim1, std::size_t dim2)
{
    dim1_ = dim1;
    dim2_ = dim2;
}

void File_image_host::set_data(Pixel_buffer data)
{
    data_ = std::move(data);
    stats_.reset();
}

const Image_stats & File_image_host::statistics() const
{
    if(stats_)
        return *stats_;

    if(data_.empty())
        throw std::logic_error{"No image data to compute statistics on"};

    Image_stats stats;
    stats.min = stats.max = data_.value(0);
    double sum = 0.0;
    for(std::size_t i = 0; i < data_.size(); ++i)
    {
        auto v = data_.value(i);
        stats.min = std::min(stats.min, v);
        stats.max = std::max(stats.max, v);
        sum += v;
    }
    stats.mean = sum / data_.size();

    return stats_.emplace(stats);
}
