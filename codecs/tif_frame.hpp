#ifndef TIF_FRAME_HPP
#define TIF_FRAME_HPP

#include <utility>

#include "pixel_buffer.hpp"
#include "tag_table.hpp"

// one decoded frame, detached from the decoder that produced it
class Tif_frame
{
public:
    Tif_frame(Tag_dictionary header, Pixel_buffer data):
        header_{std::move(header)},
        data_{std::move(data)}
    {}

    const Tag_dictionary & header() const { return header_; }
    const Pixel_buffer & data() const { return data_; }

private:
    Tag_dictionary header_;
    Pixel_buffer data_;
};

#endif // TIF_FRAME_HPP
