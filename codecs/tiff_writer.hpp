#ifndef TIFF_WRITER_HPP
#define TIFF_WRITER_HPP

#include <chrono>
#include <memory>
#include <ostream>
#include <string>
#include <string_view>
#include <vector>

#include "pixel_buffer.hpp"
#include "tag_table.hpp"

// "YYYY:MM:DD HH:MM:SS", local time
std::string tiff_timestamp(std::chrono::system_clock::time_point when = std::chrono::system_clock::now());

// Complete TIFF written by libtiff, holding one uncompressed strip.
// Descriptive ASCII tags are taken from header when held as strings there,
// resolution tags when held as numbers.
// throws std::invalid_argument for empty data or rank other than 2 or 3,
// Io_error when libtiff fails
std::vector<unsigned char> encode_tiff(const Pixel_buffer & data, const Tag_dictionary & header, const Tag_table & table,
                                       std::string_view software, std::string_view date_time);

class Tiff_write_session
{
public:
    Tiff_write_session(std::unique_ptr<std::ostream> out, std::string name);
    ~Tiff_write_session();

    Tiff_write_session(const Tiff_write_session &) = delete;
    Tiff_write_session & operator=(const Tiff_write_session &) = delete;

    void write_image(const Pixel_buffer & data, const Tag_dictionary & header, const Tag_table & table,
                     std::string_view software, std::string_view date_time);

    // flush and release the stream. throws Io_error if anything failed to write
    void close();
    bool is_open() const { return static_cast<bool>(out_); }

private:
    std::unique_ptr<std::ostream> out_;
    std::string name_;
};

#endif // TIFF_WRITER_HPP
