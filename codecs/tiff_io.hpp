#ifndef TIFF_IO_HPP
#define TIFF_IO_HPP

#include <memory>
#include <optional>
#include <vector>

#include <cstddef>
#include <cstdint>

#include <tiffio.h>

#include "log.hpp"
#include "pixel_buffer.hpp"
#include "tag_table.hpp"

// in-memory file libtiff reads from or writes to
struct Tiff_io
{
    Tiff_io() = default;

    explicit Tiff_io(std::vector<unsigned char> && data):
        data{std::move(data)}
    {}

    std::vector<unsigned char> data;
    std::size_t pos {0};
};

struct Tiff_closer
{
    void operator()(TIFF * tiff) const { TIFFClose(tiff); }
};
using Tiff_handle = std::unique_ptr<TIFF, Tiff_closer>;

// io must outlive the handle. Both throw: Decode_failure when libtiff
// rejects the data, Io_error when a writer can't be set up
Tiff_handle open_tiff_reader(Tiff_io & io);
Tiff_handle open_tiff_writer(Tiff_io & io);

// Tags of the current directory that the table knows, read with whatever
// calling convention libtiff uses for each. BitsPerSample and SampleFormat
// are repeated once per sample. Rationals come out at libtiff's single
// precision
Tag_dictionary extract_header(TIFF * tiff, const Tag_table & table, const Logger & log);

// Throws Decode_failure unless the current directory's strips or tiles lie
// inside a file of file_size bytes and hold enough data for the declared
// image size. Call before allocating anything sized from the header
void check_data_size(TIFF * tiff, std::uint64_t file_size);

std::optional<Sample_type> native_sample_type(std::uint16_t bits, std::uint16_t format);

#endif // TIFF_IO_HPP
