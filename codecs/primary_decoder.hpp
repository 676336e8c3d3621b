#ifndef PRIMARY_DECODER_HPP
#define PRIMARY_DECODER_HPP

#include <memory>

#include "decoder_backend.hpp"
#include "tiff_io.hpp"

// Reads the samples of the selected directory as stored: any compression,
// strips or tiles, either planar configuration. Samples come out in their
// own type. Layouts with no native sample type (1 to 4 bit, 12 bit, 64 bit
// integers, YCbCr) are a Decode_failure
Pixel_buffer read_native_image(TIFF * tiff, std::uint64_t file_size);

// Multi-frame decoder, one frame per TIFF directory
class Primary_decoder final: public Decoder_backend
{
public:
    Primary_decoder(const Tag_table & table, const Logger & log);

    Backend kind() const override { return Backend::primary; }
    std::string_view name() const override { return "TIFF reader"; }

    std::size_t open(std::istream & input) override;
    std::size_t num_frames() const override { return handle_ ? num_frames_ : 0; }

    Tag_dictionary get_header(std::size_t index) const override;
    Pixel_buffer get_data(std::size_t index) const override;

    void close() noexcept override;

private:
    // make directory index current
    TIFF * select(std::size_t index) const;

    const Tag_table & table_;
    Logger log_;
    std::unique_ptr<Tiff_io> io_;
    Tiff_handle handle_; // declared after io_ so it's closed first
    std::size_t num_frames_ {0};
};

#endif // PRIMARY_DECODER_HPP
