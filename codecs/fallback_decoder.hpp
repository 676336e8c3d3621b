#ifndef FALLBACK_DECODER_HPP
#define FALLBACK_DECODER_HPP

#include <memory>

#include "decoder_backend.hpp"
#include "tiff_io.hpp"

// Any layout libtiff can convert, as {h, w, 4} 8 bit RGBA
Pixel_buffer read_rgba_image(TIFF * tiff, std::uint64_t file_size);

// Single frame decoder for anything libtiff can turn into RGBA
class Fallback_decoder final: public Decoder_backend
{
public:
    Fallback_decoder(const Tag_table & table, const Logger & log);

    Backend kind() const override { return Backend::fallback; }
    std::string_view name() const override { return "libtiff RGBA reader"; }

    std::size_t open(std::istream & input) override;
    std::size_t num_frames() const override { return handle_ ? 1 : 0; }

    Tag_dictionary get_header(std::size_t index) const override;
    Pixel_buffer get_data(std::size_t index) const override;

    void close() noexcept override;

private:
    void check_frame(std::size_t index) const;

    const Tag_table & table_;
    Logger log_;
    std::unique_ptr<Tiff_io> io_;
    Tiff_handle handle_; // declared after io_ so it's closed first
};

#endif // FALLBACK_DECODER_HPP
