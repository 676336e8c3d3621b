#ifndef TIF_IMAGE_HPP
#define TIF_IMAGE_HPP

#include <istream>
#include <memory>
#include <string>
#include <string_view>

#include <cstddef>

#include "decoder_backend.hpp"
#include "header_probe.hpp"
#include "image_host.hpp"
#include "log.hpp"
#include "tag_table.hpp"
#include "tif_frame.hpp"

// Progress of the last read. primary_ok and fallback_ok are passed through
// on the way to ready and are never left as the final state
enum class Decode_state
{
    init,
    probing,
    primary_attempt,
    primary_ok,
    primary_failed,
    fallback_attempt,
    fallback_ok,
    fallback_failed,
    ready,
    error
};

std::string_view to_string(Decode_state state);

// The codecs a Tif_image may try, in order. An empty factory, or one that
// returns nullptr, counts as a codec that isn't built in
struct Backends
{
    Decoder_factory primary;
    Decoder_factory fallback;

    // native sample reader, then libtiff RGBA conversion
    static Backends standard();
};

// A TIFF file as an image: decodes through the primary codec, falling back
// to the secondary one, and keeps frame 0 in the image host.
// Only the primary codec gives access to other frames.
class Tif_image
{
public:
    explicit Tif_image(std::unique_ptr<Image_host> host = std::make_unique<File_image_host>(),
                       Logger log = {},
                       Tag_table table = Tag_table::standard(),
                       Backends backends = Backends::standard());
    ~Tif_image();

    // backends hold a reference to table_
    Tif_image(const Tif_image &) = delete;
    Tif_image & operator=(const Tif_image &) = delete;

    // throws Io_error for unreadable or empty input, Fatal_decode_error when
    // no codec could decode it. A failed read leaves state() == error and no
    // data
    void read(const std::string & filename);
    void read(std::istream & input, const std::string & name);

    // primary codec only, else Unsupported_operation. index outside
    // [0, num_frames()) throws std::out_of_range
    Tif_frame get_frame(int index) const;

    // writes through the primary codec, never the fallback
    void write(const std::string & filename) const;
    void write(const std::string & filename, const Pixel_buffer & data, const Tag_dictionary & header) const;

    // release the decoder. decoded data stays. Safe to call any time, any
    // number of times
    void close() noexcept;

    Backend backend() const { return backend_; }
    Decode_state state() const { return state_; }
    std::size_t num_frames() const { return num_frames_; }

    // hints from the header probe, all zero when it failed
    const Probe_result & probe() const { return probe_; }
    int bits() const { return probe_.bit_depth; }

    const Tag_dictionary & header() const { return host_->header(); }
    const Pixel_buffer & data() const { return host_->data(); }
    std::size_t dim1() const { return host_->dim1(); }
    std::size_t dim2() const { return host_->dim2(); }

    Image_host & host() { return *host_; }
    const Image_host & host() const { return *host_; }

private:
    void decode(std::istream & input, const std::string & name);
    void clear_host();
    // set state_ and log the transition
    void enter(Decode_state state);
    bool attempt(const Decoder_factory & factory, Backend slot, std::istream & input, const std::string & name);
    void commit_frame(Tag_dictionary header, Pixel_buffer data, const std::string & name);

    std::unique_ptr<Image_host> host_;
    Logger log_;
    Tag_table table_;
    Backends backends_;

    std::unique_ptr<Decoder_backend> active_;
    Backend backend_ {Backend::none};
    Decode_state state_ {Decode_state::init};
    std::size_t num_frames_ {0};
    Probe_result probe_;
};

#endif // TIF_IMAGE_HPP
