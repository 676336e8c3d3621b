#ifndef TAG_TABLE_HPP
#define TAG_TABLE_HPP

#include <iterator>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

#include <cstdint>

// A tag's value: a scalar, a string or a tuple
using Tag_value = std::variant<std::int64_t, double, std::string, std::vector<std::int64_t>, std::vector<double>>;

// named header exposed to callers
using Tag_dictionary = std::map<std::string, Tag_value>;

// tags as a codec delivers them, keyed on numeric tag id
using Native_tag_map = std::map<std::uint16_t, Tag_value>;

std::string to_string(const Tag_value & value);

// one-element tuples become their scalar, everything else is returned as is
Tag_value collapse(Tag_value value);

// lowercase the first char: "ImageWidth" -> "imageWidth"
std::string public_tag_name(std::string_view name);

// Tag id -> canonical name lookup. Plain data so decoders can be run against
// synthetic tag sets
class Tag_table
{
public:
    Tag_table() = default;
    explicit Tag_table(std::map<std::uint16_t, std::string> names);

    void add(std::uint16_t id, std::string name);

    std::optional<std::string_view> name(std::uint16_t id) const;
    std::optional<std::uint16_t> id(std::string_view public_name) const;
    const std::map<std::uint16_t, std::string> & entries() const { return names_; }
    bool empty() const { return std::empty(names_); }

    // TIFF 6.0 baseline and extension names
    static const Tag_table & standard();

private:
    std::map<std::uint16_t, std::string> names_;
};

// Translate a codec's tags into a header. Ids missing from the table are
// dropped. When two ids translate to the same key the lower id wins
Tag_dictionary translate_tags(const Native_tag_map & native, const Tag_table & table);

namespace tiff_tag
{
    constexpr std::uint16_t new_subfile_type   = 254;
    constexpr std::uint16_t image_width        = 256;
    constexpr std::uint16_t image_length       = 257;
    constexpr std::uint16_t bits_per_sample    = 258;
    constexpr std::uint16_t compression        = 259;
    constexpr std::uint16_t photometric        = 262;
    constexpr std::uint16_t document_name      = 269;
    constexpr std::uint16_t image_description  = 270;
    constexpr std::uint16_t make               = 271;
    constexpr std::uint16_t model              = 272;
    constexpr std::uint16_t strip_offsets      = 273;
    constexpr std::uint16_t orientation        = 274;
    constexpr std::uint16_t samples_per_pixel  = 277;
    constexpr std::uint16_t rows_per_strip     = 278;
    constexpr std::uint16_t strip_byte_counts  = 279;
    constexpr std::uint16_t x_resolution       = 282;
    constexpr std::uint16_t y_resolution       = 283;
    constexpr std::uint16_t planar_config      = 284;
    constexpr std::uint16_t page_name          = 285;
    constexpr std::uint16_t resolution_unit    = 296;
    constexpr std::uint16_t page_number        = 297;
    constexpr std::uint16_t software           = 305;
    constexpr std::uint16_t date_time          = 306;
    constexpr std::uint16_t artist             = 315;
    constexpr std::uint16_t host_computer      = 316;
    constexpr std::uint16_t predictor          = 317;
    constexpr std::uint16_t color_map          = 320;
    constexpr std::uint16_t tile_width         = 322;
    constexpr std::uint16_t tile_length        = 323;
    constexpr std::uint16_t tile_offsets       = 324;
    constexpr std::uint16_t tile_byte_counts   = 325;
    constexpr std::uint16_t extra_samples      = 338;
    constexpr std::uint16_t sample_format      = 339;
    constexpr std::uint16_t copyright          = 33432;
}

#endif // TAG_TABLE_HPP
