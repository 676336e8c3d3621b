#include "tag_table.hpp"

#include <sstream>
#include <type_traits>
#include <utility>

#include <cctype>

std::string to_string(const Tag_value & value)
{
    return std::visit([](auto && v) -> std::string
    {
        using T = std::decay_t<decltype(v)>;
        if constexpr(std::is_same_v<T, std::string>)
        {
            return v;
        }
        else if constexpr(std::is_same_v<T, std::int64_t> || std::is_same_v<T, double>)
        {
            std::ostringstream os;
            os<<v;
            return os.str();
        }
        else
        {
            std::ostringstream os;
            os<<'(';
            for(std::size_t i = 0; i < std::size(v); ++i)
            {
                if(i > 0)
                    os<<", ";
                os<<v[i];
            }
            os<<')';
            return os.str();
        }
    }, value);
}

Tag_value collapse(Tag_value value)
{
    if(auto ints = std::get_if<std::vector<std::int64_t>>(&value); ints && std::size(*ints) == 1)
        return ints->front();
    if(auto reals = std::get_if<std::vector<double>>(&value); reals && std::size(*reals) == 1)
        return reals->front();
    return value;
}

std::string public_tag_name(std::string_view name)
{
    auto out = std::string{name};
    if(!std::empty(out))
        out[0] = static_cast<char>(std::tolower(static_cast<unsigned char>(out[0])));
    return out;
}

Tag_table::Tag_table(std::map<std::uint16_t, std::string> names):
    names_{std::move(names)}
{}

void Tag_table::add(std::uint16_t id, std::string name)
{
    names_[id] = std::move(name);
}

std::optional<std::string_view> Tag_table::name(std::uint16_t id) const
{
    if(auto i = names_.find(id); i != std::end(names_))
        return i->second;
    return std::nullopt;
}

std::optional<std::uint16_t> Tag_table::id(std::string_view public_name) const
{
    for(auto && [tag, name]: names_)
    {
        if(public_tag_name(name) == public_name)
            return tag;
    }
    return std::nullopt;
}

const Tag_table & Tag_table::standard()
{
    static const Tag_table table
    {{
        {tiff_tag::new_subfile_type,  "NewSubfileType"},
        {tiff_tag::image_width,       "ImageWidth"},
        {tiff_tag::image_length,      "ImageLength"},
        {tiff_tag::bits_per_sample,   "BitsPerSample"},
        {tiff_tag::compression,       "Compression"},
        {tiff_tag::photometric,       "PhotometricInterpretation"},
        {tiff_tag::document_name,     "DocumentName"},
        {tiff_tag::image_description, "ImageDescription"},
        {tiff_tag::make,              "Make"},
        {tiff_tag::model,             "Model"},
        {tiff_tag::strip_offsets,     "StripOffsets"},
        {tiff_tag::orientation,       "Orientation"},
        {tiff_tag::samples_per_pixel, "SamplesPerPixel"},
        {tiff_tag::rows_per_strip,    "RowsPerStrip"},
        {tiff_tag::strip_byte_counts, "StripByteCounts"},
        {tiff_tag::x_resolution,      "XResolution"},
        {tiff_tag::y_resolution,      "YResolution"},
        {tiff_tag::planar_config,     "PlanarConfiguration"},
        {tiff_tag::page_name,         "PageName"},
        {tiff_tag::resolution_unit,   "ResolutionUnit"},
        {tiff_tag::page_number,       "PageNumber"},
        {tiff_tag::software,          "Software"},
        {tiff_tag::date_time,         "DateTime"},
        {tiff_tag::artist,            "Artist"},
        {tiff_tag::host_computer,     "HostComputer"},
        {tiff_tag::predictor,         "Predictor"},
        {tiff_tag::color_map,         "ColorMap"},
        {tiff_tag::tile_width,        "TileWidth"},
        {tiff_tag::tile_length,       "TileLength"},
        {tiff_tag::tile_offsets,      "TileOffsets"},
        {tiff_tag::tile_byte_counts,  "TileByteCounts"},
        {tiff_tag::extra_samples,     "ExtraSamples"},
        {tiff_tag::sample_format,     "SampleFormat"},
        {tiff_tag::copyright,         "Copyright"},
    }};
    return table;
}

Tag_dictionary translate_tags(const Native_tag_map & native, const Tag_table & table)
{
    Tag_dictionary header;
    for(auto && [id, name]: table.entries())
    {
        auto value = native.find(id);
        if(value == std::end(native))
            continue;

        header.try_emplace(public_tag_name(name), collapse(value->second));
    }
    return header;
}
