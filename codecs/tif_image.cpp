#include "tif_image.hpp"

#include <stdexcept>
#include <utility>

#include "errors.hpp"
#include "fallback_decoder.hpp"
#include "primary_decoder.hpp"
#include "tiff_writer.hpp"

namespace
{
    constexpr std::string_view software_name = "detectif";

    void rewind(std::istream & input)
    {
        input.clear();
        input.seekg(0);
        if(!input)
            throw Io_error{"Could not seek back to start of input"};
    }
}

std::string_view to_string(Decode_state state)
{
    switch(state)
    {
    case Decode_state::init:             return "init";
    case Decode_state::probing:          return "probing";
    case Decode_state::primary_attempt:  return "primary_attempt";
    case Decode_state::primary_ok:       return "primary_ok";
    case Decode_state::primary_failed:   return "primary_failed";
    case Decode_state::fallback_attempt: return "fallback_attempt";
    case Decode_state::fallback_ok:      return "fallback_ok";
    case Decode_state::fallback_failed:  return "fallback_failed";
    case Decode_state::ready:            return "ready";
    case Decode_state::error:            return "error";
    }
    return "unknown";
}

Backends Backends::standard()
{
    Backends backends;
    backends.primary = [](const Tag_table & table, const Logger & log) -> std::unique_ptr<Decoder_backend>
    {
        return std::make_unique<Primary_decoder>(table, log);
    };
    backends.fallback = [](const Tag_table & table, const Logger & log) -> std::unique_ptr<Decoder_backend>
    {
        return std::make_unique<Fallback_decoder>(table, log);
    };
    return backends;
}

Tif_image::Tif_image(std::unique_ptr<Image_host> host, Logger log, Tag_table table, Backends backends):
    host_{std::move(host)},
    log_{std::move(log)},
    table_{std::move(table)},
    backends_{std::move(backends)}
{
    if(!host_)
        throw std::invalid_argument{"Tif_image needs an image host"};
}

Tif_image::~Tif_image()
{
    close();
}

void Tif_image::read(const std::string & filename)
{
    auto input = host_->open_input(filename);
    read(*input, filename);
}

void Tif_image::read(std::istream & input, const std::string & name)
{
    try
    {
        decode(input, name);
    }
    catch(const Fatal_decode_error &)
    {
        throw;
    }
    catch(...)
    {
        // I/O errors and anything unexpected from a codec: nothing half-read survives
        close();
        clear_host();
        state_ = Decode_state::error;
        throw;
    }
}

void Tif_image::clear_host()
{
    host_->reset_header();
    host_->reset_values();
    host_->set_dims(0, 0);
    host_->set_data({});
    num_frames_ = 0;
}

void Tif_image::decode(std::istream & input, const std::string & name)
{
    close();

    enter(Decode_state::init);
    clear_host();
    probe_ = {};

    enter(Decode_state::probing);
    try
    {
        probe_ = probe_header(input);
        log_.debug("Probe of " + name + ": " + std::to_string(probe_.width) + "x" + std::to_string(probe_.height) +
            ", " + std::to_string(probe_.bit_depth) + " bits");
    }
    catch(const Format_error & e)
    {
        if(e.available() == 0)
            throw Io_error{"Input " + name + " is empty"};
        log_.debug("Header probe of " + name + " failed: " + e.what());
    }

    rewind(input);
    enter(Decode_state::primary_attempt);
    if(attempt(backends_.primary, Backend::primary, input, name))
    {
        enter(Decode_state::primary_ok);
        enter(Decode_state::ready);
        return;
    }
    enter(Decode_state::primary_failed);

    rewind(input);
    enter(Decode_state::fallback_attempt);
    if(attempt(backends_.fallback, Backend::fallback, input, name))
    {
        enter(Decode_state::fallback_ok);
        enter(Decode_state::ready);
        return;
    }
    enter(Decode_state::fallback_failed);

    clear_host();
    backend_ = Backend::none;
    enter(Decode_state::error);

    log_.error("Unable to read " + name + " with any codec");
    throw Fatal_decode_error{"Unable to read " + name + ": not a TIFF file any codec could decode"};
}

void Tif_image::enter(Decode_state state)
{
    state_ = state;
    log_.debug("Decode state: " + std::string{to_string(state)});
}

bool Tif_image::attempt(const Decoder_factory & factory, Backend slot, std::istream & input, const std::string & name)
{
    auto decoder = factory ? factory(table_, log_) : nullptr;
    if(!decoder)
    {
        if(slot == Backend::fallback)
            log_.error("No fallback codec available to read " + name);
        else
            log_.error("No primary codec available to read " + name);
        return false;
    }

    try
    {
        auto frames = decoder->open(input);
        if(frames == 0)
            throw Decode_failure{"no frames"};

        auto header = decoder->get_header(0);
        auto data = decoder->get_data(0);
        commit_frame(std::move(header), std::move(data), name);

        num_frames_ = frames;
        backend_ = decoder->kind();
        active_ = std::move(decoder);

        log_.info("Read " + name + " with " + std::string{active_->name()} + ": " + std::to_string(num_frames_) + " frame(s)");
        return true;
    }
    catch(const Decode_failure & e)
    {
        decoder->close();
        if(slot == Backend::primary)
            log_.warning("Unable to read " + name + " with the " + std::string{decoder->name()} + " due to " + e.what() + ", trying fallback");
        else
            log_.error("Unable to read " + name + " with " + std::string{decoder->name()} + ": " + e.what());
        return false;
    }
}

void Tif_image::commit_frame(Tag_dictionary header, Pixel_buffer data, const std::string & name)
{
    std::size_t dim1 = 0, dim2 = 0;
    if(data.rank() == 2 || data.rank() == 3)
    {
        dim1 = data.width();
        dim2 = data.height();
        if(data.rank() == 3)
            log_.warning("Data of " + name + " has shape " + data.shape_string() + ": third dimension is the color");
    }
    else
    {
        log_.warning("Data of " + name + " has rank " + std::to_string(data.rank()) + ", shape " + data.shape_string() +
            ": using header probe dimensions");
        dim1 = probe_.width;
        dim2 = probe_.height;
    }

    host_->set_header(std::move(header));
    host_->set_data(std::move(data));
    host_->set_dims(dim1, dim2);
    host_->reset_values();
}

Tif_frame Tif_image::get_frame(int index) const
{
    if(backend_ != Backend::primary || !active_)
        throw Unsupported_operation{"Frame access needs the TIFF reader, current backend is " + std::string{to_string(backend_)}};

    if(index < 0 || static_cast<std::size_t>(index) >= num_frames_)
        throw std::out_of_range{"Frame " + std::to_string(index) + " out of range (" + std::to_string(num_frames_) + " frames)"};

    auto i = static_cast<std::size_t>(index);
    return Tif_frame{active_->get_header(i), active_->get_data(i)};
}

void Tif_image::write(const std::string & filename) const
{
    write(filename, host_->data(), host_->header());
}

void Tif_image::write(const std::string & filename, const Pixel_buffer & data, const Tag_dictionary & header) const
{
    // checked before the file gets created
    if(data.empty())
        throw std::invalid_argument{"No image data to write to " + filename};
    if(data.rank() != 2 && data.rank() != 3)
        throw std::invalid_argument{"Can't write shape " + data.shape_string() + " to " + filename};

    Tiff_write_session session{host_->open_output(filename), filename};
    session.write_image(data, header, table_, software_name, tiff_timestamp());
    session.close();
}

void Tif_image::close() noexcept
{
    if(active_)
    {
        active_->close();
        active_.reset();
    }
    backend_ = Backend::none;
}
