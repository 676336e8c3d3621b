#ifndef DECODER_BACKEND_HPP
#define DECODER_BACKEND_HPP

#include <functional>
#include <istream>
#include <memory>
#include <string_view>
#include <vector>

#include <cstddef>

#include "log.hpp"
#include "pixel_buffer.hpp"
#include "tag_table.hpp"

enum class Backend {none, primary, fallback};

std::string_view to_string(Backend backend);

// whole stream into memory. both codecs need to seek backwards
std::vector<unsigned char> read_input_to_memory(std::istream & input);

// One codec behind the orchestrator. Implementations report anything they
// can't parse as Decode_failure, and frame indexes they don't have as
// std::out_of_range or Unsupported_operation
class Decoder_backend
{
public:
    virtual ~Decoder_backend() = default;

    virtual Backend kind() const = 0;
    virtual std::string_view name() const = 0;

    // returns the frame count
    virtual std::size_t open(std::istream & input) = 0;
    virtual std::size_t num_frames() const = 0;

    virtual Tag_dictionary get_header(std::size_t index) const = 0;
    virtual Pixel_buffer get_data(std::size_t index) const = 0;

    // idempotent, never throws
    virtual void close() noexcept = 0;
};

// returns nullptr when the codec is not built in
using Decoder_factory = std::function<std::unique_ptr<Decoder_backend>(const Tag_table &, const Logger &)>;

#endif // DECODER_BACKEND_HPP
