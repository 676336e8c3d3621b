#include "decoder_backend.hpp"

#include <array>

#include "errors.hpp"

std::string_view to_string(Backend backend)
{
    switch(backend)
    {
    case Backend::none:     return "none";
    case Backend::primary:  return "primary";
    case Backend::fallback: return "fallback";
    }
    return "unknown";
}

std::vector<unsigned char> read_input_to_memory(std::istream & input)
{
    std::vector<unsigned char> data;
    std::array<char, 4096> buffer;
    while(input)
    {
        input.read(std::data(buffer), std::size(buffer));
        if(input.bad())
            throw Io_error{"Error reading input stream"};

        data.insert(std::end(data), std::begin(buffer), std::begin(buffer) + input.gcount());
    }
    return data;
}
