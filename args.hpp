#ifndef ARGS_HPP
#define ARGS_HPP

#include <optional>
#include <string>

#include "config.h"

struct Args
{
    std::string input_filename;                  // - for stdin
    std::optional<unsigned int> frame_no;        // TIFF reader only
    std::optional<std::string> convert_filename; // write selected frame as TIFF
    bool get_frame_count;
    bool show_header;
    bool show_stats;
    bool verbose;
    bool quiet;
    std::string help_text;
};

[[nodiscard]] std::optional<Args> parse_args(int argc, char * argv[]);

#endif // ARGS_HPP
