#include "args.hpp"

#include <exception>
#include <iostream>

#include <cxxopts.hpp>

[[nodiscard]] std::optional<Args> parse_args(int argc, char * argv[])
{
    auto prog_name = std::string{argv[0]};
    if(auto sep_pos = prog_name.find_last_of("\\/"); sep_pos != std::string::npos)
        prog_name = prog_name.substr(sep_pos + 1);

    cxxopts::Options options{prog_name, "Read detector TIFF images and their metadata (version " DETECTIF_VERSION ")"};

    try
    {
        options.add_options()
            ("h,help",      "Show this message and quit")
            ("f,frame",     "Select frame number. Only available when the file is read by the built-in TIFF reader", cxxopts::value<unsigned int>(), "FRAME_NO")
            ("frame-count", "Print number of frames and exit")
            ("header",      "Print the tags of the selected frame")
            ("stats",       "Print min, max and mean of the selected frame")
            ("c,convert",   "Write the selected frame to a new TIFF file", cxxopts::value<std::string>(), "OUTPUT_FILE")
            ("v,verbose",   "Log decoder progress")
            ("q,quiet",     "Only log errors");

        options.add_options()
            ("input", "Input image path. Read from stdin if -", cxxopts::value<std::string>()->default_value("-"));

        options.parse_positional({"input"});
        options.positional_help("INPUT");
    }
    catch(const std::exception & e) // cxxopts renamed its exception class in 3.0. both derive from std::exception
    {
        std::cerr<<"Error building argument parser: "<<e.what()<<'\n';
        return {};
    }

    auto help = [&options](const std::string & msg = "") -> std::string
    {
        auto txt = options.help();

        txt += "\n"
                " Positional arguments:\n"
                "    INPUT  TIFF image path. Read from stdin if - (default: stdin)\n";

        if(!std::empty(msg))
            txt += '\n' + msg + '\n';

        return txt;
    };

    try
    {
        auto args = options.parse(argc, argv);

        if(args.count("help"))
        {
            std::cerr<<help()<<'\n';
            return {};
        }

        if(args.count("verbose") && args.count("quiet"))
        {
            std::cerr<<help("Only one of --verbose or --quiet may be specified")<<'\n';
            return {};
        }

        if(args.count("frame-count") && (args.count("header") || args.count("stats") || args.count("convert")))
        {
            std::cerr<<help("Can't specify --frame-count with --header, --stats or --convert")<<'\n';
            return {};
        }

        return Args{
            .input_filename   = args["input"].as<std::string>(),
            .frame_no         = args.count("frame") ? std::optional(args["frame"].as<unsigned int>()) : std::nullopt,
            .convert_filename = args.count("convert") ? std::optional(args["convert"].as<std::string>()) : std::nullopt,
            .get_frame_count  = static_cast<bool>(args.count("frame-count")),
            .show_header      = static_cast<bool>(args.count("header")),
            .show_stats       = static_cast<bool>(args.count("stats")),
            .verbose          = static_cast<bool>(args.count("verbose")),
            .quiet            = static_cast<bool>(args.count("quiet")),
            .help_text        = help()
        };
    }
    catch(const std::exception & e)
    {
        std::cerr<<help(e.what())<<'\n';
        return {};
    }
}
