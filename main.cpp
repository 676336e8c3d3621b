// Read a detector TIFF and report on it
#include <iostream>
#include <iterator>
#include <memory>
#include <sstream>
#include <stdexcept>

#include <cstdlib>

#include "args.hpp"
#include "codecs/decoder_backend.hpp"
#include "codecs/errors.hpp"
#include "codecs/tif_image.hpp"

namespace
{
    void print_summary(const Tif_image & img)
    {
        std::cout<<"backend:   "<<to_string(img.backend())<<'\n'
                 <<"frames:    "<<img.num_frames()<<'\n'
                 <<"size:      "<<img.dim1()<<'x'<<img.dim2()<<'\n'
                 <<"shape:     "<<img.data().shape_string()<<' '<<to_string(img.data().type())<<'\n'
                 <<"bit depth: "<<img.bits()<<" (header probe)\n";
    }

    void print_header(const Tag_dictionary & header)
    {
        for(auto && [name, value]: header)
            std::cout<<name<<": "<<to_string(value)<<'\n';
    }

    void print_stats(const Pixel_buffer & data)
    {
        File_image_host stats_host;
        stats_host.set_data(data);
        auto & stats = stats_host.statistics();
        std::cout<<"min:  "<<stats.min<<'\n'
                 <<"max:  "<<stats.max<<'\n'
                 <<"mean: "<<stats.mean<<'\n';
    }
}

int main(int argc, char * argv[])
{
    auto args = parse_args(argc, argv);
    if(!args)
        return EXIT_FAILURE;

    auto level = args->verbose ? Log_level::debug : args->quiet ? Log_level::error : Log_level::warning;
    auto log = Logger{std::make_shared<Stream_log_sink>(std::cerr, level)};

    try
    {
        Tif_image img{std::make_unique<File_image_host>(), log};

        if(args->input_filename == "-")
        {
            // decoders need to seek, which stdin might not allow
            std::istringstream input{std::string(std::istreambuf_iterator<char>{std::cin}, {})};
            img.read(input, "stdin");
        }
        else
        {
            img.read(args->input_filename);
        }

        if(args->get_frame_count)
        {
            std::cout<<img.num_frames()<<'\n';
            return EXIT_SUCCESS;
        }

        auto header = img.header();
        auto data = img.data();
        if(args->frame_no)
        {
            auto frame = img.get_frame(static_cast<int>(*args->frame_no));
            header = frame.header();
            data = frame.data();
        }

        if(!args->show_header && !args->show_stats && !args->convert_filename)
            print_summary(img);

        if(args->show_header)
            print_header(header);

        if(args->show_stats)
            print_stats(data);

        if(args->convert_filename)
            img.write(*args->convert_filename, data, header);

        img.close();
    }
    catch(const Unsupported_operation & e)
    {
        std::cerr<<args->help_text<<'\n'<<e.what()<<'\n';
        return EXIT_FAILURE;
    }
    catch(const std::logic_error & e)
    {
        std::cerr<<e.what()<<'\n';
        return EXIT_FAILURE;
    }
    catch(const std::runtime_error & e)
    {
        std::cerr<<e.what()<<'\n';
        return EXIT_FAILURE;
    }
    catch(const std::exception & e)
    {
        std::cerr<<"Unexpected error: "<<e.what()<<'\n';
        return EXIT_FAILURE;
    }

    return EXIT_SUCCESS;
}
