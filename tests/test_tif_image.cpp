#include <algorithm>
#include <array>
#include <filesystem>
#include <memory>
#include <ostream>
#include <regex>
#include <sstream>
#include <streambuf>
#include <string>
#include <string_view>
#include <vector>

#include <cstring>

#include <gtest/gtest.h>

#include "codecs/errors.hpp"
#include "codecs/tif_image.hpp"
#include "recording_sink.hpp"
#include "tiff_builder.hpp"

namespace
{
    // how a fake codec behaves, and what happened to it
    struct Fake_script
    {
        bool fail_open {false};
        std::size_t frames {1};
        Pixel_buffer data {Pixel_buffer::from_values<std::uint8_t>({2, 3}, {1, 2, 3, 4, 5, 6})};
        Tag_dictionary header {{"imageWidth", std::int64_t{3}}};

        int opened {0};
        int closed {0};
        std::string first_bytes; // start of the stream as open() saw it
    };

    class Fake_backend final: public Decoder_backend
    {
    public:
        Fake_backend(Backend kind, std::shared_ptr<Fake_script> script):
            kind_{kind},
            script_{std::move(script)}
        {}

        Backend kind() const override { return kind_; }
        std::string_view name() const override { return "fake codec"; }

        std::size_t open(std::istream & input) override
        {
            ++script_->opened;

            std::array<char, 2> start {};
            input.read(std::data(start), std::size(start));
            script_->first_bytes.assign(std::data(start), input.gcount());

            if(script_->fail_open)
                throw Decode_failure{"fake failure"};
            open_ = true;
            return script_->frames;
        }

        std::size_t num_frames() const override { return open_ ? script_->frames : 0; }

        Tag_dictionary get_header(std::size_t index) const override
        {
            check(index);
            auto header = script_->header;
            header["frame"] = static_cast<std::int64_t>(index);
            return header;
        }

        Pixel_buffer get_data(std::size_t index) const override
        {
            check(index);
            return script_->data;
        }

        void close() noexcept override
        {
            if(open_)
                ++script_->closed;
            open_ = false;
        }

    private:
        void check(std::size_t index) const
        {
            if(index >= script_->frames)
                throw std::out_of_range{"fake frame out of range"};
        }

        Backend kind_;
        std::shared_ptr<Fake_script> script_;
        bool open_ {false};
    };

    Decoder_factory fake_factory(Backend kind, std::shared_ptr<Fake_script> script)
    {
        return [kind, script](const Tag_table &, const Logger &) -> std::unique_ptr<Decoder_backend>
        {
            return std::make_unique<Fake_backend>(kind, script);
        };
    }

    std::string probe_prefix(std::uint16_t width, std::uint16_t height, std::uint16_t bits, std::size_t len = 128)
    {
        std::array<std::uint16_t, 32> words {};
        words[0] = 0x4949; // "II" either way round
        words[9] = width;
        words[15] = height;
        words[21] = bits;

        std::string data(len, '\0');
        std::memcpy(std::data(data), std::data(words), std::min(len, sizeof(words)));
        return data;
    }

    std::istringstream as_stream(const std::vector<unsigned char> & file)
    {
        return std::istringstream{std::string(std::begin(file), std::end(file))};
    }

    std::vector<std::string> logged_states(const Recording_sink & sink)
    {
        const std::string_view prefix = "Decode state: ";
        std::vector<std::string> states;
        for(auto && [level, msg]: sink.messages)
        {
            if(level == Log_level::debug && msg.starts_with(prefix))
                states.push_back(msg.substr(std::size(prefix)));
        }
        return states;
    }

    // accepts limit bytes, then reports every write as failed
    class Failing_buf final: public std::streambuf
    {
    public:
        explicit Failing_buf(std::size_t limit): limit_{limit} {}

    protected:
        int_type overflow(int_type c) override
        {
            if(traits_type::eq_int_type(c, traits_type::eof()))
                return traits_type::not_eof(c);
            if(written_ >= limit_)
                return traits_type::eof();
            ++written_;
            return c;
        }

    private:
        std::size_t limit_;
        std::size_t written_ {0};
    };

    class Failing_stream final: public std::ostream
    {
    public:
        Failing_stream(std::size_t limit, std::shared_ptr<bool> destroyed):
            std::ostream{nullptr},
            buf_{limit},
            destroyed_{std::move(destroyed)}
        {
            rdbuf(&buf_);
        }
        ~Failing_stream() override
        {
            *destroyed_ = true;
        }

    private:
        Failing_buf buf_;
        std::shared_ptr<bool> destroyed_;
    };

    // output goes to a stream that fails part way through
    class Failing_output_host final: public File_image_host
    {
    public:
        Failing_output_host(std::size_t limit, std::shared_ptr<bool> destroyed):
            limit_{limit},
            destroyed_{std::move(destroyed)}
        {}

        std::unique_ptr<std::ostream> open_output(const std::string &) override
        {
            ++opened;
            return std::make_unique<Failing_stream>(limit_, destroyed_);
        }

        int opened {0};

    private:
        std::size_t limit_;
        std::shared_ptr<bool> destroyed_;
    };
}

class Tif_image_test: public ::testing::Test
{
protected:
    Tif_image make_image(bool with_fallback = true)
    {
        Backends backends;
        backends.primary = fake_factory(Backend::primary, primary);
        if(with_fallback)
            backends.fallback = fake_factory(Backend::fallback, fallback);

        return Tif_image{std::make_unique<File_image_host>(), Logger{sink}, Tag_table::standard(), std::move(backends)};
    }

    std::shared_ptr<Recording_sink> sink {std::make_shared<Recording_sink>()};
    std::shared_ptr<Fake_script> primary {std::make_shared<Fake_script>()};
    std::shared_ptr<Fake_script> fallback {std::make_shared<Fake_script>()};
};

TEST_F(Tif_image_test, primary_success)
{
    primary->frames = 4;
    auto img = make_image();
    std::istringstream input{probe_prefix(3, 2, 8)};

    img.read(input, "good.tif");

    EXPECT_EQ(img.state(), Decode_state::ready);
    EXPECT_EQ(img.backend(), Backend::primary);
    EXPECT_EQ(img.num_frames(), 4u);
    EXPECT_EQ(img.dim1(), 3u);
    EXPECT_EQ(img.dim2(), 2u);
    EXPECT_EQ(img.bits(), 8);
    EXPECT_EQ(img.data(), primary->data);
    EXPECT_EQ(img.header().at("frame"), Tag_value{std::int64_t{0}});
    EXPECT_EQ(fallback->opened, 0);
    EXPECT_EQ(primary->first_bytes, "II");
}

TEST_F(Tif_image_test, fallback_activation)
{
    primary->fail_open = true;
    fallback->data = Pixel_buffer::from_values<std::uint16_t>({1, 2}, {100, 200});
    auto img = make_image();
    std::istringstream input{probe_prefix(2, 1, 16)};

    img.read(input, "odd.tif");

    EXPECT_EQ(img.state(), Decode_state::ready);
    EXPECT_EQ(img.backend(), Backend::fallback);
    EXPECT_EQ(img.num_frames(), 1u);
    EXPECT_EQ(img.data(), fallback->data);
    EXPECT_EQ(img.dim1(), 2u);
    EXPECT_EQ(img.dim2(), 1u);
    EXPECT_TRUE(sink->contains(Log_level::warning, "Unable to read odd.tif with the fake codec due to fake failure, trying fallback"));

    // both codecs saw the stream from the start
    EXPECT_EQ(primary->first_bytes, "II");
    EXPECT_EQ(fallback->first_bytes, "II");

    EXPECT_THROW(img.get_frame(0), Unsupported_operation);
}

TEST_F(Tif_image_test, primary_without_frames_falls_back)
{
    primary->frames = 0;
    auto img = make_image();
    std::istringstream input{probe_prefix(3, 2, 8)};

    img.read(input, "empty_ifds.tif");

    EXPECT_EQ(img.backend(), Backend::fallback);
    EXPECT_EQ(primary->closed, 1);
}

TEST_F(Tif_image_test, total_failure)
{
    primary->fail_open = true;
    fallback->fail_open = true;
    auto img = make_image();
    std::istringstream input{probe_prefix(3, 2, 8)};

    EXPECT_THROW(img.read(input, "junk.tif"), Fatal_decode_error);

    EXPECT_EQ(img.state(), Decode_state::error);
    EXPECT_EQ(img.backend(), Backend::none);
    EXPECT_EQ(img.num_frames(), 0u);
    EXPECT_EQ(img.dim1(), 0u);
    EXPECT_EQ(img.dim2(), 0u);
    EXPECT_TRUE(img.data().empty());
    EXPECT_TRUE(std::empty(img.header()));
    EXPECT_GE(sink->count(Log_level::error), 1u);

    EXPECT_NO_THROW(img.close());
    EXPECT_NO_THROW(img.close());
    EXPECT_THROW(img.get_frame(0), Unsupported_operation);
}

TEST_F(Tif_image_test, failed_read_drops_previous_image)
{
    auto img = make_image();
    std::istringstream good{probe_prefix(3, 2, 8)};
    img.read(good, "good.tif");
    ASSERT_FALSE(img.data().empty());

    primary->fail_open = true;
    fallback->fail_open = true;
    std::istringstream bad{probe_prefix(3, 2, 8)};
    EXPECT_THROW(img.read(bad, "bad.tif"), Fatal_decode_error);

    EXPECT_TRUE(img.data().empty());
    EXPECT_EQ(img.dim1(), 0u);
    EXPECT_EQ(primary->closed, 1);
}

TEST_F(Tif_image_test, no_fallback_available)
{
    primary->fail_open = true;
    auto img = make_image(false);
    std::istringstream input{probe_prefix(3, 2, 8)};

    EXPECT_THROW(img.read(input, "lzw.tif"), Fatal_decode_error);
    EXPECT_TRUE(sink->contains(Log_level::error, "No fallback codec available"));
    EXPECT_EQ(img.state(), Decode_state::error);
}

TEST_F(Tif_image_test, short_stream_skips_probe)
{
    auto img = make_image();
    std::istringstream input{probe_prefix(3, 2, 8, 20)};

    img.read(input, "tiny.tif");

    EXPECT_EQ(img.state(), Decode_state::ready);
    EXPECT_EQ(img.backend(), Backend::primary);
    EXPECT_EQ(img.probe().width, 0u);
    EXPECT_EQ(img.bits(), 0);
    EXPECT_TRUE(sink->contains(Log_level::debug, "Header probe of tiny.tif failed"));
    EXPECT_EQ(primary->first_bytes, "II");
}

TEST_F(Tif_image_test, empty_stream_is_io_error)
{
    auto img = make_image();
    std::istringstream input;

    EXPECT_THROW(img.read(input, "nothing.tif"), Io_error);
    EXPECT_EQ(img.state(), Decode_state::error);
    EXPECT_EQ(primary->opened, 0);
    EXPECT_EQ(fallback->opened, 0);
}

TEST_F(Tif_image_test, missing_file_is_io_error)
{
    auto img = make_image();
    EXPECT_THROW(img.read("/nonexistent/dir/image.tif"), Io_error);
}

TEST_F(Tif_image_test, frame_bounds)
{
    primary->frames = 3;
    auto img = make_image();
    std::istringstream input{probe_prefix(3, 2, 8)};
    img.read(input, "stack.tif");

    for(int i = 0; i < 3; ++i)
        EXPECT_EQ(img.get_frame(i).header().at("frame"), Tag_value{std::int64_t{i}});

    EXPECT_THROW(img.get_frame(3), std::out_of_range);
    EXPECT_THROW(img.get_frame(-1), std::out_of_range);
}

TEST_F(Tif_image_test, close_in_every_state)
{
    auto img = make_image();
    EXPECT_NO_THROW(img.close());

    std::istringstream input{probe_prefix(3, 2, 8)};
    img.read(input, "good.tif");
    img.close();
    img.close();

    EXPECT_EQ(primary->closed, 1);
    EXPECT_EQ(img.backend(), Backend::none);
    EXPECT_THROW(img.get_frame(0), Unsupported_operation);

    // decoded data outlives the decoder
    EXPECT_EQ(img.data(), primary->data);
    EXPECT_EQ(img.dim1(), 3u);
}

TEST_F(Tif_image_test, reading_again_closes_previous_codec)
{
    auto img = make_image();
    std::istringstream first{probe_prefix(3, 2, 8)};
    std::istringstream second{probe_prefix(3, 2, 8)};

    img.read(first, "first.tif");
    img.read(second, "second.tif");

    EXPECT_EQ(primary->opened, 2);
    EXPECT_EQ(primary->closed, 1);
}

TEST_F(Tif_image_test, color_data_warning)
{
    primary->data = Pixel_buffer{{4, 5, 3}, Sample_type::uint8};
    auto img = make_image();
    std::istringstream input{probe_prefix(1, 1, 8)};

    img.read(input, "rgb.tif");

    EXPECT_EQ(img.dim1(), 5u);
    EXPECT_EQ(img.dim2(), 4u);
    EXPECT_TRUE(sink->contains(Log_level::warning, "third dimension is the color"));
}

TEST_F(Tif_image_test, odd_rank_uses_probe_dimensions)
{
    primary->data = Pixel_buffer{{5}, Sample_type::uint8};
    auto img = make_image();
    std::istringstream input{probe_prefix(7, 4, 8)};

    img.read(input, "line.tif");

    EXPECT_EQ(img.state(), Decode_state::ready);
    EXPECT_EQ(img.dim1(), 7u);
    EXPECT_EQ(img.dim2(), 4u);
    EXPECT_TRUE(sink->contains(Log_level::warning, "rank 1"));
}

TEST(Tif_image, standard_backends_read_multipage)
{
    auto file = Tiff_builder{}
        .image(3, 2, 1, std::vector<std::uint16_t>{1, 2, 3, 4, 5, 6})
        .next_page()
        .image(2, 1, 3, std::vector<std::uint8_t>{1, 2, 3, 4, 5, 6})
        .build();
    auto input = as_stream(file);

    Tif_image img;
    img.read(input, "two.tif");

    EXPECT_EQ(img.backend(), Backend::primary);
    EXPECT_EQ(img.num_frames(), 2u);
    EXPECT_EQ(img.dim1(), 3u);
    EXPECT_EQ(img.dim2(), 2u);
    EXPECT_EQ(img.header().at("imageWidth"), Tag_value{std::int64_t{3}});

    auto frame = img.get_frame(1);
    EXPECT_EQ(frame.data().shape(), (std::vector<std::size_t>{1, 2, 3}));
    EXPECT_EQ(frame.header().at("samplesPerPixel"), Tag_value{std::int64_t{3}});
}

TEST(Tif_image, write_then_read_back)
{
    auto path = (std::filesystem::temp_directory_path() / "detectif_round_trip.tif").string();
    auto data = Pixel_buffer::from_values<std::uint16_t>({2, 2}, {0, 1000, 2000, 65535});
    Tag_dictionary header {{"imageDescription", std::string{"flat field"}}};

    Tif_image writer;
    writer.write(path, data, header);

    Tif_image reader;
    reader.read(path);
    std::filesystem::remove(path);

    EXPECT_EQ(reader.backend(), Backend::primary);
    EXPECT_EQ(reader.data(), data);
    EXPECT_EQ(reader.header().at("imageDescription"), Tag_value{std::string{"flat field"}});
    EXPECT_EQ(reader.header().at("software"), Tag_value{std::string{"detectif"}});

    auto date = std::get<std::string>(reader.header().at("dateTime"));
    EXPECT_TRUE(std::regex_match(date, std::regex{R"(\d{4}:\d{2}:\d{2} \d{2}:\d{2}:\d{2})"})) << date;
}

TEST(Tif_image, write_current_image)
{
    auto source = Tiff_builder{}.image(2, 2, 1, std::vector<float>{0.0f, 0.5f, 1.0f, -1.0f}).build();
    auto input = as_stream(source);

    Tif_image img;
    img.read(input, "float.tif");

    auto path = (std::filesystem::temp_directory_path() / "detectif_rewrite.tif").string();
    img.write(path);

    Tif_image copy;
    copy.read(path);
    std::filesystem::remove(path);

    EXPECT_EQ(copy.data(), img.data());
}

TEST(Tif_image, write_rejects_bad_shapes)
{
    auto path = (std::filesystem::temp_directory_path() / "detectif_never_written.tif").string();
    std::filesystem::remove(path);

    Tif_image img;
    EXPECT_THROW(img.write(path, Pixel_buffer{}, {}), std::invalid_argument);
    EXPECT_THROW(img.write(path, Pixel_buffer{{3}, Sample_type::uint8}, {}), std::invalid_argument);
    EXPECT_FALSE(std::filesystem::exists(path));
}

TEST(Tif_image, state_names)
{
    EXPECT_EQ(to_string(Decode_state::fallback_ok), "fallback_ok");
    EXPECT_EQ(to_string(Decode_state::error), "error");
    EXPECT_EQ(to_string(Backend::primary), "primary");
}

TEST(Tif_image, oversized_declaration_is_decode_error)
{
    // 2^24 x 2^24 doubles claimed with a single 4 byte strip
    auto file = Tiff_builder{}
        .longs(tiff_tag::image_width, {1u << 24})
        .longs(tiff_tag::image_length, {1u << 24})
        .shorts(tiff_tag::bits_per_sample, {64})
        .shorts(tiff_tag::sample_format, {3})
        .shorts(tiff_tag::compression, {1})
        .shorts(tiff_tag::photometric, {1})
        .longs(tiff_tag::rows_per_strip, {1u << 24})
        .strip({0, 0, 0, 0})
        .build();
    auto input = as_stream(file);

    auto sink = std::make_shared<Recording_sink>();
    Tif_image img{std::make_unique<File_image_host>(), Logger{sink}};
    EXPECT_THROW(img.read(input, "huge.tif"), Fatal_decode_error);

    EXPECT_EQ(img.state(), Decode_state::error);
    EXPECT_EQ(img.backend(), Backend::none);
    EXPECT_TRUE(img.data().empty());
    EXPECT_TRUE(sink->contains(Log_level::warning, "trying fallback"));
}

TEST(Tif_image, failed_write_releases_stream)
{
    auto destroyed = std::make_shared<bool>(false);
    auto host = std::make_unique<Failing_output_host>(16, destroyed);
    auto & host_ref = *host;

    Tif_image img{std::move(host)};
    auto data = Pixel_buffer::from_values<std::uint16_t>({4, 4}, std::vector<std::uint16_t>(16, 7));

    EXPECT_THROW(img.write("fails.tif", data, {}), Io_error);
    EXPECT_EQ(host_ref.opened, 1);
    EXPECT_TRUE(*destroyed);
}

TEST_F(Tif_image_test, states_passed_through_are_logged)
{
    auto img = make_image();
    std::istringstream input{probe_prefix(3, 2, 8)};
    img.read(input, "first.tif");
    EXPECT_EQ(img.state(), Decode_state::ready);

    EXPECT_EQ(logged_states(*sink), (std::vector<std::string>{"init", "probing", "primary_attempt", "primary_ok", "ready"}));

    primary->fail_open = true;
    sink->messages.clear();
    std::istringstream again{probe_prefix(3, 2, 8)};
    img.read(again, "second.tif");

    EXPECT_EQ(logged_states(*sink), (std::vector<std::string>{"init", "probing", "primary_attempt", "primary_failed", "fallback_attempt", "fallback_ok", "ready"}));
    EXPECT_EQ(img.state(), Decode_state::ready);
}
