#ifndef IMAGE_HOST_HPP
#define IMAGE_HOST_HPP

#include <istream>
#include <memory>
#include <optional>
#include <ostream>
#include <string>

#include <cstddef>

#include "pixel_buffer.hpp"
#include "tag_table.hpp"

// What a decoded image lives in: the current header, data and dimensions,
// plus the file access the container needs
class Image_host
{
public:
    virtual ~Image_host() = default;

    // both throw Io_error when the file can't be opened
    virtual std::unique_ptr<std::istream> open_input(const std::string & path) = 0;
    virtual std::unique_ptr<std::ostream> open_output(const std::string & path) = 0;

    virtual const Tag_dictionary & header() const = 0;
    virtual void set_header(Tag_dictionary header) = 0;
    virtual void reset_header() = 0;

    // drop anything computed from the data
    virtual void reset_values() = 0;

    virtual std::size_t dim1() const = 0; // width
    virtual std::size_t dim2() const = 0; // height
    virtual void set_dims(std::size_t dim1, std::size_t dim2) = 0;

    virtual const Pixel_buffer & data() const = 0;
    virtual void set_data(Pixel_buffer data) = 0;
};

struct Image_stats
{
    double min {0.0};
    double max {0.0};
    double mean {0.0};
};

class File_image_host: public Image_host
{
public:
    std::unique_ptr<std::istream> open_input(const std::string & path) override;
    std::unique_ptr<std::ostream> open_output(const std::string & path) override;

    const Tag_dictionary & header() const override { return header_; }
    void set_header(Tag_dictionary header) override;
    void reset_header() override;

    void reset_values() override;

    std::size_t dim1() const override { return dim1_; }
    std::size_t dim2() const override { return dim2_; }
    void set_dims(std::size_t dim1, std::size_t dim2) override;

    const Pixel_buffer & data() const override { return data_; }
    void set_data(Pixel_buffer data) override;

    // computed on first use. throws std::logic_error when there's no data
    const Image_stats & statistics() const;

private:
    Tag_dictionary header_;
    Pixel_buffer data_;
    std::size_t dim1_ {0}, dim2_ {0};
    mutable std::optional<Image_stats> stats_;
};

#endif // IMAGE_HOST_HPP
