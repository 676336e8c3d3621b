#include <gtest/gtest.h>

#include "codecs/tag_table.hpp"

TEST(Tag_table, public_name_lowercases_first_char)
{
    EXPECT_EQ(public_tag_name("ImageWidth"), "imageWidth");
    EXPECT_EQ(public_tag_name("XResolution"), "xResolution");
    EXPECT_EQ(public_tag_name("already"), "already");
    EXPECT_EQ(public_tag_name(""), "");
}

TEST(Tag_table, collapse_unwraps_single_element_tuples)
{
    EXPECT_EQ(collapse(std::vector<std::int64_t>{42}), Tag_value{std::int64_t{42}});
    EXPECT_EQ(collapse(std::vector<double>{0.5}), Tag_value{0.5});

    auto pair = Tag_value{std::vector<std::int64_t>{1, 2}};
    EXPECT_EQ(collapse(pair), pair);
    EXPECT_EQ(collapse(std::string{"text"}), Tag_value{std::string{"text"}});
}

TEST(Tag_table, standard_names)
{
    auto & table = Tag_table::standard();
    EXPECT_EQ(table.name(tiff_tag::image_width), "ImageWidth");
    EXPECT_EQ(table.name(tiff_tag::sample_format), "SampleFormat");
    EXPECT_FALSE(table.name(65000));

    EXPECT_EQ(table.id("bitsPerSample"), tiff_tag::bits_per_sample);
    EXPECT_FALSE(table.id("BitsPerSample"));
}

TEST(Tag_table, translate_drops_unknown_ids)
{
    Tag_table table{std::map<std::uint16_t, std::string>{{256, "ImageWidth"}}};
    Native_tag_map native
    {
        {256, std::vector<std::int64_t>{640}},
        {40000, std::string{"private"}},
    };

    auto header = translate_tags(native, table);

    ASSERT_EQ(std::size(header), 1u);
    EXPECT_EQ(header.at("imageWidth"), Tag_value{std::int64_t{640}});
}

TEST(Tag_table, translate_keeps_lower_id_on_key_clash)
{
    Tag_table table;
    table.add(301, "exposure");
    table.add(300, "Exposure");

    Native_tag_map native
    {
        {300, std::vector<double>{0.25}},
        {301, std::vector<double>{9.0}},
    };

    auto header = translate_tags(native, table);

    ASSERT_EQ(std::size(header), 1u);
    EXPECT_EQ(header.at("exposure"), Tag_value{0.25});
}

TEST(Tag_table, translate_keeps_tuples_and_strings)
{
    Native_tag_map native
    {
        {tiff_tag::bits_per_sample, std::vector<std::int64_t>{8, 8, 8}},
        {tiff_tag::image_description, std::string{"detector 1"}},
    };

    auto header = translate_tags(native, Tag_table::standard());

    EXPECT_EQ(header.at("bitsPerSample"), (Tag_value{std::vector<std::int64_t>{8, 8, 8}}));
    EXPECT_EQ(header.at("imageDescription"), Tag_value{std::string{"detector 1"}});
}

TEST(Tag_table, value_to_string)
{
    EXPECT_EQ(to_string(Tag_value{std::int64_t{7}}), "7");
    EXPECT_EQ(to_string(Tag_value{std::string{"abc"}}), "abc");
    EXPECT_EQ(to_string(Tag_value{std::vector<std::int64_t>{1, 2, 3}}), "(1, 2, 3)");
}
