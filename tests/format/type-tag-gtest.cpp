#include "l2db/format/l2db-type-tag.h"
#include <gtest/gtest.h>

using namespace l2db;

TEST(TypeTag, CodesAreThreeLetters)
{
    for (auto tag :
         {TypeTag::RAW,
          TypeTag::STR,
          TypeTag::INT,
          TypeTag::UIN,
          TypeTag::FLT,
          TypeTag::BOL,
          TypeTag::NUL,
          TypeTag::INV})
    {
        auto code = tag_code(tag);
        EXPECT_EQ(code.size(), TYPE_TAG_SIZE);
        EXPECT_EQ(parse_tag(code), tag);
    }
}

TEST(TypeTag, UnknownCodesAreRejected)
{
    EXPECT_FALSE(parse_tag(std::string_view("xyz")).has_value());
    EXPECT_FALSE(parse_tag(std::string_view("STR")).has_value());
    EXPECT_FALSE(parse_tag(std::string_view("st")).has_value());

    const uint8_t bytes[] = {'b', 'o', 'l'};
    EXPECT_EQ(parse_tag(bytes), TypeTag::BOL);
}
