#include <gtest/gtest.h>
#include <sanidate/schema/primitives.hpp>

#include <string>
#include <string_view>

TEST(primitives, bytes_view_aliases_string_storage) {
  auto text = std::string{"hi"};
  auto view = sanidate::schema::make_bytes_view(std::string_view{text});
  ASSERT_EQ(view.size(), 2u);
  EXPECT_EQ(view[0], 0x68);
  EXPECT_EQ(static_cast<const void*>(view.data()),
            static_cast<const void*>(text.data()));
}

TEST(primitives, make_string_copies_bytes) {
  auto bytes = sanidate::schema::bytes_t{0x6F, 0x00, 0x6B};
  auto text =
      sanidate::schema::make_string(sanidate::schema::make_bytes_view(bytes));
  EXPECT_EQ(text, std::string("o\0k", 3));
}

TEST(primitives, to_hex_renders_lowercase_pairs) {
  auto bytes = sanidate::schema::bytes_t{0x00, 0x0A, 0xFF};
  EXPECT_EQ(sanidate::schema::to_hex(bytes), "000aff");
  EXPECT_EQ(sanidate::schema::to_hex({}), "");
}
