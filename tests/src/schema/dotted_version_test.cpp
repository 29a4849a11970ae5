#include <gtest/gtest.h>
#include <tessera/schema/dotted_version.hpp>

using namespace tessera::schema;

namespace {

dotted_version_t parse(const std::string_view text) {
  auto parsed = try_parse_dotted_version(text);
  EXPECT_TRUE(parsed.has_value()) << text;
  return parsed.value_or(dotted_version_t{});
}

}  // namespace

TEST(dotted_version, orders_components_numerically) {
  EXPECT_LT(parse("1.9"), parse("1.10"));
  EXPECT_LT(parse("2015.01"), parse("2016.04"));
  EXPECT_LT(parse("2016.04"), parse("2016.10"));
  EXPECT_GT(parse("2.0"), parse("1.99"));
}

TEST(dotted_version, trailing_zeros_are_insignificant) {
  EXPECT_EQ(parse("1"), parse("1.0"));
  EXPECT_EQ(parse("1.0.0"), parse("1.0"));
  EXPECT_LT(parse("1.0"), parse("1.0.1"));
}

TEST(dotted_version, keeps_original_text) {
  EXPECT_EQ(parse("2016.04").text, "2016.04");
  EXPECT_EQ(parse("2016.04").components, (std::vector<uint32_t>{2016, 4}));
}

TEST(dotted_version, rejects_malformed_text) {
  for (auto text : {"", ".", "1.", ".1", "1..2", "v1.0", "1.0-beta", "-1",
                    "1.x", " 1.0"}) {
    EXPECT_FALSE(try_parse_dotted_version(text).has_value()) << text;
  }
}

TEST(dotted_version, compare_versions_reports_malformed_input) {
  EXPECT_EQ(compare_versions("1.0", "1.1"), std::strong_ordering::less);
  EXPECT_EQ(compare_versions("1.1", "1.1.0"), std::strong_ordering::equal);
  EXPECT_FALSE(compare_versions("1.0", "bogus").has_value());
}
