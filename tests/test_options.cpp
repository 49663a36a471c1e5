#include <gtest/gtest.h>

#include "streamdl/options.hpp"

#include <limits>
#include <stdexcept>
#include <string>

using streamdl::parseOptionValue;

TEST(OptionValueTest, AcceptsValuesWithinRange) {
    EXPECT_EQ(parseOptionValue("--max-redirects", "0", 10), 0u);
    EXPECT_EQ(parseOptionValue("--max-redirects", "10", 10), 10u);
    EXPECT_EQ(parseOptionValue("--max-redirects", "4294967295", std::numeric_limits<unsigned>::max()),
              4294967295ull);
}

TEST(OptionValueTest, RejectsValuesThatWouldWrap) {
    EXPECT_THROW((void)parseOptionValue("--max-redirects", "4294967296", std::numeric_limits<unsigned>::max()),
                 std::invalid_argument);
    EXPECT_THROW((void)parseOptionValue("--idle-timeout", "99999999999999999999999", 1000), std::invalid_argument);
}

TEST(OptionValueTest, RejectsSignsAndGarbage) {
    EXPECT_THROW((void)parseOptionValue("--max-redirects", "-1", 100), std::invalid_argument);
    EXPECT_THROW((void)parseOptionValue("--max-redirects", "+3", 100), std::invalid_argument);
    EXPECT_THROW((void)parseOptionValue("--max-redirects", "", 100), std::invalid_argument);
    EXPECT_THROW((void)parseOptionValue("--max-redirects", "12s", 100), std::invalid_argument);
    EXPECT_THROW((void)parseOptionValue("--max-redirects", " 5", 100), std::invalid_argument);
}

TEST(OptionValueTest, MessageNamesTheOption) {
    try {
        (void)parseOptionValue("--connect-timeout", "abc", 100);
        FAIL() << "expected invalid_argument";
    } catch (const std::invalid_argument& e) {
        EXPECT_NE(std::string(e.what()).find("--connect-timeout"), std::string::npos);
    }
}
