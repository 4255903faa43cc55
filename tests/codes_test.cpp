#include "wormhole/codes.hpp"

#include <gtest/gtest.h>

#include <sstream>
#include <string>
#include <vector>

#include "wormhole/crypto.hpp"
#include "wormhole/errors.hpp"

TEST(CodesTest, MakeCodeStartsWithNameplate) {
    ASSERT_EQ(Wormhole::Crypto::init(), 0);

    std::string code = Wormhole::make_code("7");

    std::vector<std::string> parts;
    std::istringstream fields(code);
    std::string part;
    while (std::getline(fields, part, '-')) {
        parts.push_back(part);
    }
    ASSERT_EQ(parts.size(), 1 + Wormhole::CODE_WORD_COUNT);
    ASSERT_EQ(parts[0], "7");
    for (size_t i = 1; i < parts.size(); ++i) {
        ASSERT_FALSE(parts[i].empty());
    }
    ASSERT_EQ(Wormhole::nameplate_of(code), "7");
}

TEST(CodesTest, MakeCodeWordCount) {
    ASSERT_EQ(Wormhole::Crypto::init(), 0);

    std::string code = Wormhole::make_code("42", 4);
    size_t dashes = 0;
    for (char c : code) {
        dashes += c == '-' ? 1 : 0;
    }
    ASSERT_EQ(dashes, 4u);
}

TEST(CodesTest, NormalizeCode) {
    ASSERT_EQ(Wormhole::normalize_code("7-guitarist-revenue"), "7-guitarist-revenue");
    ASSERT_EQ(Wormhole::normalize_code("  7 guitarist   revenue\n"), "7-guitarist-revenue");
    ASSERT_EQ(Wormhole::normalize_code("\t7\tguitarist-revenue "), "7-guitarist-revenue");
    ASSERT_EQ(Wormhole::normalize_code("   "), "");
}

TEST(CodesTest, NameplateOf) {
    ASSERT_EQ(Wormhole::nameplate_of("7-guitarist-revenue"), "7");
    ASSERT_EQ(Wormhole::nameplate_of("123-a"), "123");

    ASSERT_THROW(Wormhole::nameplate_of("guitarist-revenue"), Wormhole::InvalidArgument);
    ASSERT_THROW(Wormhole::nameplate_of("7"), Wormhole::InvalidArgument);
    ASSERT_THROW(Wormhole::nameplate_of("7-"), Wormhole::InvalidArgument);
    ASSERT_THROW(Wormhole::nameplate_of("-7-a"), Wormhole::InvalidArgument);
    ASSERT_THROW(Wormhole::nameplate_of(""), Wormhole::InvalidArgument);
}
