// File: tests/tools/DisInputTests.cpp
// Purpose: Check hex and constant-pool text parsing for classlens-dis.
// Key invariants: Errors name the 1-based line; comments and blank lines are
//                 ignored.
// Ownership/Lifetime: Inputs are string literals.
// Links: src/tools/classlens-dis/input.hpp

#include "tools/classlens-dis/input.hpp"

#include <gtest/gtest.h>

#include <optional>
#include <string>
#include <vector>

using namespace classlens::tools::dis;

TEST(DisInput, HexWithCommentsAndGrouping)
{
    auto bytes = parseHexText("# main body\n2a b7 0001   # super()\n\tB1\n");
    ASSERT_TRUE(bytes);
    EXPECT_EQ(bytes.value(), (std::vector<uint8_t>{0x2A, 0xB7, 0x00, 0x01, 0xB1}));
}

TEST(DisInput, EmptyHexIsEmptyCode)
{
    auto bytes = parseHexText("# nothing here\n\n");
    ASSERT_TRUE(bytes);
    EXPECT_TRUE(bytes.value().empty());
}

TEST(DisInput, HexErrorsNameTheLine)
{
    auto badDigit = parseHexText("00\n1G\n");
    ASSERT_FALSE(badDigit);
    EXPECT_EQ(badDigit.error().message, "line 2: invalid hex digit 'G'");
    EXPECT_FALSE(badDigit.error().loc.isValid());

    auto oddDigits = parseHexText("b1 0");
    ASSERT_FALSE(oddDigits);
    EXPECT_EQ(oddDigits.error().message, "line 1: odd number of hex digits");

    auto splitPair = parseHexText("1 0\n");
    ASSERT_FALSE(splitPair);
    EXPECT_EQ(splitPair.error().message, "line 1: odd number of hex digits");
}

TEST(DisInput, PoolEntries)
{
    auto pool = parsePoolText("# constant pool\n"
                              "7: java/io/PrintStream.println:(I)V\n"
                              "\n"
                              "  13 :  Hello, world  \n");
    ASSERT_TRUE(pool);
    EXPECT_EQ(pool.value().size(), 2u);
    EXPECT_EQ(pool.value().describe(7),
              std::optional<std::string>("java/io/PrintStream.println:(I)V"));
    EXPECT_EQ(pool.value().describe(13), std::optional<std::string>("Hello, world"));
}

TEST(DisInput, PoolDescriptionMayContainColons)
{
    auto pool = parsePoolText("2: Foo.bar:()V");
    ASSERT_TRUE(pool);
    EXPECT_EQ(pool.value().describe(2), std::optional<std::string>("Foo.bar:()V"));
}

TEST(DisInput, PoolSyntaxErrors)
{
    auto noColon = parsePoolText("1: ok\nbroken line\n");
    ASSERT_FALSE(noColon);
    EXPECT_EQ(noColon.error().message, "line 2: expected 'INDEX: DESCRIPTION'");

    auto badIndex = parsePoolText("x1: nope\n");
    ASSERT_FALSE(badIndex);
    EXPECT_EQ(badIndex.error().message, "line 1: invalid constant-pool index 'x1'");

    auto emptyIndex = parsePoolText(": nope\n");
    ASSERT_FALSE(emptyIndex);
}

TEST(DisInput, MissingFileIsAnError)
{
    auto code = loadCodeFile("/nonexistent/classlens/code.bin", false);
    ASSERT_FALSE(code);
    EXPECT_EQ(code.error().message, "cannot open /nonexistent/classlens/code.bin");

    auto pool = loadPoolFile("/nonexistent/classlens/pool.txt");
    ASSERT_FALSE(pool);
}
