// File: tests/unit/ListingTests.cpp
// Purpose: Check listing line format and constant-pool description handling.
// Key invariants: Descriptions are cut to kMaxDescriptionLength characters.
// Ownership/Lifetime: Resolvers and instructions are test-local.
// Links: include/classlens/bytecode/Listing.hpp

#include "classlens/bytecode/Listing.hpp"

#include <gtest/gtest.h>

#include <map>
#include <optional>
#include <sstream>
#include <string>
#include <utility>

using namespace classlens::bytecode;

TEST(Listing, PlainInstruction)
{
    const DecodedInstruction instr{0, 0xB1, "return", std::nullopt};
    EXPECT_EQ(formatInstruction(instr), "Offset 0000: opcode [B1] return");
}

TEST(Listing, PoolIndexWithoutResolver)
{
    const DecodedInstruction instr{3, 0xB6, "invokevirtual", 258u};
    EXPECT_EQ(formatInstruction(instr), "Offset 0003: opcode [B6] invokevirtual 258");
}

TEST(Listing, ResolverAddsDescription)
{
    MapConstantPoolResolver pool;
    pool.set(258, "java/io/PrintStream.println:(I)V");

    const DecodedInstruction known{3, 0xB6, "invokevirtual", 258u};
    EXPECT_EQ(formatInstruction(known, &pool),
              "Offset 0003: opcode [B6] invokevirtual 258 - java/io/PrintStream.println:(I)V");

    const DecodedInstruction unknown{7, 0x12, "ldc", 9u};
    EXPECT_EQ(formatInstruction(unknown, &pool), "Offset 0007: opcode [12] ldc 9");
}

TEST(Listing, LongDescriptionsAreTruncated)
{
    std::map<uint32_t, std::string> entries;
    entries[1] = std::string(1500, 'x');
    entries[2] = std::string(1000, 'y');
    const MapConstantPoolResolver pool(std::move(entries));
    const std::string prefix = "Offset 0000: opcode [BB] new 1 - ";

    const std::string longLine = formatInstruction({0, 0xBB, "new", 1u}, &pool);
    ASSERT_EQ(longLine.size(), prefix.size() + kMaxDescriptionLength);
    EXPECT_EQ(longLine.substr(prefix.size()), std::string(1000, 'x'));

    const std::string exactLine = formatInstruction({0, 0xBB, "new", 2u}, &pool);
    EXPECT_EQ(exactLine.size(), prefix.size() + 1000);
}

TEST(Listing, WideOffsetsAreNotClipped)
{
    const DecodedInstruction instr{12345, 0x00, "nop", std::nullopt};
    EXPECT_EQ(formatInstruction(instr), "Offset 12345: opcode [00] nop");
}

TEST(Listing, WritesEveryInstruction)
{
    DecodeResult result;
    result.instructions.push_back({0, 0x10, "bipush 100", std::nullopt});
    result.instructions.push_back({2, 0xAB, "lookupswitch: default=4\n    case 1: 8", std::nullopt});
    std::ostringstream os;
    writeListing(os, result);
    EXPECT_EQ(os.str(),
              "Offset 0000: opcode [10] bipush 100\n"
              "Offset 0002: opcode [AB] lookupswitch: default=4\n    case 1: 8\n");
}

TEST(Listing, MapResolverLookup)
{
    MapConstantPoolResolver pool;
    EXPECT_EQ(pool.size(), 0u);
    pool.set(4, "first");
    pool.set(4, "second");
    EXPECT_EQ(pool.size(), 1u);
    EXPECT_EQ(pool.describe(4), std::optional<std::string>("second"));
    EXPECT_FALSE(pool.describe(5).has_value());
}
