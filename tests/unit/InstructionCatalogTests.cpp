// File: tests/unit/InstructionCatalogTests.cpp
// Purpose: Verify the opcode catalog covers exactly the defined JVM opcodes.
// Key invariants: 205 entries, unique codes and mnemonics, reserved entries
//                 flagged, undefined bytes unmapped.
// Ownership/Lifetime: Catalog is static; tests only read it.
// Links: src/bytecode/InstructionCatalog.hpp

#include "bytecode/InstructionCatalog.hpp"

#include <gtest/gtest.h>

#include <set>
#include <string>

using namespace classlens::bytecode;

TEST(InstructionCatalog, HoldsEveryDefinedOpcode)
{
    EXPECT_EQ(allInstructions().size(), 205u);
    for (unsigned code = 0; code <= 201; ++code)
    {
        const InstructionDef *def = lookup(static_cast<uint8_t>(code));
        ASSERT_NE(def, nullptr) << "opcode " << code;
        EXPECT_EQ(def->opcode, code);
        EXPECT_FALSE(def->reserved) << def->mnemonic;
    }
}

TEST(InstructionCatalog, UndefinedBytesHaveNoEntry)
{
    for (unsigned code = 203; code <= 253; ++code)
        EXPECT_EQ(lookup(static_cast<uint8_t>(code)), nullptr) << "opcode " << code;
}

TEST(InstructionCatalog, ReservedOpcodesCarryPrefix)
{
    const InstructionDef *breakpoint = lookup(uint8_t{202});
    ASSERT_NE(breakpoint, nullptr);
    EXPECT_TRUE(breakpoint->reserved);
    EXPECT_EQ(displayName(*breakpoint), "[Reserved] breakpoint");

    EXPECT_EQ(displayName(lookup(Opcode::Impdep1)), "[Reserved] impdep1");
    EXPECT_EQ(displayName(lookup(Opcode::Impdep2)), "[Reserved] impdep2");
    EXPECT_EQ(displayName(lookup(Opcode::Return)), "return");
}

TEST(InstructionCatalog, MnemonicsAreUnique)
{
    std::set<std::string> seen;
    for (const auto &def : allInstructions())
        EXPECT_TRUE(seen.insert(def.mnemonic).second) << def.mnemonic;
}

TEST(InstructionCatalog, EntriesAreAscending)
{
    const auto all = allInstructions();
    for (size_t i = 1; i < all.size(); ++i)
        EXPECT_LT(all[i - 1].opcode, all[i].opcode);
}

TEST(InstructionCatalog, OperandShapes)
{
    EXPECT_EQ(lookup(Opcode::Nop).shape, OperandShape::None);
    EXPECT_EQ(lookup(Opcode::Bipush).shape, OperandShape::U8Immediate);
    EXPECT_EQ(lookup(Opcode::Aload).shape, OperandShape::U8Immediate);
    EXPECT_EQ(lookup(Opcode::Ret).shape, OperandShape::U8Immediate);
    EXPECT_EQ(lookup(Opcode::Sipush).shape, OperandShape::U16Immediate);
    EXPECT_EQ(lookup(Opcode::Ifnull).shape, OperandShape::S16Branch);
    EXPECT_EQ(lookup(Opcode::Jsr).shape, OperandShape::S16Branch);
    EXPECT_EQ(lookup(Opcode::GotoW).shape, OperandShape::S32Branch);
    EXPECT_EQ(lookup(Opcode::Iinc).shape, OperandShape::LocalIndexConst);
    EXPECT_EQ(lookup(Opcode::Ldc).shape, OperandShape::ConstPoolU8);
    EXPECT_EQ(lookup(Opcode::Ldc2W).shape, OperandShape::ConstPoolU16);
    EXPECT_EQ(lookup(Opcode::Instanceof).shape, OperandShape::ConstPoolU16);
    EXPECT_EQ(lookup(Opcode::Invokeinterface).shape, OperandShape::InvokeInterface);
    EXPECT_EQ(lookup(Opcode::Invokedynamic).shape, OperandShape::InvokeDynamic);
    EXPECT_EQ(lookup(Opcode::Newarray).shape, OperandShape::NewArrayPrimitive);
    EXPECT_EQ(lookup(Opcode::Multianewarray).shape, OperandShape::MultiArray);
    EXPECT_EQ(lookup(Opcode::Tableswitch).shape, OperandShape::TableSwitch);
    EXPECT_EQ(lookup(Opcode::Lookupswitch).shape, OperandShape::LookupSwitch);
    EXPECT_EQ(lookup(Opcode::Wide).shape, OperandShape::WidePrefix);
    EXPECT_STREQ(toString(OperandShape::S16Branch), "branch16");
}

TEST(InstructionCatalog, CanonicalMnemonics)
{
    EXPECT_STREQ(lookup(uint8_t{0x01})->mnemonic, "aconst_null");
    EXPECT_STREQ(lookup(uint8_t{0x02})->mnemonic, "iconst_m1");
    EXPECT_STREQ(lookup(uint8_t{0x14})->mnemonic, "ldc2_w");
    EXPECT_STREQ(lookup(uint8_t{0xA7})->mnemonic, "goto");
    EXPECT_STREQ(lookup(uint8_t{0xB1})->mnemonic, "return");
    EXPECT_STREQ(lookup(uint8_t{0xC8})->mnemonic, "goto_w");
    EXPECT_STREQ(lookup(uint8_t{0xC9})->mnemonic, "jsr_w");
}

TEST(InstructionCatalog, ArrayTypeCodes)
{
    EXPECT_EQ(arrayTypeName(4).value_or(""), "T_BOOLEAN");
    EXPECT_EQ(arrayTypeName(5).value_or(""), "T_CHAR");
    EXPECT_EQ(arrayTypeName(10).value_or(""), "T_INT");
    EXPECT_EQ(arrayTypeName(11).value_or(""), "T_LONG");
    EXPECT_FALSE(arrayTypeName(3).has_value());
    EXPECT_FALSE(arrayTypeName(12).has_value());
}
