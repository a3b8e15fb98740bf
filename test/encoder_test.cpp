#include <gtest/gtest.h>
#include "xeasm/codegen/instruction_encoder.h"

using namespace xeasm;

class InstructionEncoderTest : public ::testing::Test {
protected:
    void SetUp() override {
        encoder.setSymbolTable(&symbols);
    }

    std::vector<uint8_t> encode(const std::string& mnemonic, const std::string& operand, uint32_t address = 0) {
        auto result = tryEncode(mnemonic, operand, address);
        EXPECT_TRUE(result.success) << mnemonic << " " << operand << ": " << result.error;
        return result.bytes;
    }

    EncodedInstruction tryEncode(const std::string& mnemonic, const std::string& operand, uint32_t address = 0) {
        auto spec = lookupInstruction(mnemonic);
        EXPECT_TRUE(spec.has_value()) << "unknown mnemonic " << mnemonic;
        SourceRecord record(SourceLocation(), "", mnemonic, operand);
        encoder.setCurrentAddress(address);
        if (spec->isDirective()) {
            return encoder.encodeData(*spec, record);
        }
        return encoder.encode(*spec, record);
    }

    SymbolTable symbols;
    InstructionEncoder encoder;
};

// ========== Format 1 and 2 ==========

TEST_F(InstructionEncoderTest, FormatOne) {
    EXPECT_EQ(encode("FIX", ""), (std::vector<uint8_t>{0xC4}));
    EXPECT_EQ(encode("HIO", ""), (std::vector<uint8_t>{0xF4}));
}

TEST_F(InstructionEncoderTest, FormatTwoRegisters) {
    EXPECT_EQ(encode("CLEAR", "X"), (std::vector<uint8_t>{0xB4, 0x10}));
    EXPECT_EQ(encode("CLEAR", "S"), (std::vector<uint8_t>{0xB4, 0x40}));
    EXPECT_EQ(encode("COMPR", "A,S"), (std::vector<uint8_t>{0xA0, 0x04}));
    EXPECT_EQ(encode("TIXR", "T"), (std::vector<uint8_t>{0xB8, 0x50}));
}

TEST_F(InstructionEncoderTest, ShiftEncodesCountMinusOne) {
    EXPECT_EQ(encode("SHIFTL", "T,4"), (std::vector<uint8_t>{0xA4, 0x53}));
    EXPECT_EQ(encode("SHIFTR", "A,16"), (std::vector<uint8_t>{0xA8, 0x0F}));
}

TEST_F(InstructionEncoderTest, SvcNumberInHighNibble) {
    EXPECT_EQ(encode("SVC", "15"), (std::vector<uint8_t>{0xB0, 0xF0}));
    EXPECT_EQ(encode("SVC", "0"), (std::vector<uint8_t>{0xB0, 0x00}));
}

// ========== Format 3 ==========

TEST_F(InstructionEncoderTest, PcRelative) {
    symbols.define("RETADR", 0x30, 14);
    EXPECT_EQ(encode("STL", "RETADR", 0x0), (std::vector<uint8_t>{0x17, 0x20, 0x2D}));
}

TEST_F(InstructionEncoderTest, ForwardReferenceRightAfterInstruction) {
    symbols.define("ALPHA", 3, 2);
    EXPECT_EQ(encode("STA", "ALPHA", 0x0), (std::vector<uint8_t>{0x0F, 0x20, 0x00}));
}

TEST_F(InstructionEncoderTest, NegativeDisplacementTwosComplement) {
    symbols.define("CLOOP", 0x6, 3);
    EXPECT_EQ(encode("J", "CLOOP", 0x17), (std::vector<uint8_t>{0x3F, 0x2F, 0xEC}));
}

TEST_F(InstructionEncoderTest, BaseRelativeIndexed) {
    symbols.define("BUFFER", 0x36, 17);
    encoder.setBaseRegister(0x33);
    EXPECT_EQ(encode("STCH", "BUFFER,X", 0x104E), (std::vector<uint8_t>{0x57, 0xC0, 0x03}));
}

TEST_F(InstructionEncoderTest, BaseRelativeZeroDisplacement) {
    symbols.define("LENGTH", 0x33, 15);
    encoder.setBaseRegister(0x33);
    EXPECT_EQ(encode("STX", "LENGTH", 0x1056), (std::vector<uint8_t>{0x13, 0x40, 0x00}));
}

TEST_F(InstructionEncoderTest, ImmediateConstant) {
    EXPECT_EQ(encode("LDA", "#3", 0x20), (std::vector<uint8_t>{0x01, 0x00, 0x03}));
    EXPECT_EQ(encode("COMP", "#0", 0xD), (std::vector<uint8_t>{0x29, 0x00, 0x00}));
}

TEST_F(InstructionEncoderTest, Indirect) {
    symbols.define("RETADR", 0x30, 14);
    EXPECT_EQ(encode("J", "@RETADR", 0x2A), (std::vector<uint8_t>{0x3E, 0x20, 0x03}));
}

TEST_F(InstructionEncoderTest, Rsub) {
    EXPECT_EQ(encode("RSUB", "", 0x1059), (std::vector<uint8_t>{0x4F, 0x00, 0x00}));
}

// ========== Format 4 ==========

TEST_F(InstructionEncoderTest, ExtendedSymbol) {
    symbols.define("RDREC", 0x1036, 30);
    EXPECT_EQ(encode("+JSUB", "RDREC", 0x6), (std::vector<uint8_t>{0x4B, 0x10, 0x10, 0x36}));
}

TEST_F(InstructionEncoderTest, ExtendedImmediate) {
    EXPECT_EQ(encode("+LDT", "#4096", 0x103C), (std::vector<uint8_t>{0x75, 0x10, 0x10, 0x00}));
}

TEST_F(InstructionEncoderTest, ExtendedTopAddressBits) {
    symbols.define("HIGH", 0xFFFFF, 1);
    EXPECT_EQ(encode("+LDA", "HIGH", 0), (std::vector<uint8_t>{0x03, 0x1F, 0xFF, 0xFF}));
}

// ========== Errors surface with their kind ==========

TEST_F(InstructionEncoderTest, ErrorsCarryKind) {
    auto undefined = tryEncode("LDA", "NOWHERE");
    EXPECT_FALSE(undefined.success);
    EXPECT_EQ(undefined.error_kind, ErrorKind::UNDEFINED_SYMBOL);
    EXPECT_TRUE(undefined.bytes.empty());

    auto svc = tryEncode("SVC", "16");
    EXPECT_FALSE(svc.success);
    EXPECT_EQ(svc.error_kind, ErrorKind::SVC_OPERAND_OUT_OF_RANGE);
}

TEST_F(InstructionEncoderTest, DirectiveIsNotAnInstruction) {
    auto spec = lookupInstruction("BYTE");
    ASSERT_TRUE(spec.has_value());
    SourceRecord record(SourceLocation(), "", "BYTE", "X'F1'");

    auto result = encoder.encode(*spec, record);
    EXPECT_FALSE(result.success);
    EXPECT_EQ(result.error_kind, ErrorKind::INTERNAL_ERROR);
}

// ========== pack() layouts ==========

TEST_F(InstructionEncoderTest, PackFormatThreeFlags) {
    auto spec = lookupInstruction("LDA");
    ASSERT_TRUE(spec.has_value());

    AddressingDecision decision;
    decision.flags.n = true;
    decision.flags.i = true;
    decision.flags.x = true;
    decision.flags.p = true;
    decision.value = -1;
    decision.width = 12;

    auto bytes = InstructionEncoder::pack(*spec, decision);
    EXPECT_EQ(bytes, (std::vector<uint8_t>{0x03, 0xAF, 0xFF}));
}

TEST_F(InstructionEncoderTest, PackFormatFourLength) {
    auto spec = lookupInstruction("+STA");
    ASSERT_TRUE(spec.has_value());

    AddressingDecision decision;
    decision.flags.n = true;
    decision.flags.i = true;
    decision.flags.e = true;
    decision.value = 0x12345;
    decision.width = 20;

    auto bytes = InstructionEncoder::pack(*spec, decision);
    EXPECT_EQ(bytes, (std::vector<uint8_t>{0x0F, 0x11, 0x23, 0x45}));
}

// ========== BYTE ==========

TEST_F(InstructionEncoderTest, ByteCharacterLiteral) {
    EXPECT_EQ(encode("BYTE", "C'EOF'"), (std::vector<uint8_t>{0x45, 0x4F, 0x46}));
}

TEST_F(InstructionEncoderTest, ByteHexLiteral) {
    EXPECT_EQ(encode("BYTE", "X'F1'"), (std::vector<uint8_t>{0xF1}));
    EXPECT_EQ(encode("BYTE", "X'05a0'"), (std::vector<uint8_t>{0x05, 0xA0}));
}

TEST_F(InstructionEncoderTest, ByteOddHexDigits) {
    auto result = tryEncode("BYTE", "X'F'");
    EXPECT_FALSE(result.success);
    EXPECT_EQ(result.error_kind, ErrorKind::INVALID_OPERAND);
}

TEST_F(InstructionEncoderTest, ByteDecimal) {
    EXPECT_EQ(encode("BYTE", "255"), (std::vector<uint8_t>{0xFF}));
    EXPECT_EQ(encode("BYTE", "-1"), (std::vector<uint8_t>{0xFF}));

    auto result = tryEncode("BYTE", "256");
    EXPECT_FALSE(result.success);
    EXPECT_EQ(result.error_kind, ErrorKind::VALUE_OUT_OF_RANGE);
}

// ========== WORD ==========

TEST_F(InstructionEncoderTest, WordDecimal) {
    EXPECT_EQ(encode("WORD", "5"), (std::vector<uint8_t>{0x00, 0x00, 0x05}));
    EXPECT_EQ(encode("WORD", "4096"), (std::vector<uint8_t>{0x00, 0x10, 0x00}));
    EXPECT_EQ(encode("WORD", "-1"), (std::vector<uint8_t>{0xFF, 0xFF, 0xFF}));
}

TEST_F(InstructionEncoderTest, WordSymbolAddress) {
    symbols.define("TABLE", 0x1036, 3);
    EXPECT_EQ(encode("WORD", "TABLE"), (std::vector<uint8_t>{0x00, 0x10, 0x36}));
}

TEST_F(InstructionEncoderTest, WordLiteralRightAligned) {
    EXPECT_EQ(encode("WORD", "C'AB'"), (std::vector<uint8_t>{0x00, 0x41, 0x42}));
    EXPECT_EQ(encode("WORD", "X'F1'"), (std::vector<uint8_t>{0x00, 0x00, 0xF1}));
}

TEST_F(InstructionEncoderTest, WordErrors) {
    auto too_long = tryEncode("WORD", "X'01020304'");
    EXPECT_FALSE(too_long.success);
    EXPECT_EQ(too_long.error_kind, ErrorKind::INVALID_OPERAND);

    auto too_big = tryEncode("WORD", "16777216");
    EXPECT_FALSE(too_big.success);
    EXPECT_EQ(too_big.error_kind, ErrorKind::VALUE_OUT_OF_RANGE);

    auto undefined = tryEncode("WORD", "MISSING");
    EXPECT_FALSE(undefined.success);
    EXPECT_EQ(undefined.error_kind, ErrorKind::UNDEFINED_SYMBOL);
}
