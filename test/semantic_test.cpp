#include <gtest/gtest.h>
#include "xeasm/lexer/lexer.h"
#include "xeasm/semantic/semantic_analyzer.h"
#include "xeasm/semantic/symbol_table.h"

using namespace xeasm;

class SymbolTableTest : public ::testing::Test {
protected:
    SymbolTable symbols;
};

TEST_F(SymbolTableTest, DefineAndResolve) {
    EXPECT_TRUE(symbols.define("LOOP", 0x1003, 4));
    auto addr = symbols.resolve("LOOP");
    ASSERT_TRUE(addr.has_value());
    EXPECT_EQ(*addr, 0x1003u);
}

TEST_F(SymbolTableTest, DuplicateKeepsFirstBinding) {
    EXPECT_TRUE(symbols.define("LOOP", 0x0000, 3));
    EXPECT_FALSE(symbols.define("LOOP", 0x0010, 9));

    auto symbol = symbols.lookup("LOOP");
    ASSERT_TRUE(symbol.has_value());
    EXPECT_EQ(symbol->address, 0x0000u);
    EXPECT_EQ(symbol->definition_line, 3u);
}

TEST_F(SymbolTableTest, UnknownSymbol) {
    EXPECT_FALSE(symbols.resolve("MISSING").has_value());
    EXPECT_FALSE(symbols.exists("MISSING"));
}

TEST_F(SymbolTableTest, CaseSensitive) {
    symbols.define("Alpha", 3, 1);
    EXPECT_TRUE(symbols.exists("Alpha"));
    EXPECT_FALSE(symbols.exists("ALPHA"));
}

TEST_F(SymbolTableTest, SortedByAddress) {
    symbols.define("ZETA", 0x30, 1);
    symbols.define("ALPHA", 0x10, 2);
    symbols.define("BETA", 0x10, 3);

    auto sorted = symbols.sortedByAddress();
    ASSERT_EQ(sorted.size(), 3u);
    EXPECT_EQ(sorted[0].name, "ALPHA");
    EXPECT_EQ(sorted[1].name, "BETA");
    EXPECT_EQ(sorted[2].name, "ZETA");
}

TEST_F(SymbolTableTest, Clear) {
    symbols.define("A1", 0, 1);
    symbols.clear();
    EXPECT_EQ(symbols.size(), 0u);
}

class SemanticAnalyzerTest : public ::testing::Test {
protected:
    Program parse(const std::string& source) {
        Lexer lexer(source);
        Program program;
        program.records = lexer.tokenize();
        return program;
    }

    bool analyze(const std::string& source, AssemblyContext& context) {
        Program program = parse(source);
        SemanticAnalyzer analyzer;
        return analyzer.analyze(program, context);
    }

    uint32_t addressOf(const AssemblyContext& context, const std::string& name) {
        auto addr = context.symbols.resolve(name);
        EXPECT_TRUE(addr.has_value()) << name << " is not defined";
        return addr.value_or(0);
    }
};

TEST_F(SemanticAnalyzerTest, EmptyProgram) {
    AssemblyContext context;
    EXPECT_TRUE(analyze("", context));
    EXPECT_EQ(context.state, AssemblyState::PASS1_COMPLETE);
    EXPECT_EQ(context.symbols.size(), 0u);
}

TEST_F(SemanticAnalyzerTest, FormatSizes) {
    std::string source =
        "ONE     FIX\n"
        "TWO     CLEAR   X\n"
        "THREE   LDA     ALPHA\n"
        "FOUR   +LDA     ALPHA\n"
        "ALPHA   RESW    1\n";

    AssemblyContext context;
    ASSERT_TRUE(analyze(source, context));
    EXPECT_EQ(addressOf(context, "ONE"), 0u);
    EXPECT_EQ(addressOf(context, "TWO"), 1u);
    EXPECT_EQ(addressOf(context, "THREE"), 3u);
    EXPECT_EQ(addressOf(context, "FOUR"), 6u);
    EXPECT_EQ(addressOf(context, "ALPHA"), 10u);
    EXPECT_EQ(context.program_end, 13u);
}

TEST_F(SemanticAnalyzerTest, StartSetsOriginAndName) {
    std::string source =
        "COPY    START   1000\n"
        "FIRST   STL     RETADR\n"
        "RETADR  RESW    1\n"
        "        END     FIRST\n";

    AssemblyContext context;
    ASSERT_TRUE(analyze(source, context));
    EXPECT_EQ(context.program_start, 0x1000u);
    EXPECT_EQ(context.program_name, "COPY");
    EXPECT_EQ(addressOf(context, "COPY"), 0x1000u);
    EXPECT_EQ(addressOf(context, "FIRST"), 0x1000u);
    EXPECT_EQ(addressOf(context, "RETADR"), 0x1003u);
    EXPECT_EQ(context.program_end, 0x1006u);
}

TEST_F(SemanticAnalyzerTest, OriginOptionWithoutStart) {
    AssemblyOptions options;
    options.origin = 0x2000;
    AssemblyContext context(options);

    ASSERT_TRUE(analyze("LOOP    J       LOOP\n", context));
    EXPECT_EQ(addressOf(context, "LOOP"), 0x2000u);
}

TEST_F(SemanticAnalyzerTest, ReserveSizes) {
    std::string source =
        "A1      RESB    10\n"
        "A2      RESW    3\n"
        "A3      RESB    X'10'\n"
        "A4      BYTE    C'EOF'\n"
        "A5      BYTE    X'F1'\n"
        "A6      WORD    5\n"
        "A7      BYTE    0\n";

    AssemblyContext context;
    ASSERT_TRUE(analyze(source, context));
    EXPECT_EQ(addressOf(context, "A1"), 0u);
    EXPECT_EQ(addressOf(context, "A2"), 10u);
    EXPECT_EQ(addressOf(context, "A3"), 19u);
    EXPECT_EQ(addressOf(context, "A4"), 35u);
    EXPECT_EQ(addressOf(context, "A5"), 38u);
    EXPECT_EQ(addressOf(context, "A6"), 39u);
    EXPECT_EQ(addressOf(context, "A7"), 42u);
    EXPECT_EQ(context.program_end, 43u);
    EXPECT_FALSE(context.reporter.hasErrors());
}

TEST_F(SemanticAnalyzerTest, ZeroSizeDirectives) {
    std::string source =
        "FIRST   LDB    #BUF\n"
        "        BASE    BUF\n"
        "        NOBASE\n"
        "BUF     RESB    1\n";

    AssemblyContext context;
    ASSERT_TRUE(analyze(source, context));
    EXPECT_EQ(addressOf(context, "BUF"), 3u);
}

TEST_F(SemanticAnalyzerTest, ResWithNonCountOperand) {
    std::string source =
        "BAD     RESW    ABC\n"
        "NEXT    RSUB\n";

    AssemblyContext context;
    ASSERT_TRUE(analyze(source, context));
    EXPECT_EQ(context.reporter.countOf(ErrorKind::INVALID_RESERVE_OPERAND), 1u);
    EXPECT_EQ(context.state, AssemblyState::PASS1_COMPLETE);

    // The bad reservation occupies nothing, the label is still bound
    EXPECT_EQ(addressOf(context, "BAD"), 0u);
    EXPECT_EQ(addressOf(context, "NEXT"), 0u);

    ASSERT_EQ(context.addresses.size(), 2u);
    ASSERT_EQ(context.addresses[0].diagnostics.size(), 1u);
    EXPECT_EQ(context.addresses[0].diagnostics[0], ErrorKind::INVALID_RESERVE_OPERAND);
    EXPECT_FALSE(context.addresses[0].first_error.empty());
    EXPECT_TRUE(context.addresses[1].diagnostics.empty());
}

TEST_F(SemanticAnalyzerTest, ResbWithCharacterOperand) {
    AssemblyContext context;
    ASSERT_TRUE(analyze("BAD     RESB    C'AB'\n", context));
    EXPECT_EQ(context.reporter.countOf(ErrorKind::INVALID_RESERVE_OPERAND), 1u);
}

TEST_F(SemanticAnalyzerTest, DuplicateSymbol) {
    std::string source =
        "LOOP    LDA     #1\n"
        "LOOP    LDA     #2\n";

    AssemblyContext context;
    ASSERT_TRUE(analyze(source, context));
    EXPECT_EQ(context.reporter.countOf(ErrorKind::DUPLICATE_SYMBOL), 1u);
    EXPECT_EQ(addressOf(context, "LOOP"), 0u);
    EXPECT_EQ(context.program_end, 6u);

    const auto& errors = context.reporter.getErrors();
    ASSERT_FALSE(errors.empty());
    EXPECT_EQ(errors[0].location.line, 2u);
    EXPECT_NE(errors[0].message.find("line 1"), std::string::npos);
}

TEST_F(SemanticAnalyzerTest, UnknownMnemonic) {
    std::string source =
        "HERE    FOO     BAR\n"
        "NEXT    RSUB\n";

    AssemblyContext context;
    ASSERT_TRUE(analyze(source, context));
    EXPECT_EQ(context.reporter.countOf(ErrorKind::UNKNOWN_MNEMONIC), 1u);
    EXPECT_EQ(addressOf(context, "HERE"), 0u);
    EXPECT_EQ(addressOf(context, "NEXT"), 0u);
    EXPECT_FALSE(context.addresses[0].sized);
}

TEST_F(SemanticAnalyzerTest, ExtendedMarkerOnFormat2) {
    AssemblyContext context;
    ASSERT_TRUE(analyze("       +CLEAR   X\n", context));
    EXPECT_EQ(context.reporter.countOf(ErrorKind::INVALID_OPERAND), 1u);
}

TEST_F(SemanticAnalyzerTest, StartMustBeFirst) {
    std::string source =
        "        LDA     #1\n"
        "COPY    START   1000\n";

    AssemblyContext context;
    EXPECT_FALSE(analyze(source, context));
    EXPECT_EQ(context.state, AssemblyState::FAILED);
    EXPECT_TRUE(context.reporter.hasFatal());
    EXPECT_EQ(context.reporter.countOf(ErrorKind::PROGRAM_BOUNDS), 1u);
}

TEST_F(SemanticAnalyzerTest, SecondStartIsFatal) {
    std::string source =
        "COPY    START   1000\n"
        "AGAIN   START   2000\n";

    AssemblyContext context;
    EXPECT_FALSE(analyze(source, context));
    EXPECT_EQ(context.state, AssemblyState::FAILED);
}

TEST_F(SemanticAnalyzerTest, MalformedStartOperand) {
    AssemblyContext context;
    EXPECT_FALSE(analyze("COPY    START   XYZ\n", context));
    EXPECT_EQ(context.state, AssemblyState::FAILED);
}

TEST_F(SemanticAnalyzerTest, AddressSpaceExceeded) {
    std::string source =
        "COPY    START   FFFF0\n"
        "BIG     RESB    100\n";

    AssemblyContext context;
    EXPECT_FALSE(analyze(source, context));
    EXPECT_EQ(context.state, AssemblyState::FAILED);
    EXPECT_EQ(context.reporter.countOf(ErrorKind::PROGRAM_BOUNDS), 1u);
}

TEST_F(SemanticAnalyzerTest, StrictBoundsRequireStartAndEnd) {
    AssemblyOptions options;
    options.require_bounds = true;

    AssemblyContext no_start(options);
    EXPECT_FALSE(analyze("        RSUB\n        END\n", no_start));
    EXPECT_EQ(no_start.state, AssemblyState::FAILED);

    AssemblyContext no_end(options);
    EXPECT_FALSE(analyze("COPY    START   0\n        RSUB\n", no_end));
    EXPECT_EQ(no_end.state, AssemblyState::FAILED);

    AssemblyContext complete(options);
    EXPECT_TRUE(analyze("COPY    START   0\n        RSUB\n        END\n", complete));
    EXPECT_EQ(complete.state, AssemblyState::PASS1_COMPLETE);
}

TEST_F(SemanticAnalyzerTest, MissingEndIsSilentWhenLenient) {
    AssemblyContext context;
    EXPECT_TRUE(analyze("        RSUB\n", context));
    EXPECT_TRUE(context.reporter.getErrors().empty());
}

TEST_F(SemanticAnalyzerTest, StatementsAfterEndIgnored) {
    std::string source =
        "        RSUB\n"
        "        END\n"
        "LATE    RESW    1\n"
        "LATER   RESW    1\n";

    AssemblyContext context;
    ASSERT_TRUE(analyze(source, context));
    EXPECT_FALSE(context.symbols.exists("LATE"));
    EXPECT_FALSE(context.symbols.exists("LATER"));
    EXPECT_EQ(context.program_end, 3u);
    EXPECT_TRUE(context.addresses[2].ignored);
    EXPECT_TRUE(context.addresses[3].ignored);

    // One warning for the whole tail
    const auto& errors = context.reporter.getErrors();
    ASSERT_EQ(errors.size(), 1u);
    EXPECT_EQ(errors[0].severity, ErrorSeverity::WARNING);
    EXPECT_FALSE(context.reporter.hasErrors());
}

TEST_F(SemanticAnalyzerTest, WarningsCanBeDisabled) {
    AssemblyOptions options;
    options.warnings_enabled = false;
    AssemblyContext context(options);

    ASSERT_TRUE(analyze("        END\n        RSUB\n", context));
    EXPECT_TRUE(context.reporter.getErrors().empty());
}

TEST_F(SemanticAnalyzerTest, CalculateSizeMatchesFormats) {
    SourceRecord plain(SourceLocation(), "", "LDA", "ALPHA");
    SourceRecord extended(SourceLocation(), "", "+LDA", "ALPHA");
    SourceRecord reg(SourceLocation(), "", "COMPR", "A,S");

    EXPECT_EQ(SemanticAnalyzer::calculateSize(plain, *lookupInstruction("LDA")).size, 3u);
    EXPECT_EQ(SemanticAnalyzer::calculateSize(extended, *lookupInstruction("+LDA")).size, 4u);
    EXPECT_EQ(SemanticAnalyzer::calculateSize(reg, *lookupInstruction("COMPR")).size, 2u);
}

TEST_F(SemanticAnalyzerTest, ReserveOperandWithSurroundingBlanks) {
    SourceRecord hex_count(SourceLocation(), "BUF", "RESB", " X'10'");
    SourceRecord word_count(SourceLocation(), "TAB", "RESW", "\t4 ");
    SourceRecord chars(SourceLocation(), "BAD", "RESB", "  C'AB'");

    SizeResult hex_size = SemanticAnalyzer::calculateSize(hex_count, *lookupInstruction("RESB"));
    EXPECT_TRUE(hex_size.success);
    EXPECT_EQ(hex_size.size, 16u);

    SizeResult word_size = SemanticAnalyzer::calculateSize(word_count, *lookupInstruction("RESW"));
    EXPECT_TRUE(word_size.success);
    EXPECT_EQ(word_size.size, 12u);

    SizeResult char_size = SemanticAnalyzer::calculateSize(chars, *lookupInstruction("RESB"));
    EXPECT_FALSE(char_size.success);
    EXPECT_EQ(char_size.error_kind, ErrorKind::INVALID_RESERVE_OPERAND);
}
