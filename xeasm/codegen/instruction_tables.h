#pragma once

#include <cstdint>
#include <string>
#include <vector>
#include <optional>
#include <algorithm>
#include <cctype>

namespace xeasm {

/**
 * How a mnemonic is laid out in memory
 */
enum class EntryKind {
    // Format 1: [opcode:8]
    FORMAT1,

    // Format 2: [opcode:8][r1:4][r2:4]
    FORMAT2,

    // Format 3: [opcode:6][n][i][x][b][p][e][disp:12]
    // Format 4 is the same entry with the '+' marker: [..][e=1][address:20]
    FORMAT3,

    // Assembler directive, sized by its own rule
    DIRECTIVE,
};

/**
 * Operand pattern an instruction expects
 */
enum class OperandShape {
    NONE,            // FIX, RSUB, NOBASE
    MEMORY,          // LDA BUFFER, #3, @RETADR, TABLE,X
    REGISTER,        // CLEAR X
    REGISTER_PAIR,   // COMPR A,S
    REGISTER_COUNT,  // SHIFTL T,4
    SVC_NUMBER,      // SVC 5
    VALUE,           // directive operands: START 1000, BYTE C'EOF', RESW 3
};

/**
 * Directives, each with its own sizing rule
 */
enum class DirectiveKind {
    NONE,    // not a directive
    START,   // sets the origin, 0 bytes
    END,     // closes the program, 0 bytes
    BASE,    // declares the base register, 0 bytes
    NOBASE,  // clears the base register, 0 bytes
    BYTE,    // literal size
    WORD,    // 3 bytes
    RESB,    // count bytes
    RESW,    // count * 3 bytes
};

/// Size of a SIC/XE word in bytes
inline constexpr uint32_t WORD_SIZE = 3;

/// Highest address reachable with a 20-bit format-4 field
inline constexpr uint32_t MAX_ADDRESS = 0xFFFFF;

/**
 * Single row of the instruction/directive table
 */
struct InstructionSpec {
    std::string mnemonic;        // "LDA", "COMPR", "RESW", ...
    EntryKind kind;              // Layout family
    uint8_t opcode;              // Base opcode byte, low 2 bits clear
    OperandShape operands;       // Expected operand pattern
    DirectiveKind directive;     // Which directive, NONE for instructions

    InstructionSpec(
        std::string mn,
        EntryKind k,
        uint8_t op,
        OperandShape shape,
        DirectiveKind dir = DirectiveKind::NONE
    )
        : mnemonic(std::move(mn))
        , kind(k)
        , opcode(op)
        , operands(shape)
        , directive(dir)
    {}

    bool isDirective() const { return kind == EntryKind::DIRECTIVE; }
};

/**
  Master instruction table.
  Single source of truth for both passes: pass 1 sizes from `kind`,
  pass 2 encodes from `opcode` and `operands`.
*/
inline const std::vector<InstructionSpec> INSTRUCTION_TABLE = {
    // ========== Directives ==========
    {"START",  EntryKind::DIRECTIVE, 0x00, OperandShape::VALUE, DirectiveKind::START},
    {"END",    EntryKind::DIRECTIVE, 0x00, OperandShape::VALUE, DirectiveKind::END},
    {"BASE",   EntryKind::DIRECTIVE, 0x00, OperandShape::VALUE, DirectiveKind::BASE},
    {"NOBASE", EntryKind::DIRECTIVE, 0x00, OperandShape::NONE,  DirectiveKind::NOBASE},
    {"BYTE",   EntryKind::DIRECTIVE, 0x00, OperandShape::VALUE, DirectiveKind::BYTE},
    {"WORD",   EntryKind::DIRECTIVE, 0x00, OperandShape::VALUE, DirectiveKind::WORD},
    {"RESB",   EntryKind::DIRECTIVE, 0x00, OperandShape::VALUE, DirectiveKind::RESB},
    {"RESW",   EntryKind::DIRECTIVE, 0x00, OperandShape::VALUE, DirectiveKind::RESW},

    // ========== Format 1 ==========
    {"FIX",   EntryKind::FORMAT1, 0xC4, OperandShape::NONE},
    {"FLOAT", EntryKind::FORMAT1, 0xC0, OperandShape::NONE},
    {"HIO",   EntryKind::FORMAT1, 0xF4, OperandShape::NONE},
    {"NORM",  EntryKind::FORMAT1, 0xC8, OperandShape::NONE},
    {"SIO",   EntryKind::FORMAT1, 0xF0, OperandShape::NONE},
    {"TIO",   EntryKind::FORMAT1, 0xF8, OperandShape::NONE},

    // ========== Format 2 ==========
    {"ADDR",   EntryKind::FORMAT2, 0x90, OperandShape::REGISTER_PAIR},
    {"CLEAR",  EntryKind::FORMAT2, 0xB4, OperandShape::REGISTER},
    {"COMPR",  EntryKind::FORMAT2, 0xA0, OperandShape::REGISTER_PAIR},
    {"DIVR",   EntryKind::FORMAT2, 0x9C, OperandShape::REGISTER_PAIR},
    {"MULR",   EntryKind::FORMAT2, 0x98, OperandShape::REGISTER_PAIR},
    {"RMO",    EntryKind::FORMAT2, 0xAC, OperandShape::REGISTER_PAIR},
    {"SHIFTL", EntryKind::FORMAT2, 0xA4, OperandShape::REGISTER_COUNT},
    {"SHIFTR", EntryKind::FORMAT2, 0xA8, OperandShape::REGISTER_COUNT},
    {"SUBR",   EntryKind::FORMAT2, 0x94, OperandShape::REGISTER_PAIR},
    {"SVC",    EntryKind::FORMAT2, 0xB0, OperandShape::SVC_NUMBER},
    {"TIXR",   EntryKind::FORMAT2, 0xB8, OperandShape::REGISTER},

    // ========== Format 3/4 ==========
    {"ADD",   EntryKind::FORMAT3, 0x18, OperandShape::MEMORY},
    {"ADDF",  EntryKind::FORMAT3, 0x58, OperandShape::MEMORY},
    {"AND",   EntryKind::FORMAT3, 0x40, OperandShape::MEMORY},
    {"COMP",  EntryKind::FORMAT3, 0x28, OperandShape::MEMORY},
    {"COMPF", EntryKind::FORMAT3, 0x88, OperandShape::MEMORY},
    {"DIV",   EntryKind::FORMAT3, 0x24, OperandShape::MEMORY},
    {"DIVF",  EntryKind::FORMAT3, 0x64, OperandShape::MEMORY},
    {"J",     EntryKind::FORMAT3, 0x3C, OperandShape::MEMORY},
    {"JEQ",   EntryKind::FORMAT3, 0x30, OperandShape::MEMORY},
    {"JGT",   EntryKind::FORMAT3, 0x34, OperandShape::MEMORY},
    {"JLT",   EntryKind::FORMAT3, 0x38, OperandShape::MEMORY},
    {"JSUB",  EntryKind::FORMAT3, 0x48, OperandShape::MEMORY},
    {"LDA",   EntryKind::FORMAT3, 0x00, OperandShape::MEMORY},
    {"LDB",   EntryKind::FORMAT3, 0x68, OperandShape::MEMORY},
    {"LDCH",  EntryKind::FORMAT3, 0x50, OperandShape::MEMORY},
    {"LDF",   EntryKind::FORMAT3, 0x70, OperandShape::MEMORY},
    {"LDL",   EntryKind::FORMAT3, 0x08, OperandShape::MEMORY},
    {"LDS",   EntryKind::FORMAT3, 0x6C, OperandShape::MEMORY},
    {"LDT",   EntryKind::FORMAT3, 0x74, OperandShape::MEMORY},
    {"LDX",   EntryKind::FORMAT3, 0x04, OperandShape::MEMORY},
    {"LPS",   EntryKind::FORMAT3, 0xD0, OperandShape::MEMORY},
    {"MUL",   EntryKind::FORMAT3, 0x20, OperandShape::MEMORY},
    {"MULF",  EntryKind::FORMAT3, 0x60, OperandShape::MEMORY},
    {"OR",    EntryKind::FORMAT3, 0x44, OperandShape::MEMORY},
    {"RD",    EntryKind::FORMAT3, 0xD8, OperandShape::MEMORY},
    {"RSUB",  EntryKind::FORMAT3, 0x4C, OperandShape::NONE},
    {"SSK",   EntryKind::FORMAT3, 0xEC, OperandShape::MEMORY},
    {"STA",   EntryKind::FORMAT3, 0x0C, OperandShape::MEMORY},
    {"STB",   EntryKind::FORMAT3, 0x78, OperandShape::MEMORY},
    {"STCH",  EntryKind::FORMAT3, 0x54, OperandShape::MEMORY},
    {"STF",   EntryKind::FORMAT3, 0x80, OperandShape::MEMORY},
    {"STI",   EntryKind::FORMAT3, 0xD4, OperandShape::MEMORY},
    {"STL",   EntryKind::FORMAT3, 0x14, OperandShape::MEMORY},
    {"STS",   EntryKind::FORMAT3, 0x7C, OperandShape::MEMORY},
    {"STSW",  EntryKind::FORMAT3, 0xE8, OperandShape::MEMORY},
    {"STT",   EntryKind::FORMAT3, 0x84, OperandShape::MEMORY},
    {"STX",   EntryKind::FORMAT3, 0x10, OperandShape::MEMORY},
    {"SUB",   EntryKind::FORMAT3, 0x1C, OperandShape::MEMORY},
    {"SUBF",  EntryKind::FORMAT3, 0x5C, OperandShape::MEMORY},
    {"TD",    EntryKind::FORMAT3, 0xE0, OperandShape::MEMORY},
    {"TIX",   EntryKind::FORMAT3, 0x2C, OperandShape::MEMORY},
    {"WD",    EntryKind::FORMAT3, 0xDC, OperandShape::MEMORY},
};

/**
 * Finds the table row for a mnemonic.
 * Case-insensitive; a leading '+' is ignored here and validated by the caller.
 */
inline std::optional<InstructionSpec> lookupInstruction(const std::string& mnemonic) {
    std::string key = (!mnemonic.empty() && mnemonic[0] == '+') ? mnemonic.substr(1) : mnemonic;
    std::transform(key.begin(), key.end(), key.begin(), ::toupper);

    for (const auto& spec : INSTRUCTION_TABLE) {
        if (spec.mnemonic == key) {
            return spec;
        }
    }
    return std::nullopt;
}

/**
 * Register numbers used by format-2 instructions
 */
struct RegisterInfo {
    const char* name;
    uint8_t number;
};

inline const std::vector<RegisterInfo> REGISTER_TABLE = {
    {"A", 0}, {"X", 1}, {"L", 2}, {"B", 3}, {"S", 4},
    {"T", 5}, {"F", 6}, {"PC", 8}, {"SW", 9},
};

} // namespace xeasm
