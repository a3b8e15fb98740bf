/**
 * @file ast.h
 * @brief Structured source records consumed by both assembler passes
 *
 * SIC/XE source is line oriented, so the syntax tree is flat: one
 * SourceRecord per statement, each holding the label, mnemonic and raw operand
 * text. Operand text is broken down further by the OperandParser when the
 * passes need it.
 */

#pragma once

#include <string>
#include <vector>
#include <cstdint>
#include "../lexer/source_location.h"

namespace xeasm {

/**
 * @brief One statement of SIC/XE source
 *
 * Produced once by the lexer (or built directly by a caller that does its
 * own line splitting) and read by pass 1 and pass 2. Never mutated after
 * construction.
 *
 * @code
 * CLOOP   +JSUB   RDREC
 * // label = "CLOOP", mnemonic = "+JSUB", operand = "RDREC"
 * @endcode
 */
struct SourceRecord {
    SourceLocation location;   ///< Where the statement starts
    std::string label;         ///< Label defined by this line, empty if none
    std::string mnemonic;      ///< Instruction or directive, may carry a leading '+'
    std::string operand;       ///< Raw operand text, empty if none

    SourceRecord() = default;

    SourceRecord(SourceLocation loc, std::string lbl, std::string mnem, std::string op)
        : location(std::move(loc))
        , label(std::move(lbl))
        , mnemonic(std::move(mnem))
        , operand(std::move(op))
    {}

    /** @brief Whether the mnemonic carries the format-4 extension marker */
    bool isExtended() const {
        return !mnemonic.empty() && mnemonic[0] == '+';
    }

    /** @brief Mnemonic with any leading '+' removed */
    std::string baseMnemonic() const {
        return isExtended() ? mnemonic.substr(1) : mnemonic;
    }

    /**
     * @brief Rebuilds the statement as text for listings
     * @return Label, mnemonic and operand separated by tabs
     */
    std::string text() const {
        return label + "\t" + mnemonic + (operand.empty() ? "" : "\t" + operand);
    }
};

/**
 * @brief Root of a parsed source file
 *
 * Contains all statements in the order they appear in source. Comment and
 * blank lines are not represented.
 */
struct Program {
    std::vector<SourceRecord> records;  ///< All statements in source order
};

} // namespace xeasm
