/**
 * @file addressing_analyzer.h
 * @brief Operand analysis and addressing-mode selection for SIC/XE
 *
 * Given an instruction's operand text, the address it is placed at, the
 * symbol table and the base register, the analyzer picks the one legal way to
 * address the operand and computes the field value the encoder will pack.
 */

#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include "instruction_tables.h"
#include "../core/error.h"
#include "../parser/ast.h"
#include "../parser/operand_parser.h"
#include "../semantic/symbol_table.h"

namespace xeasm {

/**
 * @brief Which addressing prefix the operand used
 */
enum class AddressingMode {
    IMMEDIATE,  ///< #operand, n=0 i=1
    SIMPLE,     ///< operand, n=1 i=1
    INDIRECT    ///< @operand, n=1 i=0
};

/**
 * @brief How the field value relates to the target address
 */
enum class TargetRelation {
    NONE,           ///< Format 1/2, no address field
    PC_RELATIVE,    ///< disp = target - (address + length), p=1
    BASE_RELATIVE,  ///< disp = target - base, b=1
    ABSOLUTE,       ///< field holds the constant or address itself
    EXTENDED        ///< format 4, 20-bit address, e=1
};

/**
 * @brief The n,i,x,b,p,e bits of a format-3/4 instruction
 */
struct AddressingFlags {
    bool n = false;
    bool i = false;
    bool x = false;
    bool b = false;
    bool p = false;
    bool e = false;

    /** @brief Packs the flags as nixbpe, n in bit 5 */
    uint8_t bits() const {
        return static_cast<uint8_t>((n << 5) | (i << 4) | (x << 3) | (b << 2) | (p << 1) | e);
    }
};

/**
 * @brief Outcome of analyzing one operand
 *
 * For format 3/4 the encoder packs flags and value; for format 2 it packs
 * r1 and r2.
 */
struct AddressingDecision {
    AddressingMode mode = AddressingMode::SIMPLE;
    TargetRelation relation = TargetRelation::NONE;
    AddressingFlags flags;
    int32_t value = 0;      ///< Displacement, address or constant
    uint8_t width = 0;      ///< Field width in bits: 12, 20, or 0
    uint8_t r1 = 0;         ///< Format 2 high nibble
    uint8_t r2 = 0;         ///< Format 2 low nibble
};

/**
 * @brief Either a decision or the reason no legal addressing exists
 */
struct AddressingResult {
    AddressingDecision decision;
    bool success;
    ErrorKind error_kind;
    std::string error;

    AddressingResult(AddressingDecision d)
        : decision(d), success(true), error_kind(ErrorKind::NOTE) {}
    AddressingResult(ErrorKind kind, std::string err)
        : success(false), error_kind(kind), error(std::move(err)) {}
};

/**
 * @brief Selects addressing modes and validates operands
 *
 * **Format 3** (12-bit field), in this order:
 * 1. `#constant` (and plain constants below 4096) go in the field directly
 * 2. PC-relative if target - (address + 3) is in [-2048, 2047]
 * 3. Base-relative if a base is declared and target - base is in [0, 4095]
 * 4. Otherwise the operand can't be addressed in format 3
 *
 * **Format 4** (`+` marker): the 20-bit field holds the address or constant,
 * e=1, no relative computation.
 *
 * **Format 2**: register names or numbers in [0,15]; `r,n` shifts need
 * 0 < n < 17; `SVC n` needs 0 <= n < 16.
 *
 * Indexed addressing (`,X`) is only legal with simple addressing.
 */
class AddressingAnalyzer {
public:
    AddressingAnalyzer() = default;

    /**
     * @brief Provides the symbol table built by pass 1
     * @param symbols Complete symbol table (must outlive the analyzer's use)
     */
    void setSymbolTable(const SymbolTable* symbols) { m_symbol_table = symbols; }

    /**
     * @brief Sets or clears the base register
     * @param base Address declared by BASE, nullopt after NOBASE
     */
    void setBaseRegister(std::optional<uint32_t> base) { m_base = base; }

    /**
     * @brief Analyzes the operand of one instruction
     * @param spec Table entry for the instruction (format 1, 2 or 3)
     * @param record Statement being assembled
     * @param address Address the instruction is placed at
     * @return Decision, or the error kind explaining why none exists
     */
    AddressingResult analyze(const InstructionSpec& spec, const SourceRecord& record,
                             uint32_t address) const;

private:
    /** @brief Format 3/4 memory operands */
    AddressingResult analyzeMemory(const InstructionSpec& spec, const SourceRecord& record,
                                   uint32_t address) const;

    /** @brief Format 2 register, register pair, shift count and SVC operands */
    AddressingResult analyzeRegisters(const InstructionSpec& spec, const SourceRecord& record) const;

    /**
     * @brief Tries PC-relative, then base-relative addressing
     * @param decision Decision with mode flags already set
     * @param target Address the operand refers to
     * @param next_address Address of the following instruction
     * @param operand Operand text for messages
     */
    AddressingResult selectRelative(AddressingDecision decision, int64_t target,
                                    uint32_t next_address, const std::string& operand) const;

    /**
     * @brief Converts a register name or number
     * @param text Register operand ("A", "PC", "3")
     * @return Register number, or nullopt for an unknown name
     */
    static std::optional<int64_t> parseRegister(const std::string& text);

    const SymbolTable* m_symbol_table = nullptr;  ///< For resolving symbols
    std::optional<uint32_t> m_base;               ///< BASE register state
};

} // namespace xeasm
