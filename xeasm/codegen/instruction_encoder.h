/**
 * @file instruction_encoder.h
 * @brief Converts SIC/XE statements into machine code bytes
 *
 * The encoder asks the AddressingAnalyzer how an operand is addressed, then
 * packs opcode, flags and field into the instruction's byte layout. It also
 * produces the initialized bytes of BYTE and WORD directives.
 */

#pragma once

#include <vector>
#include <cstdint>
#include <optional>
#include "instruction_tables.h"
#include "addressing_analyzer.h"
#include "../parser/ast.h"
#include "../core/error.h"
#include "../semantic/symbol_table.h"

namespace xeasm {

/**
 * @brief Result of encoding a single statement
 *
 * Either contains the generated machine code bytes or an error explaining
 * why encoding failed. Success can be checked via the success flag.
 */
struct EncodedInstruction {
    std::vector<uint8_t> bytes;      ///< Machine code bytes (if successful)
    bool success;                    ///< True if encoding succeeded
    ErrorKind error_kind;            ///< Category of failure
    std::string error;               ///< Error message (if failed)
    AddressingDecision decision;     ///< How the operand was addressed

    EncodedInstruction() : success(false), error_kind(ErrorKind::NOTE) {}
    EncodedInstruction(std::vector<uint8_t> b)
        : bytes(std::move(b)), success(true), error_kind(ErrorKind::NOTE) {}
    EncodedInstruction(ErrorKind kind, std::string err)
        : success(false), error_kind(kind), error(std::move(err)) {}
};

/**
 * @brief Table-driven SIC/XE instruction encoder
 *
 * The four instruction layouts:
 *
 * **Format 1** (1 byte): `[opcode:8]`
 *
 * **Format 2** (2 bytes): `[opcode:8][r1:4][r2:4]`
 * - CLEAR X → B4 10
 * - COMPR A,S → A0 04
 *
 * **Format 3** (3 bytes): `[opcode:6][n][i][x][b][p][e=0][disp:12]`
 * - STL RETADR (PC-relative, disp 0x02D) → 17 20 2D
 * - STCH BUFFER,X (base-relative) → 57 C0 03
 *
 * **Format 4** (4 bytes): `[opcode:6][n][i][x][b=0][p=0][e=1][address:20]`
 * - +JSUB RDREC → 4B 10 10 36
 *
 * The encoder:
 * 1. Obtains an AddressingDecision from the analyzer
 * 2. Clears the opcode's low 2 bits and ORs in n,i
 * 3. Packs register nibbles or x,b,p,e and the 12/20-bit field
 * 4. Stores negative displacements in two's complement
 */
class InstructionEncoder {
public:
    InstructionEncoder() = default;

    /**
     * @brief Provides symbol table for resolving operands
     * @param symbols Symbol table from pass 1
     *
     * Must be called before encoding statements that reference symbols.
     */
    void setSymbolTable(const SymbolTable* symbols) {
        m_symbol_table = symbols;
        m_analyzer.setSymbolTable(symbols);
    }

    /**
     * @brief Sets the address of the statement being encoded
     * @param address Location counter at the start of the statement
     *
     * PC-relative displacements are calculated as target - (address + length).
     */
    void setCurrentAddress(uint32_t address) { m_current_address = address; }

    /**
     * @brief Sets or clears the base register used for base-relative addressing
     */
    void setBaseRegister(std::optional<uint32_t> base) { m_analyzer.setBaseRegister(base); }

    /**
     * @brief Encodes an instruction to machine code
     * @param spec Table entry (format 1, 2 or 3)
     * @param record Statement with mnemonic and operand
     * @return Encoded bytes, or the error that prevented encoding
     */
    EncodedInstruction encode(const InstructionSpec& spec, const SourceRecord& record) const;

    /**
     * @brief Encodes the initialized data of a BYTE or WORD directive
     * @param spec Table entry for BYTE or WORD
     * @param record Statement holding the literal
     * @return Data bytes, or the error that prevented encoding
     *
     * BYTE: C'..' one byte per character, X'..' one byte per hex pair,
     * decimal -128..255 one byte.
     * WORD: decimal (24-bit two's complement), symbol address, or a literal
     * of at most 3 bytes right-aligned.
     */
    EncodedInstruction encodeData(const InstructionSpec& spec, const SourceRecord& record) const;

    /**
     * @brief Packs an analyzed instruction into bytes
     * @param spec Table entry
     * @param decision Flags, field value and registers from the analyzer
     * @return 1 to 4 bytes, big-endian
     */
    static std::vector<uint8_t> pack(const InstructionSpec& spec, const AddressingDecision& decision);

private:
    EncodedInstruction encodeByte(const SourceRecord& record) const;
    EncodedInstruction encodeWord(const SourceRecord& record) const;

    AddressingAnalyzer m_analyzer;                ///< Picks addressing modes
    const SymbolTable* m_symbol_table = nullptr;  ///< For WORD symbol operands
    uint32_t m_current_address = 0;               ///< For PC-relative displacements
};

} // namespace xeasm
