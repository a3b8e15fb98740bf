/**
 * @file semantic_analyzer.h
 * @brief Pass 1: location counter and symbol table construction
 *
 * The semantic analyzer walks the records once, assigns an address to every
 * statement, and defines every label in the symbol table. Instruction sizes
 * are fixed by format and operand syntax, so a single walk is enough; pass 2
 * recomputes the same sizes with calculateSize() and must agree.
 */

#pragma once

#include "symbol_table.h"
#include "../parser/ast.h"
#include "../core/error.h"
#include "../core/assembly_context.h"
#include "../codegen/instruction_tables.h"
#include <string>

namespace xeasm {

/**
 * @brief Size of one record, or the reason it could not be sized
 */
struct SizeResult {
    uint32_t size;               ///< Bytes the record occupies (0 on failure)
    bool success;                ///< True if the operand allowed sizing
    ErrorKind error_kind;        ///< Category of failure
    std::string error;           ///< Error message (if failed)

    SizeResult(uint32_t s) : size(s), success(true), error_kind(ErrorKind::NOTE) {}
    SizeResult(ErrorKind kind, std::string err)
        : size(0), success(false), error_kind(kind), error(std::move(err)) {}
};

/**
 * @brief Performs pass 1 over a program
 *
 * **Location counter**
 * - Starts at the START operand (hexadecimal) or the configured origin
 * - Advances by 1/2/3/4 bytes for instruction formats 1/2/3/4
 * - Advances by count or count × 3 for RESB/RESW, and by the literal size
 *   for BYTE/WORD
 * - Stays put for START, END, BASE and NOBASE
 *
 * **Symbol table**
 * - Every label is defined at the address of its statement
 * - A second definition reports DuplicateSymbol and keeps the first value
 *
 * **Program bounds**
 * - START after another statement, a second START, or a bad START operand
 *   is fatal
 * - Running past the 20-bit address space is fatal
 * - With strict bounds, a missing START or END is fatal
 * - Records after END are ignored
 */
class SemanticAnalyzer {
public:
    SemanticAnalyzer() = default;

    /**
     * @brief Runs pass 1
     * @param program Records to analyze
     * @param context Run state; receives symbols, the address map and diagnostics
     * @return false only if a fatal condition stopped the pass
     *
     * Per-line errors are reported into the context and do not stop the pass.
     */
    bool analyze(const Program& program, AssemblyContext& context);

    /**
     * @brief Computes how many bytes a record occupies
     * @param record Statement to size
     * @param spec Table entry for the record's mnemonic
     * @return Size, or the reason the operand can't be sized
     *
     * Shared with pass 2 so both passes advance the location counter the
     * same way.
     */
    static SizeResult calculateSize(const SourceRecord& record, const InstructionSpec& spec);

private:
    /**
     * @brief Handles the START directive
     * @return false if START is misplaced or malformed (fatal)
     */
    bool processStart(const SourceRecord& record, size_t index, AssemblyContext& context);

    /**
     * @brief Calculates the size of a RESB/RESW reservation
     * @param record Statement holding the count
     * @param element_size 1 for RESB, 3 for RESW
     */
    static SizeResult calculateReserveSize(const SourceRecord& record, uint32_t element_size);

    /**
     * @brief Calculates the size of BYTE data
     */
    static SizeResult calculateByteSize(const SourceRecord& record);

    /**
     * @brief Reports a per-line error and tags the record with its kind
     */
    void error(AssemblyContext& context, AddressInfo& info, ErrorKind kind,
               const std::string& message, const SourceLocation& loc);

    /** @brief Defines a record's label, reporting duplicates */
    void defineLabel(const SourceRecord& record, AddressInfo& info, AssemblyContext& context);

    bool m_seen_statement = false;   ///< Any statement other than START processed
    bool m_warned_after_end = false; ///< Only one warning for trailing statements
};

} // namespace xeasm
