/**
 * @file code_generator.h
 * @brief Pass 2: emits SIC/XE machine code
 *
 * The code generator is the final phase. It runs pass 1 through the semantic
 * analyzer, then walks the records a second time producing the bytes of every
 * statement, maintaining a listing that maps source lines to their encoding.
 */

#pragma once

#include <vector>
#include <cstdint>
#include "../parser/ast.h"
#include "../core/assembler.h"
#include "../core/assembly_context.h"
#include "../core/error.h"
#include "../semantic/semantic_analyzer.h"
#include "instruction_encoder.h"

namespace xeasm {

/**
 * @brief Converts source records into SIC/XE machine code
 *
 * It handles:
 * - **Instructions**: Delegates to InstructionEncoder for addressing and packing
 * - **BYTE/WORD**: Emits the initialized data
 * - **RESB/RESW**: Reserve space, no bytes
 * - **START/END/BASE/NOBASE**: Bookkeeping only
 *
 * A line that fails to encode is recorded with its diagnostics and the run
 * moves on to the next line; only fatal conditions stop it.
 */
class CodeGenerator {
public:
    CodeGenerator() = default;

    /**
     * @brief Assembles a program
     * @param program Records in source order
     * @param context Fresh run state; holds symbols and diagnostics afterwards
     * @return Complete assembly result with image, listing, symbols, and any errors
     *
     * Runs pass 1 first. If pass 1 hits a fatal condition, pass 2 is skipped
     * and the result carries state FAILED.
     */
    AssemblyResult generate(const Program& program, AssemblyContext& context);

private:
    /**
     * @brief Processes a single record during pass 2
     * @param record Statement to process
     * @param info Pass-1 address entry for the record
     * @param context Run state
     * @return false if the run must stop
     */
    bool generateStatement(const SourceRecord& record, const AddressInfo& info, AssemblyContext& context);

    /**
     * @brief Applies a directive's side effect and emits its data
     * @param spec Directive table entry
     * @param record Statement to process
     * @param line Listing line to fill
     * @param context Run state
     */
    void processDirective(const InstructionSpec& spec, const SourceRecord& record,
                          AssembledLine& line, AssemblyContext& context);

    /**
     * @brief Encodes an instruction into the listing line
     */
    void processInstruction(const InstructionSpec& spec, const SourceRecord& record,
                            AssembledLine& line, AssemblyContext& context);

    /** @brief BASE: resolves the operand and loads the base register */
    void processBase(const SourceRecord& record, AssembledLine& line, AssemblyContext& context);

    /** @brief END: resolves the entry point */
    void processEnd(const SourceRecord& record, AssembledLine& line, AssemblyContext& context);

    /** @brief Records a pass-2 error against a line */
    void lineError(AssembledLine& line, ErrorKind kind, const std::string& message,
                   const SourceLocation& loc, AssemblyContext& context);

    /** @brief Builds the memory image from the listing */
    std::vector<uint8_t> buildImage(const AssemblyContext& context) const;

    SemanticAnalyzer m_semantic_analyzer;  ///< Pass 1
    InstructionEncoder m_encoder;          ///< Handles SIC/XE instruction encoding
    std::vector<AssembledLine> m_listing;  ///< Source-to-binary mapping
};

} // namespace xeasm
