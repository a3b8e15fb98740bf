/**
 * @file assembler.h
 * @brief Main interface to the xeasm SIC/XE assembler
 *
 * This file contains the primary API for embedding the assembler into other projects.
 * The Assembler class orchestrates the entire assembly process from source text to
 * machine code, handling both passes transparently.
 */

#pragma once

#include <string>
#include <vector>
#include <cstdint>
#include <map>
#include <memory>
#include <optional>
#include "error.h"
#include "assembly_context.h"
#include "../parser/ast.h"

namespace xeasm {

/**
 * @brief Represents a single line of assembled code with its metadata
 *
 * Each line tracks the original source, generated machine code, and its
 * address. Used for generating listings that show the correspondence
 * between source and output.
 */
struct AssembledLine {
    size_t source_line;                   ///< Line number in the original source file
    std::string source_text;              ///< Statement rebuilt from its fields
    std::vector<uint8_t> machine_code;    ///< Encoded bytes, empty for RESB/RESW and failed lines
    uint32_t address;                     ///< Location counter at the start of the line
    bool success;                         ///< Whether this line assembled without errors
    bool has_address;                     ///< False for START/END/BASE/NOBASE in listings
    std::vector<ErrorKind> diagnostics;   ///< Kinds of every error reported for this line
    std::string error_message;            ///< First error description if assembly failed

    AssembledLine()
        : source_line(0), address(0), success(false), has_address(true) {}
};

/**
 * @brief Complete result of an assembly operation
 *
 * Contains everything produced by the assembler: the memory image, a
 * line-by-line listing, resolved symbol addresses, and any errors or
 * warnings encountered during assembly.
 */
struct AssemblyResult {
    std::vector<uint8_t> binary;           ///< Memory image from program_start, reserved space zero-filled
    std::vector<AssembledLine> listing;    ///< Detailed line-by-line assembly output
    std::map<std::string, uint32_t> symbols; ///< Resolved symbols (labels -> addresses)
    std::vector<Error> errors;             ///< All errors and warnings from assembly
    bool success;                          ///< True only if assembly completed without errors
    AssemblyState state;                   ///< DONE, or FAILED on a fatal condition
    std::string program_name;              ///< Label on the START statement
    uint32_t program_start;                ///< Origin from START or setOrigin()
    uint32_t program_length;               ///< Bytes between program start and end
    std::optional<uint32_t> entry_point;   ///< Address named by END, if any

    AssemblyResult()
        : success(false), state(AssemblyState::IDLE), program_start(0), program_length(0) {}

    /**
     * @brief Formats the assembly listing as human-readable text
     * @return Multi-line string showing addresses, object code, source and errors for each line
     *
     * Object code longer than 4 bytes continues on extra lines that carry
     * the address of their first byte and no source text.
     */
    std::string getListingText() const;

    /**
     * @brief Formats the symbol table sorted by address
     * @return One "NAME: 01036" style line per symbol
     */
    std::string getSymbolTableText() const;

    /**
     * @brief Writes the assembled memory image to a file
     * @param filename Path to the output file
     * @return true if file was written successfully, false on I/O error
     */
    bool writeBinary(const std::string& filename) const;
};

/**
 * @brief Main entry point for the xeasm assembler
 *
 * This class provides a clean API for assembling SIC/XE code from strings, files,
 * or already-split source records. Each call runs both passes over a fresh
 * AssemblyContext, so one Assembler can be reused and several Assemblers can
 * run side by side.
 *
 * @code
 * xeasm::Assembler assembler;
 * assembler.requireProgramBounds(true);
 * auto result = assembler.assemble("COPY START 1000\nFIRST STL RETADR\nRETADR RESW 1\nEND FIRST");
 * if (result.success) {
 *     result.writeBinary("copy.bin");
 * }
 * @endcode
 */
class Assembler {
public:
    /**
     * @brief Constructs a new assembler with default settings
     *
     * The assembler starts with origin 0, lenient program bounds, and warnings enabled.
     */
    Assembler();

    ~Assembler();

    /**
     * @brief Assembles SIC/XE source code from a string
     *
     * Splits the text into records and runs pass 1 and pass 2.
     *
     * @param source The complete assembly source code as a string
     * @param filename Filename to display in error messages (doesn't need to be real)
     * @return AssemblyResult containing the image, listing, symbols, and any errors
     */
    AssemblyResult assemble(const std::string& source,
                           const std::string& filename = "<input>");

    /**
     * @brief Assembles records that were already split into fields
     *
     * Use when another front end does the line splitting.
     *
     * @param records Statements in source order
     * @return AssemblyResult containing the image, listing, symbols, and any errors
     */
    AssemblyResult assembleRecords(const std::vector<SourceRecord>& records);

    /**
     * @brief Assembles SIC/XE code from a file on disk
     *
     * Convenience method that reads the file and calls assemble(). The filename
     * is automatically used for error reporting.
     *
     * @param filepath Path to the assembly source file
     * @return AssemblyResult containing the image, listing, symbols, and any errors
     */
    AssemblyResult assembleFile(const std::string& filepath);

    /**
     * @brief Sets the start address used when START is missing or has no operand
     *
     * @param origin Address of the first statement
     */
    void setOrigin(uint32_t origin);

    /**
     * @brief Makes a missing START or END statement fatal
     *
     * @param require true to reject programs that are not delimited by START and END
     */
    void requireProgramBounds(bool require);

    /**
     * @brief Controls whether warnings are reported
     *
     * When enabled, the assembler reports issues that don't prevent assembly
     * (statements after END). Warnings appear in the errors
     * vector but don't set success=false.
     *
     * @param enable true to report warnings, false to suppress them
     */
    void enableWarnings(bool enable);

private:
    class Impl;
    std::unique_ptr<Impl> m_impl;  ///< PIMPL pattern hides implementation details
};

} // namespace xeasm
