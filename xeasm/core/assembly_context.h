/**
 * @file assembly_context.h
 * @brief Per-run state shared by pass 1 and pass 2
 *
 * Everything an assembly run mutates lives in one AssemblyContext owned by
 * that run. Nothing is global, so independent Assembler instances never
 * interfere with each other.
 */

#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>
#include "error.h"
#include "../semantic/symbol_table.h"

namespace xeasm {

/**
 * @brief Progress of one assembly run
 *
 * IDLE → PASS1_RUNNING → PASS1_COMPLETE → PASS2_RUNNING → DONE.
 * FAILED is only entered on a fatal condition; per-line errors never move
 * the run there.
 */
enum class AssemblyState {
    IDLE,
    PASS1_RUNNING,
    PASS1_COMPLETE,
    PASS2_RUNNING,
    DONE,
    FAILED
};

/**
 * @brief User-controlled settings for a run
 */
struct AssemblyOptions {
    uint32_t origin = 0;            ///< Start address when START is absent or has no operand
    bool require_bounds = false;    ///< Missing START or END is fatal when set
    bool warnings_enabled = true;   ///< Report warnings into the result
};

/**
 * @brief Address assignment for a single record
 *
 * Pass 1 fills one entry per record. Pass 2 recomputes the same address
 * independently and checks it against this entry.
 */
struct AddressInfo {
    size_t record_index = 0;                ///< Index in Program::records
    uint32_t address = 0;                   ///< Location counter when the record starts
    uint32_t size = 0;                      ///< Bytes the record occupies
    bool sized = true;                      ///< False if the record could not be sized
    bool ignored = false;                   ///< True for records after END
    std::vector<ErrorKind> diagnostics;     ///< Kinds pass 1 reported for this record
    std::string first_error;                ///< Message of the first pass-1 error
};

/**
 * @brief Owned state of one assembly run
 */
struct AssemblyContext {
    AssemblyOptions options;
    SymbolTable symbols;                    ///< Built by pass 1, read-only in pass 2
    std::vector<AddressInfo> addresses;     ///< Pass-1 address map, one per record
    ErrorReporter reporter;                 ///< Diagnostics from both passes
    AssemblyState state = AssemblyState::IDLE;

    uint32_t location_counter = 0;          ///< Current address
    uint32_t program_start = 0;             ///< Origin from START or options
    uint32_t program_end = 0;               ///< Address after the last statement
    std::string program_name;               ///< Label on the START line
    std::optional<uint32_t> entry_point;    ///< Resolved END operand
    std::optional<size_t> start_index;      ///< Record holding START
    std::optional<size_t> end_index;        ///< Record holding END

    explicit AssemblyContext(AssemblyOptions opts = AssemblyOptions())
        : options(opts)
    {
        reporter.setWarningsEnabled(options.warnings_enabled);
    }

    /** @brief Marks the run as stopped by a fatal condition */
    void fail(ErrorKind kind, std::string message, SourceLocation location) {
        reporter.fatal(kind, std::move(message), std::move(location));
        state = AssemblyState::FAILED;
    }
};

} // namespace xeasm
