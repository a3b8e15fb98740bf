/**
 * @file error.h
 * @brief Error reporting infrastructure for the assembler
 *
 * Provides a unified system for collecting and formatting errors, warnings, and
 * fatal errors throughout the assembly process. Both passes use this to report
 * issues against the source line that caused them.
 */

#pragma once

#include <string>
#include <utility>
#include <vector>
#include "../lexer/source_location.h"

namespace xeasm {

/**
 * @brief Severity level of a diagnostic message
 *
 * Warnings allow assembly to continue, errors prevent successful output,
 * and fatal errors immediately terminate processing.
 */
enum class ErrorSeverity {
    WARNING,  ///< Non-critical issue that doesn't prevent assembly
    ERROR,    ///< Problem that prevents generating valid machine code
    FATAL     ///< Critical failure that stops further processing
};

/**
 * @brief Tag identifying what kind of problem a diagnostic describes
 *
 * Every diagnostic carries one of these so callers (listing writers, tests)
 * can react to the category without parsing message text.
 */
enum class ErrorKind {
    INVALID_RESERVE_OPERAND,        ///< RESB/RESW given a character or non-count operand
    SVC_OPERAND_OUT_OF_RANGE,       ///< SVC n outside [0,16)
    REGISTER_OUT_OF_RANGE,          ///< Register number outside [0,16)
    OPERAND_OUT_OF_RANGE,           ///< r,n form outside 0<n<17, 0<=r<16
    NO_BASE_DECLARED,               ///< Base-relative needed but no BASE in effect
    ADDRESSING_MODE_UNAVAILABLE,    ///< Neither PC nor base relative fits
    INDEXED_WITH_IMMEDIATE_OR_INDIRECT,
    DUPLICATE_SYMBOL,
    UNDEFINED_SYMBOL,
    UNKNOWN_MNEMONIC,
    INVALID_OPERAND,                ///< Operand text that can't be parsed for its instruction
    VALUE_OUT_OF_RANGE,             ///< Constant too wide for its field
    PROGRAM_BOUNDS,                 ///< START/END missing or misplaced (fatal)
    INTERNAL_ERROR,                 ///< Pass 1 and pass 2 disagree on an address
    IO_ERROR,                       ///< Source file could not be read
    NOTE                            ///< Warnings that carry no specific category
};

/**
 * @brief Short stable name for an error kind
 * @return Identifier like "UndefinedSymbol", used in listings
 */
inline const char* errorKindName(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::INVALID_RESERVE_OPERAND:            return "InvalidReserveOperand";
        case ErrorKind::SVC_OPERAND_OUT_OF_RANGE:           return "SvcOperandOutOfRange";
        case ErrorKind::REGISTER_OUT_OF_RANGE:              return "RegisterOutOfRange";
        case ErrorKind::OPERAND_OUT_OF_RANGE:               return "OperandOutOfRange";
        case ErrorKind::NO_BASE_DECLARED:                   return "NoBaseDeclared";
        case ErrorKind::ADDRESSING_MODE_UNAVAILABLE:        return "AddressingModeUnavailable";
        case ErrorKind::INDEXED_WITH_IMMEDIATE_OR_INDIRECT: return "IndexedWithImmediateOrIndirect";
        case ErrorKind::DUPLICATE_SYMBOL:                   return "DuplicateSymbol";
        case ErrorKind::UNDEFINED_SYMBOL:                   return "UndefinedSymbol";
        case ErrorKind::UNKNOWN_MNEMONIC:                   return "UnknownMnemonic";
        case ErrorKind::INVALID_OPERAND:                    return "InvalidOperand";
        case ErrorKind::VALUE_OUT_OF_RANGE:                 return "ValueOutOfRange";
        case ErrorKind::PROGRAM_BOUNDS:                     return "ProgramBounds";
        case ErrorKind::INTERNAL_ERROR:                     return "InternalError";
        case ErrorKind::IO_ERROR:                           return "IoError";
        case ErrorKind::NOTE:                               return "Note";
    }
    return "Unknown";
}

/**
 * @brief A single diagnostic message with location context
 *
 * Captures everything needed to present a helpful error to the user:
 * what went wrong, where it happened, and how serious it is.
 */
struct Error {
    ErrorKind kind;                ///< Category of the problem
    std::string message;           ///< Human-readable description of the issue
    SourceLocation location;       ///< Position in source where error occurred
    ErrorSeverity severity;        ///< How serious this diagnostic is

    Error() : kind(ErrorKind::NOTE), message(""), location(), severity(ErrorSeverity::ERROR) {}

    Error(ErrorKind k, std::string msg, SourceLocation loc, ErrorSeverity sev = ErrorSeverity::ERROR)
        : kind(k), message(std::move(msg)), location(loc), severity(sev) {}

    /**
     * @brief Formats error in standard compiler format
     * @return String like "copy.asm:10:1: error: undefined symbol 'BUFFER'"
     *
     * Output format matches GCC/Clang style for IDE integration.
     */
    std::string format() const {
        std::string severity_str;
        switch (severity) {
            case ErrorSeverity::WARNING: severity_str = "warning"; break;
            case ErrorSeverity::ERROR:   severity_str = "error"; break;
            case ErrorSeverity::FATAL:   severity_str = "fatal error"; break;
        }
        return location.format() + ": " + severity_str + ": " + message;
    }

    /**
     * @brief Checks if this diagnostic prevents successful assembly
     * @return true for ERROR or FATAL, false for WARNING
     */
    bool isError() const {
        return severity == ErrorSeverity::ERROR || severity == ErrorSeverity::FATAL;
    }
};

/**
 * @brief Collects errors and warnings during an assembly run
 *
 * Both passes use one ErrorReporter to accumulate diagnostics without
 * throwing exceptions. This allows the assembler to report every bad line
 * in one run rather than stopping at the first problem.
 *
 * The reporter tracks whether any true errors (not just warnings) have
 * occurred, and separately whether a fatal error has stopped the run.
 */
class ErrorReporter {
public:
    ErrorReporter() : m_has_errors(false), m_has_fatal(false), m_warnings_enabled(true) {}

    /**
     * @brief Reports a recoverable error that prevents successful assembly
     *
     * Use for problems like undefined symbols or illegal addressing modes.
     * Assembly continues with the next line.
     *
     * @param kind Category of the error
     * @param message Description of what went wrong
     * @param location Where in the source the error occurred
     */
    void error(ErrorKind kind, std::string message, SourceLocation location) {
        m_errors.emplace_back(kind, std::move(message), location, ErrorSeverity::ERROR);
        m_has_errors = true;
    }

    /**
     * @brief Reports a potential issue that doesn't prevent assembly
     *
     * Dropped silently when warnings are disabled.
     *
     * @param message Description of the potential issue
     * @param location Where in the source the warning originated
     */
    void warning(std::string message, SourceLocation location) {
        if (!m_warnings_enabled) {
            return;
        }
        m_errors.emplace_back(ErrorKind::NOTE, std::move(message), location, ErrorSeverity::WARNING);
    }

    /**
     * @brief Reports an unrecoverable error that stops all processing
     *
     * Reserved for program-bounds problems and internal inconsistencies.
     * Most errors should be ERROR, not FATAL.
     *
     * @param kind Category of the error
     * @param message Description of the fatal problem
     * @param location Where in the source it was detected
     */
    void fatal(ErrorKind kind, std::string message, SourceLocation location) {
        m_errors.emplace_back(kind, std::move(message), location, ErrorSeverity::FATAL);
        m_has_errors = true;
        m_has_fatal = true;
    }

    /**
     * @brief Checks if any errors (not warnings) have been reported
     * @return true if error() or fatal() was called at least once
     */
    bool hasErrors() const {
        return m_has_errors;
    }

    /** @brief Checks if a fatal error stopped the run */
    bool hasFatal() const {
        return m_has_fatal;
    }

    /**
     * @brief Gets all collected diagnostics
     * @return Vector containing errors and warnings in the order they were reported
     */
    const std::vector<Error>& getErrors() const {
        return m_errors;
    }

    void setWarningsEnabled(bool enable) {
        m_warnings_enabled = enable;
    }

    /**
     * @brief Resets the reporter to initial empty state
     *
     * Call between assembly runs to reuse the same reporter instance.
     */
    void clear() {
        m_errors.clear();
        m_has_errors = false;
        m_has_fatal = false;
    }

    /**
     * @brief Counts actual errors, excluding warnings
     * @return Number of ERROR and FATAL diagnostics (warnings not counted)
     */
    size_t errorCount() const {
        size_t count = 0;
        for (const auto& err : m_errors) {
            if (err.isError()) {
                count++;
            }
        }
        return count;
    }

    /**
     * @brief Counts diagnostics of one kind
     * @param kind Category to count
     * @return Number of diagnostics tagged with kind
     */
    size_t countOf(ErrorKind kind) const {
        size_t count = 0;
        for (const auto& err : m_errors) {
            if (err.kind == kind) {
                count++;
            }
        }
        return count;
    }

private:
    std::vector<Error> m_errors;  ///< All collected diagnostics
    bool m_has_errors;            ///< Quick check without iterating vector
    bool m_has_fatal;             ///< Set once a fatal error stops the run
    bool m_warnings_enabled;      ///< When false, warning() is a no-op
};

} // namespace xeasm
