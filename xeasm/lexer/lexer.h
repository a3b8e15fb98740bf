/**
 * @file lexer.h
 * @brief Line splitter for SIC/XE assembly source
 *
 * The lexer is the first phase. It reads raw source text and breaks each
 * statement into its label, mnemonic and operand fields. SIC/XE source is
 * column oriented: a line that starts with a letter carries a label, a line
 * that starts with '.' is a comment, and anything after the operand field is
 * free-form commentary.
 */

#pragma once

#include <string>
#include <string_view>
#include <vector>
#include "source_location.h"
#include "../parser/ast.h"

namespace xeasm {

/**
 * @brief Converts assembly source text into a sequence of SourceRecords
 *
 * The lexer recognizes:
 * - Comment lines (first character '.') and blank lines, which are skipped
 * - A label field when the line starts with a letter in column 1 and has
 *   more than one field (a lone field is always the mnemonic)
 * - The mnemonic field, including the '+' extension marker
 * - The operand field, where quoted literals like C'EOF FILE' may contain spaces
 * - Trailing commentary after the operand, which is discarded
 *
 * @code
 * Lexer lexer("FIRST   STL     RETADR   save return address\n");
 * auto records = lexer.tokenize();
 * // records[0].label == "FIRST", mnemonic == "STL", operand == "RETADR"
 * @endcode
 */
class Lexer {
public:
    /**
     * @brief Constructs a lexer for the given source
     * @param source Assembly source code (must outlive the Lexer)
     * @param filename Name to display in error locations
     */
    explicit Lexer(std::string_view source, std::string filename = "<input>");

    /**
     * @brief Scans the entire source and produces one record per statement
     * @return Records in source order, comments and blank lines removed
     *
     * Never fails: a bad mnemonic or operand is left for pass 1 to report
     * against its line.
     */
    std::vector<SourceRecord> tokenize();

private:
    /** @brief Scans one physical line starting at the current position */
    bool scanLine(SourceRecord& record);

    /** @brief Scans a whitespace-delimited field, keeping quoted text intact */
    std::string scanField();

    /** @brief Checks if we've consumed all input */
    bool isAtEnd() const;

    /** @brief Returns current character without advancing */
    char peek() const;

    /** @brief Consumes and returns current character */
    char advance();

    /** @brief Skips spaces and tabs (but not newlines) */
    void skipWhitespace();

    /** @brief Skips to the start of the next line */
    void skipRestOfLine();

    /** @brief Creates a SourceLocation for the current position */
    SourceLocation currentLocation() const;

    /** @brief Updates line/column tracking after consuming a character */
    void advanceLocation(char c);

    /** @brief Checks if character can start a label */
    bool isAlpha(char c) const;

    /** @brief Checks for field separators */
    bool isBlank(char c) const;

    std::string_view m_source;  ///< Source text (not owned, must outlive lexer)
    std::string m_filename;     ///< Filename for error reporting
    size_t m_current;           ///< Current position in source
    size_t m_line;              ///< Current line number (1-based)
    size_t m_column;            ///< Current column number (1-based)
};

} // namespace xeasm
