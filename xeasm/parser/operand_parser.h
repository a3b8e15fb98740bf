#pragma once

#include <string>
#include <vector>
#include <optional>
#include <cstdint>

namespace xeasm {

/**
 * Addressing prefix written in front of a memory operand
 */
enum class AddressingPrefix {
    SIMPLE,     // BUFFER
    IMMEDIATE,  // #BUFFER, #3
    INDIRECT,   // @RETADR
};

/**
 * Memory operand split into its syntactic parts
 * Example: "BUFFER,X" → {SIMPLE, indexed, symbol "BUFFER"}
 */
struct MemoryOperandSyntax {
    AddressingPrefix prefix = AddressingPrefix::SIMPLE;
    bool indexed = false;           // ",X" suffix present
    bool is_number = false;         // body is a decimal constant
    std::string symbol;             // body when it names a symbol
    int64_t number = 0;             // body when it is a constant
};

/**
 * Quoted literal used by BYTE, WORD, RESB and RESW
 */
struct LiteralSyntax {
    enum class Kind { CHARACTER, HEX };

    Kind kind = Kind::CHARACTER;
    std::string body;               // text between the quotes
    std::vector<uint8_t> bytes;     // encoded value, one byte per char or hex pair
};

/**
 * Operand text parser
 * All functions are stateless; symbol resolution happens later in the analyzer.
 */
class OperandParser {
public:
    /**
     * Parse a format-3/4 operand
     * Example: "#LENGTH" → {IMMEDIATE, symbol "LENGTH"}
     *          "@RETADR" → {INDIRECT, symbol "RETADR"}
     *          "BUFFER,X" → {SIMPLE, indexed, symbol "BUFFER"}
     * @return Parsed syntax or nullopt if the body is neither symbol nor number
     */
    static std::optional<MemoryOperandSyntax> parseMemory(const std::string& text);

    /**
     * Parse C'...' or X'...'
     * Hex literals must have an even number of digits.
     * @return Parsed literal or nullopt if the text is not a well-formed literal
     */
    static std::optional<LiteralSyntax> parseLiteral(const std::string& text);

    /**
     * Check whether text looks like a quoted literal (C'..' or X'..')
     * Used to tell a malformed literal from a plain symbol.
     */
    static bool looksLikeLiteral(const std::string& text);

    /**
     * Parse a decimal number with optional sign
     * Example: "4096" → 4096, "-1" → -1
     */
    static std::optional<int64_t> parseDecimal(const std::string& text);

    /**
     * Parse an unsigned hexadecimal number without prefix
     * Example: "1000" → 0x1000
     */
    static std::optional<int64_t> parseHex(const std::string& text);

    /**
     * Split a comma separated operand list, trimming blanks around each part
     * Example: "A, S" → {"A", "S"}
     */
    static std::vector<std::string> splitList(const std::string& text);

    /**
     * Check if string is a valid symbol name (letter first, then letters/digits/_)
     */
    static bool isSymbolName(const std::string& text);

    /**
     * Strip leading and trailing blanks (space, tab, CR)
     */
    static std::string trim(const std::string& text);
};

} // namespace xeasm
