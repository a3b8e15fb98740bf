/**
 * @file symbol_table.h
 * @brief Symbol table for tracking label addresses
 *
 * The symbol table maps label names to the addresses pass 1 assigned them.
 * Lookups are case-sensitive, and a symbol's address is bound exactly once
 * per assembly run.
 */

#pragma once

#include <string>
#include <unordered_map>
#include <optional>
#include <vector>
#include <cstdint>

namespace xeasm {

/**
 * @brief A single symbol with its properties
 *
 * Represents a label defined in the program. Created the first time pass 1
 * sees the label and never changed afterwards.
 */
struct Symbol {
    std::string name;           ///< Symbol identifier
    uint32_t address;           ///< Program-relative address
    size_t definition_line;     ///< Source line where defined

    Symbol() : address(0), definition_line(0) {}

    Symbol(std::string n, uint32_t addr, size_t line)
        : name(std::move(n))
        , address(addr)
        , definition_line(line)
    {}
};

/**
 * @brief Symbol table populated by pass 1 and read by pass 2
 *
 * Every symbol is defined once; a second definition is rejected and the
 * first binding is kept. Because any label may be used before the line
 * that defines it, pass 1 must finish before pass 2 resolves anything.
 *
 * @code
 * SymbolTable symbols;
 * symbols.define("LOOP", 0x0000, 3);
 * symbols.define("LOOP", 0x0010, 9);   // false, LOOP stays 0x0000
 * auto addr = symbols.resolve("LOOP"); // 0x0000
 * @endcode
 */
class SymbolTable {
public:
    SymbolTable() = default;

    /**
     * @brief Adds a new symbol to the table
     * @param name Symbol name (case-sensitive)
     * @param address Address assigned by the location counter
     * @param line Source line where defined
     * @return true if added, false if the name is already defined
     */
    bool define(const std::string& name, uint32_t address, size_t line);

    /**
     * @brief Resolves a symbol to its address
     * @param name Symbol to find
     * @return Address if defined, nullopt otherwise
     */
    std::optional<uint32_t> resolve(const std::string& name) const;

    /**
     * @brief Looks up the full symbol record
     * @param name Symbol to find
     * @return Symbol if found, nullopt otherwise
     */
    std::optional<Symbol> lookup(const std::string& name) const;

    /**
     * @brief Checks if a symbol exists
     * @param name Symbol to check
     * @return true if symbol is defined
     */
    bool exists(const std::string& name) const;

    /**
     * @brief Gets all symbols for iteration
     * @return Map of all symbols keyed by name
     */
    const std::unordered_map<std::string, Symbol>& getAllSymbols() const { return m_symbols; }

    /**
     * @brief Symbols ordered by address, then name
     * @return Copy of every symbol, sorted for listings
     */
    std::vector<Symbol> sortedByAddress() const;

    size_t size() const { return m_symbols.size(); }

    /**
     * @brief Removes all symbols
     *
     * Call between assembly runs to reuse the same table instance.
     */
    void clear() {
        m_symbols.clear();
    }

private:
    std::unordered_map<std::string, Symbol> m_symbols;
};

} // namespace xeasm
