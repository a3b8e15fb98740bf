#include "symbol_table.h"
#include <algorithm>

namespace xeasm {

bool SymbolTable::define(const std::string& name, uint32_t address, size_t line) {
    if (exists(name)) {
        return false;
    }

    m_symbols.emplace(name, Symbol(name, address, line));
    return true;
}

std::optional<uint32_t> SymbolTable::resolve(const std::string& name) const {
    auto it = m_symbols.find(name);
    if (it == m_symbols.end()) {
        return std::nullopt;
    }
    return it->second.address;
}

std::optional<Symbol> SymbolTable::lookup(const std::string& name) const {
    auto it = m_symbols.find(name);
    if (it == m_symbols.end()) {
        return std::nullopt;
    }
    return it->second;
}

bool SymbolTable::exists(const std::string& name) const {
    return m_symbols.find(name) != m_symbols.end();
}

std::vector<Symbol> SymbolTable::sortedByAddress() const {
    std::vector<Symbol> sorted;
    sorted.reserve(m_symbols.size());
    for (const auto& [name, symbol] : m_symbols) {
        sorted.push_back(symbol);
    }

    std::sort(sorted.begin(), sorted.end(), [](const Symbol& a, const Symbol& b) {
        if (a.address != b.address) return a.address < b.address;
        return a.name < b.name;
    });
    return sorted;
}

} // namespace xeasm
