#include "assembler.h"
#include "../lexer/lexer.h"
#include "../codegen/code_generator.h"
#include <fstream>
#include <sstream>
#include <cstdio>
#include <algorithm>

namespace xeasm {

/**
  Pimpl keeps the passes and their headers out of the public API, so
  embedding the assembler only needs assembler.h.
*/
class Assembler::Impl {
public:
    AssemblyOptions options;

    AssemblyResult assemble(const std::string& source, const std::string& filename) {
        // Phase 1: Line splitting
        Lexer lexer(source, filename);
        Program program;
        program.records = lexer.tokenize();

        return run(program);
    }

    AssemblyResult run(const Program& program) {
        // Phase 2: Pass 1 and pass 2 over a fresh context
        AssemblyContext context(options);
        CodeGenerator generator;
        return generator.generate(program, context);
    }
};

Assembler::Assembler()
    : m_impl(std::make_unique<Impl>())
{
}

Assembler::~Assembler() = default;

AssemblyResult Assembler::assemble(const std::string& source, const std::string& filename) {
    return m_impl->assemble(source, filename);
}

AssemblyResult Assembler::assembleRecords(const std::vector<SourceRecord>& records) {
    Program program;
    program.records = records;
    return m_impl->run(program);
}

AssemblyResult Assembler::assembleFile(const std::string& filepath) {
    std::ifstream file(filepath);
    if (!file.is_open()) {
        AssemblyResult result;
        result.success = false;
        result.state = AssemblyState::FAILED;
        result.errors.push_back(Error(ErrorKind::IO_ERROR, "Could not open file: " + filepath,
                                     SourceLocation(filepath, 0, 0), ErrorSeverity::FATAL));
        return result;
    }

    std::stringstream buffer;
    buffer << file.rdbuf();
    return assemble(buffer.str(), filepath);
}

void Assembler::setOrigin(uint32_t origin) {
    m_impl->options.origin = origin;
}

void Assembler::requireProgramBounds(bool require) {
    m_impl->options.require_bounds = require;
}

void Assembler::enableWarnings(bool enable) {
    m_impl->options.warnings_enabled = enable;
}

std::string AssemblyResult::getListingText() const {
    std::string listing;
    for (const auto& line : this->listing) {
        // Format: address | object code | source
        char addr_buf[16];
        if (line.has_address) {
            snprintf(addr_buf, sizeof(addr_buf), "%05X", line.address);
        } else {
            snprintf(addr_buf, sizeof(addr_buf), "     ");
        }
        listing += addr_buf;
        listing += " | ";

        std::string code;
        for (uint8_t byte : line.machine_code) {
            char byte_buf[4];
            snprintf(byte_buf, sizeof(byte_buf), "%02X", byte);
            code += byte_buf;
        }

        // At most 4 bytes per line; long BYTE literals continue below
        std::string first = code.substr(0, 8);
        first.resize(8, ' ');
        listing += first;
        listing += " | ";
        listing += line.source_text;
        listing += "\n";

        for (size_t pos = 8; pos < code.size(); pos += 8) {
            uint32_t offset = static_cast<uint32_t>(pos / 2);
            if (line.has_address) {
                snprintf(addr_buf, sizeof(addr_buf), "%05X", line.address + offset);
            } else {
                snprintf(addr_buf, sizeof(addr_buf), "     ");
            }
            std::string chunk = code.substr(pos, 8);
            chunk.resize(8, ' ');
            listing += addr_buf;
            listing += " | ";
            listing += chunk;
            listing += " |\n";
        }

        for (ErrorKind kind : line.diagnostics) {
            listing += "      ** ";
            listing += errorKindName(kind);
            listing += "\n";
        }
    }
    return listing;
}

std::string AssemblyResult::getSymbolTableText() const {
    std::vector<std::pair<std::string, uint32_t>> sorted(symbols.begin(), symbols.end());
    std::stable_sort(sorted.begin(), sorted.end(), [](const auto& a, const auto& b) {
        return a.second < b.second;
    });

    std::string text;
    for (const auto& [name, address] : sorted) {
        char buf[64];
        snprintf(buf, sizeof(buf), "%10s: %05X\n", name.c_str(), address);
        text += buf;
    }
    return text;
}

bool AssemblyResult::writeBinary(const std::string& filename) const {
    std::ofstream file(filename, std::ios::binary);
    if (!file.is_open()) {
        return false;
    }

    file.write(reinterpret_cast<const char*>(binary.data()), binary.size());
    return file.good();
}

} // namespace xeasm
