#include "xeasm/core/assembler.h"
#include "xeasm/parser/operand_parser.h"
#include "xeasm/codegen/instruction_tables.h"
#include <iostream>
#include <string>

using namespace xeasm;

static void printUsage(const char* argv0) {
    std::cerr << "usage: " << argv0
              << " <source.asm> [-o out.bin] [--origin hex] [--strict] [--no-warnings]\n";
}

int main(int argc, char** argv) {
    std::string source_path;
    std::string output_path;
    Assembler assembler;

    for (int i = 1; i < argc; i++) {
        std::string arg = argv[i];

        if (arg == "-o" && i + 1 < argc) {
            output_path = argv[++i];
        } else if (arg == "--origin" && i + 1 < argc) {
            auto origin = OperandParser::parseHex(argv[++i]);
            if (!origin || *origin > MAX_ADDRESS) {
                std::cerr << "xeasm: invalid origin '" << argv[i] << "'\n";
                return 2;
            }
            assembler.setOrigin(static_cast<uint32_t>(*origin));
        } else if (arg == "--strict") {
            assembler.requireProgramBounds(true);
        } else if (arg == "--no-warnings") {
            assembler.enableWarnings(false);
        } else if (arg == "-h" || arg == "--help") {
            printUsage(argv[0]);
            return 0;
        } else if (!arg.empty() && arg[0] != '-' && source_path.empty()) {
            source_path = arg;
        } else {
            printUsage(argv[0]);
            return 2;
        }
    }

    if (source_path.empty()) {
        printUsage(argv[0]);
        return 2;
    }

    auto result = assembler.assembleFile(source_path);

    std::cout << result.getListingText() << "\n";
    std::cout << result.getSymbolTableText();

    for (const auto& err : result.errors) {
        std::cerr << err.format() << "\n";
    }

    if (!result.success) {
        return 1;
    }

    if (!output_path.empty() && !result.writeBinary(output_path)) {
        std::cerr << "xeasm: could not write " << output_path << "\n";
        return 1;
    }

    return 0;
}
