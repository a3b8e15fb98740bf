#include "code_generator.h"
#include "../parser/operand_parser.h"
#include <algorithm>

namespace xeasm {

AssemblyResult CodeGenerator::generate(const Program& program, AssemblyContext& context) {
    AssemblyResult result;
    m_listing.clear();

    if (m_semantic_analyzer.analyze(program, context)) {
        context.state = AssemblyState::PASS2_RUNNING;
        context.location_counter = context.program_start;
        context.entry_point.reset();

        m_encoder.setSymbolTable(&context.symbols);
        m_encoder.setBaseRegister(std::nullopt);

        for (size_t i = 0; i < program.records.size(); i++) {
            if (!generateStatement(program.records[i], context.addresses[i], context)) {
                break;
            }
        }

        if (context.state != AssemblyState::FAILED) {
            context.state = AssemblyState::DONE;
            result.binary = buildImage(context);
            result.program_length = context.program_end - context.program_start;
        }
    }

    result.listing = m_listing;
    result.errors = context.reporter.getErrors();
    result.success = !context.reporter.hasErrors();
    result.state = context.state;
    result.program_name = context.program_name;
    result.program_start = context.program_start;
    result.entry_point = context.entry_point;

    for (const auto& [name, symbol] : context.symbols.getAllSymbols()) {
        result.symbols[name] = symbol.address;
    }

    return result;
}

bool CodeGenerator::generateStatement(const SourceRecord& record, const AddressInfo& info,
                                      AssemblyContext& context) {
    if (info.ignored) {
        return true;
    }

    AssembledLine line;
    line.source_line = record.location.line;
    line.source_text = record.text();
    line.address = context.location_counter;
    line.diagnostics = info.diagnostics;
    line.error_message = info.first_error;
    line.success = info.diagnostics.empty();

    // Both passes must agree on every address
    if (context.location_counter != info.address) {
        context.fail(ErrorKind::INTERNAL_ERROR,
                     "pass 2 address " + std::to_string(context.location_counter) +
                         " differs from pass 1 address " + std::to_string(info.address),
                     record.location);
        line.success = false;
        line.diagnostics.push_back(ErrorKind::INTERNAL_ERROR);
        m_listing.push_back(line);
        return false;
    }

    auto spec = lookupInstruction(record.mnemonic);
    if (!spec || !info.sized) {
        // Already reported by pass 1
        line.success = false;
        m_listing.push_back(line);
        context.location_counter += info.size;
        return true;
    }

    SizeResult size = SemanticAnalyzer::calculateSize(record, *spec);
    if (size.size != info.size) {
        context.fail(ErrorKind::INTERNAL_ERROR,
                     "pass 2 size of '" + record.mnemonic + "' differs from pass 1",
                     record.location);
        line.success = false;
        line.diagnostics.push_back(ErrorKind::INTERNAL_ERROR);
        m_listing.push_back(line);
        return false;
    }

    if (spec->isDirective()) {
        processDirective(*spec, record, line, context);
    } else {
        processInstruction(*spec, record, line, context);
    }

    m_listing.push_back(line);
    context.location_counter += size.size;
    return true;
}

void CodeGenerator::processInstruction(const InstructionSpec& spec, const SourceRecord& record,
                                       AssembledLine& line, AssemblyContext& context) {
    m_encoder.setCurrentAddress(context.location_counter);

    auto encoded = m_encoder.encode(spec, record);
    if (encoded.success) {
        line.machine_code = encoded.bytes;
    } else {
        lineError(line, encoded.error_kind, encoded.error, record.location, context);
    }
}

void CodeGenerator::processDirective(const InstructionSpec& spec, const SourceRecord& record,
                                     AssembledLine& line, AssemblyContext& context) {
    switch (spec.directive) {
        case DirectiveKind::START:
            line.has_address = false;
            break;

        case DirectiveKind::END:
            line.has_address = false;
            processEnd(record, line, context);
            break;

        case DirectiveKind::BASE:
            line.has_address = false;
            processBase(record, line, context);
            break;

        case DirectiveKind::NOBASE:
            line.has_address = false;
            m_encoder.setBaseRegister(std::nullopt);
            break;

        case DirectiveKind::BYTE:
        case DirectiveKind::WORD: {
            auto encoded = m_encoder.encodeData(spec, record);
            if (encoded.success) {
                line.machine_code = encoded.bytes;
            } else {
                lineError(line, encoded.error_kind, encoded.error, record.location, context);
            }
            break;
        }

        case DirectiveKind::RESB:
        case DirectiveKind::RESW:
        case DirectiveKind::NONE:
            // Space only, no initialized bytes
            break;
    }
}

void CodeGenerator::processBase(const SourceRecord& record, AssembledLine& line, AssemblyContext& context) {
    std::optional<uint32_t> base;

    if (OperandParser::isSymbolName(record.operand)) {
        base = context.symbols.resolve(record.operand);
        if (!base) {
            lineError(line, ErrorKind::UNDEFINED_SYMBOL,
                      "BASE operand '" + record.operand + "' is undefined", record.location, context);
            return;
        }
    } else {
        auto value = OperandParser::parseDecimal(record.operand);
        if (!value || *value < 0 || *value > MAX_ADDRESS) {
            lineError(line, ErrorKind::INVALID_OPERAND,
                      "invalid BASE operand '" + record.operand + "'", record.location, context);
            return;
        }
        base = static_cast<uint32_t>(*value);
    }

    m_encoder.setBaseRegister(base);
}

void CodeGenerator::processEnd(const SourceRecord& record, AssembledLine& line, AssemblyContext& context) {
    if (record.operand.empty()) {
        return;
    }

    if (OperandParser::isSymbolName(record.operand)) {
        auto entry = context.symbols.resolve(record.operand);
        if (!entry) {
            lineError(line, ErrorKind::UNDEFINED_SYMBOL,
                      "END operand '" + record.operand + "' is undefined", record.location, context);
            return;
        }
        context.entry_point = entry;
        return;
    }

    auto value = OperandParser::parseHex(record.operand);
    if (!value || *value > MAX_ADDRESS) {
        lineError(line, ErrorKind::INVALID_OPERAND,
                  "invalid END operand '" + record.operand + "'", record.location, context);
        return;
    }
    context.entry_point = static_cast<uint32_t>(*value);
}

void CodeGenerator::lineError(AssembledLine& line, ErrorKind kind, const std::string& message,
                              const SourceLocation& loc, AssemblyContext& context) {
    context.reporter.error(kind, message, loc);
    line.diagnostics.push_back(kind);
    line.success = false;
    if (line.error_message.empty()) {
        line.error_message = message;
    }
}

std::vector<uint8_t> CodeGenerator::buildImage(const AssemblyContext& context) const {
    std::vector<uint8_t> image(context.program_end - context.program_start, 0x00);

    for (const auto& line : m_listing) {
        size_t offset = line.address - context.program_start;
        if (offset + line.machine_code.size() > image.size()) {
            continue;
        }
        std::copy(line.machine_code.begin(), line.machine_code.end(), image.begin() + offset);
    }

    return image;
}

} // namespace xeasm
