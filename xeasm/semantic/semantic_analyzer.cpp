#include "semantic_analyzer.h"
#include "../parser/operand_parser.h"

namespace xeasm {

bool SemanticAnalyzer::analyze(const Program& program, AssemblyContext& context) {
    m_seen_statement = false;
    m_warned_after_end = false;

    context.state = AssemblyState::PASS1_RUNNING;
    context.symbols.clear();
    context.addresses.clear();
    context.location_counter = context.options.origin;
    context.program_start = context.options.origin;
    context.start_index.reset();
    context.end_index.reset();

    for (size_t i = 0; i < program.records.size(); i++) {
        const SourceRecord& record = program.records[i];

        AddressInfo info;
        info.record_index = i;
        info.address = context.location_counter;

        if (context.end_index) {
            if (!m_warned_after_end) {
                context.reporter.warning("statements after END are ignored", record.location);
                m_warned_after_end = true;
            }
            info.ignored = true;
            context.addresses.push_back(std::move(info));
            continue;
        }

        auto spec = lookupInstruction(record.mnemonic);

        if (spec && spec->directive == DirectiveKind::START) {
            if (!processStart(record, i, context)) {
                return false;
            }
            info.address = context.location_counter;
            context.addresses.push_back(std::move(info));
            continue;
        }

        m_seen_statement = true;
        defineLabel(record, info, context);

        if (!spec) {
            if (record.mnemonic.empty()) {
                error(context, info, ErrorKind::UNKNOWN_MNEMONIC,
                      "label '" + record.label + "' has no mnemonic", record.location);
            } else {
                error(context, info, ErrorKind::UNKNOWN_MNEMONIC,
                      "unknown mnemonic '" + record.mnemonic + "'", record.location);
            }
            info.sized = false;
            context.addresses.push_back(std::move(info));
            continue;
        }

        if (record.isExtended() && spec->kind != EntryKind::FORMAT3) {
            error(context, info, ErrorKind::INVALID_OPERAND,
                  "'+' extension is only valid on format 3 instructions: '" + record.mnemonic + "'",
                  record.location);
            info.sized = false;
            context.addresses.push_back(std::move(info));
            continue;
        }

        SizeResult size = calculateSize(record, *spec);
        if (!size.success) {
            error(context, info, size.error_kind, size.error, record.location);
            info.sized = false;
        }
        info.size = size.size;

        if (spec->directive == DirectiveKind::END) {
            context.end_index = i;
        }

        uint64_t next = static_cast<uint64_t>(context.location_counter) + info.size;
        if (next > static_cast<uint64_t>(MAX_ADDRESS) + 1) {
            context.addresses.push_back(std::move(info));
            context.fail(ErrorKind::PROGRAM_BOUNDS,
                         "program exceeds the 20-bit address space", record.location);
            return false;
        }

        context.addresses.push_back(std::move(info));
        context.location_counter = static_cast<uint32_t>(next);
    }

    SourceLocation end_loc = program.records.empty()
        ? SourceLocation()
        : program.records.back().location;

    if (context.options.require_bounds) {
        if (!context.start_index) {
            context.fail(ErrorKind::PROGRAM_BOUNDS, "program has no START statement", end_loc);
            return false;
        }
        if (!context.end_index) {
            context.fail(ErrorKind::PROGRAM_BOUNDS, "program has no END statement", end_loc);
            return false;
        }
    }

    context.program_end = context.location_counter;
    context.state = AssemblyState::PASS1_COMPLETE;
    return true;
}

bool SemanticAnalyzer::processStart(const SourceRecord& record, size_t index, AssemblyContext& context) {
    if (context.start_index) {
        context.fail(ErrorKind::PROGRAM_BOUNDS, "START may only appear once", record.location);
        return false;
    }
    if (m_seen_statement) {
        context.fail(ErrorKind::PROGRAM_BOUNDS, "START must be the first statement", record.location);
        return false;
    }

    uint32_t origin = context.options.origin;
    if (!record.operand.empty()) {
        auto value = OperandParser::parseHex(record.operand);
        if (!value || *value > MAX_ADDRESS) {
            context.fail(ErrorKind::PROGRAM_BOUNDS,
                         "invalid START address '" + record.operand + "'", record.location);
            return false;
        }
        origin = static_cast<uint32_t>(*value);
    }

    context.start_index = index;
    context.program_start = origin;
    context.location_counter = origin;
    context.program_name = record.label;

    if (!record.label.empty()) {
        context.symbols.define(record.label, origin, record.location.line);
    }
    return true;
}

SizeResult SemanticAnalyzer::calculateSize(const SourceRecord& record, const InstructionSpec& spec) {
    switch (spec.kind) {
        case EntryKind::FORMAT1:
            return SizeResult(1);

        case EntryKind::FORMAT2:
            return SizeResult(2);

        case EntryKind::FORMAT3:
            return SizeResult(record.isExtended() ? 4 : 3);

        case EntryKind::DIRECTIVE:
            break;
    }

    switch (spec.directive) {
        case DirectiveKind::START:
        case DirectiveKind::END:
        case DirectiveKind::BASE:
        case DirectiveKind::NOBASE:
        case DirectiveKind::NONE:
            return SizeResult(0);

        case DirectiveKind::RESB:
            return calculateReserveSize(record, 1);

        case DirectiveKind::RESW:
            return calculateReserveSize(record, WORD_SIZE);

        case DirectiveKind::BYTE:
            return calculateByteSize(record);

        case DirectiveKind::WORD:
            return SizeResult(WORD_SIZE);
    }

    return SizeResult(0);
}

SizeResult SemanticAnalyzer::calculateReserveSize(const SourceRecord& record, uint32_t element_size) {
    const std::string name = record.baseMnemonic();
    std::optional<int64_t> count;

    const std::string operand = OperandParser::trim(record.operand);

    if (OperandParser::looksLikeLiteral(operand)) {
        if (operand[0] == 'C' || operand[0] == 'c') {
            return SizeResult(ErrorKind::INVALID_RESERVE_OPERAND,
                              name + " does not support character operands");
        }
        // X'..' counts may have any number of digits
        if (operand.size() > 3 && operand.back() == '\'') {
            count = OperandParser::parseHex(operand.substr(2, operand.size() - 3));
        }
    } else {
        count = OperandParser::parseDecimal(operand);
    }

    if (!count || *count < 0) {
        return SizeResult(ErrorKind::INVALID_RESERVE_OPERAND,
                          name + " operand '" + record.operand + "' is not a count");
    }

    uint64_t total = static_cast<uint64_t>(*count) * element_size;
    if (total > static_cast<uint64_t>(MAX_ADDRESS) + 1) {
        return SizeResult(ErrorKind::VALUE_OUT_OF_RANGE,
                          name + " " + record.operand + " exceeds the address space");
    }
    return SizeResult(static_cast<uint32_t>(total));
}

SizeResult SemanticAnalyzer::calculateByteSize(const SourceRecord& record) {
    if (OperandParser::looksLikeLiteral(record.operand)) {
        auto literal = OperandParser::parseLiteral(record.operand);
        if (!literal) {
            return SizeResult(ErrorKind::INVALID_OPERAND,
                              "malformed BYTE literal '" + record.operand + "'");
        }
        return SizeResult(static_cast<uint32_t>(literal->bytes.size()));
    }

    if (OperandParser::parseDecimal(record.operand)) {
        return SizeResult(1);
    }

    return SizeResult(ErrorKind::INVALID_OPERAND,
                      "BYTE operand '" + record.operand + "' is not a literal or number");
}

void SemanticAnalyzer::defineLabel(const SourceRecord& record, AddressInfo& info, AssemblyContext& context) {
    if (record.label.empty()) {
        return;
    }

    if (!context.symbols.define(record.label, context.location_counter, record.location.line)) {
        auto first = context.symbols.lookup(record.label);
        error(context, info, ErrorKind::DUPLICATE_SYMBOL,
              "symbol '" + record.label + "' is already defined on line " +
                  std::to_string(first ? first->definition_line : 0),
              record.location);
    }
}

void SemanticAnalyzer::error(AssemblyContext& context, AddressInfo& info, ErrorKind kind,
                             const std::string& message, const SourceLocation& loc) {
    context.reporter.error(kind, message, loc);
    info.diagnostics.push_back(kind);
    if (info.first_error.empty()) {
        info.first_error = message;
    }
}

} // namespace xeasm
