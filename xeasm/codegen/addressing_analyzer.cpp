#include "addressing_analyzer.h"
#include <algorithm>
#include <cctype>

namespace xeasm {

static constexpr int64_t PC_DISP_MIN = -2048;
static constexpr int64_t PC_DISP_MAX = 2047;
static constexpr int64_t BASE_DISP_MAX = 4095;
static constexpr int64_t FIELD12_MAX = 4095;

AddressingResult AddressingAnalyzer::analyze(const InstructionSpec& spec, const SourceRecord& record,
                                             uint32_t address) const {
    switch (spec.kind) {
        case EntryKind::FORMAT1:
            return AddressingResult(AddressingDecision{});

        case EntryKind::FORMAT2:
            return analyzeRegisters(spec, record);

        case EntryKind::FORMAT3:
            return analyzeMemory(spec, record, address);

        case EntryKind::DIRECTIVE:
            break;
    }
    return AddressingResult(ErrorKind::INTERNAL_ERROR,
                            "directive '" + spec.mnemonic + "' has no addressing mode");
}

AddressingResult AddressingAnalyzer::analyzeMemory(const InstructionSpec& spec, const SourceRecord& record,
                                                   uint32_t address) const {
    const bool extended = record.isExtended();
    const uint32_t length = extended ? 4 : 3;

    AddressingDecision decision;
    decision.width = extended ? 20 : 12;
    decision.flags.e = extended;

    // RSUB takes no operand: simple addressing, field 0
    if (spec.operands == OperandShape::NONE) {
        decision.mode = AddressingMode::SIMPLE;
        decision.flags.n = true;
        decision.flags.i = true;
        decision.relation = extended ? TargetRelation::EXTENDED : TargetRelation::ABSOLUTE;
        return AddressingResult(decision);
    }

    if (record.operand.empty()) {
        return AddressingResult(ErrorKind::INVALID_OPERAND,
                                record.baseMnemonic() + " requires an operand");
    }

    auto syntax = OperandParser::parseMemory(record.operand);
    if (!syntax) {
        return AddressingResult(ErrorKind::INVALID_OPERAND,
                                "invalid operand '" + record.operand + "'");
    }

    switch (syntax->prefix) {
        case AddressingPrefix::IMMEDIATE:
            decision.mode = AddressingMode::IMMEDIATE;
            decision.flags.i = true;
            break;
        case AddressingPrefix::INDIRECT:
            decision.mode = AddressingMode::INDIRECT;
            decision.flags.n = true;
            break;
        case AddressingPrefix::SIMPLE:
            decision.mode = AddressingMode::SIMPLE;
            decision.flags.n = true;
            decision.flags.i = true;
            break;
    }

    if (syntax->indexed && decision.mode != AddressingMode::SIMPLE) {
        return AddressingResult(ErrorKind::INDEXED_WITH_IMMEDIATE_OR_INDIRECT,
                                "indexed addressing is used with immediate or indirect addressing: '" +
                                    record.operand + "'");
    }
    decision.flags.x = syntax->indexed;

    int64_t target = syntax->number;
    if (!syntax->is_number) {
        std::optional<uint32_t> resolved;
        if (m_symbol_table) {
            resolved = m_symbol_table->resolve(syntax->symbol);
        }
        if (!resolved) {
            return AddressingResult(ErrorKind::UNDEFINED_SYMBOL,
                                    "undefined symbol '" + syntax->symbol + "'");
        }
        target = *resolved;
    }

    // Format 4: the field holds the full address or constant
    if (extended) {
        if (target < 0 || target > MAX_ADDRESS) {
            return AddressingResult(ErrorKind::VALUE_OUT_OF_RANGE,
                                    "value " + std::to_string(target) + " does not fit in 20 bits");
        }
        decision.relation = TargetRelation::EXTENDED;
        decision.value = static_cast<int32_t>(target);
        return AddressingResult(decision);
    }

    // Constants that fit go in the field as they are
    if (syntax->is_number) {
        if (target >= 0 && target <= FIELD12_MAX) {
            decision.relation = TargetRelation::ABSOLUTE;
            decision.value = static_cast<int32_t>(target);
            return AddressingResult(decision);
        }
        if (decision.mode == AddressingMode::IMMEDIATE || target < 0) {
            return AddressingResult(ErrorKind::VALUE_OUT_OF_RANGE,
                                    "value " + std::to_string(target) +
                                        " does not fit in 12 bits; use format 4");
        }
    }

    return selectRelative(decision, target, address + length, record.operand);
}

AddressingResult AddressingAnalyzer::selectRelative(AddressingDecision decision, int64_t target,
                                                    uint32_t next_address, const std::string& operand) const {
    int64_t pc_disp = target - static_cast<int64_t>(next_address);
    if (pc_disp >= PC_DISP_MIN && pc_disp <= PC_DISP_MAX) {
        decision.relation = TargetRelation::PC_RELATIVE;
        decision.flags.p = true;
        decision.value = static_cast<int32_t>(pc_disp);
        return AddressingResult(decision);
    }

    if (!m_base) {
        return AddressingResult(ErrorKind::NO_BASE_DECLARED,
                                "no BASE was declared; '" + operand +
                                    "' is out of PC-relative range");
    }

    int64_t base_disp = target - static_cast<int64_t>(*m_base);
    if (base_disp >= 0 && base_disp <= BASE_DISP_MAX) {
        decision.relation = TargetRelation::BASE_RELATIVE;
        decision.flags.b = true;
        decision.value = static_cast<int32_t>(base_disp);
        return AddressingResult(decision);
    }

    return AddressingResult(ErrorKind::ADDRESSING_MODE_UNAVAILABLE,
                            "cannot use PC or base relative addressing for '" + operand + "'");
}

AddressingResult AddressingAnalyzer::analyzeRegisters(const InstructionSpec& spec,
                                                      const SourceRecord& record) const {
    AddressingDecision decision;
    auto parts = OperandParser::splitList(record.operand);
    const std::string name = record.baseMnemonic();

    size_t expected = 1;
    if (spec.operands == OperandShape::REGISTER_PAIR || spec.operands == OperandShape::REGISTER_COUNT) {
        expected = 2;
    }
    if (record.operand.empty() || parts.size() != expected) {
        return AddressingResult(ErrorKind::INVALID_OPERAND,
                                name + " expects " + std::to_string(expected) +
                                    (expected == 1 ? " operand" : " operands"));
    }

    switch (spec.operands) {
        case OperandShape::SVC_NUMBER: {
            auto n = OperandParser::parseDecimal(parts[0]);
            if (!n) {
                return AddressingResult(ErrorKind::INVALID_OPERAND,
                                        "SVC operand '" + parts[0] + "' is not a number");
            }
            if (*n < 0 || *n >= 16) {
                return AddressingResult(ErrorKind::SVC_OPERAND_OUT_OF_RANGE,
                                        "SVC operand n must be of format 0 <= n < 16");
            }
            decision.r1 = static_cast<uint8_t>(*n);
            return AddressingResult(decision);
        }

        case OperandShape::REGISTER_COUNT: {
            auto r = parseRegister(parts[0]);
            if (!r) {
                return AddressingResult(ErrorKind::INVALID_OPERAND,
                                        "unknown register '" + parts[0] + "'");
            }
            auto n = OperandParser::parseDecimal(parts[1]);
            if (!n) {
                return AddressingResult(ErrorKind::INVALID_OPERAND,
                                        name + " count '" + parts[1] + "' is not a number");
            }
            if (*n <= 0 || *n >= 17 || *r < 0 || *r >= 16) {
                return AddressingResult(ErrorKind::OPERAND_OUT_OF_RANGE,
                                        name + " operand n must be of format 0 < n < 17 and "
                                               "operand r must be of format 0 <= r < 16");
            }
            decision.r1 = static_cast<uint8_t>(*r);
            decision.r2 = static_cast<uint8_t>(*n - 1);
            return AddressingResult(decision);
        }

        case OperandShape::REGISTER:
        case OperandShape::REGISTER_PAIR: {
            uint8_t numbers[2] = {0, 0};
            for (size_t i = 0; i < parts.size(); i++) {
                auto r = parseRegister(parts[i]);
                if (!r) {
                    return AddressingResult(ErrorKind::INVALID_OPERAND,
                                            "unknown register '" + parts[i] + "'");
                }
                if (*r < 0 || *r >= 16) {
                    return AddressingResult(ErrorKind::REGISTER_OUT_OF_RANGE,
                                            name + " operands r1,r2 must be of format 0 <= r1,r2 < 16");
                }
                numbers[i] = static_cast<uint8_t>(*r);
            }
            decision.r1 = numbers[0];
            decision.r2 = numbers[1];
            return AddressingResult(decision);
        }

        case OperandShape::NONE:
        case OperandShape::MEMORY:
        case OperandShape::VALUE:
            break;
    }

    return AddressingResult(ErrorKind::INTERNAL_ERROR,
                            "format 2 instruction '" + name + "' has no register form");
}

std::optional<int64_t> AddressingAnalyzer::parseRegister(const std::string& text) {
    std::string upper = text;
    std::transform(upper.begin(), upper.end(), upper.begin(), ::toupper);

    for (const auto& reg : REGISTER_TABLE) {
        if (upper == reg.name) {
            return reg.number;
        }
    }
    return OperandParser::parseDecimal(text);
}

} // namespace xeasm
