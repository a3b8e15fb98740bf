#include "instruction_encoder.h"
#include "../parser/operand_parser.h"

namespace xeasm {

static constexpr int64_t WORD_MIN = -(1 << 23);
static constexpr int64_t WORD_MAX = (1 << 24) - 1;

EncodedInstruction InstructionEncoder::encode(const InstructionSpec& spec, const SourceRecord& record) const {
    if (spec.isDirective()) {
        return EncodedInstruction(ErrorKind::INTERNAL_ERROR,
                                  "directive '" + spec.mnemonic + "' is not an instruction");
    }

    auto analyzed = m_analyzer.analyze(spec, record, m_current_address);
    if (!analyzed.success) {
        return EncodedInstruction(analyzed.error_kind, analyzed.error);
    }

    EncodedInstruction encoded(pack(spec, analyzed.decision));
    encoded.decision = analyzed.decision;
    return encoded;
}

std::vector<uint8_t> InstructionEncoder::pack(const InstructionSpec& spec, const AddressingDecision& decision) {
    switch (spec.kind) {
        case EntryKind::FORMAT1:
            return {spec.opcode};

        case EntryKind::FORMAT2:
            return {
                spec.opcode,
                static_cast<uint8_t>(((decision.r1 & 0x0F) << 4) | (decision.r2 & 0x0F))
            };

        case EntryKind::FORMAT3:
            break;

        case EntryKind::DIRECTIVE:
            return {};
    }

    const AddressingFlags& f = decision.flags;
    uint8_t first = static_cast<uint8_t>((spec.opcode & 0xFC) | (f.n << 1) | f.i);
    uint8_t xbpe = static_cast<uint8_t>((f.x << 3) | (f.b << 2) | (f.p << 1) | f.e);

    // Two's complement truncated to the field width
    uint32_t field = static_cast<uint32_t>(decision.value);

    if (f.e) {
        field &= 0xFFFFF;
        return {
            first,
            static_cast<uint8_t>((xbpe << 4) | ((field >> 16) & 0x0F)),
            static_cast<uint8_t>((field >> 8) & 0xFF),
            static_cast<uint8_t>(field & 0xFF)
        };
    }

    field &= 0xFFF;
    return {
        first,
        static_cast<uint8_t>((xbpe << 4) | ((field >> 8) & 0x0F)),
        static_cast<uint8_t>(field & 0xFF)
    };
}

EncodedInstruction InstructionEncoder::encodeData(const InstructionSpec& spec, const SourceRecord& record) const {
    switch (spec.directive) {
        case DirectiveKind::BYTE:
            return encodeByte(record);
        case DirectiveKind::WORD:
            return encodeWord(record);
        default:
            break;
    }
    return EncodedInstruction(std::vector<uint8_t>{});
}

EncodedInstruction InstructionEncoder::encodeByte(const SourceRecord& record) const {
    if (OperandParser::looksLikeLiteral(record.operand)) {
        auto literal = OperandParser::parseLiteral(record.operand);
        if (!literal) {
            return EncodedInstruction(ErrorKind::INVALID_OPERAND,
                                      "malformed BYTE literal '" + record.operand + "'");
        }
        return EncodedInstruction(literal->bytes);
    }

    auto value = OperandParser::parseDecimal(record.operand);
    if (!value) {
        return EncodedInstruction(ErrorKind::INVALID_OPERAND,
                                  "BYTE operand '" + record.operand + "' is not a literal or number");
    }
    if (*value < -128 || *value > 255) {
        return EncodedInstruction(ErrorKind::VALUE_OUT_OF_RANGE,
                                  "BYTE value " + std::to_string(*value) + " does not fit in one byte");
    }
    return EncodedInstruction(std::vector<uint8_t>{static_cast<uint8_t>(*value & 0xFF)});
}

EncodedInstruction InstructionEncoder::encodeWord(const SourceRecord& record) const {
    int64_t value = 0;

    if (OperandParser::looksLikeLiteral(record.operand)) {
        auto literal = OperandParser::parseLiteral(record.operand);
        if (!literal || literal->bytes.size() > WORD_SIZE) {
            return EncodedInstruction(ErrorKind::INVALID_OPERAND,
                                      "WORD literal '" + record.operand + "' must be 1 to 3 bytes");
        }
        std::vector<uint8_t> bytes(WORD_SIZE - literal->bytes.size(), 0x00);
        bytes.insert(bytes.end(), literal->bytes.begin(), literal->bytes.end());
        return EncodedInstruction(bytes);
    }

    if (OperandParser::isSymbolName(record.operand)) {
        std::optional<uint32_t> address;
        if (m_symbol_table) {
            address = m_symbol_table->resolve(record.operand);
        }
        if (!address) {
            return EncodedInstruction(ErrorKind::UNDEFINED_SYMBOL,
                                      "undefined symbol '" + record.operand + "'");
        }
        value = *address;
    } else {
        auto number = OperandParser::parseDecimal(record.operand);
        if (!number) {
            return EncodedInstruction(ErrorKind::INVALID_OPERAND,
                                      "WORD operand '" + record.operand + "' is not a number or symbol");
        }
        if (*number < WORD_MIN || *number > WORD_MAX) {
            return EncodedInstruction(ErrorKind::VALUE_OUT_OF_RANGE,
                                      "WORD value " + std::to_string(*number) + " does not fit in 24 bits");
        }
        value = *number;
    }

    uint32_t word = static_cast<uint32_t>(value) & 0xFFFFFF;
    return EncodedInstruction(std::vector<uint8_t>{
        static_cast<uint8_t>((word >> 16) & 0xFF),
        static_cast<uint8_t>((word >> 8) & 0xFF),
        static_cast<uint8_t>(word & 0xFF)
    });
}

} // namespace xeasm
