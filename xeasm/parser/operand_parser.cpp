#include "operand_parser.h"
#include <cctype>

namespace xeasm {

// Longest constant we accept before overflow matters; 20-bit fields top out at 7 digits
static constexpr size_t MAX_NUMBER_DIGITS = 12;

std::optional<MemoryOperandSyntax> OperandParser::parseMemory(const std::string& text) {
    std::string body = trim(text);
    MemoryOperandSyntax syntax;

    if (body.empty()) {
        return std::nullopt;
    }

    if (body[0] == '#') {
        syntax.prefix = AddressingPrefix::IMMEDIATE;
        body = body.substr(1);
    } else if (body[0] == '@') {
        syntax.prefix = AddressingPrefix::INDIRECT;
        body = body.substr(1);
    }

    // Indexed suffix: BUFFER,X (blanks around the comma are tolerated)
    auto parts = splitList(body);
    if (parts.size() == 2) {
        if (parts[1] != "X" && parts[1] != "x") {
            return std::nullopt;
        }
        syntax.indexed = true;
        body = parts[0];
    } else if (parts.size() != 1) {
        return std::nullopt;
    } else {
        body = parts[0];
    }

    if (isSymbolName(body)) {
        syntax.symbol = body;
        return syntax;
    }

    auto number = parseDecimal(body);
    if (!number) {
        return std::nullopt;
    }
    syntax.is_number = true;
    syntax.number = *number;
    return syntax;
}

bool OperandParser::looksLikeLiteral(const std::string& text) {
    std::string body = trim(text);
    if (body.size() < 2 || body[1] != '\'') {
        return false;
    }
    char kind = static_cast<char>(std::toupper(static_cast<unsigned char>(body[0])));
    return kind == 'C' || kind == 'X';
}

std::optional<LiteralSyntax> OperandParser::parseLiteral(const std::string& text) {
    std::string body = trim(text);
    if (!looksLikeLiteral(body) || body.size() < 3 || body.back() != '\'') {
        return std::nullopt;
    }

    LiteralSyntax literal;
    literal.body = body.substr(2, body.size() - 3);

    char kind = static_cast<char>(std::toupper(static_cast<unsigned char>(body[0])));
    if (kind == 'C') {
        literal.kind = LiteralSyntax::Kind::CHARACTER;
        if (literal.body.empty()) {
            return std::nullopt;
        }
        for (char c : literal.body) {
            literal.bytes.push_back(static_cast<uint8_t>(c));
        }
        return literal;
    }

    literal.kind = LiteralSyntax::Kind::HEX;
    if (literal.body.empty() || literal.body.size() % 2 != 0) {
        return std::nullopt;
    }
    for (size_t i = 0; i < literal.body.size(); i += 2) {
        auto byte = parseHex(literal.body.substr(i, 2));
        if (!byte) {
            return std::nullopt;
        }
        literal.bytes.push_back(static_cast<uint8_t>(*byte));
    }
    return literal;
}

std::optional<int64_t> OperandParser::parseDecimal(const std::string& text) {
    std::string str = trim(text);
    if (str.empty()) {
        return std::nullopt;
    }

    bool negative = false;
    size_t pos = 0;
    if (str[0] == '-' || str[0] == '+') {
        negative = str[0] == '-';
        pos = 1;
    }

    if (pos >= str.size() || str.size() - pos > MAX_NUMBER_DIGITS) {
        return std::nullopt;
    }

    int64_t value = 0;
    for (; pos < str.size(); pos++) {
        if (!std::isdigit(static_cast<unsigned char>(str[pos]))) {
            return std::nullopt;
        }
        value = value * 10 + (str[pos] - '0');
    }
    return negative ? -value : value;
}

std::optional<int64_t> OperandParser::parseHex(const std::string& text) {
    std::string str = trim(text);
    if (str.empty() || str.size() > MAX_NUMBER_DIGITS) {
        return std::nullopt;
    }

    int64_t value = 0;
    for (char c : str) {
        int digit;
        if (c >= '0' && c <= '9') {
            digit = c - '0';
        } else if (c >= 'a' && c <= 'f') {
            digit = c - 'a' + 10;
        } else if (c >= 'A' && c <= 'F') {
            digit = c - 'A' + 10;
        } else {
            return std::nullopt;
        }
        value = value * 16 + digit;
    }
    return value;
}

std::vector<std::string> OperandParser::splitList(const std::string& text) {
    std::vector<std::string> parts;
    std::string current;

    for (char c : text) {
        if (c == ',') {
            parts.push_back(trim(current));
            current.clear();
        } else {
            current += c;
        }
    }
    parts.push_back(trim(current));
    return parts;
}

bool OperandParser::isSymbolName(const std::string& text) {
    if (text.empty() || !std::isalpha(static_cast<unsigned char>(text[0]))) {
        return false;
    }
    for (char c : text) {
        if (!std::isalnum(static_cast<unsigned char>(c)) && c != '_') {
            return false;
        }
    }
    return true;
}

std::string OperandParser::trim(const std::string& text) {
    size_t start = text.find_first_not_of(" \t\r");
    if (start == std::string::npos) {
        return "";
    }
    size_t end = text.find_last_not_of(" \t\r");
    return text.substr(start, end - start + 1);
}

} // namespace xeasm
