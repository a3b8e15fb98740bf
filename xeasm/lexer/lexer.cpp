#include "lexer.h"
#include <utility>

namespace xeasm {

Lexer::Lexer(std::string_view source, std::string filename)
    : m_source(source)
    , m_filename(std::move(filename))
    , m_current(0)
    , m_line(1)
    , m_column(1)
{
}

std::vector<SourceRecord> Lexer::tokenize() {
    std::vector<SourceRecord> records;

    while (!isAtEnd()) {
        SourceRecord record;
        if (scanLine(record)) {
            records.push_back(std::move(record));
        }
    }

    return records;
}

bool Lexer::scanLine(SourceRecord& record) {
    SourceLocation loc = currentLocation();
    char first = peek();

    // Comment line
    if (first == '.') {
        skipRestOfLine();
        return false;
    }

    record.location = loc;

    if (isAlpha(first)) {
        record.label = scanField();
    }

    skipWhitespace();
    if (isAtEnd() || peek() == '\n') {
        skipRestOfLine();
        if (record.label.empty()) {
            return false;  // blank line
        }
        // A lone field is the mnemonic, whatever its column
        record.mnemonic = std::move(record.label);
        record.label.clear();
        return true;
    }

    // Indented comment
    if (record.label.empty() && peek() == '.') {
        skipRestOfLine();
        return false;
    }

    record.location.column = m_column;
    record.mnemonic = scanField();

    skipWhitespace();
    if (!isAtEnd() && peek() != '\n') {
        record.operand = scanField();
    }

    // Everything past the operand field is commentary
    skipRestOfLine();
    return true;
}

std::string Lexer::scanField() {
    std::string field;
    bool quoted = false;

    while (!isAtEnd() && peek() != '\n') {
        char c = peek();
        if (!quoted && isBlank(c)) {
            break;
        }
        if (c == '\'') {
            quoted = !quoted;
        }
        field += advance();
    }

    return field;
}

bool Lexer::isAtEnd() const {
    return m_current >= m_source.size();
}

char Lexer::peek() const {
    if (isAtEnd()) return '\0';
    return m_source[m_current];
}

char Lexer::advance() {
    if (isAtEnd()) return '\0';
    char c = m_source[m_current++];
    advanceLocation(c);
    return c;
}

void Lexer::skipWhitespace() {
    while (!isAtEnd() && isBlank(peek())) {
        advance();
    }
}

void Lexer::skipRestOfLine() {
    while (!isAtEnd() && peek() != '\n') {
        advance();
    }
    if (!isAtEnd()) {
        advance();  // the newline itself
    }
}

SourceLocation Lexer::currentLocation() const {
    return SourceLocation(m_filename, m_line, m_column);
}

void Lexer::advanceLocation(char c) {
    if (c == '\n') {
        m_line++;
        m_column = 1;
    } else {
        m_column++;
    }
}

bool Lexer::isAlpha(char c) const {
    return (c >= 'a' && c <= 'z') ||
           (c >= 'A' && c <= 'Z');
}

bool Lexer::isBlank(char c) const {
    return c == ' ' || c == '\t' || c == '\r';
}

} // namespace xeasm
