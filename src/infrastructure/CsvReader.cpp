#include "infrastructure/CsvReader.hpp"

namespace crmterm::infrastructure {

CsvReader::CsvReader(std::istream& input) : m_input(input) {}

bool CsvReader::next(std::vector<std::string>& record) {
    record.clear();
    std::string field;
    bool inQuotes = false;
    bool fieldStarted = false;
    const int startLine = m_line;

    int c = 0;
    while ((c = m_input.get()) != std::char_traits<char>::eof()) {
        const char ch = static_cast<char>(c);

        if (inQuotes) {
            if (ch == '"') {
                if (m_input.peek() == '"') {
                    m_input.get();
                    field += '"';
                } else {
                    inQuotes = false;
                }
            } else {
                if (ch == '\n') {
                    ++m_line;
                }
                field += ch;
            }
            continue;
        }

        if (ch == '"' && !fieldStarted) {
            inQuotes = true;
            fieldStarted = true;
            continue;
        }
        if ((ch == ' ' || ch == '\t') && !fieldStarted) {
            continue;
        }
        if (ch == ',') {
            record.push_back(field);
            field.clear();
            fieldStarted = false;
            continue;
        }
        if (ch == '\r' && m_input.peek() == '\n') {
            continue;
        }
        if (ch == '\n' || ch == '\r') {
            ++m_line;
            if (record.empty() && !fieldStarted) {
                continue; // blank line
            }
            record.push_back(field);
            return true;
        }
        fieldStarted = true;
        field += ch;
    }

    if (inQuotes) {
        throw CsvError("line " + std::to_string(startLine) + ": unterminated quoted field");
    }
    if (record.empty() && !fieldStarted) {
        return false;
    }
    record.push_back(field);
    return true;
}

} // namespace crmterm::infrastructure
