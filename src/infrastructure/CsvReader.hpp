/**
 * @file CsvReader.hpp
 * @brief Minimal RFC 4180 record reader used by the account import.
 */

#pragma once

#include <istream>
#include <stdexcept>
#include <string>
#include <vector>

namespace crmterm::infrastructure {

class CsvError : public std::runtime_error {
public:
    explicit CsvError(const std::string& message) : std::runtime_error(message) {}
};

/**
 * @class CsvReader
 * @brief Reads comma-separated records one at a time.
 *
 * Quoted fields may contain commas, newlines and doubled quotes. Leading
 * spaces of a field are dropped and blank lines are skipped. Records may have
 * different field counts.
 */
class CsvReader {
public:
    explicit CsvReader(std::istream& input);

    /**
     * @brief Reads the next record into @p record.
     * @return false at end of input.
     * @throws CsvError on an unterminated quoted field.
     */
    bool next(std::vector<std::string>& record);

    /** @brief Physical line the reader stopped at (1-based). */
    int line() const { return m_line; }

private:
    std::istream& m_input;
    int m_line = 1;
};

} // namespace crmterm::infrastructure
