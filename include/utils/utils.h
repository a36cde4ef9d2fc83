#pragma once

#include <string>
#include <vector>
#include <cstdint>

namespace cryptotrade {
namespace utils {

class Formatter {
public:
    // Renders a fixed-point amount exactly, e.g. 499500000000 -> "4995.00000000".
    static std::string formatAmount(int64_t atoms, int decimals = 8);
    static std::string formatValue(double value, int precision = 2);
    static std::string formatDuration(uint64_t seconds);
    static std::string formatTimestamp(uint64_t seconds);
    static std::string formatDate(uint64_t seconds);
    static std::string formatPercent(double value, int precision = 1);
    static std::string padRight(const std::string& str, size_t width, char padChar = ' ');
    static std::string toUpper(const std::string& str);
    static std::string toLower(const std::string& str);
    static std::string trim(const std::string& str);
    static std::vector<std::string> split(const std::string& str, char delimiter);
};

class TableFormatter {
public:
    TableFormatter();
    void setHeaders(const std::vector<std::string>& hdrs);
    void addRow(const std::vector<std::string>& row);
    std::string render();
    std::string renderRow(const std::vector<std::string>& row);
    std::string renderSeparator();
    void clear();
    
private:
    std::vector<std::string> headers;
    std::vector<std::vector<std::string>> rows;
    std::vector<size_t> columnWidths;
    char borderChar;
    char headerSeparator;
};

}
}
