#include "utils/utils.h"
#include <sstream>
#include <iomanip>
#include <ctime>
#include <algorithm>
#include <cctype>
#include <cmath>

namespace cryptotrade {
namespace utils {

std::string Formatter::formatAmount(int64_t atoms, int decimals) {
    bool negative = atoms < 0;
    uint64_t mag = negative ? static_cast<uint64_t>(-(atoms + 1)) + 1 : static_cast<uint64_t>(atoms);
    uint64_t scale = 1;
    for (int i = 0; i < decimals; i++) scale *= 10;
    std::string out = std::to_string(mag / scale);
    if (decimals > 0) {
        std::string frac = std::to_string(mag % scale);
        out += "." + std::string(decimals - frac.size(), '0') + frac;
    }
    return negative ? "-" + out : out;
}

std::string Formatter::formatValue(double value, int precision) {
    std::stringstream ss;
    ss << std::fixed << std::setprecision(precision) << value;
    return ss.str();
}

std::string Formatter::formatDuration(uint64_t seconds) {
    if (seconds < 60) return std::to_string(seconds) + "s";
    else if (seconds < 3600) return std::to_string(seconds / 60) + "m " + std::to_string(seconds % 60) + "s";
    else if (seconds < 86400) return std::to_string(seconds / 3600) + "h " + std::to_string((seconds % 3600) / 60) + "m";
    else return std::to_string(seconds / 86400) + "d " + std::to_string((seconds % 86400) / 3600) + "h";
}

std::string Formatter::formatTimestamp(uint64_t seconds) {
    time_t ts = static_cast<time_t>(seconds);
    std::tm tmBuf{};
    gmtime_r(&ts, &tmBuf);
    char buf[64];
    strftime(buf, sizeof(buf), "%Y-%m-%d %H:%M:%S", &tmBuf);
    return std::string(buf);
}

std::string Formatter::formatDate(uint64_t seconds) {
    time_t ts = static_cast<time_t>(seconds);
    std::tm tmBuf{};
    gmtime_r(&ts, &tmBuf);
    char buf[32];
    strftime(buf, sizeof(buf), "%Y-%m-%d", &tmBuf);
    return std::string(buf);
}

std::string Formatter::formatPercent(double value, int precision) {
    std::stringstream ss;
    ss << std::fixed << std::setprecision(precision) << value << "%";
    return ss.str();
}

std::string Formatter::padRight(const std::string& str, size_t width, char padChar) {
    if (str.length() >= width) return str;
    return str + std::string(width - str.length(), padChar);
}

std::string Formatter::toUpper(const std::string& str) {
    std::string result = str;
    std::transform(result.begin(), result.end(), result.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    return result;
}

std::string Formatter::toLower(const std::string& str) {
    std::string result = str;
    std::transform(result.begin(), result.end(), result.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return result;
}

std::string Formatter::trim(const std::string& str) {
    size_t start = str.find_first_not_of(" \t\n\r");
    if (start == std::string::npos) return "";
    size_t end = str.find_last_not_of(" \t\n\r");
    return str.substr(start, end - start + 1);
}

std::vector<std::string> Formatter::split(const std::string& str, char delimiter) {
    std::vector<std::string> result;
    std::stringstream ss(str);
    std::string item;
    while (std::getline(ss, item, delimiter)) result.push_back(item);
    return result;
}

TableFormatter::TableFormatter() : borderChar('|'), headerSeparator('-') {}

void TableFormatter::setHeaders(const std::vector<std::string>& hdrs) {
    headers = hdrs;
    columnWidths.resize(headers.size(), 0);
    for (size_t i = 0; i < headers.size(); i++) {
        columnWidths[i] = std::max(columnWidths[i], headers[i].length());
    }
}

void TableFormatter::addRow(const std::vector<std::string>& row) {
    rows.push_back(row);
    for (size_t i = 0; i < row.size() && i < columnWidths.size(); i++) {
        columnWidths[i] = std::max(columnWidths[i], row[i].length());
    }
}

std::string TableFormatter::render() {
    std::stringstream ss;
    ss << renderRow(headers);
    ss << renderSeparator();
    for (const auto& row : rows) ss << renderRow(row);
    return ss.str();
}

std::string TableFormatter::renderRow(const std::vector<std::string>& row) {
    std::stringstream ss;
    ss << borderChar;
    for (size_t i = 0; i < columnWidths.size(); i++) {
        std::string cell = (i < row.size()) ? row[i] : "";
        ss << " " << Formatter::padRight(cell, columnWidths[i]) << " " << borderChar;
    }
    ss << "\n";
    return ss.str();
}

std::string TableFormatter::renderSeparator() {
    std::stringstream ss;
    ss << borderChar;
    for (size_t width : columnWidths) ss << std::string(width + 2, headerSeparator) << borderChar;
    ss << "\n";
    return ss.str();
}

void TableFormatter::clear() {
    headers.clear();
    rows.clear();
    columnWidths.clear();
}

}
}
