#include "list_writer.hpp"
#include <algorithm>
#include <cctype>
#include <fstream>
#include <iomanip>
#include <sstream>
#include <stdexcept>

namespace bbcx {

namespace {

std::string upper(std::string text)
{
    std::transform(text.begin(), text.end(), text.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    return text;
}

std::string rtrim(std::string text)
{
    while (!text.empty() && (text.back() == ' ' || text.back() == '\t'))
        text.pop_back();
    return text;
}

} // namespace

std::string ListWriter::timestamp(std::time_t when)
{
    std::tm utc{};
    gmtime_r(&when, &utc);
    std::ostringstream oss;
    oss << std::put_time(&utc, "%a %d %b %Y %H:%M");
    return upper(oss.str());
}

ListWriter::ListWriter(const std::string& fileName, std::time_t when)
{
    std::ostringstream oss;
    oss << std::string(14, ' ') << std::left << std::setw(42) << fileName << ' ' << timestamp(when);
    addText(upper(oss.str()));
    addText("");
}

void ListWriter::addText(const std::string& text)
{
    std::size_t start = 0;
    while (true) {
        std::size_t end = text.find('\n', start);
        listing.push_back(rtrim(text.substr(start, end == std::string::npos ? std::string::npos : end - start)));
        if (end == std::string::npos)
            break;
        start = end + 1;
    }
}

void ListWriter::addSource(const std::vector<ParsedLine>& lines)
{
    for (const auto& parsed : lines) {
        std::ostringstream oss;
        oss << std::setw(5) << parsed.lineNumber;
        if (parsed.failed()) {
            oss << "  *****  " << *parsed.error << '\n' << parsed.text;
        } else {
            oss << std::string(9, ' ') << (parsed.line ? parsed.line->to_string() : parsed.text);
        }
        addText(oss.str());
    }
}

void ListWriter::addSymbolTable(const SymbolTable& symbols)
{
    addText("\nSYMBOL TABLE:\n=============\n");
    for (const auto& [label, location] : symbols) {
        std::ostringstream oss;
        oss << std::left << std::setw(8) << label << std::right
            << std::oct << std::setw(8) << std::setfill('0') << location;
        addText(oss.str());
    }
}

void ListWriter::addErrors(const Error& error)
{
    addText("\n***** Errors: *****\n");
    addText(error.what());
    for (const auto& offender : error.offenders())
        addText("    " + offender);
}

std::string ListWriter::str() const
{
    std::string text;
    for (const auto& line : listing) {
        text += line;
        text += '\n';
    }
    return text;
}

void ListWriter::write(const std::filesystem::path& path) const
{
    std::ofstream file(path);
    if (!file.is_open())
        throw std::runtime_error("Could not write listing file: " + path.string());
    file << str();
}

} // namespace bbcx
