#include "assembler.hpp"
#include "error.hpp"
#include <algorithm>
#include <map>
#include <type_traits>

namespace bbcx {

namespace {

template <typename Container>
std::string join(const Container& items)
{
    std::string text;
    for (const auto& item : items) {
        if (!text.empty())
            text += ", ";
        if constexpr (std::is_same_v<typename Container::value_type, std::string>)
            text += item;
        else
            text += std::to_string(item);
    }
    return text;
}

void checkUnique(const std::vector<SourceLine>& lines)
{
    std::map<Location, int> locationCounts;
    std::map<std::string, int> labelCounts;
    for (const auto& line : lines) {
        ++locationCounts[line.location];
        if (line.label)
            ++labelCounts[*line.label];
    }

    // std::map keeps both lists sorted: locations ascending, labels lexicographically.
    std::vector<Location> locations;
    std::vector<std::string> labels;
    for (const auto& [location, count] : locationCounts)
        if (count > 1) locations.push_back(location);
    for (const auto& [label, count] : labelCounts)
        if (count > 1) labels.push_back(label);

    if (locations.empty() && labels.empty())
        return;

    std::vector<std::string> offenders;
    for (auto location : locations)
        offenders.push_back(std::to_string(location));
    offenders.insert(offenders.end(), labels.begin(), labels.end());

    throw Error(ErrorKind::DuplicatedSymbols,
                "Multiple definitions: locations: \"" + join(locations) + "\", labels: \"" + join(labels) + "\"",
                offenders);
}

void checkInMemory(const std::vector<SourceLine>& lines)
{
    std::vector<Location> outside;
    for (const auto& line : lines) {
        if (line.location >= MEMORY_SIZE)
            outside.push_back(line.location);
    }
    if (outside.empty())
        return;

    std::sort(outside.begin(), outside.end());
    std::vector<std::string> offenders;
    for (auto location : outside)
        offenders.push_back(std::to_string(location));
    throw Error(ErrorKind::OutOfMemory,
                "locations outside memory: \"" + join(outside) + "\"",
                offenders);
}

} // namespace

Assembly Assembler::assemble(std::vector<SourceLine> lines)
{
    checkUnique(lines);
    checkInMemory(lines);

    SymbolTable symbols;
    CodeMap code;
    for (auto& line : lines) {
        if (line.label)
            symbols.emplace(*line.label, line.location);
        code.emplace(line.location, std::move(line.word));
    }
    return Assembly(std::move(symbols), std::move(code));
}

} // namespace bbcx
