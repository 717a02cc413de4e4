#pragma once
#include "interpreter.hpp"
#include "linker.hpp"
#include <cstddef>
#include <filesystem>
#include <istream>
#include <optional>
#include <ostream>
#include <string>
#include <utility>
#include <vector>

namespace bbcx {

struct Options
{
    std::vector<std::filesystem::path> files;
    bool list = false;
    std::optional<std::filesystem::path> listPath;
    bool run = false;
    bool trace = false;
    std::optional<std::filesystem::path> tracePath;
    std::size_t maxSteps = DEFAULT_MAX_STEPS;
};

// <dir or source directory>/<source stem>.<extension>
std::filesystem::path outputPath(const std::filesystem::path& source,
                                 const std::optional<std::filesystem::path>& directory,
                                 const std::string& extension);

std::string readFile(const std::filesystem::path& path);

/**
 * @brief Runs each source file through parse, list, assemble, link and run.
 *
 * A failing file is reported on the error stream and the next file is
 * processed; run() returns 1 if any file failed.
 */
class Driver
{
    Options options;
    std::istream& input;
    std::ostream& output;
    std::ostream& log;
    std::ostream& errors;

    void execute(const std::filesystem::path& file, const Image& image);

public:
    Driver(Options opts, std::istream& in, std::ostream& out, std::ostream& logStream, std::ostream& err)
        : options(std::move(opts)), input(in), output(out), log(logStream), errors(err) {}

    int run();
    void process(const std::filesystem::path& file);
};

} // namespace bbcx
