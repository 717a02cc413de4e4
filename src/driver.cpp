#include "driver.hpp"
#include "assembler.hpp"
#include "error.hpp"
#include "list_writer.hpp"
#include "parser.hpp"
#include <ctime>
#include <fstream>
#include <iomanip>
#include <sstream>
#include <stdexcept>

namespace bbcx {

std::filesystem::path outputPath(const std::filesystem::path& source,
                                 const std::optional<std::filesystem::path>& directory,
                                 const std::string& extension)
{
    std::filesystem::path name = source.stem();
    name += extension;
    if (directory)
        return *directory / name;
    return source.parent_path() / name;
}

std::string readFile(const std::filesystem::path& path)
{
    std::ifstream file(path);
    if (!file.is_open()) {
        throw std::runtime_error("Could not open file: " + path.string());
    }

    std::stringstream buffer;
    buffer << file.rdbuf();
    return buffer.str();
}

int Driver::run()
{
    bool failed = false;
    for (const auto& file : options.files) {
        try {
            process(file);
        } catch (const Error& e) {
            errors << "Error: " << e.what() << "\n";
            for (const auto& offender : e.offenders())
                errors << "    " << offender << "\n";
            failed = true;
        } catch (const std::exception& e) {
            errors << "Error: " << e.what() << "\n";
            failed = true;
        }
    }
    return failed ? 1 : 0;
}

void Driver::process(const std::filesystem::path& file)
{
    log << "Assembling " << file.string() << "...\n";
    const std::string text = readFile(file);
    auto parsed = parseProgram(text);

    std::optional<ListWriter> listing;
    std::filesystem::path listFile;
    if (options.list) {
        listing.emplace(file.filename().string(), std::time(nullptr));
        listing->addSource(parsed);
        listFile = outputPath(file, options.listPath, ".lst");
    }

    Assembly assembly;
    Image image;
    try {
        assembly = Assembler::assemble(takeSourceLines(parsed));
        image = Linker::link(assembly);
    } catch (const Error& e) {
        if (listing) {
            listing->addErrors(e);
            listing->write(listFile);
            log << "Listing written to " << listFile.string() << "\n";
        }
        throw;
    }

    if (listing) {
        listing->addSymbolTable(assembly.symbolTable());
        listing->write(listFile);
        log << "Listing written to " << listFile.string() << "\n";
    }

    if (options.run)
        execute(file, image);
}

void Driver::execute(const std::filesystem::path& file, const Image& image)
{
    Interpreter interpreter(image, input, output);

    std::ofstream traceFile;
    std::filesystem::path tracePath;
    if (options.trace) {
        tracePath = outputPath(file, options.tracePath, ".out");
        traceFile.open(tracePath);
        if (!traceFile.is_open())
            throw std::runtime_error("Could not write trace file: " + tracePath.string());
        interpreter.setTrace(&traceFile);
    }

    try {
        interpreter.run(options.maxSteps);
    } catch (const Error&) {
        output.flush();
        if (options.trace) {
            interpreter.dump(traceFile);
            log << "Trace written to " << tracePath.string() << "\n";
        }
        throw;
    }

    output.flush();
    if (options.trace) {
        interpreter.dump(traceFile);
        log << "Trace written to " << tracePath.string() << "\n";
    }
    log << "Halted at " << std::setw(4) << std::setfill('0') << interpreter.programCounter()
        << std::setfill(' ') << " after " << interpreter.steps() << " instructions\n";
}

} // namespace bbcx
