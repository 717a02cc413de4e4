#include "driver.hpp"
#include <iostream>
#include <string>
#include <vector>
#include <argparse.hpp>

int main(int argc, char* argv[]) {
    argparse::ArgumentParser program("bbcx", "0.1.0", argparse::default_arguments::all);

    program.add_argument("files")
        .help("The BBC-X source files to assemble")
        .nargs(argparse::nargs_pattern::at_least_one)
        .required();

    program.add_argument("-l", "--list")
        .help("Write a listing file (<stem>.lst) next to each source")
        .default_value(false)
        .implicit_value(true);

    program.add_argument("--list-path")
        .help("Directory for listing files (implies --list)")
        .default_value(std::string(""));

    program.add_argument("-r", "--run")
        .help("Run each program after it assembles")
        .default_value(false)
        .implicit_value(true);

    program.add_argument("-t", "--trace")
        .help("Write an execution trace (<stem>.out) (implies --run)")
        .default_value(false)
        .implicit_value(true);

    program.add_argument("--trace-path")
        .help("Directory for trace files (implies --trace)")
        .default_value(std::string(""));

    program.add_argument("--max-steps")
        .help("Stop a run after this many instructions, 0 for no limit")
        .default_value(std::size_t{bbcx::DEFAULT_MAX_STEPS})
        .scan<'u', std::size_t>();

    try {
        program.parse_args(argc, argv);
    }
    catch (const std::exception& err) {
        std::cerr << err.what() << std::endl;
        std::cerr << program;
        return 1;
    }

    bbcx::Options options;
    for (const auto& file : program.get<std::vector<std::string>>("files"))
        options.files.emplace_back(file);

    const std::string listPath = program.get<std::string>("--list-path");
    const std::string tracePath = program.get<std::string>("--trace-path");
    if (!listPath.empty())
        options.listPath = listPath;
    if (!tracePath.empty())
        options.tracePath = tracePath;

    options.list = program.get<bool>("--list") || options.listPath.has_value();
    options.trace = program.get<bool>("--trace") || options.tracePath.has_value();
    options.run = program.get<bool>("--run") || options.trace;
    options.maxSteps = program.get<std::size_t>("--max-steps");

    bbcx::Driver driver(options, std::cin, std::cout, std::cout, std::cerr);
    return driver.run();
}
