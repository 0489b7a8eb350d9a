#include "base/Base.h"

#include <argparse/argparse.hpp>
#include <fstream>

#include "Exporter.h"
#include "format/ElfFile.h"

using JSON = nlohmann::json;

using namespace segmap;

struct ProgramOptions {
    std::string mTarget;
    std::string mOutput;
    bool        mNotes{true};
    bool        mVerbose{};
};

ProgramOptions init_program(int argc, char* argv[]) {
    argparse::ArgumentParser args("segmap", "1.0.0");

    // clang-format off

    args.add_argument("target")
        .help("Path to a valid ELF file.")
        .required();
    args.add_argument("-o", "--output")
        .help("Path to save the result, in JSON format.")
        .required();
    args.add_argument("--no-notes")
        .help("Do not decode PT_NOTE segments.")
        .default_value(false)
        .implicit_value(true);
    args.add_argument("-v", "--verbose")
        .help("Log every decoded segment and note.")
        .default_value(false)
        .implicit_value(true);

    // clang-format on

    args.parse_args(argc, argv);

    return ProgramOptions{
        args.get<std::string>("target"),
        args.get<std::string>("-o"),
        !args.get<bool>("--no-notes"),
        args.get<bool>("--verbose")
    };
}

void init_logger() {
    auto logger = spdlog::stdout_color_st("segmap");
    logger->set_pattern("[%T.%e %^%l%$] %v");
#ifndef NDEBUG
    logger->set_level(spdlog::level::debug);
#endif
    spdlog::set_default_logger(logger);
}

bool save_to_json(const std::string& fileName, const JSON& result) {
    std::ofstream file(fileName, std::ios::trunc);
    if (!file.is_open()) {
        spdlog::error("Failed to open {}!", fileName);
        return false;
    }
    file << result.dump(4);
    file.close();
    spdlog::info("Results have been saved to: {}", fileName);
    return true;
}

int main(int argc, char* argv[]) {

    init_logger();

    ProgramOptions options;
    try {
        options = init_program(argc, argv);
    } catch (const std::runtime_error& e) {
        spdlog::error(e.what());
        return -1;
    }

    if (options.mVerbose) {
        spdlog::set_level(spdlog::level::debug);
    }
    if (!options.mOutput.ends_with(".json")) {
        options.mOutput += ".json";
    }

    spdlog::info("{:<12}{}", "Input file:", options.mTarget);

    format::ElfFile image(options.mTarget);
    if (!image.isValid()) {
        spdlog::error("Unable to load input file.");
        return -1;
    }

    JSON result;
    try {
        result = exportImage(image, ExportArguments{options.mNotes});
        spdlog::info("{:<12}{}", "Segments:", image.getSegments().size());
        if (auto interp = image.getInterpreter()) {
            spdlog::info("{:<12}{}", "Interpreter:", *interp);
        }
    } catch (const std::runtime_error& e) {
        spdlog::error(e.what());
        return -1;
    }

    if (!save_to_json(options.mOutput, result)) return -1;

    spdlog::info("All works done...");

    return 0;
}
