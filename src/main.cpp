/**
 * Copyright (c) 2026 Cr4nkSt4r - https://github.com/Cr4nkSt4r/Borderlands-4.NcsParser
 */
#include "tpl_parser.h"
#include "utils/fs_utils.h"
#include "utils/log.h"

#include <chrono>
#include <exception>
#include <filesystem>
#include <string>
#include <string_view>

namespace fs = std::filesystem;

struct Settings {
    fs::path input;
    fs::path output = "output.json";
    bool debug = false;
};

static void print_usage() {
    PS_LOG_INFO(
        "Usage:\n" \
        "    tpl_parser <input_file> [-o <output_file>] [--debug]\n\n" \
        "Parse Photoshop TPL files and save the output as JSON.\n\n" \
        "Options:\n" \
        "    -o, --output  path to save the parsed JSON data (default: output.json)\n" \
        "    --debug       enables extra logging\n"
    );
}

static int process_file(const Settings& settings) {
    ps::tpl::ParserDecodeOptions opt{};
    opt.debug = settings.debug;

    try {
        const auto t0 = std::chrono::steady_clock::now();
        const auto res = ps::tpl::TplParser::DecodeTplFile(settings.input, opt);
        if (!res.ok()) {
            PS_LOG_ERROR(
                "Failed: %s (%s)", settings.input.string().c_str(),
                std::string(ps::tpl::decode_status_name(res.status)).c_str()
            );
            return 1;
        }
        const auto t1 = std::chrono::steady_clock::now();
        ps::fs_utils::write_text_file(settings.output, ps::tpl::TplParser::Serialize(res.document));
        const auto t2 = std::chrono::steady_clock::now();
        if (settings.debug) {
            const auto decode_ms =
                std::chrono::duration_cast<std::chrono::milliseconds>(t1 - t0).count();
            const auto write_ms =
                std::chrono::duration_cast<std::chrono::milliseconds>(t2 - t1).count();
            PS_LOG_INFO(
                "Timing %s: decode=%lldms write=%lldms", settings.input.string().c_str(),
                static_cast<long long>(decode_ms), static_cast<long long>(write_ms)
            );
        }
    } catch (const std::exception& e) {
        PS_LOG_ERROR("Failed: %s (%s)", settings.input.string().c_str(), e.what());
        return 1;
    }

    PS_LOG_INFO("Parsed TPL data has been saved to %s", settings.output.string().c_str());
    return 0;
}

int main(int argc, char** argv) {
    if (argc < 2) {
        print_usage();
        return 1;
    }

    const std::string_view first_arg = argv[1];
    if (first_arg == "-h" || first_arg == "--help") {
        print_usage();
        return 0;
    }
    if (!first_arg.empty() && first_arg[0] == '-') {
        PS_LOG_ERROR("First argument must be the input file.");
        print_usage();
        return 2;
    }

    Settings settings;
    settings.input = fs::path(std::string(first_arg));
    for (int i = 2; i < argc; i++) {
        const std::string_view arg = argv[i];
        if (arg == "-o" || arg == "--output") {
            if (i + 1 >= argc) {
                PS_LOG_ERROR("Missing value for %s", std::string(arg).c_str());
                return 2;
            }
            settings.output = fs::path(argv[++i]);
            continue;
        }
        if (arg == "--debug") {
            settings.debug = true;
            continue;
        }
        PS_LOG_ERROR("Unknown option: %s", std::string(arg).c_str());
        return 2;
    }

    if (!fs::is_regular_file(settings.input)) {
        PS_LOG_ERROR("Input does not exist: %s", settings.input.string().c_str());
        return 2;
    }

    return process_file(settings);
}
