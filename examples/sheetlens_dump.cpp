/**
 * @file sheetlens_dump.cpp
 * @brief 把 XLSX 文件解析结果输出为 JSON
 *
 * 用法：
 *   sheetlens_dump <input.xlsx> [-o out.json] [--pretty] [--log-level L]
 */

#include "sheetlens/cli/WorkbookJson.hpp"
#include "sheetlens/core/Exception.hpp"
#include "sheetlens/reader/XLSXReader.hpp"
#include "sheetlens/utils/FileWrapper.hpp"
#include "sheetlens/utils/Logger.hpp"
#include <iostream>
#include <string>

namespace {

struct Arguments {
    std::string input;
    std::string output;
    bool pretty = false;
    sheetlens::Logger::Level log_level = sheetlens::Logger::Level::WARN;
};

void printUsage() {
    std::cerr << "Usage: sheetlens_dump <input.xlsx> [-o out.json] [--pretty] [--log-level L]" << std::endl;
}

bool parseArguments(int argc, char** argv, Arguments& args) {
    for (int i = 1; i < argc; ++i) {
        const std::string arg = argv[i];
        if (arg == "-o" || arg == "--output") {
            if (i + 1 >= argc) {
                std::cerr << "Error: " << arg << " requires a path" << std::endl;
                return false;
            }
            args.output = argv[++i];
        } else if (arg == "--pretty") {
            args.pretty = true;
        } else if (arg == "--log-level") {
            if (i + 1 >= argc || !sheetlens::Logger::parseLevel(argv[i + 1], args.log_level)) {
                std::cerr << "Error: --log-level expects trace/debug/info/warn/error/critical/off" << std::endl;
                return false;
            }
            ++i;
        } else if (!arg.empty() && arg[0] == '-') {
            std::cerr << "Error: unknown option " << arg << std::endl;
            return false;
        } else if (args.input.empty()) {
            args.input = arg;
        } else {
            std::cerr << "Error: unexpected argument " << arg << std::endl;
            return false;
        }
    }
    if (args.input.empty()) {
        printUsage();
        return false;
    }
    return true;
}

} // namespace

int main(int argc, char** argv) {
    Arguments args;
    if (!parseArguments(argc, argv, args)) {
        return 1;
    }

    // 日志只写 stderr，不生成日志文件，避免污染 stdout 上的 JSON
    sheetlens::Logger::getInstance().initialize("", args.log_level, true);

    try {
        auto workbook = sheetlens::reader::XLSXReader::parseFile(args.input);
        if (!workbook) {
            std::cerr << "Error parsing " << args.input << ": " << workbook.error().fullMessage() << std::endl;
            return 1;
        }

        const std::string json = sheetlens::cli::workbookToJson(workbook.value(), args.pretty);

        if (args.output.empty()) {
            std::cout << json;
            if (!args.pretty) {
                std::cout << '\n';
            }
            std::cout.flush();
            if (!std::cout) {
                std::cerr << "Error writing to stdout" << std::endl;
                return 1;
            }
        } else {
            auto written = sheetlens::utils::writeFileBytes(args.output, json.data(), json.size());
            if (!written) {
                std::cerr << "Error writing " << args.output << ": " << written.error().fullMessage() << std::endl;
                return 1;
            }
            std::cerr << "Written: " << args.output << std::endl;
        }
    } catch (const sheetlens::core::SheetLensException& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }

    sheetlens::Logger::getInstance().shutdown();
    return 0;
}
