#include "yeon_json_import.h"
#include "yeon_json_export.h"
#include "yeon_graph_file.h"
#include "yeon_node_registry.h"
#include <iostream>
#include <fstream>
#include <string>
#include <cstring>

static const char* VERSION = "0.1.0";

static void printUsage() {
    std::cout << "Yeon Compiler v" << VERSION << "\n"
              << "Usage: YeonCompiler <input.json> [-o output.ygb]\n"
              << "       YeonCompiler --export-json <input.ygb> [-o output.json]\n"
              << "\n"
              << "Options:\n"
              << "  -o <path>    Output file path (default: story.ygb)\n"
              << "  --validate   Validate only, do not write output\n"
              << "  --export-json <path>  Decode a .ygb graph back to JSON (default: stdout)\n"
              << "  -h, --help   Show this help message\n"
              << "  --version    Show version number\n";
}

static void printErrors(const std::vector<std::string>& errors) {
    for (const auto& err : errors) {
        std::cerr << "error: " << err << std::endl;
    }
}

// .ygb → JSON
static int exportJson(const std::string& inputPath, const std::string& outputPath) {
    Yeon::NodeRegistry registry;
    std::vector<std::string> errors;
    auto graph = Yeon::loadGraphFile(inputPath, registry, errors);
    if (!graph) {
        printErrors(errors);
        std::cerr << "\n" << errors.size() << " error(s). Export aborted." << std::endl;
        return 1;
    }

    std::string text = Yeon::JsonExport::toJsonString(*graph);
    if (outputPath.empty()) {
        std::cout << text << std::endl;
        return 0;
    }

    std::ofstream ofs(outputPath);
    if (!ofs.is_open()) {
        std::cerr << "Failed to write JSON: " << outputPath << std::endl;
        return 1;
    }
    ofs << text << std::endl;
    std::cout << "Exported: " << outputPath << std::endl;
    return 0;
}

int main(int argc, char* argv[]) {
    // help/version 플래그 체크 (위치 무관)
    for (int i = 1; i < argc; ++i) {
        if (std::strcmp(argv[i], "-h") == 0 || std::strcmp(argv[i], "--help") == 0) {
            printUsage();
            return 0;
        }
        if (std::strcmp(argv[i], "--version") == 0) {
            std::cout << "YeonCompiler " << VERSION << std::endl;
            return 0;
        }
    }

    if (argc < 2) {
        printUsage();
        return 1;
    }

    std::string inputPath;
    std::string outputPath;
    std::string exportInput;
    bool validateOnly = false;

    // 옵션 파싱
    for (int i = 1; i < argc; ++i) {
        if (std::strcmp(argv[i], "-o") == 0 && i + 1 < argc) {
            outputPath = argv[++i];
        } else if (std::strcmp(argv[i], "--validate") == 0) {
            validateOnly = true;
        } else if (std::strcmp(argv[i], "--export-json") == 0 && i + 1 < argc) {
            exportInput = argv[++i];
        } else if (argv[i][0] != '-' && inputPath.empty()) {
            inputPath = argv[i];
        } else {
            std::cerr << "error: unknown option '" << argv[i] << "'" << std::endl;
            printUsage();
            return 1;
        }
    }

    if (!exportInput.empty()) {
        return exportJson(exportInput, outputPath);
    }

    if (inputPath.empty()) {
        printUsage();
        return 1;
    }
    if (outputPath.empty()) outputPath = "story.ygb";

    Yeon::NodeRegistry registry;
    std::vector<std::string> errors;
    auto graph = Yeon::JsonImport::fromFile(inputPath, registry, errors);
    if (!graph) {
        printErrors(errors);
        std::cerr << "\n" << errors.size() << " error(s). Compilation aborted." << std::endl;
        return 1;
    }

    // 구조 검증
    errors = graph->validate();
    if (!errors.empty()) {
        printErrors(errors);
        std::cerr << "\n" << errors.size() << " error(s). Compilation aborted." << std::endl;
        return 1;
    }

    if (validateOnly) {
        std::cout << inputPath << ": OK (" << graph->getNodes().size() << " nodes, "
                  << graph->getConnections().size() << " connections)" << std::endl;
        return 0;
    }

    if (!Yeon::saveGraphFile(*graph, outputPath)) {
        std::cerr << "Failed to write graph: " << outputPath << std::endl;
        return 1;
    }

    std::cout << "Compiled: " << outputPath << std::endl;
    return 0;
}
