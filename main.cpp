#include <iostream>
#include <string>
#include <vector>
#include <optional>
#include <filesystem>
#include <thread>
#include <algorithm>
#include <stdexcept>

#include "code_page.hpp"
#include "extractor.hpp"
#include "rsrc_builder.hpp"
#include "rsrc_codec.hpp"
#include "rsrc_parser.hpp"
#include "tree_document.hpp"

namespace fs = std::filesystem;

void printUsage(const char* progName) {
    std::cerr << "A tool to decode and rebuild LabVIEW RSRC files (VI, CTL, LLB, ...)." << std::endl;
    std::cerr << "Usage: " << progName << " <command> [options]" << std::endl << std::endl;
    std::cerr << "Commands:" << std::endl;
    std::cerr << "  info       Print the container headers and block list of an RSRC file." << std::endl;
    std::cerr << "  extract    Decode RSRC files into JSON tree documents." << std::endl;
    std::cerr << "  repack     Rebuild an RSRC file from a JSON tree document." << std::endl;
    std::cerr << "  verify     Check that RSRC files survive a decode/encode round trip unchanged." << std::endl << std::endl;
    std::cerr << "Options for 'info':" << std::endl;
    std::cerr << "  " << progName << " info <rsrc_file> [-v]" << std::endl;
    std::cerr << "    -v, --verbose        Also list every section." << std::endl << std::endl;
    std::cerr << "Options for 'extract':" << std::endl;
    std::cerr << "  " << progName << " extract <rsrc_file>... [-d <path>] [-c <codepage>]" << std::endl;
    std::cerr << "    -d, --dest <path>    The directory to write <name>.json documents to (default: current)." << std::endl << std::endl;
    std::cerr << "Options for 'repack':" << std::endl;
    std::cerr << "  " << progName << " repack <json_file> <output_file> [--layout legacy|extended] [-c <codepage>]" << std::endl;
    std::cerr << "    --layout <name>      Container layout to write (default: as recorded in the document)." << std::endl << std::endl;
    std::cerr << "Options for 'verify':" << std::endl;
    std::cerr << "  " << progName << " verify <rsrc_file>... [-c <codepage>]" << std::endl << std::endl;
    std::cerr << "General Options:" << std::endl;
    std::cerr << "  -c, --codepage <name>  Text encoding of strings in the file (default: " << DEFAULT_CODE_PAGE << ")." << std::endl;
    std::cerr << "                         One of:";
    for (const auto& name : code_page_names()) {
        std::cerr << " " << name;
    }
    std::cerr << std::endl;
    std::cerr << "  -h, --help             Show this help message and exit." << std::endl;
}

int main(int argc, char* argv[]) {
    // Handle help options in priority
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "-h" || arg == "--help") {
            printUsage(argv[0]);
            return 0;
        }
    }

    if (argc < 2) {
        std::cerr << "Error: No command specified. Use 'info', 'extract', 'repack' or 'verify'." << std::endl;
        printUsage(argv[0]);
        return 1;
    }

    try {
        std::string command = argv[1];
        if (command != "info" && command != "extract" && command != "repack" && command != "verify") {
            std::cerr << "Error: Unknown command '" << command << "'. Use 'info', 'extract', 'repack' or 'verify'." << std::endl;
            printUsage(argv[0]);
            return 1;
        }

        std::vector<std::string> positional;
        std::optional<std::string> dest_path;
        std::optional<std::string> layout_name_arg;
        std::string codepage_name = DEFAULT_CODE_PAGE;
        bool verbose = false;

        for (int i = 2; i < argc; ++i) {
            std::string arg = argv[i];
            if (arg == "-v" || arg == "--verbose") {
                verbose = true;
            } else if (arg == "-d" || arg == "--dest" || arg == "-c" || arg == "--codepage" || arg == "--layout") {
                if (i + 1 >= argc) {
                    std::cerr << "Error: " << arg << " option requires an argument." << std::endl;
                    printUsage(argv[0]);
                    return 1;
                }
                std::string value = argv[++i];
                if (arg == "-d" || arg == "--dest") {
                    dest_path = value;
                } else if (arg == "--layout") {
                    layout_name_arg = value;
                } else {
                    codepage_name = value;
                }
            } else {
                positional.push_back(arg);
            }
        }

        const CodePage& code_page = code_page_by_name(codepage_name);

        if (command == "info") {
            if (positional.size() != 1) {
                std::cerr << "Error: 'info' takes exactly one input file." << std::endl;
                printUsage(argv[0]);
                return 1;
            }
            RsrcContainer container(read_filepath(positional[0]));
            container.print_info(verbose);
            for (const auto& warning : container.warnings) {
                std::cout << "warning: " << format_warning(warning) << std::endl;
            }

        } else if (command == "extract" || command == "verify") {
            if (positional.empty()) {
                std::cerr << "Error: No input RSRC file specified for " << command << " command." << std::endl;
                printUsage(argv[0]);
                return 1;
            }

            // Files are independent; one pool task per file
            size_t num_threads = std::max(1u, std::thread::hardware_concurrency() / 2);
            num_threads = std::min(num_threads, positional.size());
            ThreadPool pool(num_threads);
            std::cout << "Initializing thread pool with " << num_threads << " threads." << std::endl << std::endl;

            size_t failures;
            if (command == "extract") {
                std::cout << "Extracting " << positional.size() << " file(s) with code page " << code_page.name()
                          << "..." << std::endl;
                failures = extract_rsrc_files(positional, dest_path.value_or("."), code_page, pool);
            } else {
                std::cout << "Verifying " << positional.size() << " file(s) with code page " << code_page.name()
                          << "..." << std::endl;
                failures = verify_rsrc_files(positional, code_page, pool);
            }
            if (failures > 0) {
                std::cerr << failures << " of " << positional.size() << " file(s) failed." << std::endl;
                return 1;
            }

        } else {
            if (positional.size() != 2) {
                std::cerr << "Error: Invalid number of arguments for repack command." << std::endl;
                std::cerr << "Usage: " << argv[0] << " repack <json_file> <output_file>" << std::endl;
                return 1;
            }
            fs::path input_file(positional[0]);
            fs::path output_file(positional[1]);
            if (!fs::exists(input_file)) {
                throw std::runtime_error("ERROR: '" + input_file.string() + "' not found");
            }

            std::cout << "Loading tree document " << input_file.string() << "..." << std::endl;
            IntermediateNode root = load_tree_document(input_file);
            ContainerLayout layout = layout_name_arg.has_value() ? layout_from_name(*layout_name_arg) : tree_layout(root);

            std::cout << "Building " << layout_name(layout) << " container..." << std::endl;
            RsrcFile file = tree_to_file(root, layout, code_page);
            RsrcBuilder builder(file);
            builder.build(output_file);
            std::cout << "Wrote " << output_file.string() << " (" << fs::file_size(output_file) << " bytes)." << std::endl;
        }

    } catch (const std::exception& e) {
        std::cerr << "An error occurred: " << e.what() << std::endl;
        return 1;
    }

    return 0;
}
