#include "extractor.hpp"
#include "rsrc_codec.hpp"
#include "tree_document.hpp"
#include "utils.hpp"
#include <filesystem>
#include <future>
#include <iostream>
#include <mutex>
#include <stdexcept>

namespace fs = std::filesystem;

namespace {

// Serialises console output from pool workers
std::mutex cout_mutex;

struct VerifyResult {
    size_t input_size = 0;
    size_t output_size = 0;
    size_t first_difference = 0;
    bool identical = false;
};

VerifyResult verify_rsrc_file(const std::string& in_path, const CodePage& code_page) {
    {
        std::lock_guard<std::mutex> lock(cout_mutex);
        std::cout << "  verifying " << in_path << "..." << std::endl;
    }
    Bytes original = read_filepath(in_path);
    DecodeResult decoded = decode_rsrc(original, code_page);
    Bytes rebuilt = encode_rsrc(decoded.tree, code_page);

    VerifyResult result;
    result.input_size = original.size();
    result.output_size = rebuilt.size();
    result.identical = original == rebuilt;
    while (result.first_difference < original.size() && result.first_difference < rebuilt.size() &&
           original[result.first_difference] == rebuilt[result.first_difference]) {
        ++result.first_difference;
    }
    return result;
}

} // namespace

ExtractResult extract_rsrc_file(const std::string& in_path, const std::string& out_path, const CodePage& code_page) {
    {
        std::lock_guard<std::mutex> lock(cout_mutex);
        std::cout << "  extracting " << in_path << "..." << std::endl;
    }
    Bytes data = read_filepath(in_path);
    DecodeResult decoded = decode_rsrc(data, code_page);

    fs::path out_file_path = fs::path(out_path) / (fs::path(in_path).stem().string() + ".json");
    save_tree_document(out_file_path, decoded.tree);

    ExtractResult result;
    result.input = in_path;
    result.output = out_file_path.string();
    result.blocks = decoded.tree.children.size();
    result.warnings = std::move(decoded.warnings);
    return result;
}

size_t extract_rsrc_files(const std::vector<std::string>& in_paths, const std::string& out_path,
                          const CodePage& code_page, ThreadPool& pool) {
    fs::create_directories(out_path);

    std::vector<std::future<ExtractResult>> results;
    results.reserve(in_paths.size());
    for (const auto& in_path : in_paths) {
        results.emplace_back(pool.enqueue(extract_rsrc_file, in_path, out_path, std::cref(code_page)));
    }

    // Collect in input order so the report reads the same on every run
    size_t failures = 0;
    for (size_t i = 0; i < results.size(); ++i) {
        try {
            ExtractResult result = results[i].get();
            std::lock_guard<std::mutex> lock(cout_mutex);
            std::cout << "  " << result.input << " -> " << result.output << " (" << result.blocks << " blocks, "
                      << result.warnings.size() << " warnings)" << std::endl;
            for (const auto& warning : result.warnings) {
                std::cout << "    warning: " << format_warning(warning) << std::endl;
            }
        } catch (const std::exception& e) {
            std::lock_guard<std::mutex> lock(cout_mutex);
            std::cerr << "  " << in_paths[i] << ": " << e.what() << std::endl;
            ++failures;
        }
    }
    std::cout << "Done.\n" << std::endl;
    return failures;
}

size_t verify_rsrc_files(const std::vector<std::string>& in_paths, const CodePage& code_page, ThreadPool& pool) {
    std::vector<std::future<VerifyResult>> results;
    results.reserve(in_paths.size());
    for (const auto& in_path : in_paths) {
        results.emplace_back(pool.enqueue(verify_rsrc_file, in_path, std::cref(code_page)));
    }

    size_t failures = 0;
    for (size_t i = 0; i < results.size(); ++i) {
        try {
            VerifyResult result = results[i].get();
            std::lock_guard<std::mutex> lock(cout_mutex);
            if (result.identical) {
                std::cout << "  " << in_paths[i] << ": OK (" << result.input_size << " bytes)" << std::endl;
            } else {
                std::cout << "  " << in_paths[i] << ": MISMATCH (" << result.input_size << " -> " << result.output_size
                          << " bytes, first difference at offset 0x" << std::hex << result.first_difference
                          << std::dec << ")" << std::endl;
                ++failures;
            }
        } catch (const std::exception& e) {
            std::lock_guard<std::mutex> lock(cout_mutex);
            std::cerr << "  " << in_paths[i] << ": " << e.what() << std::endl;
            ++failures;
        }
    }
    std::cout << "Done.\n" << std::endl;
    return failures;
}
