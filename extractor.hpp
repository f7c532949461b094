#ifndef EXTRACTOR_HPP
#define EXTRACTOR_HPP

#include "code_page.hpp"
#include "errors.hpp"
#include "thread_pool.hpp"
#include <string>
#include <vector>

struct ExtractResult {
    std::string input;
    std::string output;
    size_t blocks = 0;
    std::vector<DecodeWarning> warnings;
};

// Decodes one RSRC file and writes its tree document as <out_path>/<stem>.json.
ExtractResult extract_rsrc_file(const std::string& in_path, const std::string& out_path, const CodePage& code_page);

// One pool task per input file. Returns the number of files that failed.
size_t extract_rsrc_files(const std::vector<std::string>& in_paths, const std::string& out_path,
                          const CodePage& code_page, ThreadPool& pool);

// Decodes and re-encodes each file, comparing the result with the input bytes.
// Returns the number of files that did not reproduce.
size_t verify_rsrc_files(const std::vector<std::string>& in_paths, const CodePage& code_page, ThreadPool& pool);

#endif // EXTRACTOR_HPP
