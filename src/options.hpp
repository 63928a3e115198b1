#ifndef OPTIONS_HPP
#define OPTIONS_HPP

// Compiler options.

#include <vector>
#include <string>
#include <filesystem>

namespace fs = ::std::filesystem;

struct options_t
{
    int num_threads = 1;
    bool build_time = false;
    bool werror = false;

    // Traces every input file and variable resolution on stdout.
    bool verbose = false;

    // Indents everything but 'function' and 'label' lines in .vm output.
    bool indent = true;

    // Parses 'a + b + c' left to right instead of stopping after one operator.
    bool chain_operators = false;

    // Empty means "next to the source file".
    fs::path output_dir;

    std::vector<fs::path> source_names;
};

extern options_t _options;
inline options_t const& compiler_options() { return _options; }

#endif
