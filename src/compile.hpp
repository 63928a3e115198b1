#ifndef COMPILE_HPP
#define COMPILE_HPP

// Ties the passes together: source text in, VM instructions out.

#include <string>
#include <string_view>
#include <vector>

#include "file.hpp"

// Tokenizes, parses, and compiles the single class in 'file'.
// Throws compiler_error_t on the first error.
std::vector<std::string> compile_class(file_contents_t const& file);

// Same, for text that isn't on disk.
std::vector<std::string> compile_source(std::string name, std::string_view source);

// Where the .vm file for 'source' goes, honoring --output-dir.
fs::path output_path(fs::path const& source);

// Compiles and writes one file.
void compile_file(fs::path const& source);

// Compiles every file in 'compiler_options().source_names'.
// A failing file is reported on stderr and doesn't stop the others.
// Returns the number of files that failed.
unsigned compile_all();

#endif
