#ifndef FILE_HPP
#define FILE_HPP

#include <cstdint>
#include <cstdio>
#include <filesystem>
#include <functional>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

namespace fs = ::std::filesystem;

bool read_binary_file(char const* filename, std::function<void*(std::size_t)> const& alloc);

// Lists the .jack files directly inside 'dir', sorted by name.
std::vector<fs::path> jack_files_in(fs::path const& dir);

bool is_jack_file(fs::path const& path);

// Holds one compilation unit's source text and its filename.
// The buffer is padded with two null characters, which the lexer relies on.
struct file_contents_t
{
public:
    file_contents_t() = default;

    // Reads the file from disk.
    explicit file_contents_t(fs::path path);

    // Copies 'source' into the buffer; 'name' is only used in messages.
    file_contents_t(std::string name, std::string_view source);

    file_contents_t(file_contents_t&&) = default;
    file_contents_t& operator=(file_contents_t&&) = default;

    fs::path const& path() const { return m_path; }
    std::string const& name() const { return m_name; }
    char const* source() const { return m_alloc.get(); }

    // Excludes the padding.
    std::size_t size() const { return m_size; }

private:
    void alloc(std::size_t size);

    fs::path m_path;
    std::string m_name;
    std::size_t m_size = 0;
    std::unique_ptr<char[]> m_alloc;
};

#endif
