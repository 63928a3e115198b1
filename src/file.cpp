#include "file.hpp"

#include <algorithm>
#include <cctype>
#include <cstring>
#include <stdexcept>

#include "guard.hpp"
#include "format.hpp"

bool read_binary_file(char const* filename, std::function<void*(std::size_t)> const& alloc)
{
    FILE* fp = std::fopen(filename, "rb");
    if(!fp)
        return false;
    auto scope_guard = make_scope_guard([&]{ std::fclose(fp); });

    // Get the file size
    if(std::fseek(fp, 0, SEEK_END) != 0)
        return false;
    long const file_size = std::ftell(fp);
    if(file_size < 0 || std::fseek(fp, 0, SEEK_SET) != 0)
        return false;

    void* data = alloc(std::size_t(file_size));

    if(!data)
        return false;

    return file_size == 0 || std::fread(data, file_size, 1, fp) == 1;
}

bool is_jack_file(fs::path const& path)
{
    std::string ext = path.extension().string();
    std::transform(ext.begin(), ext.end(), ext.begin(),
                   [](unsigned char c){ return std::tolower(c); });
    return ext == ".jack";
}

std::vector<fs::path> jack_files_in(fs::path const& dir)
{
    std::error_code ec;
    fs::directory_iterator it(dir, ec);
    if(ec)
        throw std::runtime_error(fmt("Unable to read directory %: %", dir.string(), ec.message()));

    std::vector<fs::path> ret;
    for(fs::directory_entry const& entry : it)
        if(entry.is_regular_file() && is_jack_file(entry.path()))
            ret.push_back(entry.path());

    std::sort(ret.begin(), ret.end());
    return ret;
}

file_contents_t::file_contents_t(fs::path path)
: m_path(std::move(path))
, m_name(m_path.string())
{
    if(!read_binary_file(m_path.string().c_str(), [this](std::size_t size)
    {
        alloc(size);
        return reinterpret_cast<void*>(m_alloc.get());
    }))
    {
        throw std::runtime_error(fmt("Unable to open file: %", m_name));
    }
}

file_contents_t::file_contents_t(std::string name, std::string_view source)
: m_path(name)
, m_name(std::move(name))
{
    alloc(source.size());
    if(!source.empty())
        std::memcpy(m_alloc.get(), source.data(), source.size());
}

void file_contents_t::alloc(std::size_t size)
{
    m_size = size;
    m_alloc.reset(new char[size + 2]);
    m_alloc[size] = m_alloc[size+1] = '\0';
}
