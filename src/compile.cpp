#include "compile.hpp"

#include <atomic>
#include <cstdio>
#include <exception>
#include <utility>

#include "class_compiler.hpp"
#include "debug_print.hpp"
#include "lexer.hpp"
#include "options.hpp"
#include "parser.hpp"
#include "thread.hpp"
#include "vm.hpp"

std::vector<std::string> compile_class(file_contents_t const& file)
{
    std::vector<token_t> const tokens = tokenize(file);
    class_t const cls = parse(file, tokens);
    return class_compiler_t(file, cls).compile();
}

std::vector<std::string> compile_source(std::string name, std::string_view source)
{
    file_contents_t const file(std::move(name), source);
    return compile_class(file);
}

fs::path output_path(fs::path const& source)
{
    fs::path const& dir = compiler_options().output_dir;
    if(dir.empty())
    {
        fs::path path = source;
        path.replace_extension(".vm");
        return path;
    }

    fs::path name = source.filename();
    name.replace_extension(".vm");
    return dir / name;
}

void compile_file(fs::path const& source)
{
    dprint(trace_log(), "INPUT", source.string());

    file_contents_t const file(source);
    std::vector<std::string> const lines = compile_class(file);

    fs::path const out = output_path(source);
    write_vm_file(out, lines, compiler_options().indent);

    dprint(trace_log(), "OUTPUT", out.string(), lines.size());
}

unsigned compile_all()
{
    std::vector<fs::path> const& sources = compiler_options().source_names;
    std::atomic<unsigned> next_file_i = 0;
    std::atomic<unsigned> failures = 0;

    if(!compiler_options().output_dir.empty())
        fs::create_directories(compiler_options().output_dir);

    parallelize(compiler_options().num_threads,
    [&](std::atomic<bool>& stop)
    {
        while(!stop)
        {
            unsigned const file_i = next_file_i++;
            if(file_i >= sources.size())
                return;

            try
            {
                compile_file(sources[file_i]);
            }
            catch(std::exception const& e)
            {
                stderr_log.write(e.what());
                ++failures;
            }
        }
    });

    return failures;
}
