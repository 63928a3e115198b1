// This project is licensed under the Boost Software License.
// See license.txt for details.

#include <algorithm>
#include <cstdlib>
#include <chrono>
#include <iostream>
#include <fstream>
#include <filesystem>

#include <boost/program_options.hpp>

#include "compile.hpp"
#include "file.hpp"
#include "format.hpp"
#include "options.hpp"

#ifndef VERSION
#define VERSION "unknown"
#endif

namespace po = boost::program_options;
namespace fs = std::filesystem;

void handle_options(fs::path dir, po::options_description const& cfg_desc, po::variables_map const& vm, int depth = 0)
{
    if(depth > 16)
        throw std::runtime_error("Configuration files nested too deeply.");

    if(vm.count("input"))
    {
        for(std::string const& name : vm["input"].as<std::vector<std::string>>())
        {
            fs::path const path = dir / fs::path(name);
            std::string const ext = path.extension().string();

            if(fs::is_directory(path))
            {
                std::vector<fs::path> files = jack_files_in(path);
                _options.source_names.insert(_options.source_names.end(), files.begin(), files.end());
            }
            else if(is_jack_file(path))
                _options.source_names.push_back(path);
            else if(ext == ".cfg")
            {
                std::ifstream ifs(path.string(), std::ios::in);
                if(ifs)
                {
                    fs::path cfg_dir = path;
                    cfg_dir.remove_filename();

                    po::variables_map cfg_vm;
                    po::store(po::parse_config_file(ifs, cfg_desc), cfg_vm);
                    po::notify(cfg_vm);

                    handle_options(cfg_dir, cfg_desc, cfg_vm, depth + 1);
                }
                else
                    throw std::runtime_error(fmt("Unable to open configuration file: %", name));
            }
            else
                throw std::runtime_error(fmt("Unknown file type: %", name));
        }
    }

    if(vm.count("output-dir"))
        _options.output_dir = dir / fs::path(vm["output-dir"].as<std::string>());

    if(vm.count("threads"))
        _options.num_threads = std::clamp(vm["threads"].as<int>(), 1, 1024); // Clamp to some sufficiently high value

    if(vm.count("build-time"))
        _options.build_time = true;

    if(vm.count("error-on-warning"))
        _options.werror = true;

    if(vm.count("verbose"))
        _options.verbose = true;

    if(vm.count("no-indent"))
        _options.indent = false;

    if(vm.count("chain-operators"))
        _options.chain_operators = true;
}

int main(int argc, char** argv)
{
    auto entry_time = std::chrono::system_clock::now();
    unsigned failures = 0;

#ifdef NDEBUG
    try
#endif
    {
        /////////////////////////////
        // Handle program options: //
        /////////////////////////////
        {
            po::options_description cmdline("Instructional Flags");
            cmdline.add_options()
                ("help,h", "produce help message")
                ("version,v", "version")
            ;

            po::options_description basic("Options");
            basic.add_options()
                ("output-dir,o", po::value<std::string>(), "directory for .vm files")
                ("threads,j", po::value<int>(), "number of compiler threads")
                ("error-on-warning,W", "turn warnings into errors")
                ("verbose,V", "trace inputs and name resolution")
                ("no-indent", "don't indent .vm output")
                ("chain-operators", "allow more than one operator per expression")
            ;

            po::options_description basic_hidden("Hidden options");
            basic_hidden.add_options()
                ("input,i", po::value<std::vector<std::string>>()->multitoken(), "input file")
                ("build-time,B", "print compiler execution time")
            ;

            po::options_description cmdline_full;
            cmdline_full.add(cmdline).add(basic).add(basic_hidden);

            po::options_description config_full;
            config_full.add(basic).add(basic_hidden);

            po::positional_options_description p;
            p.add("input", -1);

            po::variables_map vm;
            po::store(po::command_line_parser(argc, argv).options(cmdline_full).positional(p).run(), vm);
            po::notify(vm);

            if(vm.count("help"))
            {
                std::cout << "Usage: jackc [options] <file.jack | directory | file.cfg>...\n";
                po::options_description visible;
                visible.add(cmdline).add(basic);
                std::cout << visible << std::endl;
                return EXIT_SUCCESS;
            }

            if(vm.count("version"))
            {
                std::cout << "jackc " << VERSION << " (" << __DATE__ << ")\n";
                std::cout <<
                    "This is free software. "
                    "There is no warranty.\n";
                return EXIT_SUCCESS;
            }

            handle_options(fs::path(), config_full, vm);

            if(compiler_options().source_names.empty())
                throw std::runtime_error("No input files.");
        }

        ////////////////////////////////////
        // OK! Now to do the actual work: //
        ////////////////////////////////////

        failures = compile_all();

        if(failures)
            std::fprintf(stderr, "%u of %u files failed to compile.\n",
                         failures, unsigned(compiler_options().source_names.size()));
    }
#ifdef NDEBUG // In debug mode, we get better stack traces without catching.
    catch(std::exception& e)
    {
        std::fprintf(stderr, "%s\n", e.what());
        return EXIT_FAILURE;
    }
#endif

    if(compiler_options().build_time)
    {
        auto now = std::chrono::system_clock::now();
        unsigned long long const ms = std::chrono::duration_cast<std::chrono::milliseconds>(now - entry_time).count();
        std::printf("time total:     %8lli ms\n", ms);
    }

    return failures ? EXIT_FAILURE : EXIT_SUCCESS;
}
