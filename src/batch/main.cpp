#include "pluscode/batch/script.hpp"
#include "pluscode/batch/runner.hpp"
#include <iostream>
#include <string>
#include <cstring>
#include <cstdlib>
#include <memory>

void print_usage(const char* program) {
    std::cerr << "Usage: " << program << " [-v] [-s] [-l LEN] [-e SCRIPT] [<file>]\n";
    std::cerr << "  -v         Verbose mode (print each command to stderr)\n";
    std::cerr << "  -s         Print statistics to stderr\n";
    std::cerr << "  -l LEN     Default code length for encode (default: 10)\n";
    std::cerr << "  -e SCRIPT  Run the given script text instead of a file\n";
}

bool g_print_stats = false;
bool g_verbose = false;

void print_stats(const pluscode::batch::Runner& runner) {
    if (!g_print_stats) return;
    const auto& s = runner.stats();
    std::cerr << "% Stats: commands=" << s.command_count
              << " errors=" << s.error_count
              << "\n";
}

int main(int argc, char* argv[]) {
    const char* filename = nullptr;
    const char* inline_script = nullptr;
    int default_code_length = pluscode::PAIR_CODE_LENGTH;

    // Parse command line arguments
    for (int i = 1; i < argc; ++i) {
        if (std::strcmp(argv[i], "-s") == 0) {
            g_print_stats = true;
        } else if (std::strcmp(argv[i], "-v") == 0) {
            g_verbose = true;
        } else if (std::strcmp(argv[i], "-l") == 0 && i + 1 < argc) {
            default_code_length = std::atoi(argv[++i]);
        } else if (std::strcmp(argv[i], "-e") == 0 && i + 1 < argc) {
            inline_script = argv[++i];
        } else if (std::strcmp(argv[i], "-h") == 0 ||
                   std::strcmp(argv[i], "--help") == 0) {
            print_usage(argv[0]);
            return 0;
        } else if (argv[i][0] != '-') {
            filename = argv[i];
        } else {
            std::cerr << "Unknown option: " << argv[i] << "\n";
            print_usage(argv[0]);
            return 1;
        }
    }

    if (!filename && !inline_script) {
        print_usage(argv[0]);
        return 1;
    }

    try {
        std::unique_ptr<pluscode::batch::Script> script;
        if (inline_script) {
            script = pluscode::batch::parse_string(inline_script);
        } else {
            script = pluscode::batch::parse_file(filename);
        }

        pluscode::batch::Runner runner(std::cout, std::cerr);
        runner.set_verbose(g_verbose);
        runner.set_default_code_length(default_code_length);

        if (g_verbose) {
            std::cerr << "% [verbose] " << script->size() << " commands\n";
        }
        runner.run(*script);
        print_stats(runner);
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }

    return 0;
}
