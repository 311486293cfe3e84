//
// pngme: hide, reveal and remove messages in PNG chunks
//

#include <iostream>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include <pngme/exceptions.hh>
#include <pngme/parse_options.hh>
#include <pngme/pngme_config.h>

#include "commands.hh"

namespace {

    void usage(const char* prog, std::ostream& os) {
        os << "Usage: " << prog << " [-v|--verbose] <command> [args]\n";
        os << "\n";
        os << "Hide, reveal and remove messages stored in PNG chunks.\n";
        os << "\n";
        os << "Commands:\n";
        os << "  encode <file> <chunk_type> <message> [output]\n";
        os << "      Append a chunk carrying message. Writes to output, or back to file\n";
        os << "  decode <file> <chunk_type>\n";
        os << "      Print the first chunk of chunk_type\n";
        os << "  remove <file> <chunk_type>\n";
        os << "      Remove the first chunk of chunk_type and rewrite file\n";
        os << "  print <file>\n";
        os << "      List every chunk of file\n";
        os << "\n";
        os << "Options:\n";
        os << "  -v, --verbose   Report parse warnings on stderr\n";
        os << "  -h, --help      Show this help\n";
        os << "      --version   Show version\n";
    }

    // Positional argument count after the command name
    bool arity_ok(std::string_view command, std::size_t n) {
        if (command == "encode") {
            return n == 3 || n == 4;
        }
        if (command == "decode" || command == "remove") {
            return n == 2;
        }
        if (command == "print") {
            return n == 1;
        }
        return false;
    }

    std::string_view action_of(std::string_view command) {
        if (command == "encode") {
            return "encode message into the file";
        }
        if (command == "decode") {
            return "decode the file";
        }
        if (command == "remove") {
            return "remove the chunk";
        }
        return "print the file chunks";
    }
}

int main(int argc, char* argv[]) {
    bool verbose = false;
    std::vector<std::string> args;

    for (int i = 1; i < argc; i++) {
        std::string_view arg = argv[i];
        if (arg == "-v" || arg == "--verbose") {
            verbose = true;
        } else if (arg == "-h" || arg == "--help") {
            usage(argv[0], std::cout);
            return 0;
        } else if (arg == "--version") {
            std::cout << "pngme " << PNGME_VERSION_STRING << "\n";
            return 0;
        } else {
            args.emplace_back(arg);
        }
    }

    if (args.empty() || !arity_ok(args[0], args.size() - 1)) {
        usage(argv[0], std::cerr);
        return 1;
    }

    pngme::parse_options options;
    if (verbose) {
        options.on_warning = [](std::uint64_t offset, std::string_view category, std::string_view message) {
            std::cerr << "warning [" << category << "] at offset " << offset << ": " << message << "\n";
        };
    }

    const std::string& command = args[0];
    try {
        if (command == "encode") {
            std::optional<std::filesystem::path> output;
            if (args.size() == 5) {
                output = args[4];
            }
            pngme::cli::encode(args[1], args[2], args[3], output, options);
        } else if (command == "decode") {
            pngme::cli::decode(args[1], args[2], std::cout, std::cerr, options);
        } else if (command == "remove") {
            pngme::cli::remove(args[1], args[2], options);
        } else {
            pngme::cli::print(args[1], std::cout, options);
        }
    } catch (const pngme::pngme_error& e) {
        std::cerr << "Could not " << action_of(command) << ": " << e.what() << "\n";
        return 1;
    }
    return 0;
}
