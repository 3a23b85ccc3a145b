/**
 * @file main.cpp
 * @brief pngmsg command line tool
 *
 * Hides text messages in ancillary PNG chunks, reads them back,
 * removes them and lists the chunks of a file.
 */

#include <pngmsg/commands.hh>
#include <pngmsg/parse_options.hh>
#include <pngmsg/pngmsg_config.h>
#include "command_line.hh"
#include <cstdint>
#include <filesystem>
#include <iostream>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace {

void print_usage(const char* prog) {
    std::cout << "pngmsg " << PNGMSG_VERSION << "\n";
    std::cout << "Usage: " << prog << " [options] <command> <args>\n";
    std::cout << "\n";
    std::cout << "Commands:\n";
    std::cout << "  encode <file> <type> <message> [output]  Append a chunk carrying message\n";
    std::cout << "  decode <file> <type>                     Print the message of the first <type> chunk\n";
    std::cout << "  remove <file> <type>                     Remove the first <type> chunk\n";
    std::cout << "  print  <file>                            List all chunks (alias: inspect)\n";
    std::cout << "\n";
    std::cout << "Options:\n";
    std::cout << "  --lenient  Report oversized chunks as warnings instead of errors\n";
    std::cout << "  --quiet    Do not print parser warnings\n";
    std::cout << "\n";
    std::cout << "Examples:\n";
    std::cout << "  " << prog << " encode image.png ruSt \"secret message\"\n";
    std::cout << "  " << prog << " decode image.png ruSt\n";
}

}

int main(int argc, char* argv[]) {
    const auto cl = pngmsg::parse_command_line(argc, argv);
    if (cl.help) {
        print_usage(argv[0]);
        return 0;
    }

    pngmsg::parse_options options;
    options.strict = !cl.lenient;
    const auto& args = cl.args;

    if (!cl.quiet) {
        options.on_warning = [](std::uint64_t offset, std::string_view category, std::string_view message) {
            std::cerr << "warning [" << category << "] at offset " << offset << ": " << message << "\n";
        };
    }

    if (args.empty()) {
        print_usage(argv[0]);
        return 1;
    }

    const std::string_view command = args[0];
    const std::size_t nargs = args.size() - 1;

    try {
        if (command == "encode" && (nargs == 3 || nargs == 4)) {
            std::optional<std::filesystem::path> output;
            if (nargs == 4) {
                output = std::filesystem::path(args[4]);
            }
            pngmsg::encode(args[1], args[2], args[3], output, options);
        } else if (command == "decode" && nargs == 2) {
            std::cout << pngmsg::decode(args[1], args[2], options) << "\n";
        } else if (command == "remove" && nargs == 2) {
            std::cout << pngmsg::remove(args[1], args[2], options) << "\n";
        } else if ((command == "print" || command == "inspect") && nargs == 1) {
            pngmsg::inspect(args[1], std::cout, options);
        } else {
            print_usage(argv[0]);
            return 1;
        }
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }

    return 0;
}
