//
// Argument handling for the pngmsg tool.
//

#pragma once

#include <string_view>
#include <vector>

namespace pngmsg {

    struct command_line {
        bool lenient = false;
        bool quiet = false;
        bool help = false;
        // Command word followed by its operands
        std::vector<std::string_view> args;
    };

    // Options are recognised only before the command word; everything
    // after it is passed through untouched.
    inline command_line parse_command_line(int argc, const char* const* argv) {
        command_line cl;
        for (int i = 1; i < argc; ++i) {
            std::string_view arg = argv[i];
            if (!cl.args.empty()) {
                cl.args.push_back(arg);
            } else if (arg == "--lenient") {
                cl.lenient = true;
            } else if (arg == "--quiet") {
                cl.quiet = true;
            } else if (arg == "-h" || arg == "--help") {
                cl.help = true;
            } else {
                cl.args.push_back(arg);
            }
        }
        return cl;
    }

} // namespace pngmsg
