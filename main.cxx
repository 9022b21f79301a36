/*
    Bfwalk - A tree-walking brainfuck interpreter
    Main standalone file
    Published under the GNU AGPL-3.0-or-later license
*/
// SPDX-License-Identifier: AGPL-3.0-or-later
#include <cctype>
#include <cstdint>
#include <cstdio>
#include <cstdlib>
#include <fstream>
#include <iostream>
#include <string>
#include <string_view>

#include "bfwalk.hxx"
#include "bfwalk/source.hxx"

namespace {
constexpr int kExitUsage = 1;
constexpr int kExitStatusBase = 10;

struct CmdArgs {
    std::string filename;
    std::string evalCode;
    bool hasEval = false;
    std::string inputFile;
    bool noInput = false;
    std::string tapeFile;
    bool help = false;
    bool strip = false;
    bool printAst = false;
    bool profile = false;
    bfwalk::Options options{};
};

CmdArgs parseArgs(int argc, char* argv[]) {
    CmdArgs args;
    for (int i = 1; i < argc; ++i) {
        std::string_view arg = argv[i];
        if (arg == "-e" && i + 1 < argc) {
            args.evalCode = argv[++i];
            args.hasEval = true;
            args.filename.clear();
        } else if (arg == "-i" && i + 1 < argc) {
            // -e takes precedence over -i
            const char* val = argv[++i];
            if (!args.hasEval) args.filename = val;
        } else if (arg == "-in" && i + 1 < argc) {
            args.inputFile = argv[++i];
        } else if (arg == "-tape" && i + 1 < argc) {
            args.tapeFile = argv[++i];
        } else if (arg == "-noin") {
            args.noInput = true;
        } else if (arg == "-h") {
            args.help = true;
        } else if (arg == "-strict") {
            args.options.strict = true;
        } else if (arg == "-strip") {
            args.strip = true;
        } else if (arg == "-ast") {
            args.printAst = true;
        } else if (arg == "--profile") {
            args.profile = true;
        } else if (arg == "-ts" && i + 1 < argc) {
            const char* val = argv[++i];
            char* end = nullptr;
            unsigned long long parsed = std::strtoull(val, &end, 10);
            if (val[0] == '-' || end == val || *end != '\0' || parsed == 0) {
                std::cerr << "Tape size must be a positive integer: " << val << std::endl;
                args.help = true;
            } else {
                args.options.tapeSize = static_cast<std::size_t>(parsed);
            }
        } else if (arg == "-cl" && i + 1 < argc) {
            const char* val = argv[++i];
            char* end = nullptr;
            unsigned long long parsed = std::strtoull(val, &end, 10);
            if (val[0] == '-' || end == val || *end != '\0') {
                std::cerr << "Cycle limit must be a non-negative integer: " << val << std::endl;
                args.help = true;
            } else {
                args.options.cycleLimit = static_cast<std::uint64_t>(parsed);
            }
        } else {
            std::cerr << "Unknown option: " << arg << std::endl;
            args.help = true;
        }
    }
    return args;
}

void printHelp(const char* prog) {
    std::cout << "Usage: " << prog << " [options]\n"
              << "Options:\n"
              << "  -e <code>        Execute brainfuck code directly\n"
              << "  -i <file>        Execute code from file\n"
              << "  -in <file>       Read program input from file (default stdin)\n"
              << "  -noin            Run without input; every read yields 0\n"
              << "  -tape <file>     Preload the tape with the bytes of a file\n"
              << "  -ts <size>       Tape size in cells (default " << BFWALK_DEFAULT_TAPE_SIZE
              << ")\n"
              << "  -cl <cycles>     Cycle limit (default " << BFWALK_DEFAULT_CYCLE_LIMIT << ")\n"
              << "  -strict          Reject unmatched brackets\n"
              << "  -strip           Ignore non-instruction bytes in the source\n"
              << "  -ast             Print the syntax tree and exit\n"
              << "  --profile        Print execution profile\n"
              << "  -h               Show this help message" << std::endl;
}

bool isParseFailure(bfwalk::Status status) {
    return status == bfwalk::Status::SyntaxError || status == bfwalk::Status::UnmatchedClose ||
           status == bfwalk::Status::UnmatchedOpen || status == bfwalk::Status::NestingTooDeep;
}

void reportFailure(bfwalk::Status status, const bfwalk::ParseError& error) {
    std::cerr << "ERROR: " << bfwalk::describe(status);
    if (status == bfwalk::Status::SyntaxError) {
        const auto byte = static_cast<unsigned char>(error.token);
        if (std::isprint(byte)) {
            std::cerr << " '" << error.token << "'";
        } else {
            char hex[8];
            std::snprintf(hex, sizeof(hex), "0x%02x", byte);
            std::cerr << " byte " << hex;
        }
        std::cerr << " at offset " << error.offset;
    } else if (isParseFailure(status)) {
        std::cerr << " at offset " << error.offset;
    }
    std::cerr << std::endl;
}
}  // namespace

int main(int argc, char* argv[]) {
    CmdArgs opts = parseArgs(argc, argv);
    if (opts.help) {
        printHelp(argv[0]);
        return 0;
    }
    if (opts.options.tapeSize > BFWALK_TAPE_MAX_BYTES) {
        std::cerr << "ERROR: Requested tape exceeds maximum allowed size ("
                  << (BFWALK_TAPE_MAX_BYTES >> 20) << " MiB)" << std::endl;
        return kExitUsage;
    }
    if (opts.options.tapeSize > BFWALK_TAPE_WARN_BYTES) {
        std::cerr << "warning: Tape allocation ~" << (opts.options.tapeSize >> 20)
                  << " MiB may exceed system memory" << std::endl;
    }
    if (opts.filename.empty() && !opts.hasEval) {
        std::cerr << "ERROR: No program given; use -i <file> or -e <code>" << std::endl;
        printHelp(argv[0]);
        return kExitUsage;
    }

    std::string code;
    if (opts.hasEval) {
        code = opts.strip ? bfwalk::stripSource(opts.evalCode) : opts.evalCode;
    } else {
        std::string err;
        if (!bfwalk::loadSource(opts.filename, code, err, opts.strip)) {
            std::cerr << "ERROR: " << err << std::endl;
            return kExitUsage;
        }
    }

    bfwalk::ParseError error;
    if (opts.printAst) {
        bfwalk::node program;
        bfwalk::Status ret = bfwalk::parse(code, opts.options.strict, program, &error);
        if (ret != bfwalk::Status::Ok) {
            reportFailure(ret, error);
            return kExitStatusBase + static_cast<int>(ret);
        }
        std::cout << bfwalk::toString(program) << std::endl;
        return 0;
    }

    std::ifstream inputFile;
    std::istream* input = &std::cin;
    if (opts.noInput) {
        input = nullptr;
    } else if (!opts.inputFile.empty()) {
        inputFile.open(opts.inputFile, std::ios::binary);
        if (!inputFile.is_open()) {
            std::cerr << "ERROR: Input file could not be opened: " << opts.inputFile << std::endl;
            return kExitUsage;
        }
        input = &inputFile;
    }

    std::string initialTape;
    if (!opts.tapeFile.empty()) {
        std::string err;
        if (!bfwalk::loadSource(opts.tapeFile, initialTape, err)) {
            std::cerr << "ERROR: " << err << std::endl;
            return kExitUsage;
        }
    }

    bfwalk::ProfileInfo prof;
    bfwalk::ProfileInfo* profPtr = opts.profile ? &prof : nullptr;
    bfwalk::Status ret =
        bfwalk::execute(code, input, std::cout, opts.options, profPtr, initialTape, &error);
    if (ret != bfwalk::Status::Ok) reportFailure(ret, error);
    if (opts.profile && !isParseFailure(ret)) {
        std::cerr << "Instructions executed: " << prof.instructions << std::endl;
        std::cerr << "Elapsed time: " << prof.seconds << "s" << std::endl;
    }
    return ret == bfwalk::Status::Ok ? 0 : kExitStatusBase + static_cast<int>(ret);
}
