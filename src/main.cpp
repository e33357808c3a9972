
#include "diagnostics.hpp"
#include "interpreter.hpp"
#include "io.hpp"
#include "optimizer.hpp"
#include "options.hpp"
#include "parser.hpp"
#include <csignal>
#include <filesystem>
#include <fstream>
#include <optional>
#include <string>
#include <string_view>
#include <system_error>
#include <fmt/format.h>
#include <unistd.h>
#include <utility>

std::optional<std::string> load_program(char const* path);
void print_usage(char const* argv);
void print_bfcode(std::span<bfi::Instruction const> code);

int main(int const argc, char const *argv[]) {
    bfi::CLIOpts cli_opts;

    for (int i = 1; i < argc; i++) {
        auto arg = std::string_view{ argv[i] };
        if (arg.starts_with("-")) {
            if (arg == "-d") {
                cli_opts.do_not_optimize = true;
            } else if (arg == "-h") {
                print_usage(argv[0]);
                return 0;
            } else if (arg == "-p") {
                cli_opts.print_and_exit = true;
            } else if (arg == "-v") {
                cli_opts.debug_info = true;
            } else {
                fmt::print(stderr, "unknown flag: {}\n", arg);
                print_usage(argv[0]);
                return 1;
            }
        } else if (cli_opts.program_path != nullptr) {
            bfi::report_error("more than one file to run given");
            print_usage(argv[0]);
            return 1;
        } else {
            cli_opts.program_path = argv[i];
        }
    }
    if (cli_opts.program_path == nullptr) {
        bfi::report_error("file to run not specified");
        print_usage(argv[0]);
        return 1;
    }
    auto const program = load_program(cli_opts.program_path);
    if (!program)
        return 1;

    auto bytecode = bfi::parse_program(*program);
    auto const parsed_size = bytecode.size();
    if (!cli_opts.do_not_optimize)
        bytecode = bfi::optimize(bytecode);
    if (cli_opts.debug_info)
        bfi::report_note("{} instructions parsed, {} after optimization", parsed_size, bytecode.size());

    if (cli_opts.print_and_exit) {
        print_bfcode(bytecode);
        return 0;
    }

    // A reader that went away has to show up as EPIPE, not kill the process.
    std::signal(SIGPIPE, SIG_IGN);

    auto interpreter = bfi::Interpreter( std::move(bytecode) );
    auto input = bfi::FdSource( STDIN_FILENO );
    auto output = bfi::FdSink( STDOUT_FILENO );
    if (auto err = interpreter.run(input, output)) {
        if (err->is_broken_pipe())
            return 0;
        bfi::report_error("{}", err->message());
        return 1;
    }
    return 0;
}

std::optional<std::string> load_program(char const* path) {
    std::error_code ec;
    auto const regular = std::filesystem::is_regular_file(path, ec);
    if (ec) {
        bfi::report_error("cannot stat {}: {}", path, ec.message());
        return std::nullopt;
    }
    if (!regular) {
        bfi::report_error("{} is not a regular file", path);
        return std::nullopt;
    }
    auto const fsize = std::filesystem::file_size(path, ec);
    if (ec) {
        bfi::report_error("cannot stat {}: {}", path, ec.message());
        return std::nullopt;
    }
    if (fsize > bfi::MAX_PROGRAM_SIZE) {
        bfi::report_error("file is too big ({} KB)", (fsize + 511) / 1024);
        return std::nullopt;
    }
    auto handle = std::ifstream( path, std::ios::binary );
    std::string buffer;
    buffer.resize(fsize);
    if (!handle.read(buffer.data(), std::streamsize(fsize))) {
        bfi::report_error("cannot read {}", path);
        return std::nullopt;
    }
    return buffer;
}

void print_bfcode(std::span<bfi::Instruction const> code) {
    size_t offset = 0;
    for (auto const& bc : code) {
        if (bc.m_type == bfi::Instruction::Type::Close && offset > 0)
            offset--;
        for (size_t j = 0; j < offset; j++) fmt::print(" ");
        switch (bc.m_type) {
        case bfi::Instruction::Type::Add:
            fmt::print("<+:{}>\n", bc.count);
            break;
        case bfi::Instruction::Type::Sub:
            fmt::print("<-:{}>\n", bc.count);
            break;
        case bfi::Instruction::Type::Right:
            fmt::print("<>:{}>\n", bc.count);
            break;
        case bfi::Instruction::Type::Left:
            fmt::print("<<:{}>\n", bc.count);
            break;
        case bfi::Instruction::Type::In:
            fmt::print("<In>\n");
            break;
        case bfi::Instruction::Type::Out:
            fmt::print("<Out>\n");
            break;
        case bfi::Instruction::Type::Open:
            fmt::print("<LoopBegin>\n");
            offset++;
            break;
        case bfi::Instruction::Type::Close:
            fmt::print("<LoopEnd>\n");
            break;
        }
    }
}

void print_usage(char const* argv) {
    fmt::print(R"(Usage:
{} [-d] [-p] [-v] SOURCE_FILE
OPTIONS:
    -d      disable optimizations
    -h      print this message
    -p      print bytecode before execution and exit
    -v      report instruction counts before running
)", argv);
}
