#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "interpreter.hpp"
#include "io.hpp"

struct RunOutput {
    std::optional<bfi::Error> error;
    std::vector<uint8_t> output;
};

inline RunOutput run_with(bfi::Interpreter& interpreter, std::vector<uint8_t> const& input = {}) {
    bfi::MemorySource in(input);
    bfi::MemorySink out;
    auto err = interpreter.run(in, out);
    return {err, out.data()};
}

inline std::string as_text(std::vector<uint8_t> const& bytes) { return std::string(bytes.begin(), bytes.end()); }

inline constexpr std::string_view hello_world =
    "++++++++[>++++[>++>+++>+++>+<<<<-]>+>+>->>+[<]<-]>>.>---"
    ".+++++++..+++.>>.<-.<.+++.------.--------.>>+.>++.\n";

inline constexpr std::string_view hello_world_complex =
    ">++++++++[-<+++++++++>]<.>>+>-[+]++>++>+++[>[->+++<<+++>]<<]"
    ">-----.>->+++..+++.>-.<<+[>[+>+]>>]<--------------.>>.+++.---"
    "---.--------.>+.>+.";
