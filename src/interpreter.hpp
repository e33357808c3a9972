#pragma once

#include "error.hpp"
#include "instruction.hpp"
#include "io.hpp"
#include <cstdint>
#include <optional>
#include <span>
#include <string_view>
#include <vector>

namespace bfi {

    inline constexpr size_t TAPE_SIZE = 30'000;

    struct Interpreter {
        std::vector<Instruction> m_bytecode;
        std::vector<uint8_t> m_buffer;
        size_t m_ptr;
        size_t m_ip;
        // Index of the first body instruction of every loop being executed.
        std::vector<size_t> m_loop_stack;

        // Parses and optimizes the source.
        explicit Interpreter(std::string_view program);
        // Runs the sequence exactly as given.
        explicit Interpreter(std::vector<Instruction> bytecode);
        ~Interpreter() = default;
        Interpreter(Interpreter const&) = default;
        Interpreter(Interpreter &&) = default;
        Interpreter& operator = (Interpreter const&) = default;
        Interpreter& operator = (Interpreter &&) = default;

        // Runs until the end of the program or the first error.
        [[nodiscard]]
        auto run(ByteSource& input, ByteSink& output) -> std::optional<Error>;
        // run() with no input and discarded output.
        [[nodiscard]]
        auto run_pure() -> std::optional<Error>;

        // Executes a single instruction. Does nothing once finished().
        [[nodiscard]]
        auto run_one_step(ByteSource& input, ByteSink& output) -> std::optional<Error>;
        [[nodiscard]]
        auto finished() const -> bool;

        [[nodiscard]]
        auto data_pointer() const -> size_t { return m_ptr; }
        // Cells [begin, end). Throws std::out_of_range on a bad range.
        [[nodiscard]]
        auto tape(size_t begin, size_t end) const -> std::span<uint8_t const>;
        [[nodiscard]]
        auto instructions() const -> std::span<Instruction const> { return m_bytecode; }

    private:
        void skip_loop();
    };

}
