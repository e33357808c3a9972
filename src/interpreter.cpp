
#include "interpreter.hpp"
#include "optimizer.hpp"
#include "parser.hpp"
#include <cstdint>
#include <fmt/format.h>
#include <stdexcept>
#include <utility>

namespace bfi {

    Interpreter::Interpreter(std::string_view program) :
        Interpreter(optimize(parse_program(program)))
    {
    }

    Interpreter::Interpreter(std::vector<Instruction> bytecode) :
        m_bytecode(std::move(bytecode)),
        m_ptr(0),
        m_ip(0)
    {
        m_buffer.resize(TAPE_SIZE);
    }

    auto Interpreter::finished() const -> bool {
        return m_ip >= m_bytecode.size();
    }
    auto Interpreter::run_one_step(ByteSource& input, ByteSink& output) -> std::optional<Error> {
        if (finished())
            return std::nullopt;

        auto const& c_inst = m_bytecode[m_ip++];
        switch (c_inst.m_type) {
            case Instruction::Type::Add:
                m_buffer[m_ptr] = uint8_t(m_buffer[m_ptr] + c_inst.count);
                break;
            case Instruction::Type::Sub:
                m_buffer[m_ptr] = uint8_t(m_buffer[m_ptr] - c_inst.count);
                break;
            case Instruction::Type::Right:
                {
                    auto const last = m_buffer.size() - 1;
                    m_ptr = c_inst.count > last - m_ptr ? last : m_ptr + c_inst.count;
                }
                break;
            case Instruction::Type::Left:
                m_ptr = c_inst.count > m_ptr ? 0 : m_ptr - c_inst.count;
                break;
            case Instruction::Type::Out:
                {
                    auto const res = output.write(std::span<uint8_t const>{ &m_buffer[m_ptr], 1 });
                    if (res.error)
                        return Error{ .m_kind = Error::Kind::WriteError, .m_cause = res.error };
                }
                break;
            case Instruction::Type::In:
                {
                    uint8_t byte = 0;
                    auto const res = input.read(std::span<uint8_t>{ &byte, 1 });
                    if (res.error)
                        return Error{ .m_kind = Error::Kind::ReadError, .m_cause = res.error };
                    m_buffer[m_ptr] = res.count == 0 ? 0 : byte;
                }
                break;
            case Instruction::Type::Open:
                if (m_buffer[m_ptr] == 0)
                    skip_loop();
                else
                    m_loop_stack.push_back(m_ip);
                break;
            case Instruction::Type::Close:
                if (m_loop_stack.empty())
                    return Error{ .m_kind = Error::Kind::UnbalancedParens, .m_pos = c_inst.pos };
                if (m_buffer[m_ptr] != 0)
                    m_ip = m_loop_stack.back();
                else
                    m_loop_stack.pop_back();
                break;
        }

        return std::nullopt;
    }
    auto Interpreter::run(ByteSource& input, ByteSink& output) -> std::optional<Error> {
        while (!finished()) {
            if (auto err = this->run_one_step(input, output))
                return err;
        }
        return std::nullopt;
    }
    auto Interpreter::run_pure() -> std::optional<Error> {
        auto input = EmptySource();
        auto output = NullSink();
        return run(input, output);
    }

    auto Interpreter::tape(size_t begin, size_t end) const -> std::span<uint8_t const> {
        if (begin > end || end > m_buffer.size())
            throw std::out_of_range(fmt::format("tape range [{}, {}) outside of [0, {})", begin, end, m_buffer.size()));
        return std::span<uint8_t const>{ m_buffer }.subspan(begin, end - begin);
    }

    // m_ip points just past the '[' being skipped. A missing ']' runs off
    // the end of the program, which ends the run without an error.
    void Interpreter::skip_loop() {
        size_t cnt = 0;
        for (; m_ip < m_bytecode.size(); m_ip++) {
            auto const type = m_bytecode[m_ip].m_type;
            if (type == Instruction::Type::Open) {
                cnt++;
            } else if (type == Instruction::Type::Close) {
                if (cnt == 0) {
                    m_ip++;
                    return;
                }
                cnt--;
            }
        }
    }
}
