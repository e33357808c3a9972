#pragma once

#include <cstddef>
#include <cstdint>

namespace bfi {

    struct Position {
        size_t line = 1;
        size_t column = 1;

        bool operator == (Position const&) const = default;
    };

    struct Instruction {
        enum class Type : uint8_t {
            Add,
            Sub,
            Right,
            Left,
            Out,
            In,
            Open,
            Close,
        } m_type;
        // Run length for Add/Sub/Right/Left, unused otherwise.
        size_t count = 0;
        // Where the (first) symbol of this instruction sits in the source.
        Position pos = {};

        [[nodiscard]]
        auto has_count() const -> bool {
            return m_type == Type::Add || m_type == Type::Sub
                || m_type == Type::Right || m_type == Type::Left;
        }

        // Source position is not part of an instruction's identity.
        bool operator == (Instruction const& other) const {
            return m_type == other.m_type && count == other.count;
        }
    };

    inline auto make_add(size_t n)   -> Instruction { return Instruction{ .m_type = Instruction::Type::Add,   .count = n }; }
    inline auto make_sub(size_t n)   -> Instruction { return Instruction{ .m_type = Instruction::Type::Sub,   .count = n }; }
    inline auto make_right(size_t n) -> Instruction { return Instruction{ .m_type = Instruction::Type::Right, .count = n }; }
    inline auto make_left(size_t n)  -> Instruction { return Instruction{ .m_type = Instruction::Type::Left,  .count = n }; }
    inline auto make_out()   -> Instruction { return Instruction{ .m_type = Instruction::Type::Out }; }
    inline auto make_in()    -> Instruction { return Instruction{ .m_type = Instruction::Type::In }; }
    inline auto make_open()  -> Instruction { return Instruction{ .m_type = Instruction::Type::Open }; }
    inline auto make_close() -> Instruction { return Instruction{ .m_type = Instruction::Type::Close }; }

}
