
#include "parser.hpp"
#include <algorithm>

namespace bfi {

    auto parse_program(std::string_view program) -> std::vector<Instruction> {
        auto ret = std::vector<Instruction>();
        ret.reserve(std::min<size_t>(program.size(), 1024 * 1024));

        auto pos = Position{};
        for (auto const& ch : program) {
            auto const c_pos = pos;
            if (ch == '\n') {
                pos.line++;
                pos.column = 1;
            } else {
                pos.column++;
            }

            switch (ch) {
                case '+': ret.push_back( Instruction{ .m_type = Instruction::Type::Add,   .count = 1, .pos = c_pos } ); break;
                case '-': ret.push_back( Instruction{ .m_type = Instruction::Type::Sub,   .count = 1, .pos = c_pos } ); break;
                case '>': ret.push_back( Instruction{ .m_type = Instruction::Type::Right, .count = 1, .pos = c_pos } ); break;
                case '<': ret.push_back( Instruction{ .m_type = Instruction::Type::Left,  .count = 1, .pos = c_pos } ); break;
                case '.': ret.push_back( Instruction{ .m_type = Instruction::Type::Out,   .pos = c_pos } ); break;
                case ',': ret.push_back( Instruction{ .m_type = Instruction::Type::In,    .pos = c_pos } ); break;
                case '[': ret.push_back( Instruction{ .m_type = Instruction::Type::Open,  .pos = c_pos } ); break;
                case ']': ret.push_back( Instruction{ .m_type = Instruction::Type::Close, .pos = c_pos } ); break;
                default: break;
            }
        }

        return ret;
    }

}
