#include "optimizer.hpp"
#include "instruction.hpp"

namespace bfi {
    auto opposite(Instruction::Type type) -> std::optional<Instruction::Type>;

    auto rewrite_pair(Instruction const& first, Instruction const& second) -> PairRewrite {
        if (!first.has_count() || !second.has_count())
            return std::nullopt;

        if (first.m_type == second.m_type) {
            auto fused = first;
            fused.count = first.count + second.count;
            return std::optional<Instruction>{ fused };
        }
        if (opposite(first.m_type) == second.m_type && first.count == second.count)
            return std::optional<Instruction>{};

        return std::nullopt;
    }

    auto optimize(std::span<Instruction const> buffer_in) -> std::vector<Instruction> {
        std::vector<Instruction> buffer;
        buffer.reserve(buffer_in.size());

        // The output is kept as a fixed point at all times. Each incoming
        // instruction is folded into the back of the output for as long as
        // a rule fires, so a fusion that exposes a new cancelling pair
        // (Add(2), Sub(1), Sub(1)) is still caught.
        for (auto const& op : buffer_in) {
            auto c_op = std::optional<Instruction>{ op };
            while (c_op && !buffer.empty()) {
                auto rep = rewrite_pair(buffer.back(), *c_op);
                if (!rep)
                    break;
                buffer.pop_back();
                c_op = *rep;
            }
            if (c_op)
                buffer.push_back(*c_op);
        }
        return buffer;
    }

    auto opposite(Instruction::Type type) -> std::optional<Instruction::Type> {
        switch (type) {
            case Instruction::Type::Add:   return Instruction::Type::Sub;
            case Instruction::Type::Sub:   return Instruction::Type::Add;
            case Instruction::Type::Right: return Instruction::Type::Left;
            case Instruction::Type::Left:  return Instruction::Type::Right;
            default: return std::nullopt;
        }
    }

}
