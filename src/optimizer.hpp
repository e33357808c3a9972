#pragma once

#include "instruction.hpp"
#include <optional>
#include <span>
#include <vector>

namespace bfi {

    // Result of looking at two adjacent instructions.
    // An engaged optional holding nullopt means the pair cancels out.
    using PairRewrite = std::optional<std::optional<Instruction>>;

    [[nodiscard]]
    auto rewrite_pair(Instruction const& first, Instruction const& second) -> PairRewrite;

    // Peephole pass. The result is a fixed point: no adjacent pair in it
    // can be rewritten any further, so optimize(optimize(x)) == optimize(x).
    [[nodiscard]]
    auto optimize(std::span<Instruction const> buffer) -> std::vector<Instruction>;

}
