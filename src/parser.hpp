#pragma once

#include "instruction.hpp"
#include <vector>
#include <string_view>

namespace bfi {

    [[nodiscard]]
    auto parse_program(std::string_view program) -> std::vector<Instruction>;

}
