#include <cassert>
#include <string>
#include <vector>

#include "instruction.hpp"
#include "optimizer.hpp"
#include "parser.hpp"

using namespace bfi;

static std::vector<Instruction> opt(std::vector<Instruction> const& code) { return optimize(code); }

static void test_fuse_runs() {
    assert(opt({make_add(1)}) == std::vector<Instruction>{make_add(1)});
    assert((opt({make_out(), make_add(1), make_add(1), make_add(1), make_out()}) ==
            std::vector<Instruction>{make_out(), make_add(3), make_out()}));
    assert((opt({make_out(), make_sub(1), make_sub(1), make_sub(1), make_out()}) ==
            std::vector<Instruction>{make_out(), make_sub(3), make_out()}));
    assert(opt({make_right(5), make_right(5)}) == std::vector<Instruction>{make_right(10)});
    assert(opt({make_left(5), make_left(5)}) == std::vector<Instruction>{make_left(10)});
}

static void test_fusion_laws() {
    for (size_t x = 1; x < 6; ++x) {
        for (size_t y = 1; y < 6; ++y) {
            assert(opt({make_add(x), make_add(y)}) == opt({make_add(x + y)}));
            assert(opt({make_sub(x), make_sub(y)}) == opt({make_sub(x + y)}));
            assert(opt({make_right(x), make_right(y)}) == opt({make_right(x + y)}));
            assert(opt({make_left(x), make_left(y)}) == opt({make_left(x + y)}));
        }
    }
}

static void test_cancellation_laws() {
    for (size_t n = 1; n < 8; ++n) {
        assert(opt({make_add(n), make_sub(n)}).empty());
        assert(opt({make_sub(n), make_add(n)}).empty());
        assert(opt({make_right(n), make_left(n)}).empty());
        assert(opt({make_left(n), make_right(n)}).empty());
    }
    // Unequal counts are left alone.
    assert((opt({make_add(2), make_sub(1)}) == std::vector<Instruction>{make_add(2), make_sub(1)}));
    assert(opt(parse_program("+-<>-+><")).empty());
}

static void test_counts_not_reduced() {
    auto code = opt(parse_program(std::string(300, '+')));
    assert(code.size() == 1);
    assert(code[0] == make_add(300));
}

static void test_barriers() {
    assert(opt(parse_program("+.-")).size() == 3);
    assert(opt(parse_program("+,-")).size() == 3);
    assert(opt(parse_program("+[-]")).size() == 4);
    assert(opt(parse_program(">]<")).size() == 3);
    assert(opt(parse_program("[][]")).size() == 4);
}

static void test_fixed_point() {
    // Cancelling the middle pair exposes Add(1), Add(1).
    assert(opt(parse_program("+><+")) == std::vector<Instruction>{make_add(2)});
    // Fusing Sub(1), Sub(1) exposes Add(2), Sub(2).
    assert(opt({make_add(2), make_sub(1), make_sub(1)}).empty());
    assert(opt(parse_program(">>+-<<")).empty());
}

static void test_idempotent() {
    for (auto const* src : {"++++++++[>++++[>++>+++>+++>+<<<<-]>+>+>->>+[<]<-]>>.>---.",
                            "+><+-<>>><<<+.", "", ",[.,]", "-+-+-+>"}) {
        auto once = optimize(parse_program(src));
        auto twice = optimize(once);
        assert(once == twice);
    }
}

static void test_keeps_first_position() {
    auto code = optimize(parse_program("\n ++"));
    assert(code.size() == 1);
    assert((code[0].pos == Position{2, 2}));
}

int main() {
    test_fuse_runs();
    test_fusion_laws();
    test_cancellation_laws();
    test_counts_not_reduced();
    test_barriers();
    test_fixed_point();
    test_idempotent();
    test_keeps_first_position();
    return 0;
}
