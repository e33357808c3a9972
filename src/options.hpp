#pragma once

#include <cstddef>

namespace bfi {

    // Largest program file the CLI agrees to load.
    inline constexpr size_t MAX_PROGRAM_SIZE = 1024 * 1024;

    struct CLIOpts {
        char const* program_path = nullptr;
        bool do_not_optimize = false;
        bool print_and_exit = false;
        bool debug_info = false;
    };

}
