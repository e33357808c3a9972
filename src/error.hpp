#pragma once

#include "instruction.hpp"
#include <string>
#include <system_error>

namespace bfi {

    struct Error {
        enum class Kind {
            ReadError,
            WriteError,
            UnbalancedParens,
        } m_kind;
        // Underlying stream failure, set for ReadError and WriteError.
        std::error_code m_cause = {};
        // The offending ']', set for UnbalancedParens.
        Position m_pos = {};

        [[nodiscard]]
        auto is_broken_pipe() const -> bool;
        [[nodiscard]]
        auto message() const -> std::string;
    };

}
