#include "error.hpp"
#include <fmt/format.h>

namespace bfi {

    auto Error::is_broken_pipe() const -> bool {
        return m_kind == Kind::WriteError
            && m_cause == std::errc::broken_pipe;
    }

    auto Error::message() const -> std::string {
        switch (m_kind) {
            case Kind::ReadError:
                return fmt::format("read error: {}", m_cause.message());
            case Kind::WriteError:
                return fmt::format("write error: {}", m_cause.message());
            case Kind::UnbalancedParens:
                return fmt::format("unbalanced parens at line {}, column {}", m_pos.line, m_pos.column);
        }
        return "unknown error";
    }

}
