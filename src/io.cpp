#include "io.hpp"
#include <algorithm>
#include <cerrno>
#include <unistd.h>

namespace bfi {

    auto FdSource::read(std::span<uint8_t> buffer) -> IoResult {
        while (true) {
            auto const n = ::read(m_fd, buffer.data(), buffer.size());
            if (n >= 0)
                return { .count = size_t(n) };
            if (errno != EINTR)
                return { .error = std::error_code(errno, std::generic_category()) };
        }
    }

    auto FdSink::write(std::span<uint8_t const> bytes) -> IoResult {
        size_t done = 0;
        while (done < bytes.size()) {
            auto const n = ::write(m_fd, bytes.data() + done, bytes.size() - done);
            if (n < 0) {
                if (errno == EINTR)
                    continue;
                return { .count = done, .error = std::error_code(errno, std::generic_category()) };
            }
            done += size_t(n);
        }
        return { .count = done };
    }

    auto MemorySource::read(std::span<uint8_t> buffer) -> IoResult {
        auto const n = std::min(buffer.size(), m_data.size());
        std::copy_n(m_data.begin(), n, buffer.begin());
        m_data = m_data.subspan(n);
        return { .count = n };
    }

    auto MemorySink::write(std::span<uint8_t const> bytes) -> IoResult {
        m_data.insert(m_data.end(), bytes.begin(), bytes.end());
        return { .count = bytes.size() };
    }

}
