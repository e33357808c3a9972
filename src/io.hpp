#pragma once

#include <cstddef>
#include <cstdint>
#include <span>
#include <system_error>
#include <vector>

namespace bfi {

    struct IoResult {
        size_t count = 0;
        std::error_code error = {};
    };

    // Input collaborator. A result with count == 0 and no error is end-of-stream.
    class ByteSource {
    public:
        virtual ~ByteSource() = default;
        virtual auto read(std::span<uint8_t> buffer) -> IoResult = 0;
    };

    // Output collaborator.
    class ByteSink {
    public:
        virtual ~ByteSink() = default;
        virtual auto write(std::span<uint8_t const> bytes) -> IoResult = 0;
    };

    class FdSource final : public ByteSource {
    public:
        explicit FdSource(int fd) : m_fd(fd) {}
        auto read(std::span<uint8_t> buffer) -> IoResult override;
    private:
        int m_fd;
    };

    // Writes straight through to the descriptor, no buffering.
    class FdSink final : public ByteSink {
    public:
        explicit FdSink(int fd) : m_fd(fd) {}
        auto write(std::span<uint8_t const> bytes) -> IoResult override;
    private:
        int m_fd;
    };

    class MemorySource final : public ByteSource {
    public:
        explicit MemorySource(std::span<uint8_t const> data) : m_data(data) {}
        auto read(std::span<uint8_t> buffer) -> IoResult override;
    private:
        std::span<uint8_t const> m_data;
    };

    class EmptySource final : public ByteSource {
    public:
        auto read(std::span<uint8_t>) -> IoResult override { return {}; }
    };

    class MemorySink final : public ByteSink {
    public:
        auto write(std::span<uint8_t const> bytes) -> IoResult override;

        [[nodiscard]]
        auto data() const -> std::vector<uint8_t> const& { return m_data; }
    private:
        std::vector<uint8_t> m_data;
    };

    class NullSink final : public ByteSink {
    public:
        auto write(std::span<uint8_t const> bytes) -> IoResult override { return { .count = bytes.size() }; }
    };

}
