#pragma once

#include <algorithm>
#include <array>
#include <cstddef>
#include <vector>
#include "meta/helpers.hpp"

namespace RollTftp::MyBSock {
    /// NOTE: Non-owning, read-only window over octets. The viewed storage must outlive the view.
    template <Meta::OctetKind T>
    class BufferView {
    private:
        const T* m_ptr;
        std::size_t m_length;

    public:
        constexpr BufferView() noexcept
        : m_ptr {nullptr}, m_length {0UL} {}

        constexpr BufferView(const T* ptr, std::size_t length) noexcept
        : m_ptr {ptr}, m_length {(ptr != nullptr) ? length : 0UL} {}

        /// NOTE: Implicit so encoded packets (`PacketBytes`) pass straight to the codec and the sockets.
        BufferView(const std::vector<T>& octets) noexcept
        : m_ptr {octets.data()}, m_length {octets.size()} {}

        [[nodiscard]] constexpr const T* viewPtr() const noexcept {
            return m_ptr;
        }

        [[nodiscard]] constexpr std::size_t getLength() const noexcept {
            return m_length;
        }

        explicit constexpr operator bool() const noexcept {
            return m_ptr != nullptr and m_length > 0UL;
        }

        [[nodiscard]] constexpr T operator[](std::size_t index) const noexcept {
            return m_ptr[index];
        }

        /// NOTE: Out of range requests yield an empty view rather than a dangling one.
        [[nodiscard]] constexpr BufferView subView(std::size_t begin, std::size_t length) const noexcept {
            if (begin > m_length or length > m_length - begin) {
                return {};
            }

            return {m_ptr + begin, length};
        }

        [[nodiscard]] std::vector<T> toOwned() const {
            return {m_ptr, m_ptr + m_length};
        }
    };

    /// NOTE: Receive-side storage sized for the largest datagram. `markLength` records how much of it the last read filled.
    template <Meta::OctetKind T, std::size_t N> requires (N > 0UL)
    class FixedBuffer {
    private:
        std::array<T, N> m_data;
        std::size_t m_length;

    public:
        constexpr FixedBuffer() noexcept
        : m_data {}, m_length {0UL} {}

        [[nodiscard]] T* viewPtr() noexcept {
            return m_data.data();
        }

        [[nodiscard]] constexpr std::size_t getLength() const noexcept {
            return m_length;
        }

        [[nodiscard]] constexpr std::size_t getSize() const noexcept {
            return N;
        }

        void markLength(std::size_t length) noexcept {
            m_length = std::min(length, N);
        }

        void reset() noexcept {
            m_length = 0UL;
        }

        [[nodiscard]] BufferView<T> view() const noexcept {
            return {m_data.data(), m_length};
        }
    };
}
