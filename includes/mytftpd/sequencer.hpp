#pragma once

#include <cstddef>
#include <cstdint>
#include "mytftp/types.hpp"

namespace RollTftp::Driver {
    inline constexpr std::uint64_t block_space = 65536ULL;

    /**
     * @brief Position of a DATA block across rollovers.
     * @note The wire only carries `block`. The epoch counts how many times it has wrapped from 65535 to 0 within this transfer.
     */
    struct BlockPosition {
        std::uint64_t epoch;
        MyTftp::tftp_u16 block;

        [[nodiscard]] constexpr bool operator==(const BlockPosition& other) const noexcept = default;
    };

    inline constexpr BlockPosition first_data_block {0, 1};

    [[nodiscard]] constexpr BlockPosition nextBlock(BlockPosition current) noexcept {
        const auto next_block = static_cast<MyTftp::tftp_u16>(current.block + 1U);

        return {
            (next_block == 0) ? current.epoch + 1ULL : current.epoch,
            next_block
        };
    }

    [[nodiscard]] constexpr std::uint64_t logicalPosition(BlockPosition pos) noexcept {
        return pos.epoch * block_space + pos.block;
    }

    /// NOTE: Logical block N carries source bytes [(N - 1) * blksize, N * blksize).
    [[nodiscard]] constexpr std::uint64_t blockOffset(BlockPosition pos, std::size_t block_size) noexcept {
        const auto logical_n = logicalPosition(pos);

        return (logical_n == 0ULL) ? 0ULL : (logical_n - 1ULL) * block_size;
    }

    /// NOTE: 16-bit serial comparison. `acked` is "earlier" when it trails `current` by 1 to 32767 blocks.
    [[nodiscard]] constexpr bool isEarlierBlock(MyTftp::tftp_u16 current, MyTftp::tftp_u16 acked) noexcept {
        const auto distance = static_cast<MyTftp::tftp_u16>(current - acked);

        return distance != 0 and distance < 0x8000U;
    }

    class BlockSequencer {
    private:
        BlockPosition m_current;

    public:
        constexpr BlockSequencer() noexcept
        : m_current {first_data_block} {}

        [[nodiscard]] constexpr BlockPosition getPosition() const noexcept {
            return m_current;
        }

        [[nodiscard]] constexpr MyTftp::tftp_u16 getWireBlock() const noexcept {
            return m_current.block;
        }

        [[nodiscard]] constexpr std::uint64_t getOffset(std::size_t block_size) const noexcept {
            return blockOffset(m_current, block_size);
        }

        constexpr BlockPosition advance() noexcept {
            m_current = nextBlock(m_current);

            return m_current;
        }
    };
}
