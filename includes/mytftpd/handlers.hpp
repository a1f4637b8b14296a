#pragma once

#include <filesystem>
#include <fstream>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include "mytftp/types.hpp"
#include "mytftpd/handler.hpp"

namespace RollTftp::Driver {
    namespace FileUtils {
        /// NOTE: Resolves a requested name below `root`. Leading slashes are dropped, and any `..` component makes the result empty.
        [[nodiscard]] std::optional<std::filesystem::path> resolveBelow(const std::filesystem::path& root, const std::string& requested);
    }

    class FileSource : public Source {
    private:
        std::ifstream m_fs;
        std::uint64_t m_size;

    public:
        FileSource(std::ifstream fs, std::uint64_t size);

        [[nodiscard]] ReadResult read(std::uint64_t offset, std::size_t max_length) override;
        [[nodiscard]] std::optional<std::uint64_t> length() const override;
    };

    class MemorySource : public Source {
    private:
        std::shared_ptr<const MyTftp::PacketBytes> m_blob;

    public:
        explicit MemorySource(std::shared_ptr<const MyTftp::PacketBytes> blob) noexcept;

        [[nodiscard]] ReadResult read(std::uint64_t offset, std::size_t max_length) override;
        [[nodiscard]] std::optional<std::uint64_t> length() const override;
    };

    /**
     * @brief Wraps a raw source for `netascii` transfers: LF goes out as CR LF, and a bare CR as CR NUL.
     * @note The translated length is unknown up front, and reads must be sequential (the transfer caches blocks for resends).
     */
    class NetasciiSource : public Source {
    private:
        std::unique_ptr<Source> m_inner;
        MyTftp::PacketBytes m_chunk;
        std::size_t m_chunk_pos;
        std::uint64_t m_inner_offset;
        std::uint64_t m_out_offset;
        std::optional<MyTftp::tftp_u8> m_pending;
        bool m_inner_done;

    public:
        explicit NetasciiSource(std::unique_ptr<Source> inner) noexcept;

        [[nodiscard]] ReadResult read(std::uint64_t offset, std::size_t max_length) override;
        [[nodiscard]] std::optional<std::uint64_t> length() const override;
    };

    class FileHandler : public Handler {
    private:
        std::filesystem::path m_root;

    public:
        explicit FileHandler(std::filesystem::path root);

        [[nodiscard]] const std::filesystem::path& getRoot() const noexcept {
            return m_root;
        }

        [[nodiscard]] OpenResult open(const std::string& path, MyTftp::DataMode mode) override;
    };

    class MemoryHandler : public Handler {
    private:
        std::map<std::string, std::shared_ptr<const MyTftp::PacketBytes>> m_entries;

    public:
        MemoryHandler() = default;

        void addEntry(std::string name, MyTftp::PacketBytes data);

        [[nodiscard]] OpenResult open(const std::string& path, MyTftp::DataMode mode) override;
    };
}
