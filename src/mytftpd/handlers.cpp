#include <algorithm>
#include <system_error>
#include <utility>
#include "mytftpd/handlers.hpp"

namespace RollTftp::Driver {
    static constexpr std::size_t netascii_chunk_size = 4096UL;
    static constexpr MyTftp::tftp_u8 octet_cr = '\r';
    static constexpr MyTftp::tftp_u8 octet_lf = '\n';
    static constexpr MyTftp::tftp_u8 octet_nul = '\0';

    namespace FileUtils {
        std::optional<std::filesystem::path> resolveBelow(const std::filesystem::path& root, const std::string& requested) {
            const auto name_begin = requested.find_first_not_of('/');

            if (name_begin == std::string::npos) {
                return {};
            }

            const auto relative = std::filesystem::path {requested.substr(name_begin)}.lexically_normal();

            for (const auto& part : relative) {
                if (part == "..") {
                    return {};
                }
            }

            return root / relative;
        }
    }

    static OpenResult wrapForMode(std::unique_ptr<Source> source, MyTftp::DataMode mode) {
        if (mode == MyTftp::DataMode::netascii) {
            return {HandlerError::none, {}, std::make_unique<NetasciiSource>(std::move(source))};
        }

        return {HandlerError::none, {}, std::move(source)};
    }

    FileSource::FileSource(std::ifstream fs, std::uint64_t size)
    : m_fs {std::move(fs)}, m_size {size} {}

    ReadResult FileSource::read(std::uint64_t offset, std::size_t max_length) {
        if (offset >= m_size) {
            return {HandlerError::none, {}, {}};
        }

        m_fs.clear();
        m_fs.seekg(static_cast<std::streamoff>(offset));

        if (not m_fs) {
            return {HandlerError::io_failure, "seek failed", {}};
        }

        MyTftp::PacketBytes temp(max_length);
        m_fs.read(reinterpret_cast<char*>(temp.data()), static_cast<std::streamsize>(max_length));

        if (m_fs.bad()) {
            return {HandlerError::io_failure, "read failed", {}};
        }

        temp.resize(static_cast<std::size_t>(m_fs.gcount()));

        return {HandlerError::none, {}, std::move(temp)};
    }

    std::optional<std::uint64_t> FileSource::length() const {
        return m_size;
    }

    MemorySource::MemorySource(std::shared_ptr<const MyTftp::PacketBytes> blob) noexcept
    : m_blob {std::move(blob)} {}

    ReadResult MemorySource::read(std::uint64_t offset, std::size_t max_length) {
        const auto blob_size = static_cast<std::uint64_t>(m_blob->size());

        if (offset >= blob_size) {
            return {HandlerError::none, {}, {}};
        }

        const auto count = static_cast<std::size_t>(std::min<std::uint64_t>(max_length, blob_size - offset));
        const auto begin = m_blob->begin() + static_cast<std::ptrdiff_t>(offset);

        return {HandlerError::none, {}, MyTftp::PacketBytes {begin, begin + static_cast<std::ptrdiff_t>(count)}};
    }

    std::optional<std::uint64_t> MemorySource::length() const {
        return m_blob->size();
    }

    NetasciiSource::NetasciiSource(std::unique_ptr<Source> inner) noexcept
    : m_inner {std::move(inner)}, m_chunk {}, m_chunk_pos {0UL}, m_inner_offset {0ULL}, m_out_offset {0ULL}, m_pending {}, m_inner_done {false} {}

    ReadResult NetasciiSource::read(std::uint64_t offset, std::size_t max_length) {
        if (offset != m_out_offset) {
            return {HandlerError::io_failure, "netascii source only supports sequential reads", {}};
        }

        MyTftp::PacketBytes temp;
        temp.reserve(max_length);

        while (temp.size() < max_length) {
            if (m_pending) {
                temp.push_back(*m_pending);
                m_pending.reset();
                continue;
            }

            if (m_chunk_pos >= m_chunk.size()) {
                if (m_inner_done) {
                    break;
                }

                auto [error, detail, data] = m_inner->read(m_inner_offset, netascii_chunk_size);

                if (error != HandlerError::none) {
                    return {error, std::move(detail), {}};
                }

                m_inner_done = data.size() < netascii_chunk_size;
                m_inner_offset += data.size();
                m_chunk = std::move(data);
                m_chunk_pos = 0UL;
                continue;
            }

            const auto octet = m_chunk[m_chunk_pos++];

            if (octet == octet_lf) {
                temp.push_back(octet_cr);
                m_pending = octet_lf;
            } else if (octet == octet_cr) {
                temp.push_back(octet_cr);
                m_pending = octet_nul;
            } else {
                temp.push_back(octet);
            }
        }

        m_out_offset += temp.size();

        return {HandlerError::none, {}, std::move(temp)};
    }

    std::optional<std::uint64_t> NetasciiSource::length() const {
        return {};
    }

    FileHandler::FileHandler(std::filesystem::path root)
    : m_root {std::move(root)} {}

    OpenResult FileHandler::open(const std::string& path, MyTftp::DataMode mode) {
        if (mode != MyTftp::DataMode::octet and mode != MyTftp::DataMode::netascii) {
            return {HandlerError::access_denied, "unsupported transfer mode", nullptr};
        }

        const auto resolved = FileUtils::resolveBelow(m_root, path);

        if (not resolved) {
            return {HandlerError::access_denied, "path escapes the serving directory", nullptr};
        }

        std::error_code fs_error;
        const auto file_status = std::filesystem::status(*resolved, fs_error);

        if (not std::filesystem::exists(file_status)) {
            return {HandlerError::not_found, {}, nullptr};
        }

        if (not std::filesystem::is_regular_file(file_status)) {
            return {HandlerError::access_denied, "not a regular file", nullptr};
        }

        const auto file_size = std::filesystem::file_size(*resolved, fs_error);

        if (fs_error) {
            return {HandlerError::io_failure, fs_error.message(), nullptr};
        }

        std::ifstream fs {*resolved, std::ios::binary | std::ios::in};

        if (not fs.is_open()) {
            return {HandlerError::access_denied, "file is not readable", nullptr};
        }

        return wrapForMode(std::make_unique<FileSource>(std::move(fs), file_size), mode);
    }

    void MemoryHandler::addEntry(std::string name, MyTftp::PacketBytes data) {
        m_entries.insert_or_assign(std::move(name), std::make_shared<const MyTftp::PacketBytes>(std::move(data)));
    }

    OpenResult MemoryHandler::open(const std::string& path, MyTftp::DataMode mode) {
        if (mode != MyTftp::DataMode::octet and mode != MyTftp::DataMode::netascii) {
            return {HandlerError::access_denied, "unsupported transfer mode", nullptr};
        }

        const auto entry_it = m_entries.find(path);

        if (entry_it == m_entries.end()) {
            return {HandlerError::not_found, {}, nullptr};
        }

        return wrapForMode(std::make_unique<MemorySource>(entry_it->second), mode);
    }
}
