#include "test_common.hpp"
#include <filesystem>
#include <fstream>
#include <iostream>
#include <string>
#include <unistd.h>
#include "mytftpd/handlers.hpp"

using namespace RollTftp::Driver;
using RollTftp::MyTftp::DataMode;
using RollTftp::MyTftp::PacketBytes;
using test::TestStats;
using test::bytesOf;
using test::check;

namespace fs = std::filesystem;

static fs::path makeScratchRoot() {
    auto root = fs::temp_directory_path() / ("rolltftp-handlers-" + std::to_string(::getpid()));
    fs::remove_all(root);
    fs::create_directories(root / "sub");
    return root;
}

static void writeFile(const fs::path& path, const PacketBytes& content) {
    std::ofstream out {path, std::ios::binary | std::ios::trunc};
    out.write(reinterpret_cast<const char*>(content.data()), static_cast<std::streamsize>(content.size()));
}

// Reads a source to exhaustion in fixed steps, like a transfer would
static PacketBytes drain(Source& source, std::size_t step) {
    PacketBytes all;
    std::uint64_t offset = 0;
    while (true) {
        auto result = source.read(offset, step);
        if (result.error != HandlerError::none) {
            break;
        }
        all.insert(all.end(), result.data.begin(), result.data.end());
        offset += result.data.size();
        if (result.data.size() < step) {
            break;
        }
    }
    return all;
}

// =================== A. Path resolution ===================
void testResolve(TestStats& stats) {
    std::cout << "\n[A. Path Resolution]\n";

    const fs::path root {"/srv/tftp"};
    check(stats, FileUtils::resolveBelow(root, "boot/pxe.0") == root / "boot/pxe.0", "relative names land below the root");
    check(stats, FileUtils::resolveBelow(root, "/boot/pxe.0") == root / "boot/pxe.0", "leading slashes are relative to the root");
    check(stats, !FileUtils::resolveBelow(root, "../etc/passwd"), "parent traversal is refused");
    check(stats, !FileUtils::resolveBelow(root, "a/../../etc/passwd"), "nested traversal is refused");
    check(stats, FileUtils::resolveBelow(root, "a/../b") == root / "b", "traversal that stays inside is normalized");
    check(stats, !FileUtils::resolveBelow(root, "///"), "a name of only slashes is refused");
}

// =================== B. File handler ===================
void testFileHandler(TestStats& stats, const fs::path& root) {
    std::cout << "\n[B. File Handler]\n";

    const auto content = test::makeBlob(1300);
    writeFile(root / "sub" / "kernel.bin", content);
    writeFile(root / "empty.bin", {});

    FileHandler handler {root};

    auto opened = handler.open("sub/kernel.bin", DataMode::octet);
    check(stats, opened.error == HandlerError::none && opened.source != nullptr, "existing file opens");
    check(stats, opened.source && opened.source->length() == 1300ULL, "file length is known");
    check(stats, opened.source && drain(*opened.source, 512) == content, "octet reads return the file verbatim");

    if (opened.source) {
        const auto tail = opened.source->read(1200, 512);
        check(stats, tail.error == HandlerError::none && tail.data.size() == 100, "read near the end is short");
        const auto past = opened.source->read(5000, 512);
        check(stats, past.error == HandlerError::none && past.data.empty(), "read past the end is empty");
        const auto again = opened.source->read(0, 8);
        check(stats, again.data == PacketBytes(content.begin(), content.begin() + 8), "reads may seek backwards");
    }

    opened = handler.open("empty.bin", DataMode::octet);
    check(stats, opened.source && opened.source->length() == 0ULL && drain(*opened.source, 512).empty(), "empty file opens with length 0");

    opened = handler.open("missing.bin", DataMode::octet);
    check(stats, opened.error == HandlerError::not_found && opened.source == nullptr, "missing file is not_found");

    opened = handler.open("sub", DataMode::octet);
    check(stats, opened.error == HandlerError::access_denied, "directory is access_denied");

    opened = handler.open("../outside", DataMode::octet);
    check(stats, opened.error == HandlerError::access_denied, "escaping the root is access_denied");

    opened = handler.open("sub/kernel.bin", DataMode::mail);
    check(stats, opened.error == HandlerError::access_denied, "mail mode is refused");

    check(stats, toErrorCode(HandlerError::not_found) == RollTftp::MyTftp::ErrorCode::file_not_found &&
                 toErrorCode(HandlerError::access_denied) == RollTftp::MyTftp::ErrorCode::access_violation &&
                 toErrorCode(HandlerError::io_failure) == RollTftp::MyTftp::ErrorCode::not_defined,
          "handler errors map to TFTP codes 1, 2, 0");
}

// =================== C. Memory handler ===================
void testMemoryHandler(TestStats& stats) {
    std::cout << "\n[C. Memory Handler]\n";

    MemoryHandler handler;
    handler.addEntry("greeting", bytesOf("hello, world"));

    auto opened = handler.open("greeting", DataMode::octet);
    check(stats, opened.source && opened.source->length() == 12ULL, "memory entry reports its length");
    check(stats, opened.source && drain(*opened.source, 5) == bytesOf("hello, world"), "memory entry reads back in pieces");

    auto second = handler.open("greeting", DataMode::octet);
    check(stats, second.source != nullptr && opened.source.get() != second.source.get(), "each open yields an independent source");

    opened = handler.open("absent", DataMode::octet);
    check(stats, opened.error == HandlerError::not_found, "unknown entry is not_found");
}

// =================== D. netascii ===================
void testNetascii(TestStats& stats) {
    std::cout << "\n[D. netascii Translation]\n";

    MemoryHandler handler;
    handler.addEntry("text", bytesOf("a\nb\rc"));

    auto opened = handler.open("text", DataMode::netascii);
    check(stats, opened.source && !opened.source->length(), "netascii length is unknown");
    check(stats, opened.source && drain(*opened.source, 512) == bytesOf({'a', '\r', '\n', 'b', '\r', 0, 'c'}),
          "LF becomes CR LF and CR becomes CR NUL");

    // The expansion of '\n' straddles the 2-octet read boundary
    opened = handler.open("text", DataMode::netascii);
    if (opened.source) {
        const auto first = opened.source->read(0, 2);
        const auto second = opened.source->read(2, 2);
        check(stats, first.data == bytesOf({'a', '\r'}) && second.data == bytesOf({'\n', 'b'}), "expansions split across reads");
        const auto out_of_order = opened.source->read(0, 2);
        check(stats, out_of_order.error == HandlerError::io_failure, "non-sequential reads are refused");
    }

    PacketBytes big(10000, 'x');
    big[4095] = '\n';
    handler.addEntry("big", big);
    opened = handler.open("big", DataMode::netascii);
    check(stats, opened.source && drain(*opened.source, 512).size() == 10001, "translation spans inner chunk boundaries");
}

int main() {
    std::cout << "Handler tests\n";

    TestStats stats;
    const auto root = makeScratchRoot();

    testResolve(stats);
    testFileHandler(stats, root);
    testMemoryHandler(stats);
    testNetascii(stats);

    fs::remove_all(root);

    stats.print();
    return stats.exitCode();
}
