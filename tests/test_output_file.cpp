#include <gtest/gtest.h>
#include <chrono>
#include <string>
#include <thread>

#include <fcntl.h>
#include <unistd.h>

#include "core/errors.hpp"
#include "io/output_file.hpp"
#include "test_util.hpp"

using namespace repcat;
using repcat_test::read_all;
using repcat_test::random_bytes;

class OutputFileTest : public repcat_test::TempDirTest {};

TEST_F(OutputFileTest, CreateTruncatesExistingFile) {
    const auto p = write_file("out", "old contents that are long");
    auto out = output_file::create(p);
    out.write_all("new", 3);
    EXPECT_EQ(out.offset(), 3u);
    out.close();
    EXPECT_FALSE(out.is_open());
    EXPECT_EQ(read_all(p), "new");
}

TEST_F(OutputFileTest, CreateInMissingDirectoryIsIoError) {
    try {
        output_file::create(path("no/such/dir/out"));
        FAIL() << "expected io_error";
    } catch (const io_error& e) {
        EXPECT_EQ(e.operation(), "create");
        EXPECT_EQ(e.errno_value(), ENOENT);
    }
}

TEST_F(OutputFileTest, PreallocateSizesRegularFile) {
    const auto p = path("pre");
    auto out = output_file::create(p);
    EXPECT_TRUE(out.preallocate(4096));
    out.write_all("abc", 3);
    out.close();
    EXPECT_EQ(std::filesystem::file_size(p), 4096u);
    EXPECT_EQ(read_all(p).substr(0, 3), "abc");
}

TEST_F(OutputFileTest, MoveTransfersOwnership) {
    const auto p = path("moved");
    auto a = output_file::create(p);
    output_file b = std::move(a);
    EXPECT_FALSE(a.is_open());
    ASSERT_TRUE(b.is_open());
    b.write_all("x", 1);
    b.close();
    EXPECT_EQ(read_all(p), "x");
}

TEST_F(OutputFileTest, StdoutIsBorrowedNotClosed) {
    auto out = output_file::standard_output();
    EXPECT_EQ(out.name(), "<stdout>");
    out.close();
    EXPECT_NE(::fcntl(STDOUT_FILENO, F_GETFD), -1);
}

TEST(OutputFilePipe, ReopenedPipeIsNotPreallocated) {
    int fds[2];
    ASSERT_EQ(::pipe(fds), 0);
    const std::string payload = random_bytes(1 << 20, 9);

    std::string received;
    std::thread reader([&] {
        char buf[4096];
        ssize_t n;
        while ((n = ::read(fds[0], buf, sizeof(buf))) > 0) received.append(buf, static_cast<size_t>(n));
        ::close(fds[0]);
    });

    // Reopen the pipe's write end through /proc so output_file owns it.
    auto out = output_file::create("/proc/self/fd/" + std::to_string(fds[1]));
    ::close(fds[1]);
    EXPECT_FALSE(out.preallocate(payload.size()));
    out.write_all(payload.data(), payload.size());
    out.close();
    reader.join();
    EXPECT_EQ(received, payload);
}

TEST(OutputFilePipe, NonBlockingPipeResumesAfterShortWritesAndEagain) {
    int fds[2];
    ASSERT_EQ(::pipe(fds), 0);
    // One page of pipe buffer and a non-blocking write end: each write() can
    // take at most what the reader has drained, the rest is EAGAIN.
    const int cap = ::fcntl(fds[1], F_SETPIPE_SZ, 4096);
    ASSERT_GT(cap, 0);
    ASSERT_EQ(::fcntl(fds[1], F_SETFL, ::fcntl(fds[1], F_GETFL) | O_NONBLOCK), 0);

    const std::string payload = random_bytes(256 << 10, 21);
    ASSERT_GT(payload.size(), static_cast<std::size_t>(cap) * 8);

    std::string received;
    std::thread reader([&] {
        char buf[512];
        ssize_t n;
        while ((n = ::read(fds[0], buf, sizeof(buf))) > 0) {
            received.append(buf, static_cast<size_t>(n));
            std::this_thread::sleep_for(std::chrono::microseconds(50));
        }
        ::close(fds[0]);
    });

    auto out = output_file::adopt(fds[1], "pipe");
    out.write_all(payload.data(), payload.size());
    out.write_all("tail", 4);
    EXPECT_EQ(out.offset(), payload.size() + 4);
    out.close();
    reader.join();
    EXPECT_EQ(received, payload + "tail");
}

TEST(OutputFileAdopt, NegativeDescriptorIsIoError) {
    EXPECT_THROW(output_file::adopt(-1, "bad"), io_error);
}
