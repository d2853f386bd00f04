/**
 * line_stdio_client_test.cpp - LineReader / LineStdioClient unit tests
 *
 * Exercises framing against plain OS pipes:
 * - Line splitting, CRLF stripping, unterminated final line at EOF
 * - Timeout reporting without error
 * - Oversized line discarding
 * - Write framing and broken-pipe reporting
 * - Non-blocking writes: timeout on a full pipe, backlog kept across flushes
 */

#include "worker/line_stdio_client.hpp"

#include <gtest/gtest.h>
#include <fcntl.h>
#include <unistd.h>

#include <string>
#include <thread>

using namespace ccproxy::worker;

namespace {

void write_all(int fd, const std::string &data) {
    size_t offset = 0;
    while (offset < data.size()) {
        ssize_t n = ::write(fd, data.data() + offset, data.size() - offset);
        if (n <= 0) {
            return;
        }
        offset += static_cast<size_t>(n);
    }
}

}  // namespace

class LineReaderTest : public ::testing::Test {
protected:
    int fds[2] = {-1, -1};
    LineReader reader;

    void SetUp() override {
        ASSERT_EQ(pipe(fds), 0);
        reader.set_handle(fds[0]);
    }

    void TearDown() override {
        reader.close();
        close_writer();
    }

    void close_writer() {
        if (fds[1] >= 0) {
            ::close(fds[1]);
            fds[1] = -1;
        }
    }
};

TEST_F(LineReaderTest, SplitsLinesAndStripsCarriageReturn) {
    write_all(fds[1], "first\nsecond\r\n\nthird");
    close_writer();

    std::string line;
    ASSERT_TRUE(reader.read_line(line, 1000));
    EXPECT_EQ(line, "first");
    ASSERT_TRUE(reader.read_line(line, 1000));
    EXPECT_EQ(line, "second");
    ASSERT_TRUE(reader.read_line(line, 1000));
    EXPECT_EQ(line, "");

    // Unterminated tail is delivered at EOF
    ASSERT_TRUE(reader.read_line(line, 1000));
    EXPECT_EQ(line, "third");

    EXPECT_FALSE(reader.read_line(line, 1000));
    EXPECT_TRUE(reader.at_eof());
    EXPECT_TRUE(reader.last_error().empty());
}

TEST_F(LineReaderTest, TimeoutIsNotAnError) {
    write_all(fds[1], "partial");

    std::string line;
    EXPECT_FALSE(reader.read_line(line, 50));
    EXPECT_FALSE(reader.at_eof());
    EXPECT_TRUE(reader.last_error().empty());

    // The partial line is kept until its newline arrives
    write_all(fds[1], " line\n");
    ASSERT_TRUE(reader.read_line(line, 1000));
    EXPECT_EQ(line, "partial line");
}

TEST_F(LineReaderTest, DropsOversizedLine) {
    std::thread writer([this]() {
        write_all(fds[1], std::string(kMaxLineSize + 1024, 'x'));
        write_all(fds[1], "\nok\n");
        close_writer();
    });

    std::string line;
    ASSERT_TRUE(reader.read_line(line, 5000));
    EXPECT_EQ(line, "ok");
    EXPECT_EQ(reader.dropped_lines(), 1u);

    writer.join();
}

TEST(LineReaderStandaloneTest, InvalidHandleReportsError) {
    LineReader reader;
    std::string line;
    EXPECT_FALSE(reader.read_line(line, 10));
    EXPECT_EQ(reader.last_error(), "Invalid pipe");
}

class LineStdioClientTest : public ::testing::Test {
protected:
    int in_fds[2] = {-1, -1};   // client writes [1], test reads [0]
    int out_fds[2] = {-1, -1};  // test writes [1], client reads [0]
    int err_fds[2] = {-1, -1};
    LineStdioClient client;

    void SetUp() override {
        ASSERT_EQ(pipe(in_fds), 0);
        ASSERT_EQ(pipe(out_fds), 0);
        ASSERT_EQ(pipe(err_fds), 0);
        client.set_handles(in_fds[1], out_fds[0], err_fds[0]);
    }

    void TearDown() override {
        client.close_all();
        for (int fd : {in_fds[0], out_fds[1], err_fds[1]}) {
            if (fd >= 0) {
                ::close(fd);
            }
        }
    }
};

TEST_F(LineStdioClientTest, WriteLineAppendsNewline) {
    ASSERT_TRUE(client.write_line("{\"type\":\"user\"}"));
    ASSERT_TRUE(client.write_line("already framed\n"));

    LineReader peer;
    peer.set_handle(in_fds[0]);
    std::string line;
    ASSERT_TRUE(peer.read_line(line, 1000));
    EXPECT_EQ(line, "{\"type\":\"user\"}");
    ASSERT_TRUE(peer.read_line(line, 1000));
    EXPECT_EQ(line, "already framed");
}

TEST_F(LineStdioClientTest, ReadsStdoutAndStderrSeparately) {
    write_all(out_fds[1], "out line\n");
    write_all(err_fds[1], "err line\n");

    std::string line;
    ASSERT_TRUE(client.stdout_reader().read_line(line, 1000));
    EXPECT_EQ(line, "out line");
    ASSERT_TRUE(client.stderr_reader().read_line(line, 1000));
    EXPECT_EQ(line, "err line");
}

TEST_F(LineStdioClientTest, WriteAfterReaderGoneFails) {
    // Test main ignores SIGPIPE, so the write surfaces as EPIPE
    ::close(in_fds[0]);
    in_fds[0] = -1;

    EXPECT_FALSE(client.write_line("hello"));
    EXPECT_NE(client.last_error().find("Broken pipe"), std::string::npos);
}

TEST_F(LineStdioClientTest, WriteAfterCloseStdinFails) {
    client.close_stdin();
    EXPECT_FALSE(client.stdin_open());
    EXPECT_FALSE(client.write_line("hello"));
    EXPECT_FALSE(client.last_error().empty());
}

TEST_F(LineStdioClientTest, WriteLineTimesOutOnFullNonBlockingPipe) {
    ASSERT_EQ(fcntl(in_fds[1], F_SETFL, fcntl(in_fds[1], F_GETFL) | O_NONBLOCK), 0);

    // Nobody drains in_fds[0]
    EXPECT_FALSE(client.write_line(std::string(1024 * 1024, 'x'), 100));
    EXPECT_EQ(client.last_error(), "Timeout writing line");
}

TEST_F(LineStdioClientTest, QueuedLineSurvivesFullPipe) {
    ASSERT_EQ(fcntl(in_fds[1], F_SETFL, fcntl(in_fds[1], F_GETFL) | O_NONBLOCK), 0);

    const std::string big(200000, 'x');
    ASSERT_TRUE(client.queue_line(big));
    EXPECT_GT(client.pending_bytes(), 0u);
    ASSERT_TRUE(client.queue_line("next"));

    // Drain the pipe while flushing until the backlog is empty
    std::string received;
    char chunk[65536];
    for (int i = 0; i < 1000 && (client.pending_bytes() > 0 || received.size() < big.size() + 6); ++i) {
        ssize_t n = ::read(in_fds[0], chunk, sizeof(chunk));
        if (n > 0) {
            received.append(chunk, static_cast<size_t>(n));
        }
        ASSERT_TRUE(client.flush()) << client.last_error();
    }

    EXPECT_EQ(client.pending_bytes(), 0u);
    EXPECT_EQ(received, big + "\nnext\n");
}

TEST_F(LineStdioClientTest, CloseStdinDropsBacklog) {
    ASSERT_EQ(fcntl(in_fds[1], F_SETFL, fcntl(in_fds[1], F_GETFL) | O_NONBLOCK), 0);

    ASSERT_TRUE(client.queue_line(std::string(200000, 'x')));
    ASSERT_GT(client.pending_bytes(), 0u);

    client.close_stdin();
    EXPECT_EQ(client.pending_bytes(), 0u);
    EXPECT_FALSE(client.queue_line("late"));
}
