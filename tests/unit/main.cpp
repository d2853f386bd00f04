#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <csignal>

int main(int argc, char **argv) {
    // Writes to exited test workers must fail with EPIPE instead of killing the run
    std::signal(SIGPIPE, SIG_IGN);

    // Explicitly initialize GoogleTest so --gtest_list_tests and filters work
    // reliably during CTest discovery.
    ::testing::InitGoogleTest(&argc, argv);
    ::testing::InitGoogleMock(&argc, argv);
    return RUN_ALL_TESTS();
}
