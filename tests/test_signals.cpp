#include <gtest/gtest.h>
#include <platform/signals.hpp>
#include <platform/process.hpp>
#include <sys/wait.h>
#include <unistd.h>

static void (*current_handler(int sig))(int) {
    struct sigaction cur = {};
    sigaction(sig, nullptr, &cur);
    return cur.sa_handler;
}

static void dummy_handler(int) {}

// Installs dummy_handler for SIGINT/SIGQUIT so restores are observable, and
// puts back the test runner's own dispositions afterwards.
class SignalsTest : public ::testing::Test {
protected:
    struct sigaction saved_int = {};
    struct sigaction saved_quit = {};

    void SetUp() override {
        struct sigaction sa = {};
        sa.sa_handler = dummy_handler;
        sigemptyset(&sa.sa_mask);
        sigaction(SIGINT, &sa, &saved_int);
        sigaction(SIGQUIT, &sa, &saved_quit);
    }

    void TearDown() override {
        sigaction(SIGINT, &saved_int, nullptr);
        sigaction(SIGQUIT, &saved_quit, nullptr);
    }
};

TEST_F(SignalsTest, InterruptExitsQuietlyWithStatus) {
    pid_t pid = fork();
    ASSERT_GE(pid, 0);
    if (pid == 0) {
        platform::exit_quietly_on_interrupt(130);
        raise(SIGINT);
        _exit(0);   // not reached
    }

    int status = 0;
    ASSERT_EQ(waitpid(pid, &status, 0), pid);
    ASSERT_TRUE(WIFEXITED(status));
    EXPECT_EQ(WEXITSTATUS(status), 130);
}

TEST_F(SignalsTest, ScopedIgnoreRestoresPreviousHandlers) {
    {
        platform::ScopedIgnoreInterrupts ignore;
        EXPECT_EQ(current_handler(SIGINT), SIG_IGN);
        EXPECT_EQ(current_handler(SIGQUIT), SIG_IGN);
    }
    EXPECT_EQ(current_handler(SIGINT), dummy_handler);
    EXPECT_EQ(current_handler(SIGQUIT), dummy_handler);
}

TEST_F(SignalsTest, ScopedIgnoreSurvivesInterrupt) {
    {
        platform::ScopedIgnoreInterrupts ignore;
        raise(SIGINT);
        raise(SIGQUIT);
    }
    SUCCEED();
}

TEST_F(SignalsTest, RestoreDefaultInterrupts) {
    platform::restore_default_interrupts();
    EXPECT_EQ(current_handler(SIGINT), SIG_DFL);
    EXPECT_EQ(current_handler(SIGQUIT), SIG_DFL);
}

TEST_F(SignalsTest, ChildSeesDefaultInterruptWhileParentIgnores) {
    // The parent ignores SIGINT during run(); the child must still die from it
    EXPECT_EQ(platform::run({"sh", "-c", "kill -INT $$"}), 128 + SIGINT);
    EXPECT_EQ(current_handler(SIGINT), dummy_handler);
}
