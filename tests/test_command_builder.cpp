#include <gtest/gtest.h>
#include <algorithm>
#include <ssh/command_builder.hpp>
#include "fake_lookup.hpp"

class CommandBuilderTest : public ::testing::Test {
protected:
    Settings settings;
    FakeLookup lookup{"bastion.corp.example.com", "hop.example.org"};
    HostResolver resolver{lookup};

    void SetUp() override {
        settings.ssh_port = "22";
        settings.jump_host = "bastion";
        settings.domains = {"corp.example.com"};
        settings.tunnel_port = "1080";
        settings.sshpass = false;
    }

    CommandVector build_ok(const ConnectionOptions& options,
                           const std::string& target = "db1.corp.example.com") {
        CommandBuilder builder(settings, resolver);
        auto result = builder.build(options, target);
        EXPECT_TRUE(result.is_ok()) << result.failure.message();
        return result.value;
    }

    static bool has(const CommandVector& cmd, const std::string& arg) {
        return std::find(cmd.begin(), cmd.end(), arg) != cmd.end();
    }

    static long index_of(const CommandVector& cmd, const std::string& arg) {
        return std::find(cmd.begin(), cmd.end(), arg) - cmd.begin();
    }
};

TEST_F(CommandBuilderTest, Minimal) {
    auto cmd = build_ok(ConnectionOptions{});
    EXPECT_EQ(cmd, (CommandVector{"ssh", "-p", "22", "-o", "StrictHostKeyChecking=no",
                                  "db1.corp.example.com"}));
}

TEST_F(CommandBuilderTest, PortOverride) {
    ConnectionOptions options;
    options.port = "2222";
    auto cmd = build_ok(options);
    EXPECT_EQ(cmd[1], "-p");
    EXPECT_EQ(cmd[2], "2222");
}

TEST_F(CommandBuilderTest, PortFromSettings) {
    settings.ssh_port = "8022";
    auto cmd = build_ok(ConnectionOptions{});
    EXPECT_EQ(cmd[2], "8022");
}

TEST_F(CommandBuilderTest, VerbosityClamped) {
    const std::vector<std::pair<int, std::string>> cases = {
        {1, "-v"}, {2, "-vv"}, {3, "-vvv"}, {4, "-vvv"}, {100, "-vvv"},
    };
    for (const auto& [count, flag] : cases) {
        ConnectionOptions options;
        options.verbosity = count;
        auto cmd = build_ok(options);
        EXPECT_EQ(cmd[3], flag) << count;
    }
}

TEST_F(CommandBuilderTest, NoVerbosityFlagAtZero) {
    auto cmd = build_ok(ConnectionOptions{});
    for (const auto& arg : cmd) {
        EXPECT_NE(arg.rfind("-v", 0), 0u) << arg;
    }
}

TEST_F(CommandBuilderTest, NoPubkey) {
    ConnectionOptions options;
    options.no_pubkey = true;
    auto cmd = build_ok(options);
    long at = index_of(cmd, "PubkeyAuthentication=no");
    ASSERT_LT(at, static_cast<long>(cmd.size()));
    EXPECT_EQ(cmd[at - 1], "-o");
}

TEST_F(CommandBuilderTest, JumpUsesConfiguredHostCompleted) {
    ConnectionOptions options;
    options.jump = true;
    auto cmd = build_ok(options);
    long at = index_of(cmd, "-J");
    ASSERT_LT(at + 1, static_cast<long>(cmd.size()));
    EXPECT_EQ(cmd[at + 1], "bastion.corp.example.com");
    EXPECT_LT(at, index_of(cmd, "db1.corp.example.com"));
}

TEST_F(CommandBuilderTest, JumpOverrideWins) {
    ConnectionOptions options;
    options.jump_host = "me@hop.example.org";
    auto cmd = build_ok(options);
    long at = index_of(cmd, "-J");
    EXPECT_EQ(cmd[at + 1], "me@hop.example.org");
}

TEST_F(CommandBuilderTest, JumpHostFailure) {
    ConnectionOptions options;
    options.jump_host = "nowhere";
    CommandBuilder builder(settings, resolver);
    auto result = builder.build(options, "db1.corp.example.com");
    ASSERT_TRUE(result.is_err());
    EXPECT_EQ(result.failure.subject, ResolutionFailure::Subject::JumpHost);
    EXPECT_EQ(result.failure.attempted_host, "nowhere");
    EXPECT_EQ(result.failure.message(), "Failed to find valid FQDN for jumphost \"nowhere\"");
}

TEST_F(CommandBuilderTest, NoJumpNoLookups) {
    build_ok(ConnectionOptions{});
    EXPECT_TRUE(lookup.calls.empty());
}

TEST_F(CommandBuilderTest, PasswordInjectionPrepended) {
    settings.sshpass = true;
    auto cmd = build_ok(ConnectionOptions{});
    ASSERT_GE(cmd.size(), 3u);
    EXPECT_EQ(cmd[0], "sshpass");
    EXPECT_EQ(cmd[1], "-e");
    EXPECT_EQ(cmd[2], "ssh");
}

TEST_F(CommandBuilderTest, PasswordInjectionSkippedForExplicitUser) {
    settings.sshpass = true;
    auto cmd = build_ok(ConnectionOptions{}, "root@db1.corp.example.com");
    EXPECT_EQ(cmd[0], "ssh");
    EXPECT_FALSE(has(cmd, "sshpass"));
}

TEST_F(CommandBuilderTest, PasswordInjectionSkippedWhenJumping) {
    settings.sshpass = true;
    ConnectionOptions options;
    options.jump = true;
    auto cmd = build_ok(options);
    EXPECT_EQ(cmd[0], "ssh");
    EXPECT_TRUE(has(cmd, "-J"));
}

TEST_F(CommandBuilderTest, TunnelBeforeTarget) {
    ConnectionOptions options;
    options.tunnel = true;
    auto cmd = build_ok(options);
    long at = index_of(cmd, "-D");
    ASSERT_LT(at + 1, static_cast<long>(cmd.size()));
    EXPECT_EQ(cmd[at + 1], "1080");
    EXPECT_EQ(cmd.back(), "db1.corp.example.com");
}

TEST_F(CommandBuilderTest, CommandAppendedLast) {
    ConnectionOptions options;
    options.command = "uptime -p";
    auto cmd = build_ok(options);
    ASSERT_GE(cmd.size(), 2u);
    EXPECT_EQ(cmd[cmd.size() - 2], "db1.corp.example.com");
    EXPECT_EQ(cmd.back(), "uptime -p");
}

TEST_F(CommandBuilderTest, CommandSuppressesTunnel) {
    ConnectionOptions options;
    options.tunnel = true;
    options.command = "uptime";
    auto cmd = build_ok(options);
    EXPECT_FALSE(has(cmd, "-D"));
    EXPECT_FALSE(has(cmd, "1080"));
}

TEST_F(CommandBuilderTest, JumpTunnelAndCommand) {
    ConnectionOptions options;
    options.jump = true;
    options.tunnel = true;
    options.command = "hostname";
    auto cmd = build_ok(options);
    EXPECT_EQ(cmd, (CommandVector{"ssh", "-p", "22", "-o", "StrictHostKeyChecking=no",
                                  "-J", "bastion.corp.example.com",
                                  "db1.corp.example.com", "hostname"}));
}

TEST_F(CommandBuilderTest, FullOrdering) {
    settings.sshpass = true;
    ConnectionOptions options;
    options.port = "2200";
    options.verbosity = 2;
    options.no_pubkey = true;
    options.tunnel = true;
    auto cmd = build_ok(options);
    EXPECT_EQ(cmd, (CommandVector{"sshpass", "-e", "ssh", "-p", "2200", "-vv",
                                  "-o", "StrictHostKeyChecking=no",
                                  "-o", "PubkeyAuthentication=no",
                                  "-D", "1080", "db1.corp.example.com"}));
}
