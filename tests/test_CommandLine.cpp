#include <gtest/gtest.h>
#include <functional>
#include "core/CommandLine.h"

namespace {
template <size_t N>
HubOptions hub(const char* const (&argv)[N]) {
    return parseHubArgs(static_cast<int>(N), argv);
}

template <size_t N>
ProxyOptions proxy(const char* const (&argv)[N]) {
    return parseProxyArgs(static_cast<int>(N), argv);
}

std::string errorOf(const std::function<void()>& fn) {
    try {
        fn();
    } catch (const std::runtime_error& e) {
        return e.what();
    }
    return "";
}
} // namespace

TEST(CommandLineTest, HubDefaults) {
    const char* const argv[] = {"mcphub"};
    HubOptions options = hub(argv);
    EXPECT_TRUE(options.configPaths.empty());
    EXPECT_FALSE(options.port.has_value());
    EXPECT_FALSE(options.noWorkspace);
    EXPECT_FALSE(options.autoApprove);
    EXPECT_FALSE(options.logLevel.has_value());
}

TEST(CommandLineTest, HubOptionsInBothForms) {
    const char* const argv[] = {"mcphub", "--config", "a.json", "--config=b.json", "--port=40001",
                                "--no-workspace", "--log-level", "debug", "--auto-approve"};
    HubOptions options = hub(argv);
    EXPECT_EQ(options.configPaths, (std::vector<std::string>{"a.json", "b.json"}));
    ASSERT_TRUE(options.port.has_value());
    EXPECT_EQ(*options.port, 40001);
    EXPECT_TRUE(options.noWorkspace);
    ASSERT_TRUE(options.logLevel.has_value());
    EXPECT_EQ(*options.logLevel, LogLevel::DEBUG);
    EXPECT_TRUE(options.autoApprove);
}

TEST(CommandLineTest, HubRejectsBadInput) {
    const char* const unknown[] = {"mcphub", "--frobnicate"};
    EXPECT_EQ(errorOf([&] { hub(unknown); }), "Unknown option: --frobnicate");

    const char* const missing[] = {"mcphub", "--config"};
    EXPECT_EQ(errorOf([&] { hub(missing); }), "Missing value for --config");

    const char* const notNumber[] = {"mcphub", "--port", "12ab"};
    EXPECT_EQ(errorOf([&] { hub(notNumber); }), "Invalid number for --port: 12ab");

    const char* const outOfRange[] = {"mcphub", "--port", "70000"};
    EXPECT_FALSE(errorOf([&] { hub(outOfRange); }).empty());
}

TEST(CommandLineTest, ProxyNeedsExactlyOneTarget) {
    const char* const none[] = {"mcphub-proxy"};
    EXPECT_EQ(errorOf([&] { proxy(none); }), "Exactly one of --socket, --port or --workspace is required");

    const char* const both[] = {"mcphub-proxy", "--port", "40000", "--socket", "/tmp/hub.sock"};
    EXPECT_EQ(errorOf([&] { proxy(both); }), "Exactly one of --socket, --port or --workspace is required");

    const char* const help[] = {"mcphub-proxy", "--help"};
    EXPECT_TRUE(proxy(help).help);
}

TEST(CommandLineTest, ProxyTimeoutsAndShortFlags) {
    const char* const argv[] = {"mcphub-proxy", "--workspace", "/work/app", "-t", "1500", "-c", "250", "-v", "3"};
    ProxyOptions options = proxy(argv);
    EXPECT_EQ(options.workspaceDir, "/work/app");
    EXPECT_EQ(options.rpcCallTimeout, std::chrono::milliseconds(1500));
    EXPECT_EQ(options.connectionTimeout, std::chrono::milliseconds(250));
    ASSERT_TRUE(options.logLevel.has_value());
    EXPECT_EQ(*options.logLevel, LogLevel::WARNING);
}
