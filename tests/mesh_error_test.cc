#include <core/error/mesh_error.h>
#include <gtest/gtest.h>
#include <string>

using namespace tailkit::core;

TEST(MeshErrorTest, Descriptions) {
    EXPECT_EQ(MeshError::CommandFailed("Connection timeout").description(),
              "Tailscale command failed: Connection timeout");
    EXPECT_EQ(MeshError::ExecutionFailed("Process crashed").description(),
              "Failed to execute Tailscale command: Process crashed");
    EXPECT_EQ(MeshError::InvalidAddress("192.168.1.1").description(),
              "Invalid Tailscale IP address: 192.168.1.1");
    EXPECT_EQ(MeshError::InvalidOutput().description(), "Invalid output from Tailscale command");
    EXPECT_EQ(MeshError::NotInstalled().description(), "Tailscale is not installed on this system");
    EXPECT_EQ(MeshError::NotConnected().description(), "Tailscale is not connected to a network");
}

TEST(MeshErrorTest, WhatMatchesDescription) {
    auto error = MeshError::CommandFailed("boom");
    EXPECT_EQ(std::string(error.what()), error.description());
}

TEST(MeshErrorTest, InvalidOutputDiagnosticStaysOutOfDescription) {
    auto error = MeshError::InvalidOutput("$.Peer: expected object, got array");
    EXPECT_EQ(error.description(), "Invalid output from Tailscale command");
    EXPECT_EQ(error.detail(), "$.Peer: expected object, got array");
}

TEST(MeshErrorTest, KindAndDetail) {
    auto error = MeshError::InvalidAddress("10.0.0.1");
    EXPECT_EQ(error.kind(), ErrorKind::kInvalidAddress);
    EXPECT_EQ(error.detail(), "10.0.0.1");
    EXPECT_EQ(MeshError::NotInstalled().kind(), ErrorKind::kNotInstalled);
    EXPECT_TRUE(MeshError::NotConnected().detail().empty());
}

TEST(MeshErrorTest, RecoverySuggestions) {
    EXPECT_NE(MeshError::CommandFailed("x").recovery_suggestion().find("tailscale status"),
              std::string::npos);
    EXPECT_NE(MeshError::ExecutionFailed("x").recovery_suggestion().find("tailscale status"),
              std::string::npos);
    EXPECT_NE(MeshError::InvalidAddress("0.0.0.0").recovery_suggestion().find("tailscale up"),
              std::string::npos);
    EXPECT_NE(MeshError::InvalidOutput().recovery_suggestion().find("bug"), std::string::npos);
    EXPECT_NE(MeshError::NotInstalled().recovery_suggestion().find("tailscale.com/download"),
              std::string::npos);
    EXPECT_NE(MeshError::NotConnected().recovery_suggestion().find("tailscale up"),
              std::string::npos);
}

TEST(MeshErrorTest, MessagesArePreservedVerbatim) {
    EXPECT_EQ(MeshError::CommandFailed("").description(), "Tailscale command failed: ");

    const std::string multiline = "Line 1\nLine 2\nLine 3";
    EXPECT_NE(MeshError::CommandFailed(multiline).description().find(multiline), std::string::npos);

    const std::string special = "Error: \"quoted\", 'apostrophe', <brackets>, & ampersand";
    EXPECT_NE(MeshError::CommandFailed(special).description().find(special), std::string::npos);

    const std::string unicode = "Error: \xF0\x9F\x9A\x80, \xE6\x97\xA5\xE6\x9C\xAC";
    EXPECT_NE(MeshError::CommandFailed(unicode).description().find(unicode), std::string::npos);

    std::string long_message;
    for (int i = 0; i < 100; ++i) {
        long_message += "error ";
    }
    EXPECT_NE(MeshError::ExecutionFailed(long_message).description().find(long_message),
              std::string::npos);
}

TEST(MeshErrorTest, CatchableAsRuntimeError) {
    try {
        throw MeshError::CommandFailed("Test error");
    } catch (const std::runtime_error& e) {
        EXPECT_EQ(std::string(e.what()), "Tailscale command failed: Test error");
        return;
    }
    FAIL() << "MeshError was not caught as std::runtime_error";
}

TEST(MeshErrorTest, KindNames) {
    EXPECT_EQ(ToString(ErrorKind::kCommandFailed), "CommandFailed");
    EXPECT_EQ(ToString(ErrorKind::kExecutionFailed), "ExecutionFailed");
    EXPECT_EQ(ToString(ErrorKind::kInvalidAddress), "InvalidAddress");
    EXPECT_EQ(ToString(ErrorKind::kInvalidOutput), "InvalidOutput");
    EXPECT_EQ(ToString(ErrorKind::kNotInstalled), "NotInstalled");
    EXPECT_EQ(ToString(ErrorKind::kNotConnected), "NotConnected");
}

TEST(MeshErrorTest, ToJson) {
    auto data = MeshError::CommandFailed("daemon not running").ToJson();
    EXPECT_EQ(data["kind"], "CommandFailed");
    EXPECT_EQ(data["message"], "Tailscale command failed: daemon not running");
    EXPECT_EQ(data["detail"], "daemon not running");
    EXPECT_FALSE(data["suggestion"].get<std::string>().empty());

    EXPECT_FALSE(MeshError::NotInstalled().ToJson().contains("detail"));
}
