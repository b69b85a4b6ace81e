#include <core/error/mesh_error.h>
#include <core/service/mesh_service.h>
#include <gtest/gtest.h>
#include <test_support.h>

using namespace tailkit::core;
using namespace tailkit::test;

namespace {

// MeshService on its default SubprocessRunner, pointed at a shell script that
// answers like the tailscale binary.
class MeshServiceIntegrationTest : public ::testing::Test {
protected:
    std::filesystem::path WriteTool(const std::string& body) {
        auto file = dir_.WriteFile("tailscale", "#!/bin/sh\n" + body);
        std::filesystem::permissions(file,
                                     std::filesystem::perms::owner_exec,
                                     std::filesystem::perm_options::add);
        return file;
    }

    std::filesystem::path WriteWorkingTool() {
        return WriteTool("case \"$1\" in\n"
                         "  ip) echo \"" + std::string(kSelfIp) + "\" ;;\n"
                         "  status)\n"
                         "    cat <<'JSON'\n"
                         + StatusJson().dump(2) + "\n"
                         "JSON\n"
                         "    ;;\n"
                         "  *) echo \"unknown command: $1\" >&2; exit 1 ;;\n"
                         "esac\n");
    }

    TempDir dir_;
    net::io_context ioc_;
};

} // namespace

TEST_F(MeshServiceIntegrationTest, AnswersFromTheTool) {
    auto tool = WriteWorkingTool();
    MeshService service(ioc_, ServiceOptions{.binary_path = tool.string()});

    EXPECT_TRUE(service.IsAvailable());
    EXPECT_EQ(RunSync(ioc_, service.GetCurrentAddress()), kSelfIp);
    EXPECT_EQ(RunSync(ioc_, service.GetHostname()), kSelfHostname);

    auto status = RunSync(ioc_, service.GetStatus());
    EXPECT_EQ(status, (ConnectionStatus{.hostname = kSelfHostname,
                                        .ip = kSelfIp,
                                        .online = true,
                                        .peer_count = 2}));
    EXPECT_TRUE(RunSync(ioc_, service.IsConnected()));

    auto devices = RunSync(ioc_, service.ListDevices());
    ASSERT_EQ(devices.size(), 2u);
    EXPECT_EQ(devices[0].id, kPeerKey1);
    EXPECT_EQ(devices[0].ip, "100.64.1.3");
    EXPECT_EQ(devices[1].id, kPeerKey2);
    EXPECT_FALSE(devices[1].online);
}

TEST_F(MeshServiceIntegrationTest, FailingToolIsCommandFailed) {
    auto tool = WriteTool("echo 'Tailscale is stopped.' >&2\nexit 1\n");
    MeshService service(ioc_, ServiceOptions{.binary_path = tool.string()});

    try {
        RunSync(ioc_, service.GetCurrentAddress());
        FAIL() << "expected MeshError";
    } catch (const MeshError& e) {
        EXPECT_EQ(e.kind(), ErrorKind::kCommandFailed);
        EXPECT_EQ(e.detail(), "Tailscale is stopped.");
    }
    EXPECT_FALSE(RunSync(ioc_, service.IsConnected()));
}

TEST_F(MeshServiceIntegrationTest, MissingToolIsExecutionFailed) {
    MeshService service(ioc_,
                        ServiceOptions{.binary_path = (dir_.path() / "tailscale").string(),
                                       .fallback_binary_path = (dir_.path() / "other").string()});

    EXPECT_FALSE(service.IsAvailable());
    try {
        RunSync(ioc_, service.GetStatus());
        FAIL() << "expected MeshError";
    } catch (const MeshError& e) {
        EXPECT_EQ(e.kind(), ErrorKind::kExecutionFailed);
    }
}

TEST_F(MeshServiceIntegrationTest, ToolTimeout) {
    auto tool = WriteTool("exec sleep 5\n");
    MeshService service(ioc_,
                        ServiceOptions{.binary_path = tool.string(),
                                       .command_timeout = std::chrono::milliseconds(200)});

    try {
        RunSync(ioc_, service.GetCurrentAddress());
        FAIL() << "expected MeshError";
    } catch (const MeshError& e) {
        EXPECT_EQ(e.kind(), ErrorKind::kExecutionFailed);
    }
}
