#include <gtest/gtest.h>

#include <algorithm>
#include <chrono>
#include <cstdlib>
#include <stdexcept>
#include <string>
#include <vector>

#include "container/container_client.hpp"
#include "container/scoped_container.hpp"
#include "test_support.hpp"

using evalbox::container::ContainerClient;
using evalbox::container::ContainerConfig;
using evalbox::container::ContainerError;
using evalbox::container::ContainerState;
using evalbox::container::ScopedContainer;
using evalbox::testing::CountOccurrences;
using evalbox::testing::QuietLogger;
using evalbox::testing::TempDir;
using evalbox::testing::WaitUntil;
using evalbox::testing::WriteExecutable;
using evalbox::utils::ReadFile;

namespace {

// Stand-in for nerdctl: logs its argv, answers `ps` from ps-<namespace>.json and runs the
// command of `exec` locally.
std::string FakeRuntimeScript(const TempDir& dir) {
    const auto root = dir.Path().string();
    return "#!/bin/sh\n"
           "printf '%s\\n' \"$*\" >> '" + root + "/calls.log'\n"
           "ns=\n"
           "if [ \"$1\" = \"-n\" ]; then ns=\"$2\"; shift 2; fi\n"
           "case \"$1\" in\n"
           "  run) echo cid-42 ;;\n"
           "  ps) cat '" + root + "/ps-'\"$ns\"'.json' 2>/dev/null || exit 1 ;;\n"
           "  exec) for last; do :; done; exec /bin/sh -c \"$last\" ;;\n"
           "  stop|rm) exit 0 ;;\n"
           "  *) exit 64 ;;\n"
           "esac\n";
}

class ContainerClientTest : public ::testing::Test {
protected:
    void SetUp() override {
        runtime_ = WriteExecutable(dir_ / "fake-runtime", FakeRuntimeScript(dir_)).string();
        ::setenv("POD_NAME", "pod-1", 1);
        ::setenv("POD_NAMESPACE", "team", 1);
    }

    void TearDown() override {
        ::unsetenv("POD_NAME");
        ::unsetenv("POD_NAMESPACE");
        ::unsetenv("EVALBOX_TEST_FORWARDED");
    }

    ContainerConfig Config() const {
        ContainerConfig config;
        config.image = "python:3.11";
        config.cwd = "/work";
        config.executable = runtime_;
        config.timeout = std::chrono::seconds(5);
        config.discovery_backoff = std::chrono::milliseconds(10);
        return config;
    }

    void WriteListing(const std::string& ns, const std::string& body) const {
        evalbox::utils::WriteFile(dir_ / ("ps-" + ns + ".json"), body);
    }

    std::string Calls() const { return ReadFile(dir_ / "calls.log"); }

    TempDir dir_;
    std::string runtime_;
};

}  // namespace

TEST_F(ContainerClientTest, StartStoresContainerId) {
    ContainerClient client(Config(), QuietLogger());
    EXPECT_EQ(client.State(), ContainerState::kUnbound);

    client.StartContainer();

    EXPECT_EQ(client.State(), ContainerState::kStarted);
    EXPECT_EQ(client.ContainerId(), "cid-42");
    const auto calls = Calls();
    EXPECT_NE(calls.find("run -d --name evalbox-"), std::string::npos);
    EXPECT_NE(calls.find("-w /work --rm python:3.11 sleep 2h"), std::string::npos);
}

TEST_F(ContainerClientTest, StartFailureThrowsWithRuntimeOutput) {
    auto config = Config();
    config.executable = WriteExecutable(dir_ / "failing-runtime",
                                        "#!/bin/sh\necho 'pull access denied' 1>&2\nexit 1\n").string();
    ContainerClient client(config, QuietLogger());
    try {
        client.StartContainer();
        FAIL() << "expected ContainerError";
    } catch (const ContainerError& ex) {
        EXPECT_NE(std::string(ex.what()).find("pull access denied"), std::string::npos);
    }
    EXPECT_EQ(client.State(), ContainerState::kUnbound);
}

TEST_F(ContainerClientTest, ExecuteRequiresStartedContainer) {
    ContainerClient client(Config(), QuietLogger());
    EXPECT_THROW(client.Execute("echo hi"), std::logic_error);
}

TEST_F(ContainerClientTest, ExecuteReturnsMergedOutput) {
    ContainerClient client(Config(), QuietLogger());
    client.StartContainer();

    const auto result = client.Execute("echo hi; echo oops 1>&2; exit 2");

    EXPECT_EQ(result.returncode, 2);
    EXPECT_NE(result.stdout_text.find("hi"), std::string::npos);
    EXPECT_NE(result.stdout_text.find("oops"), std::string::npos);
    EXPECT_TRUE(result.stderr_text.empty());
    EXPECT_NE(Calls().find("exec -w /work cid-42 bash -lc"), std::string::npos);
}

TEST_F(ContainerClientTest, ExecuteTimeoutBecomesFailureResult) {
    ContainerClient client(Config(), QuietLogger());
    client.StartContainer();

    const auto result = client.Execute("sleep 5", {}, std::chrono::seconds(1));

    EXPECT_EQ(result.returncode, 1);
    EXPECT_TRUE(result.stdout_text.empty());
    EXPECT_EQ(result.stderr_text.rfind("run err:", 0), 0u);
}

TEST_F(ContainerClientTest, ExecuteWithMissingRuntimeBecomesFailureResult) {
    auto config = Config();
    config.executable = (dir_ / "missing-runtime").string();
    config.container_id = "cid-1";
    ContainerClient client(config, QuietLogger());
    ASSERT_EQ(client.State(), ContainerState::kBound);

    const auto result = client.Execute("true");

    EXPECT_EQ(result.returncode, 1);
    EXPECT_EQ(result.stderr_text.rfind("run err:", 0), 0u);
}

TEST_F(ContainerClientTest, ExecArgsForwardSetVariablesBeforeOverlay) {
    ::setenv("EVALBOX_TEST_FORWARDED", "from-host", 1);
    auto config = Config();
    config.container_id = "cid-7";
    config.namespace_name = "default";
    config.forward_env = {"EVALBOX_TEST_FORWARDED", "EVALBOX_TEST_NEVER_SET"};
    config.env = {{"EVALBOX_TEST_FORWARDED", "explicit"}};
    ContainerClient client(config, QuietLogger());

    const auto argv = client.BuildExecArgs("make test", "/src");

    const std::vector<std::string> expected = {
        runtime_, "-n", "default", "exec", "-w", "/src",
        "-e", "EVALBOX_TEST_FORWARDED=from-host",
        "-e", "EVALBOX_TEST_FORWARDED=explicit",
        "cid-7", "bash", "-lc", "make test"};
    EXPECT_EQ(argv, expected);
}

TEST_F(ContainerClientTest, DiscoveryReturnsFirstNamespaceWithExactMatch) {
    WriteListing("k8s.io", "{\"ID\":\"other\",\"Names\":\"k8s://team/pod-1/second-sidecar\"}\n");
    WriteListing("default", "not json at all\n{\"ID\":\"abc123\",\"Names\":\"k8s://team/pod-1/second\"}\n");

    auto client = ContainerClient::LoadContainer(Config(), {"k8s.io", "default"}, "second", QuietLogger());

    EXPECT_EQ(client->ContainerId(), "abc123");
    EXPECT_EQ(client->Namespace(), "default");
    EXPECT_EQ(client->State(), ContainerState::kBound);
}

TEST_F(ContainerClientTest, DiscoveryPrefersEarlierNamespace) {
    WriteListing("k8s.io", "{\"ID\":\"first\",\"Names\":\"k8s://team/pod-1/second\"}\n");
    WriteListing("default", "{\"ID\":\"later\",\"Names\":\"k8s://team/pod-1/second\"}\n");

    auto client = ContainerClient::LoadContainer(Config(), {"k8s.io", "default"}, "second", QuietLogger());

    EXPECT_EQ(client->ContainerId(), "first");
    EXPECT_EQ(client->Namespace(), "k8s.io");
}

TEST_F(ContainerClientTest, DiscoverySkipsFailingNamespace) {
    // No listing for "broken", so the fake runtime exits non-zero there.
    WriteListing("default", "{\"ID\":\"abc123\",\"Names\":\"k8s://team/pod-1/second\"}\n");

    auto client = ContainerClient::LoadContainer(Config(), {"broken", "default"}, "second", QuietLogger());

    EXPECT_EQ(client->Namespace(), "default");
}

TEST_F(ContainerClientTest, DiscoveryGivesUpAfterFiveAttempts) {
    WriteListing("k8s.io", "{\"ID\":\"x\",\"Names\":\"k8s://team/pod-1/other\"}\n");

    EXPECT_THROW(ContainerClient::LoadContainer(Config(), {"k8s.io"}, "second", QuietLogger()),
                 ContainerError);
    EXPECT_EQ(CountOccurrences(Calls(), "-n k8s.io ps --format json"), 5u);
}

TEST_F(ContainerClientTest, DiscoveryNeedsPodEnvironment) {
    ::unsetenv("POD_NAME");
    EXPECT_THROW(ContainerClient::LoadContainer(Config(), {"k8s.io"}, "second", QuietLogger()),
                 ContainerError);
}

TEST_F(ContainerClientTest, DiscoveryNeedsNamespaces) {
    EXPECT_THROW(ContainerClient::LoadContainer(Config(), {}, "second", QuietLogger()),
                 ContainerError);
}

TEST_F(ContainerClientTest, ExecOnDiscoveredContainerUsesItsNamespace) {
    WriteListing("default", "{\"ID\":\"abc123\",\"Names\":\"k8s://team/pod-1/second\"}\n");
    auto client = ContainerClient::LoadContainer(Config(), {"default"}, "second", QuietLogger());

    const auto result = client->Execute("echo bound");

    EXPECT_EQ(result.returncode, 0);
    EXPECT_EQ(result.stdout_text, "bound\n");
    EXPECT_NE(Calls().find("-n default exec -w /work abc123 bash -lc echo bound"), std::string::npos);
}

TEST_F(ContainerClientTest, CleanupIsIdempotent) {
    ContainerClient client(Config(), QuietLogger());
    client.StartContainer();

    client.Cleanup();
    client.Cleanup();

    EXPECT_EQ(client.State(), ContainerState::kReleased);
    ASSERT_TRUE(WaitUntil([&] { return Calls().find("stop cid-42") != std::string::npos; }));
    std::this_thread::sleep_for(std::chrono::milliseconds(200));
    EXPECT_EQ(CountOccurrences(Calls(), "stop cid-42"), 1u);
    EXPECT_THROW(client.Execute("true"), std::logic_error);
}

TEST_F(ContainerClientTest, CleanupWithoutIdIsNoop) {
    ContainerClient client(Config(), QuietLogger());
    client.Cleanup();
    EXPECT_EQ(client.State(), ContainerState::kUnbound);
    EXPECT_TRUE(Calls().empty());
}

TEST_F(ContainerClientTest, CleanupCommandFallsBackToRemove) {
    auto config = Config();
    config.container_id = "cid-9";
    config.stop_timeout = std::chrono::seconds(15);
    ContainerClient client(config, QuietLogger());

    const auto command = client.BuildCleanupCommand();

    EXPECT_EQ(command, "(timeout 15 " + runtime_ + " stop cid-9 || " + runtime_ +
                       " rm -f cid-9) >/dev/null 2>&1 &");
}

TEST_F(ContainerClientTest, ScopedContainerReleasesOnScopeExit) {
    {
        auto scoped = evalbox::container::StartScopedContainer(Config(), QuietLogger());
        EXPECT_EQ(scoped->State(), ContainerState::kStarted);
        ScopedContainer moved(std::move(scoped));
        EXPECT_FALSE(static_cast<bool>(scoped));
        EXPECT_EQ(moved->ContainerId(), "cid-42");
    }
    ASSERT_TRUE(WaitUntil([&] { return Calls().find("stop cid-42") != std::string::npos; }));
    std::this_thread::sleep_for(std::chrono::milliseconds(200));
    EXPECT_EQ(CountOccurrences(Calls(), "stop cid-42"), 1u);
}

TEST_F(ContainerClientTest, TemplateVarsDescribeConfiguration) {
    ContainerClient client(Config(), QuietLogger());
    const auto vars = client.TemplateVars();
    EXPECT_EQ(vars["image"], "python:3.11");
    EXPECT_EQ(vars["cwd"], "/work");
    EXPECT_EQ(vars["state"], "unbound");
}
