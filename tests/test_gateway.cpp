/**
 * bashgate - gateway end-to-end tests
 *
 * Policy file on disk -> store -> validators -> executor, including reloads
 * while a command is in flight.
 */

#include <gtest/gtest.h>
#include <bashgate/gate/gateway.hpp>
#include <bashgate/core/utils.hpp>
#include "test_helpers.hpp"

#include <sys/stat.h>
#include <thread>
#include <unistd.h>

using namespace bashgate;
using bashgate::testing_support::TempDir;

namespace {

std::string policy_json(const std::string& commands, const std::string& dir, bool strict) {
    return std::string("{\"allowedCommands\": [") + commands + "],"
           " \"allowedDirectories\": [\"" + dir + "\"],"
           " \"validateCommandsStrictly\": " + (strict ? "true" : "false") + "}";
}

bool file_exists(const std::string& path) {
    struct stat st;
    return stat(path.c_str(), &st) == 0;
}

} // namespace

class GatewayTest : public ::testing::Test {
protected:
    GatewayTest() : gateway(store) {}

    void SetUp() override {
        work = config_dir.path();
        mkdir((work + "/sub").c_str(), 0755);
        policy_path = config_dir.write("policy.json",
                                       policy_json("\"ls\", \"pwd\", \"echo\", \"sleep\"", work, true));
        store.initialize(policy_path);
    }

    TempDir config_dir;
    std::string work;
    std::string policy_path;
    PolicyStore store;
    Gateway gateway;
};

// =============================================================================
// Approval and denial
// =============================================================================

TEST_F(GatewayTest, ApprovedCommandRuns) {
    ExecutionResult r = gateway.execute(ExecutionRequest("pwd", work + "/sub"));
    EXPECT_TRUE(r.success);
    EXPECT_EQ(r.output, work + "/sub\n");
    ASSERT_TRUE(r.has_exit_code);
    EXPECT_EQ(r.exit_code, 0);
}

TEST_F(GatewayTest, UnnormalizedDirectoryRunsInNormalizedPath) {
    ExecutionResult r = gateway.execute(ExecutionRequest("pwd", work + "/sub/../sub/./"));
    EXPECT_TRUE(r.success);
    EXPECT_EQ(r.output, work + "/sub\n");
}

TEST_F(GatewayTest, DeniedCommandHasNoExitCode) {
    ExecutionResult r = gateway.execute(ExecutionRequest("rm -rf x", work));
    EXPECT_FALSE(r.success);
    EXPECT_EQ(r.state, ExecutionState::REJECTED);
    EXPECT_EQ(r.kind, ErrorKind::COMMAND_NOT_ALLOWED);
    EXPECT_FALSE(r.has_exit_code);
    EXPECT_EQ(r.output, "");
    EXPECT_EQ(r.command, "rm -rf x");
}

TEST_F(GatewayTest, CommandCheckRunsBeforeInjectionScan) {
    ExecutionResult r = gateway.execute(ExecutionRequest("rm x; ls", work));
    EXPECT_EQ(r.kind, ErrorKind::COMMAND_NOT_ALLOWED);
}

TEST_F(GatewayTest, InjectionScanRunsBeforeDirectoryCheck) {
    ExecutionResult r = gateway.execute(ExecutionRequest("ls | echo", "/"));
    EXPECT_EQ(r.kind, ErrorKind::INJECTION_PATTERN_DETECTED);
}

TEST_F(GatewayTest, DirectoryOutsideWhitelistIsDenied) {
    ExecutionResult r = gateway.execute(ExecutionRequest("ls", "/"));
    EXPECT_EQ(r.state, ExecutionState::REJECTED);
    EXPECT_EQ(r.kind, ErrorKind::DIRECTORY_NOT_ALLOWED);
    EXPECT_NE(r.error.find(work), std::string::npos);
}

TEST_F(GatewayTest, NulInDirectoryCannotEscapeWhitelist) {
    ExecutionResult direct = gateway.execute(ExecutionRequest("pwd -P", work + std::string("/..\0", 4)));
    EXPECT_EQ(direct.state, ExecutionState::REJECTED);
    EXPECT_EQ(direct.kind, ErrorKind::DIRECTORY_NOT_ALLOWED);
    EXPECT_EQ(direct.output, "");

    Json args = Json::parse("{\"command\": \"pwd -P\", \"cwd\": \"" + work + "/..\\u0000\"}");
    ExecutionRequest request;
    std::string error;
    ASSERT_TRUE(ExecutionRequest::from_json(args, request, error)) << error;
    ExecutionResult parsed = gateway.execute(request);
    EXPECT_EQ(parsed.state, ExecutionState::REJECTED);
    EXPECT_EQ(parsed.kind, ErrorKind::DIRECTORY_NOT_ALLOWED);
    EXPECT_FALSE(parsed.has_exit_code);
}

TEST_F(GatewayTest, RelaxedPolicyStillChecksCommandAndDirectory) {
    config_dir.write("policy.json", policy_json("\"ls\", \"wc\"", work, false));
    ASSERT_TRUE(gateway.reload(policy_path));

    ExecutionResult unlisted = gateway.execute(ExecutionRequest("rm x | ls", work));
    EXPECT_EQ(unlisted.state, ExecutionState::REJECTED);
    EXPECT_EQ(unlisted.kind, ErrorKind::COMMAND_NOT_ALLOWED);

    ExecutionResult outside = gateway.execute(ExecutionRequest("ls | wc -l", "/"));
    EXPECT_EQ(outside.state, ExecutionState::REJECTED);
    EXPECT_EQ(outside.kind, ErrorKind::DIRECTORY_NOT_ALLOWED);

    ExecutionResult piped = gateway.execute(ExecutionRequest("ls | wc -l", work));
    EXPECT_TRUE(piped.success) << piped.error;
    EXPECT_EQ(piped.state, ExecutionState::COMPLETED);
}

TEST_F(GatewayTest, InjectedCommandNeverRuns) {
    std::string marker = work + "/pwned";
    ExecutionResult r = gateway.execute(ExecutionRequest("echo hi; echo x > " + marker, work));
    EXPECT_EQ(r.kind, ErrorKind::INJECTION_PATTERN_DETECTED);
    EXPECT_FALSE(file_exists(marker));
}

TEST_F(GatewayTest, MissingSubdirectoryIsSpawnFailure) {
    ExecutionResult r = gateway.execute(ExecutionRequest("ls", work + "/not-there"));
    EXPECT_EQ(r.state, ExecutionState::FAULTED);
    EXPECT_EQ(r.kind, ErrorKind::SPAWN_FAILURE);
    EXPECT_FALSE(r.has_exit_code);
}

TEST_F(GatewayTest, TimeoutIsHonored) {
    ExecutionResult r = gateway.execute(ExecutionRequest("sleep 5", work, 0.5));
    EXPECT_EQ(r.state, ExecutionState::TIMED_OUT);
    EXPECT_FALSE(r.has_exit_code);
    EXPECT_FALSE(r.success);
}

TEST_F(GatewayTest, HugeTimeoutIsClampedNotExpired) {
    Json args = Json::parse("{\"command\": \"sleep 0.2; echo hi\", \"cwd\": \"" + work + "\", \"timeout\": 1e30}");
    ExecutionRequest request;
    std::string error;
    ASSERT_TRUE(ExecutionRequest::from_json(args, request, error)) << error;
    EXPECT_EQ(request.timeout_seconds, ExecutionRequest::MAX_TIMEOUT_SECONDS);

    ExecutionResult r = gateway.execute(request);
    EXPECT_EQ(r.state, ExecutionState::COMPLETED);
    EXPECT_TRUE(r.success) << r.error;
    EXPECT_EQ(r.output, "hi\n");
}

TEST(GatewayNoPolicyTest, MissingSnapshotIsInternalFault) {
    PolicyStore empty;
    Gateway gateway(empty);
    ExecutionResult r = gateway.execute(ExecutionRequest("ls", "/tmp"));
    EXPECT_EQ(r.kind, ErrorKind::INTERNAL_FAULT);
    EXPECT_FALSE(r.has_exit_code);
}

// =============================================================================
// Reload
// =============================================================================

TEST_F(GatewayTest, ReloadAppliesToNextRequest) {
    EXPECT_EQ(gateway.execute(ExecutionRequest("true", work)).kind, ErrorKind::COMMAND_NOT_ALLOWED);

    config_dir.write("policy.json", policy_json("\"true\"", work, true));
    ASSERT_TRUE(gateway.reload(policy_path));

    ExecutionResult r = gateway.execute(ExecutionRequest("true", work));
    EXPECT_TRUE(r.success);
    EXPECT_EQ(gateway.execute(ExecutionRequest("ls", work)).kind, ErrorKind::COMMAND_NOT_ALLOWED);
}

TEST_F(GatewayTest, InvalidReloadKeepsServing) {
    config_dir.write("policy.json", "{ \"allowedCommands\": ");
    EXPECT_FALSE(gateway.reload(policy_path));

    ExecutionResult r = gateway.execute(ExecutionRequest("echo still here", work));
    EXPECT_TRUE(r.success);
    EXPECT_EQ(r.output, "still here\n");
}

TEST_F(GatewayTest, ReloadDuringExecutionDoesNotAffectIt) {
    config_dir.write("policy.json", policy_json("\"sleep\"", work, false));
    ASSERT_TRUE(gateway.reload(policy_path));

    ExecutionResult in_flight;
    std::thread runner([&] {
        in_flight = gateway.execute(ExecutionRequest("sleep 1; echo finished", work, 10));
    });

    // Revoke sleep while it runs
    usleep(300000);
    config_dir.write("policy.json", policy_json("\"ls\"", work, true));
    ASSERT_TRUE(gateway.reload(policy_path));

    runner.join();
    EXPECT_TRUE(in_flight.success);
    EXPECT_EQ(in_flight.output, "finished\n");

    EXPECT_EQ(gateway.execute(ExecutionRequest("sleep 0", work)).kind, ErrorKind::COMMAND_NOT_ALLOWED);
}
