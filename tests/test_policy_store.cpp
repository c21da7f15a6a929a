/**
 * bashgate - policy store tests
 *
 * Initial load is fatal on bad input; reload never is, and never disturbs
 * the snapshot a reader already holds.
 */

#include <gtest/gtest.h>
#include <bashgate/policy/policy_store.hpp>
#include "test_helpers.hpp"

#include <atomic>
#include <map>
#include <memory>
#include <thread>
#include <vector>

using namespace bashgate;
using bashgate::testing_support::TempDir;

namespace {

// Serves policy text from memory, keyed by location
class MemoryPolicySource : public PolicySource {
public:
    explicit MemoryPolicySource(std::map<std::string, std::string>* docs) : docs_(docs) {}

    std::string read(const std::string& location) const override {
        std::map<std::string, std::string>::const_iterator it = docs_->find(location);
        if (it == docs_->end()) {
            throw ConfigError("no such policy: " + location);
        }
        return it->second;
    }

private:
    std::map<std::string, std::string>* docs_;
};

const char* const POLICY_A =
    "{\"allowedCommands\": [\"ls\"], \"allowedDirectories\": [\"/tmp\"]}";
const char* const POLICY_B =
    "{\"allowedCommands\": [\"ls\", \"cat\"], \"allowedDirectories\": [\"/tmp\", \"/var\"],"
    " \"maxOutputSize\": 100}";

} // namespace

class PolicyStoreTest : public ::testing::Test {
protected:
    PolicyStoreTest()
        : store(std::unique_ptr<PolicySource>(new MemoryPolicySource(&docs))) {}

    void SetUp() override {
        docs["policy"] = POLICY_A;
        store.initialize("policy");
    }

    std::map<std::string, std::string> docs;
    PolicyStore store;
};

TEST(PolicyStoreInitTest, EmptyBeforeInitialize) {
    PolicyStore store;
    EXPECT_FALSE(store.get());
    EXPECT_EQ(store.generation(), 0u);
}

TEST(PolicyStoreInitTest, InitializeThrowsOnMissingFile) {
    TempDir dir;
    PolicyStore store;
    EXPECT_THROW(store.initialize(dir.file("nope.json")), ConfigError);
    EXPECT_FALSE(store.get());
}

TEST(PolicyStoreInitTest, InitializeThrowsOnMalformedFile) {
    TempDir dir;
    std::string path = dir.write("policy.json", "{ broken");
    PolicyStore store;
    EXPECT_THROW(store.initialize(path), ConfigError);
}

TEST(PolicyStoreInitTest, LoadsFromFile) {
    TempDir dir;
    std::string path = dir.write("policy.json", POLICY_B);
    PolicyStore store;
    store.initialize(path);
    ASSERT_TRUE(store.get());
    EXPECT_TRUE(store.get()->allows_command("cat"));
    EXPECT_EQ(store.get()->max_output_size(), 100u);
    EXPECT_EQ(store.generation(), 1u);
}

TEST_F(PolicyStoreTest, ReloadInstallsNewSnapshot) {
    std::shared_ptr<const PolicySnapshot> before = store.get();

    docs["policy"] = POLICY_B;
    EXPECT_TRUE(store.reload("policy"));

    std::shared_ptr<const PolicySnapshot> after = store.get();
    EXPECT_NE(before.get(), after.get());
    EXPECT_TRUE(after->allows_command("cat"));
    EXPECT_EQ(store.generation(), 2u);

    // The old snapshot is still intact for whoever held it
    EXPECT_FALSE(before->allows_command("cat"));
    EXPECT_EQ(before->max_output_size(), PolicySnapshot::DEFAULT_MAX_OUTPUT_SIZE);
}

TEST_F(PolicyStoreTest, MalformedReloadKeepsCurrentSnapshot) {
    std::shared_ptr<const PolicySnapshot> before = store.get();

    docs["policy"] = "{ \"allowedCommands\": [";
    EXPECT_FALSE(store.reload("policy"));
    EXPECT_EQ(store.get().get(), before.get());
    EXPECT_EQ(store.generation(), 1u);

    docs["policy"] = "{\"allowedCommands\": [\"ls\"], \"allowedDirectories\": [\"relative\"]}";
    EXPECT_FALSE(store.reload("policy"));
    EXPECT_EQ(store.get().get(), before.get());
}

TEST_F(PolicyStoreTest, UnreadableReloadKeepsCurrentSnapshot) {
    std::shared_ptr<const PolicySnapshot> before = store.get();
    EXPECT_FALSE(store.reload("elsewhere"));
    EXPECT_EQ(store.get().get(), before.get());
}

TEST_F(PolicyStoreTest, IdenticalReloadIsNoOp) {
    std::shared_ptr<const PolicySnapshot> before = store.get();
    EXPECT_TRUE(store.reload("policy"));
    EXPECT_EQ(store.get().get(), before.get());
    EXPECT_EQ(store.generation(), 1u);
}

TEST_F(PolicyStoreTest, InstallReplacesSnapshot) {
    std::set<std::string> commands;
    commands.insert("pwd");
    std::set<std::string> dirs;
    dirs.insert("/");
    store.install(PolicySnapshot(commands, dirs, false, 10));

    ASSERT_TRUE(store.get());
    EXPECT_TRUE(store.get()->allows_command("pwd"));
    EXPECT_EQ(store.generation(), 2u);
}

TEST_F(PolicyStoreTest, ReadersSeeWholeSnapshotsDuringReloads) {
    std::atomic<bool> done(false);
    std::atomic<int> torn(0);

    std::vector<std::thread> readers;
    for (int i = 0; i < 4; ++i) {
        readers.push_back(std::thread([&] {
            while (!done.load()) {
                std::shared_ptr<const PolicySnapshot> p = store.get();
                // A: {ls}, 1 dir, default cap. B: {ls, cat}, 2 dirs, cap 100.
                bool is_a = p->allowed_commands().size() == 1 &&
                            p->allowed_directories().size() == 1 &&
                            p->max_output_size() == PolicySnapshot::DEFAULT_MAX_OUTPUT_SIZE;
                bool is_b = p->allowed_commands().size() == 2 &&
                            p->allowed_directories().size() == 2 &&
                            p->max_output_size() == 100;
                if (!is_a && !is_b) {
                    torn.fetch_add(1);
                }
            }
        }));
    }

    // Alternate between two locations so each reload really swaps
    docs["b"] = POLICY_B;
    for (int i = 0; i < 200; ++i) {
        store.reload(i % 2 == 0 ? "b" : "policy");
    }
    done.store(true);
    for (size_t i = 0; i < readers.size(); ++i) {
        readers[i].join();
    }

    EXPECT_EQ(torn.load(), 0);
}
