#include <gtest/gtest.h>
#include <algorithm>
#include <filesystem>
#include <sstream>
#include <nlohmann/json.hpp>
#include "axiom/commit_log.hpp"
#include "test_helpers.hpp"

using namespace zero::axiom;
using zero::kernel::Bytes;
using zero::kernel::KernelConfig;
using zero::kernel::to_string;
using zero::test::KernelFixture;
using zero::test::bytes_of;

namespace {

// A short workload touching IPC, capabilities and process exit
void run_workload(KernelFixture& fx) {
    auto a = fx.spawn("a");
    auto b = fx.spawn("b");
    auto to_b = fx.connect(b, a);
    a.send(to_b, 1, bytes_of("one"));
    b.recv(zero::runtime::INBOX_SLOT, false);
    b.reply(a.pid(), 2, bytes_of("two"));
    a.recv(zero::runtime::INBOX_SLOT, false);
    a.exit(0);
}

} // namespace

TEST(CommitLog, KernelStartsWithBootCommit) {
    KernelConfig config;
    config.endpoint_capacity = 8;
    KernelFixture fx(config);

    ASSERT_EQ(fx.kernel.log().size(), 1u);
    const Commit& boot = fx.kernel.log().at(0);
    EXPECT_EQ(boot.commit_id, 0u);
    EXPECT_EQ(boot.commit_type, CommitType::BOOT);
    auto recorded = nlohmann::json::parse(to_string(boot.payload));
    EXPECT_EQ(recorded["endpoint_capacity"], 8);
}

TEST(CommitLog, SyscallIsBracketedByRequestAndResponse) {
    KernelFixture fx;
    auto a = fx.spawn("a");
    size_t before = fx.kernel.log().size();

    a.time();

    ASSERT_EQ(fx.kernel.log().size(), before + 2);
    const Commit& request = fx.kernel.log().at(before);
    const Commit& response = fx.kernel.log().at(before + 1);
    EXPECT_EQ(request.commit_type, CommitType::SYSCALL_REQUEST);
    EXPECT_EQ(response.commit_type, CommitType::SYSCALL_RESPONSE);
    EXPECT_EQ(request.pre_state_hash, fx.kernel.log().at(before - 1).post_state_hash);
    EXPECT_EQ(response.pre_state_hash, request.post_state_hash);
    EXPECT_EQ(response.post_state_hash, fx.kernel.state_hash());
}

TEST(CommitLog, MutationsChangeTheStateHash) {
    KernelFixture fx;
    auto a = fx.spawn("a");
    auto b = fx.spawn("b");
    auto to_b = fx.connect(b, a);

    auto before = fx.kernel.state_hash();
    a.send(to_b, 1, bytes_of("x"));
    EXPECT_NE(fx.kernel.state_hash(), before);

    const Commit& request = fx.kernel.log().at(fx.kernel.log().size() - 3);
    EXPECT_EQ(request.commit_type, CommitType::SYSCALL_REQUEST);
    EXPECT_NE(request.pre_state_hash, request.post_state_hash);
}

TEST(CommitLog, CommitIdsAreDense) {
    KernelFixture fx;
    run_workload(fx);

    const auto& commits = fx.kernel.log().commits();
    for (size_t i = 0; i < commits.size(); ++i) {
        EXPECT_EQ(commits[i].commit_id, i);
    }
    EXPECT_EQ(fx.kernel.log().last().commit_type, CommitType::SYSCALL_RESPONSE);
}

TEST(CommitLog, EncodedLogDecodesToTheSameCommits) {
    KernelFixture fx;
    run_workload(fx);

    Bytes encoded = fx.kernel.log().encode();
    ASSERT_GE(encoded.size(), 8u);
    EXPECT_EQ(encoded[0], 'Z');
    EXPECT_EQ(encoded[3], 'G');

    CommitLog decoded = CommitLog::decode(encoded);
    ASSERT_EQ(decoded.size(), fx.kernel.log().size());
    for (size_t i = 0; i < decoded.size(); ++i) {
        EXPECT_EQ(decoded.at(i), fx.kernel.log().at(i)) << "commit " << i;
    }
}

TEST(CommitLog, SaveAndLoadFile) {
    KernelFixture fx;
    run_workload(fx);

    auto path = std::filesystem::temp_directory_path() / "zero_commit_log_test.zlog";
    fx.kernel.log().save(path);
    CommitLog loaded = CommitLog::load(path);
    std::filesystem::remove(path);

    ASSERT_EQ(loaded.size(), fx.kernel.log().size());
    EXPECT_EQ(loaded.last(), fx.kernel.log().last());
}

TEST(CommitLog, StreamRoundTrip) {
    KernelFixture fx;
    std::stringstream stream;
    fx.kernel.log().write(stream);

    CommitLog read = CommitLog::read(stream);
    ASSERT_EQ(read.size(), 1u);
    EXPECT_EQ(read.at(0).commit_type, CommitType::BOOT);
}

TEST(CommitLog, WrittenStreamMatchesEncoding) {
    KernelFixture fx;
    run_workload(fx);
    std::ostringstream stream;
    fx.kernel.log().write(stream);

    std::string written = stream.str();
    Bytes encoded = fx.kernel.log().encode();
    ASSERT_EQ(written.size(), encoded.size());
    EXPECT_EQ(written.substr(0, 4), "ZLOG");
    EXPECT_TRUE(std::equal(encoded.begin(), encoded.end(), written.begin(),
                           [](uint8_t b, char c) { return b == static_cast<uint8_t>(c); }));
}

TEST(CommitLog, RejectsBadMagic) {
    Bytes data = {'N', 'O', 'P', 'E', 1, 0, 0, 0};
    EXPECT_THROW(CommitLog::decode(data), LogFormatError);
}

TEST(CommitLog, RejectsUnknownVersion) {
    Bytes data = {'Z', 'L', 'O', 'G', 9, 0, 0, 0};
    EXPECT_THROW(CommitLog::decode(data), LogFormatError);
}

TEST(CommitLog, RejectsTruncatedRecord) {
    KernelFixture fx;
    Bytes encoded = fx.kernel.log().encode();
    encoded.resize(encoded.size() - 5);
    EXPECT_THROW(CommitLog::decode(encoded), LogFormatError);
}

TEST(CommitLog, RejectsUnknownCommitType) {
    KernelFixture fx;
    Bytes encoded = fx.kernel.log().encode();
    // magic(4) + version(4) + commit_id(8), then the type byte
    encoded[16] = 200;
    EXPECT_THROW(CommitLog::decode(encoded), LogFormatError);
}

TEST(CommitLog, RejectsNonContiguousIds) {
    KernelFixture fx;
    Bytes encoded = fx.kernel.log().encode();
    encoded[8] = 5;
    EXPECT_THROW(CommitLog::decode(encoded), LogFormatError);
}

TEST(CommitLog, LoadMissingFileFails) {
    EXPECT_THROW(CommitLog::load("/nonexistent/dir/log.zlog"), LogFormatError);
}

TEST(CommitLog, TypeNames) {
    EXPECT_EQ(commit_type_to_string(CommitType::BOOT), "Boot");
    EXPECT_EQ(commit_type_to_string(CommitType::SYSCALL_REQUEST), "SyscallRequest");
    EXPECT_EQ(commit_type_to_string(CommitType::PROCESS_EXITED), "ProcessExited");
    EXPECT_EQ(commit_type_to_string(CommitType::PROCESS_WOKEN), "ProcessWoken");
}
