#include <gtest/gtest.h>
#include <optional>
#include "kernel/replay.hpp"
#include "test_helpers.hpp"

using namespace zero::kernel;
using zero::axiom::Commit;
using zero::axiom::CommitLog;
using zero::axiom::CommitType;
using zero::runtime::INBOX_SLOT;
using zero::test::KernelFixture;
using zero::test::bytes_of;

namespace {

// Ping-pong traffic between two processes; returns the number of rounds run
void exchange(KernelFixture& fx, size_t rounds) {
    auto a = fx.spawn("client");
    auto b = fx.spawn("server");
    auto to_b = fx.connect(b, a);

    for (size_t i = 0; i < rounds; ++i) {
        fx.hal->advance(1000);
        a.send(to_b, 0x100, bytes_of("request " + std::to_string(i)));
        b.recv(INBOX_SLOT, false);
        b.reply(a.pid(), 0x101, bytes_of("response " + std::to_string(i)));
        a.recv(INBOX_SLOT, false);
        if (i % 10 == 0) {
            a.random(8);
            fx.kernel.tick();
        }
    }
}

CommitLog copy_without_last(const CommitLog& log) {
    CommitLog copy;
    for (size_t i = 0; i + 1 < log.size(); ++i) {
        const Commit& c = log.at(i);
        copy.append(c.commit_type, c.payload, c.pre_state_hash, c.post_state_hash);
    }
    return copy;
}

// Offset of the first data byte inside a SyscallRequest payload
constexpr size_t REQUEST_DATA_OFFSET = 8 + 4 + 4 * 8 + 4;

} // namespace

TEST(Replay, ReproducesTheFinalState) {
    KernelFixture fx;
    exchange(fx, 20);

    auto result = replay_and_verify(fx.kernel.log());
    ASSERT_TRUE(result.success) << result.error->reason;
    EXPECT_EQ(result.final_hash, fx.kernel.state_hash());
    EXPECT_EQ(result.commits_applied, fx.kernel.log().size());
    ASSERT_NE(result.kernel, nullptr);
    EXPECT_TRUE(result.kernel->replaying());
    EXPECT_EQ(result.kernel->log().size(), fx.kernel.log().size());
}

TEST(Replay, UnverifiedReplayReachesTheSameHash) {
    KernelFixture fx;
    exchange(fx, 5);

    auto result = replay(fx.kernel.log());
    ASSERT_TRUE(result.success);
    EXPECT_EQ(result.final_hash, fx.kernel.state_hash());
}

TEST(Replay, CoversEveryTopLevelStep) {
    KernelFixture fx;
    auto a = fx.spawn("a");
    auto b = fx.spawn("b");
    auto to_b = fx.connect(b, a);
    fx.kernel.post_message(a.pid(), MSG_CONSOLE_INPUT, bytes_of("input"));
    a.send(to_b, 1, bytes_of("x"));
    ASSERT_TRUE(b.cap_revoke(INBOX_SLOT).is_ok());
    fx.kernel.tick();
    fx.kernel.fault_process(b.pid(), "test fault");
    fx.kernel.reap(b.pid());
    a.io(IoChannel::STORAGE, IoOp::READ, "key");
    a.exit(1);
    fx.kernel.reap(a.pid());

    auto result = replay_and_verify(fx.kernel.log());
    ASSERT_TRUE(result.success) << result.error->reason;
    EXPECT_EQ(result.final_hash, fx.kernel.state_hash());
}

TEST(Replay, TamperedSendIsDetectedAtItsCommit) {
    KernelFixture fx;
    exchange(fx, 120);
    CommitLog log = fx.kernel.log();
    ASSERT_GE(log.size(), 1000u);

    std::optional<uint64_t> target;
    for (const auto& commit : log.commits()) {
        if (commit.commit_id < 500 || commit.commit_type != CommitType::SYSCALL_REQUEST) {
            continue;
        }
        SyscallRequest request;
        SyscallEnv env;
        decode_request(commit.payload, request, env);
        if (request.num == SyscallNum::SYS_SEND && !request.data.empty()) {
            target = commit.commit_id;
            break;
        }
    }
    ASSERT_TRUE(target.has_value());

    log.at(*target).payload[REQUEST_DATA_OFFSET] ^= 0xFF;

    auto result = replay_and_verify(log);
    EXPECT_FALSE(result.success);
    ASSERT_TRUE(result.error.has_value());
    EXPECT_EQ(result.error->commit_id, *target);
    EXPECT_NE(result.error->reason.find("post-state"), std::string::npos);
}

TEST(Replay, TamperedHashIsDetected) {
    KernelFixture fx;
    exchange(fx, 3);
    CommitLog log = fx.kernel.log();
    log.at(4).pre_state_hash[0] ^= 1;

    auto result = replay_and_verify(log);
    EXPECT_FALSE(result.success);
    EXPECT_EQ(result.error->commit_id, 4u);
}

TEST(Replay, LogEndingInsideASyscallFails) {
    KernelFixture fx;
    exchange(fx, 2);
    CommitLog truncated = copy_without_last(fx.kernel.log());

    auto result = replay_and_verify(truncated);
    EXPECT_FALSE(result.success);
    EXPECT_EQ(result.error->commit_id, truncated.size());
}

TEST(Replay, StrayInformationalCommitFails) {
    KernelFixture fx;
    CommitLog log = fx.kernel.log();
    auto hash = fx.kernel.state_hash();
    log.append(CommitType::CAP_REVOKED, {}, hash, hash);

    auto result = replay_and_verify(log);
    EXPECT_FALSE(result.success);
    EXPECT_EQ(result.error->commit_id, 1u);
}

TEST(Replay, EmptyLogFails) {
    CommitLog log;
    auto result = replay_and_verify(log);
    EXPECT_FALSE(result.success);
    EXPECT_EQ(result.error->commit_id, 0u);
}

TEST(Replay, LogMustStartWithBoot) {
    CommitLog log;
    zero::axiom::StateHash hash{};
    log.append(CommitType::TICK, {0, 0, 0, 0, 0, 0, 0, 0}, hash, hash);

    auto result = replay_and_verify(log);
    EXPECT_FALSE(result.success);
    EXPECT_EQ(result.error->commit_id, 0u);
    EXPECT_THROW(boot_from(log.at(0)), std::runtime_error);
}

TEST(Replay, MalformedPayloadIsReported) {
    KernelFixture fx;
    fx.spawn("a");
    CommitLog log = fx.kernel.log();
    log.at(1).payload.resize(3);

    auto result = replay_and_verify(log);
    EXPECT_FALSE(result.success);
    EXPECT_EQ(result.error->commit_id, 1u);
}

TEST(Replay, ReplayedRandomBytesMatchTheRecording) {
    KernelFixture fx;
    auto a = fx.spawn("a");
    auto live = a.random(16);

    auto result = replay_and_verify(fx.kernel.log());
    ASSERT_TRUE(result.success);
    const Commit& response = result.kernel->log().last();
    EXPECT_EQ(response.payload, live.encode());
}

TEST(Replay, TopLevelClassification) {
    EXPECT_TRUE(is_top_level(CommitType::SYSCALL_REQUEST));
    EXPECT_TRUE(is_top_level(CommitType::PROCESS_CREATED));
    EXPECT_TRUE(is_top_level(CommitType::TICK));
    EXPECT_FALSE(is_top_level(CommitType::BOOT));
    EXPECT_FALSE(is_top_level(CommitType::SYSCALL_RESPONSE));
    EXPECT_FALSE(is_top_level(CommitType::CAP_REVOKED));
    EXPECT_FALSE(is_top_level(CommitType::PROCESS_EXITED));
}
