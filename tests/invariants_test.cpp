#include <gtest/gtest.h>
#include <algorithm>
#include <map>
#include <memory>
#include <nlohmann/json.hpp>
#include "kernel/replay.hpp"
#include "supervisor/script.hpp"
#include "test_helpers.hpp"

using namespace zero::kernel;
using zero::axiom::CommitLog;
using zero::axiom::StateHash;
using zero::axiom::commit_type_to_string;
using zero::axiom::ObjectKey;
using zero::runtime::INBOX_SLOT;
using zero::runtime::Syscalls;
using zero::supervisor::ScriptRunner;
using zero::test::KernelFixture;
using zero::test::SystemTest;
using zero::test::bytes_of;

namespace {

// Counters that may only move forward between two top-level steps
struct Counters {
    ProcessId next_pid = 0;
    EndpointId next_endpoint_id = 0;
    uint64_t next_cap_id = 0;
    std::map<ObjectKey, uint32_t> generations;
    std::map<ProcessId, RequestId> request_ids;
    std::map<ProcessId, CapSlot> next_slots;
};

Counters counters_of(const KernelState& state) {
    Counters c;
    c.next_pid = state.next_pid;
    c.next_endpoint_id = state.next_endpoint_id;
    c.next_cap_id = state.next_cap_id;
    c.generations = state.generations.entries();
    for (const auto& [pid, proc] : state.processes) {
        c.request_ids[pid] = proc.next_request_id;
    }
    for (const auto& [pid, space] : state.cap_spaces) {
        c.next_slots[pid] = space.next_slot();
    }
    return c;
}

bool is_waiting(const KernelState& state, ProcessId pid) {
    for (const auto& [id, ep] : state.endpoints) {
        if (std::find(ep.recv_waiters.begin(), ep.recv_waiters.end(), pid) != ep.recv_waiters.end()) {
            return true;
        }
        for (const auto& waiter : ep.send_waiters) {
            if (waiter.pid == pid) {
                return true;
            }
        }
    }
    return false;
}

// Nothing in the kernel may still point at a process that exited
void expect_forgotten(const KernelState& state, ProcessId pid) {
    for (const auto& [id, ep] : state.endpoints) {
        EXPECT_NE(ep.owner, pid) << "endpoint " << id;
        for (const auto& msg : ep.queue) {
            EXPECT_NE(msg.from_pid, pid) << "queued on endpoint " << id;
        }
        for (const auto& waiter : ep.send_waiters) {
            EXPECT_NE(waiter.pid, pid) << "parked on endpoint " << id;
            EXPECT_NE(waiter.msg.from_pid, pid) << "parked on endpoint " << id;
        }
        EXPECT_EQ(std::count(ep.recv_waiters.begin(), ep.recv_waiters.end(), pid), 0) << "endpoint " << id;
    }
    for (const auto& [other, proc] : state.processes) {
        EXPECT_EQ(proc.reply_credits.count(pid), 0u) << "credit held by PID " << other;
    }
    auto space = state.cap_spaces.find(pid);
    if (space != state.cap_spaces.end()) {
        EXPECT_EQ(space->second.size(), 0u);
    }
}

void expect_invariants(const KernelState& state, const Counters& before) {
    Counters now = counters_of(state);
    EXPECT_GE(now.next_pid, before.next_pid);
    EXPECT_GE(now.next_endpoint_id, before.next_endpoint_id);
    EXPECT_GE(now.next_cap_id, before.next_cap_id);

    for (const auto& [key, generation] : before.generations) {
        auto it = now.generations.find(key);
        ASSERT_NE(it, now.generations.end()) << "generation entry vanished";
        EXPECT_GE(it->second, generation);
    }
    for (const auto& [pid, rid] : before.request_ids) {
        auto it = now.request_ids.find(pid);
        if (it != now.request_ids.end()) {
            EXPECT_GE(it->second, rid) << "PID " << pid;
        }
    }
    for (const auto& [pid, slot] : before.next_slots) {
        auto it = now.next_slots.find(pid);
        if (it != now.next_slots.end()) {
            EXPECT_GE(it->second, slot) << "PID " << pid;
        }
    }

    for (const auto& [id, ep] : state.endpoints) {
        EXPECT_LE(ep.queue.size(), ep.capacity) << "endpoint " << id;
        EXPECT_EQ(ep.metrics.queue_depth, ep.queue.size()) << "endpoint " << id;
        EXPECT_NE(state.find_live_process(ep.owner), nullptr) << "endpoint " << id << " outlived its owner";
    }

    // Receive on a live endpoint is only ever held by its owner
    for (const auto& [pid, space] : state.cap_spaces) {
        for (const auto& [slot, cap] : space.slots()) {
            if (cap.object_type != ObjectType::ENDPOINT || !(cap.permissions & perm::RECEIVE)) {
                continue;
            }
            if (const Endpoint* ep = state.find_endpoint(cap.object_id)) {
                EXPECT_EQ(ep->owner, pid) << "PID " << pid << " slot " << slot;
            }
        }
    }

    for (const auto& [pid, proc] : state.processes) {
        if (proc.state == ProcessState::BLOCKED) {
            EXPECT_TRUE(is_waiting(state, pid)) << "PID " << pid << " blocked on nothing";
        }
        if (proc.state == ProcessState::ZOMBIE) {
            expect_forgotten(state, pid);
        }
    }
    // Reaped processes stay forgotten too
    for (ProcessId pid = 1; pid < state.next_pid; ++pid) {
        if (!state.find_process(pid)) {
            expect_forgotten(state, pid);
        }
    }
}

// Re-applies the log one top-level step at a time, checking after each step
void replay_checking_invariants(const CommitLog& log, const StateHash& expected) {
    auto kernel = boot_from(log.at(0));
    Counters before = counters_of(kernel->state());
    size_t steps = 0;

    for (const auto& commit : log.commits()) {
        if (commit.commit_id < kernel->log().size()) {
            continue;
        }
        ASSERT_TRUE(is_top_level(commit.commit_type))
            << "commit " << commit.commit_id << " is " << commit_type_to_string(commit.commit_type);
        apply_commit(*kernel, commit);
        ASSERT_EQ(kernel->log().at(commit.commit_id), commit) << "commit " << commit.commit_id;

        SCOPED_TRACE("after commit " + std::to_string(commit.commit_id) + " (" +
                     commit_type_to_string(commit.commit_type) + ")");
        expect_invariants(kernel->state(), before);
        before = counters_of(kernel->state());
        ++steps;
    }

    EXPECT_GT(steps, 0u);
    EXPECT_EQ(kernel->log().size(), log.size());
    EXPECT_EQ(kernel->state_hash(), expected);
}

// IPC with parked senders, transfers, revocation, init wiring, wakes, faults and reaps
void mixed_workload(KernelFixture& fx) {
    auto init = fx.spawn("init");
    auto a = fx.spawn("a");
    auto b = fx.spawn("b");
    CapSlot to_b = fx.connect(b, a);
    CapSlot to_a = fx.connect(a, b);

    ASSERT_TRUE(a.send(to_b, 1, bytes_of("one")).is_ok());
    ASSERT_TRUE(a.send(to_b, 2, bytes_of("two")).is_ok());
    ASSERT_EQ(a.send(to_b, 3, bytes_of("three")).kind, ResultKind::BLOCKED);
    for (int i = 0; i < 3; ++i) {
        ASSERT_EQ(b.recv(INBOX_SLOT, false).kind, ResultKind::MESSAGE);
    }
    ASSERT_TRUE(b.reply(a.pid(), 0x3, bytes_of("done")).is_ok());

    auto created = b.create_endpoint();
    auto private_slot = static_cast<CapSlot>(created.value);
    ASSERT_TRUE(b.send_cap(to_a, 0x10, {}, {private_slot}, perm::SEND).is_ok());
    ASSERT_EQ(a.recv(INBOX_SLOT, false).kind, ResultKind::MESSAGE);
    auto carried = a.recv(INBOX_SLOT, false);
    ASSERT_EQ(carried.kind, ResultKind::MESSAGE);
    ASSERT_EQ(carried.message->cap_slots.size(), 1u);
    ASSERT_TRUE(a.send(carried.message->cap_slots.front(), 0x11, {}).is_ok());
    ASSERT_EQ(b.cap_revoke(private_slot).kind, ResultKind::OK);

    ASSERT_TRUE(a.io(IoChannel::STORAGE, IoOp::WRITE, "k", bytes_of("v")).is_ok());
    ASSERT_TRUE(fx.kernel.post_message(a.pid(), MSG_CONSOLE_INPUT, bytes_of("ls")));
    fx.hal->advance(10);
    fx.kernel.tick();

    auto registered = init.register_process("child");
    ASSERT_EQ(registered.kind, ResultKind::OK);
    auto child_pid = static_cast<ProcessId>(registered.value);
    ASSERT_TRUE(init.grant_endpoint_to(INBOX_SLOT, child_pid, perm::SEND).is_ok());
    Syscalls child(fx.kernel, child_pid);
    ASSERT_TRUE(child.send(2, 0x99, bytes_of("hello")).is_ok());
    ASSERT_EQ(child.recv(INBOX_SLOT).kind, ResultKind::BLOCKED);
    ASSERT_TRUE(child.time().is_err(KernelError::WOULD_BLOCK));
    ASSERT_TRUE(fx.kernel.wake(child_pid));
    ASSERT_TRUE(child.time().is_ok());
    ASSERT_EQ(init.recv(INBOX_SLOT, false).kind, ResultKind::MESSAGE);
    ASSERT_TRUE(init.reply(child_pid, 0x9A, {}).is_ok());

    ASSERT_EQ(b.recv(INBOX_SLOT).kind, ResultKind::BLOCKED);
    ASSERT_TRUE(a.send(to_b, 4, {}).is_ok());
    ASSERT_TRUE(a.send(to_b, 5, {}).is_ok());
    ASSERT_EQ(a.send(to_b, 6, {}).kind, ResultKind::BLOCKED);

    // b exits with a message queued, a sender parked and reply credits owed
    ASSERT_TRUE(b.exit(0).is_ok());
    ASSERT_TRUE(fx.kernel.fault_process(child_pid, "bad pointer"));
    ASSERT_TRUE(fx.kernel.reap(b.pid()));
    ASSERT_TRUE(fx.kernel.reap(child_pid));

    while (a.recv(INBOX_SLOT, false).kind == ResultKind::MESSAGE) {
    }
    fx.hal->advance(10);
    fx.kernel.tick();
}

} // namespace

TEST(KernelInvariants, HoldAfterEveryReplayedStep) {
    KernelConfig config;
    config.endpoint_capacity = 2;
    KernelFixture fx(config);
    mixed_workload(fx);

    auto verified = replay_and_verify(fx.kernel.log());
    ASSERT_TRUE(verified.success) << verified.error->reason;
    replay_checking_invariants(fx.kernel.log(), fx.kernel.state_hash());
}

TEST_F(SystemTest, InvariantsHoldAcrossTheDemoScript) {
    ScriptRunner runner(*sup);
    runner.run(ScriptRunner::demo_script());
    sup->run_until_idle();

    replay_checking_invariants(sup->kernel().log(), sup->kernel().state_hash());
}

TEST(KernelInvariants, ThirdSendWaitsForRoomAndKeepsItsPlace) {
    KernelConfig config;
    config.endpoint_capacity = 2;
    KernelFixture fx(config);
    auto a = fx.spawn("a");
    auto b = fx.spawn("b");
    CapSlot to_b = fx.connect(b, a);
    EndpointId inbox = fx.kernel.state().find_process(b.pid())->inbox;

    ASSERT_TRUE(a.send(to_b, 1, {}).is_ok());
    ASSERT_TRUE(a.send(to_b, 2, {}).is_ok());
    EXPECT_EQ(a.send(to_b, 3, {}).kind, ResultKind::BLOCKED);
    EXPECT_EQ(fx.kernel.state().find_process(a.pid())->state, ProcessState::BLOCKED);
    EXPECT_EQ(fx.kernel.state().find_endpoint(inbox)->queue.size(), 2u);

    auto first = b.recv(INBOX_SLOT, false);
    ASSERT_EQ(first.kind, ResultKind::MESSAGE);
    EXPECT_EQ(first.message->tag, 1u);
    EXPECT_EQ(fx.kernel.state().find_process(a.pid())->state, ProcessState::RUNNING);
    EXPECT_EQ(fx.kernel.state().find_endpoint(inbox)->queue.size(), 2u);
    EXPECT_TRUE(fx.kernel.state().find_endpoint(inbox)->send_waiters.empty());

    for (uint32_t tag : {2u, 3u}) {
        auto next = b.recv(INBOX_SLOT, false);
        ASSERT_EQ(next.kind, ResultKind::MESSAGE);
        EXPECT_EQ(next.message->tag, tag);
    }
    EXPECT_TRUE(b.recv(INBOX_SLOT, false).is_err(KernelError::WOULD_BLOCK));
}
