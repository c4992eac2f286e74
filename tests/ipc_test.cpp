#include <gtest/gtest.h>
#include "test_helpers.hpp"

using namespace zero::kernel;
using zero::runtime::INBOX_SLOT;
using zero::runtime::Syscalls;
using zero::test::KernelFixture;
using zero::test::bytes_of;

namespace {

ProcessState state_of(const Kernel& kernel, ProcessId pid) {
    return kernel.state().find_process(pid)->state;
}

Permissions held_permissions(Syscalls& sys, CapSlot slot) {
    auto listing = sys.cap_list();
    for (const auto& info : listing.caps) {
        if (info.slot == slot) {
            return info.permissions;
        }
    }
    return 0;
}

} // namespace

TEST(Ipc, SendThenReceive) {
    KernelFixture fx;
    auto a = fx.spawn("a");
    auto b = fx.spawn("b");
    CapSlot to_b = fx.connect(b, a);
    EXPECT_EQ(to_b, 2u);

    auto sent = a.send(to_b, 0x42, bytes_of("ping"));
    EXPECT_EQ(sent.kind, ResultKind::OK);

    auto received = b.recv(INBOX_SLOT, false);
    ASSERT_EQ(received.kind, ResultKind::MESSAGE);
    EXPECT_EQ(received.message->tag, 0x42u);
    EXPECT_EQ(received.message->from_pid, a.pid());
    EXPECT_EQ(to_string(received.message->data), "ping");
    EXPECT_TRUE(received.message->cap_slots.empty());
}

TEST(Ipc, NonblockingReceiveOnEmptyQueue) {
    KernelFixture fx;
    auto a = fx.spawn("a");

    EXPECT_TRUE(a.recv(INBOX_SLOT, false).is_err(KernelError::WOULD_BLOCK));
    EXPECT_EQ(state_of(fx.kernel, a.pid()), ProcessState::RUNNING);
}

TEST(Ipc, BlockedReceiverWakesOnSend) {
    KernelFixture fx;
    auto a = fx.spawn("a");
    auto b = fx.spawn("b");
    CapSlot to_b = fx.connect(b, a);

    EXPECT_EQ(b.recv(INBOX_SLOT).kind, ResultKind::BLOCKED);
    EXPECT_EQ(state_of(fx.kernel, b.pid()), ProcessState::BLOCKED);

    a.send(to_b, 7, bytes_of("wake"));
    EXPECT_EQ(state_of(fx.kernel, b.pid()), ProcessState::RUNNING);

    auto received = b.recv(INBOX_SLOT);
    ASSERT_EQ(received.kind, ResultKind::MESSAGE);
    EXPECT_EQ(to_string(received.message->data), "wake");
}

TEST(Ipc, MessagesArriveInSendOrder) {
    KernelFixture fx;
    auto a = fx.spawn("a");
    auto b = fx.spawn("b");
    CapSlot to_b = fx.connect(b, a);

    for (uint32_t tag = 1; tag <= 5; ++tag) {
        ASSERT_TRUE(a.send(to_b, tag, {}).is_ok());
    }
    for (uint32_t tag = 1; tag <= 5; ++tag) {
        auto received = b.recv(INBOX_SLOT, false);
        ASSERT_EQ(received.kind, ResultKind::MESSAGE);
        EXPECT_EQ(received.message->tag, tag);
    }
}

TEST(Ipc, FullQueueRejectsNonblockingSend) {
    KernelConfig config;
    config.endpoint_capacity = 2;
    KernelFixture fx(config);
    auto a = fx.spawn("a");
    auto b = fx.spawn("b");
    CapSlot to_b = fx.connect(b, a);

    EXPECT_TRUE(a.send(to_b, 1, {}, FLAG_NONBLOCK).is_ok());
    EXPECT_TRUE(a.send(to_b, 2, {}, FLAG_NONBLOCK).is_ok());
    EXPECT_TRUE(a.send(to_b, 3, {}, FLAG_NONBLOCK).is_err(KernelError::WOULD_BLOCK));
    EXPECT_EQ(fx.kernel.state().find_endpoint(fx.kernel.state().find_process(b.pid())->inbox)->queue.size(), 2u);
}

TEST(Ipc, BlockedSenderIsReleasedWhenSpaceFrees) {
    KernelConfig config;
    config.endpoint_capacity = 1;
    KernelFixture fx(config);
    auto a = fx.spawn("a");
    auto b = fx.spawn("b");
    CapSlot to_b = fx.connect(b, a);

    ASSERT_TRUE(a.send(to_b, 1, {}).is_ok());
    EXPECT_EQ(a.send(to_b, 2, {}).kind, ResultKind::BLOCKED);
    EXPECT_EQ(state_of(fx.kernel, a.pid()), ProcessState::BLOCKED);

    auto first = b.recv(INBOX_SLOT, false);
    ASSERT_EQ(first.kind, ResultKind::MESSAGE);
    EXPECT_EQ(first.message->tag, 1u);
    EXPECT_EQ(state_of(fx.kernel, a.pid()), ProcessState::RUNNING);

    auto second = b.recv(INBOX_SLOT, false);
    ASSERT_EQ(second.kind, ResultKind::MESSAGE);
    EXPECT_EQ(second.message->tag, 2u);
}

TEST(Ipc, OversizedMessageIsRejected) {
    KernelFixture fx;
    auto a = fx.spawn("a");
    auto b = fx.spawn("b");
    CapSlot to_b = fx.connect(b, a);

    Bytes big(MAX_MESSAGE_SIZE + 1, 0xAB);
    EXPECT_TRUE(a.send(to_b, 1, big).is_err(KernelError::MESSAGE_TOO_LARGE));
    EXPECT_TRUE(a.send(to_b, 1, Bytes(MAX_MESSAGE_SIZE, 0xAB)).is_ok());
}

TEST(Ipc, SendNeedsCapability) {
    KernelFixture fx;
    auto a = fx.spawn("a");
    auto b = fx.spawn("b");

    EXPECT_TRUE(a.send(9, 1, {}).is_err(KernelError::INVALID_CAPABILITY));

    CapSlot receive_only = fx.connect(b, a, perm::RECEIVE);
    EXPECT_TRUE(a.send(receive_only, 1, {}).is_err(KernelError::PERMISSION_DENIED));
}

TEST(Ipc, ReceiveNeedsReceivePermission) {
    KernelFixture fx;
    auto a = fx.spawn("a");
    auto b = fx.spawn("b");
    CapSlot to_b = fx.connect(b, a);

    EXPECT_TRUE(a.recv(to_b, false).is_err(KernelError::PERMISSION_DENIED));
}

TEST(Ipc, TransferredCapabilityIsAttenuated) {
    KernelFixture fx;
    auto a = fx.spawn("a");
    auto b = fx.spawn("b");
    CapSlot to_b = fx.connect(b, a);

    auto created = a.create_endpoint();
    ASSERT_EQ(created.kind, ResultKind::OK);
    auto private_slot = static_cast<CapSlot>(created.value);

    ASSERT_TRUE(a.send_cap(to_b, 0x10, bytes_of("here"), {private_slot}, perm::SEND).is_ok());

    auto received = b.recv(INBOX_SLOT, false);
    ASSERT_EQ(received.kind, ResultKind::MESSAGE);
    ASSERT_EQ(received.message->cap_slots.size(), 1u);
    CapSlot granted = received.message->cap_slots.front();

    EXPECT_EQ(held_permissions(b, granted), perm::SEND);
    EXPECT_TRUE(b.send(granted, 0x11, bytes_of("back")).is_ok());
    EXPECT_TRUE(b.recv(granted, false).is_err(KernelError::PERMISSION_DENIED));
    EXPECT_TRUE(b.cap_grant(granted, a.pid(), perm::SEND).is_err(KernelError::PERMISSION_DENIED));

    auto back = a.recv(private_slot, false);
    ASSERT_EQ(back.kind, ResultKind::MESSAGE);
    EXPECT_EQ(to_string(back.message->data), "back");
}

TEST(Ipc, TransferRequiresGrant) {
    KernelFixture fx;
    auto a = fx.spawn("a");
    auto b = fx.spawn("b");
    CapSlot to_b = fx.connect(b, a);

    // a only holds Send on b's inbox, so it cannot pass it along
    EXPECT_TRUE(a.send_cap(to_b, 1, {}, {to_b}).is_err(KernelError::PERMISSION_DENIED));
    EXPECT_TRUE(b.recv(INBOX_SLOT, false).is_err(KernelError::WOULD_BLOCK));
}

TEST(Ipc, ZeroMaskTransfersPermissionsAsHeld) {
    KernelFixture fx;
    auto a = fx.spawn("a");
    auto b = fx.spawn("b");
    CapSlot to_b = fx.connect(b, a);

    auto created = a.create_endpoint();
    auto private_slot = static_cast<CapSlot>(created.value);
    ASSERT_TRUE(a.send_cap(to_b, 1, {}, {private_slot}).is_ok());

    auto received = b.recv(INBOX_SLOT, false);
    ASSERT_EQ(received.message->cap_slots.size(), 1u);
    EXPECT_EQ(held_permissions(b, received.message->cap_slots.front()), perm::ALL & ~perm::RECEIVE);
}

TEST(Ipc, ReceiveStaysWithTheEndpointOwner) {
    KernelFixture fx;
    auto a = fx.spawn("a");
    auto b = fx.spawn("b");
    CapSlot to_b = fx.connect(b, a);
    ASSERT_TRUE(a.send(to_b, 0x30, bytes_of("for b")).is_ok());

    auto granted = b.cap_grant(INBOX_SLOT, a.pid(), perm::RECEIVE);
    ASSERT_EQ(granted.kind, ResultKind::OK);
    auto slot = static_cast<CapSlot>(granted.value);
    EXPECT_EQ(held_permissions(a, slot), 0u);
    EXPECT_TRUE(a.recv(slot, false).is_err(KernelError::PERMISSION_DENIED));

    // Passing the inbox along in a message strips Receive as well
    CapSlot to_a = fx.connect(a, b);
    ASSERT_TRUE(b.send_cap(to_a, 0x31, {}, {INBOX_SLOT}, perm::SEND | perm::RECEIVE).is_ok());
    auto carried = a.recv(INBOX_SLOT, false);
    ASSERT_EQ(carried.kind, ResultKind::MESSAGE);
    ASSERT_EQ(carried.message->cap_slots.size(), 1u);
    CapSlot transferred = carried.message->cap_slots.front();
    EXPECT_EQ(held_permissions(a, transferred), perm::SEND);
    EXPECT_TRUE(a.recv(transferred, false).is_err(KernelError::PERMISSION_DENIED));

    // The message is still there for its owner
    auto mine = b.recv(INBOX_SLOT, false);
    ASSERT_EQ(mine.kind, ResultKind::MESSAGE);
    EXPECT_EQ(to_string(mine.message->data), "for b");
}

TEST(Ipc, ReplyNeedsAReceivedMessage) {
    KernelFixture fx;
    auto a = fx.spawn("a");
    auto b = fx.spawn("b");
    CapSlot to_b = fx.connect(b, a);

    EXPECT_TRUE(b.reply(a.pid(), 0x21, bytes_of("early")).is_err(KernelError::PERMISSION_DENIED));

    a.send(to_b, 0x20, bytes_of("question"));
    ASSERT_EQ(b.recv(INBOX_SLOT, false).kind, ResultKind::MESSAGE);

    EXPECT_TRUE(b.reply(a.pid(), 0x21, bytes_of("answer")).is_ok());
    // One message, one reply
    EXPECT_TRUE(b.reply(a.pid(), 0x21, bytes_of("again")).is_err(KernelError::PERMISSION_DENIED));

    auto answer = a.recv(INBOX_SLOT, false);
    ASSERT_EQ(answer.kind, ResultKind::MESSAGE);
    EXPECT_EQ(answer.message->tag, 0x21u);
    EXPECT_EQ(answer.message->from_pid, b.pid());
    EXPECT_EQ(to_string(answer.message->data), "answer");
}

TEST(Ipc, ReplyToAFullInboxNeverSuspends) {
    KernelConfig config;
    config.endpoint_capacity = 1;
    KernelFixture fx(config);
    auto client = fx.spawn("client");
    auto server = fx.spawn("server");
    auto other = fx.spawn("other");
    CapSlot to_server = fx.connect(server, client);
    CapSlot to_client = fx.connect(client, other);

    ASSERT_TRUE(client.send(to_server, 0x100, bytes_of("request")).is_ok());
    ASSERT_EQ(server.recv(INBOX_SLOT, false).kind, ResultKind::MESSAGE);
    ASSERT_TRUE(other.send(to_client, 0x77, bytes_of("filler")).is_ok());

    auto replied = server.reply(client.pid(), 0x101, bytes_of("answer"));
    EXPECT_TRUE(replied.is_err(KernelError::WOULD_BLOCK));
    EXPECT_EQ(state_of(fx.kernel, server.pid()), ProcessState::RUNNING);
    EXPECT_EQ(fx.kernel.state().find_process(server.pid())->reply_credits.at(client.pid()), 1u);

    // Once the client drains its inbox the same credit answers it
    ASSERT_EQ(client.recv(INBOX_SLOT, false).message->tag, 0x77u);
    ASSERT_TRUE(server.reply(client.pid(), 0x101, bytes_of("answer")).is_ok());
    EXPECT_TRUE(fx.kernel.state().find_process(server.pid())->reply_credits.empty());
    auto answer = client.recv(INBOX_SLOT, false);
    ASSERT_EQ(answer.kind, ResultKind::MESSAGE);
    EXPECT_EQ(answer.message->tag, 0x101u);
}

TEST(Ipc, DeriveNeverWidens) {
    KernelFixture fx;
    auto a = fx.spawn("a");
    auto b = fx.spawn("b");
    CapSlot to_b = fx.connect(b, a);

    auto derived = a.cap_derive(to_b, perm::SEND | perm::RECEIVE | perm::GRANT);
    ASSERT_EQ(derived.kind, ResultKind::OK);
    EXPECT_EQ(held_permissions(a, static_cast<CapSlot>(derived.value)), perm::SEND);
}

TEST(Ipc, KernelMessagesComeFromPidZero) {
    KernelFixture fx;
    auto a = fx.spawn("a");

    EXPECT_TRUE(fx.kernel.post_message(a.pid(), MSG_CONSOLE_INPUT, bytes_of("ls")));
    auto received = a.recv(INBOX_SLOT, false);
    ASSERT_EQ(received.kind, ResultKind::MESSAGE);
    EXPECT_EQ(received.message->from_pid, KERNEL_PID);
    EXPECT_EQ(received.message->tag, MSG_CONSOLE_INPUT);

    // Kernel messages grant no reply credit
    EXPECT_TRUE(a.reply(KERNEL_PID, 1, {}).is_err(KernelError::PERMISSION_DENIED));
}

TEST(Ipc, EndpointDetailShowsQueuedMessages) {
    KernelFixture fx;
    auto a = fx.spawn("a");
    auto b = fx.spawn("b");
    CapSlot to_b = fx.connect(b, a);
    ASSERT_TRUE(a.send(to_b, 0x10, bytes_of("one")).is_ok());
    ASSERT_TRUE(a.send(to_b, 0x11, bytes_of("three")).is_ok());

    EndpointId inbox = fx.kernel.state().find_process(b.pid())->inbox;
    auto detail = fx.kernel.endpoint_detail(inbox);
    EXPECT_EQ(detail["owner"], b.pid());
    EXPECT_EQ(detail["queue_depth"], 2);
    ASSERT_EQ(detail["queued"].size(), 2u);
    EXPECT_EQ(detail["queued"][0]["tag"], 0x10);
    EXPECT_EQ(detail["queued"][1]["size"], 5);
    EXPECT_EQ(fx.kernel.metrics().total_pending_messages, 2u);

    EXPECT_TRUE(fx.kernel.endpoint_detail(999).is_null());
}
