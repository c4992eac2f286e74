#include <gtest/gtest.h>
#include <optional>
#include <nlohmann/json.hpp>
#include "runtime/protocol.hpp"
#include "services/init_service.hpp"
#include "test_helpers.hpp"

using namespace zero::services;
using zero::kernel::ReceivedMessage;
using zero::kernel::ResultKind;
using zero::runtime::INBOX_SLOT;
using zero::runtime::INIT_SLOT;
using zero::runtime::Syscalls;
using zero::runtime::decode_json;
using zero::runtime::encode_json;
using zero::supervisor::Client;
using zero::test::SystemTest;
using json = nlohmann::json;

namespace msg = zero::runtime::msg;
namespace perm = zero::kernel::perm;

TEST(ServiceRegistry, PutFindErase) {
    ServiceRegistry registry;
    registry.put(ServiceEntry{"vfs", 2, 7, false});
    registry.put(ServiceEntry{"identity", 4, 9, false});

    ASSERT_NE(registry.find("vfs"), nullptr);
    EXPECT_EQ(registry.find("vfs")->slot, 7u);
    EXPECT_EQ(registry.find("nope"), nullptr);
    EXPECT_EQ(registry.names(), (std::vector<std::string>{"identity", "vfs"}));

    // Replacing keeps one entry per name
    registry.put(ServiceEntry{"vfs", 5, 11, false});
    EXPECT_EQ(registry.size(), 2u);
    EXPECT_EQ(registry.find("vfs")->owner_pid, 5u);

    EXPECT_TRUE(registry.erase("vfs"));
    EXPECT_FALSE(registry.erase("vfs"));
    EXPECT_EQ(registry.size(), 1u);
}

TEST(ServiceRegistry, MarkReadyByOwner) {
    ServiceRegistry registry;
    registry.put(ServiceEntry{"vfs", 2, 7, false});

    EXPECT_FALSE(registry.mark_ready(3).has_value());
    EXPECT_EQ(registry.mark_ready(2), std::optional<std::string>("vfs"));
    EXPECT_TRUE(registry.find("vfs")->ready);

    auto j = registry.to_json();
    ASSERT_EQ(j.size(), 1u);
    EXPECT_EQ(j[0]["name"], "vfs");
    EXPECT_EQ(j[0]["ready"], true);
}

namespace {

std::optional<ReceivedMessage> receive_tag(Syscalls& sys, uint32_t tag) {
    while (true) {
        auto received = sys.recv(INBOX_SLOT, false);
        if (received.kind != ResultKind::MESSAGE) {
            return std::nullopt;
        }
        if (received.message->tag == tag) {
            return received.message;
        }
    }
}

class RegistryTest : public SystemTest {
protected:
    // Registers app's inbox under name and returns init's answer
    json register_app(const std::string& name) {
        auto sent = app->sys().send_cap(INIT_SLOT, msg::REGISTER_SERVICE, encode_json({{"name", name}}),
                                        {INBOX_SLOT}, perm::SEND | perm::GRANT);
        EXPECT_TRUE(sent.is_ok());
        sup->run_until_idle();
        auto reply = receive_tag(app->sys(), msg::REGISTER_RESPONSE);
        return reply ? decode_json(reply->data).value_or(json()) : json();
    }

    const ServiceRegistry& registry() { return sup->init().registry(); }
};

class PartialBootTest : public SystemTest {
protected:
    PartialBootTest() { config.services = {"keystore"}; }
};

} // namespace

TEST_F(RegistryTest, BootRegistersEveryService) {
    ASSERT_EQ(registry().size(), 3u);
    for (const auto& name : {"vfs", "keystore", "identity"}) {
        const ServiceEntry* entry = registry().find(name);
        ASSERT_NE(entry, nullptr) << name;
        EXPECT_EQ(entry->owner_pid, sup->pid_of(name));
        EXPECT_TRUE(entry->ready) << name;
    }
}

TEST_F(RegistryTest, LookupGrantsASendCapability) {
    auto slot = app->lookup("identity");
    ASSERT_TRUE(slot.has_value());
    // After inbox, init, vfs, vfs response and keystore
    EXPECT_EQ(*slot, 6u);

    auto listing = app->sys().cap_list();
    ASSERT_EQ(listing.kind, ResultKind::CAP_LIST);
    ASSERT_EQ(listing.caps.size(), 6u);
    EXPECT_EQ(listing.caps.back().slot, 6u);
    EXPECT_EQ(listing.caps.back().permissions, perm::SEND);

    EXPECT_FALSE(app->lookup("missing").has_value());
}

TEST_F(RegistryTest, LiveOwnerKeepsItsName) {
    auto response = register_app("vfs");
    EXPECT_FALSE(response.value("success", true));
    EXPECT_EQ(response.value("error", ""), "AlreadyExists");
    EXPECT_EQ(registry().find("vfs")->owner_pid, sup->pid_of("vfs"));
}

TEST_F(RegistryTest, NewServiceIsReachableByOthers) {
    auto response = register_app("echo");
    ASSERT_TRUE(response.value("success", false)) << response.dump();
    EXPECT_EQ(registry().find("echo")->owner_pid, app->pid());
    EXPECT_FALSE(registry().find("echo")->ready);

    auto other = Client::spawn(*sup, "other");
    ASSERT_TRUE(other.has_value());
    auto slot = other->lookup("echo");
    ASSERT_TRUE(slot.has_value());
    ASSERT_TRUE(other->sys().send(*slot, 0x4242, zero::kernel::to_bytes("ping")).is_ok());

    auto received = receive_tag(app->sys(), 0x4242);
    ASSERT_TRUE(received.has_value());
    EXPECT_EQ(received->from_pid, other->pid());
}

TEST_F(RegistryTest, NameIsFreedWhenTheOwnerDies) {
    auto vfs_pid = *sup->pid_of("vfs");
    ASSERT_TRUE(sup->init().process_slot(vfs_pid).has_value());
    ASSERT_TRUE(sup->kill(vfs_pid).is_ok());
    sup->run_until_idle();
    EXPECT_EQ(sup->kernel().state().find_process(vfs_pid), nullptr);

    // The registry still names the dead owner but lookups fail
    auto late = Client::spawn(*sup, "late");
    ASSERT_TRUE(late.has_value());
    EXPECT_FALSE(late->lookup("vfs").has_value());

    auto response = register_app("vfs");
    ASSERT_TRUE(response.value("success", false)) << response.dump();
    EXPECT_EQ(registry().find("vfs")->owner_pid, app->pid());
    EXPECT_TRUE(late->lookup("vfs").has_value());
}

TEST_F(RegistryTest, MalformedRegistrations) {
    auto no_cap = app->sys().send(INIT_SLOT, msg::REGISTER_SERVICE, encode_json({{"name", "bare"}}));
    ASSERT_TRUE(no_cap.is_ok());
    sup->run_until_idle();
    auto reply = receive_tag(app->sys(), msg::REGISTER_RESPONSE);
    ASSERT_TRUE(reply.has_value());
    EXPECT_EQ((*decode_json(reply->data))["error"], "InvalidRequest");

    EXPECT_EQ(register_app("")["error"], "InvalidRequest");
    EXPECT_EQ(registry().find("bare"), nullptr);
}

TEST_F(RegistryTest, SpawnThroughInit) {
    ASSERT_TRUE(app->sys().send(INIT_SLOT, msg::SPAWN_SERVICE, encode_json({{"name", "worker"}})).is_ok());
    sup->run_until_idle();

    auto reply = receive_tag(app->sys(), msg::SPAWN_RESPONSE);
    ASSERT_TRUE(reply.has_value());
    auto body = *decode_json(reply->data);
    ASSERT_TRUE(body["success"].get<bool>()) << body.dump();
    auto pid = body["pid"].get<zero::kernel::ProcessId>();
    EXPECT_EQ(sup->pid_of("worker"), pid);

    // Fully wired like any other child
    Syscalls worker(sup->kernel(), pid);
    EXPECT_EQ(worker.cap_list().caps.size(), 5u);
    EXPECT_TRUE(sup->init().process_slot(pid).has_value());
}

TEST_F(RegistryTest, ServicesSpawnedBeforeTheirPeersAreWiredPartially) {
    // Both are blocked in RECV, so look at their spaces from the kernel side
    const auto& spaces = sup->kernel().state().cap_spaces;

    // vfs came up first: inbox and init only
    EXPECT_EQ(spaces.at(*sup->pid_of("vfs")).size(), 2u);
    EXPECT_EQ(spaces.at(*sup->pid_of("identity")).size(), 5u);
}

TEST_F(PartialBootTest, SlotsNeverNameTheWrongService) {
    // No VFS, so wiring stops after init even though the keystore exists
    EXPECT_EQ(app->sys().cap_list().caps.size(), 2u);

    auto slot = app->service_slot("keystore");
    ASSERT_TRUE(slot.has_value());
    EXPECT_EQ(*slot, 3u);

    auto written = app->request("keystore", msg::KEYSTORE_WRITE, {{"key", "/keys/a"}, {"value_hex", "aa"}});
    EXPECT_TRUE(written["success"].get<bool>()) << written.dump();
}
