#include <gtest/gtest.h>
#include <stdexcept>
#include "runtime/memory_storage.hpp"
#include "test_helpers.hpp"

using namespace zero::kernel;
using zero::runtime::INBOX_SLOT;
using zero::runtime::MemoryStorage;
using zero::test::KernelFixture;
using zero::test::bytes_of;

TEST(StorageSyscalls, RequestIdsArePerProcessAndStartAtOne) {
    KernelFixture fx;
    auto a = fx.spawn("a");
    auto b = fx.spawn("b");

    EXPECT_EQ(a.io(IoChannel::STORAGE, IoOp::READ, "x").value, 1u);
    EXPECT_EQ(a.io(IoChannel::STORAGE, IoOp::EXISTS, "y").value, 2u);
    EXPECT_EQ(b.io(IoChannel::STORAGE, IoOp::READ, "x").value, 1u);
    EXPECT_EQ(a.io(IoChannel::KEYSTORE, IoOp::READ, "/keys/k").value, 3u);

    auto pending = fx.kernel.take_pending_io();
    ASSERT_EQ(pending.size(), 4u);
    EXPECT_EQ(pending[0].pid, a.pid());
    EXPECT_EQ(pending[0].request_id, 1u);
    EXPECT_EQ(pending[0].op, IoOp::READ);
    EXPECT_EQ(pending[0].key, "x");
    EXPECT_EQ(pending[1].op, IoOp::EXISTS);
    EXPECT_EQ(pending[2].pid, b.pid());
    EXPECT_EQ(pending[3].channel, IoChannel::KEYSTORE);
    EXPECT_EQ(fx.kernel.pending_io_count(), 0u);
}

TEST(StorageSyscalls, WriteCarriesKeyAndValue) {
    KernelFixture fx;
    auto a = fx.spawn("a");

    ASSERT_TRUE(a.io(IoChannel::STORAGE, IoOp::WRITE, "content:/f", bytes_of("data")).is_ok());
    auto pending = fx.kernel.take_pending_io();
    ASSERT_EQ(pending.size(), 1u);
    EXPECT_EQ(pending[0].key, "content:/f");
    EXPECT_EQ(to_string(pending[0].value), "data");
}

TEST(StorageSyscalls, RejectsMalformedRequests) {
    KernelFixture fx;
    auto a = fx.spawn("a");

    EXPECT_TRUE(a.io(IoChannel::STORAGE, IoOp::READ, "").is_err(KernelError::INVALID_ARGUMENT));
    EXPECT_TRUE(a.io(IoChannel::KEYSTORE, IoOp::READ, "/etc/passwd").is_err(KernelError::INVALID_ARGUMENT));
    EXPECT_TRUE(a.call(SyscallNum::SYS_STORAGE_WRITE, 0, 0, 0, 0, Bytes{1, 2})
                    .is_err(KernelError::INVALID_ARGUMENT));
    // An empty LIST prefix means everything
    EXPECT_TRUE(a.io(IoChannel::STORAGE, IoOp::LIST, "").is_ok());
    EXPECT_EQ(fx.kernel.pending_io_count(), 1u);
}

TEST(StorageSyscalls, ResultsArriveAsKernelMessages) {
    KernelFixture fx;
    auto a = fx.spawn("a");
    a.io(IoChannel::STORAGE, IoOp::READ, "k");

    IoResult result;
    result.request_id = 1;
    result.type = IoResultType::READ_OK;
    result.data = bytes_of("v");
    EXPECT_TRUE(fx.kernel.deliver_io_result(a.pid(), IoChannel::STORAGE, result));

    auto received = a.recv(INBOX_SLOT, false);
    ASSERT_EQ(received.kind, ResultKind::MESSAGE);
    EXPECT_EQ(received.message->tag, MSG_STORAGE_RESULT);
    EXPECT_EQ(received.message->from_pid, KERNEL_PID);

    auto parsed = IoResult::parse(received.message->data);
    ASSERT_TRUE(parsed.has_value());
    EXPECT_EQ(parsed->request_id, 1u);
    EXPECT_EQ(parsed->type, IoResultType::READ_OK);
    EXPECT_EQ(to_string(parsed->data), "v");
}

TEST(StorageSyscalls, ResultsForDeadProcessesAreCounted) {
    KernelFixture fx;
    auto a = fx.spawn("a");
    a.exit(0);

    IoResult result;
    result.request_id = 1;
    result.type = IoResultType::WRITE_OK;
    EXPECT_FALSE(fx.kernel.deliver_io_result(a.pid(), IoChannel::KEYSTORE, result));
    EXPECT_FALSE(fx.kernel.deliver_io_result(999, IoChannel::STORAGE, result));
    EXPECT_EQ(fx.kernel.metrics().dropped_io_results, 2u);
}

TEST(IoResult, ParseRejectsGarbage) {
    EXPECT_FALSE(IoResult::parse(Bytes{1, 2}).has_value());
    EXPECT_FALSE(IoResult::parse(Bytes{1, 0, 0, 0, 99, 0, 0, 0, 0}).has_value());
}

TEST(IoResult, ErrorTypes) {
    IoResult result;
    result.type = IoResultType::LIST_ERR;
    EXPECT_TRUE(result.is_error());
    result.type = IoResultType::READ_NOT_FOUND;
    EXPECT_FALSE(result.is_error());
}

TEST(IoResult, KeyListEncoding) {
    std::vector<std::string> keys = {"inode:/a", "inode:/b", ""};
    EXPECT_EQ(decode_key_list(encode_key_list(keys)), keys);
    EXPECT_TRUE(decode_key_list({}).empty());
}

namespace {

IoRequest make_request(IoOp op, const std::string& key, const std::string& value = "") {
    IoRequest request;
    request.request_id = 7;
    request.op = op;
    request.key = key;
    request.value = bytes_of(value);
    return request;
}

} // namespace

TEST(MemoryStorage, ReadWriteDelete) {
    MemoryStorage storage;

    EXPECT_EQ(storage.execute(make_request(IoOp::READ, "k")).type, IoResultType::READ_NOT_FOUND);

    auto written = storage.execute(make_request(IoOp::WRITE, "k", "value"));
    EXPECT_EQ(written.type, IoResultType::WRITE_OK);
    EXPECT_EQ(written.request_id, 7u);

    auto read = storage.execute(make_request(IoOp::READ, "k"));
    EXPECT_EQ(read.type, IoResultType::READ_OK);
    EXPECT_EQ(to_string(read.data), "value");

    EXPECT_EQ(storage.execute(make_request(IoOp::EXISTS, "k")).type, IoResultType::EXISTS_TRUE);
    EXPECT_EQ(storage.execute(make_request(IoOp::DELETE, "k")).type, IoResultType::DELETE_OK);
    EXPECT_EQ(storage.execute(make_request(IoOp::EXISTS, "k")).type, IoResultType::EXISTS_FALSE);
    // Deleting a missing key succeeds
    EXPECT_EQ(storage.execute(make_request(IoOp::DELETE, "k")).type, IoResultType::DELETE_OK);
}

TEST(MemoryStorage, ListIsPrefixedAndSorted) {
    MemoryStorage storage;
    storage.put("inode:/b", {});
    storage.put("inode:/a", {});
    storage.put("content:/a", {});
    storage.put("inode:/a/x", {});

    auto listed = storage.execute(make_request(IoOp::LIST, "inode:/"));
    ASSERT_EQ(listed.type, IoResultType::LIST_OK);
    EXPECT_EQ(decode_key_list(listed.data),
              (std::vector<std::string>{"inode:/a", "inode:/a/x", "inode:/b"}));
    EXPECT_EQ(storage.keys().size(), 4u);
}

TEST(MemoryStorage, ReadOnlyRejectsMutations) {
    MemoryStorage storage;
    storage.put("k", bytes_of("v"));
    storage.set_read_only(true);

    EXPECT_EQ(storage.execute(make_request(IoOp::WRITE, "k", "new")).type, IoResultType::WRITE_ERR);
    EXPECT_EQ(storage.execute(make_request(IoOp::DELETE, "k")).type, IoResultType::DELETE_ERR);
    EXPECT_EQ(to_string(*storage.get("k")), "v");
}

TEST(MemoryStorage, SeedFromJson) {
    MemoryStorage storage;
    storage.seed({{"content:/docs/readme", "hello"}, {"count", 3}});

    EXPECT_EQ(to_string(*storage.get("content:/docs/readme")), "hello");
    EXPECT_EQ(to_string(*storage.get("count")), "3");
    EXPECT_EQ(storage.to_json()["content:/docs/readme"], "hello");
    EXPECT_THROW(storage.seed(nlohmann::json::array({1, 2})), std::invalid_argument);
}
