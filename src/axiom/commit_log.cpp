#include "axiom/commit_log.hpp"
#include "kernel/wire.hpp"
#include <algorithm>
#include <fstream>
#include <iterator>
#include <spdlog/spdlog.h>

namespace zero::axiom {

namespace {
constexpr uint8_t LOG_MAGIC[4] = {'Z', 'L', 'O', 'G'};
} // namespace

std::string commit_type_to_string(CommitType type) {
    switch (type) {
        case CommitType::BOOT:              return "Boot";
        case CommitType::PROCESS_CREATED:   return "ProcessCreated";
        case CommitType::SYSCALL_REQUEST:   return "SyscallRequest";
        case CommitType::SYSCALL_RESPONSE:  return "SyscallResponse";
        case CommitType::MESSAGE_DELIVERED: return "MessageDelivered";
        case CommitType::CAP_REVOKED:       return "CapRevoked";
        case CommitType::TICK:              return "Tick";
        case CommitType::PROCESS_FAULTED:   return "ProcessFaulted";
        case CommitType::PROCESS_REAPED:    return "ProcessReaped";
        case CommitType::PROCESS_EXITED:    return "ProcessExited";
        case CommitType::PROCESS_WOKEN:     return "ProcessWoken";
        default: return "Unknown";
    }
}

uint64_t CommitLog::append(CommitType type, Bytes payload,
                           const StateHash& pre_hash, const StateHash& post_hash) {
    Commit commit;
    commit.commit_id = commits_.size();
    commit.commit_type = type;
    commit.payload = std::move(payload);
    commit.pre_state_hash = pre_hash;
    commit.post_state_hash = post_hash;
    commits_.push_back(std::move(commit));
    return commits_.back().commit_id;
}

void CommitLog::set_post_hash(uint64_t commit_id, const StateHash& post_hash) {
    commits_.at(commit_id).post_state_hash = post_hash;
}

Bytes CommitLog::encode() const {
    kernel::ByteWriter w;
    w.raw(LOG_MAGIC, sizeof(LOG_MAGIC));
    w.u32(FORMAT_VERSION);
    for (const auto& commit : commits_) {
        w.u64(commit.commit_id);
        w.u8(static_cast<uint8_t>(commit.commit_type));
        w.bytes(commit.payload);
        w.raw(commit.pre_state_hash.data(), commit.pre_state_hash.size());
        w.raw(commit.post_state_hash.data(), commit.post_state_hash.size());
    }
    return w.take();
}

CommitLog CommitLog::decode(const Bytes& data) {
    CommitLog log;
    kernel::ByteReader r(data);

    try {
        Bytes magic = r.raw(sizeof(LOG_MAGIC));
        if (!std::equal(magic.begin(), magic.end(), LOG_MAGIC)) {
            throw LogFormatError("bad magic, not a commit log");
        }
        uint32_t version = r.u32();
        if (version != FORMAT_VERSION) {
            throw LogFormatError("unsupported log version " + std::to_string(version));
        }

        while (!r.done()) {
            Commit commit;
            commit.commit_id = r.u64();
            uint8_t type = r.u8();
            if (type > static_cast<uint8_t>(CommitType::PROCESS_WOKEN)) {
                throw LogFormatError("unknown commit type " + std::to_string(type) +
                                     " at commit " + std::to_string(commit.commit_id));
            }
            commit.commit_type = static_cast<CommitType>(type);
            commit.payload = r.bytes();
            Bytes pre = r.raw(32);
            Bytes post = r.raw(32);
            std::copy(pre.begin(), pre.end(), commit.pre_state_hash.begin());
            std::copy(post.begin(), post.end(), commit.post_state_hash.begin());

            if (commit.commit_id != log.commits_.size()) {
                throw LogFormatError("non-contiguous commit id " + std::to_string(commit.commit_id) +
                                     ", expected " + std::to_string(log.commits_.size()));
            }
            log.commits_.push_back(std::move(commit));
        }
    } catch (const kernel::WireError& e) {
        throw LogFormatError(std::string("truncated log: ") + e.what());
    }

    return log;
}

void CommitLog::write(std::ostream& out) const {
    Bytes data = encode();
    auto end = std::copy(data.begin(), data.end(), std::ostreambuf_iterator<char>(out));
    if (end.failed() || !out) {
        throw LogFormatError("failed to write commit log");
    }
}

CommitLog CommitLog::read(std::istream& in) {
    Bytes data((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
    return decode(data);
}

void CommitLog::save(const std::filesystem::path& path) const {
    std::ofstream file(path, std::ios::binary | std::ios::trunc);
    if (!file) {
        throw LogFormatError("cannot open " + path.string() + " for writing");
    }
    write(file);
    spdlog::info("Wrote {} commits to {}", commits_.size(), path.string());
}

CommitLog CommitLog::load(const std::filesystem::path& path) {
    std::ifstream file(path, std::ios::binary);
    if (!file) {
        throw LogFormatError("cannot open " + path.string());
    }
    return read(file);
}

} // namespace zero::axiom
