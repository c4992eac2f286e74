/**
 * Axiom Commit Log
 *
 * Append-only replay tape. Every kernel mutation is bracketed by commits
 * carrying the SHA-256 state hash before and after it.
 *
 * File format: "ZLOG" magic, u32 version, then one record per commit:
 *   commit_id u64 | commit_type u8 | payload_len u32 | payload |
 *   pre_hash[32] | post_hash[32]
 */
#pragma once
#include <array>
#include <cstdint>
#include <filesystem>
#include <iosfwd>
#include <stdexcept>
#include <string>
#include <vector>
#include "kernel/types.hpp"

namespace zero::axiom {

using kernel::Bytes;

using StateHash = std::array<uint8_t, 32>;

enum class CommitType : uint8_t {
    BOOT              = 0,
    PROCESS_CREATED   = 1,
    SYSCALL_REQUEST   = 2,
    SYSCALL_RESPONSE  = 3,
    MESSAGE_DELIVERED = 4,
    CAP_REVOKED       = 5,
    TICK              = 6,
    PROCESS_FAULTED   = 7,
    PROCESS_REAPED    = 8,
    PROCESS_EXITED    = 9,
    PROCESS_WOKEN     = 10
};

std::string commit_type_to_string(CommitType type);

struct Commit {
    uint64_t commit_id = 0;
    CommitType commit_type = CommitType::TICK;
    Bytes payload;
    StateHash pre_state_hash{};
    StateHash post_state_hash{};

    bool operator==(const Commit& other) const {
        return commit_id == other.commit_id &&
               commit_type == other.commit_type &&
               payload == other.payload &&
               pre_state_hash == other.pre_state_hash &&
               post_state_hash == other.post_state_hash;
    }
    bool operator!=(const Commit& other) const { return !(*this == other); }
};

// Thrown when a log file or record cannot be decoded
class LogFormatError : public std::runtime_error {
public:
    explicit LogFormatError(const std::string& what) : std::runtime_error(what) {}
};

class CommitLog {
public:
    static constexpr uint32_t FORMAT_VERSION = 1;

    // Appends with the next commit_id and returns that id
    uint64_t append(CommitType type, Bytes payload,
                    const StateHash& pre_hash, const StateHash& post_hash);

    // Only used to finalise a SyscallRequest once its effects are known
    void set_post_hash(uint64_t commit_id, const StateHash& post_hash);

    // Direct record access by commit id
    Commit& at(uint64_t commit_id) { return commits_.at(commit_id); }
    const Commit& at(uint64_t commit_id) const { return commits_.at(commit_id); }

    const std::vector<Commit>& commits() const { return commits_; }
    size_t size() const { return commits_.size(); }
    bool empty() const { return commits_.empty(); }
    const Commit& last() const { return commits_.back(); }

    Bytes encode() const;
    static CommitLog decode(const Bytes& data);

    void write(std::ostream& out) const;
    static CommitLog read(std::istream& in);

    void save(const std::filesystem::path& path) const;
    static CommitLog load(const std::filesystem::path& path);

private:
    std::vector<Commit> commits_;
};

} // namespace zero::axiom
