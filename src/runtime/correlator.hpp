/**
 * Async request correlator
 *
 * Services never block on storage. Each async syscall returns a request id
 * immediately; the correlator remembers what to do with the result and
 * runs that continuation when MSG_STORAGE_RESULT / MSG_KEYSTORE_RESULT for
 * the id arrives. A continuation either finishes (Done) or issues the next
 * operation with the same context.
 */
#pragma once
#include <algorithm>
#include <cstdint>
#include <functional>
#include <map>
#include <optional>
#include <string>
#include <vector>
#include <spdlog/spdlog.h>
#include "kernel/io.hpp"
#include "runtime/syscalls.hpp"

namespace zero::runtime {

using kernel::IoOp;
using kernel::IoResult;
using kernel::IoResultType;
using kernel::RequestId;

enum class StepKind {
    DONE,
    CONTINUE_READ,
    CONTINUE_WRITE,
    CONTINUE_DELETE,
    CONTINUE_EXISTS,
    CONTINUE_LIST
};

template <typename Context>
struct Step;

template <typename Context>
using NextStep = std::function<Step<Context>(const IoResult&, Context&)>;

template <typename Context>
struct Step {
    StepKind kind = StepKind::DONE;
    std::string key;        // prefix for LIST
    Bytes value;            // WRITE only
    NextStep<Context> next;

    static Step done() { return Step{}; }
    static Step read(std::string key, NextStep<Context> next) {
        return Step{StepKind::CONTINUE_READ, std::move(key), {}, std::move(next)};
    }
    static Step write(std::string key, Bytes value, NextStep<Context> next) {
        return Step{StepKind::CONTINUE_WRITE, std::move(key), std::move(value), std::move(next)};
    }
    static Step remove(std::string key, NextStep<Context> next) {
        return Step{StepKind::CONTINUE_DELETE, std::move(key), {}, std::move(next)};
    }
    static Step exists(std::string key, NextStep<Context> next) {
        return Step{StepKind::CONTINUE_EXISTS, std::move(key), {}, std::move(next)};
    }
    static Step list(std::string prefix, NextStep<Context> next) {
        return Step{StepKind::CONTINUE_LIST, std::move(prefix), {}, std::move(next)};
    }
};

struct StartResult {
    bool success = false;
    RequestId request_id = 0;
    kernel::KernelError error = kernel::KernelError::INVALID_ARGUMENT;
};

inline IoOp step_op(StepKind kind) {
    switch (kind) {
        case StepKind::CONTINUE_WRITE:  return IoOp::WRITE;
        case StepKind::CONTINUE_DELETE: return IoOp::DELETE;
        case StepKind::CONTINUE_EXISTS: return IoOp::EXISTS;
        case StepKind::CONTINUE_LIST:   return IoOp::LIST;
        default: return IoOp::READ;
    }
}

// Result handed to a continuation whose operation never reached storage
inline IoResult failed_result(IoOp op, const std::string& reason) {
    IoResult result;
    switch (op) {
        case IoOp::WRITE:  result.type = IoResultType::WRITE_ERR; break;
        case IoOp::DELETE: result.type = IoResultType::DELETE_ERR; break;
        case IoOp::LIST:   result.type = IoResultType::LIST_ERR; break;
        default:           result.type = IoResultType::READ_ERR; break;
    }
    result.data = kernel::Bytes(reason.begin(), reason.end());
    return result;
}

template <typename Context>
class Correlator {
public:
    using Issue = std::function<SyscallResult()>;

    Correlator(Syscalls& sys, kernel::IoChannel channel) : sys_(sys), channel_(channel) {}

    // Runs the issuing syscall and parks the continuation under its request id.
    // op only selects the error result a later fail() synthesizes.
    StartResult start(const Issue& issue, Context context, NextStep<Context> next, uint64_t now,
                      IoOp op = IoOp::READ) {
        StartResult started;
        SyscallResult result = issue();
        if (result.kind != kernel::ResultKind::OK) {
            started.error = result.kind == kernel::ResultKind::ERR ? result.error
                                                                   : kernel::KernelError::WOULD_BLOCK;
            return started;
        }

        auto rid = static_cast<RequestId>(result.value);
        if (pending_.count(rid)) {
            spdlog::error("PID {} request id {} already pending", sys_.pid(), rid);
            started.error = kernel::KernelError::INVALID_ARGUMENT;
            return started;
        }
        pending_.emplace(rid, PendingOp{std::move(context), std::move(next), now, op});
        started.success = true;
        started.request_id = rid;
        return started;
    }

    StartResult start(IoOp op, const std::string& key, const Bytes& value,
                      Context context, NextStep<Context> next, uint64_t now) {
        return start([this, op, &key, &value]() { return sys_.io(channel_, op, key, value); },
                     std::move(context), std::move(next), now, op);
    }

    StartResult start_read(const std::string& key, Context context, NextStep<Context> next, uint64_t now) {
        return start(IoOp::READ, key, {}, std::move(context), std::move(next), now);
    }
    StartResult start_write(const std::string& key, const Bytes& value, Context context,
                            NextStep<Context> next, uint64_t now) {
        return start(IoOp::WRITE, key, value, std::move(context), std::move(next), now);
    }
    StartResult start_delete(const std::string& key, Context context, NextStep<Context> next, uint64_t now) {
        return start(IoOp::DELETE, key, {}, std::move(context), std::move(next), now);
    }
    StartResult start_exists(const std::string& key, Context context, NextStep<Context> next, uint64_t now) {
        return start(IoOp::EXISTS, key, {}, std::move(context), std::move(next), now);
    }
    StartResult start_list(const std::string& prefix, Context context, NextStep<Context> next, uint64_t now) {
        return start(IoOp::LIST, prefix, {}, std::move(context), std::move(next), now);
    }

    // Starts the first operation of a chain. When it cannot be issued the
    // continuation runs immediately with a synthesized error result.
    void begin(Step<Context> step, Context context, uint64_t now) {
        run(std::move(step), std::move(context), now);
    }

    // False when no operation is pending for the id (duplicate or unknown result)
    bool on_result(const IoResult& result, uint64_t now) {
        auto it = pending_.find(result.request_id);
        if (it == pending_.end()) {
            ++unmatched_;
            spdlog::warn("PID {} dropping {} for unknown request {}", sys_.pid(),
                         kernel::io_result_type_to_string(result.type), result.request_id);
            return false;
        }

        PendingOp op = std::move(it->second);
        pending_.erase(it);
        Step<Context> step = op.next(result, op.context);
        run(std::move(step), std::move(op.context), now);
        return true;
    }

    // Request ids started more than timeout ago, oldest first
    std::vector<RequestId> expired(uint64_t now, uint64_t timeout) const {
        std::vector<std::pair<uint64_t, RequestId>> aged;
        for (const auto& [rid, op] : pending_) {
            if (now >= op.started_at && now - op.started_at > timeout) {
                aged.emplace_back(op.started_at, rid);
            }
        }
        std::sort(aged.begin(), aged.end());
        std::vector<RequestId> ids;
        for (const auto& entry : aged) {
            ids.push_back(entry.second);
        }
        return ids;
    }

    // Removes a pending entry without running its continuation
    std::optional<Context> take(RequestId rid) {
        auto it = pending_.find(rid);
        if (it == pending_.end()) {
            return std::nullopt;
        }
        Context context = std::move(it->second.context);
        pending_.erase(it);
        return context;
    }

    // Completes a pending entry with a synthesized error result
    bool fail(RequestId rid, const std::string& reason, uint64_t now) {
        auto it = pending_.find(rid);
        if (it == pending_.end()) {
            return false;
        }
        PendingOp pending = std::move(it->second);
        pending_.erase(it);
        Step<Context> step = pending.next(failed_result(pending.op, reason), pending.context);
        run(std::move(step), std::move(pending.context), now);
        return true;
    }

    bool contains(RequestId rid) const { return pending_.count(rid) > 0; }
    size_t pending_count() const { return pending_.size(); }
    uint64_t unmatched_count() const { return unmatched_; }

private:
    struct PendingOp {
        Context context;
        NextStep<Context> next;
        uint64_t started_at = 0;
        IoOp op = IoOp::READ;
    };

    // Issues each continuation in turn until one is parked or the chain is done
    void run(Step<Context> step, Context context, uint64_t now) {
        while (step.kind != StepKind::DONE) {
            IoOp op = step_op(step.kind);
            auto started = start(op, step.key, step.value, context, step.next, now);
            if (started.success) {
                return;
            }
            spdlog::warn("PID {} could not issue {} '{}': {}", sys_.pid(), kernel::io_op_to_string(op),
                         step.key, kernel::kernel_error_to_string(started.error));
            step = step.next(failed_result(op, kernel::kernel_error_to_string(started.error)), context);
        }
    }

    Syscalls& sys_;
    kernel::IoChannel channel_;
    std::map<RequestId, PendingOp> pending_;
    uint64_t unmatched_ = 0;
};

} // namespace zero::runtime
