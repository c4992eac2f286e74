#include "kernel/kernel.hpp"
#include "kernel/state_hasher.hpp"
#include "kernel/syscall_handlers.hpp"
#include "kernel/wire.hpp"
#include <algorithm>
#include <iterator>
#include <spdlog/spdlog.h>

namespace zero::kernel {

Kernel::Kernel(const KernelConfig& config, std::shared_ptr<Hal> hal)
    : hal_(std::move(hal))
    , context_(config, log_, hal_.get()) {
    config.validate();
    modules_.push_back(std::make_unique<IpcSyscalls>(context_));
    modules_.push_back(std::make_unique<CapabilitySyscalls>(context_));
    modules_.push_back(std::make_unique<ProcessSyscalls>(context_));
    modules_.push_back(std::make_unique<SystemSyscalls>(context_));
    modules_.push_back(std::make_unique<StorageSyscalls>(context_));
    for (auto& module : modules_) {
        size_t before = router_.handler_count();
        module->register_syscalls(router_);
        spdlog::debug("Syscall module '{}': {} handlers", module->name(), router_.handler_count() - before);
    }

    // The Boot commit carries the config so replay can rebuild an identical kernel
    auto empty = context_.hash();
    log_.append(axiom::CommitType::BOOT, to_bytes(config.to_json().dump()), empty, empty);

    spdlog::info("Kernel booted{} ({} syscalls, endpoint capacity {}, {} caps per space)",
                 replaying() ? " for replay" : "", router_.handler_count(),
                 config.endpoint_capacity, config.max_caps_per_space);
}

Kernel::~Kernel() = default;

uint64_t Kernel::read_clock() {
    return hal_ ? hal_->now_nanos() : 0;
}

void Kernel::begin_step(uint64_t now) {
    context_.env = SyscallEnv{now, {}};
    last_now_ = std::max(last_now_, now);
}

SyscallResult Kernel::dispatch(const SyscallRequest& request) {
    SyscallEnv env;
    env.now = read_clock();

    if (request.num == SyscallNum::SYS_RANDOM && hal_) {
        size_t wanted = std::min<size_t>(static_cast<size_t>(request.args[0]), MAX_RANDOM_BYTES);
        env.entropy.resize(wanted);
        if (wanted > 0 && !hal_->fill_random(env.entropy.data(), wanted)) {
            spdlog::error("HAL entropy source failed for PID {}", request.pid);
            env.entropy.clear();
        }
    }

    return execute(request, env);
}

SyscallResult Kernel::execute(const SyscallRequest& request, const SyscallEnv& env) {
    auto pre = context_.hash();
    uint64_t request_id = log_.append(axiom::CommitType::SYSCALL_REQUEST,
                                      encode_request(request, env), pre, pre);

    begin_step(env.now);
    context_.env = env;
    context_.in_syscall = true;

    SyscallResult result;
    Process* proc = context_.state.find_live_process(request.pid);
    if (!proc) {
        result = SyscallResult::err(KernelError::PROCESS_NOT_FOUND);
    } else if (proc->state == ProcessState::BLOCKED) {
        result = SyscallResult::err(KernelError::WOULD_BLOCK);
    } else {
        proc->metrics.syscall_count++;
        proc->metrics.last_active_ns = env.now;
        result = router_.handle(request);
    }

    context_.in_syscall = false;

    auto post = context_.hash();
    log_.set_post_hash(request_id, post);
    log_.append(axiom::CommitType::SYSCALL_RESPONSE, result.encode(), post, post);

    spdlog::trace("PID {} {} -> {}", request.pid, syscall_to_string(request.num), result.describe());
    return result;
}

ProcessId Kernel::spawn_process(const std::string& name, ProcessId parent) {
    return spawn_at(name, parent, read_clock());
}

ProcessId Kernel::spawn_at(const std::string& name, ProcessId parent, uint64_t now) {
    begin_step(now);
    auto pre = context_.hash();
    ProcessId pid = context_.create_process(name, parent);

    ByteWriter w;
    w.u64(pid);
    w.u64(parent);
    w.str(name);
    w.u64(now);
    log_.append(axiom::CommitType::PROCESS_CREATED, w.take(), pre, context_.hash());
    return pid;
}

bool Kernel::post_message(ProcessId pid, uint32_t tag, const Bytes& data) {
    return post_at(pid, tag, data, read_clock());
}

bool Kernel::post_at(ProcessId pid, uint32_t tag, const Bytes& data, uint64_t now) {
    if (data.size() > MAX_MESSAGE_SIZE) {
        spdlog::warn("Kernel message 0x{:x} for PID {} too large ({} bytes)", tag, pid, data.size());
        return false;
    }

    begin_step(now);
    auto pre = context_.hash();
    if (!context_.post_to_inbox(pid, tag, data)) {
        return false;
    }

    ByteWriter w;
    w.u64(pid);
    w.u64(KERNEL_PID);
    w.u32(tag);
    w.bytes(data);
    w.u64(now);
    log_.append(axiom::CommitType::MESSAGE_DELIVERED, w.take(), pre, context_.hash());
    return true;
}

bool Kernel::deliver_io_result(ProcessId pid, IoChannel channel, const IoResult& result) {
    uint32_t tag = channel == IoChannel::STORAGE ? MSG_STORAGE_RESULT : MSG_KEYSTORE_RESULT;
    if (!context_.state.find_live_process(pid) || !post_message(pid, tag, result.encode())) {
        context_.dropped_io_results++;
        spdlog::debug("Dropped {} for dead PID {} (request {})",
                      io_result_type_to_string(result.type), pid, result.request_id);
        return false;
    }
    return true;
}

bool Kernel::fault_process(ProcessId pid, const std::string& reason) {
    return fault_at(pid, reason, read_clock());
}

bool Kernel::fault_at(ProcessId pid, const std::string& reason, uint64_t now) {
    if (!context_.state.find_live_process(pid)) {
        return false;
    }

    begin_step(now);
    auto pre = context_.hash();
    spdlog::error("Process {} faulted: {}", pid, reason);
    context_.terminate_process(pid, EXIT_FAULTED);

    ByteWriter w;
    w.u64(pid);
    w.str(reason);
    w.u64(now);
    log_.append(axiom::CommitType::PROCESS_FAULTED, w.take(), pre, context_.hash());
    return true;
}

bool Kernel::wake(ProcessId pid) {
    return wake_at(pid, read_clock());
}

bool Kernel::wake_at(ProcessId pid, uint64_t now) {
    const Process* proc = context_.state.find_live_process(pid);
    if (!proc || proc->state != ProcessState::BLOCKED) {
        return false;
    }

    begin_step(now);
    auto pre = context_.hash();
    if (!context_.interrupt_receive(pid)) {
        spdlog::debug("PID {} is parked on a send and stays blocked", pid);
        return false;
    }

    ByteWriter w;
    w.u64(pid);
    w.u64(now);
    log_.append(axiom::CommitType::PROCESS_WOKEN, w.take(), pre, context_.hash());
    return true;
}

bool Kernel::reap(ProcessId pid) {
    return reap_at(pid, read_clock());
}

bool Kernel::reap_at(ProcessId pid, uint64_t now) {
    const Process* proc = context_.state.find_process(pid);
    if (!proc || proc->state != ProcessState::ZOMBIE) {
        return false;
    }

    begin_step(now);
    auto pre = context_.hash();
    context_.state.processes.erase(pid);
    context_.state.cap_spaces.erase(pid);

    ByteWriter w;
    w.u64(pid);
    w.u64(now);
    log_.append(axiom::CommitType::PROCESS_REAPED, w.take(), pre, context_.hash());

    spdlog::debug("Reaped PID {}", pid);
    return true;
}

void Kernel::tick() {
    tick_at(read_clock());
}

void Kernel::tick_at(uint64_t now) {
    begin_step(now);
    auto pre = context_.hash();
    context_.state.last_tick_ns = now;

    ByteWriter w;
    w.u64(now);
    log_.append(axiom::CommitType::TICK, w.take(), pre, context_.hash());
}

std::vector<IoRequest> Kernel::take_pending_io() {
    std::vector<IoRequest> requests(std::make_move_iterator(context_.pending_io.begin()),
                                    std::make_move_iterator(context_.pending_io.end()));
    context_.pending_io.clear();
    return requests;
}

metrics::SystemMetrics Kernel::metrics() const {
    auto m = metrics::collect_system(context_.state);
    m.dropped_io_results = context_.dropped_io_results;
    m.pending_io = context_.pending_io.size();
    m.capability_checks = context_.gate.check_count();
    m.commit_count = log_.size();
    m.uptime_ns = last_now_;
    return m;
}

nlohmann::json Kernel::process_table() const {
    nlohmann::json table = nlohmann::json::array();
    for (const auto& snapshot : metrics::collect_processes(context_.state)) {
        table.push_back(snapshot.to_json());
    }
    return table;
}

nlohmann::json Kernel::endpoint_detail(EndpointId id) const {
    const Endpoint* ep = context_.state.find_endpoint(id);
    if (!ep) {
        return nlohmann::json();
    }
    return metrics::collect_endpoint(*ep).to_json();
}

} // namespace zero::kernel
