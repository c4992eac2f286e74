#include "supervisor/supervisor.hpp"
#include "services/identity_service.hpp"
#include "services/keystore_service.hpp"
#include "services/vfs_service.hpp"
#include <spdlog/spdlog.h>
#include <stdexcept>

namespace zero::supervisor {

std::unique_ptr<runtime::Service> make_builtin_service(kernel::Kernel& kernel, ProcessId pid,
                                                       const std::string& name,
                                                       const SupervisorConfig& config) {
    if (name == "vfs") {
        return std::make_unique<services::VfsService>(kernel, pid);
    }
    if (name == "identity") {
        return std::make_unique<services::IdentityService>(kernel, pid);
    }
    if (name == "keystore") {
        return std::make_unique<services::KeystoreService>(kernel, pid, config.keystore_max_pending);
    }
    return nullptr;
}

Supervisor::Supervisor(const SupervisorConfig& config, std::shared_ptr<kernel::Hal> hal,
                       ProgramFactory factory)
    : config_(config)
    , hal_(std::move(hal))
    , factory_(std::move(factory)) {
    if (!hal_) {
        throw std::invalid_argument("supervisor needs a HAL");
    }
    kernel_ = std::make_unique<kernel::Kernel>(config_.kernel, hal_);
    storage_.seed(config_.storage_seed);
    keystore_.seed(config_.keystore_seed);
}

void Supervisor::boot() {
    if (booted_) {
        return;
    }
    booted_ = true;

    ProcessId init_pid = kernel_->spawn_process("init");
    if (init_pid != kernel::INIT_PID) {
        throw std::runtime_error("init did not get PID 1");
    }
    init_ = std::make_unique<services::InitService>(*kernel_, init_pid);
    init_->set_spawn_hook([this](ProcessId pid, const std::string& name) { attach(pid, name); });
    names_["init"] = init_pid;

    for (const auto& name : config_.services) {
        if (!spawn(name)) {
            spdlog::error("Boot: could not spawn '{}'", name);
            continue;
        }
        run_until_idle();
    }

    spdlog::info("Boot complete: {} services registered", init_->registry().size());
}

std::optional<ProcessId> Supervisor::spawn(const std::string& name) {
    if (!init_) {
        throw std::logic_error("spawn before boot");
    }
    if (!wake(init_->pid())) {
        spdlog::error("init cannot run to spawn '{}'", name);
        return std::nullopt;
    }
    return init_->spawn(name);
}

kernel::SyscallResult Supervisor::kill(ProcessId pid) {
    if (!init_) {
        throw std::logic_error("kill before boot");
    }
    auto slot = init_->process_slot(pid);
    if (!slot) {
        return kernel::SyscallResult::err(kernel::KernelError::INVALID_CAPABILITY);
    }
    if (!wake(init_->pid())) {
        return kernel::SyscallResult::err(kernel::KernelError::WOULD_BLOCK);
    }
    return init_->sys().kill(*slot);
}

bool Supervisor::wake(ProcessId pid) {
    const auto* proc = kernel_->state().find_live_process(pid);
    if (!proc) {
        return false;
    }
    return proc->state != kernel::ProcessState::BLOCKED || kernel_->wake(pid);
}

void Supervisor::attach(ProcessId pid, const std::string& name) {
    names_[name] = pid;
    auto program = factory_ ? factory_(*kernel_, pid, name, config_) : nullptr;
    if (!program) {
        spdlog::debug("PID {} '{}' has no program", pid, name);
        return;
    }
    programs_[pid] = std::move(program);
    starting_.push_back(pid);
}

size_t Supervisor::start_programs() {
    auto pending = std::move(starting_);
    starting_.clear();
    for (auto pid : pending) {
        auto it = programs_.find(pid);
        if (it != programs_.end()) {
            spdlog::info("Starting '{}' (PID {})", it->second->name(), pid);
            it->second->on_start();
        }
    }
    return pending.size();
}

size_t Supervisor::step_services(RoundStats& stats) {
    std::vector<std::pair<ProcessId, runtime::Service*>> order;
    if (init_) {
        order.emplace_back(init_->pid(), init_.get());
    }
    for (auto& [pid, program] : programs_) {
        order.emplace_back(pid, program.get());
    }

    size_t handled = 0;
    for (auto& [pid, service] : order) {
        for (size_t i = 0; i < config_.max_messages_per_step; ++i) {
            const auto* proc = kernel_->state().find_process(pid);
            if (!proc || proc->state != kernel::ProcessState::RUNNING) {
                break;
            }
            try {
                if (!service->step()) {
                    break;
                }
                handled++;
            } catch (const std::exception& e) {
                kernel_->fault_process(pid, e.what());
                stats.faulted++;
                break;
            }
        }
    }
    return handled;
}

size_t Supervisor::complete_io() {
    auto requests = kernel_->take_pending_io();
    if (io_paused_) {
        held_io_.insert(held_io_.end(), requests.begin(), requests.end());
        return 0;
    }
    if (!held_io_.empty()) {
        requests.insert(requests.begin(), held_io_.begin(), held_io_.end());
        held_io_.clear();
    }

    for (const auto& request : requests) {
        auto& backend = request.channel == kernel::IoChannel::STORAGE ? storage_ : keystore_;
        auto result = backend.execute(request);
        spdlog::trace("I/O {} '{}' for PID {} -> {}", kernel::io_op_to_string(request.op), request.key,
                      request.pid, kernel::io_result_type_to_string(result.type));
        kernel_->deliver_io_result(request.pid, request.channel, result);
    }
    return requests.size();
}

size_t Supervisor::expire_pending() {
    uint64_t now = hal_->now_nanos();
    size_t expired = 0;
    for (auto& [pid, program] : programs_) {
        if (kernel_->state().find_live_process(pid) == nullptr) {
            continue;
        }
        if (!program->has_expired(now, config_.pending_timeout_ns())) {
            continue;
        }
        if (!wake(pid)) {
            spdlog::warn("'{}' (PID {}) cannot run to expire its requests", program->name(), pid);
            continue;
        }
        expired += program->expire_pending(now, config_.pending_timeout_ns());
    }
    return expired;
}

size_t Supervisor::reap_zombies() {
    std::vector<ProcessId> zombies;
    for (const auto& [pid, proc] : kernel_->state().processes) {
        if (proc.state == kernel::ProcessState::ZOMBIE && pid != kernel::INIT_PID) {
            zombies.push_back(pid);
        }
    }

    for (auto pid : zombies) {
        auto it = programs_.find(pid);
        if (it != programs_.end()) {
            spdlog::info("'{}' (PID {}) exited", it->second->name(), pid);
            programs_.erase(it);
        }
        kernel_->reap(pid);
    }
    return zombies.size();
}

RoundStats Supervisor::run_round() {
    RoundStats stats;
    stats.started = start_programs();
    stats.messages = step_services(stats);
    stats.io_completed = complete_io();
    stats.expired = expire_pending();
    stats.reaped = reap_zombies();
    if (stats.progressed()) {
        kernel_->tick();
    }
    return stats;
}

size_t Supervisor::run_until_idle(size_t max_rounds) {
    size_t rounds = 0;
    while (rounds < max_rounds) {
        ++rounds;
        if (!run_round().progressed()) {
            break;
        }
    }
    if (rounds == max_rounds) {
        spdlog::warn("Supervisor still busy after {} rounds", max_rounds);
    }
    return rounds;
}

runtime::Service* Supervisor::program(ProcessId pid) {
    if (init_ && pid == init_->pid()) {
        return init_.get();
    }
    auto it = programs_.find(pid);
    return it == programs_.end() ? nullptr : it->second.get();
}

std::optional<ProcessId> Supervisor::pid_of(const std::string& name) const {
    auto it = names_.find(name);
    if (it == names_.end()) {
        return std::nullopt;
    }
    return it->second;
}

nlohmann::json Supervisor::status() const {
    nlohmann::json j;
    j["metrics"] = kernel_->metrics().to_json();
    j["processes"] = kernel_->process_table();
    j["services"] = init_ ? init_->registry().to_json() : nlohmann::json::array();
    j["storage_keys"] = storage_.size();
    j["keystore_keys"] = keystore_.size();
    j["held_io"] = held_io_.size();
    return j;
}

} // namespace zero::supervisor
