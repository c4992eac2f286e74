/**
 * zero_sim
 *
 *   zero_sim run [--config FILE] [--script FILE] [--log-out FILE]
 *   zero_sim verify LOG
 *   zero_sim dump LOG [--limit N]
 */
#include <argparse/argparse.hpp>
#include <fstream>
#include <iostream>
#include <spdlog/spdlog.h>
#include "axiom/commit_log.hpp"
#include "core/config.hpp"
#include "core/logger.hpp"
#include "core/paths.hpp"
#include "kernel/replay.hpp"
#include "kernel/syscall.hpp"
#include "kernel/wire.hpp"
#include "supervisor/script.hpp"
#include "supervisor/supervisor.hpp"

using namespace zero;

namespace {

nlohmann::json commit_to_json(const axiom::Commit& commit) {
    nlohmann::json j;
    j["id"] = commit.commit_id;
    j["type"] = axiom::commit_type_to_string(commit.commit_type);
    j["payload_len"] = commit.payload.size();
    j["pre"] = kernel::to_hex(commit.pre_state_hash.data(), commit.pre_state_hash.size());
    j["post"] = kernel::to_hex(commit.post_state_hash.data(), commit.post_state_hash.size());

    if (commit.commit_type == axiom::CommitType::SYSCALL_REQUEST) {
        try {
            kernel::SyscallRequest request;
            kernel::SyscallEnv env;
            kernel::decode_request(commit.payload, request, env);
            j["pid"] = request.pid;
            j["syscall"] = kernel::syscall_to_string(request.num);
            j["now"] = env.now;
        } catch (const kernel::WireError& e) {
            j["decode_error"] = e.what();
        }
    } else if (commit.commit_type == axiom::CommitType::BOOT) {
        j["config"] = nlohmann::json::parse(commit.payload.begin(), commit.payload.end(), nullptr, false);
    }
    return j;
}

int run_command(const argparse::ArgumentParser& cmd) {
    supervisor::SupervisorConfig config;
    if (auto path = cmd.present("--config")) {
        config = supervisor::SupervisorConfig::load(*path);
    } else if (auto found = core::paths::find_relative("zero.json")) {
        spdlog::info("Using config {}", found->string());
        config = supervisor::SupervisorConfig::load(*found);
    }
    config.apply_env_overrides();

    core::init_logger(config.log_file);
    core::set_log_level(core::parse_log_level(config.log_level));

    nlohmann::json script = supervisor::ScriptRunner::demo_script();
    if (auto path = cmd.present("--script")) {
        script = core::config::load_json_file(*path);
    }

    supervisor::Supervisor sup(config);
    sup.boot();

    supervisor::ScriptRunner runner(sup);
    auto results = runner.run(script);
    std::cout << results.dump(2, ' ', false, nlohmann::json::error_handler_t::replace) << std::endl;

    if (auto path = cmd.present("--log-out")) {
        sup.kernel().log().save(*path);
    }
    return 0;
}

int verify_command(const argparse::ArgumentParser& cmd) {
    core::init_logger();
    core::set_log_level(core::parse_log_level(core::config::get_env_or("ZERO_LOG_LEVEL", "warn")));

    auto path = cmd.get<std::string>("log");
    auto log = axiom::CommitLog::load(path);
    auto result = kernel::replay_and_verify(log);

    nlohmann::json report;
    report["log"] = path;
    report["commits"] = log.size();
    report["commits_applied"] = result.commits_applied;
    report["success"] = result.success;
    report["final_hash"] = kernel::to_hex(result.final_hash.data(), result.final_hash.size());
    if (result.error) {
        report["error"] = {{"commit_id", result.error->commit_id}, {"reason", result.error->reason}};
    }
    std::cout << report.dump(2) << std::endl;
    return result.success ? 0 : 1;
}

int dump_command(const argparse::ArgumentParser& cmd) {
    auto log = axiom::CommitLog::load(cmd.get<std::string>("log"));
    auto limit = cmd.get<size_t>("--limit");

    nlohmann::json commits = nlohmann::json::array();
    for (const auto& commit : log.commits()) {
        if (limit != 0 && commits.size() >= limit) {
            break;
        }
        commits.push_back(commit_to_json(commit));
    }
    std::cout << commits.dump(2, ' ', false, nlohmann::json::error_handler_t::replace) << std::endl;
    return 0;
}

} // namespace

int main(int argc, const char** argv) try {
    core::config::load_dotenv();

    argparse::ArgumentParser parser{"zero_sim"};

    argparse::ArgumentParser run_cmd{"run"};
    run_cmd.add_description("Boot the system and execute a scripted workload");
    run_cmd.add_argument("--config").help("supervisor config JSON (default: first zero.json under cwd or the binary dir)");
    run_cmd.add_argument("--script").help("workload JSON (default: built-in demo)");
    run_cmd.add_argument("--log-out").help("write the commit log here");

    argparse::ArgumentParser verify_cmd{"verify"};
    verify_cmd.add_description("Replay a commit log and check every hash");
    verify_cmd.add_argument("log").help("commit log file");

    argparse::ArgumentParser dump_cmd{"dump"};
    dump_cmd.add_description("Print the commits of a log as JSON");
    dump_cmd.add_argument("log").help("commit log file");
    dump_cmd.add_argument("--limit")
        .help("print at most this many commits (0 = all)")
        .default_value(size_t{0})
        .scan<'u', size_t>();

    parser.add_subparser(run_cmd);
    parser.add_subparser(verify_cmd);
    parser.add_subparser(dump_cmd);

    try {
        parser.parse_args(argc, argv);
    } catch (const std::exception& e) {
        std::cerr << e.what() << std::endl << parser;
        return 2;
    }

    if (parser.is_subcommand_used(run_cmd)) {
        return run_command(run_cmd);
    }
    if (parser.is_subcommand_used(verify_cmd)) {
        return verify_command(verify_cmd);
    }
    if (parser.is_subcommand_used(dump_cmd)) {
        return dump_command(dump_cmd);
    }

    std::cerr << parser;
    return 2;
} catch (const std::exception& e) {
    spdlog::error("{}", e.what());
    return 1;
}
