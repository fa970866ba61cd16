#include "sandbox/docker_cli_runtime.hpp"

#include <boost/process.hpp>
#include <algorithm>
#include <atomic>
#include <sstream>
#include <system_error>
#include <thread>

#include "core/errors.hpp"
#include "utils/logging.hpp"

namespace sandgrade::sandbox {
namespace bp = boost::process;
namespace {

constexpr std::size_t kReadBufferSize = 4096;

std::string Trim(const std::string& value) {
    const auto begin = value.find_first_not_of(" \t\r\n");
    if (begin == std::string::npos) {
        return {};
    }
    const auto end = value.find_last_not_of(" \t\r\n");
    return value.substr(begin, end - begin + 1);
}

std::string ResolveBinary(const std::string& binary) {
    if (binary.find('/') != std::string::npos) {
        return binary;
    }
    const auto found = bp::search_path(binary);
    return found.empty() ? binary : found.string();
}

std::string FirstLine(const std::string& text) {
    const auto trimmed = Trim(text);
    const auto newline = trimmed.find('\n');
    return newline == std::string::npos ? trimmed : trimmed.substr(0, newline);
}

class DockerContainerWatch : public ContainerWatch {
public:
    DockerContainerWatch(const std::string& docker, const std::string& id,
                         LogChannel& logs, std::chrono::milliseconds inspect_timeout)
        : docker_(docker)
        , id_(id)
        , logs_(logs)
        , inspect_timeout_(inspect_timeout) {
        try {
            logs_child_ = bp::child(
                bp::exe = docker_,
                bp::args = std::vector<std::string>{"logs", "--follow", id_},
                bp::std_in < bp::null,
                bp::std_out > stdout_pipe_,
                bp::std_err > stderr_pipe_);
            wait_child_ = bp::child(
                bp::exe = docker_,
                bp::args = std::vector<std::string>{"wait", id_},
                bp::std_in < bp::null,
                bp::std_out > wait_output_,
                bp::std_err > bp::null);
        } catch (const bp::process_error& ex) {
            logs_.Close();
            Shutdown();
            throw core::RuntimeFault(std::string("docker watch failed: ") + ex.what());
        }
        readers_.emplace_back([this] { ReadStream(stdout_pipe_, LogStream::kStdout); });
        readers_.emplace_back([this] { ReadStream(stderr_pipe_, LogStream::kStderr); });
    }

    ~DockerContainerWatch() override {
        Shutdown();
    }

    std::optional<ContainerExit> WaitFor(std::chrono::milliseconds timeout) override {
        if (exit_) {
            return exit_;
        }
        const auto deadline = std::chrono::steady_clock::now() + timeout;
        std::error_code ec;
        while (wait_child_.running(ec)) {
            const auto now = std::chrono::steady_clock::now();
            if (now >= deadline) {
                return std::nullopt;
            }
            const auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - now);
            std::this_thread::sleep_for(std::min(remaining, std::chrono::milliseconds(20)));
        }
        if (ec) {
            throw core::RuntimeFault("docker wait failed: " + ec.message());
        }
        std::string line;
        std::getline(wait_output_, line);
        if (wait_child_.exit_code() != 0 || Trim(line).empty()) {
            throw core::RuntimeFault("docker wait failed for " + id_);
        }
        ContainerExit exit{};
        try {
            exit.exit_code = std::stoi(Trim(line));
        } catch (const std::exception&) {
            throw core::RuntimeFault("docker wait returned '" + line + "'");
        }
        const auto inspect = CommandRunner::Run(
            docker_,
            {"inspect", "--format", "{{.State.OOMKilled}}", id_},
            inspect_timeout_);
        exit.oom_killed = inspect.exit_code == 0 && Trim(inspect.output) == "true";
        exit_ = exit;
        return exit_;
    }

private:
    void ReadStream(bp::pipe& pipe, LogStream stream) {
        std::string buffer(kReadBufferSize, '\0');
        try {
            while (true) {
                const int count = pipe.read(&buffer[0], static_cast<int>(buffer.size()));
                if (count <= 0) {
                    break;
                }
                if (!logs_.Push(LogChunk{stream, buffer.substr(0, static_cast<std::size_t>(count))})) {
                    break;
                }
            }
        } catch (const bp::process_error& ex) {
            utils::LogWarn("docker", "log stream read failed", {{"id", id_}, {"error", ex.what()}});
        }
        if (open_readers_.fetch_sub(1) == 1) {
            logs_.Close();
        }
    }

    void Shutdown() {
        std::error_code ec;
        if (wait_child_.valid() && wait_child_.running(ec)) {
            wait_child_.terminate(ec);
        }
        if (logs_child_.valid() && logs_child_.running(ec)) {
            logs_child_.terminate(ec);
        }
        // Unblocks readers stuck on a full channel.
        logs_.Close();
        for (auto& reader : readers_) {
            if (reader.joinable()) {
                reader.join();
            }
        }
        readers_.clear();
    }

    std::string docker_;
    std::string id_;
    LogChannel& logs_;
    std::chrono::milliseconds inspect_timeout_;
    bp::pipe stdout_pipe_;
    bp::pipe stderr_pipe_;
    bp::ipstream wait_output_;
    bp::child logs_child_;
    bp::child wait_child_;
    std::vector<std::thread> readers_;
    std::atomic<int> open_readers_{2};
    std::optional<ContainerExit> exit_;
};

}  // namespace

DockerCliRuntime::DockerCliRuntime(std::string docker_binary, std::chrono::milliseconds command_timeout)
    : docker_binary_(ResolveBinary(docker_binary))
    , command_timeout_(command_timeout) {}

CommandResult DockerCliRuntime::Docker(const std::vector<std::string>& args) const {
    utils::LogDebug("docker", "exec", {{"args", args.empty() ? std::string() : args.front()}});
    auto result = CommandRunner::Run(docker_binary_, args, command_timeout_);
    if (!result.launched) {
        throw core::RuntimeFault("cannot launch " + docker_binary_ + ": " + result.error);
    }
    if (result.timed_out) {
        throw core::RuntimeFault("docker " + (args.empty() ? std::string() : args.front()) + " timed out");
    }
    return result;
}

CommandResult DockerCliRuntime::DockerChecked(const std::vector<std::string>& args, const char* what) const {
    auto result = Docker(args);
    if (result.exit_code != 0) {
        throw core::RuntimeFault(std::string(what) + " failed (exit " +
                                 std::to_string(result.exit_code) + "): " + FirstLine(result.error));
    }
    return result;
}

bool DockerCliRuntime::Ping() {
    try {
        const auto result = Docker({"version", "--format", "{{.Server.Version}}"});
        return result.exit_code == 0;
    } catch (const core::RuntimeFault& ex) {
        utils::LogWarn("docker", "daemon unreachable", {{"error", ex.what()}});
        return false;
    }
}

bool DockerCliRuntime::ImageExists(const std::string& image) {
    const auto result = Docker({"image", "inspect", "--format", "{{.Id}}", image});
    if (result.exit_code == 0) {
        return true;
    }
    if (result.error.find("No such image") != std::string::npos ||
        result.error.find("No such object") != std::string::npos) {
        return false;
    }
    throw core::RuntimeFault("docker image inspect failed: " + FirstLine(result.error));
}

std::vector<std::string> DockerCliRuntime::BuildCreateArgs(const ContainerSpec& spec) {
    const auto& policy = spec.policy;
    std::vector<std::string> args = {"create", "--pull", "never"};
    if (!spec.name.empty()) {
        args.insert(args.end(), {"--name", spec.name});
    }
    args.insert(args.end(), {
        "--memory", std::to_string(policy.memory_bytes),
        "--memory-swap", std::to_string(policy.memory_bytes),
        "--cpu-period", std::to_string(policy::ResourcePolicy::kCpuPeriodMicros),
        "--cpu-quota", std::to_string(policy.CpuQuotaMicros()),
        "--pids-limit", std::to_string(policy.pids_limit),
        "--user", policy.user,
        "--cap-drop", "ALL",
        "--security-opt", "no-new-privileges:true",
        "--ipc", "none"
    });
    if (policy.network_disabled) {
        args.insert(args.end(), {"--network", "none"});
    }
    if (policy.read_only_root) {
        args.push_back("--read-only");
    }
    args.insert(args.end(), {
        "--tmpfs",
        spec.scratch_path + ":rw,noexec,nosuid,nodev,size=" + std::to_string(policy.scratch_bytes)
    });
    for (const auto& mount : spec.mounts) {
        std::string value = "type=bind,source=" + mount.host_path + ",target=" + mount.container_path;
        if (mount.read_only) {
            value += ",readonly";
        }
        args.insert(args.end(), {"--mount", value});
    }
    for (const auto& [key, value] : spec.labels) {
        args.insert(args.end(), {"--label", key + "=" + value});
    }
    for (const auto& [key, value] : spec.env) {
        args.insert(args.end(), {"--env", key + "=" + value});
    }
    if (!spec.working_dir.empty()) {
        args.insert(args.end(), {"--workdir", spec.working_dir});
    }
    args.push_back(spec.image);
    args.insert(args.end(), spec.command.begin(), spec.command.end());
    return args;
}

std::string DockerCliRuntime::Create(const ContainerSpec& spec) {
    const auto result = DockerChecked(BuildCreateArgs(spec), "docker create");
    const auto id = Trim(result.output);
    if (id.empty()) {
        throw core::RuntimeFault("docker create returned no container id");
    }
    return id;
}

void DockerCliRuntime::Start(const std::string& id) {
    DockerChecked({"start", id}, "docker start");
}

std::unique_ptr<ContainerWatch> DockerCliRuntime::Watch(const std::string& id, LogChannel& logs) {
    return std::make_unique<DockerContainerWatch>(docker_binary_, id, logs, command_timeout_);
}

void DockerCliRuntime::Kill(const std::string& id) {
    const auto result = Docker({"kill", "--signal", "KILL", id});
    // An already-exited container is not an error here.
    if (result.exit_code != 0 && result.error.find("is not running") == std::string::npos) {
        throw core::RuntimeFault("docker kill failed: " + FirstLine(result.error));
    }
}

bool DockerCliRuntime::Remove(const std::string& id) {
    const auto result = Docker({"rm", "--force", "--volumes", id});
    if (result.exit_code == 0 || result.error.find("No such container") != std::string::npos) {
        return true;
    }
    utils::LogError("docker", "remove failed", {{"id", id}, {"error", FirstLine(result.error)}});
    return false;
}

std::vector<std::string> DockerCliRuntime::ListManaged() {
    const auto result = DockerChecked(
        {"ps", "--all", "--quiet", "--no-trunc", "--filter", std::string("label=") + kManagedLabel + "=true"},
        "docker ps");
    std::vector<std::string> ids;
    std::istringstream stream(result.output);
    std::string line;
    while (std::getline(stream, line)) {
        line = Trim(line);
        if (!line.empty()) {
            ids.push_back(line);
        }
    }
    return ids;
}

}  // namespace sandgrade::sandbox
