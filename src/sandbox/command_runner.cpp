#include "sandbox/command_runner.hpp"

#include <algorithm>
#include <boost/process.hpp>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <thread>
#include <signal.h>
#include <sys/wait.h>

#include "utils/common.hpp"

namespace sandgrade::sandbox {
namespace bp = boost::process;
namespace {

constexpr std::chrono::milliseconds kTermGrace{2000};

// Stream capture file removed when it goes out of scope.
class CaptureFile {
public:
    explicit CaptureFile(const char* stream)
        : path_(std::filesystem::temp_directory_path() /
                ("sandgrade_" + std::string(stream) + "_" + utils::RandomHex() + ".log")) {}

    ~CaptureFile() {
        std::error_code ec;
        std::filesystem::remove(path_, ec);
    }

    CaptureFile(const CaptureFile&) = delete;
    CaptureFile& operator=(const CaptureFile&) = delete;

    std::string Path() const { return path_.string(); }

    std::string Read(std::size_t max_bytes) const {
        std::ifstream input(path_, std::ios::binary);
        if (!input.is_open()) {
            return {};
        }
        std::string content;
        std::istreambuf_iterator<char> it(input);
        std::istreambuf_iterator<char> end;
        for (; it != end && content.size() < max_bytes; ++it) {
            content.push_back(*it);
        }
        return content;
    }

private:
    std::filesystem::path path_;
};

// Polls for the child's exit until deadline. Fills status and returns true
// once it has been reaped.
bool ReapBefore(pid_t pid, std::chrono::steady_clock::time_point deadline, int& status) {
    auto pause = std::chrono::milliseconds(2);
    do {
        const auto waited = ::waitpid(pid, &status, WNOHANG);
        if (waited == pid) {
            return true;
        }
        if (waited < 0) {
            return false;
        }
        std::this_thread::sleep_for(pause);
        pause = std::min(pause * 2, std::chrono::milliseconds(25));
    } while (std::chrono::steady_clock::now() < deadline);
    return false;
}

int DecodeStatus(int status) {
    if (WIFEXITED(status)) {
        return WEXITSTATUS(status);
    }
    if (WIFSIGNALED(status)) {
        return 128 + WTERMSIG(status);
    }
    return -1;
}

}  // namespace

CommandResult CommandRunner::Run(const std::string& program,
                                 const std::vector<std::string>& args,
                                 std::chrono::milliseconds timeout) {
    CommandResult result{};
    CaptureFile out("stdout");
    CaptureFile err("stderr");

    try {
        bp::child child(bp::exe = program,
                        bp::args = args,
                        bp::std_in < bp::null,
                        bp::std_out > out.Path(),
                        bp::std_err > err.Path());
        result.launched = true;
        const pid_t pid = child.id();

        int status = 0;
        bool reaped = ReapBefore(pid, std::chrono::steady_clock::now() + timeout, status);
        if (!reaped) {
            result.timed_out = true;
            ::kill(pid, SIGTERM);
            reaped = ReapBefore(pid, std::chrono::steady_clock::now() + kTermGrace, status);
        }
        if (!reaped) {
            ::kill(pid, SIGKILL);
            reaped = ::waitpid(pid, &status, 0) == pid;
        }
        // The child is reaped here; keep boost from waiting on it again.
        child.detach();
        result.exit_code = reaped ? DecodeStatus(status) : -1;
    } catch (const bp::process_error& ex) {
        result.error = std::string("exec failed: ") + ex.what();
        return result;
    }

    result.output = out.Read(kMaxCapturedBytes);
    result.error = err.Read(kMaxCapturedBytes);
    return result;
}

}  // namespace sandgrade::sandbox
