#include "core/BlameRunner.hpp"

#include <cerrno>
#include <cstring>
#include <utility>

#include <fcntl.h>
#include <poll.h>
#include <sys/wait.h>
#include <unistd.h>

#include "util/Logger.hpp"
#include "util/Utf8.hpp"

namespace fs = std::filesystem;

namespace blamer {

namespace {

/// Owns a file descriptor and closes it on scope exit
class UniqueFd {
public:
    UniqueFd() = default;
    explicit UniqueFd(int fd) : fd_(fd) {}
    ~UniqueFd() { reset(); }

    UniqueFd(const UniqueFd&) = delete;
    UniqueFd& operator=(const UniqueFd&) = delete;

    UniqueFd(UniqueFd&& other) noexcept : fd_(other.fd_) { other.fd_ = -1; }
    UniqueFd& operator=(UniqueFd&& other) noexcept {
        if (this != &other) {
            reset();
            fd_ = other.fd_;
            other.fd_ = -1;
        }
        return *this;
    }

    int get() const { return fd_; }
    void reset() {
        if (fd_ >= 0) ::close(fd_);
        fd_ = -1;
    }

private:
    int fd_{-1};
};

struct Pipe {
    UniqueFd read;
    UniqueFd write;
};

std::string errnoText(const std::string& what, int err) {
    return what + ": " + std::strerror(err);
}

Expected<void> openPipe(Pipe& p, bool closeOnExec) {
    int fds[2];
    if (::pipe(fds) != 0) {
        return Error{ErrorCode::InternalError, errnoText("pipe failed", errno)};
    }
    p.read = UniqueFd(fds[0]);
    p.write = UniqueFd(fds[1]);
    if (closeOnExec) {
        if (::fcntl(fds[0], F_SETFD, FD_CLOEXEC) == -1 ||
            ::fcntl(fds[1], F_SETFD, FD_CLOEXEC) == -1) {
            return Error{ErrorCode::InternalError, errnoText("fcntl failed", errno)};
        }
    }
    return {};
}

std::string trimTrailing(std::string s) {
    while (!s.empty() && (s.back() == '\n' || s.back() == '\r' || s.back() == ' ')) {
        s.pop_back();
    }
    return s;
}

std::string joinArgs(const std::vector<std::string>& args) {
    std::string out;
    for (const auto& a : args) {
        if (!out.empty()) out += ' ';
        out += a;
    }
    return out;
}

}

BlameRunner::BlameRunner(std::string gitExecutable) : git(std::move(gitExecutable)) {}

std::vector<std::string> BlameRunner::buildArgs(const fs::path& file) const {
    fs::path absolute = fs::absolute(file);
    return {
        git,
        "-C", absolute.parent_path().string(),
        "blame", "--line-porcelain",
        "--", absolute.filename().string()
    };
}

Expected<std::string> BlameRunner::run(const fs::path& file) const {
    std::error_code ec;
    if (!fs::is_regular_file(file, ec)) {
        return Error{ErrorCode::InvalidArgs, "invalid file path: " + file.string()};
    }

    auto args = buildArgs(file);
    Logger::instance().debug("Running: " + joinArgs(args));

    auto res = execute(args);
    if (!res) return res.error();

    const ProcessOutput& output = res.value();
    if (output.exitCode != 0) {
        std::string msg = trimTrailing(output.err);
        if (msg.empty()) {
            msg = git + " blame exited with status " + std::to_string(output.exitCode);
        }
        return Error{ErrorCode::SubprocessFailed, msg};
    }
    return Utf8::sanitize(output.out);
}

Expected<BlameRunner::ProcessOutput> BlameRunner::execute(const std::vector<std::string>& args) {
    if (args.empty()) {
        return Error{ErrorCode::InvalidArgs, "no program to execute"};
    }

    Pipe outPipe, errPipe, execPipe;
    for (auto* p : {&outPipe, &errPipe}) {
        auto r = openPipe(*p, false);
        if (!r) return r.error();
    }
    // Written by the child only if exec fails; closed by a successful exec
    auto r = openPipe(execPipe, true);
    if (!r) return r.error();

    std::vector<char*> argv;
    argv.reserve(args.size() + 1);
    for (const auto& a : args) argv.push_back(const_cast<char*>(a.c_str()));
    argv.push_back(nullptr);

    pid_t pid = ::fork();
    if (pid < 0) {
        return Error{ErrorCode::InternalError, errnoText("fork failed", errno)};
    }

    if (pid == 0) {
        // Child: only async-signal-safe calls from here on
        ::dup2(outPipe.write.get(), STDOUT_FILENO);
        ::dup2(errPipe.write.get(), STDERR_FILENO);
        ::close(outPipe.read.get());
        ::close(errPipe.read.get());
        ::close(outPipe.write.get());
        ::close(errPipe.write.get());
        ::close(execPipe.read.get());
        ::execvp(argv[0], argv.data());
        int err = errno;
        ssize_t ignored = ::write(execPipe.write.get(), &err, sizeof(err));
        (void)ignored;
        ::_exit(127);
    }

    outPipe.write.reset();
    errPipe.write.reset();
    execPipe.write.reset();

    int execErr = 0;
    ssize_t n;
    do {
        n = ::read(execPipe.read.get(), &execErr, sizeof(execErr));
    } while (n < 0 && errno == EINTR);

    ProcessOutput output;
    bool execFailed = (n == static_cast<ssize_t>(sizeof(execErr)));

    Expected<void> readStatus;
    if (!execFailed) {
        struct pollfd fds[2];
        fds[0] = {outPipe.read.get(), POLLIN, 0};
        fds[1] = {errPipe.read.get(), POLLIN, 0};
        std::string* sinks[2] = {&output.out, &output.err};
        int openStreams = 2;
        char buffer[4096];

        while (openStreams > 0) {
            int ret = ::poll(fds, 2, -1);
            if (ret < 0) {
                if (errno == EINTR) continue;
                readStatus = Error{ErrorCode::IoError, errnoText("poll failed", errno)};
                break;
            }
            for (int i = 0; i < 2; ++i) {
                if (fds[i].fd < 0 || fds[i].revents == 0) continue;
                ssize_t got = ::read(fds[i].fd, buffer, sizeof(buffer));
                if (got > 0) {
                    sinks[i]->append(buffer, static_cast<size_t>(got));
                } else if (got == 0 || errno != EINTR) {
                    // EOF or hard error: stop watching this stream
                    fds[i].fd = -1;
                    --openStreams;
                }
            }
        }
    }

    // Unblock the child if we stopped reading early
    outPipe.read.reset();
    errPipe.read.reset();

    int status = 0;
    pid_t waited;
    do {
        waited = ::waitpid(pid, &status, 0);
    } while (waited < 0 && errno == EINTR);
    if (waited < 0) {
        return Error{ErrorCode::InternalError, errnoText("waitpid failed", errno)};
    }

    if (execFailed) {
        return Error{ErrorCode::SubprocessFailed, errnoText("failed to run '" + args[0] + "'", execErr)};
    }
    if (!readStatus) return readStatus.error();

    if (WIFEXITED(status)) {
        output.exitCode = WEXITSTATUS(status);
    } else if (WIFSIGNALED(status)) {
        output.exitCode = 128 + WTERMSIG(status);
    }
    return output;
}

}
