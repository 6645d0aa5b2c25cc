#include "diarclip/subprocess.hpp"

#include <cerrno>
#include <csignal>
#include <cstdlib>
#include <cstring>
#include <ctime>
#include <stdexcept>

#include <fcntl.h>
#include <poll.h>
#include <pthread.h>
#include <signal.h>
#include <sys/stat.h>
#include <sys/wait.h>
#include <unistd.h>

namespace diarclip {

namespace {

void close_fd(int &fd) {
    if (fd >= 0) {
        close(fd);
        fd = -1;
    }
}

// Blocks SIGPIPE on the calling thread while a pipe write is in flight, so
// a child that exits without reading stdin yields EPIPE instead of killing
// the process. The process-wide disposition is left alone.
class SigpipeBlock {
  public:
    SigpipeBlock() {
        sigemptyset(&set_);
        sigaddset(&set_, SIGPIPE);
        sigset_t pending;
        sigemptyset(&pending);
        sigpending(&pending);
        was_pending_ = sigismember(&pending, SIGPIPE) == 1;
        pthread_sigmask(SIG_BLOCK, &set_, &old_);
    }
    ~SigpipeBlock() { pthread_sigmask(SIG_SETMASK, &old_, nullptr); }

    SigpipeBlock(const SigpipeBlock &) = delete;
    SigpipeBlock &operator=(const SigpipeBlock &) = delete;

    // Drop the SIGPIPE our own write raised; one that was already pending
    // belongs to someone else and stays queued.
    void consume() {
        int saved = errno;
        if (!was_pending_) {
            timespec zero{0, 0};
            while (sigtimedwait(&set_, nullptr, &zero) == -1 && errno == EINTR) {
            }
        }
        errno = saved;
    }

  private:
    sigset_t set_;
    sigset_t old_;
    bool was_pending_ = false;
};

struct Pipe {
    int fds[2] = {-1, -1};

    void open(int flags) {
        if (pipe2(fds, flags) == -1) {
            throw std::runtime_error(std::string("pipe() failed: ") +
                                     std::strerror(errno));
        }
    }
    int &read_end() { return fds[0]; }
    int &write_end() { return fds[1]; }

    ~Pipe() {
        close_fd(fds[0]);
        close_fd(fds[1]);
    }
};

bool is_executable_file(const std::string &path) {
    struct stat st{};
    return stat(path.c_str(), &st) == 0 && S_ISREG(st.st_mode) &&
           access(path.c_str(), X_OK) == 0;
}

} // namespace

std::string find_executable(const std::string &name) {
    if (name.empty())
        return "";
    if (name.find('/') != std::string::npos)
        return is_executable_file(name) ? name : "";

    const char *path_env = std::getenv("PATH");
    std::string path = path_env ? path_env : "/usr/local/bin:/usr/bin:/bin";

    size_t start = 0;
    while (start <= path.size()) {
        size_t end = path.find(':', start);
        if (end == std::string::npos)
            end = path.size();
        std::string dir = path.substr(start, end - start);
        if (dir.empty())
            dir = ".";
        std::string candidate = dir + "/" + name;
        if (is_executable_file(candidate))
            return candidate;
        start = end + 1;
    }
    return "";
}

ProcessResult run_process(const std::vector<std::string> &argv,
                          const std::vector<uint8_t> &input) {
    if (argv.empty()) {
        throw std::runtime_error("run_process: empty command");
    }

    Pipe in_pipe, out_pipe, err_pipe, exec_pipe;
    in_pipe.open(O_CLOEXEC);
    out_pipe.open(O_CLOEXEC);
    err_pipe.open(O_CLOEXEC);
    exec_pipe.open(O_CLOEXEC); // closes on successful exec

    std::vector<char *> cargv;
    cargv.reserve(argv.size() + 1);
    for (const auto &arg : argv)
        cargv.push_back(const_cast<char *>(arg.c_str()));
    cargv.push_back(nullptr);

    pid_t pid = fork();
    if (pid == -1) {
        throw std::runtime_error(std::string("fork() failed: ") +
                                 std::strerror(errno));
    }

    if (pid == 0) {
        // Child: only async-signal-safe calls from here on
        dup2(in_pipe.read_end(), STDIN_FILENO);
        dup2(out_pipe.write_end(), STDOUT_FILENO);
        dup2(err_pipe.write_end(), STDERR_FILENO);
        execvp(cargv[0], cargv.data());
        int err = errno;
        ssize_t ignored = write(exec_pipe.write_end(), &err, sizeof(err));
        (void)ignored;
        _exit(127);
    }

    // Parent
    close_fd(in_pipe.read_end());
    close_fd(out_pipe.write_end());
    close_fd(err_pipe.write_end());
    close_fd(exec_pipe.write_end());

    int exec_errno = 0;
    ssize_t n_exec;
    do {
        n_exec = read(exec_pipe.read_end(), &exec_errno, sizeof(exec_errno));
    } while (n_exec == -1 && errno == EINTR);
    if (n_exec == static_cast<ssize_t>(sizeof(exec_errno))) {
        int status;
        waitpid(pid, &status, 0);
        throw std::runtime_error("Cannot execute '" + argv[0] +
                                 "': " + std::strerror(exec_errno));
    }

    fcntl(in_pipe.write_end(), F_SETFL, O_NONBLOCK);
    if (input.empty())
        close_fd(in_pipe.write_end());

    ProcessResult result;
    size_t written = 0;
    char buffer[65536];

    while (in_pipe.write_end() >= 0 || out_pipe.read_end() >= 0 ||
           err_pipe.read_end() >= 0) {
        pollfd fds[3];
        nfds_t nfds = 0;
        int in_idx = -1, out_idx = -1, err_idx = -1;
        if (in_pipe.write_end() >= 0) {
            in_idx = static_cast<int>(nfds);
            fds[nfds++] = {in_pipe.write_end(), POLLOUT, 0};
        }
        if (out_pipe.read_end() >= 0) {
            out_idx = static_cast<int>(nfds);
            fds[nfds++] = {out_pipe.read_end(), POLLIN, 0};
        }
        if (err_pipe.read_end() >= 0) {
            err_idx = static_cast<int>(nfds);
            fds[nfds++] = {err_pipe.read_end(), POLLIN, 0};
        }

        if (poll(fds, nfds, -1) == -1) {
            if (errno == EINTR)
                continue;
            kill(pid, SIGKILL);
            int status;
            waitpid(pid, &status, 0);
            throw std::runtime_error(std::string("poll() failed: ") +
                                     std::strerror(errno));
        }

        if (in_idx >= 0 && fds[in_idx].revents) {
            if (fds[in_idx].revents & (POLLERR | POLLHUP)) {
                close_fd(in_pipe.write_end());
            } else {
                ssize_t n;
                {
                    SigpipeBlock block;
                    n = write(in_pipe.write_end(), input.data() + written,
                              input.size() - written);
                    if (n == -1 && errno == EPIPE)
                        block.consume();
                }
                if (n > 0) {
                    written += static_cast<size_t>(n);
                    if (written == input.size())
                        close_fd(in_pipe.write_end());
                } else if (n == -1 && errno != EAGAIN && errno != EINTR) {
                    // EPIPE: the child stopped reading; keep its output
                    close_fd(in_pipe.write_end());
                }
            }
        }

        if (out_idx >= 0 && fds[out_idx].revents) {
            ssize_t n = read(out_pipe.read_end(), buffer, sizeof(buffer));
            if (n > 0) {
                result.out.insert(result.out.end(), buffer, buffer + n);
            } else if (n == 0 || errno != EINTR) {
                close_fd(out_pipe.read_end());
            }
        }

        if (err_idx >= 0 && fds[err_idx].revents) {
            ssize_t n = read(err_pipe.read_end(), buffer, sizeof(buffer));
            if (n > 0) {
                result.err.append(buffer, static_cast<size_t>(n));
            } else if (n == 0 || errno != EINTR) {
                close_fd(err_pipe.read_end());
            }
        }
    }

    int status = 0;
    while (waitpid(pid, &status, 0) == -1) {
        if (errno != EINTR) {
            throw std::runtime_error(std::string("waitpid() failed: ") +
                                     std::strerror(errno));
        }
    }
    if (WIFEXITED(status)) {
        result.exit_code = WEXITSTATUS(status);
    } else if (WIFSIGNALED(status)) {
        result.exit_code = 128 + WTERMSIG(status);
    }
    return result;
}

} // namespace diarclip
