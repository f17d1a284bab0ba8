#include "codeloop/proc.h"

#include <algorithm>
#include <cctype>
#include <cerrno>
#include <chrono>
#include <cstdlib>
#include <cstring>
#include <mutex>

#include <unistd.h>
#include <fcntl.h>
#include <signal.h>
#include <poll.h>
#include <sys/stat.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <sys/resource.h>
#ifdef __linux__
  #include <sys/prctl.h>
#endif

extern char** environ;

namespace codeloop {

std::vector<std::string> split_argv_quoted(const std::string& cmd) {
    std::vector<std::string> out;
    std::string cur;
    bool have_token = false;
    enum { NORM, SQ, DQ } st = NORM;
    bool esc = false;

    auto flush = [&]() {
        if (have_token) {
            out.push_back(cur);
            cur.clear();
            have_token = false;
        }
    };

    for (char c : cmd) {
        if (st == NORM) {
            if (c == ' ' || c == '\t' || c == '\n' || c == '\r') {
                flush();
                continue;
            }
            have_token = true;
            if (c == '\'') { st = SQ; continue; }
            if (c == '"') { st = DQ; esc = false; continue; }
            cur.push_back(c);
        } else if (st == SQ) {
            if (c == '\'') { st = NORM; continue; }
            cur.push_back(c);
        } else { // DQ
            if (esc) {
                cur.push_back(c);
                esc = false;
                continue;
            }
            if (c == '\\') { esc = true; continue; }
            if (c == '"') { st = NORM; continue; }
            cur.push_back(c);
        }
    }
    if (st != NORM) return {};
    flush();
    return out;
}

std::filesystem::path self_exe_dir(const char* argv0) {
    std::error_code ec;
    auto exe = std::filesystem::read_symlink("/proc/self/exe", ec);
    if (!ec && !exe.empty()) return exe.parent_path();

    std::filesystem::path p = argv0 ? std::filesystem::path(argv0) : std::filesystem::path();
    if (p.empty() || !p.has_parent_path()) return std::filesystem::current_path();
    auto abs = std::filesystem::weakly_canonical(std::filesystem::absolute(p, ec), ec);
    if (ec) return p.parent_path();
    return abs.parent_path();
}

bool executable_on_path(const std::string& exe) {
    if (exe.empty()) return false;
    if (exe.find('/') != std::string::npos) {
        return ::access(exe.c_str(), X_OK) == 0;
    }
    const char* path = std::getenv("PATH");
    if (!path) return false;
    std::string p = path;
    size_t start = 0;
    while (start <= p.size()) {
        size_t end = p.find(':', start);
        if (end == std::string::npos) end = p.size();
        std::string dir = p.substr(start, end - start);
        if (dir.empty()) dir = ".";
        std::string cand = dir + "/" + exe;
        struct stat sb;
        if (::stat(cand.c_str(), &sb) == 0 && S_ISREG(sb.st_mode) && ::access(cand.c_str(), X_OK) == 0) {
            return true;
        }
        start = end + 1;
    }
    return false;
}

namespace {

bool env_true(const char* key) {
    const char* v = std::getenv(key);
    if (!v) return false;
    std::string s = v;
    for (auto& c : s) c = (char)std::tolower((unsigned char)c);
    return (s == "1" || s == "true" || s == "yes" || s == "on");
}

void set_rlimit(int resource, rlim_t v) {
    struct rlimit rl;
    rl.rlim_cur = v;
    rl.rlim_max = v;
    (void)setrlimit(resource, &rl);
}

// A child that exits before reading all of stdin must not take the parent
// down with SIGPIPE; writes fail with EPIPE instead.
void ignore_sigpipe_once() {
    static std::once_flag once;
    std::call_once(once, [] { (void)signal(SIGPIPE, SIG_IGN); });
}

void set_nonblocking(int fd) {
    int flags = fcntl(fd, F_GETFL, 0);
    if (flags >= 0) (void)fcntl(fd, F_SETFL, flags | O_NONBLOCK);
}

struct StreamSink {
    std::string* dst;
    size_t cap;
    bool* truncated;

    void append(const char* buf, ssize_t n) {
        size_t can = cap > dst->size() ? (cap - dst->size()) : 0;
        size_t take = (size_t)n;
        if (take > can) {
            take = can;
            *truncated = true;
        }
        if (take) dst->append(buf, buf + take);
    }
};

// Read whatever is available without blocking. Returns false once the write
// side is closed (EOF) or the fd is unusable.
bool drain_fd(int fd, StreamSink& sink) {
    char buf[8192];
    while (true) {
        ssize_t n = read(fd, buf, sizeof(buf));
        if (n > 0) { sink.append(buf, n); continue; }
        if (n == 0) return false;
        if (errno == EINTR) continue;
        if (errno == EAGAIN || errno == EWOULDBLOCK) return true;
        return false;
    }
}

void close_fd(int& fd) {
    if (fd >= 0) {
        close(fd);
        fd = -1;
    }
}

} // namespace

bool proc_run_capture_sandboxed_stdin(const std::vector<std::string>& argv,
                                      const std::string& cwd,
                                      const std::string& stdin_data,
                                      const ProcLimits& lim,
                                      ProcResult* res) {
    if (!res) return false;
    *res = ProcResult{};

    if (argv.empty() || argv[0].empty()) {
        res->error = "empty argv";
        return false;
    }

    // Optional operator-provided wrapper (e.g., nsjail/firejail/bwrap).
    std::vector<std::string> eff_argv = argv;
    if (env_true("CODELOOP_PROC_WRAPPER_ENABLE")) {
        if (const char* w = std::getenv("CODELOOP_PROC_WRAPPER")) {
            auto toks = split_argv_quoted(w);
            if (!toks.empty()) {
                toks.insert(toks.end(), eff_argv.begin(), eff_argv.end());
                eff_argv.swap(toks);
            }
        }
    }

    ignore_sigpipe_once();

    // Everything the child needs is prepared before fork(); after fork() the
    // child only makes system calls.
    std::vector<char*> cargv;
    cargv.reserve(eff_argv.size() + 1);
    for (const auto& s : eff_argv) cargv.push_back(const_cast<char*>(s.c_str()));
    cargv.push_back(nullptr);

    std::vector<char*> cenv;
    for (char** e = environ; e && *e; ++e) {
        if (std::strncmp(*e, "LD_PRELOAD=", 11) == 0) continue;
        if (std::strncmp(*e, "LD_LIBRARY_PATH=", 16) == 0) continue;
        cenv.push_back(*e);
    }
    cenv.push_back(nullptr);

    long maxfd = sysconf(_SC_OPEN_MAX);
    if (maxfd < 256) maxfd = 256;
    if (maxfd > 65536) maxfd = 65536;

    int in_pipe[2], out_pipe[2], err_pipe[2];
    if (pipe2(in_pipe, O_CLOEXEC) != 0) {
        res->error = std::string("pipe(in) failed: ") + std::strerror(errno);
        return false;
    }
    if (pipe2(out_pipe, O_CLOEXEC) != 0) {
        close(in_pipe[0]); close(in_pipe[1]);
        res->error = std::string("pipe(out) failed: ") + std::strerror(errno);
        return false;
    }
    if (pipe2(err_pipe, O_CLOEXEC) != 0) {
        close(in_pipe[0]); close(in_pipe[1]);
        close(out_pipe[0]); close(out_pipe[1]);
        res->error = std::string("pipe(err) failed: ") + std::strerror(errno);
        return false;
    }

    auto start = std::chrono::steady_clock::now();
    pid_t pid = fork();
    if (pid < 0) {
        close(in_pipe[0]); close(in_pipe[1]);
        close(out_pipe[0]); close(out_pipe[1]);
        close(err_pipe[0]); close(err_pipe[1]);
        res->error = std::string("fork failed: ") + std::strerror(errno);
        return false;
    }

    if (pid == 0) {
        // child
        (void)dup2(in_pipe[0], STDIN_FILENO);
        (void)dup2(out_pipe[1], STDOUT_FILENO);
        (void)dup2(err_pipe[1], STDERR_FILENO);

        // isolate process group so timeout can kill the whole subtree
        (void)setpgid(0, 0);
        (void)umask(077);

        for (int fd = 3; fd < maxfd; fd++) {
            (void)close(fd);
        }

        if (!cwd.empty() && chdir(cwd.c_str()) != 0) {
            const char msg[] = "codeloop: chdir to scratch workspace failed\n";
            (void)!write(STDERR_FILENO, msg, sizeof(msg) - 1);
            _exit(126);
        }

#ifdef __linux__
        if (lim.no_new_privs) {
            (void)prctl(PR_SET_NO_NEW_PRIVS, 1, 0, 0, 0);
        }
        (void)prctl(PR_SET_PDEATHSIG, SIGKILL);
#endif
        (void)signal(SIGPIPE, SIG_DFL);

        if (lim.rlimit_cpu_sec > 0) set_rlimit(RLIMIT_CPU, (rlim_t)lim.rlimit_cpu_sec);
        if (lim.rlimit_as_mb > 0) set_rlimit(RLIMIT_AS, (rlim_t)lim.rlimit_as_mb * 1024ULL * 1024ULL);
        if (lim.rlimit_fsize_mb > 0) set_rlimit(RLIMIT_FSIZE, (rlim_t)lim.rlimit_fsize_mb * 1024ULL * 1024ULL);
        if (lim.rlimit_nofile > 0) set_rlimit(RLIMIT_NOFILE, (rlim_t)lim.rlimit_nofile);
#ifdef RLIMIT_NPROC
        if (lim.rlimit_nproc > 0) set_rlimit(RLIMIT_NPROC, (rlim_t)lim.rlimit_nproc);
#endif

        execvpe(cargv[0], cargv.data(), cenv.data());
        _exit(127);
    }

    // parent
    (void)setpgid(pid, pid);
    close(in_pipe[0]);
    close(out_pipe[1]);
    close(err_pipe[1]);

    int in_fd = in_pipe[1];
    int out_fd = out_pipe[0];
    int err_fd = err_pipe[0];
    set_nonblocking(out_fd);
    set_nonblocking(err_fd);
    if (stdin_data.empty()) {
        close_fd(in_fd);
    } else {
        set_nonblocking(in_fd);
    }
    size_t write_off = 0;

    StreamSink out_sink{&res->stdout_data, lim.stdout_max_bytes, &res->output_truncated};
    StreamSink err_sink{&res->stderr_data, lim.stdout_max_bytes, &res->output_truncated};

    auto elapsed = [&]() -> int64_t {
        return (int64_t)std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::steady_clock::now() - start).count();
    };
    auto kill_group = [&]() {
        (void)kill(-pid, SIGKILL);
        (void)kill(pid, SIGKILL);
    };

    int status = 0;
    bool child_exited = false;

    while (true) {
        pid_t w = waitpid(pid, &status, WNOHANG);
        if (w == pid) {
            child_exited = true;
            break;
        }

        int64_t el = elapsed();
        if (lim.timeout_ms > 0 && el >= lim.timeout_ms) {
            res->timed_out = true;
            break;
        }
        if (lim.cancel && lim.cancel->load()) {
            res->cancelled = true;
            break;
        }

        struct pollfd fds[3];
        nfds_t nfds = 0;
        int in_idx = -1, out_idx = -1, err_idx = -1;
        if (in_fd >= 0) { in_idx = (int)nfds; fds[nfds].fd = in_fd; fds[nfds].events = POLLOUT; fds[nfds].revents = 0; nfds++; }
        if (out_fd >= 0) { out_idx = (int)nfds; fds[nfds].fd = out_fd; fds[nfds].events = POLLIN; fds[nfds].revents = 0; nfds++; }
        if (err_fd >= 0) { err_idx = (int)nfds; fds[nfds].fd = err_fd; fds[nfds].events = POLLIN; fds[nfds].revents = 0; nfds++; }

        int slice = 50;
        if (lim.timeout_ms > 0) {
            int64_t remaining = lim.timeout_ms - el;
            if (remaining < slice) slice = (int)std::max<int64_t>(1, remaining);
        }

        if (nfds == 0) {
            // all streams closed; only the exit status is outstanding
            (void)poll(nullptr, 0, slice);
            continue;
        }

        int pr = poll(fds, nfds, slice);
        if (pr < 0) {
            if (errno == EINTR) continue;
            res->error = std::string("poll failed: ") + std::strerror(errno);
            kill_group();
            break;
        }

        if (in_idx >= 0 && (fds[in_idx].revents & (POLLOUT | POLLERR | POLLHUP))) {
            while (write_off < stdin_data.size()) {
                ssize_t n = write(in_fd, stdin_data.data() + write_off, stdin_data.size() - write_off);
                if (n > 0) { write_off += (size_t)n; continue; }
                if (n == -1 && errno == EINTR) continue;
                if (n == -1 && (errno == EAGAIN || errno == EWOULDBLOCK)) break;
                write_off = stdin_data.size(); // EPIPE or other error: child stopped reading
                break;
            }
            if (write_off >= stdin_data.size()) close_fd(in_fd);
        }
        if (out_idx >= 0 && (fds[out_idx].revents & (POLLIN | POLLERR | POLLHUP))) {
            if (!drain_fd(out_fd, out_sink)) close_fd(out_fd);
        }
        if (err_idx >= 0 && (fds[err_idx].revents & (POLLIN | POLLERR | POLLHUP))) {
            if (!drain_fd(err_fd, err_sink)) close_fd(err_fd);
        }
    }

    if (!child_exited && lim.kill_grace_ms > 0 && (res->timed_out || res->cancelled)) {
        (void)kill(-pid, SIGTERM);
        (void)kill(pid, SIGTERM);
        close_fd(in_fd);
        const int64_t grace_end = elapsed() + lim.kill_grace_ms;
        while (elapsed() < grace_end) {
            if (waitpid(pid, &status, WNOHANG) == pid) {
                child_exited = true;
                break;
            }
            struct pollfd fds[2];
            nfds_t nfds = 0;
            if (out_fd >= 0) { fds[nfds].fd = out_fd; fds[nfds].events = POLLIN; fds[nfds].revents = 0; nfds++; }
            if (err_fd >= 0) { fds[nfds].fd = err_fd; fds[nfds].events = POLLIN; fds[nfds].revents = 0; nfds++; }
            if (poll(nfds ? fds : nullptr, nfds, 20) < 0 && errno != EINTR) break;
            if (out_fd >= 0 && !drain_fd(out_fd, out_sink)) close_fd(out_fd);
            if (err_fd >= 0 && !drain_fd(err_fd, err_sink)) close_fd(err_fd);
        }
    }

    if (!child_exited) {
        kill_group();
        (void)waitpid(pid, &status, 0);
    } else {
        // reap anything the child left behind in its group
        (void)kill(-pid, SIGKILL);
    }

    close_fd(in_fd);
    if (out_fd >= 0) { (void)drain_fd(out_fd, out_sink); close_fd(out_fd); }
    if (err_fd >= 0) { (void)drain_fd(err_fd, err_sink); close_fd(err_fd); }

    res->elapsed_ms = elapsed();
    if (WIFEXITED(status)) {
        res->exit_code = WEXITSTATUS(status);
    } else if (WIFSIGNALED(status)) {
        res->term_signal = WTERMSIG(status);
        res->exit_code = 128 + res->term_signal;
    } else {
        res->exit_code = 128;
    }
    return true;
}

bool proc_run_capture_sandboxed(const std::vector<std::string>& argv,
                                const std::string& cwd,
                                const ProcLimits& lim,
                                ProcResult* res) {
    return proc_run_capture_sandboxed_stdin(argv, cwd, std::string(), lim, res);
}

} // namespace codeloop
