#include "process_utils.hpp"

#include <cerrno>
#include <cstring>
#include <set>

#include <fcntl.h>
#include <poll.h>
#include <signal.h>
#include <sys/wait.h>
#include <unistd.h>

extern char** environ;

namespace procutil {

std::string CommandResult::combined() const {
    if (err.empty())
        return out;
    if (out.empty())
        return err;
    std::string all = out;
    if (all.back() != '\n')
        all += '\n';
    return all + err;
}

/**
 * @brief Build a `KEY=VALUE` list from the inherited environment and @p overlay.
 */
static std::vector<std::string> merged_environment(const Environment& overlay) {
    std::vector<std::string> result;
    std::set<std::string> overridden;
    for (const auto& kv : overlay)
        overridden.insert(kv.first);
    for (char** e = environ; e && *e; ++e) {
        std::string entry(*e);
        auto eq = entry.find('=');
        std::string key = eq == std::string::npos ? entry : entry.substr(0, eq);
        if (!overridden.count(key))
            result.push_back(std::move(entry));
    }
    for (const auto& [k, v] : overlay)
        result.push_back(k + "=" + v);
    return result;
}

static void drain(int fd, std::string& buf, bool& open) {
    char chunk[4096];
    while (true) {
        ssize_t n = read(fd, chunk, sizeof(chunk));
        if (n > 0) {
            buf.append(chunk, static_cast<size_t>(n));
            continue;
        }
        if (n == 0)
            open = false;
        else if (errno == EINTR)
            continue;
        else if (errno != EAGAIN && errno != EWOULDBLOCK)
            open = false;
        return;
    }
}

CommandResult run_command(const std::vector<std::string>& args, const std::filesystem::path& cwd,
                          std::chrono::seconds timeout, const Environment& env) {
    CommandResult res;
    if (args.empty()) {
        res.error = "empty command";
        return res;
    }

    // Everything the child needs is prepared before fork().
    std::vector<char*> argv;
    argv.reserve(args.size() + 1);
    for (const auto& a : args)
        argv.push_back(const_cast<char*>(a.c_str()));
    argv.push_back(nullptr);
    std::vector<std::string> env_strings = merged_environment(env);
    std::vector<char*> envp;
    envp.reserve(env_strings.size() + 1);
    for (auto& s : env_strings)
        envp.push_back(s.data());
    envp.push_back(nullptr);
    std::string dir = cwd.string();

    int out_pipe[2];
    int err_pipe[2];
    if (pipe(out_pipe) != 0) {
        res.error = std::string("pipe() failed: ") + std::strerror(errno);
        return res;
    }
    if (pipe(err_pipe) != 0) {
        res.error = std::string("pipe() failed: ") + std::strerror(errno);
        close(out_pipe[0]);
        close(out_pipe[1]);
        return res;
    }

    pid_t pid = fork();
    if (pid < 0) {
        res.error = std::string("fork() failed: ") + std::strerror(errno);
        close(out_pipe[0]);
        close(out_pipe[1]);
        close(err_pipe[0]);
        close(err_pipe[1]);
        return res;
    }

    if (pid == 0) {
        setpgid(0, 0);
        int devnull = open("/dev/null", O_RDONLY);
        if (devnull >= 0) {
            dup2(devnull, STDIN_FILENO);
            close(devnull);
        }
        dup2(out_pipe[1], STDOUT_FILENO);
        dup2(err_pipe[1], STDERR_FILENO);
        close(out_pipe[0]);
        close(out_pipe[1]);
        close(err_pipe[0]);
        close(err_pipe[1]);
        if (!dir.empty() && chdir(dir.c_str()) != 0)
            _exit(126);
        execvpe(argv[0], argv.data(), envp.data());
        _exit(127);
    }

    res.launched = true;
    close(out_pipe[1]);
    close(err_pipe[1]);
    fcntl(out_pipe[0], F_SETFL, O_NONBLOCK);
    fcntl(err_pipe[0], F_SETFL, O_NONBLOCK);

    bool out_open = true;
    bool err_open = true;
    const auto start = std::chrono::steady_clock::now();
    while (out_open || err_open) {
        if (timeout.count() > 0 && std::chrono::steady_clock::now() - start >= timeout) {
            res.timed_out = true;
            kill(-pid, SIGKILL);
            kill(pid, SIGKILL);
            break;
        }
        pollfd fds[2];
        nfds_t count = 0;
        if (out_open)
            fds[count++] = {out_pipe[0], POLLIN, 0};
        if (err_open)
            fds[count++] = {err_pipe[0], POLLIN, 0};
        int rc = poll(fds, count, 50);
        if (rc < 0 && errno != EINTR)
            break;
        if (out_open)
            drain(out_pipe[0], res.out, out_open);
        if (err_open)
            drain(err_pipe[0], res.err, err_open);
    }
    close(out_pipe[0]);
    close(err_pipe[0]);

    // Output is closed; the child may still be running.
    int status = 0;
    while (true) {
        pid_t w = waitpid(pid, &status, res.timed_out ? 0 : WNOHANG);
        if (w == pid)
            break;
        if (w < 0) {
            if (errno == EINTR)
                continue;
            res.error = std::string("waitpid failed: ") + std::strerror(errno);
            return res;
        }
        if (timeout.count() > 0 && std::chrono::steady_clock::now() - start >= timeout) {
            res.timed_out = true;
            kill(-pid, SIGKILL);
            kill(pid, SIGKILL);
            continue;
        }
        poll(nullptr, 0, 10);
    }
    if (res.timed_out) {
        res.error = "timed out after " + std::to_string(timeout.count()) + "s";
        return res;
    }
    if (WIFEXITED(status)) {
        res.exit_code = WEXITSTATUS(status);
        if (res.exit_code == 127 && res.out.empty() && res.err.empty())
            res.error = "failed to execute " + args.front();
    } else if (WIFSIGNALED(status)) {
        res.error = "terminated by signal " + std::to_string(WTERMSIG(status));
    }
    return res;
}

} // namespace procutil
