#include <trellis/vcs.hpp>
#include <trellis/semver.hpp>
#include <trellis/log.hpp>

#include <cerrno>
#include <chrono>
#include <cstring>
#include <sstream>

#include <fcntl.h>
#include <poll.h>
#include <signal.h>
#include <sys/wait.h>
#include <unistd.h>

namespace trellis {

namespace fs = std::filesystem;

// ---------------------------------------------------------------------------
// Subprocess
// ---------------------------------------------------------------------------

namespace {

// Owns one end of a pipe
struct Fd {
    int fd = -1;
    Fd() = default;
    Fd(const Fd&) = delete;
    Fd& operator=(const Fd&) = delete;
    ~Fd() { reset(); }
    void reset() {
        if (fd >= 0) close(fd);
        fd = -1;
    }
};

void drain(Fd& from, std::string& into) {
    char buf[4096];
    ssize_t n = read(from.fd, buf, sizeof(buf));
    if (n > 0) {
        into.append(buf, static_cast<size_t>(n));
    } else if (n == 0 || (errno != EAGAIN && errno != EINTR)) {
        from.reset();  // EOF or error
    }
}

} // namespace

Result<CommandResult> run_command(const std::vector<std::string>& args,
                                  const std::string& working_dir,
                                  int timeout_seconds) {
    if (args.empty()) {
        return TrellisError{TrellisError::InvalidArg, "run_command: empty args"};
    }

    std::vector<const char*> argv;
    argv.reserve(args.size() + 1);
    for (const auto& a : args) argv.push_back(a.c_str());
    argv.push_back(nullptr);

    int out_pipe[2];
    int err_pipe[2];
    if (pipe(out_pipe) != 0) {
        return TrellisError{TrellisError::IO,
            std::string("pipe() failed: ") + strerror(errno)};
    }
    Fd out_r, out_w;
    out_r.fd = out_pipe[0];
    out_w.fd = out_pipe[1];
    if (pipe(err_pipe) != 0) {
        return TrellisError{TrellisError::IO,
            std::string("pipe() failed: ") + strerror(errno)};
    }
    Fd err_r, err_w;
    err_r.fd = err_pipe[0];
    err_w.fd = err_pipe[1];

    pid_t pid = fork();
    if (pid < 0) {
        return TrellisError{TrellisError::IO,
            std::string("fork() failed: ") + strerror(errno)};
    }

    if (pid == 0) {
        dup2(out_w.fd, STDOUT_FILENO);
        dup2(err_w.fd, STDERR_FILENO);
        close(out_r.fd);
        close(err_r.fd);
        close(out_w.fd);
        close(err_w.fd);

        if (!working_dir.empty() && chdir(working_dir.c_str()) != 0) {
            _exit(127);
        }

        execvp(argv[0], const_cast<char* const*>(argv.data()));
        _exit(127);  // execvp failed
    }

    out_w.reset();
    err_w.reset();
    fcntl(out_r.fd, F_SETFL, O_NONBLOCK);
    fcntl(err_r.fd, F_SETFL, O_NONBLOCK);

    std::string out_buf, err_buf;
    auto deadline = std::chrono::steady_clock::now() +
                    std::chrono::seconds(timeout_seconds);

    while (out_r.fd >= 0 || err_r.fd >= 0) {
        auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(
            deadline - std::chrono::steady_clock::now()).count();
        if (remaining <= 0) {
            kill(pid, SIGKILL);
            waitpid(pid, nullptr, 0);
            return TrellisError{TrellisError::IO,
                "command timed out after " + std::to_string(timeout_seconds) + "s: " +
                args[0]};
        }

        pollfd fds[2];
        nfds_t nfds = 0;
        if (out_r.fd >= 0) fds[nfds++] = pollfd{out_r.fd, POLLIN, 0};
        if (err_r.fd >= 0) fds[nfds++] = pollfd{err_r.fd, POLLIN, 0};

        int ready = poll(fds, nfds, static_cast<int>(remaining));
        if (ready < 0) {
            if (errno == EINTR) continue;
            kill(pid, SIGKILL);
            waitpid(pid, nullptr, 0);
            return TrellisError{TrellisError::IO,
                std::string("poll() failed: ") + strerror(errno)};
        }

        for (nfds_t i = 0; i < nfds; ++i) {
            if (fds[i].revents == 0) continue;
            if (fds[i].fd == out_r.fd) drain(out_r, out_buf);
            else if (fds[i].fd == err_r.fd) drain(err_r, err_buf);
        }
    }

    int status = 0;
    while (waitpid(pid, &status, 0) < 0) {
        if (errno != EINTR) {
            return TrellisError{TrellisError::IO,
                std::string("waitpid failed: ") + strerror(errno)};
        }
    }

    int exit_code = WIFEXITED(status) ? WEXITSTATUS(status) : -1;
    return Result<CommandResult>::ok(
        CommandResult{exit_code, std::move(out_buf), std::move(err_buf)});
}

// ---------------------------------------------------------------------------
// Ref listing and classification (pure functions)
// ---------------------------------------------------------------------------

static std::string trim_newline(std::string s) {
    while (!s.empty() && (s.back() == '\n' || s.back() == '\r')) {
        s.pop_back();
    }
    return s;
}

Result<RepoState> parse_ref_listing(const std::string& output) {
    RepoState state;
    std::istringstream stream(output);
    std::string line;

    const std::string heads = "refs/heads/";
    const std::string tags = "refs/tags/";

    while (std::getline(stream, line)) {
        line = trim_newline(line);
        if (line.empty()) continue;

        // "<object> <peeled-or-empty> <refname>"
        auto sp1 = line.find(' ');
        auto sp2 = sp1 == std::string::npos ? std::string::npos
                                            : line.find(' ', sp1 + 1);
        if (sp2 == std::string::npos) {
            return TrellisError{TrellisError::VcsQuery,
                "malformed ref listing line: '" + line + "'"};
        }

        std::string object = line.substr(0, sp1);
        std::string peeled = line.substr(sp1 + 1, sp2 - sp1 - 1);
        std::string ref = line.substr(sp2 + 1);

        if (ref.compare(0, heads.size(), heads) == 0) {
            state.branches[ref.substr(heads.size())] = object;
        } else if (ref.compare(0, tags.size(), tags) == 0) {
            state.tags[ref.substr(tags.size())] = peeled.empty() ? object : peeled;
        }
    }

    return Result<RepoState>::ok(std::move(state));
}

Result<Version> classify_checkout(const RepoState& state) {
    if (state.head.empty()) {
        return TrellisError{TrellisError::VcsQuery,
            "repository has no active commit"};
    }

    // 1. Branch tip. The checked out branch wins over other branches at the
    //    same commit; otherwise the map order picks the smallest name.
    if (state.current_branch) {
        auto it = state.branches.find(*state.current_branch);
        if (it != state.branches.end() && it->second == state.head) {
            return Result<Version>::ok(Version::branch(it->first).is(state.head));
        }
    }
    for (const auto& [name, tip] : state.branches) {
        if (tip == state.head) {
            return Result<Version>::ok(Version::branch(name).is(state.head));
        }
    }

    // 2. Highest semver tag on the commit
    std::optional<std::pair<SemVer, std::string>> best;
    for (const auto& [name, commit] : state.tags) {
        if (commit != state.head) continue;
        auto sv = SemVer::parse_tag(name);
        if (sv.is_err()) continue;  // non-semver tags don't classify
        if (!best || best->first < sv.value()) {
            best = std::make_pair(std::move(sv).value(), name);
        }
    }
    if (best) {
        return Result<Version>::ok(Version::tag(best->second).is(state.head));
    }

    // 3. Bare revision
    return Result<Version>::ok(Version::revision(state.head));
}

// ---------------------------------------------------------------------------
// GitInspector
// ---------------------------------------------------------------------------

Result<std::string> GitInspector::git(const fs::path& repo_dir,
                                      const std::vector<std::string>& args) const {
    std::vector<std::string> argv = {"git", "-C", repo_dir.string()};
    argv.insert(argv.end(), args.begin(), args.end());

    auto r = run_command(argv, "", timeout_seconds_);
    if (r.is_err()) {
        return TrellisError{TrellisError::VcsQuery,
            "git query failed in " + repo_dir.string() + ": " + r.error().message};
    }

    auto& cmd = r.value();
    if (cmd.exit_code == 127 && cmd.stderr_str.empty()) {
        return TrellisError{TrellisError::VcsQuery,
            "git not found", "install git and make sure it is on PATH"};
    }
    if (cmd.exit_code != 0) {
        return TrellisError{TrellisError::VcsQuery,
            "git " + args.front() + " failed in " + repo_dir.string() + ": " +
            trim_newline(cmd.stderr_str)};
    }

    return Result<std::string>::ok(std::move(cmd.stdout_str));
}

Result<RepoState> GitInspector::inspect(const fs::path& repo_dir) const {
    log::debug("inspecting repository at %s", repo_dir.string().c_str());

    // The directory must be a repository root, not merely inside one
    auto toplevel = git(repo_dir, {"rev-parse", "--show-toplevel"});
    if (toplevel.is_err()) return std::move(toplevel).error();

    std::error_code ec;
    fs::path top = fs::weakly_canonical(trim_newline(toplevel.value()), ec);
    fs::path dir = fs::weakly_canonical(repo_dir, ec);
    if (ec || top != dir) {
        return TrellisError{TrellisError::VcsQuery,
            repo_dir.string() + " is not the root of a repository",
            "enclosing repository is at " + top.string()};
    }

    auto head = git(repo_dir, {"rev-parse", "--verify", "HEAD"});
    if (head.is_err()) return std::move(head).error();

    auto refs = git(repo_dir, {"for-each-ref",
                               "--format=%(objectname) %(*objectname) %(refname)",
                               "refs/heads", "refs/tags"});
    if (refs.is_err()) return std::move(refs).error();

    auto state = parse_ref_listing(refs.value());
    if (state.is_err()) return std::move(state).error();
    state.value().head = trim_newline(head.value());

    // Exits non-zero on a detached HEAD, which is not an error here
    auto branch = run_command({"git", "-C", repo_dir.string(),
                               "symbolic-ref", "-q", "--short", "HEAD"},
                              "", timeout_seconds_);
    if (branch.is_err()) {
        return TrellisError{TrellisError::VcsQuery,
            "git symbolic-ref failed in " + repo_dir.string() + ": " +
            branch.error().message};
    }
    if (branch.value().exit_code == 0) {
        state.value().current_branch = trim_newline(branch.value().stdout_str);
    }

    log::debug("HEAD of %s is %s", repo_dir.string().c_str(),
               state.value().head.c_str());
    return state;
}

} // namespace trellis
