#include <bmr/git.hpp>
#include <bmr/log.hpp>

#include <chrono>
#include <cstring>
#include <filesystem>
#include <fstream>

#include <fcntl.h>
#include <signal.h>
#include <sys/wait.h>
#include <unistd.h>

extern char** environ;

namespace fs = std::filesystem;

namespace bmr {

// ---------------------------------------------------------------------------
// Subprocess
// ---------------------------------------------------------------------------

Result<CommandResult> run_command(const std::vector<std::string>& args,
                                  const std::string& working_dir,
                                  int timeout_seconds,
                                  const std::vector<std::string>& env) {
    if (args.empty()) {
        return BmrError{BmrError::InvalidArg, "run_command: empty args"};
    }

    // Build argv for execvpe
    std::vector<const char*> argv;
    argv.reserve(args.size() + 1);
    for (const auto& a : args) argv.push_back(a.c_str());
    argv.push_back(nullptr);

    // Child environment: ours minus the overridden names, plus `env`.
    // Built before fork; the child may only exec.
    std::vector<std::string> env_strings;
    for (char** e = environ; e && *e; ++e) {
        std::string entry(*e);
        std::string name = entry.substr(0, entry.find('=') + 1);
        bool overridden = false;
        for (const auto& x : env) {
            if (x.compare(0, name.size(), name) == 0) { overridden = true; break; }
        }
        if (!overridden) env_strings.push_back(std::move(entry));
    }
    env_strings.insert(env_strings.end(), env.begin(), env.end());

    std::vector<char*> envp;
    envp.reserve(env_strings.size() + 1);
    for (auto& e : env_strings) envp.push_back(&e[0]);
    envp.push_back(nullptr);

    int stdout_pipe[2];
    int stderr_pipe[2];

    if (pipe(stdout_pipe) != 0) {
        return BmrError{BmrError::IO,
            std::string("pipe() failed: ") + strerror(errno)};
    }
    if (pipe(stderr_pipe) != 0) {
        close(stdout_pipe[0]); close(stdout_pipe[1]);
        return BmrError{BmrError::IO,
            std::string("pipe() failed: ") + strerror(errno)};
    }

    pid_t pid = fork();
    if (pid < 0) {
        close(stdout_pipe[0]); close(stdout_pipe[1]);
        close(stderr_pipe[0]); close(stderr_pipe[1]);
        return BmrError{BmrError::IO,
            std::string("fork() failed: ") + strerror(errno)};
    }

    if (pid == 0) {
        // Child: own process group so a timeout can kill helpers too
        setpgid(0, 0);

        close(stdout_pipe[0]);
        close(stderr_pipe[0]);

        dup2(stdout_pipe[1], STDOUT_FILENO);
        dup2(stderr_pipe[1], STDERR_FILENO);
        close(stdout_pipe[1]);
        close(stderr_pipe[1]);

        int devnull = open("/dev/null", O_RDONLY);
        if (devnull >= 0) {
            dup2(devnull, STDIN_FILENO);
            close(devnull);
        }

        if (!working_dir.empty()) {
            if (chdir(working_dir.c_str()) != 0) {
                _exit(127);
            }
        }

        execvpe(argv[0], const_cast<char* const*>(argv.data()), envp.data());
        _exit(127);  // execvpe failed
    }

    // Parent process
    close(stdout_pipe[1]);
    close(stderr_pipe[1]);

    fcntl(stdout_pipe[0], F_SETFL, O_NONBLOCK);
    fcntl(stderr_pipe[0], F_SETFL, O_NONBLOCK);

    std::string out_buf, err_buf;
    char buf[4096];
    auto start = std::chrono::steady_clock::now();

    auto drain = [&]() {
        ssize_t n;
        while ((n = read(stdout_pipe[0], buf, sizeof(buf))) > 0) {
            out_buf.append(buf, static_cast<size_t>(n));
        }
        while ((n = read(stderr_pipe[0], buf, sizeof(buf))) > 0) {
            err_buf.append(buf, static_cast<size_t>(n));
        }
    };

    while (true) {
        auto elapsed = std::chrono::steady_clock::now() - start;
        if (std::chrono::duration_cast<std::chrono::seconds>(elapsed).count()
                >= timeout_seconds) {
            kill(-pid, SIGKILL);
            kill(pid, SIGKILL);
            waitpid(pid, nullptr, 0);
            close(stdout_pipe[0]);
            close(stderr_pipe[0]);
            return BmrError{BmrError::IO,
                "command '" + args[0] + "' timed out after " +
                std::to_string(timeout_seconds) + "s"};
        }

        drain();

        int status = 0;
        pid_t w = waitpid(pid, &status, WNOHANG);
        if (w == pid) {
            drain();
            close(stdout_pipe[0]);
            close(stderr_pipe[0]);

            int exit_code = WIFEXITED(status) ? WEXITSTATUS(status) : -1;
            return Result<CommandResult>::ok(
                CommandResult{exit_code, std::move(out_buf), std::move(err_buf)});
        } else if (w < 0) {
            close(stdout_pipe[0]);
            close(stderr_pipe[0]);
            return BmrError{BmrError::IO,
                std::string("waitpid failed: ") + strerror(errno)};
        }

        usleep(1000);  // 1ms
    }
}

// ---------------------------------------------------------------------------
// GitCli
// ---------------------------------------------------------------------------

static std::string trim_trailing(std::string s) {
    while (!s.empty() && (s.back() == '\n' || s.back() == '\r' || s.back() == ' ')) {
        s.pop_back();
    }
    return s;
}

std::vector<std::string> GitCli::base_args() const {
    std::vector<std::string> args{"git"};
    for (const auto& [prefix, replacement] : rewrites_) {
        args.push_back("-c");
        args.push_back("url." + replacement + ".insteadOf=" + prefix);
    }
    return args;
}

Result<CommandResult> GitCli::git(const std::vector<std::string>& args,
                                  const std::string& working_dir) {
    auto full = base_args();
    full.insert(full.end(), args.begin(), args.end());
    // Never block on a credential prompt
    return run_command(full, working_dir, timeout_seconds_,
                       {"GIT_TERMINAL_PROMPT=0", "GIT_ASKPASS=true"});
}

void GitCli::add_url_rewrite(const std::string& prefix,
                             const std::string& replacement) {
    rewrites_.emplace_back(prefix, replacement);
}

Result<std::string> GitCli::check_version() {
    auto r = git({"--version"});
    if (r.is_err()) return std::move(r).error();

    auto& cmd = r.value();
    if (cmd.exit_code != 0) {
        return BmrError{BmrError::IO,
            "git not found or failed", "install git >= 2.20"};
    }

    std::string out = trim_trailing(cmd.stdout_str);
    auto pos = out.find("git version ");
    if (pos == std::string::npos) {
        return BmrError{BmrError::Parse,
            "unexpected git --version output: " + out};
    }
    std::string ver_str = out.substr(pos + 12);

    int major = 0, minor = 0;
    if (sscanf(ver_str.c_str(), "%d.%d", &major, &minor) < 2) {
        return BmrError{BmrError::Parse,
            "cannot parse git version: " + ver_str};
    }

    if (major < 2 || (major == 2 && minor < 20)) {
        return BmrError{BmrError::Version,
            "git version " + ver_str + " too old",
            "upgrade to git >= 2.20"};
    }

    return Result<std::string>::ok(std::move(ver_str));
}

Status GitCli::clone(const std::string& url, const std::string& dest,
                     const std::string& ref, bool ref_is_commit) {
    std::vector<std::string> args{"clone", "--quiet"};
    if (!ref.empty() && !ref_is_commit) {
        args.push_back("--branch");
        args.push_back(ref);
    }
    args.push_back(url);
    args.push_back(dest);

    log::debug("git clone %s%s%s -> %s", url.c_str(),
               ref.empty() ? "" : " #", ref.c_str(), dest.c_str());
    auto r = git(args);
    if (r.is_err()) {
        return BmrError{BmrError::CloneFailed,
            "git clone " + url + " failed: " + r.error().message};
    }
    if (r.value().exit_code != 0) {
        return BmrError{BmrError::CloneFailed,
            "git clone " + url + " failed: " + trim_trailing(r.value().stderr_str),
            "check the URL, the ref, and your credentials"};
    }

    if (ref_is_commit) {
        auto co = git({"-C", dest, "checkout", "--quiet", "--detach", ref});
        if (co.is_err()) {
            return BmrError{BmrError::CloneFailed,
                "git checkout " + ref + " failed: " + co.error().message};
        }
        if (co.value().exit_code != 0) {
            return BmrError{BmrError::CloneFailed,
                "commit " + ref + " not found in " + url + ": " +
                trim_trailing(co.value().stderr_str)};
        }
    }

    return ok_status();
}

Status GitCli::fetch_fast_forward(const std::string& repo, const std::string& ref) {
    log::debug("git -C %s fetch origin %s", repo.c_str(), ref.c_str());
    auto f = git({"-C", repo, "fetch", "--quiet", "origin", ref});
    if (f.is_err()) {
        return BmrError{BmrError::UpdateFailed,
            "git fetch failed: " + f.error().message};
    }
    if (f.value().exit_code != 0) {
        return BmrError{BmrError::UpdateFailed,
            "git fetch failed: " + trim_trailing(f.value().stderr_str)};
    }

    auto m = git({"-C", repo, "merge", "--ff-only", "--quiet", "FETCH_HEAD"});
    if (m.is_err()) {
        return BmrError{BmrError::UpdateFailed,
            "git merge --ff-only failed: " + m.error().message};
    }
    if (m.value().exit_code != 0) {
        return BmrError{BmrError::UpdateFailed,
            "cannot fast-forward: " + trim_trailing(m.value().stderr_str),
            "the remote history diverged; evict the cache entry to re-clone"};
    }

    return ok_status();
}

Result<std::string> GitCli::head_commit(const std::string& repo) {
    auto r = git({"-C", repo, "rev-parse", "HEAD"});
    if (r.is_err()) return std::move(r).error();

    auto& cmd = r.value();
    if (cmd.exit_code != 0) {
        return BmrError{BmrError::CacheCorrupt,
            "cannot resolve HEAD in " + repo + ": " + trim_trailing(cmd.stderr_str)};
    }

    return Result<std::string>::ok(trim_trailing(cmd.stdout_str));
}

bool GitCli::is_work_tree(const std::string& repo) {
    std::error_code ec;
    if (!fs::exists(fs::path(repo) / ".git", ec)) return false;

    auto r = git({"-C", repo, "rev-parse", "--show-toplevel"});
    if (r.is_err() || r.value().exit_code != 0) return false;

    auto top = fs::weakly_canonical(trim_trailing(r.value().stdout_str), ec);
    if (ec) return false;
    return top == fs::weakly_canonical(repo, ec);
}

Status GitCli::exclude_path(const std::string& repo, const std::string& pattern) {
    fs::path info = fs::path(repo) / ".git" / "info";
    std::error_code ec;
    fs::create_directories(info, ec);
    if (ec) {
        return BmrError{BmrError::IO,
            "cannot create " + info.string() + ": " + ec.message()};
    }

    std::ofstream out(info / "exclude", std::ios::app);
    if (!out) {
        return BmrError{BmrError::IO,
            "cannot write " + (info / "exclude").string()};
    }
    out << pattern << "\n";
    return ok_status();
}

} // namespace bmr
