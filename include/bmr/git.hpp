#pragma once

#include <bmr/result.hpp>
#include <string>
#include <utility>
#include <vector>

namespace bmr {

// Result of running an external command
struct CommandResult {
    int exit_code;
    std::string stdout_str;
    std::string stderr_str;
};

// Run an external command, capturing stdout and stderr.
// `env` entries ("KEY=value") are added to the child's environment.
// Returns IO error on fork/exec failure or timeout (the whole process group
// is killed on timeout).
Result<CommandResult> run_command(const std::vector<std::string>& args,
                                  const std::string& working_dir = "",
                                  int timeout_seconds = 60,
                                  const std::vector<std::string>& env = {});

// Wrapper around the git CLI operations the clone cache needs.
// Clone and fetch failures map to CloneFailed / UpdateFailed.
class GitCli {
public:
    // Check git is available and version >= 2.20
    Result<std::string> check_version();

    // `git clone [--branch <ref>] <url> <dest>`; commit refs are cloned
    // without --branch and then checked out detached.
    Status clone(const std::string& url, const std::string& dest,
                 const std::string& ref, bool ref_is_commit);

    // `git fetch origin <ref>` followed by `git merge --ff-only FETCH_HEAD`.
    // Diverged history fails without touching the work tree.
    Status fetch_fast_forward(const std::string& repo, const std::string& ref);

    // `git rev-parse HEAD`
    Result<std::string> head_commit(const std::string& repo);

    // True if `repo` is the top level of a git work tree
    bool is_work_tree(const std::string& repo);

    // Add a line to <repo>/.git/info/exclude
    Status exclude_path(const std::string& repo, const std::string& pattern);

    // Rewrite URLs starting with `prefix` to start with `replacement`
    // (passed to git as url.<replacement>.insteadOf=<prefix>)
    void add_url_rewrite(const std::string& prefix, const std::string& replacement);

    void set_timeout(int seconds) { timeout_seconds_ = seconds; }
    int timeout() const { return timeout_seconds_; }

private:
    int timeout_seconds_ = 120;
    std::vector<std::pair<std::string, std::string>> rewrites_;

    // "git" plus the -c options every invocation carries
    std::vector<std::string> base_args() const;
    Result<CommandResult> git(const std::vector<std::string>& args,
                              const std::string& working_dir = "");
};

} // namespace bmr
