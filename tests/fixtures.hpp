#pragma once

#include <catch2/catch.hpp>
#include <bmr/git.hpp>

#include <atomic>
#include <chrono>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <string>
#include <vector>

#include <unistd.h>

namespace fs = std::filesystem;

// ---------------------------------------------------------------------------
// RAII temp directory
// ---------------------------------------------------------------------------

struct TempDir {
    fs::path path;

    TempDir() {
        static std::atomic<unsigned> counter{0};
        const char* src = std::getenv("BMR_SOURCE_DIR");
        fs::path base = src ? fs::path(src) / "build" : fs::temp_directory_path();
        path = base / ("bmr_test_" + std::to_string(getpid()) + "_" +
                       std::to_string(counter.fetch_add(1)) + "_" +
                       std::to_string(std::chrono::steady_clock::now()
                                          .time_since_epoch().count()));
        fs::create_directories(path);
        // Scans compare canonical paths
        path = fs::canonical(path);
    }

    ~TempDir() {
        std::error_code ec;
        fs::remove_all(path, ec);
    }

    TempDir(const TempDir&) = delete;
    TempDir& operator=(const TempDir&) = delete;

    void write_file(const std::string& rel, const std::string& content) const {
        fs::path full = path / rel;
        fs::create_directories(full.parent_path());
        std::ofstream f(full, std::ios::binary);
        f << content;
    }

    void make_dir(const std::string& rel) const {
        fs::create_directories(path / rel);
    }

    std::string str(const std::string& rel = "") const {
        return rel.empty() ? path.string() : (path / rel).string();
    }
};

// ---------------------------------------------------------------------------
// Installation layouts
// ---------------------------------------------------------------------------

inline void make_v6(const TempDir& td, const std::string& root,
                    const std::string& version = "6.0.0-alpha.0") {
    td.write_file(root + "/_cfg/manifest.yaml",
        "installation:\n  version: " + version + "\nmodules:\n  - name: core\n  - name: bmm\n");
    td.write_file(root + "/_cfg/agent-manifest.csv",
        "name,displayName,module,path\n"
        "analyst,Mary,bmm,bmad/bmm/agents/analyst.md\n"
        "bmad-master,Master,core,bmad/core/agents/bmad-master.md\n");
    td.write_file(root + "/_cfg/workflow-manifest.csv",
        "name,description,module,path\n"
        "plan-project,Plan,bmm,bmad/bmm/workflows/plan-project/workflow.yaml\n");
    td.write_file(root + "/_cfg/task-manifest.csv",
        "name,displayName,module,path\n"
        "workflow,Run,core,bmad/core/tasks/workflow.xml\n");
    td.write_file(root + "/bmm/agents/analyst.md", "# analyst (" + root + ")\n");
    td.write_file(root + "/core/agents/bmad-master.md", "# master (" + root + ")\n");
    td.write_file(root + "/bmm/workflows/plan-project/workflow.yaml",
                  "name: plan-project\n");
    td.write_file(root + "/core/tasks/workflow.xml", "<task/>\n");
}

inline void make_v4(const TempDir& td, const std::string& root,
                    const std::string& version = "4.44.1") {
    td.write_file(root + "/install-manifest.yaml",
        "version: " + version + "\ninstall_type: full\nfiles:\n"
        "  - path: .bmad-core/agents/dev.md\n");
    td.write_file(root + "/agents/dev.md", "# dev (" + root + ")\n");
    td.write_file(root + "/agents/analyst.md", "# v4 analyst (" + root + ")\n");
    td.write_file(root + "/workflows/greenfield.yaml", "name: greenfield\n");
    td.write_file(root + "/tasks/create-doc.md", "# create-doc\n");
}

inline void make_custom(const TempDir& td, const std::string& root,
                        const std::string& agent = "helper") {
    td.write_file(root + "/agents/" + agent + ".md", "# " + agent + " (" + root + ")\n");
}

// ---------------------------------------------------------------------------
// Local git repositories served through a URL rewrite
// ---------------------------------------------------------------------------

inline bool git_available() {
    auto r = bmr::run_command({"git", "--version"});
    return r.is_ok() && r.value().exit_code == 0;
}

#define REQUIRE_GIT()                                  \
    do {                                               \
        if (!git_available()) {                        \
            WARN("git not available; skipping");       \
            return;                                    \
        }                                              \
    } while (0)

// Repositories live under <tmp>/remotes/<org>/<repo>.git and are reachable as
// https://example.org/<org>/<repo>.git through mirror_prefix() -> mirror_target().
struct GitFixture {
    TempDir td;

    static std::string mirror_prefix() { return "https://example.org/"; }
    std::string mirror_target() const { return "file://" + td.str("remotes") + "/"; }

    std::string repo_dir(const std::string& org, const std::string& repo) const {
        return td.str("remotes/" + org + "/" + repo + ".git");
    }

    static void git(const std::string& dir, std::vector<std::string> args) {
        std::vector<std::string> full{"git", "-c", "user.email=test@test.com",
                                      "-c", "user.name=Test"};
        full.insert(full.end(), args.begin(), args.end());
        auto r = bmr::run_command(full, dir);
        REQUIRE(r.is_ok());
        INFO(r.value().stderr_str);
        REQUIRE(r.value().exit_code == 0);
    }

    static std::string head(const std::string& dir) {
        auto r = bmr::run_command({"git", "rev-parse", "HEAD"}, dir);
        REQUIRE(r.is_ok());
        std::string s = r.value().stdout_str;
        while (!s.empty() && (s.back() == '\n' || s.back() == '\r')) s.pop_back();
        return s;
    }

    // Create a repository on branch "main" with one commit per call to commit()
    std::string create_repo(const std::string& org, const std::string& repo) {
        std::string dir = repo_dir(org, repo);
        fs::create_directories(dir);
        git(dir, {"init", "--quiet"});
        git(dir, {"symbolic-ref", "HEAD", "refs/heads/main"});
        return dir;
    }

    void write(const std::string& dir, const std::string& rel,
               const std::string& content) {
        fs::path full = fs::path(dir) / rel;
        fs::create_directories(full.parent_path());
        std::ofstream f(full, std::ios::binary);
        f << content;
    }

    std::string commit(const std::string& dir, const std::string& msg) {
        git(dir, {"add", "-A"});
        git(dir, {"commit", "--quiet", "-m", msg});
        return head(dir);
    }

    // Repository containing a v6 installation under bmad/
    std::string create_v6_repo(const std::string& org, const std::string& repo,
                               const std::string& version = "6.0.0") {
        std::string dir = create_repo(org, repo);
        write(dir, "README.md", "pack\n");
        write(dir, "bmad/_cfg/manifest.yaml",
              "installation:\n  version: " + version + "\n");
        write(dir, "bmad/_cfg/agent-manifest.csv",
              "name,module,path\nremote-agent,bmm,bmad/bmm/agents/remote-agent.md\n");
        write(dir, "bmad/bmm/agents/remote-agent.md", "# remote agent v1\n");
        commit(dir, "initial");
        return dir;
    }
};
