#pragma once

#include <bmr/result.hpp>
#include <map>
#include <optional>
#include <string>

namespace bmr {

enum class GitProtocol { Https, Ssh };

const char* protocol_name(GitProtocol p);

// Parsed identity of a git-hosted source:
//   git+<protocol>://[user@]<host>/<org>/<repo>.git[#<ref>][:/<subpath>]
struct RemoteSpec {
    GitProtocol protocol = GitProtocol::Https;
    std::string user;                  // ssh user, not part of identity
    std::string host;                  // may include ":port"
    std::string org;
    std::string repo;                  // without ".git"
    std::optional<std::string> ref;    // branch, tag, or commit; none = remote HEAD
    std::optional<std::string> subpath;

    static Result<RemoteSpec> parse(const std::string& input);

    // True for strings that look like remote specs (git+https:// or git+ssh://)
    static bool looks_like_remote(const std::string& input);

    // Rendered back in the input grammar
    std::string canonical() const;

    // URL handed to git: https://host/org/repo.git or ssh://[user@]host/org/repo.git
    std::string clone_url() const;

    // "main", "v2", ... or "HEAD" when no ref was given
    std::string ref_or_head() const;

    // Hex object name of 7..40 chars; such refs are immutable
    bool ref_is_commit() const;

    // Same clone: host, org, repo, ref
    bool same_checkout(const RemoteSpec& o) const;

    bool operator==(const RemoteSpec& o) const;
    bool operator!=(const RemoteSpec& o) const { return !(*this == o); }
};

// Deterministic directory name for a clone: <host>-<org>-<repo>-<ref|HEAD>,
// every field byte outside [A-Za-z0-9._] percent-encoded ('-' included, since it
// separates the fields). Subpath never participates.
std::string derive_cache_key(const RemoteSpec& spec);

// Aliases for remotes, from [git.named]: name -> remote spec
using NamedRemotes = std::map<std::string, std::string>;

// Lowercase letter first, then lowercase letters, digits and '-'
bool valid_remote_name(const std::string& name);

// "@name" and "@name:path" expand to the named remote, with `path` appended
// to its subpath. Other input goes through RemoteSpec::parse.
Result<RemoteSpec> resolve_remote(const std::string& input, const NamedRemotes& named);

} // namespace bmr
