#include <bmr/remote.hpp>

#include <cctype>
#include <cstdio>
#include <vector>

namespace bmr {

// ---------------------------------------------------------------------------
// Helpers
// ---------------------------------------------------------------------------

static BmrError malformed(const std::string& input,
                          const std::string& what,
                          const std::string& offending) {
    BmrError err{BmrError::MalformedRemoteSpec,
        "malformed remote spec '" + input + "': " + what,
        "expected git+https://<host>/<org>/<repo>.git[#<ref>][:/<subpath>]"};
    err.with_context("offending part: '" + offending + "'");
    return err;
}

static bool is_name_char(char c) {
    return std::isalnum(static_cast<unsigned char>(c)) ||
           c == '.' || c == '_' || c == '-';
}

static bool valid_host(const std::string& host) {
    if (host.empty()) return false;
    size_t colon = host.find(':');
    std::string name = host.substr(0, colon);
    if (name.empty() || name.front() == '-' || name.front() == '.') return false;
    for (char c : name) {
        if (!std::isalnum(static_cast<unsigned char>(c)) && c != '.' && c != '-') {
            return false;
        }
    }
    if (colon != std::string::npos) {
        std::string port = host.substr(colon + 1);
        if (port.empty() || port.size() > 5) return false;
        for (char c : port) {
            if (!std::isdigit(static_cast<unsigned char>(c))) return false;
        }
    }
    return true;
}

static bool valid_segment(const std::string& s) {
    if (s.empty() || s == "." || s == "..") return false;
    for (char c : s) {
        if (!is_name_char(c)) return false;
    }
    return true;
}

// Mirrors the git check-ref-format rules that matter for a command line
static bool valid_ref(const std::string& ref) {
    if (ref.empty() || ref.front() == '-' || ref.front() == '/' ||
        ref.back() == '/' || ref.back() == '.') {
        return false;
    }
    if (ref.find("..") != std::string::npos || ref.find("//") != std::string::npos ||
        ref.find("@{") != std::string::npos) {
        return false;
    }
    for (char c : ref) {
        unsigned char uc = static_cast<unsigned char>(c);
        if (uc <= 0x20 || uc == 0x7f) return false;
        if (c == '~' || c == '^' || c == ':' || c == '?' ||
            c == '*' || c == '[' || c == '\\') {
            return false;
        }
    }
    return true;
}

static std::vector<std::string> split(const std::string& s, char sep) {
    std::vector<std::string> parts;
    size_t start = 0;
    while (true) {
        size_t pos = s.find(sep, start);
        parts.push_back(s.substr(start, pos == std::string::npos
                                            ? std::string::npos
                                            : pos - start));
        if (pos == std::string::npos) break;
        start = pos + 1;
    }
    return parts;
}

// ---------------------------------------------------------------------------
// RemoteSpec
// ---------------------------------------------------------------------------

const char* protocol_name(GitProtocol p) {
    switch (p) {
        case GitProtocol::Https: return "https";
        case GitProtocol::Ssh:   return "ssh";
    }
    return "https";
}

bool RemoteSpec::looks_like_remote(const std::string& input) {
    return input.rfind("git+https://", 0) == 0 ||
           input.rfind("git+ssh://", 0) == 0;
}

Result<RemoteSpec> RemoteSpec::parse(const std::string& input) {
    if (input.empty()) {
        return malformed(input, "empty string", input);
    }
    for (char c : input) {
        unsigned char uc = static_cast<unsigned char>(c);
        if (uc <= 0x20 || uc == 0x7f) {
            return malformed(input, "whitespace or control character", std::string(1, c));
        }
    }

    RemoteSpec spec;
    std::string rest = input;

    // Scheme
    if (rest.rfind("git+", 0) == 0) {
        size_t sep = rest.find("://");
        if (sep == std::string::npos) {
            return malformed(input, "missing '://' after scheme", rest.substr(0, 8));
        }
        std::string proto = rest.substr(4, sep - 4);
        if (proto == "https") {
            spec.protocol = GitProtocol::Https;
        } else if (proto == "ssh") {
            spec.protocol = GitProtocol::Ssh;
        } else {
            return malformed(input, "unsupported protocol", proto);
        }
        rest = rest.substr(sep + 3);
    } else if (rest.find("://") != std::string::npos) {
        return malformed(input, "scheme must be git+https or git+ssh",
                         rest.substr(0, rest.find("://")));
    }

    // Subpath: first ":/" after the authority and path
    size_t first_slash = rest.find('/');
    if (first_slash == std::string::npos) {
        return malformed(input, "missing '/<org>/<repo>.git'", rest);
    }
    size_t subpath_pos = rest.find(":/", first_slash);
    std::string subpath_raw;
    bool has_subpath = false;
    if (subpath_pos != std::string::npos) {
        subpath_raw = rest.substr(subpath_pos + 2);
        rest = rest.substr(0, subpath_pos);
        has_subpath = true;
    }

    // Ref
    size_t hash = rest.find('#');
    if (hash != std::string::npos) {
        std::string ref = rest.substr(hash + 1);
        rest = rest.substr(0, hash);
        if (!valid_ref(ref)) {
            return malformed(input, "invalid ref", ref);
        }
        // HEAD is the remote default branch, same as no ref
        if (ref != "HEAD") spec.ref = ref;
    }

    // Authority
    first_slash = rest.find('/');
    std::string authority = rest.substr(0, first_slash);
    std::string path = rest.substr(first_slash + 1);

    size_t at = authority.find('@');
    if (at != std::string::npos) {
        if (spec.protocol != GitProtocol::Ssh) {
            return malformed(input, "user info is only allowed for ssh", authority);
        }
        spec.user = authority.substr(0, at);
        authority = authority.substr(at + 1);
        if (!valid_segment(spec.user)) {
            return malformed(input, "invalid ssh user", spec.user);
        }
    }
    if (!valid_host(authority)) {
        return malformed(input, "invalid host", authority);
    }
    spec.host = authority;

    // <org>/<repo>.git
    auto segs = split(path, '/');
    if (segs.size() != 2) {
        return malformed(input, "expected exactly '<org>/<repo>.git' after host", path);
    }
    const std::string suffix = ".git";
    std::string repo = segs[1];
    if (repo.size() <= suffix.size() ||
        repo.compare(repo.size() - suffix.size(), suffix.size(), suffix) != 0) {
        return malformed(input, "repository must end in '.git'", repo);
    }
    repo = repo.substr(0, repo.size() - suffix.size());

    if (!valid_segment(segs[0])) {
        return malformed(input, "invalid organization", segs[0]);
    }
    if (!valid_segment(repo)) {
        return malformed(input, "invalid repository name", repo);
    }
    spec.org = segs[0];
    spec.repo = repo;

    // Subpath normalization: drop empty and "." segments, reject ".."
    if (has_subpath) {
        std::string normalized;
        for (const auto& seg : split(subpath_raw, '/')) {
            if (seg.empty() || seg == ".") continue;
            if (seg == "..") {
                return malformed(input, "subpath must not contain '..'", subpath_raw);
            }
            if (seg.find('\\') != std::string::npos) {
                return malformed(input, "subpath must not contain '\\'", seg);
            }
            if (!normalized.empty()) normalized += "/";
            normalized += seg;
        }
        if (!normalized.empty()) {
            spec.subpath = normalized;
        }
    }

    return Result<RemoteSpec>::ok(std::move(spec));
}

std::string RemoteSpec::canonical() const {
    std::string s = "git+";
    s += protocol_name(protocol);
    s += "://";
    if (!user.empty()) s += user + "@";
    s += host + "/" + org + "/" + repo + ".git";
    if (ref) s += "#" + *ref;
    if (subpath) s += ":/" + *subpath;
    return s;
}

std::string RemoteSpec::clone_url() const {
    if (protocol == GitProtocol::Ssh) {
        std::string s = "ssh://";
        if (!user.empty()) s += user + "@";
        return s + host + "/" + org + "/" + repo + ".git";
    }
    return "https://" + host + "/" + org + "/" + repo + ".git";
}

std::string RemoteSpec::ref_or_head() const {
    return ref ? *ref : std::string("HEAD");
}

bool RemoteSpec::ref_is_commit() const {
    if (!ref || ref->size() < 7 || ref->size() > 40) return false;
    for (char c : *ref) {
        if (!std::isxdigit(static_cast<unsigned char>(c))) return false;
    }
    return true;
}

bool RemoteSpec::same_checkout(const RemoteSpec& o) const {
    return host == o.host && org == o.org && repo == o.repo && ref == o.ref;
}

bool RemoteSpec::operator==(const RemoteSpec& o) const {
    return protocol == o.protocol && user == o.user && same_checkout(o) &&
           subpath == o.subpath;
}

// ---------------------------------------------------------------------------
// Cache key
// ---------------------------------------------------------------------------

static void append_encoded(std::string& out, const std::string& part) {
    for (char c : part) {
        unsigned char uc = static_cast<unsigned char>(c);
        if (std::isalnum(uc) || c == '.' || c == '_') {
            out.push_back(c);
        } else {
            char buf[4];
            std::snprintf(buf, sizeof(buf), "%%%02X", uc);
            out += buf;
        }
    }
}

std::string derive_cache_key(const RemoteSpec& spec) {
    // '-' is the field separator, so it is encoded inside fields
    std::string key;
    append_encoded(key, spec.host);
    key.push_back('-');
    append_encoded(key, spec.org);
    key.push_back('-');
    append_encoded(key, spec.repo);
    key.push_back('-');
    append_encoded(key, spec.ref_or_head());
    return key;
}

// ---------------------------------------------------------------------------
// Named remotes
// ---------------------------------------------------------------------------

bool valid_remote_name(const std::string& name) {
    if (name.empty() || !(name[0] >= 'a' && name[0] <= 'z')) return false;
    for (char c : name) {
        bool ok = (c >= 'a' && c <= 'z') || (c >= '0' && c <= '9') || c == '-';
        if (!ok) return false;
    }
    return true;
}

Result<RemoteSpec> resolve_remote(const std::string& input, const NamedRemotes& named) {
    if (input.empty() || input[0] != '@') {
        return RemoteSpec::parse(input);
    }

    size_t colon = input.find(':');
    std::string name = input.substr(1, colon == std::string::npos ? std::string::npos
                                                                  : colon - 1);
    std::string path;
    if (colon != std::string::npos) {
        path = input.substr(colon + 1);
        while (!path.empty() && path.front() == '/') path.erase(0, 1);
    }

    auto it = named.find(name);
    if (it == named.end()) {
        std::string known;
        for (const auto& [k, v] : named) {
            known += (known.empty() ? "@" : ", @") + k;
        }
        BmrError err{BmrError::MalformedRemoteSpec,
            "unknown named remote '@" + name + "'",
            "define it under [git.named] in the config file"};
        err.with_context("known names: " + (known.empty() ? std::string("none") : known));
        return err;
    }

    auto base = RemoteSpec::parse(it->second);
    if (base.is_err()) {
        return std::move(base).context("named remote @" + name);
    }
    if (path.empty()) return base;

    // Re-parse so the joined subpath gets the usual validation
    std::string text = base.value().canonical();
    text += base.value().subpath ? "/" + path : ":/" + path;
    return RemoteSpec::parse(text).context("expanded from " + input);
}

} // namespace bmr
