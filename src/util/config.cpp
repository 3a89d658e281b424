#include <bmr/config.hpp>
#include <toml++/toml.hpp>

#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <sstream>

namespace fs = std::filesystem;

namespace bmr {

// ---------------------------------------------------------------------------
// Helpers
// ---------------------------------------------------------------------------

const char* mode_name(DiscoveryMode m) {
    switch (m) {
        case DiscoveryMode::Normal: return "normal";
        case DiscoveryMode::Strict: return "strict";
    }
    return "normal";
}

static bool parse_mode(const std::string& s, DiscoveryMode& out) {
    // "auto" is the historical name of normal mode
    if (s == "normal" || s == "auto") { out = DiscoveryMode::Normal; return true; }
    if (s == "strict") { out = DiscoveryMode::Strict; return true; }
    return false;
}

static bool parse_bool(const std::string& s, bool& out) {
    std::string v;
    for (char c : s) v.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));
    if (v == "1" || v == "true" || v == "yes" || v == "on") { out = true; return true; }
    if (v == "0" || v == "false" || v == "no" || v == "off") { out = false; return true; }
    return false;
}

static bool parse_positive(const std::string& s, long& out) {
    if (s.empty()) return false;
    char* end = nullptr;
    long v = std::strtol(s.c_str(), &end, 10);
    if (*end != '\0' || v < 0) return false;
    out = v;
    return true;
}

static std::vector<std::string> split_list(const std::string& s, char sep) {
    std::vector<std::string> out;
    std::string cur;
    std::istringstream in(s);
    while (std::getline(in, cur, sep)) {
        size_t b = cur.find_first_not_of(" \t");
        size_t e = cur.find_last_not_of(" \t");
        if (b == std::string::npos) continue;
        out.push_back(cur.substr(b, e - b + 1));
    }
    return out;
}

static Result<std::vector<std::string>> string_array(const toml::node_view<const toml::node>& node,
                                                     const std::string& key) {
    std::vector<std::string> out;
    auto arr = node.as_array();
    if (!arr) {
        return BmrError{BmrError::Config, "'" + key + "' must be an array of strings"};
    }
    for (const auto& elem : *arr) {
        auto s = elem.value<std::string>();
        if (!s) {
            return BmrError{BmrError::Config, "'" + key + "' must contain only strings"};
        }
        out.push_back(*s);
    }
    return Result<std::vector<std::string>>::ok(std::move(out));
}

std::string expand_home(const std::string& path) {
    if (path.empty() || path[0] != '~') return path;
    if (path.size() > 1 && path[1] != '/') return path;
    const char* home = std::getenv("HOME");
    if (!home) return path;
    return std::string(home) + path.substr(1);
}

std::vector<std::string> ResolverConfig::default_excludes() {
    return {".git", "git", "node_modules", "cache", "build", "dist", "bin"};
}

// ---------------------------------------------------------------------------
// Parsing
// ---------------------------------------------------------------------------

Result<Config> Config::parse(const std::string& toml_str) {
    toml::table doc;
    try {
        doc = toml::parse(toml_str);
    } catch (const toml::parse_error& e) {
        BmrError err{BmrError::Parse,
            std::string("config TOML parse error: ") + std::string(e.description())};
        err.line = static_cast<int>(e.source().begin.line);
        return err;
    }

    Config cfg;
    const toml::table& root = doc;

    // [discovery]
    if (auto d = root["discovery"]; d) {
        if (!d.is_table()) {
            return BmrError{BmrError::Config, "[discovery] must be a table"};
        }
        if (auto v = d["mode"]; v) {
            DiscoveryMode m;
            auto s = v.value<std::string>();
            if (!s || !parse_mode(*s, m)) {
                return BmrError{BmrError::Config,
                    "discovery.mode must be \"normal\" or \"strict\""};
            }
            cfg.mode = m;
        }
        if (auto v = d["paths"]; v) {
            auto arr = string_array(v, "discovery.paths");
            if (arr.is_err()) return std::move(arr).error();
            cfg.paths = std::move(arr).value();
        }
        if (auto v = d["max-depth"]; v) {
            auto n = v.value<int64_t>();
            if (!n || *n < 0 || *n > 64) {
                return BmrError{BmrError::Config,
                    "discovery.max-depth must be an integer between 0 and 64"};
            }
            cfg.max_depth = static_cast<int>(*n);
        }
        if (auto v = d["exclude"]; v) {
            auto arr = string_array(v, "discovery.exclude");
            if (arr.is_err()) return std::move(arr).error();
            cfg.exclude = std::move(arr).value();
        }
        if (auto v = d["user-root"]; v) {
            auto s = v.value<std::string>();
            if (!s) return BmrError{BmrError::Config, "discovery.user-root must be a string"};
            cfg.user_root = *s;
        }
        if (auto v = d["include-user"]; v) {
            auto b = v.value<bool>();
            if (!b) return BmrError{BmrError::Config, "discovery.include-user must be a boolean"};
            cfg.include_user = *b;
        }
    }

    // [git]
    if (auto g = root["git"]; g) {
        if (!g.is_table()) {
            return BmrError{BmrError::Config, "[git] must be a table"};
        }
        if (auto v = g["remotes"]; v) {
            auto arr = string_array(v, "git.remotes");
            if (arr.is_err()) return std::move(arr).error();
            cfg.remotes = std::move(arr).value();
        }
        if (auto v = g["cache-dir"]; v) {
            auto s = v.value<std::string>();
            if (!s) return BmrError{BmrError::Config, "git.cache-dir must be a string"};
            cfg.cache_dir = *s;
        }
        if (auto v = g["auto-update"]; v) {
            auto b = v.value<bool>();
            if (!b) return BmrError{BmrError::Config, "git.auto-update must be a boolean"};
            cfg.auto_update = *b;
        }
        if (auto v = g["ttl"]; v) {
            auto n = v.value<int64_t>();
            if (!n || *n < 0) {
                return BmrError{BmrError::Config, "git.ttl must be a non-negative integer (seconds)"};
            }
            cfg.ttl_seconds = static_cast<long>(*n);
        }
        if (auto v = g["timeout"]; v) {
            auto n = v.value<int64_t>();
            if (!n || *n <= 0) {
                return BmrError{BmrError::Config, "git.timeout must be a positive integer (seconds)"};
            }
            cfg.timeout_seconds = static_cast<int>(*n);
        }
        if (auto m = g["mirrors"]; m) {
            auto tbl = m.as_table();
            if (!tbl) return BmrError{BmrError::Config, "[git.mirrors] must be a table"};
            for (const auto& [key, val] : *tbl) {
                auto s = val.value<std::string>();
                if (!s) {
                    return BmrError{BmrError::Config,
                        "git.mirrors.\"" + std::string(key.str()) + "\" must be a string"};
                }
                cfg.mirrors[std::string(key.str())] = *s;
            }
        }
        if (auto n = g["named"]; n) {
            auto tbl = n.as_table();
            if (!tbl) return BmrError{BmrError::Config, "[git.named] must be a table"};
            for (const auto& [key, val] : *tbl) {
                std::string name(key.str());
                if (!valid_remote_name(name)) {
                    return BmrError{BmrError::Config,
                        "invalid remote name '" + name + "' in [git.named]",
                        "names start with a lowercase letter and use only a-z, 0-9 and '-'"};
                }
                auto s = val.value<std::string>();
                if (!s || !RemoteSpec::looks_like_remote(*s)) {
                    return BmrError{BmrError::Config,
                        "git.named." + name + " must be a git+https:// or git+ssh:// remote"};
                }
                auto spec = RemoteSpec::parse(*s);
                if (spec.is_err()) {
                    BmrError err{BmrError::Config,
                        "git.named." + name + ": " + spec.error().message,
                        spec.error().hint};
                    err.context = spec.error().context;
                    return err;
                }
                cfg.named_remotes[name] = *s;
            }
        }
    }

    // [log]
    if (auto l = root["log"]; l) {
        if (auto v = l["level"]; v) {
            log::Level lvl;
            auto s = v.value<std::string>();
            if (!s || !log::parse_level(*s, lvl)) {
                return BmrError{BmrError::Config,
                    "log.level must be one of trace, debug, info, warn, error"};
            }
            cfg.log_level = lvl;
        }
    }

    return Result<Config>::ok(std::move(cfg));
}

Result<Config> Config::load(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        return BmrError{BmrError::IO,
            "cannot open config file: " + path};
    }
    std::ostringstream ss;
    ss << file.rdbuf();
    auto cfg = Config::parse(ss.str());
    if (cfg.is_err()) {
        cfg.error().file = path;
    }
    return cfg;
}

Result<Config> Config::from_env(const std::function<const char*(const char*)>& lookup) {
    auto get = [&](const char* name) -> const char* {
        return lookup ? lookup(name) : std::getenv(name);
    };
    auto invalid = [](const std::string& name, const std::string& value) {
        return BmrError{BmrError::Config,
            "invalid value '" + value + "' for " + name};
    };

    Config cfg;

    if (const char* v = get("BMR_ROOT"); v && *v) {
        cfg.paths = split_list(v, ':');
    }
    if (const char* v = get("BMR_DISCOVERY_MODE"); v && *v) {
        DiscoveryMode m;
        if (!parse_mode(v, m)) return invalid("BMR_DISCOVERY_MODE", v);
        cfg.mode = m;
    }
    if (const char* v = get("BMR_USER_PATH"); v && *v) {
        cfg.user_root = v;
    }
    if (const char* v = get("BMR_DISABLE_USER"); v && *v) {
        bool b;
        if (!parse_bool(v, b)) return invalid("BMR_DISABLE_USER", v);
        cfg.include_user = !b;
    }
    if (const char* v = get("BMR_MAX_DEPTH"); v && *v) {
        long n;
        if (!parse_positive(v, n) || n > 64) return invalid("BMR_MAX_DEPTH", v);
        cfg.max_depth = static_cast<int>(n);
    }
    if (const char* v = get("BMR_EXCLUDE_DIRS"); v && *v) {
        cfg.exclude = split_list(v, ',');
    }
    if (const char* v = get("BMR_REMOTES"); v && *v) {
        cfg.remotes = split_list(v, ',');
    }
    if (const char* v = get("BMR_GIT_CACHE_DIR"); v && *v) {
        cfg.cache_dir = v;
    }
    if (const char* v = get("BMR_AUTO_UPDATE_GIT"); v && *v) {
        bool b;
        if (!parse_bool(v, b)) return invalid("BMR_AUTO_UPDATE_GIT", v);
        cfg.auto_update = b;
    }
    if (const char* v = get("BMR_GIT_TTL"); v && *v) {
        long n;
        if (!parse_positive(v, n)) return invalid("BMR_GIT_TTL", v);
        cfg.ttl_seconds = n;
    }
    if (const char* v = get("BMR_GIT_TIMEOUT"); v && *v) {
        long n;
        if (!parse_positive(v, n) || n == 0) return invalid("BMR_GIT_TIMEOUT", v);
        cfg.timeout_seconds = static_cast<int>(n);
    }
    if (const char* v = get("BMR_LOG_LEVEL"); v && *v) {
        log::Level lvl;
        if (!log::parse_level(v, lvl)) return invalid("BMR_LOG_LEVEL", v);
        cfg.log_level = lvl;
    }

    return Result<Config>::ok(std::move(cfg));
}

// ---------------------------------------------------------------------------
// Layering
// ---------------------------------------------------------------------------

void Config::merge(const Config& other) {
    if (other.mode) mode = other.mode;
    if (other.paths) paths = other.paths;
    if (other.max_depth) max_depth = other.max_depth;
    if (other.exclude) exclude = other.exclude;
    if (other.user_root) user_root = other.user_root;
    if (other.include_user) include_user = other.include_user;

    if (other.remotes) remotes = other.remotes;
    if (other.cache_dir) cache_dir = other.cache_dir;
    if (other.auto_update) auto_update = other.auto_update;
    if (other.ttl_seconds) ttl_seconds = other.ttl_seconds;
    if (other.timeout_seconds) timeout_seconds = other.timeout_seconds;

    // Mirrors: other overrides per prefix
    for (const auto& [k, v] : other.mirrors) {
        mirrors[k] = v;
    }
    for (const auto& [k, v] : other.named_remotes) {
        named_remotes[k] = v;
    }

    if (other.log_level) log_level = other.log_level;
}

Config Config::effective(const std::optional<Config>& global,
                         const std::optional<Config>& project,
                         const std::optional<Config>& env) {
    Config result;
    if (global.has_value()) result.merge(global.value());
    if (project.has_value()) result.merge(project.value());
    if (env.has_value()) result.merge(env.value());
    return result;
}

ResolverConfig Config::resolve(const std::string& project_root) const {
    ResolverConfig rc;
    fs::path base = project_root.empty() ? fs::current_path() : fs::path(project_root);
    rc.project_root = base.lexically_normal().string();

    auto absolute = [&](const std::string& p) {
        fs::path expanded = expand_home(p);
        if (expanded.is_relative()) expanded = base / expanded;
        return expanded.lexically_normal().string();
    };

    if (paths) {
        for (const auto& p : *paths) rc.explicit_paths.push_back(absolute(p));
    }
    if (remotes) rc.remotes = *remotes;
    rc.named_remotes = named_remotes;
    rc.mode = mode.value_or(DiscoveryMode::Normal);
    rc.user_root = absolute(user_root.value_or("~/.bmad"));
    rc.include_user = include_user.value_or(true);
    rc.max_depth = max_depth.value_or(3);
    rc.exclude_dirs = exclude.value_or(ResolverConfig::default_excludes());

    rc.cache.root = cache_dir ? absolute(*cache_dir)
                              : (fs::path(rc.user_root) / "cache" / "git").string();
    rc.cache.auto_update = auto_update.value_or(true);
    rc.cache.ttl_seconds = ttl_seconds.value_or(3600);
    rc.cache.timeout_seconds = timeout_seconds.value_or(120);
    rc.cache.mirrors = mirrors;

    rc.log_level = log_level.value_or(log::Info);
    return rc;
}

// ---------------------------------------------------------------------------
// Discovery of config files
// ---------------------------------------------------------------------------

std::string global_config_path() {
    const char* home = std::getenv("HOME");
    if (!home) return "";
    return std::string(home) + "/.bmr/config.toml";
}

std::string project_config_path(const std::string& project_root) {
    return (fs::path(project_root) / ".bmr.toml").string();
}

Result<ResolverConfig> load_effective_config(const std::string& project_root) {
    std::optional<Config> global;
    std::optional<Config> project;
    std::error_code ec;

    std::string gpath = global_config_path();
    if (!gpath.empty() && fs::is_regular_file(gpath, ec)) {
        auto g = Config::load(gpath);
        if (g.is_err()) return std::move(g).error();
        global = std::move(g).value();
    }

    std::string ppath = project_config_path(project_root);
    if (fs::is_regular_file(ppath, ec)) {
        auto p = Config::load(ppath);
        if (p.is_err()) return std::move(p).error();
        project = std::move(p).value();
    }

    auto env = Config::from_env();
    if (env.is_err()) return std::move(env).error();

    Config eff = Config::effective(global, project, env.value());
    return Result<ResolverConfig>::ok(eff.resolve(project_root));
}

} // namespace bmr
