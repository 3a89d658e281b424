#include <bmr/inventory.hpp>
#include <bmr/log.hpp>
#include <bmr/manifest.hpp>

#include <algorithm>
#include <filesystem>
#include <set>

namespace fs = std::filesystem;

namespace bmr {

const char* resource_kind_name(ResourceKind k) {
    switch (k) {
        case ResourceKind::Agent:    return "agent";
        case ResourceKind::Workflow: return "workflow";
        case ResourceKind::Task:     return "task";
    }
    return "unknown";
}

std::string Resource::absolute_path() const {
    return (fs::path(base_dir) / relative_path).string();
}

bool Inventory::has_module(const std::string& module) const {
    return std::find(modules.begin(), modules.end(), module) != modules.end();
}

const std::vector<Resource>& Inventory::of_kind(ResourceKind k) const {
    switch (k) {
        case ResourceKind::Agent:    return agents;
        case ResourceKind::Workflow: return workflows;
        case ResourceKind::Task:     return tasks;
    }
    return agents;
}

std::string v4_module_name(const std::string& dir_name) {
    if (dir_name.compare(0, 6, ".bmad-") == 0 && dir_name.size() > 6) {
        return dir_name.substr(6);
    }
    return "core";
}

// ---------------------------------------------------------------------------
// Helpers
// ---------------------------------------------------------------------------

namespace {

std::string lower(std::string s) {
    for (auto& c : s) c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    return s;
}

bool has_ext(const fs::path& p, std::initializer_list<const char*> exts) {
    std::string e = lower(p.extension().string());
    for (const char* x : exts) {
        if (e == x) return true;
    }
    return false;
}

bool exists_file(const fs::path& p) {
    std::error_code ec;
    return fs::is_regular_file(p, ec);
}

// Files directly in `dir`, sorted
std::vector<fs::path> list_files(const fs::path& dir) {
    std::vector<fs::path> out;
    std::error_code ec;
    fs::directory_iterator it(dir, ec);
    if (ec) return out;
    for (; it != fs::directory_iterator(); it.increment(ec)) {
        if (ec) break;
        std::error_code fec;
        if (it->is_regular_file(fec)) out.push_back(it->path());
    }
    std::sort(out.begin(), out.end());
    return out;
}

// Files below `dir` (recursively, skipping _cfg), sorted
std::vector<fs::path> list_files_recursive(const fs::path& dir) {
    std::vector<fs::path> out;
    std::error_code ec;
    fs::recursive_directory_iterator it(dir, fs::directory_options::skip_permission_denied, ec);
    if (ec) return out;
    for (; it != fs::recursive_directory_iterator(); it.increment(ec)) {
        if (ec) break;
        std::error_code fec;
        if (it->is_directory(fec) && it->path().filename() == "_cfg") {
            it.disable_recursion_pending();
            continue;
        }
        if (it->is_regular_file(fec)) out.push_back(it->path());
    }
    std::sort(out.begin(), out.end());
    return out;
}

// Subdirectories of `dir`, sorted
std::vector<fs::path> list_dirs(const fs::path& dir) {
    std::vector<fs::path> out;
    std::error_code ec;
    fs::directory_iterator it(dir, ec);
    if (ec) return out;
    for (; it != fs::directory_iterator(); it.increment(ec)) {
        if (ec) break;
        std::error_code dec;
        if (it->is_directory(dec)) out.push_back(it->path());
    }
    std::sort(out.begin(), out.end());
    return out;
}

bool contained(const fs::path& base, const std::string& relative_path) {
    std::error_code ec;
    fs::path real_base = fs::weakly_canonical(base, ec);
    if (ec) return false;
    fs::path real = fs::weakly_canonical(base / relative_path, ec);
    if (ec) return false;
    fs::path inside = real.lexically_relative(real_base);
    return !inside.empty() && *inside.begin() != "..";
}

std::string rel(const fs::path& p, const fs::path& base) {
    return p.lexically_relative(base).generic_string();
}

class Builder {
public:
    Builder(const Installation& inst, size_t index) : inst_(inst), index_(index) {}

    Inventory inv;

    void add_module(const std::string& m) {
        if (!inv.has_module(m)) inv.modules.push_back(m);
    }

    // Adds unless the same file is already listed or it resolves, through
    // symlinks, to somewhere outside `base`
    void add(ResourceKind kind, const std::string& name, const std::string& module,
             const fs::path& base, const std::string& relative_path) {
        std::string key = (base / relative_path).lexically_normal().string();
        if (files_.count(key)) return;
        if (!contained(base, relative_path)) {
            warn(std::string(resource_kind_name(kind)) + " '" + name + "' (" +
                 relative_path + ") resolves outside " + base.string() + "; skipped");
            return;
        }
        files_.insert(key);

        Resource r;
        r.name = name;
        r.module = module;
        r.kind = kind;
        r.relative_path = relative_path;
        r.base_dir = base.string();
        r.installation_root = inst_.root_path;
        r.source = inst_.source;
        r.installation_index = index_;
        add_module(module);
        list(kind).push_back(std::move(r));
    }

    bool listed(const fs::path& absolute) const {
        return files_.count(absolute.lexically_normal().string()) > 0;
    }

    void warn(const std::string& msg) {
        log::debug("%s: %s", inst_.root_path.c_str(), msg.c_str());
        inv.warnings.push_back(msg);
    }

private:
    const Installation& inst_;
    size_t index_;
    std::set<std::string> files_;

    std::vector<Resource>& list(ResourceKind k) {
        switch (k) {
            case ResourceKind::Agent:    return inv.agents;
            case ResourceKind::Workflow: return inv.workflows;
            case ResourceKind::Task:     return inv.tasks;
        }
        return inv.agents;
    }
};

std::string workflow_name(const fs::path& file, const std::string& fallback) {
    auto name = read_yaml_name(file.string());
    if (name.is_ok() && !name.value().empty()) return name.value();
    return fallback;
}

// ---------------------------------------------------------------------------
// v6
// ---------------------------------------------------------------------------

void inventory_v6(Builder& b, const fs::path& root) {
    for (const auto& dir : list_dirs(root)) {
        std::string name = dir.filename().string();
        if (name.empty() || name[0] == '_' || name[0] == '.') continue;
        b.add_module(name);
    }

    struct ManifestFile {
        const char* csv;
        ResourceKind kind;
    };
    for (const auto& src : {ManifestFile{"agent-manifest.csv", ResourceKind::Agent},
                            ManifestFile{"workflow-manifest.csv", ResourceKind::Workflow},
                            ManifestFile{"task-manifest.csv", ResourceKind::Task}}) {
        fs::path csv = root / "_cfg" / src.csv;
        if (!exists_file(csv)) continue;

        auto records = read_resource_manifest(csv.string());
        if (records.is_err()) {
            b.warn("unreadable " + csv.string() + ": " + records.error().message);
            continue;
        }
        for (const auto& rec : records.value()) {
            fs::path p = fs::path(rec.path).lexically_normal();
            if (p.is_absolute() || p.empty() || *p.begin() == "..") {
                b.warn(std::string(src.csv) + ": path '" + rec.path + "' leaves the installation");
                continue;
            }
            if (src.kind == ResourceKind::Agent && lower(p.filename().string()) == "readme.md") {
                continue;
            }
            if (!exists_file(root / p)) {
                b.warn(std::string(src.csv) + ": " + rec.name + " -> " + rec.path + " (no such file)");
                continue;
            }
            std::string module = rec.module.empty() ? p.begin()->string() : rec.module;
            b.add(src.kind, rec.name, module, root, p.generic_string());
        }
    }

    // Files the manifests do not name
    for (const auto& mod : std::vector<std::string>(b.inv.modules)) {
        fs::path mdir = root / mod;

        for (const auto& f : list_files_recursive(mdir / "agents")) {
            if (!has_ext(f, {".md"}) || lower(f.filename().string()) == "readme.md") continue;
            if (b.listed(f)) continue;
            b.add(ResourceKind::Agent, f.stem().string(), mod, root, rel(f, root));
        }

        for (const auto& wdir : list_dirs(mdir / "workflows")) {
            if (wdir.filename() == "_cfg") continue;
            fs::path f = wdir / "workflow.yaml";
            if (!exists_file(f)) f = wdir / "workflow.yml";
            if (!exists_file(f) || b.listed(f)) continue;
            b.add(ResourceKind::Workflow, workflow_name(f, wdir.filename().string()),
                  mod, root, rel(f, root));
        }

        for (const auto& f : list_files_recursive(mdir / "tasks")) {
            if (!has_ext(f, {".md", ".xml"}) || b.listed(f)) continue;
            b.add(ResourceKind::Task, f.stem().string(), mod, root, rel(f, root));
        }
    }
}

// ---------------------------------------------------------------------------
// v4 and custom
// ---------------------------------------------------------------------------

void inventory_flat(Builder& b, const fs::path& base, const std::string& module) {
    b.add_module(module);
    for (const auto& f : list_files(base / "agents")) {
        if (!has_ext(f, {".md"}) || lower(f.filename().string()) == "readme.md") continue;
        b.add(ResourceKind::Agent, f.stem().string(), module, base, rel(f, base));
    }
    for (const auto& f : list_files(base / "workflows")) {
        if (!has_ext(f, {".yaml", ".yml"})) continue;
        b.add(ResourceKind::Workflow, f.stem().string(), module, base, rel(f, base));
    }
    for (const auto& f : list_files(base / "tasks")) {
        if (!has_ext(f, {".md"})) continue;
        b.add(ResourceKind::Task, f.stem().string(), module, base, rel(f, base));
    }
}

// install-manifest.yaml `files:` entries such as ".bmad-core/agents/dev.md"
void inventory_v4_files(Builder& b, const fs::path& root, const std::string& root_module,
                        const std::vector<std::string>& files) {
    for (const auto& entry : files) {
        fs::path p = fs::path(entry).lexically_normal();
        if (p.is_absolute() || p.empty() || *p.begin() == "..") continue;

        std::vector<std::string> parts;
        for (const auto& seg : p) parts.push_back(seg.string());

        size_t cat = 0;
        while (cat < parts.size() && parts[cat] != "agents" &&
               parts[cat] != "workflows" && parts[cat] != "tasks") {
            ++cat;
        }
        if (cat + 1 >= parts.size()) continue;

        fs::path file = p.filename();
        ResourceKind kind;
        if (parts[cat] == "agents" && has_ext(file, {".md"})) {
            kind = ResourceKind::Agent;
        } else if (parts[cat] == "workflows" && has_ext(file, {".yaml", ".yml"})) {
            kind = ResourceKind::Workflow;
        } else if (parts[cat] == "tasks" && has_ext(file, {".md"})) {
            kind = ResourceKind::Task;
        } else {
            continue;
        }

        // Entries are relative to the install dir (parent of .bmad-core) or to the root
        std::string module = root_module;
        fs::path base = root;
        fs::path relative;
        if (cat > 0 && parts[0].compare(0, 6, ".bmad-") == 0) {
            module = v4_module_name(parts[0]);
            base = root.parent_path() / parts[0];
            for (size_t i = 1; i < parts.size(); ++i) relative /= parts[i];
        } else {
            relative = p;
        }
        if (!exists_file(base / relative)) continue;

        // Sibling directories count only when listed as expansion packs
        if (base != root && !b.inv.has_module(module)) continue;
        b.add(kind, file.stem().string(), module, base, relative.generic_string());
    }
}

void inventory_v4(Builder& b, const fs::path& root) {
    std::string module = v4_module_name(root.filename().string());
    inventory_flat(b, root, module);

    fs::path manifest = root / "install-manifest.yaml";
    if (!exists_file(manifest)) return;

    auto m = read_v4_manifest(manifest.string());
    if (m.is_err()) {
        b.warn("unreadable " + manifest.string() + ": " + m.error().message);
        return;
    }

    for (const auto& pack : m.value().expansion_packs) {
        std::string dir_name = pack.compare(0, 5, "bmad-") == 0 ? "." + pack : ".bmad-" + pack;
        fs::path pack_dir = root.parent_path() / dir_name;
        std::error_code ec;
        if (!fs::is_directory(pack_dir, ec)) {
            b.warn("expansion pack '" + pack + "' not found at " + pack_dir.string());
            continue;
        }
        inventory_flat(b, pack_dir, v4_module_name(dir_name));
    }

    inventory_v4_files(b, root, module, m.value().files);
}

} // namespace

Inventory build_inventory(const Installation& installation, size_t index) {
    Builder b(installation, index);
    fs::path root(installation.root_path);

    switch (installation.kind) {
        case InstallKind::V6:
            inventory_v6(b, root);
            break;
        case InstallKind::V4:
            inventory_v4(b, root);
            break;
        case InstallKind::Custom:
            inventory_flat(b, root, root.filename().string());
            break;
        case InstallKind::Unknown:
            break;
    }
    return std::move(b.inv);
}

} // namespace bmr
