#include <bmr/view.hpp>
#include <bmr/log.hpp>

#include <filesystem>
#include <fstream>
#include <set>
#include <sstream>

namespace fs = std::filesystem;

namespace bmr {

static std::vector<Resource> first_wins(const ResolvedCatalog& catalog, ResourceKind kind) {
    std::vector<Resource> out;
    std::set<std::string> seen;
    for (size_t i = 0; i < catalog.installations.size(); ++i) {
        Inventory inv = build_inventory(catalog.installations[i], i);
        for (const auto& r : inv.of_kind(kind)) {
            if (seen.insert(r.name).second) out.push_back(r);
        }
    }
    return out;
}

std::vector<Resource> list_agents(const ResolvedCatalog& catalog) {
    return first_wins(catalog, ResourceKind::Agent);
}

std::vector<Resource> list_workflows(const ResolvedCatalog& catalog) {
    return first_wins(catalog, ResourceKind::Workflow);
}

std::vector<Resource> list_tasks(const ResolvedCatalog& catalog) {
    return first_wins(catalog, ResourceKind::Task);
}

std::vector<std::string> list_modules(const ResolvedCatalog& catalog) {
    std::vector<std::string> out;
    std::set<std::string> seen;
    for (size_t i = 0; i < catalog.installations.size(); ++i) {
        Inventory inv = build_inventory(catalog.installations[i], i);
        for (const auto& m : inv.modules) {
            if (seen.insert(m).second) out.push_back(m);
        }
    }
    return out;
}

// ---------------------------------------------------------------------------
// Reading
// ---------------------------------------------------------------------------

static Result<std::string> read_contained(const std::string& base_dir,
                                          const std::string& relative_path) {
    if (relative_path.empty()) {
        return BmrError{BmrError::ResourceNotFound, "empty resource path"};
    }
    fs::path rel(relative_path);
    if (rel.is_absolute() || rel.has_root_name() || rel.has_root_directory()) {
        return BmrError{BmrError::PathTraversalRejected,
            "absolute path rejected: " + relative_path};
    }
    fs::path normal = rel.lexically_normal();
    if (!normal.empty() && *normal.begin() == "..") {
        return BmrError{BmrError::PathTraversalRejected,
            "path leaves the installation root: " + relative_path};
    }

    std::error_code ec;
    fs::path root = fs::weakly_canonical(base_dir, ec);
    if (ec) {
        return BmrError{BmrError::IO,
            "cannot resolve " + base_dir + ": " + ec.message()};
    }
    fs::path full = root / normal;
    if (!fs::exists(full, ec)) {
        return BmrError{BmrError::ResourceNotFound,
            "no such file: " + relative_path, "", base_dir, 0};
    }

    fs::path real = fs::weakly_canonical(full, ec);
    if (ec) {
        return BmrError{BmrError::IO,
            "cannot resolve " + full.string() + ": " + ec.message()};
    }
    fs::path inside = real.lexically_relative(root);
    if (inside.empty() || *inside.begin() == "..") {
        return BmrError{BmrError::PathTraversalRejected,
            "path resolves outside the installation root: " + relative_path};
    }
    if (!fs::is_regular_file(real, ec)) {
        return BmrError{BmrError::ResourceNotFound,
            "not a regular file: " + relative_path, "", base_dir, 0};
    }

    std::ifstream in(real, std::ios::binary);
    if (!in.is_open()) {
        return BmrError{BmrError::IO, "cannot open " + real.string()};
    }
    std::ostringstream ss;
    ss << in.rdbuf();
    return Result<std::string>::ok(ss.str());
}

Result<std::string> read_resource_by_path(const Installation& installation,
                                          const std::string& relative_path) {
    return read_contained(installation.root_path, relative_path);
}

Result<std::string> read_resource(const Resource& resource) {
    return read_contained(resource.base_dir, resource.relative_path);
}

static bool last_segment_has_extension(const std::string& name) {
    size_t slash = name.find_last_of('/');
    std::string last = slash == std::string::npos ? name : name.substr(slash + 1);
    size_t dot = last.find_last_of('.');
    return dot != std::string::npos && dot > 0 && dot + 1 < last.size();
}

Result<std::string> read_resource(const ResolvedCatalog& catalog,
                                  const std::string& logical_name) {
    if (logical_name.empty()) {
        return BmrError{BmrError::InvalidArg, "empty resource name"};
    }

    // relative file path
    if (last_segment_has_extension(logical_name)) {
        BmrError missing{BmrError::ResourceNotFound,
            "no installation contains " + logical_name};
        for (const auto& inst : catalog.installations) {
            auto r = read_resource_by_path(inst, logical_name);
            if (r.is_ok()) return r;
            if (r.error().code != BmrError::ResourceNotFound) return r;
            missing.with_context(inst.root_path + ": not found");
        }
        return missing;
    }

    // module/name
    size_t slash = logical_name.find('/');
    if (slash != std::string::npos) {
        std::string module = logical_name.substr(0, slash);
        std::string name = logical_name.substr(slash + 1);
        for (size_t i = 0; i < catalog.installations.size(); ++i) {
            Inventory inv = build_inventory(catalog.installations[i], i);
            if (!inv.has_module(module)) continue;

            for (ResourceKind kind : {ResourceKind::Agent, ResourceKind::Workflow,
                                      ResourceKind::Task}) {
                for (const auto& r : inv.of_kind(kind)) {
                    if (r.module == module && r.name == name) {
                        log::debug("%s -> %s", logical_name.c_str(), r.absolute_path().c_str());
                        return read_resource(r);
                    }
                }
            }
            return BmrError{BmrError::ResourceNotFound,
                "module '" + module + "' has no resource named '" + name + "'",
                "", catalog.installations[i].root_path, 0};
        }
        BmrError err{BmrError::ModuleNotFound,
            "no installation provides module '" + module + "'"};
        for (const auto& m : list_modules(catalog)) {
            err.with_context("available module: " + m);
        }
        return err;
    }

    // bare name
    for (ResourceKind kind : {ResourceKind::Agent, ResourceKind::Workflow,
                              ResourceKind::Task}) {
        for (const auto& r : first_wins(catalog, kind)) {
            if (r.name == logical_name) {
                log::debug("%s -> %s (%s)", logical_name.c_str(),
                           r.absolute_path().c_str(), resource_kind_name(kind));
                return read_resource(r);
            }
        }
    }
    return BmrError{BmrError::ResourceNotFound,
        "no agent, workflow, or task named '" + logical_name + "'"};
}

} // namespace bmr
