#pragma once

#include <bmr/installation.hpp>
#include <string>
#include <vector>

namespace bmr {

enum class ResourceKind { Agent, Workflow, Task };

const char* resource_kind_name(ResourceKind k);

// A named file in an installation. Content is read on demand.
struct Resource {
    std::string name;
    std::string module;
    ResourceKind kind = ResourceKind::Agent;
    std::string relative_path;       // relative to base_dir, '/'-separated
    std::string base_dir;            // installation root, or an expansion pack dir
    std::string installation_root;
    Source source = Source::Explicit;
    size_t installation_index = 0;   // position in the catalog

    std::string absolute_path() const;
};

// Contents of one installation, in a stable order
struct Inventory {
    std::vector<std::string> modules;
    std::vector<Resource> agents;
    std::vector<Resource> workflows;
    std::vector<Resource> tasks;
    std::vector<std::string> warnings;

    bool has_module(const std::string& module) const;
    const std::vector<Resource>& of_kind(ResourceKind k) const;
};

// v6: modules are root subdirectories not starting with '_' or '.';
//     _cfg/*-manifest.csv rows first, then files the manifests do not name.
// v4: module from the root name (.bmad-core -> core, .bmad-x -> x, else core);
//     agents/*.md, workflows/*.yaml|yml, tasks/*.md, install-manifest files,
//     and sibling .bmad-<pack> directories for expansion_packs.
// custom: one module named after the root directory, same file rules as v4.
Inventory build_inventory(const Installation& installation, size_t index = 0);

// Module name a v4 directory contributes
std::string v4_module_name(const std::string& dir_name);

} // namespace bmr
