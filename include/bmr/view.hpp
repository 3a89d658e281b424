#pragma once

#include <bmr/result.hpp>
#include <bmr/inventory.hpp>
#include <bmr/resolver.hpp>
#include <string>
#include <vector>

namespace bmr {

// First-wins listings: catalog order, a name already seen is skipped
std::vector<Resource> list_agents(const ResolvedCatalog& catalog);
std::vector<Resource> list_workflows(const ResolvedCatalog& catalog);
std::vector<Resource> list_tasks(const ResolvedCatalog& catalog);

// Modules in catalog order, each listed once
std::vector<std::string> list_modules(const ResolvedCatalog& catalog);

// Logical names:
//   "module/name"  first installation having the module (ModuleNotFound,
//                  then ResourceNotFound)
//   "a/b/file.md"  relative file path; last segment has an extension
//   "name"         agents, then workflows, then tasks
Result<std::string> read_resource(const ResolvedCatalog& catalog,
                                  const std::string& logical_name);

// Bytes of a file below the installation root. Absolute paths and paths
// leaving the root (lexically or through symlinks) are PathTraversalRejected.
Result<std::string> read_resource_by_path(const Installation& installation,
                                          const std::string& relative_path);

// Content of a listed resource, with the same containment check
Result<std::string> read_resource(const Resource& resource);

} // namespace bmr
