#pragma once

#include <bmr/result.hpp>
#include <map>
#include <string>
#include <vector>

namespace bmr {

// _cfg/manifest.yaml of a v6 installation
struct V6Manifest {
    std::string version;                  // installation.version, may be empty
    std::string install_date;             // installation.installDate
    std::vector<std::string> modules;     // modules[].name
    std::vector<std::string> ides;
};

// install-manifest.yaml of a v4 installation
struct V4Manifest {
    std::string version;
    std::string install_type;
    std::string installed_at;
    std::vector<std::string> files;            // files[] (string or {path: ...})
    std::vector<std::string> expansion_packs;
};

// Manifest errors carry code Manifest and the file path
Result<V6Manifest> read_v6_manifest(const std::string& path);
Result<V4Manifest> read_v4_manifest(const std::string& path);

// core-config.yaml `version` ("" when absent)
Result<std::string> read_core_config_version(const std::string& path);

// Top-level `name` scalar of a YAML document ("" when absent)
Result<std::string> read_yaml_name(const std::string& path);

// CSV with a header row. Quoted fields ("a,b", "say ""hi""") may span lines;
// fields are trimmed and rows with only empty fields are dropped.
struct CsvTable {
    std::vector<std::string> header;
    std::vector<std::map<std::string, std::string>> rows;

    bool has_column(const std::string& name) const;
};

Result<CsvTable> parse_csv(const std::string& text);
Result<CsvTable> read_csv(const std::string& path);

// One row of agent-/workflow-/task-manifest.csv
struct ManifestRecord {
    std::string name;
    std::string module;
    std::string path;        // leading "bmad/" stripped
};

// Requires `name` and `path` columns; `module` is optional
Result<std::vector<ManifestRecord>> read_resource_manifest(const std::string& path);

} // namespace bmr
