#include <bmr/manifest.hpp>
#include <yaml-cpp/yaml.h>

#include <fstream>
#include <sstream>

namespace bmr {

// ---------------------------------------------------------------------------
// YAML helpers
// ---------------------------------------------------------------------------

static Result<YAML::Node> load_yaml(const std::string& path) {
    try {
        return Result<YAML::Node>::ok(YAML::LoadFile(path));
    } catch (const YAML::BadFile&) {
        return BmrError{BmrError::IO, "cannot open " + path};
    } catch (const YAML::Exception& e) {
        BmrError err{BmrError::Manifest,
            std::string("YAML parse failed: ") + e.msg};
        err.file = path;
        err.line = e.mark.is_null() ? 0 : e.mark.line + 1;
        return err;
    }
}

static std::string scalar(const YAML::Node& node) {
    if (!node || !node.IsScalar()) return "";
    return node.Scalar();
}

static std::vector<std::string> scalar_list(const YAML::Node& node) {
    std::vector<std::string> out;
    if (!node || !node.IsSequence()) return out;
    for (const auto& item : node) {
        if (item.IsScalar()) out.push_back(item.Scalar());
    }
    return out;
}

static BmrError not_a_map(const std::string& path) {
    BmrError err{BmrError::Manifest, "expected a YAML mapping at top level"};
    err.file = path;
    return err;
}

Result<V6Manifest> read_v6_manifest(const std::string& path) {
    auto doc = load_yaml(path);
    if (doc.is_err()) return std::move(doc).error();
    const YAML::Node& root = doc.value();
    if (!root.IsMap()) return not_a_map(path);

    V6Manifest m;
    if (auto inst = root["installation"]; inst && inst.IsMap()) {
        m.version = scalar(inst["version"]);
        m.install_date = scalar(inst["installDate"]);
    }
    if (auto mods = root["modules"]; mods && mods.IsSequence()) {
        for (const auto& mod : mods) {
            if (mod.IsMap()) {
                std::string name = scalar(mod["name"]);
                if (!name.empty()) m.modules.push_back(name);
            } else if (mod.IsScalar()) {
                m.modules.push_back(mod.Scalar());
            }
        }
    }
    m.ides = scalar_list(root["ides"]);
    return Result<V6Manifest>::ok(std::move(m));
}

Result<V4Manifest> read_v4_manifest(const std::string& path) {
    auto doc = load_yaml(path);
    if (doc.is_err()) return std::move(doc).error();
    const YAML::Node& root = doc.value();
    if (!root.IsMap()) return not_a_map(path);

    V4Manifest m;
    m.version = scalar(root["version"]);
    m.install_type = scalar(root["install_type"]);
    m.installed_at = scalar(root["installed_at"]);
    if (auto files = root["files"]; files && files.IsSequence()) {
        for (const auto& f : files) {
            if (f.IsScalar()) {
                m.files.push_back(f.Scalar());
            } else if (f.IsMap()) {
                std::string p = scalar(f["path"]);
                if (!p.empty()) m.files.push_back(p);
            }
        }
    }
    m.expansion_packs = scalar_list(root["expansion_packs"]);
    return Result<V4Manifest>::ok(std::move(m));
}

Result<std::string> read_core_config_version(const std::string& path) {
    auto doc = load_yaml(path);
    if (doc.is_err()) return std::move(doc).error();
    const YAML::Node& root = doc.value();
    if (!root.IsMap()) return not_a_map(path);
    return Result<std::string>::ok(scalar(root["version"]));
}

Result<std::string> read_yaml_name(const std::string& path) {
    auto doc = load_yaml(path);
    if (doc.is_err()) return std::move(doc).error();
    const YAML::Node& root = doc.value();
    if (!root.IsMap()) return not_a_map(path);
    return Result<std::string>::ok(scalar(root["name"]));
}

// ---------------------------------------------------------------------------
// CSV
// ---------------------------------------------------------------------------

static std::string trim(const std::string& s) {
    size_t b = s.find_first_not_of(" \t");
    if (b == std::string::npos) return "";
    size_t e = s.find_last_not_of(" \t");
    return s.substr(b, e - b + 1);
}

bool CsvTable::has_column(const std::string& name) const {
    for (const auto& h : header) {
        if (h == name) return true;
    }
    return false;
}

Result<CsvTable> parse_csv(const std::string& text) {
    std::vector<std::vector<std::string>> records;
    std::vector<std::string> record;
    std::string field;
    bool in_quotes = false;
    bool quoted = false;
    int line = 1;
    int quote_line = 0;

    auto end_field = [&]() {
        record.push_back(quoted ? field : trim(field));
        field.clear();
        quoted = false;
    };
    auto end_record = [&]() {
        end_field();
        records.push_back(std::move(record));
        record.clear();
    };

    size_t i = 0;
    // UTF-8 byte order mark
    if (text.compare(0, 3, "\xEF\xBB\xBF") == 0) i = 3;

    for (; i < text.size(); ++i) {
        char c = text[i];
        if (in_quotes) {
            if (c == '"') {
                if (i + 1 < text.size() && text[i + 1] == '"') {
                    field.push_back('"');
                    ++i;
                } else {
                    in_quotes = false;
                }
            } else {
                if (c == '\n') ++line;
                field.push_back(c);
            }
            continue;
        }
        switch (c) {
            case '"':
                if (trim(field).empty()) {
                    field.clear();
                    in_quotes = true;
                    quoted = true;
                    quote_line = line;
                } else {
                    field.push_back(c);
                }
                break;
            case ',':
                end_field();
                break;
            case '\r':
                break;
            case '\n':
                end_record();
                ++line;
                break;
            default:
                // Whitespace after a closing quote is dropped
                if (!(quoted && (c == ' ' || c == '\t'))) field.push_back(c);
                break;
        }
    }
    if (in_quotes) {
        BmrError err{BmrError::Parse, "unterminated quoted CSV field"};
        err.line = quote_line;
        return err;
    }
    if (!field.empty() || quoted || !record.empty()) end_record();

    CsvTable table;
    size_t first = 0;
    while (first < records.size() &&
           records[first].size() == 1 && records[first][0].empty()) {
        ++first;
    }
    if (first == records.size()) {
        return Result<CsvTable>::ok(std::move(table));
    }
    table.header = records[first];

    for (size_t r = first + 1; r < records.size(); ++r) {
        const auto& rec = records[r];
        bool any = false;
        for (const auto& f : rec) {
            if (!f.empty()) { any = true; break; }
        }
        if (!any) continue;

        std::map<std::string, std::string> row;
        for (size_t c = 0; c < table.header.size(); ++c) {
            row[table.header[c]] = c < rec.size() ? rec[c] : "";
        }
        table.rows.push_back(std::move(row));
    }
    return Result<CsvTable>::ok(std::move(table));
}

Result<CsvTable> read_csv(const std::string& path) {
    std::ifstream in(path, std::ios::binary);
    if (!in.is_open()) {
        return BmrError{BmrError::IO, "cannot open " + path};
    }
    std::ostringstream ss;
    ss << in.rdbuf();
    auto table = parse_csv(ss.str());
    if (table.is_err()) table.error().file = path;
    return table;
}

Result<std::vector<ManifestRecord>> read_resource_manifest(const std::string& path) {
    auto table = read_csv(path);
    if (table.is_err()) {
        auto err = std::move(table).error();
        if (err.code == BmrError::Parse) err.code = BmrError::Manifest;
        return err;
    }
    const auto& t = table.value();
    if (!t.has_column("name") || !t.has_column("path")) {
        BmrError err{BmrError::Manifest,
            "manifest is missing the 'name' or 'path' column"};
        err.file = path;
        return err;
    }

    std::vector<ManifestRecord> out;
    for (const auto& row : t.rows) {
        ManifestRecord rec;
        rec.name = row.at("name");
        auto mod = row.find("module");
        if (mod != row.end()) rec.module = mod->second;
        rec.path = row.at("path");
        if (rec.path.compare(0, 5, "bmad/") == 0) rec.path = rec.path.substr(5);
        if (rec.name.empty() || rec.path.empty()) continue;
        out.push_back(std::move(rec));
    }
    return Result<std::vector<ManifestRecord>>::ok(std::move(out));
}

} // namespace bmr
