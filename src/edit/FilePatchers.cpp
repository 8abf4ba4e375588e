#include "edit/FilePatchers.h"
#include "core/Errors.h"
#include "utils/AtomicFile.h"
#include "utils/Logger.h"
#include <algorithm>
#include <cctype>
#include <filesystem>
#include <sstream>
#include <vector>
#include <yaml-cpp/yaml.h>
#include <toml++/toml.hpp>

namespace fs = std::filesystem;

namespace {

std::vector<std::string> splitLines(const std::string& raw) {
    std::vector<std::string> lines;
    std::istringstream in(raw);
    std::string line;
    while (std::getline(in, line)) {
        if (!line.empty() && line.back() == '\r') line.pop_back();
        lines.push_back(line);
    }
    return lines;
}

std::string joinLines(const std::vector<std::string>& lines) {
    std::string out;
    for (size_t i = 0; i < lines.size(); ++i) {
        if (i > 0) out += "\n";
        out += lines[i];
    }
    return out;
}

std::string trim(const std::string& s) {
    size_t b = s.find_first_not_of(" \t");
    if (b == std::string::npos) return "";
    size_t e = s.find_last_not_of(" \t");
    return s.substr(b, e - b + 1);
}

// "  KEY = v" matches KEY
bool isEnvAssignment(const std::string& line, const std::string& key) {
    size_t pos = line.find_first_not_of(" \t");
    if (pos == std::string::npos || line.compare(pos, key.size(), key) != 0) {
        return false;
    }
    pos = line.find_first_not_of(" \t", pos + key.size());
    return pos != std::string::npos && line[pos] == '=';
}

size_t headingDepth(const std::string& line) {
    size_t n = 0;
    while (n < line.size() && line[n] == '#') ++n;
    return n;
}

std::vector<std::string> splitDotPath(const std::string& dotPath) {
    if (dotPath.empty()) {
        throw CortexError(ErrorKind::InvalidEdit, "Config path must not be empty");
    }
    std::vector<std::string> keys;
    std::stringstream ss(dotPath);
    std::string key;
    while (std::getline(ss, key, '.')) keys.push_back(key);
    return keys;
}

YAML::Node toYaml(const nlohmann::json& v) {
    if (v.is_boolean()) return YAML::Node(v.get<bool>());
    if (v.is_number_unsigned()) return YAML::Node(v.get<uint64_t>());
    if (v.is_number_integer()) return YAML::Node(v.get<int64_t>());
    if (v.is_number_float()) return YAML::Node(v.get<double>());
    if (v.is_string()) return YAML::Node(v.get<std::string>());
    if (v.is_array()) {
        YAML::Node seq(YAML::NodeType::Sequence);
        for (const auto& item : v) seq.push_back(toYaml(item));
        return seq;
    }
    if (v.is_object()) {
        YAML::Node map(YAML::NodeType::Map);
        for (auto it = v.begin(); it != v.end(); ++it) {
            map[it.key()] = toYaml(it.value());
        }
        return map;
    }
    return YAML::Node(YAML::NodeType::Null);
}

void pushToml(toml::array& arr, const nlohmann::json& v);
void insertToml(toml::table& tbl, const std::string& key, const nlohmann::json& v);

toml::array toTomlArray(const nlohmann::json& v) {
    toml::array arr;
    for (const auto& item : v) pushToml(arr, item);
    return arr;
}

toml::table toTomlTable(const nlohmann::json& v) {
    toml::table tbl;
    for (auto it = v.begin(); it != v.end(); ++it) insertToml(tbl, it.key(), it.value());
    return tbl;
}

void pushToml(toml::array& arr, const nlohmann::json& v) {
    if (v.is_boolean()) arr.push_back(v.get<bool>());
    else if (v.is_number_integer()) arr.push_back(v.get<int64_t>());
    else if (v.is_number_float()) arr.push_back(v.get<double>());
    else if (v.is_string()) arr.push_back(v.get<std::string>());
    else if (v.is_array()) arr.push_back(toTomlArray(v));
    else if (v.is_object()) arr.push_back(toTomlTable(v));
    else arr.push_back(std::string("null"));
}

void insertToml(toml::table& tbl, const std::string& key, const nlohmann::json& v) {
    if (v.is_boolean()) tbl.insert_or_assign(key, v.get<bool>());
    else if (v.is_number_integer()) tbl.insert_or_assign(key, v.get<int64_t>());
    else if (v.is_number_float()) tbl.insert_or_assign(key, v.get<double>());
    else if (v.is_string()) tbl.insert_or_assign(key, v.get<std::string>());
    else if (v.is_array()) tbl.insert_or_assign(key, toTomlArray(v));
    else if (v.is_object()) tbl.insert_or_assign(key, toTomlTable(v));
    else tbl.insert_or_assign(key, std::string("null"));
}

} // namespace

namespace FilePatchers {

std::string patchEnv(const std::string& file, Action action, const std::string& key, const std::string& value) {
    if (key.empty()) {
        throw CortexError(ErrorKind::InvalidEdit, "Env key must not be empty");
    }
    std::vector<std::string> lines = splitLines(AtomicFile::read(file));

    if (action == Action::Set) {
        std::string assignment = key + "=" + value;
        auto it = std::find_if(lines.begin(), lines.end(),
                               [&](const std::string& l) { return isEnvAssignment(l, key); });
        if (it != lines.end()) {
            *it = assignment;
        } else {
            lines.push_back(assignment);
        }
    } else {
        lines.erase(std::remove_if(lines.begin(), lines.end(),
                                   [&](const std::string& l) { return isEnvAssignment(l, key); }),
                    lines.end());
    }

    AtomicFile::write(file, joinLines(lines) + "\n");
    Logger::getInstance().action("Patched env key " + key + " in " + file);
    return "Patched .env '" + file + "' for key '" + key + "'";
}

std::string patchDocs(const std::string& file, Action action, const std::string& section,
                      const std::string& content, int headingLevel) {
    size_t level = static_cast<size_t>(std::clamp(headingLevel, 1, 6));
    std::string heading = std::string(level, '#') + " " + trim(section);
    std::vector<std::string> lines = splitLines(AtomicFile::read(file));

    auto startIt = std::find_if(lines.begin(), lines.end(),
                                [&](const std::string& l) { return trim(l) == heading; });
    if (startIt == lines.end()) {
        throw CortexError(ErrorKind::NotFound, "Section '" + section + "' (level " + std::to_string(level) +
                                               ") not found in " + file);
    }
    size_t start = static_cast<size_t>(startIt - lines.begin());

    size_t end = lines.size();
    for (size_t i = start + 1; i < lines.size(); ++i) {
        size_t depth = headingDepth(lines[i]);
        if (depth > 0 && depth <= level) {
            end = i;
            break;
        }
    }

    std::string body = (action == Action::Delete) ? std::string() : content;
    std::vector<std::string> bodyLines = splitLines(body);

    std::vector<std::string> out(lines.begin(), lines.begin() + static_cast<long>(start) + 1);
    if (body.empty() || body.front() != '\n') {
        out.push_back("");
    }
    out.insert(out.end(), bodyLines.begin(), bodyLines.end());
    if (end < lines.size()) {
        out.push_back("");
        out.insert(out.end(), lines.begin() + static_cast<long>(end), lines.end());
    }

    AtomicFile::write(file, joinLines(out) + "\n");
    Logger::getInstance().action("Replaced section '" + section + "' in " + file);
    return "Replaced section '" + section + "' in '" + file + "' (" + std::to_string(end - start - 1) +
           " lines -> " + std::to_string(bodyLines.size()) + " lines)";
}

std::string patchJsonConfig(const std::string& file, Action action, const std::string& dotPath,
                            const nlohmann::json& value) {
    std::vector<std::string> keys = splitDotPath(dotPath);

    nlohmann::json root;
    try {
        root = nlohmann::json::parse(AtomicFile::read(file));
    } catch (const nlohmann::json::parse_error& e) {
        throw CortexError(ErrorKind::IoError, "Parsing JSON in " + file + ": " + e.what());
    }

    nlohmann::json* cursor = &root;
    for (size_t i = 0; i + 1 < keys.size(); ++i) {
        if (!cursor->is_object() || !cursor->contains(keys[i])) {
            throw CortexError(ErrorKind::NotFound, "Key '" + keys[i] + "' not found in JSON");
        }
        cursor = &(*cursor)[keys[i]];
    }
    if (!cursor->is_object()) {
        throw CortexError(ErrorKind::InvalidEdit, "Parent of '" + dotPath + "' is not a JSON object");
    }

    if (action == Action::Set) {
        (*cursor)[keys.back()] = value;
    } else {
        cursor->erase(keys.back());
    }

    AtomicFile::write(file, root.dump(2) + "\n");
    Logger::getInstance().action("Patched JSON " + file + " at " + dotPath);
    return "Patched JSON '" + file + "' at '" + dotPath + "'";
}

std::string patchYamlConfig(const std::string& file, Action action, const std::string& dotPath,
                            const nlohmann::json& value) {
    std::vector<std::string> keys = splitDotPath(dotPath);

    YAML::Node root;
    try {
        root = YAML::Load(AtomicFile::read(file));
    } catch (const YAML::Exception& e) {
        throw CortexError(ErrorKind::IoError, "Parsing YAML in " + file + ": " + e.what());
    }
    if (root.IsNull()) {
        root = YAML::Node(YAML::NodeType::Map);
    }

    // Node assignment copies content; reset() rebinds the handle
    YAML::Node cursor = root;
    for (size_t i = 0; i + 1 < keys.size(); ++i) {
        const YAML::Node next = cursor.IsMap() ? static_cast<const YAML::Node&>(cursor)[keys[i]] : YAML::Node();
        if (!cursor.IsMap() || !next.IsDefined()) {
            throw CortexError(ErrorKind::NotFound, "Key '" + keys[i] + "' not found in YAML");
        }
        cursor.reset(next);
    }
    if (!cursor.IsMap()) {
        throw CortexError(ErrorKind::InvalidEdit, "Parent of '" + dotPath + "' is not a YAML mapping");
    }

    if (action == Action::Set) {
        cursor[keys.back()] = toYaml(value);
    } else {
        cursor.remove(keys.back());
    }

    YAML::Emitter out;
    out << root;
    if (!out.good()) {
        throw CortexError(ErrorKind::IoError, "Serializing YAML for " + file + ": " + out.GetLastError());
    }
    AtomicFile::write(file, std::string(out.c_str()) + "\n");
    Logger::getInstance().action("Patched YAML " + file + " at " + dotPath);
    return "Patched YAML '" + file + "' at '" + dotPath + "'";
}

std::string patchTomlConfig(const std::string& file, Action action, const std::string& dotPath,
                            const nlohmann::json& value) {
    std::vector<std::string> keys = splitDotPath(dotPath);

    toml::table root;
    try {
        root = toml::parse(AtomicFile::read(file), std::string_view(file));
    } catch (const toml::parse_error& e) {
        throw CortexError(ErrorKind::IoError, "Parsing TOML in " + file + ": " + std::string(e.description()));
    }

    toml::table* cursor = &root;
    for (size_t i = 0; i + 1 < keys.size(); ++i) {
        toml::node* next = cursor->get(keys[i]);
        if (!next) {
            throw CortexError(ErrorKind::NotFound, "Key '" + keys[i] + "' not found in TOML");
        }
        cursor = next->as_table();
        if (!cursor) {
            throw CortexError(ErrorKind::InvalidEdit, "Parent of '" + dotPath + "' is not a TOML table");
        }
    }

    if (action == Action::Set) {
        insertToml(*cursor, keys.back(), value);
    } else {
        cursor->erase(keys.back());
    }

    std::ostringstream out;
    out << root;
    std::string text = out.str();
    if (text.empty() || text.back() != '\n') text += "\n";
    AtomicFile::write(file, text);
    Logger::getInstance().action("Patched TOML " + file + " at " + dotPath);
    return "Patched TOML '" + file + "' at '" + dotPath + "'";
}

std::string patchConfig(const std::string& file, Action action, const std::string& dotPath,
                        const nlohmann::json& value) {
    std::string ext = fs::u8path(file).extension().u8string();
    std::transform(ext.begin(), ext.end(), ext.begin(), [](unsigned char c) { return std::tolower(c); });
    if (ext == ".json") {
        return patchJsonConfig(file, action, dotPath, value);
    }
    if (ext == ".yaml" || ext == ".yml") {
        return patchYamlConfig(file, action, dotPath, value);
    }
    if (ext == ".toml") {
        return patchTomlConfig(file, action, dotPath, value);
    }
    throw CortexError(ErrorKind::InvalidEdit, "Unsupported config file extension: " + (ext.empty() ? std::string("(none)") : ext));
}

} // namespace FilePatchers
