#include "config/YamlConfigStore.hpp"
#include "log/Registry.hpp"

#include <fstream>
#include <optional>
#include <sstream>
#include <stdexcept>
#include <string_view>
#include <vector>
#include <unistd.h>
#include <yaml-cpp/yaml.h>

namespace fs = std::filesystem;

namespace sg::config {

namespace {

constexpr std::string_view SECTION_KEY = "postgresql:";
constexpr std::string_view VERSION_KEY = "version:";

std::string_view trimRight(std::string_view s) {
    while (!s.empty() && (s.back() == ' ' || s.back() == '\t' || s.back() == '\r')) s.remove_suffix(1);
    return s;
}

size_t indentOf(const std::string_view line) {
    const auto pos = line.find_first_not_of(" \t");
    return pos == std::string_view::npos ? line.size() : pos;
}

bool isBlankOrComment(const std::string_view line) {
    const auto pos = line.find_first_not_of(" \t\r");
    return pos == std::string_view::npos || line[pos] == '#';
}

// `key:` with nothing after it but whitespace or a comment.
bool opensBlock(const std::string_view rest) {
    const auto pos = rest.find_first_not_of(" \t\r");
    return pos == std::string_view::npos || rest[pos] == '#';
}

std::string readFile(const fs::path& path) {
    if (!fs::exists(path)) return {};
    std::ifstream in(path);
    if (!in.is_open()) throw std::runtime_error("Failed to open " + path.string() + " for reading");
    std::ostringstream ss;
    ss << in.rdbuf();
    return ss.str();
}

/*
 * Rewrites the `version:` scalar of the top-level block-style `postgresql:`
 * section in the raw document, leaving every other line untouched. Adds the key
 * or the section when absent. Returns nullopt for layouts it does not handle
 * (flow style, a non-mapping document).
 */
std::optional<std::string> withVersionScalar(const std::string& text, const unsigned int version) {
    std::vector<std::string> lines;
    {
        std::istringstream in(text);
        for (std::string line; std::getline(in, line);) lines.push_back(std::move(line));
    }

    const auto value = std::to_string(version);

    std::optional<size_t> section;
    for (size_t i = 0; i < lines.size(); ++i) {
        const std::string_view line = lines[i];
        if (!line.starts_with(SECTION_KEY)) continue;
        if (!opensBlock(line.substr(SECTION_KEY.size()))) return std::nullopt;
        section = i;
        break;
    }

    if (!section) {
        lines.emplace_back(SECTION_KEY);
        lines.push_back("  " + std::string(VERSION_KEY) + " " + value);
    } else {
        std::optional<size_t> childIndent, versionLine;
        size_t end = *section + 1;
        for (; end < lines.size(); ++end) {
            const std::string_view line = lines[end];
            if (isBlankOrComment(line)) continue;
            const auto indent = indentOf(line);
            if (indent == 0) break;
            if (!childIndent) childIndent = indent;
            if (indent == *childIndent && line.substr(indent).starts_with(VERSION_KEY)) {
                versionLine = end;
                break;
            }
        }

        const std::string pad(childIndent.value_or(2), ' ');
        if (versionLine) {
            const std::string_view line = lines[*versionLine];
            const auto rest = line.substr(pad.size() + VERSION_KEY.size());
            std::string comment;
            if (const auto hash = rest.find(" #"); hash != std::string_view::npos)
                comment = "  " + std::string(trimRight(rest.substr(hash + 1)));
            lines[*versionLine] = pad + std::string(VERSION_KEY) + " " + value + comment;
        } else {
            lines.insert(lines.begin() + static_cast<std::ptrdiff_t>(*section) + 1,
                         pad + std::string(VERSION_KEY) + " " + value);
        }
    }

    std::string out;
    for (const auto& line : lines) out += line + '\n';

    // Refuse an edit that yaml-cpp would not read back as intended.
    try {
        const auto root = YAML::Load(out);
        if (!root.IsMap() || root["postgresql"]["version"].as<unsigned int>() != version) return std::nullopt;
    } catch (const YAML::Exception&) {
        return std::nullopt;
    }

    return out;
}

std::string reemitted(const std::string& text, const unsigned int version) {
    YAML::Node root;
    if (!text.empty()) root = YAML::Load(text);
    if (!root.IsMap()) root = YAML::Node(YAML::NodeType::Map);

    root["postgresql"]["version"] = version;

    YAML::Emitter out;
    out << root;
    if (!out.good()) throw std::runtime_error("Failed to serialise config: " + out.GetLastError());
    return std::string(out.c_str()) + '\n';
}

}

YamlConfigStore::YamlConfigStore(fs::path path) : path_(std::move(path)) {}

std::optional<unsigned int> YamlConfigStore::configuredMajorVersion() const {
    if (!fs::exists(path_)) return std::nullopt;

    const YAML::Node root = YAML::LoadFile(path_.string());
    if (!root.IsMap()) return std::nullopt;

    const auto pg = root["postgresql"];
    if (!pg || !pg.IsMap() || !pg["version"]) return std::nullopt;

    const auto version = pg["version"].as<unsigned int>();
    if (version == 0) return std::nullopt;
    return version;
}

void YamlConfigStore::persistMajorVersion(const unsigned int version) {
    const auto text = readFile(path_);

    auto document = withVersionScalar(text, version);
    if (!document) {
        log::Registry::config()->warn("[YamlConfigStore] Could not edit postgresql.version in place in {}; "
                                      "rewriting the whole document, comments will be lost", path_.string());
        document = reemitted(text, version);
    }

    if (const auto parent = path_.parent_path(); !parent.empty() && !fs::exists(parent)) {
        std::error_code ec;
        fs::create_directories(parent, ec);
        if (ec) throw std::runtime_error("Failed to create config directory " + parent.string() + ": " + ec.message());
        log::Registry::config()->info("[YamlConfigStore] Created config directory {}", parent.string());
    }

    auto tmp = path_;
    tmp += ".tmp." + std::to_string(::getpid());

    {
        std::ofstream f(tmp, std::ios::out | std::ios::trunc);
        if (!f.is_open()) throw std::runtime_error("Failed to open " + tmp.string() + " for writing");
        f << *document;
        f.flush();
        if (!f) {
            std::error_code ec;
            fs::remove(tmp, ec);
            throw std::runtime_error("Failed to write " + tmp.string());
        }
    }

    std::error_code ec;
    fs::rename(tmp, path_, ec);
    if (ec) {
        std::error_code ignored;
        fs::remove(tmp, ignored);
        throw std::runtime_error("Failed to replace " + path_.string() + ": " + ec.message());
    }

    log::Registry::config()->info("[YamlConfigStore] Set postgresql.version = {} in {}", version, path_.string());
}

}
