#include "discovery.hpp"
#include "util.hpp"

#include <algorithm>
#include <filesystem>
#include <fstream>
#include <sstream>

namespace fs = std::filesystem;

namespace karltui {

DiscoveryRoots DiscoveryRoots::defaults() {
    return {expand_home("~/.config/karl"), ".karl"};
}

std::vector<std::string> DiscoveryRoots::dirs_for(const std::string& kind) const {
    std::vector<std::string> dirs;
    if (!global.empty()) dirs.push_back((fs::path(global) / kind).string());
    if (!project.empty()) dirs.push_back((fs::path(project) / kind).string());
    return dirs;
}

namespace {

bool read_file(const fs::path& path, std::string& out) {
    std::ifstream file(path);
    if (!file.is_open()) return false;
    std::ostringstream ss;
    ss << file.rdbuf();
    if (file.bad()) return false;
    out = ss.str();
    return true;
}

bool is_directory(const fs::path& path) {
    std::error_code ec;
    return fs::is_directory(path, ec);
}

std::string frontmatter_value(const std::string& raw) {
    return trim_char(trim(raw), '"');
}

} // namespace

std::vector<StackInfo> discover_stacks(const Config& config, const DiscoveryRoots& roots) {
    std::vector<StackInfo> stacks;
    for (const auto& [name, entry] : config.stacks) {
        stacks.push_back({name, entry, kInlineSource});
    }

    for (const auto& dir : roots.dirs_for("stacks")) {
        if (!is_directory(dir)) continue;
        std::error_code ec;
        for (fs::directory_iterator it(dir, ec), end; !ec && it != end; it.increment(ec)) {
            const fs::path& path = it->path();
            if (path.extension() != ".json") continue;

            std::string name = path.stem().string();
            bool taken = std::any_of(stacks.begin(), stacks.end(),
                [&](const StackInfo& s) { return s.name == name; });
            if (taken) continue;

            std::string content;
            if (!read_file(path, content)) continue;
            try {
                auto entry = StackEntry::from_json(nlohmann::json::parse(content));
                stacks.push_back({name, std::move(entry), path.string()});
            } catch (const std::exception&) { // NOLINT(bugprone-empty-catch)
                // Malformed stack file: skip this entry only
            }
        }
    }

    std::sort(stacks.begin(), stacks.end(),
              [](const StackInfo& a, const StackInfo& b) { return a.name < b.name; });
    return stacks;
}

SkillInfo parse_skill_markdown(const std::string& content, const std::string& skill_dir) {
    SkillInfo info;
    info.path = skill_dir;

    if (starts_with(content, "---")) {
        size_t end = content.find("---", 3);
        if (end != std::string::npos) {
            std::string frontmatter = content.substr(3, end - 3);
            for (const auto& raw_line : split(frontmatter, '\n')) {
                std::string line = trim(raw_line);
                if (starts_with(line, "name:")) {
                    info.name = frontmatter_value(line.substr(5));
                } else if (starts_with(line, "description:")) {
                    info.description = frontmatter_value(line.substr(12));
                } else if (starts_with(line, "license:")) {
                    info.license = frontmatter_value(line.substr(8));
                }
            }
        }
    }

    if (info.name.empty()) {
        std::string dir_name = fs::path(skill_dir).filename().string();
        info.name = dir_name.empty() ? "unknown" : dir_name;
    }
    return info;
}

std::vector<SkillInfo> discover_skills(const DiscoveryRoots& roots) {
    std::vector<SkillInfo> skills;
    for (const auto& dir : roots.dirs_for("skills")) {
        if (!is_directory(dir)) continue;
        std::error_code ec;
        for (fs::directory_iterator it(dir, ec), end; !ec && it != end; it.increment(ec)) {
            fs::path skill_file = it->path() / "SKILL.md";
            std::error_code fec;
            if (!fs::is_regular_file(skill_file, fec)) continue;
            std::string content;
            if (!read_file(skill_file, content)) continue;
            skills.push_back(parse_skill_markdown(content, it->path().string()));
        }
    }
    std::sort(skills.begin(), skills.end(),
              [](const SkillInfo& a, const SkillInfo& b) { return a.name < b.name; });
    return skills;
}

std::string classify_hook(const std::string& file_stem) {
    static const char* const kinds[] = {
        "pre-task", "post-task", "pre-tool", "post-tool", "on-error"
    };
    for (const char* kind : kinds) {
        if (file_stem.find(kind) != std::string::npos) return kind;
    }
    return "unknown";
}

std::vector<HookInfo> discover_hooks(const DiscoveryRoots& roots) {
    std::vector<HookInfo> hooks;
    for (const auto& dir : roots.dirs_for("hooks")) {
        if (!is_directory(dir)) continue;
        std::error_code ec;
        fs::recursive_directory_iterator it(
            dir, fs::directory_options::skip_permission_denied, ec);
        for (fs::recursive_directory_iterator end; !ec && it != end; it.increment(ec)) {
            std::error_code sec;
            if (it->is_directory(sec)) {
                // Hooks live at most one directory below the root
                if (it.depth() >= 1) it.disable_recursion_pending();
                continue;
            }
            if (!it->is_regular_file(sec)) continue;

            const fs::path& path = it->path();
            auto ext = path.extension().string();
            if (ext != ".js" && ext != ".ts" && ext != ".mjs") continue;

            std::string name = path.stem().string();
            hooks.push_back({name, classify_hook(name), path.string()});
        }
    }
    std::sort(hooks.begin(), hooks.end(),
              [](const HookInfo& a, const HookInfo& b) { return a.name < b.name; });
    return hooks;
}

} // namespace karltui
