#pragma once
#include "config.hpp"
#include <optional>
#include <string>
#include <vector>

namespace karltui {

constexpr const char* kInlineSource = "inline";

// Base directories scanned for {stacks,skills,hooks}/.
struct DiscoveryRoots {
    std::string global;   // ~/.config/karl
    std::string project;  // ./.karl

    static DiscoveryRoots defaults();
    std::vector<std::string> dirs_for(const std::string& kind) const;
};

struct StackInfo {
    std::string name;
    StackEntry entry;
    std::string source; // kInlineSource or the stack file path

    bool is_inline() const { return source == kInlineSource; }
};

struct SkillInfo {
    std::string name;
    std::string description;
    std::optional<std::string> license;
    std::string path;
};

struct HookInfo {
    std::string name;
    std::string hook_type; // pre-task, post-task, pre-tool, post-tool, on-error, unknown
    std::string path;
};

// Inline stacks plus <root>/stacks/*.json; inline wins on name clashes.
// Sorted by name.
std::vector<StackInfo> discover_stacks(const Config& config, const DiscoveryRoots& roots);

// Every <root>/skills/<dir>/SKILL.md, sorted by name.
std::vector<SkillInfo> discover_skills(const DiscoveryRoots& roots);

// .js/.ts/.mjs files in <root>/hooks and one level below, sorted by name.
std::vector<HookInfo> discover_hooks(const DiscoveryRoots& roots);

// Parse SKILL.md frontmatter; name falls back to the directory name.
SkillInfo parse_skill_markdown(const std::string& content, const std::string& skill_dir);

// Hook kind from filename substrings.
std::string classify_hook(const std::string& file_stem);

} // namespace karltui
