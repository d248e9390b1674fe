#include "git/git_probe.hpp"
#include "core/format.hpp"
#include "daemon/process_runner.hpp"

#include <filesystem>
#include <sstream>
#include <vector>

namespace fs = std::filesystem;

static constexpr size_t NAME_MAX_LEN = 20;

static const char* const WORKTREE_GLYPH = "⊕";

/// Canonical form of p without requiring it to exist
static std::string resolve(const fs::path& p) {
    std::error_code ec;
    fs::path r = fs::weakly_canonical(p, ec);
    if (ec) return p.lexically_normal().string();
    std::string s = r.string();
    while (s.size() > 1 && s.back() == '/') s.pop_back();
    return s;
}

std::string GitProbe::git(const std::string& cwd, const std::initializer_list<const char*>& args) {
    try {
        std::vector<std::string> argv = {"git"};
        if (!cwd.empty()) {
            argv.push_back("-C");
            argv.push_back(cwd);
        }
        for (const char* a : args) argv.push_back(a);

        CommandResult r = ProcessRunner::run(argv, QUERY_TIMEOUT_MS);
        if (!r.ok()) return "";
        return ProcessRunner::chomp(r.output);
    } catch (const std::exception&) {
        return "";
    }
}

int GitProbe::parse_count(const std::string& text) {
    size_t i = 0;
    while (i < text.size() && (text[i] == ' ' || text[i] == '\t')) ++i;
    long long n = 0;
    bool any = false;
    for (; i < text.size() && text[i] >= '0' && text[i] <= '9'; ++i) {
        n = n * 10 + (text[i] - '0');
        if (n > 1000000000) break;
        any = true;
    }
    return any ? static_cast<int>(n) : 0;
}

void GitProbe::detect_worktree(const std::string& cwd,
                               const std::string& toplevel,
                               const std::string& common_dir,
                               GitSummary& summary) {
    if (toplevel.empty() || common_dir.empty()) return;

    try {
        fs::path common(common_dir);
        if (common.is_relative()) {
            common = fs::path(cwd.empty() ? fs::current_path().string() : cwd) / common;
        }

        std::string resolved_common = resolve(common);
        std::string resolved_top = resolve(toplevel);
        if (resolved_common == resolve(fs::path(resolved_top) / ".git")) {
            return;  // main checkout
        }

        summary.in_worktree = true;

        std::string main_toplevel = fs::path(resolved_common).parent_path().string();
        std::string prefix = main_toplevel + "/.worktrees/";
        if (resolved_top.compare(0, prefix.size(), prefix) == 0) {
            summary.worktree_name = resolved_top.substr(prefix.size());
        } else {
            summary.worktree_name = resolved_top;
        }
    } catch (const std::exception&) {
        summary.in_worktree = false;
        summary.worktree_name.clear();
    }
}

GitSummary GitProbe::probe(const std::string& cwd) {
    GitSummary summary;

    // Step 1: branch (nothing else matters without one)
    summary.branch = git(cwd, {"branch", "--show-current"});
    if (summary.branch.empty()) return summary;

    // Step 2: worktree
    std::string toplevel = git(cwd, {"rev-parse", "--show-toplevel"});
    std::string common = git(cwd, {"rev-parse", "--git-common-dir"});
    detect_worktree(cwd, toplevel, common, summary);

    // Step 3: dirty
    summary.dirty = !git(cwd, {"--no-optional-locks", "status", "--porcelain"}).empty();

    // Step 4: ahead/behind; no upstream makes rev-list fail, which reads as 0
    summary.ahead = parse_count(git(cwd, {"rev-list", "--count", "@{u}..HEAD"}));
    summary.behind = parse_count(git(cwd, {"rev-list", "--count", "HEAD..@{u}"}));

    // Step 5: stash
    std::istringstream stash(git(cwd, {"stash", "list"}));
    std::string line;
    while (std::getline(stash, line)) {
        if (!line.empty()) ++summary.stash;
    }

    return summary;
}

std::string GitProbe::branch_display(const GitSummary& summary) {
    if (summary.empty()) return "";

    std::string branch = Format::truncate(Format::shorten_branch(summary.branch), NAME_MAX_LEN);
    if (!summary.in_worktree) return branch;

    std::string worktree = Format::truncate(Format::shorten_branch(summary.worktree_name), NAME_MAX_LEN);
    if (worktree == branch) {
        return std::string(WORKTREE_GLYPH) + " " + branch;
    }
    return std::string(WORKTREE_GLYPH) + worktree + " " + branch;
}

std::string GitProbe::extras(const GitSummary& summary) {
    std::vector<std::string> parts;
    if (summary.ahead > 0) parts.push_back("↑" + std::to_string(summary.ahead));
    if (summary.behind > 0) parts.push_back("↓" + std::to_string(summary.behind));
    if (summary.stash > 0) parts.push_back("stash:" + std::to_string(summary.stash));

    std::string out;
    for (const auto& p : parts) {
        if (!out.empty()) out += " ";
        out += p;
    }
    return out;
}
