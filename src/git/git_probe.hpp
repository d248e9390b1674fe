#pragma once

#include <initializer_list>
#include <string>

struct GitSummary {
    std::string branch;          // empty: not a repo, or detached HEAD
    bool in_worktree = false;    // linked worktree, not the main checkout
    std::string worktree_name;
    bool dirty = false;
    int ahead = 0;
    int behind = 0;
    int stash = 0;

    bool empty() const { return branch.empty(); }
};

class GitProbe {
public:
    static constexpr int QUERY_TIMEOUT_MS = 2000;

    /// Query the repository containing cwd. Each step degrades to empty/zero
    /// on its own; nothing here throws.
    static GitSummary probe(const std::string& cwd);

    /// Branch text with worktree context: "main", "⊕ ★login", "⊕wt-a ★login"
    static std::string branch_display(const GitSummary& summary);

    /// "↑2 ↓1 stash:3", zero counts omitted
    static std::string extras(const GitSummary& summary);

    /// Derive worktree state from rev-parse output.
    /// common_dir is resolved against cwd when relative.
    static void detect_worktree(const std::string& cwd,
                                const std::string& toplevel,
                                const std::string& common_dir,
                                GitSummary& summary);

    /// Leading decimal integer of text, 0 on anything else
    static int parse_count(const std::string& text);

private:
    /// Run `git -C cwd args...`; trimmed stdout on success, "" otherwise
    static std::string git(const std::string& cwd, const std::initializer_list<const char*>& args);
};
