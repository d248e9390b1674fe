#pragma once

#include <iosfwd>
#include <memory>

struct CliOptions;

class App {
public:
    explicit App(const CliOptions& options);
    ~App();

    /// Read one snapshot from in, write the status line to out.
    /// Always returns 0: every failure degrades the output instead.
    int run(std::istream& in, std::ostream& out);

    /// Fire-and-forget cache refresh after rendering (on by default)
    void set_background_enabled(bool enabled);

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};
