#pragma once

#include <string>
#include <vector>

class LineComposer {
public:
    /// Appends section unless it is empty
    LineComposer& add(const std::string& section);

    bool empty() const;

    /// Sections joined by a dim vertical bar
    std::string str() const;

    static std::string separator();

    /// Remove every ESC[...m sequence
    static std::string strip_ansi(const std::string& text);

    /// "l1\nl2\n", or "l1\n\n" when l2 is empty; strips color when no_color
    static std::string finish(const std::string& line1, const std::string& line2, bool no_color);

private:
    std::vector<std::string> sections_;
};
