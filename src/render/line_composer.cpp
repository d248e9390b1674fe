#include "render/line_composer.hpp"
#include "render/ansi.hpp"

#include <regex>

LineComposer& LineComposer::add(const std::string& section) {
    if (!section.empty()) sections_.push_back(section);
    return *this;
}

bool LineComposer::empty() const {
    return sections_.empty();
}

std::string LineComposer::separator() {
    return std::string(" ") + ansi::DIM + "│" + ansi::RST + " ";
}

std::string LineComposer::str() const {
    std::string line;
    const std::string sep = separator();
    for (size_t i = 0; i < sections_.size(); ++i) {
        if (i > 0) line += sep;
        line += sections_[i];
    }
    return line;
}

std::string LineComposer::strip_ansi(const std::string& text) {
    static const std::regex sgr("\033\\[[0-9;]*m");
    return std::regex_replace(text, sgr, "");
}

std::string LineComposer::finish(const std::string& line1, const std::string& line2, bool no_color) {
    std::string l1 = no_color ? strip_ansi(line1) : line1;
    std::string l2 = no_color ? strip_ansi(line2) : line2;

    if (l2.empty()) return l1 + "\n\n";
    return l1 + "\n" + l2 + "\n";
}
