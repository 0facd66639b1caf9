#include "metrics/logical_lines.hpp"
#include <algorithm>
#include <cctype>

namespace scorecard::metrics {

namespace {

struct ScanState {
    int bracket_depth{0};
    bool in_string{false};
    bool triple_quoted{false};
    char quote{'\0'};
    bool continued{false};
};

bool is_space(char c) {
    return std::isspace(static_cast<unsigned char>(c)) != 0;
}

// Scans one physical line, updating the lexical state. Returns true when the
// line holds code that is not inside a string opened on an earlier line.
bool scan_line(std::string_view line, ScanState& state) {
    bool has_code = false;
    state.continued = false;

    for (std::size_t i = 0; i < line.size(); ++i) {
        char c = line[i];

        if (state.in_string) {
            if (c == '\\') {
                ++i;
            } else if (c == state.quote) {
                if (!state.triple_quoted) {
                    state.in_string = false;
                } else if (i + 2 < line.size() && line[i + 1] == c && line[i + 2] == c) {
                    state.in_string = false;
                    i += 2;
                }
            }
            continue;
        }

        if (c == '#') {
            break;
        }
        if (!is_space(c)) {
            has_code = true;
        }

        switch (c) {
            case '"':
            case '\'':
                state.in_string = true;
                state.quote = c;
                state.triple_quoted = i + 2 < line.size() && line[i + 1] == c && line[i + 2] == c;
                if (state.triple_quoted) {
                    i += 2;
                }
                break;
            case '(':
            case '[':
            case '{':
                ++state.bracket_depth;
                break;
            case ')':
            case ']':
            case '}':
                state.bracket_depth = std::max(0, state.bracket_depth - 1);
                break;
            case '\\':
                if (i + 1 == line.size()) {
                    state.continued = true;
                }
                break;
            default:
                break;
        }
    }

    // A single-quoted string cannot span lines unless escaped at the line end
    if (state.in_string && !state.triple_quoted &&
        !(line.size() > 0 && line.back() == '\\')) {
        state.in_string = false;
    }

    return has_code;
}

} // namespace

LogicalLineIndex LogicalLineIndex::from_source(std::string_view source) {
    LogicalLineIndex index;
    index.prefix_.push_back(0);

    ScanState state;
    std::size_t position = 0;

    while (position < source.size()) {
        std::size_t newline = source.find('\n', position);
        std::size_t end = newline == std::string_view::npos ? source.size() : newline;

        std::string_view line = source.substr(position, end - position);
        if (!line.empty() && line.back() == '\r') {
            line.remove_suffix(1);
        }

        bool at_boundary = !state.in_string && state.bracket_depth == 0 && !state.continued;
        bool has_code = scan_line(line, state);

        index.prefix_.push_back(index.prefix_.back() + ((at_boundary && has_code) ? 1 : 0));

        if (newline == std::string_view::npos) {
            break;
        }
        position = newline + 1;
    }

    return index;
}

std::size_t LogicalLineIndex::count(std::size_t first_line, std::size_t last_line) const {
    if (prefix_.size() < 2 || first_line == 0 || first_line > last_line) {
        return 0;
    }

    std::size_t last = std::min(last_line, prefix_.size() - 1);
    if (first_line > last) {
        return 0;
    }
    return prefix_[last] - prefix_[first_line - 1];
}

bool LogicalLineIndex::starts_logical_line(std::size_t line) const {
    if (line == 0 || line >= prefix_.size()) {
        return false;
    }
    return prefix_[line] != prefix_[line - 1];
}

} // namespace scorecard::metrics
