#include "directive.hpp"
#include "errors.hpp"
#include "tool.hpp"
#include "util.hpp"
#include <cctype>
#include <cstring>
#include <iostream>

namespace tooledchat {

static bool is_horizontal_space(char c) {
    return c == ' ' || c == '\t';
}

static bool is_name_char(char c) {
    auto u = static_cast<unsigned char>(c);
    return std::isalnum(u) || c == '_' || c == '.';
}

// A quote only opens a quoted value at the start of a value or argument, so
// apostrophes inside bare words (O'Hare) stay literal.
static bool opens_value(char prev_significant) {
    return prev_significant == '(' || prev_significant == '=' ||
           prev_significant == ',' || prev_significant == ':';
}

ToolInvocationRequest parse_directive_at(const std::string& text, size_t keyword_pos,
                                         size_t& end_pos) {
    size_t line_end = text.find('\n', keyword_pos);
    if (line_end == std::string::npos) line_end = text.size();

    size_t i = keyword_pos + std::strlen(kDirectiveKeyword);
    while (i < line_end && is_horizontal_space(text[i])) i++;

    size_t name_start = i;
    while (i < line_end && is_name_char(text[i])) i++;
    std::string name = text.substr(name_start, i - name_start);
    if (!is_valid_tool_name(name)) {
        std::string shown = name.empty()
            ? text.substr(name_start, std::min<size_t>(line_end - name_start, 32))
            : name;
        throw Error(ErrorKind::Parse, "Invalid tool name in directive: '" + shown + "'");
    }

    while (i < line_end && is_horizontal_space(text[i])) i++;
    if (i >= line_end || text[i] != '(') {
        throw Error(ErrorKind::Parse, "Expected '(' after tool name " + name);
    }

    size_t open = i;
    int depth = 0;
    char quote = 0;
    bool escape = false;
    char prev = '(';
    size_t close = std::string::npos;

    for (i = open; i < line_end; i++) {
        char c = text[i];
        if (quote) {
            if (escape) {
                escape = false;
            } else if (c == '\\') {
                escape = true;
            } else if (c == quote) {
                quote = 0;
                prev = c;
            }
            continue;
        }
        if ((c == '"' || c == '\'') && opens_value(prev)) {
            quote = c;
            continue;
        }
        if (c == '(') {
            depth++;
        } else if (c == ')') {
            depth--;
            if (depth == 0) {
                close = i;
                break;
            }
        }
        if (!is_horizontal_space(c)) prev = c;
    }

    if (close == std::string::npos) {
        throw Error(ErrorKind::Parse, quote
            ? "Unterminated quote in directive for " + name
            : "Unbalanced parentheses in directive for " + name);
    }

    end_pos = close + 1;
    return ToolInvocationRequest{name, text.substr(open + 1, close - open - 1)};
}

DirectiveScan scan_for_directive(const std::string& text) {
    DirectiveScan scan;

    size_t pos = text.find(kDirectiveKeyword);
    if (pos == std::string::npos) {
        scan.plain_text = text;
        return scan;
    }

    size_t end_pos = 0;
    try {
        scan.request = parse_directive_at(text, pos, end_pos);
    } catch (const Error& e) {
        std::cerr << "[directive] " << e.what() << '\n';
        scan.error = e.what();
        scan.plain_text = text;
        return scan;
    }

    std::string before = text.substr(0, pos);
    std::string after = text.substr(end_pos);
    // Models often quote the directive the way the prompt shows it
    if (!before.empty() && !after.empty() && before.back() == after.front() &&
        (after.front() == '\'' || after.front() == '"' || after.front() == '`')) {
        before.pop_back();
        after.erase(0, 1);
    }
    scan.plain_text = trim(before + after);
    return scan;
}

} // namespace tooledchat
