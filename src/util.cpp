#include "util.hpp"

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <ctime>
#include <filesystem>
#include <fstream>
#include <unistd.h>

namespace tooledchat {

uint64_t epoch_seconds() {
    return static_cast<uint64_t>(std::time(nullptr));
}

std::string trim(const std::string& s) {
    auto start = s.begin();
    while (start != s.end() && std::isspace(static_cast<unsigned char>(*start))) {
        ++start;
    }
    auto end = s.end();
    while (end != start && std::isspace(static_cast<unsigned char>(*(end - 1)))) {
        --end;
    }
    return std::string(start, end);
}

bool iequals(const std::string& a, const std::string& b) {
    if (a.size() != b.size()) return false;
    for (size_t i = 0; i < a.size(); ++i) {
        if (std::tolower(static_cast<unsigned char>(a[i])) !=
            std::tolower(static_cast<unsigned char>(b[i]))) {
            return false;
        }
    }
    return true;
}

std::string format_placeholders(const std::string& tmpl,
                                const std::vector<std::pair<std::string, std::string>>& values) {
    // Single left-to-right pass so substituted text is never re-expanded
    std::string out;
    out.reserve(tmpl.size());
    size_t pos = 0;
    while (pos < tmpl.size()) {
        size_t open = tmpl.find('{', pos);
        if (open == std::string::npos) {
            out.append(tmpl, pos, std::string::npos);
            break;
        }
        out.append(tmpl, pos, open - pos);
        size_t close = tmpl.find('}', open + 1);
        if (close == std::string::npos) {
            out.append(tmpl, open, std::string::npos);
            break;
        }
        std::string key = tmpl.substr(open + 1, close - open - 1);
        auto it = std::find_if(values.begin(), values.end(),
            [&key](const std::pair<std::string, std::string>& v) { return v.first == key; });
        if (it != values.end()) {
            out += it->second;
            pos = close + 1;
        } else {
            out += '{';
            pos = open + 1;
        }
    }
    return out;
}

std::string expand_home(const std::string& path) {
    if (!path.empty() && path[0] == '~') {
        const char* home = std::getenv("HOME");
        if (home) {
            return std::string(home) + path.substr(1);
        }
    }
    return path;
}

bool atomic_write_file(const std::string& path, const std::string& content) {
    std::error_code ec;
    auto parent = std::filesystem::path(path).parent_path();
    if (!parent.empty()) {
        std::filesystem::create_directories(parent, ec);
        if (ec) return false;
    }

    std::string tmp = path + ".tmp." + std::to_string(getpid());
    {
        std::ofstream out(tmp, std::ios::trunc);
        if (!out) return false;
        out << content;
        if (!out.good()) return false;
    }
    std::filesystem::rename(tmp, path, ec);
    if (ec) {
        std::filesystem::remove(tmp, ec);
        return false;
    }
    return true;
}

} // namespace tooledchat
