#include "binder.hpp"
#include "errors.hpp"
#include "util.hpp"
#include <cerrno>
#include <cmath>
#include <cstdlib>
#include <limits>

namespace tooledchat {

static bool is_quote(char c) {
    return c == '"' || c == '\'';
}

static bool at_value_start(char prev_significant) {
    return prev_significant == '(' || prev_significant == '=' ||
           prev_significant == ',' || prev_significant == ':';
}

std::vector<std::string> split_arguments(const std::string& raw) {
    std::vector<std::string> segments;
    std::string current;
    int depth = 0;
    char quote = 0;
    bool escape = false;
    char prev = ',';

    auto flush = [&]() {
        std::string seg = trim(current);
        if (!seg.empty()) segments.push_back(std::move(seg));
        current.clear();
        prev = ',';
    };

    for (char c : raw) {
        if (quote) {
            current += c;
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
        if (is_quote(c) && at_value_start(prev)) {
            quote = c;
            current += c;
            continue;
        }
        if (c == '(' || c == '[' || c == '{') {
            depth++;
        } else if ((c == ')' || c == ']' || c == '}') && depth > 0) {
            depth--;
        } else if (c == ',' && depth == 0) {
            flush();
            continue;
        }
        current += c;
        if (c != ' ' && c != '\t') prev = c;
    }
    flush();
    return segments;
}

std::pair<std::string, std::string> split_key_value(const std::string& segment) {
    size_t equals = std::string::npos;
    size_t colon = std::string::npos;
    char quote = 0;
    bool escape = false;

    for (size_t i = 0; i < segment.size() && equals == std::string::npos; i++) {
        char c = segment[i];
        if (quote) {
            if (escape) escape = false;
            else if (c == '\\') escape = true;
            else if (c == quote) quote = 0;
            continue;
        }
        if (is_quote(c) && (i == 0 || equals != std::string::npos ||
                            colon != std::string::npos)) {
            quote = c;
        } else if (c == '=') {
            equals = i;
        } else if (c == ':' && colon == std::string::npos) {
            colon = i;
        }
    }

    size_t sep = equals != std::string::npos ? equals : colon;
    if (sep == std::string::npos) {
        throw Error(ErrorKind::Parse,
                    "Expected key=value but got '" + segment + "'");
    }

    std::string key = unquote(segment.substr(0, sep));
    if (key.empty()) {
        throw Error(ErrorKind::Parse, "Missing parameter name in '" + segment + "'");
    }
    return {key, trim(segment.substr(sep + 1))};
}

std::string unquote(const std::string& text) {
    std::string t = trim(text);
    if (t.size() < 2 || !is_quote(t.front()) || t.back() != t.front()) {
        return t;
    }

    std::string out;
    out.reserve(t.size() - 2);
    for (size_t i = 1; i + 1 < t.size(); i++) {
        char c = t[i];
        if (c == '\\' && i + 2 < t.size()) {
            char next = t[++i];
            switch (next) {
                case 'n': out += '\n'; break;
                case 't': out += '\t'; break;
                case 'r': out += '\r'; break;
                default: out += next; break;
            }
            continue;
        }
        out += c;
    }
    return out;
}

static Error mismatch(const ParamSpec& spec, const std::string& text) {
    return Error(ErrorKind::TypeMismatch,
                 "Parameter '" + spec.name + "' expects " +
                 param_type_name(spec.type) + ", got '" + text + "'");
}

// Full-consume strtod; nullopt if anything is left over or the value is not finite
static std::optional<double> parse_double(const std::string& text) {
    if (text.empty()) return std::nullopt;
    errno = 0;
    char* end = nullptr;
    double d = std::strtod(text.c_str(), &end);
    if (end != text.c_str() + text.size() || errno == ERANGE || !std::isfinite(d)) {
        return std::nullopt;
    }
    return d;
}

nlohmann::json coerce_value(const std::string& text, const ParamSpec& spec) {
    switch (spec.type) {
        case ParamType::String:
            return text;

        case ParamType::Number: {
            auto d = parse_double(trim(text));
            if (!d) throw mismatch(spec, text);
            return *d;
        }

        case ParamType::Integer: {
            std::string t = trim(text);
            if (t.empty()) throw mismatch(spec, text);
            errno = 0;
            char* end = nullptr;
            long long v = std::strtoll(t.c_str(), &end, 10);
            if (end == t.c_str() + t.size() && errno != ERANGE) {
                return static_cast<int64_t>(v);
            }
            // "3.0" is an integer as far as the tool is concerned
            auto d = parse_double(t);
            if (d && std::floor(*d) == *d &&
                *d >= static_cast<double>(std::numeric_limits<int64_t>::min()) &&
                *d < static_cast<double>(std::numeric_limits<int64_t>::max())) {
                return static_cast<int64_t>(*d);
            }
            throw mismatch(spec, text);
        }

        case ParamType::Boolean: {
            std::string t = trim(text);
            if (iequals(t, "true")) return true;
            if (iequals(t, "false")) return false;
            throw mismatch(spec, text);
        }
    }
    throw mismatch(spec, text);
}

BoundArguments bind_arguments(const ToolInvocationRequest& request,
                              const ToolSnapshot& tools) {
    Tool* tool = tools.find(request.tool_name);
    if (!tool) {
        throw Error(ErrorKind::UnknownTool, "Unknown tool: " + request.tool_name);
    }

    std::vector<ParamSpec> specs = tool->parameters();
    auto find_spec = [&specs](const std::string& name) -> const ParamSpec* {
        for (const auto& s : specs) {
            if (s.name == name) return &s;
        }
        return nullptr;
    };

    BoundArguments args = nlohmann::json::object();
    for (const auto& segment : split_arguments(request.raw_parameters)) {
        auto [key, raw_value] = split_key_value(segment);
        if (args.contains(key)) {
            throw Error(ErrorKind::Parse, "Duplicate parameter: " + key);
        }
        const ParamSpec* spec = find_spec(key);
        if (!spec) {
            throw Error(ErrorKind::UnknownParameter,
                        "Unknown parameter '" + key + "' for tool " + request.tool_name);
        }
        args[key] = coerce_value(unquote(raw_value), *spec);
    }

    for (const auto& spec : specs) {
        if (args.contains(spec.name)) continue;
        if (spec.required) {
            throw Error(ErrorKind::MissingParameter,
                        "Missing required parameter '" + spec.name + "' for tool " +
                        request.tool_name);
        }
        if (spec.default_value) {
            args[spec.name] = *spec.default_value;
        }
    }

    return args;
}

} // namespace tooledchat
