#include "turnkit/parser/json_repair.hpp"

#include <cctype>
#include <cstdio>
#include <vector>

namespace turnkit::parser {

namespace {

bool is_space(char c) {
    return std::isspace(static_cast<unsigned char>(c)) != 0;
}

std::string_view trim(std::string_view text) {
    size_t begin = 0;
    size_t end = text.size();
    while (begin < end && is_space(text[begin])) ++begin;
    while (end > begin && is_space(text[end - 1])) --end;
    return text.substr(begin, end - begin);
}

// Next non-whitespace char at or after `pos`, or '\0'
char peek_significant(std::string_view text, size_t pos) {
    while (pos < text.size() && is_space(text[pos])) ++pos;
    return pos < text.size() ? text[pos] : '\0';
}

// A single quote opens a string only where a key or value may start
bool can_open_single(char last) {
    return last == '\0' || last == '{' || last == '[' || last == ',' || last == ':';
}

// ...and closes one only where a key or value may end; anything else is
// taken as an apostrophe inside the text.
bool can_close_single(std::string_view text, size_t pos) {
    char next = peek_significant(text, pos + 1);
    return next == '\0' || next == ',' || next == ':' || next == '}' || next == ']';
}

// Tracks whether a scan position lies inside a string literal, delimited by
// double quotes or by the single-quote heuristic above.
class StringTracker {
public:
    // True when text[pos] belongs to a string, delimiters included
    bool feed(std::string_view text, size_t pos) {
        char c = text[pos];
        if (quote_) {
            if (escaped_) {
                escaped_ = false;
            } else if (c == '\\') {
                escaped_ = true;
            } else if (c == '"' && quote_ == '"') {
                quote_ = 0;
                last_ = '"';
            } else if (c == '\'' && quote_ == '\'' && can_close_single(text, pos)) {
                quote_ = 0;
                last_ = '"';
            }
            return true;
        }

        if (c == '"' || (c == '\'' && can_open_single(last_))) {
            quote_ = c;
            return true;
        }

        if (!is_space(c)) last_ = c;
        return false;
    }

    bool in_string() const { return quote_ != 0; }
    bool escaped() const { return escaped_; }
    char quote() const { return quote_; }

private:
    char quote_ = 0;
    bool escaped_ = false;
    char last_ = '\0';
};

// First ``` that does not sit inside a string literal of a JSON object.
// Braces in surrounding prose only open a scan; they never hide a fence.
size_t find_wrapping_fence(std::string_view text) {
    StringTracker tracker;
    int depth = 0;

    for (size_t i = 0; i < text.size(); ++i) {
        const bool fence_here = text.compare(i, 3, "```") == 0;

        if (depth == 0) {
            if (fence_here) return i;
            if (text[i] == '{') {
                tracker = StringTracker{};
                tracker.feed(text, i);
                depth = 1;
            }
            continue;
        }

        if (fence_here && !tracker.in_string()) return i;
        if (tracker.feed(text, i)) continue;

        if (text[i] == '{') {
            ++depth;
        } else if (text[i] == '}') {
            --depth;
        }
    }
    return std::string_view::npos;
}

}  // namespace

std::string strip_code_fence(std::string_view text) {
    auto fence = find_wrapping_fence(text);
    if (fence == std::string_view::npos) {
        return std::string(text);
    }

    size_t pos = fence + 3;
    while (pos < text.size() &&
           (std::isalnum(static_cast<unsigned char>(text[pos])) || text[pos] == '_' || text[pos] == '-')) {
        ++pos;
    }

    auto close = text.find("```", pos);
    auto interior = text.substr(pos, close == std::string_view::npos ? std::string_view::npos : close - pos);
    return std::string(trim(interior));
}

std::string extract_first_object(std::string_view text) {
    auto start = text.find('{');
    if (start == std::string_view::npos) {
        return std::string(trim(text));
    }

    StringTracker tracker;
    int depth = 0;
    for (size_t i = start; i < text.size(); ++i) {
        if (tracker.feed(text, i)) continue;

        if (text[i] == '{') {
            ++depth;
        } else if (text[i] == '}') {
            if (--depth == 0) {
                return std::string(text.substr(start, i - start + 1));
            }
        }
    }

    // Truncated object; closers are added by balance_brackets
    return std::string(trim(text.substr(start)));
}

std::string balance_brackets(std::string_view text) {
    std::string out;
    out.reserve(text.size() + 8);
    std::vector<char> stack;
    StringTracker tracker;

    for (size_t i = 0; i < text.size(); ++i) {
        char c = text[i];
        if (tracker.feed(text, i)) {
            out += c;
            continue;
        }

        if (c == '{' || c == '[') {
            stack.push_back(c);
            out += c;
        } else if (c == '}' || c == ']') {
            char open = c == '}' ? '{' : '[';
            if (!stack.empty() && stack.back() == open) {
                stack.pop_back();
                out += c;
            }
            // unmatched closer dropped
        } else {
            out += c;
        }
    }

    if (tracker.in_string()) {
        if (tracker.escaped()) out += '\\';
        out += tracker.quote();
    }

    for (auto it = stack.rbegin(); it != stack.rend(); ++it) {
        out += *it == '{' ? '}' : ']';
    }
    return out;
}

std::string strip_trailing_commas(std::string_view text) {
    std::string out;
    out.reserve(text.size());
    StringTracker tracker;

    for (size_t i = 0; i < text.size(); ++i) {
        char c = text[i];
        if (!tracker.feed(text, i) && c == ',') {
            char next = peek_significant(text, i + 1);
            if (next == '}' || next == ']') continue;
        }
        out += c;
    }
    return out;
}

std::string normalize_single_quotes(std::string_view text) {
    std::string out;
    out.reserve(text.size() + 8);

    bool in_double = false;
    bool in_single = false;
    bool escaped = false;
    char last = '\0';

    for (size_t i = 0; i < text.size(); ++i) {
        char c = text[i];

        if (in_double) {
            out += c;
            if (escaped) {
                escaped = false;
            } else if (c == '\\') {
                escaped = true;
            } else if (c == '"') {
                in_double = false;
                last = '"';
            }
            continue;
        }

        if (in_single) {
            if (escaped) {
                escaped = false;
                // \' has no meaning inside a double-quoted string
                if (c == '\'') {
                    out.back() = '\'';
                } else {
                    out += c;
                }
            } else if (c == '\\') {
                escaped = true;
                out += c;
            } else if (c == '"') {
                out += "\\\"";
            } else if (c == '\'' && can_close_single(text, i)) {
                in_single = false;
                last = '"';
                out += '"';
            } else {
                out += c;
            }
            continue;
        }

        if (c == '"') {
            in_double = true;
        } else if (c == '\'' && can_open_single(last)) {
            in_single = true;
            out += '"';
            continue;
        } else if (!is_space(c)) {
            last = c;
        }
        out += c;
    }
    return out;
}

std::string escape_control_chars(std::string_view text) {
    std::string out;
    out.reserve(text.size() + 8);

    bool in_string = false;
    bool escaped = false;

    for (char c : text) {
        if (!in_string) {
            if (c == '"') in_string = true;
            out += c;
            continue;
        }

        if (escaped) {
            escaped = false;
            out += c;
            continue;
        }

        switch (c) {
            case '\\':
                escaped = true;
                out += c;
                break;
            case '"':
                in_string = false;
                out += c;
                break;
            case '\n':
                out += "\\n";
                break;
            case '\r':
                out += "\\r";
                break;
            case '\t':
                out += "\\t";
                break;
            default:
                if (static_cast<unsigned char>(c) < 0x20) {
                    char buf[8];
                    std::snprintf(buf, sizeof(buf), "\\u%04x", static_cast<unsigned>(static_cast<unsigned char>(c)));
                    out += buf;
                } else {
                    out += c;
                }
                break;
        }
    }
    return out;
}

std::string repair_json(std::string_view text) {
    std::string s = strip_code_fence(text);
    s = extract_first_object(s);
    s = balance_brackets(s);
    s = strip_trailing_commas(s);
    s = normalize_single_quotes(s);
    return escape_control_chars(s);
}

Result<Json, Error> parse_json_lenient(std::string_view text) {
    std::string repaired = repair_json(text);
    if (repaired.empty()) {
        return Result<Json, Error>::err(ErrorCode::LLMInvalidResponse, "Empty model response");
    }

    try {
        return Result<Json, Error>::ok(Json::parse(repaired));
    } catch (const Json::parse_error& e) {
        return Result<Json, Error>::err(
            ErrorCode::LLMInvalidResponse,
            std::string("Invalid JSON after repair: ") + e.what()
        );
    }
}

}  // namespace turnkit::parser
