#include "config_parser.hpp"

#include "util/readlines.hpp"

#include <fmt/format.h>

#include <charconv>
#include <cstdio>
#include <string>
#include <string_view>
#include <tuple>

using namespace fuzzpatch;

namespace internal {

std::tuple<std::string_view, std::string_view>
str_split2(const std::string_view s, char delimiter) {
    auto pos = s.find(delimiter);
    if (pos == std::string::npos) {
        return std::make_tuple(s, "");
    }

    return std::make_tuple(s.substr(0, pos), s.substr(pos + 1, std::string::npos));
}

bool
is_whitespace(char c) {
    return c == ' ' || c == '\t' || c == '\r' || c == '\n';
}

bool
is_identifier_char(char c) {
    return (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') || (c >= '0' && c <= '9') || c == '_' || c == '-';
}

std::string_view
strip(std::string_view s) {
    while (!s.empty() && is_whitespace(s.front()))
        s.remove_prefix(1);
    while (!s.empty() && is_whitespace(s.back()))
        s.remove_suffix(1);
    return s;
}

// Cursor over a single line of configuration text.
struct LineCursor {
    std::string_view text;
    std::size_t pos = 0;
    std::size_t line = 0;

    bool
    done() const {
        return pos >= text.size();
    }

    char
    peek() const {
        return done() ? '\0' : text[pos];
    }

    void
    skip_whitespace() {
        while (!done() && is_whitespace(text[pos]))
            pos++;
    }

    // Only whitespace or a comment remains.
    bool
    at_end_of_content() {
        skip_whitespace();
        return done() || peek() == '#';
    }
};

bool
parse_value(LineCursor& c, ParseResult& result, Value& out);

bool
parse_string(LineCursor& c, ParseResult& result, Value& out) {
    const char quote = c.peek();
    const std::size_t start_column = c.pos + 1;
    c.pos++;

    std::string s;
    while (!c.done()) {
        char ch = c.text[c.pos++];
        if (ch == quote) {
            out = Value{Value::String{s}};
            return true;
        }
        if (ch == '\\' && !c.done()) {
            char escaped = c.text[c.pos++];
            switch (escaped) {
                case 'n':
                    s += '\n';
                    break;
                case 't':
                    s += '\t';
                    break;
                default:
                    s += escaped;
                    break;
            }
            continue;
        }
        s += ch;
    }

    result.set_error(c.line, start_column, "unterminated string");
    return false;
}

bool
parse_array(LineCursor& c, ParseResult& result, Value& out) {
    c.pos++;  // [
    Value::Array array;
    while (true) {
        c.skip_whitespace();
        if (c.done()) {
            result.set_error(c.line, c.pos + 1, "unterminated array");
            return false;
        }
        if (c.peek() == ']') {
            c.pos++;
            break;
        }

        Value element;
        if (!parse_value(c, result, element)) {
            return false;
        }
        array.push_back(element);

        c.skip_whitespace();
        if (c.peek() == ',') {
            c.pos++;
        } else if (c.peek() != ']') {
            result.set_error(c.line, c.pos + 1, "expected ',' or ']'");
            return false;
        }
    }
    out = Value{array};
    return true;
}

bool
parse_scalar(LineCursor& c, ParseResult& result, Value& out) {
    const std::size_t start = c.pos;
    while (!c.done() && (is_identifier_char(c.peek()) || c.peek() == '+')) {
        c.pos++;
    }
    std::string_view word = c.text.substr(start, c.pos - start);

    if (word == "true" || word == "false") {
        out = Value{Value::Bool{word == "true"}};
        return true;
    }

    Value::Int number = 0;
    auto digits = (!word.empty() && word.front() == '+') ? word.substr(1) : word;
    auto [ptr, ec] = std::from_chars(digits.data(), digits.data() + digits.size(), number);
    if (!digits.empty() && ec == std::errc() && ptr == digits.data() + digits.size()) {
        out = Value{Value::Int{number}};
        return true;
    }

    result.set_error(c.line, start + 1, fmt::format("unexpected value '{}'", word));
    return false;
}

bool
parse_value(LineCursor& c, ParseResult& result, Value& out) {
    c.skip_whitespace();
    switch (c.peek()) {
        case '\'':
        case '"':
            return parse_string(c, result, out);
        case '[':
            return parse_array(c, result, out);
        case '\0': {
            result.set_error(c.line, c.pos + 1, "missing value");
            return false;
        }
        default:
            return parse_scalar(c, result, out);
    }
}

std::string
quote(const std::string& s) {
    std::string out = "'";
    for (char c : s) {
        switch (c) {
            case '\'':
                out += "\\'";
                break;
            case '\\':
                out += "\\\\";
                break;
            case '\n':
                out += "\\n";
                break;
            case '\t':
                out += "\\t";
                break;
            default:
                out += c;
                break;
        }
    }
    return out + "'";
}

std::string
serialize_obj(Value& value) {
    if (value.is_int()) {
        return fmt::format("{}", value.as_int());
    } else if (value.is_bool()) {
        return value.as_bool() ? "true" : "false";
    } else if (value.is_string()) {
        return quote(value.as_string());
    } else if (value.is_array()) {
        std::string output = "[";
        auto& array = value.as_array();
        for (std::size_t i = 0; i < array.size(); i++) {
            if (i > 0) {
                output += ", ";
            }
            output += serialize_obj(array[i]);
        }
        return output + "]";
    }
    assert(false && "nested tables can only be serialized as sections");
    return "";
}

void
serialize_comments(const Value& value, std::string& output) {
    for (const auto& comment : value.key_comments) {
        for (const auto& line : split_lines(comment)) {
            output += line.empty() || line[0] == '#' ? line : "# " + line;
            output += "\n";
        }
    }
}

}  // namespace internal

std::optional<std::reference_wrapper<Value>>
Value::lookup_value_by_path(const std::string_view dotted_path) {
    Value* result_value = this;
    std::string_view remaining{dotted_path};
    while (!remaining.empty()) {
        auto [head, rest] = internal::str_split2(remaining, '.');
        std::string key{head};
        if (!result_value->contains(key)) {
            return std::nullopt;
        }
        result_value = &(*result_value)[key];
        remaining = rest;
    }
    return std::reference_wrapper(*result_value);
}

bool
Value::set_value_at(const std::string_view dotted_path, Value value) {
    Value* iter = this;
    std::string_view remaining{dotted_path};
    while (!remaining.empty()) {
        if (!iter->is_table()) {
            return false;
        }

        auto [head, rest] = internal::str_split2(remaining, '.');
        std::string key{head};
        if (rest.empty()) {
            (*iter)[key] = std::move(value);
            return true;
        }

        if (!iter->contains(key)) {
            iter->as_table().insert(key, Value{Value::Table{}});
        }
        iter = &(*iter)[key];
        remaining = rest;
    }
    return false;
}

void
fuzzpatch::ParseResult::set_error(std::size_t line, std::size_t column, const std::string& error_message) {
    this->kind = ParseErrorKind::Parsing;
    this->error = fmt::format("'{}' at line {} column {}", error_message, line, column);
}

bool
fuzzpatch::cfg_parse_value_tree(const std::string& input_data, ParseResult& result, Value& result_obj) {
    result = ParseResult{};
    result_obj = Value{Value::Table{}};

    Value* section = &result_obj;
    std::vector<std::string> pending_comments;

    const auto lines = split_lines(input_data);
    for (std::size_t i = 0; i < lines.size(); i++) {
        internal::LineCursor c{lines[i], 0, i + 1};

        c.skip_whitespace();
        if (c.done()) {
            continue;
        }

        if (c.peek() == '#') {
            pending_comments.emplace_back(internal::strip(c.text.substr(c.pos)));
            continue;
        }

        if (c.peek() == '[') {
            auto close = c.text.find(']', c.pos);
            if (close == std::string::npos) {
                result.set_error(c.line, c.pos + 1, "unterminated section header");
                return false;
            }
            std::string name{internal::strip(c.text.substr(c.pos + 1, close - c.pos - 1))};
            if (name.empty()) {
                result.set_error(c.line, c.pos + 1, "empty section name");
                return false;
            }
            c.pos = close + 1;
            if (!c.at_end_of_content()) {
                result.set_error(c.line, c.pos + 1, "unexpected text after section header");
                return false;
            }

            if (!result_obj.contains(name) || !result_obj[name].is_table()) {
                result_obj[name] = Value{Value::Table{}};
            }
            section = &result_obj[name];
            section->key_comments = std::move(pending_comments);
            pending_comments.clear();
            continue;
        }

        const std::size_t key_start = c.pos;
        while (!c.done() && internal::is_identifier_char(c.peek())) {
            c.pos++;
        }
        std::string key{c.text.substr(key_start, c.pos - key_start)};
        if (key.empty()) {
            result.set_error(c.line, key_start + 1, "expected key");
            return false;
        }

        c.skip_whitespace();
        if (c.peek() != '=') {
            result.set_error(c.line, c.pos + 1, fmt::format("expected '=' after '{}'", key));
            return false;
        }
        c.pos++;

        Value value;
        if (!internal::parse_value(c, result, value)) {
            return false;
        }
        if (!c.at_end_of_content()) {
            result.set_error(c.line, c.pos + 1, "unexpected text after value");
            return false;
        }

        value.key_comments = std::move(pending_comments);
        pending_comments.clear();
        (*section)[key] = std::move(value);
    }

    return true;
}

bool
fuzzpatch::cfg_load_file(const std::string& file_path, ParseResult& result, Value& result_obj) {
    TextFile file;
    if (!read_text_file(file_path, file)) {
        result.kind = ParseErrorKind::File;
        result.error = "Failed to open file for reading";
        return false;
    }

    return cfg_parse_value_tree(join_lines(file.lines), result, result_obj);
}

std::string
fuzzpatch::cfg_serialize(Value& value) {
    assert(value.is_table());

    std::string output;
    auto& root = value.as_table();

    // Plain keys first; they'd otherwise be read back as part of the last section.
    root.for_each([&](const std::string& key, Value& v) {
        if (v.is_table()) {
            return;
        }
        internal::serialize_comments(v, output);
        output += fmt::format("{} = {}\n", key, internal::serialize_obj(v));
    });

    root.for_each([&](const std::string& key, Value& section) {
        if (!section.is_table()) {
            return;
        }
        if (!output.empty()) {
            output += "\n";
        }
        internal::serialize_comments(section, output);
        output += fmt::format("[{}]\n", key);
        section.as_table().for_each([&](const std::string& k, Value& v) {
            if (v.is_table()) {
                // One level of sections only.
                return;
            }
            internal::serialize_comments(v, output);
            output += fmt::format("{} = {}\n", k, internal::serialize_obj(v));
        });
    });

    return output;
}

std::string
fuzzpatch::repr(Value& v) {
    if (v.is_table()) {
        std::string s = "{";
        bool first = true;
        v.as_table().for_each([&](const std::string& key, Value& value) {
            s += fmt::format("{}{}: {}", first ? "" : ", ", key, repr(value));
            first = false;
        });
        return s + "}";
    }
    return internal::serialize_obj(v);
}
