#pragma once

#include "ordered_map.hpp"

#include <cassert>
#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace fuzzpatch {

/**

 Configuration language parser

 It's "INI with arrays, strings, ints and bools":

    # comment attached to the section
    [general]
    fuzziness = 1                       # trailing comments are allowed
    comment_markers = ['#', '//']
    log_level = 'info'
    color = true

 Keys before the first section header land in the root table. Every section
 is a table in the root table, so `general.fuzziness` addresses the value above.

*/

struct Value {
    using Table = OrderedMap<std::string, Value>;
    using Array = std::vector<Value>;
    using Int = int32_t;
    using Bool = bool;
    using String = std::string;

    std::variant<Table, Array, Int, Bool, String> v;

    // Comment lines placed above the key this value is assigned to.
    std::vector<std::string> key_comments;

    Value&
    operator[](const std::string& key) {
        assert(is_table());
        return as_table()[key];
    }

    bool
    contains(const std::string& key) {
        if (is_table()) {
            return as_table().contains(key);
        }
        return false;
    }

    // Find a nested value using e.g. "general.fuzziness"
    std::optional<std::reference_wrapper<Value>>
    lookup_value_by_path(const std::string_view dotted_path);

    // Sets a nested value using e.g. set("general.fuzziness", {1}). Missing
    // tables along the path are created.
    bool
    set_value_at(const std::string_view dotted_path, Value value);

    // clang-format off
    bool is_array() const { return std::holds_alternative<Value::Array>(v); }
    bool is_table() const { return std::holds_alternative<Value::Table>(v); }
    bool is_int() const { return std::holds_alternative<Value::Int>(v); }
    bool is_bool() const { return std::holds_alternative<Value::Bool>(v); }
    bool is_string() const { return std::holds_alternative<Value::String>(v); }

    Array& as_array() { return std::get<Value::Array>(v); }
    Table& as_table() { return std::get<Value::Table>(v); }
    Int& as_int() { return std::get<Value::Int>(v); }
    Bool& as_bool() { return std::get<Value::Bool>(v); }
    String& as_string() { return std::get<Value::String>(v); }
    // clang-format on
};

std::string
repr(Value& v);

// clang-format off
enum class ParseErrorKind {
    None,
    File,     // Missing or unreadable file
    Parsing,
};
// clang-format on

struct ParseResult {
    ParseErrorKind kind = ParseErrorKind::None;
    std::string error;

    bool
    is_ok() const {
        return kind == ParseErrorKind::None;
    }

    void
    set_error(std::size_t line, std::size_t column, const std::string& error_message);
};

bool
cfg_parse_value_tree(const std::string& input_data, ParseResult& result, Value& result_obj);

// Load a file and construct a value tree based on the contents
bool
cfg_load_file(const std::string& file_path, ParseResult& result, Value& result_obj);

// Serialize all entries in the given Value. Nested tables in the root table
// become [section]s. The input Value must hold a Value::Table.
std::string
cfg_serialize(Value& value);

}  // namespace fuzzpatch
