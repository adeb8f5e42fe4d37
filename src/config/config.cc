#include "config.hpp"

#include "config/config_parser.hpp"
#include "processing/line_matcher.hpp"
#include "util/color.hpp"
#include "util/log.hpp"

#include <fmt/format.h>
#include <sago/platform_folders.h>

#include <cerrno>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <filesystem>
#include <string>
#include <tuple>
#include <vector>

static std::string config_doc_general = R"foo(# General configuration for `fuzzpatch`
#
# Configure default options. These can be overriden with command-line arguments.
#
#   fuzziness        highest tolerance used when locating hunks:
#                      0 exact lines only
#                      1 ignore trailing whitespace and trailing comments
#                      2 also ignore indentation
#   comment_markers  strings that start a trailing comment, e.g. ['#', '//']
#   log_level        'debug', 'info', 'warning', 'error' or 'quiet'
#)foo";

static std::string config_doc_log = R"foo(# Colors of the log level tags. Available color names:
#   red, green, yellow, cyan, dark_gray, light_red,
#   light_green, light_yellow, default
#)foo";

enum class ConfigVariableType {
    Bool,
    Int,
    String,
    StringList,
};

enum class ConfigLoadResult {
    Ok,
    Invalid,
    DoesNotExist,
};

static ConfigLoadResult
config_load_file(const std::string& config_path, fuzzpatch::Value& config_table, fuzzpatch::ParseResult& load_result) {
    if (!std::filesystem::exists(config_path)) {
        return ConfigLoadResult::DoesNotExist;
    }

    if (fuzzpatch::cfg_load_file(config_path, load_result, config_table) && config_table.is_table()) {
        return ConfigLoadResult::Ok;
    }
    return ConfigLoadResult::Invalid;
}

static bool
config_save(const std::string& config_path, fuzzpatch::Value& config_value) {
    std::error_code ec;
    std::filesystem::create_directories(std::filesystem::path(config_path).parent_path(), ec);

    FILE* f = fopen(config_path.c_str(), "wb");
    if (!f) {
        fuzzpatch::log_warning("failed to open '{}' for writing: {}", config_path, strerror(errno));
        return false;
    }

    std::string serialized = fuzzpatch::cfg_serialize(config_value);
    bool ok = fwrite(serialized.c_str(), serialized.size(), 1, f) == 1;
    fclose(f);
    return ok;
}

using OptionVector = std::vector<std::tuple<std::string, ConfigVariableType, void*>>;

static void
config_apply_options(fuzzpatch::Value& config, const OptionVector& options) {
    using fuzzpatch::Value;

    for (const auto& [path, type, ptr] : options) {
        // Do we have a value for this option in the config we loaded?
        if (auto stored = config.lookup_value_by_path(path); stored) {
            // Yes. So we take the value and write it into our settings struct.
            Value& stored_value = stored->get();
            bool type_ok = true;
            switch (type) {
                case ConfigVariableType::Bool: {
                    if ((type_ok = stored_value.is_bool()))
                        *((bool*) ptr) = stored_value.as_bool();
                } break;
                case ConfigVariableType::Int: {
                    if ((type_ok = stored_value.is_int()))
                        *((int64_t*) ptr) = stored_value.as_int();
                } break;
                case ConfigVariableType::String: {
                    if ((type_ok = stored_value.is_string()))
                        *((std::string*) ptr) = stored_value.as_string();
                } break;
                case ConfigVariableType::StringList: {
                    std::vector<std::string> strings;
                    type_ok = stored_value.is_array();
                    if (type_ok) {
                        for (auto& element : stored_value.as_array()) {
                            if (!element.is_string()) {
                                type_ok = false;
                                break;
                            }
                            strings.push_back(element.as_string());
                        }
                    }
                    if (type_ok)
                        *((std::vector<std::string>*) ptr) = strings;
                } break;
            }
            if (!type_ok) {
                fuzzpatch::log_warning("config: ignoring '{}', unexpected value {}", path, fuzzpatch::repr(stored_value));
            }
        } else {
            // No such setting in the stored file, so we store the default value
            // from the struct.
            switch (type) {
                case ConfigVariableType::Bool: {
                    config.set_value_at(path, Value{Value::Bool{*(bool*) ptr}});
                } break;
                case ConfigVariableType::Int: {
                    auto value = static_cast<Value::Int>(*(int64_t*) ptr);
                    config.set_value_at(path, Value{Value::Int{value}});
                } break;
                case ConfigVariableType::String: {
                    config.set_value_at(path, Value{Value::String{*(std::string*) ptr}});
                } break;
                case ConfigVariableType::StringList: {
                    Value::Array array;
                    for (const auto& s : *(std::vector<std::string>*) ptr) {
                        array.push_back(Value{Value::String{s}});
                    }
                    config.set_value_at(path, Value{array});
                } break;
            }
        }
    }
}

std::string
fuzzpatch::config_get_directory() {
    const char* override_dir = getenv("FUZZPATCH_CONFIG_DIR");
    if (override_dir != nullptr && override_dir[0] != '\0') {
        return override_dir;
    }
    return fmt::format("{}/fuzzpatch", sago::getConfigHome());
}

bool
fuzzpatch::config_apply_options(const std::string& config_path, ProgramOptions& program_options, bool write_defaults) {
    bool flush_config_to_disk = false;

    ParseResult config_parse_result;
    Value config_file_table_value{Value::Table{}};
    switch (config_load_file(config_path, config_file_table_value, config_parse_result)) {
        case ConfigLoadResult::Ok: {
            // yay!
        } break;
        case ConfigLoadResult::Invalid: {
            log_error("{}\n\twhile parsing: {}", config_parse_result.error, config_path);
            return false;
        } break;
        case ConfigLoadResult::DoesNotExist: {
            if (write_defaults) {
                log_info("could not find config, creating file:\n\t{}", config_path);
                flush_config_to_disk = true;
            }
            config_file_table_value = Value{Value::Table{}};
        } break;
    };

    // clang-format off
    const OptionVector options = {
        { "general.fuzziness",       ConfigVariableType::Int,        &program_options.fuzziness },
        { "general.comment_markers", ConfigVariableType::StringList, &program_options.comment_markers },
        { "general.log_level",       ConfigVariableType::String,     &program_options.log_level },
        { "general.color",           ConfigVariableType::Bool,       &program_options.color },

        { "log.debug_color",         ConfigVariableType::String,     &program_options.debug_color },
        { "log.info_color",          ConfigVariableType::String,     &program_options.info_color },
        { "log.warning_color",       ConfigVariableType::String,     &program_options.warning_color },
        { "log.error_color",         ConfigVariableType::String,     &program_options.error_color },
    };
    // clang-format on

    ::config_apply_options(config_file_table_value, options);

    if (program_options.fuzziness < 0) {
        log_warning("config: fuzziness must not be negative, using 0");
        program_options.fuzziness = 0;
    } else if (program_options.fuzziness > kMaxFuzziness) {
        log_warning("config: fuzziness {} is above the maximum, using {}", program_options.fuzziness,
                    kMaxFuzziness);
        program_options.fuzziness = kMaxFuzziness;
    }

    // Write the configuration to disk with default settings
    if (flush_config_to_disk) {
        config_file_table_value["general"].key_comments.push_back(config_doc_general);
        config_file_table_value["log"].key_comments.push_back(config_doc_log);
        config_save(config_path, config_file_table_value);
    }
    return true;
}

void
fuzzpatch::config_apply_options(ProgramOptions& program_options) {
    const std::string config_path = fmt::format("{}/{}", config_get_directory(), "fuzzpatch.conf");
    config_apply_options(config_path, program_options, true);
}

void
fuzzpatch::config_apply_logging(const ProgramOptions& program_options) {
    if (auto level = log_level_from_string(program_options.log_level); level) {
        log_set_level(*level);
    } else {
        log_warning("unknown log level '{}'", program_options.log_level);
    }

    // clang-format off
    const std::vector<std::tuple<LogLevel, const std::string*>> colors = {
        { LogLevel::kDebug,   &program_options.debug_color },
        { LogLevel::kInfo,    &program_options.info_color },
        { LogLevel::kWarning, &program_options.warning_color },
        { LogLevel::kError,   &program_options.error_color },
    };
    // clang-format on

    for (const auto& [level, name] : colors) {
        if (auto color = TermColor::from_string(*name); color) {
            log_set_level_color(level, *color);
        } else {
            log_warning("config: unknown color '{}' for {} messages", *name, to_string(level));
        }
    }

    log_init(program_options.color);
}
