#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <tabsync/logger.hpp>
#include <vector>

namespace tabsync
{

// Runtime configuration shared by tabsync-authority and tabsync-shell.
// Loaded from a small JSON file; command-line flags override the file.
// Unknown keys are ignored and a malformed value keeps its default.
struct TabsyncConfig
{
    float       drag_threshold_px      = 5.0f;
    uint32_t    suppression_timeout_ms = 2000;
    uint32_t    push_debounce_ms       = 100;
    uint32_t    invoke_timeout_ms      = 3000;
    uint32_t    max_tabs               = 20;
    std::string home_url               = "tabsync://home";
    std::string socket_path;   // empty = ipc::default_socket_path()
    std::string log_level = "info";
    std::string log_file;      // empty = stderr only

    // Set by --inproc; not read from the file.
    bool inproc = false;

    // Serialize to JSON string.
    std::string serialize() const;

    // Deserialize from JSON string. Returns false for an empty document or a
    // future version; fields missing from the document keep their values.
    bool deserialize(const std::string& json);

    // Save to a JSON file. Returns true on success.
    bool save(const std::string& path) const;

    // Load from a JSON file. Returns true on success.
    bool load(const std::string& path);

    // $XDG_CONFIG_HOME/tabsync/config.json, else ~/.config/tabsync/config.json.
    static std::string default_path();

    std::optional<LogLevel> parsed_log_level() const { return Logger::level_from_string(log_level); }
};

// Result of command-line parsing.
struct CommandLine
{
    std::optional<std::string> config_path;
    std::optional<std::string> socket_path;
    std::optional<std::string> log_level;
    bool                       inproc    = false;
    bool                       show_help = false;
    std::vector<std::string>   positional;
    std::string                error;   // non-empty when parsing failed

    bool ok() const { return error.empty(); }
};

// Recognizes --config <path>, --socket <path>, --log-level <level>,
// --inproc and --help/-h. Anything else starting with "--" is an error.
CommandLine parse_command_line(int argc, const char* const* argv);

// Load the config file named on the command line (or the default path when
// it exists), then apply the command-line overrides. File problems are
// logged and leave the defaults in place.
TabsyncConfig resolve_config(const CommandLine& cli);

// Apply log_level and log_file to the global logger, replacing its sinks
// with the console sink plus a file sink when log_file is set.
void apply_logging(const TabsyncConfig& config);

}   // namespace tabsync
