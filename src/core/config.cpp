#include "config.hpp"

#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <system_error>

namespace tabsync
{

// ─── JSON serialization ──────────────────────────────────────────────────────

static std::string escape_json(const std::string& s)
{
    std::string out;
    out.reserve(s.size() + 8);
    for (char c : s)
    {
        switch (c)
        {
            case '"':
                out += "\\\"";
                break;
            case '\\':
                out += "\\\\";
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
                out += c;
                break;
        }
    }
    return out;
}

static std::string unescape_json(const std::string& s)
{
    std::string out;
    out.reserve(s.size());
    for (size_t i = 0; i < s.size(); ++i)
    {
        if (s[i] != '\\' || i + 1 == s.size())
        {
            out += s[i];
            continue;
        }
        char next = s[++i];
        switch (next)
        {
            case 'n':
                out += '\n';
                break;
            case 'r':
                out += '\r';
                break;
            case 't':
                out += '\t';
                break;
            default:
                out += next;
                break;
        }
    }
    return out;
}

std::string TabsyncConfig::serialize() const
{
    std::ostringstream os;
    os << "{\n";
    os << "  \"version\": 1,\n";
    os << "  \"drag_threshold_px\": " << drag_threshold_px << ",\n";
    os << "  \"suppression_timeout_ms\": " << suppression_timeout_ms << ",\n";
    os << "  \"push_debounce_ms\": " << push_debounce_ms << ",\n";
    os << "  \"invoke_timeout_ms\": " << invoke_timeout_ms << ",\n";
    os << "  \"max_tabs\": " << max_tabs << ",\n";
    os << "  \"home_url\": \"" << escape_json(home_url) << "\",\n";
    os << "  \"socket_path\": \"" << escape_json(socket_path) << "\",\n";
    os << "  \"log_level\": \"" << escape_json(log_level) << "\",\n";
    os << "  \"log_file\": \"" << escape_json(log_file) << "\"\n";
    os << "}\n";
    return os.str();
}

// Minimal JSON reader for our flat format: finds `"key"` followed by ':'.
static std::optional<size_t> find_json_value(const std::string& json, const std::string& key)
{
    std::string search = "\"" + key + "\"";
    auto        pos    = json.find(search);
    if (pos == std::string::npos)
        return std::nullopt;
    pos = json.find(':', pos + search.size());
    if (pos == std::string::npos)
        return std::nullopt;
    pos = json.find_first_not_of(" \t\n\r", pos + 1);
    if (pos == std::string::npos)
        return std::nullopt;
    return pos;
}

static std::optional<std::string> read_json_string(const std::string& json, const std::string& key)
{
    auto pos = find_json_value(json, key);
    if (!pos || json[*pos] != '"')
        return std::nullopt;
    size_t end = *pos + 1;
    while (end < json.size())
    {
        if (json[end] == '"' && json[end - 1] != '\\')
            break;
        ++end;
    }
    if (end >= json.size())
        return std::nullopt;
    return unescape_json(json.substr(*pos + 1, end - *pos - 1));
}

static std::optional<double> read_json_number(const std::string& json, const std::string& key)
{
    auto pos = find_json_value(json, key);
    if (!pos)
        return std::nullopt;
    const char* begin = json.c_str() + *pos;
    char*       end   = nullptr;
    double      value = std::strtod(begin, &end);
    if (end == begin)
        return std::nullopt;
    return value;
}

static void read_u32(const std::string& json, const std::string& key, uint32_t& out)
{
    auto value = read_json_number(json, key);
    if (!value)
        return;
    if (*value < 0.0 || *value > 4294967295.0)
    {
        TABSYNC_LOG_WARN("config", "ignoring out-of-range {} = {}", key, *value);
        return;
    }
    out = static_cast<uint32_t>(*value);
}

bool TabsyncConfig::deserialize(const std::string& json)
{
    if (json.empty() || json.find('{') == std::string::npos)
        return false;

    // Check version
    if (auto ver = read_json_number(json, "version"); ver && *ver > 1)
        return false;   // Future version

    if (auto v = read_json_number(json, "drag_threshold_px"))
    {
        if (*v >= 0.0)
            drag_threshold_px = static_cast<float>(*v);
        else
            TABSYNC_LOG_WARN("config", "ignoring negative drag_threshold_px {}", *v);
    }
    read_u32(json, "suppression_timeout_ms", suppression_timeout_ms);
    read_u32(json, "push_debounce_ms", push_debounce_ms);
    read_u32(json, "invoke_timeout_ms", invoke_timeout_ms);
    read_u32(json, "max_tabs", max_tabs);

    if (auto v = read_json_string(json, "home_url"))
        home_url = *v;
    if (auto v = read_json_string(json, "socket_path"))
        socket_path = *v;
    if (auto v = read_json_string(json, "log_level"))
        log_level = *v;
    if (auto v = read_json_string(json, "log_file"))
        log_file = *v;
    return true;
}

// ─── File I/O ────────────────────────────────────────────────────────────────

bool TabsyncConfig::save(const std::string& path) const
{
    // Create parent directories
    auto dir = std::filesystem::path(path).parent_path();
    if (!dir.empty())
    {
        std::error_code ec;
        std::filesystem::create_directories(dir, ec);
        if (ec)
            TABSYNC_LOG_WARN("config", "cannot create {}: {}", dir.string(), ec.message());
    }

    std::ofstream f(path);
    if (!f.is_open())
        return false;
    f << serialize();
    return f.good();
}

bool TabsyncConfig::load(const std::string& path)
{
    std::ifstream f(path);
    if (!f.is_open())
        return false;
    std::string json((std::istreambuf_iterator<char>(f)), std::istreambuf_iterator<char>());
    return deserialize(json);
}

std::string TabsyncConfig::default_path()
{
    const char* xdg = std::getenv("XDG_CONFIG_HOME");
    if (xdg && xdg[0] != '\0')
        return (std::filesystem::path(xdg) / "tabsync" / "config.json").string();

    const char* home = std::getenv("HOME");
    if (!home)
        return "config.json";

    std::filesystem::path dir = std::filesystem::path(home) / ".config" / "tabsync";
    return (dir / "config.json").string();
}

// ─── Command line ────────────────────────────────────────────────────────────

CommandLine parse_command_line(int argc, const char* const* argv)
{
    CommandLine cli;
    for (int i = 1; i < argc; ++i)
    {
        std::string arg = argv[i];

        auto take_value = [&](std::optional<std::string>& out) -> bool
        {
            if (i + 1 >= argc)
            {
                cli.error = arg + " requires a value";
                return false;
            }
            out = argv[++i];
            return true;
        };

        if (arg == "--config")
        {
            if (!take_value(cli.config_path))
                break;
        }
        else if (arg == "--socket")
        {
            if (!take_value(cli.socket_path))
                break;
        }
        else if (arg == "--log-level")
        {
            if (!take_value(cli.log_level))
                break;
            if (!Logger::level_from_string(*cli.log_level))
            {
                cli.error = "unknown log level: " + *cli.log_level;
                break;
            }
        }
        else if (arg == "--inproc")
        {
            cli.inproc = true;
        }
        else if (arg == "--help" || arg == "-h")
        {
            cli.show_help = true;
        }
        else if (arg.rfind("--", 0) == 0)
        {
            cli.error = "unknown option: " + arg;
            break;
        }
        else
        {
            cli.positional.push_back(arg);
        }
    }
    return cli;
}

TabsyncConfig resolve_config(const CommandLine& cli)
{
    TabsyncConfig config;

    std::string path     = cli.config_path.value_or(TabsyncConfig::default_path());
    bool        explicit_path = cli.config_path.has_value();

    std::error_code ec;
    if (explicit_path || std::filesystem::exists(path, ec))
    {
        if (config.load(path))
            TABSYNC_LOG_DEBUG("config", "loaded {}", path);
        else
            TABSYNC_LOG_WARN("config", "could not read {}, using defaults", path);
    }

    if (cli.socket_path)
        config.socket_path = *cli.socket_path;
    if (cli.log_level)
        config.log_level = *cli.log_level;
    config.inproc = cli.inproc;
    return config;
}

void apply_logging(const TabsyncConfig& config)
{
    auto& logger = Logger::instance();

    auto level = config.parsed_log_level();
    if (!level)
    {
        TABSYNC_LOG_WARN("config", "unknown log_level '{}', keeping info", config.log_level);
        level = LogLevel::Info;
    }
    logger.set_level(*level);

    logger.clear_sinks();
    logger.add_sink(sinks::console_sink());
    if (!config.log_file.empty())
        logger.add_sink(sinks::file_sink(config.log_file));
}

}   // namespace tabsync
