#include <devscope/config/config_helpers.h>

#include <charconv>
#include <fstream>

namespace devscope::config {

namespace {

// Strips a trailing `# comment` that is not inside quotes
std::string stripInlineComment(const std::string& v) {
    char quote = 0;
    for (std::size_t i = 0; i < v.size(); ++i) {
        char c = v[i];
        if (quote) {
            if (c == quote) {
                quote = 0;
            }
        } else if (c == '"' || c == '\'') {
            quote = c;
        } else if (c == '#') {
            return v.substr(0, i);
        }
    }
    return v;
}

} // namespace

Result<ConfigValues> load_config_values(const std::filesystem::path& config_path) {
    ConfigValues values;
    std::error_code ec;
    if (config_path.empty() || !std::filesystem::exists(config_path, ec)) {
        return values;
    }

    std::ifstream file(config_path);
    if (!file) {
        return Error{ErrorCode::InvalidArgument,
                     "Cannot open config file: " + config_path.string()};
    }

    std::string line;
    std::string currentSection;
    std::size_t lineNo = 0;
    while (std::getline(file, line)) {
        ++lineNo;
        trim(line);

        // Skip comments and empty lines
        if (line.empty() || line[0] == '#') {
            continue;
        }

        // Check for section headers [section]
        if (line[0] == '[') {
            size_t end = line.find(']');
            if (end == std::string::npos) {
                return Error{ErrorCode::InvalidData, config_path.string() + ":" +
                                                         std::to_string(lineNo) +
                                                         ": unterminated section header"};
            }
            currentSection = line.substr(1, end - 1);
            trim(currentSection);
            continue;
        }

        size_t eq = line.find('=');
        if (eq == std::string::npos) {
            return Error{ErrorCode::InvalidData, config_path.string() + ":" +
                                                     std::to_string(lineNo) +
                                                     ": expected key = value"};
        }
        std::string k = line.substr(0, eq);
        std::string v = stripInlineComment(line.substr(eq + 1));
        trim(k);

        // Dotted keys outside a section ("streaming.idle_timeout_s = 60") are accepted too
        auto full = currentSection.empty() ? k : currentSection + "." + k;
        values[full] = unquote(v);
    }
    return values;
}

std::filesystem::path get_config_path(const std::string& override_path) {
    if (!override_path.empty()) {
        return expand_tilde(override_path);
    }

    const char* xdgConfigHome = std::getenv("XDG_CONFIG_HOME");
    const char* homeEnv = std::getenv("HOME");

    std::filesystem::path configHome;
    if (xdgConfigHome && *xdgConfigHome) {
        configHome = std::filesystem::path(xdgConfigHome);
    } else if (homeEnv) {
        configHome = std::filesystem::path(homeEnv) / ".config";
    } else {
        return {};
    }

    return configHome / "devscope" / "config.toml";
}

std::optional<bool> parse_bool(std::string_view s) {
    std::string v(s);
    trim(v);
    std::transform(v.begin(), v.end(), v.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (v == "true" || v == "1" || v == "yes" || v == "on") {
        return true;
    }
    if (v == "false" || v == "0" || v == "no" || v == "off") {
        return false;
    }
    return std::nullopt;
}

std::optional<long long> parse_integer(std::string_view s) {
    std::string v(s);
    trim(v);
    long long out = 0;
    auto [ptr, ec] = std::from_chars(v.data(), v.data() + v.size(), out);
    if (v.empty() || ec != std::errc{} || ptr != v.data() + v.size()) {
        return std::nullopt;
    }
    return out;
}

std::optional<double> parse_double(std::string_view s) {
    std::string v(s);
    trim(v);
    if (v.empty()) {
        return std::nullopt;
    }
    char* end = nullptr;
    double out = std::strtod(v.c_str(), &end);
    if (end != v.c_str() + v.size()) {
        return std::nullopt;
    }
    return out;
}

} // namespace devscope::config
