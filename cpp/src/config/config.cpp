// ==============================================================================
// config.cpp - Конфигурация сервиса
// ==============================================================================
//
// yaml-cpp для файла конфигурации, std::getenv для окружения.
//
// ==============================================================================

#include "turbosort/config.hpp"

#include "turbosort/platform.hpp"

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <limits>
#include <map>
#include <vector>
#include <yaml-cpp/yaml.h>

namespace turbosort::config {

namespace {

constexpr const char* DEFAULT_HISTORY_NAME = "turbosort_history.json";

/// Применяет строковое значение к Config; возвращает текст ошибки
using Setter = std::function<std::optional<std::string>(Config&, const std::string&)>;

struct Option {
    const char* env_name;
    const char* yaml_key;
    Setter apply;
};

Setter set_path(std::filesystem::path Config::*field) {
    return [field](Config& cfg, const std::string& value) -> std::optional<std::string> {
        if (value.empty()) {
            return std::string("path must not be empty");
        }
        cfg.*field = platform::path_from_utf8(value);
        return std::nullopt;
    };
}

Setter set_bool(bool Config::*field) {
    return [field](Config& cfg, const std::string& value) -> std::optional<std::string> {
        auto parsed = parse_bool(value);
        if (!parsed) {
            return "invalid boolean '" + value + "'";
        }
        cfg.*field = *parsed;
        return std::nullopt;
    };
}

Setter set_uint(std::uint32_t Config::*field) {
    return [field](Config& cfg, const std::string& value) -> std::optional<std::string> {
        auto parsed = parse_uint(value);
        if (!parsed) {
            return "invalid non-negative integer '" + value + "'";
        }
        cfg.*field = *parsed;
        return std::nullopt;
    };
}

Setter set_s3(std::string S3Settings::*field) {
    return [field](Config& cfg, const std::string& value) -> std::optional<std::string> {
        cfg.s3.*field = value;
        return std::nullopt;
    };
}

const std::vector<Option>& options() {
    // HISTORY_DIR стоит раньше HISTORY_FILE: явный HISTORY_FILE имеет приоритет
    static const std::vector<Option> table = {
        {"SOURCE_DIR", "source_dir", set_path(&Config::source_dir)},
        {"DEST_DIR", "dest_dir", set_path(&Config::dest_dir)},
        {"HISTORY_DIR", "history_dir",
         [](Config& cfg, const std::string& value) -> std::optional<std::string> {
             if (value.empty()) {
                 return std::string("path must not be empty");
             }
             cfg.history_file = platform::path_from_utf8(value) / DEFAULT_HISTORY_NAME;
             return std::nullopt;
         }},
        {"HISTORY_FILE", "history_file", set_path(&Config::history_file)},
        {"MARKER_FILE", "marker_file",
         [](Config& cfg, const std::string& value) -> std::optional<std::string> {
             if (value.empty() || value.find('/') != std::string::npos || value == "." ||
                 value == "..") {
                 return "invalid marker file name '" + value + "'";
             }
             cfg.marker_name = value;
             return std::nullopt;
         }},
        {"ENABLE_YEAR_PREFIX", "enable_year_prefix", set_bool(&Config::year_prefix)},
        {"ENABLE_DRIVE_SUFFIX", "enable_drive_suffix", set_bool(&Config::drive_suffix)},
        {"DRIVE_SUFFIX", "drive_suffix",
         [](Config& cfg, const std::string& value) -> std::optional<std::string> {
             cfg.drive_suffix_name = value;
             return std::nullopt;
         }},
        {"FORCE_RECOPY", "force_recopy", set_bool(&Config::force_recopy)},
        {"DEBOUNCE_SECONDS", "debounce_seconds", set_uint(&Config::debounce_seconds)},
        {"DRAIN_INTERVAL_MS", "drain_interval_ms", set_uint(&Config::drain_interval_ms)},
        {"LOCAL_RESCAN_INTERVAL", "local_rescan_interval",
         set_uint(&Config::local_rescan_interval)},
        {"STATS_INTERVAL", "stats_interval", set_uint(&Config::stats_interval)},
        {"USE_S3_SOURCE", "use_s3_source",
         [](Config& cfg, const std::string& value) -> std::optional<std::string> {
             auto parsed = parse_bool(value);
             if (!parsed) {
                 return "invalid boolean '" + value + "'";
             }
             cfg.source_kind = *parsed ? SourceKind::S3 : SourceKind::Local;
             return std::nullopt;
         }},
        {"S3_ENDPOINT", "s3_endpoint", set_s3(&S3Settings::endpoint)},
        {"S3_ACCESS_KEY", "s3_access_key", set_s3(&S3Settings::access_key)},
        {"S3_SECRET_KEY", "s3_secret_key", set_s3(&S3Settings::secret_key)},
        {"S3_BUCKET", "s3_bucket", set_s3(&S3Settings::bucket)},
        {"S3_REGION", "s3_region", set_s3(&S3Settings::region)},
        {"S3_PATH_PREFIX", "s3_path_prefix", set_s3(&S3Settings::prefix)},
        {"S3_POLL_INTERVAL", "s3_poll_interval", set_uint(&Config::s3_poll_interval)},
        {"S3_RESCAN_INTERVAL", "s3_rescan_interval", set_uint(&Config::s3_rescan_interval)},
    };
    return table;
}

std::string to_lower(std::string_view s) {
    std::string out(s);
    std::transform(out.begin(), out.end(), out.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return out;
}

std::string trim(std::string_view s) {
    size_t begin = 0;
    size_t end = s.size();
    while (begin < end && std::isspace(static_cast<unsigned char>(s[begin]))) {
        ++begin;
    }
    while (end > begin && std::isspace(static_cast<unsigned char>(s[end - 1]))) {
        --end;
    }
    return std::string(s.substr(begin, end - begin));
}

/// Применить YAML файл. Возвращает текст ошибки или nullopt.
std::optional<std::string> apply_yaml(Config& cfg, const std::filesystem::path& file) {
    YAML::Node root;
    try {
        root = YAML::LoadFile(platform::path_to_utf8(file));
    } catch (const YAML::BadFile&) {
        return "cannot read config file '" + platform::path_to_utf8(file) + "'";
    } catch (const YAML::Exception& e) {
        return "invalid config file '" + platform::path_to_utf8(file) + "' - " + e.what();
    }

    if (root.IsNull()) {
        return std::nullopt;  // пустой файл
    }
    if (!root.IsMap()) {
        return "config file '" + platform::path_to_utf8(file) + "' must contain a mapping";
    }

    const auto& table = options();
    std::map<std::string, std::string> values;
    for (const auto& item : root) {
        std::string key;
        try {
            key = item.first.as<std::string>();
        } catch (const YAML::Exception& e) {
            return std::string("invalid key in config file - ") + e.what();
        }

        auto it = std::find_if(table.begin(), table.end(),
                               [&](const Option& o) { return key == o.yaml_key; });
        if (it == table.end()) {
            return "unknown config key '" + key + "'";
        }
        if (!item.second.IsScalar()) {
            return "config key '" + key + "' must be a scalar";
        }
        values[key] = trim(item.second.Scalar());
    }

    // Порядок таблицы, а не файла: history_file перекрывает history_dir
    for (const auto& option : table) {
        auto it = values.find(option.yaml_key);
        if (it == values.end()) {
            continue;
        }
        if (auto err = option.apply(cfg, it->second)) {
            return it->first + ": " + *err;
        }
    }
    return std::nullopt;
}

}  // namespace

const char* source_kind_to_string(SourceKind kind) {
    switch (kind) {
    case SourceKind::Local:
        return "local";
    case SourceKind::S3:
        return "s3";
    }
    return "unknown";
}

EnvLookup process_env() {
    return [](const std::string& name) -> std::optional<std::string> {
        const char* value = std::getenv(name.c_str());
        if (value == nullptr) {
            return std::nullopt;
        }
        return std::string(value);
    };
}

std::optional<bool> parse_bool(std::string_view value) {
    std::string v = to_lower(trim(value));
    if (v == "true" || v == "yes" || v == "1" || v == "on") {
        return true;
    }
    if (v == "false" || v == "no" || v == "0" || v == "off") {
        return false;
    }
    return std::nullopt;
}

std::optional<std::uint32_t> parse_uint(std::string_view value) {
    std::string v = trim(value);
    if (v.empty() || v.size() > 10) {
        return std::nullopt;
    }
    std::uint64_t result = 0;
    for (char c : v) {
        if (!std::isdigit(static_cast<unsigned char>(c))) {
            return std::nullopt;
        }
        result = result * 10 + static_cast<std::uint64_t>(c - '0');
    }
    if (result > std::numeric_limits<std::uint32_t>::max()) {
        return std::nullopt;
    }
    return static_cast<std::uint32_t>(result);
}

std::optional<std::string> validate(const Config& cfg) {
    if (cfg.drive_suffix) {
        const std::string& s = cfg.drive_suffix_name;
        if (s.empty() || s == "." || s == ".." || s.find('/') != std::string::npos ||
            s.find('\\') != std::string::npos) {
            return "DRIVE_SUFFIX must be a single path segment, got '" + s + "'";
        }
    }
    if (cfg.drain_interval_ms == 0) {
        return std::string("DRAIN_INTERVAL_MS must be greater than zero");
    }
    if (cfg.source_kind == SourceKind::S3) {
        if (cfg.s3.bucket.empty()) {
            return std::string("S3_BUCKET must be set when USE_S3_SOURCE is enabled");
        }
        if (cfg.s3.endpoint.empty()) {
            return std::string("S3_ENDPOINT must be set when USE_S3_SOURCE is enabled");
        }
        if (cfg.s3_poll_interval == 0) {
            return std::string("S3_POLL_INTERVAL must be greater than zero");
        }
    }
    return std::nullopt;
}

ConfigResult load(const std::optional<std::filesystem::path>& config_file, const EnvLookup& env) {
    ConfigResult result;
    Config cfg;

    std::optional<std::filesystem::path> file = config_file;
    if (!file) {
        if (auto from_env = env("TURBOSORT_CONFIG"); from_env && !from_env->empty()) {
            file = platform::path_from_utf8(*from_env);
        }
    }

    if (file) {
        if (auto err = apply_yaml(cfg, *file)) {
            result.error = *err;
            return result;
        }
    }

    for (const auto& option : options()) {
        auto value = env(option.env_name);
        if (!value) {
            continue;
        }
        if (auto err = option.apply(cfg, trim(*value))) {
            result.error = std::string(option.env_name) + ": " + *err;
            return result;
        }
    }

    if (auto err = validate(cfg)) {
        result.error = *err;
        return result;
    }

    result.ok = true;
    result.config = std::move(cfg);
    return result;
}

}  // namespace turbosort::config
