// ==============================================================================
// config.cpp - Параметры запуска пайплайна
// ==============================================================================

#include <curator/config.hpp>
#include <curator/platform.hpp>
#include <fstream>
#include <sstream>
#include <yaml-cpp/yaml.h>

namespace curator::config {

// ============================================================================
// KeepStrategy
// ============================================================================

std::optional<KeepStrategy> parse_keep_strategy(std::string_view s) {
    if (s == "first") {
        return KeepStrategy::First;
    }
    if (s == "biggest") {
        return KeepStrategy::Biggest;
    }
    return std::nullopt;
}

std::string keep_strategy_to_string(KeepStrategy strategy) {
    switch (strategy) {
        case KeepStrategy::First:
            return "first";
        case KeepStrategy::Biggest:
            return "biggest";
    }
    return "biggest";
}

std::vector<std::string> default_sections_to_delete() {
    return {"statistics", "info",     "local_conf", "debug",    "detections2pid",
            "malfamily",  "malfamily_tag", "malscore", "network", "procmemory",
            "shots",      "suricata", "ttps",       "url_analysis"};
}

// ============================================================================
// Разбор YAML
// ============================================================================

namespace {

/// Ошибка типа значения ключа
std::string type_error(const std::string& key, const char* expected) {
    return "invalid value for '" + key + "' - expected " + expected;
}

bool read_scalar_string(const YAML::Node& node, const std::string& key, std::string& out,
                        std::string& error) {
    if (!node.IsScalar()) {
        error = type_error(key, "a string");
        return false;
    }
    out = node.as<std::string>();
    return true;
}

bool read_integer(const YAML::Node& node, const std::string& key, long long& out,
                  std::string& error) {
    if (!node.IsScalar()) {
        error = type_error(key, "an integer");
        return false;
    }
    try {
        out = node.as<long long>();
    } catch (const YAML::BadConversion&) {
        error = type_error(key, "an integer");
        return false;
    }
    return true;
}

ConfigResult apply_root(const YAML::Node& root, const Config& base) {
    ConfigResult result;
    result.config = base;

    // Пустой документ - конфигурация без изменений
    if (!root || root.IsNull()) {
        result.ok = true;
        return result;
    }

    if (!root.IsMap()) {
        result.error = "configuration root must be a mapping";
        return result;
    }

    Config& cfg = result.config;

    for (const auto& kv : root) {
        const std::string key = kv.first.as<std::string>();
        const YAML::Node& value = kv.second;

        if (key == "workers") {
            long long n = 0;
            if (!read_integer(value, key, n, result.error)) {
                return result;
            }
            if (n < 1) {
                result.error = "invalid value for 'workers' - must be at least 1";
                return result;
            }
            cfg.workers = static_cast<std::size_t>(n);
        } else if (key == "duplicates") {
            std::string s;
            if (!read_scalar_string(value, key, s, result.error)) {
                return result;
            }
            auto strategy = parse_keep_strategy(s);
            if (!strategy) {
                result.error = "invalid value for 'duplicates' - expected 'first' or 'biggest'";
                return result;
            }
            cfg.keep_strategy = *strategy;
        } else if (key == "vt_threshold") {
            long long n = 0;
            if (!read_integer(value, key, n, result.error)) {
                return result;
            }
            cfg.vt_threshold = static_cast<std::int64_t>(n);
        } else if (key == "anonymize_terms") {
            std::string s;
            if (!read_scalar_string(value, key, s, result.error)) {
                return result;
            }
            cfg.terms_file = platform::path_from_utf8(s);
        } else if (key == "sections_to_delete") {
            if (!value.IsSequence()) {
                result.error = type_error(key, "a sequence of strings");
                return result;
            }
            std::vector<std::string> sections;
            for (const auto& item : value) {
                if (!item.IsScalar()) {
                    result.error = type_error(key, "a sequence of strings");
                    return result;
                }
                sections.push_back(item.as<std::string>());
            }
            cfg.sections_to_delete = std::move(sections);
        } else if (key == "output") {
            std::string s;
            if (!read_scalar_string(value, key, s, result.error)) {
                return result;
            }
            cfg.output_dir = platform::path_from_utf8(s);
        } else if (key == "redaction_marker") {
            std::string s;
            if (!read_scalar_string(value, key, s, result.error)) {
                return result;
            }
            cfg.redaction_marker = s;
        } else {
            result.warnings.push_back("unknown configuration key '" + key + "' ignored");
        }
    }

    result.ok = true;
    return result;
}

}  // anonymous namespace

// ============================================================================
// Публичный API
// ============================================================================

ConfigResult parse_config(std::string_view yaml, const Config& base) {
    try {
        YAML::Node root = YAML::Load(std::string(yaml));
        return apply_root(root, base);
    } catch (const YAML::Exception& e) {
        ConfigResult result;
        result.config = base;
        result.error = std::string("YAML parse error: ") + e.what();
        return result;
    }
}

ConfigResult load_config_file(const std::filesystem::path& path, const Config& base) {
    std::ifstream file(path);
    if (!file.is_open()) {
        ConfigResult result;
        result.config = base;
        result.error = "cannot open configuration file: " + platform::path_to_utf8(path);
        return result;
    }

    std::ostringstream ss;
    ss << file.rdbuf();
    ConfigResult result = parse_config(ss.str(), base);
    if (!result.ok) {
        result.error = platform::path_to_utf8(path) + ": " + result.error;
    }
    return result;
}

std::string validate(const Config& config) {
    if (config.workers < 1) {
        return "number of workers must be at least 1";
    }
    if (config.redaction_marker.empty()) {
        return "redaction marker must not be empty";
    }
    return {};
}

}  // namespace curator::config
