// ==============================================================================
// cli.cpp - CLI парсинг
// ==============================================================================

#include "curator/cli.hpp"

#include "curator/platform.hpp"

#include <cerrno>
#include <cstdint>
#include <cstdlib>
#include <cstring>
#include <type_traits>
#include <utility>

namespace curator::cli {

// ----------------------------------------------------------------------------
// Вспомогательные функции
// ----------------------------------------------------------------------------

namespace {

bool str_eq(const char* a, const char* b) {
    return std::strcmp(a, b) == 0;
}

bool starts_with(const char* str, const char* prefix) {
    return std::strncmp(str, prefix, std::strlen(prefix)) == 0;
}

/// Опции, которые принимает подкоманда
enum OptionMask : unsigned {
    OPT_WORKERS = 1u << 0,
    OPT_DUPLICATES = 1u << 1,
    OPT_VT_THRESHOLD = 1u << 2,
    OPT_TERMS = 1u << 3,
    OPT_OUTPUT = 1u << 4,
    OPT_CONFIG = 1u << 5,
    OPT_LABEL = 1u << 6,
    OPT_INCLUDE = 1u << 7,
    OPT_EXCLUDE = 1u << 8,
    OPT_COUNT = 1u << 9,
    OPT_CRITERIA = 1u << 10,
    OPT_MAPPING = 1u << 11,
    OPT_SEED = 1u << 12,
};

constexpr unsigned EXTRACT_MASK = OPT_LABEL | OPT_INCLUDE | OPT_EXCLUDE | OPT_COUNT |
                                  OPT_CRITERIA | OPT_MAPPING | OPT_SEED | OPT_OUTPUT;

enum class ArgsStatus { Ok, Help, Error };

std::string usage_line(const std::string& command) {
    if (command == "rename") {
        return "Usage: curator rename <JSON_DIR>";
    }
    return "Usage: curator " + command + " [OPTIONS] <JSON_DIR>";
}

/// Ошибка в стиле clap: error + "\n\n" + Usage + "\n\n" + hint
std::string render_usage_error(const std::string& error_msg, const std::string& usage) {
    return error_msg + "\n\n" + usage + "\n\nFor more information, try '--help'.\n";
}

void fail(ParseResult& result, const std::string& error_msg, const std::string& usage) {
    result.ok = false;
    result.diagnostic.exit_code = 2;
    result.diagnostic.stderr_message = render_usage_error(error_msg, usage);
}

/// Глобальный флаг (допустим в любой позиции)
bool apply_global_flag(const char* arg, GlobalOptions& global) {
    if (str_eq(arg, "--no-banner")) {
        global.no_banner = true;
        return true;
    }
    if (str_eq(arg, "-v")) {
        global.verbose++;
        return true;
    }
    if (str_eq(arg, "-q") || str_eq(arg, "--quiet") || str_eq(arg, "-s") ||
        str_eq(arg, "--silent")) {
        global.quiet = true;
        return true;
    }
    return false;
}

bool parse_int(const std::string& text, long long& out) {
    if (text.empty()) {
        return false;
    }
    errno = 0;
    char* end = nullptr;
    long long value = std::strtoll(text.c_str(), &end, 10);
    if (errno != 0 || end == nullptr || *end != '\0') {
        return false;
    }
    out = value;
    return true;
}

/// Разбор аргументов подкоманды: позиционный <JSON_DIR> и опции из mask.
/// Опции выборки (OPT_LABEL..OPT_SEED) пишутся в extract, он обязателен при их наличии в mask.
ArgsStatus parse_command_args(int argc, char** argv, int start, const std::string& command,
                              unsigned mask, ParseResult& result,
                              std::filesystem::path& json_dir, PhaseOptions& options,
                              curate::ExtractOptions* extract = nullptr) {
    const std::string usage = usage_line(command);
    bool have_dir = false;

    for (int i = start; i < argc; ++i) {
        const char* arg = argv[i];

        if (str_eq(arg, "-h") || str_eq(arg, "--help")) {
            return ArgsStatus::Help;
        }
        if (apply_global_flag(arg, result.global)) {
            continue;
        }

        if (arg[0] != '-' || str_eq(arg, "-")) {
            if (have_dir) {
                fail(result, std::string("error: unexpected argument '") + arg + "' found", usage);
                return ArgsStatus::Error;
            }
            json_dir = platform::path_from_utf8(arg);
            have_dir = true;
            continue;
        }

        // --name=value
        std::string name = arg;
        std::optional<std::string> inline_value;
        if (starts_with(arg, "--")) {
            auto eq = name.find('=');
            if (eq != std::string::npos) {
                inline_value = name.substr(eq + 1);
                name = name.substr(0, eq);
            }
        }

        unsigned option = 0;
        const char* display = "";
        if ((name == "-w" || name == "--workers") && (mask & OPT_WORKERS)) {
            option = OPT_WORKERS;
            display = "--workers <WORKERS>";
        } else if ((name == "-d" || name == "--duplicates") && (mask & OPT_DUPLICATES)) {
            option = OPT_DUPLICATES;
            display = "--duplicates <DUPLICATES>";
        } else if ((name == "--vt-threshold" || name == "-vt" ||
                    name == "--vt-positives-threshold") &&
                   (mask & OPT_VT_THRESHOLD)) {
            option = OPT_VT_THRESHOLD;
            display = "--vt-threshold <VT_THRESHOLD>";
        } else if ((name == "-a" || name == "--anonymize-terms") && (mask & OPT_TERMS)) {
            option = OPT_TERMS;
            display = "--anonymize-terms <FILE>";
        } else if ((name == "-o" || name == "--output") && (mask & OPT_OUTPUT)) {
            option = OPT_OUTPUT;
            display = "--output <DIR>";
        } else if ((name == "-c" || name == "--config") && (mask & OPT_CONFIG)) {
            option = OPT_CONFIG;
            display = "--config <FILE>";
        } else if ((name == "-l" || name == "--label") && (mask & OPT_LABEL)) {
            option = OPT_LABEL;
            display = "--label <LABEL>";
        } else if ((name == "-i" || name == "--include") && (mask & OPT_INCLUDE)) {
            option = OPT_INCLUDE;
            display = "--include <FAMILIES>";
        } else if ((name == "-e" || name == "--exclude") && (mask & OPT_EXCLUDE)) {
            option = OPT_EXCLUDE;
            display = "--exclude <FAMILIES>";
        } else if ((name == "-n" || name == "--count") && (mask & OPT_COUNT)) {
            option = OPT_COUNT;
            display = "--count <COUNT>";
        } else if ((name == "-c" || name == "--criteria") && (mask & OPT_CRITERIA)) {
            option = OPT_CRITERIA;
            display = "--criteria <CRITERIA>";
        } else if ((name == "-m" || name == "--mapping") && (mask & OPT_MAPPING)) {
            option = OPT_MAPPING;
            display = "--mapping <FILE>";
        } else if (name == "--seed" && (mask & OPT_SEED)) {
            option = OPT_SEED;
            display = "--seed <SEED>";
        } else {
            fail(result, std::string("error: unexpected argument '") + arg + "' found", usage);
            return ArgsStatus::Error;
        }

        std::string value;
        if (inline_value.has_value()) {
            value = *inline_value;
        } else if (i + 1 < argc) {
            value = argv[++i];
        } else {
            fail(result,
                 std::string("error: a value is required for '") + display +
                     "' but none was supplied",
                 usage);
            return ArgsStatus::Error;
        }

        auto invalid = [&](const std::string& reason) {
            fail(result,
                 "error: invalid value '" + value + "' for '" + display + "': " + reason, usage);
            return ArgsStatus::Error;
        };

        long long number = 0;
        switch (option) {
            case OPT_WORKERS:
                if (!parse_int(value, number)) {
                    return invalid("invalid digit found in string");
                }
                if (number < 1) {
                    return invalid("number of workers must be at least 1");
                }
                options.workers = static_cast<std::size_t>(number);
                break;
            case OPT_DUPLICATES: {
                auto strategy = config::parse_keep_strategy(value);
                if (!strategy) {
                    return invalid("possible values: first, biggest");
                }
                options.duplicates = *strategy;
                break;
            }
            case OPT_VT_THRESHOLD:
                if (!parse_int(value, number)) {
                    return invalid("invalid digit found in string");
                }
                options.vt_threshold = static_cast<std::int64_t>(number);
                break;
            case OPT_TERMS:
                options.anonymize_terms = platform::path_from_utf8(value);
                break;
            case OPT_OUTPUT:
                options.output = platform::path_from_utf8(value);
                break;
            case OPT_CONFIG:
                options.config = platform::path_from_utf8(value);
                break;
            case OPT_LABEL: {
                auto label = curate::parse_label_source(value);
                if (!label) {
                    return invalid("possible values: A, C");
                }
                extract->label = *label;
                break;
            }
            case OPT_INCLUDE:
                extract->include = curate::split_families(value);
                break;
            case OPT_EXCLUDE:
                extract->exclude = curate::split_families(value);
                break;
            case OPT_COUNT:
                if (!parse_int(value, number)) {
                    return invalid("invalid digit found in string");
                }
                if (number < 1) {
                    return invalid("number of reports must be at least 1");
                }
                extract->count = static_cast<std::size_t>(number);
                break;
            case OPT_CRITERIA: {
                auto order = curate::parse_selection_order(value);
                if (!order) {
                    return invalid("possible values: r, f");
                }
                extract->order = *order;
                break;
            }
            case OPT_MAPPING:
                extract->mapping = platform::path_from_utf8(value);
                break;
            case OPT_SEED:
                if (!parse_int(value, number)) {
                    return invalid("invalid digit found in string");
                }
                if (number < 0 || number > static_cast<long long>(UINT32_MAX)) {
                    return invalid("seed must be between 0 and 4294967295");
                }
                extract->seed = static_cast<std::uint32_t>(number);
                break;
            default:
                break;
        }
    }

    if (!have_dir) {
        result.ok = false;
        result.diagnostic.exit_code = 2;
        result.diagnostic.stderr_message =
            "error: the following required arguments were not provided:\n"
            "  <JSON_DIR>\n\n" +
            usage + "\n\nFor more information, try '--help'.\n";
        return ArgsStatus::Error;
    }

    return ArgsStatus::Ok;
}

/// Разобрать подкоманду с позиционным <JSON_DIR> и записать её в result
template <typename CommandT>
void parse_phase_command(int argc, char** argv, int cmd_idx, const std::string& name,
                         unsigned mask, ParseResult& result) {
    CommandT cmd;
    PhaseOptions options;
    ArgsStatus status =
        parse_command_args(argc, argv, cmd_idx + 1, name, mask, result, cmd.json_dir, options);
    if (status == ArgsStatus::Help) {
        result.ok = true;
        result.command = HelpCommand{name};
        return;
    }
    if (status == ArgsStatus::Error) {
        return;
    }
    if constexpr (!std::is_same_v<CommandT, RenameCommand>) {
        cmd.options = options;
    }
    result.ok = true;
    result.command = std::move(cmd);
}

/// extract: опции выборки плюс --output как выходная директория
void parse_extract_command(int argc, char** argv, int cmd_idx, ParseResult& result) {
    ExtractCommand cmd;
    PhaseOptions options;
    ArgsStatus status = parse_command_args(argc, argv, cmd_idx + 1, "extract", EXTRACT_MASK,
                                           result, cmd.json_dir, options, &cmd.options);
    if (status == ArgsStatus::Help) {
        result.ok = true;
        result.command = HelpCommand{std::string("extract")};
        return;
    }
    if (status == ArgsStatus::Error) {
        return;
    }
    if (options.output) {
        cmd.options.output_dir = *options.output;
    }
    if (cmd.options.mapping && cmd.options.include.empty()) {
        fail(result,
             "error: the following required arguments were not provided:\n"
             "  --include <FAMILIES>",
             usage_line("extract"));
        return;
    }
    result.ok = true;
    result.command = std::move(cmd);
}

}  // anonymous namespace

// ----------------------------------------------------------------------------
// render_version
// ----------------------------------------------------------------------------

std::string render_version() {
    return std::string("curator ") + VERSION + "\n";
}

// ----------------------------------------------------------------------------
// render_help
// ----------------------------------------------------------------------------

std::string render_help(const std::optional<std::string>& command) {
    if (!command.has_value()) {
        return std::string(ABOUT) +
               "\n"
               "\n"
               "Usage: curator [OPTIONS] <COMMAND>\n"
               "\n"
               "Commands:\n"
               "  run         Run the full pipeline: errors, duplicates, sanitize, stats\n"
               "  errors      Detect incorrect reports and move them aside\n"
               "  duplicates  Detect duplicate reports and keep one per sample\n"
               "  sanitize    Sanitize and anonymize reports in place\n"
               "  stats       Generate statistics over the reports\n"
               "  rename      Rename every report to <sha256>.json\n"
               "  extract     Copy a per-family selection of reports to another directory\n"
               "  help        Print this message or the help of the given subcommand(s)\n"
               "\n"
               "Options:\n"
               "      --no-banner  Hide the banner\n"
               "  -q, --quiet      Suppress informational output (alias: -s, --silent)\n"
               "  -v...            Print verbose output\n"
               "  -h, --help       Print help\n"
               "  -V, --version    Print version\n"
               "\n"
               "Examples:\n"
               "\n"
               "    Curate a directory of reports keeping the biggest duplicate:\n"
               "        ./curator run reports/ -w 16 -a terms_to_anonymize.txt\n"
               "\n"
               "    Only compute statistics with a custom detection threshold:\n"
               "        ./curator stats reports/ --vt-threshold 5\n";
    } else if (*command == "run") {
        return "Run the full pipeline: errors, duplicates, sanitize, stats\n"
               "WARNING: reports in <JSON_DIR> are moved and rewritten in place\n"
               "\n"
               "Usage: curator run [OPTIONS] <JSON_DIR>\n"
               "\n"
               "Arguments:\n"
               "  <JSON_DIR>  The directory containing one or more json reports\n"
               "\n"
               "Options:\n"
               "  -w, --workers <WORKERS>            Number of workers to use [default: 10]\n"
               "  -d, --duplicates <DUPLICATES>      Which duplicate to keep: first, biggest "
               "[default: biggest]\n"
               "      --vt-threshold <VT_THRESHOLD>  Threshold for VirusTotal positives "
               "[default: 10]\n"
               "  -a, --anonymize-terms <FILE>       Terms to replace with [REDACTED], one per "
               "line [default: terms_to_anonymize.txt]\n"
               "  -o, --output <DIR>                 Directory for results [default: .]\n"
               "  -c, --config <FILE>                YAML configuration file\n"
               "  -h, --help                         Print help\n";
    } else if (*command == "errors") {
        return "Detect incorrect reports and move them aside\n"
               "\n"
               "Usage: curator errors [OPTIONS] <JSON_DIR>\n"
               "\n"
               "Arguments:\n"
               "  <JSON_DIR>  The directory containing one or more json reports\n"
               "\n"
               "Options:\n"
               "  -o, --output <DIR>   Directory for results [default: .]\n"
               "  -c, --config <FILE>  YAML configuration file\n"
               "  -h, --help           Print help\n";
    } else if (*command == "duplicates") {
        return "Detect duplicate reports and keep one per sample\n"
               "\n"
               "Usage: curator duplicates [OPTIONS] <JSON_DIR>\n"
               "\n"
               "Arguments:\n"
               "  <JSON_DIR>  The directory containing one or more json reports\n"
               "\n"
               "Options:\n"
               "  -d, --duplicates <DUPLICATES>  Which duplicate to keep: first, biggest "
               "[default: biggest]\n"
               "  -o, --output <DIR>             Directory for results [default: .]\n"
               "  -c, --config <FILE>            YAML configuration file\n"
               "  -h, --help                     Print help\n";
    } else if (*command == "sanitize") {
        return "Sanitize and anonymize reports in place\n"
               "\n"
               "Usage: curator sanitize [OPTIONS] <JSON_DIR>\n"
               "\n"
               "Arguments:\n"
               "  <JSON_DIR>  The directory containing one or more json reports\n"
               "\n"
               "Options:\n"
               "  -w, --workers <WORKERS>       Number of workers to use [default: 10]\n"
               "  -a, --anonymize-terms <FILE>  Terms to replace with [REDACTED], one per line "
               "[default: terms_to_anonymize.txt]\n"
               "  -c, --config <FILE>           YAML configuration file\n"
               "  -h, --help                    Print help\n";
    } else if (*command == "stats") {
        return "Generate statistics over the reports\n"
               "\n"
               "Usage: curator stats [OPTIONS] <JSON_DIR>\n"
               "\n"
               "Arguments:\n"
               "  <JSON_DIR>  The directory containing one or more json reports\n"
               "\n"
               "Options:\n"
               "      --vt-threshold <VT_THRESHOLD>  Threshold for VirusTotal positives "
               "[default: 10]\n"
               "  -o, --output <DIR>                 Directory for results [default: .]\n"
               "  -c, --config <FILE>                YAML configuration file\n"
               "  -h, --help                         Print help\n";
    } else if (*command == "rename") {
        return "Rename every report to <sha256>.json\n"
               "\n"
               "Usage: curator rename <JSON_DIR>\n"
               "\n"
               "Arguments:\n"
               "  <JSON_DIR>  The directory containing one or more json reports\n"
               "\n"
               "Options:\n"
               "  -h, --help  Print help\n";
    } else if (*command == "extract") {
        return "Copy a per-family selection of reports to another directory\n"
               "\n"
               "Usage: curator extract [OPTIONS] <JSON_DIR>\n"
               "\n"
               "Arguments:\n"
               "  <JSON_DIR>  The directory containing one or more json reports\n"
               "\n"
               "Options:\n"
               "  -l, --label <LABEL>        Family label to use: A (AVClass), C (CAPE) "
               "[default: A]\n"
               "  -i, --include <FAMILIES>   Comma-separated families; --count applies to each\n"
               "  -e, --exclude <FAMILIES>   Comma-separated families to skip when --include "
               "is not given\n"
               "  -n, --count <COUNT>        Reports per family, or in total without --include "
               "[default: 100]\n"
               "  -c, --criteria <CRITERIA>  Selection order: r (random), f (first found) "
               "[default: r]\n"
               "  -m, --mapping <FILE>       Select from a label mapping JSON instead of "
               "reading reports\n"
               "      --seed <SEED>          Seed for random selection\n"
               "  -o, --output <DIR>         Directory for the selected reports "
               "[default: extracted_reports]\n"
               "  -h, --help                 Print help\n";
    } else {
        return "error: unrecognized subcommand '" + *command + "'\n";
    }
}

// ----------------------------------------------------------------------------
// parse
// ----------------------------------------------------------------------------

ParseResult parse(int argc, char** argv) {
    ParseResult result;
    result.ok = false;
    result.command = HelpCommand{};

    if (argc < 2) {
        // Без аргументов: справка в stderr, exit code 2
        result.diagnostic.exit_code = 2;
        result.diagnostic.stderr_message = render_help(std::nullopt);
        return result;
    }

    // Глобальные опции и поиск подкоманды
    int cmd_idx = argc;
    for (int i = 1; i < argc; ++i) {
        const char* arg = argv[i];

        if (apply_global_flag(arg, result.global)) {
            continue;
        } else if (str_eq(arg, "-h") || str_eq(arg, "--help")) {
            result.ok = true;
            result.command = HelpCommand{};
            return result;
        } else if (str_eq(arg, "-V") || str_eq(arg, "--version")) {
            result.ok = true;
            result.command = VersionCommand{};
            return result;
        } else if (arg[0] != '-') {
            cmd_idx = i;
            break;
        } else {
            fail(result, std::string("error: unexpected argument '") + arg + "' found",
                 "Usage: curator [OPTIONS] <COMMAND>");
            return result;
        }
    }

    if (cmd_idx >= argc) {
        result.ok = true;
        result.command = HelpCommand{};
        return result;
    }

    const char* cmd = argv[cmd_idx];

    if (str_eq(cmd, "run")) {
        parse_phase_command<RunCommand>(
            argc, argv, cmd_idx, "run",
            OPT_WORKERS | OPT_DUPLICATES | OPT_VT_THRESHOLD | OPT_TERMS | OPT_OUTPUT | OPT_CONFIG,
            result);
    } else if (str_eq(cmd, "errors")) {
        parse_phase_command<ErrorsCommand>(argc, argv, cmd_idx, "errors",
                                           OPT_OUTPUT | OPT_CONFIG, result);
    } else if (str_eq(cmd, "duplicates")) {
        parse_phase_command<DuplicatesCommand>(argc, argv, cmd_idx, "duplicates",
                                               OPT_DUPLICATES | OPT_OUTPUT | OPT_CONFIG, result);
    } else if (str_eq(cmd, "sanitize")) {
        parse_phase_command<SanitizeCommand>(argc, argv, cmd_idx, "sanitize",
                                             OPT_WORKERS | OPT_TERMS | OPT_CONFIG, result);
    } else if (str_eq(cmd, "stats")) {
        parse_phase_command<StatsCommand>(argc, argv, cmd_idx, "stats",
                                          OPT_VT_THRESHOLD | OPT_OUTPUT | OPT_CONFIG, result);
    } else if (str_eq(cmd, "rename")) {
        parse_phase_command<RenameCommand>(argc, argv, cmd_idx, "rename", 0, result);
    } else if (str_eq(cmd, "extract")) {
        parse_extract_command(argc, argv, cmd_idx, result);
    } else if (str_eq(cmd, "help")) {
        result.ok = true;
        if (cmd_idx + 1 < argc) {
            result.command = HelpCommand{std::string(argv[cmd_idx + 1])};
        } else {
            result.command = HelpCommand{};
        }
    } else if (str_eq(cmd, "version")) {
        result.ok = true;
        result.command = VersionCommand{};
    } else {
        fail(result, std::string("error: unrecognized subcommand '") + cmd + "'",
             "Usage: curator [OPTIONS] <COMMAND>");
    }

    return result;
}

// ----------------------------------------------------------------------------
// effective_config
// ----------------------------------------------------------------------------

config::ConfigResult effective_config(const PhaseOptions& options) {
    config::ConfigResult result;
    if (options.config.has_value()) {
        result = config::load_config_file(*options.config);
        if (!result.ok) {
            return result;
        }
    } else {
        result.ok = true;
    }

    config::Config& cfg = result.config;
    if (options.workers) {
        cfg.workers = *options.workers;
    }
    if (options.duplicates) {
        cfg.keep_strategy = *options.duplicates;
    }
    if (options.vt_threshold) {
        cfg.vt_threshold = *options.vt_threshold;
    }
    if (options.anonymize_terms) {
        cfg.terms_file = *options.anonymize_terms;
    }
    if (options.output) {
        cfg.output_dir = *options.output;
    }

    std::string error = config::validate(cfg);
    if (!error.empty()) {
        result.ok = false;
        result.error = error;
    }
    return result;
}

}  // namespace curator::cli
