// ==============================================================================
// cli.cpp - CLI парсинг
// ==============================================================================
//
// Собственный парсер argv; справка и ошибки в формате clap.
// Глобальные опции допускаются до и после подкоманды.
//
// ==============================================================================

#include "turbosort/cli.hpp"

#include "turbosort/platform.hpp"

#include <cstring>

namespace turbosort::cli {

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

bool is_known_command(const std::string& name) {
    return name == "run" || name == "scan" || name == "history" || name == "clear-history";
}

ParseResult usage_error(const std::string& message) {
    ParseResult result;
    result.ok = false;
    result.diagnostic.exit_code = 2;
    result.diagnostic.stderr_message = render_usage_error(message);
    return result;
}

}  // anonymous namespace

// ----------------------------------------------------------------------------
// render_version / render_help
// ----------------------------------------------------------------------------

std::string render_version() {
    return std::string("turbosort ") + VERSION + "\n";
}

std::string render_help(const std::optional<std::string>& command) {
    if (!command.has_value()) {
        return std::string(ABOUT) +
               "\n"
               "\n"
               "Usage: turbosort [OPTIONS] [COMMAND]\n"
               "\n"
               "Commands:\n"
               "  run            Watch the source and deliver files continuously (default)\n"
               "  scan           Perform one full scan and exit\n"
               "  history        Display the delivery history\n"
               "  clear-history  Remove every history entry and exit\n"
               "  help           Print this message or the help of the given subcommand(s)\n"
               "\n"
               "Options:\n"
               "  -c, --config <FILE>  YAML configuration file (overridden by environment)\n"
               "      --history        Same as 'history'\n"
               "      --detailed       Show detailed history (with --history)\n"
               "      --no-banner      Hide TurboSort's banner\n"
               "  -q                   Suppress informational output\n"
               "  -v...                Print verbose output\n"
               "  -h, --help           Print help\n"
               "  -V, --version        Print version\n"
               "\n"
               "Environment:\n"
               "  SOURCE_DIR, DEST_DIR, HISTORY_FILE, HISTORY_DIR, MARKER_FILE,\n"
               "  ENABLE_YEAR_PREFIX, ENABLE_DRIVE_SUFFIX, DRIVE_SUFFIX, FORCE_RECOPY,\n"
               "  DEBOUNCE_SECONDS, DRAIN_INTERVAL_MS, LOCAL_RESCAN_INTERVAL, STATS_INTERVAL,\n"
               "  USE_S3_SOURCE, S3_ENDPOINT, S3_ACCESS_KEY, S3_SECRET_KEY, S3_BUCKET,\n"
               "  S3_REGION, S3_PATH_PREFIX, S3_POLL_INTERVAL, S3_RESCAN_INTERVAL\n";
    } else if (*command == "run") {
        return "Watch the source and deliver files continuously (default)\n"
               "\n"
               "Usage: turbosort run [OPTIONS]\n"
               "\n"
               "Options:\n"
               "  -h, --help  Print help\n";
    } else if (*command == "scan") {
        return "Perform one full scan and exit\n"
               "\n"
               "Usage: turbosort scan [OPTIONS]\n"
               "\n"
               "Options:\n"
               "  -h, --help  Print help\n";
    } else if (*command == "history") {
        return "Display the delivery history\n"
               "\n"
               "Usage: turbosort history [OPTIONS]\n"
               "\n"
               "Options:\n"
               "      --detailed  Show every field of every record\n"
               "      --json      Print the history document as JSON\n"
               "  -h, --help      Print help\n";
    } else if (*command == "clear-history") {
        return "Remove every history entry and exit\n"
               "\n"
               "Usage: turbosort clear-history [OPTIONS]\n"
               "\n"
               "Options:\n"
               "  -h, --help  Print help\n";
    }
    return "error: unrecognized subcommand '" + *command + "'\n";
}

std::string render_usage_error(const std::string& error_msg) {
    return error_msg + "\n\n"
                       "Usage: turbosort [OPTIONS] [COMMAND]\n\n"
                       "For more information, try '--help'.\n";
}

// ----------------------------------------------------------------------------
// parse
// ----------------------------------------------------------------------------

ParseResult parse(int argc, char** argv) {
    GlobalOptions global;
    std::optional<std::string> command;
    bool history_flag = false;
    bool detailed = false;
    bool json = false;
    bool help = false;
    std::optional<std::string> help_topic;

    for (int i = 1; i < argc; ++i) {
        const char* arg = argv[i];

        if (str_eq(arg, "--no-banner")) {
            global.no_banner = true;
        } else if (str_eq(arg, "-q")) {
            global.quiet = true;
        } else if (arg[0] == '-' && arg[1] == 'v' && arg[1 + std::strspn(arg + 1, "v")] == '\0') {
            // -v, -vv, -vvv
            global.verbose += static_cast<int>(std::strlen(arg) - 1);
        } else if (str_eq(arg, "-c") || str_eq(arg, "--config")) {
            if (i + 1 >= argc) {
                return usage_error(
                    "error: a value is required for '--config <FILE>' but none was supplied");
            }
            ++i;
            global.config = platform::path_from_utf8(argv[i]);
        } else if (starts_with(arg, "--config=")) {
            const char* value = arg + std::strlen("--config=");
            if (*value == '\0') {
                return usage_error(
                    "error: a value is required for '--config <FILE>' but none was supplied");
            }
            global.config = platform::path_from_utf8(value);
        } else if (str_eq(arg, "--history")) {
            history_flag = true;
        } else if (str_eq(arg, "--detailed")) {
            detailed = true;
        } else if (str_eq(arg, "--json")) {
            json = true;
        } else if (str_eq(arg, "-h") || str_eq(arg, "--help")) {
            help = true;
        } else if (str_eq(arg, "-V") || str_eq(arg, "--version")) {
            ParseResult result;
            result.ok = true;
            result.global = global;
            result.command = VersionCommand{};
            return result;
        } else if (arg[0] == '-' && arg[1] != '\0') {
            return usage_error(std::string("error: unexpected argument '") + arg + "' found");
        } else if (!command) {
            command = arg;
        } else if (*command == "help" && !help_topic) {
            help_topic = arg;
        } else {
            return usage_error(std::string("error: unexpected argument '") + arg + "' found");
        }
    }

    ParseResult result;
    result.global = global;

    // help [COMMAND] и --help
    if (command && *command == "help") {
        if (help_topic && !is_known_command(*help_topic)) {
            return usage_error("error: unrecognized subcommand '" + *help_topic + "'");
        }
        result.ok = true;
        result.command = HelpCommand{help_topic};
        return result;
    }
    if (command && !is_known_command(*command)) {
        return usage_error("error: unrecognized subcommand '" + *command + "'");
    }
    if (help) {
        result.ok = true;
        result.command = HelpCommand{command};
        return result;
    }

    // --history совместим только с history
    if (history_flag) {
        if (command && *command != "history") {
            return usage_error("error: the argument '--history' cannot be used with '" +
                               *command + "'");
        }
        command = "history";
    }

    if (detailed && (!command || *command != "history")) {
        return usage_error(
            "error: the argument '--detailed' can only be used with 'history' or '--history'");
    }
    if (json && (!command || *command != "history")) {
        return usage_error(
            "error: the argument '--json' can only be used with 'history' or '--history'");
    }
    if (json && detailed) {
        return usage_error("error: the argument '--json' cannot be used with '--detailed'");
    }

    result.ok = true;
    if (!command || *command == "run") {
        result.command = RunCommand{};
    } else if (*command == "scan") {
        result.command = ScanCommand{};
    } else if (*command == "history") {
        result.command = HistoryCommand{detailed, json};
    } else {
        result.command = ClearHistoryCommand{};
    }
    return result;
}

}  // namespace turbosort::cli
