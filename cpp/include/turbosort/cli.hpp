// ==============================================================================
// turbosort/cli.hpp - CLI парсинг и команды
// ==============================================================================
//
// Назначение:
// - Парсинг argv
// - Генерация --help / --version
// - Диагностические ошибки CLI (в стиле clap)
//
// ==============================================================================

#ifndef TURBOSORT_CLI_HPP
#define TURBOSORT_CLI_HPP

#include <filesystem>
#include <optional>
#include <string>
#include <variant>

namespace turbosort::cli {

// ----------------------------------------------------------------------------
// Глобальные опции
// ----------------------------------------------------------------------------

struct GlobalOptions {
    bool no_banner = false;                       // --no-banner
    int verbose = 0;                              // -v (repeatable)
    bool quiet = false;                           // -q
    std::optional<std::filesystem::path> config;  // -c, --config
};

// ----------------------------------------------------------------------------
// Подкоманды
// ----------------------------------------------------------------------------

/// run - непрерывная работа (по умолчанию)
struct RunCommand {};

/// scan - один полный проход и выход
struct ScanCommand {};

/// history - показать журнал доставки
struct HistoryCommand {
    bool detailed = false;  // --detailed
    bool json = false;      // --json
};

/// clear-history - очистить журнал и выйти
struct ClearHistoryCommand {};

/// help - показать справку
struct HelpCommand {
    std::optional<std::string> command;
};

/// version - показать версию
struct VersionCommand {};

using Command = std::variant<RunCommand, ScanCommand, HistoryCommand, ClearHistoryCommand,
                             HelpCommand, VersionCommand>;

// ----------------------------------------------------------------------------
// Диагностика CLI
// ----------------------------------------------------------------------------

struct CliDiagnostic {
    int exit_code = 2;
    std::string stderr_message;
};

struct ParseResult {
    bool ok = false;
    GlobalOptions global;
    Command command;
    CliDiagnostic diagnostic;
};

// ----------------------------------------------------------------------------
// API
// ----------------------------------------------------------------------------

/// Парсить аргументы командной строки
ParseResult parse(int argc, char** argv);

/// Текст --help (общий или для подкоманды)
std::string render_help(const std::optional<std::string>& command = std::nullopt);

/// Текст --version
std::string render_version();

/// Сообщение об ошибке использования в стиле clap
std::string render_usage_error(const std::string& error_msg);

// ----------------------------------------------------------------------------
// Константы
// ----------------------------------------------------------------------------

constexpr const char* VERSION = "1.2.0";

constexpr const char* ABOUT = "Sort incoming files into destination trees named by marker files";

}  // namespace turbosort::cli

#endif  // TURBOSORT_CLI_HPP
