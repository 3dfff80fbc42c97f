// ==============================================================================
// main.cpp - Точка входа приложения
// ==============================================================================
//
// 1. Парсинг argv (cli)
// 2. Создание Writer (output)
// 3. Загрузка конфигурации (файл + окружение)
// 4. Dispatch команды (service)
// 5. Возврат exit code
//
// ==============================================================================

#include "turbosort/cli.hpp"
#include "turbosort/config.hpp"
#include "turbosort/output.hpp"
#include "turbosort/service.hpp"

#include <exception>
#include <iostream>
#include <type_traits>
#include <variant>

namespace {

// ----------------------------------------------------------------------------
// ASCII Banner (--no-banner)
// ----------------------------------------------------------------------------

constexpr const char* BANNER = R"(
  ████████╗██╗   ██╗██████╗ ██████╗  ██████╗ ███████╗ ██████╗ ██████╗ ████████╗
  ╚══██╔══╝██║   ██║██╔══██╗██╔══██╗██╔═══██╗██╔════╝██╔═══██╗██╔══██╗╚══██╔══╝
     ██║   ██║   ██║██████╔╝██████╔╝██║   ██║███████╗██║   ██║██████╔╝   ██║
     ██║   ██║   ██║██╔══██╗██╔══██╗██║   ██║╚════██║██║   ██║██╔══██╗   ██║
     ██║   ╚██████╔╝██║  ██║██████╔╝╚██████╔╝███████║╚██████╔╝██║  ██║   ██║
     ╚═╝    ╚═════╝ ╚═╝  ╚═╝╚═════╝  ╚═════╝ ╚══════╝ ╚═════╝ ╚═╝  ╚═╝   ╚═╝
)";

void print_banner(turbosort::output::Writer& writer, bool no_banner, bool quiet) {
    if (no_banner || quiet) {
        return;
    }
    writer.write(turbosort::output::Stream::Stderr, BANNER);
    writer.write_line(turbosort::output::Stream::Stderr, "");
}

// ----------------------------------------------------------------------------
// Главная функция выполнения (run)
// ----------------------------------------------------------------------------

int run(int argc, char** argv) {
    using namespace turbosort;

    // 1. Парсинг argv
    cli::ParseResult parse_result = cli::parse(argc, argv);

    // 2. Создание Writer; сервис пишет журнал с метками времени
    output::OutputConfig out_cfg;
    out_cfg.quiet = parse_result.global.quiet;
    out_cfg.verbose = parse_result.global.verbose;
    out_cfg.no_banner = parse_result.global.no_banner;
    out_cfg.timestamps = std::holds_alternative<cli::RunCommand>(parse_result.command);
    output::Writer writer(out_cfg);

    // Сообщение об ошибке использования идёт без префикса [x]
    if (!parse_result.ok) {
        writer.write(output::Stream::Stderr, parse_result.diagnostic.stderr_message);
        return parse_result.diagnostic.exit_code;
    }

    // help / version не требуют конфигурации
    if (auto* help = std::get_if<cli::HelpCommand>(&parse_result.command)) {
        writer.write(output::Stream::Stdout, cli::render_help(help->command));
        return 0;
    }
    if (std::holds_alternative<cli::VersionCommand>(parse_result.command)) {
        writer.write(output::Stream::Stdout, cli::render_version());
        return 0;
    }

    // 3. Конфигурация
    config::ConfigResult loaded = config::load(parse_result.global.config, config::process_env());
    if (!loaded) {
        writer.error("Invalid configuration: " + loaded.error);
        return 1;
    }
    const config::Config& cfg = loaded.config;

    // 4. Dispatch команды
    return std::visit(
        [&](auto&& cmd) -> int {
            using T = std::decay_t<decltype(cmd)>;

            if constexpr (std::is_same_v<T, cli::RunCommand>) {
                print_banner(writer, out_cfg.no_banner, out_cfg.quiet);
                return service::run(cfg, writer);
            } else if constexpr (std::is_same_v<T, cli::ScanCommand>) {
                print_banner(writer, out_cfg.no_banner, out_cfg.quiet);
                return service::scan(cfg, writer);
            } else if constexpr (std::is_same_v<T, cli::HistoryCommand>) {
                if (!cmd.json) {
                    print_banner(writer, out_cfg.no_banner, out_cfg.quiet);
                }
                return service::history(cfg, writer, cmd.detailed, cmd.json);
            } else if constexpr (std::is_same_v<T, cli::ClearHistoryCommand>) {
                print_banner(writer, out_cfg.no_banner, out_cfg.quiet);
                return service::clear_history(cfg, writer);
            } else {
                // help / version обработаны выше
                return 1;
            }
        },
        parse_result.command);
}

}  // anonymous namespace

// ----------------------------------------------------------------------------
// main
// ----------------------------------------------------------------------------

int main(int argc, char** argv) {
    try {
        return run(argc, argv);
    } catch (const std::exception& e) {
        // Формат ошибки "[x] <err>"
        std::cerr << "[x] " << e.what() << "\n";
        return 1;
    } catch (...) {
        std::cerr << "[x] Unknown error occurred\n";
        return 1;
    }
}
