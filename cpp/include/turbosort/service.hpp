// ==============================================================================
// turbosort/service.hpp - Оркестратор сервиса
// ==============================================================================
//
// Назначение:
// - Выбор источника (LocalSource / RemoteSource) по конфигурации
// - Цикл событий: LocalTrigger (inotify) или RemoteTrigger (опрос листинга)
// - Периодическая статистика журнала
// - Команды: run, scan, history, clear-history
//
// Каждая функция возвращает код завершения процесса.
//
// ==============================================================================

#ifndef TURBOSORT_SERVICE_HPP
#define TURBOSORT_SERVICE_HPP

#include <memory>
#include <string>

#include "turbosort/ledger.hpp"

namespace turbosort::config {
struct Config;
}

namespace turbosort::output {
class Writer;
}

namespace turbosort::s3 {
class ObjectStore;
}

namespace turbosort::source {
class SourceProvider;
}

namespace turbosort::service {

// ----------------------------------------------------------------------------
// Источник
// ----------------------------------------------------------------------------

/// Источник и (для S3) клиент хранилища, которым он владеет
struct SourceBundle {
    std::unique_ptr<s3::ObjectStore> store;
    std::unique_ptr<source::SourceProvider> provider;
    std::string remote_prefix;  // нормализованный префикс (режим S3)
};

/// Построить источник по конфигурации
SourceBundle make_source(const config::Config& cfg);

// ----------------------------------------------------------------------------
// Статистика и журнал
// ----------------------------------------------------------------------------

/// Напечатать сводку журнала (только если что-то доставлено)
void print_stats(const ledger::Ledger& ledger, output::Writer& log);

/// Текст таблицы / подробного списка журнала
std::string render_history(const ledger::Ledger& ledger, bool detailed);

// ----------------------------------------------------------------------------
// Команды
// ----------------------------------------------------------------------------

/// Непрерывная работа до SIGINT/SIGTERM
int run(const config::Config& cfg, output::Writer& log);

/// Один полный проход
int scan(const config::Config& cfg, output::Writer& log);

/// Показать журнал
int history(const config::Config& cfg, output::Writer& log, bool detailed, bool json);

/// Очистить журнал
int clear_history(const config::Config& cfg, output::Writer& log);

}  // namespace turbosort::service

#endif  // TURBOSORT_SERVICE_HPP
