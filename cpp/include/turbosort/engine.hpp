// ==============================================================================
// turbosort/engine.hpp - Движок идемпотентной доставки
// ==============================================================================
//
// Назначение:
// - Обработка одной директории с маркером: разбор маркера, вычисление
//   назначения, решение "копировать или пропустить", копирование, запись
//   в журнал доставки
// - Очистка журнала от записей, чей источник исчез (reconcile)
// - Полный проход по всем директориям с маркерами (full_scan)
//
// Контракт: повторная обработка директории без изменений источника не
// выполняет ни одного копирования. Ошибка одного элемента не прерывает
// обработку остальных.
//
// Вызовы process_directory никогда не выполняются параллельно: движок
// и журнал принадлежат единственному потоку цикла событий.
//
// ==============================================================================

#ifndef TURBOSORT_ENGINE_HPP
#define TURBOSORT_ENGINE_HPP

#include <cstddef>
#include <cstdint>
#include <string>

#include "turbosort/destination.hpp"

namespace turbosort::config {
struct Config;
}

namespace turbosort::ledger {
class Ledger;
}

namespace turbosort::output {
class Writer;
}

namespace turbosort::source {
class SourceProvider;
}

namespace turbosort::engine {

// ----------------------------------------------------------------------------
// Отчёты
// ----------------------------------------------------------------------------

/// Итог обработки одной директории
struct DirectoryReport {
    bool marker_found = false;  // маркер присутствует
    bool resolved = false;      // назначение вычислено и создано
    std::size_t copied = 0;
    std::size_t skipped = 0;   // отпечаток не изменился
    std::size_t failed = 0;    // ошибка метаданных или копирования
    std::size_t vanished = 0;  // элемент исчез до обработки
};

/// Итог полного прохода
struct ScanReport {
    bool ok = false;  // список директорий получен
    std::size_t directories = 0;
    std::size_t pruned = 0;
    std::size_t copied = 0;
    std::size_t skipped = 0;
    std::size_t failed = 0;
    std::size_t vanished = 0;
};

/// Накопительные счётчики за время работы процесса
struct EngineStats {
    std::uint64_t directories = 0;
    std::uint64_t copied = 0;
    std::uint64_t skipped = 0;
    std::uint64_t failed = 0;
    std::uint64_t vanished = 0;
    std::uint64_t pruned = 0;
    std::uint64_t bytes_copied = 0;
};

// ----------------------------------------------------------------------------
// DeliveryEngine
// ----------------------------------------------------------------------------

class DeliveryEngine {
public:
    DeliveryEngine(const config::Config& cfg, source::SourceProvider& provider,
                   ledger::Ledger& ledger, output::Writer& log);

    DeliveryEngine(const DeliveryEngine&) = delete;
    DeliveryEngine& operator=(const DeliveryEngine&) = delete;

    /// Обработать директорию (ключ директории источника)
    DirectoryReport process_directory(const std::string& dir);

    /// Удалить из журнала записи, чей источник больше не существует
    /// @return число удалённых записей
    std::size_t reconcile();

    /// reconcile(), затем process_directory() для каждой директории с маркером
    ScanReport full_scan();

    const EngineStats& stats() const { return stats_; }

    source::SourceProvider& provider() { return provider_; }

private:
    const config::Config& cfg_;
    destination::ResolveOptions resolve_options_;
    source::SourceProvider& provider_;
    ledger::Ledger& ledger_;
    output::Writer& log_;
    EngineStats stats_;
};

}  // namespace turbosort::engine

#endif  // TURBOSORT_ENGINE_HPP
