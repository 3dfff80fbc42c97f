// ==============================================================================
// turbosort/trigger.hpp - Стратегии запуска обработки
// ==============================================================================
//
// Назначение:
// - LocalTrigger: события файловой системы -> немедленная обработка при
//   изменении маркера, отложенная (debounce) обработка прочих файлов,
//   периодический полный проход
// - RemoteTrigger: периодический листинг bucket, сравнение с предыдущим
//   листингом (новые / изменённые / удалённые ключи), независимый таймер
//   полного прохода
//
// Оба триггера работают в одном потоке цикла событий; время передаётся
// явно (now), что делает логику таймеров детерминированной в тестах.
//
// ==============================================================================

#ifndef TURBOSORT_TRIGGER_HPP
#define TURBOSORT_TRIGGER_HPP

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <map>
#include <optional>
#include <set>
#include <string>
#include <vector>

namespace turbosort::config {
struct Config;
}

namespace turbosort::engine {
class DeliveryEngine;
}

namespace turbosort::output {
class Writer;
}

namespace turbosort::s3 {
class ObjectStore;
struct ObjectInfo;
}

namespace turbosort::watch {
struct WatchEvent;
}

namespace turbosort::trigger {

using Clock = std::chrono::steady_clock;

// ----------------------------------------------------------------------------
// LocalTrigger
// ----------------------------------------------------------------------------

class LocalTrigger {
public:
    /// @param root Абсолютный корень источника (как у LocalSource)
    LocalTrigger(const config::Config& cfg, std::filesystem::path root,
                 engine::DeliveryEngine& engine, output::Writer& log, Clock::time_point now);

    /// Обработать одно событие файловой системы
    void on_event(const watch::WatchEvent& event);

    /// Обработать накопленные директории, если с прошлого прохода прошёл
    /// интервал тишины.
    /// @return число обработанных директорий
    std::size_t drain(Clock::time_point now);

    /// Полный проход, если наступил срок (или запрошен после переполнения)
    /// @return true если проход выполнен
    bool rescan_if_due(Clock::time_point now);

    /// drain() + rescan_if_due()
    void tick(Clock::time_point now);

    /// Ближайшая директория с маркером от start вверх до корня
    std::optional<std::filesystem::path> find_marker_dir(const std::filesystem::path& start) const;

    std::size_t pending_count() const { return pending_.size(); }
    bool is_pending(const std::string& dir) const { return pending_.count(dir) > 0; }

private:
    bool inside_root(const std::filesystem::path& p) const;
    bool is_marker(const std::filesystem::path& p) const;
    void enqueue(const std::filesystem::path& dir);

    const config::Config& cfg_;
    std::filesystem::path root_;
    engine::DeliveryEngine& engine_;
    output::Writer& log_;

    std::set<std::string> pending_;
    Clock::time_point last_drain_;
    Clock::time_point last_rescan_;
    bool rescan_requested_ = false;
};

// ----------------------------------------------------------------------------
// RemoteTrigger
// ----------------------------------------------------------------------------

/// Состояние объекта в листинге
struct ListingEntry {
    std::uint64_t size = 0;
    std::string etag;
};

/// key -> состояние
using Listing = std::map<std::string, ListingEntry>;

/// Разница двух листингов (ключи отсортированы)
struct ListingDiff {
    std::vector<std::string> added;
    std::vector<std::string> modified;
    std::vector<std::string> removed;

    bool empty() const { return added.empty() && modified.empty() && removed.empty(); }
};

/// Преобразовать объекты листинга в Listing
Listing make_listing(const std::vector<s3::ObjectInfo>& objects);

/// Сравнить листинги: нового ключа не было раньше (added); ETag изменился
/// (modified); ключ исчез (removed)
ListingDiff diff_listings(const Listing& before, const Listing& after);

/// Итог одного опроса
struct PollReport {
    bool ok = false;  // листинг получен
    ListingDiff diff;
    std::size_t directories = 0;  // обработано родительских префиксов
};

class RemoteTrigger {
public:
    RemoteTrigger(const config::Config& cfg, s3::ObjectStore& store, std::string prefix,
                  engine::DeliveryEngine& engine, output::Writer& log, Clock::time_point now);

    /// Запомнить текущий листинг без обработки (после начального прохода)
    bool prime();

    /// Опрос: листинг, сравнение, обработка родителей новых/изменённых ключей.
    /// Ошибка листинга - тик пропускается, предыдущий листинг сохраняется.
    PollReport poll();

    /// Безусловный полный проход всех префиксов с маркерами
    void full_rescan();

    /// Выполнить поллинг и/или полный проход, если наступил срок
    void tick(Clock::time_point now);

    const Listing& last_listing() const { return last_listing_; }

private:
    const config::Config& cfg_;
    s3::ObjectStore& store_;
    std::string prefix_;
    engine::DeliveryEngine& engine_;
    output::Writer& log_;

    Listing last_listing_;
    Clock::time_point next_poll_;
    Clock::time_point next_rescan_;
};

}  // namespace turbosort::trigger

#endif  // TURBOSORT_TRIGGER_HPP
