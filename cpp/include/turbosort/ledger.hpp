// ==============================================================================
// turbosort/ledger.hpp - Журнал доставленных файлов
// ==============================================================================
//
// RapidJSON для сериализации.
//
// Назначение:
// - Отображение sourceKey -> DeliveryRecord (не более одной записи на ключ)
// - Загрузка один раз при старте (пустой журнал при отсутствии или порче файла)
// - Сквозная запись на диск после каждой мутации put()
// - Очистка записей, чей источник больше не существует (prune)
//
// Формат файла - один JSON объект на весь журнал:
//   {
//     "<sourceKey>": {
//       "destination": "/dest/Clients/Acme/incoming/invoice.pdf",
//       "timestamp": "2024-05-01T12:30:00Z",
//       "size": 1024,
//       "identity": "3f2a9c0d1e4b5a67"
//     }
//   }
//
// Ошибка записи на диск не отменяет изменения в памяти: журнал в памяти
// остаётся авторитетным до конца работы, рассинхронизация с диском
// фиксируется в журнале сервиса.
//
// ==============================================================================

#ifndef TURBOSORT_LEDGER_HPP
#define TURBOSORT_LEDGER_HPP

#include <cstdint>
#include <filesystem>
#include <functional>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace turbosort::output {
class Writer;
}

namespace turbosort::ledger {

// ----------------------------------------------------------------------------
// DeliveryRecord
// ----------------------------------------------------------------------------

/// Запись о доставленном элементе источника
struct DeliveryRecord {
    std::string source_key;        // абсолютный путь или ключ объекта
    std::string destination_path;  // куда записан файл
    std::string identity;          // отпечаток на момент доставки
    std::uint64_t size_bytes = 0;
    std::string delivered_at;  // ISO-8601
};

/// Сводка по журналу
struct LedgerStats {
    std::size_t total_files = 0;
    std::uint64_t total_bytes = 0;
};

// ----------------------------------------------------------------------------
// Сериализация
// ----------------------------------------------------------------------------

/// Результат разбора документа журнала
struct ParseResult {
    bool ok = false;
    std::unordered_map<std::string, DeliveryRecord> records;
    std::vector<std::string> warnings;  // пропущенные некорректные записи
    std::string error;
};

/// Разобрать JSON документ журнала
ParseResult parse_document(const std::string& json);

/// Сериализовать записи в JSON документ (ключи отсортированы)
std::string serialize_document(const std::unordered_map<std::string, DeliveryRecord>& records);

// ----------------------------------------------------------------------------
// Ledger
// ----------------------------------------------------------------------------

class Ledger {
public:
    /// Проверка существования источника для prune()
    using ExistenceCheck = std::function<bool(const std::string& source_key)>;

    Ledger(std::filesystem::path file, output::Writer& log);

    /// Прочитать файл журнала. Отсутствие файла - пустой журнал;
    /// ошибка разбора - предупреждение и пустой журнал.
    void load();

    /// Найти запись
    std::optional<DeliveryRecord> get(const std::string& source_key) const;

    /// Вставить или заменить запись, затем записать журнал на диск
    void put(DeliveryRecord record);

    /// Удалить запись; запись на диск выполняет вызывающий код (save())
    /// @return true если запись существовала
    bool remove(const std::string& source_key);

    /// Удалить все записи, для которых exists() вернул false.
    /// Журнал записывается один раз в конце, если что-то удалено.
    /// @return число удалённых записей
    std::size_t prune(const ExistenceCheck& exists);

    /// Удалить все записи и записать пустой журнал
    void clear();

    /// Записать журнал на диск
    /// @return false при ошибке ввода-вывода (ошибка уже зафиксирована в журнале)
    bool save();

    /// Все записи, отсортированные по ключу
    std::vector<DeliveryRecord> records() const;

    LedgerStats stats() const;

    std::size_t size() const { return records_.size(); }
    bool empty() const { return records_.empty(); }

    /// Журнал в памяти расходится с диском после неудачной записи
    bool out_of_sync() const { return out_of_sync_; }

    const std::filesystem::path& file() const { return file_; }

private:
    std::filesystem::path file_;
    output::Writer& log_;
    std::unordered_map<std::string, DeliveryRecord> records_;
    bool out_of_sync_ = false;
};

}  // namespace turbosort::ledger

#endif  // TURBOSORT_LEDGER_HPP
