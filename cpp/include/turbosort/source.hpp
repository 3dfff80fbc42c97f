// ==============================================================================
// turbosort/source.hpp - Источники файлов (локальное дерево / объектное хранилище)
// ==============================================================================
//
// Назначение:
// - Единый интерфейс SourceProvider, против которого написан DeliveryEngine
// - LocalSource: локальное дерево директорий (std::filesystem)
// - RemoteSource: bucket объектного хранилища поверх s3::ObjectStore
//
// Ключи:
// - LocalSource: директория и элемент - абсолютные пути (UTF-8)
// - RemoteSource: директория - префикс ключа, оканчивающийся на '/'
//   ("" - корень bucket), элемент - полный ключ объекта
//
// ==============================================================================

#ifndef TURBOSORT_SOURCE_HPP
#define TURBOSORT_SOURCE_HPP

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

#include "turbosort/identity.hpp"

namespace turbosort::s3 {
class ObjectStore;
}

namespace turbosort::source {

// ----------------------------------------------------------------------------
// Типы
// ----------------------------------------------------------------------------

/// Элемент источника рядом с маркером
struct SourceItem {
    std::string key;   // sourceKey: абсолютный путь или ключ объекта
    std::string name;  // имя файла в директории назначения
};

/// Директории, содержащие маркер
struct MarkerDirs {
    bool ok = false;
    std::vector<std::string> dirs;
    std::vector<std::string> warnings;  // недоступные поддиректории
    std::string error;
};

enum class MarkerStatus {
    Absent,     // маркера нет - не ошибка
    Ok,         // содержимое прочитано
    Unreadable  // маркер есть, но прочитать не удалось
};

struct MarkerRead {
    MarkerStatus status = MarkerStatus::Absent;
    std::string content;
    std::string error;
};

struct Children {
    bool ok = false;
    std::vector<SourceItem> items;  // отсортированы по имени
    std::string error;
};

enum class StatStatus {
    Ok,
    Vanished,  // элемент исчез между перечислением и обработкой
    Failed     // метаданные получить не удалось
};

struct StatResult {
    StatStatus status = StatStatus::Failed;
    identity::ItemState state;
    std::string error;
};

struct FetchResult {
    bool ok = false;
    std::uint64_t size = 0;
    /// Состояние, наблюдавшееся при загрузке (если отличается от stat_identity)
    std::optional<identity::ItemState> observed;
    std::string error;
    std::string warning;
};

/// Результат проверки существования для очистки журнала
enum class Presence {
    Present,
    Missing,
    Unknown  // проверка не удалась; запись сохраняется
};

// ----------------------------------------------------------------------------
// SourceProvider
// ----------------------------------------------------------------------------

class SourceProvider {
public:
    virtual ~SourceProvider() = default;

    /// Описание источника для журнала
    virtual std::string describe() const = 0;

    /// Все директории, непосредственно содержащие маркер
    virtual MarkerDirs list_marker_dirs() = 0;

    /// Прочитать маркер, лежащий непосредственно в dir
    virtual MarkerRead read_marker(const std::string& dir) = 0;

    /// Файлы непосредственно в dir (без маркера, без рекурсии)
    virtual Children enumerate_children(const std::string& dir) = 0;

    /// Текущий отпечаток элемента
    virtual StatResult stat_identity(const SourceItem& item) = 0;

    /// Доставить элемент в файл dst
    virtual FetchResult fetch(const SourceItem& item, const std::filesystem::path& dst) = 0;

    /// Существует ли элемент с ключом key
    virtual Presence exists(const std::string& key, std::string& error) = 0;
};

// ----------------------------------------------------------------------------
// LocalSource
// ----------------------------------------------------------------------------

class LocalSource : public SourceProvider {
public:
    LocalSource(const std::filesystem::path& root, std::string marker_name);

    std::string describe() const override;
    MarkerDirs list_marker_dirs() override;
    MarkerRead read_marker(const std::string& dir) override;
    Children enumerate_children(const std::string& dir) override;
    StatResult stat_identity(const SourceItem& item) override;
    FetchResult fetch(const SourceItem& item, const std::filesystem::path& dst) override;
    Presence exists(const std::string& key, std::string& error) override;

    /// Абсолютный нормализованный корень
    const std::filesystem::path& root() const { return root_; }

    /// Ключ директории для пути
    static std::string dir_key(const std::filesystem::path& dir);

private:
    std::filesystem::path root_;
    std::string marker_name_;
};

// ----------------------------------------------------------------------------
// RemoteSource
// ----------------------------------------------------------------------------

class RemoteSource : public SourceProvider {
public:
    RemoteSource(s3::ObjectStore& store, std::string prefix, std::string marker_name);

    std::string describe() const override;
    MarkerDirs list_marker_dirs() override;
    MarkerRead read_marker(const std::string& dir) override;
    Children enumerate_children(const std::string& dir) override;
    StatResult stat_identity(const SourceItem& item) override;
    FetchResult fetch(const SourceItem& item, const std::filesystem::path& dst) override;
    Presence exists(const std::string& key, std::string& error) override;

    const std::string& prefix() const { return prefix_; }

private:
    s3::ObjectStore& store_;
    std::string prefix_;
    std::string marker_name_;
};

/// Родительский префикс ключа: "a/b/c.txt" -> "a/b/", "c.txt" -> ""
std::string parent_prefix(const std::string& key);

}  // namespace turbosort::source

#endif  // TURBOSORT_SOURCE_HPP
