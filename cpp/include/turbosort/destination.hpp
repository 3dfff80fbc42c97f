// ==============================================================================
// turbosort/destination.hpp - Вычисление директории назначения
// ==============================================================================
//
// Назначение:
// - Разбор содержимого маркер-файла (MarkerDirective)
// - Вычисление директории назначения из пути маркера и конфигурации:
//   нормализация, префикс года, суффикс диска
//
// resolve() - чистая функция: без I/O и скрытого состояния. Создание
// директории выполняет вызывающий код после успешного вычисления.
//
// ==============================================================================

#ifndef TURBOSORT_DESTINATION_HPP
#define TURBOSORT_DESTINATION_HPP

#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace turbosort::config {
struct Config;
}

namespace turbosort::destination {

// ----------------------------------------------------------------------------
// Маркер
// ----------------------------------------------------------------------------

/// Разобрать содержимое маркер-файла: обрезать пробелы по краям.
/// Пустое содержимое (или только пробелы) - недействительная директива.
/// Допускается UTF-8 BOM в начале.
std::optional<std::string> parse_marker_directive(std::string_view content);

// ----------------------------------------------------------------------------
// Параметры преобразования
// ----------------------------------------------------------------------------

struct ResolveOptions {
    std::filesystem::path dest_root;
    bool year_prefix = false;
    bool drive_suffix = false;
    std::string drive_suffix_name = "incoming";

    /// Собрать параметры из конфигурации сервиса
    static ResolveOptions from_config(const config::Config& cfg);
};

// ----------------------------------------------------------------------------
// Результат
// ----------------------------------------------------------------------------

struct ResolveResult {
    bool ok = false;

    /// Конечная директория назначения (нормализованная)
    std::filesystem::path target;

    /// Нормализованный путь из маркера
    std::string normalized;

    /// Найденный год (если префикс года включён и год найден)
    std::optional<std::string> year;

    /// Нефатальные замечания (например, год не найден)
    std::vector<std::string> warnings;

    /// Текст ошибки при ok == false
    std::string error;

    explicit operator bool() const { return ok; }
};

// ----------------------------------------------------------------------------
// API
// ----------------------------------------------------------------------------

/// Нормализовать путь из маркера: схлопнуть "." и "..", убрать лишние
/// разделители и ведущий "/".
/// @return nullopt если путь пуст, содержит управляющие символы или выходит
///         за пределы корня назначения
std::optional<std::string> normalize_marker_path(std::string_view raw);

/// Найти первый (самый левый) год вида 19xx или 20xx
std::optional<std::string> extract_year(std::string_view text);

/// Вычислить директорию назначения
ResolveResult resolve(std::string_view marker_destination, const ResolveOptions& opt);

}  // namespace turbosort::destination

#endif  // TURBOSORT_DESTINATION_HPP
