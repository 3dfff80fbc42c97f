// ==============================================================================
// turbosort/output.hpp - Пользовательский вывод и журнал
// ==============================================================================
//
// RapidJSON для JSON сериализации.
// Только этот модуль пишет в stdout/stderr.
//
// Назначение:
// - Единственная точка записи в stdout/stderr
// - Журнал сервиса с префиксами уровней и метками времени
// - Таблицы (история копирований)
// - Цветной вывод (ANSI escape codes) при TTY
//
// ==============================================================================

#ifndef TURBOSORT_OUTPUT_HPP
#define TURBOSORT_OUTPUT_HPP

#include <cstdint>
#include <cstdio>
#include <string>
#include <string_view>
#include <vector>

// Forward declarations для JSON
namespace rapidjson {
class CrtAllocator;
template <typename BaseAllocator>
class MemoryPoolAllocator;
template <typename Encoding, typename Allocator>
class GenericValue;
template <typename CharType>
struct UTF8;
using Value = GenericValue<UTF8<char>, MemoryPoolAllocator<CrtAllocator>>;
}  // namespace rapidjson

namespace turbosort::output {

// ----------------------------------------------------------------------------
// Потоки вывода
// ----------------------------------------------------------------------------

enum class Stream { Stdout, Stderr };

// ----------------------------------------------------------------------------
// ANSI цвета для терминала
// ----------------------------------------------------------------------------

enum class Color {
    Default,
    Green,   // Успех, информация
    Yellow,  // Предупреждения
    Red,     // Ошибки
    Cyan,    // Отладка
    Magenta  // Трассировка
};

// ----------------------------------------------------------------------------
// Конфигурация вывода
// ----------------------------------------------------------------------------

struct OutputConfig {
    bool quiet = false;       // -q: подавить info и предупреждения
    int verbose = 0;          // -v: уровень подробности (0..2+)
    bool no_banner = false;   // --no-banner: скрыть баннер
    bool timestamps = false;  // метка времени перед каждой строкой журнала
};

// ----------------------------------------------------------------------------
// Writer - единый слой вывода
// ----------------------------------------------------------------------------

class Writer {
public:
    explicit Writer(const OutputConfig& cfg);
    ~Writer();

    Writer(const Writer&) = delete;
    Writer& operator=(const Writer&) = delete;

    // Базовый вывод
    // -------------------------------------------------------------------------

    /// Записать байты в поток
    void write(Stream s, std::string_view bytes);

    /// Записать строку с переводом строки
    void write_line(Stream s, std::string_view bytes);

    // Сообщения журнала
    // -------------------------------------------------------------------------

    /// Информационное сообщение в stderr (если не quiet)
    /// Формат: "[+] <message>"
    void info(std::string_view message);

    /// Предупреждение в stderr (если не quiet)
    /// Формат: "[!] <message>"
    void warn(std::string_view message);

    /// Ошибка в stderr (всегда)
    /// Формат: "[x] <message>"
    void error(std::string_view message);

    /// Отладочное сообщение (только при verbose > 0)
    /// Формат: "[*] <message>"
    void debug(std::string_view message);

    /// Трассировка (только при verbose > 1)
    /// Формат: "[~] <message>"
    void trace(std::string_view message);

    // JSON
    // -------------------------------------------------------------------------

    /// Записать pretty JSON (с отступами) в stdout
    void write_json_pretty(const rapidjson::Value& value);

    // Управление
    // -------------------------------------------------------------------------

    void flush();

    const OutputConfig& config() const { return config_; }

    /// Количество выведенных предупреждений и ошибок
    size_t warning_count() const { return warnings_; }
    size_t error_count() const { return errors_; }

private:
    /// Строка журнала: [метка времени] + цветной префикс + сообщение
    void log_line(std::string_view prefix, Color color, std::string_view message);

    FILE* get_file(Stream s) const;

    OutputConfig config_;
    size_t warnings_ = 0;
    size_t errors_ = 0;
};

// ----------------------------------------------------------------------------
// Table - форматирование таблиц
// ----------------------------------------------------------------------------

class Table {
public:
    Table();

    /// Добавить заголовки
    void set_headers(const std::vector<std::string>& headers);

    /// Добавить строку данных
    void add_row(const std::vector<std::string>& cells);

    /// Ограничить ширину столбца (длинные значения обрезаются с "...")
    void set_max_width(size_t col, size_t width);

    /// Вывести таблицу через Writer (Unicode box-drawing)
    void print(Writer& w);

    /// Вывести таблицу в строку
    std::string to_string() const;

    size_t row_count() const { return rows_.size(); }

private:
    std::string format_line(char left, char middle, char right,
                            const std::vector<size_t>& widths) const;
    std::string format_row(const std::vector<std::string>& cells,
                           const std::vector<size_t>& widths) const;
    std::vector<size_t> column_widths() const;
    std::string clip(const std::string& cell, size_t col) const;

    std::vector<std::string> headers_;
    std::vector<std::vector<std::string>> rows_;
    std::vector<size_t> max_widths_;
};

// ----------------------------------------------------------------------------
// Вспомогательные функции
// ----------------------------------------------------------------------------

/// "[+] <message>\n"
std::string format_info(std::string_view message);

/// "[x] <message>\n"
std::string format_error(std::string_view message);

/// "[!] <message>\n"
std::string format_warning(std::string_view message);

/// "[*] <message>\n"
std::string format_debug(std::string_view message);

/// Размер в человекочитаемом виде: "512 B", "1.50 KB", "3.25 MB", "1.00 GB"
std::string format_size(std::uint64_t bytes);

/// Размер в мегабайтах с округлением до 2 знаков: 1572864 -> "1.50"
std::string format_megabytes(std::uint64_t bytes);

/// Получить ANSI escape code для цвета
std::string ansi_color_code(Color color);

/// Получить ANSI reset code
std::string ansi_reset_code();

/// Проверить, поддерживает ли поток цвета (TTY check)
bool supports_color(Stream s);

}  // namespace turbosort::output

#endif  // TURBOSORT_OUTPUT_HPP
