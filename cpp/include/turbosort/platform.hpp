// ==============================================================================
// turbosort/platform.hpp - Платформенные абстракции
// ==============================================================================
//
// Назначение:
// - Преобразования path <-> UTF-8
// - Определение TTY для цветного вывода
// - Примитив копирования файла с сохранением метаданных
// - Атомарная запись файла (временный файл + rename)
// - Метки времени (ISO-8601 и формат журнала)
// - Флаг завершения процесса (SIGINT/SIGTERM)
//
// Платформенная специфика изолирована здесь.
//
// ==============================================================================

#ifndef TURBOSORT_PLATFORM_HPP
#define TURBOSORT_PLATFORM_HPP

#include <filesystem>
#include <string>
#include <string_view>

namespace turbosort::platform {

// ----------------------------------------------------------------------------
// Преобразования путей
// ----------------------------------------------------------------------------

/// Создать path из строки UTF-8
std::filesystem::path path_from_utf8(std::string_view u8str);

/// Получить UTF-8 представление path
std::string path_to_utf8(const std::filesystem::path& p);

// ----------------------------------------------------------------------------
// TTY detection
// ----------------------------------------------------------------------------

bool is_tty_stdout();
bool is_tty_stderr();

// ----------------------------------------------------------------------------
// Файловые операции
// ----------------------------------------------------------------------------

/// Скопировать файл с сохранением прав и времени модификации.
/// Существующий файл назначения перезаписывается.
///
/// @param error[out] Текст ошибки при неудаче
/// @return true при успехе
bool copy_file_preserving(const std::filesystem::path& src, const std::filesystem::path& dst,
                          std::string& error);

/// Атомарно записать содержимое файла: запись во временный файл в той же
/// директории, затем rename поверх целевого.
///
/// @param error[out] Текст ошибки при неудаче
/// @return true при успехе
bool write_file_atomic(const std::filesystem::path& path, std::string_view content,
                       std::string& error);

/// Создать уникальный временный файл рядом с target (в той же директории)
/// @throws std::runtime_error если файл создать не удалось
std::filesystem::path make_temp_file_near(const std::filesystem::path& target);

// ----------------------------------------------------------------------------
// Время
// ----------------------------------------------------------------------------

/// Текущее время UTC в формате ISO-8601: "2024-05-01T12:30:00Z"
std::string now_iso8601();

/// Текущее локальное время для журнала: "2024-05-01 12:30:00"
std::string now_log_stamp();

// ----------------------------------------------------------------------------
// Завершение процесса
// ----------------------------------------------------------------------------

/// Установить обработчики SIGINT/SIGTERM, выставляющие флаг остановки
void install_stop_handlers();

/// Запрошена ли остановка (сигналом или request_stop())
bool stop_requested();

/// Запросить остановку программно
void request_stop();

/// Сбросить флаг остановки (для тестов)
void reset_stop();

// ----------------------------------------------------------------------------
// Информация о платформе
// ----------------------------------------------------------------------------

std::string os_name();

}  // namespace turbosort::platform

#endif  // TURBOSORT_PLATFORM_HPP
