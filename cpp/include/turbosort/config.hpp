// ==============================================================================
// turbosort/config.hpp - Конфигурация сервиса
// ==============================================================================
//
// yaml-cpp для файла конфигурации.
//
// Назначение:
// - Единое неизменяемое значение Config, создаётся один раз в main
//   и передаётся явно в конструктор каждого компонента
// - Приоритет: значения по умолчанию < YAML файл < переменные окружения
// - Валидация значений (булевы, целые, суффикс)
//
// ==============================================================================

#ifndef TURBOSORT_CONFIG_HPP
#define TURBOSORT_CONFIG_HPP

#include <cstdint>
#include <filesystem>
#include <functional>
#include <optional>
#include <string>
#include <string_view>

namespace turbosort::config {

// ----------------------------------------------------------------------------
// Типы
// ----------------------------------------------------------------------------

/// Вид источника
enum class SourceKind {
    Local,  // локальное дерево директорий
    S3      // bucket объектного хранилища
};

const char* source_kind_to_string(SourceKind kind);

/// Параметры объектного хранилища
struct S3Settings {
    std::string endpoint = "http://minio:9000";
    std::string access_key = "minioadmin";
    std::string secret_key = "minioadmin";
    std::string bucket = "turbosort-source";
    std::string region = "us-east-1";
    std::string prefix;  // префикс ключей внутри bucket ("" = весь bucket)
};

/// Полная конфигурация сервиса
struct Config {
    SourceKind source_kind = SourceKind::Local;

    std::filesystem::path source_dir = "source";
    std::filesystem::path dest_dir = "destination";
    std::filesystem::path history_file = "turbosort_history.json";
    std::string marker_name = ".turbosort";

    // Преобразования пути назначения
    bool year_prefix = false;
    bool drive_suffix = true;
    std::string drive_suffix_name = "incoming";

    bool force_recopy = false;

    // Интервалы (секунды; 0 = выключено для rescan/stats)
    std::uint32_t debounce_seconds = 2;
    std::uint32_t drain_interval_ms = 500;
    std::uint32_t local_rescan_interval = 3600;
    std::uint32_t stats_interval = 300;
    std::uint32_t s3_poll_interval = 60;
    std::uint32_t s3_rescan_interval = 3600;

    S3Settings s3;
};

// ----------------------------------------------------------------------------
// Загрузка
// ----------------------------------------------------------------------------

/// Функция чтения переменной окружения (подменяется в тестах)
using EnvLookup = std::function<std::optional<std::string>(const std::string& name)>;

/// Чтение из реального окружения процесса (std::getenv)
EnvLookup process_env();

/// Результат загрузки конфигурации
struct ConfigResult {
    bool ok = false;
    Config config;
    std::string error;

    explicit operator bool() const { return ok; }
};

/// Собрать конфигурацию.
///
/// @param config_file YAML файл (плоские ключи в нижнем регистре); nullopt = без файла.
///                    Если не задан, используется TURBOSORT_CONFIG из окружения.
/// @param env Источник переменных окружения
/// @return ConfigResult; ok=false с текстом ошибки при неверном значении
ConfigResult load(const std::optional<std::filesystem::path>& config_file, const EnvLookup& env);

/// Проверить согласованность уже собранной конфигурации
/// @return текст ошибки или nullopt
std::optional<std::string> validate(const Config& cfg);

// ----------------------------------------------------------------------------
// Разбор значений
// ----------------------------------------------------------------------------

/// true/yes/1/on, false/no/0/off (без учёта регистра)
std::optional<bool> parse_bool(std::string_view value);

/// Неотрицательное целое, помещающееся в uint32
std::optional<std::uint32_t> parse_uint(std::string_view value);

}  // namespace turbosort::config

#endif  // TURBOSORT_CONFIG_HPP
