// ==============================================================================
// turbosort/s3.hpp - Клиент объектного хранилища (S3-совместимого)
// ==============================================================================
//
// libcurl (подпись запросов AWS SigV4 средствами curl), pugixml для разбора
// ответов ListObjectsV2.
//
// Назначение:
// - Абстрактный интерфейс ObjectStore: list / head / get
// - CurlObjectStore: path-style запросы к S3/MinIO
// - Чистые функции разбора (XML листинга, даты, ETag, URI кодирование)
//
// Ошибки сети и HTTP возвращаются как ok=false, исключения наружу не выходят.
//
// ==============================================================================

#ifndef TURBOSORT_S3_HPP
#define TURBOSORT_S3_HPP

#include <cstdint>
#include <ctime>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "turbosort/config.hpp"

namespace turbosort::s3 {

// ----------------------------------------------------------------------------
// Типы
// ----------------------------------------------------------------------------

/// Метаданные объекта
struct ObjectInfo {
    std::string key;
    std::uint64_t size = 0;
    std::string last_modified;  // как вернул сервер
    std::string etag;           // без кавычек
};

struct StoreError {
    std::string message;
    long http_status = 0;  // 0 = ошибка транспорта
};

/// Полный листинг (все страницы)
struct ListResult {
    bool ok = false;
    std::vector<ObjectInfo> objects;
    StoreError error;
};

struct HeadResult {
    bool ok = false;     // запрос выполнен (в т.ч. 404)
    bool found = false;  // объект существует
    ObjectInfo info;
    StoreError error;
};

struct GetResult {
    bool ok = false;
    ObjectInfo info;
    StoreError error;
    std::string warning;  // нефатальное замечание (например, не выставлено mtime)
};

// ----------------------------------------------------------------------------
// ObjectStore - интерфейс хранилища
// ----------------------------------------------------------------------------

class ObjectStore {
public:
    virtual ~ObjectStore() = default;

    /// Перечислить все объекты под префиксом (постранично, до конца)
    virtual ListResult list(const std::string& prefix) = 0;

    /// Метаданные объекта; found=false если объекта нет
    virtual HeadResult head(const std::string& key) = 0;

    /// Скачать объект в файл dst (через временный файл + rename)
    virtual GetResult get(const std::string& key, const std::filesystem::path& dst) = 0;

    /// Описание для журнала ("s3://bucket/prefix")
    virtual std::string describe() const = 0;
};

// ----------------------------------------------------------------------------
// Разбор ответов
// ----------------------------------------------------------------------------

/// Одна страница ListObjectsV2
struct ListPage {
    bool ok = false;
    std::vector<ObjectInfo> objects;
    bool truncated = false;
    std::string next_token;
    std::string error;
};

/// Разобрать XML ответ ListObjectsV2 (или XML ошибки S3)
ListPage parse_list_response(std::string_view xml);

/// Убрать кавычки вокруг ETag: "\"abc\"" -> "abc"
std::string strip_etag_quotes(std::string_view etag);

/// URI-кодирование по правилам SigV4 (unreserved: A-Z a-z 0-9 - _ . ~)
std::string uri_encode(std::string_view s, bool encode_slash);

/// Разобрать HTTP дату (RFC 1123): "Wed, 21 Oct 2015 07:28:00 GMT"
std::optional<std::time_t> parse_http_date(std::string_view value);

// ----------------------------------------------------------------------------
// CurlObjectStore
// ----------------------------------------------------------------------------

class CurlObjectStore : public ObjectStore {
public:
    explicit CurlObjectStore(config::S3Settings settings);

    ListResult list(const std::string& prefix) override;
    HeadResult head(const std::string& key) override;
    GetResult get(const std::string& key, const std::filesystem::path& dst) override;
    std::string describe() const override;

    /// URL объекта (path-style): <endpoint>/<bucket>/<key>
    std::string object_url(const std::string& key) const;

    /// URL страницы листинга; параметры в каноническом (отсортированном) порядке
    std::string list_url(const std::string& prefix, const std::string& continuation) const;

private:
    config::S3Settings settings_;
    std::string endpoint_;  // без завершающего '/'
};

}  // namespace turbosort::s3

#endif  // TURBOSORT_S3_HPP
