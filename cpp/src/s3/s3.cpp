// ==============================================================================
// s3.cpp - Клиент объектного хранилища (S3-совместимого)
// ==============================================================================
//
// libcurl: path-style запросы, подпись CURLOPT_AWS_SIGV4.
// pugixml: разбор ответов ListObjectsV2.
//
// ==============================================================================

#include "turbosort/s3.hpp"

#include "turbosort/platform.hpp"

#include <curl/curl.h>
#include <pugixml.hpp>

#include <algorithm>
#include <cctype>
#include <cerrno>
#include <cstdio>
#include <cstdlib>
#include <memory>
#include <mutex>
#include <stdexcept>
#include <system_error>
#include <unordered_map>
#include <utime.h>

namespace turbosort::s3 {

namespace {

// ----------------------------------------------------------------------------
// RAII для libcurl
// ----------------------------------------------------------------------------

struct CurlEasyDeleter {
    void operator()(CURL* handle) const noexcept {
        if (handle) {
            curl_easy_cleanup(handle);
        }
    }
};

using unique_curl_easy = std::unique_ptr<CURL, CurlEasyDeleter>;

struct CurlSlistDeleter {
    void operator()(curl_slist* list) const noexcept {
        if (list) {
            curl_slist_free_all(list);
        }
    }
};

using unique_curl_slist = std::unique_ptr<curl_slist, CurlSlistDeleter>;

struct FileCloser {
    void operator()(std::FILE* f) const noexcept {
        if (f) {
            std::fclose(f);
        }
    }
};

using unique_file = std::unique_ptr<std::FILE, FileCloser>;

// SHA-256 пустого тела запроса
constexpr const char* EMPTY_PAYLOAD_SHA256 =
    "e3b0c44298fc1c149afbf4c8996fb92427ae41e4649b934ca495991b7852b855";

bool ensure_curl_initialized(std::string& error) {
    static std::once_flag once;
    static CURLcode init_code = CURLE_OK;
    std::call_once(once, [] { init_code = curl_global_init(CURL_GLOBAL_DEFAULT); });
    if (init_code != CURLE_OK) {
        error = std::string("curl_global_init failed: ") + curl_easy_strerror(init_code);
        return false;
    }
    return true;
}

size_t write_to_string(void* ptr, size_t size, size_t nmemb, void* userdata) noexcept {
    if (!ptr || !userdata) {
        return 0;
    }
    const size_t total = size * nmemb;
    static_cast<std::string*>(userdata)->append(static_cast<const char*>(ptr), total);
    return total;
}

size_t write_to_file(void* ptr, size_t size, size_t nmemb, void* userdata) noexcept {
    if (!ptr || !userdata) {
        return 0;
    }
    return std::fwrite(ptr, size, nmemb, static_cast<std::FILE*>(userdata)) * size;
}

/// Заголовки ответа (имена в нижнем регистре)
using HeaderMap = std::unordered_map<std::string, std::string>;

size_t collect_header(char* buffer, size_t size, size_t nitems, void* userdata) noexcept {
    const size_t total = size * nitems;
    if (!buffer || !userdata) {
        return total;
    }

    std::string line(buffer, total);
    size_t colon = line.find(':');
    if (colon == std::string::npos) {
        return total;
    }

    std::string name = line.substr(0, colon);
    std::transform(name.begin(), name.end(), name.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    size_t begin = colon + 1;
    while (begin < line.size() && (line[begin] == ' ' || line[begin] == '\t')) {
        ++begin;
    }
    size_t end = line.size();
    while (end > begin && (line[end - 1] == '\r' || line[end - 1] == '\n' || line[end - 1] == ' ')) {
        --end;
    }

    (*static_cast<HeaderMap*>(userdata))[name] = line.substr(begin, end - begin);
    return total;
}

/// Общие параметры запроса: URL, подпись, заголовки
void apply_common_options(CURL* curl, const std::string& url, const config::S3Settings& s3,
                          const std::string& sigv4, const std::string& userpwd,
                          curl_slist* headers, char* error_buffer) {
    curl_easy_setopt(curl, CURLOPT_URL, url.c_str());
    curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);
    curl_easy_setopt(curl, CURLOPT_ERRORBUFFER, error_buffer);
    curl_easy_setopt(curl, CURLOPT_HTTPHEADER, headers);
    if (!s3.access_key.empty()) {
        curl_easy_setopt(curl, CURLOPT_AWS_SIGV4, sigv4.c_str());
        curl_easy_setopt(curl, CURLOPT_USERPWD, userpwd.c_str());
    }
}

std::string transport_error(CURLcode code, const char* error_buffer) {
    std::string msg = curl_easy_strerror(code);
    if (error_buffer && error_buffer[0] != '\0') {
        msg += " (";
        msg += error_buffer;
        msg += ")";
    }
    return msg;
}

/// Краткий текст ошибки из XML тела ответа S3
std::string describe_error_body(const std::string& body) {
    pugi::xml_document doc;
    if (doc.load_buffer(body.data(), body.size())) {
        pugi::xml_node err = doc.child("Error");
        if (err) {
            std::string code = err.child_value("Code");
            std::string message = err.child_value("Message");
            if (!code.empty()) {
                return message.empty() ? code : code + ": " + message;
            }
        }
    }
    return std::string();
}

std::uint64_t parse_size(const char* text) {
    if (!text || *text == '\0') {
        return 0;
    }
    return std::strtoull(text, nullptr, 10);
}

std::string header_or_empty(const HeaderMap& headers, const std::string& name) {
    auto it = headers.find(name);
    return it == headers.end() ? std::string() : it->second;
}

}  // namespace

// ----------------------------------------------------------------------------
// Разбор ответов
// ----------------------------------------------------------------------------

std::string strip_etag_quotes(std::string_view etag) {
    if (etag.size() >= 2 && etag.front() == '"' && etag.back() == '"') {
        etag = etag.substr(1, etag.size() - 2);
    }
    return std::string(etag);
}

std::string uri_encode(std::string_view s, bool encode_slash) {
    static const char* hex = "0123456789ABCDEF";
    std::string out;
    out.reserve(s.size());
    for (char ch : s) {
        auto c = static_cast<unsigned char>(ch);
        if (std::isalnum(c) || c == '-' || c == '_' || c == '.' || c == '~') {
            out += ch;
        } else if (c == '/' && !encode_slash) {
            out += ch;
        } else {
            out += '%';
            out += hex[c >> 4];
            out += hex[c & 0x0F];
        }
    }
    return out;
}

std::optional<std::time_t> parse_http_date(std::string_view value) {
    std::string s(value);
    std::tm tm{};
    const char* end = strptime(s.c_str(), "%a, %d %b %Y %H:%M:%S", &tm);
    if (!end) {
        return std::nullopt;
    }
    std::time_t t = timegm(&tm);
    if (t == static_cast<std::time_t>(-1)) {
        return std::nullopt;
    }
    return t;
}

ListPage parse_list_response(std::string_view xml) {
    ListPage page;

    pugi::xml_document doc;
    pugi::xml_parse_result parsed = doc.load_buffer(xml.data(), xml.size());
    if (!parsed) {
        page.error = std::string("invalid listing XML: ") + parsed.description();
        return page;
    }

    pugi::xml_node root = doc.child("ListBucketResult");
    if (!root) {
        pugi::xml_node err = doc.child("Error");
        if (err) {
            page.error = std::string(err.child_value("Code")) + ": " + err.child_value("Message");
        } else {
            page.error = "unexpected listing response (no ListBucketResult)";
        }
        return page;
    }

    for (pugi::xml_node contents : root.children("Contents")) {
        ObjectInfo info;
        info.key = contents.child_value("Key");
        if (info.key.empty()) {
            continue;
        }
        info.size = parse_size(contents.child_value("Size"));
        info.last_modified = contents.child_value("LastModified");
        info.etag = strip_etag_quotes(contents.child_value("ETag"));
        page.objects.push_back(std::move(info));
    }

    std::string truncated = root.child_value("IsTruncated");
    page.truncated = (truncated == "true");
    page.next_token = root.child_value("NextContinuationToken");

    if (page.truncated && page.next_token.empty()) {
        page.error = "truncated listing without NextContinuationToken";
        return page;
    }

    page.ok = true;
    return page;
}

// ----------------------------------------------------------------------------
// CurlObjectStore
// ----------------------------------------------------------------------------

CurlObjectStore::CurlObjectStore(config::S3Settings settings)
    : settings_(std::move(settings)), endpoint_(settings_.endpoint) {
    while (!endpoint_.empty() && endpoint_.back() == '/') {
        endpoint_.pop_back();
    }
}

std::string CurlObjectStore::describe() const {
    return "s3://" + settings_.bucket + "/" + settings_.prefix;
}

std::string CurlObjectStore::object_url(const std::string& key) const {
    return endpoint_ + "/" + uri_encode(settings_.bucket, true) + "/" + uri_encode(key, false);
}

std::string CurlObjectStore::list_url(const std::string& prefix,
                                      const std::string& continuation) const {
    std::string url = endpoint_ + "/" + uri_encode(settings_.bucket, true) + "?";
    if (!continuation.empty()) {
        url += "continuation-token=" + uri_encode(continuation, true) + "&";
    }
    url += "list-type=2";
    if (!prefix.empty()) {
        url += "&prefix=" + uri_encode(prefix, true);
    }
    return url;
}

ListResult CurlObjectStore::list(const std::string& prefix) {
    ListResult result;
    if (!ensure_curl_initialized(result.error.message)) {
        return result;
    }

    const std::string sigv4 = "aws:amz:" + settings_.region + ":s3";
    const std::string userpwd = settings_.access_key + ":" + settings_.secret_key;

    std::string token;
    do {
        unique_curl_easy curl{curl_easy_init()};
        if (!curl) {
            result.error.message = "curl_easy_init failed";
            return result;
        }

        unique_curl_slist headers{curl_slist_append(
            nullptr, (std::string("x-amz-content-sha256: ") + EMPTY_PAYLOAD_SHA256).c_str())};

        const std::string url = list_url(prefix, token);
        std::string body;
        char error_buffer[CURL_ERROR_SIZE]{};

        apply_common_options(curl.get(), url, settings_, sigv4, userpwd, headers.get(),
                             error_buffer);
        curl_easy_setopt(curl.get(), CURLOPT_WRITEFUNCTION, write_to_string);
        curl_easy_setopt(curl.get(), CURLOPT_WRITEDATA, &body);

        const CURLcode code = curl_easy_perform(curl.get());
        if (code != CURLE_OK) {
            result.error.message = "list " + url + ": " + transport_error(code, error_buffer);
            return result;
        }

        long status = 0;
        curl_easy_getinfo(curl.get(), CURLINFO_RESPONSE_CODE, &status);
        if (status != 200) {
            result.error.http_status = status;
            std::string detail = describe_error_body(body);
            result.error.message = "list " + url + ": HTTP " + std::to_string(status) +
                                   (detail.empty() ? "" : " (" + detail + ")");
            return result;
        }

        ListPage page = parse_list_response(body);
        if (!page.ok) {
            result.error.message = "list " + url + ": " + page.error;
            return result;
        }

        for (auto& obj : page.objects) {
            result.objects.push_back(std::move(obj));
        }
        token = page.truncated ? page.next_token : std::string();
    } while (!token.empty());

    result.ok = true;
    return result;
}

HeadResult CurlObjectStore::head(const std::string& key) {
    HeadResult result;
    if (!ensure_curl_initialized(result.error.message)) {
        return result;
    }

    unique_curl_easy curl{curl_easy_init()};
    if (!curl) {
        result.error.message = "curl_easy_init failed";
        return result;
    }

    const std::string sigv4 = "aws:amz:" + settings_.region + ":s3";
    const std::string userpwd = settings_.access_key + ":" + settings_.secret_key;
    unique_curl_slist headers{curl_slist_append(
        nullptr, (std::string("x-amz-content-sha256: ") + EMPTY_PAYLOAD_SHA256).c_str())};

    const std::string url = object_url(key);
    HeaderMap response_headers;
    char error_buffer[CURL_ERROR_SIZE]{};

    apply_common_options(curl.get(), url, settings_, sigv4, userpwd, headers.get(), error_buffer);
    curl_easy_setopt(curl.get(), CURLOPT_NOBODY, 1L);
    curl_easy_setopt(curl.get(), CURLOPT_HEADERFUNCTION, collect_header);
    curl_easy_setopt(curl.get(), CURLOPT_HEADERDATA, &response_headers);

    const CURLcode code = curl_easy_perform(curl.get());
    if (code != CURLE_OK) {
        result.error.message = "head " + url + ": " + transport_error(code, error_buffer);
        return result;
    }

    long status = 0;
    curl_easy_getinfo(curl.get(), CURLINFO_RESPONSE_CODE, &status);
    if (status == 404) {
        result.ok = true;
        result.found = false;
        return result;
    }
    if (status != 200) {
        result.error.http_status = status;
        result.error.message = "head " + url + ": HTTP " + std::to_string(status);
        return result;
    }

    result.info.key = key;
    result.info.size = parse_size(header_or_empty(response_headers, "content-length").c_str());
    result.info.last_modified = header_or_empty(response_headers, "last-modified");
    result.info.etag = strip_etag_quotes(header_or_empty(response_headers, "etag"));
    result.ok = true;
    result.found = true;
    return result;
}

GetResult CurlObjectStore::get(const std::string& key, const std::filesystem::path& dst) {
    GetResult result;
    if (!ensure_curl_initialized(result.error.message)) {
        return result;
    }

    std::filesystem::path tmp;
    try {
        tmp = platform::make_temp_file_near(dst);
    } catch (const std::runtime_error& e) {
        result.error.message = e.what();
        return result;
    }

    auto discard_tmp = [&tmp]() {
        std::error_code ec;
        std::filesystem::remove(tmp, ec);
    };

    unique_file file{std::fopen(tmp.c_str(), "wb")};
    if (!file) {
        result.error.message = "cannot open " + platform::path_to_utf8(tmp) + " for writing";
        discard_tmp();
        return result;
    }

    unique_curl_easy curl{curl_easy_init()};
    if (!curl) {
        result.error.message = "curl_easy_init failed";
        file.reset();
        discard_tmp();
        return result;
    }

    const std::string sigv4 = "aws:amz:" + settings_.region + ":s3";
    const std::string userpwd = settings_.access_key + ":" + settings_.secret_key;
    unique_curl_slist headers{curl_slist_append(
        nullptr, (std::string("x-amz-content-sha256: ") + EMPTY_PAYLOAD_SHA256).c_str())};

    const std::string url = object_url(key);
    HeaderMap response_headers;
    char error_buffer[CURL_ERROR_SIZE]{};

    apply_common_options(curl.get(), url, settings_, sigv4, userpwd, headers.get(), error_buffer);
    curl_easy_setopt(curl.get(), CURLOPT_WRITEFUNCTION, write_to_file);
    curl_easy_setopt(curl.get(), CURLOPT_WRITEDATA, file.get());
    curl_easy_setopt(curl.get(), CURLOPT_HEADERFUNCTION, collect_header);
    curl_easy_setopt(curl.get(), CURLOPT_HEADERDATA, &response_headers);

    const CURLcode code = curl_easy_perform(curl.get());
    long status = 0;
    curl_easy_getinfo(curl.get(), CURLINFO_RESPONSE_CODE, &status);

    const bool flushed = std::fflush(file.get()) == 0;
    file.reset();

    if (code != CURLE_OK) {
        result.error.message = "get " + url + ": " + transport_error(code, error_buffer);
        discard_tmp();
        return result;
    }
    if (status != 200) {
        result.error.http_status = status;
        result.error.message = "get " + url + ": HTTP " + std::to_string(status);
        discard_tmp();
        return result;
    }
    if (!flushed) {
        result.error.message = "write error on " + platform::path_to_utf8(tmp);
        discard_tmp();
        return result;
    }

    std::error_code ec;
    std::filesystem::rename(tmp, dst, ec);
    if (ec) {
        result.error.message = "rename " + platform::path_to_utf8(tmp) + " -> " +
                               platform::path_to_utf8(dst) + ": " + ec.message();
        discard_tmp();
        return result;
    }

    result.info.key = key;
    result.info.last_modified = header_or_empty(response_headers, "last-modified");
    result.info.etag = strip_etag_quotes(header_or_empty(response_headers, "etag"));
    result.info.size = std::filesystem::file_size(dst, ec);
    if (ec) {
        result.info.size = 0;
    }

    // Время модификации копии = Last-Modified объекта (ошибка не фатальна)
    if (auto mtime = parse_http_date(result.info.last_modified)) {
        struct utimbuf times {};
        times.actime = *mtime;
        times.modtime = *mtime;
        if (::utime(dst.c_str(), &times) != 0) {
            result.warning = "cannot set modification time of " + platform::path_to_utf8(dst) +
                             ": " + std::generic_category().message(errno);
        }
    }

    result.ok = true;
    return result;
}

}  // namespace turbosort::s3
