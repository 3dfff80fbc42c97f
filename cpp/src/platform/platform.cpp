// ==============================================================================
// platform.cpp - Платформенные абстракции
// ==============================================================================
//
// std::filesystem::path + явные преобразования path <-> UTF-8.
// Платформенная специфика изолирована здесь.
//
// ==============================================================================

#include "turbosort/platform.hpp"

#include <atomic>
#include <csignal>
#include <cstdio>
#include <cstdlib>
#include <ctime>
#include <fstream>
#include <stdexcept>
#include <system_error>
#include <unistd.h>
#include <vector>

namespace turbosort::platform {

namespace {

std::atomic<bool> g_stop{false};

extern "C" void handle_stop_signal(int /*signo*/) {
    g_stop.store(true);
}

std::string format_time(const char* fmt, bool utc) {
    std::time_t now = std::time(nullptr);
    std::tm tm_buf{};
    if (utc) {
        gmtime_r(&now, &tm_buf);
    } else {
        localtime_r(&now, &tm_buf);
    }
    char buf[64];
    size_t n = std::strftime(buf, sizeof(buf), fmt, &tm_buf);
    return std::string(buf, n);
}

}  // namespace

// ----------------------------------------------------------------------------
// Преобразования путей
// ----------------------------------------------------------------------------

std::filesystem::path path_from_utf8(std::string_view u8str) {
    // POSIX: пути уже в UTF-8 (или native encoding)
    return std::filesystem::path(u8str);
}

std::string path_to_utf8(const std::filesystem::path& p) {
    return p.string();
}

// ----------------------------------------------------------------------------
// TTY detection
// ----------------------------------------------------------------------------

bool is_tty_stdout() {
    return isatty(fileno(stdout)) != 0;
}

bool is_tty_stderr() {
    return isatty(fileno(stderr)) != 0;
}

// ----------------------------------------------------------------------------
// Временные файлы
// ----------------------------------------------------------------------------

std::filesystem::path make_temp_file_near(const std::filesystem::path& target) {
    std::filesystem::path dir = target.parent_path();
    if (dir.empty()) {
        dir = ".";
    }
    std::string tmpl =
        path_to_utf8(dir / ("." + path_to_utf8(target.filename()) + ".part_XXXXXX"));
    std::vector<char> tmpl_buf(tmpl.begin(), tmpl.end());
    tmpl_buf.push_back('\0');

    int fd = mkstemp(tmpl_buf.data());
    if (fd == -1) {
        throw std::runtime_error("Failed to create temp file in " + path_to_utf8(dir));
    }
    close(fd);

    return path_from_utf8(tmpl_buf.data());
}

// ----------------------------------------------------------------------------
// Копирование и запись
// ----------------------------------------------------------------------------

bool copy_file_preserving(const std::filesystem::path& src, const std::filesystem::path& dst,
                          std::string& error) {
    std::error_code ec;

    // Копируем во временный файл рядом с dst: частично записанный файл
    // никогда не появляется под конечным именем
    std::filesystem::path tmp;
    try {
        tmp = make_temp_file_near(dst);
    } catch (const std::runtime_error& e) {
        error = e.what();
        return false;
    }

    std::filesystem::copy_file(src, tmp, std::filesystem::copy_options::overwrite_existing, ec);
    if (ec) {
        error = "copy failed - " + ec.message();
        std::filesystem::remove(tmp, ec);
        return false;
    }

    auto perms = std::filesystem::status(src, ec).permissions();
    if (!ec) {
        std::filesystem::permissions(tmp, perms, ec);
    }
    auto mtime = std::filesystem::last_write_time(src, ec);
    if (!ec) {
        std::filesystem::last_write_time(tmp, mtime, ec);
    }
    if (ec) {
        error = "failed to preserve metadata - " + ec.message();
        std::filesystem::remove(tmp, ec);
        return false;
    }

    std::filesystem::rename(tmp, dst, ec);
    if (ec) {
        error = "failed to move file into place - " + ec.message();
        std::error_code ignored;
        std::filesystem::remove(tmp, ignored);
        return false;
    }
    return true;
}

bool write_file_atomic(const std::filesystem::path& path, std::string_view content,
                       std::string& error) {
    std::error_code ec;
    if (path.has_parent_path()) {
        std::filesystem::create_directories(path.parent_path(), ec);
        if (ec) {
            error = "failed to create directory - " + ec.message();
            return false;
        }
    }

    std::filesystem::path tmp;
    try {
        tmp = make_temp_file_near(path);
    } catch (const std::runtime_error& e) {
        error = e.what();
        return false;
    }

    {
        std::ofstream out(tmp, std::ios::binary | std::ios::trunc);
        if (!out.is_open()) {
            error = "could not open file for writing";
            std::filesystem::remove(tmp, ec);
            return false;
        }
        out.write(content.data(), static_cast<std::streamsize>(content.size()));
        out.flush();
        if (!out) {
            error = "write failed";
            out.close();
            std::filesystem::remove(tmp, ec);
            return false;
        }
    }

    std::filesystem::rename(tmp, path, ec);
    if (ec) {
        error = "failed to replace file - " + ec.message();
        std::error_code ignored;
        std::filesystem::remove(tmp, ignored);
        return false;
    }
    return true;
}

// ----------------------------------------------------------------------------
// Время
// ----------------------------------------------------------------------------

std::string now_iso8601() {
    return format_time("%Y-%m-%dT%H:%M:%SZ", true);
}

std::string now_log_stamp() {
    return format_time("%Y-%m-%d %H:%M:%S", false);
}

// ----------------------------------------------------------------------------
// Завершение процесса
// ----------------------------------------------------------------------------

void install_stop_handlers() {
    std::signal(SIGINT, handle_stop_signal);
    std::signal(SIGTERM, handle_stop_signal);
}

bool stop_requested() {
    return g_stop.load();
}

void request_stop() {
    g_stop.store(true);
}

void reset_stop() {
    g_stop.store(false);
}

// ----------------------------------------------------------------------------
// Информация о платформе
// ----------------------------------------------------------------------------

std::string os_name() {
#if defined(__APPLE__)
    return "macOS";
#elif defined(__linux__)
    return "Linux";
#else
    return "Unknown";
#endif
}

}  // namespace turbosort::platform
