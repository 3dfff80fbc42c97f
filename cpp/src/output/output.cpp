// ==============================================================================
// output.cpp - Пользовательский вывод и журнал
// ==============================================================================
//
// RapidJSON для JSON сериализации.
// Только этот модуль пишет в stdout/stderr; байты первичны, без std::endl.
//
// ==============================================================================

#include "turbosort/output.hpp"

#include "turbosort/platform.hpp"

#include <algorithm>
#include <cstdio>
#include <rapidjson/document.h>
#include <rapidjson/prettywriter.h>
#include <rapidjson/stringbuffer.h>

namespace turbosort::output {

// ----------------------------------------------------------------------------
// ANSI Escape Codes
// ----------------------------------------------------------------------------

namespace {

constexpr const char* ANSI_RESET = "\x1b[0m";
constexpr const char* ANSI_GREEN = "\x1b[32m";
constexpr const char* ANSI_YELLOW = "\x1b[33m";
constexpr const char* ANSI_RED = "\x1b[31m";
constexpr const char* ANSI_CYAN = "\x1b[36m";
constexpr const char* ANSI_MAGENTA = "\x1b[35m";

// Unicode box-drawing characters (UTF-8)
constexpr const char* BOX_V = "\xe2\x94\x82";      // │ U+2502
constexpr const char* BOX_H = "\xe2\x94\x80";      // ─ U+2500
constexpr const char* BOX_TL = "\xe2\x94\x8c";     // ┌ U+250C
constexpr const char* BOX_TR = "\xe2\x94\x90";     // ┐ U+2510
constexpr const char* BOX_BL = "\xe2\x94\x94";     // └ U+2514
constexpr const char* BOX_BR = "\xe2\x94\x98";     // ┘ U+2518
constexpr const char* BOX_LT = "\xe2\x94\x9c";     // ├ U+251C
constexpr const char* BOX_RT = "\xe2\x94\xa4";     // ┤ U+2524
constexpr const char* BOX_TT = "\xe2\x94\xac";     // ┬ U+252C
constexpr const char* BOX_BT = "\xe2\x94\xb4";     // ┴ U+2534
constexpr const char* BOX_CROSS = "\xe2\x94\xbc";  // ┼ U+253C

std::string format_fixed2(double value) {
    char buf[64];
    std::snprintf(buf, sizeof(buf), "%.2f", value);
    return buf;
}

}  // namespace

// ----------------------------------------------------------------------------
// Writer
// ----------------------------------------------------------------------------

Writer::Writer(const OutputConfig& cfg) : config_(cfg) {}

Writer::~Writer() {
    flush();
}

void Writer::write(Stream s, std::string_view bytes) {
    FILE* f = get_file(s);
    if (f != nullptr) {
        std::fwrite(bytes.data(), 1, bytes.size(), f);
    }
}

void Writer::write_line(Stream s, std::string_view bytes) {
    write(s, bytes);
    write(s, "\n");
}

FILE* Writer::get_file(Stream s) const {
    return (s == Stream::Stdout) ? stdout : stderr;
}

void Writer::log_line(std::string_view prefix, Color color, std::string_view message) {
    if (config_.timestamps) {
        write(Stream::Stderr, platform::now_log_stamp());
        write(Stream::Stderr, " - ");
    }
    if (supports_color(Stream::Stderr)) {
        write(Stream::Stderr, ansi_color_code(color));
        write(Stream::Stderr, prefix);
        write(Stream::Stderr, ANSI_RESET);
    } else {
        write(Stream::Stderr, prefix);
    }
    write_line(Stream::Stderr, message);
    // Сервис работает долго: строка журнала не должна застревать в буфере
    std::fflush(stderr);
}

void Writer::info(std::string_view message) {
    if (config_.quiet) {
        return;
    }
    log_line("[+] ", Color::Green, message);
}

void Writer::warn(std::string_view message) {
    ++warnings_;
    if (config_.quiet) {
        return;
    }
    log_line("[!] ", Color::Yellow, message);
}

void Writer::error(std::string_view message) {
    // Ошибки печатаются всегда, даже при --quiet
    ++errors_;
    log_line("[x] ", Color::Red, message);
}

void Writer::debug(std::string_view message) {
    if (config_.verbose <= 0) {
        return;
    }
    log_line("[*] ", Color::Cyan, message);
}

void Writer::trace(std::string_view message) {
    if (config_.verbose <= 1) {
        return;
    }
    log_line("[~] ", Color::Magenta, message);
}

void Writer::write_json_pretty(const rapidjson::Value& value) {
    rapidjson::StringBuffer buffer;
    rapidjson::PrettyWriter<rapidjson::StringBuffer> writer(buffer);
    writer.SetIndent(' ', 2);
    value.Accept(writer);

    write(Stream::Stdout, std::string_view(buffer.GetString(), buffer.GetSize()));
    write(Stream::Stdout, "\n");
    flush();
}

void Writer::flush() {
    std::fflush(stdout);
    std::fflush(stderr);
}

// ----------------------------------------------------------------------------
// Table
// ----------------------------------------------------------------------------

Table::Table() = default;

void Table::set_headers(const std::vector<std::string>& headers) {
    headers_ = headers;
}

void Table::add_row(const std::vector<std::string>& cells) {
    rows_.push_back(cells);
}

void Table::set_max_width(size_t col, size_t width) {
    if (col >= max_widths_.size()) {
        max_widths_.resize(col + 1, 0);
    }
    max_widths_[col] = width;
}

std::string Table::clip(const std::string& cell, size_t col) const {
    if (col >= max_widths_.size() || max_widths_[col] == 0 || cell.size() <= max_widths_[col]) {
        return cell;
    }
    size_t limit = max_widths_[col];
    // Граница разреза не должна попадать внутрь символа UTF-8
    auto is_continuation = [&cell](size_t i) {
        return i < cell.size() && (static_cast<unsigned char>(cell[i]) & 0xC0) == 0x80;
    };
    if (limit <= 3) {
        size_t end = limit;
        while (end > 0 && is_continuation(end)) {
            --end;
        }
        return cell.substr(0, end);
    }
    // Обрезаем начало: для путей важнее хвост (имя файла)
    size_t start = cell.size() - (limit - 3);
    while (is_continuation(start)) {
        ++start;
    }
    return "..." + cell.substr(start);
}

std::vector<size_t> Table::column_widths() const {
    size_t num_cols = headers_.size();
    for (const auto& row : rows_) {
        num_cols = std::max(num_cols, row.size());
    }

    std::vector<size_t> widths(num_cols, 0);
    for (size_t i = 0; i < headers_.size(); ++i) {
        widths[i] = std::max(widths[i], clip(headers_[i], i).size());
    }
    for (const auto& row : rows_) {
        for (size_t i = 0; i < row.size(); ++i) {
            widths[i] = std::max(widths[i], clip(row[i], i).size());
        }
    }
    return widths;
}

std::string Table::format_line(char left, char middle, char right,
                               const std::vector<size_t>& widths) const {
    std::string line;

    if (left == 'T') {
        line += BOX_TL;
    } else if (left == 'M') {
        line += BOX_LT;
    } else if (left == 'B') {
        line += BOX_BL;
    }

    for (size_t i = 0; i < widths.size(); ++i) {
        // padding (1 пробел с каждой стороны) + ширина содержимого
        for (size_t j = 0; j < widths[i] + 2; ++j) {
            line += BOX_H;
        }

        if (i + 1 < widths.size()) {
            if (middle == 'T') {
                line += BOX_TT;
            } else if (middle == 'M') {
                line += BOX_CROSS;
            } else if (middle == 'B') {
                line += BOX_BT;
            }
        }
    }

    if (right == 'T') {
        line += BOX_TR;
    } else if (right == 'M') {
        line += BOX_RT;
    } else if (right == 'B') {
        line += BOX_BR;
    }

    return line;
}

std::string Table::format_row(const std::vector<std::string>& cells,
                              const std::vector<size_t>& widths) const {
    std::string line;
    line += BOX_V;

    for (size_t i = 0; i < widths.size(); ++i) {
        line += ' ';

        std::string cell = (i < cells.size()) ? clip(cells[i], i) : "";
        line += cell;
        if (cell.size() < widths[i]) {
            line.append(widths[i] - cell.size(), ' ');
        }

        line += ' ';
        line += BOX_V;
    }

    return line;
}

std::string Table::to_string() const {
    std::vector<size_t> widths = column_widths();
    std::string result;

    // ┌───┬───┐
    result += format_line('T', 'T', 'T', widths);
    result += '\n';

    if (!headers_.empty()) {
        result += format_row(headers_, widths);
        result += '\n';

        // ├───┼───┤
        result += format_line('M', 'M', 'M', widths);
        result += '\n';
    }

    for (const auto& row : rows_) {
        result += format_row(row, widths);
        result += '\n';
    }

    // └───┴───┘
    result += format_line('B', 'B', 'B', widths);
    result += '\n';

    return result;
}

void Table::print(Writer& w) {
    w.write(Stream::Stdout, to_string());
}

// ----------------------------------------------------------------------------
// Вспомогательные функции
// ----------------------------------------------------------------------------

std::string format_info(std::string_view message) {
    std::string result = "[+] ";
    result.append(message);
    result.append("\n");
    return result;
}

std::string format_error(std::string_view message) {
    std::string result = "[x] ";
    result.append(message);
    result.append("\n");
    return result;
}

std::string format_warning(std::string_view message) {
    std::string result = "[!] ";
    result.append(message);
    result.append("\n");
    return result;
}

std::string format_debug(std::string_view message) {
    std::string result = "[*] ";
    result.append(message);
    result.append("\n");
    return result;
}

std::string format_size(std::uint64_t bytes) {
    constexpr std::uint64_t KB = 1024ULL;
    constexpr std::uint64_t MB = 1024ULL * 1024ULL;
    constexpr std::uint64_t GB = 1024ULL * 1024ULL * 1024ULL;
    if (bytes >= GB) {
        return format_fixed2(static_cast<double>(bytes) / GB) + " GB";
    }
    if (bytes >= MB) {
        return format_fixed2(static_cast<double>(bytes) / MB) + " MB";
    }
    if (bytes >= KB) {
        return format_fixed2(static_cast<double>(bytes) / KB) + " KB";
    }
    return std::to_string(bytes) + " B";
}

std::string format_megabytes(std::uint64_t bytes) {
    return format_fixed2(static_cast<double>(bytes) / (1024.0 * 1024.0));
}

std::string ansi_color_code(Color color) {
    switch (color) {
    case Color::Green:
        return ANSI_GREEN;
    case Color::Yellow:
        return ANSI_YELLOW;
    case Color::Red:
        return ANSI_RED;
    case Color::Cyan:
        return ANSI_CYAN;
    case Color::Magenta:
        return ANSI_MAGENTA;
    case Color::Default:
    default:
        return "";
    }
}

std::string ansi_reset_code() {
    return ANSI_RESET;
}

bool supports_color(Stream s) {
    if (s == Stream::Stdout) {
        return platform::is_tty_stdout();
    }
    return platform::is_tty_stderr();
}

}  // namespace turbosort::output
