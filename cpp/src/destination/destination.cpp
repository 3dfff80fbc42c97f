// ==============================================================================
// destination.cpp - Вычисление директории назначения
// ==============================================================================

#include "turbosort/destination.hpp"

#include "turbosort/config.hpp"
#include "turbosort/platform.hpp"

#include <cctype>
#include <regex>
#include <system_error>

namespace turbosort::destination {

namespace {

bool is_space(char c) {
    return std::isspace(static_cast<unsigned char>(c)) != 0;
}

bool is_single_segment(const std::string& s) {
    return !s.empty() && s != "." && s != ".." && s.find('/') == std::string::npos &&
           s.find('\0') == std::string::npos;
}

}  // namespace

// ----------------------------------------------------------------------------
// Маркер
// ----------------------------------------------------------------------------

std::optional<std::string> parse_marker_directive(std::string_view content) {
    // UTF-8 BOM
    if (content.size() >= 3 && content.substr(0, 3) == "\xEF\xBB\xBF") {
        content.remove_prefix(3);
    }

    size_t begin = 0;
    size_t end = content.size();
    while (begin < end && is_space(content[begin])) {
        ++begin;
    }
    while (end > begin && is_space(content[end - 1])) {
        --end;
    }

    if (begin == end) {
        return std::nullopt;
    }
    return std::string(content.substr(begin, end - begin));
}

// ----------------------------------------------------------------------------
// ResolveOptions
// ----------------------------------------------------------------------------

ResolveOptions ResolveOptions::from_config(const config::Config& cfg) {
    ResolveOptions opt;
    // В журнал попадают абсолютные пути, не зависящие от рабочей директории
    std::error_code ec;
    std::filesystem::path abs = std::filesystem::absolute(cfg.dest_dir, ec);
    opt.dest_root = (ec ? cfg.dest_dir : abs).lexically_normal();
    opt.year_prefix = cfg.year_prefix;
    opt.drive_suffix = cfg.drive_suffix;
    opt.drive_suffix_name = cfg.drive_suffix_name;
    return opt;
}

// ----------------------------------------------------------------------------
// Нормализация
// ----------------------------------------------------------------------------

std::optional<std::string> normalize_marker_path(std::string_view raw) {
    for (char c : raw) {
        auto uc = static_cast<unsigned char>(c);
        if (uc < 0x20 || uc == 0x7F) {
            return std::nullopt;
        }
    }

    std::vector<std::string_view> segments;
    size_t pos = 0;
    while (pos <= raw.size()) {
        size_t next = raw.find('/', pos);
        if (next == std::string_view::npos) {
            next = raw.size();
        }
        std::string_view segment = raw.substr(pos, next - pos);
        pos = next + 1;

        if (segment.empty() || segment == ".") {
            continue;
        }
        if (segment == "..") {
            // Выход за пределы корня назначения
            if (segments.empty()) {
                return std::nullopt;
            }
            segments.pop_back();
            continue;
        }
        segments.push_back(segment);
    }

    if (segments.empty()) {
        return std::nullopt;
    }

    std::string result;
    for (size_t i = 0; i < segments.size(); ++i) {
        if (i > 0) {
            result += '/';
        }
        result.append(segments[i]);
    }
    return result;
}

std::optional<std::string> extract_year(std::string_view text) {
    static const std::regex year_re("(19[0-9]{2}|20[0-9]{2})");

    std::string s(text);
    std::smatch m;
    if (std::regex_search(s, m, year_re)) {
        return m[1].str();
    }
    return std::nullopt;
}

// ----------------------------------------------------------------------------
// resolve
// ----------------------------------------------------------------------------

ResolveResult resolve(std::string_view marker_destination, const ResolveOptions& opt) {
    ResolveResult result;

    auto normalized = normalize_marker_path(marker_destination);
    if (!normalized) {
        result.error = "invalid destination path '" + std::string(marker_destination) + "'";
        return result;
    }
    result.normalized = *normalized;

    std::filesystem::path base = opt.dest_root;

    if (opt.year_prefix) {
        result.year = extract_year(*normalized);
        if (result.year) {
            base /= *result.year;
        } else {
            result.warnings.push_back("No valid year found in path: " + *normalized +
                                      ", using standard path");
        }
    }

    base /= platform::path_from_utf8(*normalized);

    if (opt.drive_suffix) {
        if (!is_single_segment(opt.drive_suffix_name)) {
            result.error = "invalid drive suffix '" + opt.drive_suffix_name + "'";
            return result;
        }
        base /= opt.drive_suffix_name;
    }

    std::filesystem::path target = base.lexically_normal();
    std::filesystem::path root = opt.dest_root.lexically_normal();

    // Итоговый путь обязан оставаться строго внутри корня назначения
    std::filesystem::path relative = target.lexically_relative(root);
    if (relative.empty() || relative == "." || *relative.begin() == "..") {
        result.error = "destination '" + platform::path_to_utf8(target) +
                       "' escapes destination root '" + platform::path_to_utf8(root) + "'";
        return result;
    }

    result.target = std::move(target);
    result.ok = true;
    return result;
}

}  // namespace turbosort::destination
