// ==============================================================================
// identity.cpp - Отпечатки элементов источника
// ==============================================================================

#include "turbosort/identity.hpp"

#include "turbosort/platform.hpp"

#include <system_error>

namespace turbosort::identity {

std::string to_hex(std::uint64_t value) {
    static const char* hex = "0123456789abcdef";
    std::string result(16, '0');
    for (int i = 15; i >= 0; --i) {
        result[static_cast<size_t>(i)] = hex[value & 0xF];
        value >>= 4;
    }
    return result;
}

std::string fingerprint(std::string_view material) {
    Fnv1a64 h;
    h.update(material);
    return to_hex(h.digest());
}

std::string local_identity(std::string_view absolute_path, std::uint64_t size,
                           std::int64_t mtime_ticks) {
    std::string material;
    material.reserve(absolute_path.size() + 48);
    material.append(absolute_path);
    material += ':';
    material += std::to_string(size);
    material += ':';
    material += std::to_string(mtime_ticks);
    return fingerprint(material);
}

std::string remote_identity(std::string_view key, std::string_view etag) {
    std::string material;
    material.reserve(key.size() + etag.size() + 1);
    material.append(key);
    material += ':';
    material.append(etag);
    return fingerprint(material);
}

std::optional<ItemState> stat_local(const std::filesystem::path& path) {
    // Файл может исчезнуть между перечислением и обработкой: это не ошибка
    std::error_code ec;
    auto status = std::filesystem::status(path, ec);
    if (ec || !std::filesystem::is_regular_file(status)) {
        return std::nullopt;
    }

    auto size = std::filesystem::file_size(path, ec);
    if (ec) {
        return std::nullopt;
    }
    auto mtime = std::filesystem::last_write_time(path, ec);
    if (ec) {
        return std::nullopt;
    }

    ItemState state;
    state.size = static_cast<std::uint64_t>(size);
    state.identity = local_identity(platform::path_to_utf8(path), state.size,
                                    static_cast<std::int64_t>(mtime.time_since_epoch().count()));
    return state;
}

}  // namespace turbosort::identity
