// ==============================================================================
// turbosort/identity.hpp - Отпечатки элементов источника
// ==============================================================================
//
// Назначение:
// - Стабильный отпечаток элемента по его расположению и изменяемым атрибутам
//   (размер + время модификации для файла, ключ + ETag для объекта)
// - Быстрый некриптографический 64-битный хеш (FNV-1a)
//
// Отпечаток служит детектором изменений, а не границей безопасности.
//
// ==============================================================================

#ifndef TURBOSORT_IDENTITY_HPP
#define TURBOSORT_IDENTITY_HPP

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>

namespace turbosort::identity {

// ----------------------------------------------------------------------------
// FNV-1a 64
// ----------------------------------------------------------------------------

class Fnv1a64 {
public:
    static constexpr std::uint64_t OFFSET_BASIS = 14695981039346656037ULL;
    static constexpr std::uint64_t PRIME = 1099511628211ULL;

    void update(std::string_view data) {
        for (unsigned char c : data) {
            hash_ ^= c;
            hash_ *= PRIME;
        }
    }

    std::uint64_t digest() const { return hash_; }

private:
    std::uint64_t hash_ = OFFSET_BASIS;
};

/// 64-битный хеш в виде 16 hex-символов (нижний регистр)
std::string to_hex(std::uint64_t value);

/// hex(FNV-1a 64) строки
std::string fingerprint(std::string_view material);

// ----------------------------------------------------------------------------
// Отпечатки
// ----------------------------------------------------------------------------

/// Состояние элемента на момент вычисления отпечатка
struct ItemState {
    std::string identity;
    std::uint64_t size = 0;
};

/// Отпечаток локального файла: hash(path + ":" + size + ":" + mtime)
std::string local_identity(std::string_view absolute_path, std::uint64_t size,
                           std::int64_t mtime_ticks);

/// Отпечаток объекта: hash(key + ":" + etag)
std::string remote_identity(std::string_view key, std::string_view etag);

/// Вычислить состояние локального файла.
/// @return nullopt если файл исчез или не является обычным файлом
std::optional<ItemState> stat_local(const std::filesystem::path& path);

}  // namespace turbosort::identity

#endif  // TURBOSORT_IDENTITY_HPP
