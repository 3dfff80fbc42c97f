// ==============================================================================
// turbosort/watch.hpp - Подписка на события файловой системы (inotify)
// ==============================================================================
//
// Назначение:
// - Channel<T>: очередь сообщений между потоками (mutex + condition_variable)
// - WatchEvent: событие файловой системы (вид, путь, признак директории)
// - InotifyWatcher: фоновый поток, рекурсивные inotify-подписки на дерево
//   источника, события публикуются в Channel
//
// Фоновый поток не пишет в журнал: ошибки передаются в канал как события
// вида Error, единственный потребитель - основной цикл.
//
// ==============================================================================

#ifndef TURBOSORT_WATCH_HPP
#define TURBOSORT_WATCH_HPP

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <deque>
#include <filesystem>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <unordered_map>

namespace turbosort::watch {

// ----------------------------------------------------------------------------
// Channel
// ----------------------------------------------------------------------------

/// Неограниченная очередь с одним или несколькими производителями.
/// После close() push() отклоняет новые элементы, pop_for() отдаёт остаток.
template <typename T>
class Channel {
public:
    Channel() = default;
    Channel(const Channel&) = delete;
    Channel& operator=(const Channel&) = delete;

    /// @return false если канал закрыт
    bool push(T value) {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (closed_) {
                return false;
            }
            queue_.push_back(std::move(value));
        }
        cv_.notify_one();
        return true;
    }

    /// Ждать элемент не дольше timeout
    template <typename Rep, typename Period>
    std::optional<T> pop_for(const std::chrono::duration<Rep, Period>& timeout) {
        std::unique_lock<std::mutex> lock(mutex_);
        cv_.wait_for(lock, timeout, [this] { return !queue_.empty() || closed_; });
        if (queue_.empty()) {
            return std::nullopt;
        }
        T value = std::move(queue_.front());
        queue_.pop_front();
        return value;
    }

    std::optional<T> try_pop() {
        std::lock_guard<std::mutex> lock(mutex_);
        if (queue_.empty()) {
            return std::nullopt;
        }
        T value = std::move(queue_.front());
        queue_.pop_front();
        return value;
    }

    void close() {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            closed_ = true;
        }
        cv_.notify_all();
    }

    bool closed() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return closed_;
    }

    std::size_t size() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return queue_.size();
    }

private:
    mutable std::mutex mutex_;
    std::condition_variable cv_;
    std::deque<T> queue_;
    bool closed_ = false;
};

// ----------------------------------------------------------------------------
// WatchEvent
// ----------------------------------------------------------------------------

enum class EventKind {
    Created,   // создан или перемещён внутрь дерева
    Modified,  // запись закрыта или изменены атрибуты
    Deleted,   // удалён или перемещён за пределы
    Overflow,  // очередь ядра переполнена, события потеряны
    Error      // ошибка подписки (message)
};

const char* event_kind_to_string(EventKind kind);

struct WatchEvent {
    EventKind kind = EventKind::Modified;
    std::filesystem::path path;
    bool is_directory = false;
    std::string message;
};

// ----------------------------------------------------------------------------
// InotifyWatcher
// ----------------------------------------------------------------------------

class InotifyWatcher {
public:
    InotifyWatcher(std::filesystem::path root, Channel<WatchEvent>& out);
    ~InotifyWatcher();

    InotifyWatcher(const InotifyWatcher&) = delete;
    InotifyWatcher& operator=(const InotifyWatcher&) = delete;

    /// Создать inotify, подписаться на дерево, запустить поток
    /// @param error[out] текст ошибки
    bool start(std::string& error);

    /// Остановить поток и закрыть дескриптор
    void stop();

    bool running() const { return running_.load(); }

    /// Число активных подписок
    std::size_t watch_count() const;

private:
    void loop();
    void add_watch_recursive(const std::filesystem::path& dir, bool announce);
    void add_watch(const std::filesystem::path& dir);
    void handle_event(int wd, std::uint32_t mask, const char* name);
    void publish(WatchEvent ev);

    std::filesystem::path root_;
    Channel<WatchEvent>& out_;
    int fd_ = -1;
    std::atomic<bool> running_{false};
    std::thread thread_;

    mutable std::mutex mutex_;
    std::unordered_map<int, std::filesystem::path> wd_to_path_;
};

}  // namespace turbosort::watch

#endif  // TURBOSORT_WATCH_HPP
