// ==============================================================================
// watch.cpp - Подписка на события файловой системы (inotify)
// ==============================================================================

#include "turbosort/watch.hpp"

#include "turbosort/platform.hpp"

#include <cerrno>
#include <deque>
#include <poll.h>
#include <sys/inotify.h>
#include <system_error>
#include <unistd.h>

namespace turbosort::watch {

namespace fs = std::filesystem;

namespace {

constexpr std::uint32_t WATCH_MASK = IN_CREATE | IN_CLOSE_WRITE | IN_ATTRIB | IN_MOVED_TO |
                                     IN_MOVED_FROM | IN_DELETE | IN_ONLYDIR;

// Период проверки флага остановки в фоновом потоке
constexpr int POLL_TIMEOUT_MS = 200;

std::string errno_message(int err) {
    return std::generic_category().message(err);
}

}  // namespace

const char* event_kind_to_string(EventKind kind) {
    switch (kind) {
    case EventKind::Created:
        return "created";
    case EventKind::Modified:
        return "modified";
    case EventKind::Deleted:
        return "deleted";
    case EventKind::Overflow:
        return "overflow";
    case EventKind::Error:
        return "error";
    }
    return "unknown";
}

// ----------------------------------------------------------------------------
// InotifyWatcher
// ----------------------------------------------------------------------------

InotifyWatcher::InotifyWatcher(fs::path root, Channel<WatchEvent>& out)
    : root_(std::move(root)), out_(out) {}

InotifyWatcher::~InotifyWatcher() {
    stop();
}

bool InotifyWatcher::start(std::string& error) {
    if (running_.load()) {
        return true;
    }
    // Поток завершился сам (ошибка или закрытый канал): освободить ресурсы
    stop();

    fd_ = inotify_init1(IN_NONBLOCK | IN_CLOEXEC);
    if (fd_ < 0) {
        error = "inotify_init1 failed: " + errno_message(errno);
        return false;
    }

    int wd = inotify_add_watch(fd_, root_.c_str(), WATCH_MASK);
    if (wd < 0) {
        error = "cannot watch " + platform::path_to_utf8(root_) + ": " + errno_message(errno);
        ::close(fd_);
        fd_ = -1;
        return false;
    }
    {
        std::lock_guard<std::mutex> lock(mutex_);
        wd_to_path_[wd] = root_;
    }

    // Поддиректории, существующие на момент старта
    std::error_code ec;
    for (fs::directory_iterator it(root_, ec), end; !ec && it != end; it.increment(ec)) {
        std::error_code entry_ec;
        if (it->is_directory(entry_ec) && !it->is_symlink(entry_ec)) {
            add_watch_recursive(it->path(), false);
        }
    }

    running_.store(true);
    thread_ = std::thread(&InotifyWatcher::loop, this);
    return true;
}

void InotifyWatcher::stop() {
    running_.store(false);
    if (thread_.joinable()) {
        thread_.join();
    }
    if (fd_ >= 0) {
        ::close(fd_);
        fd_ = -1;
    }
    std::lock_guard<std::mutex> lock(mutex_);
    wd_to_path_.clear();
}

std::size_t InotifyWatcher::watch_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return wd_to_path_.size();
}

void InotifyWatcher::publish(WatchEvent ev) {
    // Канал закрыт: потребителя больше нет
    if (!out_.push(std::move(ev))) {
        running_.store(false);
    }
}

void InotifyWatcher::add_watch(const fs::path& dir) {
    int wd = inotify_add_watch(fd_, dir.c_str(), WATCH_MASK);
    if (wd < 0) {
        WatchEvent ev;
        ev.kind = EventKind::Error;
        ev.path = dir;
        ev.is_directory = true;
        ev.message = "cannot watch " + platform::path_to_utf8(dir) + ": " + errno_message(errno);
        publish(std::move(ev));
        return;
    }
    std::lock_guard<std::mutex> lock(mutex_);
    wd_to_path_[wd] = dir;
}

void InotifyWatcher::add_watch_recursive(const fs::path& dir, bool announce) {
    std::deque<fs::path> pending;
    pending.push_back(dir);

    while (!pending.empty()) {
        fs::path current = std::move(pending.front());
        pending.pop_front();

        add_watch(current);

        // Директория, появившаяся после старта, могла прийти уже с файлами
        if (announce) {
            WatchEvent ev;
            ev.kind = EventKind::Created;
            ev.path = current;
            ev.is_directory = true;
            publish(std::move(ev));
        }

        std::error_code ec;
        for (fs::directory_iterator it(current, ec), end; !ec && it != end; it.increment(ec)) {
            std::error_code entry_ec;
            if (it->is_directory(entry_ec) && !it->is_symlink(entry_ec)) {
                pending.push_back(it->path());
            }
        }
    }
}

void InotifyWatcher::loop() {
    alignas(struct inotify_event) char buffer[16 * 1024];

    while (running_.load()) {
        struct pollfd pfd {};
        pfd.fd = fd_;
        pfd.events = POLLIN;

        int rc = ::poll(&pfd, 1, POLL_TIMEOUT_MS);
        if (rc < 0) {
            if (errno == EINTR) {
                continue;
            }
            WatchEvent ev;
            ev.kind = EventKind::Error;
            ev.path = root_;
            ev.message = "poll on inotify descriptor failed: " + errno_message(errno);
            publish(std::move(ev));
            break;
        }
        if (rc == 0 || !(pfd.revents & POLLIN)) {
            continue;
        }

        ssize_t len = ::read(fd_, buffer, sizeof(buffer));
        if (len < 0) {
            if (errno == EAGAIN || errno == EINTR) {
                continue;
            }
            WatchEvent ev;
            ev.kind = EventKind::Error;
            ev.path = root_;
            ev.message = "read on inotify descriptor failed: " + errno_message(errno);
            publish(std::move(ev));
            break;
        }

        for (char* ptr = buffer; ptr < buffer + len;) {
            const auto* event = reinterpret_cast<const struct inotify_event*>(ptr);
            handle_event(event->wd, event->mask, event->len > 0 ? event->name : "");
            ptr += sizeof(struct inotify_event) + event->len;
        }
    }

    running_.store(false);
}

void InotifyWatcher::handle_event(int wd, std::uint32_t mask, const char* name) {
    if (mask & IN_Q_OVERFLOW) {
        WatchEvent ev;
        ev.kind = EventKind::Overflow;
        ev.path = root_;
        publish(std::move(ev));
        return;
    }

    fs::path dir;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = wd_to_path_.find(wd);
        if (it == wd_to_path_.end()) {
            return;
        }
        if (mask & IN_IGNORED) {
            wd_to_path_.erase(it);
            return;
        }
        dir = it->second;
    }

    if (name == nullptr || *name == '\0') {
        return;
    }

    fs::path path = dir / name;
    const bool is_dir = (mask & IN_ISDIR) != 0;

    if (is_dir && (mask & (IN_CREATE | IN_MOVED_TO))) {
        add_watch_recursive(path, true);
        return;
    }

    WatchEvent ev;
    ev.path = std::move(path);
    ev.is_directory = is_dir;

    if (mask & (IN_DELETE | IN_MOVED_FROM)) {
        ev.kind = EventKind::Deleted;
    } else if (mask & (IN_CREATE | IN_MOVED_TO)) {
        ev.kind = EventKind::Created;
    } else if (mask & (IN_CLOSE_WRITE | IN_ATTRIB)) {
        if (is_dir) {
            return;
        }
        ev.kind = EventKind::Modified;
    } else {
        return;
    }

    publish(std::move(ev));
}

}  // namespace turbosort::watch
