// ==============================================================================
// trigger.cpp - Стратегии запуска обработки
// ==============================================================================

#include "turbosort/trigger.hpp"

#include "turbosort/config.hpp"
#include "turbosort/engine.hpp"
#include "turbosort/output.hpp"
#include "turbosort/platform.hpp"
#include "turbosort/s3.hpp"
#include "turbosort/source.hpp"
#include "turbosort/watch.hpp"

#include <system_error>

namespace turbosort::trigger {

namespace fs = std::filesystem;

// ============================================================================
// LocalTrigger
// ============================================================================

LocalTrigger::LocalTrigger(const config::Config& cfg, fs::path root,
                           engine::DeliveryEngine& engine, output::Writer& log,
                           Clock::time_point now)
    : cfg_(cfg),
      root_(std::move(root)),
      engine_(engine),
      log_(log),
      last_drain_(now),
      last_rescan_(now) {}

bool LocalTrigger::inside_root(const fs::path& p) const {
    fs::path rel = p.lexically_normal().lexically_relative(root_);
    return !rel.empty() && *rel.begin() != "..";
}

bool LocalTrigger::is_marker(const fs::path& p) const {
    return p.filename() == cfg_.marker_name;
}

void LocalTrigger::enqueue(const fs::path& dir) {
    std::string key = source::LocalSource::dir_key(dir);
    if (pending_.insert(key).second) {
        log_.debug("Queued " + key + " for processing");
    }
}

std::optional<fs::path> LocalTrigger::find_marker_dir(const fs::path& start) const {
    fs::path current = start.lexically_normal();
    while (inside_root(current)) {
        std::error_code ec;
        if (fs::is_regular_file(current / cfg_.marker_name, ec)) {
            return current;
        }
        if (current == root_ || !current.has_parent_path()) {
            break;
        }
        current = current.parent_path();
    }
    return std::nullopt;
}

void LocalTrigger::on_event(const watch::WatchEvent& event) {
    switch (event.kind) {
    case watch::EventKind::Error:
        log_.warn("File watcher: " + event.message);
        return;
    case watch::EventKind::Overflow:
        log_.warn("File event queue overflowed, scheduling a full scan");
        rescan_requested_ = true;
        return;
    default:
        break;
    }

    if (!inside_root(event.path)) {
        return;
    }

    log_.trace(std::string("Event ") + watch::event_kind_to_string(event.kind) + ": " +
               platform::path_to_utf8(event.path));

    // Новая директория могла появиться уже с маркером и файлами
    if (event.is_directory) {
        if (event.kind == watch::EventKind::Created) {
            std::error_code ec;
            if (fs::is_regular_file(event.path / cfg_.marker_name, ec)) {
                enqueue(event.path);
            }
        }
        return;
    }

    const fs::path dir = event.path.parent_path();

    if (is_marker(event.path)) {
        if (event.kind == watch::EventKind::Deleted) {
            log_.info("Marker file deleted in " + platform::path_to_utf8(dir));
            return;
        }
        // Изменение маркера - немедленная обработка
        std::string key = source::LocalSource::dir_key(dir);
        log_.info("Marker file changed in " + key + ", processing");
        pending_.erase(key);
        engine_.process_directory(key);
        return;
    }

    if (event.kind == watch::EventKind::Deleted) {
        return;
    }

    if (auto marker_dir = find_marker_dir(dir)) {
        enqueue(*marker_dir);
    }
}

std::size_t LocalTrigger::drain(Clock::time_point now) {
    if (pending_.empty()) {
        return 0;
    }
    if (now - last_drain_ < std::chrono::seconds(cfg_.debounce_seconds)) {
        return 0;
    }

    std::set<std::string> batch;
    batch.swap(pending_);
    last_drain_ = now;

    log_.debug("Processing " + std::to_string(batch.size()) + " queued directories");
    for (const std::string& dir : batch) {
        engine_.process_directory(dir);
    }
    return batch.size();
}

bool LocalTrigger::rescan_if_due(Clock::time_point now) {
    const bool timer_due = cfg_.local_rescan_interval > 0 &&
                           now - last_rescan_ >= std::chrono::seconds(cfg_.local_rescan_interval);
    if (!timer_due && !rescan_requested_) {
        return false;
    }

    log_.info("Running periodic full scan");
    engine_.full_scan();
    // Полный проход покрывает все директории из очереди
    pending_.clear();
    last_rescan_ = now;
    rescan_requested_ = false;
    return true;
}

void LocalTrigger::tick(Clock::time_point now) {
    drain(now);
    rescan_if_due(now);
}

// ============================================================================
// Листинги
// ============================================================================

Listing make_listing(const std::vector<s3::ObjectInfo>& objects) {
    Listing listing;
    for (const auto& obj : objects) {
        ListingEntry entry;
        entry.size = obj.size;
        entry.etag = obj.etag;
        listing[obj.key] = std::move(entry);
    }
    return listing;
}

ListingDiff diff_listings(const Listing& before, const Listing& after) {
    ListingDiff diff;

    for (const auto& kv : after) {
        auto it = before.find(kv.first);
        if (it == before.end()) {
            diff.added.push_back(kv.first);
        } else if (it->second.etag != kv.second.etag) {
            diff.modified.push_back(kv.first);
        }
    }
    for (const auto& kv : before) {
        if (after.find(kv.first) == after.end()) {
            diff.removed.push_back(kv.first);
        }
    }
    return diff;
}

// ============================================================================
// RemoteTrigger
// ============================================================================

RemoteTrigger::RemoteTrigger(const config::Config& cfg, s3::ObjectStore& store, std::string prefix,
                             engine::DeliveryEngine& engine, output::Writer& log,
                             Clock::time_point now)
    : cfg_(cfg),
      store_(store),
      prefix_(std::move(prefix)),
      engine_(engine),
      log_(log),
      next_poll_(now + std::chrono::seconds(cfg.s3_poll_interval)),
      next_rescan_(now + std::chrono::seconds(cfg.s3_rescan_interval)) {}

bool RemoteTrigger::prime() {
    s3::ListResult listing = store_.list(prefix_);
    if (!listing.ok) {
        log_.warn("Cannot fetch initial remote listing: " + listing.error.message);
        return false;
    }
    last_listing_ = make_listing(listing.objects);
    log_.debug("Remote listing holds " + std::to_string(last_listing_.size()) + " objects");
    return true;
}

PollReport RemoteTrigger::poll() {
    PollReport report;

    s3::ListResult listing = store_.list(prefix_);
    if (!listing.ok) {
        log_.error("Error listing remote source: " + listing.error.message +
                   " (keeping previous listing)");
        return report;
    }
    report.ok = true;

    Listing current = make_listing(listing.objects);
    report.diff = diff_listings(last_listing_, current);

    if (!report.diff.empty()) {
        log_.info("Remote changes: " + std::to_string(report.diff.added.size()) + " new, " +
                  std::to_string(report.diff.modified.size()) + " modified, " +
                  std::to_string(report.diff.removed.size()) + " deleted");
    }

    // Каждый родительский префикс обрабатывается один раз
    std::set<std::string> parents;
    for (const auto& key : report.diff.added) {
        parents.insert(source::parent_prefix(key));
    }
    for (const auto& key : report.diff.modified) {
        parents.insert(source::parent_prefix(key));
    }

    for (const std::string& dir : parents) {
        engine_.process_directory(dir);
        ++report.directories;
    }

    last_listing_ = std::move(current);
    return report;
}

void RemoteTrigger::full_rescan() {
    log_.info("Running periodic full scan of " + store_.describe());
    engine_.full_scan();
}

void RemoteTrigger::tick(Clock::time_point now) {
    if (now >= next_poll_) {
        poll();
        next_poll_ = now + std::chrono::seconds(cfg_.s3_poll_interval);
    }
    if (cfg_.s3_rescan_interval > 0 && now >= next_rescan_) {
        full_rescan();
        next_rescan_ = now + std::chrono::seconds(cfg_.s3_rescan_interval);
    }
}

}  // namespace turbosort::trigger
