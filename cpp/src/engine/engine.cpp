// ==============================================================================
// engine.cpp - Движок идемпотентной доставки
// ==============================================================================

#include "turbosort/engine.hpp"

#include "turbosort/config.hpp"
#include "turbosort/ledger.hpp"
#include "turbosort/output.hpp"
#include "turbosort/platform.hpp"
#include "turbosort/source.hpp"

#include <system_error>

namespace turbosort::engine {

namespace fs = std::filesystem;

DeliveryEngine::DeliveryEngine(const config::Config& cfg, source::SourceProvider& provider,
                               ledger::Ledger& ledger, output::Writer& log)
    : cfg_(cfg),
      resolve_options_(destination::ResolveOptions::from_config(cfg)),
      provider_(provider),
      ledger_(ledger),
      log_(log) {}

// ----------------------------------------------------------------------------
// process_directory
// ----------------------------------------------------------------------------

DirectoryReport DeliveryEngine::process_directory(const std::string& dir) {
    DirectoryReport report;
    ++stats_.directories;

    // 1. Маркер
    source::MarkerRead marker = provider_.read_marker(dir);
    if (marker.status == source::MarkerStatus::Absent) {
        log_.debug("No " + cfg_.marker_name + " file in " + dir);
        return report;
    }
    report.marker_found = true;
    if (marker.status == source::MarkerStatus::Unreadable) {
        log_.warn("Cannot read " + cfg_.marker_name + " in " + dir + ": " + marker.error);
        return report;
    }

    // 2. Директива
    auto directive = destination::parse_marker_directive(marker.content);
    if (!directive) {
        log_.warn("Empty " + cfg_.marker_name + " file in " + dir);
        return report;
    }

    // 3. Назначение
    destination::ResolveResult target = destination::resolve(*directive, resolve_options_);
    for (const auto& w : target.warnings) {
        log_.warn(w);
    }
    if (!target) {
        log_.error("Cannot resolve destination for " + dir + ": " + target.error);
        return report;
    }

    // 4. Директория назначения
    std::error_code ec;
    fs::create_directories(target.target, ec);
    if (ec) {
        log_.error("Cannot create destination directory " +
                   platform::path_to_utf8(target.target) + ": " + ec.message());
        return report;
    }
    report.resolved = true;

    // 5. Кандидаты
    source::Children children = provider_.enumerate_children(dir);
    if (!children.ok) {
        log_.error("Cannot enumerate " + dir + ": " + children.error);
        return report;
    }

    log_.debug("Processing " + dir + " -> " + platform::path_to_utf8(target.target) + " (" +
               std::to_string(children.items.size()) + " candidates)");

    // 6. Копировать или пропустить
    for (const source::SourceItem& item : children.items) {
        if (item.name.empty() || item.name == "." || item.name == "..") {
            log_.error("Refusing to deliver item with invalid name: " + item.key);
            ++report.failed;
            continue;
        }

        source::StatResult stat = provider_.stat_identity(item);
        if (stat.status == source::StatStatus::Vanished) {
            log_.warn("File vanished before processing: " + item.key);
            ++report.vanished;
            continue;
        }
        if (stat.status == source::StatStatus::Failed) {
            log_.error("Cannot read metadata of " + item.key + ": " + stat.error);
            ++report.failed;
            continue;
        }

        auto existing = ledger_.get(item.key);
        if (existing && existing->identity == stat.state.identity && !cfg_.force_recopy) {
            log_.trace("Skipping " + item.key + ": already delivered");
            ++report.skipped;
            continue;
        }

        fs::path dst = target.target / platform::path_from_utf8(item.name);
        source::FetchResult fetched = provider_.fetch(item, dst);
        if (!fetched.ok) {
            log_.error("Error copying " + item.key + ": " + fetched.error);
            ++report.failed;
            continue;
        }
        if (!fetched.warning.empty()) {
            log_.warn(fetched.warning);
        }

        const identity::ItemState& delivered = fetched.observed ? *fetched.observed : stat.state;

        ledger::DeliveryRecord record;
        record.source_key = item.key;
        record.destination_path = platform::path_to_utf8(dst);
        record.identity = delivered.identity;
        record.size_bytes = fetched.size != 0 ? fetched.size : delivered.size;
        record.delivered_at = platform::now_iso8601();
        ledger_.put(std::move(record));

        log_.info("Copied " + item.key + " to " + platform::path_to_utf8(dst));
        ++report.copied;
        stats_.bytes_copied += fetched.size;
    }

    stats_.copied += report.copied;
    stats_.skipped += report.skipped;
    stats_.failed += report.failed;
    stats_.vanished += report.vanished;
    return report;
}

// ----------------------------------------------------------------------------
// reconcile
// ----------------------------------------------------------------------------

std::size_t DeliveryEngine::reconcile() {
    std::size_t removed = ledger_.prune([this](const std::string& key) {
        std::string error;
        switch (provider_.exists(key, error)) {
        case source::Presence::Present:
            return true;
        case source::Presence::Missing:
            return false;
        case source::Presence::Unknown:
            break;
        }
        // Проверка не удалась: запись сохраняется до следующего прохода
        log_.warn("Cannot check source " + key + " (" + error + "), keeping history entry");
        return true;
    });

    if (removed > 0) {
        log_.info("Removed " + std::to_string(removed) + " stale entries from history");
    }
    stats_.pruned += removed;
    return removed;
}

// ----------------------------------------------------------------------------
// full_scan
// ----------------------------------------------------------------------------

ScanReport DeliveryEngine::full_scan() {
    ScanReport scan;
    log_.info("Scanning " + provider_.describe() + " for " + cfg_.marker_name + " files");

    scan.pruned = reconcile();

    source::MarkerDirs dirs = provider_.list_marker_dirs();
    for (const auto& w : dirs.warnings) {
        log_.warn(w);
    }
    if (!dirs.ok) {
        log_.error("Error scanning source: " + dirs.error);
        return scan;
    }
    scan.ok = true;

    for (const std::string& dir : dirs.dirs) {
        if (platform::stop_requested()) {
            log_.info("Stop requested, interrupting scan");
            break;
        }
        DirectoryReport r = process_directory(dir);
        ++scan.directories;
        scan.copied += r.copied;
        scan.skipped += r.skipped;
        scan.failed += r.failed;
        scan.vanished += r.vanished;
    }

    log_.info("Scan complete: " + std::to_string(scan.directories) + " directories, " +
              std::to_string(scan.copied) + " copied, " + std::to_string(scan.skipped) +
              " unchanged, " + std::to_string(scan.failed) + " failed");
    return scan;
}

}  // namespace turbosort::engine
