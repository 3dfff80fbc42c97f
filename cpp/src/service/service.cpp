// ==============================================================================
// service.cpp - Оркестратор сервиса
// ==============================================================================
//
// Все команды собираются из одних и тех же частей:
// Config -> SourceBundle -> Ledger -> DeliveryEngine -> (триггер).
//
// ==============================================================================

#include "turbosort/service.hpp"

#include "turbosort/config.hpp"
#include "turbosort/engine.hpp"
#include "turbosort/output.hpp"
#include "turbosort/platform.hpp"
#include "turbosort/s3.hpp"
#include "turbosort/source.hpp"
#include "turbosort/trigger.hpp"
#include "turbosort/watch.hpp"

#include <rapidjson/document.h>

#include <chrono>
#include <cstdio>
#include <system_error>
#include <thread>

namespace turbosort::service {

namespace fs = std::filesystem;

// ----------------------------------------------------------------------------
// Вспомогательные функции
// ----------------------------------------------------------------------------

namespace {

/// Пауза между попытками перезапуска наблюдателя
constexpr std::chrono::seconds WATCHER_RESTART_DELAY{5};

const std::string RULE(70, '=');
const std::string THIN_RULE(70, '-');

/// Последний компонент пути или ключа объекта
std::string base_name(const std::string& key) {
    auto pos = key.rfind('/');
    if (pos == std::string::npos) {
        return key;
    }
    return key.substr(pos + 1);
}

std::string kilobytes(std::uint64_t bytes) {
    char buf[64];
    std::snprintf(buf, sizeof(buf), "%.2f", static_cast<double>(bytes) / 1024.0);
    return buf;
}

bool ensure_directory(const fs::path& dir, const char* what, output::Writer& log) {
    std::error_code ec;
    fs::create_directories(dir, ec);
    if (ec) {
        log.error(std::string("Cannot create ") + what + " directory " +
                  platform::path_to_utf8(dir) + ": " + ec.message());
        return false;
    }
    return true;
}

/// Подготовить директории источника (локальный режим) и назначения
bool prepare_directories(const config::Config& cfg, output::Writer& log) {
    if (cfg.source_kind == config::SourceKind::Local &&
        !ensure_directory(cfg.source_dir, "source", log)) {
        return false;
    }
    return ensure_directory(cfg.dest_dir, "destination", log);
}

void log_startup(const config::Config& cfg, const source::SourceProvider& provider,
                 output::Writer& log) {
    log.info(std::string("Source (") + config::source_kind_to_string(cfg.source_kind) +
             "): " + provider.describe());
    log.info("Destination: " + platform::path_to_utf8(cfg.dest_dir));
    log.info("History file: " + platform::path_to_utf8(cfg.history_file));
    log.info("Marker file name: " + cfg.marker_name);
    if (cfg.year_prefix) {
        log.info("Year prefix enabled");
    }
    if (cfg.drive_suffix) {
        log.info("Drive suffix enabled: " + cfg.drive_suffix_name);
    }
    if (cfg.force_recopy) {
        log.warn("FORCE_RECOPY is enabled: files are copied again on every pass");
    }
}

void log_scan_report(const engine::ScanReport& report, output::Writer& log) {
    log.debug("Directories: " + std::to_string(report.directories) +
              ", copied: " + std::to_string(report.copied) +
              ", skipped: " + std::to_string(report.skipped) +
              ", failed: " + std::to_string(report.failed));
}

/// Таймер периодической статистики
class StatsTimer {
public:
    StatsTimer(std::uint32_t interval, trigger::Clock::time_point now)
        : interval_(interval), next_(now + std::chrono::seconds(interval)) {}

    void tick(trigger::Clock::time_point now, const ledger::Ledger& ledger,
              output::Writer& log) {
        if (interval_ == 0 || now < next_) {
            return;
        }
        print_stats(ledger, log);
        next_ = now + std::chrono::seconds(interval_);
    }

private:
    std::uint32_t interval_;
    trigger::Clock::time_point next_;
};

// ----------------------------------------------------------------------------
// Циклы событий
// ----------------------------------------------------------------------------

int run_local(const config::Config& cfg, const source::LocalSource& local,
              engine::DeliveryEngine& engine, ledger::Ledger& ledger, output::Writer& log) {
    watch::Channel<watch::WatchEvent> events;
    watch::InotifyWatcher watcher(local.root(), events);

    std::string error;
    if (!watcher.start(error)) {
        log.error("Cannot watch " + platform::path_to_utf8(local.root()) + ": " + error);
        return 1;
    }
    log.debug("Watching " + std::to_string(watcher.watch_count()) + " directories");

    auto now = trigger::Clock::now();
    trigger::LocalTrigger trig(cfg, local.root(), engine, log, now);
    StatsTimer stats(cfg.stats_interval, now);
    auto next_restart = now;

    log.info("TurboSort running. Press Ctrl+C to stop.");

    const auto slice = std::chrono::milliseconds(cfg.drain_interval_ms);
    while (!platform::stop_requested()) {
        if (auto ev = events.pop_for(slice)) {
            trig.on_event(*ev);
            while (auto more = events.try_pop()) {
                trig.on_event(*more);
            }
        }

        now = trigger::Clock::now();
        trig.tick(now);
        stats.tick(now, ledger, log);

        // Наблюдатель остановился после ошибки чтения
        if (!watcher.running() && now >= next_restart && !platform::stop_requested()) {
            next_restart = now + WATCHER_RESTART_DELAY;
            log.warn("File watcher stopped, restarting");
            if (watcher.start(error)) {
                // События за время простоя потеряны
                engine.full_scan();
            } else {
                log.error("Cannot restart file watcher: " + error);
            }
        }
    }

    watcher.stop();
    return 0;
}

int run_remote(const config::Config& cfg, trigger::RemoteTrigger& trig, ledger::Ledger& ledger,
               output::Writer& log) {
    StatsTimer stats(cfg.stats_interval, trigger::Clock::now());

    log.info("TurboSort running. Press Ctrl+C to stop.");

    const auto slice = std::chrono::milliseconds(cfg.drain_interval_ms);
    while (!platform::stop_requested()) {
        std::this_thread::sleep_for(slice);
        if (platform::stop_requested()) {
            break;
        }
        auto now = trigger::Clock::now();
        trig.tick(now);
        stats.tick(now, ledger, log);
    }
    return 0;
}

}  // anonymous namespace

// ----------------------------------------------------------------------------
// Источник
// ----------------------------------------------------------------------------

SourceBundle make_source(const config::Config& cfg) {
    SourceBundle bundle;
    if (cfg.source_kind == config::SourceKind::S3) {
        bundle.store = std::make_unique<s3::CurlObjectStore>(cfg.s3);
        auto remote =
            std::make_unique<source::RemoteSource>(*bundle.store, cfg.s3.prefix, cfg.marker_name);
        bundle.remote_prefix = remote->prefix();
        bundle.provider = std::move(remote);
    } else {
        bundle.provider = std::make_unique<source::LocalSource>(cfg.source_dir, cfg.marker_name);
    }
    return bundle;
}

// ----------------------------------------------------------------------------
// Статистика и журнал
// ----------------------------------------------------------------------------

void print_stats(const ledger::Ledger& ledger, output::Writer& log) {
    ledger::LedgerStats stats = ledger.stats();
    if (stats.total_files == 0) {
        return;
    }
    log.info("=== TurboSort Copy Statistics ===");
    log.info("Total files copied: " + std::to_string(stats.total_files));
    log.info("Total size: " + output::format_megabytes(stats.total_bytes) + " MB");
    log.info("===============================");
}

std::string render_history(const ledger::Ledger& ledger, bool detailed) {
    std::vector<ledger::DeliveryRecord> records = ledger.records();
    if (records.empty()) {
        return "No files have been copied yet.\n";
    }

    std::string out;
    out += "\n" + RULE + "\n";
    out += "TurboSort Copy History - " + std::to_string(records.size()) + " files\n";
    out += RULE + "\n";

    std::uint64_t total = 0;
    if (detailed) {
        for (const auto& r : records) {
            out += "\nSource:      " + r.source_key + "\n";
            out += "Destination: " + r.destination_path + "\n";
            out += "Timestamp:   " + r.delivered_at + "\n";
            out += "Size:        " + std::to_string(r.size_bytes) + " bytes (" +
                   kilobytes(r.size_bytes) + " KB)\n";
            out += "Identity:    " + (r.identity.empty() ? std::string("-") : r.identity) + "\n";
            out += THIN_RULE + "\n";
            total += r.size_bytes;
        }
    } else {
        output::Table table;
        table.set_headers({"Source", "Destination", "Size (KB)"});
        table.set_max_width(0, 40);
        table.set_max_width(1, 40);
        for (const auto& r : records) {
            table.add_row({base_name(r.source_key), base_name(r.destination_path),
                           kilobytes(r.size_bytes)});
            total += r.size_bytes;
        }
        out += table.to_string();
    }

    out += "\nTotal: " + std::to_string(records.size()) + " files, " +
           output::format_megabytes(total) + " MB\n";
    out += RULE + "\n";
    return out;
}

// ----------------------------------------------------------------------------
// Команды
// ----------------------------------------------------------------------------

int run(const config::Config& cfg, output::Writer& log) {
    if (!prepare_directories(cfg, log)) {
        return 1;
    }

    SourceBundle bundle = make_source(cfg);
    log_startup(cfg, *bundle.provider, log);

    ledger::Ledger ledger(cfg.history_file, log);
    ledger.load();

    platform::install_stop_handlers();

    engine::DeliveryEngine engine(cfg, *bundle.provider, ledger, log);

    int rc = 0;
    if (cfg.source_kind == config::SourceKind::S3) {
        // Листинг запоминается до прохода: объекты, появившиеся во время
        // прохода, попадут в первый опрос
        trigger::RemoteTrigger trig(cfg, *bundle.store, bundle.remote_prefix, engine, log,
                                    trigger::Clock::now());
        trig.prime();
        log_scan_report(engine.full_scan(), log);
        print_stats(ledger, log);
        rc = run_remote(cfg, trig, ledger, log);
    } else {
        log_scan_report(engine.full_scan(), log);
        print_stats(ledger, log);
        auto* local = static_cast<source::LocalSource*>(bundle.provider.get());
        rc = run_local(cfg, *local, engine, ledger, log);
    }

    log.info("Stopping TurboSort...");
    log.info("Final statistics:");
    print_stats(ledger, log);
    return rc;
}

int scan(const config::Config& cfg, output::Writer& log) {
    if (!prepare_directories(cfg, log)) {
        return 1;
    }

    SourceBundle bundle = make_source(cfg);
    log_startup(cfg, *bundle.provider, log);

    ledger::Ledger ledger(cfg.history_file, log);
    ledger.load();

    engine::DeliveryEngine engine(cfg, *bundle.provider, ledger, log);
    engine::ScanReport report = engine.full_scan();
    log_scan_report(report, log);
    print_stats(ledger, log);

    if (!report.ok || report.failed > 0 || ledger.out_of_sync()) {
        return 1;
    }
    return 0;
}

int history(const config::Config& cfg, output::Writer& log, bool detailed, bool json) {
    ledger::Ledger ledger(cfg.history_file, log);
    ledger.load();

    if (json) {
        rapidjson::Document doc(rapidjson::kObjectType);
        auto& alloc = doc.GetAllocator();
        for (const auto& r : ledger.records()) {
            rapidjson::Value entry(rapidjson::kObjectType);
            entry.AddMember("destination", rapidjson::Value(r.destination_path.c_str(), alloc),
                            alloc);
            entry.AddMember("identity", rapidjson::Value(r.identity.c_str(), alloc), alloc);
            entry.AddMember("size", rapidjson::Value(static_cast<uint64_t>(r.size_bytes)), alloc);
            entry.AddMember("timestamp", rapidjson::Value(r.delivered_at.c_str(), alloc), alloc);
            doc.AddMember(rapidjson::Value(r.source_key.c_str(), alloc), entry, alloc);
        }
        log.write_json_pretty(doc);
        return 0;
    }

    log.write(output::Stream::Stdout, render_history(ledger, detailed));
    return 0;
}

int clear_history(const config::Config& cfg, output::Writer& log) {
    ledger::Ledger ledger(cfg.history_file, log);
    ledger.load();

    std::size_t removed = ledger.size();
    ledger.clear();
    if (ledger.out_of_sync()) {
        log.error("History was cleared in memory but could not be written to " +
                  platform::path_to_utf8(ledger.file()));
        return 1;
    }
    log.info("Cleared " + std::to_string(removed) + " history entries");
    return 0;
}

}  // namespace turbosort::service
