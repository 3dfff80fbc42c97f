// ==============================================================================
// test_engine_gtest.cpp - Тесты движка доставки (GoogleTest)
// ==============================================================================
//
// Локальный источник на временной директории и удалённый источник
// на FakeObjectStore.
//
// ==============================================================================

#include "turbosort/config.hpp"
#include "turbosort/engine.hpp"
#include "turbosort/ledger.hpp"
#include "turbosort/output.hpp"
#include "turbosort/platform.hpp"
#include "turbosort/source.hpp"

#include "fake_object_store.hpp"
#include "test_support.hpp"

#include <chrono>
#include <gtest/gtest.h>
#include <memory>
#include <string>

namespace turbosort::engine::test {

namespace fs = std::filesystem;

// ==============================================================================
// Test Fixture: источник, назначение и журнал во временной директории
// ==============================================================================

class EngineTest : public turbosort::test::TempDirTest {
protected:
    config::Config cfg_;
    output::OutputConfig out_cfg_;
    std::unique_ptr<output::Writer> log_;
    fs::path src_;
    fs::path dest_;

    void SetUp() override {
        TempDirTest::SetUp();
        platform::reset_stop();

        src_ = test_dir_ / "source";
        dest_ = test_dir_ / "dest";
        fs::create_directories(src_);

        cfg_.source_dir = src_;
        cfg_.dest_dir = dest_;
        cfg_.history_file = test_dir_ / "history.json";
        cfg_.drive_suffix = false;
        cfg_.year_prefix = false;

        out_cfg_.quiet = true;
        log_ = std::make_unique<output::Writer>(out_cfg_);
    }

    // Директория с маркером и n файлами file<i>.txt
    void make_drop(const std::string& dir, const std::string& directive, int files) {
        write_file(src_ / dir / ".turbosort", directive + "\n");
        for (int i = 0; i < files; ++i) {
            write_file(src_ / dir / ("file" + std::to_string(i) + ".txt"),
                       "content " + std::to_string(i));
        }
    }
};

// ==============================================================================
// Полный цикл: доставка, повтор, очистка, принудительное копирование
// ==============================================================================

TEST_F(EngineTest, FullLifecycle_CopySkipPruneForce) {
    // Arrange
    make_drop("drop", "clients/acme", 10);
    source::LocalSource provider(src_, cfg_.marker_name);
    ledger::Ledger ledger(cfg_.history_file, *log_);
    DeliveryEngine engine(cfg_, provider, ledger, *log_);

    // Act 1: первый проход копирует всё
    ScanReport first = engine.full_scan();

    // Assert 1
    ASSERT_TRUE(first.ok);
    EXPECT_EQ(first.directories, 1u);
    EXPECT_EQ(first.copied, 10u);
    EXPECT_EQ(ledger.size(), 10u);
    EXPECT_EQ(read_file(dest_ / "clients" / "acme" / "file3.txt"), "content 3");

    // Act 2: повторный проход ничего не копирует
    ScanReport second = engine.full_scan();
    EXPECT_EQ(second.copied, 0u);
    EXPECT_EQ(second.skipped, 10u);

    // Act 3: удалены три исходных файла
    for (int i = 0; i < 3; ++i) {
        fs::remove(src_ / "drop" / ("file" + std::to_string(i) + ".txt"));
    }
    std::size_t pruned = engine.reconcile();
    EXPECT_EQ(pruned, 3u);
    EXPECT_EQ(ledger.size(), 7u);

    // Act 4: принудительное копирование оставшихся
    cfg_.force_recopy = true;
    ScanReport forced = engine.full_scan();
    EXPECT_EQ(forced.copied, 7u);
    EXPECT_EQ(forced.skipped, 0u);

    // Копии на месте назначения не удаляются вместе с источником
    EXPECT_TRUE(fs::exists(dest_ / "clients" / "acme" / "file0.txt"));
}

TEST_F(EngineTest, RecreatedFile_AfterPrune_IsCopiedAgain) {
    // Arrange
    make_drop("drop", "out", 1);
    fs::path file = src_ / "drop" / "file0.txt";
    source::LocalSource provider(src_, cfg_.marker_name);
    ledger::Ledger ledger(cfg_.history_file, *log_);
    DeliveryEngine engine(cfg_, provider, ledger, *log_);
    ASSERT_EQ(engine.full_scan().copied, 1u);
    auto original_mtime = fs::last_write_time(file);

    // Act 1: исходный файл удалён, запись журнала очищена
    fs::remove(file);
    EXPECT_EQ(engine.reconcile(), 1u);
    EXPECT_FALSE(ledger.get(file.string()).has_value());

    // Act 2: тот же файл с тем же содержимым и временем изменения
    write_file(file, "content 0");
    fs::last_write_time(file, original_mtime);
    ScanReport report = engine.full_scan();

    // Assert
    EXPECT_EQ(report.copied, 1u);
    EXPECT_TRUE(ledger.get(file.string()).has_value());
}

TEST_F(EngineTest, RelativeDestination_RecordsAbsolutePath) {
    // Arrange: относительный DEST_DIR от рабочей директории теста
    make_drop("drop", "out", 1);
    fs::path saved_cwd = fs::current_path();
    fs::current_path(test_dir_);
    fs::path work_dir = fs::current_path();
    cfg_.dest_dir = "dest";
    source::LocalSource provider(src_, cfg_.marker_name);
    ledger::Ledger ledger(cfg_.history_file, *log_);

    // Act
    ScanReport report;
    {
        DeliveryEngine engine(cfg_, provider, ledger, *log_);
        report = engine.full_scan();
    }
    fs::current_path(saved_cwd);

    // Assert
    EXPECT_EQ(report.copied, 1u);
    auto rec = ledger.get((src_ / "drop" / "file0.txt").string());
    ASSERT_TRUE(rec.has_value());
    fs::path recorded(rec->destination_path);
    EXPECT_TRUE(recorded.is_absolute());
    EXPECT_EQ(recorded, (work_dir / "dest" / "out" / "file0.txt").lexically_normal());
    EXPECT_EQ(read_file(recorded), "content 0");
}

TEST_F(EngineTest, History_PersistsAcrossRestart) {
    make_drop("drop", "x", 2);
    source::LocalSource provider(src_, cfg_.marker_name);
    {
        ledger::Ledger ledger(cfg_.history_file, *log_);
        DeliveryEngine engine(cfg_, provider, ledger, *log_);
        engine.full_scan();
    }

    ledger::Ledger reloaded(cfg_.history_file, *log_);
    reloaded.load();
    DeliveryEngine engine(cfg_, provider, reloaded, *log_);
    ScanReport report = engine.full_scan();

    EXPECT_EQ(report.copied, 0u);
    EXPECT_EQ(report.skipped, 2u);
}

// ==============================================================================
// Обнаружение изменений
// ==============================================================================

TEST_F(EngineTest, ModifiedFile_IsCopiedAgain) {
    // Arrange
    make_drop("drop", "out", 1);
    source::LocalSource provider(src_, cfg_.marker_name);
    ledger::Ledger ledger(cfg_.history_file, *log_);
    DeliveryEngine engine(cfg_, provider, ledger, *log_);
    engine.full_scan();

    fs::path file = src_ / "drop" / "file0.txt";
    write_file(file, "updated content");
    fs::last_write_time(file, fs::last_write_time(file) + std::chrono::seconds(5));

    // Act
    DirectoryReport report = engine.process_directory((src_ / "drop").string());

    // Assert
    EXPECT_EQ(report.copied, 1u);
    EXPECT_EQ(read_file(dest_ / "out" / "file0.txt"), "updated content");
    EXPECT_EQ(ledger.get(file.string())->size_bytes, std::string("updated content").size());
}

TEST_F(EngineTest, SameNameInDifferentDirectories_AreDistinctEntries) {
    make_drop("a", "team/a", 1);
    make_drop("b", "team/b", 1);
    source::LocalSource provider(src_, cfg_.marker_name);
    ledger::Ledger ledger(cfg_.history_file, *log_);
    DeliveryEngine engine(cfg_, provider, ledger, *log_);

    ScanReport report = engine.full_scan();

    EXPECT_EQ(report.copied, 2u);
    EXPECT_EQ(ledger.size(), 2u);
    EXPECT_TRUE(fs::exists(dest_ / "team" / "a" / "file0.txt"));
    EXPECT_TRUE(fs::exists(dest_ / "team" / "b" / "file0.txt"));
}

TEST_F(EngineTest, LegacyRecordWithoutIdentity_IsCopiedOnce) {
    make_drop("drop", "out", 1);
    std::string key = (src_ / "drop" / "file0.txt").string();
    source::LocalSource provider(src_, cfg_.marker_name);
    ledger::Ledger ledger(cfg_.history_file, *log_);
    ledger::DeliveryRecord legacy;
    legacy.source_key = key;
    legacy.destination_path = "/old/place";
    ledger.put(legacy);
    DeliveryEngine engine(cfg_, provider, ledger, *log_);

    EXPECT_EQ(engine.full_scan().copied, 1u);
    EXPECT_EQ(engine.full_scan().copied, 0u);
}

// ==============================================================================
// Маркеры и назначение
// ==============================================================================

TEST_F(EngineTest, DestinationTransforms_YearAndSuffix) {
    cfg_.year_prefix = true;
    cfg_.drive_suffix = true;
    cfg_.drive_suffix_name = "incoming";
    make_drop("drop", "reports/2024/q1", 1);
    source::LocalSource provider(src_, cfg_.marker_name);
    ledger::Ledger ledger(cfg_.history_file, *log_);
    DeliveryEngine engine(cfg_, provider, ledger, *log_);

    engine.full_scan();

    EXPECT_TRUE(fs::exists(dest_ / "2024" / "reports" / "2024" / "q1" / "incoming" / "file0.txt"));
}

TEST_F(EngineTest, EmptyMarker_SkipsDirectoryWithWarning) {
    write_file(src_ / "drop" / ".turbosort", "   \n");
    write_file(src_ / "drop" / "f.txt", "x");
    source::LocalSource provider(src_, cfg_.marker_name);
    ledger::Ledger ledger(cfg_.history_file, *log_);
    DeliveryEngine engine(cfg_, provider, ledger, *log_);

    DirectoryReport report = engine.process_directory((src_ / "drop").string());

    EXPECT_TRUE(report.marker_found);
    EXPECT_FALSE(report.resolved);
    EXPECT_EQ(report.copied, 0u);
    EXPECT_GE(log_->warning_count(), 1u);
    EXPECT_TRUE(ledger.empty());
}

TEST_F(EngineTest, EscapingMarker_IsRejected) {
    make_drop("drop", "../../outside", 1);
    source::LocalSource provider(src_, cfg_.marker_name);
    ledger::Ledger ledger(cfg_.history_file, *log_);
    DeliveryEngine engine(cfg_, provider, ledger, *log_);

    DirectoryReport report = engine.process_directory((src_ / "drop").string());

    EXPECT_FALSE(report.resolved);
    EXPECT_FALSE(fs::exists(test_dir_ / "outside"));
    EXPECT_GE(log_->error_count(), 1u);
}

TEST_F(EngineTest, DirectoryWithoutMarker_IsIgnored) {
    write_file(src_ / "plain" / "f.txt", "x");
    source::LocalSource provider(src_, cfg_.marker_name);
    ledger::Ledger ledger(cfg_.history_file, *log_);
    DeliveryEngine engine(cfg_, provider, ledger, *log_);

    DirectoryReport report = engine.process_directory((src_ / "plain").string());

    EXPECT_FALSE(report.marker_found);
    EXPECT_EQ(engine.full_scan().directories, 0u);
}

TEST_F(EngineTest, MarkerFileItself_IsNeverDelivered) {
    make_drop("drop", "out", 1);
    source::LocalSource provider(src_, cfg_.marker_name);
    ledger::Ledger ledger(cfg_.history_file, *log_);
    DeliveryEngine engine(cfg_, provider, ledger, *log_);

    engine.full_scan();

    EXPECT_FALSE(fs::exists(dest_ / "out" / ".turbosort"));
}

TEST_F(EngineTest, StopRequested_InterruptsScan) {
    make_drop("a", "x", 1);
    make_drop("b", "y", 1);
    source::LocalSource provider(src_, cfg_.marker_name);
    ledger::Ledger ledger(cfg_.history_file, *log_);
    DeliveryEngine engine(cfg_, provider, ledger, *log_);

    platform::request_stop();
    ScanReport report = engine.full_scan();
    platform::reset_stop();

    EXPECT_TRUE(report.ok);
    EXPECT_EQ(report.directories, 0u);
}

TEST_F(EngineTest, Stats_AccumulateAcrossCalls) {
    make_drop("drop", "out", 3);
    source::LocalSource provider(src_, cfg_.marker_name);
    ledger::Ledger ledger(cfg_.history_file, *log_);
    DeliveryEngine engine(cfg_, provider, ledger, *log_);

    engine.full_scan();
    engine.full_scan();

    EXPECT_EQ(engine.stats().copied, 3u);
    EXPECT_EQ(engine.stats().skipped, 3u);
    EXPECT_EQ(engine.stats().bytes_copied, 3u * std::string("content 0").size());
}

// ==============================================================================
// Удалённый источник
// ==============================================================================

class RemoteEngineTest : public EngineTest {
protected:
    turbosort::test::FakeObjectStore store_;
};

TEST_F(RemoteEngineTest, Remote_CopySkipAndChange) {
    // Arrange
    store_.put("drop/a/.turbosort", "clients/acme");
    store_.put("drop/a/one.txt", "1");
    store_.put("drop/a/two.txt", "22");
    source::RemoteSource provider(store_, "drop", cfg_.marker_name);
    ledger::Ledger ledger(cfg_.history_file, *log_);
    DeliveryEngine engine(cfg_, provider, ledger, *log_);

    // Act + Assert: первый проход
    ScanReport first = engine.full_scan();
    ASSERT_TRUE(first.ok);
    EXPECT_EQ(first.copied, 2u);
    EXPECT_EQ(read_file(dest_ / "clients" / "acme" / "two.txt"), "22");
    EXPECT_EQ(ledger.get("drop/a/two.txt")->size_bytes, 2u);

    // Повтор без изменений
    EXPECT_EQ(engine.full_scan().copied, 0u);

    // Перезапись объекта меняет ETag
    store_.put("drop/a/one.txt", "one");
    ScanReport third = engine.full_scan();
    EXPECT_EQ(third.copied, 1u);
    EXPECT_EQ(read_file(dest_ / "clients" / "acme" / "one.txt"), "one");
}

TEST_F(RemoteEngineTest, Remote_RecreatedObject_AfterPrune_IsCopiedAgain) {
    // Arrange
    store_.put("drop/a/.turbosort", "out");
    store_.put("drop/a/f.txt", "x");
    std::string etag = store_.etag_of("drop/a/f.txt");
    source::RemoteSource provider(store_, "drop/", cfg_.marker_name);
    ledger::Ledger ledger(cfg_.history_file, *log_);
    DeliveryEngine engine(cfg_, provider, ledger, *log_);
    ASSERT_EQ(engine.full_scan().copied, 1u);

    // Act 1: объект удалён, запись журнала очищена
    store_.erase("drop/a/f.txt");
    EXPECT_EQ(engine.reconcile(), 1u);

    // Act 2: тот же ключ с тем же ETag
    store_.put_with_etag("drop/a/f.txt", "x", etag);
    ScanReport report = engine.full_scan();

    // Assert
    EXPECT_EQ(report.copied, 1u);
    EXPECT_TRUE(ledger.get("drop/a/f.txt").has_value());
}

TEST_F(RemoteEngineTest, Remote_FailedDownload_IsRetriedNextPass) {
    store_.put("drop/a/.turbosort", "out");
    store_.put("drop/a/f.txt", "x");
    store_.fail_get.insert("drop/a/f.txt");
    source::RemoteSource provider(store_, "drop/", cfg_.marker_name);
    ledger::Ledger ledger(cfg_.history_file, *log_);
    DeliveryEngine engine(cfg_, provider, ledger, *log_);

    ScanReport failed = engine.full_scan();
    EXPECT_EQ(failed.failed, 1u);
    EXPECT_TRUE(ledger.empty());

    store_.fail_get.clear();
    EXPECT_EQ(engine.full_scan().copied, 1u);
}

TEST_F(RemoteEngineTest, Remote_Reconcile_KeepsEntriesWhenHeadFails) {
    store_.put("drop/a/.turbosort", "out");
    store_.put("drop/a/f.txt", "x");
    store_.put("drop/a/g.txt", "y");
    source::RemoteSource provider(store_, "drop/", cfg_.marker_name);
    ledger::Ledger ledger(cfg_.history_file, *log_);
    DeliveryEngine engine(cfg_, provider, ledger, *log_);
    engine.full_scan();
    store_.erase("drop/a/f.txt");

    store_.fail_head = true;
    EXPECT_EQ(engine.reconcile(), 0u);
    EXPECT_EQ(ledger.size(), 2u);

    store_.fail_head = false;
    EXPECT_EQ(engine.reconcile(), 1u);
    EXPECT_FALSE(ledger.get("drop/a/f.txt").has_value());
}

TEST_F(RemoteEngineTest, Remote_ListingFailure_ScanNotOk) {
    store_.fail_list = true;
    source::RemoteSource provider(store_, "drop/", cfg_.marker_name);
    ledger::Ledger ledger(cfg_.history_file, *log_);
    DeliveryEngine engine(cfg_, provider, ledger, *log_);

    ScanReport report = engine.full_scan();

    EXPECT_FALSE(report.ok);
    EXPECT_GE(log_->error_count(), 1u);
}

}  // namespace turbosort::engine::test
