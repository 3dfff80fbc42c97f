// ==============================================================================
// ledger.cpp - Журнал доставленных файлов
// ==============================================================================
//
// RapidJSON для сериализации; запись через platform::write_file_atomic.
//
// ==============================================================================

#include "turbosort/ledger.hpp"

#include "turbosort/output.hpp"
#include "turbosort/platform.hpp"

#include <algorithm>
#include <fstream>
#include <limits>
#include <rapidjson/document.h>
#include <rapidjson/error/en.h>
#include <rapidjson/prettywriter.h>
#include <rapidjson/stringbuffer.h>
#include <sstream>
#include <system_error>

namespace turbosort::ledger {

namespace {

constexpr const char* FIELD_DESTINATION = "destination";
constexpr const char* FIELD_TIMESTAMP = "timestamp";
constexpr const char* FIELD_SIZE = "size";
constexpr const char* FIELD_IDENTITY = "identity";

/// Разобрать одну запись; текст ошибки или nullopt
std::optional<std::string> parse_record(const std::string& key, const rapidjson::Value& value,
                                        DeliveryRecord& out) {
    if (!value.IsObject()) {
        return "entry '" + key + "' is not an object";
    }

    auto dest = value.FindMember(FIELD_DESTINATION);
    if (dest == value.MemberEnd() || !dest->value.IsString()) {
        return "entry '" + key + "' has no destination";
    }

    out.source_key = key;
    out.destination_path.assign(dest->value.GetString(), dest->value.GetStringLength());

    auto ts = value.FindMember(FIELD_TIMESTAMP);
    if (ts != value.MemberEnd() && ts->value.IsString()) {
        out.delivered_at.assign(ts->value.GetString(), ts->value.GetStringLength());
    }

    auto size = value.FindMember(FIELD_SIZE);
    if (size != value.MemberEnd()) {
        if (size->value.IsUint64()) {
            out.size_bytes = size->value.GetUint64();
        } else if (size->value.IsNumber() && size->value.GetDouble() >= 0 &&
                   size->value.GetDouble() <
                       static_cast<double>(std::numeric_limits<std::uint64_t>::max())) {
            out.size_bytes = static_cast<std::uint64_t>(size->value.GetDouble());
        } else {
            return "entry '" + key + "' has invalid size";
        }
    }

    // Записи старого формата без отпечатка: пустая строка никогда не совпадёт
    // с вычисленным отпечатком, файл будет доставлен повторно один раз
    auto id = value.FindMember(FIELD_IDENTITY);
    if (id != value.MemberEnd() && id->value.IsString()) {
        out.identity.assign(id->value.GetString(), id->value.GetStringLength());
    }

    return std::nullopt;
}

}  // namespace

// ----------------------------------------------------------------------------
// Сериализация
// ----------------------------------------------------------------------------

ParseResult parse_document(const std::string& json) {
    ParseResult result;

    rapidjson::Document doc;
    doc.Parse(json.c_str(), json.size());
    if (doc.HasParseError()) {
        result.error = std::string("JSON parse error: ") +
                       rapidjson::GetParseError_En(doc.GetParseError()) + " at offset " +
                       std::to_string(doc.GetErrorOffset());
        return result;
    }

    if (!doc.IsObject()) {
        result.error = "history document root must be an object";
        return result;
    }

    for (auto it = doc.MemberBegin(); it != doc.MemberEnd(); ++it) {
        std::string key(it->name.GetString(), it->name.GetStringLength());
        DeliveryRecord record;
        if (auto err = parse_record(key, it->value, record)) {
            result.warnings.push_back(*err);
            continue;
        }
        result.records[key] = std::move(record);
    }

    result.ok = true;
    return result;
}

std::string serialize_document(const std::unordered_map<std::string, DeliveryRecord>& records) {
    // Детерминированный порядок ключей
    std::vector<const DeliveryRecord*> sorted;
    sorted.reserve(records.size());
    for (const auto& kv : records) {
        sorted.push_back(&kv.second);
    }
    std::sort(sorted.begin(), sorted.end(), [](const DeliveryRecord* a, const DeliveryRecord* b) {
        return a->source_key < b->source_key;
    });

    rapidjson::StringBuffer buffer;
    rapidjson::PrettyWriter<rapidjson::StringBuffer> writer(buffer);
    writer.SetIndent(' ', 2);

    writer.StartObject();
    for (const DeliveryRecord* r : sorted) {
        writer.Key(r->source_key.c_str(), static_cast<rapidjson::SizeType>(r->source_key.size()));
        writer.StartObject();
        writer.Key(FIELD_DESTINATION);
        writer.String(r->destination_path.c_str(),
                      static_cast<rapidjson::SizeType>(r->destination_path.size()));
        writer.Key(FIELD_TIMESTAMP);
        writer.String(r->delivered_at.c_str(),
                      static_cast<rapidjson::SizeType>(r->delivered_at.size()));
        writer.Key(FIELD_SIZE);
        writer.Uint64(r->size_bytes);
        writer.Key(FIELD_IDENTITY);
        writer.String(r->identity.c_str(), static_cast<rapidjson::SizeType>(r->identity.size()));
        writer.EndObject();
    }
    writer.EndObject();

    std::string out(buffer.GetString(), buffer.GetSize());
    out += '\n';
    return out;
}

// ----------------------------------------------------------------------------
// Ledger
// ----------------------------------------------------------------------------

Ledger::Ledger(std::filesystem::path file, output::Writer& log)
    : file_(std::move(file)), log_(log) {}

void Ledger::load() {
    records_.clear();
    out_of_sync_ = false;

    std::error_code ec;
    if (!std::filesystem::exists(file_, ec)) {
        log_.debug("No history file at " + platform::path_to_utf8(file_) + ", starting empty");
        return;
    }

    std::ifstream in(file_, std::ios::binary);
    if (!in.is_open()) {
        log_.error("Error loading history: cannot open " + platform::path_to_utf8(file_) +
                   ", starting with empty history");
        return;
    }
    std::stringstream buffer;
    buffer << in.rdbuf();

    ParseResult parsed = parse_document(buffer.str());
    if (!parsed.ok) {
        log_.warn("History file " + platform::path_to_utf8(file_) + " is corrupt (" +
                  parsed.error + "), starting with empty history");
        return;
    }
    for (const auto& w : parsed.warnings) {
        log_.warn("Skipping history " + w);
    }

    records_ = std::move(parsed.records);
    log_.info("Loaded history for " + std::to_string(records_.size()) + " files");
}

std::optional<DeliveryRecord> Ledger::get(const std::string& source_key) const {
    auto it = records_.find(source_key);
    if (it == records_.end()) {
        return std::nullopt;
    }
    return it->second;
}

void Ledger::put(DeliveryRecord record) {
    std::string key = record.source_key;
    records_[key] = std::move(record);
    save();
}

bool Ledger::remove(const std::string& source_key) {
    return records_.erase(source_key) > 0;
}

std::size_t Ledger::prune(const ExistenceCheck& exists) {
    std::vector<std::string> stale;
    for (const auto& kv : records_) {
        if (!exists(kv.first)) {
            stale.push_back(kv.first);
        }
    }

    for (const auto& key : stale) {
        log_.debug("Pruning history entry for missing source " + key);
        records_.erase(key);
    }

    if (!stale.empty()) {
        save();
    }
    return stale.size();
}

void Ledger::clear() {
    records_.clear();
    save();
}

bool Ledger::save() {
    std::string error;
    if (!platform::write_file_atomic(file_, serialize_document(records_), error)) {
        log_.error("Error saving history to " + platform::path_to_utf8(file_) + ": " + error +
                   " (in-memory history remains authoritative until the next successful write)");
        out_of_sync_ = true;
        return false;
    }
    if (out_of_sync_) {
        log_.info("History file " + platform::path_to_utf8(file_) + " is back in sync");
        out_of_sync_ = false;
    }
    return true;
}

std::vector<DeliveryRecord> Ledger::records() const {
    std::vector<DeliveryRecord> out;
    out.reserve(records_.size());
    for (const auto& kv : records_) {
        out.push_back(kv.second);
    }
    std::sort(out.begin(), out.end(), [](const DeliveryRecord& a, const DeliveryRecord& b) {
        return a.source_key < b.source_key;
    });
    return out;
}

LedgerStats Ledger::stats() const {
    LedgerStats s;
    s.total_files = records_.size();
    for (const auto& kv : records_) {
        s.total_bytes += kv.second.size_bytes;
    }
    return s;
}

}  // namespace turbosort::ledger
