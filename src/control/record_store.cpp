#include "xferq/control/record_store.h"
#include "xferq/base/logger.h"
#include <nlohmann/json.hpp>
#include <filesystem>
#include <fstream>
#include <system_error>

namespace xferq {

namespace {

nlohmann::json to_json(const TransferRecord& record) {
    return nlohmann::json{
        {"key", record.key},
        {"task_id", record.task_id},
        {"kind", record.kind == TransferKind::download ? "download" : "upload"},
        {"url", record.url},
        {"local_path", record.local_path},
        {"status", to_string(record.status)},
        {"expected_size", record.expected_size},
        {"progress", record.progress},
        {"updated_at", std::chrono::duration_cast<std::chrono::milliseconds>(
                           record.updated_at.time_since_epoch()).count()},
    };
}

TransferRecord from_json(const nlohmann::json& j) {
    TransferRecord record;
    record.key = j.at("key").get<std::string>();
    record.task_id = j.value("task_id", "");
    record.kind = j.value("kind", "download") == "upload" ? TransferKind::upload : TransferKind::download;
    record.url = j.value("url", "");
    record.local_path = j.value("local_path", "");
    record.status = task_status_from_string(j.value("status", "enqueued")).value_or(TaskStatus::enqueued);
    record.expected_size = j.value("expected_size", static_cast<int64_t>(-1));
    record.progress = j.value("progress", 0.0);
    record.updated_at = std::chrono::system_clock::time_point(
        std::chrono::milliseconds(j.value("updated_at", static_cast<int64_t>(0))));
    return record;
}

} // anonymous namespace

TransferRecord TransferRecord::from_item(const TransferItem& item) {
    TransferRecord record;
    record.key = item.key();
    record.task_id = item.task.task_id;
    record.kind = item.task.kind;
    record.url = item.task.url;
    record.local_path = item.task.local_path();
    record.status = item.status;
    record.expected_size = item.expected_file_size;
    record.progress = item.progress;
    record.updated_at = item.updated_at;
    return record;
}

std::vector<TransferRecord> MemoryRecordStore::load_all() {
    std::vector<TransferRecord> records;
    records.reserve(records_.size());
    for (const auto& [key, record] : records_) records.push_back(record);
    return records;
}

bool MemoryRecordStore::upsert(const TransferRecord& record) {
    records_[record.key] = record;
    return true;
}

bool MemoryRecordStore::remove(const std::string& key) {
    return records_.erase(key) > 0;
}

void MemoryRecordStore::clear() {
    records_.clear();
}

JsonFileRecordStore::JsonFileRecordStore(std::string path) : path_(std::move(path)) {}

// Problems are logged; a store that cannot be read starts out empty
void JsonFileRecordStore::load() {
    if (loaded_) return;
    loaded_ = true;

    if (!std::filesystem::exists(path_)) return;

    std::ifstream file(path_);
    if (!file.is_open()) {
        Logger::instance().error("Cannot open record file: {}", path_);
        return;
    }

    try {
        auto root = nlohmann::json::parse(file);
        for (const auto& entry : root) {
            auto record = from_json(entry);
            records_[record.key] = record;
        }
    } catch (const nlohmann::json::exception& e) {
        Logger::instance().error("Corrupt record file {}: {}", path_, e.what());
        records_.clear();
        return;
    }
    Logger::instance().debug("Loaded {} transfer records from {}", records_.size(), path_);
}

bool JsonFileRecordStore::flush() {
    nlohmann::json root = nlohmann::json::array();
    for (const auto& [key, record] : records_) {
        root.push_back(to_json(record));
    }

    std::error_code ec;
    auto parent = std::filesystem::path(path_).parent_path();
    if (!parent.empty()) std::filesystem::create_directories(parent, ec);

    std::string tmp = path_ + ".tmp";
    {
        std::ofstream file(tmp, std::ios::trunc);
        if (!file.is_open()) {
            Logger::instance().error("Cannot write record file: {}", tmp);
            return false;
        }
        file << root.dump(2);
        if (!file.good()) {
            Logger::instance().error("Failed writing record file: {}", tmp);
            return false;
        }
    }

    std::filesystem::rename(tmp, path_, ec);
    if (ec) {
        Logger::instance().error("Cannot replace record file {}: {}", path_, ec.message());
        return false;
    }
    return true;
}

std::vector<TransferRecord> JsonFileRecordStore::load_all() {
    load();
    std::vector<TransferRecord> records;
    records.reserve(records_.size());
    for (const auto& [key, record] : records_) records.push_back(record);
    return records;
}

bool JsonFileRecordStore::upsert(const TransferRecord& record) {
    load();
    records_[record.key] = record;
    return flush();
}

bool JsonFileRecordStore::remove(const std::string& key) {
    load();
    if (records_.erase(key) == 0) return false;
    return flush();
}

void JsonFileRecordStore::clear() {
    loaded_ = true;
    records_.clear();
    if (!flush()) {
        Logger::instance().warning("Record file {} could not be cleared", path_);
    }
}

std::shared_ptr<TransferRecordStore> make_record_store(const std::string& path) {
    if (path.empty()) return std::make_shared<MemoryRecordStore>();
    return std::make_shared<JsonFileRecordStore>(path);
}

} // namespace xferq
