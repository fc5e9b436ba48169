#ifndef XFERQ_CONTROL_RECORD_STORE_H
#define XFERQ_CONTROL_RECORD_STORE_H

#include "xferq/transfer/transfer_task.h"
#include <chrono>
#include <cstdint>
#include <map>
#include <memory>
#include <string>
#include <vector>

namespace xferq {

// Persisted summary of one transfer
struct TransferRecord {
    std::string key;
    std::string task_id;
    TransferKind kind = TransferKind::download;
    std::string url;
    std::string local_path;
    TaskStatus status = TaskStatus::enqueued;
    int64_t expected_size = -1;
    double progress = 0.0;
    std::chrono::system_clock::time_point updated_at = std::chrono::system_clock::now();

    static TransferRecord from_item(const TransferItem& item);
};

class TransferRecordStore {
public:
    virtual ~TransferRecordStore() = default;

    virtual std::vector<TransferRecord> load_all() = 0;
    virtual bool upsert(const TransferRecord& record) = 0;
    virtual bool remove(const std::string& key) = 0;
    virtual void clear() = 0;
};

class MemoryRecordStore : public TransferRecordStore {
public:
    std::vector<TransferRecord> load_all() override;
    bool upsert(const TransferRecord& record) override;
    bool remove(const std::string& key) override;
    void clear() override;

private:
    std::map<std::string, TransferRecord> records_;
};

// Records kept as a JSON array, rewritten through a temporary file on every change
class JsonFileRecordStore : public TransferRecordStore {
public:
    explicit JsonFileRecordStore(std::string path);

    std::vector<TransferRecord> load_all() override;
    bool upsert(const TransferRecord& record) override;
    bool remove(const std::string& key) override;
    void clear() override;

    const std::string& path() const { return path_; }

private:
    void load();
    bool flush();

    std::string path_;
    std::map<std::string, TransferRecord> records_;
    bool loaded_ = false;
};

// JSON store when path is set, memory store otherwise
std::shared_ptr<TransferRecordStore> make_record_store(const std::string& path);

} // namespace xferq

#endif // XFERQ_CONTROL_RECORD_STORE_H
