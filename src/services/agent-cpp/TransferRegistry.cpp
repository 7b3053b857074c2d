#include "TransferRegistry.hpp"

#include <utility>

TransferRecord::TransferRecord(Uuid transferId, FileTransferDirection direction, const CancellationToken& callerToken)
    : transferId_(std::move(transferId)),
      direction_(direction),
      startedAt_(std::chrono::system_clock::now()),
      cancellation_(CancellationSource::CreateLinked(callerToken)) {}

bool TransferRecord::Advance(FileTransferState next) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!CanAdvance(state_, next)) {
        return false;
    }
    state_ = next;
    return true;
}

FileTransferState TransferRecord::State() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return state_;
}

void TransferRecord::Fail(FileTransferState terminal, const std::string& errorMessage) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!CanAdvance(state_, terminal)) {
        return;
    }
    state_ = terminal;
    errorMessage_ = errorMessage;
}

void TransferRecord::UpdateProgress(const FileTransferProgress& progress) {
    std::lock_guard<std::mutex> lock(mutex_);
    progress_ = progress;
}

CancellationToken TransferRecord::Token() const {
    return cancellation_.Token();
}

void TransferRecord::Cancel() {
    cancellation_.Cancel();
}

FileTransferStatus TransferRecord::Snapshot() const {
    FileTransferStatus status;
    status.transferId = transferId_;
    status.direction = direction_;
    status.startedAt = startedAt_;

    std::lock_guard<std::mutex> lock(mutex_);
    status.state = state_;
    status.progress = progress_;
    status.errorMessage = errorMessage_;
    return status;
}

TransferRegistry::Admission TransferRegistry::TryAdmit(
    const std::shared_ptr<TransferRecord>& record,
    std::size_t maxActive) {
    std::unique_lock<std::shared_mutex> lock(mutex_);
    if (transfers_.size() >= maxActive) {
        return Admission::LimitReached;
    }
    if (!transfers_.emplace(record->TransferId(), record).second) {
        return Admission::Duplicate;
    }
    return Admission::Admitted;
}

void TransferRegistry::Remove(const Uuid& transferId) {
    std::unique_lock<std::shared_mutex> lock(mutex_);
    transfers_.erase(transferId);
}

std::shared_ptr<TransferRecord> TransferRegistry::Find(const Uuid& transferId) const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    const auto it = transfers_.find(transferId);
    return it == transfers_.end() ? nullptr : it->second;
}

std::vector<std::shared_ptr<TransferRecord>> TransferRegistry::Active() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    std::vector<std::shared_ptr<TransferRecord>> records;
    records.reserve(transfers_.size());
    for (const auto& entry : transfers_) {
        records.push_back(entry.second);
    }
    return records;
}

std::size_t TransferRegistry::Count() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return transfers_.size();
}
