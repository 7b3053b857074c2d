#pragma once

#include "CancellationToken.hpp"
#include "FileTransferTypes.hpp"
#include "Uuid.hpp"

#include <cstddef>
#include <memory>
#include <mutex>
#include <optional>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <vector>

// Bookkeeping for one in-flight transfer. Shared between the transfer loop, status queries and
// CancelTransfer, so a record stays valid for whoever still holds it after removal.
class TransferRecord {
public:
    TransferRecord(Uuid transferId, FileTransferDirection direction, const CancellationToken& callerToken);

    TransferRecord(const TransferRecord&) = delete;
    TransferRecord& operator=(const TransferRecord&) = delete;

    const Uuid& TransferId() const { return transferId_; }
    FileTransferDirection Direction() const { return direction_; }

    // Returns false, leaving the state alone, when `next` is not later than the current state.
    bool Advance(FileTransferState next);
    FileTransferState State() const;
    void Fail(FileTransferState terminal, const std::string& errorMessage);
    void UpdateProgress(const FileTransferProgress& progress);

    // Fires for CancelTransfer and for the caller's own token.
    CancellationToken Token() const;
    void Cancel();

    FileTransferStatus Snapshot() const;

private:
    const Uuid transferId_;
    const FileTransferDirection direction_;
    const std::chrono::system_clock::time_point startedAt_;
    CancellationSource cancellation_;

    mutable std::mutex mutex_;
    FileTransferState state_ = FileTransferState::Pending;
    std::optional<FileTransferProgress> progress_;
    std::optional<std::string> errorMessage_;
};

class TransferRegistry {
public:
    enum class Admission {
        Admitted,
        LimitReached,
        Duplicate
    };

    // The ceiling and the duplicate check are evaluated together under one exclusive lock, so
    // concurrent admissions can neither overshoot the ceiling nor register an id twice.
    Admission TryAdmit(const std::shared_ptr<TransferRecord>& record, std::size_t maxActive);
    void Remove(const Uuid& transferId);

    std::shared_ptr<TransferRecord> Find(const Uuid& transferId) const;
    std::vector<std::shared_ptr<TransferRecord>> Active() const;
    std::size_t Count() const;

private:
    mutable std::shared_mutex mutex_;
    std::unordered_map<Uuid, std::shared_ptr<TransferRecord>> transfers_;
};
