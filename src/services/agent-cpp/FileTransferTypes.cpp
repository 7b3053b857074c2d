#include "FileTransferTypes.hpp"

const char* ToString(FileTransferDirection direction) {
    return direction == FileTransferDirection::Upload ? "upload" : "download";
}

const char* ToString(FileTransferState state) {
    switch (state) {
    case FileTransferState::Pending:
        return "Pending";
    case FileTransferState::Connecting:
        return "Connecting";
    case FileTransferState::Transferring:
        return "Transferring";
    case FileTransferState::Verifying:
        return "Verifying";
    case FileTransferState::Completed:
        return "Completed";
    case FileTransferState::Cancelled:
        return "Cancelled";
    case FileTransferState::Failed:
        return "Failed";
    }
    return "Unknown";
}

bool IsTerminal(FileTransferState state) {
    return state == FileTransferState::Completed
        || state == FileTransferState::Cancelled
        || state == FileTransferState::Failed;
}

bool CanAdvance(FileTransferState from, FileTransferState to) {
    if (IsTerminal(from)) {
        return false;
    }
    if (to == FileTransferState::Cancelled || to == FileTransferState::Failed) {
        return true;
    }
    return static_cast<int>(to) > static_cast<int>(from);
}
