// Display names for the shared enums (logs, snapshots, CLI output).
#include "mediaferry/TransferTypes.hpp"

namespace mediaferry {

const char *transferErrorName(TransferError e) {
    switch (e) {
    case TransferError::None:
        return "None";
    case TransferError::PoolExhausted:
        return "PoolExhausted";
    case TransferError::ChunkTransferError:
        return "ChunkTransferError";
    case TransferError::ChunkExhausted:
        return "ChunkExhausted";
    case TransferError::ReauthRequired:
        return "ReauthRequired";
    case TransferError::Cancelled:
        return "Cancelled";
    case TransferError::BackendRejected:
        return "BackendRejected";
    case TransferError::NoSession:
        return "NoSession";
    case TransferError::InvalidRequest:
        return "InvalidRequest";
    case TransferError::NotFound:
        return "NotFound";
    case TransferError::LocalIo:
        return "LocalIo";
    case TransferError::ConnectFailed:
        return "ConnectFailed";
    case TransferError::ShuttingDown:
        return "ShuttingDown";
    }
    return "Unknown";
}

const char *transportErrorKindName(TransportErrorKind k) {
    switch (k) {
    case TransportErrorKind::None:
        return "None";
    case TransportErrorKind::Transient:
        return "Transient";
    case TransportErrorKind::Timeout:
        return "Timeout";
    case TransportErrorKind::AuthRejected:
        return "AuthRejected";
    case TransportErrorKind::RateLimited:
        return "RateLimited";
    case TransportErrorKind::NotFound:
        return "NotFound";
    case TransportErrorKind::Interrupted:
        return "Interrupted";
    case TransportErrorKind::Fatal:
        return "Fatal";
    }
    return "Unknown";
}

const char *jobStateName(JobState s) {
    switch (s) {
    case JobState::Pending:
        return "Pending";
    case JobState::Running:
        return "Running";
    case JobState::Paused:
        return "Paused";
    case JobState::Completed:
        return "Completed";
    case JobState::Failed:
        return "Failed";
    case JobState::Cancelled:
        return "Cancelled";
    }
    return "Unknown";
}

const char *directionName(Direction d) {
    return d == Direction::Download ? "download" : "upload";
}

const char *connectionStateName(ConnectionState s) {
    switch (s) {
    case ConnectionState::Idle:
        return "idle";
    case ConnectionState::Busy:
        return "busy";
    case ConnectionState::Draining:
        return "draining";
    case ConnectionState::Closed:
        return "closed";
    }
    return "unknown";
}

} // namespace mediaferry
