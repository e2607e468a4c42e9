// Basic types shared between the transport layer and the transfer engine.
// Keep these structures plain so they can be copied into snapshots freely.
#pragma once
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace mediaferry {

enum class Direction { Download, Upload };

// Error taxonomy surfaced by the engine. Transport-level failures are mapped
// onto these before they reach a caller.
enum class TransferError {
    None,
    PoolExhausted,      // acquire timed out; retry later
    ChunkTransferError, // transient, retried inside the job
    ChunkExhausted,     // retry budget of one chunk exceeded
    ReauthRequired,     // session invalid; job paused
    Cancelled,          // explicit cancel
    BackendRejected,    // rate limit / quota; pool-wide backoff
    NoSession,
    InvalidRequest,
    NotFound,
    LocalIo,
    ConnectFailed,
    ShuttingDown
};

// Classification of a failed transport call.
enum class TransportErrorKind {
    None,
    Transient,
    Timeout,
    AuthRejected,
    RateLimited,
    NotFound,
    Interrupted,
    Fatal
};

struct TransportError {
    TransportErrorKind kind = TransportErrorKind::None;
    std::string message;
    std::uint32_t retry_after_ms = 0; // only meaningful for RateLimited

    void clear() {
        kind = TransportErrorKind::None;
        message.clear();
        retry_after_ms = 0;
    }
    bool ok() const { return kind == TransportErrorKind::None; }
};

enum class ChunkState { Pending, InFlight, Done, Failed };

enum class ConnectionState { Idle, Busy, Draining, Closed };

enum class JobState { Pending, Running, Paused, Completed, Failed, Cancelled };

inline bool isTerminal(JobState s) {
    return s == JobState::Completed || s == JobState::Failed ||
           s == JobState::Cancelled;
}

// Half-open byte range [offset, offset + length).
struct ChunkRange {
    std::uint64_t offset = 0;
    std::uint64_t length = 0;

    std::uint64_t end() const { return offset + length; }
};

// Address of a remote file: a message inside a chat.
struct FileReference {
    std::string   chat;           // username or numeric id ("-100123...")
    std::int64_t  message_id = 0;
    std::optional<std::int64_t> thread_id;

    // Canonical "chat/message_id" key used by transports.
    std::string key() const { return chat + "/" + std::to_string(message_id); }
    bool valid() const { return !chat.empty() && message_id > 0; }
};

// Where an upload lands and under which backend upload id its parts are
// staged until finalize.
struct UploadTarget {
    std::string chat;
    std::string file_name;
    std::string upload_id;
};

struct RemoteFileInfo {
    std::string   name;
    std::uint64_t size = 0;
    std::uint64_t mtime = 0; // epoch seconds, 0 if unknown
};

// Parameters used to open one backend connection for one user.
struct BackendOptions {
    std::string   endpoint;
    std::string   user_id;
    std::string   session_token;
    std::uint32_t chunk_timeout_ms = 30000;
};

const char *transferErrorName(TransferError e);
const char *transportErrorKindName(TransportErrorKind k);
const char *jobStateName(JobState s);
const char *directionName(Direction d);
const char *connectionStateName(ConnectionState s);

} // namespace mediaferry
