// Pending-work queue over the chunks of one file.
#pragma once
#include "TransferTypes.hpp"
#include <cstddef>
#include <deque>
#include <mutex>
#include <string>
#include <vector>

namespace mediaferry {

struct ChunkInfo {
    ChunkRange range;
    int attempts = 0; // transfer attempts started
    int failures = 0; // attempts that failed (abandoned ones excluded)
    ChunkState state = ChunkState::Pending;
};

// Shared by all workers of a job; every method is thread-safe.
//
// Workers pull chunks with next(), then report markDone / markFailed /
// abandon. A chunk that fails more than max_retries times is marked Failed
// and the job must fail with ChunkExhausted.
class ChunkScheduler {
public:
    ChunkScheduler() = default;
    ChunkScheduler(const ChunkScheduler&) = delete;
    ChunkScheduler& operator=(const ChunkScheduler&) = delete;

    bool plan(std::uint64_t total_size, std::uint64_t chunk_size, int max_retries,
              std::string& err);
    bool planned() const;

    // Moves the next pending chunk to InFlight. False when none is pending.
    bool next(std::size_t& index, ChunkRange& range);

    // Returns true when this call completed the last chunk.
    bool markDone(std::size_t index);

    // Counts a failed attempt and re-queues the chunk. Returns true when the
    // retry budget is exhausted; the chunk is then left Failed.
    bool markFailed(std::size_t index);

    // Back to Pending without counting a failure (session loss, backoff,
    // cancellation). Abandoned chunks are handed out first.
    void abandon(std::size_t index);

    // Every InFlight chunk back to Pending; used when a job is resumed.
    void abandonInFlight();

    std::uint64_t totalSize() const;
    std::uint64_t chunkSize() const;
    std::uint64_t bytesDone() const;
    bool isComplete() const;
    bool hasPending() const;
    bool hasFailed() const;

    std::size_t chunkCount() const;
    std::size_t doneCount() const;
    std::size_t inFlightCount() const;
    std::size_t pendingCount() const;
    std::uint64_t totalAttempts() const;
    ChunkInfo chunk(std::size_t index) const;

    // Completed ranges in ascending offset order; the finalize order for
    // uploads.
    std::vector<ChunkRange> orderedParts() const;

private:
    mutable std::mutex mtx_;
    std::vector<ChunkInfo> chunks_;
    std::deque<std::size_t> pending_;
    std::uint64_t total_ = 0;
    std::uint64_t chunkSize_ = 0;
    std::uint64_t bytesDone_ = 0;
    std::uint64_t attempts_ = 0;
    std::size_t done_ = 0;
    std::size_t inFlight_ = 0;
    int maxRetries_ = 0;
    bool planned_ = false;
    bool failed_ = false;
};

} // namespace mediaferry
