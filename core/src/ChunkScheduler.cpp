#include "mediaferry/ChunkScheduler.hpp"
#include "mediaferry/ChunkPlan.hpp"

namespace mediaferry {

bool ChunkScheduler::plan(std::uint64_t total_size, std::uint64_t chunk_size, int max_retries,
                          std::string& err) {
    std::vector<ChunkRange> ranges;
    if (!planChunks(total_size, chunk_size, ranges, err))
        return false;
    std::lock_guard<std::mutex> lk(mtx_);
    chunks_.clear();
    pending_.clear();
    chunks_.reserve(ranges.size());
    for (std::size_t i = 0; i < ranges.size(); ++i) {
        ChunkInfo c;
        c.range = ranges[i];
        chunks_.push_back(c);
        pending_.push_back(i);
    }
    total_ = total_size;
    chunkSize_ = chunk_size;
    bytesDone_ = 0;
    attempts_ = 0;
    done_ = 0;
    inFlight_ = 0;
    maxRetries_ = max_retries < 0 ? 0 : max_retries;
    planned_ = true;
    failed_ = false;
    return true;
}

bool ChunkScheduler::planned() const {
    std::lock_guard<std::mutex> lk(mtx_);
    return planned_;
}

bool ChunkScheduler::next(std::size_t& index, ChunkRange& range) {
    std::lock_guard<std::mutex> lk(mtx_);
    if (failed_ || pending_.empty())
        return false;
    index = pending_.front();
    pending_.pop_front();
    ChunkInfo& c = chunks_[index];
    c.state = ChunkState::InFlight;
    ++c.attempts;
    ++attempts_;
    ++inFlight_;
    range = c.range;
    return true;
}

bool ChunkScheduler::markDone(std::size_t index) {
    std::lock_guard<std::mutex> lk(mtx_);
    if (index >= chunks_.size())
        return false;
    ChunkInfo& c = chunks_[index];
    if (c.state != ChunkState::InFlight)
        return false;
    c.state = ChunkState::Done;
    --inFlight_;
    ++done_;
    bytesDone_ += c.range.length;
    return done_ == chunks_.size();
}

bool ChunkScheduler::markFailed(std::size_t index) {
    std::lock_guard<std::mutex> lk(mtx_);
    if (index >= chunks_.size())
        return false;
    ChunkInfo& c = chunks_[index];
    if (c.state != ChunkState::InFlight)
        return false;
    --inFlight_;
    ++c.failures;
    if (c.failures > maxRetries_) {
        c.state = ChunkState::Failed;
        failed_ = true;
        return true;
    }
    c.state = ChunkState::Pending;
    pending_.push_back(index);
    return false;
}

void ChunkScheduler::abandon(std::size_t index) {
    std::lock_guard<std::mutex> lk(mtx_);
    if (index >= chunks_.size())
        return;
    ChunkInfo& c = chunks_[index];
    if (c.state != ChunkState::InFlight)
        return;
    --inFlight_;
    c.state = ChunkState::Pending;
    pending_.push_front(index);
}

void ChunkScheduler::abandonInFlight() {
    std::lock_guard<std::mutex> lk(mtx_);
    for (std::size_t i = 0; i < chunks_.size(); ++i) {
        if (chunks_[i].state != ChunkState::InFlight)
            continue;
        chunks_[i].state = ChunkState::Pending;
        pending_.push_front(i);
    }
    inFlight_ = 0;
}

std::uint64_t ChunkScheduler::totalSize() const {
    std::lock_guard<std::mutex> lk(mtx_);
    return total_;
}

std::uint64_t ChunkScheduler::chunkSize() const {
    std::lock_guard<std::mutex> lk(mtx_);
    return chunkSize_;
}

std::uint64_t ChunkScheduler::bytesDone() const {
    std::lock_guard<std::mutex> lk(mtx_);
    return bytesDone_;
}

bool ChunkScheduler::isComplete() const {
    std::lock_guard<std::mutex> lk(mtx_);
    return planned_ && done_ == chunks_.size();
}

bool ChunkScheduler::hasPending() const {
    std::lock_guard<std::mutex> lk(mtx_);
    return !failed_ && !pending_.empty();
}

bool ChunkScheduler::hasFailed() const {
    std::lock_guard<std::mutex> lk(mtx_);
    return failed_;
}

std::size_t ChunkScheduler::chunkCount() const {
    std::lock_guard<std::mutex> lk(mtx_);
    return chunks_.size();
}

std::size_t ChunkScheduler::doneCount() const {
    std::lock_guard<std::mutex> lk(mtx_);
    return done_;
}

std::size_t ChunkScheduler::inFlightCount() const {
    std::lock_guard<std::mutex> lk(mtx_);
    return inFlight_;
}

std::size_t ChunkScheduler::pendingCount() const {
    std::lock_guard<std::mutex> lk(mtx_);
    return failed_ ? 0 : pending_.size();
}

std::uint64_t ChunkScheduler::totalAttempts() const {
    std::lock_guard<std::mutex> lk(mtx_);
    return attempts_;
}

ChunkInfo ChunkScheduler::chunk(std::size_t index) const {
    std::lock_guard<std::mutex> lk(mtx_);
    return index < chunks_.size() ? chunks_[index] : ChunkInfo{};
}

std::vector<ChunkRange> ChunkScheduler::orderedParts() const {
    std::lock_guard<std::mutex> lk(mtx_);
    std::vector<ChunkRange> out;
    out.reserve(done_);
    // chunks_ is built in ascending offset order by plan().
    for (const auto& c : chunks_) {
        if (c.state == ChunkState::Done)
            out.push_back(c.range);
    }
    return out;
}

} // namespace mediaferry
