// Byte-range planning for chunked transfers.
#pragma once
#include "TransferTypes.hpp"
#include <string>
#include <vector>

namespace mediaferry {

// Split [0, total) into consecutive ranges of chunk_size bytes; the last one
// may be shorter. A zero-length file yields no ranges. Fails when
// chunk_size is zero.
bool planChunks(std::uint64_t total,
                std::uint64_t chunk_size,
                std::vector<ChunkRange>& out,
                std::string& err);

inline std::uint64_t chunkCountFor(std::uint64_t total, std::uint64_t chunk_size) {
    if (chunk_size == 0)
        return 0;
    return total / chunk_size + (total % chunk_size ? 1 : 0);
}

// True if "ranges" (sorted or not) cover [0, total) exactly once.
bool rangesPartition(std::vector<ChunkRange> ranges, std::uint64_t total);

} // namespace mediaferry
