#include "mediaferry/ChunkPlan.hpp"
#include <algorithm>

namespace mediaferry {

bool planChunks(std::uint64_t total,
                std::uint64_t chunk_size,
                std::vector<ChunkRange>& out,
                std::string& err) {
    out.clear();
    if (chunk_size == 0) {
        err = "chunk size must be greater than zero";
        return false;
    }
    out.reserve(static_cast<std::size_t>(chunkCountFor(total, chunk_size)));
    std::uint64_t offset = 0;
    while (offset < total) {
        const std::uint64_t len = std::min(chunk_size, total - offset);
        out.push_back({offset, len});
        offset += len;
    }
    return true;
}

bool rangesPartition(std::vector<ChunkRange> ranges, std::uint64_t total) {
    std::sort(ranges.begin(), ranges.end(),
              [](const ChunkRange& a, const ChunkRange& b) { return a.offset < b.offset; });
    std::uint64_t expected = 0;
    for (const auto& r : ranges) {
        if (r.length == 0 || r.offset != expected)
            return false;
        expected = r.end();
    }
    return expected == total;
}

} // namespace mediaferry
