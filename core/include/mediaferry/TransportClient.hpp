// Abstract interface to the messaging backend. Concrete transports must honor
// this API so the transfer engine stays decoupled from the wire protocol.
#pragma once
#include "TransferTypes.hpp"
#include <functional>
#include <memory>

namespace mediaferry {

class TransportClient {
public:
    virtual ~TransportClient() = default;

    // Connect and disconnect
    virtual bool connect(const BackendOptions& opt, TransportError& err) = 0;
    virtual void disconnect() = 0;
    virtual bool isConnected() const = 0;

    // Remote metadata (size is required to plan a download).
    virtual bool stat(const FileReference& ref,
                      RemoteFileInfo& info,
                      TransportError& err) = 0;

    // Read one byte range of a remote file. On success "out" holds exactly
    // range.length bytes.
    virtual bool fetchChunk(const FileReference& ref,
                            const ChunkRange& range,
                            std::vector<std::uint8_t>& out,
                            TransportError& err) = 0;

    // Stage one byte range of an upload. Parts may arrive in any order.
    virtual bool pushChunk(const UploadTarget& target,
                           const ChunkRange& range,
                           const std::vector<std::uint8_t>& data,
                           TransportError& err) = 0;

    // Commit staged parts. "parts" is in ascending offset order and covers
    // the whole file; on success "out" addresses the new remote message.
    virtual bool finalizeUpload(const UploadTarget& target,
                                const std::vector<ChunkRange>& parts,
                                FileReference& out,
                                TransportError& err) = 0;

    // Abort a blocking call from another thread. The call returns with
    // TransportErrorKind::Interrupted and the connection is not reusable.
    virtual void interrupt() {}

    // Create a new connection of the same kind with the given options.
    virtual std::unique_ptr<TransportClient> newConnectionLike(const BackendOptions& opt,
                                                               TransportError& err) = 0;
};

} // namespace mediaferry
