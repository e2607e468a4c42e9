#pragma once
#include "TransportClient.hpp"
#include <atomic>
#include <filesystem>

namespace mediaferry {

// Transport over a plain directory standing in for the messaging backend.
//
// Layout under the endpoint directory:
//   <chat>/<message_id>          file contents of one remote message
//   .uploads/<upload_id>/<offset> staged upload parts
//   .revoked                     one rejected session token per line
//
// Used by the command-line front end and by integration-style tests.
class LocalDirTransportClient : public TransportClient {
public:
    LocalDirTransportClient() = default;
    ~LocalDirTransportClient() override = default;

    bool connect(const BackendOptions& opt, TransportError& err) override;
    void disconnect() override;
    bool isConnected() const override { return connected_.load() && !interrupted_.load(); }

    bool stat(const FileReference& ref, RemoteFileInfo& info, TransportError& err) override;
    bool fetchChunk(const FileReference& ref, const ChunkRange& range,
                    std::vector<std::uint8_t>& out, TransportError& err) override;
    bool pushChunk(const UploadTarget& target, const ChunkRange& range,
                   const std::vector<std::uint8_t>& data, TransportError& err) override;
    bool finalizeUpload(const UploadTarget& target, const std::vector<ChunkRange>& parts,
                        FileReference& out, TransportError& err) override;
    void interrupt() override { interrupted_ = true; }

    std::unique_ptr<TransportClient> newConnectionLike(const BackendOptions& opt,
                                                       TransportError& err) override;

private:
    bool ready(TransportError& err) const;
    bool tokenRevoked() const;
    std::filesystem::path fileFor(const FileReference& ref) const;
    std::filesystem::path stagingFor(const std::string& upload_id) const;

    std::filesystem::path root_;
    std::string token_;
    std::atomic<bool> connected_{false};
    std::atomic<bool> interrupted_{false};
};

} // namespace mediaferry
