#pragma once
#include "TransportClient.hpp"
#include <atomic>
#include <condition_variable>
#include <map>
#include <mutex>
#include <set>
#include <unordered_map>

namespace mediaferry {

// In-memory backend shared by every MockTransportClient created from it.
// Besides storing files it can inject the failures the engine must survive.
class MockBackend {
public:
    void putFile(const std::string& key, std::vector<std::uint8_t> data);
    bool hasFile(const std::string& key) const;
    std::vector<std::uint8_t> file(const std::string& key) const;

    // Tokens are accepted unless revoked.
    void revokeToken(const std::string& token);
    void restoreToken(const std::string& token);
    bool tokenAccepted(const std::string& token) const;
    // Revoke "token" once "chunks" more chunk calls have succeeded with it.
    void revokeAfterChunks(const std::string& token, int chunks);

    // The chunk starting at "offset" fails "times" times (-1 = always).
    void failChunkAt(std::uint64_t offset, int times,
                     TransportErrorKind kind = TransportErrorKind::Transient);
    // The next "count" chunk calls are rejected as rate limited.
    void rateLimitNext(int count, std::uint32_t retry_after_ms);
    void setChunkDelayMs(int ms);
    // While held, chunk calls block (interruptible) until released.
    void setHold(bool hold);
    // The next "times" reads of the chunk at "offset" return half the bytes.
    void truncateChunkAt(std::uint64_t offset, int times);
    // While held, finalizeUpload blocks (interruptible) before committing.
    void setHoldFinalize(bool hold);
    int finalizeWaiters() const;

    int connectionsOpened() const;
    int activeTransfers() const;
    int peakActiveTransfers() const;
    std::uint64_t chunkCalls() const;
    int failuresInjected() const;
    // Part lists passed to every successful finalize, in call order.
    std::vector<std::vector<ChunkRange>> finalizeCalls() const;

private:
    friend class MockTransportClient;

    struct Fault {
        int remaining = 0;
        TransportErrorKind kind = TransportErrorKind::Transient;
    };

    void noteConnection();
    bool enterChunk(const std::string& token, std::uint64_t offset,
                    const std::atomic<bool>& interrupted,
                    std::uint32_t timeout_ms, TransportError& err);
    void leaveChunk(const std::string& token, bool ok);
    void wakeAll();
    bool waitFinalizeGate(const std::atomic<bool>& interrupted, TransportError& err);
    bool stagePart(const std::string& upload_id, const ChunkRange& range,
                   const std::vector<std::uint8_t>& data, TransportError& err);
    bool commitUpload(const UploadTarget& target, const std::vector<ChunkRange>& parts,
                      FileReference& out, TransportError& err);

    mutable std::mutex mtx_;
    std::condition_variable cv_;
    std::unordered_map<std::string, std::vector<std::uint8_t>> files_;
    std::unordered_map<std::string, std::map<std::uint64_t, std::vector<std::uint8_t>>> staged_;
    std::set<std::string> revoked_;
    std::unordered_map<std::string, int> revokeAfter_;
    std::unordered_map<std::uint64_t, Fault> faults_;
    std::unordered_map<std::uint64_t, int> truncated_;
    std::vector<std::vector<ChunkRange>> finalizeCalls_;
    int rateLimited_ = 0;
    std::uint32_t retryAfterMs_ = 0;
    int delayMs_ = 0;
    bool hold_ = false;
    bool holdFinalize_ = false;
    int finalizeWaiters_ = 0;
    int connections_ = 0;
    int active_ = 0;
    int peakActive_ = 0;
    std::uint64_t chunkCalls_ = 0;
    int failuresInjected_ = 0;
    std::int64_t nextMessageId_ = 1000;
};

class MockTransportClient : public TransportClient {
public:
    MockTransportClient();
    explicit MockTransportClient(std::shared_ptr<MockBackend> backend);

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
    void interrupt() override;

    std::unique_ptr<TransportClient> newConnectionLike(const BackendOptions& opt,
                                                       TransportError& err) override;

    const std::shared_ptr<MockBackend>& backend() const { return backend_; }

private:
    bool ready(TransportError& err) const;

    std::shared_ptr<MockBackend> backend_;
    std::atomic<bool> connected_{false};
    std::atomic<bool> interrupted_{false};
    BackendOptions opt_{};
};

} // namespace mediaferry
