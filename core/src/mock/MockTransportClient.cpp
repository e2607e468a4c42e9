#include "mediaferry/MockTransportClient.hpp"
#include <algorithm>
#include <chrono>

namespace mediaferry {

// ---- MockBackend -----------------------------------------------------------

void MockBackend::putFile(const std::string& key, std::vector<std::uint8_t> data) {
  std::lock_guard<std::mutex> lk(mtx_);
  files_[key] = std::move(data);
}

bool MockBackend::hasFile(const std::string& key) const {
  std::lock_guard<std::mutex> lk(mtx_);
  return files_.count(key) > 0;
}

std::vector<std::uint8_t> MockBackend::file(const std::string& key) const {
  std::lock_guard<std::mutex> lk(mtx_);
  auto it = files_.find(key);
  return it == files_.end() ? std::vector<std::uint8_t>{} : it->second;
}

void MockBackend::revokeToken(const std::string& token) {
  {
    std::lock_guard<std::mutex> lk(mtx_);
    revoked_.insert(token);
  }
  wakeAll();
}

void MockBackend::restoreToken(const std::string& token) {
  std::lock_guard<std::mutex> lk(mtx_);
  revoked_.erase(token);
  revokeAfter_.erase(token);
}

bool MockBackend::tokenAccepted(const std::string& token) const {
  std::lock_guard<std::mutex> lk(mtx_);
  return !token.empty() && revoked_.count(token) == 0;
}

void MockBackend::revokeAfterChunks(const std::string& token, int chunks) {
  std::lock_guard<std::mutex> lk(mtx_);
  if (chunks <= 0)
    revoked_.insert(token);
  else
    revokeAfter_[token] = chunks;
}

void MockBackend::failChunkAt(std::uint64_t offset, int times, TransportErrorKind kind) {
  std::lock_guard<std::mutex> lk(mtx_);
  faults_[offset] = Fault{times, kind};
}

void MockBackend::truncateChunkAt(std::uint64_t offset, int times) {
  std::lock_guard<std::mutex> lk(mtx_);
  truncated_[offset] = times;
}

void MockBackend::setHoldFinalize(bool hold) {
  {
    std::lock_guard<std::mutex> lk(mtx_);
    holdFinalize_ = hold;
  }
  cv_.notify_all();
}

int MockBackend::finalizeWaiters() const {
  std::lock_guard<std::mutex> lk(mtx_);
  return finalizeWaiters_;
}

bool MockBackend::waitFinalizeGate(const std::atomic<bool>& interrupted, TransportError& err) {
  std::unique_lock<std::mutex> lk(mtx_);
  ++finalizeWaiters_;
  while (holdFinalize_ && !interrupted.load())
    cv_.wait_for(lk, std::chrono::milliseconds(5));
  --finalizeWaiters_;
  if (interrupted.load()) {
    err = {TransportErrorKind::Interrupted, "interrupted", 0};
    return false;
  }
  return true;
}

void MockBackend::rateLimitNext(int count, std::uint32_t retry_after_ms) {
  std::lock_guard<std::mutex> lk(mtx_);
  rateLimited_ = count;
  retryAfterMs_ = retry_after_ms;
}

void MockBackend::setChunkDelayMs(int ms) {
  std::lock_guard<std::mutex> lk(mtx_);
  delayMs_ = std::max(0, ms);
}

void MockBackend::setHold(bool hold) {
  {
    std::lock_guard<std::mutex> lk(mtx_);
    hold_ = hold;
  }
  wakeAll();
}

int MockBackend::connectionsOpened() const {
  std::lock_guard<std::mutex> lk(mtx_);
  return connections_;
}

int MockBackend::activeTransfers() const {
  std::lock_guard<std::mutex> lk(mtx_);
  return active_;
}

int MockBackend::peakActiveTransfers() const {
  std::lock_guard<std::mutex> lk(mtx_);
  return peakActive_;
}

std::uint64_t MockBackend::chunkCalls() const {
  std::lock_guard<std::mutex> lk(mtx_);
  return chunkCalls_;
}

int MockBackend::failuresInjected() const {
  std::lock_guard<std::mutex> lk(mtx_);
  return failuresInjected_;
}

std::vector<std::vector<ChunkRange>> MockBackend::finalizeCalls() const {
  std::lock_guard<std::mutex> lk(mtx_);
  return finalizeCalls_;
}

void MockBackend::noteConnection() {
  std::lock_guard<std::mutex> lk(mtx_);
  ++connections_;
}

void MockBackend::wakeAll() {
  cv_.notify_all();
}

bool MockBackend::enterChunk(const std::string& token, std::uint64_t offset,
                             const std::atomic<bool>& interrupted,
                             std::uint32_t timeout_ms, TransportError& err) {
  using clock = std::chrono::steady_clock;
  std::unique_lock<std::mutex> lk(mtx_);
  ++chunkCalls_;
  if (revoked_.count(token) > 0) {
    err = {TransportErrorKind::AuthRejected, "session token revoked", 0};
    return false;
  }
  if (rateLimited_ > 0) {
    --rateLimited_;
    err = {TransportErrorKind::RateLimited, "flood wait", retryAfterMs_};
    return false;
  }
  ++active_;
  peakActive_ = std::max(peakActive_, active_);

  auto bail = [this](TransportError& e, TransportErrorKind kind, const char* msg) {
    --active_;
    cv_.notify_all();
    e = {kind, msg, 0};
    return false;
  };

  while (hold_ && !interrupted.load() && revoked_.count(token) == 0)
    cv_.wait_for(lk, std::chrono::milliseconds(5));
  if (interrupted.load())
    return bail(err, TransportErrorKind::Interrupted, "interrupted");
  if (revoked_.count(token) > 0)
    return bail(err, TransportErrorKind::AuthRejected, "session token revoked");

  if (delayMs_ > 0) {
    const auto start = clock::now();
    const auto done = start + std::chrono::milliseconds(delayMs_);
    const auto timeoutAt = start + std::chrono::milliseconds(timeout_ms);
    while (!interrupted.load()) {
      const auto now = clock::now();
      if (timeout_ms > 0 && now >= timeoutAt && timeoutAt < done)
        return bail(err, TransportErrorKind::Timeout, "chunk attempt timed out");
      if (now >= done)
        break;
      cv_.wait_until(lk, timeout_ms > 0 ? std::min(done, timeoutAt) : done);
    }
    if (interrupted.load())
      return bail(err, TransportErrorKind::Interrupted, "interrupted");
  }

  auto f = faults_.find(offset);
  if (f != faults_.end() && f->second.remaining != 0) {
    if (f->second.remaining > 0)
      --f->second.remaining;
    ++failuresInjected_;
    const TransportErrorKind kind = f->second.kind;
    return bail(err, kind, "injected chunk failure");
  }
  return true;
}

void MockBackend::leaveChunk(const std::string& token, bool ok) {
  {
    std::lock_guard<std::mutex> lk(mtx_);
    --active_;
    if (ok) {
      auto it = revokeAfter_.find(token);
      if (it != revokeAfter_.end() && --it->second <= 0) {
        revoked_.insert(token);
        revokeAfter_.erase(it);
      }
    }
  }
  cv_.notify_all();
}

bool MockBackend::stagePart(const std::string& upload_id, const ChunkRange& range,
                            const std::vector<std::uint8_t>& data, TransportError& err) {
  if (data.size() != range.length) {
    err = {TransportErrorKind::Fatal, "part size does not match range", 0};
    return false;
  }
  std::lock_guard<std::mutex> lk(mtx_);
  staged_[upload_id][range.offset] = data;
  return true;
}

bool MockBackend::commitUpload(const UploadTarget& target, const std::vector<ChunkRange>& parts,
                               FileReference& out, TransportError& err) {
  std::lock_guard<std::mutex> lk(mtx_);
  auto it = staged_.find(target.upload_id);
  if (it == staged_.end() && !parts.empty()) {
    err = {TransportErrorKind::NotFound, "unknown upload id", 0};
    return false;
  }
  std::vector<std::uint8_t> assembled;
  std::uint64_t expected = 0;
  for (const auto& p : parts) {
    // The backend requires ascending, gap-free finalize order.
    if (p.offset != expected) {
      err = {TransportErrorKind::Fatal, "parts out of order", 0};
      return false;
    }
    auto part = it->second.find(p.offset);
    if (part == it->second.end() || part->second.size() != p.length) {
      err = {TransportErrorKind::Fatal, "missing staged part", 0};
      return false;
    }
    assembled.insert(assembled.end(), part->second.begin(), part->second.end());
    expected = p.end();
  }
  if (it != staged_.end())
    staged_.erase(it);
  FileReference ref;
  ref.chat = target.chat;
  ref.message_id = nextMessageId_++;
  files_[ref.key()] = std::move(assembled);
  finalizeCalls_.push_back(parts);
  out = ref;
  return true;
}

// ---- MockTransportClient ---------------------------------------------------

MockTransportClient::MockTransportClient()
    : backend_(std::make_shared<MockBackend>()) {}

MockTransportClient::MockTransportClient(std::shared_ptr<MockBackend> backend)
    : backend_(backend ? std::move(backend) : std::make_shared<MockBackend>()) {}

bool MockTransportClient::connect(const BackendOptions& opt, TransportError& err) {
  if (opt.user_id.empty() || opt.session_token.empty()) {
    err = {TransportErrorKind::Fatal, "user id and session token are required", 0};
    return false;
  }
  if (!backend_->tokenAccepted(opt.session_token)) {
    err = {TransportErrorKind::AuthRejected, "session token rejected", 0};
    return false;
  }
  backend_->noteConnection();
  opt_ = opt;
  interrupted_ = false;
  connected_ = true;
  return true;
}

void MockTransportClient::disconnect() {
  connected_ = false;
}

bool MockTransportClient::ready(TransportError& err) const {
  if (interrupted_.load()) {
    err = {TransportErrorKind::Interrupted, "connection was interrupted", 0};
    return false;
  }
  if (!connected_.load()) {
    err = {TransportErrorKind::Fatal, "not connected", 0};
    return false;
  }
  return true;
}

bool MockTransportClient::stat(const FileReference& ref, RemoteFileInfo& info,
                               TransportError& err) {
  if (!ready(err))
    return false;
  if (!backend_->tokenAccepted(opt_.session_token)) {
    err = {TransportErrorKind::AuthRejected, "session token revoked", 0};
    return false;
  }
  std::lock_guard<std::mutex> lk(backend_->mtx_);
  auto it = backend_->files_.find(ref.key());
  if (it == backend_->files_.end()) {
    err = {TransportErrorKind::NotFound, "remote file not found in mock: " + ref.key(), 0};
    return false;
  }
  info.name = ref.key();
  info.size = it->second.size();
  info.mtime = 0;
  return true;
}

bool MockTransportClient::fetchChunk(const FileReference& ref, const ChunkRange& range,
                                     std::vector<std::uint8_t>& out, TransportError& err) {
  if (!ready(err))
    return false;
  if (!backend_->enterChunk(opt_.session_token, range.offset, interrupted_,
                            opt_.chunk_timeout_ms, err))
    return false;
  bool ok = false;
  {
    std::lock_guard<std::mutex> lk(backend_->mtx_);
    auto it = backend_->files_.find(ref.key());
    if (it == backend_->files_.end()) {
      err = {TransportErrorKind::NotFound, "remote file not found in mock: " + ref.key(), 0};
    } else if (range.end() > it->second.size()) {
      err = {TransportErrorKind::Fatal, "range beyond end of file", 0};
    } else {
      const auto first = it->second.begin() + static_cast<std::ptrdiff_t>(range.offset);
      std::uint64_t len = range.length;
      auto cut = backend_->truncated_.find(range.offset);
      if (cut != backend_->truncated_.end() && cut->second > 0) {
        --cut->second;
        len /= 2;
      }
      out.assign(first, first + static_cast<std::ptrdiff_t>(len));
      ok = true;
    }
  }
  backend_->leaveChunk(opt_.session_token, ok);
  return ok;
}

bool MockTransportClient::pushChunk(const UploadTarget& target, const ChunkRange& range,
                                    const std::vector<std::uint8_t>& data,
                                    TransportError& err) {
  if (!ready(err))
    return false;
  if (!backend_->enterChunk(opt_.session_token, range.offset, interrupted_,
                            opt_.chunk_timeout_ms, err))
    return false;
  const bool ok = backend_->stagePart(target.upload_id, range, data, err);
  backend_->leaveChunk(opt_.session_token, ok);
  return ok;
}

bool MockTransportClient::finalizeUpload(const UploadTarget& target,
                                         const std::vector<ChunkRange>& parts,
                                         FileReference& out, TransportError& err) {
  if (!ready(err))
    return false;
  if (!backend_->tokenAccepted(opt_.session_token)) {
    err = {TransportErrorKind::AuthRejected, "session token revoked", 0};
    return false;
  }
  if (!backend_->waitFinalizeGate(interrupted_, err))
    return false;
  return backend_->commitUpload(target, parts, out, err);
}

void MockTransportClient::interrupt() {
  interrupted_ = true;
  backend_->wakeAll();
}

std::unique_ptr<TransportClient> MockTransportClient::newConnectionLike(const BackendOptions& opt,
                                                                        TransportError& err) {
  auto conn = std::make_unique<MockTransportClient>(backend_);
  if (!conn->connect(opt, err))
    return nullptr;
  return conn;
}

} // namespace mediaferry
