// Directory-backed transport: each remote message is a file, uploads are
// staged per part and concatenated in offset order on finalize.
#include "mediaferry/LocalDirTransportClient.hpp"

#include <algorithm>
#include <cstdlib>
#include <fstream>
#include <mutex>
#include <string>
#include <system_error>

namespace fs = std::filesystem;

namespace mediaferry {

namespace {

constexpr std::size_t kSliceBytes = 64 * 1024;

// Finalize picks the next free message id inside a chat directory; serialize
// it within the process.
std::mutex g_finalizeMutex;

bool safeComponent(const std::string& s) {
    if (s.empty() || s == "." || s == "..")
        return false;
    return s.find('/') == std::string::npos && s.find('\\') == std::string::npos;
}

} // namespace

bool LocalDirTransportClient::connect(const BackendOptions& opt, TransportError& err) {
    if (opt.endpoint.empty()) {
        err = {TransportErrorKind::Fatal, "backend directory is required", 0};
        return false;
    }
    if (opt.session_token.empty()) {
        err = {TransportErrorKind::AuthRejected, "session token is required", 0};
        return false;
    }
    std::error_code ec;
    if (!fs::is_directory(opt.endpoint, ec)) {
        err = {TransportErrorKind::Fatal, "backend directory not found: " + opt.endpoint, 0};
        return false;
    }
    root_ = opt.endpoint;
    token_ = opt.session_token;
    if (tokenRevoked()) {
        err = {TransportErrorKind::AuthRejected, "session token rejected by backend", 0};
        return false;
    }
    interrupted_ = false;
    connected_ = true;
    return true;
}

void LocalDirTransportClient::disconnect() {
    connected_ = false;
}

bool LocalDirTransportClient::ready(TransportError& err) const {
    if (interrupted_.load()) {
        err = {TransportErrorKind::Interrupted, "connection was interrupted", 0};
        return false;
    }
    if (!connected_.load()) {
        err = {TransportErrorKind::Fatal, "not connected", 0};
        return false;
    }
    if (tokenRevoked()) {
        err = {TransportErrorKind::AuthRejected, "session token rejected by backend", 0};
        return false;
    }
    return true;
}

bool LocalDirTransportClient::tokenRevoked() const {
    std::ifstream in(root_ / ".revoked");
    if (!in.is_open())
        return false;
    std::string line;
    while (std::getline(in, line)) {
        while (!line.empty() && (line.back() == '\r' || line.back() == ' '))
            line.pop_back();
        if (line == token_)
            return true;
    }
    return false;
}

fs::path LocalDirTransportClient::fileFor(const FileReference& ref) const {
    return root_ / ref.chat / std::to_string(ref.message_id);
}

fs::path LocalDirTransportClient::stagingFor(const std::string& upload_id) const {
    return root_ / ".uploads" / upload_id;
}

bool LocalDirTransportClient::stat(const FileReference& ref, RemoteFileInfo& info,
                                   TransportError& err) {
    if (!ready(err))
        return false;
    if (!safeComponent(ref.chat) || ref.message_id <= 0) {
        err = {TransportErrorKind::NotFound, "invalid file reference: " + ref.key(), 0};
        return false;
    }
    std::error_code ec;
    const fs::path p = fileFor(ref);
    const auto size = fs::file_size(p, ec);
    if (ec) {
        err = {TransportErrorKind::NotFound, "remote file not found: " + ref.key(), 0};
        return false;
    }
    info.name = ref.key();
    info.size = size;
    info.mtime = 0;
    return true;
}

bool LocalDirTransportClient::fetchChunk(const FileReference& ref, const ChunkRange& range,
                                         std::vector<std::uint8_t>& out,
                                         TransportError& err) {
    if (!ready(err))
        return false;
    std::ifstream in(fileFor(ref), std::ios::binary);
    if (!in.is_open()) {
        err = {TransportErrorKind::NotFound, "remote file not found: " + ref.key(), 0};
        return false;
    }
    in.seekg(static_cast<std::streamoff>(range.offset));
    if (!in) {
        err = {TransportErrorKind::Fatal, "seek failed", 0};
        return false;
    }
    out.resize(static_cast<std::size_t>(range.length));
    std::size_t done = 0;
    while (done < out.size()) {
        if (interrupted_.load()) {
            err = {TransportErrorKind::Interrupted, "interrupted", 0};
            return false;
        }
        const std::size_t want = std::min(kSliceBytes, out.size() - done);
        in.read(reinterpret_cast<char*>(out.data() + done), static_cast<std::streamsize>(want));
        const auto got = static_cast<std::size_t>(in.gcount());
        if (got != want) {
            err = {TransportErrorKind::Transient, "short read from backend file", 0};
            return false;
        }
        done += got;
    }
    return true;
}

bool LocalDirTransportClient::pushChunk(const UploadTarget& target, const ChunkRange& range,
                                        const std::vector<std::uint8_t>& data,
                                        TransportError& err) {
    if (!ready(err))
        return false;
    if (!safeComponent(target.upload_id) || data.size() != range.length) {
        err = {TransportErrorKind::Fatal, "invalid upload part", 0};
        return false;
    }
    std::error_code ec;
    const fs::path dir = stagingFor(target.upload_id);
    fs::create_directories(dir, ec);
    if (ec) {
        err = {TransportErrorKind::Fatal, "cannot create staging directory: " + ec.message(), 0};
        return false;
    }
    const fs::path tmp = dir / (std::to_string(range.offset) + ".tmp");
    {
        std::ofstream out(tmp, std::ios::binary | std::ios::trunc);
        if (!out.is_open()) {
            err = {TransportErrorKind::Transient, "cannot open staging part", 0};
            return false;
        }
        std::size_t done = 0;
        while (done < data.size()) {
            if (interrupted_.load()) {
                err = {TransportErrorKind::Interrupted, "interrupted", 0};
                return false;
            }
            const std::size_t n = std::min(kSliceBytes, data.size() - done);
            out.write(reinterpret_cast<const char*>(data.data() + done),
                      static_cast<std::streamsize>(n));
            done += n;
        }
        if (!out) {
            err = {TransportErrorKind::Transient, "write to staging part failed", 0};
            return false;
        }
    }
    fs::rename(tmp, dir / std::to_string(range.offset), ec);
    if (ec) {
        err = {TransportErrorKind::Transient, "cannot commit staging part: " + ec.message(), 0};
        return false;
    }
    return true;
}

bool LocalDirTransportClient::finalizeUpload(const UploadTarget& target,
                                             const std::vector<ChunkRange>& parts,
                                             FileReference& out, TransportError& err) {
    if (!ready(err))
        return false;
    if (!safeComponent(target.chat) || !safeComponent(target.upload_id)) {
        err = {TransportErrorKind::Fatal, "invalid upload target", 0};
        return false;
    }
    std::lock_guard<std::mutex> lk(g_finalizeMutex);
    std::error_code ec;
    const fs::path chatDir = root_ / target.chat;
    fs::create_directories(chatDir, ec);
    if (ec) {
        err = {TransportErrorKind::Fatal, "cannot create chat directory: " + ec.message(), 0};
        return false;
    }
    std::int64_t next = 1;
    for (const auto& entry : fs::directory_iterator(chatDir, ec)) {
        const std::string name = entry.path().filename().string();
        if (name.empty() ||
            !std::all_of(name.begin(), name.end(), [](char c) { return c >= '0' && c <= '9'; }))
            continue;
        next = std::max<std::int64_t>(next, std::strtoll(name.c_str(), nullptr, 10) + 1);
    }

    FileReference ref;
    ref.chat = target.chat;
    ref.message_id = next;
    const fs::path dest = fileFor(ref);
    const fs::path staging = stagingFor(target.upload_id);
    {
        std::ofstream o(dest, std::ios::binary | std::ios::trunc);
        if (!o.is_open()) {
            err = {TransportErrorKind::Fatal, "cannot create remote file", 0};
            return false;
        }
        std::uint64_t expected = 0;
        std::vector<char> buf(kSliceBytes);
        for (const auto& p : parts) {
            if (p.offset != expected) {
                o.close();
                fs::remove(dest, ec);
                err = {TransportErrorKind::Fatal, "parts out of order", 0};
                return false;
            }
            std::ifstream in(staging / std::to_string(p.offset), std::ios::binary);
            if (!in.is_open()) {
                o.close();
                fs::remove(dest, ec);
                err = {TransportErrorKind::Fatal,
                       "missing staged part at offset " + std::to_string(p.offset), 0};
                return false;
            }
            while (in) {
                in.read(buf.data(), static_cast<std::streamsize>(buf.size()));
                o.write(buf.data(), in.gcount());
            }
            expected = p.end();
        }
        o.flush();
        if (!o) {
            o.close();
            fs::remove(dest, ec);
            err = {TransportErrorKind::Fatal, "write to remote file failed", 0};
            return false;
        }
    }
    fs::remove_all(staging, ec);
    out = ref;
    return true;
}

std::unique_ptr<TransportClient> LocalDirTransportClient::newConnectionLike(const BackendOptions& opt,
                                                                            TransportError& err) {
    auto conn = std::make_unique<LocalDirTransportClient>();
    if (!conn->connect(opt, err))
        return nullptr;
    return conn;
}

} // namespace mediaferry
