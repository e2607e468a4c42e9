// Core unit tests without external framework (run via CTest).
#include "mediaferry/ChunkPlan.hpp"
#include "mediaferry/ChunkScheduler.hpp"
#include "mediaferry/FormatUtils.hpp"
#include "mediaferry/LocalDirTransportClient.hpp"
#include "mediaferry/MessageLink.hpp"
#include "mediaferry/MockTransportClient.hpp"
#include "mediaferry/RuntimeLogging.hpp"

#include <csignal>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <random>
#include <string>
#include <vector>

#include <sys/resource.h>

namespace {

struct TestContext {
    int failures = 0;

    void check(bool cond, const std::string &msg) {
        if (!cond) {
            ++failures;
            std::cerr << "[FAIL] " << msg << "\n";
        }
    }

    void checkContains(const std::string &haystack, const std::string &needle,
                       const std::string &msg) {
        check(haystack.find(needle) != std::string::npos, msg);
    }
};

std::vector<std::uint8_t> pattern(std::size_t n) {
    std::vector<std::uint8_t> v(n);
    for (std::size_t i = 0; i < n; ++i)
        v[i] = static_cast<std::uint8_t>((i * 31 + 7) & 0xff);
    return v;
}

mediaferry::BackendOptions optionsFor(const std::string &endpoint, const std::string &token) {
    mediaferry::BackendOptions opt;
    opt.endpoint = endpoint;
    opt.user_id = "alice";
    opt.session_token = token;
    opt.chunk_timeout_ms = 2000;
    return opt;
}

void test_plan_partitions_file(TestContext &t) {
    std::vector<mediaferry::ChunkRange> out;
    std::string err;
    t.check(mediaferry::planChunks(10 * 1024 * 1024, 1024 * 1024, out, err),
            "10 MiB / 1 MiB should plan");
    t.check(out.size() == 10, "10 MiB / 1 MiB should yield 10 chunks");
    t.check(mediaferry::rangesPartition(out, 10 * 1024 * 1024),
            "10 MiB plan should partition the file");

    t.check(mediaferry::planChunks(2500, 1000, out, err), "2500 / 1000 should plan");
    t.check(out.size() == 3, "2500 / 1000 should yield 3 chunks");
    if (out.size() == 3)
        t.check(out[2].offset == 2000 && out[2].length == 500,
                "last chunk should be the 500-byte tail");

    t.check(mediaferry::planChunks(0, 1000, out, err), "empty file should plan");
    t.check(out.empty(), "empty file should yield no chunks");

    err.clear();
    t.check(!mediaferry::planChunks(100, 0, out, err), "zero chunk size should fail");
    t.check(!err.empty(), "zero chunk size should report an error");
}

void test_plan_partition_property(TestContext &t) {
    std::mt19937_64 rng(42);
    for (int i = 0; i < 200; ++i) {
        const std::uint64_t total = rng() % (64ull * 1024 * 1024);
        const std::uint64_t chunk = 1 + rng() % (4ull * 1024 * 1024);
        std::vector<mediaferry::ChunkRange> out;
        std::string err;
        if (!mediaferry::planChunks(total, chunk, out, err)) {
            t.check(false, "random plan failed: " + err);
            continue;
        }
        if (!mediaferry::rangesPartition(out, total) ||
            out.size() != mediaferry::chunkCountFor(total, chunk)) {
            t.check(false, "random plan does not partition total=" + std::to_string(total) +
                               " chunk=" + std::to_string(chunk));
        }
    }
}

void test_ranges_partition_rejects_gaps(TestContext &t) {
    std::vector<mediaferry::ChunkRange> gap = {{0, 10}, {11, 9}};
    t.check(!mediaferry::rangesPartition(gap, 20), "a gap should not partition");
    std::vector<mediaferry::ChunkRange> overlap = {{0, 10}, {5, 15}};
    t.check(!mediaferry::rangesPartition(overlap, 20), "an overlap should not partition");
    std::vector<mediaferry::ChunkRange> shuffled = {{10, 10}, {0, 10}};
    t.check(mediaferry::rangesPartition(shuffled, 20), "unsorted cover should partition");
}

void test_scheduler_hands_out_each_chunk_once(TestContext &t) {
    mediaferry::ChunkScheduler s;
    std::string err;
    t.check(s.plan(3000, 1000, 2, err), "scheduler plan should succeed");
    t.check(s.chunkCount() == 3 && s.pendingCount() == 3, "three chunks should be pending");

    std::size_t a = 0, b = 0, c = 0, d = 0;
    mediaferry::ChunkRange ra, rb, rc, rd;
    t.check(s.next(a, ra) && s.next(b, rb) && s.next(c, rc), "three chunks should be handed out");
    t.check(!s.next(d, rd), "no fourth chunk should exist");
    t.check(s.inFlightCount() == 3, "all chunks should be in flight");
    t.check(a != b && b != c && a != c, "chunks should be distinct");

    t.check(!s.markDone(b), "first completion is not the last");
    t.check(!s.markDone(a), "second completion is not the last");
    t.check(s.markDone(c), "third completion should complete the plan");
    t.check(s.isComplete(), "scheduler should report complete");
    t.check(s.bytesDone() == 3000, "bytesDone should equal the file size");
    t.check(!s.markDone(c), "completing twice should be ignored");
}

void test_scheduler_retry_budget(TestContext &t) {
    mediaferry::ChunkScheduler s;
    std::string err;
    t.check(s.plan(2000, 1000, 2, err), "scheduler plan should succeed");
    std::size_t idx = 0;
    mediaferry::ChunkRange r;

    t.check(s.next(idx, r) && idx == 0, "first chunk should be handed out");
    t.check(!s.markFailed(idx), "first failure should be retried");
    t.check(s.next(idx, r) && idx == 1, "retried chunk goes to the back of the queue");
    t.check(s.markDone(idx) == false, "chunk 1 done");
    t.check(s.next(idx, r) && idx == 0, "chunk 0 should come back");
    t.check(!s.markFailed(idx), "second failure should be retried");
    t.check(s.next(idx, r) && idx == 0, "chunk 0 third attempt");
    t.check(s.markFailed(idx), "third failure should exhaust a budget of 2 retries");
    t.check(s.hasFailed(), "scheduler should report the failed chunk");
    t.check(!s.next(idx, r), "failed scheduler should hand out nothing");
    t.check(s.chunk(0).state == mediaferry::ChunkState::Failed, "chunk 0 should stay Failed");
    t.check(s.chunk(0).attempts == 3 && s.chunk(0).failures == 3,
            "chunk 0 should record three attempts and failures");
}

void test_scheduler_abandon_does_not_count(TestContext &t) {
    mediaferry::ChunkScheduler s;
    std::string err;
    t.check(s.plan(3000, 1000, 0, err), "scheduler plan should succeed");
    std::size_t a = 0, b = 0;
    mediaferry::ChunkRange r;
    t.check(s.next(a, r) && s.next(b, r), "two chunks should be handed out");
    s.abandon(b);
    t.check(s.chunk(b).failures == 0, "abandon should not count a failure");
    std::size_t again = 99;
    t.check(s.next(again, r) && again == b, "abandoned chunk should be handed out first");

    s.abandonInFlight();
    t.check(s.inFlightCount() == 0, "abandonInFlight should clear in-flight chunks");
    t.check(s.pendingCount() == 3, "all chunks should be pending again");
}

void test_scheduler_ordered_parts(TestContext &t) {
    mediaferry::ChunkScheduler s;
    std::string err;
    t.check(s.plan(4000, 1000, 1, err), "scheduler plan should succeed");
    std::vector<std::size_t> order;
    std::size_t idx = 0;
    mediaferry::ChunkRange r;
    while (s.next(idx, r))
        order.push_back(idx);
    for (auto it = order.rbegin(); it != order.rend(); ++it)
        s.markDone(*it);
    const auto parts = s.orderedParts();
    t.check(parts.size() == 4, "all parts should be listed");
    bool ascending = true;
    for (std::size_t i = 0; i < parts.size(); ++i)
        ascending = ascending && parts[i].offset == i * 1000;
    t.check(ascending, "parts should be in ascending offset order");
}

void test_format_helpers(TestContext &t) {
    t.check(mediaferry::formatSize(512) == "512 B", "512 bytes");
    t.check(mediaferry::formatSize(1536) == "1.50 KB", "1.5 KB");
    t.check(mediaferry::formatSize(10ll * 1024 * 1024) == "10.00 MB", "10 MB");
    t.check(mediaferry::formatSize(-5) == "0 B", "negative sizes clamp to zero");
    t.check(mediaferry::formatDuration(0) == "0s", "zero duration");
    t.check(mediaferry::formatDuration(3600) == "1h", "one hour");
    t.check(mediaferry::formatDuration(5025) == "1h 23m 45s", "mixed duration");
    t.check(mediaferry::formatRate(2048.0) == "2.00 KB/s", "rate suffix");
}

void test_message_links(TestContext &t) {
    mediaferry::FileReference ref;
    std::string err;
    t.check(mediaferry::parseMessageLink("https://t.me/somechannel/42", ref, err),
            "public link should parse");
    t.check(ref.chat == "somechannel" && ref.message_id == 42 && !ref.thread_id,
            "public link fields");

    t.check(mediaferry::parseMessageLink("https://t.me/c/123456/7/99?single", ref, err),
            "private thread link should parse");
    t.check(ref.chat == "-100123456" && ref.message_id == 99 && ref.thread_id &&
                *ref.thread_id == 7,
            "private thread link fields");

    t.check(mediaferry::parseFileReference("archive/1000", ref, err), "key form should parse");
    t.check(ref.key() == "archive/1000", "key round trip");
    t.check(mediaferry::parseFileReference("t.me/chan/5/", ref, err),
            "scheme-less link should parse");
    t.check(ref.chat == "chan" && ref.message_id == 5, "scheme-less link fields");

    err.clear();
    t.check(!mediaferry::parseFileReference("archive/-3", ref, err), "negative id rejected");
    t.check(!err.empty(), "rejection should carry an error");
    t.check(!mediaferry::parseMessageLink("https://t.me/c/abc/1", ref, err),
            "non-numeric channel rejected");

    t.check(mediaferry::messageLink("-100123456", 99) == "https://t.me/c/123456/99",
            "private link building");
    t.check(mediaferry::messageLink("-100123456", 99, "chan") == "https://t.me/chan/99",
            "public link building");
}

void test_token_redaction(TestContext &t) {
    const std::string token = "abcdef0123456789abcdef";
    const std::string red = mediaferry::redactToken(token);
    t.check(red.find(token) == std::string::npos, "redacted token should not contain the token");
    t.checkContains(red, "(22 chars)", "redacted token should keep the length");
    t.check(mediaferry::redactToken("") == "<empty>", "empty token placeholder");
    t.check(mediaferry::redactToken("short").find("short") == std::string::npos,
            "short tokens keep no prefix");

    ::setenv("MEDIAFERRY_LOG_SENSITIVE", "yes", 1);
    t.check(mediaferry::redactToken(token) != token, "opt-in alone does not reveal tokens");
    ::setenv("MEDIAFERRY_ENV", "  Dev ", 1);
    t.check(mediaferry::redactToken(token) == token, "dev opt-in logs the full token");
    ::setenv("MEDIAFERRY_ENV", "production", 1);
    t.check(mediaferry::redactToken(token) != token, "production always redacts");
    ::unsetenv("MEDIAFERRY_ENV");
    ::unsetenv("MEDIAFERRY_LOG_SENSITIVE");
}

void test_mock_transport_download(TestContext &t) {
    auto backend = std::make_shared<mediaferry::MockBackend>();
    backend->putFile("chan/1", pattern(5000));
    mediaferry::MockTransportClient proto(backend);
    mediaferry::TransportError err;
    auto c = proto.newConnectionLike(optionsFor("mock", "tok-1"), err);
    t.check(c != nullptr, "mock connection should open");
    if (!c)
        return;
    mediaferry::FileReference ref;
    ref.chat = "chan";
    ref.message_id = 1;
    mediaferry::RemoteFileInfo info;
    t.check(c->stat(ref, info, err) && info.size == 5000, "stat should report the size");
    std::vector<std::uint8_t> out;
    t.check(c->fetchChunk(ref, {1000, 1000}, out, err), "fetchChunk should succeed");
    const auto full = pattern(5000);
    t.check(out == std::vector<std::uint8_t>(full.begin() + 1000, full.begin() + 2000),
            "fetched bytes should match the range");
    t.check(backend->connectionsOpened() == 1, "one connection should be counted");

    ref.message_id = 2;
    err.clear();
    t.check(!c->stat(ref, info, err) && err.kind == mediaferry::TransportErrorKind::NotFound,
            "missing file should be NotFound");
}

void test_mock_transport_failures(TestContext &t) {
    auto backend = std::make_shared<mediaferry::MockBackend>();
    backend->putFile("chan/1", pattern(3000));
    mediaferry::MockTransportClient proto(backend);
    mediaferry::TransportError err;
    auto c = proto.newConnectionLike(optionsFor("mock", "tok-2"), err);
    if (!c) {
        t.check(false, "mock connection should open");
        return;
    }
    mediaferry::FileReference ref{"chan", 1, {}};
    std::vector<std::uint8_t> out;

    backend->failChunkAt(0, 1);
    t.check(!c->fetchChunk(ref, {0, 1000}, out, err) &&
                err.kind == mediaferry::TransportErrorKind::Transient,
            "injected failure should be Transient");
    err.clear();
    t.check(c->fetchChunk(ref, {0, 1000}, out, err), "fault should clear after one use");

    backend->rateLimitNext(1, 300);
    err.clear();
    t.check(!c->fetchChunk(ref, {1000, 1000}, out, err) &&
                err.kind == mediaferry::TransportErrorKind::RateLimited &&
                err.retry_after_ms == 300,
            "rate limit should carry retry_after_ms");

    backend->revokeToken("tok-2");
    err.clear();
    t.check(!c->fetchChunk(ref, {1000, 1000}, out, err) &&
                err.kind == mediaferry::TransportErrorKind::AuthRejected,
            "revoked token should be AuthRejected");
    err.clear();
    t.check(!proto.newConnectionLike(optionsFor("mock", "tok-2"), err) &&
                err.kind == mediaferry::TransportErrorKind::AuthRejected,
            "revoked token should not connect");
    t.check(backend->failuresInjected() == 1, "one injected failure expected");
}

void test_mock_upload_finalize_order(TestContext &t) {
    auto backend = std::make_shared<mediaferry::MockBackend>();
    mediaferry::MockTransportClient proto(backend);
    mediaferry::TransportError err;
    auto c = proto.newConnectionLike(optionsFor("mock", "tok-3"), err);
    if (!c) {
        t.check(false, "mock connection should open");
        return;
    }
    const auto data = pattern(2500);
    mediaferry::UploadTarget target{"archive", "clip.bin", "u-1"};
    const std::vector<mediaferry::ChunkRange> parts = {{0, 1000}, {1000, 1000}, {2000, 500}};
    for (auto it = parts.rbegin(); it != parts.rend(); ++it) {
        std::vector<std::uint8_t> slice(data.begin() + static_cast<std::ptrdiff_t>(it->offset),
                                        data.begin() + static_cast<std::ptrdiff_t>(it->end()));
        t.check(c->pushChunk(target, *it, slice, err), "pushChunk in reverse order");
    }
    mediaferry::FileReference out;
    t.check(c->finalizeUpload(target, parts, out, err), "finalize should succeed");
    t.check(out.key() == "archive/1000", "first upload should land as archive/1000");
    t.check(backend->file(out.key()) == data, "assembled file should match");
}

void test_localdir_transport_round_trip(TestContext &t) {
    namespace fs = std::filesystem;
    const fs::path root =
        fs::temp_directory_path() / ("mediaferry_core_tests_" + std::to_string(std::rand()));
    std::error_code ec;
    fs::remove_all(root, ec);
    fs::create_directories(root / "chan", ec);
    const auto data = pattern(200 * 1024);
    {
        std::ofstream o(root / "chan" / "7", std::ios::binary);
        o.write(reinterpret_cast<const char *>(data.data()),
                static_cast<std::streamsize>(data.size()));
    }

    mediaferry::LocalDirTransportClient proto;
    mediaferry::TransportError err;
    auto c = proto.newConnectionLike(optionsFor(root.string(), "tok-local"), err);
    t.check(c != nullptr, "localdir connection should open: " + err.message);
    if (c) {
        mediaferry::FileReference ref{"chan", 7, {}};
        mediaferry::RemoteFileInfo info;
        t.check(c->stat(ref, info, err) && info.size == data.size(), "localdir stat");
        std::vector<std::uint8_t> out;
        t.check(c->fetchChunk(ref, {100000, 50000}, out, err) && out.size() == 50000,
                "localdir fetchChunk");
        t.check(out == std::vector<std::uint8_t>(data.begin() + 100000, data.begin() + 150000),
                "localdir fetched bytes should match");

        mediaferry::UploadTarget target{"out", "x.bin", "up-1"};
        const std::vector<mediaferry::ChunkRange> parts = {{0, 120 * 1024},
                                                          {120 * 1024, 80 * 1024}};
        for (const auto &p : parts) {
            std::vector<std::uint8_t> slice(data.begin() + static_cast<std::ptrdiff_t>(p.offset),
                                            data.begin() + static_cast<std::ptrdiff_t>(p.end()));
            t.check(c->pushChunk(target, p, slice, err), "localdir pushChunk");
        }
        mediaferry::FileReference outRef;
        t.check(c->finalizeUpload(target, parts, outRef, err), "localdir finalize");
        t.check(outRef.key() == "out/1", "first message in a new chat should be 1");
        t.check(fs::file_size(root / "out" / "1", ec) == data.size(),
                "localdir uploaded size should match");
        t.check(!fs::exists(root / ".uploads" / "up-1"), "staging should be removed");

        {
            std::ofstream rev(root / ".revoked");
            rev << "tok-local\n";
        }
        err.clear();
        t.check(!c->stat(ref, info, err) &&
                    err.kind == mediaferry::TransportErrorKind::AuthRejected,
                "revoked token should be rejected by localdir");
    }
    fs::remove_all(root, ec);
}

void test_localdir_failed_finalize_leaves_no_message(TestContext &t) {
    namespace fs = std::filesystem;
    const fs::path root =
        fs::temp_directory_path() / ("mediaferry_core_fin_" + std::to_string(std::rand()));
    std::error_code ec;
    fs::remove_all(root, ec);
    fs::create_directories(root, ec);

    mediaferry::LocalDirTransportClient proto;
    mediaferry::TransportError err;
    auto c = proto.newConnectionLike(optionsFor(root.string(), "tok-local"), err);
    t.check(c != nullptr, "localdir connection should open: " + err.message);
    if (!c)
        return;

    const auto data = pattern(12000);
    mediaferry::UploadTarget target{"out", "big.bin", "up-2"};
    std::vector<mediaferry::ChunkRange> parts;
    for (std::uint64_t off = 0; off < data.size(); off += 3000) {
        const mediaferry::ChunkRange p{off, 3000};
        std::vector<std::uint8_t> slice(data.begin() + static_cast<std::ptrdiff_t>(p.offset),
                                        data.begin() + static_cast<std::ptrdiff_t>(p.end()));
        t.check(c->pushChunk(target, p, slice, err), "staging a part should succeed");
        parts.push_back(p);
    }

    // A missing part aborts the commit.
    mediaferry::FileReference outRef;
    std::vector<mediaferry::ChunkRange> gap = parts;
    gap.push_back({12000, 10});
    t.check(!c->finalizeUpload(target, gap, outRef, err), "missing staged part should fail");
    t.check(!fs::exists(root / "out" / "1"), "no message after a missing part");

    // The commit cannot write past the file size limit.
    struct rlimit saved {};
    if (::getrlimit(RLIMIT_FSIZE, &saved) == 0) {
        auto prevHandler = std::signal(SIGXFSZ, SIG_IGN);
        struct rlimit small = saved;
        small.rlim_cur = 4096;
        if (::setrlimit(RLIMIT_FSIZE, &small) == 0) {
            err.clear();
            const bool ok = c->finalizeUpload(target, parts, outRef, err);
            ::setrlimit(RLIMIT_FSIZE, &saved);
            t.check(!ok, "finalize should fail when the write fails");
            t.checkContains(err.message, "write", "error should name the failed write");
            t.check(!fs::exists(root / "out" / "1"), "no partial message after a failed write");
        }
        std::signal(SIGXFSZ, prevHandler);
    }

    err.clear();
    t.check(c->finalizeUpload(target, parts, outRef, err) && outRef.key() == "out/1",
            "finalize succeeds once the parts can be written");
    t.check(fs::file_size(root / "out" / "1", ec) == data.size(), "committed size should match");
    fs::remove_all(root, ec);
}

} // namespace

int main() {
    TestContext t;
    test_plan_partitions_file(t);
    test_plan_partition_property(t);
    test_ranges_partition_rejects_gaps(t);
    test_scheduler_hands_out_each_chunk_once(t);
    test_scheduler_retry_budget(t);
    test_scheduler_abandon_does_not_count(t);
    test_scheduler_ordered_parts(t);
    test_format_helpers(t);
    test_message_links(t);
    test_token_redaction(t);
    test_mock_transport_download(t);
    test_mock_transport_failures(t);
    test_mock_upload_finalize_order(t);
    test_localdir_transport_round_trip(t);
    test_localdir_failed_finalize_leaves_no_message(t);

    if (t.failures != 0) {
        std::cerr << "[FAILURES] " << t.failures << "\n";
        return EXIT_FAILURE;
    }
    std::cout << "[OK] mediaferry_core_tests\n";
    return EXIT_SUCCESS;
}
