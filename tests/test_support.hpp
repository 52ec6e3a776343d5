#pragma once

#include <algorithm>
#include <atomic>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <random>
#include <sstream>
#include <string>
#include <vector>

#include "cache.hpp"
#include "cancellation.hpp"
#include "checksum.hpp"
#include "errors.hpp"
#include "progress.hpp"
#include "source.hpp"

/**
 * Fresh directory under the system temp dir, removed on destruction.
 */
class TempDir
{
public:
    TempDir()
    {
        std::random_device rd;
        std::mt19937_64 gen(rd());
        path_ = std::filesystem::temp_directory_path() /
                ("xget_test_" + std::to_string(gen()));
        std::filesystem::create_directories(path_);
    }

    ~TempDir()
    {
        std::error_code ec;
        std::filesystem::remove_all(path_, ec);
    }

    TempDir(const TempDir &) = delete;
    TempDir &operator=(const TempDir &) = delete;

    const std::filesystem::path &path() const { return path_; }
    std::filesystem::path operator/(const std::string &name) const { return path_ / name; }

private:
    std::filesystem::path path_;
};

inline void writeFile(const std::filesystem::path &path, const std::string &content)
{
    std::filesystem::create_directories(path.parent_path());
    std::ofstream out(path, std::ios::binary | std::ios::trunc);
    out << content;
}

inline std::string readFile(const std::filesystem::path &path)
{
    std::ifstream in(path, std::ios::binary);
    std::ostringstream content;
    content << in.rdbuf();
    return content.str();
}

inline std::string sha256Of(const std::string &content)
{
    Sha256Hasher hasher;
    hasher.update(content.data(), content.size());
    return hasher.finalHex();
}

/**
 * Deterministic, non-repeating payload of `size` bytes.
 */
inline std::string makePayload(std::size_t size)
{
    std::string payload(size, '\0');
    for (std::size_t i = 0; i < size; ++i)
    {
        payload[i] = static_cast<char>((i * 31 + i / 7) & 0xFF);
    }
    return payload;
}

/**
 * Server-side state of an in-memory object, shared by every FakeSource
 * opened on it. Records what was asked for.
 */
struct FakeRemote
{
    std::string content;
    bool honorRange = true;
    std::size_t chunkSize = 10;

    // The next `failingOpens` opens stop with a transport error after
    // delivering `failAfterBytes` bytes
    int failingOpens = 0;
    std::int64_t failAfterBytes = 0;

    // Fire this token once `cancelAfterBytes` bytes were delivered in one open
    CancellationToken *cancelToken = nullptr;
    std::int64_t cancelAfterBytes = -1;

    // When false, size() fails like a server that rejects HEAD
    bool sizeKnown = true;

    std::mutex mutex;
    std::vector<std::int64_t> offsets;
    int sizeCalls = 0;
    std::int64_t bytesServed = 0;

    int opens()
    {
        std::lock_guard<std::mutex> lock(mutex);
        return static_cast<int>(offsets.size());
    }
};

class FakeSource : public Source
{
public:
    explicit FakeSource(std::shared_ptr<FakeRemote> remote) : remote_(std::move(remote)) {}

    std::int64_t open(std::int64_t offset, ByteSink &sink, const CancellationToken &token) override
    {
        bool fail = false;
        {
            std::lock_guard<std::mutex> lock(remote_->mutex);
            remote_->offsets.push_back(offset);
            if (remote_->failingOpens > 0)
            {
                --remote_->failingOpens;
                fail = true;
            }
        }
        token.throwIfCancelled();

        const auto total = static_cast<std::int64_t>(remote_->content.size());
        std::int64_t start = remote_->honorRange ? offset : 0;
        if (start > total)
        {
            throw RangeNotSatisfiableError("range not satisfiable");
        }
        sink.begin(start, total);

        std::int64_t delivered = 0;
        for (std::int64_t pos = start; pos < total;)
        {
            if (fail && delivered >= remote_->failAfterBytes)
            {
                throw XgetError(ErrorKind::Transport, "connection reset by peer");
            }
            auto length = std::min<std::int64_t>(static_cast<std::int64_t>(remote_->chunkSize), total - pos);
            sink.write(remote_->content.data() + pos, static_cast<std::size_t>(length));
            pos += length;
            delivered += length;
            {
                std::lock_guard<std::mutex> lock(remote_->mutex);
                remote_->bytesServed += length;
            }
            if (remote_->cancelToken && remote_->cancelAfterBytes >= 0 &&
                delivered >= remote_->cancelAfterBytes)
            {
                remote_->cancelToken->cancel();
            }
        }
        if (fail)
        {
            throw XgetError(ErrorKind::Transport, "connection reset by peer");
        }
        return total;
    }

    std::int64_t size(const CancellationToken &token) override
    {
        token.throwIfCancelled();
        {
            std::lock_guard<std::mutex> lock(remote_->mutex);
            ++remote_->sizeCalls;
        }
        if (!remote_->sizeKnown)
        {
            throw XgetError(ErrorKind::Transport, "HEAD not allowed");
        }
        return static_cast<std::int64_t>(remote_->content.size());
    }

    std::string describe() const override { return "fake://object"; }

private:
    std::shared_ptr<FakeRemote> remote_;
};

/**
 * Opener for a single in-memory object, counting calls.
 */
inline SourceOpener fakeOpener(std::shared_ptr<FakeRemote> remote,
                               std::shared_ptr<std::atomic<int>> calls = nullptr)
{
    return [remote, calls](const std::string &) -> std::unique_ptr<Source>
    {
        if (calls)
        {
            ++*calls;
        }
        return std::make_unique<FakeSource>(remote);
    };
}

/**
 * In-memory content cache.
 */
class FakeCache : public ContentCache
{
public:
    bool fetch(const std::string &digest, const std::filesystem::path &destination,
               const CancellationToken &token) override
    {
        token.throwIfCancelled();
        std::lock_guard<std::mutex> lock(mutex_);
        ++fetches;
        if (fetchError)
        {
            throw XgetError(*fetchError, "cache unavailable");
        }
        auto it = objects.find(digest);
        if (it == objects.end())
        {
            return false;
        }
        if (sha256Of(it->second) != digest)
        {
            throw XgetError(ErrorKind::Integrity, "cache object is corrupt");
        }
        writeFile(destination, it->second);
        return true;
    }

    void store(const std::string &digest, const std::filesystem::path &file,
               const CancellationToken &) override
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (storeError)
        {
            throw XgetError(ErrorKind::Transport, "PUT failed");
        }
        objects[digest] = readFile(file);
        stored.push_back(digest);
    }

    std::map<std::string, std::string> objects;
    std::vector<std::string> stored;
    std::optional<ErrorKind> fetchError;
    bool storeError = false;
    int fetches = 0;

private:
    std::mutex mutex_;
};

/**
 * Progress sink remembering what it was told.
 */
class RecordingProgress : public ProgressSink
{
public:
    void start(const std::string &, std::int64_t totalSize, std::int64_t alreadyStaged) override
    {
        std::lock_guard<std::mutex> lock(mutex_);
        total = totalSize;
        staged = alreadyStaged;
        ++starts;
    }

    void advance(const std::string &, std::size_t bytes) override
    {
        std::lock_guard<std::mutex> lock(mutex_);
        advanced += static_cast<std::int64_t>(bytes);
    }

    void finish(const std::string &, bool success) override
    {
        std::lock_guard<std::mutex> lock(mutex_);
        finishedOk = success;
        ++finishes;
    }

    std::int64_t total = -1;
    std::int64_t staged = 0;
    std::int64_t advanced = 0;
    int starts = 0;
    int finishes = 0;
    bool finishedOk = false;

private:
    std::mutex mutex_;
};
