#pragma once

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <mutex>
#include <vector>

namespace http
{

inline constexpr std::size_t kDefaultChunkSize = 16 * 1024;

class ChunkBufferPool;

// Returns the buffer to its pool instead of freeing it.
struct ChunkDeleter
{
    ChunkBufferPool* pool = nullptr;

    void operator()(char* ptr) const;
};

using PooledChunk = std::unique_ptr<char[], ChunkDeleter>;

// Thread-safe free list of fixed-size read buffers shared by all exchanges.
// The pool must outlive every chunk it hands out.
class ChunkBufferPool
{
public:
    explicit ChunkBufferPool(std::size_t chunk_size = kDefaultChunkSize, std::size_t max_retained = 32);

    ChunkBufferPool(const ChunkBufferPool&) = delete;
    ChunkBufferPool& operator=(const ChunkBufferPool&) = delete;

    PooledChunk acquire();

    std::size_t chunkSize() const { return chunk_size_; }

    struct Stats
    {
        std::size_t available;
        std::uint64_t acquisitions;
        std::uint64_t pool_hits;
    };
    Stats stats() const;

private:
    friend struct ChunkDeleter;
    void release(char* buffer);

    const std::size_t chunk_size_;
    const std::size_t max_retained_;

    mutable std::mutex mutex_;
    std::vector<std::unique_ptr<char[]>> free_list_;

    std::atomic<std::uint64_t> acquisitions_{ 0 };
    std::atomic<std::uint64_t> pool_hits_{ 0 };
};

} // namespace http
