#include "ChunkBufferPool.hpp"

namespace http
{

void ChunkDeleter::operator()(char* ptr) const
{
    if (!ptr)
        return;
    if (pool)
        pool->release(ptr);
    else
        delete[] ptr;
}

ChunkBufferPool::ChunkBufferPool(std::size_t chunk_size, std::size_t max_retained)
    : chunk_size_(chunk_size == 0 ? kDefaultChunkSize : chunk_size)
    , max_retained_(max_retained)
{
}

PooledChunk ChunkBufferPool::acquire()
{
    acquisitions_.fetch_add(1, std::memory_order_relaxed);

    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!free_list_.empty())
        {
            char* raw = free_list_.back().release();
            free_list_.pop_back();
            pool_hits_.fetch_add(1, std::memory_order_relaxed);
            return PooledChunk(raw, ChunkDeleter{ this });
        }
    }

    return PooledChunk(new char[chunk_size_], ChunkDeleter{ this });
}

void ChunkBufferPool::release(char* buffer)
{
    std::unique_ptr<char[]> owned(buffer);
    std::lock_guard<std::mutex> lock(mutex_);
    if (free_list_.size() < max_retained_)
        free_list_.push_back(std::move(owned));
}

ChunkBufferPool::Stats ChunkBufferPool::stats() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return Stats{ free_list_.size(), acquisitions_.load(std::memory_order_relaxed),
                  pool_hits_.load(std::memory_order_relaxed) };
}

} // namespace http
