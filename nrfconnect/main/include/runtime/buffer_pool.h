#pragma once

#include <lib/core/CHIPError.h>
#include <lib/support/Span.h>
#include <zephyr/kernel.h>

#include <cstddef>
#include <cstdint>

namespace runtime
{

/**
 * Statically sized pool of byte buffers. Acquire() never blocks: an empty pool
 * reports CHIP_ERROR_NO_MEMORY.
 */
template <size_t kCount, size_t kSize>
class BufferPool
{
public:
    static constexpr size_t kBufferSize = kSize;

    class Handle
    {
    public:
        Handle() = default;
        ~Handle() { Release(); }

        Handle(const Handle &)             = delete;
        Handle & operator=(const Handle &) = delete;

        Handle(Handle && other) : mPool(other.mPool), mIndex(other.mIndex) { other.mPool = nullptr; }

        Handle & operator=(Handle && other)
        {
            if (this != &other)
            {
                Release();
                mPool        = other.mPool;
                mIndex       = other.mIndex;
                other.mPool = nullptr;
            }
            return *this;
        }

        bool IsValid() const { return mPool != nullptr; }
        chip::MutableByteSpan Span() { return chip::MutableByteSpan(mPool->mBuffers[mIndex], kSize); }

        void Release()
        {
            if (mPool != nullptr)
            {
                mPool->Free(mIndex);
                mPool = nullptr;
            }
        }

    private:
        friend class BufferPool;

        BufferPool * mPool = nullptr;
        size_t mIndex      = 0;
    };

    CHIP_ERROR Acquire(Handle & handle)
    {
        handle.Release();

        k_spinlock_key_t key = k_spin_lock(&mLock);
        for (size_t i = 0; i < kCount; i++)
        {
            if (!mInUse[i])
            {
                mInUse[i] = true;
                k_spin_unlock(&mLock, key);
                handle.mPool  = this;
                handle.mIndex = i;
                return CHIP_NO_ERROR;
            }
        }
        k_spin_unlock(&mLock, key);
        return CHIP_ERROR_NO_MEMORY;
    }

    size_t Available()
    {
        size_t available     = 0;
        k_spinlock_key_t key = k_spin_lock(&mLock);
        for (size_t i = 0; i < kCount; i++)
        {
            available += mInUse[i] ? 0 : 1;
        }
        k_spin_unlock(&mLock, key);
        return available;
    }

private:
    void Free(size_t index)
    {
        k_spinlock_key_t key = k_spin_lock(&mLock);
        mInUse[index]        = false;
        k_spin_unlock(&mLock, key);
    }

    uint8_t mBuffers[kCount][kSize];
    bool mInUse[kCount] = {};
    struct k_spinlock mLock = {};
};

} // namespace runtime
