#ifndef DEEPEQ_READER_WRITER_LOCK_HPP
#define DEEPEQ_READER_WRITER_LOCK_HPP

#include <deepeq/meta/CacheLineSize.hpp>

#include <atomic>
#include <cstdint>

namespace deepeq {

enum class ReaderWriterLockType { READ, WRITE };

/**
 * @brief ReaderWriterLock is multi-reader-multi-writer atomic lock meant to protect a resource
 * in situations where the thread is not allowed to block.
 *
 * The lock is implemented using atomic CAS-loops on a counter, which is
 * incremented (/decremented) when a thread acquires a read (/write) lock, and
 * decremented (/incremented) when the thread releases the read (/write) lock.
 *
 * N.B. The lock is unlocked when the counter reaches 0.
 */
class ReaderWriterLock {
    alignas(kCacheLine) mutable std::atomic<std::int64_t> _activeReaderCount{0};

public:
    ReaderWriterLock() = default;

    template<ReaderWriterLockType lockType>
    std::int64_t lock() const noexcept {
        std::int64_t expected = _activeReaderCount.load(std::memory_order_relaxed);
        if constexpr (lockType == ReaderWriterLockType::READ) {
            do {
                if (expected < 0L) {
                    expected = 0L;
                }
            } while (!_activeReaderCount.compare_exchange_strong(expected, expected + 1L));
            return expected + 1L;
        } else {
            do {
                if (expected > 0L) {
                    expected = 0L;
                }
            } while (!_activeReaderCount.compare_exchange_strong(expected, expected - 1L));
            return expected - 1L;
        }
    }

    template<ReaderWriterLockType lockType>
    std::int64_t unlock() const noexcept {
        if constexpr (lockType == ReaderWriterLockType::READ) {
            return _activeReaderCount.fetch_sub(1L) - 1L;
        } else {
            return _activeReaderCount.fetch_add(1L) + 1L;
        }
    }

    template<ReaderWriterLockType lockType>
    class ScopedLock { // NOSONAR - class destructor is needed for guard functionality
        const ReaderWriterLock* _readWriteLock;

    public:
        ScopedLock()                             = delete;
        ScopedLock(const ScopedLock&)            = delete;
        ScopedLock(ScopedLock&&)                 = delete;
        ScopedLock& operator=(const ScopedLock&) = delete;
        ScopedLock& operator=(ScopedLock&&)      = delete;

        explicit constexpr ScopedLock(const ReaderWriterLock& parent) noexcept : _readWriteLock(&parent) { _readWriteLock->lock<lockType>(); }

        ~ScopedLock() { _readWriteLock->unlock<lockType>(); }
    };

    template<ReaderWriterLockType lockType>
    [[nodiscard]] ScopedLock<lockType> scopedGuard() const {
        return ScopedLock<lockType>(*this);
    }
};

} // namespace deepeq

#endif // DEEPEQ_READER_WRITER_LOCK_HPP
