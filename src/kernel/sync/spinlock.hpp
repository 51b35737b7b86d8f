#pragma once

namespace ksync {

// Test-and-set spinlock. Acquire ordering on lock, release on unlock.
class Spinlock {
public:
    void lock() {
        while (__atomic_test_and_set(&locked_, __ATOMIC_ACQUIRE)) {
            while (__atomic_load_n(&locked_, __ATOMIC_RELAXED)) {
                asm volatile("pause");
            }
        }
    }

    bool try_lock() {
        return !__atomic_test_and_set(&locked_, __ATOMIC_ACQUIRE);
    }

    void unlock() {
        __atomic_clear(&locked_, __ATOMIC_RELEASE);
    }

private:
    bool locked_ = false;
};

class SpinlockGuard {
public:
    explicit SpinlockGuard(Spinlock& lock) : lock_(lock) {
        lock_.lock();
    }
    ~SpinlockGuard() {
        lock_.unlock();
    }

    SpinlockGuard(const SpinlockGuard&) = delete;
    SpinlockGuard& operator=(const SpinlockGuard&) = delete;

private:
    Spinlock& lock_;
};

}  // namespace ksync
