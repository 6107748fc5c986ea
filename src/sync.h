// Copyright (c) 2025 The StakePool developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef STAKEPOOL_SYNC_H
#define STAKEPOOL_SYNC_H

#include <atomic>
#include <mutex>
#include <thread>

/*
RecursiveMutex mutex;
    std::recursive_mutex mutex;

LOCK(mutex);
    std::unique_lock<std::recursive_mutex> criticalblock(mutex);

AssertLockHeld(mutex);
    fails (returns false from the enclosing check) when the calling thread
    does not own mutex.
 */

/**
 * Recursive mutex that remembers its owning thread, so that operations which
 * require the pool lock can verify they run under it.
 */
class RecursiveMutex
{
public:
    void lock()
    {
        m_mutex.lock();
        if (m_depth++ == 0) {
            m_owner = std::this_thread::get_id();
        }
    }

    void unlock()
    {
        if (--m_depth == 0) {
            m_owner = std::thread::id();
        }
        m_mutex.unlock();
    }

    bool try_lock()
    {
        if (!m_mutex.try_lock()) return false;
        if (m_depth++ == 0) {
            m_owner = std::this_thread::get_id();
        }
        return true;
    }

    bool IsHeldByCurrentThread() const
    {
        return m_depth > 0 && m_owner == std::this_thread::get_id();
    }

private:
    std::recursive_mutex m_mutex;
    std::atomic<std::thread::id> m_owner{std::thread::id()};
    std::atomic<unsigned int> m_depth{0};
};

typedef std::unique_lock<RecursiveMutex> RecursiveMutexLock;

#define PASTE(x, y) x ## y
#define PASTE2(x, y) PASTE(x, y)

#define LOCK(cs) RecursiveMutexLock PASTE2(criticalblock, __COUNTER__)(cs)

#define AssertLockHeld(cs) AssertLockHeldInternal(#cs, __FILE__, __LINE__, cs)

void AssertLockHeldInternal(const char* pszName, const char* pszFile, int nLine, const RecursiveMutex& cs);

#endif // STAKEPOOL_SYNC_H
