// Copyright (c) 2009-2010 Satoshi Nakamoto
// Copyright (c) 2009-2016 The Bitcoin Core developers
// Copyright (c) 2026 The LinkedToken developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef LINKEDTOKEN_SYNC_H
#define LINKEDTOKEN_SYNC_H

#include <condition_variable>
#include <mutex>
#include <type_traits>

////////////////////////////////////////////////
//                                            //
// THE SIMPLE DEFINITION, EXCLUDING DEBUG CODE //
//                                            //
////////////////////////////////////////////////

/*
RecursiveMutex mutex;
    std::recursive_mutex mutex;

Mutex mutex;
    std::mutex mutex;

LOCK(mutex);
    std::unique_lock<std::recursive_mutex> criticalblock(mutex);

LOCK2(mutex1, mutex2);
    std::unique_lock<std::recursive_mutex> criticalblock1(mutex1);
    std::unique_lock<std::recursive_mutex> criticalblock2(mutex2);
 */

/** Wrapped mutex: supports recursive locking, but no waiting */
typedef std::recursive_mutex RecursiveMutex;

/** Wrapped mutex: supports waiting but not recursive locking */
typedef std::mutex Mutex;

/** Wrapper around std::unique_lock style lock for Mutex. */
template <typename MutexType>
class UniqueLock : public std::unique_lock<MutexType>
{
    typedef std::unique_lock<MutexType> Base;

public:
    explicit UniqueLock(MutexType& mutexIn) : Base(mutexIn) {}
    UniqueLock(MutexType& mutexIn, std::try_to_lock_t t) : Base(mutexIn, t) {}

    operator bool() const
    {
        return Base::owns_lock();
    }
};

#define PASTE(x, y) x ## y
#define PASTE2(x, y) PASTE(x, y)

#define LOCK(cs) UniqueLock<typename std::decay<decltype(cs)>::type> PASTE2(criticalblock, __COUNTER__)(cs)
#define LOCK2(cs1, cs2)                                                           \
    UniqueLock<typename std::decay<decltype(cs1)>::type> criticalblock1(cs1);    \
    UniqueLock<typename std::decay<decltype(cs2)>::type> criticalblock2(cs2);
#define TRY_LOCK(cs, name) UniqueLock<typename std::decay<decltype(cs)>::type> name(cs, std::try_to_lock)
#define WAIT_LOCK(cs, name) UniqueLock<typename std::decay<decltype(cs)>::type> name(cs)

#endif // LINKEDTOKEN_SYNC_H
