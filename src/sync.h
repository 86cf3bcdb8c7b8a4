// Copyright (c) 2025 The XFactory developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef XFACTORY_SYNC_H
#define XFACTORY_SYNC_H

#include <mutex>
#include <type_traits>

/** Wrapped mutex: supports recursive locking, but no waiting */
typedef std::recursive_mutex CCriticalSection;

#define PASTE(x, y) x ## y
#define PASTE2(x, y) PASTE(x, y)

#define LOCK(cs) std::lock_guard<typename std::decay<decltype(cs)>::type> PASTE2(criticalblock, __COUNTER__)(cs)

#endif // XFACTORY_SYNC_H
