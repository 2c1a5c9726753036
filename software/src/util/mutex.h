/*
 * Copyright (C) 2018 Mark Hills <mark@xwax.org>
 * Copyright (C) 2024-2026 Niklas Klügel <lodsb@lodsb.org>
 *
 * This program is free software; you can redistribute it and/or
 * modify it under the terms of the GNU General Public License
 * version 2, as published by the Free Software Foundation.
 *
 * This program is distributed in the hope that it will be useful, but
 * WITHOUT ANY WARRANTY; without even the implied warranty of
 * MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE. See the GNU
 * General Public License version 2 for more details.
 *
 * You should have received a copy of the GNU General Public License
 * version 2 along with this program; if not, write to the Free
 * Software Foundation, Inc., 51 Franklin Street, Fifth Floor, Boston,
 * MA 02110-1301, USA.
 *
 */

/*
 * Thin pthread mutex helpers
 *
 * Failure of any of these calls means a corrupted or misused mutex,
 * so they abort rather than return an error.
 */

#pragma once

#include <cerrno>
#include <cstdio>
#include <cstdlib>
#include <pthread.h>

namespace icmd {

using mutex = pthread_mutex_t;

// Recursive: the owner may lock again (multi-step bus operations)
inline void mutex_init_recursive(mutex* m)
{
    pthread_mutexattr_t attr;

    if (pthread_mutexattr_init(&attr) != 0)
        abort();
    if (pthread_mutexattr_settype(&attr, PTHREAD_MUTEX_RECURSIVE) != 0)
        abort();
    if (pthread_mutex_init(m, &attr) != 0)
        abort();

    pthread_mutexattr_destroy(&attr);
}

inline void mutex_clear(mutex* m)
{
    int r = pthread_mutex_destroy(m);
    if (r != 0) {
        errno = r;
        perror("pthread_mutex_destroy");
        abort();
    }
}

inline void mutex_lock(mutex* m)
{
    if (pthread_mutex_lock(m) != 0)
        abort();
}

inline void mutex_unlock(mutex* m)
{
    if (pthread_mutex_unlock(m) != 0)
        abort();
}

//
// Scoped lock, released on every return path
//
class MutexGuard {
public:
    explicit MutexGuard(mutex* m) : m_(m) { mutex_lock(m_); }
    ~MutexGuard() { mutex_unlock(m_); }

    MutexGuard(const MutexGuard&) = delete;
    MutexGuard& operator=(const MutexGuard&) = delete;

private:
    mutex* m_;
};

} // namespace icmd
