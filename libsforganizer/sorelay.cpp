/*
 * Copyright(C) 2026, The Sforganizer developers
 *
 * This file is part of Sforganizer.
 *
 * Sforganizer is free software; you can redistribute it and/or modify
 * it under the terms of the GNU General Public License as published by
 * the Free Software Foundation; either version 3 of the License, or
 * (at your option) any later version.
 *
 * Sforganizer is distributed in the hope that it will be useful,
 * but WITHOUT ANY WARRANTY; without even the implied warranty of
 * MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
 * GNU General Public License for more details.
 *
 * You should have received a copy of the GNU General Public License
 * along with Sforganizer. If not, see <http://www.gnu.org/licenses/>.
 */

#include "sorelay.hpp"
#include <QMutexLocker>

relayq::relayq() : fnshd(false) {}

void relayq::put(cQStr &txt)
{
    QMutexLocker lckr(&mtx);
    if(! fnshd) items.enqueue({txt, 0, Chunk});
}

void relayq::done(int rc)
{
    QMutexLocker lckr(&mtx);
    if(fnshd) return;
    items.enqueue({QStr(), rc, Done});
    fnshd = true;
}

bool relayq::take(ritem &item)
{
    QMutexLocker lckr(&mtx);
    if(items.isEmpty()) return false;
    item = items.dequeue();
    return true;
}

bool relayq::isdone() const
{
    QMutexLocker lckr(&mtx);
    return fnshd;
}
