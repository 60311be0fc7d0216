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

#ifndef SORELAY_HPP
#define SORELAY_HPP

#include "solib.hpp"
#include <QMutex>
#include <QQueue>

// Single producer, single consumer channel between a runner thread and the UI thread
class SHARED_EXPORT_IMPORT relayq
{
public:
    enum { Chunk = 0, Done = 1 };

    struct ritem
    {
        QStr text;
        int rc;
        uchar type;
    };

    relayq();

    void put(cQStr &txt);
    void done(int rc);
    bool take(ritem &item);
    bool isdone() const;

private:
    mutable QMutex mtx;
    QQueue<ritem> items;
    bool fnshd;
};

#endif
