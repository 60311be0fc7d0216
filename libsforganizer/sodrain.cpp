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

#include "sodrain.hpp"

drainer::drainer(const QSharedPointer<relayq> &queue, ushort intrvl, QObject *parent) : QObject(parent), rq(queue), active(false)
{
    ptimer.setSingleShot(true);
    ptimer.setInterval(intrvl);
    connect(&ptimer, SIGNAL(timeout()), this, SLOT(poll()));
    rslt.reportStarted();
}

drainer::~drainer()
{
    if(! rslt.isFinished())
    {
        rslt.reportCanceled();
        rslt.reportFinished();
    }
}

void drainer::start()
{
    if(active || rslt.isFinished()) return;
    active = true;
    ptimer.start();
}

void drainer::poll()
{
    relayq::ritem item;

    while(rq->take(item))
    {
        if(item.type == relayq::Done)
        {
            active = false;
            rslt.reportResult(item.rc);
            rslt.reportFinished();
            emit completed(item.rc);
            return;
        }

        emit output(item.text);
    }

    ptimer.start();
}
