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

#include "sopipeline.hpp"

pipeline::pipeline(ushort intrvl, QObject *parent) : QObject(parent), intrvl(intrvl), busy(false) {}

pipeline::~pipeline()
{
    if(prun)
    {
        prun->kill();
        prun->wait();
        delete prun;
    }
}

bool pipeline::start(cQSL &cmd)
{
    if(busy) return false;
    busy = true;
    if(drnr) drnr->deleteLater();
    QSharedPointer<relayq> rq(new relayq);
    drnr = new drainer(rq, intrvl, this);
    connect(drnr, SIGNAL(output(QString)), this, SIGNAL(output(QString)));
    connect(drnr, SIGNAL(completed(int)), this, SLOT(finished(int)));
    prun = new prunner(cmd, rq);
    connect(prun, SIGNAL(finished()), prun, SLOT(deleteLater()));
    prun->start();
    drnr->start();
    return true;
}

// Nothing is launched unless the paths are valid
uchar pipeline::organize(cQStr &script, cQStr &src, cQStr &out)
{
    uchar rv(so::chkorganize(src, out));
    return rv != so::Valid ? rv : start({script, src, out}) ? so::Valid : so::Busy;
}

uchar pipeline::verify(cQStr &script, cQStr &dir)
{
    uchar rv(so::chkverify(dir));
    return rv != so::Valid ? rv : start({script, dir}) ? so::Valid : so::Busy;
}

QFuture<int> pipeline::result()
{
    return drnr ? drnr->result() : QFuture<int>();
}

void pipeline::kill()
{
    if(prun) prun->kill();
}

void pipeline::finished(int rc)
{
    busy = false;
    emit completed(rc);
}
