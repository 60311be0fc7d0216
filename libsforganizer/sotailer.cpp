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

#include "sotailer.hpp"
#include <QFile>

ltailer::ltailer(ushort intrvl, QObject *parent) : QObject(parent), running(false)
{
    ttimer.setSingleShot(true);
    ttimer.setInterval(intrvl);
    connect(&ttimer, SIGNAL(timeout()), this, SLOT(tick()));
}

void ltailer::start(cQSL &paths)
{
    lpaths = paths;
    tpos.clear();
    tdec.clear();

    for(cQStr &path : lpaths)
    {
        tpos.insert(path, 0);
        tdec.insert(path, QSharedPointer<QTextDecoder>(QTextCodec::codecForName("UTF-8")->makeDecoder()));
    }
    running = true;
    tick();
}

void ltailer::stop()
{
    running = false;
    ttimer.stop();
}

void ltailer::tick()
{
    if(! running) return;
    QSL parts;

    for(cQStr &path : lpaths)
    {
        QFile file(path);
        if(! file.open(QIODevice::ReadOnly)) continue;
        qint64 &pos(tpos[path]);
        QSharedPointer<QTextDecoder> &dec(tdec[path]);

        if(pos > file.size())
        {
            pos = 0;
            dec.reset(QTextCodec::codecForName("UTF-8")->makeDecoder());
        }

        if(! file.seek(pos)) continue;
        // an incomplete multibyte sequence stays in the decoder until the next read
        QStr txt(dec->toUnicode(file.readAll()));
        if(! txt.isEmpty()) parts.append("--- " % QFileInfo(path).fileName() % " ---\n" % txt % '\n');
        pos = file.pos();
    }

    if(! parts.isEmpty()) emit output(parts.join('\n'));
    ttimer.start();
}
