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

#include "sorunner.hpp"
#include <QProcess>
#include <signal.h>
#include <unistd.h>

// The script and everything it starts share one process group
class gproc : public QProcess
{
protected:
    void setupChildProcess()
    {
        setpgid(0, 0);
    }
};

prunner::prunner(cQSL &cmd, const QSharedPointer<relayq> &queue) : cmd(cmd), rq(queue), intrpt(0) {}

void prunner::kill()
{
    intrpt.storeRelease(1);
}

void prunner::run()
{
    if(cmd.isEmpty())
    {
        rq->put("[ERROR] Script not found: \n" % tr("Empty command") % '\n');
        rq->done(so::Notlaunched);
        return;
    }

    gproc proc;
    proc.setProcessChannelMode(QProcess::MergedChannels);
    proc.start(cmd.first(), cmd.mid(1), QIODevice::ReadOnly);

    if(! proc.waitForStarted(-1))
    {
        rq->put("[ERROR] Script not found: " % cmd.first() % '\n' % proc.errorString() % '\n');
        rq->done(so::Notlaunched);
        return;
    }

    auto kgroup([&proc] {
            if(proc.processId() > 0) ::kill(-proc.processId(), SIGKILL);
            proc.kill();
        });

    auto flush([&] {
            while(proc.canReadLine()) rq->put(QStr::fromUtf8(proc.readLine()));
        });

    for(;;)
    {
        bool fnshd(proc.waitForFinished(50));
        flush();
        if(fnshd) break;

        if(proc.error() == QProcess::ReadError || proc.state() == QProcess::NotRunning)
        {
            rq->put("[ERROR] Running command failed: " % proc.errorString() % '\n');

            if(proc.state() != QProcess::NotRunning)
            {
                kgroup();
                proc.waitForFinished(-1);
            }

            rq->done(so::Failed);
            return;
        }

        if(intrpt.loadAcquire() == 1 && proc.state() == QProcess::Running) kgroup();
    }

    { QBA rest(proc.readAll());
    if(! rest.isEmpty()) rq->put(QStr::fromUtf8(rest)); }

    if(proc.exitStatus() == QProcess::CrashExit)
    {
        rq->put(intrpt.loadAcquire() == 1 ? QStr("[INFO] Interrupted\n") : QStr("[ERROR] " % cmd.first() % ' ' % tr("terminated abnormally") % '\n'));
        rq->done(so::Crashed);
    }
    else
        rq->done(proc.exitCode());
}
