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

#include <QtTest>
#include "../libsforganizer/sorunner.hpp"

class tst_prunner : public QObject
{
    Q_OBJECT

private:
    QList<relayq::ritem> run(cQSL &cmd, bool intrpt = false);

private slots:
    void notfound();
    void notexecutable();
    void linesinorder();
    void mergedstderr();
    void exitcode();
    void unterminated();
    void interrupt();
    void interruptchildren();
    void abnormal();
};

static bool gone(cQStr &pid)
{
    QFile stat("/proc/" % pid % "/stat");
    if(! stat.open(QIODevice::ReadOnly)) return true;
    QBA data(stat.readAll());
    // a killed child left unreaped by its new parent counts as gone
    return data.mid(data.lastIndexOf(')') + 2, 1) == "Z";
}

QList<relayq::ritem> tst_prunner::run(cQSL &cmd, bool intrpt)
{
    QSharedPointer<relayq> rq(new relayq);
    prunner prun(cmd, rq);
    prun.start();
    if(intrpt) prun.kill();
    QList<relayq::ritem> items;
    if(! prun.wait(20000)) return items;
    relayq::ritem item;
    while(rq->take(item)) items.append(item);
    return items;
}

void tst_prunner::notfound()
{
    QList<relayq::ritem> items(run({"/nonexistent/organize_files.sh", "/tmp/src", "/tmp/out"}));
    QCOMPARE(items.count(), 2);
    QCOMPARE(int(items.at(0).type), int(relayq::Chunk));
    QVERIFY(items.at(0).text.startsWith("[ERROR] Script not found: /nonexistent/organize_files.sh\n"));
    QCOMPARE(int(items.at(1).type), int(relayq::Done));
    QCOMPARE(items.at(1).rc, int(so::Notlaunched));
}

void tst_prunner::notexecutable()
{
    QTemporaryDir tdir;
    QVERIFY(tdir.isValid());
    QFile file(tdir.path() % "/verify_integrity.sh");
    QVERIFY(file.open(QIODevice::WriteOnly));
    file.write("#!/bin/sh\necho never\n");
    file.close();
    QVERIFY(file.setPermissions(QFile::ReadOwner | QFile::WriteOwner));

    QList<relayq::ritem> items(run({file.fileName(), tdir.path()}));
    QCOMPARE(items.count(), 2);
    QCOMPARE(int(items.at(0).type), int(relayq::Chunk));
    QCOMPARE(items.at(1).rc, int(so::Notlaunched));
}

void tst_prunner::linesinorder()
{
    QList<relayq::ritem> items(run({"/bin/sh", "-c", "i=1; while [ $i -le 200 ]; do echo line$i; i=$((i+1)); done"}));
    QCOMPARE(items.count(), 201);

    for(ushort a(0) ; a < 200 ; ++a)
    {
        QCOMPARE(int(items.at(a).type), int(relayq::Chunk));
        QCOMPARE(items.at(a).text, QStr("line" % QStr::number(a + 1) % '\n'));
    }

    QCOMPARE(int(items.last().type), int(relayq::Done));
    QCOMPARE(items.last().rc, 0);
}

void tst_prunner::mergedstderr()
{
    QList<relayq::ritem> items(run({"/bin/sh", "-c", "echo out; echo err 1>&2; echo again"}));
    QCOMPARE(items.count(), 4);
    QCOMPARE(items.at(0).text, QStr("out\n"));
    QCOMPARE(items.at(1).text, QStr("err\n"));
    QCOMPARE(items.at(2).text, QStr("again\n"));
    QCOMPARE(items.at(3).rc, 0);
}

void tst_prunner::exitcode()
{
    QList<relayq::ritem> items(run({"/bin/sh", "-c", "echo '[ERROR] Source directory does not exist'; exit 3"}));
    QCOMPARE(items.count(), 2);
    QCOMPARE(int(items.last().type), int(relayq::Done));
    QCOMPARE(items.last().rc, 3);
}

void tst_prunner::unterminated()
{
    QList<relayq::ritem> items(run({"/bin/sh", "-c", "echo first; printf partial"}));
    QCOMPARE(items.count(), 3);
    QCOMPARE(items.at(0).text, QStr("first\n"));
    QCOMPARE(items.at(1).text, QStr("partial"));
    QCOMPARE(items.at(2).rc, 0);
}

void tst_prunner::interrupt()
{
    QElapsedTimer tmr;
    tmr.start();
    QList<relayq::ritem> items(run({"/bin/sh", "-c", "exec sleep 30"}, true));
    QVERIFY(tmr.elapsed() < 20000);
    QVERIFY(items.count() >= 2);
    QCOMPARE(items.at(items.count() - 2).text, QStr("[INFO] Interrupted\n"));
    QCOMPARE(int(items.last().type), int(relayq::Done));
    QCOMPARE(items.last().rc, int(so::Crashed));
}

void tst_prunner::interruptchildren()
{
    QTemporaryDir tdir;
    QVERIFY(tdir.isValid());
    QStr pidfile(tdir.path() % "/child.pid");
    QSharedPointer<relayq> rq(new relayq);
    prunner prun({"/bin/sh", "-c", QStr("sleep 30 & echo $! > '" % pidfile % "'; wait")}, rq);
    prun.start();

    QTRY_VERIFY_WITH_TIMEOUT(QFileInfo(pidfile).size() > 0, 20000);
    QFile file(pidfile);
    QVERIFY(file.open(QIODevice::ReadOnly));
    QStr pid(QStr::fromUtf8(file.readAll()).trimmed());
    QVERIFY(! pid.isEmpty());
    QVERIFY(! gone(pid));

    prun.kill();
    QVERIFY(prun.wait(20000));
    QTRY_VERIFY_WITH_TIMEOUT(gone(pid), 5000);

    relayq::ritem item;
    QList<relayq::ritem> items;
    while(rq->take(item)) items.append(item);
    QCOMPARE(items.count(), 2);
    QCOMPARE(items.at(0).text, QStr("[INFO] Interrupted\n"));
    QCOMPARE(items.at(1).rc, int(so::Crashed));
}

void tst_prunner::abnormal()
{
    QList<relayq::ritem> items(run({"/bin/sh", "-c", "echo before; kill -SEGV $$"}));
    QCOMPARE(items.count(), 3);
    QCOMPARE(items.at(0).text, QStr("before\n"));
    QCOMPARE(items.at(1).text, QStr("[ERROR] /bin/sh terminated abnormally\n"));
    QCOMPARE(int(items.at(2).type), int(relayq::Done));
    QCOMPARE(items.at(2).rc, int(so::Crashed));
}

QTEST_GUILESS_MAIN(tst_prunner)
#include "tst_prunner.moc"
