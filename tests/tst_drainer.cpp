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
#include "../libsforganizer/sodrain.hpp"

class tst_drainer : public QObject
{
    Q_OBJECT

private slots:
    void ordered();
    void emptyticks();
    void futureresult();
    void startonce();
};

void tst_drainer::ordered()
{
    QSharedPointer<relayq> rq(new relayq);
    for(ushort a(0) ; a < 50 ; ++a) rq->put("line" % QStr::number(a) % '\n');
    rq->done(0);
    drainer drnr(rq, 10);
    QSL events;
    connect(&drnr, &drainer::output, [&events](const QString &txt) { events.append("chunk:" % txt); });
    connect(&drnr, &drainer::completed, [&events](int rc) { events.append("done:" % QStr::number(rc)); });
    drnr.start();

    QTRY_COMPARE(events.count(), 51);
    QTest::qWait(100);
    QCOMPARE(events.count(), 51);
    for(ushort a(0) ; a < 50 ; ++a) QCOMPARE(events.at(a), QStr("chunk:line" % QStr::number(a) % '\n'));
    QCOMPARE(events.last(), QStr("done:0"));
    QVERIFY(! drnr.isactive());
}

void tst_drainer::emptyticks()
{
    QSharedPointer<relayq> rq(new relayq);
    drainer drnr(rq, 10);
    QSignalSpy output(&drnr, SIGNAL(output(QString)));
    QSignalSpy completed(&drnr, SIGNAL(completed(int)));
    drnr.start();

    QTest::qWait(60);
    QVERIFY(drnr.isactive());
    QCOMPARE(output.count(), 0);
    rq->put("[INFO] Script started\n");
    QTRY_COMPARE(output.count(), 1);
    QCOMPARE(output.at(0).at(0).toString(), QStr("[INFO] Script started\n"));
    QCOMPARE(completed.count(), 0);
    rq->done(1);
    QTRY_COMPARE(completed.count(), 1);
    QCOMPARE(completed.at(0).at(0).toInt(), 1);
}

void tst_drainer::futureresult()
{
    QSharedPointer<relayq> rq(new relayq);
    drainer drnr(rq, 10);
    QFuture<int> rslt(drnr.result());
    drnr.start();
    QVERIFY(! rslt.isFinished());
    rq->put("checking\n");
    rq->done(42);

    QTRY_VERIFY(rslt.isFinished());
    QVERIFY(! rslt.isCanceled());
    QCOMPARE(rslt.result(), 42);
}

void tst_drainer::startonce()
{
    QSharedPointer<relayq> rq(new relayq);
    rq->done(0);
    drainer drnr(rq, 10);
    QSignalSpy completed(&drnr, SIGNAL(completed(int)));
    drnr.start();
    QTRY_COMPARE(completed.count(), 1);
    drnr.start();
    QTest::qWait(60);
    QCOMPARE(completed.count(), 1);
}

QTEST_GUILESS_MAIN(tst_drainer)
#include "tst_drainer.moc"
