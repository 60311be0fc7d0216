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
#include "../libsforganizer/sorelay.hpp"

namespace {

class producer : public QThread
{
public:
    producer(relayq &queue, ushort count) : rq(queue), cnt(count) {}

protected:
    void run()
    {
        for(ushort a(0) ; a < cnt ; ++a) rq.put(QStr::number(a));
        rq.done(7);
    }

private:
    relayq &rq;
    ushort cnt;
};

}

class tst_relayq : public QObject
{
    Q_OBJECT

private slots:
    void emptytake();
    void fifoorder();
    void singledone();
    void crossthread();
};

void tst_relayq::emptytake()
{
    relayq rq;
    relayq::ritem item;
    QVERIFY(! rq.take(item));
    QVERIFY(! rq.isdone());
}

void tst_relayq::fifoorder()
{
    relayq rq;
    rq.put("first\n");
    rq.put("second\n");
    rq.done(0);
    relayq::ritem item;

    QVERIFY(rq.take(item));
    QCOMPARE(int(item.type), int(relayq::Chunk));
    QCOMPARE(item.text, QStr("first\n"));
    QVERIFY(rq.take(item));
    QCOMPARE(item.text, QStr("second\n"));
    QVERIFY(rq.take(item));
    QCOMPARE(int(item.type), int(relayq::Done));
    QCOMPARE(item.rc, 0);
    QVERIFY(! rq.take(item));
}

void tst_relayq::singledone()
{
    relayq rq;
    rq.done(3);
    rq.done(5);
    rq.put("late\n");
    QVERIFY(rq.isdone());
    relayq::ritem item;
    QVERIFY(rq.take(item));
    QCOMPARE(int(item.type), int(relayq::Done));
    QCOMPARE(item.rc, 3);
    QVERIFY(! rq.take(item));
}

void tst_relayq::crossthread()
{
    relayq rq;
    producer prdcr(rq, 5000);
    prdcr.start();
    relayq::ritem item;
    int next(0), rc(-1);
    QElapsedTimer tmr;
    tmr.start();

    while(rc == -1 && tmr.elapsed() < 10000)
    {
        if(! rq.take(item)) continue;

        if(item.type == relayq::Done)
            rc = item.rc;
        else
        {
            QCOMPARE(item.text, QStr::number(next));
            ++next;
        }
    }

    QVERIFY(prdcr.wait(5000));
    QCOMPARE(next, 5000);
    QCOMPARE(rc, 7);
    QVERIFY(! rq.take(item));
}

QTEST_GUILESS_MAIN(tst_relayq)
#include "tst_relayq.moc"
