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

#ifndef SODRAIN_HPP
#define SODRAIN_HPP

#include "sorelay.hpp"
#include <QFutureInterface>
#include <QSharedPointer>
#include <QFuture>
#include <QTimer>

class SHARED_EXPORT_IMPORT drainer : public QObject
{
    Q_OBJECT

public:
    drainer(const QSharedPointer<relayq> &queue, ushort intrvl, QObject *parent = nullptr);
    ~drainer();

    QFuture<int> result();
    bool isactive() const;

public slots:
    void start();

signals:
    void output(const QString &txt);
    void completed(int rc);

private slots:
    void poll();

private:
    QTimer ptimer;
    QSharedPointer<relayq> rq;
    QFutureInterface<int> rslt;
    bool active;
};

inline QFuture<int> drainer::result()
{
    return rslt.future();
}

inline bool drainer::isactive() const
{
    return active;
}

#endif
