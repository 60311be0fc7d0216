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

#ifndef SOPIPELINE_HPP
#define SOPIPELINE_HPP

#include "sodrain.hpp"
#include "sorunner.hpp"
#include <QPointer>

// One runner thread and one drain loop per invocation, at most one active invocation
class SHARED_EXPORT_IMPORT pipeline : public QObject
{
    Q_OBJECT

public:
    explicit pipeline(ushort intrvl = 100, QObject *parent = nullptr);
    ~pipeline();

    QFuture<int> result();
    bool isbusy() const;
    bool start(cQSL &cmd);
    uchar organize(cQStr &script, cQStr &src, cQStr &out);
    uchar verify(cQStr &script, cQStr &dir);

public slots:
    void kill();

signals:
    void output(const QString &txt);
    void completed(int rc);

private slots:
    void finished(int rc);

private:
    QPointer<prunner> prun;
    QPointer<drainer> drnr;
    ushort intrvl;
    bool busy;
};

inline bool pipeline::isbusy() const
{
    return busy;
}

#endif
