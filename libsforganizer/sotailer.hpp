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

#ifndef SOTAILER_HPP
#define SOTAILER_HPP

#include "solib.hpp"
#include <QSharedPointer>
#include <QTextCodec>
#include <QHash>
#include <QTimer>

class SHARED_EXPORT_IMPORT ltailer : public QObject
{
    Q_OBJECT

public:
    explicit ltailer(ushort intrvl = 2000, QObject *parent = nullptr);

    qint64 offset(cQStr &path) const;
    bool isrunning() const;
    void start(cQSL &paths);

public slots:
    void stop();

signals:
    void output(const QString &txt);

private slots:
    void tick();

private:
    QTimer ttimer;
    QSL lpaths;
    QHash<QStr, qint64> tpos;
    QHash<QStr, QSharedPointer<QTextDecoder>> tdec;
    bool running;
};

inline qint64 ltailer::offset(cQStr &path) const
{
    return tpos.value(path, 0);
}

inline bool ltailer::isrunning() const
{
    return running;
}

#endif
