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

#ifndef SFORGANIZERCLI_HPP
#define SFORGANIZERCLI_HPP

#include "../libsforganizer/sopipeline.hpp"
#include "../libsforganizer/sotailer.hpp"
#include <QTimer>

class sforganizer : public QObject
{
    Q_OBJECT

public:
    explicit sforganizer(const socfg &config, QObject *parent = nullptr);

public slots:
    void main();

private slots:
    void completed(int rc);
    void print(const QString &txt);
    void sigcheck();

private:
    enum { Running = 255 };

    const socfg cfg;
    pipeline pipe;
    ltailer tlr;
    QTimer itimer;
    QStr epath;

    uchar organize(cQStr &src, cQStr &out);
    uchar restore(cQStr &dir, cQStr &name, cQStr &dest);
    uchar verify(cQStr &dir);
    uchar backups(cQStr &dir);
    uchar tail(cQStr &dir);
};

#endif // SFORGANIZERCLI_HPP
