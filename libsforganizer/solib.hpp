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

#ifndef SOLIB_HPP
#define SOLIB_HPP
#define chr(qstr) qstr.toUtf8().constData()

#include "solib_global.hpp"
#include "sotypedef.hpp"
#include <QStringBuilder>
#include <QFileInfo>
#include <QThread>

// Script paths and poll intervals, passed to the pipelines and the log tailer
struct SHARED_EXPORT_IMPORT socfg
{
    socfg();

    QStr oscript, vscript, lang;
    ushort ointrvl, lintrvl;
};

class SHARED_EXPORT_IMPORT so : public QThread
{
public:
    enum { Restored = 0, Notfound = 1, Extrerr = 2,
           Valid = 0, Missingpath = 1, Nosrcdir = 2, Nooutdir = 3, Nodir = 4,
           Read = 0, Write = 1, Exec = 2,
           Busy = 5,
           Success = 0, Failed = 1, Notlaunched = 127, Crashed = 255 };

    static so SOThrd;
    static QStr ThrdDbg;

    static QStr appver();
    static QStr cfgfile();
    static QSL bcklist(cQStr &dir);
    static QSL loglist(cQStr &dir);
    static uchar brestore(cQStr &arch, cQStr &trgt);
    static uchar chkorganize(cQStr &src, cQStr &out);
    static uchar chkverify(cQStr &dir);
    static bool cfgread(socfg &cfg, cQStr &file = nullptr);
    static bool cfgwrite(const socfg &cfg, cQStr &file = nullptr);
    static bool like(cQStr &txt, cQSL &lst);
    static bool access(cQStr &path, uchar mode = Read);
    static bool xdgopen(cQStr &path);
    static bool isfile(cQStr &path);
    static bool isdir(cQStr &path);
    static void print(cQStr &txt);
    static void error(cQStr &txt);
    static void thrdelay();

protected:
    void run();

private:
    so();

    static QStr ThrdStr[2];
    static uchar ThrdRslt;

    static bool crtfile(cQStr &path, cQStr &txt);
    uchar thrdbrestore(cQStr &arch, cQStr &trgt);
};

// Patterns are "_exact_", "*suffix_", "_prefix*" or "*part*"
inline bool so::like(cQStr &txt, cQSL &lst)
{
    for(cQStr &stxt : lst)
    {
        cQStr &ptrn(stxt.mid(1, stxt.length() - 2));

        if(stxt.startsWith('*'))
        {
            if(stxt.endsWith('*') ? txt.contains(ptrn) : txt.endsWith(ptrn)) return true;
        }
        else if(stxt.endsWith('*') ? txt.startsWith(ptrn) : txt == ptrn)
            return true;
    }

    return false;
}

inline bool so::isfile(cQStr &path)
{
    return QFileInfo(path).isFile();
}

inline bool so::isdir(cQStr &path)
{
    return QFileInfo(path).isDir();
}

inline bool so::access(cQStr &path, uchar mode)
{
    switch(mode) {
    case Read:
        return QFileInfo(path).isReadable();
    case Write:
        return QFileInfo(path).isWritable();
    case Exec:
        return QFileInfo(path).isExecutable();
    default:
        return false;
    }
}

#endif
