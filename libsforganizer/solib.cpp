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

#include "solib.hpp"
#include <QCoreApplication>
#include <QProcess>
#include <QDir>
#include <archive.h>
#include <archive_entry.h>
#include <algorithm>
#include <functional>

#ifndef SOVERSION
#define SOVERSION "1.0"
#endif

so so::SOThrd;
QStr so::ThrdDbg, so::ThrdStr[2];
uchar so::ThrdRslt;

socfg::socfg() : oscript(QDir::currentPath() % "/organize_files.sh"), vscript(QDir::currentPath() % "/verify_integrity.sh"), lang("auto"), ointrvl(100), lintrvl(2000) {}

so::so() {}

void so::print(cQStr &txt)
{
    QTS(stdout) << "\033[1m" % txt % "\033[0m";
}

void so::error(cQStr &txt)
{
    QTS(stderr) << "\033[1;31m" % txt % "\033[0m";
}

QStr so::appver()
{
    QStr vrsn(qVersion());

    return SOVERSION % QStr("_Qt") % (vrsn == QT_VERSION_STR ? vrsn : vrsn % '(' % QT_VERSION_STR % ')') % '_' %
#ifdef __clang__
            "Clang" % QStr::number(__clang_major__) % '.' % QStr::number(__clang_minor__) % '.' % QStr::number(__clang_patchlevel__)
#elif defined(__INTEL_COMPILER) || ! defined(__GNUC__)
            "compiler?"
#elif defined(__GNUC__)
            "GCC" % QStr::number(__GNUC__) % '.' % QStr::number(__GNUC_MINOR__) % '.' % QStr::number(__GNUC_PATCHLEVEL__)
#endif
            % '_' % archive_version_string();
}

QStr so::cfgfile()
{
    return QDir::homePath() % "/.config/sforganizer.conf";
}

bool so::crtfile(cQStr &path, cQStr &txt)
{
    QStr pdir(QFileInfo(path).absolutePath());
    if(! isdir(pdir) && ! QDir().mkpath(pdir)) return false;
    QFile file(path);
    if(! file.open(QFile::WriteOnly | QFile::Truncate) || file.write(txt.toUtf8()) == -1) return false;
    return file.flush();
}

bool so::cfgread(socfg &cfg, cQStr &file)
{
    QFile cfile(file.isEmpty() ? cfgfile() : file);
    if(! cfile.open(QIODevice::ReadOnly)) return true;
    bool cfgupdt(false);

    auto rdnum([&cfgupdt](cQStr &cval, ushort min, ushort max, ushort &trgt) {
            bool ok;
            ushort num(cval.toUShort(&ok));

            if(ok && num >= min && num <= max)
                trgt = num;
            else
                cfgupdt = true;
        });

    while(! cfile.atEnd())
    {
        QStr cline(QStr::fromUtf8(cfile.readLine()).trimmed()), cval(cline.mid(cline.indexOf('=') + 1).trimmed());
        if(cline.startsWith('#') || cval.isEmpty()) continue;

        if(cline.startsWith("organize_script="))
            cfg.oscript = cval;
        else if(cline.startsWith("verify_script="))
            cfg.vscript = cval;
        else if(cline.startsWith("output_poll_interval="))
            rdnum(cval, 10, 5000, cfg.ointrvl);
        else if(cline.startsWith("log_poll_interval="))
            rdnum(cval, 100, 60000, cfg.lintrvl);
        else if(cline.startsWith("language="))
            cfg.lang = cval;
    }

    return cfgupdt;
}

bool so::cfgwrite(const socfg &cfg, cQStr &file)
{
    return crtfile(file.isEmpty() ? cfgfile() : file, "# Script settings\n#  organize_script=<path>\n#  verify_script=<path>\n\n"
            "organize_script=" % cfg.oscript %
            "\nverify_script=" % cfg.vscript %
            "\n\n\n# Polling settings\n#  output_poll_interval=[10-5000]\n#  log_poll_interval=[100-60000]\n\n"
            "output_poll_interval=" % QStr::number(cfg.ointrvl) %
            "\nlog_poll_interval=" % QStr::number(cfg.lintrvl) %
            "\n\n\n# User interface settings\n#  language=[auto/<language_COUNTRY>]\n\n"
            "language=" % cfg.lang % '\n');
}

uchar so::chkorganize(cQStr &src, cQStr &out)
{
    return src.isEmpty() || out.isEmpty() ? Missingpath
        : ! isdir(src) ? Nosrcdir
        : ! isdir(out) && ! QDir().mkpath(out) ? Nooutdir : Valid;
}

uchar so::chkverify(cQStr &dir)
{
    return dir.isEmpty() ? Missingpath : ! isdir(dir) ? Nodir : Valid;
}

QSL so::loglist(cQStr &dir)
{
    QSL lst;

    for(cQStr &name : QSL{"organizer.log", "integrity_check.log"})
        if(isfile(dir % '/' % name)) lst.append(dir % '/' % name);

    return lst;
}

QSL so::bcklist(cQStr &dir)
{
    QDir bdir(dir % "/backups");
    if(dir.isEmpty() || ! bdir.exists()) return QSL();
    QSL lst(bdir.entryList(QDir::Files | QDir::Hidden, QDir::Unsorted));
    std::sort(lst.begin(), lst.end(), std::greater<QStr>());

    for(int a(lst.count() - 1) ; a > -1 ; --a)
        if(! lst.at(a).endsWith(".zip", Qt::CaseInsensitive)) lst.removeAt(a);

    return lst;
}

bool so::xdgopen(cQStr &path)
{
    return QProcess::startDetached("xdg-open", {path});
}

void so::thrdelay()
{
    while(SOThrd.isRunning())
    {
        msleep(10);
        QCoreApplication::processEvents();
    }
}

uchar so::brestore(cQStr &arch, cQStr &trgt)
{
    if(SOThrd.isRunning()) return Busy;
    if(! isfile(arch)) return Notfound;
    ThrdStr[0] = arch;
    ThrdStr[1] = trgt;
    SOThrd.start();
    thrdelay();
    return ThrdRslt;
}

void so::run()
{
    if(! ThrdDbg.isEmpty()) ThrdDbg.clear();
    ThrdRslt = thrdbrestore(ThrdStr[0], ThrdStr[1]);
}

uchar so::thrdbrestore(cQStr &arch, cQStr &trgt)
{
    if(! isdir(trgt) && ! QDir().mkpath(trgt))
    {
        ThrdDbg = tr("Cannot create the destination directory:") % ' ' % trgt;
        return Extrerr;
    }

    // the secure extract checks apply to the whole path, the destination included
    QStr ctrgt(QFileInfo(trgt).canonicalFilePath());

    archive *rarch(archive_read_new()), *warch(archive_write_disk_new());
    archive_read_support_format_zip(rarch);
    archive_write_disk_set_options(warch, ARCHIVE_EXTRACT_TIME | ARCHIVE_EXTRACT_PERM | ARCHIVE_EXTRACT_SECURE_NODOTDOT | ARCHIVE_EXTRACT_SECURE_SYMLINKS);
    archive_write_disk_set_standard_lookup(warch);

    uchar rv([&]() -> uchar {
            if(archive_read_open_filename(rarch, chr(arch), 10240) != ARCHIVE_OK)
            {
                ThrdDbg = archive_error_string(rarch);
                return Extrerr;
            }

            archive_entry *entry;
            int rslt;

            while((rslt = archive_read_next_header(rarch, &entry)) == ARCHIVE_OK)
            {
                archive_entry_set_pathname(entry, chr(QStr(ctrgt % '/' % QStr::fromUtf8(archive_entry_pathname(entry)))));
                if(archive_entry_hardlink(entry)) archive_entry_set_hardlink(entry, chr(QStr(ctrgt % '/' % QStr::fromUtf8(archive_entry_hardlink(entry)))));

                if(archive_write_header(warch, entry) != ARCHIVE_OK)
                {
                    ThrdDbg = archive_error_string(warch);
                    return Extrerr;
                }

                const void *buff;
                size_t size;
                la_int64_t offset;

                while((rslt = archive_read_data_block(rarch, &buff, &size, &offset)) == ARCHIVE_OK)
                    if(archive_write_data_block(warch, buff, size, offset) != ARCHIVE_OK)
                    {
                        ThrdDbg = archive_error_string(warch);
                        return Extrerr;
                    }

                if(rslt != ARCHIVE_EOF)
                {
                    ThrdDbg = archive_error_string(rarch);
                    return Extrerr;
                }

                if(archive_write_finish_entry(warch) != ARCHIVE_OK)
                {
                    ThrdDbg = archive_error_string(warch);
                    return Extrerr;
                }
            }

            if(rslt != ARCHIVE_EOF)
            {
                ThrdDbg = archive_error_string(rarch);
                return Extrerr;
            }

            return Restored;
        }());

    archive_read_close(rarch);
    archive_read_free(rarch);
    archive_write_close(warch);
    archive_write_free(warch);
    return rv;
}
