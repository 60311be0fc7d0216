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

#include "sforganizer-cli.hpp"
#include <QCoreApplication>
#include <signal.h>

static volatile sig_atomic_t sigrcvd(0);

static void sighandler(int)
{
    sigrcvd = 1;
}

sforganizer::sforganizer(const socfg &config, QObject *parent) : QObject(parent), cfg(config), pipe(config.ointrvl), tlr(config.lintrvl)
{
    connect(&pipe, SIGNAL(output(QString)), this, SLOT(print(QString)));
    connect(&pipe, SIGNAL(completed(int)), this, SLOT(completed(int)));
    connect(&tlr, SIGNAL(output(QString)), this, SLOT(print(QString)));
    connect(&itimer, SIGNAL(timeout()), this, SLOT(sigcheck()));
    ::signal(SIGINT, sighandler);
    ::signal(SIGTERM, sighandler);
    itimer.start(100);
}

// The scripts run in their own process group, a terminal interrupt only reaches this process
void sforganizer::sigcheck()
{
    if(! sigrcvd) return;
    sigrcvd = 0;

    if(pipe.isbusy())
        pipe.kill();
    else
    {
        tlr.stop();
        qApp->exit(so::Crashed);
    }
}

void sforganizer::main()
{
    auto help([] {
            return tr("Usage: sforganizer-cli <command> [argument(s)]\n\n"
                " Commands:\n\n"
                "  organize <source_dir> <output_dir>     organize the source folder into the\n"
                "                                         output folder\n\n"
                "  verify <organized_dir>                 verify the checksums of an organized\n"
                "                                         folder\n\n"
                "  backups <organized_dir>                list the available backups\n\n"
                "  restore <organized_dir> <backup_name> <destination_dir>\n"
                "                                         restore a backup into a folder\n\n"
                "  tail <organized_dir>                   follow the organizer and integrity\n"
                "                                         logs\n\n"
                "  -v, --version                          output Sforganizer version number\n\n"
                "  -h, --help                             show this help");
        });

    cQSL &args(qApp->arguments());

    uchar rv([&]() -> uchar {
            if(args.count() == 2 && so::like(args.at(1), {"_-h_", "_--help_"}))
                so::print("\n " % help() % "\n\n");
            else if(args.count() == 2 && so::like(args.at(1), {"_-v_", "_--version_"}))
                so::print("\n " % so::appver() % "\n\n");
            else
                return args.count() == 4 && args.at(1) == "organize" ? organize(args.at(2).trimmed(), args.at(3).trimmed())
                    : args.count() == 3 && args.at(1) == "verify" ? verify(args.at(2).trimmed())
                    : args.count() == 3 && args.at(1) == "backups" ? backups(args.at(2).trimmed())
                    : args.count() == 5 && args.at(1) == "restore" ? restore(args.at(2).trimmed(), args.at(3), args.at(4).trimmed())
                    : args.count() == 3 && args.at(1) == "tail" ? tail(args.at(2).trimmed()) : 1;

            return 0;
        }());

    if(rv == Running) return;

    if(rv > 0) so::error("\n " % [&]() -> QStr {
            switch(rv) {
            case 1:
                return help();
            case 2:
                return tr("Missing path(s).");
            case 3:
                return tr("Directory does not exist: %1").arg(epath);
            case 4:
                return tr("Output folder cannot be created: %1").arg(epath);
            case 5:
                return tr("Backup not found: %1").arg(epath);
            case 6:
                return tr("Failed to restore: %1").arg(so::ThrdDbg);
            default:
                return tr("No log files found in the selected directory.");
            }
        }() % "\n\n");

    qApp->exit(rv);
}

uchar sforganizer::organize(cQStr &src, cQStr &out)
{
    switch(pipe.organize(cfg.oscript, src, out)) {
    case so::Missingpath:
        return 2;
    case so::Nosrcdir:
        epath = src;
        return 3;
    case so::Nooutdir:
        epath = out;
        return 4;
    }

    return Running;
}

uchar sforganizer::verify(cQStr &dir)
{
    switch(pipe.verify(cfg.vscript, dir)) {
    case so::Missingpath:
        return 2;
    case so::Nodir:
        epath = dir;
        return 3;
    }

    return Running;
}

uchar sforganizer::backups(cQStr &dir)
{
    if(dir.isEmpty()) return 2;
    QSL lst(so::bcklist(dir));

    if(lst.isEmpty())
        so::print("\n " % tr("No backups found.") % "\n\n");
    else
        for(cQStr &name : lst) QTS(stdout) << name << '\n';

    return 0;
}

uchar sforganizer::restore(cQStr &dir, cQStr &name, cQStr &dest)
{
    if(dir.isEmpty() || name.isEmpty() || dest.isEmpty()) return 2;
    epath = dir % "/backups/" % name;

    switch(so::brestore(epath, dest)) {
    case so::Notfound:
        return 5;
    case so::Extrerr:
    case so::Busy:
        return 6;
    }

    so::print("\n " % tr("Backup restored into %1").arg(dest) % "\n\n");
    return 0;
}

uchar sforganizer::tail(cQStr &dir)
{
    if(dir.isEmpty()) return 2;
    QSL paths(so::loglist(dir));
    if(paths.isEmpty()) return 7;
    tlr.start(paths);
    return Running;
}

void sforganizer::print(const QString &txt)
{
    QTS(stdout) << txt;
}

void sforganizer::completed(int rc)
{
    if(rc != so::Success) so::error("\n " % tr("The script returned code %1.").arg(rc) % "\n\n");
    qApp->exit(rc);
}
