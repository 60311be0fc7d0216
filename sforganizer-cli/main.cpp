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
#include <QStringBuilder>
#include <QTranslator>
#include <QLocale>
#include <QTimer>

int main(int argc, char *argv[])
{
    QCoreApplication a(argc, argv);
    QTranslator trnsltr;
    socfg cfg;
    if(so::cfgread(cfg) && ! so::cfgwrite(cfg)) so::error("\n " % QObject::tr("Unable to write the configuration file:") % ' ' % so::cfgfile() % "\n\n");

    if(cfg.lang == "auto")
    {
        if(! QLocale::system().name().startsWith("en") && trnsltr.load(QLocale::system(), "sforganizer", "_", "/usr/share/sforganizer/lang")) a.installTranslator(&trnsltr);
    }
    else if(! cfg.lang.startsWith("en") && trnsltr.load("sforganizer_" % cfg.lang, "/usr/share/sforganizer/lang"))
        a.installTranslator(&trnsltr);

    sforganizer c(cfg);
    QTimer::singleShot(0, &c, SLOT(main()));
    return a.exec();
}
