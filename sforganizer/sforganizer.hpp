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

#ifndef SFORGANIZER_HPP
#define SFORGANIZER_HPP

#include "../libsforganizer/sopipeline.hpp"
#include "../libsforganizer/sotailer.hpp"
#include <QMainWindow>

namespace Ui {
class sforganizer;
}

class sforganizer : public QMainWindow
{
    Q_OBJECT

public:
    explicit sforganizer(const socfg &config);
    ~sforganizer();

protected:
    void closeEvent(QCloseEvent *ev);

private:
    enum { Organizer = 0, Integrity = 1,
           Information = 0, Warning = 1, Critical = 2 };

    Ui::sforganizer *ui;
    const socfg cfg;
    pipeline orgpipe, verifypipe;
    ltailer tlr;

    QStr browse(cQStr &title);
    void notify(uchar type, cQStr &title, cQStr &txt);
    void busy(uchar pipe, bool state = true);

private slots:
    void orgcompleted(int rc);
    void verifycompleted(int rc);

    void on_restorebackup_clicked();
    void on_refreshbackups_clicked();
    void on_verifyinterrupt_clicked();
    void on_orginterrupt_clicked();
    void on_openchecksum_clicked();
    void on_runorganizer_clicked();
    void on_outputbrowse_clicked();
    void on_sourcebrowse_clicked();
    void on_verifybrowse_clicked();
    void on_backupbrowse_clicked();
    void on_clearoutput_clicked();
    void on_openoutput_clicked();
    void on_runverify_clicked();
    void on_startlogs_clicked();
    void on_logbrowse_clicked();
    void on_clearlogs_clicked();
    void on_stoplogs_clicked();
};

#endif
