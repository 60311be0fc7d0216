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

#include "ui_sforganizer.h"
#include "sforganizer.hpp"
#include <QApplication>
#include <QFileDialog>
#include <QMessageBox>
#include <QCloseEvent>
#include <QStatusBar>

sforganizer::sforganizer(const socfg &config) : QMainWindow(nullptr), ui(new Ui::sforganizer), cfg(config), orgpipe(config.ointrvl), verifypipe(config.ointrvl), tlr(config.lintrvl)
{
    ui->setupUi(this);
    connect(&orgpipe, SIGNAL(output(QString)), ui->orgoutput, SLOT(addtext(QString)));
    connect(&orgpipe, SIGNAL(completed(int)), this, SLOT(orgcompleted(int)));
    connect(&verifypipe, SIGNAL(output(QString)), ui->verifyoutput, SLOT(addtext(QString)));
    connect(&verifypipe, SIGNAL(completed(int)), this, SLOT(verifycompleted(int)));
    connect(&tlr, SIGNAL(output(QString)), ui->logoutput, SLOT(addtext(QString)));
    statusBar()->showMessage(tr("Ready"));
}

sforganizer::~sforganizer()
{
    delete ui;
}

void sforganizer::closeEvent(QCloseEvent *ev)
{
    if(orgpipe.isbusy() || verifypipe.isbusy())
    {
        if(QMessageBox::question(this, tr("Script running"), tr("A script is still running. Interrupt it and quit?")) != QMessageBox::Yes)
        {
            ev->ignore();
            return;
        }

        orgpipe.kill();
        verifypipe.kill();
    }

    tlr.stop();
    ev->accept();
}

QStr sforganizer::browse(cQStr &title)
{
    return QFileDialog::getExistingDirectory(this, title);
}

void sforganizer::notify(uchar type, cQStr &title, cQStr &txt)
{
    statusBar()->showMessage(title % ": " % txt);

    switch(type) {
    case Information:
        QMessageBox::information(this, title, txt);
        break;
    case Warning:
        QMessageBox::warning(this, title, txt);
        break;
    default:
        QMessageBox::critical(this, title, txt);
    }
}

void sforganizer::busy(uchar pipe, bool state)
{
    if(pipe == Organizer)
    {
        ui->runorganizer->setDisabled(state);
        ui->orginterrupt->setEnabled(state);
        ui->orgprogress->setMaximum(state ? 0 : 1);
    }
    else
    {
        ui->runverify->setDisabled(state);
        ui->verifyinterrupt->setEnabled(state);
        ui->verifyprogress->setMaximum(state ? 0 : 1);
    }
}

void sforganizer::on_sourcebrowse_clicked()
{
    QStr path(browse(tr("Select Source Folder")));
    if(! path.isEmpty()) ui->sourcedir->setText(path);
}

void sforganizer::on_outputbrowse_clicked()
{
    QStr path(browse(tr("Select Output Folder (existing) or Cancel to type new")));
    if(! path.isEmpty()) ui->outputdir->setText(path);
}

void sforganizer::on_verifybrowse_clicked()
{
    QStr path(browse(tr("Select Organized Folder to Verify")));
    if(! path.isEmpty()) ui->verifydir->setText(path);
}

void sforganizer::on_backupbrowse_clicked()
{
    QStr path(browse(tr("Select Organized Folder (contains backups/)")));

    if(! path.isEmpty())
    {
        ui->backupdir->setText(path);
        on_refreshbackups_clicked();
    }
}

void sforganizer::on_logbrowse_clicked()
{
    QStr path(browse(tr("Select Organized Folder (for logs)")));
    if(! path.isEmpty()) ui->logdir->setText(path);
}

void sforganizer::on_runorganizer_clicked()
{
    QStr src(ui->sourcedir->text().trimmed()), out(ui->outputdir->text().trimmed());

    switch(orgpipe.organize(cfg.oscript, src, out)) {
    case so::Missingpath:
        return notify(Warning, tr("Missing paths"), tr("Please select both source and output folders."));
    case so::Nosrcdir:
        return notify(Critical, tr("Invalid source"), tr("Source folder does not exist: %1").arg(src));
    case so::Nooutdir:
        return notify(Critical, tr("Invalid output"), tr("Output folder cannot be created: %1").arg(out));
    case so::Busy:
        return;
    }

    ui->orgoutput->clear();
    busy(Organizer);
    ui->orgstatus->setText(tr("Running organizer..."));
    statusBar()->showMessage(tr("Running organizer..."));
}

void sforganizer::orgcompleted(int rc)
{
    busy(Organizer, false);

    if(rc == so::Success)
    {
        ui->orgstatus->setText(tr("Organizer completed successfully"));
        notify(Information, tr("Done"), tr("Organizer finished successfully."));
    }
    else
    {
        ui->orgstatus->setText(tr("Organizer finished with errors"));
        notify(Warning, tr("Completed with errors"), tr("Organizer returned code %1. Check logs.").arg(rc));
    }
}

void sforganizer::on_orginterrupt_clicked()
{
    ui->orginterrupt->setEnabled(false);
    ui->orgstatus->setText(tr("Interrupting..."));
    orgpipe.kill();
}

void sforganizer::on_openoutput_clicked()
{
    QStr path(ui->outputdir->text().trimmed());

    if(path.isEmpty())
        notify(Warning, tr("No Output"), tr("Please select an output folder first."));
    else if(! so::xdgopen(path))
        notify(Critical, tr("Cannot open"), tr("Unable to open the folder: %1").arg(path));
}

void sforganizer::on_clearoutput_clicked()
{
    ui->orgoutput->clear();
}

void sforganizer::on_runverify_clicked()
{
    QStr dir(ui->verifydir->text().trimmed());

    switch(verifypipe.verify(cfg.vscript, dir)) {
    case so::Missingpath:
        return notify(Warning, tr("Missing path"), tr("Select organized directory to verify."));
    case so::Nodir:
        return notify(Critical, tr("Invalid directory"), tr("Directory does not exist: %1").arg(dir));
    case so::Busy:
        return;
    }

    ui->verifyoutput->clear();
    busy(Integrity);
    ui->verifystatus->setText(tr("Running integrity check..."));
    statusBar()->showMessage(tr("Running integrity check..."));
}

void sforganizer::verifycompleted(int rc)
{
    busy(Integrity, false);

    if(rc == so::Success)
    {
        ui->verifystatus->setText(tr("Integrity OK"));
        notify(Information, tr("Integrity"), tr("All files match their checksums."));
    }
    else
    {
        ui->verifystatus->setText(tr("Integrity FAILED"));
        notify(Warning, tr("Integrity"), tr("Some files failed verification (code %1). Check logs.").arg(rc));
    }
}

void sforganizer::on_verifyinterrupt_clicked()
{
    ui->verifyinterrupt->setEnabled(false);
    ui->verifystatus->setText(tr("Interrupting..."));
    verifypipe.kill();
}

void sforganizer::on_openchecksum_clicked()
{
    QStr dir(ui->verifydir->text().trimmed());
    if(dir.isEmpty()) return notify(Warning, tr("Missing path"), tr("Select organized directory first."));
    QStr chk(dir % "/organized_files_checksum.log");

    if(! so::isfile(chk))
        notify(Critical, tr("Not found"), tr("Checksum log not found: %1").arg(chk));
    else if(! so::xdgopen(chk))
        notify(Critical, tr("Cannot open"), tr("Unable to open the file: %1").arg(chk));
}

void sforganizer::on_refreshbackups_clicked()
{
    ui->backuplist->clear();
    QStr dir(ui->backupdir->text().trimmed());
    if(dir.isEmpty()) return;
    ui->backuplist->addItems(so::bcklist(dir));
    statusBar()->showMessage(tr("%n backup(s) found", nullptr, ui->backuplist->count()));
}

void sforganizer::on_restorebackup_clicked()
{
    if(! ui->backuplist->currentItem()) return notify(Warning, tr("Select backup"), tr("Choose a backup to restore."));
    QStr name(ui->backuplist->currentItem()->text()), path(ui->backupdir->text().trimmed() % "/backups/" % name);
    if(! so::isfile(path)) return notify(Critical, tr("Not found"), path);
    QStr dest(browse(tr("Select folder to restore backup into")));
    if(dest.isEmpty() || QMessageBox::question(this, tr("Confirm restore"), tr("Restore %1 into %2? This may overwrite files.").arg(name, dest)) != QMessageBox::Yes) return;
    for(QWidget *wdgt : QList<QWidget *>{ui->restorebackup, ui->refreshbackups, ui->backupbrowse, ui->backuplist}) wdgt->setDisabled(true);
    QApplication::setOverrideCursor(Qt::WaitCursor);
    statusBar()->showMessage(tr("Restoring %1...").arg(name));
    uchar rv(so::brestore(path, dest));
    QApplication::restoreOverrideCursor();
    for(QWidget *wdgt : QList<QWidget *>{ui->restorebackup, ui->refreshbackups, ui->backupbrowse, ui->backuplist}) wdgt->setEnabled(true);

    switch(rv) {
    case so::Restored:
        notify(Information, tr("Restored"), tr("Backup restored into %1").arg(dest));
        break;
    case so::Notfound:
        notify(Critical, tr("Not found"), path);
        break;
    case so::Busy:
        notify(Warning, tr("Restore running"), tr("Another backup is being restored."));
        break;
    default:
        notify(Critical, tr("Restore failed"), tr("Failed to restore: %1").arg(so::ThrdDbg));
    }
}

void sforganizer::on_startlogs_clicked()
{
    QStr dir(ui->logdir->text().trimmed());
    if(dir.isEmpty()) return notify(Warning, tr("Select directory"), tr("Select organized directory to read logs from."));
    QSL paths(so::loglist(dir));
    if(paths.isEmpty()) return notify(Warning, tr("No logs"), tr("No log files found in the selected directory."));
    ui->logoutput->clear();
    tlr.start(paths);
    statusBar()->showMessage(tr("Live logs running"));
}

void sforganizer::on_stoplogs_clicked()
{
    tlr.stop();
    statusBar()->showMessage(tr("Live logs stopped"));
}

void sforganizer::on_clearlogs_clicked()
{
    ui->logoutput->clear();
}
