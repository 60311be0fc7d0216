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

#ifndef LOGVIEW_HPP
#define LOGVIEW_HPP

#include <QPlainTextEdit>

class logview : public QPlainTextEdit
{
    Q_OBJECT

public:
    explicit logview(QWidget *parent = nullptr) : QPlainTextEdit(parent)
    {
        setReadOnly(true);
        setLineWrapMode(NoWrap);
    }

public slots:
    inline void addtext(const QString &txt);
};

inline void logview::addtext(const QString &txt)
{
    moveCursor(QTextCursor::End);
    insertPlainText(txt);
    moveCursor(QTextCursor::End);
    ensureCursorVisible();
}

#endif // LOGVIEW_HPP
