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

#ifndef SOTYPEDEF_HPP
#define SOTYPEDEF_HPP

#include <QTextStream>
#include <QStringList>
#include <QByteArray>

typedef QTextStream QTS;
typedef const QStringList cQSL;
typedef QStringList QSL;
typedef const QString cQStr;
typedef QString QStr;
typedef const QByteArray cQBA;
typedef QByteArray QBA;

#endif // SOTYPEDEF_HPP
