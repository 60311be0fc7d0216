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

#ifndef SORUNNER_HPP
#define SORUNNER_HPP

#include "sorelay.hpp"
#include <QSharedPointer>
#include <QAtomicInt>

class SHARED_EXPORT_IMPORT prunner : public QThread
{
public:
    prunner(cQSL &cmd, const QSharedPointer<relayq> &queue);

    void kill();

protected:
    void run();

private:
    cQSL cmd;
    QSharedPointer<relayq> rq;
    QAtomicInt intrpt;
};

#endif
