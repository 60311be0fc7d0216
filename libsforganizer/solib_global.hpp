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

#ifndef SOLIB_GLOBAL_HPP
#define SOLIB_GLOBAL_HPP

#include <QtGlobal>

#ifdef SOLIB_LIBRARY
#define SHARED_EXPORT_IMPORT Q_DECL_EXPORT
#else
#define SHARED_EXPORT_IMPORT Q_DECL_IMPORT
#endif

#endif // SOLIB_GLOBAL_HPP
