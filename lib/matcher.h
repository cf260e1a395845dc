/*
 * This file is part of caldavserver package
 *
 * Copyright (C) 2025 caldavserver contributors
 *
 * This library is free software; you can redistribute it and/or
 * modify it under the terms of the GNU Lesser General Public License
 * version 2.1 as published by the Free Software Foundation.
 *
 * This library is distributed in the hope that it will be useful, but
 * WITHOUT ANY WARRANTY; without even the implied warranty of
 * MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE. See the GNU
 * Lesser General Public License for more details.
 *
 * You should have received a copy of the GNU Lesser General Public
 * License along with this library; if not, write to the Free Software
 * Foundation, Inc., 51 Franklin St, Fifth Floor, Boston, MA
 * 02110-1301 USA
 */

#ifndef MATCHER_H
#define MATCHER_H

#include "caldavexport.h"
#include "davtypes.h"
#include "filter.h"

namespace CalDav {

/* Evaluates a calendar-query filter against one calendar object,
   following RFC 4791 section 9.7. */
class CALDAV_EXPORT Matcher
{
public:
    static bool matches(const Filter &filter, const CalendarObject &object);
};
}

#endif
