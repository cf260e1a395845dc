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

#ifndef CANCELLATION_H
#define CANCELLATION_H

#include <QAtomicInt>

#include "caldavexport.h"

namespace CalDav {

// Set by the transport when the client goes away, polled by long
// running request processing.
class CALDAV_EXPORT CancellationToken
{
public:
    CancellationToken() : mCancelled(0) {}

    void cancel() { mCancelled.storeRelease(1); }
    bool isCancelled() const { return mCancelled.loadAcquire() != 0; }

private:
    QAtomicInt mCancelled;
};
}

#endif
