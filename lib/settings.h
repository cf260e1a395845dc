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

#ifndef SETTINGS_H
#define SETTINGS_H

#include <QString>
#include <QDateTime>
#include <QHostAddress>

#include "caldavexport.h"

namespace CalDav {

class CALDAV_EXPORT Settings
{
public:
    Settings();

    void setPathPrefix(const QString &prefix);
    QString pathPrefix() const;

    void setRealm(const QString &realm);
    QString realm() const;

    void setListenAddress(const QHostAddress &address);
    QHostAddress listenAddress() const;

    void setPort(quint16 port);
    quint16 port() const;

    void setMaxResourceSize(qint64 size);
    qint64 maxResourceSize() const;

    void setMinDateTime(const QDateTime &dateTime);
    QDateTime minDateTime() const;

    void setMaxDateTime(const QDateTime &dateTime);
    QDateTime maxDateTime() const;

    void setMaxInstances(int count);
    int maxInstances() const;

    void setMaxAttendeesPerInstance(int count);
    int maxAttendeesPerInstance() const;

    // Reads the [server] group of an INI file, keeping current
    // values for missing keys.
    bool load(const QString &fileName, QString *errorMessage = nullptr);

private:
    QString mPathPrefix;
    QString mRealm;
    QHostAddress mListenAddress;
    quint16 mPort;
    qint64 mMaxResourceSize;
    QDateTime mMinDateTime;
    QDateTime mMaxDateTime;
    int mMaxInstances;
    int mMaxAttendeesPerInstance;
};
}

#endif // SETTINGS_H
