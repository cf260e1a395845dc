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

#ifndef RESOLVER_H
#define RESOLVER_H

#include <QHash>
#include <QStringList>

#include "caldavexport.h"
#include "davtypes.h"
#include "properties.h"
#include "pathcodec.h"
#include "settings.h"
#include "storage.h"

namespace CalDav {

/* Everything a resolver may need about one resource. Storage records
   are fetched on first use and kept for the lifetime of the
   environment, failures included. */
class CALDAV_EXPORT ResolverEnvironment
{
public:
    ResolverEnvironment(Storage *storage, const Settings &settings,
                        const Resource &resource,
                        const CalendarObject *preloaded = nullptr);

    const Resource &resource() const;
    const Settings &settings() const;

    bool resourceHref(QString *href) const;
    bool principalHref(QString *href) const;
    bool homeSetHref(QString *href) const;

    Storage::Status user(User *user);
    Storage::Status calendar(Calendar *calendar);
    Storage::Status object(CalendarObject *object);
    Storage::Status privileges(Privileges *privileges);

private:
    Storage *mStorage;
    const Settings &mSettings;
    PathCodec mCodec;
    Resource mResource;

    bool mUserLoaded = false;
    Storage::Status mUserStatus = Storage::NoError;
    User mUser;
    bool mCalendarLoaded = false;
    Storage::Status mCalendarStatus = Storage::NoError;
    Calendar mCalendar;
    bool mObjectLoaded = false;
    Storage::Status mObjectStatus = Storage::NoError;
    CalendarObject mObject;
};

class CALDAV_EXPORT PropertyResolver
{
public:
    typedef PropertyResult (*Resolver)(ResolverEnvironment &env);
    typedef QHash<QString, Resolver> Table;

    static const Table &table(Resource::Type type);

    // Fills every entry of properties, names without resolver
    // resolve to NotFound.
    static void resolve(ResolverEnvironment &env, PropertyMap *properties);

    // Properties a resource of this type can resolve, sorted.
    static QStringList names(Resource::Type type);
};
}

#endif
