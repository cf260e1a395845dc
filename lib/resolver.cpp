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

#include "resolver.h"
#include "incidencehandler.h"
#include "logging_p.h"

using namespace CalDav;

namespace {
    typedef PropertyResolver::Table Table;

    PropertyResult storageFailure(ResolverEnvironment &env, Storage::Status status, const char *what)
    {
        if (status == Storage::NotFound)
            return PropertyResult::failure(PropertyResult::NotFound);
        qCWarning(lcCalDav) << "Failed to get" << what << "for"
                            << Resource::typeName(env.resource().type) << env.resource().uri
                            << ":" << Storage::statusMessage(status);
        return PropertyResult::failure(PropertyResult::Internal);
    }

    PropertyResult text(const QString &name, const QString &value)
    {
        if (value.isEmpty())
            return PropertyResult::failure(PropertyResult::NotFound);
        return PropertyResult::ok(Property::Ptr(new TextProperty(name, value)));
    }

    PropertyResult href(const QString &name, bool encoded, const QString &value)
    {
        if (!encoded)
            return PropertyResult::failure(PropertyResult::NotFound);
        return PropertyResult::ok(Property::Ptr(new HrefProperty(name, value)));
    }

    PropertyResult aclFor(ResolverEnvironment &env, bool encoded, const QString &principal)
    {
        if (!encoded)
            return PropertyResult::failure(PropertyResult::NotFound);
        Privileges privileges;
        const Storage::Status status = env.privileges(&privileges);
        if (status != Storage::NoError) {
            qCWarning(lcCalDav) << "Failed to determine privileges for acl:" << Storage::statusMessage(status);
            return PropertyResult::failure(PropertyResult::Internal);
        }
        AclProperty::Ace ace;
        ace.principal = principal;
        ace.grant = privilegeNames(privileges);
        return PropertyResult::ok(Property::Ptr(new AclProperty(QList<AclProperty::Ace>() << ace)));
    }

    // Common

    PropertyResult owner(ResolverEnvironment &env)
    {
        QString value;
        const bool encoded = env.principalHref(&value);
        return href(QStringLiteral("owner"), encoded, value);
    }

    PropertyResult currentUserPrincipal(ResolverEnvironment &env)
    {
        QString value;
        const bool encoded = env.principalHref(&value);
        return href(QStringLiteral("current-user-principal"), encoded, value);
    }

    PropertyResult principalUrl(ResolverEnvironment &env)
    {
        QString value;
        const bool encoded = env.principalHref(&value);
        return href(QStringLiteral("principal-url"), encoded, value);
    }

    PropertyResult supportedReportSet(ResolverEnvironment &)
    {
        const QStringList reports = QStringList()
            << QStringLiteral("calendar-query")
            << QStringLiteral("calendar-multiget");
        return PropertyResult::ok(Property::Ptr(new SupportedReportSetProperty(reports)));
    }

    PropertyResult currentUserPrivilegeSet(ResolverEnvironment &env)
    {
        Privileges privileges;
        const Storage::Status status = env.privileges(&privileges);
        if (status != Storage::NoError) {
            qCWarning(lcCalDav) << "Failed to determine privilege set:" << Storage::statusMessage(status);
            return PropertyResult::failure(PropertyResult::Internal);
        }
        return PropertyResult::ok(Property::Ptr(new PrivilegeSetProperty(privilegeNames(privileges))));
    }

    PropertyResult calendarHomeSet(ResolverEnvironment &env)
    {
        QString value;
        if (!env.homeSetHref(&value))
            return PropertyResult::failure(PropertyResult::Internal);
        return PropertyResult::ok(Property::Ptr(new HrefProperty(QStringLiteral("calendar-home-set"), value)));
    }

    PropertyResult calendarUserAddressSet(ResolverEnvironment &env)
    {
        User user;
        const Storage::Status status = env.user(&user);
        if (status != Storage::NoError)
            return storageFailure(env, status, "user");
        if (user.userAddress.isEmpty())
            return PropertyResult::failure(PropertyResult::NotFound);
        return PropertyResult::ok(Property::Ptr(new HrefListProperty(QStringLiteral("calendar-user-address-set"),
                                                                     QStringList() << user.userAddress)));
    }

    PropertyResult calendarUserType(ResolverEnvironment &)
    {
        return text(QStringLiteral("calendar-user-type"), QStringLiteral("individual"));
    }

    PropertyResult hidden(ResolverEnvironment &)
    {
        return PropertyResult::ok(Property::Ptr(new BooleanProperty(QStringLiteral("hidden"), false)));
    }

    PropertyResult selected(ResolverEnvironment &)
    {
        return PropertyResult::ok(Property::Ptr(new BooleanProperty(QStringLiteral("selected"), true)));
    }

    PropertyResult notFound(ResolverEnvironment &)
    {
        return PropertyResult::failure(PropertyResult::NotFound);
    }

    // Limits advertised by home sets, collections and objects.

    PropertyResult maxResourceSize(ResolverEnvironment &env)
    {
        return PropertyResult::ok(Property::Ptr(new IntegerProperty(QStringLiteral("max-resource-size"),
                                                                    env.settings().maxResourceSize())));
    }

    PropertyResult minDateTime(ResolverEnvironment &env)
    {
        return PropertyResult::ok(Property::Ptr(new DateTimeProperty(QStringLiteral("min-date-time"),
                                                                     env.settings().minDateTime(),
                                                                     DateTimeProperty::CompactUtc)));
    }

    PropertyResult maxDateTime(ResolverEnvironment &env)
    {
        return PropertyResult::ok(Property::Ptr(new DateTimeProperty(QStringLiteral("max-date-time"),
                                                                     env.settings().maxDateTime(),
                                                                     DateTimeProperty::CompactUtc)));
    }

    PropertyResult maxInstances(ResolverEnvironment &env)
    {
        return PropertyResult::ok(Property::Ptr(new IntegerProperty(QStringLiteral("max-instances"),
                                                                    env.settings().maxInstances())));
    }

    PropertyResult maxAttendeesPerInstance(ResolverEnvironment &env)
    {
        return PropertyResult::ok(Property::Ptr(new IntegerProperty(QStringLiteral("max-attendees-per-instance"),
                                                                    env.settings().maxAttendeesPerInstance())));
    }

    PropertyResult supportedCalendarData(ResolverEnvironment &)
    {
        return PropertyResult::ok(Property::Ptr(new SupportedCalendarDataProperty(QStringLiteral("text/calendar"),
                                                                                  QStringLiteral("2.0"))));
    }

    void insertLimits(Table *table)
    {
        table->insert(QStringLiteral("max-resource-size"), maxResourceSize);
        table->insert(QStringLiteral("min-date-time"), minDateTime);
        table->insert(QStringLiteral("max-date-time"), maxDateTime);
        table->insert(QStringLiteral("max-instances"), maxInstances);
        table->insert(QStringLiteral("max-attendees-per-instance"), maxAttendeesPerInstance);
        table->insert(QStringLiteral("supported-calendar-data"), supportedCalendarData);
        table->insert(QStringLiteral("schedule-inbox-url"), notFound);
        table->insert(QStringLiteral("schedule-outbox-url"), notFound);
        table->insert(QStringLiteral("schedule-default-calendar-url"), notFound);
    }

    // Service root

    PropertyResult rootDisplayName(ResolverEnvironment &)
    {
        return text(QStringLiteral("displayname"), QStringLiteral("CalDAV Service Root"));
    }

    PropertyResult rootResourceType(ResolverEnvironment &)
    {
        return PropertyResult::ok(Property::Ptr(new ResourceTypeProperty(ResourceTypeProperty::Plain)));
    }

    PropertyResult rootPrivilegeSet(ResolverEnvironment &)
    {
        return PropertyResult::ok(Property::Ptr(new PrivilegeSetProperty(
            privilegeNames(READ | READ_ACL | READ_CURRENT_USER_SET))));
    }

    // Principal

    PropertyResult principalDisplayName(ResolverEnvironment &env)
    {
        User user;
        const Storage::Status status = env.user(&user);
        if (status != Storage::NoError)
            return storageFailure(env, status, "user");
        return text(QStringLiteral("displayname"),
                    user.displayName.isEmpty() ? env.resource().userId : user.displayName);
    }

    PropertyResult principalResourceType(ResolverEnvironment &)
    {
        return PropertyResult::ok(Property::Ptr(new ResourceTypeProperty(ResourceTypeProperty::Principal)));
    }

    PropertyResult userColor(ResolverEnvironment &env, const QString &name)
    {
        User user;
        const Storage::Status status = env.user(&user);
        if (status != Storage::NoError)
            return storageFailure(env, status, "user");
        return text(name, user.preferredColor);
    }

    PropertyResult userCalendarColor(ResolverEnvironment &env)
    {
        return userColor(env, QStringLiteral("calendar-color"));
    }

    PropertyResult userGoogleColor(ResolverEnvironment &env)
    {
        return userColor(env, QStringLiteral("color"));
    }

    PropertyResult userTimezone(ResolverEnvironment &env)
    {
        User user;
        const Storage::Status status = env.user(&user);
        if (status != Storage::NoError)
            return storageFailure(env, status, "user");
        return text(QStringLiteral("timezone"), user.preferredTimezone);
    }

    PropertyResult ownAcl(ResolverEnvironment &env)
    {
        QString value;
        const bool encoded = env.resourceHref(&value);
        return aclFor(env, encoded, value);
    }

    // Home set

    PropertyResult homeDisplayName(ResolverEnvironment &)
    {
        return text(QStringLiteral("displayname"), QStringLiteral("Calendar Home"));
    }

    PropertyResult homeResourceType(ResolverEnvironment &)
    {
        return PropertyResult::ok(Property::Ptr(new ResourceTypeProperty(ResourceTypeProperty::HomeSet)));
    }

    PropertyResult principalAcl(ResolverEnvironment &env)
    {
        QString value;
        const bool encoded = env.principalHref(&value);
        return aclFor(env, encoded, value);
    }

    PropertyResult homeComponentSet(ResolverEnvironment &)
    {
        const QStringList components = QStringList()
            << QStringLiteral("VEVENT") << QStringLiteral("VTODO")
            << QStringLiteral("VJOURNAL") << QStringLiteral("VFREEBUSY");
        return PropertyResult::ok(Property::Ptr(new ComponentSetProperty(components)));
    }

    // Collection

    PropertyResult calendarDisplayName(ResolverEnvironment &env)
    {
        Calendar calendar;
        const Storage::Status status = env.calendar(&calendar);
        if (status != Storage::NoError)
            return storageFailure(env, status, "calendar");
        return text(QStringLiteral("displayname"), calendar.displayName);
    }

    PropertyResult calendarResourceType(ResolverEnvironment &)
    {
        return PropertyResult::ok(Property::Ptr(new ResourceTypeProperty(ResourceTypeProperty::Calendar)));
    }

    PropertyResult calendarEtag(ResolverEnvironment &env)
    {
        Calendar calendar;
        const Storage::Status status = env.calendar(&calendar);
        if (status != Storage::NoError)
            return storageFailure(env, status, "calendar");
        return text(QStringLiteral("getetag"), calendar.etag);
    }

    PropertyResult calendarCtag(ResolverEnvironment &env)
    {
        Calendar calendar;
        const Storage::Status status = env.calendar(&calendar);
        if (status != Storage::NoError)
            return storageFailure(env, status, "calendar");
        return text(QStringLiteral("getctag"), calendar.ctag);
    }

    PropertyResult calendarLastModified(ResolverEnvironment &env)
    {
        Calendar calendar;
        const Storage::Status status = env.calendar(&calendar);
        if (status != Storage::NoError)
            return storageFailure(env, status, "calendar");
        if (!calendar.lastModified.isValid())
            return PropertyResult::failure(PropertyResult::NotFound);
        return PropertyResult::ok(Property::Ptr(new DateTimeProperty(QStringLiteral("getlastmodified"),
                                                                     calendar.lastModified,
                                                                     DateTimeProperty::HttpDate)));
    }

    PropertyResult calendarDescription(ResolverEnvironment &env)
    {
        Calendar calendar;
        const Storage::Status status = env.calendar(&calendar);
        if (status != Storage::NoError)
            return storageFailure(env, status, "calendar");
        return text(QStringLiteral("calendar-description"), calendar.description);
    }

    PropertyResult calendarTimezone(ResolverEnvironment &env, const QString &name)
    {
        Calendar calendar;
        const Storage::Status status = env.calendar(&calendar);
        if (status != Storage::NoError)
            return storageFailure(env, status, "calendar");
        return text(name, calendar.timezone);
    }

    PropertyResult calendarCalDavTimezone(ResolverEnvironment &env)
    {
        return calendarTimezone(env, QStringLiteral("calendar-timezone"));
    }

    PropertyResult calendarGoogleTimezone(ResolverEnvironment &env)
    {
        return calendarTimezone(env, QStringLiteral("timezone"));
    }

    PropertyResult calendarComponentSet(ResolverEnvironment &env)
    {
        Calendar calendar;
        const Storage::Status status = env.calendar(&calendar);
        if (status != Storage::NoError)
            return storageFailure(env, status, "calendar");
        if (calendar.supportedComponents.isEmpty())
            return PropertyResult::failure(PropertyResult::NotFound);
        return PropertyResult::ok(Property::Ptr(new ComponentSetProperty(calendar.supportedComponents)));
    }

    PropertyResult calendarColor(ResolverEnvironment &env, const QString &name)
    {
        Calendar calendar;
        const Storage::Status status = env.calendar(&calendar);
        if (status != Storage::NoError)
            return storageFailure(env, status, "calendar");
        return text(name, calendar.color);
    }

    PropertyResult calendarAppleColor(ResolverEnvironment &env)
    {
        return calendarColor(env, QStringLiteral("calendar-color"));
    }

    PropertyResult calendarGoogleColor(ResolverEnvironment &env)
    {
        return calendarColor(env, QStringLiteral("color"));
    }

    // Object

    PropertyResult objectResourceType(ResolverEnvironment &env)
    {
        CalendarObject object;
        const Storage::Status status = env.object(&object);
        if (status != Storage::NoError)
            return storageFailure(env, status, "object");
        if (object.incidences.isEmpty())
            return PropertyResult::failure(PropertyResult::NotFound);
        return PropertyResult::ok(Property::Ptr(new ResourceTypeProperty(ResourceTypeProperty::CalendarObject,
                                                                         object.componentName())));
    }

    PropertyResult objectEtag(ResolverEnvironment &env)
    {
        CalendarObject object;
        const Storage::Status status = env.object(&object);
        if (status != Storage::NoError)
            return storageFailure(env, status, "object");
        return text(QStringLiteral("getetag"), object.etag);
    }

    PropertyResult objectLastModified(ResolverEnvironment &env)
    {
        CalendarObject object;
        const Storage::Status status = env.object(&object);
        if (status != Storage::NoError)
            return storageFailure(env, status, "object");
        QDateTime lastModified = object.lastModified;
        if (!lastModified.isValid() && !object.incidences.isEmpty())
            lastModified = object.incidences.first()->lastModified();
        if (!lastModified.isValid())
            return PropertyResult::failure(PropertyResult::NotFound);
        return PropertyResult::ok(Property::Ptr(new DateTimeProperty(QStringLiteral("getlastmodified"),
                                                                     lastModified,
                                                                     DateTimeProperty::HttpDate)));
    }

    PropertyResult objectContentType(ResolverEnvironment &)
    {
        return text(QStringLiteral("getcontenttype"), QStringLiteral("text/calendar"));
    }

    PropertyResult objectCalendarData(ResolverEnvironment &env)
    {
        CalendarObject object;
        const Storage::Status status = env.object(&object);
        if (status != Storage::NoError)
            return storageFailure(env, status, "object");
        const QString ics = IncidenceHandler::toIcs(object.incidences);
        if (ics.isEmpty()) {
            qCWarning(lcCalDav) << "Failed to serialize" << object.path;
            return PropertyResult::failure(PropertyResult::Internal);
        }
        return text(QStringLiteral("calendar-data"), ics);
    }

    Table buildCommon()
    {
        Table table;
        table.insert(QStringLiteral("owner"), owner);
        table.insert(QStringLiteral("current-user-principal"), currentUserPrincipal);
        table.insert(QStringLiteral("principal-url"), principalUrl);
        table.insert(QStringLiteral("supported-report-set"), supportedReportSet);
        table.insert(QStringLiteral("current-user-privilege-set"), currentUserPrivilegeSet);
        table.insert(QStringLiteral("calendar-home-set"), calendarHomeSet);
        table.insert(QStringLiteral("calendar-user-address-set"), calendarUserAddressSet);
        table.insert(QStringLiteral("calendar-user-type"), calendarUserType);
        table.insert(QStringLiteral("hidden"), hidden);
        table.insert(QStringLiteral("selected"), selected);
        return table;
    }

    const Table &commonTable()
    {
        static const Table table = buildCommon();
        return table;
    }

    Table buildServiceRoot()
    {
        Table table = commonTable();
        table.insert(QStringLiteral("displayname"), rootDisplayName);
        table.insert(QStringLiteral("resourcetype"), rootResourceType);
        table.insert(QStringLiteral("current-user-privilege-set"), rootPrivilegeSet);
        return table;
    }

    Table buildPrincipal()
    {
        Table table = commonTable();
        table.insert(QStringLiteral("displayname"), principalDisplayName);
        table.insert(QStringLiteral("resourcetype"), principalResourceType);
        table.insert(QStringLiteral("calendar-color"), userCalendarColor);
        table.insert(QStringLiteral("color"), userGoogleColor);
        table.insert(QStringLiteral("timezone"), userTimezone);
        table.insert(QStringLiteral("acl"), ownAcl);
        return table;
    }

    Table buildHomeSet()
    {
        Table table = commonTable();
        table.insert(QStringLiteral("displayname"), homeDisplayName);
        table.insert(QStringLiteral("resourcetype"), homeResourceType);
        table.insert(QStringLiteral("acl"), principalAcl);
        table.insert(QStringLiteral("supported-calendar-component-set"), homeComponentSet);
        insertLimits(&table);
        return table;
    }

    Table buildCollection()
    {
        Table table = commonTable();
        table.insert(QStringLiteral("displayname"), calendarDisplayName);
        table.insert(QStringLiteral("resourcetype"), calendarResourceType);
        table.insert(QStringLiteral("getetag"), calendarEtag);
        table.insert(QStringLiteral("getctag"), calendarCtag);
        table.insert(QStringLiteral("getlastmodified"), calendarLastModified);
        table.insert(QStringLiteral("calendar-description"), calendarDescription);
        table.insert(QStringLiteral("calendar-timezone"), calendarCalDavTimezone);
        table.insert(QStringLiteral("timezone"), calendarGoogleTimezone);
        table.insert(QStringLiteral("supported-calendar-component-set"), calendarComponentSet);
        table.insert(QStringLiteral("calendar-color"), calendarAppleColor);
        table.insert(QStringLiteral("color"), calendarGoogleColor);
        table.insert(QStringLiteral("acl"), ownAcl);
        insertLimits(&table);
        return table;
    }

    Table buildObject()
    {
        Table table = commonTable();
        table.insert(QStringLiteral("resourcetype"), objectResourceType);
        table.insert(QStringLiteral("getetag"), objectEtag);
        table.insert(QStringLiteral("getlastmodified"), objectLastModified);
        table.insert(QStringLiteral("getcontenttype"), objectContentType);
        table.insert(QStringLiteral("calendar-data"), objectCalendarData);
        table.insert(QStringLiteral("calendar-description"), calendarDescription);
        table.insert(QStringLiteral("calendar-timezone"), calendarCalDavTimezone);
        table.insert(QStringLiteral("timezone"), calendarGoogleTimezone);
        table.insert(QStringLiteral("calendar-color"), userCalendarColor);
        table.insert(QStringLiteral("color"), userGoogleColor);
        table.insert(QStringLiteral("acl"), ownAcl);
        insertLimits(&table);
        return table;
    }
}

ResolverEnvironment::ResolverEnvironment(Storage *storage, const Settings &settings,
                                         const Resource &resource,
                                         const CalendarObject *preloaded)
    : mStorage(storage)
    , mSettings(settings)
    , mCodec(settings.pathPrefix())
    , mResource(resource)
{
    if (preloaded) {
        mObjectLoaded = true;
        mObject = *preloaded;
    }
}

const Resource &ResolverEnvironment::resource() const
{
    return mResource;
}

const Settings &ResolverEnvironment::settings() const
{
    return mSettings;
}

bool ResolverEnvironment::resourceHref(QString *href) const
{
    if (!mResource.uri.isEmpty()) {
        *href = mResource.uri;
        return true;
    }
    QString errorMessage;
    if (!mCodec.encodePath(mResource, href, &errorMessage)) {
        qCWarning(lcCalDav) << "Failed to encode resource href:" << errorMessage;
        return false;
    }
    return true;
}

bool ResolverEnvironment::principalHref(QString *href) const
{
    QString errorMessage;
    if (!mCodec.encodePath(Resource(Resource::Principal, mResource.userId), href, &errorMessage)) {
        qCWarning(lcCalDav) << "Failed to encode principal href:" << errorMessage;
        return false;
    }
    return true;
}

bool ResolverEnvironment::homeSetHref(QString *href) const
{
    QString errorMessage;
    if (!mCodec.encodePath(Resource(Resource::HomeSet, mResource.userId), href, &errorMessage)) {
        qCWarning(lcCalDav) << "Failed to encode calendar home set href:" << errorMessage;
        return false;
    }
    return true;
}

Storage::Status ResolverEnvironment::user(User *user)
{
    if (!mUserLoaded) {
        mUserStatus = mStorage->getUser(mResource.userId, &mUser);
        mUserLoaded = true;
    }
    if (mUserStatus == Storage::NoError && user)
        *user = mUser;
    return mUserStatus;
}

Storage::Status ResolverEnvironment::calendar(Calendar *calendar)
{
    if (!mCalendarLoaded) {
        mCalendarStatus = mStorage->getCalendar(mResource.userId, mResource.calendarId, &mCalendar);
        mCalendarLoaded = true;
    }
    if (mCalendarStatus == Storage::NoError && calendar)
        *calendar = mCalendar;
    return mCalendarStatus;
}

Storage::Status ResolverEnvironment::object(CalendarObject *object)
{
    if (!mObjectLoaded) {
        mObjectStatus = mStorage->getObject(mResource.userId, mResource.calendarId,
                                            mResource.objectId, &mObject);
        mObjectLoaded = true;
    }
    if (mObjectStatus == Storage::NoError && object)
        *object = mObject;
    return mObjectStatus;
}

Storage::Status ResolverEnvironment::privileges(Privileges *privileges)
{
    if (mResource.type == Resource::Collection || mResource.type == Resource::Object) {
        Calendar cal;
        const Storage::Status status = calendar(&cal);
        if (status != Storage::NoError)
            return status;
        *privileges = cal.readOnly ? Privileges(READ) : (READ | WRITE);
    } else {
        *privileges = READ | WRITE;
    }
    return Storage::NoError;
}

const PropertyResolver::Table &PropertyResolver::table(Resource::Type type)
{
    static const Table serviceRoot = buildServiceRoot();
    static const Table principal = buildPrincipal();
    static const Table homeSet = buildHomeSet();
    static const Table collection = buildCollection();
    static const Table object = buildObject();
    static const Table empty;

    switch (type) {
    case Resource::ServiceRoot:
        return serviceRoot;
    case Resource::Principal:
        return principal;
    case Resource::HomeSet:
        return homeSet;
    case Resource::Collection:
        return collection;
    case Resource::Object:
        return object;
    default:
        return empty;
    }
}

void PropertyResolver::resolve(ResolverEnvironment &env, PropertyMap *properties)
{
    const Table &resolvers = table(env.resource().type);
    for (PropertyMap::iterator it = properties->begin(); it != properties->end(); ++it) {
        Table::const_iterator resolver = resolvers.constFind(it.key());
        if (resolver == resolvers.constEnd())
            it.value() = PropertyResult::failure(PropertyResult::NotFound);
        else
            it.value() = resolver.value()(env);
    }
}

QStringList PropertyResolver::names(Resource::Type type)
{
    QStringList list;
    const Table &resolvers = table(type);
    for (Table::const_iterator it = resolvers.constBegin(); it != resolvers.constEnd(); ++it) {
        if (it.value() != notFound)
            list.append(it.key());
    }
    list.sort();
    return list;
}
