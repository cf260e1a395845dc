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

#include <QtTest>
#include <QObject>

#include <KCalendarCore/Event>
#include <KCalendarCore/Todo>
#include <KCalendarCore/Attendee>
#include <KCalendarCore/Duration>

#include <matcher.h>

using namespace CalDav;
using namespace KCalendarCore;

namespace {
const QByteArray JANUARY_FILTER(
    "<C:filter xmlns:C=\"urn:ietf:params:xml:ns:caldav\">"
    " <C:comp-filter name=\"VCALENDAR\">"
    "  <C:comp-filter name=\"VEVENT\">"
    "   <C:time-range start=\"20240101T000000Z\" end=\"20240131T235959Z\"/>"
    "  </C:comp-filter>"
    " </C:comp-filter>"
    "</C:filter>");

QDateTime utc(int year, int month, int day, int hour = 0, int minute = 0)
{
    return QDateTime(QDate(year, month, day), QTime(hour, minute), Qt::UTC);
}

CalendarObject objectFor(const Incidence::Ptr &incidence)
{
    CalendarObject object;
    object.id = incidence->uid() + QStringLiteral(".ics");
    object.incidences.append(incidence);
    return object;
}

Event::Ptr event(const QDateTime &start, const QDateTime &end, const QString &summary = QString())
{
    Event::Ptr event(new Event);
    event->setUid(QStringLiteral("event-%1").arg(start.toString(Qt::ISODate)));
    event->setDtStart(start);
    if (end.isValid())
        event->setDtEnd(end);
    event->setSummary(summary);
    return event;
}

Filter rangeFilter(const QString &component, const QDateTime &start, const QDateTime &end)
{
    Filter root;
    root.component = QStringLiteral("VCALENDAR");
    Filter child;
    child.component = component;
    child.hasTimeRange = true;
    child.timeRange.start = start;
    child.timeRange.end = end;
    root.children.append(child);
    return root;
}

Filter eventFilter()
{
    Filter root;
    root.component = QStringLiteral("VCALENDAR");
    Filter child;
    child.component = QStringLiteral("VEVENT");
    root.children.append(child);
    return root;
}
}


class tst_Matcher : public QObject
{
    Q_OBJECT

private slots:
    void timeRange_data();
    void timeRange();

    void nullFilterMatchesEverything();
    void rootMustBeCalendar();
    void componentIsNotDefined();
    void todoWithoutDates();
    void todoWithDuration();
    void movedOccurrence_data();
    void movedOccurrence();
    void textMatchOnSummary_data();
    void textMatchOnSummary();
    void propIsNotDefined();
    void attendeeParameters_data();
    void attendeeParameters();
    void allOfAndAnyOf();
};

void tst_Matcher::timeRange_data()
{
    QTest::addColumn<KCalendarCore::Incidence::Ptr>("incidence");
    QTest::addColumn<bool>("expected");

    QTest::newRow("inside January")
        << Incidence::Ptr(event(utc(2024, 1, 15, 10), utc(2024, 1, 15, 11)))
        << true;
    QTest::newRow("in February")
        << Incidence::Ptr(event(utc(2024, 2, 10, 10), utc(2024, 2, 10, 11)))
        << false;
    QTest::newRow("crossing new year")
        << Incidence::Ptr(event(utc(2023, 12, 31, 23), utc(2024, 1, 1, 1)))
        << true;
    QTest::newRow("ending at range start")
        << Incidence::Ptr(event(utc(2023, 12, 31, 23), utc(2024, 1, 1)))
        << false;
    QTest::newRow("instant at range start")
        << Incidence::Ptr(event(utc(2024, 1, 1), QDateTime()))
        << true;

    Event::Ptr allDay = event(utc(2024, 1, 31), QDateTime());
    allDay->setAllDay(true);
    QTest::newRow("all day on the last day")
        << Incidence::Ptr(allDay)
        << true;

    Event::Ptr lateNight = event(utc(2023, 12, 31, 23, 30), QDateTime());
    lateNight->setDuration(Duration(3600));
    QTest::newRow("duration running into January")
        << Incidence::Ptr(lateNight)
        << true;

    Event::Ptr evening = event(utc(2023, 12, 31, 22), QDateTime());
    evening->setDuration(Duration(3600));
    QTest::newRow("duration ending before January")
        << Incidence::Ptr(evening)
        << false;

    Event::Ptr weekly = event(utc(2023, 12, 1, 9), utc(2023, 12, 1, 10));
    weekly->recurrence()->setWeekly(1);
    QTest::newRow("weekly since December")
        << Incidence::Ptr(weekly)
        << true;

    Event::Ptr finished = event(utc(2023, 11, 1, 9), utc(2023, 11, 1, 10));
    finished->recurrence()->setWeekly(1);
    finished->recurrence()->setDuration(2);
    QTest::newRow("weekly ended in November")
        << Incidence::Ptr(finished)
        << false;

    Todo::Ptr todo(new Todo);
    todo->setUid(QStringLiteral("todo"));
    todo->setDtDue(utc(2024, 1, 10));
    QTest::newRow("todo does not satisfy VEVENT")
        << Incidence::Ptr(todo)
        << false;
}

void tst_Matcher::timeRange()
{
    QFETCH(KCalendarCore::Incidence::Ptr, incidence);
    QFETCH(bool, expected);

    Filter filter;
    QVERIFY(Filter::fromData(JANUARY_FILTER, &filter));
    QCOMPARE(Matcher::matches(filter, objectFor(incidence)), expected);
}

void tst_Matcher::nullFilterMatchesEverything()
{
    QVERIFY(Matcher::matches(Filter(), objectFor(event(utc(2020, 5, 5), QDateTime()))));
    QVERIFY(Matcher::matches(Filter(), CalendarObject()));
}

void tst_Matcher::rootMustBeCalendar()
{
    Filter filter;
    filter.component = QStringLiteral("VEVENT");
    QVERIFY(!Matcher::matches(filter, objectFor(event(utc(2024, 1, 15), QDateTime()))));
}

void tst_Matcher::componentIsNotDefined()
{
    Filter filter = eventFilter();
    filter.children.first().component = QStringLiteral("VTODO");
    filter.children.first().isNotDefined = true;

    QVERIFY(Matcher::matches(filter, objectFor(event(utc(2024, 1, 15), QDateTime()))));

    Todo::Ptr todo(new Todo);
    todo->setUid(QStringLiteral("todo"));
    QVERIFY(!Matcher::matches(filter, objectFor(todo)));
}

void tst_Matcher::todoWithoutDates()
{
    Todo::Ptr todo(new Todo);
    todo->setUid(QStringLiteral("undated"));

    Filter filter = eventFilter();
    filter.children.first().component = QStringLiteral("VTODO");
    filter.children.first().hasTimeRange = true;
    filter.children.first().timeRange.start = utc(2024, 1, 1);
    filter.children.first().timeRange.end = utc(2024, 2, 1);
    QVERIFY(Matcher::matches(filter, objectFor(todo)));
}

void tst_Matcher::todoWithDuration()
{
    Todo::Ptr todo(new Todo);
    todo->setUid(QStringLiteral("late-task"));
    todo->setDtStart(utc(2023, 12, 31, 23, 30));
    todo->setDuration(Duration(3600));

    QVERIFY(Matcher::matches(rangeFilter(QStringLiteral("VTODO"), utc(2024, 1, 1), utc(2024, 2, 1)),
                             objectFor(todo)));
    QVERIFY(!Matcher::matches(rangeFilter(QStringLiteral("VTODO"), utc(2024, 1, 1, 1), utc(2024, 2, 1)),
                              objectFor(todo)));
}

void tst_Matcher::movedOccurrence_data()
{
    QTest::addColumn<QDateTime>("start");
    QTest::addColumn<QDateTime>("end");
    QTest::addColumn<bool>("withOverride");
    QTest::addColumn<bool>("expected");

    // Weekly on Mondays 09:00, January 8 to 29; the 15th moves to February 20.
    QTest::newRow("original slot, not moved") << utc(2024, 1, 15) << utc(2024, 1, 16) << false << true;
    QTest::newRow("original slot, moved away") << utc(2024, 1, 15) << utc(2024, 1, 16) << true << false;
    QTest::newRow("next slot after moved one") << utc(2024, 1, 15) << utc(2024, 1, 23) << true << true;
    QTest::newRow("new slot of moved instance") << utc(2024, 2, 20) << utc(2024, 2, 21) << true << true;
    QTest::newRow("new slot without override") << utc(2024, 2, 20) << utc(2024, 2, 21) << false << false;
}

void tst_Matcher::movedOccurrence()
{
    QFETCH(QDateTime, start);
    QFETCH(QDateTime, end);
    QFETCH(bool, withOverride);
    QFETCH(bool, expected);

    Event::Ptr master = event(utc(2024, 1, 8, 9), utc(2024, 1, 8, 10));
    master->recurrence()->setWeekly(1);
    master->recurrence()->setDuration(4);
    CalendarObject object = objectFor(master);

    if (withOverride) {
        Event::Ptr moved(new Event);
        moved->setUid(master->uid());
        moved->setRecurrenceId(utc(2024, 1, 15, 9));
        moved->setDtStart(utc(2024, 2, 20, 14));
        moved->setDtEnd(utc(2024, 2, 20, 15));
        object.incidences.append(moved);
    }

    QCOMPARE(Matcher::matches(rangeFilter(QStringLiteral("VEVENT"), start, end), object), expected);
}

void tst_Matcher::textMatchOnSummary_data()
{
    QTest::addColumn<QString>("summary");
    QTest::addColumn<QString>("matchType");
    QTest::addColumn<bool>("negate");
    QTest::addColumn<bool>("expected");

    QTest::newRow("contains")
        << QStringLiteral("Quarterly Review") << QStringLiteral("contains") << false << true;
    QTest::newRow("starts-with mismatch")
        << QStringLiteral("Quarterly Review") << QStringLiteral("starts-with") << false << false;
    QTest::newRow("negated contains")
        << QStringLiteral("Quarterly Review") << QStringLiteral("contains") << true << false;
    QTest::newRow("empty summary")
        << QString() << QStringLiteral("contains") << false << false;
}

void tst_Matcher::textMatchOnSummary()
{
    QFETCH(QString, summary);
    QFETCH(QString, matchType);
    QFETCH(bool, negate);
    QFETCH(bool, expected);

    PropFilter prop;
    prop.name = QStringLiteral("SUMMARY");
    prop.hasTextMatch = true;
    prop.textMatch.matchType = matchType;
    prop.textMatch.negate = negate;
    prop.textMatch.value = QStringLiteral("review");

    Filter filter = eventFilter();
    filter.children.first().propFilters.append(prop);
    QCOMPARE(Matcher::matches(filter, objectFor(event(utc(2024, 3, 1), QDateTime(), summary))), expected);
}

void tst_Matcher::propIsNotDefined()
{
    PropFilter prop;
    prop.name = QStringLiteral("LOCATION");
    prop.isNotDefined = true;
    Filter filter = eventFilter();
    filter.children.first().propFilters.append(prop);

    Event::Ptr indoor = event(utc(2024, 3, 1), QDateTime());
    QVERIFY(Matcher::matches(filter, objectFor(indoor)));
    indoor->setLocation(QStringLiteral("Room 1"));
    QVERIFY(!Matcher::matches(filter, objectFor(indoor)));
}

void tst_Matcher::attendeeParameters_data()
{
    QTest::addColumn<QString>("email");
    QTest::addColumn<QString>("partStat");
    QTest::addColumn<bool>("expected");

    QTest::newRow("accepted attendee")
        << QStringLiteral("bob@example.com") << QStringLiteral("ACCEPTED") << true;
    QTest::newRow("wrong participation status")
        << QStringLiteral("bob@example.com") << QStringLiteral("DECLINED") << false;
    QTest::newRow("other attendee")
        << QStringLiteral("carol@example.com") << QStringLiteral("ACCEPTED") << false;
}

void tst_Matcher::attendeeParameters()
{
    QFETCH(QString, email);
    QFETCH(QString, partStat);
    QFETCH(bool, expected);

    Event::Ptr meeting = event(utc(2024, 3, 1, 10), utc(2024, 3, 1, 11), QStringLiteral("Planning"));
    meeting->addAttendee(Attendee(QStringLiteral("Bob"), QStringLiteral("bob@example.com"),
                                  true, Attendee::Accepted));
    meeting->addAttendee(Attendee(QStringLiteral("Dave"), QStringLiteral("dave@example.com"),
                                  false, Attendee::Declined));

    PropFilter prop;
    prop.name = QStringLiteral("ATTENDEE");
    prop.hasTextMatch = true;
    prop.textMatch.value = QStringLiteral("mailto:") + email;
    ParamFilter param;
    param.name = QStringLiteral("PARTSTAT");
    param.hasTextMatch = true;
    param.textMatch.matchType = QStringLiteral("equals");
    param.textMatch.value = partStat;
    prop.paramFilters.append(param);

    Filter filter = eventFilter();
    filter.children.first().propFilters.append(prop);
    QCOMPARE(Matcher::matches(filter, objectFor(meeting)), expected);
}

void tst_Matcher::allOfAndAnyOf()
{
    PropFilter summary;
    summary.name = QStringLiteral("SUMMARY");
    summary.hasTextMatch = true;
    summary.textMatch.value = QStringLiteral("lunch");
    PropFilter location;
    location.name = QStringLiteral("LOCATION");
    location.hasTextMatch = true;
    location.textMatch.value = QStringLiteral("cafeteria");

    Filter filter = eventFilter();
    filter.children.first().propFilters << summary << location;

    Event::Ptr lunch = event(utc(2024, 3, 1, 12), utc(2024, 3, 1, 13), QStringLiteral("Team lunch"));
    lunch->setLocation(QStringLiteral("Downtown"));

    QVERIFY(Matcher::matches(filter, objectFor(lunch)));
    filter.children.first().test = QStringLiteral("allof");
    QVERIFY(!Matcher::matches(filter, objectFor(lunch)));
    lunch->setLocation(QStringLiteral("Cafeteria, 2nd floor"));
    QVERIFY(Matcher::matches(filter, objectFor(lunch)));
}

QTEST_MAIN(tst_Matcher)
#include "tst_matcher.moc"
