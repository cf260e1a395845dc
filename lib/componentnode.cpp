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

#include "componentnode_p.h"
#include "logging_p.h"

#include <KCalendarCore/Event>
#include <KCalendarCore/Todo>
#include <KCalendarCore/Journal>
#include <KCalendarCore/FreeBusy>
#include <KCalendarCore/Recurrence>
#include <KCalendarCore/RecurrenceRule>
#include <KCalendarCore/ICalFormat>

using namespace CalDav;

namespace {
    QString formatDateTime(const QDateTime &dateTime, bool dateOnly)
    {
        if (dateOnly)
            return dateTime.date().toString(QStringLiteral("yyyyMMdd"));
        return Filter::formatTimestamp(dateTime);
    }

    void appendText(QList<PropertyInstance> *list, const QString &value)
    {
        if (value.isEmpty())
            return;
        PropertyInstance instance;
        instance.value = value;
        list->append(instance);
    }

    void appendTexts(QList<PropertyInstance> *list, const QStringList &values)
    {
        for (const QString &value : values)
            appendText(list, value);
    }

    QString statusName(const KCalendarCore::Incidence &incidence)
    {
        switch (incidence.status()) {
        case KCalendarCore::Incidence::StatusTentative:
            return QStringLiteral("TENTATIVE");
        case KCalendarCore::Incidence::StatusConfirmed:
            return QStringLiteral("CONFIRMED");
        case KCalendarCore::Incidence::StatusCompleted:
            return QStringLiteral("COMPLETED");
        case KCalendarCore::Incidence::StatusNeedsAction:
            return QStringLiteral("NEEDS-ACTION");
        case KCalendarCore::Incidence::StatusCanceled:
            return QStringLiteral("CANCELLED");
        case KCalendarCore::Incidence::StatusInProcess:
            return QStringLiteral("IN-PROCESS");
        case KCalendarCore::Incidence::StatusDraft:
            return QStringLiteral("DRAFT");
        case KCalendarCore::Incidence::StatusFinal:
            return QStringLiteral("FINAL");
        case KCalendarCore::Incidence::StatusX:
            return incidence.customStatus();
        default:
            return QString();
        }
    }

    QString className(KCalendarCore::Incidence::Secrecy secrecy)
    {
        switch (secrecy) {
        case KCalendarCore::Incidence::SecrecyPrivate:
            return QStringLiteral("PRIVATE");
        case KCalendarCore::Incidence::SecrecyConfidential:
            return QStringLiteral("CONFIDENTIAL");
        default:
            return QStringLiteral("PUBLIC");
        }
    }

    QString partStatName(KCalendarCore::Attendee::PartStat status)
    {
        switch (status) {
        case KCalendarCore::Attendee::Accepted:
            return QStringLiteral("ACCEPTED");
        case KCalendarCore::Attendee::Declined:
            return QStringLiteral("DECLINED");
        case KCalendarCore::Attendee::Tentative:
            return QStringLiteral("TENTATIVE");
        case KCalendarCore::Attendee::Delegated:
            return QStringLiteral("DELEGATED");
        case KCalendarCore::Attendee::Completed:
            return QStringLiteral("COMPLETED");
        case KCalendarCore::Attendee::InProcess:
            return QStringLiteral("IN-PROCESS");
        default:
            return QStringLiteral("NEEDS-ACTION");
        }
    }

    QString roleName(KCalendarCore::Attendee::Role role)
    {
        switch (role) {
        case KCalendarCore::Attendee::OptParticipant:
            return QStringLiteral("OPT-PARTICIPANT");
        case KCalendarCore::Attendee::NonParticipant:
            return QStringLiteral("NON-PARTICIPANT");
        case KCalendarCore::Attendee::Chair:
            return QStringLiteral("CHAIR");
        default:
            return QStringLiteral("REQ-PARTICIPANT");
        }
    }

    QString actionName(KCalendarCore::Alarm::Type type)
    {
        switch (type) {
        case KCalendarCore::Alarm::Display:
            return QStringLiteral("DISPLAY");
        case KCalendarCore::Alarm::Procedure:
            return QStringLiteral("PROCEDURE");
        case KCalendarCore::Alarm::Email:
            return QStringLiteral("EMAIL");
        case KCalendarCore::Alarm::Audio:
            return QStringLiteral("AUDIO");
        default:
            return QString();
        }
    }

    QString calAddress(const QString &email)
    {
        return email.isEmpty() ? QString() : QStringLiteral("mailto:") + email;
    }

    // An occurrence [from, to) of zero length is a point in time.
    bool spanOverlaps(const TimeRange &range, const QDateTime &from, const QDateTime &to)
    {
        if (to > from)
            return range.overlaps(from, to);
        return range.contains(from);
    }
}

ComponentNode ComponentNode::calendar(const CalendarObject &object)
{
    ComponentNode node(CalendarKind);
    node.mIncidences = object.incidences;
    return node;
}

QString ComponentNode::name() const
{
    switch (mKind) {
    case CalendarKind:
        return QStringLiteral("VCALENDAR");
    case IncidenceKind:
        return componentName(*mIncidence);
    case AlarmKind:
        return QStringLiteral("VALARM");
    }
    return QString();
}

QList<ComponentNode> ComponentNode::children() const
{
    QList<ComponentNode> nodes;
    if (mKind == CalendarKind) {
        for (const KCalendarCore::Incidence::Ptr &incidence : mIncidences) {
            ComponentNode node(IncidenceKind);
            node.mIncidence = incidence;
            if (incidence->recurs()) {
                for (const KCalendarCore::Incidence::Ptr &other : mIncidences) {
                    if (other->hasRecurrenceId() && other->uid() == incidence->uid())
                        node.mOverridden.append(other->recurrenceId().toUTC());
                }
            }
            nodes.append(node);
        }
    } else if (mKind == IncidenceKind) {
        const KCalendarCore::Alarm::List alarms = mIncidence->alarms();
        for (const KCalendarCore::Alarm::Ptr &alarm : alarms) {
            ComponentNode node(AlarmKind);
            node.mIncidence = mIncidence;
            node.mAlarm = alarm;
            nodes.append(node);
        }
    }
    return nodes;
}

QList<PropertyInstance> ComponentNode::properties(const QString &name) const
{
    const QString key = name.toUpper();
    switch (mKind) {
    case CalendarKind: {
        QList<PropertyInstance> list;
        if (key == QStringLiteral("VERSION"))
            appendText(&list, QStringLiteral("2.0"));
        else if (key == QStringLiteral("CALSCALE"))
            appendText(&list, QStringLiteral("GREGORIAN"));
        return list;
    }
    case IncidenceKind:
        return incidenceProperties(key);
    case AlarmKind:
        return alarmProperties(key);
    }
    return QList<PropertyInstance>();
}

QList<PropertyInstance> ComponentNode::incidenceProperties(const QString &key) const
{
    QList<PropertyInstance> list;
    const KCalendarCore::Incidence &incidence = *mIncidence;

    if (key == QStringLiteral("SUMMARY")) {
        appendText(&list, incidence.summary());
    } else if (key == QStringLiteral("DESCRIPTION")) {
        appendText(&list, incidence.description());
    } else if (key == QStringLiteral("LOCATION")) {
        appendText(&list, incidence.location());
    } else if (key == QStringLiteral("UID")) {
        appendText(&list, incidence.uid());
    } else if (key == QStringLiteral("STATUS")) {
        appendText(&list, statusName(incidence));
    } else if (key == QStringLiteral("CLASS")) {
        appendText(&list, className(incidence.secrecy()));
    } else if (key == QStringLiteral("CATEGORIES")) {
        appendTexts(&list, incidence.categories());
    } else if (key == QStringLiteral("COMMENT")) {
        appendTexts(&list, incidence.comments());
    } else if (key == QStringLiteral("CONTACT")) {
        appendTexts(&list, incidence.contacts());
    } else if (key == QStringLiteral("RESOURCES")) {
        appendTexts(&list, incidence.resources());
    } else if (key == QStringLiteral("PRIORITY")) {
        if (incidence.priority() > 0)
            appendText(&list, QString::number(incidence.priority()));
    } else if (key == QStringLiteral("SEQUENCE")) {
        appendText(&list, QString::number(incidence.revision()));
    } else if (key == QStringLiteral("DTSTART")) {
        if (incidence.dtStart().isValid())
            appendText(&list, formatDateTime(incidence.dtStart(), incidence.allDay()));
    } else if (key == QStringLiteral("DTEND")) {
        if (incidence.type() == KCalendarCore::IncidenceBase::TypeEvent) {
            const KCalendarCore::Event &event = static_cast<const KCalendarCore::Event &>(incidence);
            if (event.hasEndDate())
                appendText(&list, formatDateTime(event.dtEnd(), event.allDay()));
        }
    } else if (key == QStringLiteral("TRANSP")) {
        if (incidence.type() == KCalendarCore::IncidenceBase::TypeEvent) {
            const KCalendarCore::Event &event = static_cast<const KCalendarCore::Event &>(incidence);
            appendText(&list, event.transparency() == KCalendarCore::Event::Transparent
                       ? QStringLiteral("TRANSPARENT") : QStringLiteral("OPAQUE"));
        }
    } else if (key == QStringLiteral("DUE") || key == QStringLiteral("COMPLETED")) {
        if (incidence.type() == KCalendarCore::IncidenceBase::TypeTodo) {
            const KCalendarCore::Todo &todo = static_cast<const KCalendarCore::Todo &>(incidence);
            if (key == QStringLiteral("DUE") && todo.hasDueDate())
                appendText(&list, formatDateTime(todo.dtDue(), todo.allDay()));
            else if (key == QStringLiteral("COMPLETED") && todo.hasCompletedDate())
                appendText(&list, formatDateTime(todo.completed(), false));
        }
    } else if (key == QStringLiteral("RECURRENCE-ID")) {
        if (incidence.hasRecurrenceId())
            appendText(&list, formatDateTime(incidence.recurrenceId(), incidence.allDay()));
    } else if (key == QStringLiteral("RRULE")) {
        if (incidence.recurs()) {
            KCalendarCore::RecurrenceRule *rule = incidence.recurrence()->defaultRRuleConst();
            if (rule) {
                KCalendarCore::ICalFormat format;
                QString text = format.toString(rule);
                if (text.startsWith(QStringLiteral("RRULE:")))
                    text = text.mid(6);
                appendText(&list, text.trimmed());
            }
        }
    } else if (key == QStringLiteral("CREATED")) {
        if (incidence.created().isValid())
            appendText(&list, formatDateTime(incidence.created(), false));
    } else if (key == QStringLiteral("LAST-MODIFIED")) {
        if (incidence.lastModified().isValid())
            appendText(&list, formatDateTime(incidence.lastModified(), false));
    } else if (key == QStringLiteral("ORGANIZER")) {
        const KCalendarCore::Person organizer = incidence.organizer();
        if (!organizer.isEmpty()) {
            PropertyInstance instance;
            instance.value = calAddress(organizer.email());
            if (!organizer.name().isEmpty())
                instance.parameters.insert(QStringLiteral("CN"), organizer.name());
            list.append(instance);
        }
    } else if (key == QStringLiteral("ATTENDEE")) {
        const KCalendarCore::Attendee::List attendees = incidence.attendees();
        for (const KCalendarCore::Attendee &attendee : attendees) {
            PropertyInstance instance;
            instance.value = calAddress(attendee.email());
            if (!attendee.name().isEmpty())
                instance.parameters.insert(QStringLiteral("CN"), attendee.name());
            instance.parameters.insert(QStringLiteral("PARTSTAT"), partStatName(attendee.status()));
            instance.parameters.insert(QStringLiteral("ROLE"), roleName(attendee.role()));
            instance.parameters.insert(QStringLiteral("CUTYPE"), attendee.cuTypeStr());
            instance.parameters.insert(QStringLiteral("RSVP"),
                                       attendee.RSVP() ? QStringLiteral("TRUE") : QStringLiteral("FALSE"));
            if (!attendee.delegate().isEmpty())
                instance.parameters.insert(QStringLiteral("DELEGATED-TO"), attendee.delegate());
            if (!attendee.delegator().isEmpty())
                instance.parameters.insert(QStringLiteral("DELEGATED-FROM"), attendee.delegator());
            list.append(instance);
        }
    } else if (key.startsWith(QStringLiteral("X-"))) {
        const QMap<QByteArray, QString> custom = incidence.customProperties();
        appendText(&list, custom.value(key.toLatin1()));
    }
    return list;
}

QList<PropertyInstance> ComponentNode::alarmProperties(const QString &key) const
{
    QList<PropertyInstance> list;
    if (key == QStringLiteral("ACTION")) {
        appendText(&list, actionName(mAlarm->type()));
    } else if (key == QStringLiteral("DESCRIPTION")) {
        appendText(&list, mAlarm->type() == KCalendarCore::Alarm::Email
                   ? mAlarm->mailText() : mAlarm->text());
    } else if (key == QStringLiteral("SUMMARY")) {
        appendText(&list, mAlarm->mailSubject());
    } else if (key == QStringLiteral("TRIGGER")) {
        if (mAlarm->hasTime()) {
            PropertyInstance instance;
            instance.value = formatDateTime(mAlarm->time(), false);
            instance.parameters.insert(QStringLiteral("VALUE"), QStringLiteral("DATE-TIME"));
            list.append(instance);
        } else {
            const int seconds = mAlarm->hasEndOffset()
                ? mAlarm->endOffset().asSeconds() : mAlarm->startOffset().asSeconds();
            PropertyInstance instance;
            instance.value = QStringLiteral("%1PT%2S").arg(seconds < 0 ? QStringLiteral("-") : QString())
                .arg(qAbs(seconds));
            instance.parameters.insert(QStringLiteral("RELATED"), mAlarm->hasEndOffset()
                                       ? QStringLiteral("END") : QStringLiteral("START"));
            list.append(instance);
        }
    } else if (key == QStringLiteral("REPEAT")) {
        if (mAlarm->repeatCount() > 0)
            appendText(&list, QString::number(mAlarm->repeatCount()));
    }
    return list;
}

bool ComponentNode::overlaps(const TimeRange &range) const
{
    switch (mKind) {
    case CalendarKind:
        for (const ComponentNode &child : children()) {
            if (child.overlaps(range))
                return true;
        }
        return false;
    case IncidenceKind:
        return incidenceOverlaps(range);
    case AlarmKind:
        return alarmOverlaps(range);
    }
    return false;
}

bool ComponentNode::incidenceOverlaps(const TimeRange &range) const
{
    QDateTime start = mIncidence->dtStart();
    QDateTime end;

    switch (mIncidence->type()) {
    case KCalendarCore::IncidenceBase::TypeEvent: {
        const KCalendarCore::Event::Ptr event = mIncidence.staticCast<KCalendarCore::Event>();
        if (!start.isValid())
            return false;
        if (event->hasEndDate()) {
            // All day events carry an inclusive end date.
            end = event->allDay() ? event->dtEnd().addDays(1) : event->dtEnd();
        } else if (event->hasDuration()) {
            end = event->duration().end(start);
        } else if (event->allDay()) {
            end = start.addDays(1);
        } else {
            end = start;
        }
        break;
    }
    case KCalendarCore::IncidenceBase::TypeTodo: {
        const KCalendarCore::Todo::Ptr todo = mIncidence.staticCast<KCalendarCore::Todo>();
        const bool hasStart = todo->hasStartDate() && start.isValid();
        if (hasStart && todo->hasDueDate()) {
            end = todo->dtDue();
        } else if (hasStart && todo->hasDuration()) {
            end = todo->duration().end(start);
        } else if (todo->hasDueDate()) {
            start = end = todo->dtDue();
        } else if (hasStart) {
            end = start;
        } else {
            // Without any date, a todo matches every range.
            return true;
        }
        break;
    }
    case KCalendarCore::IncidenceBase::TypeJournal:
        if (!start.isValid())
            return false;
        end = mIncidence->allDay() ? start.addDays(1) : start;
        break;
    case KCalendarCore::IncidenceBase::TypeFreeBusy:
        if (!start.isValid())
            return false;
        end = mIncidence.staticCast<KCalendarCore::FreeBusy>()->dtEnd();
        if (!end.isValid() || end < start)
            end = start;
        break;
    default:
        return false;
    }

    if (!mIncidence->recurs())
        return spanOverlaps(range, start, end);

    // Look up the first occurrence that may still overlap the range,
    // then check it starts before the range ends.
    const qint64 duration = start.secsTo(end);
    QDateTime after;
    if (!range.start.isValid())
        after = start.addSecs(-1);
    else if (duration > 0)
        after = range.start.addSecs(-duration);
    else
        after = range.start.addSecs(-1);

    // Instances moved by an override of the same object are not
    // instances of the master any more.
    QDateTime occurrence = mIncidence->recurrence()->getNextDateTime(after);
    while (occurrence.isValid() && mOverridden.contains(occurrence.toUTC()))
        occurrence = mIncidence->recurrence()->getNextDateTime(occurrence);
    if (!occurrence.isValid())
        return false;
    return !range.end.isValid() || occurrence < range.end;
}

bool ComponentNode::alarmOverlaps(const TimeRange &range) const
{
    const QDateTime trigger = mAlarm->time();
    if (!trigger.isValid())
        return false;
    return range.contains(trigger);
}
