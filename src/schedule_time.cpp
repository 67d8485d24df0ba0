#include "core/schedule_time.hpp"
#include "core/pipeline_errors.hpp"
#include <Poco/DateTime.h>
#include <Poco/DateTimeFormat.h>
#include <Poco/DateTimeFormatter.h>
#include <Poco/DateTimeParser.h>
#include <Poco/Timestamp.h>
#include <algorithm>

namespace
{
    size_t timeSeparator(const std::string &text)
    {
        // Date part is fixed width: YYYY-MM-DD
        if (text.size() > 10 && (text[10] == 'T' || text[10] == 't' || text[10] == ' '))
            return 10;
        return std::string::npos;
    }
}

bool ScheduleTime::hasZoneDesignator(const std::string &text)
{
    size_t sep = timeSeparator(text);
    if (sep == std::string::npos)
        return false;
    std::string time_part = text.substr(sep + 1);
    return time_part.find_first_of("Zz+-") != std::string::npos;
}

int64_t ScheduleTime::parse(const std::string &raw, int default_offset_minutes)
{
    std::string text = raw;
    text.erase(0, text.find_first_not_of(" \t"));
    text.erase(text.find_last_not_of(" \t") + 1);

    size_t sep = timeSeparator(text);
    if (sep == std::string::npos)
        throw ValidationError("scheduled_at '" + raw + "' is not an ISO 8601 date-time");
    text[sep] = 'T';
    if (text.back() == 'z')
        text.back() = 'Z';

    size_t zone_pos = text.find_first_of("Zz+-", sep + 1);
    std::string clock = text.substr(sep + 1, zone_pos == std::string::npos ? std::string::npos : zone_pos - sep - 1);

    // Sub-second precision is irrelevant for a post date
    size_t fraction = clock.find_first_of(".,");
    if (fraction != std::string::npos)
    {
        text.erase(sep + 1 + fraction, clock.size() - fraction);
        clock.erase(fraction);
    }

    // Browsers send "YYYY-MM-DDTHH:MM" without seconds
    if (std::count(clock.begin(), clock.end(), ':') == 1)
    {
        text.insert(sep + 1 + clock.size(), ":00");
    }

    Poco::DateTime parsed;
    int tzd = 0;
    if (!Poco::DateTimeParser::tryParse(Poco::DateTimeFormat::ISO8601_FORMAT, text, parsed, tzd))
        throw ValidationError("scheduled_at '" + raw + "' is not a valid ISO 8601 date-time");

    if (!hasZoneDesignator(text))
        tzd = default_offset_minutes * 60;
    parsed.makeUTC(tzd);
    return static_cast<int64_t>(parsed.timestamp().epochTime());
}

int64_t ScheduleTime::resolveFuture(const std::string &text, int default_offset_minutes, int64_t now)
{
    int64_t when = parse(text, default_offset_minutes);
    if (when <= now)
    {
        throw ValidationError("scheduled_at " + formatUtc(when) + " is not in the future (now " +
                              formatUtc(now) + ")");
    }
    return when;
}

int64_t ScheduleTime::now()
{
    return static_cast<int64_t>(Poco::Timestamp().epochTime());
}

std::string ScheduleTime::formatUtc(int64_t unix_seconds)
{
    Poco::Timestamp ts = Poco::Timestamp::fromEpochTime(static_cast<std::time_t>(unix_seconds));
    return Poco::DateTimeFormatter::format(ts, Poco::DateTimeFormat::ISO8601_FORMAT);
}
