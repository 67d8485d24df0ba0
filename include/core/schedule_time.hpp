#pragma once

#include <cstdint>
#include <string>

class ScheduleTime
{
public:
    /**
     * @brief Parse an ISO 8601 timestamp into unix seconds
     * @param text "2025-03-01T18:30:00+03:00", "...Z", or zone-less "2025-03-01T18:30[:00]"
     * @param default_offset_minutes Offset applied when the text has no zone designator
     * @throws ValidationError when the text is not a valid timestamp
     */
    static int64_t parse(const std::string &text, int default_offset_minutes);

    /**
     * @brief Parse and require a moment strictly after @p now
     * @throws ValidationError when unparsable or not in the future (no clamping)
     */
    static int64_t resolveFuture(const std::string &text, int default_offset_minutes, int64_t now);

    static int64_t now();

    static bool hasZoneDesignator(const std::string &text);

    static std::string formatUtc(int64_t unix_seconds);
};
