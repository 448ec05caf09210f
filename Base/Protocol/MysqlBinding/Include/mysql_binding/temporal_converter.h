// Include/mysql_binding/temporal_converter.h
#pragma once

#include <mysql/mysql.h>

#include <chrono>
#include <string>

namespace mysql_binding {

    // Fixed-offset calendar used to split an instant into wire date/time components.
    // Never consults the process-local time zone, so the same instant always encodes
    // to the same record.
    struct TemporalCalendar {
        std::chrono::seconds utc_offset{0};

        static TemporalCalendar utc() noexcept {
            return TemporalCalendar{};
        }
        static TemporalCalendar fixedOffset(std::chrono::seconds offset) noexcept {
            return TemporalCalendar{offset};
        }

        bool operator==(const TemporalCalendar&) const = default;
    };

    // Splits the instant into year/month/day/hour/minute/second of a DATETIME record.
    // Sub-second precision is dropped; second_part is always 0. A date outside the
    // record's 0000-9999 year range leaves year, month and day at 0.
    MYSQL_TIME toWireTemporal(const std::chrono::system_clock::time_point& time_point, const TemporalCalendar& calendar = TemporalCalendar::utc());

    // "YYYY-MM-DD HH:MM:SS[.ffffff]" for DATETIME records, "YYYY-MM-DD" for DATE and
    // "[-]HH:MM:SS[.ffffff]" for TIME. Used for log output.
    std::string formatWireTemporal(const MYSQL_TIME& record);

}  // namespace mysql_binding
