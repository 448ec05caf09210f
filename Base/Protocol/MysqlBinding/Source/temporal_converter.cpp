// Source/temporal_converter.cpp
#include "mysql_binding/temporal_converter.h"

#include <cstdio>   // For snprintf
#include <cstring>  // For std::memset
#include <iomanip>  // For std::setfill, std::setw
#include <sstream>

namespace mysql_binding {

    namespace {
        constexpr int kMaxRecordYear = 9999;

        void appendMicroseconds(std::ostringstream& oss, unsigned long second_part) {
            if (second_part > 0) {
                char micro_buf[7];
                std::snprintf(micro_buf, sizeof(micro_buf), "%06lu", second_part % 1000000UL);
                oss << "." << micro_buf;
            }
        }
    }  // namespace

    MYSQL_TIME toWireTemporal(const std::chrono::system_clock::time_point& time_point, const TemporalCalendar& calendar) {
        using namespace std::chrono;

        MYSQL_TIME mt;
        std::memset(&mt, 0, sizeof(MYSQL_TIME));
        mt.time_type = MYSQL_TIMESTAMP_DATETIME;
        mt.neg = false;

        // floor, not truncation: 1969-12-31T23:59:59.5Z must stay on the 59th second
        const sys_seconds whole_seconds = floor<seconds>(time_point) + calendar.utc_offset;
        const sys_days day_point = floor<days>(whole_seconds);
        const year_month_day ymd{day_point};
        const hh_mm_ss<seconds> time_of_day{whole_seconds - day_point};

        const int year_value = static_cast<int>(ymd.year());
        if (ymd.ok() && year_value >= 0 && year_value <= kMaxRecordYear) {
            mt.year = static_cast<unsigned int>(year_value);
            mt.month = static_cast<unsigned int>(ymd.month());
            mt.day = static_cast<unsigned int>(ymd.day());
        }

        mt.hour = static_cast<unsigned int>(time_of_day.hours().count());
        mt.minute = static_cast<unsigned int>(time_of_day.minutes().count());
        mt.second = static_cast<unsigned int>(time_of_day.seconds().count());
        mt.second_part = 0;

        return mt;
    }

    std::string formatWireTemporal(const MYSQL_TIME& record) {
        std::ostringstream oss;
        oss << std::setfill('0');

        switch (record.time_type) {
            case MYSQL_TIMESTAMP_DATE:
                oss << std::setw(4) << record.year << "-" << std::setw(2) << record.month << "-" << std::setw(2) << record.day;
                break;
            case MYSQL_TIMESTAMP_TIME:
                if (record.neg) oss << "-";
                oss << std::setw(2) << record.hour << ":" << std::setw(2) << record.minute << ":" << std::setw(2) << record.second;
                appendMicroseconds(oss, record.second_part);
                break;
            default:
                oss << std::setw(4) << record.year << "-" << std::setw(2) << record.month << "-" << std::setw(2) << record.day << " " << std::setw(2) << record.hour << ":" << std::setw(2) << record.minute << ":" << std::setw(2) << record.second;
                appendMicroseconds(oss, record.second_part);
                break;
        }
        return oss.str();
    }

}  // namespace mysql_binding
