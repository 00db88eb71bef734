#include "StudyDay.hpp"
#include "Errors.hpp"
#include <cstdio>

StudyDay::StudyDay(int rolloverHour)
    : rollover_hour(rolloverHour)
{
    if (rollover_hour < 0 || rollover_hour > 23) {
        throw ValidationError(ErrorKind::InvalidArgument, "rollover_hour must be within 0..23");
    }
}

std::string StudyDay::dateFor(std::time_t ts) const {
    std::time_t shifted = ts - static_cast<std::time_t>(rollover_hour) * 3600;
    std::tm local{};
    localtime_r(&shifted, &local);

    char buf[16];
    std::snprintf(buf, sizeof(buf), "%04d-%02d-%02d", local.tm_year + 1900, local.tm_mon + 1, local.tm_mday);
    return std::string(buf);
}

std::time_t StudyDay::nextRollover(std::time_t ts) const {
    std::tm local{};
    localtime_r(&ts, &local);

    std::tm rollover = local;
    rollover.tm_hour = rollover_hour;
    rollover.tm_min = 0;
    rollover.tm_sec = 0;
    rollover.tm_isdst = -1;
    std::time_t candidate = std::mktime(&rollover);

    if (candidate <= ts) {
        rollover.tm_mday += 1;
        rollover.tm_isdst = -1;
        candidate = std::mktime(&rollover);
    }
    return candidate;
}
