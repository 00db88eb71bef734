#pragma once
#include <ctime>
#include <string>

// A study day runs from rollover_hour (local time) to rollover_hour the
// next calendar day, so a 2 AM session still belongs to "yesterday".
class StudyDay {
public:
    explicit StudyDay(int rolloverHour = 4);

    // "YYYY-MM-DD" of the study day containing `ts`.
    std::string dateFor(std::time_t ts) const;
    std::time_t nextRollover(std::time_t ts) const;
    bool sameDay(std::time_t a, std::time_t b) const { return dateFor(a) == dateFor(b); }

private:
    int rollover_hour;
};
