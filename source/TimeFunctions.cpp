#include "TimeFunctions.h"

std::string timeMonthDayTime() {
    time_t rawTime;
    time(&rawTime);
    return timeMonthDayTime(rawTime);
};

std::string timeMonthDayTime(time_t &rawTime) {
    char timeChar[100];
    strftime(timeChar, sizeof(timeChar), "%b %d %H:%M:%S", localtime(&rawTime));
    return std::string(timeChar);
};
