#ifndef TIME_FUNCTIONS_DEF
#define TIME_FUNCTIONS_DEF

#include <ctime>
#include <string>

std::string timeMonthDayTime();
std::string timeMonthDayTime(time_t &rawTime);

#endif
