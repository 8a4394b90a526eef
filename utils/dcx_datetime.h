#ifndef dcx_DATETIME_H
#define dcx_DATETIME_H

#include "dcx_string.h"
#include <chrono>

// Local time as "YYYY-MM-DDTHH:MM:SS"
dcx_string dcx_iso_timestamp(const std::chrono::system_clock::time_point& tp);
dcx_string dcx_iso_now();

// True for strings shaped like dcx_iso_timestamp() output, optional fraction allowed
bool dcx_is_iso_timestamp(const dcx_string& text);

#endif // dcx_DATETIME_H
