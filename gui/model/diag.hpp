// gui/model/diag.hpp: diagnostic sink shared by the loader core
#pragma once

#include <QString>

namespace cfl {

// line: single log line (no trailing \n), user: opaque pointer given to set_log_cb
using log_cb = void (*)(const char* line, void* user);

// Set or clear (pass nullptr) the sink. Without a sink lines go to qDebug().
void set_log_cb(log_cb cb, void* user);

void log_line(const char* line);
void log_line(const QString& line);

// printf-style convenience, truncated to 1 KiB.
void log_fmt(const char* fmt, ...)
#if defined(__GNUC__)
    __attribute__((format(printf, 1, 2)))
#endif
    ;

} // namespace cfl
