// gui/model/diag.cpp
#include "diag.hpp"

#include <QByteArray>
#include <QDebug>

#include <cstdarg>
#include <cstdio>

namespace cfl {

namespace {
    // Single-threaded by construction (the loader lives on the GUI thread).
    log_cb g_log_cb = nullptr;
    void*  g_log_ud = nullptr;
} // namespace

void set_log_cb(log_cb cb, void* user)
{
    g_log_cb = cb;
    g_log_ud = cb ? user : nullptr;
}

void log_line(const char* line)
{
    if (!line || !*line) return;
    if (g_log_cb) {
        g_log_cb(line, g_log_ud);
        return;
    }
    qDebug().noquote() << line;
}

void log_line(const QString& line)
{
    const QByteArray utf8 = line.toUtf8();
    log_line(utf8.constData());
}

void log_fmt(const char* fmt, ...)
{
    if (!fmt) return;
    char buf[1024];
    va_list ap;
    va_start(ap, fmt);
    std::vsnprintf(buf, sizeof(buf), fmt, ap);
    va_end(ap);
    log_line(buf);
}

} // namespace cfl
