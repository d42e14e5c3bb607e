#include "diagnostics.h"

Diagnostics::Diagnostics(int warningLimit, FILE* out)
    : m_out(out ? out : stderr), m_warningLimit(warningLimit) {}

void Diagnostics::write(FILE* stream, const char* level, const char* fmt, va_list args) {
    char buf[1024];
    vsnprintf(buf, sizeof(buf), fmt, args);
    m_lastMessage = buf;
    fprintf(stream, "[%s] %s\n", level, buf);
}

void Diagnostics::info(const char* fmt, ...) {
    va_list args;
    va_start(args, fmt);
    write(m_out == stderr ? stdout : m_out, "info", fmt, args);
    va_end(args);
}

void Diagnostics::error(const char* fmt, ...) {
    m_errorCount++;
    va_list args;
    va_start(args, fmt);
    write(m_out, "error", fmt, args);
    va_end(args);
}

bool Diagnostics::warnLimited(const std::string& key, const char* fmt, ...) {
    int& count = m_warnings[key];
    count++;
    if (count > m_warningLimit) return false;

    va_list args;
    va_start(args, fmt);
    write(m_out, "warn", fmt, args);
    va_end(args);
    if (count == m_warningLimit)
        fprintf(m_out, "[warn] further '%s' warnings muted\n", key.c_str());
    return true;
}

int Diagnostics::warningCount(const std::string& key) const {
    auto it = m_warnings.find(key);
    return it == m_warnings.end() ? 0 : it->second;
}

int Diagnostics::totalWarnings() const {
    int total = 0;
    for (const auto& w : m_warnings) total += w.second;
    return total;
}

void Diagnostics::resetWarnings() {
    m_warnings.clear();
}
