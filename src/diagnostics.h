#pragma once
#include <cstdarg>
#include <cstdio>
#include <string>
#include <unordered_map>

// Log sink handed to the GPU-facing subsystems.
// Warnings are rate-limited per key so a missing uniform doesn't flood the console every tick.
class Diagnostics {
public:
    explicit Diagnostics(int warningLimit = 10, FILE* out = stderr);

    void info(const char* fmt, ...);
    void error(const char* fmt, ...);

    // Returns false once `key` has been reported warningLimit times.
    bool warnLimited(const std::string& key, const char* fmt, ...);

    int warningCount(const std::string& key) const;
    int totalWarnings() const;
    int errorCount() const { return m_errorCount; }
    const std::string& lastMessage() const { return m_lastMessage; }
    void resetWarnings();

private:
    void write(FILE* stream, const char* level, const char* fmt, va_list args);

    FILE* m_out;
    int m_warningLimit;
    int m_errorCount = 0;
    std::string m_lastMessage;
    std::unordered_map<std::string, int> m_warnings;
};
