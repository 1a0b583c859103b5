#ifndef ENTROPIX_LOG_HPP
#define ENTROPIX_LOG_HPP

namespace entropix {

enum class LogLevel { Error = 0, Warn = 1, Info = 2, Debug = 3 };

// Process-wide threshold. Messages above it are dropped. Default: Info.
void set_log_level(LogLevel level);
LogLevel log_level();

// Unbuffered printf-style log line to stderr: "[entropix] <LEVEL> <msg>\n".
void log_message(LogLevel level, const char* fmt, ...)
#if defined(__GNUC__)
    __attribute__((format(printf, 2, 3)))
#endif
    ;

}  // namespace entropix

#define ENTROPIX_LOG_ERROR(...) ::entropix::log_message(::entropix::LogLevel::Error, __VA_ARGS__)
#define ENTROPIX_LOG_WARN(...) ::entropix::log_message(::entropix::LogLevel::Warn, __VA_ARGS__)
#define ENTROPIX_LOG_INFO(...) ::entropix::log_message(::entropix::LogLevel::Info, __VA_ARGS__)
#define ENTROPIX_LOG_DEBUG(...) ::entropix::log_message(::entropix::LogLevel::Debug, __VA_ARGS__)

#endif  // ENTROPIX_LOG_HPP
