#pragma once

namespace mediasync {

// printf-style logging. Info goes to stdout, warnings and errors to stderr.
// The daemon redirects both streams to its log file.
void log_info(const char* fmt, ...) __attribute__((format(printf, 1, 2)));
void log_warn(const char* fmt, ...) __attribute__((format(printf, 1, 2)));
void log_error(const char* fmt, ...) __attribute__((format(printf, 1, 2)));

// Emitted only when verbose logging is enabled.
void log_debug(const char* fmt, ...) __attribute__((format(printf, 1, 2)));

void set_verbose_logging(bool verbose);
bool verbose_logging();

}  // namespace mediasync
