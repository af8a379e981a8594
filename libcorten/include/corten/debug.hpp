#pragma once

#include <stdint.h>

#include <frg/formatting.hpp>
#include <frg/list.hpp>
#include <frg/logging.hpp>
#include <frg/string.hpp>

namespace corten {

// --------------------------------------------------------
// Log infrastructure.
// --------------------------------------------------------

constexpr size_t logLineLength = 256;

// see RFC 5424
enum class Severity : uint8_t {
	emergency,
	alert,
	critical,
	error,
	warning,
	notice,
	info,
	debug,
};

// Receives every log line in addition to stderr.
//
// emit() is called with the global logging lock held, hence calls are serialized.
// Note that the line is _not_ null-terminated and does not end with a newline.
struct LogHandler {
	virtual void emit(Severity severity, frg::string_view line) = 0;

	frg::default_list_hook<LogHandler> hook;

protected:
	~LogHandler() = default;
};

void enableLogHandler(LogHandler *handler);
void disableLogHandler(LogHandler *handler);

// Suppresses the stderr copy of log lines (handlers still see them).
void setStderrLogging(bool enable);

// --------------------------------------------------------
// Loggers.
// --------------------------------------------------------

struct InfoSink {
	constexpr InfoSink() = default;

	void operator() (const char *msg);
};

struct WarningSink {
	constexpr WarningSink() = default;

	void operator() (const char *msg);
};

struct PanicSink {
	constexpr PanicSink() = default;

	void operator() (const char *msg);
	void finalize(bool);
};

extern frg::stack_buffer_logger<InfoSink, logLineLength> infoLogger;
extern frg::stack_buffer_logger<WarningSink, logLineLength> warningLogger;
extern frg::stack_buffer_logger<PanicSink, logLineLength> panicLogger;

} // namespace corten
