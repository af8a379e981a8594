#include <stdio.h>
#include <stdlib.h>
#include <string.h>

#include <atomic>

#include <corten/debug.hpp>
#include <frg/eternal.hpp>
#include <frg/mutex.hpp>
#include <frg/spinlock.hpp>

namespace corten {

namespace {
	using HandlerList = frg::intrusive_list<
		LogHandler,
		frg::locate_member<
			LogHandler,
			frg::default_list_hook<LogHandler>,
			&LogHandler::hook
		>
	>;

	// Protects the handler list and serializes emission.
	constinit frg::ticket_spinlock logMutex;

	std::atomic<bool> logToStderr{true};

	HandlerList &accessHandlerList() {
		static frg::eternal<HandlerList> singleton;
		return *singleton;
	}

	const char *severityTag(Severity severity) {
		switch(severity) {
		case Severity::emergency: return "emergency";
		case Severity::alert: return "alert";
		case Severity::critical: return "critical";
		case Severity::error: return "error";
		case Severity::warning: return "warning";
		case Severity::notice: return "notice";
		case Severity::info: return "info";
		case Severity::debug: return "debug";
		}
		return "?";
	}

	void emitLine(Severity severity, const char *msg) {
		auto lock = frg::guard(&logMutex);

		frg::string_view line{msg, strlen(msg)};
		for(auto handler : accessHandlerList())
			handler->emit(severity, line);

		if(logToStderr.load(std::memory_order_relaxed) || severity == Severity::emergency)
			fprintf(stderr, "[%s] %s\n", severityTag(severity), msg);
	}
} // anonymous namespace

void enableLogHandler(LogHandler *handler) {
	auto lock = frg::guard(&logMutex);
	accessHandlerList().push_back(handler);
}

void disableLogHandler(LogHandler *handler) {
	auto lock = frg::guard(&logMutex);
	auto &list = accessHandlerList();
	list.erase(list.iterator_to(handler));
}

void setStderrLogging(bool enable) {
	logToStderr.store(enable, std::memory_order_relaxed);
}

constinit frg::stack_buffer_logger<InfoSink, logLineLength> infoLogger;
constinit frg::stack_buffer_logger<WarningSink, logLineLength> warningLogger;
constinit frg::stack_buffer_logger<PanicSink, logLineLength> panicLogger;

extern "C" void frg_panic(const char *cstring) {
	panicLogger() << "frg: Panic! " << cstring << frg::endlog;
	__builtin_unreachable();
}

void InfoSink::operator() (const char *msg) {
	emitLine(Severity::info, msg);
}

void WarningSink::operator() (const char *msg) {
	emitLine(Severity::warning, msg);
}

void PanicSink::operator() (const char *msg) {
	emitLine(Severity::emergency, msg);
}

void PanicSink::finalize(bool) {
	fflush(stderr);
	abort();
}

} // namespace corten
