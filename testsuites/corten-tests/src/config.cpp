#include <assert.h>

#include <memory>
#include <string>
#include <vector>

#include <corten/config.hpp>
#include <corten/debug.hpp>
#include <corten/physical.hpp>
#include <corten/syscalls.hpp>

#include "testsuite.hpp"

namespace {
	struct CaptureHandler final : corten::LogHandler {
		CaptureHandler() {
			corten::enableLogHandler(this);
		}

		~CaptureHandler() {
			corten::disableLogHandler(this);
		}

		void emit(corten::Severity severity, frg::string_view line) override {
			if(severity == corten::Severity::warning)
				warnings.emplace_back(line.data(), line.size());
			else if(severity == corten::Severity::info)
				infos.emplace_back(line.data(), line.size());
		}

		std::vector<std::string> warnings;
		std::vector<std::string> infos;
	};
} // anonymous namespace

DEFINE_TEST(options_defaults, ([] {
	auto options = assert_ok(corten::parseOptions("")).value();
	assert(options.maxFrames == 65536);
	assert(options.maxTables == 16384);
	assert(!options.logFaults);
	assert(!options.logTables);
	assert(!options.logReclaim);
}));

DEFINE_TEST(options_parse, ([] {
	auto options = assert_ok(corten::parseOptions(
			"quiet corten.frames=128 corten.tables=64 corten.log-faults corten.log-reclaim"))
			.value();
	assert(options.maxFrames == 128);
	assert(options.maxTables == 64);
	assert(options.logFaults);
	assert(!options.logTables);
	assert(options.logReclaim);
}));

DEFINE_TEST(options_reject_bad_counts, ([] {
	CaptureHandler capture;

	assert_error(corten::parseOptions("corten.frames=abc"), corten::Error::illegalArgs);
	assert_error(corten::parseOptions("corten.tables=0"), corten::Error::illegalArgs);
	assert_error(corten::parseOptions("corten.tables=12k"), corten::Error::illegalArgs);

	assert(capture.warnings.size() == 3);
	assert(capture.warnings[0].find("corten.frames") != std::string::npos);
}));

DEFINE_TEST(options_frame_allocator, ([] {
	auto options = assert_ok(corten::parseOptions("corten.frames=8")).value();
	auto frames = corten::makeFrameAllocator(options);

	std::vector<corten::FrameNumber> allocated;
	while(true) {
		auto frame = frames->allocate();
		if(!frame) {
			assert(frame.error() == corten::Error::noMemory);
			break;
		}
		allocated.push_back(frame.value());
	}
	assert(allocated.size() == 8);

	for(auto frame : allocated)
		frames->release(frame);
	assert(!frames->numUsedFrames());
}));

DEFINE_TEST(options_enable_fault_logging, ([] {
	auto frames = std::make_shared<corten::MonotonicFrameAllocator>(4);
	auto quiet = assert_ok(corten::AddressSpace::create(frames)).value();
	auto options = assert_ok(corten::parseOptions("corten.log-faults corten.log-tables")).value();
	auto verbose = assert_ok(corten::AddressSpace::create(frames, options)).value();

	CaptureHandler capture;
	assert_error(corten::pageFault(quiet.get(), 0x5000, false), corten::Error::fault);
	assert(capture.infos.empty());

	assert_ok(corten::mmap(verbose.get(), 0x5000, 0x1000, corten::page_access::read));
	assert(capture.infos.size() == 3);
	assert(capture.infos[0].find("corten: Created level 2 table") == 0);
	assert(capture.infos[2].find("corten: Created level 0 table") == 0);

	assert_error(corten::pageFault(verbose.get(), 0x6000, true), corten::Error::fault);
	assert(capture.infos.size() == 4);
	assert(capture.infos[3].find("corten: Fatal write fault") == 0);
}));
