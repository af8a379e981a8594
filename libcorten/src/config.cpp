#include <charconv>

#include <corten/config.hpp>
#include <corten/debug.hpp>
#include <frg/array.hpp>
#include <frg/cmdline.hpp>

namespace corten {

namespace {
	frg::expected<Error, size_t> parseCount(const char *option, frg::string_view value,
			size_t fallback) {
		if(!value.size())
			return fallback;

		size_t result = 0;
		auto end = value.data() + value.size();
		auto [ptr, ec] = std::from_chars(value.data(), end, result);
		if(ec != std::errc{} || ptr != end || !result) {
			warningLogger() << "corten: Invalid value '" << value
					<< "' for option " << option << frg::endlog;
			return Error::illegalArgs;
		}
		return result;
	}
} // anonymous namespace

frg::expected<Error, Options> parseOptions(frg::string_view cmdline) {
	Options options;
	frg::string_view framesStr;
	frg::string_view tablesStr;

	frg::array args = {
		frg::option{"corten.frames", frg::as_string_view(framesStr)},
		frg::option{"corten.tables", frg::as_string_view(tablesStr)},
		frg::option{"corten.log-faults", frg::store_true(options.logFaults)},
		frg::option{"corten.log-tables", frg::store_true(options.logTables)},
		frg::option{"corten.log-reclaim", frg::store_true(options.logReclaim)},
	};
	frg::parse_arguments(cmdline, args);

	options.maxFrames = FRG_TRY(parseCount("corten.frames", framesStr, options.maxFrames));
	options.maxTables = FRG_TRY(parseCount("corten.tables", tablesStr, options.maxTables));

	return options;
}

} // namespace corten
