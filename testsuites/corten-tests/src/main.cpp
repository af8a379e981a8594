#include <fnmatch.h>
#include <iostream>
#include <string>
#include <vector>

#include <CLI/CLI.hpp>
#include <corten/debug.hpp>

#include "testsuite.hpp"

std::vector<abstract_test_case *> &test_case_ptrs() {
	static std::vector<abstract_test_case *> singleton;
	return singleton;
}

void abstract_test_case::register_case(abstract_test_case *tcp) {
	test_case_ptrs().push_back(tcp);
}

int main(int argc, char **argv) {
	CLI::App app{"Testsuite for the corten address space manager"};

	std::vector<std::string> globs;
	app.add_option("globs", globs, "tests to run");

	bool verbose = false;
	app.add_flag("-v,--verbose", verbose, "print log output of the library");

	CLI11_PARSE(app, argc, argv);

	corten::setStderrLogging(verbose);

	if (globs.empty()) {
		for(abstract_test_case *tcp : test_case_ptrs()) {
			std::cout << "corten-tests: Running " << tcp->name() << std::endl;
			tcp->run();
		}
	} else {
		for(abstract_test_case *tcp : test_case_ptrs()) {
			for (const auto &glob : globs) {
				if (fnmatch(glob.c_str(), tcp->name(), 0) == 0) {
					std::cout << "corten-tests: Running " << tcp->name() << std::endl;
					tcp->run();
				}
			}
		}
	}

	return EXIT_SUCCESS;
}
