#pragma once

#include <cstdio>
#include <cstdlib>
#include <utility>

#include <corten/error.hpp>

#define DEFINE_TEST(s, f) \
	static test_case test_ ## s{#s, f};

struct abstract_test_case {
private:
	static void register_case(abstract_test_case *tcp);

public:
	abstract_test_case(const char *name)
	: name_{name} {
		register_case(this);
	}

	abstract_test_case(const abstract_test_case &) = delete;

	virtual ~abstract_test_case() = default;

	abstract_test_case &operator= (const abstract_test_case &) = delete;

	const char *name() {
		return name_;
	}

	virtual void run() = 0;

private:
	const char *name_;
};

template<typename F>
struct test_case : abstract_test_case {
	test_case(const char *name, F functor)
	: abstract_test_case{name}, functor_{std::move(functor)} { }

	void run() override {
		functor_();
	}

private:
	F functor_;
};

// Checks that an frg::expected holds a value; prints the error otherwise.
#define assert_ok(expr) ([&] { \
		auto outcome_ = (expr); \
		if(!outcome_) \
			assert_ok_fail(#expr, outcome_.error(), __FILE__, __PRETTY_FUNCTION__, __LINE__); \
		return outcome_; \
	}())

// Checks that an frg::expected holds the given error.
#define assert_error(expr, err) ([&] { \
		auto outcome_ = (expr); \
		if(outcome_ || outcome_.error() != (err)) \
			assert_error_fail(#expr, (err), __FILE__, __PRETTY_FUNCTION__, __LINE__); \
	}())

[[noreturn]] inline void assert_ok_fail(const char *expr, corten::Error error,
		const char *file, const char *func, int line) {
	fprintf(stderr, "In function %s, file %s:%d: '%s' failed with error '%s'\n",
			func, file, line, expr, corten::errorName(error));
	abort();
}

[[noreturn]] inline void assert_error_fail(const char *expr, corten::Error expected,
		const char *file, const char *func, int line) {
	fprintf(stderr, "In function %s, file %s:%d: '%s' did not fail with error '%s'\n",
			func, file, line, expr, corten::errorName(expected));
	abort();
}
