#pragma once

#include <gtest/gtest.h>

#include <chrono>
#include <system_error>
#include <tuple>
#include <utility>

#define GTEST_TEST_ERROR_CODE(expression, text, actual, expected, fail)                       \
	GTEST_AMBIGUOUS_ELSE_BLOCKER_                                                             \
	if (const ::testing::AssertionResult gtest_ar_ = ::testing::AssertionResult (expression)) \
		;                                                                                     \
	else                                                                                      \
		fail (::testing::internal::GetBoolAssertionFailureMessage (                           \
		gtest_ar_, text, actual, expected)                                                    \
			  .c_str ())

/** Fails with the error code message when the code is set */
#define ASSERT_NO_ERROR(condition)                                                      \
	GTEST_TEST_ERROR_CODE (!(condition), #condition, condition.message ().c_str (), "", \
	GTEST_FATAL_FAILURE_)

/** Polls the system until the condition holds or the deadline passes */
#define ASSERT_TIMELY(time, condition)    \
	system.deadline_set (time);           \
	while (!(condition))                  \
	{                                     \
		ASSERT_NO_ERROR (system.poll ()); \
	}

/** Polls the system until both values compare equal, then asserts on them */
#define ASSERT_TIMELY_EQ(time, val1, val2)         \
	system.deadline_set (time);                    \
	while (!((val1) == (val2)) && !system.poll ()) \
	{                                              \
	}                                              \
	ASSERT_EQ (val1, val2);

/** Keeps polling for the whole duration, failing if the condition ever holds */
#define ASSERT_NEVER(time, condition) \
	system.deadline_set (time);       \
	while (!system.poll ())           \
	{                                 \
		ASSERT_FALSE (condition);     \
	}

namespace ballot::test
{
template <class... Ts>
class start_stop_guard
{
public:
	explicit start_stop_guard (Ts &... refs_a) :
		refs{ std::forward<Ts &> (refs_a)... }
	{
		std::apply ([] (Ts &... refs) { (refs.start (), ...); }, refs);
	}

	~start_stop_guard ()
	{
		std::apply ([] (Ts &... refs) { (refs.stop (), ...); }, refs);
	}

private:
	std::tuple<Ts &...> refs;
};
}
