#define BOOST_TEST_MODULE retry_policy
#include "uploader/detail/retry_policy.hpp"

#include <boost/test/unit_test.hpp>

using namespace s3drop;
using namespace std::chrono_literals;
using uploader::detail::give_up;
using uploader::detail::retry_after;
using uploader::detail::retry_policy;
using uploader::detail::retry_state;

namespace {
	storage::error transient_error(){
		return storage::make_http_error(503u, "SlowDown", "reduce your request rate");
	}

	retry_state after_attempts(const retry_policy& policy, std::uint32_t attempts){
		auto state = policy.initial_state();
		state.attempt_count = attempts;
		return state;
	}
}

BOOST_AUTO_TEST_CASE(transient_error_is_retried_while_budget_lasts) {
	auto policy = retry_policy(3u, 200ms, 5s);
	for (auto attempts = 1u; attempts < 3u; ++attempts){
		auto decision = policy.decide(after_attempts(policy, attempts), transient_error(), 0.5);
		BOOST_REQUIRE(api::holds_alternative<retry_after>(decision));
	}
	auto exhausted = policy.decide(after_attempts(policy, 3u), transient_error(), 0.5);
	BOOST_REQUIRE(api::holds_alternative<give_up>(exhausted));
	BOOST_REQUIRE_EQUAL(api::get<give_up>(exhausted).reason.http_status, 503u);
}

BOOST_AUTO_TEST_CASE(permanent_error_gives_up_at_once) {
	auto policy = retry_policy(5u, 200ms, 5s);
	auto denied = storage::make_http_error(403u, "SignatureDoesNotMatch", "bad signature");
	auto decision = policy.decide(after_attempts(policy, 1u), denied, 0.0);
	BOOST_REQUIRE(api::holds_alternative<give_up>(decision));
	BOOST_REQUIRE(api::get<give_up>(decision).reason.code == storage::errc::access_denied);
}

BOOST_AUTO_TEST_CASE(cancellation_is_never_retried) {
	auto policy = retry_policy(5u, 200ms, 5s);
	auto decision = policy.decide(after_attempts(policy, 1u), storage::make_cancelled_error(), 0.0);
	BOOST_REQUIRE(api::holds_alternative<give_up>(decision));
	BOOST_REQUIRE(api::get<give_up>(decision).reason.cancelled());
}

BOOST_AUTO_TEST_CASE(backoff_doubles_and_is_capped) {
	auto policy = retry_policy(10u, 200ms, 1s);
	// jitter 1.0 is the upper edge of [d/2, d]
	BOOST_REQUIRE_EQUAL(policy.backoff(1u, 1.0).count(), 200);
	BOOST_REQUIRE_EQUAL(policy.backoff(2u, 1.0).count(), 400);
	BOOST_REQUIRE_EQUAL(policy.backoff(3u, 1.0).count(), 800);
	BOOST_REQUIRE_EQUAL(policy.backoff(4u, 1.0).count(), 1000);
	BOOST_REQUIRE_EQUAL(policy.backoff(60u, 1.0).count(), 1000);
}

BOOST_AUTO_TEST_CASE(jitter_stays_within_half_to_full_delay) {
	auto policy = retry_policy(10u, 200ms, 5s);
	BOOST_REQUIRE_EQUAL(policy.backoff(2u, 0.0).count(), 200);
	for (auto jitter : {0.1, 0.25, 0.5, 0.75, 0.99}){
		auto delay = policy.backoff(2u, jitter);
		BOOST_REQUIRE_GE(delay.count(), 200);
		BOOST_REQUIRE_LE(delay.count(), 400);
	}
	for (auto i = 0; i < 100; ++i){
		auto decision = policy.decide(after_attempts(policy, 1u), transient_error());
		BOOST_REQUIRE(api::holds_alternative<retry_after>(decision));
		auto delay = api::get<retry_after>(decision).delay;
		BOOST_REQUIRE_GE(delay.count(), 100);
		BOOST_REQUIRE_LE(delay.count(), 200);
	}
}

BOOST_AUTO_TEST_CASE(single_attempt_budget_never_retries) {
	auto policy = retry_policy(1u, 200ms, 5s);
	auto decision = policy.decide(after_attempts(policy, 1u), transient_error(), 0.5);
	BOOST_REQUIRE(api::holds_alternative<give_up>(decision));
}
