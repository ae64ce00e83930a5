#define BOOST_TEST_MODULE cancellation_token
#include "uploader/detail/cancellation_token.hpp"

#include <boost/test/unit_test.hpp>

#include <atomic>
#include <thread>
#include <vector>

using s3drop::uploader::detail::cancellation_token;

BOOST_AUTO_TEST_CASE(cancel_is_one_way_until_reset) {
	auto token = cancellation_token{};
	BOOST_REQUIRE(not token.is_cancelled());
	BOOST_REQUIRE(token.cancel());
	BOOST_REQUIRE(token.is_cancelled());
	BOOST_REQUIRE(not token.cancel());
	BOOST_REQUIRE(token.is_cancelled());
	token.reset();
	BOOST_REQUIRE(not token.is_cancelled());
}

BOOST_AUTO_TEST_CASE(exactly_one_canceller_wins) {
	auto token = std::make_shared<cancellation_token>();
	auto winners = std::atomic<int>{0};
	auto threads = std::vector<std::thread>{};
	for (auto i = 0; i < 8; ++i){
		threads.emplace_back([token, &winners](){
			if (token->cancel())
				winners++;
		});
	}
	for (auto& t : threads)
		t.join();
	BOOST_REQUIRE_EQUAL(winners.load(), 1);
	BOOST_REQUIRE(token->is_cancelled());
}
