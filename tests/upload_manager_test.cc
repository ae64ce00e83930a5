#define BOOST_TEST_MODULE upload_manager
#include "uploader/manager.hpp"
#include "uploader/settings.hpp"
#include "mock_storage_client.hpp"
#include "temp_files.hpp"

#include <boost/test/unit_test.hpp>

#include <future>
#include <map>
#include <set>

using namespace s3drop;
using namespace s3drop::uploader;
using namespace std::chrono_literals;
using s3drop::testing::mock_storage_client;
using s3drop::testing::temp_dir;

namespace {
	constexpr auto threshold = 64u * Kilo;
	constexpr auto chunk = 16u * Kilo;

	settings test_settings(std::size_t parallel = 3u){
		auto cfg = settings{};
		cfg.endpoint = "http://mock.local";
		cfg.bucket = "bucket";
		cfg.region = "us-east-1";
		cfg.parallel_uploads = parallel;
		cfg.multipart_threshold = threshold;
		cfg.multipart_chunk_size = chunk;
		cfg.parts_in_flight = 2u;
		cfg.max_attempts = 3u;
		cfg.base_delay = 1ms;
		cfg.max_delay = 10ms;
		return cfg;
	}

	task::request request_for(const temp_dir& dir, const std::string& name, std::uint64_t size){
		auto file = dir.make_file(name, size);
		return task::request{file, name, size};
	}

	batch::report must_finish(api::variant<batch::report, std::error_condition> result){
		BOOST_REQUIRE(api::holds_alternative<batch::report>(result));
		return api::get<batch::report>(result);
	}

	const task::progress& outcome_of(const batch::report& rep, task::id id){
		for (auto& pg : rep.outcomes){
			if (pg.task_id == id)
				return pg;
		}
		BOOST_FAIL("no outcome for the task");
		return rep.outcomes.front();
	}

	std::map<task::id, std::vector<task::progress>> by_task(std::vector<task::progress> events){
		auto grouped = std::map<task::id, std::vector<task::progress>>{};
		for (auto& pg : events)
			grouped[pg.task_id].push_back(pg);
		return grouped;
	}

	std::uint64_t ceil_div(std::uint64_t a, std::uint64_t b){
		return a / b + (a % b ? 1 : 0);
	}
}

BOOST_AUTO_TEST_CASE(mixed_batch_completes) {
	auto dir = temp_dir{};
	auto client = mock_storage_client::create();
	auto mgr = manager(test_settings(3u), client);
	mgr.run();

	auto big_size = std::uint64_t{100u * Kilo + 5u};
	auto rep = must_finish(mgr.upload({
		request_for(dir, "small.txt", 1024u),
		request_for(dir, "medium.png", 10u * Kilo),
		request_for(dir, "big.bin", big_size)}));

	BOOST_REQUIRE_EQUAL(rep.completed, 3u);
	BOOST_REQUIRE_EQUAL(rep.failed, 0u);
	BOOST_REQUIRE_EQUAL(rep.cancelled, 0u);
	BOOST_REQUIRE_EQUAL(rep.outcomes.size(), 3u);

	BOOST_REQUIRE_EQUAL(client->count("put_object"), 2u);
	BOOST_REQUIRE_EQUAL(client->count("create_multipart"), 1u);
	BOOST_REQUIRE_EQUAL(client->count("upload_part"), ceil_div(big_size, chunk));
	auto completes = client->calls("complete_multipart");
	BOOST_REQUIRE_EQUAL(completes.size(), 1u);
	BOOST_REQUIRE_EQUAL(completes[0].parts.size(), ceil_div(big_size, chunk));
	for (auto i = 0u; i < completes[0].parts.size(); ++i)
		BOOST_REQUIRE_EQUAL(completes[0].parts[i].part_number, i + 1u);

	auto part_bytes = std::uint64_t{0};
	for (auto& c : client->calls("upload_part"))
		part_bytes += c.body_size;
	BOOST_REQUIRE_EQUAL(part_bytes, big_size);

	for (auto& put : client->calls("put_object")){
		if (put.key == "medium.png")
			BOOST_REQUIRE_EQUAL(put.content_type, "image/png");
		else
			BOOST_REQUIRE_EQUAL(put.content_type, "text/plain");
	}
	std::this_thread::sleep_for(50ms);
	BOOST_REQUIRE_EQUAL(client->count("abort_multipart"), 0u);
}

BOOST_AUTO_TEST_CASE(threshold_boundary_selects_multipart) {
	auto dir = temp_dir{};
	auto client = mock_storage_client::create();
	auto mgr = manager(test_settings(), client);
	mgr.run();

	auto rep = must_finish(mgr.upload({
		request_for(dir, "below.bin", threshold - 1u),
		request_for(dir, "at.bin", threshold)}));
	BOOST_REQUIRE_EQUAL(rep.completed, 2u);
	auto puts = client->calls("put_object");
	BOOST_REQUIRE_EQUAL(puts.size(), 1u);
	BOOST_REQUIRE_EQUAL(puts[0].key, "below.bin");
	BOOST_REQUIRE_EQUAL(puts[0].body_size, threshold - 1u);
	BOOST_REQUIRE_EQUAL(client->count("upload_part"), threshold / chunk);
}

BOOST_AUTO_TEST_CASE(forbidden_part_fails_only_its_task) {
	auto dir = temp_dir{};
	auto client = mock_storage_client::create();
	client->fail_part_always(2u, storage::make_http_error(403u, "AccessDenied", "no writes here"));
	auto mgr = manager(test_settings(3u), client);
	mgr.run();

	auto rep = must_finish(mgr.upload({
		request_for(dir, "doomed.bin", 5u * chunk),
		request_for(dir, "a.txt", 100u),
		request_for(dir, "b.txt", 200u)}));

	BOOST_REQUIRE_EQUAL(rep.completed, 2u);
	BOOST_REQUIRE_EQUAL(rep.failed, 1u);
	auto& failed = outcome_of(rep, 1u);
	BOOST_REQUIRE(failed.current_status == task::status::failed);
	BOOST_REQUIRE(not failed.reason.empty());

	BOOST_REQUIRE_EQUAL(client->count("complete_multipart"), 0u);
	BOOST_REQUIRE(client->wait_for_count("abort_multipart", 1u));
	std::this_thread::sleep_for(50ms);
	BOOST_REQUIRE_EQUAL(client->count("abort_multipart"), 1u);

	// permanent errors are not retried
	auto part_two_attempts = 0u;
	for (auto& c : client->calls("upload_part"))
		part_two_attempts += c.part_number == 2u ? 1u : 0u;
	BOOST_REQUIRE_EQUAL(part_two_attempts, 1u);
}

BOOST_AUTO_TEST_CASE(part_exhausting_retries_aborts_the_upload) {
	auto dir = temp_dir{};
	auto client = mock_storage_client::create();
	client->fail_part_always(3u, storage::make_http_error(503u, "SlowDown", "slow down"));
	auto mgr = manager(test_settings(), client);
	mgr.run();

	auto rep = must_finish(mgr.upload({request_for(dir, "flaky.bin", 4u * chunk)}));
	BOOST_REQUIRE_EQUAL(rep.failed, 1u);

	auto part_three_attempts = 0u;
	for (auto& c : client->calls("upload_part"))
		part_three_attempts += c.part_number == 3u ? 1u : 0u;
	BOOST_REQUIRE_EQUAL(part_three_attempts, 3u);
	BOOST_REQUIRE_EQUAL(client->count("complete_multipart"), 0u);
	BOOST_REQUIRE(client->wait_for_count("abort_multipart", 1u));
	std::this_thread::sleep_for(50ms);
	BOOST_REQUIRE_EQUAL(client->count("abort_multipart"), 1u);
}

BOOST_AUTO_TEST_CASE(transient_put_is_retried) {
	auto dir = temp_dir{};
	auto client = mock_storage_client::create();
	client->fail_next("put_object", storage::make_http_error(503u, "", "unavailable"));
	auto mgr = manager(test_settings(), client);
	mgr.run();

	auto rep = must_finish(mgr.upload({request_for(dir, "retry.txt", 512u)}));
	BOOST_REQUIRE_EQUAL(rep.completed, 1u);
	BOOST_REQUIRE_EQUAL(client->count("put_object"), 2u);
}

BOOST_AUTO_TEST_CASE(cancel_mid_batch_terminates_every_task) {
	auto dir = temp_dir{};
	auto client = mock_storage_client::create();
	client->set_delay(30ms);
	auto mgr = manager(test_settings(2u), client);
	mgr.run();

	auto cancelled_once = std::make_shared<std::once_flag>();
	client->on_call([&mgr, cancelled_once](const mock_storage_client::call& c){
		if (c.verb == "upload_part")
			std::call_once(*cancelled_once, [&mgr](){ mgr.cancel_all(); });
	});

	auto rep = must_finish(mgr.upload({
		request_for(dir, "one.bin", 8u * chunk),
		request_for(dir, "two.bin", 8u * chunk),
		request_for(dir, "three.bin", 8u * chunk)}));

	BOOST_REQUIRE_EQUAL(rep.outcomes.size(), 3u);
	BOOST_REQUIRE_EQUAL(rep.completed + rep.failed + rep.cancelled, 3u);
	BOOST_REQUIRE_GE(rep.cancelled, 2u);
	BOOST_REQUIRE_EQUAL(rep.failed, 0u);
	for (auto& pg : rep.outcomes)
		BOOST_REQUIRE(pg.is_terminal());

	// every session that was opened and not completed gets aborted
	auto opened = client->count("create_multipart");
	auto completed = client->count("complete_multipart");
	BOOST_REQUIRE(client->wait_for_count("abort_multipart", opened - completed));
	std::this_thread::sleep_for(100ms);
	BOOST_REQUIRE_EQUAL(client->count("abort_multipart"), opened - completed);
	BOOST_REQUIRE_LT(client->count("upload_part"), 3u * 8u);
}

BOOST_AUTO_TEST_CASE(progress_is_ordered_and_monotonic) {
	auto dir = temp_dir{};
	auto client = mock_storage_client::create();
	auto mgr = manager(test_settings(), client);
	mgr.run();

	auto rep = must_finish(mgr.upload({
		request_for(dir, "p1.bin", 7u * chunk + 3u),
		request_for(dir, "p2.bin", 100u)}));
	BOOST_REQUIRE_EQUAL(rep.completed, 2u);

	auto grouped = by_task(mgr.progress().drain());
	BOOST_REQUIRE_EQUAL(grouped.size(), 2u);
	for (auto& [id, events] : grouped){
		BOOST_REQUIRE_GE(events.size(), 2u);
		BOOST_REQUIRE(events.front().current_status == task::status::started);
		BOOST_REQUIRE(events.back().current_status == task::status::completed);
		BOOST_REQUIRE_EQUAL(events.back().bytes_transferred, events.back().total_bytes);
		for (auto i = std::size_t{1}; i < events.size(); ++i){
			BOOST_REQUIRE_GE(events[i].bytes_transferred, events[i - 1u].bytes_transferred);
			if (i + 1u < events.size())
				BOOST_REQUIRE(not events[i].is_terminal());
		}
	}
	// one in-progress event per part of the multipart task
	BOOST_REQUIRE_EQUAL(grouped[1u].size(), 1u + 8u + 1u);
	// single PUT goes straight from started to completed
	BOOST_REQUIRE_EQUAL(grouped[2u].size(), 2u);
}

BOOST_AUTO_TEST_CASE(listeners_see_events_and_history) {
	auto dir = temp_dir{};
	auto client = mock_storage_client::create();
	auto mgr = manager(test_settings(), client);
	mgr.run();

	auto listener_mutex = std::mutex{};
	auto history = std::vector<history::record>{};
	auto terminal_events = 0u;
	auto history_key = mgr.install_history_listener([&](const history::record& rec){
		std::lock_guard lock(listener_mutex);
		history.push_back(rec);
	});
	BOOST_REQUIRE(history_key);
	auto progress_key = mgr.install_progress_monitor([&](const task::progress& pg){
		std::lock_guard lock(listener_mutex);
		if (pg.is_terminal())
			terminal_events++;
	});
	BOOST_REQUIRE(progress_key);
	BOOST_REQUIRE(*progress_key != *history_key);
	BOOST_REQUIRE(not mgr.install_progress_monitor(task::progress::listener{}));

	auto rep = must_finish(mgr.upload({
		request_for(dir, "h1.txt", 10u),
		request_for(dir, "h2.bin", 2u * threshold)}));
	BOOST_REQUIRE_EQUAL(rep.completed, 2u);

	{
		std::lock_guard lock(listener_mutex);
		BOOST_REQUIRE_EQUAL(terminal_events, 2u);
		BOOST_REQUIRE_EQUAL(history.size(), 2u);
		auto keys = std::set<std::string>{};
		for (auto& rec : history){
			keys.insert(rec.object_key);
			BOOST_REQUIRE_EQUAL(rec.url, "http://mock.local/bucket/" + rec.object_key);
		}
		BOOST_REQUIRE(keys == (std::set<std::string>{"h1.txt", "h2.bin"}));
	}

	// removed listeners hear nothing of the next batch
	BOOST_REQUIRE(mgr.remove_listener(*history_key));
	BOOST_REQUIRE(mgr.remove_listener(*progress_key));
	BOOST_REQUIRE(not mgr.remove_listener(*progress_key));
	rep = must_finish(mgr.upload({request_for(dir, "h3.txt", 10u)}));
	BOOST_REQUIRE_EQUAL(rep.completed, 1u);
	std::lock_guard lock(listener_mutex);
	BOOST_REQUIRE_EQUAL(terminal_events, 2u);
	BOOST_REQUIRE_EQUAL(history.size(), 2u);
}

BOOST_AUTO_TEST_CASE(invalid_paths_fail_individually) {
	auto dir = temp_dir{};
	auto client = mock_storage_client::create();
	auto mgr = manager(test_settings(), client);
	mgr.run();

	auto good = dir.make_file(u8"Фото отпуска.JPG", 300u);
	auto rep = must_finish(mgr.upload_files({good, dir.path() / "missing.txt", dir.path()}));
	BOOST_REQUIRE_EQUAL(rep.completed, 1u);
	BOOST_REQUIRE_EQUAL(rep.failed, 2u);
	BOOST_REQUIRE_EQUAL(client->count("put_object"), 1u);
	auto key = client->calls("put_object")[0].key;
	BOOST_REQUIRE_EQUAL(key.substr(11u, 12u), "Foto_otpuska");
	BOOST_REQUIRE_EQUAL(key.substr(key.size() - 4u), ".jpg");
	for (auto& pg : rep.outcomes){
		if (pg.current_status == task::status::failed)
			BOOST_REQUIRE(not pg.reason.empty());
	}

	// rejected paths still open their stream with started, then fail
	auto streams = std::map<task::id, std::vector<task::status>>{};
	for (auto& pg : mgr.progress().drain())
		streams[pg.task_id].push_back(pg.current_status);
	BOOST_REQUIRE_EQUAL(streams.size(), 3u);
	auto rejected = 0u;
	for (auto& [id, statuses] : streams){
		BOOST_REQUIRE(not statuses.empty());
		BOOST_REQUIRE(statuses.front() == task::status::started);
		if (statuses.back() == task::status::failed){
			BOOST_REQUIRE_EQUAL(statuses.size(), 2u);
			++rejected;
		}
	}
	BOOST_REQUIRE_EQUAL(rejected, 2u);
}

BOOST_AUTO_TEST_CASE(make_request_checks_the_path) {
	auto dir = temp_dir{};
	auto file = dir.make_file("data.csv", 42u);
	auto req = manager::make_request(file);
	BOOST_REQUIRE(api::holds_alternative<task::request>(req));
	BOOST_REQUIRE_EQUAL(api::get<task::request>(req).size, 42u);
	BOOST_REQUIRE(api::get<task::request>(req).destination_key.find("/data_") != std::string::npos);

	auto missing = manager::make_request(dir.path() / "nope");
	BOOST_REQUIRE(api::holds_alternative<std::error_condition>(missing));
	BOOST_REQUIRE(api::get<std::error_condition>(missing) == std::errc::no_such_file_or_directory);
	BOOST_REQUIRE(api::holds_alternative<std::error_condition>(manager::make_request(dir.path())));
}

BOOST_AUTO_TEST_CASE(second_batch_is_refused_while_one_runs) {
	auto dir = temp_dir{};
	auto client = mock_storage_client::create();
	client->set_delay(100ms);
	auto mgr = manager(test_settings(), client);
	mgr.run();

	auto finished = std::promise<batch::report>{};
	auto first = mgr.start_batch({request_for(dir, "slow.txt", 10u)},
		[&finished](const batch::report& rep){ finished.set_value(rep); });
	BOOST_REQUIRE(api::holds_alternative<std::size_t>(first));
	BOOST_REQUIRE_EQUAL(api::get<std::size_t>(first), 1u);

	auto second = mgr.start_batch({request_for(dir, "other.txt", 10u)}, {});
	BOOST_REQUIRE(api::holds_alternative<std::error_condition>(second));
	BOOST_REQUIRE(api::get<std::error_condition>(second) == std::errc::device_or_resource_busy);

	BOOST_REQUIRE_EQUAL(finished.get_future().get().completed, 1u);

	// the token is fresh again for the next batch
	mgr.cancel_all();
	auto rep = must_finish(mgr.upload({request_for(dir, "after.txt", 10u)}));
	BOOST_REQUIRE_EQUAL(rep.completed, 1u);
}

BOOST_AUTO_TEST_CASE(empty_batch_finishes_at_once) {
	auto client = mock_storage_client::create();
	auto mgr = manager(test_settings(), client);
	auto rep = must_finish(mgr.upload({}));
	BOOST_REQUIRE(rep.outcomes.empty());
}

BOOST_AUTO_TEST_CASE(destruction_drains_the_batch) {
	auto dir = temp_dir{};
	auto client = mock_storage_client::create();
	client->set_delay(20ms);
	auto reported = std::make_shared<std::promise<batch::report>>();
	{
		auto mgr = manager(test_settings(1u), client);
		mgr.run();
		auto started = mgr.start_batch({
			request_for(dir, "d1.bin", 6u * chunk),
			request_for(dir, "d2.bin", 6u * chunk)},
			[reported](const batch::report& rep){ reported->set_value(rep); });
		BOOST_REQUIRE(api::holds_alternative<std::size_t>(started));
		BOOST_REQUIRE(client->wait_for_count("upload_part", 1u));
	}
	auto future = reported->get_future();
	BOOST_REQUIRE(future.wait_for(0s) == std::future_status::ready);
	auto rep = future.get();
	BOOST_REQUIRE_EQUAL(rep.outcomes.size(), 2u);
	BOOST_REQUIRE_GE(rep.cancelled, 1u);

	auto opened = client->count("create_multipart");
	auto completed = client->count("complete_multipart");
	BOOST_REQUIRE(client->wait_for_count("abort_multipart", opened - completed));
}

BOOST_AUTO_TEST_CASE(bad_settings_are_refused) {
	auto cfg = test_settings();
	cfg.bucket.clear();
	BOOST_REQUIRE_THROW(std::make_unique<manager>(cfg, mock_storage_client::create()), settings_error);
}
