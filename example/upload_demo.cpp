#include "s3drop.hpp"
#include <atomic>
#include <csignal>
#include <cstdlib>
#include <future>
#include <iostream>
#include <thread>

namespace {
	std::atomic<bool> interrupted{false};

	void on_interrupt(int){
		interrupted = true;
	}

	void print(const s3drop::uploader::task::progress& pg){
		std::cout << "task " << pg.task_id << ": " << s3drop::uploader::task::to_string(pg.current_status)
			<< ' ' << pg.bytes_transferred << '/' << pg.total_bytes;
		if (not pg.reason.empty())
			std::cout << " (" << pg.reason << ')';
		std::cout << std::endl;
	}
}

int main(int argc, char *argv[]){
	if (argc < 3){
		std::cerr << "usage: " << argv[0] << " <settings.ini> <file>..." << std::endl;
		return 2;
	}
	auto access_key = std::getenv("S3DROP_ACCESS_KEY");
	auto secret_key = std::getenv("S3DROP_SECRET_KEY");
	if (access_key == nullptr or secret_key == nullptr){
		std::cerr << "S3DROP_ACCESS_KEY and S3DROP_SECRET_KEY must be set" << std::endl;
		return 2;
	}

	try{
		auto cfg = s3drop::uploader::load_settings(api::fs::path{argv[1]});
		s3drop::set_max_threads_count(4);
		auto uploader = s3drop::uploader::manager(cfg, s3drop::storage::credentials{access_key, secret_key});
		uploader.run();
		uploader.install_history_listener([](const s3drop::uploader::history::record& rec){
			std::cout << to_u8string(rec.source_path) << " -> " << rec.url << std::endl;
		});

		auto files = std::vector<api::fs::path>{};
		for (auto i = 2; i < argc; ++i)
			files.emplace_back(argv[i]);

		auto finished = std::promise<s3drop::uploader::batch::report>{};
		auto report = finished.get_future();
		auto started = uploader.start_files(files, [&finished](const s3drop::uploader::batch::report& rep){
			finished.set_value(rep);
		});
		if (not api::holds_alternative<std::size_t>(started)){
			std::cerr << "batch refused: " << api::get<std::error_condition>(started).message() << std::endl;
			return 1;
		}

		std::signal(SIGINT, on_interrupt);
		while (report.wait_for(std::chrono::milliseconds(200)) != std::future_status::ready){
			if (interrupted.exchange(false))
				uploader.cancel_all();
			for (auto& pg : uploader.progress().drain())
				print(pg);
		}
		for (auto& pg : uploader.progress().drain())
			print(pg);

		auto rep = report.get();
		std::cout << rep.completed << " completed, " << rep.failed << " failed, "
			<< rep.cancelled << " cancelled" << std::endl;
		return rep.failed == 0u ? 0 : 1;
	}
	catch (const s3drop::uploader::settings_error& e){
		std::cerr << "bad settings: " << e.what() << std::endl;
		return 2;
	}
}
