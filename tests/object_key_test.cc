#define BOOST_TEST_MODULE object_key
#include "uploader/detail/object_key.hpp"

#include <boost/test/unit_test.hpp>

using namespace s3drop;
using namespace s3drop::uploader::detail;

namespace {
	// 2024-03-09T23:59:59Z
	const auto late_evening = std::chrono::system_clock::time_point{std::chrono::seconds{1710028799}};

	bool key_safe(const std::string& key){
		for (auto c : key){
			auto ok = (c >= 'a' and c <= 'z') or (c >= 'A' and c <= 'Z') or (c >= '0' and c <= '9') or
				c == '.' or c == '_' or c == '-' or c == '/';
			if (not ok)
				return false;
		}
		return true;
	}
}

BOOST_AUTO_TEST_CASE(key_layout) {
	auto key = derive_destination_key(api::fs::path{"/home/user/Photos/Holiday.JPG"}, late_evening, 0xdeadbeefu);
	BOOST_REQUIRE_EQUAL(key, "2024-03-09/Holiday_deadbeef.jpg");
}

BOOST_AUTO_TEST_CASE(disambiguator_is_zero_padded) {
	auto key = derive_destination_key(api::fs::path{"report.pdf"}, late_evening, 0x2au);
	BOOST_REQUIRE_EQUAL(key, "2024-03-09/report_0000002a.pdf");
}

BOOST_AUTO_TEST_CASE(cyrillic_names_are_transliterated) {
	auto key = derive_destination_key(api::fs::path{u8"Отчёт за год.docx"}, late_evening, 1u);
	BOOST_REQUIRE_EQUAL(key, "2024-03-09/Otchyot_za_god_00000001.docx");
	BOOST_REQUIRE_EQUAL(transliterate(u8"Їжак і ґанок"), "Yizhak i ganok");
	BOOST_REQUIRE_EQUAL(transliterate(u8"щука"), "shchuka");
}

BOOST_AUTO_TEST_CASE(latin1_diacritics_are_folded) {
	BOOST_REQUIRE_EQUAL(sanitize_file_name(u8"Crème brûlée"), "Creme_brulee");
	BOOST_REQUIRE_EQUAL(sanitize_file_name(u8"Straße"), "Strasse");
}

BOOST_AUTO_TEST_CASE(unknown_characters_become_underscores) {
	BOOST_REQUIRE_EQUAL(sanitize_file_name("a&b(c)#d"), "a_b_c__d");
	// one underscore per code point, not per byte
	BOOST_REQUIRE_EQUAL(sanitize_file_name(u8"猫.png"), "_.png");
	auto key = derive_destination_key(api::fs::path{u8"日本 語 ☃.TXT"}, late_evening, 7u);
	BOOST_REQUIRE(key_safe(key));
	BOOST_REQUIRE_EQUAL(key.substr(key.size() - 4), ".txt");
}

BOOST_AUTO_TEST_CASE(empty_stem_and_missing_extension) {
	BOOST_REQUIRE_EQUAL(derive_destination_key(api::fs::path{"Makefile"}, late_evening, 3u),
		"2024-03-09/Makefile_00000003");
	BOOST_REQUIRE_EQUAL(derive_destination_key(api::fs::path{u8"ъ.txt"}, late_evening, 3u),
		"2024-03-09/file_00000003.txt");
}

BOOST_AUTO_TEST_CASE(random_disambiguators_differ) {
	auto first = derive_destination_key(api::fs::path{"same.bin"});
	auto second = derive_destination_key(api::fs::path{"same.bin"});
	BOOST_REQUIRE(key_safe(first));
	// 1 in 2^32 to collide
	BOOST_REQUIRE_NE(first, second);
}

BOOST_AUTO_TEST_CASE(content_types) {
	BOOST_REQUIRE_EQUAL(guess_content_type("2024-03-09/a_00000001.png"), "image/png");
	BOOST_REQUIRE_EQUAL(guess_content_type("photo.JPEG"), "image/jpeg");
	BOOST_REQUIRE_EQUAL(guess_content_type("notes.txt"), "text/plain");
	BOOST_REQUIRE_EQUAL(guess_content_type("archive.unknownext"), "application/octet-stream");
	BOOST_REQUIRE_EQUAL(guess_content_type("dir.d/Makefile"), "application/octet-stream");
}
