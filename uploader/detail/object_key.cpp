#include "uploader/detail/object_key.hpp"
#include "detail/common.hpp"
#include <algorithm>
#include <cctype>
#include <cstdio>
#include <ctime>
#include <random>

namespace s3drop {
	namespace uploader {
		namespace detail {
			namespace {
				struct substitution {
					char32_t		code_point;
					const char*		ascii;
				};

				constexpr substitution transliteration_table[] = {
					// Cyrillic, Russian and Ukrainian letters
					{U'а', "a"}, {U'б', "b"}, {U'в', "v"}, {U'г', "g"}, {U'д', "d"}, {U'е', "e"},
					{U'ё', "yo"}, {U'ж', "zh"}, {U'з', "z"}, {U'и', "i"}, {U'й', "y"}, {U'к', "k"},
					{U'л', "l"}, {U'м', "m"}, {U'н', "n"}, {U'о', "o"}, {U'п', "p"}, {U'р', "r"},
					{U'с', "s"}, {U'т', "t"}, {U'у', "u"}, {U'ф', "f"}, {U'х', "kh"}, {U'ц', "ts"},
					{U'ч', "ch"}, {U'ш', "sh"}, {U'щ', "shch"}, {U'ъ', ""}, {U'ы', "y"}, {U'ь', ""},
					{U'э', "e"}, {U'ю', "yu"}, {U'я', "ya"}, {U'є', "ye"}, {U'і', "i"}, {U'ї', "yi"},
					{U'ґ', "g"},
					{U'А', "A"}, {U'Б', "B"}, {U'В', "V"}, {U'Г', "G"}, {U'Д', "D"}, {U'Е', "E"},
					{U'Ё', "Yo"}, {U'Ж', "Zh"}, {U'З', "Z"}, {U'И', "I"}, {U'Й', "Y"}, {U'К', "K"},
					{U'Л', "L"}, {U'М', "M"}, {U'Н', "N"}, {U'О', "O"}, {U'П', "P"}, {U'Р', "R"},
					{U'С', "S"}, {U'Т', "T"}, {U'У', "U"}, {U'Ф', "F"}, {U'Х', "Kh"}, {U'Ц', "Ts"},
					{U'Ч', "Ch"}, {U'Ш', "Sh"}, {U'Щ', "Shch"}, {U'Ъ', ""}, {U'Ы', "Y"}, {U'Ь', ""},
					{U'Э', "E"}, {U'Ю', "Yu"}, {U'Я', "Ya"}, {U'Є', "Ye"}, {U'І', "I"}, {U'Ї', "Yi"},
					{U'Ґ', "G"},
					// Latin-1 supplement
					{U'à', "a"}, {U'á', "a"}, {U'â', "a"}, {U'ã', "a"}, {U'ä', "a"}, {U'å', "a"},
					{U'æ', "ae"}, {U'ç', "c"}, {U'è', "e"}, {U'é', "e"}, {U'ê', "e"}, {U'ë', "e"},
					{U'ì', "i"}, {U'í', "i"}, {U'î', "i"}, {U'ï', "i"}, {U'ð', "d"}, {U'ñ', "n"},
					{U'ò', "o"}, {U'ó', "o"}, {U'ô', "o"}, {U'õ', "o"}, {U'ö', "o"}, {U'ø', "o"},
					{U'ù', "u"}, {U'ú', "u"}, {U'û', "u"}, {U'ü', "u"}, {U'ý', "y"}, {U'ÿ', "y"},
					{U'þ', "th"}, {U'ß', "ss"},
					{U'À', "A"}, {U'Á', "A"}, {U'Â', "A"}, {U'Ã', "A"}, {U'Ä', "A"}, {U'Å', "A"},
					{U'Æ', "AE"}, {U'Ç', "C"}, {U'È', "E"}, {U'É', "E"}, {U'Ê', "E"}, {U'Ë', "E"},
					{U'Ì', "I"}, {U'Í', "I"}, {U'Î', "I"}, {U'Ï', "I"}, {U'Ð', "D"}, {U'Ñ', "N"},
					{U'Ò', "O"}, {U'Ó', "O"}, {U'Ô', "O"}, {U'Õ', "O"}, {U'Ö', "O"}, {U'Ø', "O"},
					{U'Ù', "U"}, {U'Ú', "U"}, {U'Û', "U"}, {U'Ü', "U"}, {U'Ý', "Y"}, {U'Þ', "Th"},
				};

				struct content_type_entry {
					const char*		extension;
					const char*		mime;
				};

				constexpr content_type_entry content_types[] = {
					{"png", "image/png"}, {"jpg", "image/jpeg"}, {"jpeg", "image/jpeg"},
					{"gif", "image/gif"}, {"webp", "image/webp"}, {"bmp", "image/bmp"},
					{"svg", "image/svg+xml"}, {"ico", "image/x-icon"}, {"tif", "image/tiff"},
					{"tiff", "image/tiff"},
					{"txt", "text/plain"}, {"log", "text/plain"}, {"csv", "text/csv"},
					{"htm", "text/html"}, {"html", "text/html"}, {"css", "text/css"},
					{"js", "application/javascript"}, {"json", "application/json"},
					{"xml", "application/xml"}, {"pdf", "application/pdf"},
					{"zip", "application/zip"}, {"gz", "application/gzip"}, {"tar", "application/x-tar"},
					{"7z", "application/x-7z-compressed"}, {"rar", "application/vnd.rar"},
					{"doc", "application/msword"},
					{"docx", "application/vnd.openxmlformats-officedocument.wordprocessingml.document"},
					{"xls", "application/vnd.ms-excel"},
					{"xlsx", "application/vnd.openxmlformats-officedocument.spreadsheetml.sheet"},
					{"mp3", "audio/mpeg"}, {"wav", "audio/wav"}, {"ogg", "audio/ogg"},
					{"mp4", "video/mp4"}, {"webm", "video/webm"}, {"mov", "video/quicktime"},
					{"avi", "video/x-msvideo"}, {"mkv", "video/x-matroska"},
				};

				// malformed sequences decode to U+FFFD one byte at a time
				char32_t next_code_point(api::string_view text, std::size_t& pos){
					auto lead = static_cast<unsigned char>(text[pos++]);
					if (lead < 0x80)
						return lead;
					auto extra = 0u;
					auto cp = char32_t{};
					if ((lead & 0xe0) == 0xc0){
						extra = 1u;
						cp = lead & 0x1f;
					}
					else if ((lead & 0xf0) == 0xe0){
						extra = 2u;
						cp = lead & 0x0f;
					}
					else if ((lead & 0xf8) == 0xf0){
						extra = 3u;
						cp = lead & 0x07;
					}
					else
						return U'�';
					if (pos + extra > text.size())
						return U'�';
					for (auto i = 0u; i < extra; ++i){
						auto cont = static_cast<unsigned char>(text[pos + i]);
						if ((cont & 0xc0) != 0x80)
							return U'�';
						cp = (cp << 6) | (cont & 0x3f);
					}
					pos += extra;
					return cp;
				}

				bool is_key_safe(char c){
					return std::isalnum(static_cast<unsigned char>(c)) or c == '.' or c == '_' or c == '-';
				}

				std::string to_lower_ascii(std::string text){
					std::transform(text.begin(), text.end(), text.begin(),
						[](unsigned char c){ return static_cast<char>(std::tolower(c)); });
					return text;
				}
			}

			std::string transliterate(api::string_view utf8_text){
				auto out = std::string{};
				out.reserve(utf8_text.size());
				auto pos = std::size_t{0};
				while (pos < utf8_text.size()){
					auto start = pos;
					auto cp = next_code_point(utf8_text, pos);
					if (cp < 0x80){
						out.push_back(static_cast<char>(cp));
						continue;
					}
					auto found = std::find_if(std::begin(transliteration_table), std::end(transliteration_table),
						[cp](const substitution& s){ return s.code_point == cp; });
					if (found != std::end(transliteration_table))
						out += found->ascii;
					else
						out.append(utf8_text.data() + start, pos - start);
				}
				return out;
			}

			std::string sanitize_file_name(api::string_view utf8_name){
				auto ascii = transliterate(utf8_name);
				auto out = std::string{};
				out.reserve(ascii.size());
				auto pos = std::size_t{0};
				// whatever is left outside ASCII folds to one '_' per code point
				while (pos < ascii.size()){
					auto cp = next_code_point(ascii, pos);
					if (cp < 0x80 and is_key_safe(static_cast<char>(cp)))
						out.push_back(static_cast<char>(cp));
					else
						out.push_back('_');
				}
				return out;
			}

			std::string derive_destination_key(const api::fs::path& source,
				std::chrono::system_clock::time_point now, std::uint32_t disambiguator){
				auto tt = std::chrono::system_clock::to_time_t(now);
				auto utc = std::tm{};
#ifdef _WIN32
				gmtime_s(&utc, &tt);
#else
				gmtime_r(&tt, &utc);
#endif
				char date[16] = {};
				auto date_len = std::strftime(date, sizeof(date), "%Y-%m-%d", &utc);
				char suffix[16] = {};
				std::snprintf(suffix, sizeof(suffix), "_%08x", static_cast<unsigned>(disambiguator));

				auto stem = sanitize_file_name(to_u8string(source.stem()));
				if (stem.empty())
					stem = "file";
				auto extension = to_u8string(source.extension());
				if (not extension.empty() and extension.front() == '.')
					extension.erase(0, 1);
				extension = to_lower_ascii(sanitize_file_name(extension));

				auto key = std::string(date, date_len) + '/' + stem + suffix;
				if (not extension.empty())
					key += '.' + extension;
				return key;
			}

			std::string derive_destination_key(const api::fs::path& source){
				thread_local auto generator = std::mt19937{std::random_device{}()};
				return derive_destination_key(source, std::chrono::system_clock::now(),
					static_cast<std::uint32_t>(generator()));
			}

			std::string guess_content_type(const std::string& key_or_path){
				auto dot = key_or_path.find_last_of('.');
				auto slash = key_or_path.find_last_of("/\\");
				if (dot == std::string::npos or (slash != std::string::npos and dot < slash))
					return "application/octet-stream";
				auto extension = to_lower_ascii(key_or_path.substr(dot + 1));
				for (auto& entry : content_types){
					if (extension == entry.extension)
						return entry.mime;
				}
				return "application/octet-stream";
			}
		}
	}
}
