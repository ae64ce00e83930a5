#pragma once
#ifndef S3DROP_DETAIL_COMMON_HPP_
#define S3DROP_DETAIL_COMMON_HPP_

#include <memory>
#include <vector>
#include <string>
#include <cstdint>

#ifdef _WIN32
#include <windows.h>
template<typename PATH>
std::string to_u8string(PATH&& p){
	auto wp = p.wstring();
	auto bufsize = WideCharToMultiByte(CP_UTF8, 0, wp.c_str(), static_cast<int>(wp.size()), nullptr, 0, nullptr, nullptr);
	if (bufsize <= 0)
		return p.string();
	auto u8buf = std::vector<char>(static_cast<std::size_t>(bufsize));
	auto bytes_converted = WideCharToMultiByte(CP_UTF8, 0, wp.c_str(), static_cast<int>(wp.size()), u8buf.data(), bufsize, nullptr, nullptr);
	if (bytes_converted <= 0)
		return p.string();
	return std::string{u8buf.data(), static_cast<std::size_t>(bytes_converted)};
}
#else
template<typename PATH>
std::string to_u8string(PATH&& p){
	return p.string();
}
#endif

namespace s3drop{
	// request and part bodies travel between the disk and network threads by shared ownership
	using blob = std::shared_ptr<std::vector<std::uint8_t>>;

	template<typename... Args>
	inline auto make_blob(Args&&... args) -> decltype(std::make_shared<std::vector<std::uint8_t>>(std::forward<Args>(args)...)){
		return std::make_shared<std::vector<std::uint8_t>>(std::forward<Args>(args)...);
	}

	constexpr std::uint64_t Kilo = 1024u;
	constexpr std::uint64_t Mega = Kilo * Kilo;
}

#endif
