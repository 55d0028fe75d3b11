#pragma once

#include <string>

namespace promptguard::http {

// std::string because cpp-httplib route APIs take const std::string&
inline const std::string kClassifyPath = "/api/v1/classify";
inline const std::string kHealthPath = "/health";
inline const std::string kRootPath = "/";
inline constexpr const char* kJsonContentType = "application/json";

inline constexpr int kStatusOk = 200;
inline constexpr int kStatusBadRequest = 400;
inline constexpr int kStatusInternalError = 500;
inline constexpr int kStatusBadGateway = 502;

} // namespace promptguard::http
