#pragma once

#include <string>
#include <string_view>

namespace reviewgate::http {

inline constexpr std::string_view kBearerPrefix = "Bearer ";
// std::string because cpp-httplib APIs require const std::string&
inline const std::string kAuthorizationHeader = "Authorization";
inline constexpr const char* kJsonContentType = "application/json";

inline constexpr const char* kChatPath = "/api/v1/chat";
inline constexpr const char* kConversationsPath = "/api/v1/conversations";
inline constexpr const char* kAdminTracesPath = "/api/v1/admin/traces";
inline constexpr const char* kAdminGrantsPath = "/api/v1/admin/grants";
inline constexpr const char* kHealthPath = "/health";

} // namespace reviewgate::http
