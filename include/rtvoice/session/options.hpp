#pragma once

#include <chrono>
#include <climits>
#include <optional>
#include <string>

#include <rtvoice/core/config.hpp>
#include <rtvoice/core/error.hpp>
#include <rtvoice/core/logger.hpp>

namespace rtvoice::session {

inline constexpr const char* kDefaultServerUrl = "https://api.itannix.com";
inline constexpr const char* kDefaultTranscriptionModel = "gpt-4o-mini-transcribe";
// Durasi dalam milidetik harus muat di int
inline constexpr int kMaxDurationSeconds = INT_MAX / 1000;

struct ClientOptions {
    std::string client_id;
    // Empty: generated at startup and logged
    std::string client_secret;
    std::string server_url = kDefaultServerUrl;
    int duration_seconds = 60;
    std::optional<std::string> device;
    core::LogLevel log_level = core::LogLevel::INFO;
    // nullopt: wait for ICE gathering without a deadline
    std::optional<std::chrono::milliseconds> ice_timeout;
    // Set from config by default; an empty "transcription_model" disables it
    std::optional<std::string> transcription_model;
    std::chrono::milliseconds http_timeout{15000};

    // Missing keys keep their defaults; keys with the wrong type are errors
    static core::Result<ClientOptions> fromConfig(const core::Config& config);

    // client_id present, duration in 1..kMaxDurationSeconds, server URL http(s)
    core::Result<void> validate() const;
};

// 32 random bytes as 64 lowercase hex characters
std::string generateClientSecret();

} // namespace rtvoice::session
