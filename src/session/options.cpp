#include <rtvoice/session/options.hpp>

#include <iomanip>
#include <sstream>

#include <openssl/rand.h>

namespace rtvoice::session {

namespace {

template<typename T>
bool assign(core::Result<T> result, T& target, std::optional<core::Error>& failure) {
    if (!result) {
        failure.emplace(result.error());
        return false;
    }
    target = std::move(result).value();
    return true;
}

} // namespace

core::Result<ClientOptions> ClientOptions::fromConfig(const core::Config& config) {
    ClientOptions options;
    std::optional<core::Error> failure;

    std::string log_level = core::logLevelName(options.log_level);
    std::string device;
    std::string transcription_model = kDefaultTranscriptionModel;
    int64_t duration = options.duration_seconds;
    int64_t ice_timeout_ms = 0;
    int64_t http_timeout_ms = options.http_timeout.count();

    bool ok = assign(config.getOr<std::string>("client_id", ""), options.client_id, failure)
        && assign(config.getOr<std::string>("client_secret", ""), options.client_secret, failure)
        && assign(config.getOr<std::string>("server_url", kDefaultServerUrl), options.server_url, failure)
        && assign(config.getOr<int64_t>("duration_seconds", duration), duration, failure)
        && assign(config.getOr<std::string>("device", ""), device, failure)
        && assign(config.getOr<std::string>("log_level", log_level), log_level, failure)
        && assign(config.getOr<int64_t>("ice_timeout_ms", 0), ice_timeout_ms, failure)
        && assign(config.getOr<std::string>("transcription_model", transcription_model), transcription_model, failure)
        && assign(config.getOr<int64_t>("http_timeout_ms", http_timeout_ms), http_timeout_ms, failure);

    if (!ok) {
        return *failure;
    }

    if (ice_timeout_ms < 0 || http_timeout_ms <= 0) {
        return {core::ErrorCode::InvalidData, "Timeouts must be positive (ice_timeout_ms may be 0)"};
    }

    if (duration <= 0 || duration > kMaxDurationSeconds) {
        return {core::ErrorCode::InvalidData, "duration_seconds must be between 1 and " +
                                               std::to_string(kMaxDurationSeconds)};
    }

    options.duration_seconds = static_cast<int>(duration);
    options.log_level = core::parseLogLevel(log_level);
    if (!device.empty()) {
        options.device = device;
    }
    if (ice_timeout_ms > 0) {
        options.ice_timeout = std::chrono::milliseconds(ice_timeout_ms);
    }
    if (!transcription_model.empty()) {
        options.transcription_model = transcription_model;
    }
    options.http_timeout = std::chrono::milliseconds(http_timeout_ms);

    return options;
}

core::Result<void> ClientOptions::validate() const {
    if (client_id.empty()) {
        return {core::ErrorCode::InvalidArgument, "A client id is required"};
    }
    if (duration_seconds <= 0 || duration_seconds > kMaxDurationSeconds) {
        return {core::ErrorCode::InvalidArgument, "Duration must be between 1 and " +
                                                   std::to_string(kMaxDurationSeconds) + " seconds"};
    }
    if (server_url.rfind("http://", 0) != 0 && server_url.rfind("https://", 0) != 0) {
        return {core::ErrorCode::InvalidAddress, "Server URL must start with http:// or https://"};
    }
    return {};
}

std::string generateClientSecret() {
    unsigned char bytes[32];
    if (RAND_bytes(bytes, sizeof(bytes)) != 1) {
        core::throw_error(core::ErrorCode::Unknown, "Could not generate a client secret");
    }

    std::ostringstream oss;
    oss << std::hex << std::setfill('0');
    for (unsigned char b : bytes) {
        oss << std::setw(2) << static_cast<int>(b);
    }
    return oss.str();
}

} // namespace rtvoice::session
