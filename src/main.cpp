#include <rtvoice/core/config.hpp>
#include <rtvoice/core/logger.hpp>
#include <rtvoice/media/portaudio.hpp>
#include <rtvoice/session/options.hpp>
#include <rtvoice/session/runner.hpp>
#include <rtvoice/signaling/http.hpp>
#include <rtvoice/webrtc/rtc_backend.hpp>

#include <getopt.h>

#include <chrono>
#include <cstdlib>
#include <iostream>
#include <memory>
#include <optional>
#include <string>

using namespace rtvoice;

namespace {

constexpr std::chrono::milliseconds kDefaultIceTimeout{10000};

struct CommandLine {
    std::optional<std::string> config_path;
    std::optional<std::string> client_id;
    std::optional<std::string> client_secret;
    std::optional<std::string> server_url;
    std::optional<int> duration;
    std::optional<std::string> device;
    std::optional<std::string> log_level;
    std::optional<long> ice_timeout_ms;
    std::optional<std::string> transcription_model;
};

void printUsage(const char* program) {
    std::cout
        << "Usage: " << program << " --client-id ID [options]\n"
        << "\n"
        << "Options:\n"
        << "  --client-id ID             Client ID from the dashboard\n"
        << "  --client-secret SECRET     Client secret (generated if omitted)\n"
        << "  --server-url URL           API server (default " << session::kDefaultServerUrl << ")\n"
        << "  --duration SECONDS         Connection duration (default 60)\n"
        << "  --device SPEC              Microphone, e.g. ':0', 'audio=Microphone', 'default'\n"
        << "  --config FILE              JSON configuration file\n"
        << "  --log-level LEVEL          debug, info, warn or error\n"
        << "  --ice-timeout MS           ICE gathering timeout, 0 waits forever (default 10000)\n"
        << "  --transcription-model NAME Input transcription model (default "
        << session::kDefaultTranscriptionModel << ", empty disables)\n"
        << "  --help                     Show this help\n";
}

bool parseNumber(const char* text, long& value) {
    char* end = nullptr;
    value = std::strtol(text, &end, 10);
    return end != text && *end == '\0';
}

// Returns nullopt after printing help or a usage error; `exit_code` is set accordingly
std::optional<CommandLine> parseCommandLine(int argc, char** argv, int& exit_code) {
    enum {
        kClientId = 1000, kClientSecret, kServerUrl, kDuration, kDevice,
        kConfig, kLogLevel, kIceTimeout, kTranscriptionModel, kHelp
    };

    static const struct option long_options[] = {
        {"client-id", required_argument, nullptr, kClientId},
        {"client-secret", required_argument, nullptr, kClientSecret},
        {"server-url", required_argument, nullptr, kServerUrl},
        {"duration", required_argument, nullptr, kDuration},
        {"device", required_argument, nullptr, kDevice},
        {"config", required_argument, nullptr, kConfig},
        {"log-level", required_argument, nullptr, kLogLevel},
        {"ice-timeout", required_argument, nullptr, kIceTimeout},
        {"transcription-model", required_argument, nullptr, kTranscriptionModel},
        {"help", no_argument, nullptr, kHelp},
        {nullptr, 0, nullptr, 0}
    };

    CommandLine cli;
    long number = 0;
    int opt;
    while ((opt = getopt_long(argc, argv, "h", long_options, nullptr)) != -1) {
        switch (opt) {
            case kClientId:      cli.client_id = optarg; break;
            case kClientSecret:  cli.client_secret = optarg; break;
            case kServerUrl:     cli.server_url = optarg; break;
            case kDevice:        cli.device = optarg; break;
            case kConfig:        cli.config_path = optarg; break;
            case kLogLevel:      cli.log_level = optarg; break;
            case kTranscriptionModel: cli.transcription_model = optarg; break;
            case kDuration:
                if (!parseNumber(optarg, number) || number <= 0 || number > session::kMaxDurationSeconds) {
                    std::cerr << "Invalid --duration '" << optarg << "' (1.."
                              << session::kMaxDurationSeconds << " seconds)\n";
                    exit_code = 2;
                    return std::nullopt;
                }
                cli.duration = static_cast<int>(number);
                break;
            case kIceTimeout:
                if (!parseNumber(optarg, number) || number < 0) {
                    std::cerr << "Invalid --ice-timeout '" << optarg << "'\n";
                    exit_code = 2;
                    return std::nullopt;
                }
                cli.ice_timeout_ms = number;
                break;
            case 'h':
            case kHelp:
                printUsage(argv[0]);
                exit_code = 0;
                return std::nullopt;
            default:
                printUsage(argv[0]);
                exit_code = 2;
                return std::nullopt;
        }
    }
    return cli;
}

} // namespace

int main(int argc, char** argv) {
    int exit_code = 0;
    auto cli = parseCommandLine(argc, argv, exit_code);
    if (!cli) {
        return exit_code;
    }

    auto& config = core::config();
    if (cli->config_path) {
        auto loaded = config.loadFromFile(*cli->config_path);
        if (!loaded) {
            std::cerr << "Cannot load " << *cli->config_path << ": " << loaded.error().what() << "\n";
            return 2;
        }
    }

    auto parsed = session::ClientOptions::fromConfig(config);
    if (!parsed) {
        std::cerr << "Invalid configuration: " << parsed.error().what() << "\n";
        return 2;
    }
    session::ClientOptions options = std::move(parsed).value();

    if (cli->client_id) options.client_id = *cli->client_id;
    if (cli->client_secret) options.client_secret = *cli->client_secret;
    if (cli->server_url) options.server_url = *cli->server_url;
    if (cli->duration) options.duration_seconds = *cli->duration;
    if (cli->device) options.device = *cli->device;
    if (cli->log_level) options.log_level = core::parseLogLevel(*cli->log_level);
    if (cli->transcription_model) {
        if (cli->transcription_model->empty()) {
            options.transcription_model.reset();
        } else {
            options.transcription_model = *cli->transcription_model;
        }
    }
    if (cli->ice_timeout_ms) {
        if (*cli->ice_timeout_ms > 0) {
            options.ice_timeout = std::chrono::milliseconds(*cli->ice_timeout_ms);
        } else {
            options.ice_timeout.reset();
        }
    } else if (!config.has("ice_timeout_ms")) {
        options.ice_timeout = kDefaultIceTimeout;
    }

    core::Logger::setLevel(options.log_level);

    auto valid = options.validate();
    if (!valid) {
        std::cerr << valid.error().what() << "\n\n";
        printUsage(argv[0]);
        return 2;
    }

    if (options.client_secret.empty()) {
        options.client_secret = session::generateClientSecret();
        core::Logger::info("Generated client secret: {}", options.client_secret);
        core::Logger::info("Save this secret for future connections!");
    }

    try {
        signaling::HttpOptions http;
        http.timeout = options.http_timeout;

        session::SessionDependencies deps;
        deps.transport = std::make_shared<signaling::BeastHttpTransport>(http);
        deps.peer_factory = std::make_shared<webrtc::RtcPeerConnectionFactory>();
        deps.input_backend = std::make_shared<media::PortAudioInputBackend>();
        try {
            deps.output_backend = std::make_shared<media::PortAudioOutputBackend>();
        }
        catch (const media::MediaError& e) {
            core::Logger::warn("Audio output unavailable: {}", e.what());
        }

        session::ClientRunner runner(options, std::move(deps));

        auto& controller = runner.controller();
        controller.onAssistantDelta.connect([](const std::string& delta) {
            std::cout << delta << std::flush;
        });
        controller.onAssistantMessage.connect([](const std::string&) {
            std::cout << std::endl;
        });
        controller.onFunctionCall.connect([](const std::string& name, const nlohmann::json&, const std::string& call_id) {
            core::Logger::info("No local handler for {} (call {}), left to the server", name, call_id);
        });

        return runner.run();
    }
    catch (const std::exception& e) {
        core::Logger::error("Error: {}", e.what());
        return 1;
    }
}
