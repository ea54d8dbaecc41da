#include <rtvoice/realtime/router.hpp>
#include <rtvoice/core/logger.hpp>

#include <cerrno>
#include <cmath>
#include <cstdint>
#include <cstdlib>

namespace rtvoice::realtime {

namespace {

constexpr int kDefaultVolumeLevel = 50;

// Di-clamp ke 0..100 sebelum dikonversi ke int
template <typename T>
int clampVolumeLevel(T value) {
    if (value <= static_cast<T>(0)) {
        return 0;
    }
    if (value >= static_cast<T>(100)) {
        return 100;
    }
    return static_cast<int>(value);
}

// volume_level bisa berupa angka atau string angka ("70")
int volumeLevelArgument(const nlohmann::json& arguments) {
    auto it = arguments.find("volume_level");
    if (it == arguments.end() || it->is_null()) {
        return kDefaultVolumeLevel;
    }
    if (it->is_number_unsigned()) {
        return clampVolumeLevel(it->get<uint64_t>());
    }
    if (it->is_number_integer()) {
        return clampVolumeLevel(it->get<int64_t>());
    }
    if (it->is_number_float()) {
        const double value = it->get<double>();
        if (std::isnan(value)) {
            return kDefaultVolumeLevel;
        }
        return clampVolumeLevel(value);
    }
    if (it->is_string()) {
        const auto text = it->get<std::string>();
        char* end = nullptr;
        errno = 0;
        long long parsed = std::strtoll(text.c_str(), &end, 10);
        if (end != text.c_str()) {
            // ERANGE sudah memberi LLONG_MIN/LLONG_MAX, clamp tetap benar
            return clampVolumeLevel(parsed);
        }
    }
    return kDefaultVolumeLevel;
}

std::string actionArgument(const nlohmann::json& arguments) {
    auto it = arguments.find("action");
    if (it != arguments.end() && it->is_string()) {
        return it->get<std::string>();
    }
    return "increase";
}

} // namespace

LocalFunctionTable defaultLocalFunctions() {
    LocalFunctionTable table;

    table["set_device_volume"] = [](const nlohmann::json& arguments) {
        const int level = volumeLevelArgument(arguments);
        return LocalOutcome{{{"success", true}, {"volume", level}}, SetVolumeEffect{level}};
    };

    table["adjust_device_volume"] = [](const nlohmann::json& arguments) {
        auto action = actionArgument(arguments);
        return LocalOutcome{{{"success", true}, {"action", action}}, AdjustVolumeEffect{action}};
    };

    table["quiet_device"] = [](const nlohmann::json&) {
        return LocalOutcome{{{"success", true}, {"volume", 0}}, MuteEffect{}};
    };

    table["stop_audio"] = [](const nlohmann::json&) {
        return LocalOutcome{{{"success", true}, {"message", "Audio stopped"}}, StopAudioEffect{}};
    };

    return table;
}

std::vector<std::string> functionResultMessages(const std::string& call_id, const nlohmann::json& result) {
    return {encodeFunctionOutput(call_id, result), encodeResponseCreate()};
}

RealtimeEventRouter::RealtimeEventRouter(RouterCallbacks callbacks,
                                         std::shared_ptr<EventWriter> writer,
                                         std::shared_ptr<media::VolumeControl> volume,
                                         LocalFunctionTable functions)
    : callbacks_(std::move(callbacks)),
      writer_(std::move(writer)),
      volume_(std::move(volume)),
      functions_(std::move(functions)) {}

std::vector<RouterAction> RealtimeEventRouter::plan(const RealtimeEvent& event) const {
    std::vector<RouterAction> actions;

    if (auto* e = std::get_if<InputTranscriptionCompleted>(&event)) {
        actions.emplace_back(EmitUserTranscript{e->transcript});
    }
    else if (auto* e = std::get_if<TranscriptDelta>(&event)) {
        actions.emplace_back(EmitAssistantDelta{e->delta});
    }
    else if (auto* e = std::get_if<TranscriptDone>(&event)) {
        actions.emplace_back(EmitAssistantTranscript{e->transcript});
    }
    else if (auto* call = std::get_if<FunctionCallRequest>(&event)) {
        auto it = functions_.find(call->name);
        if (it != functions_.end()) {
            auto outcome = it->second(call->arguments);
            actions.emplace_back(SendFunctionResult{call->name, call->call_id,
                                                    std::move(outcome.result), std::move(outcome.effect)});
        } else {
            actions.emplace_back(ForwardFunctionCall{call->name, call->arguments, call->call_id});
        }
    }
    // OutputItemDone (non-function) dan UnknownEvent: tidak ada aksi

    return actions;
}

void RealtimeEventRouter::handleMessage(const std::string& message) {
    RealtimeEvent event;
    try {
        event = decodeEvent(message);
    }
    catch (const ProtocolDecodeError& e) {
        core::Logger::warn("Dropping data channel message: {} ({} bytes)", e.what(), message.size());
        return;
    }

    dispatch(event);
}

void RealtimeEventRouter::dispatch(const RealtimeEvent& event) {
    auto actions = plan(event);
    if (actions.empty()) {
        core::Logger::debug("Ignoring event {}", eventTypeName(event));
        return;
    }

    for (const auto& action : actions) {
        try {
            execute(action);
        }
        catch (const std::exception& e) {
            core::Logger::error("Handler for {} failed: {}", eventTypeName(event), e.what());
        }
    }
}

void RealtimeEventRouter::execute(const RouterAction& action) {
    if (auto* a = std::get_if<EmitUserTranscript>(&action)) {
        core::Logger::info("You: {}", a->text);
        if (callbacks_.on_transcript) callbacks_.on_transcript(a->text);
    }
    else if (auto* a = std::get_if<EmitAssistantDelta>(&action)) {
        if (callbacks_.on_assistant_delta) callbacks_.on_assistant_delta(a->text);
    }
    else if (auto* a = std::get_if<EmitAssistantTranscript>(&action)) {
        core::Logger::info("Assistant: {}", a->text);
        if (callbacks_.on_assistant_message) callbacks_.on_assistant_message(a->text);
    }
    else if (auto* a = std::get_if<SendFunctionResult>(&action)) {
        core::Logger::info("Function call: {} handled locally ({})", a->name, a->result.dump());
        applyEffect(a->effect);

        if (!writer_) {
            core::Logger::warn("No data channel writer, result for {} not sent", a->call_id);
            return;
        }
        auto written = writer_->write(functionResultMessages(a->call_id, a->result));
        if (!written) {
            core::Logger::warn("Function result for {} not sent: {}", a->call_id, written.error().what());
        }
    }
    else if (auto* a = std::get_if<ForwardFunctionCall>(&action)) {
        core::Logger::info("Function call: {}({})", a->name, a->arguments.dump());
        if (callbacks_.on_function_call) {
            callbacks_.on_function_call(a->name, a->arguments, a->call_id);
        } else {
            core::Logger::debug("No function call handler registered for {}", a->name);
        }
    }
}

void RealtimeEventRouter::applyEffect(const DeviceEffect& effect) {
    if (std::holds_alternative<NoEffect>(effect)) {
        return;
    }
    if (!volume_) {
        core::Logger::debug("No volume control attached, device effect skipped");
        return;
    }

    if (auto* e = std::get_if<SetVolumeEffect>(&effect)) {
        volume_->setVolume(e->level);
    } else if (auto* e = std::get_if<AdjustVolumeEffect>(&effect)) {
        volume_->adjustVolume(e->action);
    } else if (std::holds_alternative<MuteEffect>(effect)) {
        volume_->mute();
    } else if (std::holds_alternative<StopAudioEffect>(effect)) {
        volume_->stopAudio();
    }
}

} // namespace rtvoice::realtime
