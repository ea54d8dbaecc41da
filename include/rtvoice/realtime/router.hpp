#pragma once

#include <functional>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <variant>
#include <vector>

#include <nlohmann/json.hpp>

#include <rtvoice/core/error.hpp>
#include <rtvoice/media/playback.hpp>
#include <rtvoice/realtime/event.hpp>

namespace rtvoice::realtime {

// Device effects a local function asks for. Executed against VolumeControl.
struct SetVolumeEffect {
    int level;
};
struct AdjustVolumeEffect {
    std::string action;
};
struct MuteEffect {};
struct StopAudioEffect {};
struct NoEffect {};

using DeviceEffect = std::variant<NoEffect, SetVolumeEffect, AdjustVolumeEffect, MuteEffect, StopAudioEffect>;

struct LocalOutcome {
    nlohmann::json result;
    DeviceEffect effect;
};

using LocalFunction = std::function<LocalOutcome(const nlohmann::json& arguments)>;
using LocalFunctionTable = std::map<std::string, LocalFunction>;

// set_device_volume, adjust_device_volume, quiet_device, stop_audio
LocalFunctionTable defaultLocalFunctions();

// What the router decided to do for one event
struct EmitUserTranscript {
    std::string text;
};
struct EmitAssistantDelta {
    std::string text;
};
struct EmitAssistantTranscript {
    std::string text;
};
struct SendFunctionResult {
    std::string name;
    std::string call_id;
    nlohmann::json result;
    DeviceEffect effect;
};
struct ForwardFunctionCall {
    std::string name;
    nlohmann::json arguments;
    std::string call_id;
};

using RouterAction = std::variant<
    EmitUserTranscript,
    EmitAssistantDelta,
    EmitAssistantTranscript,
    SendFunctionResult,
    ForwardFunctionCall
>;

struct RouterCallbacks {
    std::function<void(const std::string&)> on_transcript;
    std::function<void(const std::string&)> on_assistant_delta;
    std::function<void(const std::string&)> on_assistant_message;
    std::function<void(const std::string& name, const nlohmann::json& arguments, const std::string& call_id)>
        on_function_call;
};

// Outbound side of the data channel. A batch is written back to back, no
// other write may land between its messages.
class EventWriter {
public:
    virtual ~EventWriter() = default;

    virtual core::Result<void> write(const std::vector<std::string>& messages) = 0;
};

// Function output followed by response.create
std::vector<std::string> functionResultMessages(const std::string& call_id, const nlohmann::json& result);

class RealtimeEventRouter {
public:
    RealtimeEventRouter(RouterCallbacks callbacks,
                        std::shared_ptr<EventWriter> writer,
                        std::shared_ptr<media::VolumeControl> volume = nullptr,
                        LocalFunctionTable functions = defaultLocalFunctions());

    // Pure decision for one decoded event. Unknown events give no actions.
    std::vector<RouterAction> plan(const RealtimeEvent& event) const;

    // Decode, plan, execute. Malformed messages are dropped with a warning.
    void handleMessage(const std::string& message);

    void dispatch(const RealtimeEvent& event);

    const LocalFunctionTable& localFunctions() const noexcept { return functions_; }

private:
    void execute(const RouterAction& action);
    void applyEffect(const DeviceEffect& effect);

    RouterCallbacks callbacks_;
    std::shared_ptr<EventWriter> writer_;
    std::shared_ptr<media::VolumeControl> volume_;
    LocalFunctionTable functions_;
};

} // namespace rtvoice::realtime
