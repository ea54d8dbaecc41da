#pragma once

#include <string>
#include <variant>

#include <nlohmann/json.hpp>

#include <rtvoice/core/error.hpp>

namespace rtvoice::realtime {

// Event type tags used on the data channel
namespace event_type {
inline constexpr const char* kInputTranscriptionCompleted =
    "conversation.item.input_audio_transcription.completed";
inline constexpr const char* kTranscriptDelta = "response.audio_transcript.delta";
inline constexpr const char* kTranscriptDone = "response.audio_transcript.done";
inline constexpr const char* kOutputItemDone = "response.output_item.done";
inline constexpr const char* kConversationItemCreate = "conversation.item.create";
inline constexpr const char* kResponseCreate = "response.create";
inline constexpr const char* kSessionUpdate = "session.update";
} // namespace event_type

// Data-channel message that is not a JSON object with a string "type"
class ProtocolDecodeError : public core::Error {
public:
    explicit ProtocolDecodeError(const std::string& message);
};

struct InputTranscriptionCompleted {
    std::string transcript;
};

struct TranscriptDelta {
    std::string delta;
};

struct TranscriptDone {
    std::string transcript;
};

struct FunctionCallRequest {
    std::string call_id;
    std::string name;
    std::string raw_arguments;
    // Always an object; empty when raw_arguments does not parse
    nlohmann::json arguments = nlohmann::json::object();
};

// response.output_item.done whose item is not a function call
struct OutputItemDone {
    nlohmann::json item;
};

struct UnknownEvent {
    std::string type;
};

using RealtimeEvent = std::variant<
    InputTranscriptionCompleted,
    TranscriptDelta,
    TranscriptDone,
    FunctionCallRequest,
    OutputItemDone,
    UnknownEvent
>;

// Throws ProtocolDecodeError for malformed messages
RealtimeEvent decodeEvent(const std::string& message);

std::string eventTypeName(const RealtimeEvent& event);

// Nested argument string -> object. Never throws; failures give {}.
nlohmann::json parseArguments(const std::string& raw);

// {"type":"conversation.item.create","item":{"type":"function_call_output",...}}
std::string encodeFunctionOutput(const std::string& call_id, const nlohmann::json& result);
// {"type":"response.create"}
std::string encodeResponseCreate();
// Enables input audio transcription with the given model
std::string encodeSessionUpdate(const std::string& transcription_model);

struct FunctionOutput {
    std::string call_id;
    nlohmann::json result;
};

// Inverse of encodeFunctionOutput. Throws ProtocolDecodeError.
FunctionOutput decodeFunctionOutput(const std::string& message);

} // namespace rtvoice::realtime
