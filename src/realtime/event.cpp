#include <rtvoice/realtime/event.hpp>

namespace rtvoice::realtime {

ProtocolDecodeError::ProtocolDecodeError(const std::string& message)
    : core::Error(core::ErrorCode::ProtocolError, message) {}

namespace {

// Field yang tidak ada atau bukan string dianggap kosong
std::string stringField(const nlohmann::json& object, const char* key, const std::string& fallback = {}) {
    auto it = object.find(key);
    if (it == object.end() || !it->is_string()) {
        return fallback;
    }
    return it->get<std::string>();
}

nlohmann::json parseObject(const std::string& message) {
    auto json = nlohmann::json::parse(message, nullptr, false);
    if (json.is_discarded()) {
        throw ProtocolDecodeError("Message is not valid JSON");
    }
    if (!json.is_object()) {
        throw ProtocolDecodeError("Message is not a JSON object");
    }
    return json;
}

RealtimeEvent decodeOutputItem(const nlohmann::json& message) {
    auto it = message.find("item");
    if (it == message.end() || !it->is_object()) {
        return OutputItemDone{nlohmann::json::object()};
    }

    const auto& item = *it;
    if (stringField(item, "type") != "function_call") {
        return OutputItemDone{item};
    }

    FunctionCallRequest call;
    call.name = stringField(item, "name");
    call.call_id = stringField(item, "call_id");

    auto args = item.find("arguments");
    if (args != item.end() && args->is_object()) {
        call.raw_arguments = args->dump();
        call.arguments = *args;
    } else {
        call.raw_arguments = stringField(item, "arguments", "{}");
        call.arguments = parseArguments(call.raw_arguments);
    }
    return call;
}

} // namespace

RealtimeEvent decodeEvent(const std::string& message) {
    auto json = parseObject(message);

    auto type_it = json.find("type");
    if (type_it == json.end() || !type_it->is_string()) {
        throw ProtocolDecodeError("Message has no string \"type\"");
    }
    const auto type = type_it->get<std::string>();

    if (type == event_type::kInputTranscriptionCompleted) {
        return InputTranscriptionCompleted{stringField(json, "transcript")};
    }
    if (type == event_type::kTranscriptDelta) {
        return TranscriptDelta{stringField(json, "delta")};
    }
    if (type == event_type::kTranscriptDone) {
        return TranscriptDone{stringField(json, "transcript")};
    }
    if (type == event_type::kOutputItemDone) {
        return decodeOutputItem(json);
    }
    return UnknownEvent{type};
}

std::string eventTypeName(const RealtimeEvent& event) {
    struct Visitor {
        std::string operator()(const InputTranscriptionCompleted&) const { return event_type::kInputTranscriptionCompleted; }
        std::string operator()(const TranscriptDelta&) const { return event_type::kTranscriptDelta; }
        std::string operator()(const TranscriptDone&) const { return event_type::kTranscriptDone; }
        std::string operator()(const FunctionCallRequest&) const { return event_type::kOutputItemDone; }
        std::string operator()(const OutputItemDone&) const { return event_type::kOutputItemDone; }
        std::string operator()(const UnknownEvent& e) const { return e.type; }
    };
    return std::visit(Visitor{}, event);
}

nlohmann::json parseArguments(const std::string& raw) {
    auto json = nlohmann::json::parse(raw, nullptr, false);
    if (json.is_discarded() || !json.is_object()) {
        return nlohmann::json::object();
    }
    return json;
}

std::string encodeFunctionOutput(const std::string& call_id, const nlohmann::json& result) {
    nlohmann::json message = {
        {"type", event_type::kConversationItemCreate},
        {"item", {
            {"type", "function_call_output"},
            {"call_id", call_id},
            {"output", result.dump()}
        }}
    };
    return message.dump();
}

std::string encodeResponseCreate() {
    return nlohmann::json{{"type", event_type::kResponseCreate}}.dump();
}

std::string encodeSessionUpdate(const std::string& transcription_model) {
    nlohmann::json message = {
        {"type", event_type::kSessionUpdate},
        {"session", {
            {"input_audio_transcription", {{"model", transcription_model}}}
        }}
    };
    return message.dump();
}

FunctionOutput decodeFunctionOutput(const std::string& message) {
    auto json = parseObject(message);
    if (stringField(json, "type") != event_type::kConversationItemCreate) {
        throw ProtocolDecodeError("Not a conversation.item.create message");
    }

    auto item = json.find("item");
    if (item == json.end() || !item->is_object() ||
        stringField(*item, "type") != "function_call_output") {
        throw ProtocolDecodeError("Item is not a function_call_output");
    }

    auto output = item->find("output");
    if (output == item->end() || !output->is_string()) {
        throw ProtocolDecodeError("function_call_output has no string output");
    }

    auto result = nlohmann::json::parse(output->get<std::string>(), nullptr, false);
    if (result.is_discarded()) {
        throw ProtocolDecodeError("function_call_output output is not valid JSON");
    }
    return {stringField(*item, "call_id"), std::move(result)};
}

} // namespace rtvoice::realtime
