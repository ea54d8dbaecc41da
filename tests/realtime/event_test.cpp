#include <gtest/gtest.h>
#include <rtvoice/realtime/event.hpp>

namespace rtvoice::realtime::test {

TEST(DecodeEventTest, InputTranscription) {
    auto event = decodeEvent(R"({"type":"conversation.item.input_audio_transcription.completed","transcript":"turn it up"})");
    auto* e = std::get_if<InputTranscriptionCompleted>(&event);
    ASSERT_NE(e, nullptr);
    EXPECT_EQ(e->transcript, "turn it up");
}

TEST(DecodeEventTest, TranscriptDeltaAndDone) {
    auto delta = decodeEvent(R"({"type":"response.audio_transcript.delta","delta":"Hel"})");
    ASSERT_TRUE(std::holds_alternative<TranscriptDelta>(delta));
    EXPECT_EQ(std::get<TranscriptDelta>(delta).delta, "Hel");

    auto done = decodeEvent(R"({"type":"response.audio_transcript.done","transcript":"Hello"})");
    ASSERT_TRUE(std::holds_alternative<TranscriptDone>(done));
    EXPECT_EQ(std::get<TranscriptDone>(done).transcript, "Hello");
}

TEST(DecodeEventTest, MissingTextFieldsAreEmpty) {
    auto event = decodeEvent(R"({"type":"response.audio_transcript.delta","delta":5})");
    EXPECT_EQ(std::get<TranscriptDelta>(event).delta, "");
}

TEST(DecodeEventTest, FunctionCallWithStringArguments) {
    auto event = decodeEvent(R"({
        "type": "response.output_item.done",
        "item": {"type":"function_call","name":"set_device_volume","call_id":"c1",
                 "arguments":"{\"volume_level\":70}"}
    })");

    auto* call = std::get_if<FunctionCallRequest>(&event);
    ASSERT_NE(call, nullptr);
    EXPECT_EQ(call->name, "set_device_volume");
    EXPECT_EQ(call->call_id, "c1");
    EXPECT_EQ(call->raw_arguments, R"({"volume_level":70})");
    EXPECT_EQ(call->arguments["volume_level"], 70);
}

TEST(DecodeEventTest, FunctionCallWithObjectArguments) {
    auto event = decodeEvent(R"({"type":"response.output_item.done",
        "item":{"type":"function_call","name":"lookup","call_id":"c2","arguments":{"q":"x"}}})");
    auto& call = std::get<FunctionCallRequest>(event);
    EXPECT_EQ(call.arguments["q"], "x");
}

TEST(DecodeEventTest, UnparsableArgumentsBecomeEmptyObject) {
    auto event = decodeEvent(R"({"type":"response.output_item.done",
        "item":{"type":"function_call","name":"quiet_device","call_id":"c3","arguments":"{oops"}})");
    auto& call = std::get<FunctionCallRequest>(event);
    EXPECT_TRUE(call.arguments.is_object());
    EXPECT_TRUE(call.arguments.empty());

    auto missing = decodeEvent(R"({"type":"response.output_item.done",
        "item":{"type":"function_call","name":"quiet_device","call_id":"c4"}})");
    EXPECT_EQ(std::get<FunctionCallRequest>(missing).raw_arguments, "{}");
}

TEST(DecodeEventTest, NonFunctionOutputItem) {
    auto event = decodeEvent(R"({"type":"response.output_item.done","item":{"type":"message","id":"m1"}})");
    auto* item = std::get_if<OutputItemDone>(&event);
    ASSERT_NE(item, nullptr);
    EXPECT_EQ(item->item["id"], "m1");
}

TEST(DecodeEventTest, UnknownTypeKept) {
    auto event = decodeEvent(R"({"type":"session.created","session":{}})");
    auto* unknown = std::get_if<UnknownEvent>(&event);
    ASSERT_NE(unknown, nullptr);
    EXPECT_EQ(unknown->type, "session.created");
    EXPECT_EQ(eventTypeName(event), "session.created");
}

TEST(DecodeEventTest, MalformedMessagesThrow) {
    EXPECT_THROW(decodeEvent("not json"), ProtocolDecodeError);
    EXPECT_THROW(decodeEvent("[1,2,3]"), ProtocolDecodeError);
    EXPECT_THROW(decodeEvent(R"({"delta":"x"})"), ProtocolDecodeError);
    EXPECT_THROW(decodeEvent(R"({"type":7})"), ProtocolDecodeError);

    try {
        decodeEvent("{");
    }
    catch (const ProtocolDecodeError& e) {
        EXPECT_EQ(e.code(), core::ErrorCode::ProtocolError);
    }
}

TEST(EncodeTest, FunctionOutputShape) {
    auto message = nlohmann::json::parse(encodeFunctionOutput("c1", {{"success", true}, {"volume", 70}}));

    EXPECT_EQ(message["type"], "conversation.item.create");
    EXPECT_EQ(message["item"]["type"], "function_call_output");
    EXPECT_EQ(message["item"]["call_id"], "c1");
    // output adalah string JSON, bukan object
    ASSERT_TRUE(message["item"]["output"].is_string());
    EXPECT_EQ(nlohmann::json::parse(message["item"]["output"].get<std::string>())["volume"], 70);
}

TEST(EncodeTest, FunctionOutputRoundTrip) {
    nlohmann::json result = {{"success", true}, {"message", "Audio stopped"}};
    auto decoded = decodeFunctionOutput(encodeFunctionOutput("call-9", result));
    EXPECT_EQ(decoded.call_id, "call-9");
    EXPECT_EQ(decoded.result, result);
}

TEST(EncodeTest, DecodeFunctionOutputRejectsOtherMessages) {
    EXPECT_THROW(decodeFunctionOutput(encodeResponseCreate()), ProtocolDecodeError);
    EXPECT_THROW(decodeFunctionOutput(R"({"type":"conversation.item.create","item":{"type":"message"}})"),
                 ProtocolDecodeError);
}

TEST(EncodeTest, ResponseCreateAndSessionUpdate) {
    EXPECT_EQ(nlohmann::json::parse(encodeResponseCreate()), (nlohmann::json{{"type", "response.create"}}));

    auto update = nlohmann::json::parse(encodeSessionUpdate("whisper-1"));
    EXPECT_EQ(update["type"], "session.update");
    EXPECT_EQ(update["session"]["input_audio_transcription"]["model"], "whisper-1");
}

TEST(ParseArgumentsTest, OnlyObjectsAccepted) {
    EXPECT_EQ(parseArguments(R"({"a":1})")["a"], 1);
    EXPECT_TRUE(parseArguments("[1]").empty());
    EXPECT_TRUE(parseArguments("").is_object());
}

} // namespace rtvoice::realtime::test
