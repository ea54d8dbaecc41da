#pragma once

#include <memory>
#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include <rtvoice/core/error.hpp>
#include <rtvoice/core/event.hpp>
#include <rtvoice/media/media.hpp>

namespace rtvoice::webrtc {

// WebRTC error codes
enum class WebRtcErrorCode {
    Success = 0,
    ConnectionFailed,
    InvalidParameter,
    InvalidState,
    NegotiationFailed,
    MediaStreamError,
    DataChannelError,
    IceError,
    NotSupported,
    UnknownError
};

class WebRtcError : public core::Error {
public:
    explicit WebRtcError(WebRtcErrorCode code, const std::string& message);
    WebRtcErrorCode webrtcCode() const noexcept { return code_; }

private:
    WebRtcErrorCode code_;
};

// ICE server descriptor as delivered by session creation
struct IceServer {
    std::vector<std::string> urls;
    std::optional<std::string> username;
    std::optional<std::string> credential;

    bool operator==(const IceServer& other) const = default;

    nlohmann::json toJson() const;
    // Accepts "urls" as a string or an array of strings
    static IceServer fromJson(const nlohmann::json& json);
};

struct Configuration {
    std::vector<IceServer> ice_servers;
};

enum class SdpType {
    Offer,
    Answer
};

class SessionDescription {
public:
    SessionDescription() = default;
    SessionDescription(SdpType type, std::string sdp);

    SdpType type() const { return type_; }
    const std::string& sdp() const { return sdp_; }
    std::string typeString() const;
    std::string toJson() const;

    static SessionDescription fromJson(const std::string& json);

private:
    SdpType type_ = SdpType::Offer;
    std::string sdp_;
};

enum class IceGatheringState {
    New,
    Gathering,
    Complete
};

enum class PeerConnectionState {
    New,
    Connecting,
    Connected,
    Disconnected,
    Failed,
    Closed
};

enum class DataChannelState {
    Connecting,
    Open,
    Closing,
    Closed
};

const char* iceGatheringStateName(IceGatheringState state);
const char* peerConnectionStateName(PeerConnectionState state);
const char* dataChannelStateName(DataChannelState state);

struct DataChannelInit {
    bool ordered = true;
    std::optional<int> max_retransmits;
    std::string protocol;
};

// Reliable ordered message channel negotiated with the peer connection
class DataChannel {
public:
    virtual ~DataChannel() = default;

    virtual std::string label() const = 0;
    virtual DataChannelState state() const = 0;
    bool isOpen() const { return state() == DataChannelState::Open; }

    // Throws WebRtcError(InvalidState) when the channel is not open
    virtual void send(const std::string& message) = 0;
    virtual void close() = 0;

    core::EventEmitter<> onOpen;
    core::EventEmitter<const std::string&> onMessage;
    core::EventEmitter<> onClose;
};

// Black-box media engine: ICE/DTLS/SRTP and codecs live behind this interface
class PeerConnection {
public:
    virtual ~PeerConnection() = default;

    virtual std::shared_ptr<DataChannel> createDataChannel(const std::string& label,
                                                           const DataChannelInit& init = {}) = 0;

    // Attach the local capture source as the outbound audio track
    virtual void addTrack(std::shared_ptr<media::AudioSource> source) = 0;

    virtual SessionDescription createOffer() = 0;
    virtual void setLocalDescription(const SessionDescription& description) = 0;
    // Includes gathered candidates once gathering is complete
    virtual std::optional<SessionDescription> localDescription() const = 0;
    virtual void setRemoteDescription(const SessionDescription& description) = 0;

    virtual IceGatheringState iceGatheringState() const = 0;
    virtual PeerConnectionState connectionState() const = 0;

    virtual void close() = 0;

    core::EventEmitter<std::shared_ptr<media::RemoteAudioTrack>> onTrack;
    core::EventEmitter<IceGatheringState> onIceGatheringStateChange;
    core::EventEmitter<PeerConnectionState> onConnectionStateChange;
};

class PeerConnectionFactory {
public:
    virtual ~PeerConnectionFactory() = default;

    virtual std::shared_ptr<PeerConnection> create(const Configuration& config) = 0;
};

} // namespace rtvoice::webrtc
