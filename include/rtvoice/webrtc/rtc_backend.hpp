#pragma once

#include <memory>

#include <rtvoice/webrtc/webrtc.hpp>

namespace rtvoice::webrtc {

// libdatachannel peer connections with one sendrecv Opus audio m-line.
// Outbound capture (48 kHz mono S16) is Opus-encoded and sent as RTP with
// payload type 111; inbound RTP is decoded to 24 kHz stereo S16 frames.
class RtcPeerConnectionFactory : public PeerConnectionFactory {
public:
    RtcPeerConnectionFactory();

    std::shared_ptr<PeerConnection> create(const Configuration& config) override;
};

} // namespace rtvoice::webrtc
