#include <streamview/peer/peer_connection.hpp>

namespace streamview::peer {

const char* toString(SdpType type) {
    switch (type) {
        case SdpType::Offer: return "offer";
        case SdpType::Answer: return "answer";
        default: return "unknown";
    }
}

const char* toString(PeerConnectionState state) {
    switch (state) {
        case PeerConnectionState::New: return "new";
        case PeerConnectionState::Connecting: return "connecting";
        case PeerConnectionState::Connected: return "connected";
        case PeerConnectionState::Disconnected: return "disconnected";
        case PeerConnectionState::Failed: return "failed";
        case PeerConnectionState::Closed: return "closed";
        default: return "unknown";
    }
}

} // namespace streamview::peer
