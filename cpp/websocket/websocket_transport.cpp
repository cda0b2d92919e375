#include "websocket_transport.hpp"
#include "websocketpp_transport.hpp"

namespace websocket_transport {

std::unique_ptr<IWebSocketTransport> WebSocketTransportFactory::create() {
    return std::make_unique<WebsocketppTransport>();
}

TransportFactory WebSocketTransportFactory::default_factory() {
    return []() { return WebSocketTransportFactory::create(); };
}

} // namespace websocket_transport
