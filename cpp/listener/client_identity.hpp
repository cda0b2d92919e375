#pragma once
#include <string>
#include <map>

namespace stripe_listener {

constexpr const char* CLI_VERSION = "1.21.0";
constexpr const char* SUBPROTOCOL = "stripecli-devproxy-v1";
constexpr const char* SESSION_PATH = "/v1/stripecli/sessions";
constexpr const char* DEFAULT_API_BASE = "https://api.stripe.com";

// Identifies the listener to the service the way the official CLI does.
class ClientIdentity {
public:
    // "linux", "darwin", ... as reported by uname(2)
    static std::string os_name();
    // "amd64", "arm64", ... normalized from the uname machine field
    static std::string architecture();

    static std::string user_agent();
    static std::string client_user_agent_json();

    /**
     * Headers sent on both the authorization request and the socket upgrade.
     * Authorization and Content-Type are added only when api_key is non-empty.
     */
    static std::map<std::string, std::string> headers(const std::string& api_key = "");
};

} // namespace stripe_listener
