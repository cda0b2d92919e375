#include "client_identity.hpp"
#include <sys/utsname.h>
#include <algorithm>
#include <cctype>
#include <json/json.h>

namespace stripe_listener {

std::string ClientIdentity::os_name() {
    struct utsname info;
    if (uname(&info) != 0) {
        return "unknown";
    }
    std::string name(info.sysname);
    std::transform(name.begin(), name.end(), name.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return name;
}

std::string ClientIdentity::architecture() {
    struct utsname info;
    if (uname(&info) != 0) {
        return "unknown";
    }
    std::string machine(info.machine);
    if (machine == "x86_64") return "amd64";
    if (machine == "aarch64" || machine == "arm64") return "arm64";
    if (machine == "i386" || machine == "i686") return "386";
    return machine;
}

std::string ClientIdentity::user_agent() {
    return std::string("Stripe/v1 stripe-cli/") + CLI_VERSION;
}

std::string ClientIdentity::client_user_agent_json() {
    const std::string os = os_name();

    Json::Value ua(Json::objectValue);
    ua["name"] = "stripe-cli";
    ua["version"] = CLI_VERSION;
    ua["publisher"] = "stripe";
    ua["os"] = os;
    ua["uname"] = os + " " + architecture();

    Json::StreamWriterBuilder writer;
    writer["indentation"] = "";
    return Json::writeString(writer, ua);
}

std::map<std::string, std::string> ClientIdentity::headers(const std::string& api_key) {
    std::map<std::string, std::string> headers;
    headers["Accept-Encoding"] = "identity";
    headers["User-Agent"] = user_agent();
    headers["X-Stripe-Client-User-Agent"] = client_user_agent_json();

    if (!api_key.empty()) {
        headers["Authorization"] = "Bearer " + api_key;
        headers["Content-Type"] = "application/x-www-form-urlencoded";
    }
    return headers;
}

} // namespace stripe_listener
