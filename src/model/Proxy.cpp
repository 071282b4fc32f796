#include "proxyrot/model/Proxy.hpp"

#include <algorithm>
#include <cmath>

namespace proxyrot::model {

const char* toString(ProxyStatus status) {
    switch (status) {
    case ProxyStatus::active:   return "active";
    case ProxyStatus::failed:   return "failed";
    case ProxyStatus::checking: return "checking";
    case ProxyStatus::disabled: return "disabled";
    }
    return "active";
}

std::optional<ProxyStatus> parseProxyStatus(std::string_view text) {
    if (text == "active") return ProxyStatus::active;
    if (text == "failed") return ProxyStatus::failed;
    if (text == "checking") return ProxyStatus::checking;
    if (text == "disabled") return ProxyStatus::disabled;
    return std::nullopt;
}

double clampWeight(double weight) {
    if (!std::isfinite(weight)) {
        return 0.0;
    }
    return std::clamp(weight, 0.0, 100.0);
}

} // namespace proxyrot::model
