#include "proxyrot/model/RotationEvent.hpp"

namespace proxyrot::model {

const char* toString(RotationReason reason) {
    switch (reason) {
    case RotationReason::scheduled:     return "scheduled";
    case RotationReason::failure:       return "failure";
    case RotationReason::manual:        return "manual";
    case RotationReason::startup:       return "startup";
    case RotationReason::ruleTriggered: return "rule_triggered";
    case RotationReason::ttlExpired:    return "ttl_expired";
    case RotationReason::cooldown:      return "cooldown";
    }
    return "scheduled";
}

std::optional<RotationReason> parseRotationReason(std::string_view text) {
    if (text == "scheduled") return RotationReason::scheduled;
    if (text == "failure") return RotationReason::failure;
    if (text == "manual") return RotationReason::manual;
    if (text == "startup") return RotationReason::startup;
    if (text == "rule_triggered") return RotationReason::ruleTriggered;
    if (text == "ttl_expired") return RotationReason::ttlExpired;
    if (text == "cooldown") return RotationReason::cooldown;
    return std::nullopt;
}

} // namespace proxyrot::model
