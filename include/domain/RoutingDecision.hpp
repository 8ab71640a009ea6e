#pragma once

#include "domain/enums/RoutingAction.hpp"
#include <string>

namespace gateway::domain {

struct RoutingDecision {
    RoutingAction action = RoutingAction::RedirectToAuth;
    std::string userId;       ///< Только для Forward
    std::string sessionId;    ///< Для ClearAndRedirect - какую сессию удалить
    std::string redirectUrl;  ///< Для редиректов
};

} // namespace gateway::domain
