#pragma once

#include <string>

namespace gateway::domain {

enum class RoutingAction {
    Forward,          ///< Передать запрос в защищённый backend
    RedirectToAuth,   ///< Редирект на вход, cookie не трогаем
    ClearAndRedirect  ///< Сессия удалена, cookie сбрасывается, редирект на вход
};

inline std::string toString(RoutingAction action) {
    switch (action) {
        case RoutingAction::Forward:          return "forward";
        case RoutingAction::RedirectToAuth:   return "redirect";
        case RoutingAction::ClearAndRedirect: return "clear_and_redirect";
    }
    return "redirect";
}

} // namespace gateway::domain
