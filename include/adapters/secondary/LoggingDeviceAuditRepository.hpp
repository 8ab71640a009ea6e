#pragma once

#include "ports/output/IDeviceAuditRepository.hpp"
#include "domain/SessionToken.hpp"
#include <iostream>

namespace gateway::adapters::secondary {

/**
 * @brief Журнал устройств в stdout (AUDIT_ENABLED=false)
 */
class LoggingDeviceAuditRepository : public ports::output::IDeviceAuditRepository {
public:
    void recordSessionStart(const domain::Session& session) override {
        std::cout << "[DeviceAudit] start session=" << domain::maskSessionId(session.sessionId)
                  << " user=" << session.userId
                  << " ip=" << session.deviceInfo.ip
                  << " ua=\"" << session.deviceInfo.userAgent << "\""
                  << " lang=\"" << session.deviceInfo.acceptLanguage << "\"" << std::endl;
    }

    void recordSessionEnd(const std::string& sessionId, const std::string& reason) override {
        std::cout << "[DeviceAudit] end session=" << domain::maskSessionId(sessionId)
                  << " reason=" << reason << std::endl;
    }
};

} // namespace gateway::adapters::secondary
