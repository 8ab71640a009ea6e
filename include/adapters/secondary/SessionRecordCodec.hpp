#pragma once

#include "domain/Session.hpp"
#include "domain/exceptions/MalformedSessionRecordException.hpp"
#include <nlohmann/json.hpp>
#include <string>
#include <chrono>
#include <cstdint>

namespace gateway::adapters::secondary {

/**
 * @brief JSON представление записи сессии в key-value хранилище
 *
 * {
 *   "session_id": "...", "user_id": "42", "fingerprint": "<64 hex>",
 *   "created_at": <epoch ms>, "expires_at": <epoch ms>,
 *   "device_info": {"ip", "user_agent", "accept_language", "forwarded_for"}
 * }
 */
class SessionRecordCodec {
public:
    static std::string encode(const domain::Session& session) {
        nlohmann::json j;
        j["session_id"] = session.sessionId;
        j["user_id"] = session.userId;
        j["fingerprint"] = session.fingerprint;
        j["created_at"] = toEpochMillis(session.createdAt);
        j["expires_at"] = toEpochMillis(session.expiresAt);
        j["device_info"] = {
            {"ip", session.deviceInfo.ip},
            {"user_agent", session.deviceInfo.userAgent},
            {"accept_language", session.deviceInfo.acceptLanguage},
            {"forwarded_for", session.deviceInfo.forwardedFor}
        };
        return j.dump();
    }

    /**
     * @throws domain::MalformedSessionRecordException если JSON битый
     *         или нет обязательных полей
     */
    static domain::Session decode(const std::string& raw) {
        nlohmann::json j;
        try {
            j = nlohmann::json::parse(raw);
        } catch (const nlohmann::json::parse_error& e) {
            throw domain::MalformedSessionRecordException(e.what());
        }

        try {
            domain::Session session;
            session.sessionId = j.at("session_id").get<std::string>();
            session.userId = j.at("user_id").get<std::string>();
            session.fingerprint = j.at("fingerprint").get<std::string>();
            session.createdAt = fromEpochMillis(j.at("created_at").get<int64_t>());
            session.expiresAt = fromEpochMillis(j.at("expires_at").get<int64_t>());

            if (j.contains("device_info")) {
                const auto& d = j["device_info"];
                session.deviceInfo.ip = d.value("ip", "");
                session.deviceInfo.userAgent = d.value("user_agent", "");
                session.deviceInfo.acceptLanguage = d.value("accept_language", "");
                session.deviceInfo.forwardedFor = d.value("forwarded_for", "");
            }

            if (session.userId.empty() || session.fingerprint.empty()) {
                throw domain::MalformedSessionRecordException("empty user_id or fingerprint");
            }
            return session;
        } catch (const nlohmann::json::exception& e) {
            throw domain::MalformedSessionRecordException(e.what());
        }
    }

    static int64_t toEpochMillis(std::chrono::system_clock::time_point tp) {
        return std::chrono::duration_cast<std::chrono::milliseconds>(tp.time_since_epoch()).count();
    }

    static std::chrono::system_clock::time_point fromEpochMillis(int64_t ms) {
        return std::chrono::system_clock::time_point(
            std::chrono::duration_cast<std::chrono::system_clock::duration>(std::chrono::milliseconds(ms)));
    }
};

} // namespace gateway::adapters::secondary
