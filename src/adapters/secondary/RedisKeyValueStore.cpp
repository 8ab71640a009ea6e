#include "adapters/secondary/RedisKeyValueStore.hpp"
#include "domain/exceptions/StoreUnavailableException.hpp"

#include <Poco/Redis/Array.h>
#include <Poco/Redis/Command.h>
#include <Poco/Redis/Exception.h>
#include <Poco/Redis/Type.h>
#include <Poco/Net/SocketAddress.h>
#include <Poco/Net/StreamSocket.h>
#include <Poco/Exception.h>
#include <Poco/Timespan.h>

#include <iostream>
#include <optional>

namespace gateway::adapters::secondary {

namespace {

Poco::Timespan toTimespan(std::chrono::milliseconds ms)
{
    return Poco::Timespan(static_cast<Poco::Timespan::TimeDiff>(ms.count()) * 1000);
}

} // namespace

// ============================================
// Соединения
// ============================================

RedisKeyValueStore::RedisKeyValueStore(std::shared_ptr<settings::StoreSettings> settings)
    : settings_(std::move(settings))
    , pool_(settings_->getPoolSize(), settings_->getPoolWait(),
            [this] { return connect(); },
            [](Poco::Redis::Client& client) {
                try {
                    client.disconnect();
                } catch (const Poco::Exception& e) {
                    std::cerr << "[RedisKeyValueStore] disconnect failed: " << e.displayText() << std::endl;
                }
            })
{
    std::cout << "[RedisKeyValueStore] Created: " << settings_->getHost() << ":" << settings_->getPort()
              << " db=" << settings_->getDatabase()
              << " pool=" << settings_->getPoolSize()
              << " commandTimeout=" << settings_->getCommandTimeout().count() << "ms" << std::endl;
}

RedisKeyValueStore::~RedisKeyValueStore()
{
    std::cout << "[RedisKeyValueStore] Closed" << std::endl;
}

std::unique_ptr<Poco::Redis::Client> RedisKeyValueStore::connect()
{
    const Poco::Timespan commandTimeout = toTimespan(settings_->getCommandTimeout());

    Poco::Net::StreamSocket socket;
    socket.connect(Poco::Net::SocketAddress(settings_->getHost(), static_cast<Poco::UInt16>(settings_->getPort())),
                   toTimespan(settings_->getConnectTimeout()));
    socket.setSendTimeout(commandTimeout);
    socket.setReceiveTimeout(commandTimeout);

    auto client = std::make_unique<Poco::Redis::Client>();
    client->connect(socket);

    if (!settings_->getPassword().empty()) {
        Poco::Redis::Command auth("AUTH");
        auth.add(settings_->getPassword());
        client->execute<std::string>(auth);
    }
    if (settings_->getDatabase() != 0) {
        Poco::Redis::Command select("SELECT");
        select.add(std::to_string(settings_->getDatabase()));
        client->execute<std::string>(select);
    }
    return client;
}

template <typename Fn>
auto RedisKeyValueStore::withClient(const char* operation, Fn&& fn)
    -> decltype(fn(std::declval<Poco::Redis::Client&>()))
{
    std::optional<Pool::Lease> lease;
    try {
        lease.emplace(pool_.acquire());
    } catch (const Poco::Exception& e) {
        std::cerr << "[RedisKeyValueStore] connect failed: " << e.displayText() << std::endl;
        throw domain::StoreUnavailableException("connect failed: " + e.displayText());
    }

    try {
        return fn(**lease);
    } catch (const Poco::TimeoutException& e) {
        lease->markBroken();
        std::cerr << "[RedisKeyValueStore] " << operation << " timed out: " << e.displayText() << std::endl;
        throw domain::StoreUnavailableException(std::string(operation) + " timed out");
    } catch (const Poco::Exception& e) {
        lease->markBroken();
        std::cerr << "[RedisKeyValueStore] " << operation << " failed: " << e.displayText() << std::endl;
        throw domain::StoreUnavailableException(std::string(operation) + ": " + e.displayText());
    }
}

// ============================================
// Операции
// ============================================

bool RedisKeyValueStore::setValue(const std::string& key, const std::string& value,
                                  std::chrono::seconds ttl, bool onlyIfAbsent)
{
    return withClient("SET", [&](Poco::Redis::Client& client) {
        Poco::Redis::Command set("SET");
        set.add(key);
        set.add(value);
        set.add("EX");
        set.add(std::to_string(ttl.count()));
        if (onlyIfAbsent) {
            set.add("NX");
        }

        // OK -> simple string, NX и ключ существует -> null bulk string
        Poco::Redis::RedisType::Ptr reply = client.sendCommand(set);
        if (reply.isNull()) {
            throw Poco::Redis::RedisException("empty reply to SET");
        }
        if (reply->isError()) {
            throw Poco::Redis::RedisException("SET rejected: " + reply->toString());
        }
        if (reply->isBulkString()) {
            auto* bulk = dynamic_cast<Poco::Redis::Type<Poco::Redis::BulkString>*>(reply.get());
            return bulk != nullptr && !bulk->value().isNull();
        }
        return true;
    });
}

std::optional<std::string> RedisKeyValueStore::getValue(const std::string& key)
{
    return withClient("GET", [&](Poco::Redis::Client& client) -> std::optional<std::string> {
        Poco::Redis::Command get = Poco::Redis::Command::get(key);
        auto reply = client.execute<Poco::Redis::BulkString>(get);
        if (reply.isNull()) {
            return std::nullopt;
        }
        return reply.value();
    });
}

bool RedisKeyValueStore::remove(const std::string& key)
{
    return withClient("DEL", [&](Poco::Redis::Client& client) {
        Poco::Redis::Command del = Poco::Redis::Command::del(key);
        return client.execute<Poco::Int64>(del) > 0;
    });
}

void RedisKeyValueStore::addToSet(const std::string& key, const std::string& member,
                                  std::chrono::seconds ttl)
{
    withClient("SADD", [&](Poco::Redis::Client& client) {
        Poco::Redis::Command sadd = Poco::Redis::Command::sadd(key, member);
        client.execute<Poco::Int64>(sadd);

        Poco::Redis::Command expire("EXPIRE");
        expire.add(key);
        expire.add(std::to_string(ttl.count()));
        client.execute<Poco::Int64>(expire);
    });
}

void RedisKeyValueStore::removeFromSet(const std::string& key, const std::string& member)
{
    withClient("SREM", [&](Poco::Redis::Client& client) {
        Poco::Redis::Command srem = Poco::Redis::Command::srem(key, member);
        client.execute<Poco::Int64>(srem);
    });
}

std::vector<std::string> RedisKeyValueStore::setMembers(const std::string& key)
{
    return withClient("SMEMBERS", [&](Poco::Redis::Client& client) {
        Poco::Redis::Command smembers = Poco::Redis::Command::smembers(key);
        auto reply = client.execute<Poco::Redis::Array>(smembers);

        std::vector<std::string> members;
        members.reserve(reply.size());
        for (size_t i = 0; i < reply.size(); ++i) {
            auto member = reply.get<Poco::Redis::BulkString>(i);
            if (!member.isNull()) {
                members.push_back(member.value());
            }
        }
        return members;
    });
}

bool RedisKeyValueStore::ping()
{
    try {
        return withClient("PING", [&](Poco::Redis::Client& client) {
            Poco::Redis::Command ping("PING");
            return client.execute<std::string>(ping) == "PONG";
        });
    } catch (const domain::StoreUnavailableException& e) {
        std::cerr << "[RedisKeyValueStore] " << e.what() << std::endl;
        return false;
    }
}

} // namespace gateway::adapters::secondary
