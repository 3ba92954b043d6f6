#pragma once
#include <httplib.h>
#include <memory>
#include <mutex>
#include <optional>
#include <shared_mutex>
#include <string>
#include <unordered_map>

struct Endpoint {
    std::string node_id;
    std::string host;
    int port = 0;
};

// Live outbound connections of one node, keyed by peer node id.
// Each connection serializes its own calls so a peer never sees two in-flight
// requests from us at once.
class ConnectionRegistry {
private:
    struct Connection {
        Endpoint endpoint;
        std::unique_ptr<httplib::Client> client;
        std::mutex call_mutex;

        Connection(const Endpoint& ep, int connect_timeout_seconds, int read_timeout_seconds)
            : endpoint(ep) {
            client = std::make_unique<httplib::Client>(endpoint.host, endpoint.port);
            client->set_keep_alive(true);
            client->set_connection_timeout(connect_timeout_seconds, 0);
            client->set_read_timeout(read_timeout_seconds, 0);
            client->set_write_timeout(read_timeout_seconds, 0);
        }
    };

    std::unordered_map<std::string, std::shared_ptr<Connection>> connections_;
    std::shared_mutex connections_mutex_;

    int connect_timeout_seconds_ = 2;
    int read_timeout_seconds_ = 30;

public:
    void setTimeouts(int connect_timeout_seconds, int read_timeout_seconds) {
        connect_timeout_seconds_ = connect_timeout_seconds;
        read_timeout_seconds_ = read_timeout_seconds;
    }

    // Replaces any previous connection registered under the same node id
    void insert(const Endpoint& endpoint) {
        auto conn = std::make_shared<Connection>(endpoint, connect_timeout_seconds_,
                                                 read_timeout_seconds_);
        std::shared_ptr<Connection> previous;
        {
            std::unique_lock<std::shared_mutex> lock(connections_mutex_);
            auto it = connections_.find(endpoint.node_id);
            if (it != connections_.end()) {
                previous = it->second;
            }
            connections_[endpoint.node_id] = conn;
        }
        if (previous) {
            previous->client->stop();
        }
    }

    bool remove(const std::string& node_id) {
        std::shared_ptr<Connection> conn;
        {
            std::unique_lock<std::shared_mutex> lock(connections_mutex_);
            auto it = connections_.find(node_id);
            if (it == connections_.end()) {
                return false;
            }
            conn = it->second;
            connections_.erase(it);
        }
        conn->client->stop();
        return true;
    }

    std::optional<Endpoint> lookup(const std::string& node_id) {
        std::shared_lock<std::shared_mutex> lock(connections_mutex_);
        auto it = connections_.find(node_id);
        if (it == connections_.end()) {
            return std::nullopt;
        }
        return it->second->endpoint;
    }

    // Runs func(httplib::Client*) while holding the connection's call lock.
    // Returns false when no connection is registered under node_id.
    template<typename Func>
    bool withConnection(const std::string& node_id, Func&& func) {
        std::shared_ptr<Connection> conn;
        {
            std::shared_lock<std::shared_mutex> lock(connections_mutex_);
            auto it = connections_.find(node_id);
            if (it == connections_.end()) {
                return false;
            }
            conn = it->second;
        }

        std::lock_guard<std::mutex> call_lock(conn->call_mutex);
        func(conn->client.get());
        return true;
    }

    void closeAll() {
        std::unordered_map<std::string, std::shared_ptr<Connection>> closing;
        {
            std::unique_lock<std::shared_mutex> lock(connections_mutex_);
            closing.swap(connections_);
        }
        for (auto& [id, conn] : closing) {
            conn->client->stop();
        }
    }
};
