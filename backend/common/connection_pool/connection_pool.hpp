#pragma once

#include <memory>
#include <mutex>
#include <condition_variable>
#include <atomic>
#include <queue>
#include <string>
#include <expected>

#include "common/config/config.hpp"

namespace common {

// RAII: a live connection, closed when destroyed
class Connection {
public:
  virtual ~Connection() = default;
  virtual bool isValid() const = 0;

  Connection(const Connection&) = delete;
  Connection& operator=(const Connection&) = delete;

  Connection() = default;
  Connection(Connection&&) = default;
  Connection& operator=(Connection&&) = default;
};


/*
  idle = connections parked in pool_ (kept <= min_connections on return)
  active = connections lent out
  idle + active <= max_connections
*/
class ConnectionPool {
public:
  virtual ~ConnectionPool();

  std::expected<std::unique_ptr<Connection>, std::string> acquire();

  void release(std::unique_ptr<Connection> conn);

  size_t activeConnections() const { return active_connections_; }
  size_t idleConnections() const;

  void shutdown();

  ConnectionPool(const ConnectionPool&) = delete;
  ConnectionPool& operator=(const ConnectionPool&) = delete;

protected:
  explicit ConnectionPool(const config::ConnectionPoolConfig& cfg): cp_config_(cfg) {}
  virtual std::unique_ptr<Connection> createConnection() = 0;

  void prefill();

  config::ConnectionPoolConfig cp_config_;
  std::queue<std::unique_ptr<Connection>> pool_;
  mutable std::mutex mutex_;
  std::condition_variable condition_;
  std::atomic<size_t> active_connections_{0};
  std::atomic<bool> shutdown_{false};
};

// RAII: borrows a connection for the guard's scope and hands it back after
class ConnectionGuard {
public:
  explicit ConnectionGuard(ConnectionPool& pool) : pool_(pool) {
    if (auto conn = pool_.acquire(); conn.has_value()) {
      conn_ = std::move(*conn);
    } else {
      error_ = conn.error();
    }
  }
  ~ConnectionGuard() { if (conn_) pool_.release(std::move(conn_)); }

  Connection* operator->() const { return conn_.get(); }
  Connection& operator*() const { return *conn_; }

  bool valid() const { return conn_ != nullptr; }
  const std::string& error() const { return error_; }

  ConnectionGuard(const ConnectionGuard&) = delete;
  ConnectionGuard& operator=(const ConnectionGuard&) = delete;

protected:
  ConnectionPool& pool_;
  std::unique_ptr<Connection> conn_;
  std::string error_;
};

} // namespace common
