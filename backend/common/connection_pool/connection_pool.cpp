#include "connection_pool.hpp"

#include <chrono>

namespace common {

ConnectionPool::~ConnectionPool() {
  shutdown();
}

void ConnectionPool::shutdown() {
  shutdown_.store(true);
  condition_.notify_all();

  std::lock_guard<std::mutex> lock(mutex_);
  while (!pool_.empty()) {
    pool_.pop();
  }
}

void ConnectionPool::prefill() {
  for (size_t i = 0; i < cp_config_.min_connections; ++i) {
    auto conn = createConnection();
    if (!conn) {
      break;
    }
    std::lock_guard<std::mutex> lock(mutex_);
    pool_.push(std::move(conn));
  }
}

std::expected<std::unique_ptr<Connection>, std::string> ConnectionPool::acquire() {
  std::unique_lock<std::mutex> lock(mutex_);

  auto deadline = std::chrono::steady_clock::now() + cp_config_.timeout;

  while (pool_.empty() && active_connections_.load() >= cp_config_.max_connections && !shutdown_.load()) {
    if (condition_.wait_until(lock, deadline) == std::cv_status::timeout) {
      return std::unexpected<std::string>("connection pool timeout");
    }
  }

  if (shutdown_.load()) {
    return std::unexpected<std::string>("connection pool is shutting down");
  }

  std::unique_ptr<Connection> conn;

  while (!pool_.empty()) {
    conn = std::move(pool_.front());
    pool_.pop();
    if (conn->isValid()) {
      break;
    }
    conn.reset();
  }

  // nothing idle and still under the cap: open a fresh one outside the lock
  if (!conn) {
    active_connections_.fetch_add(1);
    lock.unlock();
    conn = createConnection();
    if (!conn) {
      active_connections_.fetch_sub(1);
      condition_.notify_one();
      return std::unexpected<std::string>("failed to create database connection");
    }
    return conn;
  }

  active_connections_.fetch_add(1);
  return conn;
}

void ConnectionPool::release(std::unique_ptr<Connection> conn) {
  if (!conn) return;
  std::lock_guard<std::mutex> lock(mutex_);

  active_connections_.fetch_sub(1);

  if (shutdown_.load() || !conn->isValid() || pool_.size() >= cp_config_.min_connections) {
    conn.reset();
  } else {
    pool_.push(std::move(conn));
  }
  condition_.notify_one();
}

size_t ConnectionPool::idleConnections() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return pool_.size();
}

} // namespace common
