#pragma once

#include "common/config/config.hpp"
#include "common/connection_pool/connection_pool.hpp"
#include <mysql/mysql.h>
#include <memory>

namespace common {

// RAII: owns one MYSQL handle, closed on destruction
class MySQLConnection : public Connection {
public:
  explicit MySQLConnection(MYSQL* conn): conn_(conn) {}
  ~MySQLConnection() override { if (conn_) mysql_close(conn_); }

  MYSQL* get() const { return conn_; }
  bool isValid() const override;

  MySQLConnection(MySQLConnection&& other) noexcept : conn_(other.conn_) { other.conn_ = nullptr; }
  MySQLConnection& operator=(MySQLConnection&& other) noexcept;

private:
  MYSQL* conn_ = nullptr;
};


class MySQLConnectionPool final : public ConnectionPool {
public:
  MySQLConnectionPool(const config::DatabaseConfig& db_config,
                      const config::ConnectionPoolConfig& cp_config);

protected:
  std::unique_ptr<Connection> createConnection() override;

private:
  config::DatabaseConfig db_config_;
};

class MySQLConnectionGuard final : public ConnectionGuard {
  using ConnectionGuard::ConnectionGuard;
public:
  MYSQL* get() const {
    return static_cast<MySQLConnection*>(conn_.get())->get();
  }
};

} // namespace common
