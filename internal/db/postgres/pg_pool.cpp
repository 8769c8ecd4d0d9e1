#include "pg_pool.hpp"

namespace rentledger::db::postgres {

PgPool::PgPool(std::string conninfo, std::size_t max_connections)
    : conninfo_(std::move(conninfo)),
      max_connections_(max_connections == 0 ? 1 : max_connections) {
}

std::shared_ptr<pqxx::connection> PgPool::Acquire() {
  std::unique_lock lock(mutex_);
  for (;;) {
    if (!idle_.empty()) {
      auto conn = std::move(idle_.back());
      idle_.pop_back();
      return Wrap(conn.release());
    }

    if (live_connections_ < max_connections_) {
      ++live_connections_;
      lock.unlock();

      try {
        auto conn = std::make_unique<pqxx::connection>(conninfo_);
        PrepareStatements(*conn);
        return Wrap(conn.release());
      } catch (const std::exception&) {
        std::lock_guard rollback_lock(mutex_);
        --live_connections_;
        cv_.notify_one();
        throw;
      }
    }

    cv_.wait(lock, [this] {
      return !idle_.empty() || live_connections_ < max_connections_;
    });
  }
}

void PgPool::PrepareStatements(pqxx::connection& conn) {
  conn.prepare("has_entry", "SELECT 1 FROM ledger_entries WHERE durability=$1 AND slot=$2");

  conn.prepare("get_entry", "SELECT value FROM ledger_entries WHERE durability=$1 AND slot=$2");

  conn.prepare("put_entry",
               "INSERT INTO ledger_entries(durability,slot,value,live_until) VALUES($1,$2,$3,0) "
               "ON CONFLICT (durability,slot) DO UPDATE SET value=EXCLUDED.value");

  conn.prepare("set_live_until", "UPDATE ledger_entries SET live_until=$3 WHERE durability=$1 AND slot=$2");

  conn.prepare("get_live_until", "SELECT live_until FROM ledger_entries WHERE durability=$1 AND slot=$2");
}

std::shared_ptr<pqxx::connection> PgPool::Wrap(pqxx::connection* conn) {
  std::weak_ptr<PgPool> weak_self = shared_from_this();
  return std::shared_ptr<pqxx::connection>(conn, [weak_self](pqxx::connection* released_conn) {
    if (auto self = weak_self.lock()) {
      self->Release(released_conn);
      return;
    }
    delete released_conn;
  });
}

void PgPool::Release(pqxx::connection* conn) {
  {
    std::lock_guard lock(mutex_);
    idle_.emplace_back(conn);
  }
  cv_.notify_one();
}

} // namespace rentledger::db::postgres
