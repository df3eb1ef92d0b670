#include "pg_pool.hpp"

namespace jobq::db::postgres {

PgPool::PgPool(std::string conninfo, std::size_t max_connections)
    : conninfo_(std::move(conninfo)),
      max_connections_(max_connections == 0 ? 1 : max_connections) {
}

std::shared_ptr<pqxx::connection> PgPool::Acquire() {
  std::unique_lock lock(mutex_);

  cv_.wait(lock, [this] {
    return !idle_.empty() || live_connections_ < max_connections_;
  });

  if (!idle_.empty()) {
    auto conn = std::move(idle_.back());
    idle_.pop_back();
    return Wrap(conn.release());
  }

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

void PgPool::PrepareStatements(pqxx::connection& conn) {
  conn.prepare("get_job",
               "SELECT id,command,state,attempts,max_retries,timeout,backoff_base,priority,waiting_time,"
               "created_at,updated_at,next_retry_at,error_message,output,execution_time,locked_by,locked_at "
               "FROM jobs WHERE id=$1");

  conn.prepare("insert_job",
               "INSERT INTO jobs(id,command,state,attempts,max_retries,timeout,backoff_base,priority,waiting_time,"
               "created_at,updated_at,next_retry_at,error_message,output,execution_time,locked_by,locked_at) "
               "VALUES($1,$2,$3,$4,$5,$6,$7,$8,$9,$10,$11,$12,$13,$14,$15,$16,$17) "
               "ON CONFLICT(id) DO NOTHING");

  conn.prepare("update_job",
               "UPDATE jobs SET command=$2,state=$3,attempts=$4,max_retries=$5,timeout=$6,backoff_base=$7,priority=$8,"
               "waiting_time=$9,created_at=$10,updated_at=$11,next_retry_at=$12,error_message=$13,output=$14,"
               "execution_time=$15,locked_by=$16,locked_at=$17 WHERE id=$1");

  conn.prepare("delete_job", "DELETE FROM jobs WHERE id=$1");

  conn.prepare("mark_claimed",
               "UPDATE jobs SET state='processing',locked_by=$2,locked_at=$3,updated_at=$3,next_retry_at=NULL "
               "WHERE id=$1 AND locked_by IS NULL AND state IN ('pending','failed')");
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

} // namespace jobq::db::postgres
