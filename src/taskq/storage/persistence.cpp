#include "taskq/storage/persistence.hpp"

#include "taskq/storage/state_strings.hpp"
#include "taskq/util/log.hpp"

#include <sqlite3.h>

#include <algorithm>
#include <format>
#include <utility>

namespace taskq {

namespace {

auto col_text(sqlite3_stmt* stmt, int col) -> std::string {
  auto* p = reinterpret_cast<const char*>(sqlite3_column_text(stmt, col));
  return p ? p : "";
}

auto col_is_null(sqlite3_stmt* stmt, int col) -> bool {
  return sqlite3_column_type(stmt, col) == SQLITE_NULL;
}

auto bind_text(sqlite3_stmt* stmt, int idx, std::string_view text) -> void {
  sqlite3_bind_text(stmt, idx, text.data(), static_cast<int>(text.size()),
                    SQLITE_TRANSIENT);
}

auto bind_time(sqlite3_stmt* stmt, int idx, TimePoint tp) -> void {
  sqlite3_bind_int64(stmt, idx, to_millis(tp));
}

auto col_time(sqlite3_stmt* stmt, int col) -> TimePoint {
  return from_millis(sqlite3_column_int64(stmt, col));
}

// Rows written by other tools may carry text that is not JSON; keep it as a
// string instead of dropping it.
auto col_json(sqlite3_stmt* stmt, int col) -> nlohmann::json {
  auto text = col_text(stmt, col);
  auto parsed = nlohmann::json::parse(text, nullptr, false);
  if (parsed.is_discarded()) {
    log::warn("Non-JSON payload in column {}, keeping as string", col);
    return nlohmann::json(std::move(text));
  }
  return parsed;
}

auto placeholders(std::size_t n) -> std::string {
  std::string out;
  for (std::size_t i = 0; i < n; ++i) {
    out += i == 0 ? "?" : ", ?";
  }
  return out;
}

constexpr auto kTaskColumns =
    "id, task_type_id, input_data, status, created_at, assigned_to";

constexpr auto kWorkerColumns =
    "id, name, registered_at, state, last_heartbeat_at";

constexpr auto kResultColumns =
    "id, task_id, output_data, error_data, completed_at, worker_id, "
    "created_at";

constexpr auto kInFlight = "('queued', 'running')";

auto read_task_type(sqlite3_stmt* stmt) -> TaskType {
  return TaskType{
      .id = TaskTypeId{col_text(stmt, 0)},
      .name = col_text(stmt, 1),
      .created_at = col_time(stmt, 2),
  };
}

auto read_worker_row(sqlite3_stmt* stmt) -> Worker {
  return Worker{
      .id = WorkerId{col_text(stmt, 0)},
      .name = col_text(stmt, 1),
      .registered_at = col_time(stmt, 2),
      .state = parse_worker_state(col_text(stmt, 3)),
      .last_heartbeat_at = col_time(stmt, 4),
      .capabilities = {},
  };
}

auto read_result_row(sqlite3_stmt* stmt) -> TaskResult {
  TaskResult r;
  r.id = ResultId{col_text(stmt, 0)};
  r.task_id = TaskId{col_text(stmt, 1)};
  if (!col_is_null(stmt, 2)) {
    r.output_data = col_json(stmt, 2);
  }
  if (!col_is_null(stmt, 3)) {
    r.error_data = col_json(stmt, 3);
  }
  r.completed_at = col_time(stmt, 4);
  r.worker_id = WorkerId{col_text(stmt, 5)};
  r.created_at = col_time(stmt, 6);
  return r;
}

}  // namespace

auto Persistence::DbDeleter::operator()(sqlite3* db) const -> void {
  if (db)
    sqlite3_close(db);
}

Persistence::Statement::~Statement() {
  reset();
}

auto Persistence::Statement::reset() -> void {
  if (stmt_) {
    sqlite3_finalize(stmt_);
    stmt_ = nullptr;
  }
}

Persistence::Transaction::~Transaction() {
  if (active_) {
    db_.rollback_transaction();
  }
}

auto Persistence::Transaction::begin() -> Result<void> {
  if (auto r = db_.begin_transaction(); !r) {
    return r;
  }
  active_ = true;
  return ok();
}

auto Persistence::Transaction::commit() -> Result<void> {
  if (auto r = db_.commit_transaction(); !r) {
    return r;
  }
  active_ = false;
  return ok();
}

auto Persistence::prepare(const char* sql) -> Result<sqlite3_stmt*> {
  if (!db_) {
    return fail(Error::DatabaseError);
  }
  sqlite3_stmt* stmt = nullptr;
  if (sqlite3_prepare_v2(db_.get(), sql, -1, &stmt, nullptr) != SQLITE_OK) {
    log::error("Failed to prepare statement: {}", sqlite3_errmsg(db_.get()));
    return fail(Error::DatabaseQueryFailed);
  }
  return stmt;
}

auto Persistence::step_error(int rc) const -> std::error_code {
  if (rc == SQLITE_BUSY || rc == SQLITE_LOCKED) {
    log::warn("Database busy: {}", sqlite3_errmsg(db_.get()));
    return make_error_code(Error::DatabaseBusy);
  }
  log::error("SQL step failed: {}", sqlite3_errmsg(db_.get()));
  return make_error_code(Error::DatabaseQueryFailed);
}

Persistence::Persistence(std::string_view db_path,
                         std::chrono::milliseconds busy_timeout)
    : db_path_(db_path), busy_timeout_(busy_timeout) {
}

Persistence::~Persistence() {
  close();
}

auto Persistence::open() -> Result<void> {
  std::lock_guard lock(mu_);
  if (db_) {
    return ok();
  }

  sqlite3* raw_db = nullptr;
  int rc = sqlite3_open(db_path_.c_str(), &raw_db);
  if (rc != SQLITE_OK) {
    log::error("Failed to open database: {}", sqlite3_errmsg(raw_db));
    if (raw_db) {
      sqlite3_close(raw_db);
    }
    return fail(Error::DatabaseOpenFailed);
  }
  db_.reset(raw_db);
  sqlite3_busy_timeout(db_.get(), static_cast<int>(busy_timeout_.count()));

  // In-memory databases refuse WAL; that is not fatal
  if (auto r = execute("PRAGMA journal_mode=WAL;"); !r) {
    log::warn("Failed to set WAL mode: {}", r.error().message());
  }
  if (auto r = execute("PRAGMA synchronous=NORMAL;"); !r) {
    log::warn("Failed to set synchronous mode: {}", r.error().message());
  }
  if (auto r = execute("PRAGMA foreign_keys=ON;"); !r) {
    log::warn("Failed to enable foreign keys: {}", r.error().message());
  }

  if (auto r = create_tables(); !r) {
    db_.reset();
    return r;
  }

  log::info("Database opened: {}", db_path_);
  return ok();
}

auto Persistence::close() -> void {
  std::lock_guard lock(mu_);
  db_.reset();
}

auto Persistence::is_open() const noexcept -> bool {
  std::lock_guard lock(mu_);
  return db_ != nullptr;
}

auto Persistence::create_tables() -> Result<void> {
  const char* sql = R"(
    CREATE TABLE IF NOT EXISTS task_types (
      id TEXT PRIMARY KEY,
      name TEXT NOT NULL UNIQUE,
      created_at INTEGER NOT NULL
    );

    CREATE TABLE IF NOT EXISTS workers (
      id TEXT PRIMARY KEY,
      name TEXT NOT NULL,
      registered_at INTEGER NOT NULL,
      state TEXT NOT NULL DEFAULT 'alive'
        CHECK (state IN ('alive', 'suspected', 'dead')),
      last_heartbeat_at INTEGER NOT NULL
    );

    CREATE TABLE IF NOT EXISTS worker_task_types (
      worker_id TEXT NOT NULL,
      task_type_id TEXT NOT NULL,
      created_at INTEGER NOT NULL,
      PRIMARY KEY (worker_id, task_type_id),
      FOREIGN KEY (worker_id) REFERENCES workers(id) ON DELETE CASCADE,
      FOREIGN KEY (task_type_id) REFERENCES task_types(id)
    );

    CREATE TABLE IF NOT EXISTS worker_heartbeats (
      id TEXT PRIMARY KEY,
      worker_id TEXT NOT NULL,
      heartbeat_time INTEGER NOT NULL,
      created_at INTEGER NOT NULL,
      FOREIGN KEY (worker_id) REFERENCES workers(id) ON DELETE CASCADE
    );

    CREATE TABLE IF NOT EXISTS tasks (
      id TEXT PRIMARY KEY,
      task_type_id TEXT NOT NULL,
      input_data TEXT NOT NULL DEFAULT 'null',
      status TEXT NOT NULL DEFAULT 'pending'
        CHECK (status IN ('pending', 'queued', 'running', 'completed',
                          'failed', 'cancelled')),
      created_at INTEGER NOT NULL,
      assigned_to TEXT,
      CHECK ((status IN ('queued', 'running')) = (assigned_to IS NOT NULL)),
      FOREIGN KEY (task_type_id) REFERENCES task_types(id),
      FOREIGN KEY (assigned_to) REFERENCES workers(id)
    );

    CREATE TABLE IF NOT EXISTS task_results (
      id TEXT PRIMARY KEY,
      task_id TEXT NOT NULL UNIQUE,
      output_data TEXT,
      error_data TEXT,
      completed_at INTEGER NOT NULL,
      worker_id TEXT NOT NULL,
      created_at INTEGER NOT NULL,
      CHECK ((output_data IS NULL) <> (error_data IS NULL)),
      FOREIGN KEY (task_id) REFERENCES tasks(id),
      FOREIGN KEY (worker_id) REFERENCES workers(id)
    );

    CREATE INDEX IF NOT EXISTS idx_tasks_status_type
      ON tasks(status, task_type_id, created_at);
    CREATE INDEX IF NOT EXISTS idx_tasks_assigned_to
      ON tasks(assigned_to);
    CREATE INDEX IF NOT EXISTS idx_heartbeats_worker_time
      ON worker_heartbeats(worker_id, heartbeat_time);
  )";

  return execute(sql);
}

auto Persistence::execute(std::string_view sql) -> Result<void> {
  if (!db_) {
    return fail(Error::DatabaseError);
  }
  char* err_msg = nullptr;
  std::string sql_str{sql};
  int rc = sqlite3_exec(db_.get(), sql_str.c_str(), nullptr, nullptr, &err_msg);
  if (rc != SQLITE_OK) {
    log::error("SQL error: {}", err_msg ? err_msg : "unknown");
    sqlite3_free(err_msg);
    if (rc == SQLITE_BUSY || rc == SQLITE_LOCKED) {
      return fail(Error::DatabaseBusy);
    }
    return fail(Error::DatabaseQueryFailed);
  }
  return ok();
}

auto Persistence::begin_transaction() -> Result<void> {
  return execute("BEGIN IMMEDIATE;");
}

auto Persistence::commit_transaction() -> Result<void> {
  return execute("COMMIT;");
}

auto Persistence::rollback_transaction() -> void {
  if (auto r = execute("ROLLBACK;"); !r) {
    log::error("Rollback failed: {}", r.error().message());
  }
}

// ---------------------------------------------------------------------------
// Task types

auto Persistence::create_task_type(std::string_view name, TimePoint now)
    -> Result<TaskType> {
  if (name.empty()) {
    return fail(Error::InvalidArgument);
  }
  std::lock_guard lock(mu_);

  {
    constexpr auto sql = R"(
      INSERT INTO task_types (id, name, created_at) VALUES (?, ?, ?)
      ON CONFLICT(name) DO NOTHING;
    )";
    auto prepared = prepare(sql);
    if (!prepared)
      return std::unexpected(prepared.error());
    Statement stmt(*prepared);

    auto id = generate_id<TaskTypeId>();
    bind_text(stmt.get(), 1, id.value());
    bind_text(stmt.get(), 2, name);
    bind_time(stmt.get(), 3, now);
    if (int rc = sqlite3_step(stmt.get()); rc != SQLITE_DONE) {
      return fail(step_error(rc));
    }
  }

  constexpr auto sql =
      "SELECT id, name, created_at FROM task_types WHERE name = ?;";
  auto prepared = prepare(sql);
  if (!prepared)
    return std::unexpected(prepared.error());
  Statement stmt(*prepared);
  bind_text(stmt.get(), 1, name);
  if (sqlite3_step(stmt.get()) != SQLITE_ROW) {
    return fail(Error::DatabaseQueryFailed);
  }
  return read_task_type(stmt.get());
}

auto Persistence::find_task_type(std::string_view name) -> Result<TaskType> {
  std::lock_guard lock(mu_);
  constexpr auto sql =
      "SELECT id, name, created_at FROM task_types WHERE name = ?;";
  auto prepared = prepare(sql);
  if (!prepared)
    return std::unexpected(prepared.error());
  Statement stmt(*prepared);
  bind_text(stmt.get(), 1, name);

  int rc = sqlite3_step(stmt.get());
  if (rc == SQLITE_DONE)
    return fail(Error::NotFound);
  if (rc != SQLITE_ROW)
    return fail(step_error(rc));
  return read_task_type(stmt.get());
}

auto Persistence::get_task_type(const TaskTypeId& id) -> Result<TaskType> {
  std::lock_guard lock(mu_);
  constexpr auto sql =
      "SELECT id, name, created_at FROM task_types WHERE id = ?;";
  auto prepared = prepare(sql);
  if (!prepared)
    return std::unexpected(prepared.error());
  Statement stmt(*prepared);
  bind_text(stmt.get(), 1, id.value());

  int rc = sqlite3_step(stmt.get());
  if (rc == SQLITE_DONE)
    return fail(Error::NotFound);
  if (rc != SQLITE_ROW)
    return fail(step_error(rc));
  return read_task_type(stmt.get());
}

auto Persistence::list_task_types() -> Result<std::vector<TaskType>> {
  std::lock_guard lock(mu_);
  constexpr auto sql =
      "SELECT id, name, created_at FROM task_types ORDER BY name;";
  auto prepared = prepare(sql);
  if (!prepared)
    return std::unexpected(prepared.error());
  Statement stmt(*prepared);

  std::vector<TaskType> types;
  while (sqlite3_step(stmt.get()) == SQLITE_ROW) {
    types.push_back(read_task_type(stmt.get()));
  }
  return types;
}

// ---------------------------------------------------------------------------
// Workers

auto Persistence::read_capabilities(const WorkerId& id)
    -> Result<std::vector<TaskTypeId>> {
  constexpr auto sql = R"(
    SELECT task_type_id FROM worker_task_types
    WHERE worker_id = ? ORDER BY created_at, task_type_id;
  )";
  auto prepared = prepare(sql);
  if (!prepared)
    return std::unexpected(prepared.error());
  Statement stmt(*prepared);
  bind_text(stmt.get(), 1, id.value());

  std::vector<TaskTypeId> caps;
  while (sqlite3_step(stmt.get()) == SQLITE_ROW) {
    caps.emplace_back(col_text(stmt.get(), 0));
  }
  return caps;
}

auto Persistence::read_worker(const WorkerId& id) -> Result<Worker> {
  auto sql = std::format("SELECT {} FROM workers WHERE id = ?;", kWorkerColumns);
  auto prepared = prepare(sql.c_str());
  if (!prepared)
    return std::unexpected(prepared.error());
  Statement stmt(*prepared);
  bind_text(stmt.get(), 1, id.value());

  int rc = sqlite3_step(stmt.get());
  if (rc == SQLITE_DONE)
    return fail(Error::NotFound);
  if (rc != SQLITE_ROW)
    return fail(step_error(rc));

  auto worker = read_worker_row(stmt.get());
  stmt.reset();
  auto caps = read_capabilities(id);
  if (!caps)
    return std::unexpected(caps.error());
  worker.capabilities = std::move(*caps);
  return worker;
}

auto Persistence::reclaim_assigned(const WorkerId& id) -> Result<std::size_t> {
  auto sql = std::format(
      "UPDATE tasks SET status = 'pending', assigned_to = NULL "
      "WHERE assigned_to = ? AND status IN {};",
      kInFlight);
  auto prepared = prepare(sql.c_str());
  if (!prepared)
    return std::unexpected(prepared.error());
  Statement stmt(*prepared);
  bind_text(stmt.get(), 1, id.value());

  if (int rc = sqlite3_step(stmt.get()); rc != SQLITE_DONE) {
    return fail(step_error(rc));
  }
  return static_cast<std::size_t>(sqlite3_changes(db_.get()));
}

auto Persistence::register_worker(const WorkerRegistration& reg)
    -> Result<std::size_t> {
  if (reg.id.empty()) {
    return fail(Error::InvalidArgument);
  }
  std::lock_guard lock(mu_);
  Transaction txn(*this);
  if (auto r = txn.begin(); !r)
    return std::unexpected(r.error());

  {
    auto prepared = prepare("SELECT 1 FROM task_types WHERE id = ?;");
    if (!prepared)
      return std::unexpected(prepared.error());
    Statement stmt(*prepared);
    for (const auto& cap : reg.capabilities) {
      sqlite3_reset(stmt.get());
      bind_text(stmt.get(), 1, cap.value());
      if (sqlite3_step(stmt.get()) != SQLITE_ROW) {
        log::warn("Worker {} declares unknown task type {}", reg.id, cap);
        return fail(Error::InvalidCapability);
      }
    }
  }

  {
    constexpr auto sql = R"(
      INSERT INTO workers (id, name, registered_at, state, last_heartbeat_at)
      VALUES (?, ?, ?, 'alive', ?)
      ON CONFLICT(id) DO UPDATE SET
        name = excluded.name,
        registered_at = excluded.registered_at,
        state = 'alive',
        last_heartbeat_at = excluded.last_heartbeat_at;
    )";
    auto prepared = prepare(sql);
    if (!prepared)
      return std::unexpected(prepared.error());
    Statement stmt(*prepared);
    bind_text(stmt.get(), 1, reg.id.value());
    bind_text(stmt.get(), 2, reg.name);
    bind_time(stmt.get(), 3, reg.now);
    bind_time(stmt.get(), 4, reg.now);
    if (int rc = sqlite3_step(stmt.get()); rc != SQLITE_DONE) {
      return fail(step_error(rc));
    }
  }

  auto reclaimed = reclaim_assigned(reg.id);
  if (!reclaimed)
    return std::unexpected(reclaimed.error());

  {
    auto prepared =
        prepare("DELETE FROM worker_task_types WHERE worker_id = ?;");
    if (!prepared)
      return std::unexpected(prepared.error());
    Statement stmt(*prepared);
    bind_text(stmt.get(), 1, reg.id.value());
    if (int rc = sqlite3_step(stmt.get()); rc != SQLITE_DONE) {
      return fail(step_error(rc));
    }
  }

  {
    constexpr auto sql = R"(
      INSERT OR IGNORE INTO worker_task_types (worker_id, task_type_id, created_at)
      VALUES (?, ?, ?);
    )";
    auto prepared = prepare(sql);
    if (!prepared)
      return std::unexpected(prepared.error());
    Statement stmt(*prepared);
    for (const auto& cap : reg.capabilities) {
      sqlite3_reset(stmt.get());
      bind_text(stmt.get(), 1, reg.id.value());
      bind_text(stmt.get(), 2, cap.value());
      bind_time(stmt.get(), 3, reg.now);
      if (int rc = sqlite3_step(stmt.get()); rc != SQLITE_DONE) {
        return fail(step_error(rc));
      }
    }
  }

  {
    constexpr auto sql = R"(
      INSERT INTO worker_heartbeats (id, worker_id, heartbeat_time, created_at)
      VALUES (?, ?, ?, ?);
    )";
    auto prepared = prepare(sql);
    if (!prepared)
      return std::unexpected(prepared.error());
    Statement stmt(*prepared);
    auto hb_id = generate_id<HeartbeatId>();
    bind_text(stmt.get(), 1, hb_id.value());
    bind_text(stmt.get(), 2, reg.id.value());
    bind_time(stmt.get(), 3, reg.now);
    bind_time(stmt.get(), 4, reg.now);
    if (int rc = sqlite3_step(stmt.get()); rc != SQLITE_DONE) {
      return fail(step_error(rc));
    }
  }

  if (auto r = txn.commit(); !r)
    return std::unexpected(r.error());
  return *reclaimed;
}

auto Persistence::get_worker(const WorkerId& id) -> Result<Worker> {
  std::lock_guard lock(mu_);
  return read_worker(id);
}

auto Persistence::list_workers() -> Result<std::vector<Worker>> {
  std::lock_guard lock(mu_);
  auto sql = std::format("SELECT {} FROM workers ORDER BY registered_at, id;",
                         kWorkerColumns);
  auto prepared = prepare(sql.c_str());
  if (!prepared)
    return std::unexpected(prepared.error());
  Statement stmt(*prepared);

  std::vector<Worker> workers;
  while (sqlite3_step(stmt.get()) == SQLITE_ROW) {
    workers.push_back(read_worker_row(stmt.get()));
  }
  stmt.reset();

  for (auto& w : workers) {
    auto caps = read_capabilities(w.id);
    if (!caps)
      return std::unexpected(caps.error());
    w.capabilities = std::move(*caps);
  }
  return workers;
}

auto Persistence::capable_workers(const TaskTypeId& type)
    -> Result<std::vector<WorkerId>> {
  std::lock_guard lock(mu_);
  constexpr auto sql = R"(
    SELECT w.id FROM workers w
    JOIN worker_task_types c ON c.worker_id = w.id
    WHERE c.task_type_id = ? AND w.state = 'alive'
    ORDER BY w.registered_at, w.id;
  )";
  auto prepared = prepare(sql);
  if (!prepared)
    return std::unexpected(prepared.error());
  Statement stmt(*prepared);
  bind_text(stmt.get(), 1, type.value());

  std::vector<WorkerId> ids;
  while (sqlite3_step(stmt.get()) == SQLITE_ROW) {
    ids.emplace_back(col_text(stmt.get(), 0));
  }
  return ids;
}

auto Persistence::worker_loads(const TaskTypeId& type)
    -> Result<std::vector<WorkerLoad>> {
  std::lock_guard lock(mu_);
  auto sql = std::format(R"(
    SELECT w.id,
           (SELECT COUNT(*) FROM tasks t
            WHERE t.assigned_to = w.id AND t.status IN {}) AS load
    FROM workers w
    JOIN worker_task_types c ON c.worker_id = w.id
    WHERE c.task_type_id = ? AND w.state = 'alive'
    ORDER BY load, w.registered_at, w.id;
  )",
                         kInFlight);
  auto prepared = prepare(sql.c_str());
  if (!prepared)
    return std::unexpected(prepared.error());
  Statement stmt(*prepared);
  bind_text(stmt.get(), 1, type.value());

  std::vector<WorkerLoad> loads;
  while (sqlite3_step(stmt.get()) == SQLITE_ROW) {
    loads.push_back(WorkerLoad{
        .worker_id = WorkerId{col_text(stmt.get(), 0)},
        .in_flight =
            static_cast<std::size_t>(sqlite3_column_int64(stmt.get(), 1)),
    });
  }
  return loads;
}

// ---------------------------------------------------------------------------
// Liveness

auto Persistence::append_heartbeat(const WorkerId& worker,
                                   TimePoint heartbeat_time, TimePoint now)
    -> Result<Worker> {
  std::lock_guard lock(mu_);
  Transaction txn(*this);
  if (auto r = txn.begin(); !r)
    return std::unexpected(r.error());

  {
    constexpr auto sql = R"(
      INSERT INTO worker_heartbeats (id, worker_id, heartbeat_time, created_at)
      SELECT ?, id, ?, ? FROM workers WHERE id = ?;
    )";
    auto prepared = prepare(sql);
    if (!prepared)
      return std::unexpected(prepared.error());
    Statement stmt(*prepared);
    auto hb_id = generate_id<HeartbeatId>();
    bind_text(stmt.get(), 1, hb_id.value());
    bind_time(stmt.get(), 2, heartbeat_time);
    bind_time(stmt.get(), 3, now);
    bind_text(stmt.get(), 4, worker.value());
    if (int rc = sqlite3_step(stmt.get()); rc != SQLITE_DONE) {
      return fail(step_error(rc));
    }
    if (sqlite3_changes(db_.get()) == 0) {
      return fail(Error::NotFound);
    }
  }

  {
    constexpr auto sql = R"(
      UPDATE workers SET last_heartbeat_at = MAX(last_heartbeat_at, ?)
      WHERE id = ?;
    )";
    auto prepared = prepare(sql);
    if (!prepared)
      return std::unexpected(prepared.error());
    Statement stmt(*prepared);
    bind_time(stmt.get(), 1, heartbeat_time);
    bind_text(stmt.get(), 2, worker.value());
    if (int rc = sqlite3_step(stmt.get()); rc != SQLITE_DONE) {
      return fail(step_error(rc));
    }
  }

  auto updated = read_worker(worker);
  if (!updated)
    return std::unexpected(updated.error());

  if (auto r = txn.commit(); !r)
    return std::unexpected(r.error());
  return updated;
}

auto Persistence::list_heartbeats(const WorkerId& worker, std::size_t limit)
    -> Result<std::vector<Heartbeat>> {
  std::lock_guard lock(mu_);
  constexpr auto sql = R"(
    SELECT id, worker_id, heartbeat_time, created_at FROM worker_heartbeats
    WHERE worker_id = ? ORDER BY heartbeat_time DESC LIMIT ?;
  )";
  auto prepared = prepare(sql);
  if (!prepared)
    return std::unexpected(prepared.error());
  Statement stmt(*prepared);
  bind_text(stmt.get(), 1, worker.value());
  sqlite3_bind_int64(stmt.get(), 2, static_cast<sqlite3_int64>(limit));

  std::vector<Heartbeat> beats;
  while (sqlite3_step(stmt.get()) == SQLITE_ROW) {
    beats.push_back(Heartbeat{
        .id = HeartbeatId{col_text(stmt.get(), 0)},
        .worker_id = WorkerId{col_text(stmt.get(), 1)},
        .heartbeat_time = col_time(stmt.get(), 2),
        .created_at = col_time(stmt.get(), 3),
    });
  }
  return beats;
}

auto Persistence::transition_worker(const WorkerTransition& t)
    -> Result<std::size_t> {
  if (t.from.empty()) {
    return fail(Error::InvalidArgument);
  }
  std::lock_guard lock(mu_);
  Transaction txn(*this);
  if (auto r = txn.begin(); !r)
    return std::unexpected(r.error());

  auto sql = std::format("UPDATE workers SET state = ? WHERE id = ? "
                         "AND state IN ({})",
                         placeholders(t.from.size()));
  if (t.heartbeat_at_or_before) {
    sql += " AND last_heartbeat_at <= ?";
  }
  if (t.heartbeat_after) {
    sql += " AND last_heartbeat_at > ?";
  }
  sql += ";";

  {
    auto prepared = prepare(sql.c_str());
    if (!prepared)
      return std::unexpected(prepared.error());
    Statement stmt(*prepared);

    int idx = 1;
    bind_text(stmt.get(), idx++, worker_state_name(t.to));
    bind_text(stmt.get(), idx++, t.worker_id.value());
    for (auto s : t.from) {
      bind_text(stmt.get(), idx++, worker_state_name(s));
    }
    if (t.heartbeat_at_or_before) {
      bind_time(stmt.get(), idx++, *t.heartbeat_at_or_before);
    }
    if (t.heartbeat_after) {
      bind_time(stmt.get(), idx++, *t.heartbeat_after);
    }

    if (int rc = sqlite3_step(stmt.get()); rc != SQLITE_DONE) {
      return fail(step_error(rc));
    }
    if (sqlite3_changes(db_.get()) == 0) {
      stmt.reset();
      auto exists = read_worker(t.worker_id);
      if (!exists)
        return std::unexpected(exists.error());
      return fail(Error::StaleTransition);
    }
  }

  std::size_t reclaimed = 0;
  if (t.to == WorkerState::Dead) {
    auto r = reclaim_assigned(t.worker_id);
    if (!r)
      return std::unexpected(r.error());
    reclaimed = *r;
  }

  if (auto r = txn.commit(); !r)
    return std::unexpected(r.error());
  return reclaimed;
}

// ---------------------------------------------------------------------------
// Tasks

auto Persistence::read_tasks(sqlite3_stmt* stmt) -> std::vector<Task> {
  std::vector<Task> tasks;
  while (sqlite3_step(stmt) == SQLITE_ROW) {
    Task task;
    task.id = TaskId{col_text(stmt, 0)};
    task.task_type_id = TaskTypeId{col_text(stmt, 1)};
    task.input_data = col_json(stmt, 2);
    task.status =
        parse_task_status(col_text(stmt, 3)).value_or(TaskStatus::Pending);
    task.created_at = col_time(stmt, 4);
    if (!col_is_null(stmt, 5)) {
      task.assigned_to = WorkerId{col_text(stmt, 5)};
    }
    tasks.push_back(std::move(task));
  }
  return tasks;
}

auto Persistence::insert_task(const Task& task) -> Result<void> {
  if (task.id.empty() || is_in_flight(task.status) != task.assigned_to.has_value()) {
    return fail(Error::InvalidArgument);
  }
  std::lock_guard lock(mu_);
  constexpr auto sql = R"(
    INSERT INTO tasks (id, task_type_id, input_data, status, created_at, assigned_to)
    VALUES (?, ?, ?, ?, ?, ?);
  )";
  auto prepared = prepare(sql);
  if (!prepared)
    return std::unexpected(prepared.error());
  Statement stmt(*prepared);

  auto input = task.input_data.dump();
  bind_text(stmt.get(), 1, task.id.value());
  bind_text(stmt.get(), 2, task.task_type_id.value());
  bind_text(stmt.get(), 3, input);
  bind_text(stmt.get(), 4, task_status_name(task.status));
  bind_time(stmt.get(), 5, task.created_at);
  if (task.assigned_to) {
    bind_text(stmt.get(), 6, task.assigned_to->value());
  } else {
    sqlite3_bind_null(stmt.get(), 6);
  }

  int rc = sqlite3_step(stmt.get());
  if (rc == SQLITE_CONSTRAINT) {
    log::warn("Task {} rejected by constraint: {}", task.id,
              sqlite3_errmsg(db_.get()));
    return fail(Error::AlreadyExists);
  }
  if (rc != SQLITE_DONE)
    return fail(step_error(rc));
  return ok();
}

auto Persistence::get_task(const TaskId& id) -> Result<Task> {
  std::lock_guard lock(mu_);
  auto sql = std::format("SELECT {} FROM tasks WHERE id = ?;", kTaskColumns);
  auto prepared = prepare(sql.c_str());
  if (!prepared)
    return std::unexpected(prepared.error());
  Statement stmt(*prepared);
  bind_text(stmt.get(), 1, id.value());

  auto tasks = read_tasks(stmt.get());
  if (tasks.empty())
    return fail(Error::NotFound);
  return std::move(tasks.front());
}

auto Persistence::list_tasks(std::optional<TaskStatus> status,
                             std::size_t limit) -> Result<std::vector<Task>> {
  std::lock_guard lock(mu_);
  auto sql = status ? std::format("SELECT {} FROM tasks WHERE status = ? "
                                  "ORDER BY created_at, rowid LIMIT ?;",
                                  kTaskColumns)
                    : std::format("SELECT {} FROM tasks "
                                  "ORDER BY created_at, rowid LIMIT ?;",
                                  kTaskColumns);
  auto prepared = prepare(sql.c_str());
  if (!prepared)
    return std::unexpected(prepared.error());
  Statement stmt(*prepared);

  int idx = 1;
  if (status) {
    bind_text(stmt.get(), idx++, task_status_name(*status));
  }
  sqlite3_bind_int64(stmt.get(), idx, static_cast<sqlite3_int64>(limit));
  return read_tasks(stmt.get());
}

auto Persistence::count_tasks_by_status() -> Result<StatusCounts> {
  std::lock_guard lock(mu_);
  constexpr auto sql = "SELECT status, COUNT(*) FROM tasks GROUP BY status;";
  auto prepared = prepare(sql);
  if (!prepared)
    return std::unexpected(prepared.error());
  Statement stmt(*prepared);

  StatusCounts counts{};
  while (sqlite3_step(stmt.get()) == SQLITE_ROW) {
    if (auto s = parse_task_status(col_text(stmt.get(), 0))) {
      counts[std::to_underlying(*s)] = sqlite3_column_int64(stmt.get(), 1);
    }
  }
  return counts;
}

auto Persistence::pending_task_types() -> Result<std::vector<TaskTypeId>> {
  std::lock_guard lock(mu_);
  constexpr auto sql = R"(
    SELECT task_type_id, MIN(created_at) AS oldest FROM tasks
    WHERE status = 'pending'
    GROUP BY task_type_id ORDER BY oldest;
  )";
  auto prepared = prepare(sql);
  if (!prepared)
    return std::unexpected(prepared.error());
  Statement stmt(*prepared);

  std::vector<TaskTypeId> types;
  while (sqlite3_step(stmt.get()) == SQLITE_ROW) {
    types.emplace_back(col_text(stmt.get(), 0));
  }
  return types;
}

auto Persistence::pending_tasks(const TaskTypeId& type, std::size_t limit)
    -> Result<std::vector<Task>> {
  std::lock_guard lock(mu_);
  auto sql = std::format("SELECT {} FROM tasks "
                         "WHERE status = 'pending' AND task_type_id = ? "
                         "ORDER BY created_at, rowid LIMIT ?;",
                         kTaskColumns);
  auto prepared = prepare(sql.c_str());
  if (!prepared)
    return std::unexpected(prepared.error());
  Statement stmt(*prepared);
  bind_text(stmt.get(), 1, type.value());
  sqlite3_bind_int64(stmt.get(), 2, static_cast<sqlite3_int64>(limit));
  return read_tasks(stmt.get());
}

auto Persistence::transition_task(const TaskTransition& t) -> Result<void> {
  if (t.from.empty() || is_in_flight(t.to) != t.assignee.has_value() ||
      (t.require_capable_assignee && !t.assignee)) {
    return fail(Error::InvalidArgument);
  }
  std::lock_guard lock(mu_);

  auto sql = std::format("UPDATE tasks SET status = ?, assigned_to = ? "
                         "WHERE id = ? AND status IN ({})",
                         placeholders(t.from.size()));
  if (t.expected_assignee) {
    sql += " AND assigned_to = ?";
  }
  if (t.require_capable_assignee) {
    sql += R"( AND EXISTS (
      SELECT 1 FROM workers w
      JOIN worker_task_types c ON c.worker_id = w.id
      WHERE w.id = ? AND w.state = 'alive'
        AND c.task_type_id = tasks.task_type_id))";
  }
  sql += ";";

  auto prepared = prepare(sql.c_str());
  if (!prepared)
    return std::unexpected(prepared.error());
  Statement stmt(*prepared);

  int idx = 1;
  bind_text(stmt.get(), idx++, task_status_name(t.to));
  if (t.assignee) {
    bind_text(stmt.get(), idx++, t.assignee->value());
  } else {
    sqlite3_bind_null(stmt.get(), idx++);
  }
  bind_text(stmt.get(), idx++, t.task_id.value());
  for (auto s : t.from) {
    bind_text(stmt.get(), idx++, task_status_name(s));
  }
  if (t.expected_assignee) {
    bind_text(stmt.get(), idx++, t.expected_assignee->value());
  }
  if (t.require_capable_assignee) {
    bind_text(stmt.get(), idx++, t.assignee->value());
  }

  if (int rc = sqlite3_step(stmt.get()); rc != SQLITE_DONE) {
    return fail(step_error(rc));
  }
  if (sqlite3_changes(db_.get()) == 0) {
    stmt.reset();
    auto check = prepare("SELECT 1 FROM tasks WHERE id = ?;");
    if (!check)
      return std::unexpected(check.error());
    Statement exists(*check);
    bind_text(exists.get(), 1, t.task_id.value());
    if (sqlite3_step(exists.get()) != SQLITE_ROW) {
      return fail(Error::NotFound);
    }
    return fail(Error::StaleTransition);
  }
  return ok();
}

// ---------------------------------------------------------------------------
// Results

auto Persistence::finalize_task(const ResultReport& report, TimePoint now)
    -> Result<TaskResult> {
  std::lock_guard lock(mu_);
  Transaction txn(*this);
  if (auto r = txn.begin(); !r)
    return std::unexpected(r.error());

  {
    auto prepared = prepare("SELECT status FROM tasks WHERE id = ?;");
    if (!prepared)
      return std::unexpected(prepared.error());
    Statement stmt(*prepared);
    bind_text(stmt.get(), 1, report.task_id.value());

    int rc = sqlite3_step(stmt.get());
    if (rc == SQLITE_DONE)
      return fail(Error::NotFound);
    if (rc != SQLITE_ROW)
      return fail(step_error(rc));

    auto status = parse_task_status(col_text(stmt.get(), 0));
    if (!status)
      return fail(Error::DatabaseError);
    switch (*status) {
      case TaskStatus::Completed:
      case TaskStatus::Failed:
        return fail(Error::DuplicateResult);
      case TaskStatus::Pending:
      case TaskStatus::Cancelled:
        return fail(Error::OrphanedResult);
      case TaskStatus::Queued:
      case TaskStatus::Running:
        break;
    }
  }

  {
    auto prepared = prepare("SELECT state FROM workers WHERE id = ?;");
    if (!prepared)
      return std::unexpected(prepared.error());
    Statement stmt(*prepared);
    bind_text(stmt.get(), 1, report.worker_id.value());

    int rc = sqlite3_step(stmt.get());
    if (rc == SQLITE_DONE) {
      log::warn("Result for task {} from unknown worker {}", report.task_id,
                report.worker_id);
      return fail(Error::NotFound);
    }
    if (rc != SQLITE_ROW)
      return fail(step_error(rc));
    // A dead worker's tasks were reclaimed; whoever holds the task now owns it
    if (parse_worker_state(col_text(stmt.get(), 0)) == WorkerState::Dead)
      return fail(Error::OrphanedResult);
  }

  TaskResult result;
  result.id = generate_id<ResultId>();
  result.task_id = report.task_id;
  if (report.success) {
    result.output_data = report.payload;
  } else {
    result.error_data = report.payload;
  }
  result.completed_at = report.completed_at;
  result.worker_id = report.worker_id;
  result.created_at = now;

  {
    auto sql = std::format("INSERT INTO task_results ({}) "
                           "VALUES (?, ?, ?, ?, ?, ?, ?);",
                           kResultColumns);
    auto prepared = prepare(sql.c_str());
    if (!prepared)
      return std::unexpected(prepared.error());
    Statement stmt(*prepared);

    auto payload = report.payload.dump();
    bind_text(stmt.get(), 1, result.id.value());
    bind_text(stmt.get(), 2, result.task_id.value());
    if (report.success) {
      bind_text(stmt.get(), 3, payload);
      sqlite3_bind_null(stmt.get(), 4);
    } else {
      sqlite3_bind_null(stmt.get(), 3);
      bind_text(stmt.get(), 4, payload);
    }
    bind_time(stmt.get(), 5, result.completed_at);
    bind_text(stmt.get(), 6, result.worker_id.value());
    bind_time(stmt.get(), 7, result.created_at);

    int rc = sqlite3_step(stmt.get());
    if (rc == SQLITE_CONSTRAINT) {
      return fail(Error::DuplicateResult);
    }
    if (rc != SQLITE_DONE)
      return fail(step_error(rc));
  }

  {
    auto sql = std::format("UPDATE tasks SET status = ?, assigned_to = NULL "
                           "WHERE id = ? AND status IN {};",
                           kInFlight);
    auto prepared = prepare(sql.c_str());
    if (!prepared)
      return std::unexpected(prepared.error());
    Statement stmt(*prepared);
    bind_text(stmt.get(), 1,
              task_status_name(report.success ? TaskStatus::Completed
                                              : TaskStatus::Failed));
    bind_text(stmt.get(), 2, report.task_id.value());
    if (int rc = sqlite3_step(stmt.get()); rc != SQLITE_DONE) {
      return fail(step_error(rc));
    }
    if (sqlite3_changes(db_.get()) == 0) {
      return fail(Error::StaleTransition);
    }
  }

  if (auto r = txn.commit(); !r)
    return std::unexpected(r.error());
  return result;
}

auto Persistence::get_result(const TaskId& task_id) -> Result<TaskResult> {
  std::lock_guard lock(mu_);
  auto sql = std::format("SELECT {} FROM task_results WHERE task_id = ?;",
                         kResultColumns);
  auto prepared = prepare(sql.c_str());
  if (!prepared)
    return std::unexpected(prepared.error());
  Statement stmt(*prepared);
  bind_text(stmt.get(), 1, task_id.value());

  int rc = sqlite3_step(stmt.get());
  if (rc == SQLITE_DONE)
    return fail(Error::NotFound);
  if (rc != SQLITE_ROW)
    return fail(step_error(rc));
  return read_result_row(stmt.get());
}

auto Persistence::count_results(const TaskId& task_id) -> Result<std::size_t> {
  std::lock_guard lock(mu_);
  auto prepared =
      prepare("SELECT COUNT(*) FROM task_results WHERE task_id = ?;");
  if (!prepared)
    return std::unexpected(prepared.error());
  Statement stmt(*prepared);
  bind_text(stmt.get(), 1, task_id.value());
  if (int rc = sqlite3_step(stmt.get()); rc != SQLITE_ROW) {
    return fail(step_error(rc));
  }
  return static_cast<std::size_t>(sqlite3_column_int64(stmt.get(), 0));
}

}  // namespace taskq
