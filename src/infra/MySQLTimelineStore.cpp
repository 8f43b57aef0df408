// MySQLTimelineStore persists finalized timeline segments.

#include "MySQLTimelineStore.hpp"
#include "models/TimelineJson.hpp"
#include <cstring>
#include <stdexcept>
#include <string>
#include <type_traits>
#include <utility>
#include <vector>

namespace {

// my_bool on MariaDB / older clients, bool on MySQL 8
using NullFlag = std::remove_pointer_t<decltype(MYSQL_BIND::is_null)>;

// Closes a prepared statement on every exit path.
struct StmtGuard {
  MYSQL_STMT *stmt;
  ~StmtGuard() {
    if (stmt)
      mysql_stmt_close(stmt);
  }
};

MYSQL_STMT *prepare(MYSQL *conn, const char *sql) {
  MYSQL_STMT *stmt = mysql_stmt_init(conn);
  if (!stmt)
    throw std::runtime_error("mysql_stmt_init failed");
  if (mysql_stmt_prepare(stmt, sql, strlen(sql))) {
    std::string err = mysql_stmt_error(stmt);
    mysql_stmt_close(stmt);
    throw std::runtime_error(err);
  }
  return stmt;
}

} // namespace

// Establish connection using URI and credentials
MySQLTimelineStore::MySQLTimelineStore(const std::string &uri,
                                       const std::string &user,
                                       const std::string &pass,
                                       const std::string &schema) {
  conn_ = mysql_init(nullptr);
  if (!conn_)
    throw std::runtime_error("mysql_init failed");
  // Parse URI "tcp://host:port"
  std::string host = uri, port = "3306";
  if (auto pos = uri.find("://"); pos != std::string::npos) {
    host = uri.substr(pos + 3);
  }
  if (auto p = host.find(':'); p != std::string::npos) {
    port = host.substr(p + 1);
    host = host.substr(0, p);
  }
  if (!mysql_real_connect(conn_, host.c_str(), user.c_str(), pass.c_str(),
                          schema.c_str(), std::stoi(port), nullptr, 0)) {
    std::string err = mysql_error(conn_);
    mysql_close(conn_);
    throw std::runtime_error("connect failed: " + err);
  }
}

MySQLTimelineStore::~MySQLTimelineStore() { mysql_close(conn_); }

void MySQLTimelineStore::begin() {
  if (mysql_query(conn_, "START TRANSACTION"))
    throw std::runtime_error(mysql_error(conn_));
}

void MySQLTimelineStore::commit() {
  if (mysql_query(conn_, "COMMIT"))
    throw std::runtime_error(mysql_error(conn_));
}

void MySQLTimelineStore::rollback() {
  if (mysql_query(conn_, "ROLLBACK"))
    throw std::runtime_error(mysql_error(conn_));
}

// Insert or update a finalized segment
void MySQLTimelineStore::upsert_segment(const Segment &seg) {
  static const char *SQL = R"SQL(
      INSERT INTO timeline_segments
        (segment_id, kind, start_ts, end_ts, previous_id, next_id,
         sample_count, samples_json)
      VALUES (?, ?, ?, ?, ?, ?, ?, ?)
      ON DUPLICATE KEY UPDATE
        kind = VALUES(kind),
        start_ts = VALUES(start_ts),
        end_ts = VALUES(end_ts),
        previous_id = VALUES(previous_id),
        next_id = VALUES(next_id),
        sample_count = VALUES(sample_count),
        samples_json = VALUES(samples_json)
    )SQL";

  if (!seg.end)
    throw std::invalid_argument("refusing to persist open segment " +
                                std::to_string(seg.id));

  StmtGuard guard{prepare(conn_, SQL)};

  unsigned long long id = seg.id;
  int kind_code = static_cast<int>(seg.kind);
  double start = seg.start;
  double end = *seg.end;
  unsigned long long prev = seg.previous.value_or(0);
  unsigned long long next = seg.next.value_or(0);
  NullFlag prev_null = !seg.previous;
  NullFlag next_null = !seg.next;
  int count = static_cast<int>(seg.samples.size());
  const std::string samples = Json(seg.samples).dump();
  unsigned long samples_len = samples.size();

  MYSQL_BIND b[8];
  memset(b, 0, sizeof(b));

  // segment_id
  b[0].buffer_type = MYSQL_TYPE_LONGLONG;
  b[0].buffer = &id;
  b[0].is_unsigned = 1;
  // kind (enum -> tinyint)
  b[1].buffer_type = MYSQL_TYPE_LONG;
  b[1].buffer = &kind_code;
  // start_ts / end_ts
  b[2].buffer_type = MYSQL_TYPE_DOUBLE;
  b[2].buffer = &start;
  b[3].buffer_type = MYSQL_TYPE_DOUBLE;
  b[3].buffer = &end;
  // previous_id / next_id (nullable)
  b[4].buffer_type = MYSQL_TYPE_LONGLONG;
  b[4].buffer = &prev;
  b[4].is_unsigned = 1;
  b[4].is_null = &prev_null;
  b[5].buffer_type = MYSQL_TYPE_LONGLONG;
  b[5].buffer = &next;
  b[5].is_unsigned = 1;
  b[5].is_null = &next_null;
  // sample_count
  b[6].buffer_type = MYSQL_TYPE_LONG;
  b[6].buffer = &count;
  // samples_json
  b[7].buffer_type = MYSQL_TYPE_STRING;
  b[7].buffer = const_cast<char *>(samples.c_str());
  b[7].buffer_length = samples_len;
  b[7].length = &samples_len;

  if (mysql_stmt_bind_param(guard.stmt, b))
    throw std::runtime_error(mysql_stmt_error(guard.stmt));

  if (mysql_stmt_execute(guard.stmt))
    throw std::runtime_error(mysql_stmt_error(guard.stmt));
}

// Highest archived id, so a restarted engine never reuses one
SegmentId MySQLTimelineStore::max_segment_id() {
  if (mysql_query(conn_,
                  "SELECT COALESCE(MAX(segment_id), 0) FROM timeline_segments"))
    throw std::runtime_error(mysql_error(conn_));
  MYSQL_RES *res = mysql_store_result(conn_);
  if (!res)
    throw std::runtime_error(mysql_error(conn_));
  std::string max_id = "0";
  if (MYSQL_ROW row = mysql_fetch_row(res); row && row[0])
    max_id = row[0];
  mysql_free_result(res);
  return std::stoull(max_id);
}

// Fetch persisted segments overlapping [from, to]
std::vector<Segment> MySQLTimelineStore::query_segments_between(double from,
                                                                double to) {
  static const char *SQL = R"SQL(
      SELECT segment_id, kind, start_ts, end_ts, previous_id, next_id,
             samples_json
      FROM timeline_segments
      WHERE end_ts >= ? AND start_ts <= ?
      ORDER BY start_ts
    )SQL";

  StmtGuard guard{prepare(conn_, SQL)};

  MYSQL_BIND pbind[2];
  memset(pbind, 0, sizeof(pbind));
  double params[2] = {from, to};
  for (int i = 0; i < 2; ++i) {
    pbind[i].buffer_type = MYSQL_TYPE_DOUBLE;
    pbind[i].buffer = &params[i];
  }
  if (mysql_stmt_bind_param(guard.stmt, pbind))
    throw std::runtime_error(mysql_stmt_error(guard.stmt));
  if (mysql_stmt_execute(guard.stmt))
    throw std::runtime_error(mysql_stmt_error(guard.stmt));

  unsigned long long id = 0, prev = 0, next = 0;
  int kind_code = 0;
  double start = 0, end = 0;
  NullFlag prev_null = 0, next_null = 0;
  std::vector<char> json_buf(1 << 16);
  unsigned long json_len = 0;

  MYSQL_BIND rbind[7];
  memset(rbind, 0, sizeof(rbind));
  rbind[0].buffer_type = MYSQL_TYPE_LONGLONG;
  rbind[0].buffer = &id;
  rbind[0].is_unsigned = 1;
  rbind[1].buffer_type = MYSQL_TYPE_LONG;
  rbind[1].buffer = &kind_code;
  rbind[2].buffer_type = MYSQL_TYPE_DOUBLE;
  rbind[2].buffer = &start;
  rbind[3].buffer_type = MYSQL_TYPE_DOUBLE;
  rbind[3].buffer = &end;
  rbind[4].buffer_type = MYSQL_TYPE_LONGLONG;
  rbind[4].buffer = &prev;
  rbind[4].is_unsigned = 1;
  rbind[4].is_null = &prev_null;
  rbind[5].buffer_type = MYSQL_TYPE_LONGLONG;
  rbind[5].buffer = &next;
  rbind[5].is_unsigned = 1;
  rbind[5].is_null = &next_null;
  rbind[6].buffer_type = MYSQL_TYPE_STRING;
  rbind[6].buffer = json_buf.data();
  rbind[6].buffer_length = json_buf.size();
  rbind[6].length = &json_len;

  if (mysql_stmt_bind_result(guard.stmt, rbind) ||
      mysql_stmt_store_result(guard.stmt))
    throw std::runtime_error(mysql_stmt_error(guard.stmt));

  std::vector<Segment> out;
  while (true) {
    int rc = mysql_stmt_fetch(guard.stmt);
    if (rc == MYSQL_NO_DATA)
      break;
    if (rc == 1)
      throw std::runtime_error(mysql_stmt_error(guard.stmt));

    std::string samples_json;
    if (rc == MYSQL_DATA_TRUNCATED && json_len > json_buf.size()) {
      // samples column outgrew the buffer: fetch it again at full size
      std::vector<char> big(json_len);
      MYSQL_BIND col;
      memset(&col, 0, sizeof(col));
      col.buffer_type = MYSQL_TYPE_STRING;
      col.buffer = big.data();
      col.buffer_length = big.size();
      col.length = &json_len;
      if (mysql_stmt_fetch_column(guard.stmt, &col, 6, 0))
        throw std::runtime_error(mysql_stmt_error(guard.stmt));
      samples_json.assign(big.data(), json_len);
    } else {
      samples_json.assign(json_buf.data(), json_len);
    }

    Segment seg;
    seg.id = id;
    seg.kind = kind_code == static_cast<int>(SegmentKind::Visit)
                   ? SegmentKind::Visit
                   : SegmentKind::Path;
    seg.start = start;
    seg.end = end;
    if (!prev_null)
      seg.previous = prev;
    if (!next_null)
      seg.next = next;
    seg.samples =
        Json::parse(samples_json).get<std::vector<LocomotionSample>>();
    out.push_back(std::move(seg));
  }

  mysql_stmt_free_result(guard.stmt);
  return out;
}
