// MySQLRouteStore persists saved routes with prepared statements.

#include "infra/MySQLRouteStore.hpp"
#include <cstring>
#include <initializer_list>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

namespace {

struct StmtCloser {
  void operator()(MYSQL_STMT *s) const {
    if (s)
      mysql_stmt_close(s);
  }
};
using StmtPtr = std::unique_ptr<MYSQL_STMT, StmtCloser>;

StmtPtr prepare(MYSQL *conn, const char *sql) {
  StmtPtr stmt(mysql_stmt_init(conn));
  if (!stmt)
    throw std::runtime_error("mysql_stmt_init failed");
  if (mysql_stmt_prepare(stmt.get(), sql, strlen(sql)))
    throw std::runtime_error(mysql_stmt_error(stmt.get()));
  return stmt;
}

// Parameter values must outlive execute(); callers keep them in locals.
void bind_string(MYSQL_BIND &b, const std::string &s, unsigned long &len) {
  len = s.size();
  b.buffer_type = MYSQL_TYPE_STRING;
  b.buffer = (void *)s.c_str();
  b.buffer_length = len;
  b.length = &len;
}

void bind_double(MYSQL_BIND &b, const double &v) {
  b.buffer_type = MYSQL_TYPE_DOUBLE;
  b.buffer = (void *)&v;
}

void bind_int(MYSQL_BIND &b, const int &v) {
  b.buffer_type = MYSQL_TYPE_LONG;
  b.buffer = (void *)&v;
}

void execute(MYSQL_STMT *stmt, MYSQL_BIND *params) {
  if (params && mysql_stmt_bind_param(stmt, params))
    throw std::runtime_error(mysql_stmt_error(stmt));
  if (mysql_stmt_execute(stmt))
    throw std::runtime_error(mysql_stmt_error(stmt));
}

// Fetch every row of an executed SELECT with all columns read as text.
std::vector<std::vector<std::string>> fetch_rows(MYSQL_STMT *stmt,
                                                 size_t ncols) {
  std::vector<MYSQL_BIND> rbind(ncols);
  std::vector<std::vector<char>> bufs(ncols, std::vector<char>(256));
  std::vector<unsigned long> lens(ncols, 0);
  memset(rbind.data(), 0, sizeof(MYSQL_BIND) * ncols);

  auto rebind = [&](size_t i) {
    rbind[i].buffer_type = MYSQL_TYPE_STRING;
    rbind[i].buffer = bufs[i].data();
    rbind[i].buffer_length = bufs[i].size();
    rbind[i].length = &lens[i];
  };
  for (size_t i = 0; i < ncols; ++i)
    rebind(i);

  if (mysql_stmt_bind_result(stmt, rbind.data()) ||
      mysql_stmt_store_result(stmt))
    throw std::runtime_error(mysql_stmt_error(stmt));

  std::vector<std::vector<std::string>> rows;
  while (true) {
    int rc = mysql_stmt_fetch(stmt);
    if (rc == MYSQL_NO_DATA)
      break;
    if (rc == 1) {
      std::string e = mysql_stmt_error(stmt);
      mysql_stmt_free_result(stmt);
      throw std::runtime_error("fetch failed: " + e);
    }

    std::vector<std::string> row(ncols);
    for (size_t i = 0; i < ncols; ++i) {
      if (lens[i] > bufs[i].size()) {
        // MYSQL_DATA_TRUNCATED: grow and re-read just this column
        bufs[i].resize(lens[i]);
        rebind(i);
        if (mysql_stmt_fetch_column(stmt, &rbind[i],
                                    static_cast<unsigned int>(i), 0)) {
          std::string e = mysql_stmt_error(stmt);
          mysql_stmt_free_result(stmt);
          throw std::runtime_error("fetch column failed: " + e);
        }
      }
      row[i].assign(bufs[i].data(), lens[i]);
    }
    rows.push_back(std::move(row));

    // grown buffers must be re-registered for the next row
    if (mysql_stmt_bind_result(stmt, rbind.data())) {
      std::string e = mysql_stmt_error(stmt);
      mysql_stmt_free_result(stmt);
      throw std::runtime_error(e);
    }
  }
  mysql_stmt_free_result(stmt);
  return rows;
}

double to_double(const std::string &s) { return s.empty() ? 0.0 : std::stod(s); }
int to_int(const std::string &s) { return s.empty() ? 0 : std::stoi(s); }

} // namespace

// Establish connection using URI and credentials
MySQLRouteStore::MySQLRouteStore(const std::string &uri,
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
    conn_ = nullptr;
    throw std::runtime_error("connect failed: " + err);
  }
  mysql_set_character_set(conn_, "utf8mb4");
}

MySQLRouteStore::~MySQLRouteStore() {
  if (conn_)
    mysql_close(conn_);
}

void MySQLRouteStore::begin() {
  if (mysql_query(conn_, "START TRANSACTION"))
    throw std::runtime_error(mysql_error(conn_));
}

void MySQLRouteStore::commit() {
  if (mysql_query(conn_, "COMMIT"))
    throw std::runtime_error(mysql_error(conn_));
}

void MySQLRouteStore::rollback() {
  if (mysql_query(conn_, "ROLLBACK"))
    throw std::runtime_error(mysql_error(conn_));
}

void MySQLRouteStore::save_route(const RouteRecord &r) {
  static const char *SQL = R"SQL(
      INSERT INTO custom_routes
        (id, name, description, mode, distance_m, duration_s, base_route_id,
         geometry_fingerprint, waypoint_count, created_at, updated_at)
      VALUES (?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?)
    )SQL";

  StmtPtr stmt = prepare(conn_, SQL);

  const std::string mode = PlanningModeToString(r.mode);
  const int wp_count = static_cast<int>(r.waypoints.size());
  unsigned long l_id, l_name, l_desc, l_mode, l_base, l_fp, l_created,
      l_updated;

  MYSQL_BIND b[11];
  memset(b, 0, sizeof(b));
  bind_string(b[0], r.id, l_id);
  bind_string(b[1], r.name, l_name);
  bind_string(b[2], r.description, l_desc);
  bind_string(b[3], mode, l_mode);
  bind_double(b[4], r.distance_m);
  bind_double(b[5], r.duration_s);
  bind_string(b[6], r.base_route_id, l_base);
  bind_string(b[7], r.geometry_fingerprint, l_fp);
  bind_int(b[8], wp_count);
  bind_string(b[9], r.created_at, l_created);
  bind_string(b[10], r.updated_at, l_updated);

  execute(stmt.get(), b);
  insert_children(r);
}

bool MySQLRouteStore::update_route(const RouteRecord &r) {
  if (!exists(r.id))
    return false;

  static const char *SQL = R"SQL(
      UPDATE custom_routes SET
        name = ?, description = ?, mode = ?, distance_m = ?, duration_s = ?,
        base_route_id = ?, geometry_fingerprint = ?, waypoint_count = ?,
        updated_at = ?
      WHERE id = ?
    )SQL";

  StmtPtr stmt = prepare(conn_, SQL);

  const std::string mode = PlanningModeToString(r.mode);
  const int wp_count = static_cast<int>(r.waypoints.size());
  unsigned long l_name, l_desc, l_mode, l_base, l_fp, l_updated, l_id;

  MYSQL_BIND b[10];
  memset(b, 0, sizeof(b));
  bind_string(b[0], r.name, l_name);
  bind_string(b[1], r.description, l_desc);
  bind_string(b[2], mode, l_mode);
  bind_double(b[3], r.distance_m);
  bind_double(b[4], r.duration_s);
  bind_string(b[5], r.base_route_id, l_base);
  bind_string(b[6], r.geometry_fingerprint, l_fp);
  bind_int(b[7], wp_count);
  bind_string(b[8], r.updated_at, l_updated);
  bind_string(b[9], r.id, l_id);

  execute(stmt.get(), b);

  delete_children(r.id);
  insert_children(r);
  return true;
}

bool MySQLRouteStore::load_route(const std::string &id, RouteRecord &out) {
  static const char *SQL_ROUTE = R"SQL(
      SELECT id, name, description, mode, distance_m, duration_s,
             base_route_id, geometry_fingerprint, created_at, updated_at
      FROM custom_routes WHERE id = ?
    )SQL";
  static const char *SQL_WPS = R"SQL(
      SELECT waypoint_id, lat, lon, name, kind, seq
      FROM route_waypoints WHERE route_id = ? ORDER BY seq
    )SQL";
  static const char *SQL_GEOM = R"SQL(
      SELECT coords_json FROM route_geometry WHERE route_id = ?
    )SQL";

  unsigned long l_id;
  MYSQL_BIND p[1];
  memset(p, 0, sizeof(p));
  bind_string(p[0], id, l_id);

  RouteRecord rec;
  {
    StmtPtr stmt = prepare(conn_, SQL_ROUTE);
    execute(stmt.get(), p);
    auto rows = fetch_rows(stmt.get(), 10);
    if (rows.empty())
      return false;
    const auto &row = rows.front();
    rec.id = row[0];
    rec.name = row[1];
    rec.description = row[2];
    rec.mode = PlanningModeFromString(row[3]);
    rec.distance_m = to_double(row[4]);
    rec.duration_s = to_double(row[5]);
    rec.base_route_id = row[6];
    rec.geometry_fingerprint = row[7];
    rec.created_at = row[8];
    rec.updated_at = row[9];
  }
  {
    StmtPtr stmt = prepare(conn_, SQL_WPS);
    execute(stmt.get(), p);
    for (const auto &row : fetch_rows(stmt.get(), 6)) {
      Waypoint wp;
      wp.id = row[0];
      wp.coord.latitude = to_double(row[1]);
      wp.coord.longitude = to_double(row[2]);
      wp.name = row[3];
      wp.kind = WaypointKindFromString(row[4]);
      wp.order = static_cast<uint32_t>(to_int(row[5]));
      rec.waypoints.push_back(std::move(wp));
    }
  }
  {
    StmtPtr stmt = prepare(conn_, SQL_GEOM);
    execute(stmt.get(), p);
    auto rows = fetch_rows(stmt.get(), 1);
    if (!rows.empty() && !rows.front()[0].empty())
      rec.geometry = polyline_from_json(Json::parse(rows.front()[0]));
  }

  out = std::move(rec);
  return true;
}

std::vector<RouteSummary> MySQLRouteStore::list_routes() {
  static const char *SQL = R"SQL(
      SELECT id, name, mode, distance_m, waypoint_count, updated_at
      FROM custom_routes ORDER BY updated_at DESC
    )SQL";

  StmtPtr stmt = prepare(conn_, SQL);
  execute(stmt.get(), nullptr);

  std::vector<RouteSummary> out;
  for (const auto &row : fetch_rows(stmt.get(), 6)) {
    RouteSummary s;
    s.id = row[0];
    s.name = row[1];
    s.mode = PlanningModeFromString(row[2]);
    s.distance_m = to_double(row[3]);
    s.waypoint_count = to_int(row[4]);
    s.updated_at = row[5];
    out.push_back(std::move(s));
  }
  return out;
}

bool MySQLRouteStore::delete_route(const std::string &id) {
  delete_children(id);

  StmtPtr stmt = prepare(conn_, "DELETE FROM custom_routes WHERE id = ?");
  unsigned long l_id;
  MYSQL_BIND b[1];
  memset(b, 0, sizeof(b));
  bind_string(b[0], id, l_id);
  execute(stmt.get(), b);
  return mysql_stmt_affected_rows(stmt.get()) > 0;
}

bool MySQLRouteStore::exists(const std::string &id) {
  StmtPtr stmt = prepare(conn_, "SELECT 1 FROM custom_routes WHERE id = ?");
  unsigned long l_id;
  MYSQL_BIND b[1];
  memset(b, 0, sizeof(b));
  bind_string(b[0], id, l_id);
  execute(stmt.get(), b);
  return !fetch_rows(stmt.get(), 1).empty();
}

// Waypoint rows plus the geometry blob for one route
void MySQLRouteStore::insert_children(const RouteRecord &r) {
  static const char *SQL_WP = R"SQL(
      INSERT INTO route_waypoints
        (route_id, seq, waypoint_id, lat, lon, name, kind)
      VALUES (?, ?, ?, ?, ?, ?, ?)
    )SQL";
  static const char *SQL_GEOM = R"SQL(
      INSERT INTO route_geometry (route_id, point_count, coords_json)
      VALUES (?, ?, ?)
    )SQL";

  StmtPtr wp_stmt = prepare(conn_, SQL_WP);
  for (size_t i = 0; i < r.waypoints.size(); ++i) {
    const Waypoint &wp = r.waypoints[i];
    const int seq = static_cast<int>(i);
    const std::string kind = WaypointKindToString(wp.kind);
    unsigned long l_rid, l_wid, l_name, l_kind;

    MYSQL_BIND b[7];
    memset(b, 0, sizeof(b));
    bind_string(b[0], r.id, l_rid);
    bind_int(b[1], seq);
    bind_string(b[2], wp.id, l_wid);
    bind_double(b[3], wp.coord.latitude);
    bind_double(b[4], wp.coord.longitude);
    bind_string(b[5], wp.name, l_name);
    bind_string(b[6], kind, l_kind);
    execute(wp_stmt.get(), b);
  }

  StmtPtr geom_stmt = prepare(conn_, SQL_GEOM);
  const std::string coords = polyline_to_json(r.geometry).dump();
  const int pc = static_cast<int>(r.geometry.size());
  unsigned long l_rid, l_coords;

  MYSQL_BIND b[3];
  memset(b, 0, sizeof(b));
  bind_string(b[0], r.id, l_rid);
  bind_int(b[1], pc);
  bind_string(b[2], coords, l_coords);
  execute(geom_stmt.get(), b);
}

void MySQLRouteStore::delete_children(const std::string &id) {
  for (const char *sql : {"DELETE FROM route_waypoints WHERE route_id = ?",
                          "DELETE FROM route_geometry WHERE route_id = ?"}) {
    StmtPtr stmt = prepare(conn_, sql);
    unsigned long l_id;
    MYSQL_BIND b[1];
    memset(b, 0, sizeof(b));
    bind_string(b[0], id, l_id);
    execute(stmt.get(), b);
  }
}
