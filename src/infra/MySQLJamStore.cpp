// MySQLJamStore reads sections and jam pages and appends JamPerSection rows
// through the MySQL C API.

#include "MySQLJamStore.hpp"
#include "core/CoordsJson.hpp"
#include "core/Errors.hpp"
#include <cmath>
#include <cstdlib>
#include <cstring>
#include <iostream>
#include <limits>
#include <memory>
#include <string>
#include <vector>

namespace {

struct ResultDeleter {
  void operator()(MYSQL_RES *r) const { mysql_free_result(r); }
};
using ResultPtr = std::unique_ptr<MYSQL_RES, ResultDeleter>;

struct StmtDeleter {
  void operator()(MYSQL_STMT *s) const { mysql_stmt_close(s); }
};
using StmtPtr = std::unique_ptr<MYSQL_STMT, StmtDeleter>;

// NULL and unparsable numbers read as NaN so the geometry step drops them.
double field_double(MYSQL_ROW row, unsigned i) {
  if (!row[i])
    return std::numeric_limits<double>::quiet_NaN();
  char *end = nullptr;
  double v = std::strtod(row[i], &end);
  if (end == row[i])
    return std::numeric_limits<double>::quiet_NaN();
  return v;
}

long long field_ll(MYSQL_ROW row, unsigned i) {
  return row[i] ? std::strtoll(row[i], nullptr, 10) : 0;
}

std::string field_str(MYSQL_ROW row, unsigned i) {
  return row[i] ? std::string(row[i]) : std::string();
}

std::optional<std::string> opt_str(MYSQL_ROW row, unsigned i) {
  if (!row[i])
    return std::nullopt;
  return std::string(row[i]);
}

std::optional<int> opt_int(MYSQL_ROW row, unsigned i) {
  if (!row[i])
    return std::nullopt;
  return static_cast<int>(std::strtol(row[i], nullptr, 10));
}

std::optional<double> opt_double(MYSQL_ROW row, unsigned i) {
  if (!row[i])
    return std::nullopt;
  return std::strtod(row[i], nullptr);
}

} // namespace

// Establish connection using URI "tcp://host:port" and credentials
MySQLJamStore::MySQLJamStore(const std::string &uri, const std::string &user,
                             const std::string &pass,
                             const std::string &schema) {
  conn_ = mysql_init(nullptr);
  if (!conn_)
    throw StoreError("mysql_init failed");
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
    throw StoreError("connect failed: " + err);
  }
}

MySQLJamStore::~MySQLJamStore() { mysql_close(conn_); }

void MySQLJamStore::exec(const char *sql) {
  if (mysql_query(conn_, sql))
    throw StoreError(mysql_error(conn_));
}

MYSQL_RES *MySQLJamStore::query(const std::string &sql) {
  if (mysql_real_query(conn_, sql.c_str(), sql.size()))
    throw StoreError(mysql_error(conn_));
  MYSQL_RES *res = mysql_store_result(conn_);
  if (!res)
    throw StoreError(std::string("no result set: ") + mysql_error(conn_));
  return res;
}

void MySQLJamStore::begin() { exec("START TRANSACTION"); }

void MySQLJamStore::commit() { exec("COMMIT"); }

void MySQLJamStore::rollback() { exec("ROLLBACK"); }

std::vector<SectionRow> MySQLJamStore::load_sections() {
  static const char *SQL = R"SQL(
      SELECT SctnId, SctnDscNome,
             SctnDscCoordxUtmComeco, SctnDscCoordyUtmComeco,
             SctnDscCoordxUtmMeio, SctnDscCoordyUtmMeio,
             SctnDscCoordxUtmFinal, SctnDscCoordyUtmFinal,
             SctnQtdLength
      FROM Section
      ORDER BY SctnId
    )SQL";

  ResultPtr res(query(SQL));
  std::vector<SectionRow> out;
  out.reserve(mysql_num_rows(res.get()));
  while (MYSQL_ROW row = mysql_fetch_row(res.get())) {
    SectionRow s;
    s.id = field_ll(row, 0);
    s.street_name = field_str(row, 1);
    s.start = PlanarPoint(field_double(row, 2), field_double(row, 3));
    s.middle = PlanarPoint(field_double(row, 4), field_double(row, 5));
    s.end = PlanarPoint(field_double(row, 6), field_double(row, 7));
    s.length_m = row[8] ? field_double(row, 8) : 0.0;
    out.push_back(std::move(s));
  }
  return out;
}

long long MySQLJamStore::count_jams() {
  ResultPtr res(query("SELECT COUNT(*) FROM Jam"));
  MYSQL_ROW row = mysql_fetch_row(res.get());
  if (!row)
    throw StoreError("COUNT(*) returned no row");
  return field_ll(row, 0);
}

std::vector<JamRow> MySQLJamStore::load_jam_page(long long offset,
                                                 long long limit) {
  // Integers only, formatted directly into the statement.
  const std::string sql =
      "SELECT JamId, JamUuid, JamDateStart, JamDateEnd, "
      "JamDscCoordinatesLonLat, JamDscStreet, JamDscCity, "
      "JamIndLevelOfTraffic, JamTimeDelayInSeconds, JamSpdMetersPerSecond, "
      "JamQtdLengthMeters "
      "FROM Jam ORDER BY JamDateStart, JamId LIMIT " +
      std::to_string(limit) + " OFFSET " + std::to_string(offset);

  ResultPtr res(query(sql));
  std::vector<JamRow> out;
  out.reserve(mysql_num_rows(res.get()));
  while (MYSQL_ROW row = mysql_fetch_row(res.get())) {
    JamRow j;
    j.id = field_ll(row, 0);
    j.uuid = field_str(row, 1);
    j.start_time = field_str(row, 2);
    j.end_time = field_str(row, 3);
    const std::string coords = field_str(row, 4);
    j.coords = parse_coords_json(coords);
    if (j.coords.empty() && !coords.empty())
      std::cerr << "[db] jam " << j.id
                << ": unusable coordinate column, jam excluded\n";
    j.street = opt_str(row, 5);
    j.city = opt_str(row, 6);
    j.level = opt_int(row, 7);
    j.delay_s = opt_int(row, 8);
    j.speed_mps = opt_double(row, 9);
    j.length_m = opt_double(row, 10);
    out.push_back(std::move(j));
  }
  return out;
}

// Append matched pairs for one page
void MySQLJamStore::append_jam_per_section(
    const std::vector<JamPerSection> &rows) {
  static const char *SQL = R"SQL(
      INSERT INTO JamPerSection (JamDateStart, JamUuid, SctnId)
      VALUES (?, ?, ?)
    )SQL";

  if (rows.empty())
    return;

  StmtPtr stmt(mysql_stmt_init(conn_));
  if (!stmt)
    throw StoreError("mysql_stmt_init failed");

  if (mysql_stmt_prepare(stmt.get(), SQL, strlen(SQL)))
    throw StoreError(mysql_stmt_error(stmt.get()));

  for (const auto &r : rows) {
    MYSQL_BIND b[3];
    memset(b, 0, sizeof(b));

    // JamDateStart (text, converted by the server)
    unsigned long start_len = r.jam_start_time.size();
    b[0].buffer_type = MYSQL_TYPE_STRING;
    b[0].buffer = (void *)r.jam_start_time.c_str();
    b[0].buffer_length = start_len;
    b[0].length = &start_len;

    // JamUuid
    unsigned long uuid_len = r.jam_uuid.size();
    b[1].buffer_type = MYSQL_TYPE_STRING;
    b[1].buffer = (void *)r.jam_uuid.c_str();
    b[1].buffer_length = uuid_len;
    b[1].length = &uuid_len;

    // SctnId
    long long sid = r.section_id;
    b[2].buffer_type = MYSQL_TYPE_LONGLONG;
    b[2].buffer = &sid;

    if (mysql_stmt_bind_param(stmt.get(), b))
      throw StoreError(mysql_stmt_error(stmt.get()));
    if (mysql_stmt_execute(stmt.get()))
      throw StoreError(mysql_stmt_error(stmt.get()));
  }
}

std::optional<long long> MySQLJamStore::read_checkpoint() {
  ResultPtr res(
      query("SELECT NextOffset FROM JamPerSectionCheckpoint WHERE Id = 1"));
  MYSQL_ROW row = mysql_fetch_row(res.get());
  if (!row || !row[0])
    return std::nullopt;
  return field_ll(row, 0);
}

void MySQLJamStore::write_checkpoint(long long next_offset) {
  const std::string sql =
      "INSERT INTO JamPerSectionCheckpoint (Id, NextOffset) VALUES (1, " +
      std::to_string(next_offset) +
      ") ON DUPLICATE KEY UPDATE NextOffset = VALUES(NextOffset)";
  if (mysql_real_query(conn_, sql.c_str(), sql.size()))
    throw StoreError(mysql_error(conn_));
}
