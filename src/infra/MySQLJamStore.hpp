#pragma once
#include "core/JamStore.hpp"
#include <mysql/mysql.h>
#include <string>

class MySQLJamStore final : public JamStore {
public:
  MySQLJamStore(const std::string &uri, const std::string &user,
                const std::string &pass, const std::string &schema);
  ~MySQLJamStore();

  MySQLJamStore(const MySQLJamStore &) = delete;
  MySQLJamStore &operator=(const MySQLJamStore &) = delete;

  void begin() override;
  void commit() override;
  void rollback() override;
  std::vector<SectionRow> load_sections() override;
  long long count_jams() override;
  std::vector<JamRow> load_jam_page(long long offset, long long limit) override;
  void append_jam_per_section(const std::vector<JamPerSection> &rows) override;
  std::optional<long long> read_checkpoint() override;
  void write_checkpoint(long long next_offset) override;

private:
  void exec(const char *sql);
  MYSQL_RES *query(const std::string &sql);

  MYSQL *conn_ = nullptr;
};
