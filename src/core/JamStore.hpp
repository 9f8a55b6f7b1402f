#pragma once
#include "models/JamModel.hpp"
#include "models/SectionModel.hpp"
#include <optional>
#include <vector>

// Source of sections and jams, and sink for jam/section attributions.
// Implementations report failures by throwing StoreError.
class JamStore {
public:
  virtual ~JamStore() = default;
  virtual void begin() = 0;
  virtual void commit() = 0;
  virtual void rollback() = 0;

  virtual std::vector<SectionRow> load_sections() = 0;
  virtual long long count_jams() = 0;

  // Jams ordered by start time, then id, so offset paging is stable.
  virtual std::vector<JamRow> load_jam_page(long long offset,
                                            long long limit) = 0;

  // Append-only; no uniqueness is enforced.
  virtual void
  append_jam_per_section(const std::vector<JamPerSection> &rows) = 0;

  // Offset of the first page not yet persisted, if a previous run left one.
  virtual std::optional<long long> read_checkpoint() = 0;
  virtual void write_checkpoint(long long next_offset) = 0;
};
