#pragma once
#include "core/CoordinateProjector.hpp"
#include "core/JamStore.hpp"
#include "models/params.hpp"
#include <cstddef>
#include <vector>

struct BatchSummary {
  long long total_jams = 0;
  long long pages = 0;           // ceil(total_jams / page_size)
  long long start_offset = 0;    // non-zero when resumed from a checkpoint
  long long pages_processed = 0;
  std::size_t pairs_written = 0;
  std::size_t jams_unmatched = 0;
  std::vector<double> page_seconds;
};

// Pages the jam table in start-time order, matches every page against the
// section set loaded once up front, and appends the pairs page by page.
// Each page's rows and the resume offset are committed together; a failure
// rolls the page back and aborts the run.
class BatchCoordinator {
public:
  BatchCoordinator(JamStore &store, const CoordinateProjector &projector,
                   const MatchParams &match, const BatchParams &batch)
      : store_(store), projector_(projector), match_(match), batch_(batch) {}

  BatchSummary run();

private:
  void persist_page(const std::vector<JamPerSection> &pairs, long long offset,
                    long long next_offset);

  JamStore &store_;
  const CoordinateProjector &projector_;
  MatchParams match_;
  BatchParams batch_;
};
