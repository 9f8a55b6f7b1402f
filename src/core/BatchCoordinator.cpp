// BatchCoordinator drives the run: sections once, then jam pages strictly in
// sequence.

#include "core/BatchCoordinator.hpp"
#include "core/GeometryBuilder.hpp"
#include "core/SpatialMatcher.hpp"
#include <algorithm>
#include <chrono>
#include <cmath>
#include <iostream>

BatchSummary BatchCoordinator::run() {
  BatchSummary summary;
  GeometryBuilder builder(projector_, match_);

  const auto sections = builder.build_sections(store_.load_sections());
  SpatialMatcher matcher(sections);
  std::cout << "[batch] loaded " << sections.size() << " section(s)\n";

  const long long page_size = batch_.page_size;
  summary.total_jams = store_.count_jams();
  summary.pages = summary.total_jams / page_size +
                  (summary.total_jams % page_size != 0 ? 1 : 0);

  long long offset = 0;
  if (batch_.resume) {
    if (auto cp = store_.read_checkpoint()) {
      offset = std::max(0LL, std::min(*cp, summary.total_jams));
      std::cout << "[batch] resuming at offset " << offset << "\n";
    }
  }
  summary.start_offset = offset;

  for (; offset < summary.total_jams; offset += page_size) {
    const auto start = std::chrono::steady_clock::now();

    const auto rows = store_.load_jam_page(offset, page_size);
    const auto jams = builder.build_jams(rows);
    const auto report = matcher.match(jams);
    persist_page(report.pairs, offset, offset + page_size);

    const double secs = std::chrono::duration<double>(
                            std::chrono::steady_clock::now() - start)
                            .count();
    summary.page_seconds.push_back(secs);
    summary.pairs_written += report.pairs.size();
    summary.jams_unmatched += report.unmatched.size();
    ++summary.pages_processed;

    std::cout << "[batch] Batch " << (offset / page_size + 1) << " of "
              << summary.pages << " took " << std::llround(secs)
              << " s to be successfully stored.\n";
  }

  std::cout << "[batch] done: " << summary.pairs_written << " pair(s), "
            << summary.jams_unmatched << " unmatched jam(s) over "
            << summary.pages_processed << " page(s)\n";
  return summary;
}

void BatchCoordinator::persist_page(const std::vector<JamPerSection> &pairs,
                                    long long offset, long long next_offset) {
  store_.begin();
  try {
    store_.append_jam_per_section(pairs);
    store_.write_checkpoint(next_offset);
    store_.commit();
  } catch (const std::exception &e) {
    std::cerr << "[batch] page at offset " << offset
              << " failed: " << e.what() << "\n";
    try {
      store_.rollback();
    } catch (const std::exception &re) {
      std::cerr << "[batch] rollback failed: " << re.what() << "\n";
    }
    throw;
  }
}
