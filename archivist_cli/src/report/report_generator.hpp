//
// Created by Giuseppe Francione on 09/12/25.
//

#ifndef ARCHIVIST_REPORT_GENERATOR_HPP
#define ARCHIVIST_REPORT_GENERATOR_HPP

#include "../../../libarchivist/include/incremental_scan_controller.hpp"
#include "../../../libarchivist/include/records.hpp"
#include "../../../libarchivist/include/scan_events.hpp"
#include <cstdint>
#include <string>
#include <vector>

/**
 * @brief Terminal width in columns (80 when unknown).
 */
unsigned get_terminal_width();

/**
 * @brief Human-readable byte count (B, KB, MB, GB).
 */
std::string format_bytes(std::uintmax_t bytes);

/**
 * @brief Redraws the single-line progress bar on stderr.
 */
void print_progress_bar(const archivist::ScanProgress& progress);

/**
 * @brief End-of-run report: counts, elapsed time and throughput.
 */
void print_scan_report(const archivist::ScanSummary& summary, unsigned num_threads);

void print_plan(const archivist::ScanPlan& plan);

void print_history(const std::vector<archivist::ScanHistoryRecord>& history);

#endif // ARCHIVIST_REPORT_GENERATOR_HPP
