//
// Created by Giuseppe Francione on 09/12/25.
//

#include "report_generator.hpp"
#include "../utils/color.hpp"
#include "../../../libarchivist/include/file_utils.hpp"
#include <algorithm>
#include <iomanip>
#include <iterator>
#include <iostream>
#include <sstream>

#ifdef _WIN32

#include <windows.h>
#include <io.h>      // _isatty, _fileno
#define isatty _isatty
#define fileno _fileno

#else

#include <sys/ioctl.h>
#include <unistd.h>

#endif

static bool is_stderr_a_tty() {
    return isatty(fileno(stderr)) != 0;
}

unsigned get_terminal_width() {
#ifdef _WIN32
    CONSOLE_SCREEN_BUFFER_INFO csbi;
    if (GetConsoleScreenBufferInfo(GetStdHandle(STD_OUTPUT_HANDLE), &csbi))
        return csbi.srWindow.Right - csbi.srWindow.Left + 1;
    return 80;
#else
    winsize w{};
    if (ioctl(STDERR_FILENO, TIOCGWINSZ, &w) == 0 && w.ws_col > 0)
        return w.ws_col;
    return 80;
#endif
}

std::string format_bytes(const std::uintmax_t bytes) {
    constexpr const char* units[] = {"B", "KB", "MB", "GB", "TB"};
    double value = static_cast<double>(bytes);
    std::size_t unit = 0;
    while (value >= 1024.0 && unit + 1 < std::size(units)) {
        value /= 1024.0;
        ++unit;
    }
    std::ostringstream oss;
    oss << std::fixed << std::setprecision(unit == 0 ? 0 : 1) << value << " " << units[unit];
    return oss.str();
}

void print_progress_bar(const archivist::ScanProgress& p) {
    const unsigned term_width = get_terminal_width();
    const unsigned bar_width = std::max(10u, term_width > 50u ? term_width - 50u : 20u);

    const std::size_t done = p.processed_files;
    const std::size_t total = p.total_files;
    const double progress = total ? static_cast<double>(done) / static_cast<double>(total) : (p.is_completed ? 1.0 : 0.0);
    const auto pos = static_cast<unsigned>(bar_width * std::min(progress, 1.0));

    double percent = progress * 100.0;
    if (!p.is_completed && done < total && percent >= 99.95) {
        percent = 99.9;
    }

    std::cerr << "\r[";
    for (unsigned i = 0; i < bar_width; ++i) {
        if (i < pos) std::cerr << "=";
        else if (i == pos && done < total) std::cerr << ">";
        else std::cerr << " ";
    }
    std::cerr << "] "
              << std::setw(5) << std::fixed << std::setprecision(1) << percent << "%"
              << " (" << done << "/" << total << ")"
              << " found: " << p.items_found
              << " elapsed: " << std::fixed << std::setprecision(1)
              << static_cast<double>(p.elapsed.count()) / 1000.0 << "s"
              << std::flush;
    if (p.is_completed) std::cerr << "\n";
}

void print_scan_report(const archivist::ScanSummary& s, const unsigned num_threads) {
    const bool colors = is_stderr_a_tty();
    const double seconds = static_cast<double>(s.elapsed.count()) / 1000.0;
    const double rate = seconds > 0.0 ? static_cast<double>(s.processed_files) / seconds : 0.0;

    auto row = [](const char* label, const auto& value) {
        std::cerr << "  " << std::left << std::setw(24) << label << value << "\n";
    };

    std::cerr << "\n=== Scan report ===\n";
    row("Directories", s.directories);
    row("Files discovered", s.total_files);
    row("Files processed", s.processed_files);
    row("Archives indexed", s.archives_indexed);
    row("  new", s.archives_new);
    row("Archives skipped", s.archives_below_ratio);
    row("Archives failed", s.archives_failed);
    row("Images indexed", s.images_indexed);
    row("Images skipped", s.images_skipped);
    row("Invalid files", s.invalid_files);
    row("Records inserted", s.items_inserted);

    std::ostringstream time;
    time << std::fixed << std::setprecision(2) << seconds << " s (" << num_threads << " thread"
         << (num_threads > 1U ? "s" : "") << ")";
    row("Total time", time.str());

    std::ostringstream throughput;
    throughput << std::fixed << std::setprecision(1) << rate << " files/s";
    row("Throughput", throughput.str());

    if (s.cancelled) {
        std::cerr << (colors ? YELLOW : "") << "Scan interrupted; unfinished directories stay due."
                  << (colors ? RESET : "") << "\n";
    }
}

void print_plan(const archivist::ScanPlan& plan) {
    std::cout << "To scan (" << plan.to_scan.size() << "):\n";
    for (const auto& d : plan.to_scan) std::cout << "  " << d.string() << "\n";
    std::cout << "To purge (" << plan.to_purge.size() << "):\n";
    for (const auto& d : plan.to_purge) std::cout << "  " << d.string() << "\n";
}

void print_history(const std::vector<archivist::ScanHistoryRecord>& history) {
    if (history.empty()) {
        std::cout << "No scans recorded.\n";
        return;
    }
    std::cout << std::left << std::setw(22) << "Date"
              << std::setw(14) << "Type"
              << std::setw(10) << "Files"
              << std::setw(12) << "Processed"
              << "Time(s)\n";
    for (const auto& h : history) {
        std::ostringstream secs;
        secs << std::fixed << std::setprecision(2) << static_cast<double>(h.elapsed_ms) / 1000.0;
        std::cout << std::left << std::setw(22) << archivist::format_local_time(h.scan_date, "%F %T")
                  << std::setw(14) << archivist::scan_type_to_string(h.scan_type)
                  << std::setw(10) << h.file_count
                  << std::setw(12) << h.processed_count
                  << secs.str() << "\n";
    }
}
