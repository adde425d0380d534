// ============================================================================
// pmc/utils.hpp - Utility functions and the progress output sink
// ============================================================================

#ifndef PMC_UTILS_HPP
#define PMC_UTILS_HPP

#include <chrono>
#include <functional>
#include <string>
#include <vector>

namespace pmc {

// ── Output ──────────────────────────────────────────────────────────────────
// Components report progress through an OutputSink instead of writing to a
// stream themselves.  An empty sink discards the messages.

using OutputSink = std::function<void(const std::string&)>;

/// Sink writing one line per message to std::cout.
OutputSink console_output();

/// Deliver `message` to `sink` if the sink is set.
void emit(const OutputSink& sink, const std::string& message);

/// Format a duration as seconds with millisecond resolution ("1.234s").
std::string format_seconds(std::chrono::steady_clock::duration d);

// ── File I/O ────────────────────────────────────────────────────────────────

/// Read a text file and return its content as a vector of lines.
/// Throws std::runtime_error if the file cannot be opened.
std::vector<std::string> read_lines(const std::string& path);

/// Write `content` to `path`.  Throws std::runtime_error on failure.
void write_file(const std::string& path, const std::string& content);

// ── String helpers ──────────────────────────────────────────────────────────

/// Trim leading and trailing whitespace from a string.
std::string trim(const std::string& s);

/// Strip an inline comment (everything from the first '#' onward).
/// Returns the portion before '#', trimmed.
std::string strip_comment(const std::string& line);

/// Return true if the line is empty or consists only of whitespace
/// (after comment stripping).
bool is_blank_or_comment(const std::string& line);

}  // namespace pmc

#endif  // PMC_UTILS_HPP
