// ============================================================================
// utils.cpp - File I/O, string utilities and output sinks
// ============================================================================

#include "pmc/utils.hpp"

#include <fstream>
#include <iomanip>
#include <iostream>
#include <sstream>
#include <stdexcept>

namespace pmc {

// ── Output ──────────────────────────────────────────────────────────────────

OutputSink console_output() {
    return [](const std::string& message) { std::cout << message << "\n"; };
}

void emit(const OutputSink& sink, const std::string& message) {
    if (sink) sink(message);
}

std::string format_seconds(std::chrono::steady_clock::duration d) {
    std::ostringstream oss;
    oss << std::fixed << std::setprecision(3)
        << std::chrono::duration<double>(d).count() << "s";
    return oss.str();
}

// ── read_lines ──────────────────────────────────────────────────────────────

std::vector<std::string> read_lines(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        throw std::runtime_error("cannot open file: " + path);
    }

    std::vector<std::string> lines;
    std::string line;
    while (std::getline(file, line)) {
        lines.push_back(std::move(line));
    }
    return lines;
}

// ── write_file ──────────────────────────────────────────────────────────────

void write_file(const std::string& path, const std::string& content) {
    std::ofstream file(path);
    if (!file.is_open()) {
        throw std::runtime_error("cannot write file: " + path);
    }
    file << content;
}

// ── trim ────────────────────────────────────────────────────────────────────

std::string trim(const std::string& s) {
    auto start = s.find_first_not_of(" \t\r\n");
    if (start == std::string::npos) return "";
    auto end = s.find_last_not_of(" \t\r\n");
    return s.substr(start, end - start + 1);
}

// ── strip_comment ───────────────────────────────────────────────────────────

std::string strip_comment(const std::string& line) {
    auto pos = line.find('#');
    if (pos == std::string::npos) {
        return trim(line);
    }
    return trim(line.substr(0, pos));
}

// ── is_blank_or_comment ─────────────────────────────────────────────────────

bool is_blank_or_comment(const std::string& line) {
    return strip_comment(line).empty();
}

}  // namespace pmc
