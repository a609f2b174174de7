#include "logger.hpp"
#include <zlib.h>
#include <algorithm>
#include <atomic>
#include <cctype>
#include <chrono>
#include <ctime>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <mutex>
#include <nlohmann/json.hpp>

namespace fs = std::filesystem;

static std::ofstream g_log_ofs;
static std::string g_log_path; // NOLINT(runtime/string)
static std::atomic<LogLevel> g_min_level{LogLevel::INFO};
static std::atomic<size_t> g_max_size{0};
static std::atomic<size_t> g_max_files{1};
static std::atomic<bool> g_json_log{false};
static std::atomic<bool> g_compress_logs{false};
static std::atomic<bool> g_console{true};
static std::mutex g_log_mtx;

// Local time as YYYY-MM-DD HH:MM:SS.
static std::string timestamp() {
    std::time_t t = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
    std::tm tm{};
#ifdef _WIN32
    localtime_s(&tm, &t);
#else
    localtime_r(&t, &tm);
#endif
    char buf[32];
    std::strftime(buf, sizeof(buf), "%Y-%m-%d %H:%M:%S", &tm);
    return buf;
}

bool init_logger(const std::string& path, LogLevel level, size_t max_size, size_t max_files) {
    std::lock_guard<std::mutex> lk(g_log_mtx);
    if (g_log_ofs.is_open()) {
        g_log_ofs.flush();
        g_log_ofs.close();
    }
    g_log_ofs.clear();
    g_min_level.store(level);
    g_max_size.store(max_size);
    g_max_files.store(max_files);
    g_log_ofs.open(path, std::ios::app);
    if (!g_log_ofs.is_open()) {
        std::cerr << "Failed to open log file: " << path << std::endl;
        g_log_path.clear();
        return false;
    }
    g_log_path = path;
    return true;
}

void set_log_level(LogLevel level) { g_min_level.store(level); }

LogLevel get_log_level() { return g_min_level.load(); }

void set_json_logging(bool enable) { g_json_log.store(enable); }

void set_log_compression(bool enable) { g_compress_logs.store(enable); }

void set_console_logging(bool enable) { g_console.store(enable); }

bool logger_initialized() {
    std::lock_guard<std::mutex> lk(g_log_mtx);
    return g_log_ofs.is_open();
}

LogLevel parse_log_level(const std::string& text, bool& ok) {
    std::string up = text;
    std::transform(up.begin(), up.end(), up.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    ok = true;
    if (up == "DEBUG")
        return LogLevel::DEBUG;
    if (up == "INFO")
        return LogLevel::INFO;
    if (up == "WARNING" || up == "WARN")
        return LogLevel::WARNING;
    if (up == "ERROR")
        return LogLevel::ERR;
    ok = false;
    return LogLevel::INFO;
}

static const char* level_label(LogLevel level) {
    switch (level) {
    case LogLevel::DEBUG:
        return "DEBUG";
    case LogLevel::INFO:
        return "INFO";
    case LogLevel::WARNING:
        return "WARNING";
    case LogLevel::ERR:
        return "ERROR";
    }
    return "INFO";
}

static bool gzip_file(const std::string& src, const std::string& dst) {
    std::ifstream in(src, std::ios::binary);
    gzFile out = gzopen(dst.c_str(), "wb");
    if (!in.is_open() || out == nullptr) {
        if (out)
            gzclose(out);
        return false;
    }
    char buf[8192];
    while (in) {
        in.read(buf, sizeof(buf));
        std::streamsize n = in.gcount();
        if (n > 0)
            gzwrite(out, buf, static_cast<unsigned int>(n));
    }
    return gzclose(out) == Z_OK;
}

// Shift path.N -> path.N+1, dropping the oldest, then move the active file to
// path.1. Caller holds g_log_mtx and has closed the stream.
static void rotate_files() {
    std::error_code ec;
    const size_t keep = g_max_files.load();
    const std::string suffix = g_compress_logs.load() ? ".gz" : "";
    if (keep > 0) {
        for (size_t i = keep; i > 0; --i) {
            fs::path src = g_log_path + "." + std::to_string(i) + suffix;
            if (i == keep)
                fs::remove(src, ec);
            else
                fs::rename(src, g_log_path + "." + std::to_string(i + 1) + suffix, ec);
        }
        fs::path first = g_log_path + ".1";
        fs::rename(g_log_path, first, ec);
        if (!suffix.empty()) {
            fs::path gz = first;
            gz += suffix;
            if (gzip_file(first.string(), gz.string()))
                fs::remove(first, ec);
        }
    }
    g_log_ofs.open(g_log_path, std::ios::trunc);
}

static std::string format_entry(LogLevel level, const std::string& msg,
                                const std::map<std::string, std::string>& fields) {
    std::string ts = timestamp();
    if (g_json_log.load()) {
        nlohmann::json j;
        j["timestamp"] = ts;
        j["level"] = level_label(level);
        j["msg"] = msg;
        for (const auto& [k, v] : fields)
            j[k] = v;
        return j.dump();
    }
    std::string line = "[" + ts + "] [" + level_label(level) + "] " + msg;
    for (const auto& [k, v] : fields)
        line += " " + k + "=" + v;
    return line;
}

static void write_entry(LogLevel level, const std::string& msg,
                        const std::map<std::string, std::string>& fields) {
    if (level < g_min_level.load())
        return;
    std::lock_guard<std::mutex> lk(g_log_mtx);
    bool to_file = g_log_ofs.is_open();
    bool to_console = g_console.load();
    if (!to_file && !to_console)
        return;
    std::string line = format_entry(level, msg, fields);
    if (to_console)
        std::cerr << line << "\n";
    if (!to_file)
        return;
    g_log_ofs << line << "\n";
    if (g_max_size.load() == 0)
        return;
    g_log_ofs.flush();
    std::error_code ec;
    auto size = fs::file_size(g_log_path, ec);
    if (!ec && size > g_max_size.load()) {
        g_log_ofs.close();
        rotate_files();
    }
}

void log_event(LogLevel level, const std::string& message) { write_entry(level, message, {}); }

void log_event(LogLevel level, const std::string& message,
               const std::map<std::string, std::string>& fields) {
    write_entry(level, message, fields);
}

void log_debug(const std::string& msg) { write_entry(LogLevel::DEBUG, msg, {}); }
void log_debug(const std::string& msg, const std::map<std::string, std::string>& fields) {
    write_entry(LogLevel::DEBUG, msg, fields);
}
void log_info(const std::string& msg) { write_entry(LogLevel::INFO, msg, {}); }
void log_info(const std::string& msg, const std::map<std::string, std::string>& fields) {
    write_entry(LogLevel::INFO, msg, fields);
}
void log_warning(const std::string& msg) { write_entry(LogLevel::WARNING, msg, {}); }
void log_warning(const std::string& msg, const std::map<std::string, std::string>& fields) {
    write_entry(LogLevel::WARNING, msg, fields);
}
void log_error(const std::string& msg) { write_entry(LogLevel::ERR, msg, {}); }
void log_error(const std::string& msg, const std::map<std::string, std::string>& fields) {
    write_entry(LogLevel::ERR, msg, fields);
}

void flush_logger() {
    std::lock_guard<std::mutex> lk(g_log_mtx);
    if (g_log_ofs.is_open())
        g_log_ofs.flush();
    std::cerr.flush();
}

void shutdown_logger() {
    std::lock_guard<std::mutex> lk(g_log_mtx);
    if (g_log_ofs.is_open()) {
        g_log_ofs.flush();
        g_log_ofs.close();
    }
    g_log_path.clear();
    g_max_size.store(0);
    g_max_files.store(1);
    g_json_log.store(false);
    g_compress_logs.store(false);
}
