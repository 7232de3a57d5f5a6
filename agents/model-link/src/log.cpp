#include "../include/log.hpp"
#include <iostream>
#include <mutex>

namespace {
std::mutex g_log_mtx;
const char* kTag = "[model-link] ";
}

void log_info(const std::string& msg) {
    std::lock_guard<std::mutex> lock(g_log_mtx);
    std::cout << kTag << msg << std::endl;
}

void log_warn(const std::string& msg) {
    std::lock_guard<std::mutex> lock(g_log_mtx);
    std::cerr << kTag << "WARN: " << msg << std::endl;
}

void log_error(const std::string& msg) {
    std::lock_guard<std::mutex> lock(g_log_mtx);
    std::cerr << kTag << "ERROR: " << msg << std::endl;
}
