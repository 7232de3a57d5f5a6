#pragma once
#include <string>

// Line-at-a-time logging shared by the worker loops. Lines are tagged "[model-link]".
void log_info(const std::string& msg);
void log_warn(const std::string& msg);
void log_error(const std::string& msg);
