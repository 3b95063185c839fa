#include "util/flags.hpp"

std::string Flags::log_file;
std::string Flags::temp_directory = "/tmp/movebox";
bool Flags::keep_sandboxes = false;

std::string Flags::isolation = "strong";
std::string Flags::board_file;
int32_t Flags::player = 2;
std::string Flags::image = "python:3.9-slim";
std::string Flags::interpreter = "python";
std::string Flags::runtime;
int64_t Flags::timeout_millis = 2000;
int64_t Flags::memory_limit_mb = 128;
int32_t Flags::cpu_percent = 50;
int32_t Flags::pids_limit = 10;
