// execution_limits.h - Input validation and output shaping for code runs
#pragma once

#include "execution/execution_types.h"
#include <chrono>
#include <cstddef>
#include <string>
#include <vector>

namespace coderoom::server::execution {

constexpr std::chrono::milliseconds kDefaultTimeout{10000};
constexpr std::chrono::milliseconds kDefaultKillGrace{1000};

constexpr size_t kMaxFiles = 5;
constexpr size_t kMaxFileSize = 10 * 1024;
constexpr size_t kCodeMaxBytes = 100 * 1024;
constexpr size_t kStdinMaxBytes = 1024 * 1024;
constexpr size_t kOutputMaxBytes = 1024 * 1024;

// Validation helpers return false and fill error with a student-facing message

bool ValidateAttachedFiles(const std::vector<AttachedFile>& files, std::string& error);
bool ValidateCodeSize(const std::string& code, std::string& error);
bool ValidateStdinSize(const std::string& stdin_data, std::string& error);

/**
 * Make an attached file name safe to join onto the workspace directory.
 *
 * Path separators and NUL become '_', then every ".." becomes '_', then a leading
 * '.' becomes '_'. Empty or blank names map to "unnamed_file.txt".
 *   "../../../etc/passwd" -> "______etc_passwd"
 *   "...hidden"           -> "_.hidden"
 */
std::string SanitizeFilename(const std::string& name);

// Strip file paths and errno numbers from interpreter error text
std::string SanitizeError(const std::string& text);

// Cap text at max_bytes on a UTF-8 character boundary, appending a marker
std::string TruncateOutput(const std::string& text, size_t max_bytes = kOutputMaxBytes);

extern const char* const kTruncationMarker;
extern const char* const kWaitingForInputMessage;

} // namespace coderoom::server::execution
