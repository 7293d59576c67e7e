// execution_limits.cpp - Input validation and output shaping for code runs
#include "execution/execution_limits.h"
#include <algorithm>
#include <cctype>
#include <regex>

namespace coderoom::server::execution {

const char* const kTruncationMarker = "\n... [output truncated]";

const char* const kWaitingForInputMessage =
    "Program appears to be waiting for input, but no more input was provided. "
    "Make sure your code has all the input it needs, or check for extra input() calls.";

bool ValidateAttachedFiles(const std::vector<AttachedFile>& files, std::string& error) {
    if (files.size() > kMaxFiles) {
        error = "Too many files attached (max " + std::to_string(kMaxFiles) + ")";
        return false;
    }

    for (const auto& file : files) {
        if (file.name.empty() || file.content.empty()) {
            error = "Invalid file: name and content are required";
            return false;
        }
        if (file.content.size() > kMaxFileSize) {
            error = "File \"" + file.name + "\" exceeds size limit (" +
                    std::to_string(kMaxFileSize) + " bytes)";
            return false;
        }
    }
    return true;
}

bool ValidateCodeSize(const std::string& code, std::string& error) {
    if (code.size() > kCodeMaxBytes) {
        error = "Code exceeds maximum size of " + std::to_string(kCodeMaxBytes / 1024) + " KB";
        return false;
    }
    // The source travels as an argv string, which ends at the first NUL
    if (code.find('\0') != std::string::npos) {
        error = "Code contains a null character";
        return false;
    }
    return true;
}

bool ValidateStdinSize(const std::string& stdin_data, std::string& error) {
    if (stdin_data.size() > kStdinMaxBytes) {
        error = "Input exceeds maximum size of " + std::to_string(kStdinMaxBytes / 1024) + " KB";
        return false;
    }
    return true;
}

std::string SanitizeFilename(const std::string& name) {
    bool blank = std::all_of(name.begin(), name.end(),
        [](unsigned char c) { return std::isspace(c) != 0; });
    if (blank) {
        return "unnamed_file.txt";
    }

    std::string result = name;
    std::replace(result.begin(), result.end(), '/', '_');
    std::replace(result.begin(), result.end(), '\\', '_');
    std::replace(result.begin(), result.end(), '\0', '_');

    std::string::size_type pos = 0;
    while ((pos = result.find("..", pos)) != std::string::npos) {
        result.replace(pos, 2, "_");
        pos += 1;
    }

    if (!result.empty() && result.front() == '.') {
        result.front() = '_';
    }
    return result;
}

std::string SanitizeError(const std::string& text) {
    static const std::regex file_frame(R"(File "[^"]+")");
    static const std::regex errno_prefix(R"(\[Errno \d+\])");

    std::string result = std::regex_replace(text, file_frame, "File \"<student code>\"");
    return std::regex_replace(result, errno_prefix, "[Error]");
}

std::string TruncateOutput(const std::string& text, size_t max_bytes) {
    if (text.size() <= max_bytes) {
        return text;
    }

    // Back up over continuation bytes so no character is split
    size_t cut = max_bytes;
    while (cut > 0 && (static_cast<unsigned char>(text[cut]) & 0xC0) == 0x80) {
        --cut;
    }
    return text.substr(0, cut) + kTruncationMarker;
}

} // namespace coderoom::server::execution
