// diff_engine.cpp - Myers diff and hunk-based patch implementation
#include "revision/diff_engine.h"
#include <spdlog/spdlog.h>
#include <algorithm>
#include <regex>
#include <sstream>

namespace coderoom::server::revision {

namespace {

void AppendChunk(DiffList& diffs, DiffOp op, const std::string& text) {
    if (text.empty()) {
        return;
    }
    if (!diffs.empty() && diffs.back().op == op) {
        diffs.back().text += text;
    } else {
        diffs.push_back(DiffChunk{op, text});
    }
}

char OpPrefix(DiffOp op) {
    switch (op) {
        case DiffOp::Equal: return ' ';
        case DiffOp::Delete: return '-';
        case DiffOp::Insert: return '+';
    }
    return ' ';
}

int HexValue(char c) {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    return -1;
}

struct Hunk {
    size_t start_before = 0;
    size_t start_after = 0;
    size_t len_before = 0;
    size_t len_after = 0;
    DiffList chunks;

    void Add(DiffOp op, const std::string& text) {
        if (text.empty()) {
            return;
        }
        if (op != DiffOp::Insert) len_before += text.size();
        if (op != DiffOp::Delete) len_after += text.size();
        AppendChunk(chunks, op, text);
    }
};

} // anonymous namespace

DiffEngine::DiffEngine() = default;

DiffEngine::DiffEngine(const Options& options)
    : options_(options) {
}

DiffList DiffEngine::ComputeDiff(const std::string& before, const std::string& after) const {
    DiffList diffs;
    if (before == after) {
        AppendChunk(diffs, DiffOp::Equal, before);
        return diffs;
    }

    // Trim common prefix and suffix
    size_t prefix = 0;
    const size_t shorter = std::min(before.size(), after.size());
    while (prefix < shorter && before[prefix] == after[prefix]) {
        ++prefix;
    }
    size_t suffix = 0;
    while (suffix < shorter - prefix &&
           before[before.size() - 1 - suffix] == after[after.size() - 1 - suffix]) {
        ++suffix;
    }

    const std::string mid_before = before.substr(prefix, before.size() - prefix - suffix);
    const std::string mid_after = after.substr(prefix, after.size() - prefix - suffix);

    AppendChunk(diffs, DiffOp::Equal, before.substr(0, prefix));
    for (const auto& chunk : DiffMiddle(mid_before, mid_after)) {
        AppendChunk(diffs, chunk.op, chunk.text);
    }
    AppendChunk(diffs, DiffOp::Equal, before.substr(before.size() - suffix));
    return diffs;
}

DiffList DiffEngine::DiffMiddle(const std::string& a, const std::string& b) const {
    DiffList diffs;
    if (a.empty() || b.empty()) {
        AppendChunk(diffs, DiffOp::Delete, a);
        AppendChunk(diffs, DiffOp::Insert, b);
        return diffs;
    }

    const int n = static_cast<int>(a.size());
    const int m = static_cast<int>(b.size());
    const int max_d = static_cast<int>(std::min<size_t>(a.size() + b.size(), options_.max_edit_distance));
    const int offset = max_d + 1;

    // v[offset + k] = furthest x reached on diagonal k
    std::vector<int> v(2 * static_cast<size_t>(max_d) + 3, 0);
    // trace[d] holds v for diagonals [-d-1, d+1] as it was before step d
    std::vector<std::vector<int>> trace;
    int found_d = -1;

    for (int d = 0; d <= max_d && found_d < 0; ++d) {
        trace.emplace_back(v.begin() + (offset - d - 1), v.begin() + (offset + d + 2));

        for (int k = -d; k <= d; k += 2) {
            int x;
            if (k == -d || (k != d && v[offset + k - 1] < v[offset + k + 1])) {
                x = v[offset + k + 1];
            } else {
                x = v[offset + k - 1] + 1;
            }
            int y = x - k;
            while (x < n && y < m && a[x] == b[y]) {
                ++x;
                ++y;
            }
            v[offset + k] = x;
            if (x >= n && y >= m) {
                found_d = d;
                break;
            }
        }
    }

    if (found_d < 0) {
        spdlog::debug("DiffEngine: edit distance exceeds {}, using coarse diff", max_d);
        AppendChunk(diffs, DiffOp::Delete, a);
        AppendChunk(diffs, DiffOp::Insert, b);
        return diffs;
    }

    // Walk back from (n, m) collecting single-byte operations in reverse
    std::vector<std::pair<DiffOp, char>> reversed;
    reversed.reserve(static_cast<size_t>(n + m));
    int x = n;
    int y = m;
    for (int d = found_d; d > 0; --d) {
        const auto& vd = trace[d];
        auto at = [&vd, d](int k) { return vd[static_cast<size_t>(k + d + 1)]; };

        const int k = x - y;
        int prev_k;
        if (k == -d || (k != d && at(k - 1) < at(k + 1))) {
            prev_k = k + 1;
        } else {
            prev_k = k - 1;
        }
        const int prev_x = at(prev_k);
        const int prev_y = prev_x - prev_k;

        while (x > prev_x && y > prev_y) {
            reversed.emplace_back(DiffOp::Equal, a[x - 1]);
            --x;
            --y;
        }
        if (x == prev_x) {
            reversed.emplace_back(DiffOp::Insert, b[prev_y]);
        } else {
            reversed.emplace_back(DiffOp::Delete, a[prev_x]);
        }
        x = prev_x;
        y = prev_y;
    }
    while (x > 0 && y > 0) {
        reversed.emplace_back(DiffOp::Equal, a[x - 1]);
        --x;
        --y;
    }

    for (auto it = reversed.rbegin(); it != reversed.rend(); ++it) {
        if (!diffs.empty() && diffs.back().op == it->first) {
            diffs.back().text.push_back(it->second);
        } else {
            diffs.push_back(DiffChunk{it->first, std::string(1, it->second)});
        }
    }
    return diffs;
}

size_t DiffEngine::ChangedVolume(const DiffList& diffs) {
    size_t total = 0;
    for (const auto& chunk : diffs) {
        if (chunk.op != DiffOp::Equal) {
            total += chunk.text.size();
        }
    }
    return total;
}

std::string DiffEngine::MakePatch(const std::string& before, const std::string& after) const {
    return MakePatch(before, ComputeDiff(before, after));
}

std::string DiffEngine::MakePatch(const std::string& before, const DiffList& diffs) const {
    const size_t margin = options_.patch_margin;
    std::vector<Hunk> hunks;
    bool open = false;
    size_t pos_before = 0;
    size_t pos_after = 0;

    for (size_t i = 0; i < diffs.size(); ++i) {
        const auto& chunk = diffs[i];

        if (chunk.op == DiffOp::Equal) {
            if (open) {
                const bool last = (i + 1 == diffs.size());
                if (chunk.text.size() <= 2 * margin && !last) {
                    hunks.back().Add(DiffOp::Equal, chunk.text);
                } else {
                    hunks.back().Add(DiffOp::Equal, chunk.text.substr(0, std::min(margin, chunk.text.size())));
                    open = false;
                }
            }
            pos_before += chunk.text.size();
            pos_after += chunk.text.size();
            continue;
        }

        if (!open) {
            Hunk hunk;
            std::string context;
            if (i > 0 && diffs[i - 1].op == DiffOp::Equal) {
                const auto& prev = diffs[i - 1].text;
                context = prev.substr(prev.size() - std::min(margin, prev.size()));
            }
            hunk.start_before = pos_before - context.size();
            hunk.start_after = pos_after - context.size();
            hunk.Add(DiffOp::Equal, context);
            hunks.push_back(std::move(hunk));
            open = true;
        }

        hunks.back().Add(chunk.op, chunk.text);
        if (chunk.op == DiffOp::Delete) {
            pos_before += chunk.text.size();
        } else {
            pos_after += chunk.text.size();
        }
    }

    if (pos_before != before.size()) {
        throw PatchError("Diff does not describe the given text");
    }

    std::ostringstream out;
    for (const auto& hunk : hunks) {
        out << "@@ -" << hunk.start_before << "," << hunk.len_before
            << " +" << hunk.start_after << "," << hunk.len_after << " @@\n";
        for (const auto& chunk : hunk.chunks) {
            out << OpPrefix(chunk.op) << EncodeText(chunk.text) << "\n";
        }
    }
    return out.str();
}

std::string DiffEngine::ApplyPatch(const std::string& patch_text, const std::string& base) const {
    static const std::regex header_re(R"(^@@ -(\d+),(\d+) \+(\d+),(\d+) @@$)");

    std::vector<std::string> lines;
    {
        std::istringstream in(patch_text);
        std::string line;
        while (std::getline(in, line)) {
            lines.push_back(line);
        }
    }

    std::string result;
    result.reserve(base.size());
    size_t cursor = 0;
    size_t i = 0;

    while (i < lines.size()) {
        std::smatch match;
        if (!std::regex_match(lines[i], match, header_re)) {
            throw PatchError("Malformed patch header: " + lines[i]);
        }
        const size_t start_before = std::stoul(match[1].str());
        const size_t len_before = std::stoul(match[2].str());
        const size_t start_after = std::stoul(match[3].str());
        const size_t len_after = std::stoul(match[4].str());
        ++i;

        if (start_before < cursor || start_before > base.size()) {
            throw PatchError("Patch hunk out of range at offset " + std::to_string(start_before));
        }
        result.append(base, cursor, start_before - cursor);
        cursor = start_before;

        if (result.size() != start_after) {
            throw PatchError("Patch hunk target offset mismatch at " + std::to_string(start_after));
        }

        size_t consumed = 0;
        size_t produced = 0;
        while (i < lines.size() && !lines[i].empty() && lines[i][0] != '@') {
            const char op = lines[i][0];
            const std::string text = DecodeText(lines[i].substr(1));
            ++i;

            if (op == '+') {
                result += text;
                produced += text.size();
                continue;
            }
            if (op != ' ' && op != '-') {
                throw PatchError(std::string("Unknown patch operation '") + op + "'");
            }
            if (base.compare(cursor, text.size(), text) != 0) {
                throw PatchError("Patch context does not match base at offset " + std::to_string(cursor));
            }
            cursor += text.size();
            consumed += text.size();
            if (op == ' ') {
                result += text;
                produced += text.size();
            }
        }

        if (consumed != len_before || produced != len_after) {
            throw PatchError("Patch hunk length mismatch at offset " + std::to_string(start_before));
        }
    }

    result.append(base, cursor, std::string::npos);
    return result;
}

std::string DiffEngine::EncodeText(const std::string& text) {
    static const char hex[] = "0123456789ABCDEF";
    std::string out;
    out.reserve(text.size());
    for (unsigned char c : text) {
        if (c < 0x20 || c >= 0x7F || c == '%') {
            out += '%';
            out += hex[c >> 4];
            out += hex[c & 0x0F];
        } else {
            out += static_cast<char>(c);
        }
    }
    return out;
}

std::string DiffEngine::DecodeText(const std::string& encoded) {
    std::string out;
    out.reserve(encoded.size());
    for (size_t i = 0; i < encoded.size(); ++i) {
        if (encoded[i] != '%') {
            out += encoded[i];
            continue;
        }
        if (i + 2 >= encoded.size()) {
            throw PatchError("Truncated escape in patch text");
        }
        int hi = HexValue(encoded[i + 1]);
        int lo = HexValue(encoded[i + 2]);
        if (hi < 0 || lo < 0) {
            throw PatchError("Invalid escape in patch text");
        }
        out += static_cast<char>((hi << 4) | lo);
        i += 2;
    }
    return out;
}

} // namespace coderoom::server::revision
