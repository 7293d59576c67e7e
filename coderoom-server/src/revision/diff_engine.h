// diff_engine.h - Reversible text patches between code snapshots
#pragma once

#include <cstddef>
#include <stdexcept>
#include <string>
#include <vector>

namespace coderoom::server::revision {

enum class DiffOp {
    Equal,
    Delete,
    Insert
};

struct DiffChunk {
    DiffOp op;
    std::string text;

    bool operator==(const DiffChunk& other) const {
        return op == other.op && text == other.text;
    }
};

using DiffList = std::vector<DiffChunk>;

// Thrown when a patch is malformed or does not match the text it is applied to
class PatchError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

/**
 * DiffEngine - Byte-level diffs and serializable patches
 *
 * Patch text format, one hunk after another:
 *
 *   @@ -<start_before>,<len_before> +<start_after>,<len_after> @@
 *   <op><percent-encoded text>
 *   ...
 *
 * Offsets are 0-based byte positions. <op> is ' ' (context), '-' (delete)
 * or '+' (insert). Newlines, '%', control bytes and non-ASCII bytes are
 * written as %XX so every chunk fits on one line.
 */
class DiffEngine {
public:
    struct Options {
        // Edit distance beyond which the diff degrades to one delete plus one
        // insert covering the whole changed middle. Keep it above any
        // threshold compared against ChangedVolume().
        size_t max_edit_distance = 2048;

        // Context bytes kept around each change in a patch hunk
        size_t patch_margin = 4;
    };

    DiffEngine();
    explicit DiffEngine(const Options& options);

    DiffList ComputeDiff(const std::string& before, const std::string& after) const;

    // Bytes inserted plus bytes deleted
    static size_t ChangedVolume(const DiffList& diffs);

    std::string MakePatch(const std::string& before, const DiffList& diffs) const;
    std::string MakePatch(const std::string& before, const std::string& after) const;

    // Throws PatchError if the patch cannot be applied to base exactly
    std::string ApplyPatch(const std::string& patch_text, const std::string& base) const;

    const Options& GetOptions() const { return options_; }

    static std::string EncodeText(const std::string& text);
    static std::string DecodeText(const std::string& encoded);

private:
    DiffList DiffMiddle(const std::string& before, const std::string& after) const;

    Options options_;
};

} // namespace coderoom::server::revision
