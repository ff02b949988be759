#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <vector>

#include "reader/document.hpp"
#include "reader/utterance.hpp"

namespace reader {

/// Result of one chunking pass
struct ChunkBatch {
    std::vector<Utterance> utterances;
    size_t next_position = 0;     ///< Where the following pass should resume
    bool reached_end = false;     ///< No sections remain after next_position
};

/**
 * @brief Splits document sections into speakable utterances on demand
 *
 * Prose sections are broken at sentence ends and packed greedily toward a
 * target length. Skippable sections become a single placeholder carrying
 * code-block start/end events. An utterance never spans two sections.
 *
 * The chunker keeps no state between calls; the caller owns the cursor.
 */
class Chunker {
public:
    struct Config {
        size_t target_chars = 220;            ///< Stop packing sentences once a chunk reaches this
        size_t max_chars = 300;               ///< Hard ceiling; longer sentences are split at whitespace
        bool skip_technical_sections = false; ///< Drop skippable sections entirely
    };

    Chunker() = default;
    explicit Chunker(const Config& config) : config_(config) {}

    const Config& config() const { return config_; }
    void set_config(const Config& config) { config_ = config; }

    /**
     * @brief Produce up to @p max_utterances utterances starting at @p from_position
     * @param document Normalized document (sections sorted, ends clamped)
     * @param from_position Character offset; clamped to the text length. Taken exactly, so a
     *        previous batch's next_position continues where it stopped.
     */
    ChunkBatch next_chunks(const Document& document, size_t from_position, size_t max_utterances) const;

    /// Move an arbitrary seek target (resume point, rewind estimate) back to the start of the
    /// word it falls in, never before its section. Positions in whitespace or gaps are unchanged.
    static size_t align_to_word_start(const Document& document, size_t position);

    /// "[python code]", or "[code]" without a language
    static std::string placeholder_text(const std::optional<std::string>& language);

    /// Lower-cased language tag of the section, from the recorded tag or the opening fence line
    static std::optional<std::string> section_language(const Document& document, const ContentSection& section);

    /// End of a fenced block starting in [start, end). Unterminated fences run to the end of the text.
    /// Returns @p end when the range does not open with a fence.
    static size_t fenced_block_end(const std::string& text, size_t start, size_t end);

private:
    Utterance make_placeholder(const Document& document, size_t section_index, size_t start, size_t end) const;

    // Returns true when the prose range was fully consumed; @p position receives the resume offset.
    bool chunk_prose(const Document& document, size_t section_index, size_t start, size_t end,
                     size_t budget, std::vector<Utterance>& out, size_t& position) const;

    Config config_;
};

} // namespace reader
