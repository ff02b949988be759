#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <vector>

namespace reader {

/// Structural kind of a span of plain text, as reported by the parsing layer
enum class SectionKind {
    Header,
    Paragraph,
    CodeBlock,
    List,
    Blockquote
};

const char* to_string(SectionKind kind);

/// A typed span of the document's plain text. Offsets are UTF-8 byte offsets.
struct ContentSection {
    size_t start_index = 0;
    size_t end_index = 0;                         ///< Exclusive
    SectionKind kind = SectionKind::Paragraph;
    std::optional<int> level;                     ///< Heading level (1-6) for headers
    bool skippable = false;                       ///< Technical content, announced instead of read
    std::optional<std::string> language;          ///< Fence tag when the parser kept it

    size_t length() const { return end_index > start_index ? end_index - start_index : 0; }
    bool empty() const { return end_index <= start_index; }
    bool contains(size_t position) const { return position >= start_index && position < end_index; }
};

/// Plain text plus its ordered, non-overlapping sections
struct Document {
    std::string plain_text;
    std::vector<ContentSection> sections;

    bool empty() const;

    /// Sort sections by start and clamp their ends to the text length
    void normalize();

    /// Section containing @p position. Positions in a separator gap map to the
    /// following section, positions past the last section to the last one.
    /// Returns nullopt only when there are no sections.
    std::optional<size_t> section_index_at(size_t position) const;
};

/// Appends typed blocks of plain text and records their offsets.
/// Used by the console reader and tests to assemble documents without a parser.
class DocumentBuilder {
public:
    explicit DocumentBuilder(std::string separator = "\n\n");

    DocumentBuilder& header(const std::string& text, int level = 1);
    DocumentBuilder& paragraph(const std::string& text);
    DocumentBuilder& list(const std::string& text);
    DocumentBuilder& blockquote(const std::string& text);

    /// Appends a fenced block ("```lang\n...\n```"). Language tag is recorded
    /// on the section only when @p record_language is set; otherwise it must be
    /// recovered from the fence line.
    DocumentBuilder& code_block(const std::string& code, const std::string& language = "",
                                bool record_language = false);

    DocumentBuilder& section(const std::string& text, SectionKind kind, bool skippable,
                             std::optional<int> level = std::nullopt,
                             std::optional<std::string> language = std::nullopt);

    Document build() const { return doc_; }

private:
    std::string separator_;
    Document doc_;
};

} // namespace reader
