#pragma once

#include <istream>
#include <optional>
#include <ostream>
#include <string>
#include <utility>
#include <variant>

#include "shape.hpp"

namespace tweetprep {

/**
 * A tweet: identifier, text, and an optional label, e.g., a sentiment class.
 *
 * The text is either whole or already split into tokens. Preprocessing only ever replaces
 * the text; the other fields are carried along untouched.
 */
class TextRecord {
  public:
    using text_type = std::variant<Text, Tokens>;

    TextRecord() = default;
    TextRecord(std::string id, text_type text, std::optional<std::string> label = std::nullopt)
        : m_id(std::move(id)), m_text(std::move(text)), m_label(std::move(label)) {}

    [[nodiscard]] auto id() noexcept -> std::string& { return m_id; }
    [[nodiscard]] auto id() const noexcept -> std::string const& { return m_id; }
    [[nodiscard]] auto text() noexcept -> text_type& { return m_text; }
    [[nodiscard]] auto text() const noexcept -> text_type const& { return m_text; }
    [[nodiscard]] auto label() noexcept -> std::optional<std::string>& { return m_label; }
    [[nodiscard]] auto label() const noexcept -> std::optional<std::string> const& {
        return m_label;
    }

    /** Returns the text as a single string, joining tokens with spaces if needed. */
    [[nodiscard]] auto joined_text() const -> std::string;

    [[nodiscard]] auto operator==(TextRecord const& other) const -> bool;
    [[nodiscard]] auto operator!=(TextRecord const& other) const -> bool;

  private:
    std::string m_id;
    text_type m_text;
    std::optional<std::string> m_label;
};

/**
 * Parses a tab-separated `id<TAB>text[<TAB>label]` line.
 *
 * Throws `std::invalid_argument` if the line has no tab.
 */
[[nodiscard]] auto parse_record(std::string const& line) -> TextRecord;

/**
 * Reads the next record from the stream, or returns `std::nullopt` at the end of input.
 */
[[nodiscard]] auto read_record(std::istream& is) -> std::optional<TextRecord>;

/** Writes a record in the format read by `parse_record`, without a trailing newline. */
auto operator<<(std::ostream& os, TextRecord const& record) -> std::ostream&;

}  // namespace tweetprep
