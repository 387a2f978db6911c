#include "tweetprep/text_record.hpp"

#include <algorithm>
#include <stdexcept>

#include <boost/algorithm/string/join.hpp>
#include <fmt/format.h>

namespace tweetprep {

auto TextRecord::joined_text() const -> std::string {
    if (auto const* tokens = std::get_if<Tokens>(&m_text); tokens != nullptr) {
        return boost::algorithm::join(*tokens, " ");
    }
    return std::get<Text>(m_text);
}

auto TextRecord::operator==(TextRecord const& other) const -> bool {
    return m_id == other.m_id && m_text == other.m_text && m_label == other.m_label;
}

auto TextRecord::operator!=(TextRecord const& other) const -> bool {
    return !(*this == other);
}

auto parse_record(std::string const& line) -> TextRecord {
    auto first_tab = std::find(line.begin(), line.end(), '\t');
    if (first_tab == line.end()) {
        throw std::invalid_argument(fmt::format("Malformed record, missing tab: `{}`", line));
    }
    auto second_tab = std::find(std::next(first_tab), line.end(), '\t');
    std::optional<std::string> label = std::nullopt;
    if (second_tab != line.end()) {
        label = std::string(std::next(second_tab), line.end());
    }
    return TextRecord(
        std::string(line.begin(), first_tab), Text(std::next(first_tab), second_tab), std::move(label)
    );
}

auto read_record(std::istream& is) -> std::optional<TextRecord> {
    std::string line;
    if (!std::getline(is, line)) {
        return std::nullopt;
    }
    return parse_record(line);
}

auto operator<<(std::ostream& os, TextRecord const& record) -> std::ostream& {
    os << record.id() << '\t' << record.joined_text();
    if (record.label()) {
        os << '\t' << *record.label();
    }
    return os;
}

}  // namespace tweetprep
