#include "tweetprep/lemmatizer.hpp"

#include <stdexcept>

#include <fmt/format.h>
#include <spdlog/spdlog.h>

#include "tweetprep/io.hpp"
#include "tweetprep/token_stream.hpp"

namespace tweetprep {

Lemmatizer::Lemmatizer() = default;
Lemmatizer::Lemmatizer(Lemmatizer const&) = default;
Lemmatizer::Lemmatizer(Lemmatizer&&) = default;
Lemmatizer& Lemmatizer::operator=(Lemmatizer const&) = default;
Lemmatizer& Lemmatizer::operator=(Lemmatizer&&) = default;
Lemmatizer::~Lemmatizer() = default;

auto KrovetzLemmatizer::lemmatize(std::string const& token) -> std::string {
    if (token.empty()) {
        return token;
    }
    return m_stemmer->kstem_stemmer(token);
}

DictionaryLemmatizer::DictionaryLemmatizer(std::unordered_map<std::string, std::string> lemmas)
    : m_lemmas(std::move(lemmas)) {}

auto DictionaryLemmatizer::read(std::istream& is) -> DictionaryLemmatizer {
    std::unordered_map<std::string, std::string> lemmas;
    std::size_t line_number = 0;
    io::for_each_line(is, [&](std::string const& line) {
        ++line_number;
        auto fields = WhitespaceTokenStream(line).collect();
        if (fields.empty() || fields.front().front() == ';') {
            return;
        }
        if (fields.size() < 2) {
            throw std::invalid_argument(
                fmt::format("Malformed lemma dictionary line {}: `{}`", line_number, line)
            );
        }
        lemmas.emplace(std::move(fields[0]), std::move(fields[1]));
    });
    return DictionaryLemmatizer(std::move(lemmas));
}

auto DictionaryLemmatizer::from_file(std::string const& path) -> DictionaryLemmatizer {
    auto is = io::open_input(path);
    auto lemmatizer = read(is);
    spdlog::debug("Loaded {} lemmas from {}", lemmatizer.size(), path);
    return lemmatizer;
}

auto DictionaryLemmatizer::lemmatize(std::string const& token) -> std::string {
    if (auto pos = m_lemmas.find(token); pos != m_lemmas.end()) {
        return pos->second;
    }
    return token;
}

auto DictionaryLemmatizer::size() const noexcept -> std::size_t {
    return m_lemmas.size();
}

auto lemmatizer_from_name(std::string_view name, std::optional<std::string> const& dictionary_file)
    -> std::shared_ptr<Lemmatizer> {
    if (name == "krovetz") {
        return std::make_shared<KrovetzLemmatizer>();
    }
    if (name == "dictionary") {
        if (!dictionary_file) {
            throw std::invalid_argument("dictionary lemmatizer requires a lemma dictionary file");
        }
        return std::make_shared<DictionaryLemmatizer>(
            DictionaryLemmatizer::from_file(*dictionary_file)
        );
    }
    throw std::domain_error(fmt::format("invalid lemmatizer name: {}", name));
}

}  // namespace tweetprep
