#pragma once

#include <istream>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>

#include <KrovetzStemmer/KrovetzStemmer.hpp>

namespace tweetprep {

/**
 * Maps a word to its dictionary base form.
 *
 * Dictionary-based implementations return unknown words unchanged. Implementations may keep
 * internal caches, hence `lemmatize` is not `const`.
 */
class Lemmatizer {
  public:
    Lemmatizer();
    Lemmatizer(Lemmatizer const&);
    Lemmatizer(Lemmatizer&&);
    Lemmatizer& operator=(Lemmatizer const&);
    Lemmatizer& operator=(Lemmatizer&&);
    virtual ~Lemmatizer();

    [[nodiscard]] virtual auto lemmatize(std::string const& token) -> std::string = 0;
};

/**
 * Inflectional reduction with the Krovetz stemmer.
 *
 * Words missing from the stemmer's dictionary still go through its suffix rules, e.g., `xyzs`
 * becomes `xyz`, so unknown words are not guaranteed to pass through.
 */
class KrovetzLemmatizer final: public Lemmatizer {
    std::shared_ptr<stem::KrovetzStemmer> m_stemmer = std::make_shared<stem::KrovetzStemmer>();

  public:
    [[nodiscard]] auto lemmatize(std::string const& token) -> std::string override;
};

/**
 * Exact lookup in an exception list of `inflected lemma` pairs, e.g., `geese goose`.
 * Unknown words are returned unchanged.
 */
class DictionaryLemmatizer final: public Lemmatizer {
    std::unordered_map<std::string, std::string> m_lemmas;

  public:
    explicit DictionaryLemmatizer(std::unordered_map<std::string, std::string> lemmas);

    /**
     * Reads whitespace-separated pairs, one per line. Additional lemmas on a line are ignored,
     * as are blank lines and lines starting with `;`.
     *
     * Throws `std::invalid_argument` if a line has a single field.
     */
    [[nodiscard]] static auto read(std::istream& is) -> DictionaryLemmatizer;

    /** Throws `io::NoSuchFile` if the file does not exist. */
    [[nodiscard]] static auto from_file(std::string const& path) -> DictionaryLemmatizer;

    [[nodiscard]] auto lemmatize(std::string const& token) -> std::string override;
    [[nodiscard]] auto size() const noexcept -> std::size_t;
};

/**
 * Returns `krovetz` or `dictionary` lemmatizer. The latter requires a dictionary file.
 */
[[nodiscard]] auto lemmatizer_from_name(
    std::string_view name, std::optional<std::string> const& dictionary_file
) -> std::shared_ptr<Lemmatizer>;

}  // namespace tweetprep
