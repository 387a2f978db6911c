#define CATCH_CONFIG_MAIN

#include <memory>
#include <stdexcept>
#include <unordered_map>

#include <catch2/catch.hpp>

#include "tweetprep/token_filter.hpp"

using namespace tweetprep;

namespace {

struct FailingLemmatizer: public Lemmatizer {
    auto lemmatize(std::string const& token) -> std::string override {
        throw std::runtime_error("lemmatizer unavailable: " + token);
    }
};

struct CountingLemmatizer: public Lemmatizer {
    std::size_t calls = 0;
    auto lemmatize(std::string const& token) -> std::string override {
        ++calls;
        return token + "-lemma";
    }
};

}  // namespace

TEST_CASE("Lowercase") {
    Lowercase lowercase;
    REQUIRE(lowercase.apply({"WoRd", "ABC1", "<URL>"}) == Tokens{"word", "abc1", "<url>"});
    REQUIRE(lowercase.apply({}) == Tokens{});
}

TEST_CASE("WordLengthFilter") {
    SECTION("Drops short tokens and trims the rest") {
        WordLengthFilter filter(3);
        REQUIRE(filter.apply({" ab ", "abc", "  abcd ", "a"}) == Tokens{"abc", "abcd"});
    }
    SECTION("Unicode spaces are trimmed") {
        WordLengthFilter filter(3);
        REQUIRE(filter.apply({"\xC2\xA0" "ab\xC2\xA0", "\xE3\x80\x80" "abc"}) == Tokens{"abc"});
    }
    SECTION("Length is counted in code points") {
        WordLengthFilter filter(3);
        REQUIRE(
            filter.apply({"h\xC3\xA9\xC3\xA9", "\xC3\xA9\xC3\xA9"}) == Tokens{"h\xC3\xA9\xC3\xA9"}
        );
    }
    SECTION("Non-positive minimum never filters") {
        REQUIRE(WordLengthFilter(0).apply({"", " a "}) == Tokens{"", "a"});
        REQUIRE(WordLengthFilter(-5).apply({"", "ab"}) == Tokens{"", "ab"});
    }
}

TEST_CASE("PunctuationStrip") {
    SECTION("Keeps hashtags, mentions, and masks") {
        PunctuationStrip strip;
        REQUIRE(strip.apply({"#great!", "@bob,"}) == Tokens{"#great", "@bob"});
        REQUIRE(strip.apply({"<URL>", "<USERNAME>."}) == Tokens{"<URL>", "<USERNAME>"});
    }
    SECTION("Splits on inner punctuation") {
        PunctuationStrip strip;
        REQUIRE(strip.apply({"don't", "well-known"}) == Tokens{"don", "t", "well", "known"});
    }
    SECTION("Drops tokens made of punctuation only") {
        PunctuationStrip strip;
        REQUIRE(strip.apply({"...", "!?", "ok"}) == Tokens{"ok"});
    }
    SECTION("Removes everything") {
        PunctuationStrip strip(true);
        REQUIRE(
            strip.apply({"#great!", "@bob,", "<URL>"}) == Tokens{"great", "bob", "URL"}
        );
    }
    SECTION("Leaves non-ASCII characters") {
        PunctuationStrip strip(true);
        REQUIRE(strip.apply({"caf\xC3\xA9!"}) == Tokens{"caf\xC3\xA9"});
    }
}

TEST_CASE("MentionMask") {
    SECTION("Default token") {
        MentionMask mask;
        REQUIRE(mask.apply({"@alice", "hello"}) == Tokens{"<USERNAME>", "hello"});
        REQUIRE(mask.apply({"@bob:"}) == Tokens{"<USERNAME>"});
        REQUIRE(mask.apply({"hi@bob"}) == Tokens{"hi<USERNAME>"});
        REQUIRE(mask.apply({"@", "email"}) == Tokens{"@", "email"});
    }
    SECTION("Custom token is used verbatim") {
        MentionMask mask("$1\\USER");
        REQUIRE(mask.apply({"@alice"}) == Tokens{"$1\\USER"});
    }
}

TEST_CASE("UrlMask") {
    UrlMask mask;
    REQUIRE(mask.apply({"check", "http://x.co/a"}) == Tokens{"check", "<URL>"});
    REQUIRE(mask.apply({"https://t.co/abc123"}) == Tokens{"<URL>"});
    REQUIRE(mask.apply({"see:http://x.co"}) == Tokens{"see:<URL>"});
    REQUIRE(mask.apply({"http://"}) == Tokens{"<URL>"});
    REQUIRE(mask.apply({"ftp://x.co", "http"}) == Tokens{"ftp://x.co", "http"});
    REQUIRE(UrlMask("LINK").apply({"http://x.co"}) == Tokens{"LINK"});
}

TEST_CASE("RemoveRT") {
    RemoveRT remove;
    REQUIRE(
        remove.apply({"RT", "rt", "rt:", "Rt", "art", "rtx", "hello"})
        == Tokens{"Rt", "art", "rtx", "hello"}
    );
    SECTION("Word boundaries follow Unicode letters") {
        REQUIRE(
            remove.apply({"rt\xC3\xA9", "RT\xC3\xA9t\xC3\xA9", "RT\xE2\x80\xA6", "rt!"})
            == Tokens{"rt\xC3\xA9", "RT\xC3\xA9t\xC3\xA9"}
        );
    }
}

TEST_CASE("RemoveLetterRepetitions") {
    RemoveLetterRepetitions remove;
    REQUIRE(remove.apply({"soooo"}) == Tokens{"so"});
    REQUIRE(remove.apply({"cool"}) == Tokens{"cool"});
    REQUIRE(remove.apply({"hmmm", "aaabbbb"}) == Tokens{"hm", "ab"});
    REQUIRE(remove.apply({"SOOOO", "111"}) == Tokens{"SOOOO", "111"});
}

TEST_CASE("RemoveTerm") {
    SECTION("Ignoring case") {
        RemoveTerm remove("FOO");
        REQUIRE(remove.apply({"Foobar", "bar", "xfoo", "Baz"}) == Tokens{"bar", "Baz"});
    }
    SECTION("Case-sensitive") {
        RemoveTerm remove("Foo", false);
        REQUIRE(remove.apply({"Foobar", "foobar", "FOO"}) == Tokens{"foobar", "FOO"});
    }
}

TEST_CASE("RemoveExactTerms") {
    SECTION("Ignoring case lowercases kept tokens") {
        RemoveExactTerms remove({"The", "a"});
        REQUIRE(
            remove.apply({"the", "The", "apple", "A", "Banana"}) == Tokens{"apple", "banana"}
        );
    }
    SECTION("Case-sensitive compares verbatim") {
        RemoveExactTerms remove({"The"}, false);
        REQUIRE(remove.apply({"the", "The", "Apple"}) == Tokens{"the", "Apple"});
    }
    SECTION("Empty term list") {
        std::vector<std::string> no_terms;
        REQUIRE(RemoveExactTerms(no_terms).apply({"Apple"}) == Tokens{"apple"});
        REQUIRE(RemoveExactTerms(no_terms, false).apply({"Apple"}) == Tokens{"Apple"});
    }
}

TEST_CASE("RemoveEmptyStrings") {
    RemoveEmptyStrings remove;
    REQUIRE(remove.apply({"", " ", "\t", "a", " b "}) == Tokens{"a", " b "});
    REQUIRE(remove.apply({"\xC2\xA0", "\xE2\x80\x83 ", "\xC2\xA0x"}) == Tokens{"\xC2\xA0x"});
}

TEST_CASE("RemoveDigits") {
    RemoveDigits remove;
    REQUIRE(remove.apply({"abc123", "2020", "a1b2"}) == Tokens{"abc", "", "ab"});
}

TEST_CASE("RemoveNonAlphabet") {
    RemoveNonAlphabet remove;
    REQUIRE(
        remove.apply({"h\xC3\xA9llo!", "a1-b_c", "123", "<URL>"}) == Tokens{"hllo", "abc", "", "URL"}
    );
}

TEST_CASE("Lemmatize") {
    SECTION("Unknown words pass through") {
        auto lemmatizer = std::make_shared<DictionaryLemmatizer>(
            std::unordered_map<std::string, std::string>{{"geese", "goose"}, {"were", "be"}}
        );
        Lemmatize lemmatize(lemmatizer);
        REQUIRE(lemmatize.apply({"geese", "were", "cats"}) == Tokens{"goose", "be", "cats"});
    }
    SECTION("Every token is lemmatized") {
        auto lemmatizer = std::make_shared<CountingLemmatizer>();
        Lemmatize lemmatize(lemmatizer);
        REQUIRE(lemmatize.apply({"a", "b"}) == Tokens{"a-lemma", "b-lemma"});
        REQUIRE(lemmatizer->calls == 2);
    }
    SECTION("Lemmatizer failures propagate") {
        Lemmatize lemmatize(std::make_shared<FailingLemmatizer>());
        REQUIRE_THROWS_AS(lemmatize.apply({"word"}), std::runtime_error);
        REQUIRE(lemmatize.apply({}) == Tokens{});
    }
    SECTION("Requires a lemmatizer") {
        REQUIRE_THROWS_AS(Lemmatize(nullptr), std::invalid_argument);
    }
}

TEST_CASE("Transform names") {
    REQUIRE(Lowercase{}.name() == "lowercase");
    REQUIRE(WordLengthFilter{3}.name() == "length");
    REQUIRE(PunctuationStrip{}.name() == "punctuation");
    REQUIRE(MentionMask{}.name() == "mention");
    REQUIRE(UrlMask{}.name() == "url");
    REQUIRE(RemoveRT{}.name() == "rt");
    REQUIRE(RemoveLetterRepetitions{}.name() == "repetitions");
    REQUIRE(RemoveTerm{"x"}.name() == "term");
    REQUIRE(RemoveExactTerms{{"x"}}.name() == "exact-terms");
    REQUIRE(RemoveEmptyStrings{}.name() == "empty");
    REQUIRE(RemoveDigits{}.name() == "digits");
    REQUIRE(RemoveNonAlphabet{}.name() == "non-alphabet");
}
