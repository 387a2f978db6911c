#define CATCH_CONFIG_MAIN
#include "catch2/catch.hpp"

#include <cstring>
#include <fstream>
#include <stdexcept>

#include <CLI/CLI.hpp>

#include "../app.hpp"
#include "temporary_directory.hpp"
#include "tweetprep/io.hpp"

using namespace tweetprep;

/**
 * A wrapper constructing and destroying an argument list, to pass to CLI parse
 * function, which only supports passing raw char** but not vectors.
 */
struct Arguments {
    int argc;
    char** argv;

    explicit Arguments(std::vector<std::string> const& args)
        : argc(args.size() + 1), argv(new char*[argc]) {
        std::string name = "<executable>";
        argv[0] = new char[name.size() + 1];
        std::strcpy(argv[0], name.c_str());
        for (int i = 1; i < argc; ++i) {
            argv[i] = new char[args[i - 1].size() + 1];
            std::strcpy(argv[i], args[i - 1].c_str());
        }
    }
    Arguments(Arguments const&) = delete;
    Arguments& operator=(Arguments const&) = delete;
    Arguments(Arguments&&) = delete;
    Arguments& operator=(Arguments&&) = delete;
    ~Arguments() {
        while (argc-- > 0) {
            delete[] argv[argc];
        }
        delete[] argv;
    }
};

/**
 * Parses the CLI input using the given arguments.
 *
 * `CLI11_PARSE` exits when parsing fails; here errors must propagate, so `CLI::App::parse`
 * is called directly.
 */
void parse(CLI::App& app, std::vector<std::string> const& args) {
    ::Arguments input(args);
    app.parse(input.argc, input.argv);
}

TEST_CASE("Batch", "[cli]") {
    PreprocessApp app("Batch test");
    SECTION("Defaults to standard streams") {
        REQUIRE_NOTHROW(parse(app, {}));
        REQUIRE_FALSE(app.input_file().has_value());
        REQUIRE_FALSE(app.output_file().has_value());
        REQUIRE_FALSE(app.records());
    }
    SECTION("Files and records") {
        REQUIRE_NOTHROW(parse(app, {"-i", "in.tsv", "--output", "out.tsv", "--records"}));
        REQUIRE(app.input_file() == std::optional<std::string>("in.tsv"));
        REQUIRE(app.output_file() == std::optional<std::string>("out.tsv"));
        REQUIRE(app.records());
    }
}

TEST_CASE("Transforms", "[cli]") {
    PreprocessApp app("Transforms test");
    SECTION("Tweet preset by default") {
        REQUIRE_NOTHROW(parse(app, {}));
        REQUIRE(app.transform_names() == tweet_transform_names());
        REQUIRE(
            app.pipeline().apply("RT @user: Check this outttt!! http://t.co/abc123")
            == "<username> check this out <url>"
        );
    }
    SECTION("Named transforms in order") {
        REQUIRE_NOTHROW(parse(app, {"-T", "lowercase", "digits", "--transforms", "length"}));
        REQUIRE(app.transform_names() == std::vector<std::string>{"lowercase", "digits", "length"});
        REQUIRE(app.pipeline().apply("ABC1 de2 f33 Ghij") == "abc ghij");
    }
    SECTION("Invalid transform name") {
        REQUIRE_THROWS_AS(parse(app, {"-T", "stem"}), CLI::ValidationError);
    }
    SECTION("Transform options") {
        REQUIRE_NOTHROW(parse(
            app,
            {"-T",
             "mention",
             "length",
             "term",
             "--min-word-length",
             "2",
             "--username-token",
             "USER",
             "--remove-term",
             "foo",
             "--remove-term",
             "bar",
             "--case-sensitive"}
        ));
        auto options = app.transform_options();
        REQUIRE(options.min_word_length == 2);
        REQUIRE(options.removed_terms == std::vector<std::string>{"foo", "bar"});
        REQUIRE_FALSE(options.ignore_case);
        REQUIRE(options.lemmatizer == nullptr);
        REQUIRE(app.pipeline().apply("@bob a FOO foo ok barn") == "USER FOO ok");
    }
    SECTION("Exact terms file") {
        TemporaryDirectory tmpdir;
        auto terms_file = (tmpdir.path() / "terms.txt").string();
        {
            std::ofstream os(terms_file);
            os << "the\nand\n";
        }
        REQUIRE_NOTHROW(parse(app, {"-T", "exact-terms", "--exact-terms", terms_file}));
        REQUIRE(app.transform_options().exact_terms == std::vector<std::string>{"the", "and"});
        REQUIRE(app.pipeline().apply("The cat and THE dog") == "cat dog");
    }
    SECTION("Missing exact terms file") {
        REQUIRE_NOTHROW(parse(app, {"-T", "exact-terms", "--exact-terms", "missing.txt"}));
        REQUIRE_THROWS_AS(app.transform_options(), io::NoSuchFile);
    }
    SECTION("Dictionary lemmatizer") {
        TemporaryDirectory tmpdir;
        auto dictionary = (tmpdir.path() / "lemmas.txt").string();
        {
            std::ofstream os(dictionary);
            os << "; lemma dictionary\nmice mouse\nran run\n";
        }
        REQUIRE_NOTHROW(parse(
            app,
            {"-T", "lowercase", "lemmatize", "--lemmatizer", "dictionary", "--lemma-dictionary",
             dictionary}
        ));
        REQUIRE(app.pipeline().apply("Mice RAN away") == "mouse run away");
    }
    SECTION("Default lemmatizer passes unknown words through") {
        TemporaryDirectory tmpdir;
        auto dictionary = (tmpdir.path() / "lemmas.txt").string();
        {
            std::ofstream os(dictionary);
            os << "geese goose\n";
        }
        REQUIRE_NOTHROW(parse(app, {"-T", "lemmatize", "--lemma-dictionary", dictionary}));
        REQUIRE(app.pipeline().apply("geese xyzs playing") == "goose xyzs playing");
    }
    SECTION("Default lemmatizer needs a dictionary") {
        REQUIRE_NOTHROW(parse(app, {"-T", "lemmatize"}));
        REQUIRE_THROWS_AS(app.pipeline(), std::invalid_argument);
    }
    SECTION("Dictionary lemmatizer without dictionary") {
        REQUIRE_NOTHROW(parse(app, {"-T", "lemmatize", "--lemmatizer", "dictionary"}));
        REQUIRE_THROWS_AS(app.pipeline(), std::invalid_argument);
    }
    SECTION("Invalid lemmatizer") {
        REQUIRE_THROWS_AS(parse(app, {"--lemmatizer", "porter"}), CLI::ValidationError);
    }
}

TEST_CASE("LogLevel", "[cli]") {
    PreprocessApp app("Log level test");
    SECTION("Default") {
        REQUIRE_NOTHROW(parse(app, {}));
        REQUIRE(app.log_level() == spdlog::level::level_enum::info);
    }
    SECTION("Short option") {
        REQUIRE_NOTHROW(parse(app, {"-L", "debug"}));
        REQUIRE(app.log_level() == spdlog::level::level_enum::debug);
    }
    SECTION("Invalid level") {
        REQUIRE_THROWS_AS(parse(app, {"--log-level", "verbose"}), CLI::ValidationError);
    }
}
