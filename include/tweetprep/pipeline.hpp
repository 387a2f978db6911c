#pragma once

#include <functional>
#include <memory>
#include <string>
#include <type_traits>
#include <utility>
#include <vector>

#include "transform.hpp"

namespace tweetprep {

/**
 * An ordered chain of transforms, applied left to right.
 *
 * The pipeline type carries the input shape of the first transform and the output shape of the
 * last one. Appending a transform that does not accept the current output shape fails to compile,
 * e.g., `Lowercase` cannot follow `ConcatWords`.
 *
 * Transforms are shared between copies of a pipeline, so appending to a copy never affects the
 * original.
 */
template <typename In, typename Out>
class Pipeline {
    template <typename, typename>
    friend class Pipeline;

    std::function<Out(In)> m_run;
    std::vector<std::string> m_names;

    Pipeline(std::function<Out(In)> run, std::vector<std::string> names)
        : m_run(std::move(run)), m_names(std::move(names)) {}

  public:
    using input_type = In;
    using output_type = Out;

    template <typename T>
    explicit Pipeline(std::shared_ptr<T> transform)
        : m_names{std::string(transform->name())} {
        static_assert(
            std::is_same_v<typename T::input_type, In> && std::is_same_v<typename T::output_type, Out>,
            "transform shapes must match the pipeline shapes"
        );
        m_run = [transform = std::move(transform)](In input) {
            return transform->apply(std::move(input));
        };
    }

    /**
     * Returns a new pipeline with `transform` appended.
     */
    template <typename T>
    [[nodiscard]] auto then(std::shared_ptr<T> transform) const
        -> Pipeline<In, typename T::output_type> {
        static_assert(
            std::is_same_v<typename T::input_type, Out>,
            "transform input shape must match the pipeline output shape"
        );
        using Next = typename T::output_type;
        auto names = m_names;
        names.emplace_back(transform->name());
        return Pipeline<In, Next>(
            [run = m_run, transform = std::move(transform)](In input) -> Next {
                return transform->apply(run(std::move(input)));
            },
            std::move(names)
        );
    }

    /**
     * Constructs a transform of type `T` and appends it.
     */
    template <typename T, typename... Args>
    [[nodiscard]] auto emplace(Args&&... args) const -> Pipeline<In, typename T::output_type> {
        return then(std::make_shared<T const>(std::forward<Args>(args)...));
    }

    [[nodiscard]] auto apply(In input) const -> Out { return m_run(std::move(input)); }

    /** Number of transforms in the pipeline. */
    [[nodiscard]] auto size() const noexcept -> std::size_t { return m_names.size(); }

    /** Names of the transforms, in the order of application. */
    [[nodiscard]] auto names() const noexcept -> std::vector<std::string> const& {
        return m_names;
    }
};

/**
 * Constructs a single-transform pipeline, to be extended with `then` or `emplace`.
 */
template <typename T, typename... Args>
[[nodiscard]] auto make_pipeline(Args&&... args)
    -> Pipeline<typename T::input_type, typename T::output_type> {
    return Pipeline<typename T::input_type, typename T::output_type>(
        std::make_shared<T const>(std::forward<Args>(args)...)
    );
}

}  // namespace tweetprep
