#pragma once

#include <string_view>

#include "shape.hpp"

namespace tweetprep {

/**
 * A single normalization step.
 *
 * The input and output shapes are part of the type, so a pipeline can only be assembled from
 * transforms whose shapes line up. For example:
 *  - a splitter takes `Text` and returns `Tokens`,
 *  - a token filter takes `Tokens` and returns `Tokens`, possibly with fewer or more tokens,
 *  - a joiner takes `Tokens` and returns `Text`.
 *
 * Transforms are configured once at construction and are not modified by `apply`.
 */
template <typename In, typename Out>
class Transform {
  public:
    using input_type = In;
    using output_type = Out;

    Transform() = default;
    Transform(Transform const&) = default;
    Transform(Transform&&) = default;
    Transform& operator=(Transform const&) = default;
    Transform& operator=(Transform&&) = default;
    virtual ~Transform() = default;

    [[nodiscard]] virtual auto apply(In input) const -> Out = 0;

    /** Short name used when describing a pipeline. */
    [[nodiscard]] virtual auto name() const -> std::string_view = 0;
};

using TextSplitter = Transform<Text, Tokens>;
using TokenTransform = Transform<Tokens, Tokens>;
using TokenJoiner = Transform<Tokens, Text>;

}  // namespace tweetprep
