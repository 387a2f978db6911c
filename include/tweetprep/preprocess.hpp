#pragma once

#include <string>
#include <type_traits>
#include <variant>
#include <vector>

#include <spdlog/spdlog.h>

#include "pipeline.hpp"
#include "shape.hpp"
#include "text_record.hpp"

namespace tweetprep {

/**
 * Runs each string through the pipeline and returns the trimmed results.
 *
 * Results that are empty after trimming are dropped, so the output may be shorter than the
 * input, but the order of the remaining items is preserved. Any exception thrown by a transform
 * aborts the whole batch.
 */
[[nodiscard]] auto run_on_strings(
    std::vector<std::string> const& batch, Pipeline<Text, Text> const& pipeline
) -> std::vector<std::string>;

/** Returns an independent copy of the records. */
[[nodiscard]] auto clone_batch(std::vector<TextRecord> const& batch) -> std::vector<TextRecord>;

/**
 * Returns a copy of the batch with each record's text replaced by the pipeline output.
 *
 * The input batch is left unchanged. All records are returned, in the same order, even if their
 * text becomes empty. If the text of a record does not hold the pipeline's input shape,
 * `std::bad_variant_access` is thrown; this and any exception thrown by a transform abort the
 * whole batch.
 */
template <typename In, typename Out>
[[nodiscard]] auto run_on_records(
    std::vector<TextRecord> const& batch, Pipeline<In, Out> const& pipeline
) -> std::vector<TextRecord> {
    static_assert(
        std::is_same_v<In, Text> || std::is_same_v<In, Tokens>,
        "record pipelines must start with text or tokens"
    );
    auto records = clone_batch(batch);
    for (auto& record: records) {
        auto text = std::get<In>(std::move(record.text()));
        record.text() = pipeline.apply(std::move(text));
    }
    spdlog::debug("Preprocessed {} records", records.size());
    return records;
}

}  // namespace tweetprep
