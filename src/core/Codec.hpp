/**
 * @file Codec.hpp
 * @brief Serialization capability required by ConfigLocator.
 *
 * A codec for T turns a value into text and back. Both directions report
 * failure through Result so that the locator can fall back to its default
 * instead of propagating codec exceptions.
 *
 * @section Implementations
 * - JsonCodec (nlohmann::json, default)
 * - TomlCodec (toml++)
 */

#pragma once
#include <concepts>
#include <string>
#include <string_view>
#include "util/Result.hpp"

namespace cl {

template <typename C, typename T>
concept ConfigCodec = requires(const T& value, std::string_view text) {
    { C::encode(value) } -> std::same_as<Result<std::string>>;
    { C::decode(text) } -> std::same_as<Result<T>>;
};

} // namespace cl
