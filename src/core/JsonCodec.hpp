/**
 * @file JsonCodec.hpp
 * @brief JSON codec backed by nlohmann::ordered_json.
 *
 * T provides to_json/from_json overloads for nlohmann::ordered_json, found by
 * ADL. Keys keep insertion order so files written from defaults read the same
 * way the struct is declared.
 *
 * @section Dependencies
 * - nlohmann_json
 */

#pragma once
#include <nlohmann/json.hpp>
#include <string>
#include <string_view>
#include "util/Result.hpp"

namespace cl {

template <typename T>
struct JsonCodec {
    using Json = nlohmann::ordered_json;

    static constexpr int kIndent = 2;

    // Two-space indent, no trailing newline
    static Result<std::string> encode(const T& value) {
        try {
            Json json = value;
            return Result<std::string>::ok(json.dump(kIndent));
        } catch (const Json::exception& e) {
            return Result<std::string>::err(
                    std::string("JSON encode error: ") + e.what(),
                    ErrorKind::Encode);
        }
    }

    static Result<T> decode(std::string_view text) {
        try {
            auto json = Json::parse(text.begin(), text.end());
            return Result<T>::ok(json.template get<T>());
        } catch (const Json::exception& e) {
            return Result<T>::err(std::string("JSON decode error: ") +
                                          e.what(),
                                  ErrorKind::Decode);
        }
    }
};

} // namespace cl
