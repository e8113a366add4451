/**
 * @file TomlCodec.hpp
 * @brief TOML codec backed by toml++.
 *
 * T provides two free functions found by ADL:
 *   toml::table toTomlTable(const T&);
 *   void fromTomlTable(const toml::table&, T&);
 * fromTomlTable reports a missing or mistyped key by throwing
 * TomlCodecError, which decode() turns into a Decode error.
 *
 * @section Dependencies
 * - toml++
 */

#pragma once
#include <toml++/toml.h>
#include <sstream>
#include <stdexcept>
#include <string>
#include <string_view>
#include "util/Result.hpp"

namespace cl {

class TomlCodecError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// Required value lookup for fromTomlTable implementations
template <typename V>
V tomlRequire(const toml::table& tbl, std::string_view key) {
    if (auto val = tbl[key].value<V>())
        return *val;
    throw TomlCodecError("missing or invalid key '" + std::string(key) + "'");
}

template <typename T>
struct TomlCodec {
    static Result<std::string> encode(const T& value) {
        try {
            std::ostringstream out;
            out << toTomlTable(value);
            return Result<std::string>::ok(out.str());
        } catch (const std::exception& e) {
            return Result<std::string>::err(
                    std::string("TOML encode error: ") + e.what(),
                    ErrorKind::Encode);
        }
    }

    static Result<T> decode(std::string_view text) {
        try {
            auto tbl = toml::parse(text);
            T value{};
            fromTomlTable(tbl, value);
            return Result<T>::ok(std::move(value));
        } catch (const toml::parse_error& err) {
            return Result<T>::err(std::string("TOML parse error: ") +
                                          std::string(err.description()),
                                  ErrorKind::Decode);
        } catch (const TomlCodecError& err) {
            return Result<T>::err(std::string("TOML decode error: ") +
                                          err.what(),
                                  ErrorKind::Decode);
        }
    }
};

} // namespace cl
