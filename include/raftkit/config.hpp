#pragma once

#include <string_view>

#include <tl/expected.hpp>

#include "raftkit/errors.hpp"
#include "raftkit/options.hpp"

namespace raftkit::config
{
    /// Parses Options from a TOML document. Values are read from the [raft] table and fall back
    /// to the defaults of Options when absent. The result is validated.
    /// @param text The TOML document.
    /// @return The options or a ConfigError.
    tl::expected<Options, Error> parseOptions(std::string_view text);

    /// Loads Options from a TOML file. See parseOptions.
    /// @param path The path of the file.
    /// @return The options or a ConfigError.
    tl::expected<Options, Error> loadOptions(std::string_view path);
}  // namespace raftkit::config
