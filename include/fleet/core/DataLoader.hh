#pragma once

#include "fleet/utils/ErrorHandling.hh"

#include <toml++/toml.hpp>

#include <cstdint>
#include <filesystem>
#include <string>
#include <string_view>
#include <vector>

namespace fleet {

// Wraps a parsed TOML table with typed, dotted-key accessors ("dispatch.max_handlers").
// Every accessor reports missing keys as NotFound and type mismatches as
// InvalidState, with the source name in the message.
class DataLoader {
  public:
    DataLoader(toml::table tbl, std::string source);

    static Result<DataLoader> load(const std::filesystem::path& path);
    static Result<DataLoader> parse(std::string_view tomlContent, std::string_view sourceName = "string");

    Result<std::string> getString(std::string_view key) const;
    Result<int64_t> getInt(std::string_view key) const;
    Result<bool> getBool(std::string_view key) const;

    // Absent key yields the default; a present key of the wrong type is still an error.
    Result<std::string> getStringOr(std::string_view key, std::string_view defaultValue) const;
    Result<int64_t> getIntOr(std::string_view key, int64_t defaultValue) const;
    Result<bool> getBoolOr(std::string_view key, bool defaultValue) const;

    // Splits an array of tables ([[key]]) into one loader per element.
    Result<std::vector<DataLoader>> getTableArray(std::string_view key) const;

    bool hasKey(std::string_view key) const;
    const toml::table& table() const;
    const std::string& sourceName() const;

  private:
    const toml::node* resolve(std::string_view dottedKey) const;
    std::string formatError(std::string_view key, std::string_view expected) const;

    toml::table table_;
    std::string sourceName_;
};

} // namespace fleet
