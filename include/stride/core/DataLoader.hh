#pragma once

#include "stride/core/Spatial.hh"
#include "stride/utils/ErrorHandling.hh"

#include <toml++/toml.hpp>

#include <cstdint>
#include <filesystem>
#include <string>
#include <string_view>

namespace stride {

// Read-only view over a parsed TOML document. Keys are dotted paths
// ("mover.colliderHeight"). Missing keys report ErrorCode::NotFound,
// wrongly typed values ErrorCode::TypeMismatch.
class DataLoader {
  public:
    static Result<DataLoader> load(const std::filesystem::path& path);
    static Result<DataLoader> parse(std::string_view tomlContent, std::string_view sourceName = "<string>");

    Result<std::string> getString(std::string_view key) const;
    Result<int64_t> getInt(std::string_view key) const;
    Result<double> getFloat(std::string_view key) const;
    Result<bool> getBool(std::string_view key) const;

    // Three-element numeric array
    Result<Vec3f> getVec3(std::string_view key) const;

    bool hasKey(std::string_view key) const;

    const toml::table& table() const;
    const std::string& sourceName() const;

  private:
    DataLoader(toml::table tbl, std::string source);

    const toml::node* resolve(std::string_view dottedKey) const;
    std::string formatError(std::string_view key, std::string_view expected) const;

    toml::table table_;
    std::string sourceName_;
};

} // namespace stride
