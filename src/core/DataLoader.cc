#include "stride/core/DataLoader.hh"

#include <sstream>

#include "stride/core/Log.hh"

namespace stride {

DataLoader::DataLoader(toml::table tbl, std::string source) : table_(std::move(tbl)), sourceName_(std::move(source)) {}

Result<DataLoader> DataLoader::load(const std::filesystem::path& path) {
    if (!std::filesystem::exists(path)) {
        return Result<DataLoader>::error(ErrorCode::NotFound, "TOML file not found: " + path.string());
    }

    try {
        auto tbl = toml::parse_file(path.string());
        STRIDE_LOG_DEBUG("Loaded TOML: {}", path.string());
        return Result<DataLoader>::ok(DataLoader(std::move(tbl), path.string()));
    } catch (const toml::parse_error& err) {
        std::ostringstream oss;
        oss << path.string() << ":" << err.source().begin.line << ":" << err.source().begin.column << " - "
            << err.description();
        return Result<DataLoader>::error(ErrorCode::InvalidArgument, oss.str());
    }
}

Result<DataLoader> DataLoader::parse(std::string_view tomlContent, std::string_view sourceName) {
    try {
        auto tbl = toml::parse(tomlContent, sourceName);
        return Result<DataLoader>::ok(DataLoader(std::move(tbl), std::string(sourceName)));
    } catch (const toml::parse_error& err) {
        std::ostringstream oss;
        oss << sourceName << ":" << err.source().begin.line << ":" << err.source().begin.column << " - "
            << err.description();
        return Result<DataLoader>::error(ErrorCode::InvalidArgument, oss.str());
    }
}

const toml::node* DataLoader::resolve(std::string_view dottedKey) const {
    const toml::node* current = &table_;
    std::string_view remaining = dottedKey;

    while (!remaining.empty()) {
        auto dot = remaining.find('.');
        std::string_view segment = (dot == std::string_view::npos) ? remaining : remaining.substr(0, dot);

        if (!current->is_table()) {
            return nullptr;
        }
        current = current->as_table()->get(segment);
        if (!current) {
            return nullptr;
        }

        if (dot == std::string_view::npos) {
            break;
        }
        remaining = remaining.substr(dot + 1);
    }
    return current;
}

std::string DataLoader::formatError(std::string_view key, std::string_view expected) const {
    std::ostringstream oss;
    oss << sourceName_ << ": key '" << key << "' " << expected;
    return oss.str();
}

Result<std::string> DataLoader::getString(std::string_view key) const {
    const auto* node = resolve(key);
    if (!node) {
        return Result<std::string>::error(ErrorCode::NotFound, formatError(key, "not found"));
    }
    if (auto val = node->as_string()) {
        return Result<std::string>::ok(std::string(val->get()));
    }
    return Result<std::string>::error(ErrorCode::TypeMismatch, formatError(key, "is not a string"));
}

Result<int64_t> DataLoader::getInt(std::string_view key) const {
    const auto* node = resolve(key);
    if (!node) {
        return Result<int64_t>::error(ErrorCode::NotFound, formatError(key, "not found"));
    }
    if (auto val = node->as_integer()) {
        return Result<int64_t>::ok(val->get());
    }
    return Result<int64_t>::error(ErrorCode::TypeMismatch, formatError(key, "is not an integer"));
}

Result<double> DataLoader::getFloat(std::string_view key) const {
    const auto* node = resolve(key);
    if (!node) {
        return Result<double>::error(ErrorCode::NotFound, formatError(key, "not found"));
    }
    // Accept both float and integer values for float extraction
    if (auto val = node->as_floating_point()) {
        return Result<double>::ok(val->get());
    }
    if (auto val = node->as_integer()) {
        return Result<double>::ok(static_cast<double>(val->get()));
    }
    return Result<double>::error(ErrorCode::TypeMismatch, formatError(key, "is not a number"));
}

Result<bool> DataLoader::getBool(std::string_view key) const {
    const auto* node = resolve(key);
    if (!node) {
        return Result<bool>::error(ErrorCode::NotFound, formatError(key, "not found"));
    }
    if (auto val = node->as_boolean()) {
        return Result<bool>::ok(val->get());
    }
    return Result<bool>::error(ErrorCode::TypeMismatch, formatError(key, "is not a boolean"));
}

Result<Vec3f> DataLoader::getVec3(std::string_view key) const {
    const auto* node = resolve(key);
    if (!node) {
        return Result<Vec3f>::error(ErrorCode::NotFound, formatError(key, "not found"));
    }
    const auto* arr = node->as_array();
    if (!arr || arr->size() != 3) {
        return Result<Vec3f>::error(ErrorCode::TypeMismatch, formatError(key, "is not a 3-element array"));
    }

    float components[3] = {0.0f, 0.0f, 0.0f};
    for (size_t i = 0; i < 3; ++i) {
        const toml::node& elem = (*arr)[i];
        if (auto f = elem.as_floating_point()) {
            components[i] = static_cast<float>(f->get());
        } else if (auto n = elem.as_integer()) {
            components[i] = static_cast<float>(n->get());
        } else {
            return Result<Vec3f>::error(ErrorCode::TypeMismatch, formatError(key, "contains a non-numeric element"));
        }
    }
    return Result<Vec3f>::ok(Vec3f(components[0], components[1], components[2]));
}

bool DataLoader::hasKey(std::string_view key) const {
    return resolve(key) != nullptr;
}

const toml::table& DataLoader::table() const {
    return table_;
}

const std::string& DataLoader::sourceName() const {
    return sourceName_;
}

} // namespace stride
