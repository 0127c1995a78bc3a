#include "fleet/core/DataLoader.hh"

#include <sstream>

#include "fleet/core/Log.hh"

namespace fleet {

DataLoader::DataLoader(toml::table tbl, std::string source) : table_(std::move(tbl)), sourceName_(std::move(source)) {}

Result<DataLoader> DataLoader::load(const std::filesystem::path& path) {
    if (!std::filesystem::exists(path)) {
        return Result<DataLoader>::error(ErrorCode::NotFound, "TOML file not found: " + path.string());
    }

    try {
        auto tbl = toml::parse_file(path.string());
        FLEET_LOG_DEBUG("Loaded TOML: {}", path.string());
        return Result<DataLoader>::ok(DataLoader(std::move(tbl), path.string()));
    } catch (const toml::parse_error& err) {
        std::ostringstream oss;
        oss << path.string() << ":" << err.source().begin.line << ":" << err.source().begin.column << " - "
            << err.description();
        return Result<DataLoader>::error(ErrorCode::ParseError, oss.str());
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
        return Result<DataLoader>::error(ErrorCode::ParseError, oss.str());
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
    return Result<std::string>::error(ErrorCode::InvalidState, formatError(key, "is not a string"));
}

Result<int64_t> DataLoader::getInt(std::string_view key) const {
    const auto* node = resolve(key);
    if (!node) {
        return Result<int64_t>::error(ErrorCode::NotFound, formatError(key, "not found"));
    }
    if (auto val = node->as_integer()) {
        return Result<int64_t>::ok(val->get());
    }
    return Result<int64_t>::error(ErrorCode::InvalidState, formatError(key, "is not an integer"));
}

Result<bool> DataLoader::getBool(std::string_view key) const {
    const auto* node = resolve(key);
    if (!node) {
        return Result<bool>::error(ErrorCode::NotFound, formatError(key, "not found"));
    }
    if (auto val = node->as_boolean()) {
        return Result<bool>::ok(val->get());
    }
    return Result<bool>::error(ErrorCode::InvalidState, formatError(key, "is not a boolean"));
}

Result<std::string> DataLoader::getStringOr(std::string_view key, std::string_view defaultValue) const {
    if (!hasKey(key)) {
        return Result<std::string>::ok(std::string(defaultValue));
    }
    return getString(key);
}

Result<int64_t> DataLoader::getIntOr(std::string_view key, int64_t defaultValue) const {
    if (!hasKey(key)) {
        return Result<int64_t>::ok(defaultValue);
    }
    return getInt(key);
}

Result<bool> DataLoader::getBoolOr(std::string_view key, bool defaultValue) const {
    if (!hasKey(key)) {
        return Result<bool>::ok(defaultValue);
    }
    return getBool(key);
}

Result<std::vector<DataLoader>> DataLoader::getTableArray(std::string_view key) const {
    const auto* node = resolve(key);
    if (!node) {
        return Result<std::vector<DataLoader>>::error(ErrorCode::NotFound, formatError(key, "not found"));
    }
    auto arr = node->as_array();
    if (!arr) {
        return Result<std::vector<DataLoader>>::error(ErrorCode::InvalidState, formatError(key, "is not an array"));
    }

    std::vector<DataLoader> items;
    items.reserve(arr->size());

    for (std::size_t i = 0; i < arr->size(); ++i) {
        auto* tbl = arr->at(i).as_table();
        if (!tbl) {
            return Result<std::vector<DataLoader>>::error(
                ErrorCode::InvalidState, formatError(key, "element " + std::to_string(i) + " is not a table"));
        }
        items.emplace_back(*tbl, sourceName_ + ":" + std::string(key) + "[" + std::to_string(i) + "]");
    }

    return Result<std::vector<DataLoader>>::ok(std::move(items));
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

} // namespace fleet
