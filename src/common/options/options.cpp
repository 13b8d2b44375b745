#include "cephdu/options.hpp"

#include <cctype>
#include <charconv>
#include <cstdlib>
#include <fstream>
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

namespace cephdu::config
{
namespace
{

// Converts a value to the declared kind. Empty when the value has no reading
// of that kind ("abc" as an integer, a null).
std::optional<OptionValue> coerce(OptionKind kind, const OptionValue &value)
{
    if (value.isNull())
        return std::nullopt;
    switch (kind)
    {
    case OptionKind::Boolean:
        if (value.kind() == OptionKind::String)
        {
            std::optional<bool> parsed = parseBool(value.toString());
            if (!parsed)
                return std::nullopt;
            return OptionValue(*parsed);
        }
        return OptionValue(value.toBool());
    case OptionKind::Integer:
        if (value.kind() == OptionKind::String)
        {
            std::optional<std::int64_t> parsed = parseInteger(value.toString());
            if (!parsed)
                return std::nullopt;
            return OptionValue(*parsed);
        }
        return OptionValue(value.toInteger());
    case OptionKind::String:
        return OptionValue(value.toString());
    }
    return std::nullopt;
}

OptionValue coerceOrDefault(const OptionDefinition &definition, const OptionValue &value)
{
    if (std::optional<OptionValue> converted = coerce(definition.kind, value))
        return *converted;
    spdlog::warn("option '{}' ({}) has an unusable value, using default", definition.key, definition.description);
    return definition.defaultValue;
}

OptionValue scalarFromJson(const nlohmann::json &jsonValue)
{
    if (jsonValue.is_boolean())
        return OptionValue(jsonValue.get<bool>());
    if (jsonValue.is_number_integer())
        return OptionValue(jsonValue.get<std::int64_t>());
    if (jsonValue.is_string())
        return OptionValue(jsonValue.get<std::string>());
    return OptionValue();
}

nlohmann::json scalarToJson(const OptionValue &value)
{
    std::optional<OptionKind> kind = value.kind();
    if (!kind)
        return nullptr;
    switch (*kind)
    {
    case OptionKind::Boolean:
        return value.toBool();
    case OptionKind::Integer:
        return value.toInteger();
    case OptionKind::String:
        break;
    }
    return value.toString();
}

std::filesystem::path detectConfigRoot()
{
    if (const char *xdg = std::getenv("XDG_CONFIG_HOME"); xdg && *xdg)
        return std::filesystem::path(xdg) / "cephdu";
    if (const char *home = std::getenv("HOME"); home && *home)
        return std::filesystem::path(home) / ".config" / "cephdu";
    return std::filesystem::path(".config") / "cephdu";
}

} // namespace

std::optional<bool> parseBool(const std::string &value)
{
    std::string lower;
    lower.reserve(value.size());
    for (char ch : value)
        lower.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(ch))));
    if (lower == "true" || lower == "1" || lower == "yes" || lower == "on")
        return true;
    if (lower == "false" || lower == "0" || lower == "no" || lower == "off")
        return false;
    return std::nullopt;
}

std::optional<std::int64_t> parseInteger(const std::string &value)
{
    std::int64_t parsed = 0;
    const char *begin = value.data();
    const char *end = value.data() + value.size();
    auto [ptr, ec] = std::from_chars(begin, end, parsed);
    if (ec != std::errc() || ptr != end || begin == end)
        return std::nullopt;
    return parsed;
}

OptionValue::OptionValue(bool value)
    : value(value)
{
}

OptionValue::OptionValue(std::int64_t value)
    : value(value)
{
}

OptionValue::OptionValue(std::string value)
    : value(std::move(value))
{
}

OptionValue::OptionValue(const char *value)
    : value(std::string(value ? value : ""))
{
}

std::optional<OptionKind> OptionValue::kind() const noexcept
{
    if (std::holds_alternative<bool>(value))
        return OptionKind::Boolean;
    if (std::holds_alternative<std::int64_t>(value))
        return OptionKind::Integer;
    if (std::holds_alternative<std::string>(value))
        return OptionKind::String;
    return std::nullopt;
}

bool OptionValue::isNull() const noexcept
{
    return std::holds_alternative<std::monostate>(value);
}

bool OptionValue::toBool(bool fallback) const noexcept
{
    if (auto *ptr = std::get_if<bool>(&value))
        return *ptr;
    if (auto *iptr = std::get_if<std::int64_t>(&value))
        return *iptr != 0;
    if (auto *sptr = std::get_if<std::string>(&value))
        return parseBool(*sptr).value_or(fallback);
    return fallback;
}

std::int64_t OptionValue::toInteger(std::int64_t fallback) const noexcept
{
    if (auto *iptr = std::get_if<std::int64_t>(&value))
        return *iptr;
    if (auto *bptr = std::get_if<bool>(&value))
        return *bptr ? 1 : 0;
    if (auto *sptr = std::get_if<std::string>(&value))
        return parseInteger(*sptr).value_or(fallback);
    return fallback;
}

std::string OptionValue::toString(const std::string &fallback) const
{
    if (auto *sptr = std::get_if<std::string>(&value))
        return *sptr;
    if (auto *bptr = std::get_if<bool>(&value))
        return *bptr ? "true" : "false";
    if (auto *iptr = std::get_if<std::int64_t>(&value))
        return std::to_string(*iptr);
    return fallback;
}

OptionRegistry::OptionRegistry(std::string appId)
    : id(std::move(appId))
{
}

void OptionRegistry::registerOption(const OptionDefinition &definition)
{
    definitions.insert_or_assign(definition.key, definition);
    auto it = overrides.find(definition.key);
    if (it != overrides.end())
        it->second = coerceOrDefault(definition, it->second);
}

bool OptionRegistry::hasOption(const std::string &key) const noexcept
{
    return definitions.find(key) != definitions.end();
}

void OptionRegistry::set(const std::string &key, const OptionValue &value)
{
    const OptionDefinition *definition = findDefinition(key);
    if (!definition)
    {
        spdlog::debug("ignoring unknown option '{}' for {}", key, id);
        return;
    }
    overrides[key] = coerceOrDefault(*definition, value);
}

void OptionRegistry::reset(const std::string &key)
{
    overrides.erase(key);
}

OptionValue OptionRegistry::get(const std::string &key) const
{
    if (auto it = overrides.find(key); it != overrides.end())
        return it->second;
    if (const OptionDefinition *definition = findDefinition(key))
        return definition->defaultValue;
    return OptionValue();
}

bool OptionRegistry::getBool(const std::string &key, bool fallback) const
{
    return get(key).toBool(fallback);
}

std::int64_t OptionRegistry::getInteger(const std::string &key, std::int64_t fallback) const
{
    return get(key).toInteger(fallback);
}

std::string OptionRegistry::getString(const std::string &key, const std::string &fallback) const
{
    return get(key).toString(fallback);
}

bool OptionRegistry::loadFromFile(const std::filesystem::path &filePath)
{
    std::ifstream in(filePath);
    if (!in)
    {
        spdlog::warn("cannot open options file '{}'", filePath.string());
        return false;
    }

    nlohmann::json data = nlohmann::json::parse(in, nullptr, false);
    if (data.is_discarded() || !data.is_object())
    {
        spdlog::warn("options file '{}' is not a JSON object", filePath.string());
        return false;
    }

    for (const auto &[key, jsonValue] : data.items())
    {
        const OptionDefinition *definition = findDefinition(key);
        if (!definition)
            continue;
        overrides[key] = coerceOrDefault(*definition, scalarFromJson(jsonValue));
    }

    spdlog::debug("loaded options for {} from '{}'", id, filePath.string());
    return true;
}

bool OptionRegistry::saveToFile(const std::filesystem::path &filePath) const
{
    nlohmann::json data = nlohmann::json::object();
    for (const auto &entry : definitions)
        data[entry.first] = scalarToJson(get(entry.first));

    std::error_code ec;
    if (filePath.has_parent_path())
        std::filesystem::create_directories(filePath.parent_path(), ec);
    if (ec)
    {
        spdlog::error("cannot create '{}': {}", filePath.parent_path().string(), ec.message());
        return false;
    }

    std::ofstream out(filePath);
    if (!out)
    {
        spdlog::error("cannot write options file '{}'", filePath.string());
        return false;
    }
    out << data.dump(2) << std::endl;
    return static_cast<bool>(out);
}

bool OptionRegistry::loadDefaults()
{
    std::filesystem::path path = defaultOptionsPath();
    std::error_code ec;
    if (!std::filesystem::exists(path, ec))
        return false;
    return loadFromFile(path);
}

bool OptionRegistry::saveDefaults() const
{
    return saveToFile(defaultOptionsPath());
}

std::filesystem::path OptionRegistry::defaultOptionsPath() const
{
    return configRoot() / id / "defaults.json";
}

std::filesystem::path OptionRegistry::configRoot()
{
    static const std::filesystem::path root = detectConfigRoot();
    return root;
}

const OptionDefinition *OptionRegistry::findDefinition(const std::string &key) const
{
    auto it = definitions.find(key);
    if (it == definitions.end())
        return nullptr;
    return &it->second;
}

} // namespace cephdu::config
