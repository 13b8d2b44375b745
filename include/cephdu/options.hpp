#pragma once

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <unordered_map>
#include <variant>

namespace cephdu::config
{

enum class OptionKind
{
    Boolean,
    Integer,
    String
};

class OptionValue
{
public:
    OptionValue() = default;
    OptionValue(bool value);
    OptionValue(std::int64_t value);
    OptionValue(std::string value);
    OptionValue(const char *value);

    // Empty for a null value.
    std::optional<OptionKind> kind() const noexcept;

    bool isNull() const noexcept;
    bool toBool(bool fallback = false) const noexcept;
    std::int64_t toInteger(std::int64_t fallback = 0) const noexcept;
    std::string toString(const std::string &fallback = std::string()) const;

    bool operator==(const OptionValue &other) const = default;

private:
    std::variant<std::monostate, bool, std::int64_t, std::string> value;
};

struct OptionDefinition
{
    std::string key;
    OptionKind kind = OptionKind::String;
    OptionValue defaultValue;
    std::string description;
};

// Typed option set of one application. Values that do not match the declared
// kind are converted on the way in, so readers never see a foreign type.
class OptionRegistry
{
public:
    explicit OptionRegistry(std::string appId);

    void registerOption(const OptionDefinition &definition);
    bool hasOption(const std::string &key) const noexcept;

    void set(const std::string &key, const OptionValue &value);
    void reset(const std::string &key);

    OptionValue get(const std::string &key) const;
    bool getBool(const std::string &key, bool fallback = false) const;
    std::int64_t getInteger(const std::string &key, std::int64_t fallback = 0) const;
    std::string getString(const std::string &key, const std::string &fallback = std::string()) const;

    bool loadFromFile(const std::filesystem::path &filePath);
    bool saveToFile(const std::filesystem::path &filePath) const;

    // defaults.json under configRoot()/<appId>; a missing file is not an error
    // but still returns false.
    bool loadDefaults();
    bool saveDefaults() const;
    std::filesystem::path defaultOptionsPath() const;

    // $XDG_CONFIG_HOME/cephdu, else ~/.config/cephdu.
    static std::filesystem::path configRoot();

private:
    const OptionDefinition *findDefinition(const std::string &key) const;

    std::string id;
    std::unordered_map<std::string, OptionDefinition> definitions;
    std::unordered_map<std::string, OptionValue> overrides;
};

std::optional<bool> parseBool(const std::string &value);
std::optional<std::int64_t> parseInteger(const std::string &value);

} // namespace cephdu::config
