#pragma once

#include <cstdint>
#include <filesystem>
#include <limits>
#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace dustr::config
{

enum class OptionKind
{
    Boolean,
    Integer
};

using OptionValue = std::variant<bool, std::int64_t>;

struct OptionDefinition
{
    std::string key;
    OptionKind kind = OptionKind::Boolean;
    OptionValue defaultValue = false;
    std::string description;
    std::int64_t minimum = std::numeric_limits<std::int64_t>::min();
    std::int64_t maximum = std::numeric_limits<std::int64_t>::max();
};

// Accepts true/false, yes/no, on/off and 1/0 in any letter case.
std::optional<bool> parseBool(std::string_view text);
// Decimal only; a leading '+' or '-' is allowed, trailing text is not.
std::optional<std::int64_t> parseInteger(std::string_view text);

/// Typed option store for one tool. Values are coerced to the kind of their
/// definition and integers are clamped into [minimum, maximum]. Keys that were
/// never registered are ignored by every setter and read back as false / 0.
class OptionRegistry
{
public:
    explicit OptionRegistry(std::string appId);

    const std::string &appId() const noexcept { return id; }

    void registerOption(OptionDefinition definition);
    const OptionDefinition *definition(std::string_view key) const;
    std::vector<OptionDefinition> definitions() const;

    void setBool(std::string_view key, bool value);
    void setInteger(std::string_view key, std::int64_t value);
    void reset(std::string_view key);
    void resetAll() noexcept;
    bool isOverridden(std::string_view key) const;

    bool getBool(std::string_view key) const;
    std::int64_t getInteger(std::string_view key) const;

    /// Reads a JSON object and applies every registered key it contains.
    /// Either all values are applied or, on failure, none and \p error says why.
    bool loadFromFile(const std::filesystem::path &filePath, std::string *error = nullptr);
    bool saveToFile(const std::filesystem::path &filePath, std::string *error = nullptr) const;

    // A missing defaults file is not an error.
    bool loadDefaults(std::string *error = nullptr);
    std::filesystem::path defaultOptionsPath() const;

    static std::filesystem::path configRoot();

private:
    struct Slot
    {
        OptionDefinition definition;
        std::optional<OptionValue> value;
    };

    Slot *slotFor(std::string_view key);
    const Slot *slotFor(std::string_view key) const;
    OptionValue effectiveValue(const Slot &slot) const;

    std::string id;
    std::vector<Slot> slots;
};

} // namespace dustr::config
