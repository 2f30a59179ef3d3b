#include "dustr/options.hpp"

#include <algorithm>
#include <cctype>
#include <charconv>
#include <cstdlib>
#include <fstream>
#include <nlohmann/json.hpp>
#include <system_error>
#include <utility>

namespace dustr::config
{
namespace
{

namespace fs = std::filesystem;

bool equalsIgnoreCase(std::string_view lhs, std::string_view rhs)
{
    return lhs.size() == rhs.size() &&
           std::equal(lhs.begin(), lhs.end(), rhs.begin(), [](char a, char b) {
               return std::tolower(static_cast<unsigned char>(a)) == std::tolower(static_cast<unsigned char>(b));
           });
}

OptionValue coerce(const OptionDefinition &definition, const OptionValue &value)
{
    if (definition.kind == OptionKind::Boolean)
    {
        if (const auto *number = std::get_if<std::int64_t>(&value))
            return *number != 0;
        return value;
    }

    std::int64_t number = 0;
    if (const auto *flag = std::get_if<bool>(&value))
        number = *flag ? 1 : 0;
    else
        number = std::get<std::int64_t>(value);
    return std::clamp(number, definition.minimum, definition.maximum);
}

std::optional<OptionValue> valueFromJson(const OptionDefinition &definition, const nlohmann::json &node)
{
    if (node.is_boolean())
        return OptionValue(node.get<bool>());
    if (node.is_number_integer())
        return OptionValue(node.get<std::int64_t>());
    if (!node.is_string())
        return std::nullopt;

    const auto &text = node.get_ref<const std::string &>();
    if (definition.kind == OptionKind::Boolean)
    {
        if (auto flag = parseBool(text))
            return OptionValue(*flag);
        return std::nullopt;
    }
    if (auto number = parseInteger(text))
        return OptionValue(*number);
    return std::nullopt;
}

nlohmann::json valueToJson(const OptionValue &value)
{
    return std::visit([](auto stored) { return nlohmann::json(stored); }, value);
}

fs::path locateConfigRoot()
{
    const char *xdg = std::getenv("XDG_CONFIG_HOME");
    if (xdg && *xdg)
        return fs::path(xdg) / "dustr";
    const char *home = std::getenv("HOME");
    if (home && *home)
        return fs::path(home) / ".config" / "dustr";
    return fs::path(".config") / "dustr";
}

bool fail(std::string *error, std::string message)
{
    if (error)
        *error = std::move(message);
    return false;
}

} // namespace

std::optional<bool> parseBool(std::string_view text)
{
    for (std::string_view yes : {"true", "yes", "on", "1"})
        if (equalsIgnoreCase(text, yes))
            return true;
    for (std::string_view no : {"false", "no", "off", "0"})
        if (equalsIgnoreCase(text, no))
            return false;
    return std::nullopt;
}

std::optional<std::int64_t> parseInteger(std::string_view text)
{
    if (!text.empty() && text.front() == '+')
        text.remove_prefix(1);
    if (text.empty())
        return std::nullopt;

    std::int64_t number = 0;
    const char *end = text.data() + text.size();
    auto [ptr, ec] = std::from_chars(text.data(), end, number);
    if (ec != std::errc() || ptr != end)
        return std::nullopt;
    return number;
}

OptionRegistry::OptionRegistry(std::string appId)
    : id(std::move(appId))
{
}

void OptionRegistry::registerOption(OptionDefinition definition)
{
    definition.defaultValue = coerce(definition, definition.defaultValue);
    if (Slot *existing = slotFor(definition.key))
    {
        existing->definition = std::move(definition);
        if (existing->value)
            existing->value = coerce(existing->definition, *existing->value);
        return;
    }
    slots.push_back(Slot{std::move(definition), std::nullopt});
}

const OptionDefinition *OptionRegistry::definition(std::string_view key) const
{
    const Slot *slot = slotFor(key);
    return slot ? &slot->definition : nullptr;
}

std::vector<OptionDefinition> OptionRegistry::definitions() const
{
    std::vector<OptionDefinition> result;
    result.reserve(slots.size());
    for (const auto &slot : slots)
        result.push_back(slot.definition);
    return result;
}

void OptionRegistry::setBool(std::string_view key, bool value)
{
    if (Slot *slot = slotFor(key))
        slot->value = coerce(slot->definition, value);
}

void OptionRegistry::setInteger(std::string_view key, std::int64_t value)
{
    if (Slot *slot = slotFor(key))
        slot->value = coerce(slot->definition, value);
}

void OptionRegistry::reset(std::string_view key)
{
    if (Slot *slot = slotFor(key))
        slot->value.reset();
}

void OptionRegistry::resetAll() noexcept
{
    for (auto &slot : slots)
        slot.value.reset();
}

bool OptionRegistry::isOverridden(std::string_view key) const
{
    const Slot *slot = slotFor(key);
    return slot && slot->value.has_value();
}

bool OptionRegistry::getBool(std::string_view key) const
{
    const Slot *slot = slotFor(key);
    if (!slot)
        return false;
    OptionValue value = effectiveValue(*slot);
    if (const auto *flag = std::get_if<bool>(&value))
        return *flag;
    return std::get<std::int64_t>(value) != 0;
}

std::int64_t OptionRegistry::getInteger(std::string_view key) const
{
    const Slot *slot = slotFor(key);
    if (!slot)
        return 0;
    OptionValue value = effectiveValue(*slot);
    if (const auto *flag = std::get_if<bool>(&value))
        return *flag ? 1 : 0;
    return std::get<std::int64_t>(value);
}

bool OptionRegistry::loadFromFile(const fs::path &filePath, std::string *error)
{
    std::ifstream in(filePath);
    if (!in)
        return fail(error, "cannot open " + filePath.string());

    nlohmann::json document = nlohmann::json::parse(in, nullptr, false);
    if (document.is_discarded())
        return fail(error, filePath.string() + " is not valid JSON");
    if (!document.is_object())
        return fail(error, filePath.string() + " does not hold a JSON object");

    std::vector<std::pair<Slot *, OptionValue>> pending;
    for (auto it = document.begin(); it != document.end(); ++it)
    {
        Slot *slot = slotFor(it.key());
        if (!slot)
            continue;
        auto value = valueFromJson(slot->definition, it.value());
        if (!value)
            return fail(error, "invalid value for option '" + it.key() + "'");
        pending.emplace_back(slot, coerce(slot->definition, *value));
    }

    for (auto &[slot, value] : pending)
        slot->value = std::move(value);
    return true;
}

bool OptionRegistry::saveToFile(const fs::path &filePath, std::string *error) const
{
    nlohmann::json document = nlohmann::json::object();
    for (const auto &slot : slots)
        document[slot.definition.key] = valueToJson(effectiveValue(slot));

    if (filePath.has_parent_path())
    {
        std::error_code ec;
        fs::create_directories(filePath.parent_path(), ec);
        if (ec)
            return fail(error, "cannot create " + filePath.parent_path().string() + ": " + ec.message());
    }

    std::ofstream out(filePath, std::ios::trunc);
    if (!out)
        return fail(error, "cannot write " + filePath.string());
    out << document.dump(2) << '\n';
    out.flush();
    if (!out)
        return fail(error, "cannot write " + filePath.string());
    return true;
}

bool OptionRegistry::loadDefaults(std::string *error)
{
    const fs::path path = defaultOptionsPath();
    std::error_code ec;
    if (!fs::exists(path, ec))
        return true;
    return loadFromFile(path, error);
}

fs::path OptionRegistry::defaultOptionsPath() const
{
    return configRoot() / id / "defaults.json";
}

fs::path OptionRegistry::configRoot()
{
    static const fs::path root = locateConfigRoot();
    return root;
}

OptionRegistry::Slot *OptionRegistry::slotFor(std::string_view key)
{
    auto it = std::find_if(slots.begin(), slots.end(),
                           [key](const Slot &slot) { return slot.definition.key == key; });
    return it == slots.end() ? nullptr : &*it;
}

const OptionRegistry::Slot *OptionRegistry::slotFor(std::string_view key) const
{
    auto it = std::find_if(slots.begin(), slots.end(),
                           [key](const Slot &slot) { return slot.definition.key == key; });
    return it == slots.end() ? nullptr : &*it;
}

OptionValue OptionRegistry::effectiveValue(const Slot &slot) const
{
    return slot.value ? *slot.value : slot.definition.defaultValue;
}

} // namespace dustr::config
