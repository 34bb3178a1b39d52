#include "FallbackTable.h"
#include <nlohmann/json.hpp>

namespace Phonoclip
{

FallbackTable FallbackTable::createDefault()
{
    FallbackTable table;
    table.set ("AW", { "AE", "OW" });
    table.set ("DH", { "D" });
    table.set ("EY", { "EH", "IY" });
    table.set ("JH", { "CH" });
    table.set ("SH", { "CH" });
    table.set ("TH", { "D" });
    table.set ("ZH", { "CH" });
    table.set ("AE", { "AA" });
    table.set ("AO", { "AA", "OW" });
    table.set ("ER", { "AA" });
    table.set ("IH", { "IY" });
    table.set ("OY", { "OW", "Y", "IY" });
    table.set ("UH", { "UW" });
    return table;
}

bool FallbackTable::parseJson (const juce::String& jsonText, FallbackTable& result, juce::String& error)
{
    nlohmann::json json;

    try
    {
        json = nlohmann::json::parse (jsonText.toStdString());
    }
    catch (const nlohmann::json::parse_error& e)
    {
        error = "invalid JSON: " + juce::String (e.what());
        return false;
    }

    if (! json.is_object())
    {
        error = "fallback table must be a JSON object";
        return false;
    }

    FallbackTable parsed;

    for (const auto& [key, value] : json.items())
    {
        if (! value.is_array())
        {
            error = "entry '" + juce::String (key) + "' is not an array";
            return false;
        }

        juce::StringArray substitutes;
        for (const auto& item : value)
        {
            if (! item.is_string())
            {
                error = "entry '" + juce::String (key) + "' contains a non-string substitute";
                return false;
            }

            substitutes.add (juce::String (item.get<std::string>()).trim().toUpperCase());
        }

        substitutes.removeEmptyStrings();
        parsed.set (juce::String (key).trim().toUpperCase(), substitutes);
    }

    result = std::move (parsed);
    return true;
}

bool FallbackTable::loadFromFile (const juce::File& file, FallbackTable& result, juce::String& error)
{
    if (! file.existsAsFile())
    {
        error = "file not found: " + file.getFullPathName();
        return false;
    }

    return parseJson (file.loadFileAsString(), result, error);
}

void FallbackTable::set (const juce::String& label, const juce::StringArray& substitutes)
{
    entries[label] = substitutes;
}

void FallbackTable::remove (const juce::String& label)
{
    entries.erase (label);
}

void FallbackTable::mergeFrom (const FallbackTable& other)
{
    for (const auto& [label, substitutes] : other.entries)
        entries[label] = substitutes;
}

const juce::StringArray* FallbackTable::getSubstitutes (const juce::String& label) const
{
    const auto it = entries.find (label);
    return it != entries.end() ? &it->second : nullptr;
}

juce::String FallbackTable::toJson() const
{
    nlohmann::json json = nlohmann::json::object();

    for (const auto& [label, substitutes] : entries)
    {
        auto list = nlohmann::json::array();
        for (const auto& s : substitutes)
            list.push_back (s.toStdString());

        json[label.toStdString()] = list;
    }

    return juce::String (json.dump (2));
}

} // namespace Phonoclip
