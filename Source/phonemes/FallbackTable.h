#pragma once

#include <juce_core/juce_core.h>
#include <map>

namespace Phonoclip
{

/**
 * Substitutes for phonemes a voice bank has no recording of.
 *
 * Each label maps to an ordered list of labels whose recordings are played
 * back to back in its place. Substitutes may themselves have entries; the
 * resolver guards against cycles, so tables loaded from disk need not be
 * acyclic.
 */
class FallbackTable
{
public:
    FallbackTable() = default;

    /** The built-in table, e.g. AW -> AE OW, SH -> CH. */
    static FallbackTable createDefault();

    /**
     * Parses {"LABEL": ["SUB", ...], ...}.
     * Keys and substitutes are upper-cased. Returns false and fills error on
     * malformed JSON or values that are not arrays of strings.
     */
    static bool parseJson (const juce::String& jsonText, FallbackTable& result, juce::String& error);

    /** Reads a table written in the JSON layout above. */
    static bool loadFromFile (const juce::File& file, FallbackTable& result, juce::String& error);

    void set (const juce::String& label, const juce::StringArray& substitutes);
    void remove (const juce::String& label);

    /** Entries of other replace entries of this table with the same label. */
    void mergeFrom (const FallbackTable& other);

    /** nullptr when the label has no entry. */
    const juce::StringArray* getSubstitutes (const juce::String& label) const;

    bool contains (const juce::String& label) const { return entries.find (label) != entries.end(); }
    int size() const noexcept { return (int) entries.size(); }
    bool isEmpty() const noexcept { return entries.empty(); }

    juce::String toJson() const;

    bool operator== (const FallbackTable& other) const { return entries == other.entries; }

private:
    std::map<juce::String, juce::StringArray> entries;
};

} // namespace Phonoclip
