#pragma once

#include <juce_core/juce_core.h>

namespace Phonoclip
{

/**
 * Picks one of several interchangeable recordings of the same sound.
 */
class VariantSelector
{
public:
    virtual ~VariantSelector() = default;

    /** Returns an index in [0, numCandidates). numCandidates is always > 0. */
    virtual int pickIndex (int numCandidates) = 0;
};

/**
 * Uniform random choice. Safe to share between threads.
 */
class RandomVariantSelector : public VariantSelector
{
public:
    /** Seeded from the system clock. */
    RandomVariantSelector();

    /** Fixed seed, for reproducible renders. */
    explicit RandomVariantSelector (juce::int64 seed);

    int pickIndex (int numCandidates) override;

private:
    juce::CriticalSection lock;
    juce::Random random;

    JUCE_DECLARE_NON_COPYABLE_WITH_LEAK_DETECTOR (RandomVariantSelector)
};

/**
 * Always the first candidate, which is the unsuffixed file when one exists.
 */
class FirstVariantSelector : public VariantSelector
{
public:
    int pickIndex (int) override { return 0; }
};

} // namespace Phonoclip
