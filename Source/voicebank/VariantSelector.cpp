#include "VariantSelector.h"

namespace Phonoclip
{

RandomVariantSelector::RandomVariantSelector()
    : random (juce::Time::currentTimeMillis())
{
}

RandomVariantSelector::RandomVariantSelector (juce::int64 seed)
    : random (seed)
{
}

int RandomVariantSelector::pickIndex (int numCandidates)
{
    jassert (numCandidates > 0);

    const juce::ScopedLock sl (lock);
    return random.nextInt (juce::jmax (1, numCandidates));
}

} // namespace Phonoclip
