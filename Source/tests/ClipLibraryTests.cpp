#include "../voicebank/ClipLibrary.h"
#include "TestHelpers.h"
#include <limits>

using namespace Phonoclip;
using namespace Phonoclip::TestHelpers;

class ClipLibraryTests : public juce::UnitTest
{
public:
    ClipLibraryTests() : UnitTest ("ClipLibrary", "Phonoclip") {}

    void runTest() override
    {
        beginTest ("Variant suffix parsing");
        {
            expectEquals (ClipLibrary::variantNumber ("AE.wav", "AE"), (juce::int64) -1);
            expectEquals (ClipLibrary::variantNumber ("ae.WAV", "AE"), (juce::int64) -1);
            expectEquals (ClipLibrary::variantNumber ("AE_2000.wav", "AE"), (juce::int64) 2000);
            expectEquals (ClipLibrary::variantNumber ("AE_.wav", "AE"), (juce::int64) -2);
            expectEquals (ClipLibrary::variantNumber ("AE_x1.wav", "AE"), (juce::int64) -2);
            expectEquals (ClipLibrary::variantNumber ("AEE.wav", "AE"), (juce::int64) -2);
            expectEquals (ClipLibrary::variantNumber ("AE.mp3", "AE"), (juce::int64) -2);
            expectEquals (ClipLibrary::variantNumber ("AE_007.wav", "AE"), (juce::int64) 7);
            expectEquals (ClipLibrary::variantNumber ("AE_99999999999999999999999.wav", "AE"),
                          std::numeric_limits<juce::int64>::max());
        }

        beginTest ("Variants are grouped by base name and ordered");
        {
            TestVoiceBank bank;
            bank.addClip ("AE_2000", 10, 1);
            bank.addClip ("AE", 10, 2);
            bank.addClip ("AE_57", 10, 3);
            bank.addClip ("AEE", 10, 4);
            bank.addClip ("AH", 10, 5);
            bank.addClip ("AE_18446744073709551615", 10, 6);

            const auto variants = ClipLibrary::findVariants (bank.root, "AE");
            expectEquals (variants.size(), 4);
            expectEquals (variants[0].getFileName(), juce::String ("AE.wav"));
            expectEquals (variants[1].getFileName(), juce::String ("AE_57.wav"));
            expectEquals (variants[2].getFileName(), juce::String ("AE_2000.wav"));
            expectEquals (variants[3].getFileName(), juce::String ("AE_18446744073709551615.wav"));
        }

        beginTest ("Missing recordings are not an error");
        {
            TestVoiceBank bank;
            FirstVariantSelector first;
            ClipLibrary library (first);

            expect (! library.resolvePhoneme (bank.root, "ZH").has_value());
            expect (! library.resolveWord (bank.root, "hello").has_value());
            expect (! library.resolvePhoneme (bank.root.getChildFile ("nowhere"), "AA").has_value());
            expect (! library.resolvePhoneme (bank.root, {}).has_value());
        }

        beginTest ("Words live in their own folder and are looked up upper-case");
        {
            TestVoiceBank bank;
            bank.addWord ("HELLO", 10, 1);
            bank.addClip ("HELLO", 10, 2);

            FirstVariantSelector first;
            ClipLibrary library (first);

            auto word = library.resolveWord (bank.root, "Hello");
            expect (word.has_value());
            expectEquals (word->getParentDirectory().getFileName(), juce::String ("words"));
        }

        beginTest ("First selector prefers the unsuffixed file");
        {
            TestVoiceBank bank;
            bank.addClip ("OW_3", 10, 1);
            bank.addClip ("OW", 10, 2);

            FirstVariantSelector first;
            ClipLibrary library (first);
            expectEquals (library.resolvePhoneme (bank.root, "OW")->getFileName(), juce::String ("OW.wav"));
        }

        beginTest ("Equal seeds make equal choices");
        {
            TestVoiceBank bank;
            for (int i = 0; i < 6; ++i)
                bank.addClip (i == 0 ? juce::String ("AA") : "AA_" + juce::String (i), 10, i);

            RandomVariantSelector a (1234), b (1234);
            ClipLibrary libraryA (a), libraryB (b);

            juce::StringArray seen;
            for (int i = 0; i < 40; ++i)
            {
                const auto fa = libraryA.resolvePhoneme (bank.root, "AA");
                const auto fb = libraryB.resolvePhoneme (bank.root, "AA");
                expect (fa.has_value() && fb.has_value());
                expect (*fa == *fb);
                seen.addIfNotAlreadyThere (fa->getFileName());
            }

            expect (seen.size() > 1);
        }

        beginTest ("Random selector stays in range");
        {
            RandomVariantSelector selector;
            for (int i = 0; i < 200; ++i)
            {
                const int n = 1 + i % 7;
                expect (juce::isPositiveAndBelow (selector.pickIndex (n), n));
            }
        }
    }
};

static ClipLibraryTests clipLibraryTests;
