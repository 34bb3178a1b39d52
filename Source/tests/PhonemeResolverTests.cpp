#include "../phonemes/PhonemeResolver.h"
#include "TestHelpers.h"

using namespace Phonoclip;
using namespace Phonoclip::TestHelpers;

class PhonemeResolverTests : public juce::UnitTest
{
public:
    PhonemeResolverTests() : UnitTest ("PhonemeResolver", "Phonoclip") {}

    /** Everything a resolver needs, with the config exposed for tweaking before use. */
    struct Fixture
    {
        TestVoiceBank bank;
        FakePhonemizer g2p;
        FirstVariantSelector selector;
        ClipLibrary library { selector };
        ClipReader reader;
        SynthConfig config { SynthConfig::forFileRender() };
        DiagnosticLog diagnostics;

        PhonemeResolver makeResolver() { return PhonemeResolver (library, g2p, reader, config, diagnostics); }
    };

    void runTest() override
    {
        beginTest ("Label cleaning");
        {
            const auto labels = PhonemeResolver::cleanLabels ({ "HH", "AH0", "L", "OW1", "ER0", "-", "ah", "A1B", "", " IY2 " });
            expectEquals (labels.joinIntoString (" "), juce::String ("HH AH0 L OW ER IY"));
        }

        beginTest ("Vowel set");
        {
            for (auto* v : { "AA", "AE", "AH", "AO", "AW", "AY", "EH", "ER", "EY", "IH", "IY", "OW", "OY", "UH", "UW" })
                expect (PhonemeResolver::isVowel (v), v);

            for (auto* c : { "AH0", "HH", "L", "Y", "NG", "" })
                expect (! PhonemeResolver::isVowel (c), c);
        }

        beginTest ("Final AH, AE and AH0 become the clear vowel");
        {
            Fixture f;
            f.g2p.add ("sofa", { "S", "OW1", "F", "AH0" })
                 .add ("cat", { "K", "AE1" })
                 .add ("nope", { "N", "OW1", "P" });

            auto resolver = f.makeResolver();
            expectEquals (resolver.getPhonemeLabels ("sofa").joinIntoString (" "), juce::String ("S OW F AA"));
            expectEquals (resolver.getPhonemeLabels ("cat").joinIntoString (" "), juce::String ("K AA"));
            expectEquals (resolver.getPhonemeLabels ("nope").joinIntoString (" "), juce::String ("N OW P"));

            f.config.finalVowelSubstitution = false;
            expectEquals (resolver.getPhonemeLabels ("sofa").joinIntoString (" "), juce::String ("S OW F AH0"));
        }

        beginTest ("HH AH0 L OW: reduced vowel is a trimmed EH");
        {
            Fixture f;
            f.bank.addClip ("HH", 4000, 10);
            f.bank.addClip ("EH", 4000, 20);
            f.bank.addClip ("L", 4000, 30);
            f.bank.addClip ("OW", 4000, 40);
            f.g2p.add ("hello", { "HH", "AH0", "L", "OW1" });

            auto resolver = f.makeResolver();
            const auto segments = resolver.resolveWordToSegments (f.bank.root, "hello");

            expectEquals ((int) segments.size(), 4);
            expectEquals (segments[1].label, juce::String ("AH0"));
            expectEquals ((int) segments[1].pcm.getNumFrames(), 3998);
            expectEquals (sampleAt (segments[1].pcm, 0), 20);
            expect (segments[1].classification == AudioSegment::Classification::Consonant);
            expect (segments[2].classification == AudioSegment::Classification::Consonant);
            expect (segments[3].classification == AudioSegment::Classification::Vowel);
            expect (f.diagnostics.isEmpty());
        }

        beginTest ("Short neighbour vowel is not trimmed");
        {
            Fixture f;
            f.bank.addClip ("EH", 2, 20);

            auto resolver = f.makeResolver();
            const auto pcm = resolver.resolveOnePhoneme (f.bank.root, "AH0");
            expect (pcm.has_value());
            expectEquals ((int) pcm->getNumFrames(), 2);
        }

        beginTest ("Reduced-vowel rule can be switched off");
        {
            Fixture f;
            f.bank.addClip ("EH", 100, 20);
            f.config.reducedVowelTrim = false;

            auto resolver = f.makeResolver();
            expect (! resolver.resolveOnePhoneme (f.bank.root, "AH0").has_value());
            expectEquals (f.diagnostics.count (Diagnostic::Kind::MissingAsset), 1);
        }

        beginTest ("Clips are normalized to the target format");
        {
            Fixture f;
            f.bank.addClip ("S", 1000, 64, { 2, 1, 22050 });

            auto resolver = f.makeResolver();
            const auto pcm = resolver.resolveOnePhoneme (f.bank.root, "S");
            expect (pcm.has_value());
            expect (pcm->format == PcmFormat::target());
            expectEquals ((int) pcm->getNumFrames(), 2000);

            // 8-bit 64 widens to 16-bit 16384.
            expectEquals (sampleAt (*pcm, 0), 16384);
            expectEquals (sampleAt (*pcm, 1000), 16384);
            expectEquals (sampleAt (*pcm, 1999), 16384);
        }

        beginTest ("Missing phoneme without a substitute");
        {
            Fixture f;
            auto resolver = f.makeResolver();

            expect (! resolver.resolveOnePhoneme (f.bank.root, "NG").has_value());
            expectEquals (f.diagnostics.count (Diagnostic::Kind::MissingAsset), 1);
            expectEquals (f.diagnostics.getEntries().front().subject, juce::String ("NG"));
        }

        beginTest ("Substitutes are concatenated in order");
        {
            Fixture f;
            f.bank.addClip ("AE", 1000, 1);
            f.bank.addClip ("OW", 1500, 2);

            auto resolver = f.makeResolver();
            const auto pcm = resolver.resolveOnePhoneme (f.bank.root, "AW");
            expect (pcm.has_value());
            expectEquals ((int) pcm->getNumFrames(), 2500);
            expectEquals (sampleAt (*pcm, 999), 1);
            expectEquals (sampleAt (*pcm, 1000), 2);
        }

        beginTest ("Substitutes are skipped individually");
        {
            Fixture f;
            f.bank.addClip ("IY", 700, 3);

            auto resolver = f.makeResolver();
            const auto pcm = resolver.resolveOnePhoneme (f.bank.root, "EY");
            expect (pcm.has_value());
            expectEquals ((int) pcm->getNumFrames(), 700);
            expectEquals (f.diagnostics.count (Diagnostic::Kind::MissingAsset), 1);
        }

        beginTest ("Fallback table disabled");
        {
            Fixture f;
            f.bank.addClip ("AE", 1000, 1);
            f.bank.addClip ("OW", 1500, 2);
            f.config.useFallbackTable = false;

            auto resolver = f.makeResolver();
            expect (! resolver.resolveOnePhoneme (f.bank.root, "AW").has_value());
        }

        beginTest ("A cyclic table fails closed");
        {
            Fixture f;
            f.config.fallbackTable = {};
            f.config.fallbackTable.set ("X", { "Y" });
            f.config.fallbackTable.set ("Y", { "X" });

            auto resolver = f.makeResolver();
            expect (! resolver.resolveOnePhoneme (f.bank.root, "X").has_value());
            expectEquals (f.diagnostics.count (Diagnostic::Kind::FallbackCycle), 1);

            f.config.fallbackTable.set ("Z", { "Z" });
            expect (! resolver.resolveOnePhoneme (f.bank.root, "Z").has_value());
            expectEquals (f.diagnostics.count (Diagnostic::Kind::FallbackCycle), 2);
        }

        beginTest ("The same label may appear twice when it is not its own ancestor");
        {
            Fixture f;
            f.bank.addClip ("B", 100, 1);
            f.config.fallbackTable.set ("Q", { "B", "B" });

            auto resolver = f.makeResolver();
            const auto pcm = resolver.resolveOnePhoneme (f.bank.root, "Q");
            expect (pcm.has_value());
            expectEquals ((int) pcm->getNumFrames(), 200);
            expectEquals (f.diagnostics.count (Diagnostic::Kind::FallbackCycle), 0);
        }

        beginTest ("Unreadable clips are reported and skipped");
        {
            Fixture f;
            f.bank.addTextFile ("K.wav", "this is not audio");
            f.bank.addClip ("AA", 100, 5);
            f.g2p.add ("ka", { "K", "AA1" });

            auto resolver = f.makeResolver();
            const auto segments = resolver.resolveWordToSegments (f.bank.root, "ka");
            expectEquals ((int) segments.size(), 1);
            expectEquals (segments[0].label, juce::String ("AA"));
            expectEquals (f.diagnostics.count (Diagnostic::Kind::CorruptClip), 1);
        }

        beginTest ("Recorded words win over phonemes");
        {
            Fixture f;
            f.bank.addWord ("HELLO", 3000, 7);
            f.g2p.add ("hello", { "HH", "AH0", "L", "OW1" });

            auto resolver = f.makeResolver();
            const auto segments = resolver.resolveWordToSegments (f.bank.root, "Hello");
            expectEquals ((int) segments.size(), 1);
            expect (segments[0].role == AudioSegment::Role::Word);
            expect (segments[0].classification == AudioSegment::Classification::Opaque);
            expectEquals (f.g2p.calls.load(), 0);
        }

        beginTest ("Word lookup can be switched off");
        {
            Fixture f;
            f.bank.addWord ("HI", 3000, 7);
            f.bank.addClip ("HH", 100, 1);
            f.bank.addClip ("AY", 100, 2);
            f.g2p.add ("hi", { "HH", "AY1" });
            f.config.wordFirstLookup = false;

            auto resolver = f.makeResolver();
            const auto segments = resolver.resolveWordToSegments (f.bank.root, "hi");
            expectEquals ((int) segments.size(), 2);
            expect (segments[0].role == AudioSegment::Role::Phoneme);
        }

        beginTest ("Broken word clip is not phonemized instead");
        {
            Fixture f;
            f.bank.addTextFile ("words/HI.wav", "garbage");
            f.bank.addClip ("HH", 100, 1);
            f.g2p.add ("hi", { "HH" });

            auto resolver = f.makeResolver();
            expect (resolver.resolveWordToSegments (f.bank.root, "hi").empty());
            expectEquals (f.diagnostics.count (Diagnostic::Kind::CorruptClip), 1);
        }

        beginTest ("Word with no phonemes");
        {
            Fixture f;
            auto resolver = f.makeResolver();
            expect (resolver.resolveWordToSegments (f.bank.root, "zzz").empty());
            expectEquals (f.diagnostics.count (Diagnostic::Kind::MissingAsset), 1);
        }
    }
};

static PhonemeResolverTests phonemeResolverTests;
